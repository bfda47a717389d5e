#include "rolling_statistics.hpp"

#include <cmath>
#include <mutex>
#include <stdexcept>

namespace learning {

RollingStatistics::RollingStatistics(double alpha) : alpha_(alpha) {
  if (alpha <= 0.0 || alpha > 1.0) {
    throw std::invalid_argument("Alpha must be between 0 and 1");
  }
}

void RollingStatistics::add_value(double value) {
  std::unique_lock<std::shared_mutex> lock(mutex_);

  if (sample_count_ == 0) {
    ewma_mean_ = value;
    ewma_variance_ = 0.0;
  } else {
    double delta = value - ewma_mean_;
    ewma_mean_ += alpha_ * delta;
    ewma_variance_ = (1.0 - alpha_) * ewma_variance_ + alpha_ * delta * delta;
  }
  sample_count_++;
}

double RollingStatistics::get_mean() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return ewma_mean_;
}

double RollingStatistics::get_variance() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return ewma_variance_;
}

double RollingStatistics::get_standard_deviation() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return std::sqrt(ewma_variance_);
}

size_t RollingStatistics::get_sample_count() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return sample_count_;
}

bool RollingStatistics::is_established(size_t min_samples) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return sample_count_ >= min_samples;
}

void RollingStatistics::reset() {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  ewma_mean_ = 0.0;
  ewma_variance_ = 0.0;
  sample_count_ = 0;
}

} // namespace learning
