#include "fft.hpp"

#include <cmath>

namespace analysis {

namespace {
constexpr double PI = 3.14159265358979323846;
}

size_t next_power_of_two(size_t n) {
  size_t size = 1;
  while (size < n)
    size <<= 1;
  return size;
}

std::vector<std::complex<double>>
fft_forward(const std::vector<double> &input) {
  if (input.empty())
    return {};

  const size_t n = next_power_of_two(input.size());
  std::vector<std::complex<double>> data(n);
  for (size_t i = 0; i < input.size(); ++i)
    data[i] = input[i];

  // Bit-reversal permutation
  for (size_t i = 1, j = 0; i < n; ++i) {
    size_t bit = n >> 1;
    for (; j & bit; bit >>= 1)
      j ^= bit;
    j ^= bit;
    if (i < j)
      std::swap(data[i], data[j]);
  }

  for (size_t len = 2; len <= n; len <<= 1) {
    double angle = -2.0 * PI / static_cast<double>(len);
    for (size_t start = 0; start < n; start += len) {
      for (size_t k = 0; k < len / 2; ++k) {
        auto twiddle = std::polar(1.0, angle * static_cast<double>(k));
        auto even = data[start + k];
        auto odd = data[start + k + len / 2] * twiddle;
        data[start + k] = even + odd;
        data[start + k + len / 2] = even - odd;
      }
    }
  }
  return data;
}

} // namespace analysis
