#ifndef FFT_HPP
#define FFT_HPP

#include <complex>
#include <cstddef>
#include <vector>

namespace analysis {

size_t next_power_of_two(size_t n);

// Forward radix-2 transform with unnormalized scaling. The input is
// zero-padded to the next power of two; empty input gives empty output.
std::vector<std::complex<double>> fft_forward(const std::vector<double> &input);

} // namespace analysis

#endif // FFT_HPP
