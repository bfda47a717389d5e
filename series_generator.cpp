#include <algorithm>
#include <array>
#include <cmath>
#include <cstdint>
#include <fstream>
#include <iostream>
#include <random>
#include <string>

const uint64_t SAMPLE_INTERVAL_MS = 15ULL * 60 * 1000;
const uint64_t DEFAULT_DAYS = 14;
const uint64_t START_MS = 1704067200000ULL; // 2024-01-01T00:00:00Z
const double PI = 3.14159265358979323846;

struct DeviceProfile {
  std::string id;
  std::string household;
  std::string metric;
  std::string unit;
  double base;
  double daily_amplitude;
  int peak_hour;
  double noise;
};

const std::array<DeviceProfile, 6> devices = {{
    {"thermostat-1", "house-a", "temperature", "celsius", 20.5, 2.0, 18, 0.2},
    {"heater-1", "house-a", "power", "watts", 800.0, 600.0, 18, 40.0},
    {"lights-living", "house-a", "power", "watts", 60.0, 55.0, 21, 5.0},
    {"fridge-1", "house-a", "power", "watts", 120.0, 5.0, 12, 8.0},
    {"washer-1", "house-b", "power", "watts", 30.0, 250.0, 10, 15.0},
    {"dryer-1", "house-b", "power", "watts", 20.0, 200.0, 11, 12.0},
}};

std::mt19937 rng;

double sample_value(const DeviceProfile &device, uint64_t ts_ms) {
  double hours = static_cast<double>(ts_ms - START_MS) / 3600000.0;
  double phase = 2.0 * PI * (hours - device.peak_hour) / 24.0;
  double value = device.base + device.daily_amplitude * std::cos(phase);
  std::normal_distribution<double> noise(0.0, device.noise);
  value += noise(rng);
  return std::max(0.0, value);
}

int main(int argc, char *argv[]) {
  if (argc < 2) {
    std::cerr << "Usage: " << argv[0] << " <output.csv> [days] [seed]"
              << std::endl;
    return 1;
  }

  uint64_t days = DEFAULT_DAYS;
  unsigned seed = 42;
  try {
    if (argc >= 3)
      days = std::stoull(argv[2]);
    if (argc >= 4)
      seed = static_cast<unsigned>(std::stoul(argv[3]));
  } catch (const std::exception &e) {
    std::cerr << "Invalid argument: " << e.what() << std::endl;
    return 1;
  }
  if (days == 0) {
    std::cerr << "days must be positive" << std::endl;
    return 1;
  }
  rng.seed(seed);

  std::ofstream out(argv[1]);
  if (!out) {
    std::cerr << "Cannot open " << argv[1] << " for writing" << std::endl;
    return 1;
  }

  out << "subject_id,timestamp_ms,value,metric,unit,household_id\n";
  const uint64_t end_ms = START_MS + days * 24 * 3600000ULL;
  std::uniform_real_distribution<> prob(0.0, 1.0);
  size_t rows = 0;

  for (uint64_t ts = START_MS; ts < end_ms; ts += SAMPLE_INTERVAL_MS) {
    for (const auto &device : devices) {
      double value = sample_value(device, ts);
      // Occasional spikes give the anomaly detector something to find
      if (prob(rng) < 0.002)
        value *= 4.0;
      out << device.id << ',' << ts << ',' << value << ',' << device.metric
          << ',' << device.unit << ',' << device.household << '\n';
      ++rows;
    }
  }

  std::cout << "Wrote " << rows << " samples for " << devices.size()
            << " devices over " << days << " days to " << argv[1]
            << std::endl;
  return 0;
}
