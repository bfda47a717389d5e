#include "utils.hpp"

#include <chrono>
#include <cstdio>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace Utils {

std::vector<std::string> split_string(const std::string &text, char delimiter) {
  std::vector<std::string> tokens;
  std::string current_token;
  std::istringstream token_stream(text);

  while (std::getline(token_stream, current_token, delimiter)) {
    tokens.push_back(current_token);
  }
  return tokens;
}

std::vector<std::string_view> split_string_view(std::string_view str,
                                                char delimiter) {
  std::vector<std::string_view> result;
  size_t start = 0;
  size_t end = str.find(delimiter);
  while (end != std::string_view::npos) {
    result.push_back(str.substr(start, end - start));
    start = end + 1;
    end = str.find(delimiter, start);
  }
  result.push_back(str.substr(start));
  return result;
}

uint64_t get_current_time_ms() {
  auto now = std::chrono::system_clock::now();
  auto epoch = now.time_since_epoch();
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(epoch);
  return ms.count();
}

std::optional<uint64_t> parse_duration_ms(std::string_view duration) {
  std::string text = to_lower_copy(trim_copy(duration));
  if (text.empty())
    return std::nullopt;

  size_t digits_end = 0;
  while (digits_end < text.size() &&
         std::isdigit(static_cast<unsigned char>(text[digits_end])))
    ++digits_end;
  if (digits_end == 0)
    return std::nullopt;

  auto amount =
      string_to_number<uint64_t>(std::string_view(text).substr(0, digits_end));
  if (!amount || *amount == 0)
    return std::nullopt;

  const std::string unit = text.substr(digits_end);
  constexpr uint64_t MINUTE_MS = 60ULL * 1000ULL;
  constexpr uint64_t HOUR_MS = 60ULL * MINUTE_MS;
  constexpr uint64_t DAY_MS = 24ULL * HOUR_MS;

  uint64_t unit_ms = 0;
  if (unit == "m" || unit == "min")
    unit_ms = MINUTE_MS;
  else if (unit == "h")
    unit_ms = HOUR_MS;
  else if (unit == "d")
    unit_ms = DAY_MS;
  else if (unit == "w")
    unit_ms = 7 * DAY_MS;
  else if (unit == "mo")
    unit_ms = 30 * DAY_MS;
  else if (unit == "y")
    unit_ms = 365 * DAY_MS;
  else
    return std::nullopt;

  return *amount * unit_ms;
}

uint64_t stable_hash(std::string_view text) {
  uint64_t hash = 14695981039346656037ULL;
  for (unsigned char c : text) {
    hash ^= c;
    hash *= 1099511628211ULL;
  }
  return hash;
}

uint64_t stable_hash(const std::vector<std::string> &parts) {
  std::string joined;
  for (const auto &part : parts) {
    joined += part;
    joined.push_back('\x1f'); // unit separator keeps ["ab","c"] != ["a","bc"]
  }
  return stable_hash(joined);
}

std::string hash_to_hex(uint64_t hash) {
  std::ostringstream oss;
  oss << std::hex << std::setw(16) << std::setfill('0') << hash;
  return oss.str();
}

std::string format_iso8601_ms(uint64_t timestamp_ms) {
  std::time_t seconds = static_cast<std::time_t>(timestamp_ms / 1000);
  std::tm tm_utc{};
  gmtime_r(&seconds, &tm_utc);
  std::ostringstream oss;
  oss << std::put_time(&tm_utc, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3)
      << std::setfill('0') << (timestamp_ms % 1000) << 'Z';
  return oss.str();
}

int hour_of_day_utc(uint64_t timestamp_ms) {
  return static_cast<int>((timestamp_ms / 3600000ULL) % 24ULL);
}

} // namespace Utils
