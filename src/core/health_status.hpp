#ifndef HEALTH_STATUS_HPP
#define HEALTH_STATUS_HPP

#include <map>
#include <string>

struct HealthStatus {
  std::string component;
  bool healthy = true;
  std::map<std::string, std::string> details;
};

#endif // HEALTH_STATUS_HPP
