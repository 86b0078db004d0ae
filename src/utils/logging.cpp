#include "utils/logging.hpp"
#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace meddictate {
namespace utils {

namespace {

std::atomic<int> g_level{static_cast<int>(LogLevel::INFO)};
std::mutex g_outputMutex;

std::string timestamp() {
  auto now = std::chrono::system_clock::now();
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                now.time_since_epoch()) % 1000;
  std::time_t t = std::chrono::system_clock::to_time_t(now);
  std::tm tm{};
  localtime_r(&t, &tm);

  std::ostringstream ss;
  ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.' << std::setfill('0')
     << std::setw(3) << ms.count();
  return ss.str();
}

} // namespace

bool Logger::initialized_ = false;

void Logger::initialize(LogLevel level) {
  setLevel(level);
  if (!initialized_) {
    initialized_ = true;
    info("Logger initialized");
  }
}

void Logger::info(const std::string &message) {
  write(LogLevel::INFO, "INFO", message);
}

void Logger::warn(const std::string &message) {
  write(LogLevel::WARN, "WARN", message);
}

void Logger::error(const std::string &message) {
  write(LogLevel::ERROR, "ERROR", message);
}

void Logger::debug(const std::string &message) {
  write(LogLevel::DEBUG, "DEBUG", message);
}

void Logger::setLevel(LogLevel level) {
  g_level.store(static_cast<int>(level));
}

bool Logger::setLevel(const std::string &level) {
  std::string upper = level;
  std::transform(upper.begin(), upper.end(), upper.begin(),
                 [](unsigned char c) { return std::toupper(c); });

  if (upper == "DEBUG") {
    setLevel(LogLevel::DEBUG);
  } else if (upper == "INFO") {
    setLevel(LogLevel::INFO);
  } else if (upper == "WARN" || upper == "WARNING") {
    setLevel(LogLevel::WARN);
  } else if (upper == "ERROR") {
    setLevel(LogLevel::ERROR);
  } else {
    warn("Unknown log level '" + level + "', keeping current level");
    return false;
  }
  return true;
}

LogLevel Logger::getLevel() {
  return static_cast<LogLevel>(g_level.load());
}

void Logger::write(LogLevel level, const char *tag, const std::string &message) {
  if (static_cast<int>(level) < g_level.load()) {
    return;
  }

  std::lock_guard<std::mutex> lock(g_outputMutex);
  std::ostream &out = (level == LogLevel::ERROR) ? std::cerr : std::cout;
  out << "[" << timestamp() << "] [" << tag << "] " << message << std::endl;
}

} // namespace utils
} // namespace meddictate
