#pragma once
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <string>

namespace postmatch {

enum class LogLevel { DEBUG, INFO, WARNING, ERROR, OFF };

class Logger {
public:
  static Logger &instance() {
    static Logger logger;
    return logger;
  }

  void set_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    min_level_ = level;
  }

  void set_color(bool enabled) {
    std::lock_guard<std::mutex> lock(mutex_);
    color_ = enabled;
  }

  void log(LogLevel level, const std::string &message) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (level < min_level_ || level == LogLevel::OFF)
      return;

    auto now = std::chrono::system_clock::now();
    auto in_time_t = std::chrono::system_clock::to_time_t(now);
    std::tm local_tm{};
    localtime_r(&in_time_t, &local_tm);

    std::clog << "[" << std::put_time(&local_tm, "%Y-%m-%d %H:%M:%S")
              << "] ";

    switch (level) {
    case LogLevel::DEBUG:
      std::clog << (color_ ? "\033[36m[DEBUG]\033[0m " : "[DEBUG] ");
      break;
    case LogLevel::INFO:
      std::clog << (color_ ? "\033[32m[INFO] \033[0m " : "[INFO]  ");
      break;
    case LogLevel::WARNING:
      std::clog << (color_ ? "\033[33m[WARN] \033[0m " : "[WARN]  ");
      break;
    case LogLevel::ERROR:
      std::clog << (color_ ? "\033[31m[ERROR]\033[0m " : "[ERROR] ");
      break;
    case LogLevel::OFF:
      break;
    }

    std::clog << message << std::endl;
  }

  static void debug(const std::string &msg) {
    instance().log(LogLevel::DEBUG, msg);
  }
  static void info(const std::string &msg) {
    instance().log(LogLevel::INFO, msg);
  }
  static void warn(const std::string &msg) {
    instance().log(LogLevel::WARNING, msg);
  }
  static void error(const std::string &msg) {
    instance().log(LogLevel::ERROR, msg);
  }

  // Accepts "debug", "info", "warn"/"warning", "error" and "off".
  static bool parse_level(const std::string &name, LogLevel &out) {
    if (name == "debug")
      out = LogLevel::DEBUG;
    else if (name == "info")
      out = LogLevel::INFO;
    else if (name == "warn" || name == "warning")
      out = LogLevel::WARNING;
    else if (name == "error")
      out = LogLevel::ERROR;
    else if (name == "off")
      out = LogLevel::OFF;
    else
      return false;
    return true;
  }

private:
  Logger() : min_level_(LogLevel::INFO), color_(true) {}
  LogLevel min_level_;
  bool color_;
  std::mutex mutex_;
};

} // namespace postmatch
