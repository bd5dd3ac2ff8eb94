#include "logger.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

const char *log_level_label(Logger::Level level) {
  switch (level) {
  case Logger::Level::Error:
    return "ERROR";
  case Logger::Level::Warn:
    return "WARN";
  case Logger::Level::Info:
    return "INFO";
  case Logger::Level::Debug:
    return "DEBUG";
  }
  return "INFO";
}

void Logger::error(const std::string &msg, const std::string &name) {
  write(Level::Error, msg, name);
}

void Logger::warn(const std::string &msg, const std::string &name) {
  write(Level::Warn, msg, name);
}

void Logger::info(const std::string &msg, const std::string &name) {
  write(Level::Info, msg, name);
}

void Logger::debug(const std::string &msg, const std::string &name,
                   bool enabled) {
  if (enabled)
    write(Level::Debug, msg, name);
}

void Logger::set_capture(bool capture) {
  std::lock_guard<std::mutex> lock(mu_);
  capture_ = capture;
  captured_.clear();
}

std::string Logger::captured() const {
  std::lock_guard<std::mutex> lock(mu_);
  return captured_;
}

void Logger::write(Level level, const std::string &msg,
                   const std::string &name) {
  const auto now = std::chrono::system_clock::now();
  const std::time_t t = std::chrono::system_clock::to_time_t(now);
  std::tm tm{};
  localtime_r(&t, &tm);

  std::ostringstream line;
  line << "[" << std::put_time(&tm, "%H:%M:%S") << "] ["
       << log_level_label(level) << "] ";
  if (!name.empty())
    line << "[" << name << "] ";
  line << msg << "\n";

  std::lock_guard<std::mutex> lock(mu_);
  if (capture_) {
    captured_ += line.str();
    return;
  }
  if (level == Level::Error || level == Level::Warn) {
    std::cerr << line.str() << std::flush;
  } else {
    std::cout << line.str() << std::flush;
  }
}
