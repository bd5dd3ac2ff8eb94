#pragma once

#include <mutex>
#include <string>

// Console logger shared by every camera. Lines look like
// "[12:00:01] [INFO] [Porch] Starting video stream: 1280x720, 10 fps, 299 kbps".
class Logger {
public:
  enum class Level { Error, Warn, Info, Debug };

  void error(const std::string &msg, const std::string &name = "");
  void warn(const std::string &msg, const std::string &name = "");
  void info(const std::string &msg, const std::string &name = "");
  // Only printed when the camera runs with debug enabled.
  void debug(const std::string &msg, const std::string &name, bool enabled);

  // Test hook: collect lines instead of writing to the console.
  void set_capture(bool capture);
  std::string captured() const;

private:
  void write(Level level, const std::string &msg, const std::string &name);

  mutable std::mutex mu_;
  bool capture_ = false;
  std::string captured_;
};

const char *log_level_label(Logger::Level level);
