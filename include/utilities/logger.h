#pragma once
#ifndef CHUNKKEEPER_LOGGER_H
#define CHUNKKEEPER_LOGGER_H
#include <ctime>
#include <fstream>
#include <iostream>
#include <mutex>     // For std::mutex and std::lock_guard
#include <stdexcept> // Required for std::runtime_error
#include <string>

enum LogLevel { TRACE, DEBUG, INFO, WARN, ERROR, FATAL };

/**
 * @brief Process-wide structured logger.
 *
 * Every record is written as one JSON object per line with the keys
 * `timestamp`, `level` and `message`. File output is rotated once it grows
 * past the configured size.
 */
class Logger {
public:
  Logger(const Logger &) = delete;
  Logger &operator=(const Logger &) = delete;

  static const std::string CONSOLE_ONLY_OUTPUT; // Special value for console-only logging

  static void init(const std::string &logFile, LogLevel level = LogLevel::INFO,
                   long long maxFileSize = 10 * 1024 * 1024,
                   int maxBackupFiles = 5);
  static Logger &getInstance();

  void setLogLevel(LogLevel level);
  void log(LogLevel level, const std::string &message);
  void logToConsole(LogLevel level, const std::string &message);

  /**
   * @brief Convenience wrapper for TRACE level logging.
   *
   * Formats the provided printf-style string and logs it at TRACE level.
   *
   * @param format printf-style format string.
   * @param ...    Format arguments.
   */
  static void trace(const char *format, ...);

  /** Parse "trace", "debug", "info", "warn", "error" or "fatal". */
  static LogLevel levelFromString(const std::string &name);

  ~Logger();

private:
  Logger(const std::string &logFile, LogLevel level, long long maxFileSizeVal,
         int maxBackupFilesVal);

  std::string getTimestamp();
  std::string levelToString(LogLevel level);
  std::string formatRecord(LogLevel level, const std::string &message);
  void rotateIfNeeded();

  std::ofstream logFileStream;
  LogLevel currentLogLevel;
  std::string logFilePath;
  long long maxFileSize;
  int maxBackupFiles;

  static Logger *s_instance;
  static std::mutex s_mutex;
};

#endif // CHUNKKEEPER_LOGGER_H
