// Basic logging system, console plus an append-mode log file.
// Based on: https://www.geeksforgeeks.org/cpp/logging-system-in-cpp/

#pragma once

#include <atomic>
#include <cstdarg>
#include <cstdio>
#include <ctime>
#include <fstream>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>
#include <vector>

namespace planeGrid
{
// Bit flags, several levels can be enabled at once
enum class LogLevel : unsigned int
{
  Debug = 1,
  Info = 2,
  Warning = 4,
  Error = 8,
  Critical = 16
};

inline LogLevel operator|(LogLevel a, LogLevel b)
{
  return static_cast<LogLevel>(static_cast<unsigned>(a) | static_cast<unsigned>(b));
}

inline LogLevel operator&(LogLevel a, LogLevel b)
{
  return static_cast<LogLevel>(static_cast<unsigned>(a) & static_cast<unsigned>(b));
}

inline LogLevel& operator|=(LogLevel& a, LogLevel b)
{
  a = a | b;
  return a;
}

inline LogLevel& operator&=(LogLevel& a, LogLevel b)
{
  a = a & b;
  return a;
}

inline LogLevel operator~(LogLevel a) { return static_cast<LogLevel>(~static_cast<unsigned>(a)); }

class Logger
{
 private:
  // read on every log call from any thread, so kept as an atomic mask
  std::atomic<unsigned> log_level {
    static_cast<unsigned>(LogLevel::Info | LogLevel::Warning | LogLevel::Error | LogLevel::Critical)
  };

 public:
  // Opens the log file in append mode
  explicit Logger(const std::string& filename)
  {
    logFile.open(filename, std::ios::app);
    if (!logFile.is_open())
    {
      std::cerr << "Error opening log file " << filename << "." << std::endl;
    }
  }

  ~Logger() { logFile.close(); }

  Logger(const Logger&) = delete;
  Logger& operator=(const Logger&) = delete;

  void setLogLevel(LogLevel level, bool set = true)
  {
    if (set)
    {
      log_level.fetch_or(static_cast<unsigned>(level));
    }
    else
    {
      log_level.fetch_and(static_cast<unsigned>(~level));
    }
  }

  LogLevel getLogLevel() const { return static_cast<LogLevel>(log_level.load()); }

  bool isEnabled(LogLevel level) const { return (log_level.load() & static_cast<unsigned>(level)) != 0; }

  void log(LogLevel level, const std::string& message)
  {
    if (!isEnabled(level))
    {
      return;
    }
    std::lock_guard<std::mutex> lock(mutex);
    time_t now = time(nullptr);
    tm* timeinfo = localtime(&now);
    char timestamp[20];
    strftime(timestamp, sizeof(timestamp), "%Y-%m-%d %H:%M:%S", timeinfo);

    std::ostringstream logEntry;
    logEntry << "[planeGrid] [" << timestamp << "] " << levelToString(level) << ": " << message << std::endl;

    // errors go to stderr, everything else to stdout
    if (static_cast<unsigned>(level) >= static_cast<unsigned>(LogLevel::Error))
      std::cerr << logEntry.str();
    else
      std::cout << logEntry.str();

    if (logFile.is_open())
    {
      logFile << logEntry.str();
      logFile.flush();
    }
  }

  void log(LogLevel level, const char* fmt, ...)
  {
    if (!isEnabled(level))
    {
      return;
    }
    va_list args;
    va_start(args, fmt);

    // Get the size needed
    va_list args_copy;
    va_copy(args_copy, args);
    int size = std::vsnprintf(nullptr, 0, fmt, args_copy);
    va_end(args_copy);

    if (size < 0)
    {
      va_end(args);
      log(level, std::string("formatting error in log"));
      return;
    }

    std::vector<char> buffer(size + 1);
    std::vsnprintf(buffer.data(), buffer.size(), fmt, args);
    va_end(args);

    log(level, std::string(buffer.data(), size));
  }

 private:
  std::ofstream logFile;
  std::mutex mutex; // guards both output streams

  static std::string levelToString(LogLevel level)
  {
    switch (level)
    {
    case LogLevel::Debug:
      return "DEBUG";
    case LogLevel::Info:
      return "INFO";
    case LogLevel::Warning:
      return "WARNING";
    case LogLevel::Error:
      return "ERROR";
    case LogLevel::Critical:
      return "CRITICAL";
    default:
      return "UNKNOWN";
    }
  }
};

inline Logger logger("planeGrid_logfile.txt");

#define PLANEGRID_LOG_(level, msg)                                                                                     \
  {                                                                                                                    \
    std::stringstream ss;                                                                                              \
    ss << msg << " (" << __FILE__ << ": line " << __LINE__ << ")";                                                     \
    ::planeGrid::logger.log(level, ss.str());                                                                          \
  }

#define PLANEGRID_DEBUG(msg) PLANEGRID_LOG_(::planeGrid::LogLevel::Debug, msg)
#define PLANEGRID_INFO(msg) PLANEGRID_LOG_(::planeGrid::LogLevel::Info, msg)
#define PLANEGRID_WARNING(msg) PLANEGRID_LOG_(::planeGrid::LogLevel::Warning, msg)
#define PLANEGRID_ERROR(msg) PLANEGRID_LOG_(::planeGrid::LogLevel::Error, msg)
}
