// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Linkgate, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <fstream>
#include <functional>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>

namespace linkgate
{
namespace core
{

namespace detail
{
  /// \brief Extract filename from full path at compile-time
  constexpr const char* basename(const char* path)
  {
    const char* file = path;
    while (*path)
    {
      if (*path == '/' || *path == '\\')
      {
        file = path + 1;
      }
      ++path;
    }
    return file;
  }
} // namespace detail

/// \brief Thread-safe process-wide logger with level filtering, optional file
/// output and a pluggable external handler.
class Logger
{
public:
  enum class Level
  {
    Trace,
    Debug,
    Info,
    Warning,
    Error,
    Fatal
  };

  /// \brief External log handler function type
  /// Takes log level, formatted message, and original message without
  /// timestamp/level prefix
  using ExternalHandler = std::function<void(Level level, const std::string& formattedMessage,
                                             const std::string& rawMessage)>;

  static void init(Level level = Level::Info, const std::string& filePath = "",
                   const std::string& timeFormat = "%Y-%m-%d %H:%M:%S")
  {
    auto& data = getData();
    std::lock_guard<std::mutex> lock(data.mutex);
    data.minLevel = level;
    data.timestampFormat = timeFormat;
    data.fileStream.reset();
    if (!filePath.empty())
    {
      data.fileStream = std::make_unique<std::ofstream>(filePath, std::ios::app);
      if (!data.fileStream->is_open())
      {
        std::cerr << "[Logger] Failed to open log file: " << filePath << std::endl;
        data.fileStream.reset();
      }
    }
  }

  static void setLevel(Level level)
  {
    auto& data = getData();
    std::lock_guard<std::mutex> lock(data.mutex);
    data.minLevel = level;
  }

  static Level getLevel()
  {
    auto& data = getData();
    std::lock_guard<std::mutex> lock(data.mutex);
    return data.minLevel;
  }

  /// \brief Register an external log handler
  /// When an external handler is registered, file logging and console output
  /// are bypassed
  static void setExternalHandler(ExternalHandler handler)
  {
    auto& data = getData();
    std::lock_guard<std::mutex> lock(data.mutex);
    data.externalHandler = std::move(handler);
  }

  static void clearExternalHandler()
  {
    auto& data = getData();
    std::lock_guard<std::mutex> lock(data.mutex);
    data.externalHandler = nullptr;
  }

  static void flush()
  {
    auto& data = getData();
    std::lock_guard<std::mutex> lock(data.mutex);
    if (data.fileStream)
    {
      data.fileStream->flush();
    }
    else
    {
      std::cout.flush();
    }
  }

  static void trace(const std::string& message) { log(Level::Trace, message); }
  static void debug(const std::string& message) { log(Level::Debug, message); }
  static void info(const std::string& message) { log(Level::Info, message); }
  static void warning(const std::string& message) { log(Level::Warning, message); }
  static void error(const std::string& message) { log(Level::Error, message); }
  static void fatal(const std::string& message) { log(Level::Fatal, message); }

  static void log(Level level, const std::string& message)
  {
    log(level, message, nullptr, 0, nullptr);
  }

  /// \brief Log a message with source location information
  static void log(Level level, const std::string& message, const char* file, int line,
                  const char* function)
  {
    auto& data = getData();
    std::lock_guard<std::mutex> lock(data.mutex);
    if (level < data.minLevel)
    {
      return;
    }

    std::string output = formatLogMessage(level, message, file, line, function,
                                          data.timestampFormat);
    if (data.externalHandler)
    {
      data.externalHandler(level, output, message);
    }
    else if (data.fileStream)
    {
      (*data.fileStream) << output;
      data.fileStream->flush();
    }
    else
    {
      std::cout << output;
    }
  }

  static const char* levelToString(Level level)
  {
    switch (level)
    {
    case Level::Trace:
      return "TRACE";
    case Level::Debug:
      return "DEBUG";
    case Level::Info:
      return "INFO";
    case Level::Warning:
      return "WARN";
    case Level::Error:
      return "ERROR";
    case Level::Fatal:
      return "FATAL";
    default:
      return "UNKNOWN";
    }
  }

  /// \brief Parse a level name as used in configuration files and on the
  /// command line.
  /// \throws std::invalid_argument for unknown names
  static Level levelFromString(const std::string& name)
  {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "trace")
      return Level::Trace;
    if (lower == "debug")
      return Level::Debug;
    if (lower == "info")
      return Level::Info;
    if (lower == "warn" || lower == "warning")
      return Level::Warning;
    if (lower == "error")
      return Level::Error;
    if (lower == "fatal")
      return Level::Fatal;
    throw std::invalid_argument("Unknown log level: " + name);
  }

private:
  struct LoggerData
  {
    std::mutex mutex;
    Level minLevel = Level::Info;
    std::string timestampFormat = "%Y-%m-%d %H:%M:%S";
    std::unique_ptr<std::ofstream> fileStream;
    ExternalHandler externalHandler;
  };

  static LoggerData& getData()
  {
    static LoggerData data;
    return data;
  }

  /// \note Caller holds the logger mutex
  static std::string formatLogMessage(Level level, const std::string& message,
                                      const char* file, int line, const char* function,
                                      const std::string& timestampFmt)
  {
    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    auto ms =
        std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;
    std::tm tm{};
    localtime_r(&t, &tm);

    std::ostringstream oss;
    oss << '[' << std::put_time(&tm, timestampFmt.c_str());
    if (timestampFmt.find("%S") != std::string::npos)
    {
      oss << '.' << std::setfill('0') << std::setw(3) << ms.count();
    }
    oss << "] [" << levelToString(level) << "] [";

    std::hash<std::thread::id> hasher;
    oss << std::hex << std::setfill('0') << std::setw(sizeof(std::size_t) * 2)
        << hasher(std::this_thread::get_id()) << std::dec << "] ";

    if (file)
    {
      oss << '[' << detail::basename(file) << ':' << line << ' ' << (function ? function : "")
          << "] ";
    }
    oss << message << '\n';
    return oss.str();
  }
};

/// \brief Stream-style logging macro with source location support
#define LINKGATE_LOG_WITH_LEVEL(level, msg)                                                        \
  do                                                                                               \
  {                                                                                                \
    std::ostringstream _oss;                                                                       \
    _oss << msg;                                                                                   \
    linkgate::core::Logger::log(linkgate::core::Logger::Level::level, _oss.str(), __FILE__,       \
                                __LINE__, __func__);                                               \
  } while (0)

#define LINKGATE_LOG_TRACE(msg) LINKGATE_LOG_WITH_LEVEL(Trace, msg)
#define LINKGATE_LOG_DEBUG(msg) LINKGATE_LOG_WITH_LEVEL(Debug, msg)
#define LINKGATE_LOG_INFO(msg) LINKGATE_LOG_WITH_LEVEL(Info, msg)
#define LINKGATE_LOG_WARN(msg) LINKGATE_LOG_WITH_LEVEL(Warning, msg)
#define LINKGATE_LOG_ERROR(msg) LINKGATE_LOG_WITH_LEVEL(Error, msg)
#define LINKGATE_LOG_FATAL(msg) LINKGATE_LOG_WITH_LEVEL(Fatal, msg)

} // namespace core
} // namespace linkgate
