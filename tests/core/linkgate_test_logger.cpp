// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Linkgate, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#define CATCH_CONFIG_MAIN
#include "test_helpers.hpp"
#include <catch2/catch.hpp>

#include <algorithm>
#include <cstdio>
#include <fstream>
#include <iterator>
#include <thread>
#include <vector>

using linkgate::core::Logger;

namespace
{
struct CapturedLine
{
  Logger::Level level;
  std::string formatted;
  std::string raw;
};

/// Routes log output into a vector for the lifetime of the guard.
struct CaptureGuard
{
  std::vector<CapturedLine> lines;
  std::mutex mutex;

  CaptureGuard()
  {
    Logger::setExternalHandler(
        [this](Logger::Level level, const std::string& formatted, const std::string& raw)
        {
          std::lock_guard<std::mutex> lock(mutex);
          lines.push_back(CapturedLine{level, formatted, raw});
        });
  }

  ~CaptureGuard() { Logger::clearExternalHandler(); }
};
} // namespace

TEST_CASE("Logger writes every level to a file", "[logger][levels]")
{
  const std::string logFile = "linkgate_testlog.log";
  std::remove(logFile.c_str());

  Logger::init(Logger::Level::Trace, logFile);
  LINKGATE_LOG_TRACE("Trace message");
  LINKGATE_LOG_DEBUG("Debug message");
  LINKGATE_LOG_INFO("Info message");
  LINKGATE_LOG_WARN("Warn message");
  LINKGATE_LOG_ERROR("Error message");
  LINKGATE_LOG_FATAL("Fatal message " << 42);
  Logger::flush();
  Logger::init(Logger::Level::Info);

  std::ifstream in(logFile);
  REQUIRE(in.is_open());
  std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  REQUIRE(std::count(content.begin(), content.end(), '\n') == 6);
  REQUIRE(content.find("[FATAL]") != std::string::npos);
  REQUIRE(content.find("Fatal message 42") != std::string::npos);
  REQUIRE(content.find("linkgate_test_logger.cpp:") != std::string::npos);
  in.close();
  std::remove(logFile.c_str());
}

TEST_CASE("Logger filters messages below the minimum level", "[logger][levels]")
{
  CaptureGuard capture;
  Logger::setLevel(Logger::Level::Warning);
  Logger::debug("hidden");
  Logger::info("hidden too");
  Logger::warning("shown");
  LINKGATE_LOG_ERROR("also shown");
  Logger::setLevel(Logger::Level::Info);

  REQUIRE(capture.lines.size() == 2);
  CHECK(capture.lines[0].level == Logger::Level::Warning);
  CHECK(capture.lines[0].raw == "shown");
  CHECK(capture.lines[1].raw == "also shown");
  CHECK(capture.lines[1].formatted.find("[ERROR]") != std::string::npos);
}

TEST_CASE("External log handler receives raw and formatted text", "[logger][external]")
{
  CaptureGuard capture;
  Logger::setLevel(Logger::Level::Debug);
  LINKGATE_LOG_INFO("value=" << 7);

  REQUIRE(capture.lines.size() == 1);
  CHECK(capture.lines[0].raw == "value=7");
  CHECK(capture.lines[0].formatted.find("[INFO]") != std::string::npos);
  CHECK(capture.lines[0].formatted.back() == '\n');
  Logger::setLevel(Logger::Level::Info);
}

TEST_CASE("Logger level names", "[logger][config]")
{
  CHECK(Logger::levelFromString("trace") == Logger::Level::Trace);
  CHECK(Logger::levelFromString("DEBUG") == Logger::Level::Debug);
  CHECK(Logger::levelFromString("info") == Logger::Level::Info);
  CHECK(Logger::levelFromString("warn") == Logger::Level::Warning);
  CHECK(Logger::levelFromString("warning") == Logger::Level::Warning);
  CHECK(Logger::levelFromString("Error") == Logger::Level::Error);
  CHECK(Logger::levelFromString("fatal") == Logger::Level::Fatal);
  CHECK_THROWS_AS(Logger::levelFromString("verbose"), std::invalid_argument);
  CHECK(std::string(Logger::levelToString(Logger::Level::Warning)) == "WARN");
}

TEST_CASE("Logger Thread Safety", "[logger][threaded]")
{
  CaptureGuard capture;
  Logger::setLevel(Logger::Level::Info);
  std::vector<std::thread> threads;
  for (int t = 0; t < 8; ++t)
  {
    threads.emplace_back(
        [t]()
        {
          for (int i = 0; i < 50; ++i)
          {
            LINKGATE_LOG_INFO("thread " << t << " message " << i);
          }
        });
  }
  for (auto& thread : threads)
  {
    thread.join();
  }
  REQUIRE(capture.lines.size() == 400);
}
