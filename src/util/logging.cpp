// Copyright (c) 2024 Bridgescout
// Distributed under the MIT software license

#include "util/logging.hpp"
#include <iostream>
#include <map>
#include <mutex>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <vector>

namespace bridgescout {
namespace util {

namespace {
std::mutex s_mutex;
bool s_initialized = false;
std::map<std::string, std::shared_ptr<spdlog::logger>> s_loggers;

const std::vector<std::string> COMPONENTS = {"default", "discovery", "http",
                                             "app"};

// Caller must hold s_mutex
void InitializeLocked(const std::string &log_level, bool log_to_file,
                      const std::string &log_file_path) {
  if (s_initialized) {
    return;
  }

  try {
    std::vector<spdlog::sink_ptr> sinks;

    if (log_to_file) {
      auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(
          log_file_path, true); // append
      file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%l] %v");
      sinks.push_back(file_sink);
    } else {
      // Console goes to stderr so stdout stays clean for results
      auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
      console_sink->set_pattern("[%H:%M:%S.%e] [%n] [%l] %v");
      sinks.push_back(console_sink);
    }

    for (const auto &component : COMPONENTS) {
      auto logger = std::make_shared<spdlog::logger>(component, sinks.begin(),
                                                     sinks.end());
      logger->set_level(spdlog::level::from_str(log_level));
      logger->flush_on(spdlog::level::warn);
      spdlog::drop(component);
      spdlog::register_logger(logger);
      s_loggers[component] = logger;
    }

    spdlog::set_default_logger(s_loggers["default"]);
    s_initialized = true;

    s_loggers["default"]->debug("Logging system initialized (level: {})",
                                log_level);
  } catch (const spdlog::spdlog_ex &ex) {
    std::cerr << "Log initialization failed: " << ex.what() << std::endl;
  }
}
} // namespace

void LogManager::Initialize(const std::string &log_level, bool log_to_file,
                            const std::string &log_file_path) {
  std::lock_guard<std::mutex> lock(s_mutex);
  InitializeLocked(log_level, log_to_file, log_file_path);
}

void LogManager::Shutdown() {
  std::lock_guard<std::mutex> lock(s_mutex);
  if (!s_initialized) {
    return;
  }

  for (auto &[name, logger] : s_loggers) {
    logger->flush();
  }
  spdlog::shutdown();
  s_loggers.clear();
  s_initialized = false;
}

std::shared_ptr<spdlog::logger> LogManager::GetLogger(const std::string &name) {
  std::lock_guard<std::mutex> lock(s_mutex);
  if (!s_initialized) {
    InitializeLocked("info", false, "");
  }

  auto it = s_loggers.find(name);
  if (it != s_loggers.end()) {
    return it->second;
  }
  if (s_loggers.count("default")) {
    return s_loggers["default"];
  }
  // Initialization failed; fall back to spdlog's own default logger
  return spdlog::default_logger();
}

void LogManager::SetLogLevel(const std::string &level) {
  std::lock_guard<std::mutex> lock(s_mutex);
  if (!s_initialized) {
    return;
  }

  auto log_level = spdlog::level::from_str(level);
  for (auto &[name, logger] : s_loggers) {
    logger->set_level(log_level);
  }
}

bool LogManager::SetComponentLevel(const std::string &component,
                                   const std::string &level) {
  std::lock_guard<std::mutex> lock(s_mutex);
  if (!s_initialized) {
    return false;
  }

  auto it = s_loggers.find(component);
  if (it == s_loggers.end()) {
    return false;
  }
  it->second->set_level(spdlog::level::from_str(level));
  return true;
}

} // namespace util
} // namespace bridgescout
