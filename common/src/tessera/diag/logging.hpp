#pragma once

#include <memory>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace tessera::diag {

enum LogLevel {
  Off,
  Error,
  Warn,
  Info,
  Debug,
  Trace,
};

inline spdlog::logger &tessera_logger() {
  // thread-safe since C++11 for function-local statics
  static spdlog::logger &ref = []() -> spdlog::logger & {
    auto lg = spdlog::get("tessera");
    if (!lg) {
      auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
      lg = std::make_shared<spdlog::logger>("tessera", sink);
      lg->set_level(spdlog::level::info);
      lg->set_pattern("[%^%-5l%$ \x1B[4m%s:%#\x1B[0m] %v");
      lg->flush_on(spdlog::level::warn);
      spdlog::register_logger(lg);
    }
    return *lg;
  }();
  return ref;
}

inline spdlog::logger &tessera_raw_logger() {
  static spdlog::logger &ref = []() -> spdlog::logger & {
    auto lg = spdlog::get("tessera.raw");
    if (!lg) {
      auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
      lg = std::make_shared<spdlog::logger>("tessera.raw", sink);
      lg->set_level(spdlog::level::info);
      lg->set_pattern("%v");
      spdlog::register_logger(lg);
    }
    return *lg;
  }();
  return ref;
}

inline void set_log_level(LogLevel level) {
  spdlog::level::level_enum lvl = spdlog::level::info;
  switch (level) {
  case Off:
    lvl = spdlog::level::off;
    break;
  case Error:
    lvl = spdlog::level::err;
    break;
  case Warn:
    lvl = spdlog::level::warn;
    break;
  case Info:
    lvl = spdlog::level::info;
    break;
  case Debug:
    lvl = spdlog::level::debug;
    break;
  case Trace:
    lvl = spdlog::level::trace;
    break;
  }
  tessera_logger().set_level(lvl);
  tessera_raw_logger().set_level(lvl);
}

#define TESSERA_TRACE(...) ::tessera::diag::tessera_logger().trace(__VA_ARGS__)
#define TESSERA_DEBUG(...) ::tessera::diag::tessera_logger().debug(__VA_ARGS__)
#define TESSERA_INFO(...) ::tessera::diag::tessera_logger().info(__VA_ARGS__)
#define TESSERA_WARN(...) ::tessera::diag::tessera_logger().warn(__VA_ARGS__)
#define TESSERA_ERROR(...) ::tessera::diag::tessera_logger().error(__VA_ARGS__)

#define TESSERA_INFO_RAW(...)                                                  \
  ::tessera::diag::tessera_raw_logger().info(__VA_ARGS__)

} // namespace tessera::diag
