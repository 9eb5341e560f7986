#include "tessera/diag/logging.hpp"
#include "tessera/graph/Graph.hpp"
#include <algorithm>
#include <gtest/gtest.h>
#include <memory>
#include <spdlog/sinks/ringbuffer_sink.h>
#include <string_view>

using namespace tessera;
using namespace tessera::graph;

namespace {

// Collects the messages of the tessera logger while in scope and restores
// its level afterwards.
class CapturedLog {
public:
  CapturedLog()
      : m_sink(std::make_shared<spdlog::sinks::ringbuffer_sink_mt>(64)),
        m_level(diag::tessera_logger().level()) {
    m_sink->set_pattern("%l %v");
    diag::tessera_logger().sinks().push_back(m_sink);
  }

  ~CapturedLog() {
    auto &sinks = diag::tessera_logger().sinks();
    sinks.erase(std::remove(sinks.begin(), sinks.end(), m_sink), sinks.end());
    diag::tessera_logger().set_level(m_level);
  }

  bool contains(std::string_view needle) const {
    for (const auto &line : m_sink->last_formatted()) {
      if (line.find(needle) != std::string::npos) {
        return true;
      }
    }
    return false;
  }

private:
  std::shared_ptr<spdlog::sinks::ringbuffer_sink_mt> m_sink;
  spdlog::level::level_enum m_level;
};

} // namespace

TEST(graph_logging, realize_logs_deferred_obligation) {
  CapturedLog log;
  Options options;
  options.logLevel = diag::LogLevel::Debug;
  Graph g{options};

  GraphTensor x = g.newTensor("x", Shape{g.dynamic("seq")});
  g.realize(x, Shape{g.dynamic("len")});
  ASSERT_EQ(g.obligations().size(), 1u);
  EXPECT_TRUE(log.contains("debug"));
  EXPECT_TRUE(log.contains("deferred check seq == len (realize axis 0)"));
}

TEST(graph_logging, insert_logs_at_trace) {
  CapturedLog log;
  Options options;
  options.logLevel = diag::LogLevel::Trace;
  Graph g{options};

  g.newTensor("x", Shape{Dim::Constant(4)});
  EXPECT_TRUE(log.contains("Input{name=\"x\"}"));
}

TEST(graph_logging, default_options_keep_log_level) {
  CapturedLog log;
  Options verbose;
  verbose.logLevel = diag::LogLevel::Trace;
  Graph first{verbose};
  EXPECT_EQ(diag::tessera_logger().level(), spdlog::level::trace);

  Graph second;
  EXPECT_EQ(diag::tessera_logger().level(), spdlog::level::trace);

  Options quiet;
  quiet.logLevel = diag::LogLevel::Error;
  Graph third{quiet};
  EXPECT_EQ(diag::tessera_logger().level(), spdlog::level::err);
}
