#include <gtest/gtest.h>
#include "signals/SignalExtractor.hpp"

using namespace obs_sitter;

class SignalExtractorTest : public ::testing::Test {
protected:
    DetectorConfig config_;
    SourceParser parser_;
    std::string source_;
    std::unique_ptr<Tree> tree_;

    SignalVisitor visit(const std::string& source, int depth = 0) {
        source_ = source;
        tree_ = parser_.parse(source_);
        EXPECT_NE(tree_, nullptr);

        SignalVisitor visitor(config_, "app/jobs/worker.rb", depth);
        if (tree_) {
            visitor.visit(*tree_, source_);
        }
        return visitor;
    }
};

TEST_F(SignalExtractorTest, LogsBeforeMetrics) {
    auto visitor = visit(R"(
class Worker
  def perform
    StatsD.increment("jobs.started")
    logger.info("job_started")
    Prometheus.histogram(:job_seconds).observe(1)
    logger.warn("job_slow")
  end
end
)", 1);

    SignalExtractor extractor;
    auto signals = extractor.extract(visitor);

    ASSERT_EQ(signals.size(), 4u);
    EXPECT_EQ(signals[0].name, "job_started");
    EXPECT_TRUE(signals[0].is_log());
    EXPECT_EQ(signals[1].name, "job_slow");
    EXPECT_EQ(signals[1].metadata.level, "warn");
    EXPECT_EQ(signals[2].name, "jobs.started");
    EXPECT_EQ(signals[2].type, SignalType::Counter);
    EXPECT_EQ(signals[3].name, "job_seconds");
    EXPECT_EQ(signals[3].type, SignalType::Histogram);
    EXPECT_EQ(signals[3].metadata.metric_type, MetricType::Histogram);

    for (const auto& signal : signals) {
        EXPECT_EQ(signal.source_file, "app/jobs/worker.rb");
        EXPECT_EQ(signal.defining_class, "Worker");
        EXPECT_EQ(signal.inheritance_depth, 1);
    }
}

TEST_F(SignalExtractorTest, FallbackLogName) {
    auto visitor = visit(R"(
class Worker
  def perform(message)
    logger.error(message)
  end
end
)");

    SignalExtractor extractor;
    auto signals = extractor.extract(visitor);

    ASSERT_EQ(signals.size(), 1u);
    EXPECT_EQ(signals[0].name, SignalExtractor::fallback_log_name("Worker", "error", 4));
    EXPECT_EQ(signals[0].name.rfind("log_", 0), 0u);
    EXPECT_EQ(signals[0].name.size(), 12u);
}

TEST_F(SignalExtractorTest, FallbackNameIsStable) {
    auto first = SignalExtractor::fallback_log_name("Foo", "info", 10);
    auto again = SignalExtractor::fallback_log_name("Foo", "info", 10);
    auto other_line = SignalExtractor::fallback_log_name("Foo", "info", 11);
    auto other_level = SignalExtractor::fallback_log_name("Foo", "warn", 10);

    EXPECT_EQ(first, again);
    EXPECT_NE(first, other_line);
    EXPECT_NE(first, other_level);
    EXPECT_EQ(first.find_first_not_of("0123456789abcdef", 4), std::string::npos);
}

TEST_F(SignalExtractorTest, ConstantReferencesResolvedInPlace) {
    ConstantResolver constants(config_);
    std::string definitions = R"(
module Metrics
  RequestTotal = Hesiod.register_counter("request_total")
  QueueDepth = Hesiod.register_gauge("queue_depth")
end
)";
    auto definitions_tree = parser_.parse(definitions);
    ASSERT_NE(definitions_tree, nullptr);
    constants.scan(*definitions_tree, definitions);

    auto visitor = visit(R"(
class Worker
  def perform
    Metrics::RequestTotal.increment
    StatsD.increment("inline")
    Metrics::QueueDepth.set(5)
    Metrics::Unregistered.increment
  end
end
)");

    SignalExtractor extractor(&constants);
    auto signals = extractor.extract(visitor);

    ASSERT_EQ(signals.size(), 3u);
    EXPECT_EQ(signals[0].name, "request_total");
    EXPECT_EQ(signals[0].metadata.line, 4u);
    EXPECT_EQ(signals[1].name, "inline");
    EXPECT_EQ(signals[2].name, "queue_depth");
    EXPECT_EQ(signals[2].type, SignalType::Gauge);
}

TEST_F(SignalExtractorTest, ConstantReferencesDroppedWithoutResolver) {
    auto visitor = visit("Metrics::RequestTotal.increment\n");

    SignalExtractor extractor;

    EXPECT_TRUE(extractor.extract(visitor).empty());
}

TEST_F(SignalExtractorTest, SignalJson) {
    auto visitor = visit(R"(
class Foo
  def call
    logger.info "payment_processed"
  end
end
)");

    SignalExtractor extractor;
    auto signals = extractor.extract(visitor);
    ASSERT_EQ(signals.size(), 1u);

    json j = signals[0];
    EXPECT_EQ(j["type"], "log");
    EXPECT_EQ(j["name"], "payment_processed");
    EXPECT_EQ(j["defining_class"], "Foo");
    EXPECT_EQ(j["inheritance_depth"], 0);
    EXPECT_EQ(j["metadata"]["level"], "info");
    EXPECT_EQ(j["metadata"]["interpolated"], false);
    EXPECT_EQ(j["metadata"]["line"], 4);
    EXPECT_FALSE(j["metadata"].contains("metric_type"));
}
