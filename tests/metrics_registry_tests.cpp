#include <gtest/gtest.h>
#include "utilities/metrics.h"

/**
 * @brief Verify correct formatting of label strings in Prometheus format.
 */
TEST(MetricsRegistry, LabelsToString) {
    std::map<std::string,std::string> labels{{"strategy","refcount"},{"status","completed"}};
    EXPECT_EQ(MetricsRegistry::labelsToString(labels), "{status=\"completed\",strategy=\"refcount\"}");
    EXPECT_EQ(MetricsRegistry::labelsToString({}), "");
}

/**
 * @brief Series with the same name but different labels are tracked apart.
 */
TEST(MetricsRegistry, SeriesAreKeyedByLabels) {
    auto& m = MetricsRegistry::instance();
    m.reset();
    m.incrementCounter("chunkkeeper_gc_runs_total", 1, {{"strategy","refcount"}});
    m.incrementCounter("chunkkeeper_gc_runs_total", 2, {{"strategy","mark-sweep"}});
    m.incrementCounter("chunkkeeper_gc_runs_total", 1, {{"strategy","refcount"}});

    EXPECT_EQ(m.counterValue("chunkkeeper_gc_runs_total", {{"strategy","refcount"}}), 2.0);
    EXPECT_EQ(m.counterValue("chunkkeeper_gc_runs_total", {{"strategy","mark-sweep"}}), 2.0);
    EXPECT_EQ(m.counterValue("chunkkeeper_gc_runs_total"), 0.0);

    std::string text = m.toPrometheus();
    EXPECT_NE(text.find("# TYPE chunkkeeper_gc_runs_total counter"), std::string::npos);
    EXPECT_NE(text.find("chunkkeeper_gc_runs_total{strategy=\"refcount\"} 2"), std::string::npos);
    m.reset();
}

/**
 * @brief Validate gauge, counter and histogram reporting.
 */
TEST(MetricsRegistry, BasicRecording) {
    auto& m = MetricsRegistry::instance();
    m.reset();
    m.setGauge("chunkkeeper_reclaimable_bytes", 2048, {{"node","node-1"}});
    m.setGauge("chunkkeeper_gc_halted", 1);
    m.setGauge("chunkkeeper_gc_halted", 0);
    m.incrementCounter("chunkkeeper_gc_lock_denied_total", 3);
    m.observe("chunkkeeper_gc_run_duration_seconds", 1.5, {{"strategy","generational"}});
    m.observe("chunkkeeper_gc_run_duration_seconds", 0.5, {{"strategy","generational"}});

    EXPECT_EQ(m.gaugeValue("chunkkeeper_gc_halted"), 0.0);
    std::string metrics = m.toPrometheus();
    EXPECT_NE(metrics.find("chunkkeeper_reclaimable_bytes{node=\"node-1\"} 2048"), std::string::npos);
    EXPECT_NE(metrics.find("chunkkeeper_gc_lock_denied_total 3"), std::string::npos);
    EXPECT_NE(metrics.find("chunkkeeper_gc_run_duration_seconds_sum{strategy=\"generational\"} 2"),
              std::string::npos);
    EXPECT_NE(metrics.find("chunkkeeper_gc_run_duration_seconds_count{strategy=\"generational\"} 2"),
              std::string::npos);
    m.reset();
    EXPECT_TRUE(m.toPrometheus().empty());
}
