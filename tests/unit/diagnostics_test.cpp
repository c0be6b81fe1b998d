#include <scenesync/core/diagnostics.h>

#include <gtest/gtest.h>
#include <sstream>
#include <string>
#include <vector>

using namespace scenesync::core;

TEST(Diagnostics, EmitRecordsEvent) {
    DiagnosticEmitter emitter;
    emitter.set_batch_id(7);
    emitter.emit(Severity::Info, "host", "create", "created Shape", 3);

    ASSERT_EQ(emitter.size(), 1u);
    const auto& e = emitter.events()[0];
    EXPECT_EQ(e.severity, Severity::Info);
    EXPECT_EQ(e.module, "host");
    EXPECT_EQ(e.stage, "create");
    EXPECT_EQ(e.node_id, 3u);
    EXPECT_EQ(e.batch_id, 7u);
}

TEST(Diagnostics, MinSeverityFiltersBeforeObservers) {
    DiagnosticEmitter emitter;
    int seen = 0;
    emitter.add_observer([&seen](const DiagnosticEvent&) { ++seen; });

    emitter.emit(Severity::Debug, "host", "append", "dropped");
    EXPECT_EQ(emitter.size(), 0u);
    EXPECT_EQ(seen, 0);

    emitter.set_min_severity(Severity::Debug);
    emitter.emit(Severity::Debug, "host", "append", "kept");
    EXPECT_EQ(emitter.size(), 1u);
    EXPECT_EQ(seen, 1);
}

TEST(Diagnostics, RetentionLimitDropsOldest) {
    DiagnosticEmitter emitter;
    emitter.set_retention_limit(2);
    emitter.emit(Severity::Info, "m", "s", "one");
    emitter.emit(Severity::Info, "m", "s", "two");
    emitter.emit(Severity::Info, "m", "s", "three");
    ASSERT_EQ(emitter.size(), 2u);
    EXPECT_EQ(emitter.events()[0].message, "two");
    EXPECT_EQ(emitter.events()[1].message, "three");
}

TEST(Diagnostics, RetentionHoldsSteadyAtCap) {
    DiagnosticEmitter emitter;
    emitter.set_retention_limit(3);
    for (int i = 0; i < 1000; ++i) {
        emitter.emit(Severity::Info, "m", "s", std::to_string(i));
    }
    ASSERT_EQ(emitter.size(), 3u);
    EXPECT_EQ(emitter.events().front().message, "997");
    EXPECT_EQ(emitter.events().back().message, "999");

    emitter.set_retention_limit(1);
    ASSERT_EQ(emitter.size(), 1u);
    EXPECT_EQ(emitter.events().front().message, "999");

    FailureTraceCollector collector;
    FailureTrace& trace = collector.capture(emitter, "m", "s", "boom");
    ASSERT_EQ(trace.context_events.size(), 1u);
    EXPECT_EQ(trace.context_events[0].message, "999");
}

TEST(Diagnostics, Queries) {
    DiagnosticEmitter emitter;
    emitter.emit(Severity::Info, "host", "create", "a", 1);
    emitter.emit(Severity::Warning, "host", "append", "b", 2);
    emitter.emit(Severity::Error, "svg", "inject", "c", 1);

    EXPECT_EQ(emitter.events_by_severity(Severity::Warning).size(), 1u);
    EXPECT_EQ(emitter.events_by_module("host").size(), 2u);
    EXPECT_EQ(emitter.events_for_node(1).size(), 2u);

    emitter.clear();
    EXPECT_EQ(emitter.size(), 0u);
}

TEST(Diagnostics, FormatAndStreamObserver) {
    DiagnosticEmitter emitter;
    std::ostringstream out;
    emitter.add_observer(stream_observer(out));
    emitter.set_batch_id(2);
    emitter.emit(Severity::Warning, "host", "append", "moving node", 5);
    EXPECT_EQ(out.str(), "[warning] host/append (node:5) (batch:2): moving node\n");
}

TEST(FailureTraces, CaptureSnapshotsContext) {
    DiagnosticEmitter emitter;
    emitter.set_batch_id(4);
    emitter.emit(Severity::Info, "host", "create", "created Group", 1);

    FailureTraceCollector collector;
    FailureTrace& trace = collector.capture(emitter, "host", "insert", "can not insert node before itself");
    trace.add_snapshot("node", "1");

    ASSERT_EQ(collector.size(), 1u);
    EXPECT_EQ(trace.batch_id, 4u);
    EXPECT_EQ(trace.context_events.size(), 1u);
    std::string text = trace.format();
    EXPECT_NE(text.find("(batch:4)"), std::string::npos);
    EXPECT_NE(text.find("stage: insert"), std::string::npos);
    EXPECT_NE(text.find("node=1"), std::string::npos);

    collector.clear();
    EXPECT_EQ(collector.size(), 0u);
}
