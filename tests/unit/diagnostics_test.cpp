#include <trellis/core/diagnostics.h>

#include <gtest/gtest.h>
#include <string>
#include <vector>

using namespace trellis::core;

// ---------------------------------------------------------------------------
// 1. Emitter
// ---------------------------------------------------------------------------
TEST(DiagnosticEmitter, RecordsEventsInOrder) {
    DiagnosticEmitter emitter;
    emitter.emit(Severity::Info, "style", "cascade", "first");
    emitter.emit(Severity::Warning, "layout", "inline", "second");

    ASSERT_EQ(emitter.size(), 2u);
    EXPECT_EQ(emitter.events()[0].message, "first");
    EXPECT_EQ(emitter.events()[1].severity, Severity::Warning);
    EXPECT_LE(emitter.events()[0].timestamp, emitter.events()[1].timestamp);
}

TEST(DiagnosticEmitter, MinSeverityFilters) {
    DiagnosticEmitter emitter;
    emitter.set_min_severity(Severity::Warning);
    emitter.emit(Severity::Info, "layout", "layout", "dropped");
    emitter.emit(Severity::Error, "font", "load", "kept");
    ASSERT_EQ(emitter.size(), 1u);
    EXPECT_EQ(emitter.events()[0].message, "kept");
}

TEST(DiagnosticEmitter, CorrelationIdIsStamped) {
    DiagnosticEmitter emitter;
    emitter.set_correlation_id(7);
    emitter.emit(Severity::Info, "pipeline", "frame", "x");
    EXPECT_EQ(emitter.events()[0].correlation_id, 7u);
}

TEST(DiagnosticEmitter, ObserversSeeEveryEvent) {
    DiagnosticEmitter emitter;
    std::vector<std::string> seen;
    emitter.add_observer([&](const DiagnosticEvent& e) { seen.push_back(e.message); });
    emitter.emit(Severity::Info, "style", "cascade", "a");
    emitter.emit(Severity::Info, "style", "cascade", "b");
    EXPECT_EQ(seen, (std::vector<std::string>{"a", "b"}));
}

TEST(DiagnosticEmitter, FilterByModuleAndSeverity) {
    DiagnosticEmitter emitter;
    emitter.emit(Severity::Info, "style", "cascade", "a");
    emitter.emit(Severity::Warning, "layout", "inline", "b");
    emitter.emit(Severity::Info, "layout", "layout", "c");

    EXPECT_EQ(emitter.events_by_module("layout").size(), 2u);
    EXPECT_EQ(emitter.events_by_severity(Severity::Warning).size(), 1u);

    emitter.clear();
    EXPECT_EQ(emitter.size(), 0u);
}

TEST(DiagnosticEmitter, EmitIfToleratesNull) {
    emit_if(nullptr, Severity::Error, "layout", "layout", "ignored");
    DiagnosticEmitter emitter;
    emit_if(&emitter, Severity::Error, "layout", "layout", "kept");
    EXPECT_EQ(emitter.size(), 1u);
}

TEST(DiagnosticEmitter, HistoryIsBounded) {
    DiagnosticEmitter emitter;
    EXPECT_EQ(emitter.capacity(), 4096u);
    emitter.set_capacity(2);
    size_t observed = 0;
    emitter.add_observer([&](const DiagnosticEvent&) { ++observed; });

    emitter.emit(Severity::Info, "layout", "layout", "1");
    emitter.emit(Severity::Info, "layout", "layout", "2");
    emitter.emit(Severity::Warning, "layout", "layout", "3");

    ASSERT_EQ(emitter.size(), 2u);
    EXPECT_EQ(emitter.events().front().message, "2");
    EXPECT_EQ(emitter.dropped(), 1u);
    EXPECT_EQ(observed, 3u);
    EXPECT_EQ(emitter.count(Severity::Warning), 1u);

    emitter.set_capacity(1);
    EXPECT_EQ(emitter.events().front().message, "3");
    EXPECT_EQ(emitter.dropped(), 2u);
}

TEST(DiagnosticEmitter, ElementKeyIsRecorded) {
    DiagnosticEmitter emitter;
    emit_if(&emitter, Severity::Warning, "layout", "inline", "narrow", 42);
    EXPECT_EQ(emitter.events()[0].element_key, 42u);
}

TEST(Diagnostics, FormatEvent) {
    DiagnosticEvent event;
    event.severity = Severity::Warning;
    event.module = "layout";
    event.stage = "inline";
    event.message = "no width";
    event.correlation_id = 3;
    event.element_key = 12;
    EXPECT_EQ(format_diagnostic(event), "[warning] layout/inline (cid:3) <element 12>: no width");

    event.correlation_id = 0;
    event.element_key = 0;
    event.stage.clear();
    EXPECT_EQ(format_diagnostic(event), "[warning] layout: no width");
}

// ---------------------------------------------------------------------------
// 2. Failure traces
// ---------------------------------------------------------------------------
TEST(FailureTrace, CaptureCarriesContext) {
    DiagnosticEmitter emitter;
    emitter.set_correlation_id(12);
    emitter.emit(Severity::Info, "style", "cascade", "resolved 3 elements");

    FailureTrace trace = capture_failure(&emitter, "layout", "dispatch", "boom");
    trace.add_snapshot("tag", "div");

    EXPECT_EQ(trace.correlation_id, 12u);
    ASSERT_EQ(trace.context_events.size(), 1u);
    ASSERT_NE(trace.snapshot("tag"), nullptr);
    EXPECT_EQ(*trace.snapshot("tag"), "div");
    EXPECT_EQ(trace.snapshot("key"), nullptr);

    EXPECT_EQ(trace.format(),
              "fatal error in layout/dispatch (cid:12): boom\n"
              "  tag = div\n"
              "  recent events (1):\n"
              "    [info] style/cascade (cid:12): resolved 3 elements\n");
}

TEST(FailureTrace, KeepsOnlyRecentEvents) {
    DiagnosticEmitter emitter;
    for (int i = 0; i < 40; ++i) {
        emitter.emit(Severity::Info, "layout", "layout", std::to_string(i));
    }
    FailureTrace trace = capture_failure(&emitter, "layout", "dispatch", "boom");
    ASSERT_EQ(trace.context_events.size(), 16u);
    EXPECT_EQ(trace.context_events.front().message, "24");
    EXPECT_EQ(trace.context_events.back().message, "39");
}

TEST(FailureTrace, CaptureWithoutEmitter) {
    FailureTrace trace = capture_failure(nullptr, "font", "load", "bad data");
    EXPECT_EQ(trace.correlation_id, 0u);
    EXPECT_TRUE(trace.context_events.empty());
    EXPECT_EQ(trace.format(), "fatal error in font/load: bad data\n");
}

TEST(FailureTraceDeathTest, FatalErrorPrintsAndAborts) {
    FailureTrace trace = capture_failure(nullptr, "layout", "dispatch", "contract broken");
    EXPECT_DEATH(fatal_error(trace), "fatal error in layout/dispatch: contract broken");
}
