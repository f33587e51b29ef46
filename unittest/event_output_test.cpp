// ============================================================================
// EVENT OUTPUT UNIT TESTS
// ============================================================================
// JSON lines sink, dead letter queue and metric registry
// ============================================================================

#include <gtest/gtest.h>
#include <vaultstream/core/events/dead_letter_queue.hpp>
#include <vaultstream/core/events/json_lines_sink.hpp>
#include <vaultstream/core/metrics/registry.hpp>

#include <nlohmann/json.hpp>
#include <sstream>

using namespace VaultStream;

namespace {

EventEnvelope makeEnvelope(const std::string& type, const std::string& pattern, uint64_t seq) {
    Timestamp ts{std::chrono::milliseconds(1700000000123LL)};
    Provenance p{pattern, 7, 2, seq};
    return EventEnvelope(type, ts, PayloadValue(PayloadValue::Object{{"k", 1}}), GenericEvent{}, p);
}

} // namespace

// ============================================================================
// JSON LINES SINK
// ============================================================================

TEST(JsonLinesSink, WritesOneObjectPerLine) {
    std::ostringstream out;
    JsonLinesSink sink(out);

    sink.put(makeEnvelope("kv-v2/data-write", "kv-v2/*", 1));
    sink.put(makeEnvelope("kv-v2/data-delete", "kv-v2/*", 2));
    EXPECT_EQ(sink.written(), 2u);

    std::istringstream in(out.str());
    std::string line;
    std::vector<nlohmann::json> lines;
    while (std::getline(in, line)) {
        lines.push_back(nlohmann::json::parse(line));
    }
    ASSERT_EQ(lines.size(), 2u);

    const auto& first = lines[0];
    EXPECT_EQ(first["type"].get<std::string>(), "kv-v2/data-write");
    EXPECT_EQ(first["origin"].get<std::string>(), "kv-v2/*");
    EXPECT_EQ(first["timestamp"].get<std::string>(), "2023-11-14T22:13:20.123Z");
    EXPECT_EQ(first["data"]["k"].get<int>(), 1);
    EXPECT_EQ(first["provenance"]["session_id"].get<uint32_t>(), 7u);
    EXPECT_EQ(first["provenance"]["connection_epoch"].get<uint64_t>(), 2u);
    EXPECT_FALSE(first.contains("secret"));
    EXPECT_EQ(lines[1]["provenance"]["sequence"].get<uint64_t>(), 2u);
}

TEST(JsonLinesSink, IncludesSecretDetail) {
    std::ostringstream out;
    JsonLinesSink sink(out);

    SecretEvent secret;
    secret.path = "secret/data/app";
    secret.operation = "data-write";
    secret.modified = true;
    sink.put(EventEnvelope("kv-v2/data-write", Timestamp{}, PayloadValue(), secret, Provenance{"kv-v2/*", 1, 1, 1}));

    auto json = nlohmann::json::parse(out.str());
    ASSERT_TRUE(json.contains("secret"));
    EXPECT_EQ(json["secret"]["path"].get<std::string>(), "secret/data/app");
    EXPECT_TRUE(json["secret"]["modified"].get<bool>());
}

TEST(JsonLinesSink, ThrowsWhenStreamFails) {
    std::ostringstream out;
    out.setstate(std::ios::badbit);
    JsonLinesSink sink(out);

    EXPECT_THROW(sink.put(makeEnvelope("x", "p", 1)), std::runtime_error);
    EXPECT_EQ(sink.written(), 0u);
}

// ============================================================================
// DEAD LETTER QUEUE
// ============================================================================

TEST(DeadLetterQueue, CountsPerPatternAndReturnsNewestFirst) {
    DeadLetterQueue dlq;
    dlq.push(makeEnvelope("a", "kv-v2/*", 1), "buffer full");
    dlq.push(makeEnvelope("b", "kv-v2/*", 2), "buffer full");
    dlq.push(makeEnvelope("c", "database/*", 1), "shutdown");

    EXPECT_EQ(dlq.totalDropped(), 3u);
    EXPECT_EQ(dlq.droppedFor("kv-v2/*"), 2u);
    EXPECT_EQ(dlq.droppedFor("database/*"), 1u);
    EXPECT_EQ(dlq.droppedFor("other/*"), 0u);

    auto recent = dlq.getRecentEvents(2);
    ASSERT_EQ(recent.size(), 2u);
    EXPECT_EQ(recent[0].type(), "c");
    EXPECT_EQ(recent[1].type(), "b");

    dlq.clear();
    EXPECT_EQ(dlq.size(), 0u);
    EXPECT_EQ(dlq.totalDropped(), 3u);
}

TEST(DeadLetterQueue, KeepsOnlyMostRecentEvents) {
    DeadLetterQueue dlq;
    for (uint64_t i = 1; i <= DeadLetterQueue::MAX_STORED_EVENTS + 5; ++i) {
        dlq.push(makeEnvelope("e", "kv-v2/*", i), "buffer full");
    }
    EXPECT_EQ(dlq.size(), DeadLetterQueue::MAX_STORED_EVENTS);
    EXPECT_EQ(dlq.totalDropped(), DeadLetterQueue::MAX_STORED_EVENTS + 5);
    EXPECT_EQ(dlq.getRecentEvents(1)[0].provenance().sequence, DeadLetterQueue::MAX_STORED_EVENTS + 5);
}

// ============================================================================
// METRIC REGISTRY
// ============================================================================

TEST(MetricRegistry, SameNameSharesMetrics) {
    MetricRegistry registry;
    auto a = registry.getMetrics("kv-v2/*");
    auto b = registry.getMetrics("kv-v2/*");
    EXPECT_EQ(a.get(), b.get());

    a->events_enqueued.fetch_add(10);
    a->events_dropped.fetch_add(1);
    a->frames_received.fetch_add(11);

    auto snap = registry.getSnapshot("kv-v2/*");
    ASSERT_TRUE(snap.has_value());
    EXPECT_EQ(snap->events_enqueued, 10u);
    EXPECT_EQ(snap->frames_received, 11u);
    EXPECT_FALSE(registry.getSnapshot("missing/*").has_value());
    EXPECT_EQ(registry.getSnapshots().size(), 1u);
}
