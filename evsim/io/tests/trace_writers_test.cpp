#include <evsim/io/trace_writers.hpp>

#include <evsim/core/executor.hpp>
#include <evsim/core/simulation.hpp>

#include <gtest/gtest.h>
#include <rapidjson/document.h>

#include <memory>
#include <sstream>
#include <vector>

using namespace evsim::io;
using namespace evsim::core;

namespace {

// Forwards every event to a peer until the countdown reaches zero.
class Relay final : public Component<int> {
public:
    void set_peer(ComponentId<int> peer) { peer_ = peer; }

    void process_event(ComponentId<int> /*self_id*/, const int& remaining,
                       Scheduler& scheduler, State& /*state*/) const override {
        if (remaining > 0) {
            scheduler.schedule(duration_from_seconds(1.0), peer_, remaining - 1);
        }
    }

private:
    ComponentId<int> peer_;
};

} // namespace

class TraceWritersTest : public ::testing::Test {
protected:
    TimePoint time(double seconds) {
        return time_from_seconds(seconds);
    }

    static rapidjson::Document parse(const std::string& json) {
        rapidjson::Document doc;
        doc.Parse(json.c_str());
        EXPECT_FALSE(doc.HasParseError()) << json;
        return doc;
    }
};

// =============================================================================
// NullTraceWriter Tests
// =============================================================================

TEST_F(TraceWritersTest, NullWriterDropsSimulationRecords) {
    NullTraceWriter writer;
    Simulation sim;
    sim.set_trace_writer(&writer);

    (void)sim.add_queue(Fifo<int>{});

    EXPECT_EQ(Executor::unbound().execute(sim), 0U);
}

// =============================================================================
// JsonTraceWriter Tests
// =============================================================================

TEST_F(TraceWritersTest, JsonWriterEmptyRunIsEmptyArray) {
    std::ostringstream oss;
    {
        JsonTraceWriter writer(oss);
    }

    EXPECT_EQ(oss.str(), "[]\n");
}

TEST_F(TraceWritersTest, JsonWriterDispatchRecord) {
    std::ostringstream oss;
    {
        JsonTraceWriter writer(oss);
        writer.begin(time(1.5));
        writer.type("event_dispatched");
        writer.field("component_id", uint64_t{7});
        writer.field("sequence", uint64_t{3});
        writer.field("pending", uint64_t{0});
        writer.end();
    }

    auto doc = parse(oss.str());
    ASSERT_TRUE(doc.IsArray());
    ASSERT_EQ(doc.Size(), 1U);

    const auto& record = doc[0U];
    EXPECT_DOUBLE_EQ(record["time"].GetDouble(), 1.5);
    EXPECT_STREQ(record["type"].GetString(), "event_dispatched");
    EXPECT_EQ(record["component_id"].GetUint64(), 7U);
    EXPECT_EQ(record["sequence"].GetUint64(), 3U);
    EXPECT_EQ(record["pending"].GetUint64(), 0U);
}

TEST_F(TraceWritersTest, JsonWriterKeepsLargeIdsExact) {
    std::ostringstream oss;
    {
        JsonTraceWriter writer(oss);
        writer.begin(time(0.0));
        writer.type("component_added");
        writer.field("component_id", uint64_t{18446744073709551614ULL});
        writer.end();
    }

    auto doc = parse(oss.str());
    ASSERT_TRUE(doc[0U]["component_id"].IsUint64());
    EXPECT_EQ(doc[0U]["component_id"].GetUint64(), 18446744073709551614ULL);
}

TEST_F(TraceWritersTest, JsonWriterEscapesStrings) {
    std::ostringstream oss;
    {
        JsonTraceWriter writer(oss);
        writer.begin(time(0.0));
        writer.type("executor_finished");
        writer.field("reason", "line1\nline2\t\"quoted\"");
        writer.end();
    }

    auto doc = parse(oss.str());
    ASSERT_EQ(doc.Size(), 1U);
    EXPECT_STREQ(doc[0U]["reason"].GetString(), "line1\nline2\t\"quoted\"");
}

TEST_F(TraceWritersTest, JsonWriterFinalizeIsIdempotent) {
    std::ostringstream oss;
    {
        JsonTraceWriter writer(oss);
        writer.finalize();
        writer.finalize();
    }

    EXPECT_EQ(oss.str(), "[]\n");
}

TEST_F(TraceWritersTest, JsonWriterRecordsSimulation) {
    std::ostringstream oss;
    {
        JsonTraceWriter writer(oss);
        Simulation sim;
        sim.set_trace_writer(&writer);
        (void)sim.add_queue(Fifo<int>{});
        Executor::unbound().execute(sim);
    }

    auto doc = parse(oss.str());
    ASSERT_EQ(doc.Size(), 2U);
    EXPECT_STREQ(doc[0U]["type"].GetString(), "queue_added");
    EXPECT_STREQ(doc[1U]["type"].GetString(), "executor_finished");
    EXPECT_EQ(doc[1U]["steps"].GetUint64(), 0U);
    EXPECT_STREQ(doc[1U]["reason"].GetString(), "empty");
}

// =============================================================================
// MemoryTraceWriter Tests
// =============================================================================

TEST_F(TraceWritersTest, MemoryWriterKeepsFieldOrder) {
    MemoryTraceWriter writer;

    writer.begin(time(2.0));
    writer.type("event_dispatched");
    writer.field("component_id", uint64_t{4});
    writer.field("sequence", uint64_t{9});
    writer.field("pending", uint64_t{1});
    writer.end();

    const auto& records = writer.records();
    ASSERT_EQ(records.size(), 1U);
    EXPECT_EQ(records[0].time, time(2.0));
    ASSERT_EQ(records[0].fields.size(), 3U);
    EXPECT_EQ(records[0].fields[0].first, "component_id");
    EXPECT_EQ(records[0].fields[1].first, "sequence");
    EXPECT_EQ(records[0].fields[2].first, "pending");
    EXPECT_EQ(records[0].number("sequence"), 9U);
}

TEST_F(TraceWritersTest, MemoryWriterTypedLookups) {
    MemoryTraceWriter writer;

    writer.begin(time(0.0));
    writer.type("executor_finished");
    writer.field("steps", uint64_t{12});
    writer.field("reason", "step_limit");
    writer.end();

    const TraceRecord& record = writer.records().front();
    EXPECT_EQ(record.number("steps"), 12U);
    EXPECT_EQ(record.text("reason"), "step_limit");
    EXPECT_FALSE(record.number("reason").has_value());
    EXPECT_FALSE(record.text("steps").has_value());
    EXPECT_EQ(record.find("missing"), nullptr);
}

TEST_F(TraceWritersTest, MemoryWriterClear) {
    MemoryTraceWriter writer;

    writer.begin(time(0.0));
    writer.type("queue_added");
    writer.field("queue_id", uint64_t{0});
    writer.end();
    ASSERT_EQ(writer.records().size(), 1U);

    writer.clear();
    EXPECT_TRUE(writer.records().empty());
}

TEST_F(TraceWritersTest, MemoryWriterCapturesExecutorRun) {
    MemoryTraceWriter writer;
    Simulation sim;
    sim.set_trace_writer(&writer);

    (void)sim.add_queue(Fifo<int>{});
    Executor::steps(5).execute(sim);

    const auto& records = writer.records();
    ASSERT_EQ(records.size(), 2U);
    EXPECT_EQ(records[0].type, "queue_added");
    EXPECT_EQ(records[0].number("queue_id"), 0U);
    EXPECT_EQ(records[1].type, "executor_finished");
    EXPECT_EQ(records[1].text("reason"), "empty");
}

TEST_F(TraceWritersTest, MemoryWriterFollowsDispatchOrder) {
    MemoryTraceWriter writer;
    Simulation sim;
    sim.set_trace_writer(&writer);

    auto pong = std::make_shared<Relay>();
    auto ping = std::make_shared<Relay>();
    auto pong_id = sim.add_component(pong);
    auto ping_id = sim.add_component(ping);
    ping->set_peer(pong_id);
    pong->set_peer(ping_id);

    sim.schedule_now(ping_id, 3);
    Executor::unbound().execute(sim);

    EXPECT_EQ(writer.dispatch_targets(),
              (std::vector<uint64_t>{ping_id.value(), pong_id.value(),
                                     ping_id.value(), pong_id.value()}));

    auto dispatched = writer.records_of_type("event_dispatched");
    ASSERT_EQ(dispatched.size(), 4U);
    EXPECT_EQ(dispatched.front()->time, time(0.0));
    EXPECT_EQ(dispatched.back()->time, time(3.0));
    EXPECT_EQ(dispatched.back()->number("pending"), 0U);

    auto added = writer.records_of_type("component_added");
    ASSERT_EQ(added.size(), 2U);
    EXPECT_EQ(added[0]->number("component_id"), pong_id.value());

    auto finished = writer.records_of_type("executor_finished");
    ASSERT_EQ(finished.size(), 1U);
    EXPECT_EQ(finished[0]->number("steps"), 4U);
}
