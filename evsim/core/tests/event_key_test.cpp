#include <evsim/core/event_entry.hpp>
#include <evsim/core/scheduler.hpp>

#include <gtest/gtest.h>

#include <string>

using namespace evsim::core;

class EventKeyTest : public ::testing::Test {
protected:
    TimePoint time(double seconds) {
        return time_from_seconds(seconds);
    }
};

TEST_F(EventKeyTest, TimeIsPrimaryOrder) {
    EventKey early{time(1.0), 10};
    EventKey late{time(2.0), 0};

    EXPECT_LT(early, late);
    EXPECT_GT(late, early);
}

TEST_F(EventKeyTest, SequenceBreaksTies) {
    EventKey first{time(1.0), 0};
    EventKey second{time(1.0), 1};

    EXPECT_LT(first, second);
    EXPECT_NE(first, second);
}

TEST_F(EventKeyTest, EqualKeys) {
    EXPECT_EQ((EventKey{time(3.0), 7}), (EventKey{time(3.0), 7}));
}

// Entries are built through the scheduler, which owns the id minting path.
namespace {

struct Ping {
    std::string label;
};

} // namespace

TEST_F(EventKeyTest, EntryDowncastRecoversPayload) {
    Scheduler scheduler;
    ComponentId<Ping> target;
    scheduler.schedule(duration_from_seconds(1.5), target, Ping{"hello"});

    auto entry = scheduler.pop();
    ASSERT_TRUE(entry.has_value());

    EXPECT_EQ(entry->time(), time(1.5));
    EXPECT_EQ(entry->sequence(), 0U);
    EXPECT_EQ(entry->component_idx(), target.value());
    EXPECT_EQ(entry->key(), (EventKey{time(1.5), 0}));

    const Ping* ping = entry->downcast<Ping>();
    ASSERT_NE(ping, nullptr);
    EXPECT_EQ(ping->label, "hello");
}

TEST_F(EventKeyTest, EntryDowncastToWrongTypeIsNull) {
    Scheduler scheduler;
    scheduler.schedule_now(ComponentId<int>{}, 42);

    auto entry = scheduler.pop();
    ASSERT_TRUE(entry.has_value());

    EXPECT_EQ(entry->downcast<double>(), nullptr);
    ASSERT_NE(entry->downcast<int>(), nullptr);
    EXPECT_EQ(*entry->downcast<int>(), 42);
}
