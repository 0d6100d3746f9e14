#include <evsim/io/error.hpp>
#include <evsim/io/executor_config.hpp>

#include <evsim/core/simulation.hpp>

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <sstream>

using namespace evsim::io;
using namespace evsim::core;

class ExecutorConfigTest : public ::testing::Test {
protected:
    TimePoint time(double seconds) {
        return time_from_seconds(seconds);
    }
};

TEST_F(ExecutorConfigTest, LoadUnbound) {
    auto config = load_executor_config_from_string(R"({"mode": "unbound"})");
    EXPECT_EQ(config.mode, ExecutorConfig::Mode::Unbound);
}

TEST_F(ExecutorConfigTest, LoadTimed) {
    auto config = load_executor_config_from_string(R"({"mode": "timed", "until": 6.5})");
    EXPECT_EQ(config.mode, ExecutorConfig::Mode::Timed);
    EXPECT_EQ(config.until, time(6.5));
}

TEST_F(ExecutorConfigTest, LoadTimedAcceptsIntegerSeconds) {
    auto config = load_executor_config_from_string(R"({"mode": "timed", "until": 5})");
    EXPECT_EQ(config.until, time(5.0));
}

TEST_F(ExecutorConfigTest, HugeUntilClampsToLatestTime) {
    auto config = load_executor_config_from_string(R"({"mode": "timed", "until": 1e20})");
    EXPECT_EQ(config.until.time_since_epoch(), Duration::max());
    EXPECT_GT(config.until, time(1e9));
}

TEST_F(ExecutorConfigTest, LoadSteps) {
    auto config = load_executor_config_from_string(R"({"mode": "steps", "steps": 100})");
    EXPECT_EQ(config.mode, ExecutorConfig::Mode::Steps);
    EXPECT_EQ(config.steps, 100U);
}

TEST_F(ExecutorConfigTest, UnusedFieldsAreIgnored) {
    auto config = load_executor_config_from_string(R"({"mode": "unbound", "steps": 3})");
    EXPECT_EQ(config.mode, ExecutorConfig::Mode::Unbound);
    EXPECT_EQ(config.steps, 0U);
}

TEST_F(ExecutorConfigTest, MalformedJsonThrows) {
    EXPECT_THROW(load_executor_config_from_string("{not json"), LoaderError);
}

TEST_F(ExecutorConfigTest, RootMustBeObject) {
    EXPECT_THROW(load_executor_config_from_string("[]"), LoaderError);
}

TEST_F(ExecutorConfigTest, MissingModeThrows) {
    EXPECT_THROW(load_executor_config_from_string("{}"), LoaderError);
}

TEST_F(ExecutorConfigTest, UnknownModeThrows) {
    try {
        (void)load_executor_config_from_string(R"({"mode": "forever"})");
        FAIL() << "expected LoaderError";
    } catch (const LoaderError& e) {
        EXPECT_NE(std::string(e.what()).find("forever"), std::string::npos);
    }
}

TEST_F(ExecutorConfigTest, TimedRequiresNonNegativeUntil) {
    EXPECT_THROW(load_executor_config_from_string(R"({"mode": "timed"})"), LoaderError);
    EXPECT_THROW(load_executor_config_from_string(R"({"mode": "timed", "until": "5"})"), LoaderError);
    EXPECT_THROW(load_executor_config_from_string(R"({"mode": "timed", "until": -1.0})"), LoaderError);
}

TEST_F(ExecutorConfigTest, StepsRequiresNonNegativeInteger) {
    EXPECT_THROW(load_executor_config_from_string(R"({"mode": "steps"})"), LoaderError);
    EXPECT_THROW(load_executor_config_from_string(R"({"mode": "steps", "steps": -3})"), LoaderError);
    EXPECT_THROW(load_executor_config_from_string(R"({"mode": "steps", "steps": 1.5})"), LoaderError);
}

TEST_F(ExecutorConfigTest, MissingFileThrows) {
    EXPECT_THROW(load_executor_config("/nonexistent/executor.json"), LoaderError);
}

TEST_F(ExecutorConfigTest, WriteThenLoad) {
    ExecutorConfig original;
    original.mode = ExecutorConfig::Mode::Timed;
    original.until = time(12.25);

    std::ostringstream oss;
    write_executor_config_to_stream(original, oss);

    auto loaded = load_executor_config_from_string(oss.str());
    EXPECT_EQ(loaded.mode, ExecutorConfig::Mode::Timed);
    EXPECT_EQ(loaded.until, original.until);
}

TEST_F(ExecutorConfigTest, WriteOmitsUnusedFields) {
    ExecutorConfig config;
    config.steps = 4;

    std::ostringstream oss;
    write_executor_config_to_stream(config, oss);
    EXPECT_EQ(oss.str(), R"({"mode":"unbound"})");
}

TEST_F(ExecutorConfigTest, LoadFromFile) {
    auto path = std::filesystem::temp_directory_path() / "evsim_executor_config_test.json";
    {
        std::ofstream file(path);
        file << R"({"mode": "steps", "steps": 2})";
    }

    auto config = load_executor_config(path);
    std::filesystem::remove(path);

    EXPECT_EQ(config.mode, ExecutorConfig::Mode::Steps);
    EXPECT_EQ(config.steps, 2U);
}

TEST_F(ExecutorConfigTest, MakeExecutorMatchesMode) {
    ExecutorConfig timed;
    timed.mode = ExecutorConfig::Mode::Timed;
    timed.until = time(3.0);
    auto executor = make_executor(timed);
    EXPECT_EQ(executor.end_condition(), Executor::EndCondition::Time);
    EXPECT_EQ(executor.time_limit(), time(3.0));

    ExecutorConfig steps;
    steps.mode = ExecutorConfig::Mode::Steps;
    steps.steps = 8;
    EXPECT_EQ(make_executor(steps).step_limit(), 8U);

    EXPECT_EQ(make_executor(ExecutorConfig{}).end_condition(), Executor::EndCondition::EmptyQueue);
}
