#include <gtest/gtest.h>
#include "shipper/copy_manager.hpp"
#include "flaky_file_access.hpp"
#include "test_helpers.hpp"

#include <algorithm>
#include <thread>

using namespace std::chrono_literals;
using testutil::FlakyFileAccess;

class CopyManagerTest : public ::testing::Test
{
protected:
    testutil::TempDir dir;
    FileAccessRegistry files;
    std::shared_ptr<FlakyFileAccess> flaky = std::make_shared<FlakyFileAccess>();
    std::unique_ptr<CopyManager> manager;

    void SetUp() override
    {
        files.registerFactory(FlakyFileAccess::SCHEME, [this] { return flaky; });
        manager = std::make_unique<CopyManager>(true, files);
    }

    void TearDown() override { manager.reset(); }

    ShipOptions job(const std::string &name, std::vector<std::string> patterns, const std::string &dest)
    {
        ShipOptions opt;
        opt.name = name;
        opt.patterns = std::move(patterns);
        opt.destination = dest;
        opt.interval = 1h;
        opt.retryDelay = 1ms;
        return opt;
    }

    ShipOptions simpleJob(const std::string &name)
    {
        return job(name, {dir.str("src/" + name + ".log")}, dir.str("dst/" + name));
    }

    std::vector<std::string> listedNames()
    {
        std::vector<std::string> out;
        for (const auto &info : manager->list())
            out.push_back(info.name);
        std::sort(out.begin(), out.end());
        return out;
    }
};

TEST_F(CopyManagerTest, StartThenListShowsAliveEntry)
{
    manager->start(simpleJob("alpha"));

    auto ops = manager->list();
    ASSERT_EQ(ops.size(), 1u);
    EXPECT_EQ(ops[0].name, "alpha");
    EXPECT_TRUE(ops[0].isAlive);
    EXPECT_FALSE(ops[0].isBackground);
    EXPECT_FALSE(ops[0].threadId.empty());
    EXPECT_EQ(ops[0].threadName, "ship-alpha");
}

TEST_F(CopyManagerTest, DuplicateNameIsRejected)
{
    manager->start(simpleJob("alpha"));
    EXPECT_THROW(manager->start(simpleJob("alpha")), std::invalid_argument);
    EXPECT_EQ(manager->list().size(), 1u);
}

TEST_F(CopyManagerTest, InvalidParametersLeaveNoState)
{
    auto noRoot = simpleJob("alpha");
    noRoot.preserveStructure = true;
    EXPECT_THROW(manager->start(noRoot), std::invalid_argument);

    auto noName = simpleJob("beta");
    noName.name.clear();
    EXPECT_THROW(manager->start(noName), std::invalid_argument);

    auto badInterval = simpleJob("gamma");
    badInterval.interval = 0ms;
    EXPECT_THROW(manager->start(badInterval), std::invalid_argument);

    EXPECT_TRUE(manager->list().empty());
}

TEST_F(CopyManagerTest, DisabledManagerIgnoresValidStart)
{
    CopyManager disabled(false, files);
    EXPECT_FALSE(disabled.isEnabled());
    EXPECT_NO_THROW(disabled.start(simpleJob("alpha")));
    EXPECT_TRUE(disabled.list().empty());
    EXPECT_FALSE(disabled.snapshot()["copy_enabled"].get<bool>());

    // 校验仍然生效
    auto noRoot = simpleJob("beta");
    noRoot.preserveStructure = true;
    EXPECT_THROW(disabled.start(noRoot), std::invalid_argument);
}

TEST_F(CopyManagerTest, StopRemovesJobAndNameIsReusable)
{
    manager->start(simpleJob("alpha"));
    EXPECT_TRUE(manager->stop("alpha", 5s));
    EXPECT_TRUE(manager->list().empty());

    EXPECT_NO_THROW(manager->start(simpleJob("alpha")));
    EXPECT_EQ(manager->list().size(), 1u);
}

TEST_F(CopyManagerTest, StopUnknownNameThrows)
{
    EXPECT_THROW(manager->stop("ghost", 1s), std::invalid_argument);
}

TEST_F(CopyManagerTest, StopTimesOutWhileWorkerIsBusy)
{
    testutil::writeFile(dir.str("src/slow.log"), "data");
    auto slow = job("slow", {dir.str("src/slow.log")}, FlakyFileAccess::url(dir.str("remote")));
    slow.maxRetries = 1;
    slow.retryDelay = 1500ms;
    flaky->failAppends = 100;

    manager->start(slow);
    ASSERT_TRUE(testutil::waitUntil([&] { return flaky->appendCalls.load() >= 1; }));

    // 工作线程正睡在重试间隔里
    EXPECT_FALSE(manager->stop("slow", 50ms));
    ASSERT_EQ(manager->list().size(), 1u);

    EXPECT_TRUE(manager->stop("slow", 10s));
    EXPECT_TRUE(manager->list().empty());
}

TEST_F(CopyManagerTest, StopAllStopsEveryJob)
{
    for (const auto &name : {"a", "b", "c"})
        manager->start(simpleJob(name));
    ASSERT_EQ(manager->list().size(), 3u);

    auto failed = manager->stopAll(5s, true);
    EXPECT_TRUE(failed.empty());
    EXPECT_TRUE(manager->list().empty());
}

TEST_F(CopyManagerTest, TriggerNowWithoutJobsIsNoOp)
{
    EXPECT_NO_THROW(manager->triggerNow());
    EXPECT_NO_THROW(manager->triggerNow("ghost"));
}

TEST_F(CopyManagerTest, TriggerNowValidatesAllNamesFirst)
{
    const auto src = dir.str("src/alpha.log");
    testutil::writeFile(src, "one");
    manager->start(simpleJob("alpha"));
    ASSERT_TRUE(testutil::waitUntil([&] { return testutil::readFile(dir.str("dst/alpha/alpha.log")) == "one"; }));

    testutil::appendFile(src, "two");
    EXPECT_THROW(manager->triggerNow(std::vector<std::string>{"alpha", "ghost"}), std::invalid_argument);
    EXPECT_EQ(testutil::readFile(dir.str("dst/alpha/alpha.log")), "one");

    manager->triggerNow("alpha");
    EXPECT_EQ(testutil::readFile(dir.str("dst/alpha/alpha.log")), "onetwo");
}

TEST_F(CopyManagerTest, OverlappingJobsProduceDuplicateWarning)
{
    const auto shared = dir.str("src/shared.log");
    testutil::writeFile(shared, "s");
    testutil::writeFile(dir.str("src/only_a.log"), "a");

    testutil::LogCapture logs;
    manager->start(job("job_a", {dir.str("src/*.log")}, dir.str("dst/a")));
    manager->start(job("job_b", {shared}, dir.str("dst/b")));

    ASSERT_TRUE(testutil::waitUntil([&] {
        auto snap = manager->snapshot();
        for (const auto &op : snap["operations"])
            if (op["files"].empty())
                return false;
        return snap["operations"].size() == 2;
    }));
    manager->stopAll(5s);

    EXPECT_GE(logs.count("Duplicate copy detected"), 1u);
    const auto text = logs.text();
    const bool aThenB = text.find("'job_a' and 'job_b' are both copying 1 file(s): " + shared) != std::string::npos;
    const bool bThenA = text.find("'job_b' and 'job_a' are both copying 1 file(s): " + shared) != std::string::npos;
    EXPECT_TRUE(aThenB || bThenA);
}

TEST_F(CopyManagerTest, DisjointJobsProduceNoDuplicateWarning)
{
    testutil::writeFile(dir.str("src/a.log"), "a");
    testutil::writeFile(dir.str("src/b.log"), "b");

    testutil::LogCapture logs;
    manager->start(job("job_a", {dir.str("src/a.log")}, dir.str("dst/a")));
    manager->start(job("job_b", {dir.str("src/b.log")}, dir.str("dst/b")));
    manager->triggerNow();
    manager->stopAll(5s);

    EXPECT_EQ(logs.count("Duplicate copy detected"), 0u);
}

TEST_F(CopyManagerTest, OffsetsAreKeptWhileAnotherJobReferencesFile)
{
    const auto shared = dir.str("src/shared.log");
    testutil::writeFile(shared, "payload");

    manager->start(job("job_a", {shared}, dir.str("dst/a")));
    manager->start(job("job_b", {shared}, dir.str("dst/b")));
    manager->triggerNow();
    ASSERT_TRUE(manager->offsets().get(shared).has_value());

    EXPECT_TRUE(manager->stop("job_a", 5s));
    EXPECT_TRUE(manager->offsets().get(shared).has_value());

    EXPECT_TRUE(manager->stop("job_b", 5s));
    EXPECT_FALSE(manager->offsets().get(shared).has_value());
}

TEST_F(CopyManagerTest, CleanupFlushesStopsAndBlocksNewJobs)
{
    const auto src = dir.str("src/alpha.log");
    testutil::writeFile(src, testutil::bytes(100));
    manager->start(simpleJob("alpha"));
    ASSERT_TRUE(testutil::waitUntil([&] { return testutil::readFile(dir.str("dst/alpha/alpha.log")).size() == 100; }));

    testutil::appendFile(src, testutil::bytes(50, 'A'));
    manager->cleanup(5s);

    EXPECT_EQ(testutil::readFile(dir.str("dst/alpha/alpha.log")), testutil::readFile(src));
    EXPECT_TRUE(manager->list().empty());
    EXPECT_EQ(manager->offsets().size(), 0u);
    EXPECT_THROW(manager->start(simpleJob("beta")), std::invalid_argument);
    EXPECT_TRUE(manager->snapshot()["shutting_down"].get<bool>());

    EXPECT_NO_THROW(manager->cleanup(5s));
}

TEST_F(CopyManagerTest, CleanupTimeoutJoinsStuckWorkerOnDestruction)
{
    const auto src = dir.str("src/stuck.log");
    testutil::writeFile(src, "data");
    flaky->stallMs = 500;
    flaky->quietThread = std::this_thread::get_id();
    manager->start(job("stuck", {src}, FlakyFileAccess::url(dir.str("remote"))));
    ASSERT_TRUE(testutil::waitUntil([&] { return flaky->stallsStarted.load() >= 1; }));

    // 工作线程卡在远端调用里，停止超时
    testutil::LogCapture logs;
    manager->cleanup(20ms);
    EXPECT_TRUE(manager->list().empty());

    manager.reset();
    EXPECT_EQ(flaky->stallsActive.load(), 0);
    EXPECT_EQ(logs.count("did not stop in time"), 1u);
    EXPECT_EQ(testutil::readFile(dir.str("remote/stuck.log")), "data");
}

TEST_F(CopyManagerTest, ConcurrentCleanupWaitsForFirstToFinish)
{
    const auto src = dir.str("src/slow.log");
    testutil::writeFile(src, "data");
    flaky->stallMs = 1000;
    manager->start(job("slow", {src}, FlakyFileAccess::url(dir.str("remote"))));
    ASSERT_TRUE(testutil::waitUntil([&] { return flaky->stallsStarted.load() >= 1; }));

    std::thread first([&] { manager->cleanup(5s); });
    // 第一次 cleanup 的最终拷贝也卡在远端调用里
    EXPECT_TRUE(testutil::waitUntil([&] { return flaky->stallsStarted.load() >= 2; }));

    manager->cleanup(5s);
    EXPECT_TRUE(manager->list().empty());
    EXPECT_EQ(manager->offsets().size(), 0u);
    EXPECT_EQ(testutil::readFile(dir.str("remote/slow.log")), "data");
    first.join();
}

TEST_F(CopyManagerTest, StartFromConfigAppliesDefaults)
{
    auto root = YAML::Load(R"(
defaults:
  interval: 3600
  max_retries: 1
operations:
  first:
    patterns: [/nonexistent/*.log]
    destination: /tmp/out
  second:
    patterns: /nonexistent/x.log
    destination: /tmp/out
    max_retries: 9
  broken:
    destination: /tmp/out
)");
    EXPECT_EQ(manager->startFromConfig(root["operations"], root["defaults"]), 2u);
    EXPECT_EQ(listedNames(), (std::vector<std::string>{"first", "second"}));

    auto snap = manager->snapshot();
    EXPECT_TRUE(snap["copy_enabled"].get<bool>());
    ASSERT_EQ(snap["operations"].size(), 2u);
    EXPECT_DOUBLE_EQ(snap["operations"][0]["interval_sec"].get<double>(), 3600.0);
}

TEST_F(CopyManagerTest, StartFromConfigRejectsNonMapping)
{
    EXPECT_EQ(manager->startFromConfig(YAML::Node()), 0u);
    EXPECT_THROW(manager->startFromConfig(YAML::Load("[a, b]")), std::runtime_error);
}
