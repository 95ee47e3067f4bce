#include <gtest/gtest.h>
#include "common/config.hpp"
#include "shipper/copy_manager.hpp"
#include "test_helpers.hpp"

#include <fmt/format.h>

using namespace std::chrono_literals;

class EndToEndShippingTest : public ::testing::Test
{
protected:
    testutil::TempDir dir;
    std::unique_ptr<CopyManager> manager = std::make_unique<CopyManager>(true);

    void TearDown() override { manager.reset(); }

    Config loadConfig()
    {
        const auto path = dir.str("config.yaml");
        testutil::writeFile(path, fmt::format(R"(
shipper_config:
  defaults:
    interval: 0.05
    retry_delay: 0.01
operations:
  flat:
    patterns: ["{0}/logs/*.log"]
    destination: {0}/archive/flat
  tree:
    patterns: ["{0}/logs/**/*.log"]
    destination: {0}/archive/tree
    preserve_structure: true
    root_dir: {0}/logs
)",
                                                  dir.str()));
        return Config(path);
    }

    bool waitForContent(const std::string &path, const std::string &expected)
    {
        return testutil::waitUntil([&] { return testutil::readFile(path) == expected; });
    }
};

TEST_F(EndToEndShippingTest, GrowingFileIsShippedIncrementally)
{
    const auto src = dir.str("logs/app.log");
    const auto first = testutil::bytes(100);
    const auto second = testutil::bytes(50, 'A');
    testutil::writeFile(src, first);

    ShipOptions opt;
    opt.name = "app";
    opt.patterns = {src};
    opt.destination = dir.str("archive");
    opt.interval = 50ms;
    manager->start(opt);

    const auto dst = dir.str("archive/app.log");
    ASSERT_TRUE(waitForContent(dst, first));

    testutil::appendFile(src, second);
    ASSERT_TRUE(waitForContent(dst, first + second));

    EXPECT_TRUE(manager->stop("app", 5s));
    EXPECT_EQ(testutil::readFile(dst).size(), 150u);
}

TEST_F(EndToEndShippingTest, RotationRestartsFromBeginning)
{
    const auto src = dir.str("logs/app.log");
    testutil::writeFile(src, testutil::bytes(80));

    ShipOptions opt;
    opt.name = "app";
    opt.patterns = {src};
    opt.destination = dir.str("archive");
    opt.interval = 50ms;
    manager->start(opt);

    const auto dst = dir.str("archive/app.log");
    ASSERT_TRUE(testutil::waitUntil([&] { return testutil::readFile(dst).size() == 80; }));

    testutil::writeFile(src, "after-rotation");
    ASSERT_TRUE(testutil::waitUntil([&] { return testutil::readFile(dst).size() == 80 + 14; }));
    EXPECT_EQ(testutil::readFile(dst).substr(80), "after-rotation");
}

TEST_F(EndToEndShippingTest, ConfiguredOperationsShipFlatAndStructured)
{
    testutil::writeFile(dir.str("logs/top.log"), "top");
    testutil::writeFile(dir.str("logs/svc/nested.log"), "nested");

    auto config = loadConfig();
    ASSERT_EQ(manager->startFromConfig(config.operations(), config.jobDefaults()), 2u);

    // flat 只匹配顶层；tree 保留相对 root_dir 的目录结构
    EXPECT_TRUE(waitForContent(dir.str("archive/tree/svc/nested.log"), "nested"));

    // top.log 被两个作业同时覆盖：offset 进程内共享，只有先到者拿到这 3 字节
    EXPECT_TRUE(testutil::waitUntil([&] {
        return testutil::readFile(dir.str("archive/flat/top.log")).size() +
                   testutil::readFile(dir.str("archive/tree/top.log")).size() ==
               3;
    }));
    manager->triggerNow();
    EXPECT_EQ(testutil::readFile(dir.str("archive/flat/top.log")) +
                  testutil::readFile(dir.str("archive/tree/top.log")),
              "top");
    EXPECT_FALSE(std::filesystem::exists(dir.str("archive/flat/nested.log")));

    auto failed = manager->stopAll(5s, true);
    EXPECT_TRUE(failed.empty());
    EXPECT_TRUE(manager->list().empty());
}

TEST_F(EndToEndShippingTest, DisappearingSourceDoesNotKillWorker)
{
    const auto src = dir.str("logs/app.log");
    testutil::writeFile(src, "version-one");

    ShipOptions opt;
    opt.name = "app";
    opt.patterns = {src};
    opt.destination = dir.str("archive");
    opt.interval = 50ms;
    manager->start(opt);

    const auto dst = dir.str("archive/app.log");
    ASSERT_TRUE(waitForContent(dst, "version-one"));

    std::filesystem::remove(src);
    std::this_thread::sleep_for(200ms);
    ASSERT_EQ(manager->list().size(), 1u);
    EXPECT_TRUE(manager->list()[0].isAlive);

    // 重新出现且比上次小，按轮转处理
    testutil::writeFile(src, "v2");
    EXPECT_TRUE(waitForContent(dst, "version-onev2"));
}
