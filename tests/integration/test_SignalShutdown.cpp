#include <gtest/gtest.h>
#include "shipper/copy_manager.hpp"
#include "test_helpers.hpp"

#include <csignal>
#include <cstdlib>
#include <unistd.h>

using namespace std::chrono_literals;

// 死亡测试在 fork 出的子进程里运行；父进程此时没有其他线程
class SignalShutdownTest : public ::testing::Test
{
protected:
    testutil::TempDir dir;
    std::string src = dir.str("src/app.log");
    std::string dst = dir.str("dst/app.log");

    [[noreturn]] void runUntilSignal(int sig)
    {
        CopyManager manager(true);
        if (!manager.installSignalHandlers())
            std::_Exit(3);

        ShipOptions opt;
        opt.name = "app";
        opt.patterns = {src};
        opt.destination = dir.str("dst");
        opt.interval = 1h;
        opt.retryDelay = 1ms;
        manager.start(opt);

        if (!testutil::waitUntil([&] { return testutil::readFile(dst).size() == 100; }))
            std::_Exit(4);

        // 这 50 字节只可能由信号触发的最终 flush 送达
        testutil::appendFile(src, testutil::bytes(50, 'A'));
        std::raise(sig);
        for (;;)
            ::pause();
    }
};

TEST_F(SignalShutdownTest, SigtermFlushesThenTerminatesBySigterm)
{
    testutil::writeFile(src, testutil::bytes(100));

    EXPECT_EXIT(runUntilSignal(SIGTERM), ::testing::KilledBySignal(SIGTERM), "");

    const auto out = testutil::readFile(dst);
    EXPECT_EQ(out.size(), 150u);
    EXPECT_EQ(out, testutil::readFile(src));
}

TEST_F(SignalShutdownTest, SigintFlushesThenTerminatesBySigint)
{
    testutil::writeFile(src, testutil::bytes(100));

    EXPECT_EXIT(runUntilSignal(SIGINT), ::testing::KilledBySignal(SIGINT), "");

    EXPECT_EQ(testutil::readFile(dst), testutil::readFile(src));
}
