#include <tessera/util/run_loop.hpp>

#include "../fixtures/util.hpp"

#include <thread>
#include <vector>

using namespace tessera::util;

TEST(RunLoop, Stop) {
    RunLoop loop;

    loop.invoke([&] {
        loop.stop();
    });

    loop.run();
    EXPECT_EQ(0u, loop.pending());
}

TEST(RunLoop, InvokeRunsInOrder) {
    RunLoop loop;
    std::vector<int> calls;

    loop.invoke([&] { calls.push_back(1); });
    loop.invoke([&] { calls.push_back(2); });
    EXPECT_EQ(2u, loop.pending());

    loop.stop();
    loop.run();

    EXPECT_EQ((std::vector<int> { 1, 2 }), calls);
}

TEST(RunLoop, RunOnce) {
    RunLoop loop;
    int calls = 0;

    loop.invoke([&] {
        ++calls;
        loop.invoke([&] { ++calls; });
    });

    loop.runOnce();
    EXPECT_EQ(1, calls);
    EXPECT_EQ(1u, loop.pending());

    loop.runOnce();
    EXPECT_EQ(2, calls);
    EXPECT_EQ(0u, loop.pending());
}

TEST(RunLoop, InvokeFromOtherThread) {
    SCOPED_TEST(InvokedOnLoopThread)

    RunLoop loop;
    const std::thread::id loopThread = std::this_thread::get_id();
    std::thread::id calledOn;

    std::thread worker([&] {
        loop.invoke([&] {
            calledOn = std::this_thread::get_id();
            InvokedOnLoopThread.finish();
            loop.stop();
        });
    });

    loop.run();
    worker.join();

    EXPECT_EQ(loopThread, calledOn);
}
