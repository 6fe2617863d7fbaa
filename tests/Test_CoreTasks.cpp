#include <gtest/gtest.h>

#include <atomic>
#include <memory>
#include <utility>

import Core;

using namespace Core::Tasks;

TEST(CoreTasks, BasicDispatch)
{
    Scheduler::Initialize(2);

    std::atomic<int> counter = 0;

    for (int i = 0; i < 100; ++i)
    {
        EXPECT_TRUE(Scheduler::Dispatch([&counter]() { counter++; }));
    }

    Scheduler::WaitForAll();

    EXPECT_EQ(counter, 100);

    Scheduler::Shutdown();
}

TEST(CoreTasks, DispatchWithoutScheduler_ReturnsFalse)
{
    ASSERT_FALSE(Scheduler::IsRunning());

    bool ran = false;
    EXPECT_FALSE(Scheduler::Dispatch([&ran]() { ran = true; }));
    EXPECT_FALSE(ran);
}

TEST(CoreTasks, CapturedSharedStateOutlivesCaller)
{
    Scheduler::Initialize(1);

    auto shared = std::make_shared<std::atomic<int>>(0);
    {
        auto local = shared;
        Scheduler::Dispatch([local]() { local->fetch_add(1); });
    }

    Scheduler::WaitForAll();
    EXPECT_EQ(shared->load(), 1);

    Scheduler::Shutdown();
}

TEST(CoreTasks, LocalTask_MoveTransfersCallable)
{
    int value = 0;
    LocalTask a([&value]() { value = 5; });
    LocalTask b(std::move(a));

    EXPECT_FALSE(a.Valid());
    ASSERT_TRUE(b.Valid());
    b();
    EXPECT_EQ(value, 5);
}
