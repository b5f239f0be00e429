#include <gtest/gtest.h>
#include <chrono>
#include <future>
#include <thread>
#include "admission.hpp"
#include "errors.hpp"

using namespace std::chrono_literals;

TEST(AdmissionControllerTest, GrantsUpToLimit) {
    AdmissionController admission(2, 0, 10ms);
    auto a = admission.Acquire();
    auto b = admission.Acquire();
    EXPECT_EQ(admission.Active(), 2);
    EXPECT_THROW(admission.Acquire(), OverloadError);
}

TEST(AdmissionControllerTest, SlotReleaseFreesCapacity) {
    AdmissionController admission(1, 0, 10ms);
    {
        auto slot = admission.Acquire();
        EXPECT_TRUE(slot.Held());
    }
    EXPECT_EQ(admission.Active(), 0);
    EXPECT_NO_THROW(admission.Acquire());
}

TEST(AdmissionControllerTest, MovedSlotReleasesOnce) {
    AdmissionController admission(1, 0, 10ms);
    {
        auto first = admission.Acquire();
        AdmissionController::Slot second = std::move(first);
        EXPECT_FALSE(first.Held());
        EXPECT_TRUE(second.Held());
    }
    EXPECT_EQ(admission.Active(), 0);
}

TEST(AdmissionControllerTest, QueuedCallerGetsFreedSlot) {
    AdmissionController admission(1, 1, 2000ms);
    auto held = std::make_unique<AdmissionController::Slot>(admission.Acquire());

    auto waiter = std::async(std::launch::async, [&admission]() {
        auto slot = admission.Acquire();
        return slot.Held();
    });

    while (admission.Queued() == 0) {
        std::this_thread::sleep_for(1ms);
    }
    held.reset();
    EXPECT_TRUE(waiter.get());
}

TEST(AdmissionControllerTest, FullQueueRejectsImmediately) {
    AdmissionController admission(1, 1, 2000ms);
    auto held = admission.Acquire();
    auto waiter = std::async(std::launch::async, [&admission]() {
        try {
            admission.Acquire();
            return std::string("acquired");
        } catch (const OverloadError&) {
            return std::string("overload");
        }
    });
    while (admission.Queued() == 0) {
        std::this_thread::sleep_for(1ms);
    }

    auto start = std::chrono::steady_clock::now();
    EXPECT_THROW(admission.Acquire(), OverloadError);
    EXPECT_LT(std::chrono::steady_clock::now() - start, 500ms);

    held.Reset();
    EXPECT_EQ(waiter.get(), "acquired");
}

TEST(AdmissionControllerTest, QueueWaitExpires) {
    AdmissionController admission(1, 4, 30ms);
    auto held = admission.Acquire();
    EXPECT_THROW(admission.Acquire(), OverloadError);
    EXPECT_EQ(admission.Queued(), 0);
}

TEST(AdmissionControllerTest, CancelledWhileQueued) {
    AdmissionController admission(1, 4, 2000ms);
    auto held = admission.Acquire();
    CancellationSource source;
    source.Cancel();
    EXPECT_THROW(admission.Acquire(source.Token()), CancelledError);
    EXPECT_EQ(admission.Queued(), 0);
}
