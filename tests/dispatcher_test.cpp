#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <future>
#include <stdexcept>
#include <thread>
#include "dispatcher.hpp"
#include "envelope.hpp"
#include "errors.hpp"

using json = nlohmann::json;
using namespace std::chrono_literals;

namespace {

// Sleeps in small steps until `ms` elapse or the token fires.
json SleepFor(int ms, const CancellationToken& token) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(ms);
    while (std::chrono::steady_clock::now() < deadline) {
        token.ThrowIfCancelled("sleep");
        std::this_thread::sleep_for(2ms);
    }
    return json{{"slept", ms}};
}

class DispatcherTest : public ::testing::Test {
protected:
    void SetUp() override {
        registry_.Register(ToolDescriptor{"echo", "Echo", {{"text", FieldType::String, true, ""}}, false},
                           [this](const json& args, const CancellationToken&) {
                               calls_++;
                               return json{{"text", args["text"]}};
                           });
        registry_.Register(ToolDescriptor{"sleep", "Sleep", {{"ms", FieldType::Integer, true, ""}}, false},
                           [this](const json& args, const CancellationToken& token) {
                               started_++;
                               return SleepFor(args["ms"].get<int>(), token);
                           });
        registry_.Register(ToolDescriptor{"missing", "Raise", {}, false},
                           [](const json&, const CancellationToken&) -> json {
                               throw NotFoundError("Bucket 'nonexistent' does not exist");
                           });
        registry_.Register(ToolDescriptor{"broken", "Raise", {}, false},
                           [](const json&, const CancellationToken&) -> json {
                               throw std::runtime_error("disk on fire");
                           });
        registry_.Freeze();
    }

    ToolRegistry registry_;
    AdmissionController admission_{2, 0, 10ms};
    std::atomic<int> calls_{0};
    std::atomic<int> started_{0};
};

} // namespace

TEST_F(DispatcherTest, SuccessEnvelope) {
    Dispatcher dispatcher(registry_, admission_, 5000ms);
    json envelope = dispatcher.Invoke("echo", {{"text", "hi"}});
    EXPECT_EQ(envelope["status"], "success");
    EXPECT_EQ(envelope["payload"]["text"], "hi");
    EXPECT_FALSE(envelope.contains("error"));
    EXPECT_EQ(dispatcher.InFlight(), 0u);
}

TEST_F(DispatcherTest, UnknownToolIsSchemaValidationError) {
    Dispatcher dispatcher(registry_, admission_, 5000ms);
    json envelope = dispatcher.Invoke("create_bucket", json::object());
    EXPECT_EQ(envelope["status"], "error");
    EXPECT_EQ(envelope["error"]["kind"], "SchemaValidationError");
    EXPECT_FALSE(envelope.contains("payload"));
}

TEST_F(DispatcherTest, InvalidArgumentsNeverReachHandler) {
    Dispatcher dispatcher(registry_, admission_, 5000ms);
    EXPECT_EQ(dispatcher.Invoke("echo", json::object())["error"]["kind"], "SchemaValidationError");
    EXPECT_EQ(dispatcher.Invoke("echo", {{"text", 5}})["error"]["kind"], "SchemaValidationError");
    EXPECT_EQ(dispatcher.Invoke("echo", {{"text", "x"}, {"extra", 1}})["error"]["kind"], "SchemaValidationError");
    EXPECT_EQ(calls_.load(), 0);
}

TEST_F(DispatcherTest, NullArgumentsMeanEmptyObject) {
    Dispatcher dispatcher(registry_, admission_, 5000ms);
    EXPECT_EQ(dispatcher.Invoke("missing", nullptr)["error"]["kind"], "NotFoundError");
}

TEST_F(DispatcherTest, TypedErrorsKeepTheirKind) {
    Dispatcher dispatcher(registry_, admission_, 5000ms);
    json envelope = dispatcher.Invoke("missing", json::object());
    EXPECT_EQ(envelope["error"]["kind"], "NotFoundError");
    EXPECT_EQ(envelope["error"]["message"], "Bucket 'nonexistent' does not exist");
}

TEST_F(DispatcherTest, UnexpectedExceptionsBecomeInternalError) {
    Dispatcher dispatcher(registry_, admission_, 5000ms);
    json envelope = dispatcher.Invoke("broken", json::object());
    EXPECT_EQ(envelope["error"]["kind"], "InternalError");
    EXPECT_EQ(envelope["error"]["message"], "disk on fire");
}

TEST_F(DispatcherTest, TimeoutCancelsHandler) {
    Dispatcher dispatcher(registry_, admission_, 150ms);
    auto start = std::chrono::steady_clock::now();
    json envelope = dispatcher.Invoke("sleep", {{"ms", 10000}});
    EXPECT_EQ(envelope["error"]["kind"], "TimeoutError");
    EXPECT_LT(std::chrono::steady_clock::now() - start, 3s);
    EXPECT_EQ(admission_.Active(), 0);
}

TEST_F(DispatcherTest, CancelById) {
    Dispatcher dispatcher(registry_, admission_, 10000ms);
    auto pending = std::async(std::launch::async, [&dispatcher]() {
        return dispatcher.Invoke("sleep", {{"ms", 10000}}, "job-1");
    });
    while (started_.load() == 0) {
        std::this_thread::sleep_for(1ms);
    }
    EXPECT_TRUE(dispatcher.Cancel("job-1"));
    EXPECT_EQ(pending.get()["error"]["kind"], "CancelledError");
    EXPECT_FALSE(dispatcher.Cancel("job-1"));
}

TEST_F(DispatcherTest, ClientDisconnectCancels) {
    Dispatcher dispatcher(registry_, admission_, 10000ms);
    std::atomic<bool> gone{false};
    auto pending = std::async(std::launch::async, [&]() {
        return dispatcher.Invoke("sleep", {{"ms", 10000}}, "", [&gone]() { return gone.load(); });
    });
    while (started_.load() == 0) {
        std::this_thread::sleep_for(1ms);
    }
    gone = true;
    EXPECT_EQ(pending.get()["error"]["kind"], "CancelledError");
}

TEST_F(DispatcherTest, DuplicateInFlightIdRejected) {
    Dispatcher dispatcher(registry_, admission_, 10000ms);
    auto pending = std::async(std::launch::async, [&dispatcher]() {
        return dispatcher.Invoke("sleep", {{"ms", 300}}, "same");
    });
    while (started_.load() == 0) {
        std::this_thread::sleep_for(1ms);
    }
    EXPECT_EQ(dispatcher.Invoke("echo", {{"text", "x"}}, "same")["error"]["kind"], "SchemaValidationError");
    EXPECT_EQ(pending.get()["status"], "success");
    EXPECT_EQ(dispatcher.Invoke("echo", {{"text", "x"}}, "same")["status"], "success");
}

TEST_F(DispatcherTest, OverloadWhenAdmissionFull) {
    Dispatcher dispatcher(registry_, admission_, 10000ms);
    auto first = std::async(std::launch::async, [&]() { return dispatcher.Invoke("sleep", {{"ms", 400}}); });
    auto second = std::async(std::launch::async, [&]() { return dispatcher.Invoke("sleep", {{"ms", 400}}); });
    while (started_.load() < 2) {
        std::this_thread::sleep_for(1ms);
    }
    json rejected = dispatcher.Invoke("echo", {{"text", "x"}});
    EXPECT_EQ(rejected["error"]["kind"], "OverloadError");
    EXPECT_EQ(first.get()["status"], "success");
    EXPECT_EQ(second.get()["status"], "success");
}

TEST_F(DispatcherTest, ConcurrentInvocationsAreIndependent) {
    AdmissionController wide(8, 8, 1000ms);
    Dispatcher dispatcher(registry_, wide, 5000ms);
    std::vector<std::future<json>> results;
    for (int i = 0; i < 8; ++i) {
        results.push_back(std::async(std::launch::async, [&dispatcher, i]() {
            return dispatcher.Invoke("echo", {{"text", std::to_string(i)}});
        }));
    }
    for (int i = 0; i < 8; ++i) {
        json envelope = results[i].get();
        EXPECT_EQ(envelope["payload"]["text"], std::to_string(i));
    }
}

TEST(InvocationStateTest, Names) {
    EXPECT_EQ(InvocationStateName(InvocationState::RECEIVED), "RECEIVED");
    EXPECT_EQ(InvocationStateName(InvocationState::SUCCEEDED), "SUCCEEDED");
    EXPECT_EQ(InvocationStateName(InvocationState::FAILED), "FAILED");
}

TEST_F(DispatcherTest, CancelWithPrefixStopsOnlyMatchingInvocations) {
    Dispatcher dispatcher(registry_, admission_, 5000ms);
    auto a = std::async(std::launch::async, [&]() { return dispatcher.Invoke("sleep", {{"ms", 3000}}, "s1:1"); });
    auto b = std::async(std::launch::async, [&]() { return dispatcher.Invoke("sleep", {{"ms", 300}}, "s10:1"); });
    while (started_.load() < 2) {
        std::this_thread::sleep_for(1ms);
    }

    EXPECT_EQ(dispatcher.CancelWithPrefix("s1:"), 1u);
    EXPECT_EQ(a.get()["error"]["kind"], "CancelledError");
    EXPECT_EQ(b.get()["status"], "success");
    EXPECT_EQ(dispatcher.CancelWithPrefix("s1:"), 0u);
}
