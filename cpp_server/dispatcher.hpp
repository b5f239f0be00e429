#ifndef DISPATCHER_HPP
#define DISPATCHER_HPP

#include <atomic>
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <nlohmann/json.hpp>
#include "admission.hpp"
#include "cancellation.hpp"
#include "tool_registry.hpp"

enum class InvocationState {
    RECEIVED,
    VALIDATED,
    EXECUTING,
    SUCCEEDED,
    FAILED
};

std::string InvocationStateName(InvocationState state);

// Returns true once the caller that issued the invocation has gone away.
using DisconnectCheck = std::function<bool()>;

// Validates tool invocations against the registry and runs them under admission
// control and a per-invocation timeout. Every outcome, including unknown tools
// and bad arguments, comes back as a response envelope; Invoke never throws.
class Dispatcher {
public:
    Dispatcher(const ToolRegistry& registry, AdmissionController& admission,
               std::chrono::milliseconds invocation_timeout);

    // An empty `invocation_id` gets a generated "inv-<n>" id.
    nlohmann::json Invoke(const std::string& tool_name, const nlohmann::json& arguments,
                          const std::string& invocation_id = "",
                          const DisconnectCheck& client_gone = nullptr);

    // Fires the cancellation token of an in-flight invocation. False when no
    // invocation with that id is running.
    bool Cancel(const std::string& invocation_id);

    // Cancels every in-flight invocation whose id starts with `prefix`.
    // Returns how many were cancelled.
    std::size_t CancelWithPrefix(const std::string& prefix);

    std::size_t InFlight() const;

    const ToolRegistry& Registry() const { return registry_; }

private:
    struct Invocation {
        std::string id;
        std::string tool;
        CancellationSource source;
    };

    std::shared_ptr<Invocation> Track(const std::string& id, const std::string& tool);
    void Untrack(const std::string& id);

    nlohmann::json Execute(const RegisteredTool& tool, const nlohmann::json& arguments,
                           Invocation& invocation, const DisconnectCheck& client_gone);

    void Transition(const Invocation& invocation, InvocationState state, const std::string& detail = "") const;

    const ToolRegistry& registry_;
    AdmissionController& admission_;
    const std::chrono::milliseconds invocation_timeout_;

    std::atomic<std::uint64_t> next_id_{1};

    mutable std::mutex inflight_mutex_;
    std::map<std::string, std::shared_ptr<Invocation>> inflight_;
};

#endif // DISPATCHER_HPP
