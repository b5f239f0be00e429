#include "dispatcher.hpp"
#include "envelope.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include <future>
#include <vector>

namespace {

constexpr auto kPollInterval = std::chrono::milliseconds(100);

} // namespace

std::string InvocationStateName(InvocationState state) {
    switch (state) {
        case InvocationState::RECEIVED: return "RECEIVED";
        case InvocationState::VALIDATED: return "VALIDATED";
        case InvocationState::EXECUTING: return "EXECUTING";
        case InvocationState::SUCCEEDED: return "SUCCEEDED";
        case InvocationState::FAILED: return "FAILED";
    }
    return "UNKNOWN";
}

Dispatcher::Dispatcher(const ToolRegistry& registry, AdmissionController& admission,
                       std::chrono::milliseconds invocation_timeout)
    : registry_(registry), admission_(admission), invocation_timeout_(invocation_timeout) {}

void Dispatcher::Transition(const Invocation& invocation, InvocationState state,
                            const std::string& detail) const {
    std::string message = invocation.id + " " + invocation.tool + " " + InvocationStateName(state);
    if (!detail.empty()) {
        message += ": " + detail;
    }
    if (state == InvocationState::FAILED) {
        Logger::Warn(message, "Dispatcher");
    } else if (state == InvocationState::RECEIVED || state == InvocationState::SUCCEEDED) {
        Logger::Info(message, "Dispatcher");
    } else {
        Logger::Debug(message, "Dispatcher");
    }
}

std::shared_ptr<Dispatcher::Invocation> Dispatcher::Track(const std::string& id, const std::string& tool) {
    std::lock_guard<std::mutex> lock(inflight_mutex_);
    if (inflight_.count(id) != 0) {
        throw SchemaValidationError("Invocation id '" + id + "' is already in flight");
    }
    auto invocation = std::make_shared<Invocation>();
    invocation->id = id;
    invocation->tool = tool;
    inflight_[id] = invocation;
    return invocation;
}

void Dispatcher::Untrack(const std::string& id) {
    std::lock_guard<std::mutex> lock(inflight_mutex_);
    inflight_.erase(id);
}

bool Dispatcher::Cancel(const std::string& invocation_id) {
    std::shared_ptr<Invocation> invocation;
    {
        std::lock_guard<std::mutex> lock(inflight_mutex_);
        auto it = inflight_.find(invocation_id);
        if (it == inflight_.end()) {
            return false;
        }
        invocation = it->second;
    }
    invocation->source.Cancel(CancelReason::Cancelled);
    Logger::Info(invocation_id + " cancellation requested", "Dispatcher");
    return true;
}

std::size_t Dispatcher::CancelWithPrefix(const std::string& prefix) {
    std::vector<std::shared_ptr<Invocation>> matched;
    {
        std::lock_guard<std::mutex> lock(inflight_mutex_);
        for (auto it = inflight_.lower_bound(prefix); it != inflight_.end(); ++it) {
            if (it->first.compare(0, prefix.size(), prefix) != 0) {
                break;
            }
            matched.push_back(it->second);
        }
    }
    for (const auto& invocation : matched) {
        invocation->source.Cancel(CancelReason::Cancelled);
        Logger::Info(invocation->id + " cancellation requested", "Dispatcher");
    }
    return matched.size();
}

std::size_t Dispatcher::InFlight() const {
    std::lock_guard<std::mutex> lock(inflight_mutex_);
    return inflight_.size();
}

nlohmann::json Dispatcher::Execute(const RegisteredTool& tool, const nlohmann::json& arguments,
                                   Invocation& invocation, const DisconnectCheck& client_gone) {
    const CancellationToken& token = invocation.source.Token();

    AdmissionController::Slot slot = admission_.Acquire(token);
    Transition(invocation, InvocationState::EXECUTING);

    std::future<nlohmann::json> result = std::async(std::launch::async, [&tool, &arguments, &token]() {
        return tool.handler(arguments, token);
    });

    auto deadline = std::chrono::steady_clock::now() + invocation_timeout_;
    while (result.wait_for(kPollInterval) != std::future_status::ready) {
        if (token.IsCancelled()) {
            break;
        }
        if (client_gone && client_gone()) {
            Logger::Info(invocation.id + " client disconnected", "Dispatcher");
            invocation.source.Cancel(CancelReason::Cancelled);
            break;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            invocation.source.Cancel(CancelReason::TimedOut);
            break;
        }
    }

    // The handler stops at its next checkpoint once the token has fired.
    result.wait();
    if (token.IsCancelled()) {
        // Drop a late result; the caller was already told the invocation is over.
        try {
            result.get();
        } catch (const std::exception& e) {
            Logger::Debug(invocation.id + " handler stopped: " + e.what(), "Dispatcher");
        }
        if (token.Reason() == CancelReason::TimedOut) {
            throw TimeoutError("Tool '" + invocation.tool + "' exceeded its " +
                               std::to_string(invocation_timeout_.count()) + " ms timeout");
        }
        throw CancelledError("Invocation '" + invocation.id + "' was cancelled");
    }
    return result.get();
}

nlohmann::json Dispatcher::Invoke(const std::string& tool_name, const nlohmann::json& arguments,
                                  const std::string& invocation_id, const DisconnectCheck& client_gone) {
    std::string id = invocation_id.empty() ? "inv-" + std::to_string(next_id_.fetch_add(1)) : invocation_id;

    std::shared_ptr<Invocation> invocation;
    try {
        invocation = Track(id, tool_name);
    } catch (const BridgeError& e) {
        Logger::Warn(id + " " + tool_name + " rejected: " + e.what(), "Dispatcher");
        return MakeErrorEnvelope(e.KindName(), e.what());
    }

    struct UntrackGuard {
        Dispatcher* dispatcher;
        std::string id;
        ~UntrackGuard() { dispatcher->Untrack(id); }
    } guard{this, id};

    Transition(*invocation, InvocationState::RECEIVED);
    try {
        const RegisteredTool* tool = registry_.Find(tool_name);
        if (tool == nullptr) {
            throw SchemaValidationError("Unknown tool '" + tool_name + "'");
        }
        // Omitted arguments mean an empty argument object.
        nlohmann::json args = arguments.is_null() ? nlohmann::json::object() : arguments;
        ValidateArguments(tool->descriptor, args);
        Transition(*invocation, InvocationState::VALIDATED);

        nlohmann::json payload = Execute(*tool, args, *invocation, client_gone);
        Transition(*invocation, InvocationState::SUCCEEDED);
        return MakeSuccessEnvelope(payload);
    } catch (const BridgeError& e) {
        Transition(*invocation, InvocationState::FAILED, e.KindName() + ": " + e.what());
        return MakeErrorEnvelope(e.KindName(), e.what());
    } catch (const std::exception& e) {
        Logger::Error(id + " " + tool_name + " raised an unexpected error: " + e.what(), "Dispatcher");
        Transition(*invocation, InvocationState::FAILED, "InternalError");
        return MakeErrorEnvelope(ErrorKindName(ErrorKind::Internal), e.what());
    }
}
