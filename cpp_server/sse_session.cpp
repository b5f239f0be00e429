#include "sse_session.hpp"
#include "logger.hpp"
#include <algorithm>
#include <exception>
#include <utility>

std::string FormatSseEvent(const std::string& event, const std::string& data) {
    std::string frame = "event: " + event + "\n";
    std::size_t start = 0;
    while (true) {
        std::size_t end = data.find('\n', start);
        frame += "data: " + data.substr(start, end == std::string::npos ? std::string::npos : end - start) + "\n";
        if (end == std::string::npos) {
            break;
        }
        start = end + 1;
    }
    frame += "\n";
    return frame;
}

void SseSession::Push(const std::string& event, const std::string& data) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            Logger::Debug("Dropping '" + event + "' event for closed session " + id_, "SSE");
            return;
        }
        frames_.push_back(FormatSseEvent(event, data));
    }
    cv_.notify_all();
}

bool SseSession::Next(std::string& frame, std::chrono::milliseconds timeout) {
    frame.clear();
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_for(lock, timeout, [this]() { return closed_ || !frames_.empty(); });
    if (!frames_.empty()) {
        frame = std::move(frames_.front());
        frames_.pop_front();
        return true;
    }
    return !closed_;
}

void SseSession::Close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return;
        }
        closed_ = true;
        frames_.clear();
    }
    cv_.notify_all();
    Logger::Info("Session " + id_ + " closed", "SSE");
}

bool SseSession::Closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

bool SseSession::Spawn(std::function<void()> work) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) {
        return false;
    }
    workers_.erase(std::remove_if(workers_.begin(), workers_.end(),
                                  [](const std::future<void>& f) {
                                      return f.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
                                  }),
                   workers_.end());
    std::string id = id_;
    workers_.push_back(std::async(std::launch::async, [work = std::move(work), id]() {
        try {
            work();
        } catch (const std::exception& e) {
            Logger::Error("Message handling for session " + id + " failed: " + e.what(), "SSE");
        }
    }));
    return true;
}

void SseSession::Join() {
    std::vector<std::future<void>> workers;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        workers.swap(workers_);
    }
    for (auto& worker : workers) {
        worker.wait();
    }
}

SseSessionHub::~SseSessionHub() {
    CloseAll();
}

std::shared_ptr<SseSession> SseSessionHub::Open(const std::string& id) {
    auto session = std::make_shared<SseSession>(id);
    std::lock_guard<std::mutex> lock(mutex_);
    sessions_[id] = session;
    Logger::Info("Session " + id + " opened (" + std::to_string(sessions_.size()) + " open)", "SSE");
    return session;
}

std::shared_ptr<SseSession> SseSessionHub::Find(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(id);
    return it == sessions_.end() ? nullptr : it->second;
}

void SseSessionHub::Remove(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    sessions_.erase(id);
}

void SseSessionHub::CloseAll() {
    std::map<std::string, std::shared_ptr<SseSession>> sessions;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        sessions.swap(sessions_);
    }
    for (auto& entry : sessions) {
        entry.second->Close();
    }
    for (auto& entry : sessions) {
        entry.second->Join();
    }
}

std::size_t SseSessionHub::Count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.size();
}
