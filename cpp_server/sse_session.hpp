#ifndef SSE_SESSION_HPP
#define SSE_SESSION_HPP

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

// "event: <event>\ndata: <line>\n...\n\n". Multi-line data becomes several data lines.
std::string FormatSseEvent(const std::string& event, const std::string& data);

// One open GET /sse stream: an outbound queue of formatted frames plus the
// workers handling messages posted for it.
class SseSession {
public:
    explicit SseSession(std::string id) : id_(std::move(id)) {}

    const std::string& Id() const { return id_; }

    // Dropped once the session is closed.
    void Push(const std::string& event, const std::string& data);

    // Waits up to `timeout` for the next frame. Returns false once closed and
    // drained; `frame` is left empty when the wait timed out.
    bool Next(std::string& frame, std::chrono::milliseconds timeout);

    void Close();
    bool Closed() const;

    // Runs `work` asynchronously. False (and nothing runs) after Close.
    bool Spawn(std::function<void()> work);

    // Waits for every spawned worker. Call after Close.
    void Join();

private:
    const std::string id_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<std::string> frames_;
    bool closed_ = false;
    std::vector<std::future<void>> workers_;
};

class SseSessionHub {
public:
    SseSessionHub() = default;
    ~SseSessionHub();

    SseSessionHub(const SseSessionHub&) = delete;
    SseSessionHub& operator=(const SseSessionHub&) = delete;

    std::shared_ptr<SseSession> Open(const std::string& id);

    // nullptr when no open session has that id.
    std::shared_ptr<SseSession> Find(const std::string& id) const;

    void Remove(const std::string& id);

    // Closes every session and waits for their workers; open streams end.
    void CloseAll();

    std::size_t Count() const;

private:
    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<SseSession>> sessions_;
};

#endif // SSE_SESSION_HPP
