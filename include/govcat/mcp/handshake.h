#pragma once

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>
#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>

namespace govcat::mcp {

using json = nlohmann::json;

// Invoked once the transport has handed the frame to the OS (true) or failed (false)
using SendCompletion = std::function<void(bool flushed)>;
using FrameSender = std::function<void(json frame, SendCompletion onFlushed)>;

enum class HandshakePhase { Idle, InitializeObserved, InitializeResponseFlushed, ReadyEmitted };

const char* to_string(HandshakePhase phase) noexcept;

struct HandshakeOptions {
    std::string serverVersion;
    // Diagnostic retry of the readiness check; 0 disables. Never bypasses the gates.
    std::chrono::milliseconds readyRetry{0};
    int maxReadyRetries = 20;
    bool trace = false;
};

/**
 * Per-connection readiness ordering:
 *
 *   initialize observed -> initialize response flushed -> server/ready -> list_changed
 *
 * All state lives on one strand. The flushed flag is set only from the
 * transport's write completion, one scheduling turn after it fires. Ready is
 * latched and emitted at most once; list_changed raised before ready is kept
 * as one pending flag and replayed right after ready. Without an initialize
 * request ready never fires.
 */
class HandshakeCoordinator : public std::enable_shared_from_this<HandshakeCoordinator> {
public:
    HandshakeCoordinator(boost::asio::any_io_executor executor, FrameSender sender,
                         HandshakeOptions options);
    ~HandshakeCoordinator();

    HandshakeCoordinator(const HandshakeCoordinator&) = delete;
    HandshakeCoordinator& operator=(const HandshakeCoordinator&) = delete;

    // Call as soon as an initialize request is recognized, before handling it
    void onInitializeObserved();

    // Completion for the initialize response frame
    SendCompletion initializeResponseCompletion();

    // Any call site may ask; the gates and the latch decide
    void requestReady(std::string_view reason);

    void raiseListChanged();

    void stop();

    HandshakePhase phase() const noexcept { return phase_.load(); }
    bool readyEmitted() const noexcept { return phase_.load() == HandshakePhase::ReadyEmitted; }

    // {phase, sawInitialize, initResponseFlushed, readyNotified, pendingListChanged, events}
    json diagnostics() const;

private:
    void onFlushed(bool ok);
    void tryEmitReady(const std::string& reason);
    void armRetryTimer();
    void recordEvent(std::string event, std::string detail = {});

    boost::asio::strand<boost::asio::any_io_executor> strand_;
    FrameSender sender_;
    HandshakeOptions options_;
    boost::asio::steady_timer retryTimer_;
    const std::chrono::steady_clock::time_point created_;

    // Strand-only state; each flag moves false -> true once
    bool sawInitialize_ = false;
    bool initResponseFlushed_ = false;
    bool readyNotified_ = false;
    bool pendingListChanged_ = false;
    int retries_ = 0;
    bool stopped_ = false;

    std::atomic<HandshakePhase> phase_{HandshakePhase::Idle};

    struct Event {
        std::string event;
        std::string detail;
        int64_t atMs = 0;
    };
    mutable std::mutex eventsMutex_;
    std::deque<Event> events_;
    std::atomic<bool> pendingSnapshot_{false};
    std::atomic<int> suppressedReady_{0};
};

} // namespace govcat::mcp
