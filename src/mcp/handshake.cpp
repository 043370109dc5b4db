#include <govcat/mcp/error_handling.h>
#include <govcat/mcp/handshake.h>

#include <boost/asio/post.hpp>
#include <spdlog/spdlog.h>

namespace govcat::mcp {

namespace {
constexpr std::size_t kMaxEvents = 64;
}

const char* to_string(HandshakePhase phase) noexcept {
    switch (phase) {
        case HandshakePhase::Idle:
            return "idle";
        case HandshakePhase::InitializeObserved:
            return "initialize-observed";
        case HandshakePhase::InitializeResponseFlushed:
            return "initialize-response-flushed";
        case HandshakePhase::ReadyEmitted:
            return "ready-emitted";
    }
    return "unknown";
}

HandshakeCoordinator::HandshakeCoordinator(boost::asio::any_io_executor executor,
                                           FrameSender sender, HandshakeOptions options)
    : strand_(boost::asio::make_strand(executor)), sender_(std::move(sender)),
      options_(std::move(options)), retryTimer_(strand_),
      created_(std::chrono::steady_clock::now()) {}

HandshakeCoordinator::~HandshakeCoordinator() = default;

void HandshakeCoordinator::recordEvent(std::string event, std::string detail) {
    const auto atMs = std::chrono::duration_cast<std::chrono::milliseconds>(
                          std::chrono::steady_clock::now() - created_)
                          .count();
    if (options_.trace) {
        spdlog::info("[handshake] {} {} (+{}ms)", event, detail, atMs);
    } else {
        spdlog::debug("[handshake] {} {} (+{}ms)", event, detail, atMs);
    }
    std::lock_guard<std::mutex> lock(eventsMutex_);
    events_.push_back({std::move(event), std::move(detail), atMs});
    while (events_.size() > kMaxEvents) {
        events_.pop_front();
    }
}

void HandshakeCoordinator::onInitializeObserved() {
    boost::asio::post(strand_, [self = shared_from_this()] {
        if (self->stopped_ || self->sawInitialize_) {
            return;
        }
        self->sawInitialize_ = true;
        self->phase_.store(HandshakePhase::InitializeObserved);
        self->recordEvent("initialize-observed");
        if (self->options_.readyRetry.count() > 0) {
            self->armRetryTimer();
        }
    });
}

SendCompletion HandshakeCoordinator::initializeResponseCompletion() {
    std::weak_ptr<HandshakeCoordinator> weak = weak_from_this();
    return [weak](bool flushed) {
        if (auto self = weak.lock()) {
            self->onFlushed(flushed);
        }
    };
}

void HandshakeCoordinator::onFlushed(bool ok) {
    // The completion may fire on any thread; hop onto the strand, then wait one
    // more turn so anything queued alongside the write is ordered first
    boost::asio::post(strand_, [self = shared_from_this(), ok] {
        boost::asio::post(self->strand_, [self, ok] {
            if (self->stopped_) {
                return;
            }
            if (!ok) {
                self->recordEvent("initialize-response-write-failed");
                return;
            }
            if (!self->sawInitialize_ || self->initResponseFlushed_) {
                self->recordEvent("flush-ignored",
                                  self->sawInitialize_ ? "duplicate" : "no-initialize");
                return;
            }
            self->initResponseFlushed_ = true;
            self->phase_.store(HandshakePhase::InitializeResponseFlushed);
            self->recordEvent("initialize-response-flushed");
            self->tryEmitReady("flush");
        });
    });
}

void HandshakeCoordinator::requestReady(std::string_view reason) {
    boost::asio::post(strand_, [self = shared_from_this(), reason = std::string(reason)] {
        self->tryEmitReady(reason);
    });
}

void HandshakeCoordinator::tryEmitReady(const std::string& reason) {
    if (stopped_) {
        return;
    }
    if (readyNotified_) {
        suppressedReady_.fetch_add(1, std::memory_order_relaxed);
        recordEvent("ready-suppressed", reason);
        return;
    }
    if (!sawInitialize_ || !initResponseFlushed_) {
        recordEvent("ready-deferred", reason);
        return;
    }

    readyNotified_ = true;
    phase_.store(HandshakePhase::ReadyEmitted);
    retryTimer_.cancel();
    recordEvent("ready-emitted", reason);
    sender_(json{{"jsonrpc", protocol::JSONRPC_VERSION},
                 {"method", protocol::NOTIFY_READY},
                 {"params", {{"version", options_.serverVersion}}}},
            {});

    if (pendingListChanged_) {
        pendingListChanged_ = false;
        pendingSnapshot_.store(false);
        recordEvent("list-changed-replayed");
        sender_(json{{"jsonrpc", protocol::JSONRPC_VERSION},
                     {"method", protocol::NOTIFY_TOOLS_LIST_CHANGED},
                     {"params", json::object()}},
                {});
    }
}

void HandshakeCoordinator::raiseListChanged() {
    boost::asio::post(strand_, [self = shared_from_this()] {
        if (self->stopped_) {
            return;
        }
        if (!self->readyNotified_) {
            if (!self->pendingListChanged_) {
                self->pendingListChanged_ = true;
                self->pendingSnapshot_.store(true);
                self->recordEvent("list-changed-buffered");
            } else {
                self->recordEvent("list-changed-coalesced");
            }
            return;
        }
        self->recordEvent("list-changed-sent");
        self->sender_(json{{"jsonrpc", protocol::JSONRPC_VERSION},
                           {"method", protocol::NOTIFY_TOOLS_LIST_CHANGED},
                           {"params", json::object()}},
                      {});
    });
}

void HandshakeCoordinator::armRetryTimer() {
    if (stopped_ || readyNotified_ || retries_ >= options_.maxReadyRetries) {
        return;
    }
    retryTimer_.expires_after(options_.readyRetry);
    retryTimer_.async_wait([self = shared_from_this()](const boost::system::error_code& ec) {
        if (ec) {
            return;
        }
        ++self->retries_;
        self->tryEmitReady("retry-timer");
        self->armRetryTimer();
    });
}

void HandshakeCoordinator::stop() {
    boost::asio::post(strand_, [self = shared_from_this()] {
        self->stopped_ = true;
        self->retryTimer_.cancel();
    });
}

json HandshakeCoordinator::diagnostics() const {
    const auto phase = phase_.load();
    json events = json::array();
    {
        std::lock_guard<std::mutex> lock(eventsMutex_);
        for (const auto& e : events_) {
            json item{{"event", e.event}, {"atMs", e.atMs}};
            if (!e.detail.empty()) {
                item["detail"] = e.detail;
            }
            events.push_back(std::move(item));
        }
    }
    return json{{"phase", to_string(phase)},
                {"sawInitialize", phase != HandshakePhase::Idle},
                {"initResponseFlushed", phase == HandshakePhase::InitializeResponseFlushed ||
                                            phase == HandshakePhase::ReadyEmitted},
                {"readyNotified", phase == HandshakePhase::ReadyEmitted},
                {"pendingListChanged", pendingSnapshot_.load()},
                {"suppressedReady", suppressedReady_.load()},
                {"events", std::move(events)}};
}

} // namespace govcat::mcp
