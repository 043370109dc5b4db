#pragma once

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include <govcat/mcp/dispatcher.h>
#include <govcat/mcp/handlers.h>
#include <govcat/mcp/mcp_server.h>

#include "catalog_fixture.h"

namespace govcat::test {

using nlohmann::json;

// Frames written by the server, shared so they outlive the transport
struct SentFrames {
    std::mutex mutex;
    std::vector<json> frames;

    std::vector<json> snapshot() {
        std::lock_guard<std::mutex> lock(mutex);
        return frames;
    }

    std::vector<json> withId(const json& id) {
        std::vector<json> out;
        for (auto& f : snapshot()) {
            if (f.contains("id") && f["id"] == id) {
                out.push_back(f);
            }
        }
        return out;
    }

    // Position of the first frame matching the predicate, -1 when absent
    int indexOf(const std::function<bool(const json&)>& match) {
        auto all = snapshot();
        for (std::size_t i = 0; i < all.size(); ++i) {
            if (match(all[i])) {
                return static_cast<int>(i);
            }
        }
        return -1;
    }

    std::size_t countMethod(const std::string& method) {
        std::size_t n = 0;
        for (auto& f : snapshot()) {
            if (f.value("method", std::string{}) == method) {
                ++n;
            }
        }
        return n;
    }
};

/**
 * In-memory transport: scripted inbound messages, recorded outbound frames.
 * receive() reports a disconnect once the script runs out.
 */
class RecordingTransport : public mcp::ITransport {
public:
    explicit RecordingTransport(std::shared_ptr<SentFrames> sent,
                                std::deque<mcp::MessageResult> inbound = {})
        : sent_(std::move(sent)), inbound_(std::move(inbound)) {}

    void send(const json& message, mcp::SendCompletion onFlushed = {}) override {
        const bool ok = state_ == mcp::TransportState::Connected;
        if (ok) {
            std::lock_guard<std::mutex> lock(sent_->mutex);
            sent_->frames.push_back(message);
        }
        if (onFlushed) {
            onFlushed(ok);
        }
    }

    mcp::MessageResult receive() override {
        std::lock_guard<std::mutex> lock(inMutex_);
        if (inbound_.empty()) {
            state_ = mcp::TransportState::Disconnected;
            return Error{ErrorCode::NetworkError, "script exhausted"};
        }
        auto next = std::move(inbound_.front());
        inbound_.pop_front();
        return next;
    }

    bool isConnected() const override { return state_ == mcp::TransportState::Connected; }
    void close() override { state_ = mcp::TransportState::Closing; }
    mcp::TransportState getState() const override { return state_; }

private:
    std::shared_ptr<SentFrames> sent_;
    std::mutex inMutex_;
    std::deque<mcp::MessageResult> inbound_;
    std::atomic<mcp::TransportState> state_{mcp::TransportState::Connected};
};

/**
 * Catalog, dispatcher and server over a recording transport, with an
 * io_context running on a background thread for the strand and timers.
 */
struct ServerFixture {
    CatalogFixture catalog;
    std::unique_ptr<mcp::Dispatcher> dispatcher;
    boost::asio::io_context io;
    std::optional<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>> guard;
    std::thread ioThread;
    std::shared_ptr<SentFrames> sent = std::make_shared<SentFrames>();
    std::unique_ptr<mcp::MCPServer> server;

    explicit ServerFixture(mcp::DispatcherOptions dispatcherOptions = {}) {
        dispatcher = std::make_unique<mcp::Dispatcher>(dispatcherOptions);
        mcp::registerCatalogHandlers(*dispatcher, *catalog.engine);
        mcp::registerServiceHandlers(*dispatcher);
        guard.emplace(boost::asio::make_work_guard(io));
        ioThread = std::thread([this] { io.run(); });
    }

    ~ServerFixture() {
        server.reset();
        guard.reset();
        io.stop();
        if (ioThread.joinable()) {
            ioThread.join();
        }
    }

    // Extra handlers must be registered before this
    mcp::MCPServer& startServer(mcp::ServerOptions options = {},
                                std::deque<mcp::MessageResult> inbound = {}) {
        server = std::make_unique<mcp::MCPServer>(
            std::make_unique<RecordingTransport>(sent, std::move(inbound)), *dispatcher,
            io.get_executor(), std::move(options));
        return *server;
    }

    static json request(const json& id, const std::string& method,
                        json params = json::object()) {
        return json{{"jsonrpc", "2.0"}, {"id", id}, {"method", method}, {"params", params}};
    }

    static json notification(const std::string& method, json params = json::object()) {
        return json{{"jsonrpc", "2.0"}, {"method", method}, {"params", params}};
    }

    // Polls until the predicate holds; frames produced off the strand need this
    static bool eventually(const std::function<bool()>& pred,
                           std::chrono::milliseconds timeout = std::chrono::seconds(3)) {
        const auto deadline = std::chrono::steady_clock::now() + timeout;
        while (std::chrono::steady_clock::now() < deadline) {
            if (pred()) {
                return true;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(2));
        }
        return pred();
    }
};

} // namespace govcat::test
