#pragma once

#include <boost/asio/any_io_executor.hpp>
#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>
#include <govcat/core/types.h>
#include <govcat/mcp/dispatcher.h>
#include <govcat/mcp/error_handling.h>
#include <govcat/mcp/handshake.h>
#include <govcat/version.hpp>

namespace govcat::mcp {

using json = nlohmann::json;

/**
 * Transport interface. send() reports through onFlushed once the frame has
 * been written to the underlying stream (or the write failed).
 */
class ITransport {
public:
    virtual ~ITransport() = default;
    virtual void send(const json& message, SendCompletion onFlushed = {}) = 0;
    virtual MessageResult receive() = 0;
    virtual bool isConnected() const = 0;
    virtual void close() = 0;
    virtual TransportState getState() const = 0;
};

/**
 * Newline-delimited JSON over stdin/stdout. Each outbound frame is one line;
 * an inbound line carries a single object or a batch array, and a bare
 * "quit" line closes the transport.
 */
class StdioTransport : public ITransport {
public:
    StdioTransport();
    ~StdioTransport() override;
    void send(const json& message, SendCompletion onFlushed = {}) override;
    MessageResult receive() override;
    bool isConnected() const override { return state_.load() == TransportState::Connected; }
    void close() override { state_.store(TransportState::Closing); }
    TransportState getState() const override { return state_.load(); }

    // Checked before every read; once set, receive() reports the transport closed
    void setShutdownFlag(std::atomic<bool>* shutdown) { externalShutdown_ = shutdown; }

private:
    bool writeLine(const std::string& payload);
    MessageResult decodeFrame(std::string_view frame);

    std::atomic<TransportState> state_{TransportState::Connected};
    std::atomic<bool>* externalShutdown_{nullptr};
    std::mutex outMutex_;
};

struct ServerOptions {
    std::string name = "govcat";
    std::string version = kVersion;
    bool strictProtocol = false;
    bool handshakeTrace = false;
    std::chrono::milliseconds readyRetry{0};
    std::size_t workerThreads = 2;
};

/**
 * JSON-RPC server for one connection. Requests run on a fixed worker pool,
 * every outbound frame goes through one strand, and each request id gets
 * exactly one response even when it was cancelled in flight.
 */
class MCPServer {
public:
    MCPServer(std::unique_ptr<ITransport> transport, Dispatcher& dispatcher,
              boost::asio::any_io_executor executor, ServerOptions options = {},
              std::atomic<bool>* externalShutdown = nullptr);
    ~MCPServer();

    MCPServer(const MCPServer&) = delete;
    MCPServer& operator=(const MCPServer&) = delete;

    // Blocking receive loop; returns after disconnect, exit or stop()
    void start();
    void stop();
    bool isRunning() const { return running_.load(); }

    // Route one inbound message (object or batch array)
    void processMessage(const json& message);

    // Wait until no request is in flight and every queued frame was written
    bool waitIdle(std::chrono::milliseconds timeout);

    json handshakeDiagnostics() const { return handshake_->diagnostics(); }
    HandshakeCoordinator& handshake() { return *handshake_; }

    static const std::vector<std::string>& supportedProtocolVersions();

    // Outbound frame path; shared with posted handlers so it can outlive the server
    struct Outbound;

#ifdef GOVCAT_TESTING
public:
    MessageResult testHandleRequest(const json& request) { return handleRequest(request); }
    bool testIsCanceled(const json& id) const { return isCanceled(id); }
    std::string testNegotiatedVersion() const {
        std::lock_guard<std::mutex> lock(sessionMutex_);
        return negotiatedProtocolVersion_;
    }
#endif

private:
    // Response frame for a request; a notification yields Error{Success, "notification"}
    MessageResult handleRequest(const json& request);
    std::optional<MessageResult> dispatchCoreMethod(const json& id, const std::string& method,
                                                    const json& params);
    json callTool(const std::string& name, const json& arguments, const json& id);
    // Throws RpcError(-32901) in strict mode when the version is not supported
    json initialize(const json& params);
    json createResponse(const json& id, const json& result) const;
    json createError(const json& id, int code, const std::string& message,
                     const json& data = json::object()) const;
    json buildServerCapabilities() const;

    void processRequest(const json& request);
    void sendResponse(json message, SendCompletion onFlushed = {});
    void runRequest(const json& request);
    void finishTask();

    // Worker pool
    void startThreadPool(std::size_t threads);
    void stopThreadPool();
    void enqueueTask(std::function<void()> task);

    // Cancellation
    void registerCancelable(const json& id);
    void releaseCancelable(const json& id);
    void cancelRequest(const json& id);
    void cancelAllInFlight();
    bool isCanceled(const json& id) const;

    void markClientInitialized();

    std::shared_ptr<ITransport> transport_;
    Dispatcher& dispatcher_;
    ServerOptions options_;
    std::atomic<bool>* externalShutdown_;
    std::atomic<bool> running_{false};
    std::atomic<bool> shutdownRequested_{false};

    std::shared_ptr<Outbound> outbound_;
    std::shared_ptr<HandshakeCoordinator> handshake_;

    struct ClientInfo {
        std::string name;
        std::string version;
    };
    mutable std::mutex sessionMutex_;
    ClientInfo clientInfo_;
    std::string negotiatedProtocolVersion_;

    // Worker pool state
    std::vector<std::thread> workerPool_;
    std::deque<std::function<void()>> taskQueue_;
    std::mutex taskMutex_;
    std::condition_variable taskCv_;
    bool stopWorkers_ = false;

    // In-flight accounting for waitIdle
    std::mutex idleMutex_;
    std::condition_variable idleCv_;
    std::size_t inFlight_ = 0;

    mutable std::mutex cancelMutex_;
    std::unordered_map<std::string, std::shared_ptr<std::atomic<bool>>> cancelTokens_;

    std::atomic<uint64_t> workerFailures_{0};
};

} // namespace govcat::mcp
