#include <govcat/mcp/mcp_server.h>
#include <govcat/mcp/tool_registry.h>

#include <boost/asio/post.hpp>
#include <boost/asio/strand.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <csignal>

namespace govcat::mcp {

struct MCPServer::Outbound {
    Outbound(std::shared_ptr<ITransport> t, boost::asio::any_io_executor executor)
        : transport(std::move(t)), strand(boost::asio::make_strand(executor)) {}

    std::shared_ptr<ITransport> transport;
    boost::asio::strand<boost::asio::any_io_executor> strand;

    std::mutex mutex;
    std::condition_variable cv;
    std::size_t pending = 0;
};

namespace {

// Every frame goes through the strand, so frames leave in the order they were posted
void postFrame(const std::shared_ptr<MCPServer::Outbound>& outbound, json frame,
               SendCompletion onFlushed) {
    {
        std::lock_guard<std::mutex> lock(outbound->mutex);
        ++outbound->pending;
    }
    boost::asio::post(outbound->strand, [outbound, frame = std::move(frame),
                                         onFlushed = std::move(onFlushed)]() mutable {
        outbound->transport->send(frame, std::move(onFlushed));
        {
            std::lock_guard<std::mutex> lock(outbound->mutex);
            --outbound->pending;
        }
        outbound->cv.notify_all();
    });
}

} // namespace

const std::vector<std::string>& MCPServer::supportedProtocolVersions() {
    static const std::vector<std::string> kSupported = {"2025-06-18", "2025-03-26",
                                                        "2024-11-05"};
    return kSupported;
}

MCPServer::MCPServer(std::unique_ptr<ITransport> transport, Dispatcher& dispatcher,
                     boost::asio::any_io_executor executor, ServerOptions options,
                     std::atomic<bool>* externalShutdown)
    : transport_(std::move(transport)), dispatcher_(dispatcher), options_(std::move(options)),
      externalShutdown_(externalShutdown) {
    outbound_ = std::make_shared<Outbound>(transport_, executor);

    HandshakeOptions hs;
    hs.serverVersion = options_.version;
    hs.readyRetry = options_.readyRetry;
    hs.trace = options_.handshakeTrace;
    std::weak_ptr<Outbound> weakOutbound = outbound_;
    handshake_ = std::make_shared<HandshakeCoordinator>(
        executor,
        [weakOutbound](json frame, SendCompletion onFlushed) {
            if (auto outbound = weakOutbound.lock()) {
                postFrame(outbound, std::move(frame), std::move(onFlushed));
            } else if (onFlushed) {
                onFlushed(false);
            }
        },
        std::move(hs));

    startThreadPool(std::max<std::size_t>(1, options_.workerThreads));
}

MCPServer::~MCPServer() {
    stop();
}

void MCPServer::start() {
    if (running_.exchange(true)) {
        return;
    }
#ifndef _WIN32
    // A client that closes its read end must not kill the process on the next write
    std::signal(SIGPIPE, SIG_IGN);
#endif

    spdlog::info("MCP server started ({} {})", options_.name, options_.version);

    // The registry is announced once per connection; the handshake holds it until ready
    handshake_->raiseListChanged();

    try {
        while (running_ && (!externalShutdown_ || !externalShutdown_->load())) {
            auto messageResult = transport_->receive();

            if (!messageResult) {
                const auto& error = messageResult.error();
                switch (error.code) {
                    case ErrorCode::NetworkError:
                        spdlog::debug("Transport closed: {}", error.message);
                        running_ = false;
                        break;

                    case ErrorCode::InvalidData:
                        spdlog::debug("Invalid JSON received: {}", error.message);
                        sendResponse(
                            createError(json(nullptr), protocol::PARSE_ERROR, error.message));
                        continue;

                    default:
                        spdlog::error("Unexpected transport error: {}", error.message);
                        continue;
                }
                continue;
            }

            processMessage(messageResult.value());
        }
    } catch (const std::exception& e) {
        spdlog::critical("Fatal exception in MCPServer::start: {}", e.what());
    }

    // Requests still running belong to a client that is gone; they are answered
    // best-effort and marked cancelled
    cancelAllInFlight();
    stop();
    spdlog::info("MCP server stopped ({} failed worker task(s))", workerFailures_.load());
}

void MCPServer::stop() {
    running_.store(false);
    // Drain queued requests first so each of them still produces its response
    stopThreadPool();
    handshake_->stop();
    {
        std::unique_lock<std::mutex> lock(outbound_->mutex);
        outbound_->cv.wait_for(lock, std::chrono::seconds(2),
                               [this] { return outbound_->pending == 0; });
    }
    if (transport_) {
        transport_->close();
    }
}

void MCPServer::processMessage(const json& message) {
    if (message.is_array()) {
        if (message.empty()) {
            sendResponse(createError(json(nullptr), protocol::INVALID_REQUEST, "Empty batch"));
            return;
        }
        for (const auto& entry : message) {
            processRequest(entry);
        }
        return;
    }
    processRequest(message);
}

void MCPServer::processRequest(const json& request) {
    if (!request.is_object()) {
        spdlog::warn("MCP server received non-object entry in JSON-RPC batch");
        sendResponse(createError(json(nullptr), protocol::INVALID_REQUEST,
                                 "Batch entries must be JSON objects"));
        return;
    }

    auto valid = json_utils::validate_jsonrpc_message(request);
    if (!valid) {
        sendResponse(createError(request.value("id", json{}), protocol::INVALID_REQUEST,
                                 valid.error().message));
        return;
    }

    const bool isNotification = !request.contains("id");
    const std::string method = request.value("method", "");

    if (!isNotification && method == protocol::METHOD_INITIALIZE) {
        // Observed before anything is computed for it
        handshake_->onInitializeObserved();
    }

    if (isNotification) {
        auto outcome = handleRequest(request);
        if (!outcome && outcome.error().code != ErrorCode::Success) {
            spdlog::debug("Notification '{}' failed: {}", method, outcome.error().message);
        }
        return;
    }

    const auto id = request["id"];
    registerCancelable(id);
    {
        std::lock_guard<std::mutex> lock(idleMutex_);
        ++inFlight_;
    }
    enqueueTask([this, req = request]() { runRequest(req); });
}

void MCPServer::runRequest(const json& request) {
    const auto id = request.value("id", json{});
    const std::string method = request.value("method", "");

    json frame;
    auto response = handleRequest(request);
    if (response) {
        frame = std::move(response).value();
    } else if (response.error().code == ErrorCode::Success) {
        // Core notifications sent with an id still get an answer
        frame = createResponse(id, json::object());
    } else {
        frame = createError(id, protocol::INVALID_REQUEST, response.error().message);
    }

    if (isCanceled(id)) {
        json meta{{"cancelled", true}, {"bestEffort", true}};
        if (frame.contains("result") && frame["result"].is_object()) {
            frame["result"]["_meta"] = meta;
        } else if (frame.contains("error")) {
            auto& err = frame["error"];
            if (!err.contains("data") || !err["data"].is_object()) {
                err["data"] = json::object();
            }
            err["data"]["_meta"] = meta;
        }
        spdlog::debug("Answering cancelled request id={} best-effort", id.dump());
    }
    releaseCancelable(id);

    SendCompletion onFlushed;
    if (method == protocol::METHOD_INITIALIZE && frame.contains("result")) {
        onFlushed = handshake_->initializeResponseCompletion();
    }
    sendResponse(std::move(frame), std::move(onFlushed));
    finishTask();
}

void MCPServer::finishTask() {
    {
        std::lock_guard<std::mutex> lock(idleMutex_);
        if (inFlight_ > 0) {
            --inFlight_;
        }
    }
    idleCv_.notify_all();
}

void MCPServer::sendResponse(json message, SendCompletion onFlushed) {
    postFrame(outbound_, std::move(message), std::move(onFlushed));
}

bool MCPServer::waitIdle(std::chrono::milliseconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    {
        std::unique_lock<std::mutex> lock(idleMutex_);
        if (!idleCv_.wait_until(lock, deadline, [this] { return inFlight_ == 0; })) {
            return false;
        }
    }
    std::unique_lock<std::mutex> lock(outbound_->mutex);
    return outbound_->cv.wait_until(lock, deadline, [this] { return outbound_->pending == 0; });
}

json MCPServer::initialize(const json& params) {
    const auto& supported = supportedProtocolVersions();
    const std::string latest(protocol::LATEST_PROTOCOL_VERSION);

    std::string requested = latest;
    if (params.contains("protocolVersion") && params["protocolVersion"].is_string()) {
        requested = params["protocolVersion"].get<std::string>();
    }
    spdlog::debug("MCP client requested protocol version: {}", requested);

    std::string negotiated = latest;
    if (std::ranges::find(supported, requested) != supported.end()) {
        negotiated = requested;
    } else if (options_.strictProtocol) {
        throw RpcError(protocol::UNSUPPORTED_PROTOCOL_VERSION,
                       "Unsupported protocol version requested by client",
                       json{{"supportedVersions", supported}, {"requested", requested}});
    }

    {
        std::lock_guard<std::mutex> lock(sessionMutex_);
        if (params.contains("clientInfo") && params["clientInfo"].is_object()) {
            clientInfo_.name = params["clientInfo"].value("name", "unknown");
            clientInfo_.version = params["clientInfo"].value("version", "unknown");
        } else {
            clientInfo_.name = "unknown";
            clientInfo_.version = "unknown";
        }
        negotiatedProtocolVersion_ = negotiated;
        spdlog::info("MCP client {} {} negotiated protocol {}", clientInfo_.name,
                     clientInfo_.version, negotiated);
    }

    return json{{"protocolVersion", negotiated},
                {"serverInfo", {{"name", options_.name}, {"version", options_.version}}},
                {"capabilities", buildServerCapabilities()}};
}

json MCPServer::buildServerCapabilities() const {
    json caps = {{"tools", json({{"listChanged", true}})}, {"logging", json::object()}};
    caps["experimental"] = json::object();
    caps["experimental"]["cancellation"] = true;
    caps["experimental"]["readyNotification"] = std::string(protocol::NOTIFY_READY);
    caps["experimental"]["mutationEnabled"] = dispatcher_.mutationEnabled();
    caps["experimental"]["validationBackend"] = config::to_string(dispatcher_.validation().backend());
    return caps;
}

json MCPServer::createResponse(const json& id, const json& result) const {
    return json{{"jsonrpc", protocol::JSONRPC_VERSION}, {"id", id}, {"result", result}};
}

json MCPServer::createError(const json& id, int code, const std::string& message,
                            const json& data) const {
    json error{{"code", code}, {"message", message}};
    if (!data.empty()) {
        error["data"] = data;
    }
    return json{{"jsonrpc", protocol::JSONRPC_VERSION}, {"id", id}, {"error", std::move(error)}};
}

void MCPServer::markClientInitialized() {
    spdlog::info("MCP marking client as initialized");
    handshake_->requestReady("client-initialized");
}

// === Worker pool ===
void MCPServer::startThreadPool(std::size_t threads) {
    {
        std::lock_guard<std::mutex> lk(taskMutex_);
        stopWorkers_ = false;
    }
    workerPool_.reserve(threads);
    for (std::size_t i = 0; i < threads; ++i) {
        workerPool_.emplace_back([this]() {
            while (true) {
                std::function<void()> task;
                {
                    std::unique_lock<std::mutex> lk(taskMutex_);
                    taskCv_.wait(lk, [this]() { return stopWorkers_ || !taskQueue_.empty(); });
                    if (stopWorkers_ && taskQueue_.empty()) {
                        return;
                    }
                    task = std::move(taskQueue_.front());
                    taskQueue_.pop_front();
                }
                try {
                    task();
                } catch (const std::exception& e) {
                    workerFailures_.fetch_add(1, std::memory_order_relaxed);
                    spdlog::error("MCP worker task failed: {}", e.what());
                }
            }
        });
    }
}

void MCPServer::stopThreadPool() {
    {
        std::lock_guard<std::mutex> lk(taskMutex_);
        stopWorkers_ = true;
    }
    taskCv_.notify_all();
    for (auto& t : workerPool_) {
        if (t.joinable()) {
            t.join();
        }
    }
    workerPool_.clear();
}

void MCPServer::enqueueTask(std::function<void()> task) {
    bool runInline = false;
    {
        std::lock_guard<std::mutex> lk(taskMutex_);
        if (stopWorkers_) {
            runInline = true;
        } else {
            taskQueue_.push_back(std::move(task));
        }
    }
    if (runInline) {
        // Pool is gone; the request is still answered
        task();
        return;
    }
    taskCv_.notify_one();
}

} // namespace govcat::mcp
