#include <govcat/mcp/mcp_server.h>

#include <spdlog/spdlog.h>

namespace govcat::mcp {

namespace {
// dump() keeps "1" and 1 apart
std::string tokenKey(const json& id) {
    return id.dump();
}
} // namespace

void MCPServer::registerCancelable(const json& id) {
    if (id.is_null())
        return;
    std::lock_guard<std::mutex> lk(cancelMutex_);
    auto key = tokenKey(id);
    if (cancelTokens_.find(key) == cancelTokens_.end()) {
        cancelTokens_[key] = std::make_shared<std::atomic<bool>>(false);
    }
}

void MCPServer::releaseCancelable(const json& id) {
    if (id.is_null())
        return;
    std::lock_guard<std::mutex> lk(cancelMutex_);
    cancelTokens_.erase(tokenKey(id));
}

void MCPServer::cancelRequest(const json& id) {
    if (id.is_null())
        return;
    std::lock_guard<std::mutex> lk(cancelMutex_);
    auto it = cancelTokens_.find(tokenKey(id));
    if (it == cancelTokens_.end()) {
        spdlog::debug("cancel: no request in flight with id {}", id.dump());
        return;
    }
    it->second->store(true);
    spdlog::info("Cancel requested for id {}", id.dump());
}

void MCPServer::cancelAllInFlight() {
    std::lock_guard<std::mutex> lk(cancelMutex_);
    for (auto& [key, token] : cancelTokens_) {
        token->store(true);
    }
    if (!cancelTokens_.empty()) {
        spdlog::info("Client disconnected with {} request(s) in flight", cancelTokens_.size());
    }
}

bool MCPServer::isCanceled(const json& id) const {
    if (id.is_null())
        return false;
    std::lock_guard<std::mutex> lk(cancelMutex_);
    auto it = cancelTokens_.find(tokenKey(id));
    if (it == cancelTokens_.end())
        return false;
    return it->second->load();
}

} // namespace govcat::mcp
