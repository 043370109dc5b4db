#include <govcat/mcp/mcp_server.h>

#include <spdlog/spdlog.h>

#include <iostream>
#include <string>
#include <string_view>

namespace govcat::mcp {

namespace {

constexpr std::string_view kUtf8Bom = "\xEF\xBB\xBF";
constexpr std::string_view kQuitCommand = "quit";

bool isFrameNoise(unsigned char c) {
    // ASCII whitespace, control bytes and the RS separator some clients prepend
    return c <= 0x20 || c == 0x7f;
}

// Strip a byte order mark and surrounding noise; CRLF line endings fall out here too
std::string_view trimFrame(std::string_view line) {
    if (line.substr(0, kUtf8Bom.size()) == kUtf8Bom) {
        line.remove_prefix(kUtf8Bom.size());
    }
    while (!line.empty() && isFrameNoise(static_cast<unsigned char>(line.front()))) {
        line.remove_prefix(1);
    }
    while (!line.empty() && isFrameNoise(static_cast<unsigned char>(line.back()))) {
        line.remove_suffix(1);
    }
    return line;
}

} // namespace

StdioTransport::StdioTransport() {
    // Unit tests swap std::cin/std::cout buffers; leave iostream setup alone there
#ifndef GOVCAT_TESTING
    std::ios::sync_with_stdio(false);
    std::cin.tie(nullptr);
#endif
    state_.store(TransportState::Connected);
}

StdioTransport::~StdioTransport() {
    state_.store(TransportState::Closing);
}

void StdioTransport::send(const json& message, SendCompletion onFlushed) {
    bool flushed = false;
    if (state_.load() == TransportState::Connected) {
        try {
            // Serialized outside the lock so a bad payload never half-writes a line
            auto payload = message.dump();
            std::lock_guard<std::mutex> lock(outMutex_);
            flushed = writeLine(payload);
        } catch (const json::exception& e) {
            spdlog::error("Dropping unserializable frame: {}", e.what());
        }
    }
    if (onFlushed) {
        onFlushed(flushed);
    }
}

bool StdioTransport::writeLine(const std::string& payload) {
    std::cout << payload << '\n';
    std::cout.flush();
    if (!std::cout) {
        spdlog::error("Write to stdout failed");
        std::cout.clear();
        return false;
    }
    return true;
}

MessageResult StdioTransport::decodeFrame(std::string_view frame) {
    auto parsed = json_utils::parse_json(frame);
    if (!parsed) {
        spdlog::debug("Unparseable frame: {}", frame);
        return parsed.error();
    }
    if (!parsed.value().is_object() && !parsed.value().is_array()) {
        return Error{ErrorCode::InvalidData, "Frame must be a JSON object or batch array"};
    }
    return parsed;
}

MessageResult StdioTransport::receive() {
    // A fresh stream over stdin's buffer per call, so a failed read leaves no sticky state
    std::istream in(std::cin.rdbuf());
    std::string line;
    for (;;) {
        if (externalShutdown_ && externalShutdown_->load()) {
            state_.store(TransportState::Closing);
            return Error{ErrorCode::NetworkError, "External shutdown requested"};
        }
        if (state_.load() != TransportState::Connected) {
            return Error{ErrorCode::NetworkError, "Transport not connected"};
        }
        if (!std::getline(in, line)) {
            if (in.bad()) {
                state_.store(TransportState::Error);
                return Error{ErrorCode::NetworkError, "stdin read failed"};
            }
            spdlog::info("EOF on stdin; client disconnected");
            state_.store(TransportState::Disconnected);
            return Error{ErrorCode::NetworkError, "EOF on stdin"};
        }

        const auto frame = trimFrame(line);
        if (frame.empty()) {
            continue;
        }
        if (frame == kQuitCommand) {
            spdlog::info("Client sent quit");
            state_.store(TransportState::Closing);
            return Error{ErrorCode::NetworkError, "Client sent quit"};
        }
        return decodeFrame(frame);
    }
}

} // namespace govcat::mcp
