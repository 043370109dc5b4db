#include <govcat/mcp/error_handling.h>

#include <spdlog/spdlog.h>

#include <vector>

namespace govcat::mcp {

namespace {

struct Candidate {
    int code = 0;
    std::string message;
    json data;
    int depth = 0;
};

constexpr const char* kNestedKeys[] = {"cause", "error", "inner"};

void collectJson(const json& value, int depth, std::vector<Candidate>& out) {
    if (!value.is_object()) {
        return;
    }
    if (value.contains("code") && value["code"].is_number_integer()) {
        Candidate c;
        c.code = value["code"].get<int>();
        if (value.contains("message") && value["message"].is_string()) {
            c.message = value["message"].get<std::string>();
        }
        if (value.contains("data") && value["data"].is_object()) {
            c.data = value["data"];
        }
        c.depth = depth;
        out.push_back(std::move(c));
    }
    if (value.contains("data") && value["data"].is_object()) {
        const auto& data = value["data"];
        for (const char* key : kNestedKeys) {
            if (data.contains(key)) {
                collectJson(data[key], depth + 1, out);
            }
        }
    }
    for (const char* key : kNestedKeys) {
        if (value.contains(key)) {
            collectJson(value[key], depth + 1, out);
        }
    }
}

void collectException(std::exception_ptr ep, int depth, std::vector<Candidate>& out);

template <typename E> void collectNested(const E& e, int depth, std::vector<Candidate>& out) {
    if (const auto* nested = dynamic_cast<const std::nested_exception*>(&e)) {
        if (auto inner = nested->nested_ptr()) {
            collectException(inner, depth + 1, out);
        }
    }
}

void collectException(std::exception_ptr ep, int depth, std::vector<Candidate>& out) {
    if (!ep) {
        return;
    }
    try {
        std::rethrow_exception(ep);
    } catch (const RpcError& e) {
        out.push_back({e.code(), e.what(), e.data(), depth});
        for (const char* key : kNestedKeys) {
            if (e.data().contains(key)) {
                collectJson(e.data()[key], depth + 1, out);
            }
        }
        collectNested(e, depth, out);
    } catch (const json& value) {
        const auto before = out.size();
        collectJson(value, depth, out);
        if (out.size() == before) {
            out.push_back({protocol::INTERNAL_ERROR, value.dump(), json::object(), depth});
        }
    } catch (const json::exception& e) {
        out.push_back({protocol::INTERNAL_ERROR, e.what(), json::object(), depth});
        collectNested(e, depth, out);
    } catch (const std::exception& e) {
        out.push_back({protocol::INTERNAL_ERROR, e.what(), json::object(), depth});
        collectNested(e, depth, out);
    } catch (...) {
        out.push_back({protocol::INTERNAL_ERROR, "Unknown error", json::object(), depth});
    }
}

NormalizedError pick(std::vector<Candidate>& candidates, std::string_view method) {
    NormalizedError result;
    const Candidate* best = nullptr;
    int bestRank = -1;
    for (const auto& c : candidates) {
        const int rank = codeSpecificity(c.code);
        if (rank > bestRank || (rank == bestRank && best && c.depth > best->depth)) {
            best = &c;
            bestRank = rank;
        }
    }

    if (!best) {
        result.code = protocol::INTERNAL_ERROR;
        result.message = "Internal error";
    } else if (bestRank == 0) {
        // Only foreign codes were found; keep the detail but report internal
        result.code = protocol::INTERNAL_ERROR;
        result.message = best->message.empty() ? "Internal error" : best->message;
        result.data = json::object();
        result.data["originalCode"] = best->code;
    } else {
        result.code = best->code;
        result.message = best->message;
        result.data = best->data.is_object() ? best->data : json::object();
    }
    if (result.message.empty()) {
        result.message = "Internal error";
    }
    if (!result.data.contains("method")) {
        result.data["method"] = std::string(method);
    }
    return result;
}

} // namespace

RpcError::RpcError(int code, const std::string& message, json data)
    : std::runtime_error(message), code_(code),
      data_(data.is_object() ? std::move(data) : json::object()) {}

json RpcError::toJson() const {
    return json{{"code", code_}, {"message", what()}, {"data", data_}};
}

json NormalizedError::toJson() const {
    return json{{"code", code}, {"message", message}, {"data", data}};
}

int rpcCodeFor(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::InvalidArgument:
        case ErrorCode::ValidationError:
        case ErrorCode::InvalidData:
            return protocol::INVALID_PARAMS;
        case ErrorCode::NotFound:
            return protocol::NOT_FOUND;
        case ErrorCode::Conflict:
            return protocol::CONFLICT;
        case ErrorCode::MutationDisabled:
            return protocol::MUTATION_DISABLED;
        case ErrorCode::HashMismatch:
        case ErrorCode::CorruptedData:
            return protocol::INTEGRITY_ERROR;
        case ErrorCode::WriteError:
            return protocol::WRITE_FAILURE;
        case ErrorCode::MethodNotFound:
            return protocol::METHOD_NOT_FOUND;
        default:
            return protocol::INTERNAL_ERROR;
    }
}

int codeSpecificity(int code) noexcept {
    switch (code) {
        case protocol::MUTATION_DISABLED:
            return 8;
        case protocol::INVALID_PARAMS:
            return 7;
        case protocol::METHOD_NOT_FOUND:
            return 6;
        case protocol::NOT_FOUND:
            return 5;
        case protocol::CONFLICT:
            return 4;
        case protocol::INTEGRITY_ERROR:
            return 3;
        case protocol::WRITE_FAILURE:
            return 2;
        case protocol::INTERNAL_ERROR:
        case protocol::PARSE_ERROR:
        case protocol::INVALID_REQUEST:
        case protocol::UNSUPPORTED_PROTOCOL_VERSION:
            return 1;
        default:
            return 0;
    }
}

void throwRpcError(const Error& error, json data) {
    if (!data.is_object()) {
        data = json::object();
    }
    data["reason"] = errorToString(error.code);
    throw RpcError(rpcCodeFor(error.code), error.message, std::move(data));
}

NormalizedError deepUnwrap(std::exception_ptr error, std::string_view method) {
    std::vector<Candidate> candidates;
    collectException(error, 0, candidates);
    auto result = pick(candidates, method);
    spdlog::debug("deepUnwrap({}): {} candidate(s), chose {} '{}'", method, candidates.size(),
                  result.code, result.message);
    return result;
}

NormalizedError deepUnwrap(const json& error, std::string_view method) {
    std::vector<Candidate> candidates;
    collectJson(error, 0, candidates);
    return pick(candidates, method);
}

} // namespace govcat::mcp
