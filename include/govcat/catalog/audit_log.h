#pragma once

#include <nlohmann/json.hpp>

#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <vector>
#include <govcat/core/clock.h>

namespace spdlog {
class logger;
}

namespace govcat::catalog {

/**
 * Append-only transaction log of catalog mutations.
 *
 * Each committed change becomes one JSON line `{ts, action, ids?, meta?}`
 * written through a dedicated spdlog file sink. An empty path disables the
 * log; a path that cannot be opened disables it with a warning and the
 * mutations themselves carry on.
 */
class AuditLog {
public:
    AuditLog(std::filesystem::path path, std::shared_ptr<IClock> clock);
    ~AuditLog();

    AuditLog(const AuditLog&) = delete;
    AuditLog& operator=(const AuditLog&) = delete;

    void record(std::string_view action, const std::vector<std::string>& ids = {},
                nlohmann::json meta = nlohmann::json::object());

    bool enabled() const { return logger_ != nullptr; }
    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
    std::shared_ptr<IClock> clock_;
    std::shared_ptr<spdlog::logger> logger_;
};

} // namespace govcat::catalog
