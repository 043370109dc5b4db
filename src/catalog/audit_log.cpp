#include <govcat/catalog/audit_log.h>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/spdlog.h>

namespace govcat::catalog {

AuditLog::AuditLog(std::filesystem::path path, std::shared_ptr<IClock> clock)
    : path_(std::move(path)), clock_(clock ? std::move(clock) : systemClock()) {
    if (path_.empty()) {
        spdlog::debug("Mutation audit log disabled");
        return;
    }
    std::error_code ec;
    if (path_.has_parent_path()) {
        std::filesystem::create_directories(path_.parent_path(), ec);
    }
    try {
        // Appends; an existing log is never truncated
        auto sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(path_.string(), false);
        logger_ = std::make_shared<spdlog::logger>("govcat-audit", std::move(sink));
        logger_->set_pattern("%v");
        logger_->set_level(spdlog::level::info);
        logger_->flush_on(spdlog::level::info);
        spdlog::debug("Mutation audit log at {}", path_.string());
    } catch (const spdlog::spdlog_ex& e) {
        spdlog::warn("Mutation audit log disabled, cannot open {}: {}", path_.string(), e.what());
        logger_.reset();
    }
}

AuditLog::~AuditLog() {
    if (logger_) {
        logger_->flush();
    }
}

void AuditLog::record(std::string_view action, const std::vector<std::string>& ids,
                      nlohmann::json meta) {
    if (!logger_) {
        return;
    }
    nlohmann::json line{{"ts", toIso8601(clock_->now())}, {"action", action}};
    if (!ids.empty()) {
        line["ids"] = ids;
    }
    if (meta.is_object() && !meta.empty()) {
        line["meta"] = std::move(meta);
    }
    logger_->info("{}", line.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));
}

} // namespace govcat::catalog
