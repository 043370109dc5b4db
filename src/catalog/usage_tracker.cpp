#include <govcat/catalog/usage_tracker.h>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <fstream>

namespace govcat::catalog {

using json = nlohmann::json;

UsageTracker::UsageTracker(UsageTrackerConfig config,
                           std::optional<boost::asio::any_io_executor> executor)
    : config_(std::move(config)), executor_(std::move(executor)) {
    if (!config_.clock) {
        config_.clock = systemClock();
    }
    if (config_.window.count() <= 0) {
        config_.window = std::chrono::milliseconds{1000};
    }
    if (executor_) {
        timer_ = std::make_unique<boost::asio::steady_timer>(*executor_);
    }
}

UsageTracker::~UsageTracker() {
    {
        std::lock_guard<std::mutex> lock(liveness_->mutex);
        liveness_->alive = false;
    }
    {
        std::lock_guard<std::mutex> lock(timerMutex_);
        if (timer_) {
            timer_->cancel();
        }
        timerArmed_ = false;
    }
    if (dirty_.load()) {
        if (auto r = flush(); !r) {
            spdlog::warn("Final usage flush failed: {}", r.error().message);
        }
    }
}

std::shared_ptr<UsageTracker::Slot> UsageTracker::slotFor(std::string_view id) {
    {
        std::shared_lock<std::shared_mutex> lock(slotsMutex_);
        if (auto it = slots_.find(std::string(id)); it != slots_.end()) {
            return it->second;
        }
    }
    std::unique_lock<std::shared_mutex> lock(slotsMutex_);
    auto& slot = slots_[std::string(id)];
    if (!slot) {
        slot = std::make_shared<Slot>();
    }
    return slot;
}

Result<void> UsageTracker::loadSnapshot() {
    std::error_code ec;
    if (config_.snapshotPath.empty() || !std::filesystem::exists(config_.snapshotPath, ec)) {
        return {};
    }
    std::ifstream in(config_.snapshotPath);
    if (!in) {
        return Error{ErrorCode::NotFound, "cannot open " + config_.snapshotPath.string()};
    }
    json doc;
    try {
        doc = json::parse(in);
    } catch (const json::parse_error& e) {
        spdlog::warn("Usage snapshot {} is not valid JSON ({}); starting empty",
                     config_.snapshotPath.string(), e.what());
        return {};
    }
    if (!doc.is_object()) {
        spdlog::warn("Usage snapshot {} is not an object; starting empty",
                     config_.snapshotPath.string());
        return {};
    }

    std::unordered_map<std::string, std::shared_ptr<Slot>> loaded;
    for (const auto& [id, value] : doc.items()) {
        if (!value.is_object()) {
            spdlog::warn("Ignoring usage record for {}: not an object", id);
            continue;
        }
        auto slot = std::make_shared<Slot>();
        slot->record.usageCount = value.value("usageCount", uint64_t{0});
        slot->record.firstSeenTs = value.value("firstSeenTs", std::string{});
        slot->record.lastUsedAt = value.value("lastUsedAt", std::string{});
        loaded.emplace(id, std::move(slot));
    }

    std::unique_lock<std::shared_mutex> lock(slotsMutex_);
    slots_ = std::move(loaded);
    spdlog::debug("Loaded {} usage records from {}", slots_.size(), config_.snapshotPath.string());
    return {};
}

TrackOutcome UsageTracker::increment(std::string_view id) {
    TrackOutcome out;
    out.id = std::string(id);

    const auto now = config_.clock->now();
    const int64_t bucket = toEpochMillis(now) / config_.window.count();

    // A slot forgotten meanwhile absorbs this increment and is never flushed
    const auto slot = slotFor(id);
    bool firstUse = false;
    {
        std::lock_guard<std::mutex> lock(slot->mutex);
        if (slot->bucket != bucket) {
            slot->bucket = bucket;
            slot->bucketCount = 0;
        }
        if (slot->bucketCount >= config_.perWindow) {
            rateLimited_.fetch_add(1);
            out.rateLimited = true;
            out.record = slot->record;
            return out;
        }
        ++slot->bucketCount;

        const auto nowIso = toIso8601(now);
        ++slot->record.usageCount;
        if (slot->record.firstSeenTs.empty()) {
            slot->record.firstSeenTs = nowIso;
        }
        slot->record.lastUsedAt = nowIso;
        firstUse = slot->record.usageCount == 1;
        out.record = slot->record;
    }
    increments_.fetch_add(1);
    dirty_.store(true);

    // The first use is persisted right away so firstSeenTs survives a crash
    if (firstUse || !executor_) {
        if (auto r = flush(); !r) {
            spdlog::warn("Usage flush failed: {}", r.error().message);
        }
    } else {
        scheduleFlush();
    }
    return out;
}

std::optional<UsageRecord> UsageTracker::get(std::string_view id) const {
    std::shared_lock<std::shared_mutex> lock(slotsMutex_);
    auto it = slots_.find(std::string(id));
    if (it == slots_.end()) {
        return std::nullopt;
    }
    std::lock_guard<std::mutex> slotLock(it->second->mutex);
    return it->second->record;
}

std::vector<std::pair<std::string, UsageRecord>> UsageTracker::hotset(std::size_t limit) const {
    std::vector<std::pair<std::string, UsageRecord>> items;
    {
        std::shared_lock<std::shared_mutex> lock(slotsMutex_);
        items.reserve(slots_.size());
        for (const auto& [id, slot] : slots_) {
            std::lock_guard<std::mutex> slotLock(slot->mutex);
            if (slot->record.usageCount > 0) {
                items.emplace_back(id, slot->record);
            }
        }
    }
    std::sort(items.begin(), items.end(), [](const auto& a, const auto& b) {
        if (a.second.usageCount != b.second.usageCount) {
            return a.second.usageCount > b.second.usageCount;
        }
        if (a.second.lastUsedAt != b.second.lastUsedAt) {
            return a.second.lastUsedAt > b.second.lastUsedAt;
        }
        return a.first < b.first;
    });
    if (items.size() > limit) {
        items.resize(limit);
    }
    return items;
}

void UsageTracker::forget(std::string_view id) {
    std::unique_lock<std::shared_mutex> lock(slotsMutex_);
    if (slots_.erase(std::string(id)) > 0) {
        dirty_.store(true);
    }
}

void UsageTracker::scheduleFlush() {
    std::lock_guard<std::mutex> lock(timerMutex_);
    if (timerArmed_ || !timer_) {
        return;
    }
    timerArmed_ = true;
    timer_->expires_after(config_.flushDebounce);
    timer_->async_wait([this, liveness = liveness_](const boost::system::error_code& ec) {
        if (ec == boost::asio::error::operation_aborted) {
            return;
        }
        std::lock_guard<std::mutex> aliveLock(liveness->mutex);
        if (!liveness->alive) {
            return;
        }
        {
            std::lock_guard<std::mutex> timerLock(timerMutex_);
            timerArmed_ = false;
        }
        if (auto r = flush(); !r) {
            spdlog::warn("Debounced usage flush failed: {}", r.error().message);
        }
    });
}

Result<void> UsageTracker::flush() {
    std::lock_guard<std::mutex> lock(flushMutex_);
    return flushLocked();
}

Result<void> UsageTracker::flushLocked() {
    if (config_.snapshotPath.empty()) {
        dirty_.store(false);
        return {};
    }
    // Clear before serializing so a concurrent increment re-marks the tracker
    dirty_.store(false);

    json doc = json::object();
    {
        std::shared_lock<std::shared_mutex> lock(slotsMutex_);
        for (const auto& [id, slot] : slots_) {
            std::lock_guard<std::mutex> slotLock(slot->mutex);
            json rec = {{"usageCount", slot->record.usageCount}};
            if (!slot->record.firstSeenTs.empty()) {
                rec["firstSeenTs"] = slot->record.firstSeenTs;
            }
            if (!slot->record.lastUsedAt.empty()) {
                rec["lastUsedAt"] = slot->record.lastUsedAt;
            }
            doc[id] = std::move(rec);
        }
    }

    auto result = writer_.write(config_.snapshotPath, doc.dump(2));
    if (!result) {
        dirty_.store(true);
        flushFailures_.fetch_add(1);
        return result;
    }
    flushes_.fetch_add(1);
    spdlog::trace("Usage snapshot flushed ({} records)", doc.size());
    return {};
}

UsageStats UsageTracker::stats() const {
    return UsageStats{increments_.load(), rateLimited_.load(), flushes_.load(),
                      flushFailures_.load()};
}

} // namespace govcat::catalog
