#pragma once

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/steady_timer.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>
#include <govcat/core/clock.h>
#include <govcat/core/types.h>
#include <govcat/storage/atomic_file_writer.h>

namespace govcat::catalog {

struct UsageRecord {
    uint64_t usageCount = 0;
    std::string firstSeenTs;
    std::string lastUsedAt;
};

struct UsageTrackerConfig {
    std::filesystem::path snapshotPath;
    std::shared_ptr<IClock> clock;
    std::size_t perWindow = 10;
    std::chrono::milliseconds window{1000};
    std::chrono::milliseconds flushDebounce{500};
};

struct TrackOutcome {
    std::string id;
    UsageRecord record;
    bool rateLimited = false;
};

struct UsageStats {
    uint64_t increments = 0;
    uint64_t rateLimited = 0;
    uint64_t flushes = 0;
    uint64_t flushFailures = 0;
};

/**
 * Per-id usage counters with fixed-bucket rate limiting and a debounced
 * snapshot flush. Different ids never contend on the same lock; increments
 * for one id are serialized by that id's slot.
 *
 * Without an executor every dirty marking flushes synchronously.
 */
class UsageTracker {
public:
    explicit UsageTracker(UsageTrackerConfig config,
                          std::optional<boost::asio::any_io_executor> executor = std::nullopt);
    ~UsageTracker();

    UsageTracker(const UsageTracker&) = delete;
    UsageTracker& operator=(const UsageTracker&) = delete;

    // Replace in-memory records with the persisted snapshot; a missing file is empty
    Result<void> loadSnapshot();

    // The caller has already checked that the id exists in the catalog
    TrackOutcome increment(std::string_view id);

    std::optional<UsageRecord> get(std::string_view id) const;

    // usageCount desc, then lastUsedAt desc
    std::vector<std::pair<std::string, UsageRecord>> hotset(std::size_t limit) const;

    Result<void> flush();
    void forget(std::string_view id);

    bool dirty() const { return dirty_.load(); }
    UsageStats stats() const;
    const std::filesystem::path& snapshotPath() const { return config_.snapshotPath; }

private:
    struct Slot {
        mutable std::mutex mutex;
        UsageRecord record;
        int64_t bucket = -1;
        std::size_t bucketCount = 0;
    };

    // Shared so a slot outlives a concurrent forget() or loadSnapshot()
    std::shared_ptr<Slot> slotFor(std::string_view id);
    void scheduleFlush();
    Result<void> flushLocked();

    UsageTrackerConfig config_;
    std::optional<boost::asio::any_io_executor> executor_;
    storage::AtomicFileWriter writer_;

    mutable std::shared_mutex slotsMutex_;
    std::unordered_map<std::string, std::shared_ptr<Slot>> slots_;

    std::mutex flushMutex_;
    std::mutex timerMutex_;
    std::unique_ptr<boost::asio::steady_timer> timer_;
    bool timerArmed_ = false;

    // Cleared by the destructor; a queued debounce completion checks it before flushing
    struct Liveness {
        std::mutex mutex;
        bool alive = true;
    };
    std::shared_ptr<Liveness> liveness_ = std::make_shared<Liveness>();

    std::atomic<bool> dirty_{false};
    std::atomic<uint64_t> increments_{0};
    std::atomic<uint64_t> rateLimited_{0};
    std::atomic<uint64_t> flushes_{0};
    std::atomic<uint64_t> flushFailures_{0};
};

} // namespace govcat::catalog
