#pragma once

#include <nlohmann/json.hpp>
#include <atomic>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include <govcat/catalog/entry.h>
#include <govcat/core/clock.h>
#include <govcat/core/types.h>
#include <govcat/storage/atomic_file_writer.h>

namespace govcat::storage {

using json = nlohmann::json;

struct ContentStoreConfig {
    std::filesystem::path baseDir;
    std::shared_ptr<IClock> clock;
};

struct LoadIssue {
    std::string file;
    std::string message;
};

struct LoadedCatalog {
    std::vector<catalog::Entry> entries; // sorted by id
    Hash aggregateHash;
    std::vector<LoadIssue> issues;
    std::size_t filesScanned = 0;
};

struct StoreStats {
    uint64_t writes = 0;
    uint64_t removes = 0;
    uint64_t failedWrites = 0;
    uint64_t loads = 0;
};

// Durable per-entry documents keyed by id
class IContentStore {
public:
    virtual ~IContentStore() = default;

    virtual Result<void> save(const catalog::Entry& entry) = 0;
    // true when a document was deleted, false when none existed
    virtual Result<bool> remove(std::string_view id) = 0;
    // Corrupt documents are reported in issues and skipped
    virtual Result<LoadedCatalog> load() const = 0;
    // The stored JSON exactly as on disk
    virtual Result<json> readRaw(std::string_view id) const = 0;
    virtual bool exists(std::string_view id) const = 0;

    virtual std::filesystem::path root() const = 0;
    virtual StoreStats stats() const = 0;
};

class FileContentStore : public IContentStore {
public:
    explicit FileContentStore(ContentStoreConfig config);
    ~FileContentStore() override;

    FileContentStore(const FileContentStore&) = delete;
    FileContentStore& operator=(const FileContentStore&) = delete;

    Result<void> save(const catalog::Entry& entry) override;
    Result<bool> remove(std::string_view id) override;
    Result<LoadedCatalog> load() const override;
    Result<json> readRaw(std::string_view id) const override;
    bool exists(std::string_view id) const override;

    std::filesystem::path root() const override { return config_.baseDir; }
    StoreStats stats() const override;

    // Remove stale temp files left by an interrupted write
    Result<std::size_t> cleanupTempFiles();

private:
    [[nodiscard]] std::filesystem::path documentPath(std::string_view id) const;

    ContentStoreConfig config_;
    AtomicFileWriter writer_;

    mutable std::atomic<uint64_t> writes_{0};
    mutable std::atomic<uint64_t> removes_{0};
    mutable std::atomic<uint64_t> failedWrites_{0};
    mutable std::atomic<uint64_t> loads_{0};
};

// sha256 over "id:sourceHash" pairs sorted by id and joined with '|'
Hash computeAggregateHash(std::vector<std::pair<std::string, std::string>> idHashPairs);

} // namespace govcat::storage
