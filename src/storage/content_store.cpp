#include <govcat/core/format.h>
#include <govcat/crypto/hasher.h>
#include <govcat/storage/content_store.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <fstream>
#include <sstream>

namespace govcat::storage {

namespace {

Result<std::string> readFile(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return Error{ErrorCode::NotFound, "cannot open " + path.string()};
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    if (in.bad()) {
        return Error{ErrorCode::CorruptedData, "read failed for " + path.string()};
    }
    return ss.str();
}

} // namespace

FileContentStore::FileContentStore(ContentStoreConfig config) : config_(std::move(config)) {
    if (!config_.clock) {
        config_.clock = systemClock();
    }
    std::error_code ec;
    std::filesystem::create_directories(config_.baseDir, ec);
    if (ec) {
        spdlog::warn("Could not create content directory {}: {}", config_.baseDir.string(),
                     ec.message());
    }
}

FileContentStore::~FileContentStore() = default;

std::filesystem::path FileContentStore::documentPath(std::string_view id) const {
    return config_.baseDir / (std::string(id) + ".json");
}

Result<void> FileContentStore::save(const catalog::Entry& entry) {
    if (!catalog::isValidEntryId(entry.id)) {
        return Error{ErrorCode::InvalidArgument, "invalid entry id: " + entry.id};
    }
    std::string payload;
    try {
        payload = catalog::toJson(entry).dump(2);
    } catch (const json::exception& e) {
        failedWrites_.fetch_add(1);
        return Error{ErrorCode::InvalidData, std::string("serialization failed: ") + e.what()};
    }
    payload.push_back('\n');

    auto result = writer_.write(documentPath(entry.id), payload);
    if (!result) {
        failedWrites_.fetch_add(1);
        spdlog::error("Failed to save entry {}: {}", entry.id, result.error().message);
        return Error{ErrorCode::WriteError, result.error().message};
    }
    writes_.fetch_add(1);
    spdlog::debug("Saved entry {} ({} bytes)", entry.id, payload.size());
    return {};
}

Result<bool> FileContentStore::remove(std::string_view id) {
    if (!catalog::isValidEntryId(id)) {
        return Error{ErrorCode::InvalidArgument, "invalid entry id: " + std::string(id)};
    }
    std::error_code ec;
    bool removed = std::filesystem::remove(documentPath(id), ec);
    if (ec) {
        spdlog::error("Failed to remove entry {}: {}", id, ec.message());
        return Error{ErrorCode::WriteError, "remove failed: " + ec.message()};
    }
    if (removed) {
        removes_.fetch_add(1);
    }
    return removed;
}

Result<LoadedCatalog> FileContentStore::load() const {
    loads_.fetch_add(1);
    LoadedCatalog out;

    std::error_code ec;
    if (!std::filesystem::exists(config_.baseDir, ec)) {
        out.aggregateHash = computeAggregateHash({});
        return out;
    }

    std::vector<std::filesystem::path> files;
    for (std::filesystem::directory_iterator it(config_.baseDir, ec), end; !ec && it != end;
         it.increment(ec)) {
        const auto& p = it->path();
        std::error_code typeEc;
        if (!it->is_regular_file(typeEc) || p.extension() != ".json" ||
            AtomicFileWriter::isTempName(p)) {
            continue;
        }
        files.push_back(p);
    }
    if (ec) {
        return Error{ErrorCode::PermissionDenied,
                     "cannot enumerate " + config_.baseDir.string() + ": " + ec.message()};
    }
    std::sort(files.begin(), files.end());

    const auto nowIso = toIso8601(config_.clock->now());
    std::vector<std::pair<std::string, std::string>> pairs;
    pairs.reserve(files.size());

    for (const auto& file : files) {
        ++out.filesScanned;
        auto skip = [&](std::string message) {
            spdlog::warn("Skipping catalog document {}: {}", file.filename().string(), message);
            out.issues.push_back({file.filename().string(), std::move(message)});
        };

        auto text = readFile(file);
        if (!text) {
            skip(text.error().message);
            continue;
        }
        json doc;
        try {
            doc = json::parse(text.value());
        } catch (const json::parse_error& e) {
            skip(govcat::format("parse error at byte {}", e.byte));
            continue;
        }
        auto decoded = catalog::entryFromJson(doc);
        if (!decoded) {
            skip(decoded.error().message);
            continue;
        }
        auto entry = std::move(decoded).value();
        if (entry.id != file.stem().string()) {
            skip(govcat::format("id '{}' does not match file name", entry.id));
            continue;
        }
        if (auto valid = catalog::validateStoredEntry(entry); !valid) {
            skip(valid.error().message);
            continue;
        }
        if (entry.sourceHash.empty()) {
            entry.sourceHash = catalog::computeSourceHash(entry.body);
        }
        if (entry.createdAt.empty()) {
            entry.createdAt = nowIso;
        }
        if (entry.updatedAt.empty()) {
            entry.updatedAt = entry.createdAt;
        }
        pairs.emplace_back(entry.id, entry.sourceHash);
        out.entries.push_back(std::move(entry));
    }

    out.aggregateHash = computeAggregateHash(std::move(pairs));
    spdlog::debug("Loaded {} entries from {} ({} skipped)", out.entries.size(),
                  config_.baseDir.string(), out.issues.size());
    return out;
}

Result<json> FileContentStore::readRaw(std::string_view id) const {
    auto text = readFile(documentPath(id));
    if (!text) {
        return text.error();
    }
    try {
        return json::parse(text.value());
    } catch (const json::parse_error& e) {
        return Error{ErrorCode::CorruptedData,
                     govcat::format("{}.json: parse error at byte {}", id, e.byte)};
    }
}

bool FileContentStore::exists(std::string_view id) const {
    std::error_code ec;
    return catalog::isValidEntryId(id) && std::filesystem::exists(documentPath(id), ec);
}

StoreStats FileContentStore::stats() const {
    return StoreStats{writes_.load(), removes_.load(), failedWrites_.load(), loads_.load()};
}

Result<std::size_t> FileContentStore::cleanupTempFiles() {
    std::size_t cleaned = 0;
    std::error_code ec;
    for (std::filesystem::directory_iterator it(config_.baseDir, ec), end; !ec && it != end;
         it.increment(ec)) {
        if (AtomicFileWriter::isTempName(it->path())) {
            std::error_code rmEc;
            if (std::filesystem::remove(it->path(), rmEc)) {
                ++cleaned;
            }
        }
    }
    if (ec) {
        return Error{ErrorCode::PermissionDenied, ec.message()};
    }
    if (cleaned) {
        spdlog::info("Cleaned up {} temporary files in {}", cleaned, config_.baseDir.string());
    }
    return cleaned;
}

Hash computeAggregateHash(std::vector<std::pair<std::string, std::string>> idHashPairs) {
    std::sort(idHashPairs.begin(), idHashPairs.end());
    crypto::SHA256Hasher hasher;
    bool first = true;
    for (const auto& [id, hash] : idHashPairs) {
        if (!first) {
            hasher.update(std::string_view{"|"});
        }
        first = false;
        hasher.update(std::string_view{id});
        hasher.update(std::string_view{":"});
        hasher.update(std::string_view{hash});
    }
    return hasher.finalize();
}

} // namespace govcat::storage
