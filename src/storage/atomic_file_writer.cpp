#include <govcat/core/format.h>
#include <govcat/storage/atomic_file_writer.h>

#include <spdlog/spdlog.h>

#include <chrono>
#include <fstream>
#include <random>
#include <thread>

namespace govcat::storage {

std::filesystem::path
AtomicFileWriter::generateTempName(const std::filesystem::path& target) const {
    auto timestamp = std::chrono::system_clock::now().time_since_epoch().count();
    static thread_local std::mt19937 gen{std::random_device{}()};
    std::uniform_int_distribution<> dist(1000, 9999);
    return target.parent_path() /
           govcat::format(".{}.{}.{}.tmp", target.filename().string(), timestamp, dist(gen));
}

bool AtomicFileWriter::isTempName(const std::filesystem::path& path) {
    const auto name = path.filename().string();
    return name.size() > 5 && name.front() == '.' && name.ends_with(".tmp");
}

Result<void> AtomicFileWriter::writeImpl(const std::filesystem::path& path,
                                         std::span<const std::byte> data) {
    std::error_code ec;
    if (auto parent = path.parent_path(); !parent.empty()) {
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            spdlog::error("Failed to create directory {}: {}", parent.string(), ec.message());
            return Error{ErrorCode::WriteError, "create_directories failed: " + ec.message()};
        }
    }

    auto tempPath = generateTempName(path);

    struct TempFileGuard {
        std::filesystem::path path;
        bool success = false;

        ~TempFileGuard() {
            if (!success) {
                std::error_code removeError;
                std::filesystem::remove(path, removeError);
            }
        }
    } guard{.path = tempPath};

    {
        std::ofstream file(tempPath, std::ios::binary | std::ios::trunc);
        if (!file) {
            spdlog::error("Failed to create temp file: {}", tempPath.string());
            return Error{ErrorCode::WriteError, "cannot open temp file " + tempPath.string()};
        }
        file.write(reinterpret_cast<const char*>(data.data()),
                   static_cast<std::streamsize>(data.size()));
        file.flush();
        if (!file) {
            spdlog::error("Short write to temp file: {}", tempPath.string());
            return Error{ErrorCode::WriteError, "write failed for " + tempPath.string()};
        }
    }

    // Rename can transiently fail on some filesystems while a reader holds the target
    constexpr int kMaxAttempts = 3;
    for (int attempt = 1; attempt <= kMaxAttempts; ++attempt) {
        std::filesystem::rename(tempPath, path, ec);
        if (!ec) {
            guard.success = true;
            return {};
        }
        if (attempt < kMaxAttempts) {
            std::this_thread::sleep_for(std::chrono::milliseconds(5 * attempt));
        }
    }

    spdlog::error("Failed to rename {} to {}: {}", tempPath.string(), path.string(), ec.message());
    return Error{ErrorCode::WriteError, "rename failed: " + ec.message()};
}

} // namespace govcat::storage
