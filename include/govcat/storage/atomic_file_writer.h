#pragma once

#include <filesystem>
#include <span>
#include <string_view>
#include <govcat/core/types.h>

namespace govcat::storage {

// Write-to-temp then rename in the same directory; readers never observe a partial file
class AtomicFileWriter {
public:
    AtomicFileWriter() = default;

    [[nodiscard]] Result<void> write(const std::filesystem::path& path, std::string_view text) {
        return writeImpl(path, std::as_bytes(std::span(text.data(), text.size())));
    }

    [[nodiscard]] Result<void> write(const std::filesystem::path& path,
                                     std::span<const std::byte> data) {
        return writeImpl(path, data);
    }

    // Temp files look like .<name>.<stamp>.<rand>.tmp
    static bool isTempName(const std::filesystem::path& path);

private:
    Result<void> writeImpl(const std::filesystem::path& path, std::span<const std::byte> data);

    [[nodiscard]] std::filesystem::path generateTempName(const std::filesystem::path& target) const;
};

} // namespace govcat::storage
