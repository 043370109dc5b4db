#pragma once

#include <memory>
#include <span>
#include <string>
#include <string_view>

namespace govcat::crypto {

// Streaming content digest producing lowercase hex
class IContentHasher {
public:
    virtual ~IContentHasher() = default;

    virtual void init() = 0;
    virtual void update(std::span<const std::byte> data) = 0;
    virtual std::string finalize() = 0;

    void update(std::string_view text) { update(std::as_bytes(std::span(text.data(), text.size()))); }
};

class SHA256Hasher : public IContentHasher {
public:
    SHA256Hasher();
    ~SHA256Hasher() override;

    SHA256Hasher(const SHA256Hasher&) = delete;
    SHA256Hasher& operator=(const SHA256Hasher&) = delete;
    SHA256Hasher(SHA256Hasher&&) noexcept;
    SHA256Hasher& operator=(SHA256Hasher&&) noexcept;

    using IContentHasher::update;

    void init() override;
    void update(std::span<const std::byte> data) override;
    std::string finalize() override;

    static std::string hash(std::span<const std::byte> data);

private:
    struct Impl;
    std::unique_ptr<Impl> pImpl;
};

// sha256 of UTF-8 text, hex encoded
std::string sha256Hex(std::string_view text);

} // namespace govcat::crypto
