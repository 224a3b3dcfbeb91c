#pragma once

#include "core/result.hpp"
#include <cstdint>
#include <filesystem>
#include <optional>
#include <span>
#include <string>

namespace studysync::media {

/**
 * StoredMedia - where a blob ended up.
 */
struct StoredMedia {
    std::string reference;      // studysync://media/ab/<hash>.<ext>
    std::string hash;           // lowercase hex SHA-256
    std::string format;         // lowercase extension
    std::string relative_path;  // ab/<hash>.<ext>
    int64_t size_bytes{0};
};

/**
 * MediaStore - content-addressed blob storage used by card text.
 */
class MediaStore {
public:
    virtual ~MediaStore() = default;

    [[nodiscard]] virtual Result<StoredMedia, Error> store(
        std::span<const uint8_t> bytes, const std::string& extension) = 0;

    /**
     * Map a media reference to a local file path, or none if the reference
     * is not understood.
     */
    [[nodiscard]] virtual std::optional<std::filesystem::path> resolve(
        const std::string& reference) const = 0;
};

} // namespace studysync::media
