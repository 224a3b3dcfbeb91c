#pragma once

#include "media/media_store.hpp"
#include <filesystem>
#include <string_view>

namespace studysync::media {

inline constexpr std::string_view kMediaScheme = "studysync://";
inline constexpr std::string_view kMediaHost = "media";

/**
 * FileMediaStore - media blobs on disk, named by their SHA-256.
 *
 * Layout: <root>/<first two hex digits>/<hash>.<ext>. Storing the same
 * bytes twice writes one file.
 */
class FileMediaStore : public MediaStore {
public:
    /**
     * Fails if libsodium cannot be initialized.
     */
    [[nodiscard]] static Result<FileMediaStore, Error> open(std::filesystem::path root);

    [[nodiscard]] Result<StoredMedia, Error> store(
        std::span<const uint8_t> bytes, const std::string& extension) override;

    /**
     * studysync://media/... resolves under the root, file:// URLs and bare
     * paths pass through unchanged, anything else is rejected.
     */
    [[nodiscard]] std::optional<std::filesystem::path> resolve(
        const std::string& reference) const override;

    [[nodiscard]] const std::filesystem::path& root() const noexcept { return root_; }

    [[nodiscard]] static bool is_supported(std::string_view extension);
    [[nodiscard]] static bool is_audio(std::string_view extension);

    [[nodiscard]] static std::string build_reference(const std::string& relative_path);

    /**
     * Lowercase hex SHA-256 of the bytes.
     */
    [[nodiscard]] static std::string sha256_hex(std::span<const uint8_t> bytes);

private:
    explicit FileMediaStore(std::filesystem::path root) : root_(std::move(root)) {}

    std::filesystem::path root_;
};

} // namespace studysync::media
