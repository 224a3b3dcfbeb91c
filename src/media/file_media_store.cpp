#include "media/file_media_store.hpp"

#include <sodium.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <fstream>
#include <system_error>

namespace studysync::media {

namespace {

constexpr std::array<std::string_view, 7> kImageExtensions = {
    "jpg", "jpeg", "png", "gif", "webp", "bmp", "svg"};
constexpr std::array<std::string_view, 7> kAudioExtensions = {
    "mp3", "wav", "m4a", "ogg", "flac", "aac", "opus"};

std::string lowercase(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return out;
}

template<size_t N>
bool contains(const std::array<std::string_view, N>& list, const std::string& ext) {
    return std::find(list.begin(), list.end(), ext) != list.end();
}

} // namespace

Result<FileMediaStore, Error> FileMediaStore::open(std::filesystem::path root) {
    if (sodium_init() < 0) {
        return Result<FileMediaStore, Error>::err(Error{"Failed to initialize libsodium"});
    }
    return Result<FileMediaStore, Error>::ok(FileMediaStore(std::move(root)));
}

bool FileMediaStore::is_supported(std::string_view extension) {
    const auto ext = lowercase(extension);
    return contains(kImageExtensions, ext) || contains(kAudioExtensions, ext);
}

bool FileMediaStore::is_audio(std::string_view extension) {
    return contains(kAudioExtensions, lowercase(extension));
}

std::string FileMediaStore::build_reference(const std::string& relative_path) {
    return std::string(kMediaScheme) + std::string(kMediaHost) + "/" + relative_path;
}

std::string FileMediaStore::sha256_hex(std::span<const uint8_t> bytes) {
    std::array<unsigned char, crypto_hash_sha256_BYTES> digest{};
    crypto_hash_sha256(digest.data(), bytes.data(), bytes.size());

    std::array<char, crypto_hash_sha256_BYTES * 2 + 1> hex{};
    sodium_bin2hex(hex.data(), hex.size(), digest.data(), digest.size());
    return std::string(hex.data());
}

Result<StoredMedia, Error> FileMediaStore::store(std::span<const uint8_t> bytes,
                                                 const std::string& extension) {
    const auto ext = lowercase(extension);
    if (!is_supported(ext)) {
        return Result<StoredMedia, Error>::err(
            Error::validation("Unsupported media type: " + extension));
    }

    const auto hash = sha256_hex(bytes);
    const auto shard = hash.substr(0, 2);
    const auto relative = shard + "/" + hash + "." + ext;
    const auto dest = root_ / shard / (hash + "." + ext);

    StoredMedia stored{
        .reference = build_reference(relative),
        .hash = hash,
        .format = ext,
        .relative_path = relative,
        .size_bytes = static_cast<int64_t>(bytes.size())
    };

    std::error_code ec;
    if (std::filesystem::exists(dest, ec)) {
        return Result<StoredMedia, Error>::ok(std::move(stored));
    }

    std::filesystem::create_directories(dest.parent_path(), ec);
    if (ec) {
        return Result<StoredMedia, Error>::err(
            Error{"Failed to create media directory: " + ec.message(), ec.value()});
    }

    // Written under a temporary name, then renamed into place.
    auto temp = dest;
    temp += ".part";
    {
        std::ofstream out(temp, std::ios::binary | std::ios::trunc);
        if (!out) {
            return Result<StoredMedia, Error>::err(Error{"Failed to open " + temp.string()});
        }
        out.write(reinterpret_cast<const char*>(bytes.data()),
                  static_cast<std::streamsize>(bytes.size()));
        if (!out) {
            return Result<StoredMedia, Error>::err(Error{"Failed to write " + temp.string()});
        }
    }
    std::filesystem::rename(temp, dest, ec);
    if (ec) {
        return Result<StoredMedia, Error>::err(
            Error{"Failed to move media into place: " + ec.message(), ec.value()});
    }

    return Result<StoredMedia, Error>::ok(std::move(stored));
}

std::optional<std::filesystem::path> FileMediaStore::resolve(const std::string& reference) const {
    const std::string_view ref(reference);
    if (ref.starts_with(kMediaScheme)) {
        auto rest = ref.substr(kMediaScheme.size());
        const auto slash = rest.find('/');
        if (slash == std::string_view::npos || rest.substr(0, slash) != kMediaHost) {
            return std::nullopt;
        }
        auto relative = rest.substr(slash + 1);
        if (relative.empty() || relative.find("..") != std::string_view::npos) {
            return std::nullopt;
        }
        return root_ / std::filesystem::path(std::string(relative));
    }

    constexpr std::string_view kFileScheme = "file://";
    if (ref.starts_with(kFileScheme)) {
        return std::filesystem::path(std::string(ref.substr(kFileScheme.size())));
    }

    if (ref.find("://") != std::string_view::npos || ref.empty()) {
        return std::nullopt;
    }
    return std::filesystem::path(reference);
}

} // namespace studysync::media
