#pragma once

#include <string>
#include <string_view>
#include <chrono>
#include <array>
#include <cstdint>
#include <compare>
#include <optional>
#include <random>

namespace studysync {

/**
 * Uuid - 128-bit record identifier.
 *
 * Generated on the client when a record is created and never reused, so the
 * same value identifies a record locally and on the backend.
 */
class Uuid {
public:
    static constexpr size_t BYTE_SIZE = 16;
    using Bytes = std::array<uint8_t, BYTE_SIZE>;

    constexpr Uuid() noexcept : bytes_{} {}
    explicit constexpr Uuid(Bytes bytes) noexcept : bytes_(bytes) {}

    /**
     * Generate a random (version 4) UUID.
     */
    [[nodiscard]] static Uuid generate() {
        static thread_local std::random_device rd;
        static thread_local std::mt19937_64 gen(rd());
        static thread_local std::uniform_int_distribution<uint64_t> dist;

        Bytes bytes{};
        for (size_t half = 0; half < 2; ++half) {
            uint64_t v = dist(gen);
            for (size_t i = 0; i < 8; ++i) {
                bytes[half * 8 + i] = static_cast<uint8_t>(v >> (i * 8));
            }
        }
        bytes[6] = (bytes[6] & 0x0F) | 0x40;
        bytes[8] = (bytes[8] & 0x3F) | 0x80;
        return Uuid(bytes);
    }

    /**
     * Parse the canonical 36-character form or the bare 32 hex digits.
     * Case-insensitive.
     */
    [[nodiscard]] static std::optional<Uuid> parse(std::string_view str);

    /**
     * Lowercase hyphenated form: xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx
     */
    [[nodiscard]] std::string to_string() const;

    [[nodiscard]] constexpr bool is_nil() const noexcept {
        for (auto b : bytes_) {
            if (b != 0) return false;
        }
        return true;
    }

    [[nodiscard]] constexpr const Bytes& bytes() const noexcept {
        return bytes_;
    }

    auto operator<=>(const Uuid&) const = default;
    bool operator==(const Uuid&) const = default;

private:
    Bytes bytes_;
};

/**
 * Timestamp - UTC instant with microsecond precision.
 *
 * Persisted and exchanged with the backend as ISO-8601 text. The backend
 * stamps rows to the microsecond; the local clock is read to the millisecond.
 */
class Timestamp {
public:
    using Duration = std::chrono::microseconds;
    using Clock = std::chrono::system_clock;
    using TimePoint = std::chrono::time_point<Clock, Duration>;

    constexpr Timestamp() noexcept : micros_(0) {}
    explicit constexpr Timestamp(int64_t millis) noexcept : micros_(millis * 1000) {}

    explicit Timestamp(TimePoint tp) noexcept
        : micros_(tp.time_since_epoch().count()) {}

    [[nodiscard]] static constexpr Timestamp from_micros(int64_t micros) noexcept {
        Timestamp ts;
        ts.micros_ = micros;
        return ts;
    }

    [[nodiscard]] static Timestamp now() {
        const auto ms = std::chrono::time_point_cast<std::chrono::milliseconds>(Clock::now());
        return Timestamp(static_cast<int64_t>(ms.time_since_epoch().count()));
    }

    /**
     * Parse "YYYY-MM-DDTHH:MM:SS[.fraction][Z|+HH:MM|-HH:MM|+HHMM]".
     * A space may replace the 'T'. Fractions beyond microseconds are
     * truncated. A missing zone designator means UTC.
     */
    [[nodiscard]] static std::optional<Timestamp> from_iso_string(std::string_view text);

    // Floors toward the earlier millisecond.
    [[nodiscard]] constexpr int64_t millis() const noexcept {
        return micros_ >= 0 ? micros_ / 1000 : -((-micros_ + 999) / 1000);
    }

    [[nodiscard]] constexpr int64_t micros() const noexcept {
        return micros_;
    }

    [[nodiscard]] TimePoint to_time_point() const noexcept {
        return TimePoint(Duration(micros_));
    }

    /**
     * Format as "YYYY-MM-DDTHH:MM:SS.mmmZ", or with six fraction digits
     * when the instant is not a whole millisecond.
     */
    [[nodiscard]] std::string to_iso_string() const;

    [[nodiscard]] Timestamp plus_days(int64_t days) const noexcept {
        return from_micros(micros_ + days * 86'400'000'000);
    }

    auto operator<=>(const Timestamp&) const = default;
    bool operator==(const Timestamp&) const = default;

    Timestamp operator+(Duration d) const {
        return from_micros(micros_ + d.count());
    }

    Timestamp operator-(Duration d) const {
        return from_micros(micros_ - d.count());
    }

    Duration operator-(const Timestamp& other) const {
        return Duration(micros_ - other.micros_);
    }

private:
    int64_t micros_;
};

} // namespace studysync

namespace std {
    template<>
    struct hash<studysync::Uuid> {
        size_t operator()(const studysync::Uuid& uuid) const noexcept {
            const auto& bytes = uuid.bytes();
            size_t h = 0;
            for (size_t i = 0; i < bytes.size(); i += sizeof(size_t)) {
                size_t chunk = 0;
                for (size_t j = 0; j < sizeof(size_t) && i + j < bytes.size(); ++j) {
                    chunk |= static_cast<size_t>(bytes[i + j]) << (j * 8);
                }
                h ^= chunk + 0x9e3779b9 + (h << 6) + (h >> 2);
            }
            return h;
        }
    };
}
