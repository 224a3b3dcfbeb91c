#include "core/types.hpp"

#include <cctype>
#include <cstdio>

namespace studysync {

static_assert(sizeof(Uuid) == 16, "Uuid should be 16 bytes");
static_assert(std::is_trivially_copyable_v<Uuid>, "Uuid should be trivially copyable");
static_assert(std::is_trivially_copyable_v<Timestamp>, "Timestamp should be trivially copyable");

namespace {

constexpr int64_t kMicrosPerDay = 86'400'000'000;

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

// Days since 1970-01-01 for a proleptic Gregorian date (H. Hinnant).
constexpr int64_t days_from_civil(int64_t y, unsigned m, unsigned d) {
    y -= m <= 2;
    const int64_t era = (y >= 0 ? y : y - 399) / 400;
    const auto yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m > 2 ? m - 3 : m + 9) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<int64_t>(doe) - 719468;
}

struct CivilDate {
    int64_t year;
    unsigned month;
    unsigned day;
};

constexpr CivilDate civil_from_days(int64_t z) {
    z += 719468;
    const int64_t era = (z >= 0 ? z : z - 146096) / 146097;
    const auto doe = static_cast<unsigned>(z - era * 146097);
    const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const int64_t y = static_cast<int64_t>(yoe) + era * 400;
    const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const unsigned mp = (5 * doy + 2) / 153;
    const unsigned d = doy - (153 * mp + 2) / 5 + 1;
    const unsigned m = mp < 10 ? mp + 3 : mp - 9;
    return CivilDate{y + (m <= 2), m, d};
}

static_assert(days_from_civil(1970, 1, 1) == 0);
static_assert(days_from_civil(2000, 3, 1) == 11017);

class Cursor {
public:
    explicit Cursor(std::string_view text) : text_(text) {}

    bool digits(size_t count, int& out) {
        if (pos_ + count > text_.size()) return false;
        int value = 0;
        for (size_t i = 0; i < count; ++i) {
            const char c = text_[pos_ + i];
            if (!std::isdigit(static_cast<unsigned char>(c))) return false;
            value = value * 10 + (c - '0');
        }
        pos_ += count;
        out = value;
        return true;
    }

    bool consume(char c) {
        if (pos_ < text_.size() && text_[pos_] == c) {
            ++pos_;
            return true;
        }
        return false;
    }

    [[nodiscard]] std::optional<char> peek() const {
        if (pos_ < text_.size()) return text_[pos_];
        return std::nullopt;
    }

    [[nodiscard]] bool done() const { return pos_ == text_.size(); }

private:
    std::string_view text_;
    size_t pos_ = 0;
};

} // namespace

std::optional<Uuid> Uuid::parse(std::string_view str) {
    if (str.size() != 36 && str.size() != 32) return std::nullopt;

    Bytes bytes{};
    size_t out = 0;
    for (size_t i = 0; i < str.size();) {
        if (str.size() == 36 && (i == 8 || i == 13 || i == 18 || i == 23)) {
            if (str[i] != '-') return std::nullopt;
            ++i;
            continue;
        }
        if (i + 1 >= str.size() || out >= BYTE_SIZE) return std::nullopt;
        const int hi = hex_value(str[i]);
        const int lo = hex_value(str[i + 1]);
        if (hi < 0 || lo < 0) return std::nullopt;
        bytes[out++] = static_cast<uint8_t>((hi << 4) | lo);
        i += 2;
    }
    if (out != BYTE_SIZE) return std::nullopt;
    return Uuid(bytes);
}

std::string Uuid::to_string() const {
    static constexpr char kHex[] = "0123456789abcdef";
    std::string out;
    out.reserve(36);
    for (size_t i = 0; i < BYTE_SIZE; ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) {
            out.push_back('-');
        }
        out.push_back(kHex[bytes_[i] >> 4]);
        out.push_back(kHex[bytes_[i] & 0x0F]);
    }
    return out;
}

std::optional<Timestamp> Timestamp::from_iso_string(std::string_view text) {
    Cursor c(text);
    int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;

    if (!c.digits(4, year) || !c.consume('-') || !c.digits(2, month) ||
        !c.consume('-') || !c.digits(2, day)) {
        return std::nullopt;
    }
    if (!c.consume('T') && !c.consume(' ')) return std::nullopt;
    if (!c.digits(2, hour) || !c.consume(':') || !c.digits(2, minute) ||
        !c.consume(':') || !c.digits(2, second)) {
        return std::nullopt;
    }
    if (month < 1 || month > 12 || day < 1 || day > 31 ||
        hour > 23 || minute > 59 || second > 60) {
        return std::nullopt;
    }

    int64_t micros = 0;
    if (c.consume('.')) {
        int scale = 100'000;
        int digit = 0;
        bool any = false;
        while (c.digits(1, digit)) {
            micros += digit * scale;
            scale /= 10;
            any = true;
        }
        if (!any) return std::nullopt;
    }

    int64_t offset_minutes = 0;
    if (auto next = c.peek()) {
        if (*next == 'Z' || *next == 'z') {
            c.consume(*next);
        } else if (*next == '+' || *next == '-') {
            const int sign = *next == '-' ? -1 : 1;
            c.consume(*next);
            int oh = 0, om = 0;
            if (!c.digits(2, oh)) return std::nullopt;
            c.consume(':');
            if (!c.done() && !c.digits(2, om)) return std::nullopt;
            offset_minutes = sign * (oh * 60 + om);
        } else {
            return std::nullopt;
        }
    }
    if (!c.done()) return std::nullopt;

    const int64_t days = days_from_civil(year, static_cast<unsigned>(month),
                                         static_cast<unsigned>(day));
    const int64_t total = days * kMicrosPerDay +
                          (static_cast<int64_t>(hour) * 3600 + minute * 60 + second) * 1'000'000 +
                          micros - offset_minutes * 60'000'000;
    return Timestamp::from_micros(total);
}

std::string Timestamp::to_iso_string() const {
    int64_t days = micros_ / kMicrosPerDay;
    int64_t rem = micros_ % kMicrosPerDay;
    if (rem < 0) {
        rem += kMicrosPerDay;
        --days;
    }
    const auto date = civil_from_days(days);
    const auto fraction = static_cast<int>(rem % 1'000'000);
    const auto secs = static_cast<int>(rem / 1'000'000);

    char buf[40];
    if (fraction % 1000 == 0) {
        std::snprintf(buf, sizeof(buf), "%04lld-%02u-%02uT%02d:%02d:%02d.%03dZ",
                      static_cast<long long>(date.year), date.month, date.day,
                      secs / 3600, (secs / 60) % 60, secs % 60, fraction / 1000);
    } else {
        std::snprintf(buf, sizeof(buf), "%04lld-%02u-%02uT%02d:%02d:%02d.%06dZ",
                      static_cast<long long>(date.year), date.month, date.day,
                      secs / 3600, (secs / 60) % 60, secs % 60, fraction);
    }
    return buf;
}

} // namespace studysync
