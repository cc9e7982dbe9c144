#include "bragi/timestamp.h"
#include "bragi/errors.h"
#include <cctype>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace bragi {

namespace {

// Absorbs representation error such as 1.001 * 1000 == 1000.9999999999999
// without ever reaching the next millisecond of a genuine sub-millisecond value.
constexpr double kMillisecondEpsilon = 1e-6;

// Largest millisecond count that converts to int64_t (2^63 - 1024)
constexpr double kMaxMilliseconds = 9223372036854774784.0;

// Reads exactly `count` digits starting at pos (count < 0 = one or more digits)
bool read_digits(const std::string& text, size_t& pos, int count, int64_t& value) {
    size_t start = pos;
    value = 0;
    while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
        if (count >= 0 && static_cast<int>(pos - start) == count) {
            break;
        }
        if (value > (INT64_MAX - 9) / 10) {
            return false;  // Overflow
        }
        value = value * 10 + (text[pos] - '0');
        ++pos;
    }
    size_t read = pos - start;
    if (count < 0) {
        return read > 0;
    }
    return static_cast<int>(read) == count;
}

bool expect(const std::string& text, size_t& pos, char c) {
    if (pos >= text.size() || text[pos] != c) {
        return false;
    }
    ++pos;
    return true;
}

} // anonymous namespace

int64_t TimestampCodec::to_milliseconds(double seconds) {
    if (!(seconds > 0.0)) {
        return 0;  // Negative and NaN clamp to zero
    }
    double ms = std::floor(seconds * 1000.0 + kMillisecondEpsilon);
    if (!(ms <= kMaxMilliseconds)) {
        throw FormatError("Timestamp out of range: " + std::to_string(seconds) + "s");
    }
    return static_cast<int64_t>(ms);
}

std::string TimestampCodec::encode(double seconds) {
    int64_t total_ms = to_milliseconds(seconds);

    int64_t hours = total_ms / 3600000;
    int64_t minutes = (total_ms / 60000) % 60;
    int64_t secs = (total_ms / 1000) % 60;
    int64_t millis = total_ms % 1000;

    std::ostringstream oss;
    oss << std::setfill('0')
        << std::setw(2) << hours << ":"
        << std::setw(2) << minutes << ":"
        << std::setw(2) << secs << ","
        << std::setw(3) << millis;

    return oss.str();
}

double TimestampCodec::decode(const std::string& text) {
    size_t pos = 0;
    int64_t hours = 0, minutes = 0, secs = 0, millis = 0;

    bool ok = read_digits(text, pos, -1, hours) &&
              expect(text, pos, ':') &&
              read_digits(text, pos, 2, minutes) &&
              expect(text, pos, ':') &&
              read_digits(text, pos, 2, secs) &&
              expect(text, pos, ',') &&
              read_digits(text, pos, 3, millis) &&
              pos == text.size();

    if (!ok || hours > INT64_MAX / 3600000) {
        throw FormatError("Malformed timestamp: '" + text + "'");
    }

    // Integer total first: total_ms / 1000.0 is the double closest to the decimal
    int64_t total_ms = hours * 3600000 + minutes * 60000 + secs * 1000 + millis;
    return static_cast<double>(total_ms) / 1000.0;
}

} // namespace bragi
