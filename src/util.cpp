#include "util.hpp"

#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <stdexcept>

namespace stock_control {

namespace {

using std::chrono::duration_cast;
using std::chrono::floor;
using std::chrono::microseconds;
using std::chrono::nanoseconds;
using std::chrono::seconds;

struct CivilDate {
    long long year;
    unsigned  month;
    unsigned  day;
};

// Days since 1970-01-01 for a proleptic Gregorian date.
long long daysFromCivil(long long y, unsigned m, unsigned d) {
    y -= (m <= 2) ? 1 : 0;
    const long long era = (y >= 0 ? y : y - 399) / 400;
    const long long yoe = y - era * 400;
    const long long doy = (153 * (m > 2 ? m - 3 : m + 9) + 2) / 5 + d - 1;
    const long long doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + doe - 719468;
}

CivilDate civilFromDays(long long z) {
    z += 719468;
    const long long era = (z >= 0 ? z : z - 146096) / 146097;
    const long long doe = z - era * 146097;
    const long long yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const long long doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const long long mp  = (5 * doy + 2) / 153;
    const unsigned  d   = static_cast<unsigned>(doy - (153 * mp + 2) / 5 + 1);
    const unsigned  m   = static_cast<unsigned>(mp < 10 ? mp + 3 : mp - 9);
    return {yoe + era * 400 + (m <= 2 ? 1 : 0), m, d};
}

bool isLeapYear(long long y) {
    return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
}

unsigned daysInMonth(long long y, unsigned m) {
    static const unsigned kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    return (m == 2 && isLeapYear(y)) ? 29 : kDays[m - 1];
}

int readDigits(const std::string& text, std::size_t pos, std::size_t count) {
    int value = 0;
    for (std::size_t i = pos; i < pos + count; ++i) {
        if (!std::isdigit(static_cast<unsigned char>(text[i]))) {
            throw std::invalid_argument("Invalid date-time: " + text);
        }
        value = value * 10 + (text[i] - '0');
    }
    return value;
}

// Parse the fixed "YYYY-MM-DDTHH:MM:SS" prefix into seconds since the epoch.
seconds parseDateTimePrefix(const std::string& text) {
    if (text.size() < 19 || text[4] != '-' || text[7] != '-' || text[10] != 'T'
        || text[13] != ':' || text[16] != ':') {
        throw std::invalid_argument("Invalid date-time: " + text);
    }

    const int year   = readDigits(text, 0, 4);
    const int month  = readDigits(text, 5, 2);
    const int day    = readDigits(text, 8, 2);
    const int hour   = readDigits(text, 11, 2);
    const int minute = readDigits(text, 14, 2);
    const int second = readDigits(text, 17, 2);

    if (month < 1 || month > 12
        || day < 1 || static_cast<unsigned>(day) > daysInMonth(year, month)
        || hour > 23 || minute > 59 || second > 59) {
        throw std::invalid_argument("Date-time out of range: " + text);
    }

    const long long days = daysFromCivil(year, static_cast<unsigned>(month),
                                         static_cast<unsigned>(day));
    return seconds(days * 86400 + hour * 3600 + minute * 60 + second);
}

// Clock::duration is nanoseconds on some platforms, which only spans the
// years 1677 to 2262.
bool isRepresentable(seconds s) {
    return s >= duration_cast<seconds>(Clock::duration::min())
        && s < duration_cast<seconds>(Clock::duration::max());
}

struct Broken {
    CivilDate date;
    int       hour;
    int       minute;
    int       second;
    long long micros;
};

Broken breakDown(Timestamp ts) {
    const auto since   = ts.time_since_epoch();
    const auto wholeS  = floor<seconds>(since);
    const auto micros  = duration_cast<microseconds>(since - wholeS).count();
    const long long s  = wholeS.count();
    const long long days = (s >= 0 ? s : s - 86399) / 86400;
    const long long rem  = s - days * 86400;

    Broken b;
    b.date   = civilFromDays(days);
    b.hour   = static_cast<int>(rem / 3600);
    b.minute = static_cast<int>((rem % 3600) / 60);
    b.second = static_cast<int>(rem % 60);
    b.micros = micros;
    return b;
}

} // namespace

Timestamp nowUtc() {
    const auto micros = floor<microseconds>(Clock::now().time_since_epoch());
    return Timestamp(duration_cast<Clock::duration>(micros));
}

std::string formatTimestamp(Timestamp ts) {
    const Broken b = breakDown(ts);
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%04lld-%02u-%02uT%02d:%02d:%02d.%06lldZ",
                  b.date.year, b.date.month, b.date.day,
                  b.hour, b.minute, b.second, b.micros);
    return buf;
}

std::string formatDisplayTimestamp(Timestamp ts) {
    const Broken b = breakDown(ts);
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%04lld-%02u-%02u %02d:%02d:%02d",
                  b.date.year, b.date.month, b.date.day,
                  b.hour, b.minute, b.second);
    return buf;
}

Timestamp parseTimestamp(const std::string& text) {
    const seconds base = parseDateTimePrefix(text);
    if (!isRepresentable(base)) {
        throw std::invalid_argument("Timestamp outside the supported range: " + text);
    }

    std::size_t pos = 19;
    microseconds fraction{0};

    if (pos < text.size() && text[pos] == '.') {
        ++pos;
        const std::size_t digitsStart = pos;
        long long nanos = 0;
        while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
            if (pos - digitsStart >= 9) {
                throw std::invalid_argument("Too many fractional digits: " + text);
            }
            nanos = nanos * 10 + (text[pos] - '0');
            ++pos;
        }
        const std::size_t digits = pos - digitsStart;
        if (digits == 0) {
            throw std::invalid_argument("Empty fractional seconds: " + text);
        }
        for (std::size_t i = digits; i < 9; ++i) {
            nanos *= 10;
        }
        // Digits past microseconds are dropped, matching formatTimestamp.
        fraction = floor<microseconds>(nanoseconds(nanos));
    }

    const std::string zone = text.substr(pos);
    if (zone != "Z" && zone != "+00:00") {
        throw std::invalid_argument("Timestamp must be UTC: " + text);
    }

    return Timestamp(duration_cast<Clock::duration>(base) +
                     duration_cast<Clock::duration>(fraction));
}

Timestamp parseDateTime(const std::string& text) {
    const std::string formatError =
        "Invalid datetime '" + text + "': expected format YYYY-MM-DDTHH:MM:SS";
    if (text.size() != 19) {
        throw std::invalid_argument(formatError);
    }

    seconds base{0};
    try {
        base = parseDateTimePrefix(text);
    } catch (const std::invalid_argument&) {
        throw std::invalid_argument(formatError);
    }
    if (!isRepresentable(base)) {
        throw std::invalid_argument("Invalid datetime '" + text
                                    + "': outside the supported range");
    }
    return Timestamp(duration_cast<Clock::duration>(base));
}

std::string generateId() {
    static thread_local boost::uuids::random_generator gen;
    return boost::uuids::to_string(gen());
}

bool isBlank(const std::string& s) {
    return std::all_of(s.begin(), s.end(), [](unsigned char c) {
        return std::isspace(c) != 0;
    });
}

} // namespace stock_control
