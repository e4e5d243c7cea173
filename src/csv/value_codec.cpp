// EN: Implementation of the scalar parsers and formatters used by ValueCodec
// FR: Implémentation des parseurs et formateurs scalaires utilisés par ValueCodec

#include "csv/value_codec.hpp"
#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdio>

namespace CSVS {
namespace CSV {

namespace {

[[noreturn]] void failConversion(const std::string& text, FieldKind kind) {
    throw UnsupportedValueError("cannot convert '" + text + "' to " + fieldKindToString(kind));
}

// EN: from_chars rejects a leading '+', strip one so "+5" reads like "5"
// FR: from_chars refuse un '+' initial, on en retire un pour que "+5" se lise comme "5"
const char* skipPlusSign(const std::string& text) {
    const char* begin = text.data();
    if (text.size() > 1 && text[0] == '+' && text[1] != '-') {
        ++begin;
    }
    return begin;
}

bool readDigits(const std::string& text, size_t pos, size_t count, int& out) {
    if (pos + count > text.size()) {
        return false;
    }
    const char* begin = text.data() + pos;
    const char* end = begin + count;
    if (!std::all_of(begin, end, [](char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; })) {
        return false;
    }
    auto [ptr, ec] = std::from_chars(begin, end, out);
    return ec == std::errc() && ptr == end;
}

template<typename Real>
std::string formatReal(Real value) {
    char buffer[64];
    auto [ptr, ec] = std::to_chars(buffer, buffer + sizeof(buffer), value);
    if (ec != std::errc()) {
        return std::to_string(value);
    }
    return std::string(buffer, ptr);
}

template<typename Real>
Real parseReal(const std::string& text) {
    const char* begin = skipPlusSign(text);
    const char* end = text.data() + text.size();
    Real value{};
    auto [ptr, ec] = std::from_chars(begin, end, value);
    if (text.empty() || ec != std::errc() || ptr != end) {
        failConversion(text, FieldKind::REAL);
    }
    return value;
}

} // namespace

std::string fieldKindToString(FieldKind kind) {
    switch (kind) {
        case FieldKind::INTEGER:   return "INTEGER";
        case FieldKind::REAL:      return "REAL";
        case FieldKind::BOOLEAN:   return "BOOLEAN";
        case FieldKind::TEXT:      return "TEXT";
        case FieldKind::DATE:      return "DATE";
        case FieldKind::TIMESTAMP: return "TIMESTAMP";
        case FieldKind::OBJECT:    return "OBJECT";
        default:                   return "UNKNOWN";
    }
}

long long parseSigned(const std::string& text) {
    const char* begin = skipPlusSign(text);
    const char* end = text.data() + text.size();
    long long value = 0;
    auto [ptr, ec] = std::from_chars(begin, end, value);
    if (text.empty() || ec != std::errc() || ptr != end) {
        failConversion(text, FieldKind::INTEGER);
    }
    return value;
}

unsigned long long parseUnsigned(const std::string& text) {
    const char* begin = skipPlusSign(text);
    const char* end = text.data() + text.size();
    unsigned long long value = 0;
    auto [ptr, ec] = std::from_chars(begin, end, value);
    if (text.empty() || ec != std::errc() || ptr != end) {
        failConversion(text, FieldKind::INTEGER);
    }
    return value;
}

double parseDouble(const std::string& text) {
    return parseReal<double>(text);
}

float parseFloat(const std::string& text) {
    return parseReal<float>(text);
}

bool parseBoolean(const std::string& text) {
    std::string lowered = text;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lowered == "true" || lowered == "1" || lowered == "yes") {
        return true;
    }
    if (lowered == "false" || lowered == "0" || lowered == "no") {
        return false;
    }
    failConversion(text, FieldKind::BOOLEAN);
}

// EN: Dates are ISO-8601 calendar dates: YYYY-MM-DD
// FR: Les dates sont des dates calendaires ISO-8601 : AAAA-MM-JJ
std::chrono::year_month_day parseDate(const std::string& text) {
    int year = 0;
    int month = 0;
    int day = 0;
    if (text.size() != 10 || text[4] != '-' || text[7] != '-' ||
        !readDigits(text, 0, 4, year) || !readDigits(text, 5, 2, month) || !readDigits(text, 8, 2, day)) {
        failConversion(text, FieldKind::DATE);
    }

    std::chrono::year_month_day date{std::chrono::year{year},
                                     std::chrono::month{static_cast<unsigned>(month)},
                                     std::chrono::day{static_cast<unsigned>(day)}};
    if (!date.ok()) {
        failConversion(text, FieldKind::DATE);
    }
    return date;
}

// EN: Timestamps are UTC: YYYY-MM-DDTHH:MM:SS, a space may replace the 'T' and a trailing 'Z' is accepted
// FR: Les horodatages sont en UTC : AAAA-MM-JJTHH:MM:SS, un espace peut remplacer le 'T' et un 'Z' final est accepté
std::chrono::sys_seconds parseTimestamp(const std::string& text) {
    if (text.size() < 19 || (text[10] != 'T' && text[10] != ' ') || text[13] != ':' || text[16] != ':') {
        failConversion(text, FieldKind::TIMESTAMP);
    }
    if (text.size() > 20 || (text.size() == 20 && text[19] != 'Z')) {
        failConversion(text, FieldKind::TIMESTAMP);
    }

    std::chrono::year_month_day date;
    try {
        date = parseDate(text.substr(0, 10));
    } catch (const UnsupportedValueError&) {
        failConversion(text, FieldKind::TIMESTAMP);
    }

    int hours = 0;
    int minutes = 0;
    int seconds = 0;
    if (!readDigits(text, 11, 2, hours) || !readDigits(text, 14, 2, minutes) || !readDigits(text, 17, 2, seconds) ||
        hours > 23 || minutes > 59 || seconds > 59) {
        failConversion(text, FieldKind::TIMESTAMP);
    }

    return std::chrono::sys_days{date} + std::chrono::hours{hours} +
           std::chrono::minutes{minutes} + std::chrono::seconds{seconds};
}

std::string formatDouble(double value) {
    return formatReal(value);
}

std::string formatFloat(float value) {
    return formatReal(value);
}

std::string formatBoolean(bool value) {
    return value ? "True" : "False";
}

std::string formatDate(const std::chrono::year_month_day& value) {
    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%04d-%02u-%02u",
                  static_cast<int>(value.year()),
                  static_cast<unsigned>(value.month()),
                  static_cast<unsigned>(value.day()));
    return buffer;
}

std::string formatTimestamp(const std::chrono::sys_seconds& value) {
    auto days = std::chrono::floor<std::chrono::days>(value);
    std::chrono::hh_mm_ss<std::chrono::seconds> time{value - days};

    char buffer[16];
    std::snprintf(buffer, sizeof(buffer), "T%02d:%02d:%02d",
                  static_cast<int>(time.hours().count()),
                  static_cast<int>(time.minutes().count()),
                  static_cast<int>(time.seconds().count()));
    return formatDate(std::chrono::year_month_day{days}) + buffer;
}

} // namespace CSV
} // namespace CSVS
