// EN: Implementation of the HeaderCodec
// FR: Implémentation du HeaderCodec

#include "csv/header_codec.hpp"
#include "csv/text_utils.hpp"
#include <algorithm>
#include <unordered_set>
#include <utility>

namespace CSVS {
namespace CSV {

HeaderCodec::HeaderCodec(char separator, std::string row_number_title, bool use_line_numbers, bool explicit_ordering)
    : separator_(separator),
      row_number_title_(std::move(row_number_title)),
      use_line_numbers_(use_line_numbers),
      explicit_ordering_(explicit_ordering) {}

std::string HeaderCodec::render(const std::vector<std::string>& titles) const {
    std::string header = Text::join(titles, separator_);
    if (use_line_numbers_) {
        header = row_number_title_ + separator_ + header;
    }
    return header;
}

std::vector<std::string> HeaderCodec::normalizeColumns(const std::string& header_line) const {
    std::vector<std::string> columns = Text::split(Text::toUpper(header_line), separator_);
    for (auto& column : columns) {
        column = explicit_ordering_ ? Text::trim(column) : Text::removeSpaces(column);
    }
    return columns;
}

std::string HeaderCodec::diff(const std::string& actual_header, const std::string& expected_header) const {
    return explicit_ordering_ ? orderedDiff(actual_header, expected_header)
                              : unorderedDiff(actual_header, expected_header);
}

// EN: Actual columns lose every space, expected columns are only uppercased. Extra actual columns are tolerated.
// FR: Les colonnes réelles perdent tous leurs espaces, les colonnes attendues sont seulement mises en majuscules.
//     Les colonnes réelles supplémentaires sont tolérées.
std::string HeaderCodec::unorderedDiff(const std::string& actual_header, const std::string& expected_header) const {
    std::vector<std::string> actual = normalizeColumns(actual_header);
    std::vector<std::string> expected = Text::split(Text::toUpper(expected_header), separator_);

    std::vector<std::string> sorted_actual = actual;
    std::vector<std::string> sorted_expected = expected;
    std::sort(sorted_actual.begin(), sorted_actual.end());
    std::sort(sorted_expected.begin(), sorted_expected.end());
    if (sorted_actual == sorted_expected) {
        return std::string();
    }

    std::unordered_set<std::string> actual_set(actual.begin(), actual.end());
    std::unordered_set<std::string> reported;
    std::vector<std::string> missing;
    for (const auto& column : expected) {
        if (actual_set.count(column) == 0 && reported.insert(column).second) {
            missing.push_back(column);
        }
    }
    return Text::join(missing, separator_);
}

std::string HeaderCodec::orderedDiff(const std::string& actual_header, const std::string& expected_header) const {
    std::vector<std::string> actual = normalizeColumns(actual_header);
    std::vector<std::string> expected = Text::split(Text::toUpper(expected_header), separator_);

    std::vector<std::string> mismatched;
    for (size_t i = 0; i < expected.size(); ++i) {
        std::string column = Text::trim(expected[i]);
        if (i >= actual.size() || actual[i] != column) {
            mismatched.push_back(column);
        }
    }
    return Text::join(mismatched, separator_);
}

} // namespace CSV
} // namespace CSVS
