// EN: Non-template helpers of the CSV serializer drivers
// FR: Utilitaires non template des pilotes du sérialiseur CSV

#include "csv/csv_serializer.hpp"
#include "csv/text_utils.hpp"
#include <algorithm>
#include <unordered_set>

namespace CSVS {
namespace CSV {
namespace detail {

std::vector<std::string> splitLines(const std::string& content) {
    std::vector<std::string> lines;
    if (content.empty()) {
        return lines;
    }

    lines = Text::split(content, '\n');
    if (content.back() == '\n') {
        lines.pop_back();
    }
    for (auto& line : lines) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
    }
    return lines;
}

std::vector<size_t> selectLinesByKeywords(const std::vector<std::string>& lines,
                                          const std::vector<std::string>& keywords) {
    std::vector<std::string> lowered_keywords;
    for (const auto& keyword : keywords) {
        if (!keyword.empty()) {
            lowered_keywords.push_back(Text::toLower(keyword));
        }
    }

    std::vector<size_t> selected;
    std::unordered_set<std::string> seen;
    for (size_t i = 0; i < lines.size(); ++i) {
        std::string lowered_line = Text::toLower(lines[i]);
        bool matches = std::any_of(lowered_keywords.begin(), lowered_keywords.end(),
                                   [&lowered_line](const std::string& keyword) {
                                       return lowered_line.find(keyword) != std::string::npos;
                                   });
        if (matches && seen.insert(lines[i]).second) {
            selected.push_back(i);
        }
    }
    return selected;
}

size_t computeFlushInterval(size_t record_count) {
    if (record_count == 0) {
        return 1;
    }
    size_t interval = record_count / 10;
    return interval > 0 ? interval : record_count;
}

std::vector<std::pair<size_t, size_t>> partitionRanges(size_t count, size_t parts) {
    std::vector<std::pair<size_t, size_t>> ranges;
    if (count == 0) {
        return ranges;
    }
    parts = std::clamp<size_t>(parts, 1, count);

    size_t base = count / parts;
    size_t remainder = count % parts;
    size_t begin = 0;
    for (size_t i = 0; i < parts; ++i) {
        size_t size = base + (i < remainder ? 1 : 0);
        ranges.emplace_back(begin, begin + size);
        begin += size;
    }
    return ranges;
}

std::optional<std::string> readFirstLine(std::istream& stream) {
    std::string line;
    if (!std::getline(stream, line)) {
        return std::nullopt;
    }
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }
    return line;
}

} // namespace detail
} // namespace CSV
} // namespace CSVS
