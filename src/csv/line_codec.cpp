// EN: Implementation of the non-template parts of the LineCodec
// FR: Implémentation des parties non template du LineCodec

#include "csv/line_codec.hpp"

namespace CSVS {
namespace CSV {

LineCodec::LineCodec(const SerializerOptions& options)
    : separator_(options.separator),
      separator_text_(1, options.separator),
      separator_token_(options.separator_replacement),
      newline_token_(options.newline_replacement),
      row_number_title_(options.row_number_title),
      use_line_numbers_(options.use_line_numbers),
      skip_empty_lines_(options.skip_empty_lines) {}

std::string LineCodec::normalizeColumnName(const std::string& column) {
    return Text::replaceAll(Text::removeSpaces(column), "#", "Number");
}

ColumnLayout LineCodec::bind(const std::vector<std::string>& file_columns, const ActiveFieldSet& active) const {
    ColumnLayout layout;
    layout.columns = file_columns;
    layout.bindings.assign(file_columns.size(), std::nullopt);
    layout.first_column = use_line_numbers_ ? 1 : 0;

    const bool row_number_is_field = active.hasFieldNamed(row_number_title_);

    for (size_t i = layout.first_column; i < file_columns.size(); ++i) {
        std::string name = normalizeColumnName(file_columns[i]);
        if (!row_number_is_field && Text::equalsIgnoreCase(name, row_number_title_)) {
            continue;
        }

        for (const auto& field : active.fields) {
            const std::string& candidate = active.explicit_ordering ? normalizeColumnName(field.title) : field.name;
            if (Text::equalsIgnoreCase(candidate, name)) {
                layout.bindings[i] = field.index;
                break;
            }
        }
    }
    return layout;
}

std::string LineCodec::escape(const std::string& value) const {
    std::string result = Text::replaceAll(value, separator_text_, separator_token_);
    result = Text::replaceAll(result, "\r\n", newline_token_);
    return Text::replaceAll(result, "\n", newline_token_);
}

std::string LineCodec::unescape(const std::string& value) const {
    std::string result = Text::replaceAll(value, separator_token_, separator_text_);
    return Text::replaceAll(result, newline_token_, "\n");
}

bool LineCodec::isEndOfFile(const std::vector<std::string>& parts) const {
    return parts.size() == minimalColumnCount() && Text::trim(parts.back()) == "EOF";
}

std::string LineCodec::endOfFileLine(size_t row_number) const {
    if (use_line_numbers_) {
        return std::to_string(row_number) + separator_ + "EOF";
    }
    return "EOF";
}

} // namespace CSV
} // namespace CSVS
