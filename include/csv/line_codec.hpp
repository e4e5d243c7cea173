// EN: Conversion of one CSV line to one record and back, with escaping of separators and line breaks in values
// FR: Conversion d'une ligne CSV en un enregistrement et inversement, avec échappement des séparateurs et sauts de ligne

#pragma once

#include "csv/csv_errors.hpp"
#include "csv/field_resolver.hpp"
#include "csv/record_schema.hpp"
#include "csv/serializer_options.hpp"
#include "csv/text_utils.hpp"
#include <optional>
#include <string>
#include <vector>

namespace CSVS {
namespace CSV {

// EN: Outcome of decoding one line
// FR: Résultat du décodage d'une ligne
enum class DecodeStatus {
    DECODED,        // EN: Record produced / FR: Enregistrement produit
    SHORT_ROW,      // EN: Record produced from fewer parts than columns / FR: Enregistrement produit avec moins de parties que de colonnes
    BLANK,          // EN: Blank line skipped / FR: Ligne vide ignorée
    END_OF_FILE     // EN: EOF sentinel row skipped / FR: Ligne sentinelle EOF ignorée
};

// EN: File columns of one document and the declared field each of them feeds, computed once per decode call
// FR: Colonnes de fichier d'un document et le champ déclaré que chacune alimente, calculées une fois par appel de décodage
struct ColumnLayout {
    std::vector<std::string> columns;                   // EN: Normalized file columns / FR: Colonnes de fichier normalisées
    std::vector<std::optional<size_t>> bindings;        // EN: Declared field index per column / FR: Index de champ déclaré par colonne
    size_t first_column{0};                             // EN: 1 when column 0 holds row numbers / FR: 1 quand la colonne 0 porte les numéros de ligne
};

class LineCodec {
public:
    explicit LineCodec(const SerializerOptions& options);

    // EN: Resolve every file column to an active field, unresolvable columns stay unbound
    // FR: Résout chaque colonne de fichier vers un champ actif, les colonnes non résolues restent non liées
    ColumnLayout bind(const std::vector<std::string>& file_columns, const ActiveFieldSet& active) const;

    // EN: Column name as matched against fields: spaces removed, '#' spelled "Number"
    // FR: Nom de colonne tel que comparé aux champs : espaces supprimés, '#' écrit "Number"
    static std::string normalizeColumnName(const std::string& column);

    std::string escape(const std::string& value) const;
    std::string unescape(const std::string& value) const;

    std::vector<std::string> split(const std::string& line) const { return Text::split(line, separator_); }

    // EN: 2 parts with line numbers ("<n>,EOF"), 1 without ("EOF")
    // FR: 2 parties avec numéros de ligne ("<n>,EOF"), 1 sans ("EOF")
    size_t minimalColumnCount() const { return use_line_numbers_ ? 2 : 1; }
    bool isEndOfFile(const std::vector<std::string>& parts) const;
    std::string endOfFileLine(size_t row_number) const;

    template<typename T>
    DecodeStatus decode(const std::string& line, size_t line_number, const ColumnLayout& layout,
                        const std::vector<FieldDescriptor<T>>& fields, std::optional<T>& out) const;

    template<typename T>
    std::string encode(const T& record, size_t row_number, const ActiveFieldSet& active,
                       const std::vector<FieldDescriptor<T>>& fields) const;

private:
    char separator_;
    std::string separator_text_;
    std::string separator_token_;
    std::string newline_token_;
    std::string row_number_title_;
    bool use_line_numbers_;
    bool skip_empty_lines_;
};

template<typename T>
DecodeStatus LineCodec::decode(const std::string& line, size_t line_number, const ColumnLayout& layout,
                               const std::vector<FieldDescriptor<T>>& fields, std::optional<T>& out) const {
    if (skip_empty_lines_ && Text::isBlank(line)) {
        return DecodeStatus::BLANK;
    }

    std::vector<std::string> parts = split(line);
    if (isEndOfFile(parts)) {
        return DecodeStatus::END_OF_FILE;
    }

    T record{};
    const size_t column_count = layout.columns.size();

    for (size_t i = layout.first_column; i < column_count && i < parts.size(); ++i) {
        const std::optional<size_t>& binding = layout.bindings[i];
        if (!binding) {
            continue;
        }

        // EN: The last column absorbs any surplus parts
        // FR: La dernière colonne absorbe les parties excédentaires
        std::string raw = (i + 1 == column_count && parts.size() > column_count)
                              ? Text::join(parts, separator_, i)
                              : parts[i];
        std::string value = Text::trim(unescape(raw));

        const FieldDescriptor<T>& field = fields[*binding];
        if (value.empty()) {
            field.reset(record);
            continue;
        }

        try {
            field.parse(record, value);
        } catch (const std::exception& e) {
            throw UnsupportedValueError("Line " + std::to_string(line_number) + ", column " +
                                        layout.columns[i] + " (" + field.info.name + "): " + e.what());
        }
    }

    out = std::move(record);
    return parts.size() < column_count ? DecodeStatus::SHORT_ROW : DecodeStatus::DECODED;
}

template<typename T>
std::string LineCodec::encode(const T& record, size_t row_number, const ActiveFieldSet& active,
                              const std::vector<FieldDescriptor<T>>& fields) const {
    std::vector<std::string> parts;
    parts.reserve(active.fields.size() + 1);
    if (use_line_numbers_) {
        parts.push_back(std::to_string(row_number));
    }
    for (const auto& field : active.fields) {
        parts.push_back(escape(fields[field.index].format(record)));
    }
    return Text::join(parts, separator_);
}

} // namespace CSV
} // namespace CSVS
