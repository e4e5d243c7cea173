// EN: Rendering of the canonical CSV header and validation of file headers against it
// FR: Rendu de l'en-tête CSV canonique et validation des en-têtes de fichier par rapport à celui-ci

#pragma once

#include <string>
#include <vector>

namespace CSVS {
namespace CSV {

class HeaderCodec {
public:
    // EN: explicit_ordering selects the positional comparison, otherwise columns are compared as sets
    // FR: explicit_ordering sélectionne la comparaison positionnelle, sinon les colonnes sont comparées comme ensembles
    HeaderCodec(char separator, std::string row_number_title, bool use_line_numbers, bool explicit_ordering);

    // EN: Join titles with the separator, prefixed by the row-number title when line numbering is on
    // FR: Joint les titres avec le séparateur, préfixés par le titre du numéro de ligne si la numérotation est active
    std::string render(const std::vector<std::string>& titles) const;

    // EN: Columns of a file header, uppercased then space-stripped (set mode) or trimmed (ordered mode), in file order
    // FR: Colonnes d'un en-tête de fichier, en majuscules puis sans espaces (mode ensemble) ou rognées (mode ordonné), dans l'ordre du fichier
    std::vector<std::string> normalizeColumns(const std::string& header_line) const;

    // EN: Expected columns missing from the actual header (set mode) or not at their position (ordered mode),
    //     joined by the separator. Empty means the header matches.
    // FR: Colonnes attendues absentes de l'en-tête réel (mode ensemble) ou pas à leur position (mode ordonné),
    //     jointes par le séparateur. Vide signifie que l'en-tête correspond.
    std::string diff(const std::string& actual_header, const std::string& expected_header) const;

    bool matches(const std::string& actual_header, const std::string& expected_header) const {
        return diff(actual_header, expected_header).empty();
    }

    bool explicitOrdering() const { return explicit_ordering_; }

private:
    std::string unorderedDiff(const std::string& actual_header, const std::string& expected_header) const;
    std::string orderedDiff(const std::string& actual_header, const std::string& expected_header) const;

    char separator_;
    std::string row_number_title_;
    bool use_line_numbers_;
    bool explicit_ordering_;
};

} // namespace CSV
} // namespace CSVS
