// EN: String helpers shared by the header and line codecs
// FR: Utilitaires de chaînes partagés par les codecs d'en-tête et de ligne

#pragma once

#include <string>
#include <vector>

namespace CSVS {
namespace CSV {
namespace Text {

// EN: Split on every separator, empty fields are kept
// FR: Découpe à chaque séparateur, les champs vides sont conservés
std::vector<std::string> split(const std::string& text, char separator);

std::string join(const std::vector<std::string>& parts, char separator, size_t first = 0);

// EN: Remove leading and trailing whitespace
// FR: Supprime les espaces en début et fin
std::string trim(const std::string& text);

std::string toUpper(const std::string& text);
std::string toLower(const std::string& text);
bool equalsIgnoreCase(const std::string& lhs, const std::string& rhs);
bool containsIgnoreCase(const std::string& text, const std::string& needle);

std::string removeSpaces(const std::string& text);
std::string replaceAll(const std::string& text, const std::string& from, const std::string& to);

bool isBlank(const std::string& text);

} // namespace Text
} // namespace CSV
} // namespace CSVS
