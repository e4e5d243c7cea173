// EN: Exceptions raised by the CSV serializer when a record type or a CSV document cannot be handled
// FR: Exceptions levées par le sérialiseur CSV quand un type d'enregistrement ou un document CSV ne peut être traité

#pragma once

#include <stdexcept>
#include <string>

namespace CSVS {
namespace CSV {

// EN: The record mapping or the CSV layout is unusable (no fields, duplicate titles, missing or invalid header)
// FR: Le mapping d'enregistrement ou la structure CSV est inutilisable (aucun champ, titres en double, en-tête absent ou invalide)
class FormatError : public std::runtime_error {
public:
    explicit FormatError(const std::string& message) : std::runtime_error(message) {}
};

// EN: A field value cannot be converted to the kind declared for its field
// FR: Une valeur de champ ne peut être convertie vers le type déclaré pour son champ
class UnsupportedValueError : public std::runtime_error {
public:
    explicit UnsupportedValueError(const std::string& message) : std::runtime_error(message) {}
};

} // namespace CSV
} // namespace CSVS
