// EN: Typed value conversion between CSV text and record field values, selected at compile time per field type
// FR: Conversion typée des valeurs entre texte CSV et champs d'enregistrement, sélectionnée à la compilation par type de champ

#pragma once

#include "csv/csv_errors.hpp"
#include <chrono>
#include <limits>
#include <optional>
#include <string>
#include <type_traits>

namespace CSVS {
namespace CSV {

// EN: Kind of value a field holds, drives conversion and the reference-field filter
// FR: Nature de la valeur portée par un champ, pilote la conversion et le filtre des champs référence
enum class FieldKind {
    INTEGER,        // EN: Signed or unsigned integral types / FR: Types entiers signés ou non signés
    REAL,           // EN: float and double / FR: float et double
    BOOLEAN,        // EN: bool / FR: bool
    TEXT,           // EN: std::string / FR: std::string
    DATE,           // EN: std::chrono::year_month_day / FR: std::chrono::year_month_day
    TIMESTAMP,      // EN: std::chrono::sys_seconds / FR: std::chrono::sys_seconds
    OBJECT          // EN: User type with custom converters / FR: Type utilisateur avec convertisseurs personnalisés
};

std::string fieldKindToString(FieldKind kind);

// EN: Scalar parsers. All of them throw UnsupportedValueError when the whole text is not a valid value.
// FR: Parseurs scalaires. Tous lèvent UnsupportedValueError quand le texte entier n'est pas une valeur valide.
long long parseSigned(const std::string& text);
unsigned long long parseUnsigned(const std::string& text);
double parseDouble(const std::string& text);
float parseFloat(const std::string& text);
bool parseBoolean(const std::string& text);
std::chrono::year_month_day parseDate(const std::string& text);
std::chrono::sys_seconds parseTimestamp(const std::string& text);

// EN: Scalar formatters. Reals use the shortest representation that parses back to the same value.
// FR: Formateurs scalaires. Les réels utilisent la plus courte représentation relue à l'identique.
std::string formatDouble(double value);
std::string formatFloat(float value);
std::string formatBoolean(bool value);
std::string formatDate(const std::chrono::year_month_day& value);
std::string formatTimestamp(const std::chrono::sys_seconds& value);

// EN: Conversion traits. Types without a specialization must be mapped with custom converters.
// FR: Traits de conversion. Les types sans spécialisation doivent être mappés avec des convertisseurs personnalisés.
template<typename T, typename Enable = void>
struct ValueCodec {
    static constexpr bool supported = false;
};

template<typename T>
struct ValueCodec<T, std::enable_if_t<std::is_integral_v<T> && !std::is_same_v<T, bool>>> {
    static constexpr bool supported = true;
    static constexpr FieldKind kind = FieldKind::INTEGER;

    static T parse(const std::string& text) {
        if constexpr (std::is_signed_v<T>) {
            long long value = parseSigned(text);
            if (value < static_cast<long long>(std::numeric_limits<T>::min()) ||
                value > static_cast<long long>(std::numeric_limits<T>::max())) {
                throw UnsupportedValueError("value '" + text + "' is out of range for INTEGER");
            }
            return static_cast<T>(value);
        } else {
            unsigned long long value = parseUnsigned(text);
            if (value > static_cast<unsigned long long>(std::numeric_limits<T>::max())) {
                throw UnsupportedValueError("value '" + text + "' is out of range for INTEGER");
            }
            return static_cast<T>(value);
        }
    }

    static std::string format(const T& value) { return std::to_string(value); }
};

template<>
struct ValueCodec<double> {
    static constexpr bool supported = true;
    static constexpr FieldKind kind = FieldKind::REAL;
    static double parse(const std::string& text) { return parseDouble(text); }
    static std::string format(const double& value) { return formatDouble(value); }
};

template<>
struct ValueCodec<float> {
    static constexpr bool supported = true;
    static constexpr FieldKind kind = FieldKind::REAL;
    static float parse(const std::string& text) { return parseFloat(text); }
    static std::string format(const float& value) { return formatFloat(value); }
};

template<>
struct ValueCodec<bool> {
    static constexpr bool supported = true;
    static constexpr FieldKind kind = FieldKind::BOOLEAN;
    static bool parse(const std::string& text) { return parseBoolean(text); }
    static std::string format(const bool& value) { return formatBoolean(value); }
};

template<>
struct ValueCodec<std::string> {
    static constexpr bool supported = true;
    static constexpr FieldKind kind = FieldKind::TEXT;
    static std::string parse(const std::string& text) { return text; }
    static std::string format(const std::string& value) { return value; }
};

template<>
struct ValueCodec<std::chrono::year_month_day> {
    static constexpr bool supported = true;
    static constexpr FieldKind kind = FieldKind::DATE;
    static std::chrono::year_month_day parse(const std::string& text) { return parseDate(text); }
    static std::string format(const std::chrono::year_month_day& value) { return formatDate(value); }
};

template<>
struct ValueCodec<std::chrono::sys_seconds> {
    static constexpr bool supported = true;
    static constexpr FieldKind kind = FieldKind::TIMESTAMP;
    static std::chrono::sys_seconds parse(const std::string& text) { return parseTimestamp(text); }
    static std::string format(const std::chrono::sys_seconds& value) { return formatTimestamp(value); }
};

// EN: Nullable form. An absent value is written as an empty field and an empty field reads back as absent.
// FR: Forme nullable. Une valeur absente s'écrit comme un champ vide et un champ vide se relit comme absent.
template<typename U>
struct ValueCodec<std::optional<U>, std::enable_if_t<ValueCodec<U>::supported>> {
    static constexpr bool supported = true;
    static constexpr FieldKind kind = ValueCodec<U>::kind;
    static std::optional<U> parse(const std::string& text) { return ValueCodec<U>::parse(text); }
    static std::string format(const std::optional<U>& value) {
        return value ? ValueCodec<U>::format(*value) : std::string();
    }
};

} // namespace CSV
} // namespace CSVS
