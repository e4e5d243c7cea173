// EN: Configuration surface of the CSV serializer
// FR: Surface de configuration du sérialiseur CSV

#pragma once

#include "csv/file_io.hpp"
#include <optional>
#include <string>

namespace CSVS {

class ConfigSection;

namespace CSV {

struct SerializerOptions {
    bool skip_empty_lines{true};                    // EN: Skip blank lines on decode / FR: Ignore les lignes vides au décodage
    bool ignore_reference_fields{true};             // EN: Exclude OBJECT fields, read at construction / FR: Exclut les champs OBJECT, lu à la construction
    std::string newline_replacement{"\xC9\x94"};    // EN: U+0254, stands for line breaks in values / FR: U+0254, remplace les sauts de ligne dans les valeurs
    std::string separator_replacement{"\xC9\x95"};  // EN: U+0255, stands for the separator in values / FR: U+0255, remplace le séparateur dans les valeurs
    std::string row_number_title{"RowNumber"};      // EN: Title of the row-number column / FR: Titre de la colonne de numéro de ligne
    char separator{','};                            // EN: Field separator / FR: Séparateur de champs
    bool use_eof_literal{false};                    // EN: Append the EOF sentinel row / FR: Ajoute la ligne sentinelle EOF
    bool use_line_numbers{true};                    // EN: Write and expect the row-number column / FR: Écrit et attend la colonne de numéro de ligne
    std::optional<std::string> expected_header;     // EN: Header used for validation instead of the rendered one / FR: En-tête utilisé pour la validation au lieu de celui rendu
    std::optional<std::string> file_header;         // EN: Header of header-less input, no line is dropped / FR: En-tête d'une entrée sans en-tête, aucune ligne n'est retirée
    bool force_sequential{false};                   // EN: Decode on the calling thread / FR: Décode sur le thread appelant
    size_t worker_threads{0};                       // EN: Decode pool size (0 = hardware concurrency) / FR: Taille du pool de décodage (0 = concurrence matérielle)
    CompressionType compression{CompressionType::AUTO}; // EN: Compression of path input and output / FR: Compression des entrées et sorties par chemin

    // EN: Throws std::invalid_argument describing the first inconsistency found
    // FR: Lève std::invalid_argument décrivant la première incohérence trouvée
    void validate() const;

    bool isValid() const;

    // EN: Build options from a configuration section. Unknown keys are logged at WARN and ignored,
    //     malformed values throw std::invalid_argument.
    // FR: Construit les options depuis une section de configuration. Les clés inconnues sont journalisées en WARN et ignorées,
    //     les valeurs malformées lèvent std::invalid_argument.
    static SerializerOptions fromConfig(const ConfigSection& section);

    // EN: Same, reading the named section of the ConfigManager singleton
    // FR: Idem, en lisant la section nommée du singleton ConfigManager
    static SerializerOptions fromConfig(const std::string& section_name = "serializer");
};

} // namespace CSV
} // namespace CSVS
