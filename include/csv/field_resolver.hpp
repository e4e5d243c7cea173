// EN: Selection and ordering of the declared fields that take part in reading and writing
// FR: Sélection et ordonnancement des champs déclarés qui participent à la lecture et à l'écriture

#pragma once

#include "csv/record_schema.hpp"
#include <string>
#include <vector>

namespace CSVS {
namespace CSV {

// EN: One entry of the Active Field Set
// FR: Une entrée de l'ensemble des champs actifs
struct ActiveField {
    size_t index{0};        // EN: Position in the declared field list / FR: Position dans la liste des champs déclarés
    int order{0};           // EN: Column order, 0 without explicit markers / FR: Ordre de colonne, 0 sans marqueurs explicites
    std::string name;       // EN: Declared name / FR: Nom déclaré
    std::string title;      // EN: Effective column title / FR: Titre de colonne effectif
};

// EN: Ordered fields read and written by a serializer instance
// FR: Champs ordonnés lus et écrits par une instance de sérialiseur
struct ActiveFieldSet {
    std::vector<ActiveField> fields;
    bool explicit_ordering{false};  // EN: At least one field carries a column marker / FR: Au moins un champ porte un marqueur de colonne

    std::vector<std::string> names() const;
    std::vector<std::string> titles() const;
    bool hasFieldNamed(const std::string& name) const;
};

class FieldResolver {
public:
    // EN: Filter (reference kinds, ignored fields), sort by name, then keep marked fields sorted by order when any.
    //     Throws FormatError when nothing is declared, nothing survives, or two titles collide.
    // FR: Filtre (types référence, champs ignorés), trie par nom, puis garde les champs marqués triés par ordre s'il y en a.
    //     Lève FormatError si rien n'est déclaré, si rien ne subsiste ou si deux titres entrent en collision.
    static ActiveFieldSet resolve(const std::string& type_name,
                                  const std::vector<FieldInfo>& fields,
                                  bool ignore_reference_fields);

    // EN: Case-insensitive ordering with an ordinal tiebreak
    // FR: Ordre insensible à la casse départagé par ordre ordinal
    static bool nameLess(const std::string& lhs, const std::string& rhs);
};

} // namespace CSV
} // namespace CSVS
