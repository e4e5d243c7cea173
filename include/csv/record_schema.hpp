// EN: Declarative field mapping of a record type: which members are CSV columns, under which title and order
// FR: Mapping déclaratif des champs d'un type d'enregistrement : quels membres sont des colonnes CSV, sous quel titre et ordre

#pragma once

#include "csv/value_codec.hpp"
#include <functional>
#include <string>
#include <type_traits>
#include <typeinfo>
#include <utility>
#include <vector>

namespace CSVS {
namespace CSV {

// EN: Type-independent metadata of one declared field
// FR: Métadonnées indépendantes du type d'un champ déclaré
struct FieldInfo {
    std::string name;               // EN: Declared field name / FR: Nom déclaré du champ
    std::string column_title;       // EN: Explicit column title, empty when none / FR: Titre de colonne explicite, vide si absent
    int order{0};                   // EN: Explicit column order / FR: Ordre de colonne explicite
    FieldKind kind{FieldKind::TEXT};
    bool ignored{false};            // EN: Never read nor written / FR: Jamais lu ni écrit
    bool has_column{false};         // EN: Carries an explicit column marker / FR: Porte un marqueur de colonne explicite

    // EN: Column title when the marker names one, declared name otherwise
    // FR: Titre de colonne si le marqueur en fournit un, nom déclaré sinon
    const std::string& effectiveTitle() const {
        return has_column && !column_title.empty() ? column_title : name;
    }
};

// EN: Field metadata plus the typed accessors bound to one member of T
// FR: Métadonnées du champ plus les accesseurs typés liés à un membre de T
template<typename T>
struct FieldDescriptor {
    FieldInfo info;
    std::function<void(T&, const std::string&)> parse;     // EN: Convert and assign / FR: Convertit et affecte
    std::function<std::string(const T&)> format;           // EN: Read and render / FR: Lit et rend
    std::function<void(T&)> reset;                         // EN: Assign the default value / FR: Affecte la valeur par défaut
};

// EN: Builder collecting the field descriptors of T. Filled once by RecordMapping<T>::describe().
// FR: Builder collectant les descripteurs de champs de T. Rempli une fois par RecordMapping<T>::describe().
template<typename T>
class RecordSchema {
public:
    // EN: Handle returned by field() to attach markers to the field just declared
    // FR: Poignée retournée par field() pour attacher des marqueurs au champ qui vient d'être déclaré
    class FieldBuilder {
    public:
        FieldBuilder(RecordSchema& schema, size_t index) : schema_(schema), index_(index) {}

        // EN: Explicit column marker. An empty title keeps the declared name.
        // FR: Marqueur de colonne explicite. Un titre vide conserve le nom déclaré.
        FieldBuilder& column(const std::string& title, int order = 0) {
            FieldInfo& info = schema_.fields_[index_].info;
            info.has_column = true;
            info.column_title = title;
            info.order = order;
            return *this;
        }

        FieldBuilder& ignore() {
            schema_.fields_[index_].info.ignored = true;
            return *this;
        }

    private:
        RecordSchema& schema_;
        size_t index_;
    };

    RecordSchema() : type_name_(typeid(T).name()) {}

    // EN: Name used in error messages
    // FR: Nom utilisé dans les messages d'erreur
    RecordSchema& name(const std::string& type_name) {
        type_name_ = type_name;
        return *this;
    }

    // EN: Declare a member whose type has a ValueCodec
    // FR: Déclare un membre dont le type possède un ValueCodec
    template<typename M>
    FieldBuilder field(const std::string& name, M T::*member) {
        static_assert(ValueCodec<M>::supported,
                      "member type has no ValueCodec, declare it with custom converters");

        FieldDescriptor<T> descriptor;
        descriptor.info.name = name;
        descriptor.info.kind = ValueCodec<M>::kind;
        descriptor.parse = [member](T& record, const std::string& text) {
            record.*member = ValueCodec<M>::parse(text);
        };
        descriptor.format = [member](const T& record) {
            return ValueCodec<M>::format(record.*member);
        };
        descriptor.reset = [member](T& record) { record.*member = M{}; };
        return add(std::move(descriptor));
    }

    // EN: Declare a member of a user type with its own converters. Such fields are OBJECT fields.
    // FR: Déclare un membre de type utilisateur avec ses propres convertisseurs. Ces champs sont des champs OBJECT.
    template<typename M>
    FieldBuilder field(const std::string& name, M T::*member,
                       std::type_identity_t<std::function<std::string(const M&)>> format,
                       std::type_identity_t<std::function<M(const std::string&)>> parse) {
        FieldDescriptor<T> descriptor;
        descriptor.info.name = name;
        descriptor.info.kind = FieldKind::OBJECT;
        descriptor.parse = [member, parse](T& record, const std::string& text) {
            record.*member = parse(text);
        };
        descriptor.format = [member, format](const T& record) {
            return format(record.*member);
        };
        descriptor.reset = [member](T& record) { record.*member = M{}; };
        return add(std::move(descriptor));
    }

    const std::vector<FieldDescriptor<T>>& fields() const { return fields_; }
    const std::string& typeName() const { return type_name_; }

    std::vector<FieldInfo> infos() const {
        std::vector<FieldInfo> result;
        result.reserve(fields_.size());
        for (const auto& descriptor : fields_) {
            result.push_back(descriptor.info);
        }
        return result;
    }

private:
    FieldBuilder add(FieldDescriptor<T> descriptor) {
        fields_.push_back(std::move(descriptor));
        return FieldBuilder(*this, fields_.size() - 1);
    }

    std::string type_name_;
    std::vector<FieldDescriptor<T>> fields_;
};

// EN: Per-type registration point. Specialize with: static void describe(RecordSchema<T>& schema);
// FR: Point d'enregistrement par type. Spécialiser avec : static void describe(RecordSchema<T>& schema);
template<typename T>
struct RecordMapping;

} // namespace CSV
} // namespace CSVS
