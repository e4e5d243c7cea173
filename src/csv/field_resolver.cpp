// EN: Implementation of the FieldResolver
// FR: Implémentation du FieldResolver

#include "csv/field_resolver.hpp"
#include "csv/csv_errors.hpp"
#include "infrastructure/logging/logger.hpp"
#include "csv/text_utils.hpp"
#include <algorithm>
#include <unordered_set>

namespace CSVS {
namespace CSV {

std::vector<std::string> ActiveFieldSet::names() const {
    std::vector<std::string> result;
    result.reserve(fields.size());
    for (const auto& field : fields) {
        result.push_back(field.name);
    }
    return result;
}

std::vector<std::string> ActiveFieldSet::titles() const {
    std::vector<std::string> result;
    result.reserve(fields.size());
    for (const auto& field : fields) {
        result.push_back(field.title);
    }
    return result;
}

bool ActiveFieldSet::hasFieldNamed(const std::string& name) const {
    return std::any_of(fields.begin(), fields.end(),
                       [&name](const ActiveField& field) { return field.name == name; });
}

bool FieldResolver::nameLess(const std::string& lhs, const std::string& rhs) {
    std::string upper_lhs = Text::toUpper(lhs);
    std::string upper_rhs = Text::toUpper(rhs);
    if (upper_lhs != upper_rhs) {
        return upper_lhs < upper_rhs;
    }
    return lhs < rhs;
}

ActiveFieldSet FieldResolver::resolve(const std::string& type_name,
                                      const std::vector<FieldInfo>& fields,
                                      bool ignore_reference_fields) {
    if (fields.empty()) {
        std::string message = "There are no fields in " + type_name + " to serialize.";
        LOG_ERROR("field_resolver", message);
        throw FormatError(message);
    }

    std::vector<size_t> survivors;
    for (size_t i = 0; i < fields.size(); ++i) {
        const FieldInfo& info = fields[i];
        if (ignore_reference_fields && info.kind == FieldKind::OBJECT) {
            continue;
        }
        if (info.ignored) {
            continue;
        }
        survivors.push_back(i);
    }

    std::sort(survivors.begin(), survivors.end(), [&fields](size_t lhs, size_t rhs) {
        return nameLess(fields[lhs].name, fields[rhs].name);
    });

    ActiveFieldSet active;
    active.explicit_ordering = std::any_of(survivors.begin(), survivors.end(),
                                           [&fields](size_t i) { return fields[i].has_column; });

    for (size_t i : survivors) {
        const FieldInfo& info = fields[i];
        if (active.explicit_ordering && !info.has_column) {
            continue;
        }
        active.fields.push_back(ActiveField{i, active.explicit_ordering ? info.order : 0,
                                            info.name, info.effectiveTitle()});
    }

    if (active.explicit_ordering) {
        std::stable_sort(active.fields.begin(), active.fields.end(),
                         [](const ActiveField& lhs, const ActiveField& rhs) { return lhs.order < rhs.order; });
    }

    if (active.fields.empty()) {
        std::string message = "There are no fields in " + type_name + " to serialize.";
        LOG_ERROR("field_resolver", message);
        throw FormatError(message);
    }

    std::unordered_set<std::string> seen_titles;
    for (const auto& field : active.fields) {
        if (!seen_titles.insert(Text::toUpper(field.title)).second) {
            std::string message = "Duplicate column title '" + field.title + "' in " + type_name + ".";
            LOG_ERROR("field_resolver", message);
            throw FormatError(message);
        }
    }

    LOG_DEBUG("field_resolver", "Resolved " + std::to_string(active.fields.size()) + " active fields for " +
              type_name + (active.explicit_ordering ? " (explicit ordering)" : ""));
    return active;
}

} // namespace CSV
} // namespace CSVS
