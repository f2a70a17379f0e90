/**
 * @file NameRegistry.cpp
 * @brief Implementation of the output name registry
 */

#include "boardmerge/NameRegistry.hpp"

namespace boardmerge {

const char* const kLabelAttribute = "LABEL";

std::set<std::string>& NameRegistry::names(NameKind kind) {
    return kind == NameKind::Element ? element_names_ : signal_names_;
}

const std::set<std::string>& NameRegistry::names(NameKind kind) const {
    return kind == NameKind::Element ? element_names_ : signal_names_;
}

const std::map<std::string, std::string>& NameRegistry::renames(NameKind kind) const {
    return kind == NameKind::Element ? element_renames_ : signal_renames_;
}

Reservation NameRegistry::reserve(NameKind kind, const std::string& name) {
    auto& used = names(kind);

    Reservation result;
    result.name = name;
    for (size_t n = 1; used.count(result.name) > 0; ++n) {
        result.name = name + "_" + std::to_string(n);
    }
    used.insert(result.name);

    result.changed = result.name != name;
    if (result.changed) {
        auto& renamed = kind == NameKind::Element ? element_renames_ : signal_renames_;
        renamed[name] = result.name;
        if (kind == NameKind::Element) {
            result.label = LabelAssignment{result.name, name};
        }
    }
    return result;
}

bool NameRegistry::contains(NameKind kind, const std::string& name) const {
    return names(kind).count(name) > 0;
}

size_t NameRegistry::size(NameKind kind) const {
    return names(kind).size();
}

void NameRegistry::begin_input() {
    element_renames_.clear();
    signal_renames_.clear();
}

const std::string& NameRegistry::resolve(NameKind kind, const std::string& name) const {
    const auto& renamed = renames(kind);
    auto it = renamed.find(name);
    return it == renamed.end() ? name : it->second;
}

void apply_label(Element& element, const LabelAssignment& assignment) {
    // An element renamed by an earlier merge keeps its first label.
    const std::string label = element.label.value_or(assignment.label);
    element.label = label;

    ElementAttribute* name_attr = element.find_attribute("NAME");
    if (name_attr == nullptr || name_attr->display == "off") {
        if (ElementAttribute* existing = element.find_attribute(kLabelAttribute)) {
            existing->value = label;
        }
        return;
    }

    ElementAttribute copy = *name_attr;
    copy.name = kLabelAttribute;
    copy.value = label;
    name_attr->display = "off";

    if (ElementAttribute* existing = element.find_attribute(kLabelAttribute)) {
        *existing = std::move(copy);
    } else {
        element.attributes.push_back(std::move(copy));
    }
}

} // namespace boardmerge
