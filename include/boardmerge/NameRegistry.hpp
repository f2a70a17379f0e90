/**
 * @file NameRegistry.hpp
 * @brief Collision-free naming of elements and signals in the output
 *
 * The board format requires element names and signal names to be unique
 * within a document. Inputs are designed independently, so the same name
 * ("U1", "GND") routinely shows up in several of them. The registry hands
 * out the original name when it is free and "name_N" with the lowest free
 * N otherwise.
 */

#ifndef BOARDMERGE_NAMEREGISTRY_HPP
#define BOARDMERGE_NAMEREGISTRY_HPP

#include "boardmerge/Document.hpp"

#include <map>
#include <optional>
#include <set>
#include <string>

namespace boardmerge {

/**
 * @brief Independent name spaces of a board document
 */
enum class NameKind {
    Element,
    Signal
};

/**
 * @brief Display-label assignment emitted when an element is renamed
 */
struct LabelAssignment {
    /// Final (unique) element name
    std::string element;
    /// Label to display: the original name
    std::string label;
};

/**
 * @brief Result of NameRegistry::reserve
 */
struct Reservation {
    std::string name;
    bool changed = false;
    /// Set for renamed elements only
    std::optional<LabelAssignment> label;
};

/**
 * @brief Names committed to the output, per name space
 *
 * One registry lives for one merge run. Renames are also recorded per
 * input (original → final) so references inside that input, such as
 * signal contact references to elements, can follow them.
 */
class NameRegistry {
public:
    NameRegistry() = default;

    /**
     * @brief Reserve a name, renaming on collision
     *
     * Examples (element space):
     * - reserve("U1") → {"U1", changed=false}
     * - reserve("U1") → {"U1_1", changed=true, label {"U1_1", "U1"}}
     * - reserve("U1") → {"U1_2", changed=true, ...}
     */
    Reservation reserve(NameKind kind, const std::string& name);

    bool contains(NameKind kind, const std::string& name) const;

    size_t size(NameKind kind) const;

    /**
     * @brief Start a new input: forget the previous input's renames
     */
    void begin_input();

    /**
     * @brief Final name of an original name from the current input
     *
     * Returns `name` unchanged if it was not renamed.
     */
    const std::string& resolve(NameKind kind, const std::string& name) const;

    /**
     * @brief Renames performed for the current input (original → final)
     */
    const std::map<std::string, std::string>& renames(NameKind kind) const;

private:
    std::set<std::string>& names(NameKind kind);
    const std::set<std::string>& names(NameKind kind) const;

    std::set<std::string> element_names_;
    std::set<std::string> signal_names_;
    std::map<std::string, std::string> element_renames_;
    std::map<std::string, std::string> signal_renames_;
};

/**
 * @brief Make a renamed element keep showing its original name
 *
 * Sets the element's label override. If the element has a placed NAME
 * attribute, that attribute is hidden and a visible copy named LABEL,
 * holding the original name, is added at the same position.
 *
 * An element that already carries a label (a panel merged again) keeps
 * it, and an existing LABEL attribute is refreshed to the same value.
 */
void apply_label(Element& element, const LabelAssignment& assignment);

/// Name of the attribute that carries a preserved label
extern const char* const kLabelAttribute;

} // namespace boardmerge

#endif // BOARDMERGE_NAMEREGISTRY_HPP
