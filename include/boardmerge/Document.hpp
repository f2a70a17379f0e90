/**
 * @file Document.hpp
 * @brief In-memory model of one board document
 *
 * The model mirrors the board schema closely: coordinate-bearing fields are
 * typed (Coord/Point), everything else is kept as Value so it round-trips
 * unchanged. Keys the codec does not recognise are collected into each
 * entity's `extensions` map, where the feature gate finds and rejects them.
 *
 * JSON conversion follows nlohmann::json ADL conventions (to_json/from_json).
 * Coordinates are millimetre numbers on the JSON side.
 */

#ifndef BOARDMERGE_DOCUMENT_HPP
#define BOARDMERGE_DOCUMENT_HPP

#include "boardmerge/Value.hpp"
#include "boardmerge/Geometry.hpp"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace boardmerge {

/// Non-coordinate attributes kept verbatim (width, layer, drill, ...)
using Properties = std::map<std::string, Value>;

/// Unrecognised keys, rejected by the feature gate
using Extensions = std::map<std::string, Value>;

struct Vertex {
    Point position;
    Properties props;
    Extensions extensions;
};

/**
 * @brief One geometric construct (wire, text, pad, via, ...)
 *
 * `type` selects a PrimitiveSchema, which says how many anchor points the
 * primitive has, whether it carries an orientation, text or vertex list,
 * and which properties are allowed. A type without a schema is kept as-is
 * (all keys in `extensions`) so the gate can report it.
 */
struct Primitive {
    std::string type;
    std::vector<Point> points;
    std::vector<Vertex> vertices;
    std::string rot;
    std::optional<std::string> text;
    Properties props;
    Extensions extensions;

    /// Layer number from props, nullopt if absent or not an integer
    std::optional<int> layer() const;
};

struct Package {
    std::string name;
    std::string description;
    std::vector<Primitive> primitives;
    Extensions extensions;
};

struct Library {
    std::string name;
    std::string description;
    std::vector<Package> packages;
    Extensions extensions;

    const Package* find_package(const std::string& package_name) const;
};

struct Layer {
    int number = 0;
    std::string name;
    Properties props;
    Extensions extensions;
};

/**
 * @brief Placed text attribute of an element (NAME, VALUE, user attributes)
 */
struct ElementAttribute {
    std::string name;
    std::optional<std::string> value;
    std::optional<Point> position;
    std::string rot;
    std::string display;
    Properties props;
    Extensions extensions;
};

struct Element {
    std::string name;
    std::string library;
    std::string package;
    std::string value;
    Point position;
    std::string rot;
    /// Display-label override, set when the element was renamed
    std::optional<std::string> label;
    std::vector<ElementAttribute> attributes;
    Properties props;
    Extensions extensions;

    /// The name a renderer shows for this element
    const std::string& display_label() const noexcept {
        return label ? *label : name;
    }

    ElementAttribute* find_attribute(const std::string& attr_name);
    const ElementAttribute* find_attribute(const std::string& attr_name) const;
};

/**
 * @brief Connection of a signal to one pad of one element
 */
struct ContactRef {
    std::string element;
    std::string pad;
    Properties props;
    Extensions extensions;
};

struct Signal {
    std::string name;
    std::vector<ContactRef> contacts;
    /// Routed geometry: wires, vias and polygons
    std::vector<Primitive> routing;
    Properties props;
    Extensions extensions;
};

/**
 * @brief Named set of design rule parameters, compared as a unit
 */
struct DesignRuleSet {
    std::string name;
    std::string description;
    std::map<std::string, std::string> params;
    Extensions extensions;
};

/**
 * @brief Root aggregate for one board design
 *
 * Opaque sections (grid, attributes, variantdefs, classes, autorouter) are
 * null when absent. `compatibility` and `errors` are read but never merged
 * into an output document.
 */
struct Document {
    std::string version;
    std::map<std::string, Value> settings;
    Value grid;
    std::vector<Layer> layers;
    std::vector<Library> libraries;
    std::vector<Primitive> plain;
    Value attributes;
    Value variantdefs;
    Value classes;
    std::optional<DesignRuleSet> designrules;
    Value autorouter;
    std::vector<Element> elements;
    std::vector<Signal> signals;
    Value compatibility;
    Value errors;
    Extensions extensions;

    const Library* find_library(const std::string& name) const;
    const Element* find_element(const std::string& name) const;
    const Signal* find_signal(const std::string& name) const;
    const Layer* find_layer(int number) const;
};

// ============================================================================
// Equality
// ============================================================================

bool operator==(const Vertex& a, const Vertex& b);
bool operator==(const Primitive& a, const Primitive& b);
bool operator==(const Package& a, const Package& b);
bool operator==(const Library& a, const Library& b);
bool operator==(const Layer& a, const Layer& b);
bool operator==(const ElementAttribute& a, const ElementAttribute& b);
bool operator==(const Element& a, const Element& b);
bool operator==(const ContactRef& a, const ContactRef& b);
bool operator==(const Signal& a, const Signal& b);
bool operator==(const DesignRuleSet& a, const DesignRuleSet& b);
bool operator==(const Document& a, const Document& b);

inline bool operator!=(const Primitive& a, const Primitive& b) { return !(a == b); }
inline bool operator!=(const Library& a, const Library& b) { return !(a == b); }
inline bool operator!=(const Document& a, const Document& b) { return !(a == b); }

// ============================================================================
// JSON conversion
// ============================================================================

void to_json(Value& j, const Vertex& v);
void from_json(const Value& j, Vertex& v);
void to_json(Value& j, const Primitive& p);
void from_json(const Value& j, Primitive& p);
void to_json(Value& j, const Package& p);
void from_json(const Value& j, Package& p);
void to_json(Value& j, const Library& l);
void from_json(const Value& j, Library& l);
void to_json(Value& j, const Layer& l);
void from_json(const Value& j, Layer& l);
void to_json(Value& j, const ElementAttribute& a);
void from_json(const Value& j, ElementAttribute& a);
void to_json(Value& j, const Element& e);
void from_json(const Value& j, Element& e);
void to_json(Value& j, const ContactRef& c);
void from_json(const Value& j, ContactRef& c);
void to_json(Value& j, const Signal& s);
void from_json(const Value& j, Signal& s);
void to_json(Value& j, const DesignRuleSet& d);
void from_json(const Value& j, DesignRuleSet& d);
void to_json(Value& j, const Document& d);
void from_json(const Value& j, Document& d);

} // namespace boardmerge

#endif // BOARDMERGE_DOCUMENT_HPP
