/**
 * @file Document.cpp
 * @brief Board document model: lookups, equality and JSON conversion
 */

#include "boardmerge/Document.hpp"
#include "boardmerge/Schema.hpp"

#include <algorithm>
#include <initializer_list>
#include <set>
#include <stdexcept>
#include <tuple>

namespace boardmerge {

// ============================================================================
// Utility functions
// ============================================================================

namespace {

Coord read_coord(const Value& j, const std::string& key) {
    return mm_to_coord(j.at(key).get<double>());
}

/**
 * @brief Read an integer that must fit in int; 1.5 or 2^32 + 1 are rejected.
 */
int read_int(const Value& j, const std::string& key) {
    const Value& v = j.at(key);
    if (!v.is_number_integer()) {
        throw std::invalid_argument("'" + key + "' must be an integer, got " + v.dump());
    }
    if (!fits_int(v)) {
        throw std::out_of_range("'" + key + "' value " + v.dump() + " is out of range");
    }
    return v.get<int>();
}

Point read_point(const Value& j, const std::string& xkey, const std::string& ykey) {
    return Point{read_coord(j, xkey), read_coord(j, ykey)};
}

void write_point(Value& j, const std::string& xkey, const std::string& ykey, Point p) {
    j[xkey] = coord_to_mm(p.x);
    j[ykey] = coord_to_mm(p.y);
}

/**
 * @brief Read an orientation attribute; "R0" is stored as absent.
 */
std::string read_rot(const Value& j) {
    if (!j.contains("rot")) return "";
    std::string rot = j.at("rot").get<std::string>();
    return rot == "R0" ? std::string() : rot;
}

std::string read_string(const Value& j, const std::string& key) {
    if (!j.contains(key)) return "";
    return j.at(key).get<std::string>();
}

Properties read_props(const Value& j, const std::set<std::string>& allowed) {
    Properties props;
    for (const auto& key : allowed) {
        auto it = j.find(key);
        if (it != j.end()) {
            props[key] = *it;
        }
    }
    return props;
}

/**
 * @brief Collect every key of j that is neither typed nor an allowed property.
 */
Extensions read_extensions(const Value& j,
                           std::initializer_list<const char*> typed,
                           const std::set<std::string>& allowed) {
    Extensions ext;
    for (auto it = j.begin(); it != j.end(); ++it) {
        const std::string& key = it.key();
        bool known = allowed.count(key) > 0;
        for (const char* t : typed) {
            if (key == t) {
                known = true;
                break;
            }
        }
        if (!known) {
            ext[key] = it.value();
        }
    }
    return ext;
}

void write_map(Value& j, const std::map<std::string, Value>& values) {
    for (const auto& [key, val] : values) {
        j[key] = val;
    }
}

template <typename T>
std::vector<T> read_list(const Value& j, const std::string& key) {
    if (!j.contains(key)) return {};
    return j.at(key).get<std::vector<T>>();
}

template <typename T>
const T* find_by_name(const std::vector<T>& items, const std::string& name) {
    auto it = std::find_if(items.begin(), items.end(),
                           [&](const T& item) { return item.name == name; });
    return it == items.end() ? nullptr : &*it;
}

} // anonymous namespace

// ============================================================================
// Lookups
// ============================================================================

std::optional<int> Primitive::layer() const {
    auto it = props.find("layer");
    if (it == props.end() || !fits_int(it->second)) {
        return std::nullopt;
    }
    return it->second.get<int>();
}

const Package* Library::find_package(const std::string& package_name) const {
    return find_by_name(packages, package_name);
}

ElementAttribute* Element::find_attribute(const std::string& attr_name) {
    auto it = std::find_if(attributes.begin(), attributes.end(),
                           [&](const ElementAttribute& a) { return a.name == attr_name; });
    return it == attributes.end() ? nullptr : &*it;
}

const ElementAttribute* Element::find_attribute(const std::string& attr_name) const {
    return find_by_name(attributes, attr_name);
}

const Library* Document::find_library(const std::string& name) const {
    return find_by_name(libraries, name);
}

const Element* Document::find_element(const std::string& name) const {
    return find_by_name(elements, name);
}

const Signal* Document::find_signal(const std::string& name) const {
    return find_by_name(signals, name);
}

const Layer* Document::find_layer(int number) const {
    auto it = std::find_if(layers.begin(), layers.end(),
                           [&](const Layer& l) { return l.number == number; });
    return it == layers.end() ? nullptr : &*it;
}

// ============================================================================
// Equality
// ============================================================================

bool operator==(const Vertex& a, const Vertex& b) {
    return std::tie(a.position, a.props, a.extensions) ==
           std::tie(b.position, b.props, b.extensions);
}

bool operator==(const Primitive& a, const Primitive& b) {
    return std::tie(a.type, a.points, a.vertices, a.rot, a.text, a.props, a.extensions) ==
           std::tie(b.type, b.points, b.vertices, b.rot, b.text, b.props, b.extensions);
}

bool operator==(const Package& a, const Package& b) {
    return std::tie(a.name, a.description, a.primitives, a.extensions) ==
           std::tie(b.name, b.description, b.primitives, b.extensions);
}

bool operator==(const Library& a, const Library& b) {
    return std::tie(a.name, a.description, a.packages, a.extensions) ==
           std::tie(b.name, b.description, b.packages, b.extensions);
}

bool operator==(const Layer& a, const Layer& b) {
    return std::tie(a.number, a.name, a.props, a.extensions) ==
           std::tie(b.number, b.name, b.props, b.extensions);
}

bool operator==(const ElementAttribute& a, const ElementAttribute& b) {
    return std::tie(a.name, a.value, a.position, a.rot, a.display, a.props, a.extensions) ==
           std::tie(b.name, b.value, b.position, b.rot, b.display, b.props, b.extensions);
}

bool operator==(const Element& a, const Element& b) {
    return std::tie(a.name, a.library, a.package, a.value, a.position, a.rot,
                    a.label, a.attributes, a.props, a.extensions) ==
           std::tie(b.name, b.library, b.package, b.value, b.position, b.rot,
                    b.label, b.attributes, b.props, b.extensions);
}

bool operator==(const ContactRef& a, const ContactRef& b) {
    return std::tie(a.element, a.pad, a.props, a.extensions) ==
           std::tie(b.element, b.pad, b.props, b.extensions);
}

bool operator==(const Signal& a, const Signal& b) {
    return std::tie(a.name, a.contacts, a.routing, a.props, a.extensions) ==
           std::tie(b.name, b.contacts, b.routing, b.props, b.extensions);
}

bool operator==(const DesignRuleSet& a, const DesignRuleSet& b) {
    return std::tie(a.name, a.description, a.params, a.extensions) ==
           std::tie(b.name, b.description, b.params, b.extensions);
}

bool operator==(const Document& a, const Document& b) {
    return std::tie(a.version, a.settings, a.grid, a.layers, a.libraries, a.plain,
                    a.attributes, a.variantdefs, a.classes, a.designrules,
                    a.autorouter, a.elements, a.signals, a.compatibility,
                    a.errors, a.extensions) ==
           std::tie(b.version, b.settings, b.grid, b.layers, b.libraries, b.plain,
                    b.attributes, b.variantdefs, b.classes, b.designrules,
                    b.autorouter, b.elements, b.signals, b.compatibility,
                    b.errors, b.extensions);
}

// ============================================================================
// Primitives
// ============================================================================

void to_json(Value& j, const Vertex& v) {
    j = Value::object();
    write_point(j, "x", "y", v.position);
    write_map(j, v.props);
    write_map(j, v.extensions);
}

void from_json(const Value& j, Vertex& v) {
    v.position = read_point(j, "x", "y");
    v.props = read_props(j, vertex_props());
    v.extensions = read_extensions(j, {"x", "y"}, vertex_props());
}

void to_json(Value& j, const Primitive& p) {
    j = Value::object();
    j["type"] = p.type;
    write_map(j, p.extensions);

    const PrimitiveSchema* schema = find_primitive_schema(p.type);
    if (!schema) {
        return;
    }

    for (size_t i = 0; i < schema->points.size() && i < p.points.size(); ++i) {
        const auto& [xkey, ykey] = schema->points[i];
        write_point(j, xkey, ykey, p.points[i]);
    }
    if (schema->has_rot && !p.rot.empty()) {
        j["rot"] = p.rot;
    }
    if (schema->has_text && p.text) {
        j["text"] = *p.text;
    }
    if (schema->has_vertices) {
        j["vertices"] = p.vertices;
    }
    write_map(j, p.props);
}

void from_json(const Value& j, Primitive& p) {
    p = Primitive{};
    p.type = j.at("type").get<std::string>();

    const PrimitiveSchema* schema = find_primitive_schema(p.type);
    if (!schema) {
        // Keep the whole construct for the gate to report.
        p.extensions = read_extensions(j, {"type"}, {});
        return;
    }

    std::set<std::string> typed = {"type"};
    for (const auto& [xkey, ykey] : schema->points) {
        p.points.push_back(read_point(j, xkey, ykey));
        typed.insert(xkey);
        typed.insert(ykey);
    }
    if (schema->has_rot) {
        p.rot = read_rot(j);
        typed.insert("rot");
    }
    if (schema->has_text) {
        if (j.contains("text")) {
            p.text = j.at("text").get<std::string>();
        }
        typed.insert("text");
    }
    if (schema->has_vertices) {
        p.vertices = read_list<Vertex>(j, "vertices");
        typed.insert("vertices");
    }
    p.props = read_props(j, schema->props);

    std::set<std::string> known = schema->props;
    known.insert(typed.begin(), typed.end());
    p.extensions = read_extensions(j, {}, known);
}

// ============================================================================
// Libraries
// ============================================================================

void to_json(Value& j, const Package& p) {
    j = Value::object();
    j["name"] = p.name;
    if (!p.description.empty()) j["description"] = p.description;
    j["primitives"] = p.primitives;
    write_map(j, p.extensions);
}

void from_json(const Value& j, Package& p) {
    p.name = j.at("name").get<std::string>();
    p.description = read_string(j, "description");
    p.primitives = read_list<Primitive>(j, "primitives");
    p.extensions = read_extensions(j, {"name", "description", "primitives"}, {});
}

void to_json(Value& j, const Library& l) {
    j = Value::object();
    j["name"] = l.name;
    if (!l.description.empty()) j["description"] = l.description;
    j["packages"] = l.packages;
    write_map(j, l.extensions);
}

void from_json(const Value& j, Library& l) {
    l.name = j.at("name").get<std::string>();
    l.description = read_string(j, "description");
    l.packages = read_list<Package>(j, "packages");
    l.extensions = read_extensions(j, {"name", "description", "packages"}, {});
}

void to_json(Value& j, const Layer& l) {
    j = Value::object();
    j["number"] = l.number;
    j["name"] = l.name;
    write_map(j, l.props);
    write_map(j, l.extensions);
}

void from_json(const Value& j, Layer& l) {
    l.number = read_int(j, "number");
    l.name = read_string(j, "name");
    l.props = read_props(j, layer_props());
    l.extensions = read_extensions(j, {"number", "name"}, layer_props());
}

// ============================================================================
// Elements and signals
// ============================================================================

void to_json(Value& j, const ElementAttribute& a) {
    j = Value::object();
    j["name"] = a.name;
    if (a.value) j["value"] = *a.value;
    if (a.position) write_point(j, "x", "y", *a.position);
    if (!a.rot.empty()) j["rot"] = a.rot;
    if (!a.display.empty()) j["display"] = a.display;
    write_map(j, a.props);
    write_map(j, a.extensions);
}

void from_json(const Value& j, ElementAttribute& a) {
    a.name = j.at("name").get<std::string>();
    if (j.contains("value")) {
        a.value = j.at("value").get<std::string>();
    }
    if (j.contains("x") || j.contains("y")) {
        a.position = read_point(j, "x", "y");
    }
    a.rot = read_rot(j);
    a.display = read_string(j, "display");
    a.props = read_props(j, element_attribute_props());
    a.extensions = read_extensions(j, {"name", "value", "x", "y", "rot", "display"},
                                   element_attribute_props());
}

void to_json(Value& j, const Element& e) {
    j = Value::object();
    j["name"] = e.name;
    j["library"] = e.library;
    j["package"] = e.package;
    j["value"] = e.value;
    write_point(j, "x", "y", e.position);
    if (!e.rot.empty()) j["rot"] = e.rot;
    if (e.label) j["label"] = *e.label;
    if (!e.attributes.empty()) j["attributes"] = e.attributes;
    write_map(j, e.props);
    write_map(j, e.extensions);
}

void from_json(const Value& j, Element& e) {
    e.name = j.at("name").get<std::string>();
    e.library = j.at("library").get<std::string>();
    e.package = j.at("package").get<std::string>();
    e.value = read_string(j, "value");
    e.position = read_point(j, "x", "y");
    e.rot = read_rot(j);
    if (j.contains("label")) {
        e.label = j.at("label").get<std::string>();
    }
    e.attributes = read_list<ElementAttribute>(j, "attributes");
    e.props = read_props(j, element_props());
    e.extensions = read_extensions(
        j, {"name", "library", "package", "value", "x", "y", "rot", "label", "attributes"},
        element_props());
}

void to_json(Value& j, const ContactRef& c) {
    j = Value::object();
    j["element"] = c.element;
    j["pad"] = c.pad;
    write_map(j, c.props);
    write_map(j, c.extensions);
}

void from_json(const Value& j, ContactRef& c) {
    c.element = j.at("element").get<std::string>();
    c.pad = j.at("pad").get<std::string>();
    c.props = read_props(j, contactref_props());
    c.extensions = read_extensions(j, {"element", "pad"}, contactref_props());
}

void to_json(Value& j, const Signal& s) {
    j = Value::object();
    j["name"] = s.name;
    j["contactrefs"] = s.contacts;
    j["routing"] = s.routing;
    write_map(j, s.props);
    write_map(j, s.extensions);
}

void from_json(const Value& j, Signal& s) {
    s.name = j.at("name").get<std::string>();
    s.contacts = read_list<ContactRef>(j, "contactrefs");
    s.routing = read_list<Primitive>(j, "routing");
    s.props = read_props(j, signal_props());
    s.extensions = read_extensions(j, {"name", "contactrefs", "routing"}, signal_props());
}

// ============================================================================
// Design rules
// ============================================================================

void to_json(Value& j, const DesignRuleSet& d) {
    j = Value::object();
    j["name"] = d.name;
    if (!d.description.empty()) j["description"] = d.description;
    j["params"] = d.params;
    write_map(j, d.extensions);
}

void from_json(const Value& j, DesignRuleSet& d) {
    d.name = read_string(j, "name");
    d.description = read_string(j, "description");
    if (j.contains("params")) {
        d.params = j.at("params").get<std::map<std::string, std::string>>();
    }
    d.extensions = read_extensions(j, {"name", "description", "params"}, {});
}

// ============================================================================
// Document
// ============================================================================

void to_json(Value& j, const Document& d) {
    j = Value::object();
    j["version"] = d.version;
    if (!d.settings.empty()) j["settings"] = d.settings;
    if (!d.grid.is_null()) j["grid"] = d.grid;
    j["layers"] = d.layers;
    j["libraries"] = d.libraries;
    j["plain"] = d.plain;
    if (!d.attributes.is_null()) j["attributes"] = d.attributes;
    if (!d.variantdefs.is_null()) j["variantdefs"] = d.variantdefs;
    if (!d.classes.is_null()) j["classes"] = d.classes;
    if (d.designrules) j["designrules"] = *d.designrules;
    if (!d.autorouter.is_null()) j["autorouter"] = d.autorouter;
    j["elements"] = d.elements;
    j["signals"] = d.signals;
    if (!d.compatibility.is_null()) j["compatibility"] = d.compatibility;
    if (!d.errors.is_null()) j["errors"] = d.errors;
    write_map(j, d.extensions);
}

void from_json(const Value& j, Document& d) {
    auto opaque = [&](const char* key) {
        return j.contains(key) ? j.at(key) : Value();
    };

    d = Document{};
    d.version = read_string(j, "version");
    if (j.contains("settings")) {
        d.settings = j.at("settings").get<std::map<std::string, Value>>();
    }
    d.grid = opaque("grid");
    d.layers = read_list<Layer>(j, "layers");
    d.libraries = read_list<Library>(j, "libraries");
    d.plain = read_list<Primitive>(j, "plain");
    d.attributes = opaque("attributes");
    d.variantdefs = opaque("variantdefs");
    d.classes = opaque("classes");
    if (j.contains("designrules")) {
        d.designrules = j.at("designrules").get<DesignRuleSet>();
    }
    d.autorouter = opaque("autorouter");
    d.elements = read_list<Element>(j, "elements");
    d.signals = read_list<Signal>(j, "signals");
    d.compatibility = opaque("compatibility");
    d.errors = opaque("errors");
    d.extensions = read_extensions(
        j, {"version", "settings", "grid", "layers", "libraries", "plain",
            "attributes", "variantdefs", "classes", "designrules", "autorouter",
            "elements", "signals", "compatibility", "errors"},
        {});
}

} // namespace boardmerge
