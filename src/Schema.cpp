/**
 * @file Schema.cpp
 * @brief Supported board schema tables
 */

#include "boardmerge/Schema.hpp"

#include <algorithm>
#include <cctype>
#include <map>

namespace boardmerge {

namespace {

std::map<std::string, PrimitiveSchema> build_primitive_schemas() {
    std::map<std::string, PrimitiveSchema> schemas;

    auto add = [&](PrimitiveSchema schema) {
        std::string type = schema.type;
        schemas.emplace(std::move(type), std::move(schema));
    };

    PrimitiveSchema wire;
    wire.type = "wire";
    wire.points = {{"x1", "y1"}, {"x2", "y2"}};
    wire.props = {"width", "layer", "curve", "style", "cap", "extent"};
    add(wire);

    PrimitiveSchema polygon;
    polygon.type = "polygon";
    polygon.has_vertices = true;
    polygon.props = {"width", "layer", "spacing", "pour", "isolate",
                     "orphans", "thermals", "rank"};
    add(polygon);

    PrimitiveSchema text;
    text.type = "text";
    text.points = {{"x", "y"}};
    text.has_rot = true;
    text.has_text = true;
    text.props = {"size", "layer", "font", "ratio", "align", "distance"};
    add(text);

    PrimitiveSchema dimension;
    dimension.type = "dimension";
    dimension.points = {{"x1", "y1"}, {"x2", "y2"}, {"x3", "y3"}};
    dimension.props = {"layer", "dtype", "width", "extwidth", "extlength",
                       "extoffset", "textsize", "textratio", "unit",
                       "precision", "visible"};
    add(dimension);

    PrimitiveSchema circle;
    circle.type = "circle";
    circle.points = {{"x", "y"}};
    circle.props = {"radius", "width", "layer"};
    add(circle);

    // Corners carry the board rotation; rot stays relative to the centre.
    PrimitiveSchema rectangle;
    rectangle.type = "rectangle";
    rectangle.points = {{"x1", "y1"}, {"x2", "y2"}};
    rectangle.has_rot = true;
    rectangle.rotates_with_board = false;
    rectangle.props = {"layer"};
    add(rectangle);

    PrimitiveSchema frame;
    frame.type = "frame";
    frame.points = {{"x1", "y1"}, {"x2", "y2"}};
    frame.props = {"columns", "rows", "layer", "border-left", "border-top",
                   "border-right", "border-bottom"};
    add(frame);

    PrimitiveSchema hole;
    hole.type = "hole";
    hole.points = {{"x", "y"}};
    hole.props = {"drill"};
    add(hole);

    PrimitiveSchema via;
    via.type = "via";
    via.points = {{"x", "y"}};
    via.props = {"extent", "drill", "diameter", "shape", "alwaysstop"};
    add(via);

    PrimitiveSchema pad;
    pad.type = "pad";
    pad.points = {{"x", "y"}};
    pad.has_rot = true;
    pad.props = {"name", "drill", "diameter", "shape", "stop", "thermals", "first"};
    add(pad);

    PrimitiveSchema smd;
    smd.type = "smd";
    smd.points = {{"x", "y"}};
    smd.has_rot = true;
    smd.props = {"name", "dx", "dy", "layer", "roundness", "stop", "thermals", "cream"};
    add(smd);

    return schemas;
}

const std::map<std::string, PrimitiveSchema>& primitive_schemas() {
    static const std::map<std::string, PrimitiveSchema> schemas = build_primitive_schemas();
    return schemas;
}

} // anonymous namespace

const PrimitiveSchema* find_primitive_schema(const std::string& type) {
    const auto& schemas = primitive_schemas();
    auto it = schemas.find(type);
    return it == schemas.end() ? nullptr : &it->second;
}

const char* section_name(Section section) noexcept {
    switch (section) {
        case Section::Plain: return "plain";
        case Section::Package: return "package";
        case Section::Routing: return "signal";
    }
    return "unknown";
}

bool allowed_in_section(const std::string& type, Section section) {
    static const std::set<std::string> plain = {
        "wire", "polygon", "text", "dimension", "circle", "rectangle", "frame", "hole"};
    static const std::set<std::string> package = {
        "wire", "polygon", "text", "dimension", "circle", "rectangle", "hole", "pad", "smd"};
    static const std::set<std::string> routing = {"wire", "via", "polygon"};

    switch (section) {
        case Section::Plain: return plain.count(type) > 0;
        case Section::Package: return package.count(type) > 0;
        case Section::Routing: return routing.count(type) > 0;
    }
    return false;
}

const std::set<std::string>& vertex_props() {
    static const std::set<std::string> props = {"curve"};
    return props;
}

const std::set<std::string>& layer_props() {
    static const std::set<std::string> props = {"color", "fill", "visible", "active"};
    return props;
}

const std::set<std::string>& element_props() {
    static const std::set<std::string> props = {"locked", "smashed", "populate", "variants"};
    return props;
}

const std::set<std::string>& element_attribute_props() {
    static const std::set<std::string> props = {
        "size", "layer", "font", "ratio", "align", "constant"};
    return props;
}

const std::set<std::string>& contactref_props() {
    static const std::set<std::string> props = {"route", "routetag"};
    return props;
}

const std::set<std::string>& signal_props() {
    static const std::set<std::string> props = {"class", "airwireshidden"};
    return props;
}

std::pair<int, int> parse_version(const std::string& version) {
    const std::pair<int, int> invalid{-1, -1};

    std::vector<std::string> parts;
    std::string current;
    for (char c : version) {
        if (c == '.') {
            parts.push_back(current);
            current.clear();
        } else if (std::isdigit(static_cast<unsigned char>(c))) {
            current += c;
        } else {
            return invalid;
        }
    }
    parts.push_back(current);

    if (parts.size() < 2 || parts.size() > 3) return invalid;
    if (std::any_of(parts.begin(), parts.end(),
                    [](const std::string& p) { return p.empty() || p.size() > 4; })) {
        return invalid;
    }
    return {std::stoi(parts[0]), std::stoi(parts[1])};
}

bool is_supported_version(const std::string& version) {
    auto [major, minor] = parse_version(version);
    if (major < 0) return false;
    if (major != kBaselineMajor) return major > kBaselineMajor;
    return minor >= kBaselineMinor;
}

} // namespace boardmerge
