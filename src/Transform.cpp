/**
 * @file Transform.cpp
 * @brief Implementation of the document geometry transform
 */

#include "boardmerge/Transform.hpp"
#include "boardmerge/Diff.hpp"
#include "boardmerge/Errors.hpp"
#include "boardmerge/Schema.hpp"

namespace boardmerge {

namespace {

std::string rotated_rot(const std::string& rot, Rotation rotation, const std::string& path) {
    auto result = rotate_orientation(rot, rotation);
    if (!result) {
        throw UnsupportedFeatureError(child_path(path, "rot"),
                                      "unsupported rotation attribute '" + rot + "'");
    }
    return *result;
}

} // anonymous namespace

void transform_primitive(Primitive& primitive, const Placement& placement,
                         const std::string& path) {
    for (auto& point : primitive.points) {
        point = placement.apply(point);
    }
    for (auto& vertex : primitive.vertices) {
        vertex.position = placement.apply(vertex.position);
    }

    const PrimitiveSchema* schema = find_primitive_schema(primitive.type);
    if (schema && schema->has_rot && schema->rotates_with_board) {
        primitive.rot = rotated_rot(primitive.rot, placement.rotation, path);
    }
}

void transform_element(Element& element, const Placement& placement) {
    const std::string path = child_path("elements", element.name);

    element.position = placement.apply(element.position);
    element.rot = rotated_rot(element.rot, placement.rotation, path);

    for (auto& attr : element.attributes) {
        const std::string attr_path = child_path(child_path(path, "attributes"), attr.name);
        if (attr.position) {
            attr.position = placement.apply(*attr.position);
        }
        attr.rot = rotated_rot(attr.rot, placement.rotation, attr_path);
    }
}

Document transform_document(const Document& document, const Placement& placement) {
    Document result = document;
    if (placement.is_identity()) {
        return result;
    }

    for (size_t i = 0; i < result.plain.size(); ++i) {
        transform_primitive(result.plain[i], placement, index_path("plain", i));
    }

    for (auto& element : result.elements) {
        transform_element(element, placement);
    }

    for (auto& signal : result.signals) {
        const std::string path = child_path(child_path("signals", signal.name), "routing");
        for (size_t i = 0; i < signal.routing.size(); ++i) {
            transform_primitive(signal.routing[i], placement, index_path(path, i));
        }
    }

    return result;
}

} // namespace boardmerge
