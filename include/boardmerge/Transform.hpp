/**
 * @file Transform.hpp
 * @brief Geometry transform of a whole board document
 */

#ifndef BOARDMERGE_TRANSFORM_HPP
#define BOARDMERGE_TRANSFORM_HPP

#include "boardmerge/Document.hpp"
#include "boardmerge/Geometry.hpp"

namespace boardmerge {

/**
 * @brief Rotate and translate every placed coordinate of a document
 *
 * Applies `placement` to element origins and their placed attributes, to
 * all plain geometry and to signal routing (wires, vias, polygon vertices).
 * Orientation attributes of elements, their attributes and plain texts are
 * rotated too; mirrored constructs turn the other way. Package interiors in
 * the libraries are package-local and are left untouched.
 *
 * @param document Source document (not modified)
 * @param placement Rotation about the origin followed by an offset
 * @return Transformed copy
 * @throws UnsupportedFeatureError if an orientation attribute is malformed
 */
Document transform_document(const Document& document, const Placement& placement);

/**
 * @brief Apply a placement to one primitive in place
 * @param path Dot-path used if an orientation attribute is malformed
 */
void transform_primitive(Primitive& primitive, const Placement& placement,
                         const std::string& path);

/**
 * @brief Apply a placement to one element in place
 */
void transform_element(Element& element, const Placement& placement);

} // namespace boardmerge

#endif // BOARDMERGE_TRANSFORM_HPP
