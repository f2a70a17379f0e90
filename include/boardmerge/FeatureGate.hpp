/**
 * @file FeatureGate.hpp
 * @brief Rejection of documents outside the supported schema subset
 *
 * The gate runs on each input before anything else touches it, so a
 * document the merge engine does not fully understand can never leave a
 * half-merged trace in the output.
 */

#ifndef BOARDMERGE_FEATUREGATE_HPP
#define BOARDMERGE_FEATUREGATE_HPP

#include "boardmerge/Document.hpp"

namespace boardmerge {

/**
 * @brief Validate a document against the supported schema
 *
 * Checks, in document order:
 * - schema version present and at or after the supported baseline
 * - no unrecognised keys on any entity
 * - every primitive type supported and allowed in its section
 * - every orientation attribute well formed
 * - layer numbers within range
 * - element and signal names unique, package names unique per library
 * - element library/package references and contact references resolve
 *
 * @throws UnsupportedFeatureError naming the offending construct
 * @throws InvalidReferenceError naming the dangling reference
 */
void validate_document(const Document& document);

} // namespace boardmerge

#endif // BOARDMERGE_FEATUREGATE_HPP
