/**
 * @file Schema.hpp
 * @brief The supported subset of the board schema
 *
 * One table drives both the codec (which keys are recognised) and the
 * feature gate (what is allowed where).
 */

#ifndef BOARDMERGE_SCHEMA_HPP
#define BOARDMERGE_SCHEMA_HPP

#include <set>
#include <string>
#include <utility>
#include <vector>

namespace boardmerge {

/// Oldest supported schema version (first XML board format)
constexpr int kBaselineMajor = 6;
constexpr int kBaselineMinor = 0;

/// Valid layer numbers
constexpr int kMinLayer = 1;
constexpr int kMaxLayer = 255;

/**
 * @brief Shape of one primitive type
 */
struct PrimitiveSchema {
    std::string type;
    /// Anchor points as (x key, y key), in storage order
    std::vector<std::pair<std::string, std::string>> points;
    bool has_rot = false;
    /// False when the orientation is carried by the anchor points instead
    bool rotates_with_board = true;
    bool has_text = false;
    bool has_vertices = false;
    std::set<std::string> props;
};

/**
 * @brief Look up a primitive schema by type name
 * @return Schema, or nullptr if the type is not supported
 */
const PrimitiveSchema* find_primitive_schema(const std::string& type);

/**
 * @brief Where a primitive list lives inside a document
 */
enum class Section {
    Plain,
    Package,
    Routing
};

const char* section_name(Section section) noexcept;

/**
 * @brief Whether a primitive type may appear in a section
 */
bool allowed_in_section(const std::string& type, Section section);

/// Keys recognised on a polygon vertex besides x and y
const std::set<std::string>& vertex_props();

/// Keys recognised on a layer besides number and name
const std::set<std::string>& layer_props();

/// Keys recognised on an element besides the typed fields
const std::set<std::string>& element_props();

/// Keys recognised on a placed element attribute besides the typed fields
const std::set<std::string>& element_attribute_props();

/// Keys recognised on a contact reference besides element and pad
const std::set<std::string>& contactref_props();

/// Keys recognised on a signal besides name, contactrefs and routing
const std::set<std::string>& signal_props();

/**
 * @brief Parse "major.minor[.patch]" version text
 * @return (major, minor), or (-1, -1) if the text is malformed
 */
std::pair<int, int> parse_version(const std::string& version);

/**
 * @brief Whether a version is at or after the supported baseline
 */
bool is_supported_version(const std::string& version);

} // namespace boardmerge

#endif // BOARDMERGE_SCHEMA_HPP
