/**
 * @file Loader.hpp
 * @brief File loading and saving
 *
 * Implements:
 * - Board documents in their JSON rendition (using nlohmann::json)
 * - Value files for layouts: JSON (nlohmann::json) or TOML (toml++),
 *   selected by extension
 */

#ifndef BOARDMERGE_LOADER_HPP
#define BOARDMERGE_LOADER_HPP

#include "boardmerge/Document.hpp"
#include "boardmerge/Value.hpp"
#include <string>

namespace boardmerge {

// ============================================================================
// Value files
// ============================================================================

/**
 * @brief Load a JSON file
 *
 * @param path Path to the JSON file
 * @return Parsed Value
 * @throws FileNotFoundError if file doesn't exist
 * @throws DocumentFormatError if JSON syntax is invalid
 */
Value load_json_file(const std::string& path);

/**
 * @brief Load a TOML file and convert it to a Value
 *
 * TOML tables become objects, arrays of tables become arrays of objects.
 * Dates and times become their string form.
 *
 * @throws FileNotFoundError if file doesn't exist
 * @throws DocumentFormatError if TOML syntax is invalid
 */
Value load_toml_file(const std::string& path);

/**
 * @brief Load a value file, auto-detecting format by extension
 *
 * ".json" → JSON, ".toml" → TOML.
 *
 * @throws FileNotFoundError if file doesn't exist
 * @throws DocumentFormatError for syntax errors or other extensions
 */
Value load_value_file(const std::string& path);

/**
 * @brief Get file extension (lowercase)
 *
 * @return Extension including the dot (e.g., ".json"), or empty if none
 */
std::string get_file_extension(const std::string& path);

// ============================================================================
// Board documents
// ============================================================================

/**
 * @brief Decode a board document from its JSON rendition
 *
 * @param j Parsed JSON
 * @param source Label for error messages (usually the file path)
 * @throws DocumentFormatError if a required key is missing or a value has
 *         the wrong type
 */
Document parse_document(const Value& j, const std::string& source);

/**
 * @brief Read a board document from a JSON file
 *
 * @throws FileNotFoundError if file doesn't exist
 * @throws DocumentFormatError for syntax or schema-type errors
 */
Document load_document(const std::string& path);

/**
 * @brief Write a board document as JSON
 *
 * The document is written to a temporary file next to `path` and renamed
 * into place, so a failed write never leaves a partial output file.
 *
 * @throws BoardError if the file cannot be written
 */
void save_document(const std::string& path, const Document& document);

} // namespace boardmerge

#endif // BOARDMERGE_LOADER_HPP
