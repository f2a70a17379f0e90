/**
 * @file Loader.cpp
 * @brief File loading implementation
 */

#include "boardmerge/Loader.hpp"
#include "boardmerge/Errors.hpp"

#include <nlohmann/json.hpp>
#include <toml++/toml.hpp>

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace boardmerge {

// ============================================================================
// Utility functions
// ============================================================================

namespace {

/**
 * @brief Convert string to lowercase.
 */
std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return result;
}

/**
 * @brief Check if file exists.
 */
bool file_exists(const std::string& path) {
    std::error_code ec;
    return fs::exists(path, ec) && fs::is_regular_file(path, ec);
}

/**
 * @brief Read entire file into string.
 */
std::string read_file(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw FileNotFoundError(path);
    }

    std::ostringstream ss;
    ss << file.rdbuf();
    return ss.str();
}

/**
 * @brief Convert toml++ value to nlohmann::json.
 */
Value toml_value_to_json(const toml::node& node) {
    switch (node.type()) {
        case toml::node_type::string:
            return Value(node.as_string()->get());

        case toml::node_type::integer:
            return Value(node.as_integer()->get());

        case toml::node_type::floating_point:
            return Value(node.as_floating_point()->get());

        case toml::node_type::boolean:
            return Value(node.as_boolean()->get());

        case toml::node_type::date: {
            std::ostringstream ss;
            ss << node.as_date()->get();
            return Value(ss.str());
        }

        case toml::node_type::time: {
            std::ostringstream ss;
            ss << node.as_time()->get();
            return Value(ss.str());
        }

        case toml::node_type::date_time: {
            std::ostringstream ss;
            ss << node.as_date_time()->get();
            return Value(ss.str());
        }

        case toml::node_type::array: {
            Value arr = Value::array();
            for (const auto& elem : *node.as_array()) {
                arr.push_back(toml_value_to_json(elem));
            }
            return arr;
        }

        case toml::node_type::table: {
            Value obj = Value::object();
            for (const auto& [key, val] : *node.as_table()) {
                obj[std::string(key.str())] = toml_value_to_json(val);
            }
            return obj;
        }

        default:
            return Value(nullptr);
    }
}

} // anonymous namespace

// ============================================================================
// Value files
// ============================================================================

Value load_json_file(const std::string& path) {
    if (!file_exists(path)) {
        throw FileNotFoundError(path);
    }

    std::string content = read_file(path);
    try {
        return nlohmann::json::parse(content);
    } catch (const nlohmann::json::parse_error& e) {
        throw DocumentFormatError(path, e.what());
    }
}

Value load_toml_file(const std::string& path) {
    if (!file_exists(path)) {
        throw FileNotFoundError(path);
    }

    toml::table table;
    try {
        table = toml::parse_file(path);
    } catch (const toml::parse_error& e) {
        std::ostringstream ss;
        ss << e.description() << " (line " << e.source().begin.line
           << ", column " << e.source().begin.column << ")";
        throw DocumentFormatError(path, ss.str());
    }

    return toml_value_to_json(table);
}

std::string get_file_extension(const std::string& path) {
    fs::path p(path);
    return to_lower(p.extension().string());
}

Value load_value_file(const std::string& path) {
    if (!file_exists(path)) {
        throw FileNotFoundError(path);
    }

    std::string ext = get_file_extension(path);
    if (ext == ".json") {
        return load_json_file(path);
    } else if (ext == ".toml") {
        return load_toml_file(path);
    }
    throw DocumentFormatError(path, "unsupported file type '" + ext +
                                        "' (expected .json or .toml)");
}

// ============================================================================
// Board documents
// ============================================================================

Document parse_document(const Value& j, const std::string& source) {
    if (!j.is_object()) {
        throw DocumentFormatError(source, "board document must be a JSON object, got " +
                                              type_name(j));
    }
    try {
        return j.get<Document>();
    } catch (const nlohmann::json::exception& e) {
        throw DocumentFormatError(source, e.what());
    } catch (const std::logic_error& e) {
        // coordinate and layer number range checks in the codec
        throw DocumentFormatError(source, e.what());
    }
}

Document load_document(const std::string& path) {
    return parse_document(load_json_file(path), path);
}

void save_document(const std::string& path, const Document& document) {
    const std::string text = Value(document).dump(2) + "\n";
    const fs::path target(path);
    const fs::path staging = target.string() + ".tmp";

    {
        std::ofstream out(staging, std::ios::binary | std::ios::trunc);
        if (!out) {
            throw BoardError("Cannot write to " + staging.string());
        }
        out << text;
        out.flush();
        if (!out) {
            throw BoardError("Failed writing " + staging.string());
        }
    }

    std::error_code ec;
    fs::rename(staging, target, ec);
    if (ec) {
        const std::string reason = ec.message();
        fs::remove(staging, ec);
        throw BoardError("Cannot move output into place at " + path + ": " + reason);
    }
}

} // namespace boardmerge
