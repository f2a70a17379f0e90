/**
 * @file Layout.cpp
 * @brief Implementation of layout parsing
 */

#include "boardmerge/Layout.hpp"
#include "boardmerge/Errors.hpp"
#include "boardmerge/Loader.hpp"

#include <filesystem>
#include <set>

namespace fs = std::filesystem;

namespace boardmerge {

namespace {

const std::string& fetch_arg(const std::vector<std::string>& args, size_t i) {
    if (i >= args.size()) {
        throw UsageError("Too few arguments specified. Expected at least one more");
    }
    return args[i];
}

std::string offset_text(const Value& v, const std::string& where) {
    if (!v.is_string()) {
        throw UsageError(where + ": offsets must be strings with units, e.g. \"10mm\"");
    }
    return v.get<std::string>();
}

Rotation rotation_value(const Value& v, const std::string& where) {
    if (fits_int(v)) {
        return rotation_from_degrees(v.get<int>());
    }
    if (v.is_string()) {
        return parse_rotation(v.get<std::string>());
    }
    throw UsageError(where + ": rotation must be 0, 90, 180 or 270");
}

std::string string_value(const Value& v, const std::string& where) {
    if (!v.is_string()) {
        throw UsageError(where + " must be a string, got " + type_name(v));
    }
    return v.get<std::string>();
}

} // anonymous namespace

Layout parse_merge_args(const std::vector<std::string>& args) {
    Layout layout;
    layout.output = fetch_arg(args, 0);
    if (!layout.output.empty() && layout.output[0] == '-') {
        throw UsageError("Expected output file, got option " + layout.output);
    }

    size_t i = 1;
    while (i < args.size()) {
        const std::string& arg = args[i];
        if (!arg.empty() && arg[0] == '-') {
            // Apply one option to the current input file
            if (layout.inputs.empty()) {
                throw UsageError("Option " + arg + " must follow an input file");
            }
            InputSpec& input = layout.inputs.back();
            const std::string& value = fetch_arg(args, i + 1);
            if (arg == "--offx") {
                input.placement.offset.x = parse_offset(value);
            } else if (arg == "--offy") {
                input.placement.offset.y = parse_offset(value);
            } else if (arg == "--rotation") {
                input.placement.rotation = parse_rotation(value);
            } else {
                throw UsageError("Unsupported option " + arg);
            }
            i += 2;
        } else {
            // Start with new input file
            InputSpec input;
            input.path = arg;
            layout.inputs.push_back(std::move(input));
            i += 1;
        }
    }

    if (layout.inputs.empty()) {
        throw UsageError("No input files specified");
    }
    return layout;
}

Layout layout_from_value(const Value& v, const std::string& source) {
    if (!v.is_object()) {
        throw UsageError(source + ": layout must be a table/object");
    }

    static const std::set<std::string> known = {"output", "library_mode", "input"};
    for (auto it = v.begin(); it != v.end(); ++it) {
        if (known.count(it.key()) == 0) {
            throw UsageError(source + ": unknown layout key '" + it.key() + "'");
        }
    }

    Layout layout;
    if (!v.contains("output")) {
        throw UsageError(source + ": missing 'output'");
    }
    layout.output = string_value(v.at("output"), source + ": output");
    if (v.contains("library_mode")) {
        layout.library_mode =
            parse_library_mode(string_value(v.at("library_mode"), source + ": library_mode"));
    }

    if (!v.contains("input") || !v.at("input").is_array() || v.at("input").empty()) {
        throw UsageError(source + ": at least one [[input]] entry is required");
    }

    static const std::set<std::string> input_keys = {"path", "offx", "offy", "rotation"};
    const Value& inputs = v.at("input");
    for (size_t i = 0; i < inputs.size(); ++i) {
        const Value& entry = inputs[i];
        const std::string where = source + ": input[" + std::to_string(i) + "]";
        if (!entry.is_object()) {
            throw UsageError(where + " must be a table/object");
        }
        for (auto it = entry.begin(); it != entry.end(); ++it) {
            if (input_keys.count(it.key()) == 0) {
                throw UsageError(where + ": unknown key '" + it.key() + "'");
            }
        }
        if (!entry.contains("path")) {
            throw UsageError(where + ": missing 'path'");
        }

        InputSpec input;
        input.path = string_value(entry.at("path"), where + ".path");
        if (entry.contains("offx")) {
            input.placement.offset.x = parse_offset(offset_text(entry.at("offx"), where));
        }
        if (entry.contains("offy")) {
            input.placement.offset.y = parse_offset(offset_text(entry.at("offy"), where));
        }
        if (entry.contains("rotation")) {
            input.placement.rotation = rotation_value(entry.at("rotation"), where);
        }
        layout.inputs.push_back(std::move(input));
    }

    return layout;
}

Layout load_layout(const std::string& path) {
    Layout layout = layout_from_value(load_value_file(path), path);

    const fs::path base = fs::path(path).parent_path();
    auto resolve = [&](const std::string& p) {
        fs::path candidate(p);
        if (candidate.is_relative() && !base.empty()) {
            return (base / candidate).string();
        }
        return p;
    };

    layout.output = resolve(layout.output);
    for (auto& input : layout.inputs) {
        input.path = resolve(input.path);
    }
    return layout;
}

} // namespace boardmerge
