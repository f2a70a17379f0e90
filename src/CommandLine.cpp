/**
 * @file CommandLine.cpp
 * @brief Implementation of command-line parsing
 */

#include "boardmerge/CommandLine.hpp"
#include "boardmerge/Errors.hpp"

#include <cxxopts.hpp>

namespace boardmerge {

namespace {

cxxopts::Options build_options() {
    cxxopts::Options options("boardmerge", "Merge board designs into one panel");
    options.positional_help(
        "output-file [in-file [--offx X] [--offy Y] [--rotation R]]...");

    options.add_options()
        ("l,layout", "TOML/JSON layout file instead of positional groups",
         cxxopts::value<std::string>())
        ("library-mode", "How same-named libraries combine: strict|union",
         cxxopts::value<std::string>())
        ("v,verbose", "Log per-input progress and renames")
        ("q,quiet", "Log errors only")
        ("h,help", "Show help");

    return options;
}

/**
 * @brief Whether a global option consumes the following token
 */
bool takes_value(const std::string& token) {
    return token == "-l" || token == "--layout" || token == "--library-mode";
}

} // anonymous namespace

std::string usage() {
    std::string text = build_options().help();
    text += "\nInput options (apply to the preceding in-file):\n"
            "  --offx X        horizontal offset with units, e.g. 50mm\n"
            "  --offy Y        vertical offset with units, e.g. -12.5mm\n"
            "  --rotation R    rotation about the origin: 0, 90, 180 or 270\n";
    return text;
}

CommandLine parse_command_line(int argc, const char* const* argv) {
    // Global options end at the first positional token.
    int split = 1;
    bool separator = false;
    while (split < argc) {
        const std::string token = argv[split];
        if (token == "--") {
            separator = true;
            break;
        }
        if (token.size() < 2 || token[0] != '-') {
            break;
        }
        split += takes_value(token) ? 2 : 1;
    }
    if (split > argc) {
        throw UsageError(std::string("Option ") + argv[argc - 1] + " requires a value");
    }

    std::vector<const char*> prefix(argv, argv + split);
    int prefix_argc = static_cast<int>(prefix.size());
    const char** prefix_argv = prefix.data();

    CommandLine command_line;
    cxxopts::Options options = build_options();
    try {
        auto result = options.parse(prefix_argc, prefix_argv);
        command_line.help = result.count("help") > 0;
        command_line.verbose = result.count("verbose") > 0;
        command_line.quiet = result.count("quiet") > 0;
        if (result.count("layout")) {
            command_line.layout_path = result["layout"].as<std::string>();
        }
        if (result.count("library-mode")) {
            command_line.library_mode =
                parse_library_mode(result["library-mode"].as<std::string>());
        }
    } catch (const UsageError&) {
        throw;
    } catch (const std::exception& e) {
        throw UsageError(e.what());
    }

    if (command_line.verbose && command_line.quiet) {
        throw UsageError("--verbose and --quiet are mutually exclusive");
    }

    for (int i = split + (separator ? 1 : 0); i < argc; ++i) {
        command_line.merge_args.emplace_back(argv[i]);
    }
    return command_line;
}

Layout resolve_layout(const CommandLine& command_line) {
    Layout layout;
    if (command_line.layout_path) {
        if (!command_line.merge_args.empty()) {
            throw UsageError("A layout file and positional merge arguments can't be combined");
        }
        layout = load_layout(*command_line.layout_path);
    } else {
        layout = parse_merge_args(command_line.merge_args);
    }

    if (command_line.library_mode) {
        layout.library_mode = *command_line.library_mode;
    }
    return layout;
}

} // namespace boardmerge
