/**
 * @file LibraryReconciler.cpp
 * @brief Implementation of library merging
 */

#include "boardmerge/LibraryReconciler.hpp"
#include "boardmerge/Errors.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <set>

namespace boardmerge {

namespace {

std::optional<Divergence> compare_text(const std::string& existing,
                                       const std::string& incoming,
                                       const std::string& path) {
    return first_divergence(Value(existing), Value(incoming), path);
}

std::optional<Divergence> compare_extensions(const Extensions& existing,
                                             const Extensions& incoming,
                                             const std::string& path) {
    return first_divergence(Value(existing), Value(incoming), path);
}

} // anonymous namespace

LibraryMode parse_library_mode(const std::string& text) {
    if (text == "strict") return LibraryMode::Strict;
    if (text == "union") return LibraryMode::Union;
    throw UsageError("Unsupported library mode '" + text + "' (expected strict or union)");
}

const char* to_string(LibraryMode mode) noexcept {
    return mode == LibraryMode::Strict ? "strict" : "union";
}

std::optional<Divergence> package_divergence(const Package& existing,
                                             const Package& incoming,
                                             const std::string& path) {
    if (auto d = compare_text(existing.description, incoming.description,
                              child_path(path, "description"))) {
        return d;
    }
    if (auto d = compare_extensions(existing.extensions, incoming.extensions, path)) {
        return d;
    }
    return first_divergence_unordered(Value(existing.primitives), Value(incoming.primitives),
                                      child_path(path, "primitives"));
}

std::optional<Divergence> library_divergence(const Library& existing,
                                             const Library& incoming) {
    if (auto d = compare_text(existing.description, incoming.description, "description")) {
        return d;
    }
    if (auto d = compare_extensions(existing.extensions, incoming.extensions, "")) {
        return d;
    }

    std::set<std::string> names;
    for (const auto& p : existing.packages) names.insert(p.name);
    for (const auto& p : incoming.packages) names.insert(p.name);

    for (const auto& name : names) {
        const std::string path = child_path("packages", name);
        const Package* ep = existing.find_package(name);
        const Package* ip = incoming.find_package(name);
        if (ep == nullptr) {
            return Divergence{path, "<missing>", "package " + name};
        }
        if (ip == nullptr) {
            return Divergence{path, "package " + name, "<missing>"};
        }
        if (auto d = package_divergence(*ep, *ip, path)) {
            return d;
        }
    }
    return std::nullopt;
}

std::vector<Library> LibraryReconciler::merge(const std::vector<Library>& existing,
                                              const std::vector<Library>& incoming) const {
    std::vector<Library> merged = existing;

    for (const auto& library : incoming) {
        auto it = std::find_if(merged.begin(), merged.end(),
                               [&](const Library& l) { return l.name == library.name; });
        if (it == merged.end()) {
            spdlog::debug("Adding library '{}' ({} packages)", library.name,
                          library.packages.size());
            merged.push_back(library);
            continue;
        }
        merge_library(*it, library);
    }

    return merged;
}

void LibraryReconciler::merge_library(Library& existing, const Library& incoming) const {
    if (mode_ == LibraryMode::Strict) {
        if (auto d = library_divergence(existing, incoming)) {
            throw LibraryConflictError(existing.name, d->path, d->describe());
        }
        spdlog::debug("Library '{}' already present and identical, keeping one copy",
                      existing.name);
        return;
    }

    // Union mode: library-level fields must agree, packages are combined.
    if (existing.description.empty()) {
        existing.description = incoming.description;
    }
    if (auto d = compare_extensions(existing.extensions, incoming.extensions, "")) {
        throw LibraryConflictError(existing.name, d->path, d->describe());
    }

    for (const auto& package : incoming.packages) {
        const std::string path = child_path("packages", package.name);
        const Package* current = existing.find_package(package.name);
        if (current == nullptr) {
            spdlog::debug("Library '{}': adding package '{}'", existing.name, package.name);
            existing.packages.push_back(package);
            continue;
        }
        if (auto d = package_divergence(*current, package, path)) {
            throw LibraryConflictError(
                existing.name, d->path,
                "embedded libraries contain different packages of the same name " +
                    package.name + " (" + d->describe() + ")");
        }
    }
}

} // namespace boardmerge
