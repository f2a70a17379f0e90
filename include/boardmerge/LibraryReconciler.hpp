/**
 * @file LibraryReconciler.hpp
 * @brief Merging of embedded libraries across inputs
 *
 * Boards embed copies of the libraries their elements use. When several
 * inputs embed a library of the same name, the copies must describe the same
 * parts; picking one of two different definitions would silently change
 * footprints on the panel.
 */

#ifndef BOARDMERGE_LIBRARYRECONCILER_HPP
#define BOARDMERGE_LIBRARYRECONCILER_HPP

#include "boardmerge/Diff.hpp"
#include "boardmerge/Document.hpp"

#include <optional>
#include <string>
#include <vector>

namespace boardmerge {

/**
 * @brief How same-named libraries are combined
 */
enum class LibraryMode {
    /// Same-named libraries must be identical as a whole
    Strict,
    /// Same-named libraries are combined package by package; shared
    /// packages must be identical
    Union
};

/**
 * @brief Parse "strict" or "union"
 * @throws UsageError for any other text
 */
LibraryMode parse_library_mode(const std::string& text);

const char* to_string(LibraryMode mode) noexcept;

/**
 * @brief Deep comparison of two packages
 *
 * Primitive lists are compared as unordered collections.
 *
 * @param path Path prefix for the report (e.g. "packages.R0805")
 * @return First divergence, or nullopt if the packages are identical
 */
std::optional<Divergence> package_divergence(const Package& existing,
                                             const Package& incoming,
                                             const std::string& path);

/**
 * @brief Deep comparison of two libraries
 *
 * Packages are matched by name; a package present on one side only is a
 * divergence.
 *
 * @return First divergence, or nullopt if the libraries are identical
 */
std::optional<Divergence> library_divergence(const Library& existing,
                                             const Library& incoming);

/**
 * @brief Merges incoming library sets into an accumulated one
 */
class LibraryReconciler {
public:
    explicit LibraryReconciler(LibraryMode mode = LibraryMode::Strict) : mode_(mode) {}

    LibraryMode mode() const noexcept { return mode_; }

    /**
     * @brief Merge incoming libraries into existing ones
     *
     * - Library absent from existing: appended
     * - Present and identical: existing copy kept (deduplicated)
     * - Present and different: LibraryConflictError (strict mode), or
     *   package-wise union with conflicting shared packages (union mode)
     *
     * @param existing Libraries already committed to the output
     * @param incoming Libraries of the input being merged
     * @return Merged libraries; existing is never modified
     * @throws LibraryConflictError naming the library and first divergence
     */
    std::vector<Library> merge(const std::vector<Library>& existing,
                               const std::vector<Library>& incoming) const;

private:
    void merge_library(Library& existing, const Library& incoming) const;

    LibraryMode mode_;
};

} // namespace boardmerge

#endif // BOARDMERGE_LIBRARYRECONCILER_HPP
