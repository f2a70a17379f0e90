/**
 * @file Errors.hpp
 * @brief Exception types for boardmerge
 *
 * Error taxonomy:
 * - BoardError: Base class for everything boardmerge throws
 * - FileNotFoundError: Input, output or layout file missing
 * - DocumentFormatError: JSON/TOML syntax or schema-type errors
 * - UsageError: Malformed command line or layout description
 * - MergeError: Base class for semantic merge failures
 *   - UnsupportedFeatureError: Construct outside the supported schema
 *   - InvalidReferenceError: Dangling library/package/element reference
 *   - LibraryConflictError: Same-named library defined differently
 *   - DesignRuleMismatchError: Design rule sets differ
 *   - BoardConflictError: Board-global section differs between inputs
 */

#ifndef BOARDMERGE_ERRORS_HPP
#define BOARDMERGE_ERRORS_HPP

#include <stdexcept>
#include <string>
#include <vector>
#include <sstream>

namespace boardmerge {

/**
 * @brief Base class for all boardmerge exceptions
 */
class BoardError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief File not found
 */
class FileNotFoundError : public BoardError {
public:
    /**
     * @brief Construct with file path
     * @param path Path to the missing file
     */
    explicit FileNotFoundError(std::string path)
        : BoardError("File not found: " + path)
        , path_(std::move(path))
    {}

    /**
     * @brief Get the file path that was not found
     */
    const std::string& path() const noexcept {
        return path_;
    }

private:
    std::string path_;
};

/**
 * @brief Board or layout file could not be decoded
 *
 * Raised for syntax errors as well as for values of the wrong JSON type.
 */
class DocumentFormatError : public BoardError {
public:
    /**
     * @brief Construct with file path and error details
     * @param file Path (or label) of the offending document
     * @param details Detailed error message from the parser
     */
    DocumentFormatError(std::string file, std::string details)
        : BoardError("Format error in '" + file + "': " + details)
        , file_(std::move(file))
        , details_(std::move(details))
    {}

    const std::string& file() const noexcept {
        return file_;
    }

    const std::string& details() const noexcept {
        return details_;
    }

private:
    std::string file_;
    std::string details_;
};

/**
 * @brief Malformed command line or layout description
 */
class UsageError : public BoardError {
public:
    using BoardError::BoardError;
};

// ============================================================================
// Merge errors
// ============================================================================

/**
 * @brief Base class for semantic merge failures
 *
 * Every merge failure is fatal to the run. The orchestrator attaches the
 * label of the input being merged before the error reaches the caller, so
 * what() reads "<input>: <reason>" once an input is known.
 */
class MergeError : public BoardError {
public:
    explicit MergeError(std::string reason)
        : BoardError(reason)
        , reason_(std::move(reason))
        , message_(reason_)
    {}

    const char* what() const noexcept override {
        return message_.c_str();
    }

    /**
     * @brief Reason without the input label
     */
    const std::string& reason() const noexcept {
        return reason_;
    }

    /**
     * @brief Label of the input that failed, empty if not yet known
     */
    const std::string& input() const noexcept {
        return input_;
    }

    /**
     * @brief Attach the failing input label (first caller wins)
     */
    void attach_input(const std::string& input) {
        if (!input_.empty()) return;
        input_ = input;
        message_ = input_ + ": " + reason_;
    }

private:
    std::string reason_;
    std::string input_;
    std::string message_;
};

/**
 * @brief Document uses a construct outside the supported schema subset
 */
class UnsupportedFeatureError : public MergeError {
public:
    /**
     * @param construct Dot-path of the offending construct
     *                  (e.g. "elements.U1.foo")
     * @param detail What is wrong with it
     */
    UnsupportedFeatureError(std::string construct, std::string detail)
        : MergeError("Unsupported feature at '" + construct + "': " + detail)
        , construct_(std::move(construct))
        , detail_(std::move(detail))
    {}

    const std::string& construct() const noexcept {
        return construct_;
    }

    const std::string& detail() const noexcept {
        return detail_;
    }

private:
    std::string construct_;
    std::string detail_;
};

/**
 * @brief A reference inside one document does not resolve
 */
class InvalidReferenceError : public MergeError {
public:
    /**
     * @param construct Dot-path of the referring construct
     * @param target The name that failed to resolve
     */
    InvalidReferenceError(std::string construct, std::string target)
        : MergeError("Unresolved reference at '" + construct + "' to '" + target + "'")
        , construct_(std::move(construct))
        , target_(std::move(target))
    {}

    const std::string& construct() const noexcept {
        return construct_;
    }

    const std::string& target() const noexcept {
        return target_;
    }

private:
    std::string construct_;
    std::string target_;
};

/**
 * @brief Two inputs define the same-named library differently
 */
class LibraryConflictError : public MergeError {
public:
    /**
     * @param library Name of the conflicting library
     * @param path Dot-path of the first divergence inside the library
     * @param detail Both sides of the divergence
     */
    LibraryConflictError(std::string library, std::string path, std::string detail)
        : MergeError("Library '" + library + "' differs at '" + path + "': " + detail)
        , library_(std::move(library))
        , path_(std::move(path))
        , detail_(std::move(detail))
    {}

    const std::string& library() const noexcept {
        return library_;
    }

    const std::string& path() const noexcept {
        return path_;
    }

    const std::string& detail() const noexcept {
        return detail_;
    }

private:
    std::string library_;
    std::string path_;
    std::string detail_;
};

/**
 * @brief Design rule sets of two inputs differ
 *
 * Contains the list of all differing parameters.
 */
class DesignRuleMismatchError : public MergeError {
public:
    /**
     * @brief Construct with list of differing parameters
     * @param parameters Names of the parameters that differ
     */
    explicit DesignRuleMismatchError(std::vector<std::string> parameters)
        : MergeError(format_message(parameters))
        , parameters_(std::move(parameters))
    {}

    /**
     * @brief Get the list of differing parameters
     */
    const std::vector<std::string>& parameters() const noexcept {
        return parameters_;
    }

private:
    std::vector<std::string> parameters_;

    static std::string format_message(const std::vector<std::string>& params) {
        std::ostringstream oss;
        oss << "Design rules must be equivalent, differing parameters: [";
        for (size_t i = 0; i < params.size(); ++i) {
            if (i > 0) oss << ", ";
            oss << "'" << params[i] << "'";
        }
        oss << "]";
        return oss.str();
    }
};

/**
 * @brief A board-global section differs between inputs
 *
 * Covers the schema version and the attributes, variantdefs and classes
 * sections, which the board format cannot hold more than once.
 */
class BoardConflictError : public MergeError {
public:
    /**
     * @param section Section name (e.g. "classes")
     * @param detail Where and how the section differs
     */
    BoardConflictError(std::string section, std::string detail)
        : MergeError("Section '" + section + "' differs between inputs: " + detail)
        , section_(std::move(section))
    {}

    const std::string& section() const noexcept {
        return section_;
    }

private:
    std::string section_;
};

} // namespace boardmerge

#endif // BOARDMERGE_ERRORS_HPP
