/**
 * @file PanelMerger.hpp
 * @brief Merge orchestrator: folds input boards into one panel document
 *
 * Per input, in the order supplied:
 * 1. feature gate
 * 2. geometry transform (rotation, then offset)
 * 3. board-global sections (version, attributes, variantdefs, classes)
 * 4. design rule validation against the accumulated set
 * 5. library reconciliation
 * 6. element and signal naming, then append to the output
 *
 * Steps 1-5 only read the run state, so an input that fails leaves the
 * merger exactly as it was before that input. The caller still treats any
 * failure as fatal for the run.
 */

#ifndef BOARDMERGE_PANELMERGER_HPP
#define BOARDMERGE_PANELMERGER_HPP

#include "boardmerge/DesignRules.hpp"
#include "boardmerge/Document.hpp"
#include "boardmerge/Geometry.hpp"
#include "boardmerge/LibraryReconciler.hpp"
#include "boardmerge/NameRegistry.hpp"

#include <string>
#include <vector>

namespace boardmerge {

struct MergeOptions {
    LibraryMode library_mode = LibraryMode::Strict;
};

/**
 * @brief One input of a merge run
 */
struct MergeInput {
    /// Label used in diagnostics (usually the file path)
    std::string label;
    Document document;
    Placement placement;
};

class PanelMerger {
public:
    explicit PanelMerger(MergeOptions options = {});

    /**
     * @brief Fold one input into the panel
     *
     * @param label Input label for diagnostics
     * @param document Parsed input board (not modified)
     * @param placement Rotation and offset for this input
     * @throws MergeError (any subclass) with input() set to label
     */
    void add(const std::string& label, const Document& document, const Placement& placement);

    /// Number of inputs merged so far
    size_t input_count() const noexcept { return inputs_; }

    /// Panel assembled so far
    const Document& result() const noexcept { return output_; }

    /// Move the assembled panel out of the merger
    Document take_result() { return std::move(output_); }

    const NameRegistry& names() const noexcept { return names_; }

    /**
     * @brief Merge a whole input list
     *
     * @return The panel, only if every input merged
     * @throws MergeError for the first failing input
     */
    static Document merge_all(const std::vector<MergeInput>& inputs, MergeOptions options = {});

private:
    void check_board_sections(const Document& in) const;
    void merge_board_sections(const Document& in, const std::string& label);
    void merge_layers(const Document& in);
    void append_elements(Document& in);
    void append_signals(Document& in);

    MergeOptions options_;
    LibraryReconciler libraries_;
    DesignRuleValidator rules_;
    NameRegistry names_;
    Document output_;
    size_t inputs_ = 0;
};

} // namespace boardmerge

#endif // BOARDMERGE_PANELMERGER_HPP
