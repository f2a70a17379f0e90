/**
 * @file PanelMerger.cpp
 * @brief Implementation of the merge orchestrator
 */

#include "boardmerge/PanelMerger.hpp"
#include "boardmerge/Diff.hpp"
#include "boardmerge/Errors.hpp"
#include "boardmerge/FeatureGate.hpp"
#include "boardmerge/Transform.hpp"

#include <spdlog/spdlog.h>

namespace boardmerge {

namespace {

/**
 * @brief Sections the board format cannot hold twice: adopt or require equal.
 */
void check_unique_section(const char* section, const Value& existing, const Value& incoming) {
    if (existing.is_null() || incoming.is_null()) return;
    if (auto d = first_divergence(existing, incoming, section)) {
        throw BoardConflictError(section, "at '" + d->path + "': " + d->describe());
    }
}

void adopt_section(Value& existing, const Value& incoming) {
    if (existing.is_null() && !incoming.is_null()) {
        existing = incoming;
    }
}

} // anonymous namespace

PanelMerger::PanelMerger(MergeOptions options)
    : options_(options)
    , libraries_(options.library_mode)
{}

void PanelMerger::add(const std::string& label, const Document& document,
                      const Placement& placement) {
    try {
        spdlog::info("Merging {} (rotation {}, offset {}mm, {}mm)", label,
                     to_degrees(placement.rotation), coord_to_mm(placement.offset.x),
                     coord_to_mm(placement.offset.y));

        validate_document(document);
        Document in = transform_document(document, placement);

        check_board_sections(in);
        rules_.check(in.designrules);
        std::vector<Library> libraries = libraries_.merge(output_.libraries, in.libraries);

        // Nothing below can fail: commit.
        output_.libraries = std::move(libraries);
        output_.designrules = rules_.rules();
        merge_board_sections(in, label);
        merge_layers(in);
        for (auto& primitive : in.plain) {
            output_.plain.push_back(std::move(primitive));
        }

        names_.begin_input();
        append_elements(in);
        append_signals(in);
        ++inputs_;

        spdlog::info("Merged {}: {} elements, {} signals, {} libraries in panel", label,
                     output_.elements.size(), output_.signals.size(),
                     output_.libraries.size());
    } catch (MergeError& e) {
        e.attach_input(label);
        throw;
    }
}

void PanelMerger::check_board_sections(const Document& in) const {
    if (inputs_ > 0 && in.version != output_.version) {
        throw BoardConflictError("version", "schema version mismatch: existing " +
                                                output_.version + ", incoming " + in.version);
    }
    check_unique_section("attributes", output_.attributes, in.attributes);
    check_unique_section("variantdefs", output_.variantdefs, in.variantdefs);
    check_unique_section("classes", output_.classes, in.classes);
}

void PanelMerger::merge_board_sections(const Document& in, const std::string& label) {
    if (inputs_ == 0) {
        output_.version = in.version;
    }

    for (const auto& [name, value] : in.settings) {
        auto it = output_.settings.find(name);
        if (it == output_.settings.end()) {
            output_.settings.emplace(name, value);
        } else if (it->second != value) {
            spdlog::warn("{}: incompatible setting '{}' ({} kept, {} ignored)", label, name,
                         render_value(it->second), render_value(value));
        }
    }

    adopt_section(output_.grid, in.grid);
    adopt_section(output_.autorouter, in.autorouter);
    adopt_section(output_.attributes, in.attributes);
    adopt_section(output_.variantdefs, in.variantdefs);
    adopt_section(output_.classes, in.classes);

    if (!in.compatibility.is_null()) {
        spdlog::warn("{}: compatibility notes ignored", label);
    }
    if (!in.errors.is_null()) {
        spdlog::debug("{}: DRC error list dropped", label);
    }
}

void PanelMerger::merge_layers(const Document& in) {
    // Only existence matters; differing layer details are ignored.
    for (const auto& layer : in.layers) {
        if (output_.find_layer(layer.number) == nullptr) {
            output_.layers.push_back(layer);
        }
    }
}

void PanelMerger::append_elements(Document& in) {
    for (auto& element : in.elements) {
        Reservation r = names_.reserve(NameKind::Element, element.name);
        if (r.changed) {
            spdlog::debug("Element '{}' renamed to '{}'", element.name, r.name);
            element.name = r.name;
            if (r.label) {
                apply_label(element, *r.label);
            }
        }
        output_.elements.push_back(std::move(element));
    }
}

void PanelMerger::append_signals(Document& in) {
    for (auto& signal : in.signals) {
        for (auto& contact : signal.contacts) {
            contact.element = names_.resolve(NameKind::Element, contact.element);
        }

        Reservation r = names_.reserve(NameKind::Signal, signal.name);
        if (r.changed) {
            spdlog::debug("Signal '{}' renamed to '{}'", signal.name, r.name);
            signal.name = r.name;
        }
        output_.signals.push_back(std::move(signal));
    }
}

Document PanelMerger::merge_all(const std::vector<MergeInput>& inputs, MergeOptions options) {
    PanelMerger merger(options);
    for (const auto& input : inputs) {
        merger.add(input.label, input.document, input.placement);
    }
    return merger.take_result();
}

} // namespace boardmerge
