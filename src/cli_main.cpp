#include <iostream>
#include <string>

#include <spdlog/spdlog.h>

#include "boardmerge/CommandLine.hpp"
#include "boardmerge/Errors.hpp"
#include "boardmerge/Loader.hpp"
#include "boardmerge/Log.hpp"
#include "boardmerge/PanelMerger.hpp"

using namespace boardmerge;

namespace {

constexpr int kExitUsage = 1;
constexpr int kExitMerge = 2;
constexpr int kExitIo = 3;

} // anonymous namespace

int main(int argc, char** argv) {
    try {
        CommandLine command_line = parse_command_line(argc, argv);
        if (command_line.help) {
            std::cout << usage() << "\n";
            return 0;
        }

        configure_logging(command_line.quiet     ? Verbosity::Quiet
                          : command_line.verbose ? Verbosity::Verbose
                                                 : Verbosity::Normal);

        Layout layout = resolve_layout(command_line);
        spdlog::info("Merging {} input(s) into {} (library mode {})", layout.inputs.size(),
                     layout.output, to_string(layout.library_mode));

        MergeOptions merge_options;
        merge_options.library_mode = layout.library_mode;
        PanelMerger merger(merge_options);

        // Inputs are read one at a time; the panel is written only if all merge.
        for (const auto& input : layout.inputs) {
            Document document = load_document(input.path);
            merger.add(input.path, document, input.placement);
        }

        save_document(layout.output, merger.result());
        spdlog::info("Wrote {} ({} elements, {} signals)", layout.output,
                     merger.result().elements.size(), merger.result().signals.size());
        return 0;

    } catch (const UsageError& ue) {
        std::cerr << "Error: " << ue.what() << "\n\n" << usage() << "\n";
        return kExitUsage;
    } catch (const MergeError& me) {
        std::cerr << "Error: " << me.what() << "\n";
        return kExitMerge;
    } catch (const BoardError& be) {
        std::cerr << "Error: " << be.what() << "\n";
        return kExitIo;
    } catch (const std::exception& ex) {
        std::cerr << "Error: " << ex.what() << "\n";
        return kExitUsage;
    }
}
