/**
 * @file FeatureGate.cpp
 * @brief Implementation of the feature support gate
 */

#include "boardmerge/FeatureGate.hpp"
#include "boardmerge/Diff.hpp"
#include "boardmerge/Errors.hpp"
#include "boardmerge/Schema.hpp"

#include <set>

namespace boardmerge {

namespace {

void check_extensions(const Extensions& extensions, const std::string& path) {
    if (extensions.empty()) return;
    const auto& [key, value] = *extensions.begin();
    throw UnsupportedFeatureError(child_path(path, key),
                                  "unsupported attribute or section (" + render_value(value) + ")");
}

void check_rot(const std::string& rot, const std::string& path) {
    if (!Orientation::parse(rot)) {
        throw UnsupportedFeatureError(child_path(path, "rot"),
                                      "unsupported rotation attribute '" + rot + "'");
    }
}

class Gate {
public:
    explicit Gate(const Document& document) : doc_(document) {
        for (const auto& layer : doc_.layers) {
            declared_layers_.insert(layer.number);
        }
    }

    void run() {
        check_version();
        check_extensions(doc_.extensions, "");
        check_layers();
        check_libraries();
        check_primitives(doc_.plain, Section::Plain, "plain");
        check_elements();
        check_signals();
        if (doc_.designrules) {
            check_extensions(doc_.designrules->extensions, "designrules");
        }
    }

private:
    void check_version() const {
        if (doc_.version.empty()) {
            throw UnsupportedFeatureError("version", "missing schema version");
        }
        if (parse_version(doc_.version).first < 0) {
            throw UnsupportedFeatureError("version",
                                          "malformed schema version '" + doc_.version + "'");
        }
        if (!is_supported_version(doc_.version)) {
            throw UnsupportedFeatureError(
                "version", "schema version " + doc_.version + " predates the supported baseline " +
                               std::to_string(kBaselineMajor) + "." +
                               std::to_string(kBaselineMinor));
        }
    }

    void check_layer_number(int number, const std::string& path) const {
        if (number < kMinLayer || number > kMaxLayer) {
            throw UnsupportedFeatureError(path, "layer number " + std::to_string(number) +
                                                    " outside supported range");
        }
        if (!declared_layers_.empty() && declared_layers_.count(number) == 0) {
            throw UnsupportedFeatureError(path, "layer " + std::to_string(number) +
                                                    " is not declared");
        }
    }

    void check_layer_prop(const Properties& props, const std::string& path) const {
        auto it = props.find("layer");
        if (it == props.end()) return;
        if (!fits_int(it->second)) {
            throw UnsupportedFeatureError(child_path(path, "layer"),
                                          "layer must be an integer in range, got " +
                                              render_value(it->second));
        }
        check_layer_number(it->second.get<int>(), child_path(path, "layer"));
    }

    void check_layers() const {
        std::set<int> seen;
        for (const auto& layer : doc_.layers) {
            const std::string path = child_path("layers", std::to_string(layer.number));
            check_extensions(layer.extensions, path);
            if (layer.number < kMinLayer || layer.number > kMaxLayer) {
                throw UnsupportedFeatureError(path, "layer number outside supported range");
            }
            if (!seen.insert(layer.number).second) {
                throw UnsupportedFeatureError(path, "duplicate layer definition");
            }
        }
    }

    void check_primitive(const Primitive& p, Section section, const std::string& path) const {
        const PrimitiveSchema* schema = find_primitive_schema(p.type);
        if (schema == nullptr) {
            throw UnsupportedFeatureError(path, "unsupported primitive type '" + p.type + "'");
        }
        if (!allowed_in_section(p.type, section)) {
            throw UnsupportedFeatureError(path, "'" + p.type + "' is not allowed in " +
                                                    section_name(section));
        }
        check_extensions(p.extensions, path);
        if (schema->has_rot) {
            check_rot(p.rot, path);
        }
        check_layer_prop(p.props, path);
        for (size_t i = 0; i < p.vertices.size(); ++i) {
            check_extensions(p.vertices[i].extensions, index_path(child_path(path, "vertices"), i));
        }
    }

    void check_primitives(const std::vector<Primitive>& primitives, Section section,
                          const std::string& path) const {
        for (size_t i = 0; i < primitives.size(); ++i) {
            check_primitive(primitives[i], section, index_path(path, i));
        }
    }

    void check_libraries() const {
        std::set<std::string> names;
        for (const auto& library : doc_.libraries) {
            const std::string path = child_path("libraries", library.name);
            check_extensions(library.extensions, path);
            if (!names.insert(library.name).second) {
                throw UnsupportedFeatureError(path, "duplicate library name");
            }

            std::set<std::string> packages;
            for (const auto& package : library.packages) {
                const std::string ppath = child_path(child_path(path, "packages"), package.name);
                check_extensions(package.extensions, ppath);
                if (!packages.insert(package.name).second) {
                    throw UnsupportedFeatureError(ppath, "duplicate package name");
                }
                check_primitives(package.primitives, Section::Package,
                                 child_path(ppath, "primitives"));
            }
        }
    }

    void check_elements() const {
        std::set<std::string> names;
        for (const auto& element : doc_.elements) {
            const std::string path = child_path("elements", element.name);
            check_extensions(element.extensions, path);
            if (!names.insert(element.name).second) {
                throw UnsupportedFeatureError(path, "duplicate element name");
            }
            check_rot(element.rot, path);

            for (const auto& attr : element.attributes) {
                const std::string apath = child_path(child_path(path, "attributes"), attr.name);
                check_extensions(attr.extensions, apath);
                check_rot(attr.rot, apath);
                check_layer_prop(attr.props, apath);
            }

            const Library* library = doc_.find_library(element.library);
            if (library == nullptr) {
                throw InvalidReferenceError(child_path(path, "library"), element.library);
            }
            if (library->find_package(element.package) == nullptr) {
                throw InvalidReferenceError(child_path(path, "package"),
                                            element.library + ":" + element.package);
            }
        }
    }

    void check_signals() const {
        std::set<std::string> names;
        for (const auto& signal : doc_.signals) {
            const std::string path = child_path("signals", signal.name);
            check_extensions(signal.extensions, path);
            if (!names.insert(signal.name).second) {
                throw UnsupportedFeatureError(path, "duplicate signal name");
            }

            for (size_t i = 0; i < signal.contacts.size(); ++i) {
                const ContactRef& contact = signal.contacts[i];
                const std::string cpath = index_path(child_path(path, "contactrefs"), i);
                check_extensions(contact.extensions, cpath);
                if (doc_.find_element(contact.element) == nullptr) {
                    throw InvalidReferenceError(child_path(cpath, "element"), contact.element);
                }
            }
            check_primitives(signal.routing, Section::Routing, child_path(path, "routing"));
        }
    }

    const Document& doc_;
    std::set<int> declared_layers_;
};

} // anonymous namespace

void validate_document(const Document& document) {
    Gate(document).run();
}

} // namespace boardmerge
