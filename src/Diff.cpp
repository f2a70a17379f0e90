/**
 * @file Diff.cpp
 * @brief Implementation of structural comparison
 */

#include "boardmerge/Diff.hpp"

#include <algorithm>
#include <set>

namespace boardmerge {

namespace {

const char* kMissing = "<missing>";

Divergence make_divergence(const std::string& path, std::string existing, std::string incoming) {
    Divergence d;
    d.path = path;
    d.existing = std::move(existing);
    d.incoming = std::move(incoming);
    return d;
}

} // anonymous namespace

std::string Divergence::describe() const {
    return "existing " + existing + ", incoming " + incoming;
}

std::string child_path(const std::string& parent, const std::string& key) {
    if (parent.empty()) return key;
    return parent + "." + key;
}

std::string index_path(const std::string& parent, size_t index) {
    return parent + "[" + std::to_string(index) + "]";
}

std::string render_value(const Value& v) {
    constexpr size_t kMaxLength = 200;
    std::string text = v.dump();
    if (text.size() > kMaxLength) {
        text = text.substr(0, kMaxLength) + "...";
    }
    return text;
}

std::optional<Divergence> first_divergence(const Value& existing,
                                           const Value& incoming,
                                           const std::string& path) {
    if (existing == incoming) {
        return std::nullopt;
    }

    if (existing.is_object() && incoming.is_object()) {
        std::set<std::string> keys;
        for (auto it = existing.begin(); it != existing.end(); ++it) keys.insert(it.key());
        for (auto it = incoming.begin(); it != incoming.end(); ++it) keys.insert(it.key());

        for (const auto& key : keys) {
            const std::string sub = child_path(path, key);
            auto eit = existing.find(key);
            auto iit = incoming.find(key);
            if (eit == existing.end()) {
                return make_divergence(sub, kMissing, render_value(*iit));
            }
            if (iit == incoming.end()) {
                return make_divergence(sub, render_value(*eit), kMissing);
            }
            if (auto d = first_divergence(*eit, *iit, sub)) {
                return d;
            }
        }
        return std::nullopt;
    }

    if (existing.is_array() && incoming.is_array()) {
        const size_t common = std::min(existing.size(), incoming.size());
        for (size_t i = 0; i < common; ++i) {
            if (auto d = first_divergence(existing[i], incoming[i], index_path(path, i))) {
                return d;
            }
        }
        if (existing.size() > common) {
            return make_divergence(index_path(path, common), render_value(existing[common]), kMissing);
        }
        if (incoming.size() > common) {
            return make_divergence(index_path(path, common), kMissing, render_value(incoming[common]));
        }
        return std::nullopt;
    }

    // Scalars, or containers of different kinds
    return make_divergence(path, render_value(existing), render_value(incoming));
}

std::optional<Divergence> first_divergence_unordered(const Value& existing,
                                                     const Value& incoming,
                                                     const std::string& path) {
    if (!existing.is_array() || !incoming.is_array()) {
        return first_divergence(existing, incoming, path);
    }

    std::vector<Value> a(existing.begin(), existing.end());
    std::vector<Value> b(incoming.begin(), incoming.end());
    std::sort(a.begin(), a.end());
    std::sort(b.begin(), b.end());
    return first_divergence(Value(a), Value(b), path);
}

} // namespace boardmerge
