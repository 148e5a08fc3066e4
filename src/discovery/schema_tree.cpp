#include <azlist/discovery/schema_tree.hpp>
#include <azlist/core/strings.hpp>

#include <nlohmann/json.hpp>

#include <algorithm>
#include <fstream>
#include <sstream>

namespace azlist {

namespace {

constexpr const char* kOperation = "SchemaTree";

Error SchemaError(const std::string& message, const std::string& endpoint = "") {
    return MakeError(kOperation, message, ErrorCategory::Schema, endpoint);
}

void MergeVersions(std::vector<std::string>& into, const std::vector<std::string>& from) {
    into.insert(into.end(), from.begin(), from.end());
    std::sort(into.begin(), into.end());
    into.erase(std::unique(into.begin(), into.end()), into.end());
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Build
// ---------------------------------------------------------------------------
Result<SchemaTree, Error> SchemaTree::Build(Snapshot snapshot) {
    for (const auto& [type_path, versions] : snapshot) {
        std::string_view path = type_path;
        if (!path.empty() && path.back() == '/') {
            path.remove_suffix(1);
        }
        const auto segs = Split(path, '/');
        if (segs.size() < 2) {
            return Result<SchemaTree, Error>::Err(
                SchemaError("malformed resource type: " + type_path, type_path));
        }
        for (const auto& seg : segs) {
            if (seg.empty()) {
                return Result<SchemaTree, Error>::Err(
                    SchemaError("malformed resource type: " + type_path, type_path));
            }
        }
        if (versions.empty()) {
            return Result<SchemaTree, Error>::Err(
                SchemaError("resource type " + type_path + " has no api-version", type_path));
        }
    }

    // Fold legacy "Provider/type/" keys into "Provider/type".
    std::vector<std::string> trailing;
    for (const auto& [type_path, versions] : snapshot) {
        if (type_path.back() == '/') {
            trailing.push_back(type_path);
        }
    }
    for (const auto& type_path : trailing) {
        auto node = snapshot.extract(type_path);
        auto canonical = type_path.substr(0, type_path.size() - 1);
        auto it = snapshot.find(canonical);
        if (it == snapshot.end()) {
            snapshot.emplace(std::move(canonical), std::move(node.mapped()));
        } else {
            MergeVersions(it->second, node.mapped());
        }
    }

    SchemaTree tree;
    size_t level = 2;
    while (!snapshot.empty()) {
        for (auto it = snapshot.begin(); it != snapshot.end();) {
            const auto upper = ToUpper(it->first);
            const auto segs = Split(upper, '/');
            if (segs.size() != level) {
                ++it;
                continue;
            }

            auto existing = tree.entries_.find(upper);
            if (existing != tree.entries_.end()) {
                MergeVersions(existing->second->versions, it->second);
                it = snapshot.erase(it);
                continue;
            }

            auto entry = std::make_shared<SchemaEntry>();
            entry->type_name = Split(it->first, '/').back();
            entry->versions = std::move(it->second);
            tree.entries_.emplace(upper, entry);

            std::vector<std::string> parent_segs(segs.begin(), segs.end() - 1);
            auto parent = tree.entries_.find(Join(parent_segs, "/"));
            if (parent != tree.entries_.end()) {
                parent->second->children.emplace(segs.back(), entry);
            }
            it = snapshot.erase(it);
        }
        ++level;
    }

    return Result<SchemaTree, Error>::Ok(std::move(tree));
}

const SchemaEntry* SchemaTree::Find(std::string_view type_path) const {
    if (!type_path.empty() && type_path.front() == '/') {
        type_path.remove_prefix(1);
    }
    auto it = entries_.find(ToUpper(type_path));
    return it == entries_.end() ? nullptr : it->second.get();
}

// ---------------------------------------------------------------------------
// Snapshot loading
// ---------------------------------------------------------------------------
Result<SchemaTree::Snapshot, Error> ParseSchemaSnapshot(std::string_view json_text) {
    nlohmann::json doc;
    try {
        doc = nlohmann::json::parse(json_text);
    } catch (const nlohmann::json::parse_error& e) {
        return Result<SchemaTree::Snapshot, Error>::Err(
            SchemaError("Failed to parse schema snapshot: " + std::string(e.what())));
    }
    if (!doc.is_object()) {
        return Result<SchemaTree::Snapshot, Error>::Err(
            SchemaError("Schema snapshot must be a JSON object"));
    }

    SchemaTree::Snapshot snapshot;
    for (const auto& [type_path, versions] : doc.items()) {
        if (!versions.is_array()) {
            return Result<SchemaTree::Snapshot, Error>::Err(
                SchemaError("Versions of " + type_path + " must be an array", type_path));
        }
        auto& out = snapshot[type_path];
        for (const auto& v : versions) {
            if (!v.is_string()) {
                return Result<SchemaTree::Snapshot, Error>::Err(
                    SchemaError("Non-string version for " + type_path, type_path));
            }
            out.push_back(v.get<std::string>());
        }
    }
    return Result<SchemaTree::Snapshot, Error>::Ok(std::move(snapshot));
}

Result<SchemaTree, Error> LoadSchemaTree(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        return Result<SchemaTree, Error>::Err(MakeError(
            kOperation, "Cannot open schema snapshot: " + path,
            ErrorCategory::Configuration, path));
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();

    auto snapshot = ParseSchemaSnapshot(buffer.str());
    if (snapshot.IsErr()) {
        return Result<SchemaTree, Error>::Err(std::move(snapshot).Error());
    }
    return SchemaTree::Build(std::move(snapshot).Value());
}

} // namespace azlist
