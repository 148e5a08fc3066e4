#pragma once

#include <azlist/core/result.hpp>

#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace azlist {

// ---------------------------------------------------------------------------
// SchemaEntry: one resource type in the hierarchy snapshot.
// ---------------------------------------------------------------------------
struct SchemaEntry {
    std::string type_name;              // last type segment, casing as declared
    std::vector<std::string> versions;  // as declared; back() is the latest
    // Direct child types, keyed by uppercased last segment.
    std::map<std::string, std::shared_ptr<SchemaEntry>> children;

    [[nodiscard]] const std::string& LatestVersion() const { return versions.back(); }
};

// ---------------------------------------------------------------------------
// SchemaTree: index from uppercased full type path (no leading '/'), e.g.
// "MICROSOFT.NETWORK/VIRTUALNETWORKS/SUBNETS", to its entry.
//
// Built once, immutable afterwards and safe to share between threads.
// Every entry has at least two path segments and at least one version.
// ---------------------------------------------------------------------------
class SchemaTree {
public:
    using Snapshot = std::map<std::string, std::vector<std::string>>;

    /// Build the index from a flat "type path -> versions" snapshot.
    ///
    /// Keys with a trailing '/' are merged into the key without it (the
    /// union of versions, sorted). Entries are inserted level by level,
    /// shortest paths first, and linked to their parent when the parent
    /// type is present. Same-path keys differing only in case are merged
    /// the same way as trailing-slash keys.
    static Result<SchemaTree, Error> Build(Snapshot snapshot);

    /// Lookup by type path, case-insensitive. A leading '/' is ignored.
    [[nodiscard]] const SchemaEntry* Find(std::string_view type_path) const;

    [[nodiscard]] size_t Size() const noexcept { return entries_.size(); }

    [[nodiscard]] const std::map<std::string, std::shared_ptr<SchemaEntry>>& Entries() const noexcept {
        return entries_;
    }

private:
    std::map<std::string, std::shared_ptr<SchemaEntry>> entries_;
};

/// Parse a snapshot document: a JSON object mapping type path to an array
/// of api-version strings.
Result<SchemaTree::Snapshot, Error> ParseSchemaSnapshot(std::string_view json_text);

/// Read, parse and build the snapshot at `path`.
Result<SchemaTree, Error> LoadSchemaTree(const std::string& path);

} // namespace azlist
