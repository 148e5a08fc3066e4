#pragma once

#include <azlist/arm/resource.hpp>

#include <string>
#include <unordered_set>
#include <vector>

namespace azlist {

// ---------------------------------------------------------------------------
// ResultSet: resources deduped by uppercased id and list errors deduped by
// uppercased endpoint. The first insert of a key wins. Not thread-safe;
// pool collectors are already serialized.
// ---------------------------------------------------------------------------
class ResultSet {
public:
    ResultSet() = default;

    /// False if a resource with the same key is already present.
    bool AddResource(Resource resource);

    /// False if an error for the same endpoint is already present.
    bool AddError(ListError error);

    [[nodiscard]] bool ContainsResource(const ResourceId& id) const;
    [[nodiscard]] size_t ResourceCount() const noexcept { return resources_.size(); }
    [[nodiscard]] size_t ErrorCount() const noexcept { return errors_.size(); }

    /// Resources sorted by id, errors sorted by endpoint.
    [[nodiscard]] ListResult Finish() &&;

private:
    std::vector<Resource> resources_;
    std::unordered_set<std::string> resource_keys_;
    std::vector<ListError> errors_;
    std::unordered_set<std::string> error_keys_;
};

} // namespace azlist
