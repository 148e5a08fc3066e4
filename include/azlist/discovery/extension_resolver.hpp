#pragma once

#include <azlist/arm/i_arm_client.hpp>
#include <azlist/arm/resource.hpp>
#include <azlist/core/log.hpp>
#include <azlist/discovery/collection_walker.hpp>
#include <azlist/discovery/schema_tree.hpp>

#include <cstddef>
#include <string>
#include <vector>

namespace azlist {

// ---------------------------------------------------------------------------
// ExtensionResourceSpec: an extension type to list under every parent,
// e.g. "Microsoft.Authorization/roleAssignments", with an optional filter.
// ---------------------------------------------------------------------------
struct ExtensionResourceSpec {
    std::string type;
    ExtensionFilter filter;
};

// ---------------------------------------------------------------------------
// ResolveExtensionResources: list each extension type under each parent.
//
// One listing task per (parent, type) pair, endpoint
// "<parentId>/providers/<type>" at the type's latest api-version. Every
// type must be known to `schema`; an unknown one is a Configuration error
// reported before anything is listed. Found resources are merged with the
// parents (same dedup rule as the crawler) and are not expanded further.
// ---------------------------------------------------------------------------
[[nodiscard]] Result<ListResult, Error> ResolveExtensionResources(
    IArmClient& client,
    const SchemaTree& schema,
    std::vector<Resource> parents,
    const std::vector<ExtensionResourceSpec>& extensions,
    size_t parallelism,
    const CancellationToken& cancel = {},
    Logger& logger = Logger::Null());

} // namespace azlist
