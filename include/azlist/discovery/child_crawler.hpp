#pragma once

#include <azlist/arm/i_arm_client.hpp>
#include <azlist/arm/resource.hpp>
#include <azlist/core/log.hpp>
#include <azlist/discovery/schema_tree.hpp>

#include <cstddef>
#include <vector>

namespace azlist {

// ---------------------------------------------------------------------------
// CrawlChildResources: breadth-first expansion into child resources.
//
// Starting from `seed`, every resource whose type has declared children in
// `schema` gets one listing task per child type (latest api-version). A
// level's tasks all run in one TaskPool of `parallelism` workers; the next
// level starts only after that pool drained, and contains just the
// resources not seen before. The walk stops when a level finds nothing new.
//
// The returned resources include the seed, deduped and sorted by id; errors
// are per-endpoint listing failures, deduped and sorted by endpoint. The
// only Err is cancellation (or another pool-level failure); no partial
// result is returned with it.
// ---------------------------------------------------------------------------
[[nodiscard]] Result<ListResult, Error> CrawlChildResources(
    IArmClient& client,
    const SchemaTree& schema,
    std::vector<Resource> seed,
    size_t parallelism,
    const CancellationToken& cancel = {},
    Logger& logger = Logger::Null());

} // namespace azlist
