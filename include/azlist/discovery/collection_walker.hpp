#pragma once

#include <azlist/arm/i_arm_client.hpp>
#include <azlist/arm/resource.hpp>
#include <azlist/core/log.hpp>

#include <functional>
#include <string>

namespace azlist {

// Keeps a listed candidate when it returns true. Arguments are the parent's
// document and the candidate's document.
using ExtensionFilter =
    std::function<bool(const nlohmann::json& parent, const nlohmann::json& candidate)>;

// ---------------------------------------------------------------------------
// WalkCollection: list every page of `child_type` under `parent`.
//
// Listing failures do not fail the call. They are recorded in the returned
// ListResult, keyed by ListEndpointKey(parent.Id(), child_type):
//   - NotFound ends the walk with no error recorded;
//   - any other request failure records one error and ends the walk;
//   - an item without a usable id records an error and is skipped.
// Items rejected by `filter` are dropped before their id is looked at.
//
// The only Err is cancellation.
// ---------------------------------------------------------------------------
[[nodiscard]] Result<ListResult, Error> WalkCollection(
    IArmClient& client,
    const Resource& parent,
    const std::string& child_type,
    const std::string& api_version,
    const ExtensionFilter& filter,
    const CancellationToken& cancel,
    Logger& logger);

} // namespace azlist
