#pragma once

#include <azlist/core/cancellation.hpp>
#include <azlist/core/resource_id.hpp>
#include <azlist/core/result.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace azlist {

// ---------------------------------------------------------------------------
// QueryRequest: one Resource Graph query page request.
// ---------------------------------------------------------------------------
struct QueryRequest {
    std::vector<std::string> subscriptions;
    std::string query;                                     // full KQL text
    int top = 1000;
    int64_t skip = 0;
    std::optional<std::string> skip_token;
    std::optional<std::string> authorization_scope_filter; // e.g. "AtScopeAndBelow"
};

struct QueryPage {
    std::vector<nlohmann::json> items;
    int64_t total_records = 0;
    int64_t count = 0;
    std::optional<std::string> skip_token;
};

struct ListPage {
    std::vector<nlohmann::json> items;
    std::optional<std::string> next_link;
};

// ---------------------------------------------------------------------------
// IArmClient: typed Resource Manager operations, one page per call.
//
// The discovery layer depends on this interface; tests substitute an
// in-memory implementation. Implementations must be thread-safe.
//
// Documents are returned raw. Turning them into Resources (and recording
// per-item failures) is the caller's job.
// ---------------------------------------------------------------------------
class IArmClient {
public:
    virtual ~IArmClient() = default;

    /// One page of a Resource Graph query.
    [[nodiscard]] virtual Result<QueryPage, Error> QueryResources(
        const QueryRequest& request,
        const CancellationToken& cancel = {}) = 0;

    /// One page of the `child_type` collection under `parent`. When
    /// `next_link` is set it is followed verbatim instead of building the
    /// first-page URL. A missing collection is an Err with
    /// ErrorCategory::NotFound.
    [[nodiscard]] virtual Result<ListPage, Error> ListChildrenPage(
        const ResourceId& parent,
        std::string_view child_type,
        std::string_view api_version,
        const std::optional<std::string>& next_link,
        const CancellationToken& cancel = {}) = 0;

    /// The resource group descriptor document for `group`.
    [[nodiscard]] virtual Result<nlohmann::json, Error> GetResourceGroup(
        const ResourceId& group,
        const CancellationToken& cancel = {}) = 0;

protected:
    IArmClient() = default;
};

} // namespace azlist
