#pragma once

#include <azlist/arm/i_arm_client.hpp>
#include <azlist/arm/resource.hpp>
#include <azlist/core/log.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace azlist {

inline constexpr int kSeedPageSize = 1000;

// ---------------------------------------------------------------------------
// SeedQueryOptions: what to search for in the indexed resource catalog.
// ---------------------------------------------------------------------------
struct SeedQueryOptions {
    std::vector<std::string> subscriptions;
    std::string table = "Resources";
    std::string predicate;                                  // KQL "where" body
    std::optional<std::string> authorization_scope_filter;
};

/// "<table> | where <predicate> | order by id desc"
std::string BuildSeedQuery(std::string_view table, std::string_view predicate);

// ---------------------------------------------------------------------------
// RunSeedQuery: run the query and walk every page.
//
// Pages are requested with $top=1000; each follow-up carries the previous
// page's $skipToken and a $skip advanced by 1000 until the summed page
// counts reach totalRecords. A page that makes no progress, or comes back
// without a token while rows are still missing, is a Parse error.
// Any row without a parseable "id" is a Parse error as well.
//
// Returns the resources sorted by id.
// ---------------------------------------------------------------------------
[[nodiscard]] Result<std::vector<Resource>, Error> RunSeedQuery(
    IArmClient& client,
    const SeedQueryOptions& options,
    const CancellationToken& cancel = {},
    Logger& logger = Logger::Null());

} // namespace azlist
