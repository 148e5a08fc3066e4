#pragma once

#include <azlist/arm/i_arm_client.hpp>
#include <azlist/arm/resource.hpp>
#include <azlist/core/log.hpp>
#include <azlist/discovery/extension_resolver.hpp>
#include <azlist/discovery/schema_tree.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace azlist {

// ---------------------------------------------------------------------------
// ListerOptions
// ---------------------------------------------------------------------------
struct ListerOptions {
    std::vector<std::string> subscriptions;
    std::string table = "Resources";
    std::optional<std::string> authorization_scope_filter;
    size_t parallelism = 0;                 // 0: one per hardware thread
    bool recursive = false;
    bool include_managed = false;
    bool include_resource_group = false;
    std::vector<ExtensionResourceSpec> extensions;
};

// ---------------------------------------------------------------------------
// Lister: end-to-end listing for one predicate.
//
//   1. seed query, sorted by id
//   2. child crawl (recursive only)
//   3. drop resources with a non-empty managedBy (unless include_managed)
//   4. prepend the owning resource groups (include_resource_group only)
//   5. extension resources (when any are configured)
//
// Every failure except per-endpoint listing errors aborts the run; the
// partial result is discarded.
// ---------------------------------------------------------------------------
class Lister {
public:
    Lister(IArmClient& client, const SchemaTree& schema, ListerOptions options,
           Logger& logger = Logger::Null());

    [[nodiscard]] Result<ListResult, Error> List(std::string_view predicate,
                                                 const CancellationToken& cancel = {});

    [[nodiscard]] size_t Parallelism() const noexcept { return parallelism_; }
    [[nodiscard]] const ListerOptions& Options() const noexcept { return options_; }

private:
    Result<void, Error> Validate(std::string_view predicate) const;

    Result<std::vector<Resource>, Error> FetchResourceGroups(
        const std::vector<Resource>& resources, const CancellationToken& cancel);

    IArmClient& client_;
    const SchemaTree& schema_;
    ListerOptions options_;
    Logger& logger_;
    size_t parallelism_;
};

} // namespace azlist
