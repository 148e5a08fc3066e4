#include <azlist/discovery/lister.hpp>
#include <azlist/discovery/child_crawler.hpp>
#include <azlist/discovery/result_set.hpp>
#include <azlist/discovery/seed_query.hpp>
#include <azlist/core/strings.hpp>

#include <iterator>
#include <thread>
#include <unordered_set>

namespace azlist {

namespace {

constexpr const char* kComponent = "lister";
constexpr const char* kOperation = "List";

size_t EffectiveParallelism(size_t requested) {
    if (requested > 0) {
        return requested;
    }
    const auto hw = std::thread::hardware_concurrency();
    return hw > 0 ? hw : 1;
}

Result<ListResult, Error> Cancelled() {
    return Result<ListResult, Error>::Err(
        MakeError(kOperation, "Operation cancelled", ErrorCategory::Cancelled));
}

} // anonymous namespace

Lister::Lister(IArmClient& client, const SchemaTree& schema, ListerOptions options,
               Logger& logger)
    : client_(client),
      schema_(schema),
      options_(std::move(options)),
      logger_(logger),
      parallelism_(EffectiveParallelism(options_.parallelism)) {}

Result<void, Error> Lister::Validate(std::string_view predicate) const {
    if (predicate.empty()) {
        return Result<void, Error>::Err(MakeError(
            kOperation, "No where predicate specified", ErrorCategory::Configuration));
    }
    if (options_.subscriptions.empty()) {
        return Result<void, Error>::Err(MakeError(
            kOperation, "subscription id is empty", ErrorCategory::Configuration));
    }
    for (const auto& ext : options_.extensions) {
        if (schema_.Find(ext.type) == nullptr) {
            return Result<void, Error>::Err(MakeError(
                kOperation, "no schema entry found for resource type " + ext.type,
                ErrorCategory::Configuration));
        }
    }
    return Result<void, Error>::Ok();
}

// ---------------------------------------------------------------------------
// List
// ---------------------------------------------------------------------------
Result<ListResult, Error> Lister::List(std::string_view predicate,
                                       const CancellationToken& cancel) {
    auto valid = Validate(predicate);
    if (valid.IsErr()) {
        return Result<ListResult, Error>::Err(valid.Error());
    }

    logger_.Info(kComponent, "List begins: subscriptions=" + Join(options_.subscriptions, ",") +
                                 " predicate=" + std::string(predicate) +
                                 " parallelism=" + std::to_string(parallelism_) +
                                 " recursive=" + (options_.recursive ? "true" : "false") +
                                 " include_managed=" +
                                 (options_.include_managed ? "true" : "false"));

    // (a) seed
    SeedQueryOptions seed_options;
    seed_options.subscriptions = options_.subscriptions;
    seed_options.table = options_.table;
    seed_options.predicate = std::string(predicate);
    seed_options.authorization_scope_filter = options_.authorization_scope_filter;

    auto seed = RunSeedQuery(client_, seed_options, cancel, logger_);
    if (seed.IsErr()) {
        return Result<ListResult, Error>::Err(std::move(seed).Error());
    }
    ListResult current{std::move(seed).Value(), {}};

    // (b) children
    if (options_.recursive) {
        logger_.Debug(kComponent, "Listing child resources");
        auto crawled = CrawlChildResources(client_, schema_, std::move(current.resources),
                                           parallelism_, cancel, logger_);
        if (crawled.IsErr()) {
            return Result<ListResult, Error>::Err(std::move(crawled).Error());
        }
        current = std::move(crawled).Value();
    }

    // (c) managed resources
    if (!options_.include_managed) {
        std::vector<Resource> kept;
        kept.reserve(current.resources.size());
        for (auto& resource : current.resources) {
            if (IsManaged(resource.Properties())) {
                logger_.Debug(kComponent, "Removing managed resource " + resource.Id().String());
                continue;
            }
            kept.push_back(std::move(resource));
        }
        current.resources = std::move(kept);
    }

    // (d) resource groups
    if (options_.include_resource_group) {
        auto groups = FetchResourceGroups(current.resources, cancel);
        if (groups.IsErr()) {
            return Result<ListResult, Error>::Err(std::move(groups).Error());
        }
        auto prepended = std::move(groups).Value();
        prepended.insert(prepended.end(),
                         std::make_move_iterator(current.resources.begin()),
                         std::make_move_iterator(current.resources.end()));
        current.resources = std::move(prepended);
    }

    // (e) extensions
    if (!options_.extensions.empty()) {
        logger_.Debug(kComponent, "Listing extension resources");
        auto extended = ResolveExtensionResources(client_, schema_,
                                                  std::move(current.resources),
                                                  options_.extensions, parallelism_,
                                                  cancel, logger_);
        if (extended.IsErr()) {
            return Result<ListResult, Error>::Err(std::move(extended).Error());
        }
        auto ext = std::move(extended).Value();
        current.resources = std::move(ext.resources);
        current.errors.insert(current.errors.end(),
                              std::make_move_iterator(ext.errors.begin()),
                              std::make_move_iterator(ext.errors.end()));
    }

    if (cancel.IsCancelled()) {
        return Cancelled();
    }

    // (f) final dedup and ordering
    ResultSet final_set;
    for (auto& resource : current.resources) {
        final_set.AddResource(std::move(resource));
    }
    for (auto& error : current.errors) {
        final_set.AddError(std::move(error));
    }
    auto result = std::move(final_set).Finish();

    logger_.Info(kComponent, "List ends: " + std::to_string(result.resources.size()) +
                                 " resources, " + std::to_string(result.errors.size()) +
                                 " listing errors");
    return Result<ListResult, Error>::Ok(std::move(result));
}

// ---------------------------------------------------------------------------
// FetchResourceGroups: one GET per distinct owning group, sequentially.
// ---------------------------------------------------------------------------
Result<std::vector<Resource>, Error> Lister::FetchResourceGroups(
    const std::vector<Resource>& resources, const CancellationToken& cancel) {
    std::unordered_set<std::string> seen;
    std::vector<Resource> groups;

    for (const auto& resource : resources) {
        auto root = resource.Id().RootScope();
        if (root.GetKind() != ResourceId::Kind::ResourceGroup) {
            continue;
        }
        if (!seen.insert(root.Key()).second) {
            continue;
        }
        if (cancel.IsCancelled()) {
            return Result<std::vector<Resource>, Error>::Err(
                MakeError(kOperation, "Operation cancelled", ErrorCategory::Cancelled));
        }

        logger_.Debug(kComponent, "Fetching resource group " + root.String());
        auto doc = client_.GetResourceGroup(root, cancel);
        if (doc.IsErr()) {
            return Result<std::vector<Resource>, Error>::Err(std::move(doc).Error());
        }
        auto group = Resource::FromDocument(std::move(doc).Value());
        if (group.IsErr()) {
            return Result<std::vector<Resource>, Error>::Err(MakeError(
                "GetResourceGroup", group.Error(), ErrorCategory::Parse, root.String()));
        }
        groups.push_back(std::move(group).Value());
    }

    SortById(groups);
    return Result<std::vector<Resource>, Error>::Ok(std::move(groups));
}

} // namespace azlist
