#include <azlist/discovery/extension_resolver.hpp>
#include <azlist/discovery/result_set.hpp>
#include <azlist/discovery/task_pool.hpp>

namespace azlist {

namespace {

constexpr const char* kComponent = "extension";

struct ResolvedExtension {
    std::string child_type;     // "providers/<type>"
    std::string api_version;
    const ExtensionFilter* filter;
};

} // anonymous namespace

Result<ListResult, Error> ResolveExtensionResources(
    IArmClient& client,
    const SchemaTree& schema,
    std::vector<Resource> parents,
    const std::vector<ExtensionResourceSpec>& extensions,
    size_t parallelism,
    const CancellationToken& cancel,
    Logger& logger) {
    std::vector<ResolvedExtension> resolved;
    resolved.reserve(extensions.size());
    for (const auto& ext : extensions) {
        const auto* entry = schema.Find(ext.type);
        if (entry == nullptr) {
            return Result<ListResult, Error>::Err(MakeError(
                "ResolveExtensionResources",
                "no schema entry found for resource type " + ext.type,
                ErrorCategory::Configuration));
        }
        resolved.push_back(ResolvedExtension{"providers/" + ext.type,
                                             entry->LatestVersion(), &ext.filter});
    }

    ResultSet all;
    std::vector<Resource> unique_parents;
    for (auto& parent : parents) {
        if (all.AddResource(parent)) {
            unique_parents.push_back(std::move(parent));
        }
    }
    if (resolved.empty()) {
        return Result<ListResult, Error>::Ok(std::move(all).Finish());
    }

    std::vector<ListResult> found;
    {
        TaskPool<ListResult> pool(
            parallelism,
            [&found](ListResult r) { found.push_back(std::move(r)); },
            cancel);
        for (const auto& parent : unique_parents) {
            for (const auto& ext : resolved) {
                pool.Submit([&client, &parent, &ext, &cancel, &logger] {
                    return WalkCollection(client, parent, ext.child_type, ext.api_version,
                                          *ext.filter, cancel, logger);
                });
            }
        }
        auto status = pool.Wait();
        if (status.IsErr()) {
            return Result<ListResult, Error>::Err(status.Error());
        }
    }

    size_t added = 0;
    for (auto& page : found) {
        for (auto& resource : page.resources) {
            if (all.AddResource(std::move(resource))) {
                ++added;
            }
        }
        for (auto& error : page.errors) {
            all.AddError(std::move(error));
        }
    }

    logger.Info(kComponent, "Found " + std::to_string(added) + " extension resources under " +
                                std::to_string(unique_parents.size()) + " parents");
    return Result<ListResult, Error>::Ok(std::move(all).Finish());
}

} // namespace azlist
