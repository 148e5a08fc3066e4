#include <azlist/discovery/child_crawler.hpp>
#include <azlist/discovery/collection_walker.hpp>
#include <azlist/discovery/result_set.hpp>
#include <azlist/discovery/task_pool.hpp>

namespace azlist {

namespace {

constexpr const char* kComponent = "crawl";

} // anonymous namespace

Result<ListResult, Error> CrawlChildResources(IArmClient& client,
                                              const SchemaTree& schema,
                                              std::vector<Resource> seed,
                                              size_t parallelism,
                                              const CancellationToken& cancel,
                                              Logger& logger) {
    ResultSet all;
    std::vector<Resource> frontier;
    for (auto& resource : seed) {
        if (all.AddResource(resource)) {
            frontier.push_back(std::move(resource));
        }
    }

    size_t depth = 0;
    while (!frontier.empty()) {
        ++depth;
        std::vector<ListResult> found;
        size_t tasks = 0;
        {
            TaskPool<ListResult> pool(
                parallelism,
                [&found](ListResult r) { found.push_back(std::move(r)); },
                cancel);

            for (const auto& parent : frontier) {
                const auto* entry = schema.Find(parent.Id().RouteScopeString());
                if (entry == nullptr) {
                    continue;
                }
                for (const auto& [key, child] : entry->children) {
                    const SchemaEntry* child_entry = child.get();
                    pool.Submit([&client, &parent, child_entry, &cancel, &logger] {
                        return WalkCollection(client, parent, child_entry->type_name,
                                              child_entry->LatestVersion(), nullptr,
                                              cancel, logger);
                    });
                    ++tasks;
                }
            }

            auto status = pool.Wait();
            if (status.IsErr()) {
                return Result<ListResult, Error>::Err(status.Error());
            }
        }

        std::vector<Resource> next;
        for (auto& page : found) {
            for (auto& resource : page.resources) {
                if (all.AddResource(resource)) {
                    next.push_back(std::move(resource));
                }
            }
            for (auto& error : page.errors) {
                all.AddError(std::move(error));
            }
        }

        logger.Debug(kComponent, "Level " + std::to_string(depth) + ": " +
                                     std::to_string(frontier.size()) + " parents, " +
                                     std::to_string(tasks) + " listings, " +
                                     std::to_string(next.size()) + " new resources");
        frontier = std::move(next);
    }

    logger.Info(kComponent, "Crawl finished after " + std::to_string(depth) + " levels with " +
                                std::to_string(all.ResourceCount()) + " resources and " +
                                std::to_string(all.ErrorCount()) + " listing errors");
    return Result<ListResult, Error>::Ok(std::move(all).Finish());
}

} // namespace azlist
