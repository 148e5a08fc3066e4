#include <azlist/discovery/collection_walker.hpp>

namespace azlist {

namespace {

constexpr const char* kComponent = "crawl";

} // anonymous namespace

Result<ListResult, Error> WalkCollection(IArmClient& client,
                                         const Resource& parent,
                                         const std::string& child_type,
                                         const std::string& api_version,
                                         const ExtensionFilter& filter,
                                         const CancellationToken& cancel,
                                         Logger& logger) {
    ListResult result;
    const auto endpoint = ListEndpointKey(parent.Id(), child_type);
    auto record = [&](std::string message) {
        result.errors.push_back(ListError{endpoint, api_version, std::move(message)});
    };

    if (logger.Enabled(LogLevel::Debug)) {
        logger.Debug(kComponent, "Listing " + child_type + " under " + parent.Id().String() +
                                     " (api-version=" + api_version + ")");
    }

    std::optional<std::string> next_link;
    do {
        auto page = client.ListChildrenPage(parent.Id(), child_type, api_version,
                                            next_link, cancel);
        if (page.IsErr()) {
            const auto& error = page.Error();
            if (error.category == ErrorCategory::Cancelled || cancel.IsCancelled()) {
                return Result<ListResult, Error>::Err(MakeError(
                    "ListChildren", "Operation cancelled", ErrorCategory::Cancelled, endpoint));
            }
            if (error.IsNotFound()) {
                break;
            }
            record(error.ToString());
            break;
        }

        auto body = std::move(page).Value();
        for (auto& item : body.items) {
            if (filter && !filter(parent.Properties(), item)) {
                continue;
            }
            auto resource = Resource::FromDocument(std::move(item));
            if (resource.IsErr()) {
                record(resource.Error());
                continue;
            }
            result.resources.push_back(std::move(resource).Value());
        }
        next_link = std::move(body.next_link);
    } while (next_link.has_value());

    return Result<ListResult, Error>::Ok(std::move(result));
}

} // namespace azlist
