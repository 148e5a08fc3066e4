#include <azlist/discovery/seed_query.hpp>

namespace azlist {

namespace {

constexpr const char* kComponent = "seed";
constexpr const char* kOperation = "SeedQuery";

Error SeedParseError(const std::string& message) {
    return MakeError(kOperation, message, ErrorCategory::Parse);
}

Result<void, Error> CollectPage(QueryPage& page, std::vector<Resource>& out) {
    for (auto& item : page.items) {
        auto resource = Resource::FromDocument(std::move(item));
        if (resource.IsErr()) {
            return Result<void, Error>::Err(SeedParseError(resource.Error()));
        }
        out.push_back(std::move(resource).Value());
    }
    return Result<void, Error>::Ok();
}

} // anonymous namespace

std::string BuildSeedQuery(std::string_view table, std::string_view predicate) {
    std::string query(table);
    query += " | where ";
    query += predicate;
    query += " | order by id desc";
    return query;
}

Result<std::vector<Resource>, Error> RunSeedQuery(IArmClient& client,
                                                  const SeedQueryOptions& options,
                                                  const CancellationToken& cancel,
                                                  Logger& logger) {
    QueryRequest request;
    request.subscriptions = options.subscriptions;
    request.query = BuildSeedQuery(options.table, options.predicate);
    request.top = kSeedPageSize;
    request.authorization_scope_filter = options.authorization_scope_filter;

    logger.Info(kComponent, "Running query: " + request.query);

    std::vector<Resource> resources;
    int64_t count = 0;
    int64_t total = 0;
    bool first = true;

    while (first || count < total) {
        if (cancel.IsCancelled()) {
            return Result<std::vector<Resource>, Error>::Err(
                MakeError(kOperation, "Operation cancelled", ErrorCategory::Cancelled));
        }

        auto page = client.QueryResources(request, cancel);
        if (page.IsErr()) {
            auto error = std::move(page).Error();
            error.message = "executing query \"" + request.query + "\": " + error.message;
            return Result<std::vector<Resource>, Error>::Err(std::move(error));
        }
        auto body = std::move(page).Value();

        auto collected = CollectPage(body, resources);
        if (collected.IsErr()) {
            return Result<std::vector<Resource>, Error>::Err(collected.Error());
        }

        if (first) {
            total = body.total_records;
            first = false;
        }
        count += body.count;
        logger.Debug(kComponent, "Fetched " + std::to_string(count) + " of " +
                                     std::to_string(total) + " records");

        if (count >= total) {
            break;
        }
        if (body.count <= 0) {
            return Result<std::vector<Resource>, Error>::Err(SeedParseError(
                "query page returned no rows with " + std::to_string(total - count) +
                " records outstanding"));
        }
        if (!body.skip_token.has_value() || body.skip_token->empty()) {
            return Result<std::vector<Resource>, Error>::Err(SeedParseError(
                "query page has no $skipToken with " + std::to_string(total - count) +
                " records outstanding"));
        }
        request.skip += kSeedPageSize;
        request.skip_token = std::move(body.skip_token);
    }

    SortById(resources);
    logger.Info(kComponent, "Query matched " + std::to_string(resources.size()) + " resources");
    return Result<std::vector<Resource>, Error>::Ok(std::move(resources));
}

} // namespace azlist
