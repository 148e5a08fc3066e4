#include <azlist/arm/arm_client.hpp>
#include <azlist/arm/resource.hpp>

#include <string>
#include <utility>

namespace azlist {

namespace {

constexpr const char* kComponent = "arm";

bool IsSuccess(int status) {
    return status >= 200 && status < 300;
}

Error ParseError(const std::string& operation, const std::string& endpoint,
                 const std::string& message) {
    return Error{operation, endpoint, std::nullopt, message, std::nullopt,
                 ErrorCategory::Parse};
}

Result<nlohmann::json, Error> ParseBody(const std::string& operation,
                                        const std::string& endpoint,
                                        const std::string& body) {
    try {
        auto doc = nlohmann::json::parse(body);
        if (!doc.is_object()) {
            return Result<nlohmann::json, Error>::Err(
                ParseError(operation, endpoint, "Response body is not a JSON object"));
        }
        return Result<nlohmann::json, Error>::Ok(std::move(doc));
    } catch (const nlohmann::json::parse_error& e) {
        return Result<nlohmann::json, Error>::Err(
            ParseError(operation, endpoint,
                       "Failed to parse response JSON: " + std::string(e.what())));
    }
}

Error HttpFailure(const std::string& operation, const std::string& endpoint,
                  const HttpResponse& http) {
    return Error::FromHttpStatus(operation, endpoint, http.status_code,
                                 ExtractArmError(http.body));
}

std::string WithApiVersion(std::string path, std::string_view api_version) {
    path += path.find('?') == std::string::npos ? "?" : "&";
    path += "api-version=";
    path += api_version;
    return path;
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Free helpers
// ---------------------------------------------------------------------------
std::optional<std::string> ExtractArmError(std::string_view body) {
    if (body.empty()) {
        return std::nullopt;
    }
    auto doc = nlohmann::json::parse(body, nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) {
        return std::nullopt;
    }
    auto err = doc.find("error");
    if (err == doc.end() || !err->is_object()) {
        return std::nullopt;
    }
    auto code = GetStringField(*err, "code");
    auto message = GetStringField(*err, "message");
    if (!code.has_value() && !message.has_value()) {
        return std::nullopt;
    }
    if (!code.has_value()) {
        return *message;
    }
    if (!message.has_value()) {
        return *code;
    }
    return *code + ": " + *message;
}

nlohmann::json BuildQueryBody(const QueryRequest& request) {
    nlohmann::json options = {
        {"resultFormat", "objectArray"},
        {"$top", request.top},
    };
    if (request.skip > 0) {
        options["$skip"] = request.skip;
    }
    if (request.skip_token.has_value()) {
        options["$skipToken"] = *request.skip_token;
    }
    if (request.authorization_scope_filter.has_value()) {
        options["authorizationScopeFilter"] = *request.authorization_scope_filter;
    }

    nlohmann::json body = {
        {"query", request.query},
        {"options", std::move(options)},
    };
    if (!request.subscriptions.empty()) {
        body["subscriptions"] = request.subscriptions;
    }
    return body;
}

// ---------------------------------------------------------------------------
// ArmClient
// ---------------------------------------------------------------------------
ArmClient::ArmClient(IArmSession& session, Logger& logger)
    : session_(session), logger_(logger) {}

Result<QueryPage, Error> ArmClient::QueryResources(const QueryRequest& request,
                                                   const CancellationToken& cancel) {
    static const std::string kOperation = "QueryResources";
    const auto path = WithApiVersion(kResourceGraphPath, kResourceGraphApiVersion);

    logger_.Debug(kComponent, "Resource Graph query (skip=" +
                                  std::to_string(request.skip) + "): " + request.query);

    auto response = session_.Post(path, BuildQueryBody(request).dump(),
                                  "application/json", cancel);
    if (response.IsErr()) {
        return Result<QueryPage, Error>::Err(std::move(response).Error());
    }
    const auto& http = response.Value();
    if (!IsSuccess(http.status_code)) {
        return Result<QueryPage, Error>::Err(HttpFailure(kOperation, path, http));
    }

    auto parsed = ParseBody(kOperation, path, http.body);
    if (parsed.IsErr()) {
        return Result<QueryPage, Error>::Err(std::move(parsed).Error());
    }
    const auto& doc = parsed.Value();

    QueryPage page;
    auto total = doc.find("totalRecords");
    auto count = doc.find("count");
    auto data = doc.find("data");
    if (total == doc.end() || !total->is_number_integer() ||
        count == doc.end() || !count->is_number_integer()) {
        return Result<QueryPage, Error>::Err(ParseError(
            kOperation, path, "Response is missing totalRecords or count"));
    }
    if (data == doc.end() || !data->is_array()) {
        return Result<QueryPage, Error>::Err(ParseError(
            kOperation, path, "Response data is not an object array"));
    }
    page.total_records = total->get<int64_t>();
    page.count = count->get<int64_t>();
    page.items.reserve(data->size());
    for (const auto& item : *data) {
        page.items.push_back(item);
    }
    page.skip_token = GetStringField(doc, "$skipToken");

    return Result<QueryPage, Error>::Ok(std::move(page));
}

Result<ListPage, Error> ArmClient::ListChildrenPage(
    const ResourceId& parent,
    std::string_view child_type,
    std::string_view api_version,
    const std::optional<std::string>& next_link,
    const CancellationToken& cancel) {
    static const std::string kOperation = "ListChildren";
    const auto path = next_link.has_value()
        ? *next_link
        : WithApiVersion(ChildCollectionPath(parent, child_type), api_version);

    auto response = session_.Get(path, cancel);
    if (response.IsErr()) {
        return Result<ListPage, Error>::Err(std::move(response).Error());
    }
    const auto& http = response.Value();
    if (!IsSuccess(http.status_code)) {
        return Result<ListPage, Error>::Err(HttpFailure(kOperation, path, http));
    }

    auto parsed = ParseBody(kOperation, path, http.body);
    if (parsed.IsErr()) {
        return Result<ListPage, Error>::Err(std::move(parsed).Error());
    }
    const auto& doc = parsed.Value();

    ListPage page;
    auto value = doc.find("value");
    if (value != doc.end()) {
        if (!value->is_array()) {
            return Result<ListPage, Error>::Err(
                ParseError(kOperation, path, "Response value is not an array"));
        }
        page.items.reserve(value->size());
        for (const auto& item : *value) {
            page.items.push_back(item);
        }
    }
    auto link = GetStringField(doc, "nextLink");
    if (link.has_value() && !link->empty()) {
        page.next_link = std::move(link);
    }

    return Result<ListPage, Error>::Ok(std::move(page));
}

Result<nlohmann::json, Error> ArmClient::GetResourceGroup(const ResourceId& group,
                                                          const CancellationToken& cancel) {
    static const std::string kOperation = "GetResourceGroup";
    if (group.GetKind() != ResourceId::Kind::ResourceGroup) {
        return Result<nlohmann::json, Error>::Err(MakeError(
            kOperation, "Not a resource group id: " + group.String(),
            ErrorCategory::Internal, group.String()));
    }
    const auto path = WithApiVersion(group.String(), kResourceGroupApiVersion);

    auto response = session_.Get(path, cancel);
    if (response.IsErr()) {
        return Result<nlohmann::json, Error>::Err(std::move(response).Error());
    }
    const auto& http = response.Value();
    if (!IsSuccess(http.status_code)) {
        return Result<nlohmann::json, Error>::Err(HttpFailure(kOperation, path, http));
    }
    return ParseBody(kOperation, path, http.body);
}

} // namespace azlist
