#include <azlist/arm/resource.hpp>
#include <azlist/core/strings.hpp>

#include <algorithm>

namespace azlist {

Result<Resource, std::string> Resource::FromDocument(nlohmann::json document) {
    if (!document.is_object()) {
        return Result<Resource, std::string>::Err(
            "resource document is not a JSON object: " + document.dump());
    }
    auto it = document.find("id");
    if (it == document.end()) {
        return Result<Resource, std::string>::Err(
            "no resource id found in response: " + document.dump());
    }
    if (!it->is_string()) {
        return Result<Resource, std::string>::Err(
            "resource id is not a string: " + document.dump());
    }
    auto id = ResourceId::Parse(it->get<std::string>());
    if (id.IsErr()) {
        return Result<Resource, std::string>::Err(
            "parsing resource id " + it->get<std::string>() + ": " + id.Error());
    }
    return Result<Resource, std::string>::Ok(
        Resource(std::move(id).Value(), std::move(document)));
}

std::string ListError::ToString() const {
    return "listing " + endpoint + " (api-version=" + api_version + "): " + message;
}

std::string ChildCollectionPath(const ResourceId& parent, std::string_view child_type) {
    std::string path = parent.GetKind() == ResourceId::Kind::Tenant ? "" : parent.String();
    path += "/";
    path += child_type;
    return path;
}

std::string ListEndpointKey(const ResourceId& parent, std::string_view child_type) {
    return ToUpper(ChildCollectionPath(parent, child_type));
}

std::optional<std::string> GetStringField(const nlohmann::json& doc,
                                          std::string_view key) {
    if (!doc.is_object()) {
        return std::nullopt;
    }
    auto it = doc.find(std::string(key));
    if (it == doc.end() || !it->is_string()) {
        return std::nullopt;
    }
    return it->get<std::string>();
}

bool IsManaged(const nlohmann::json& doc) {
    if (!doc.is_object()) {
        return false;
    }
    auto it = doc.find("managedBy");
    if (it == doc.end() || it->is_null()) {
        return false;
    }
    if (it->is_string()) {
        return !it->get_ref<const std::string&>().empty();
    }
    return true;
}

std::optional<std::string> GetPropertiesScope(const nlohmann::json& doc) {
    if (!doc.is_object()) {
        return std::nullopt;
    }
    auto it = doc.find("properties");
    if (it == doc.end()) {
        return std::nullopt;
    }
    return GetStringField(*it, "scope");
}

void SortById(std::vector<Resource>& resources) {
    std::stable_sort(resources.begin(), resources.end(),
                     [](const Resource& a, const Resource& b) {
                         return a.Id().String() < b.Id().String();
                     });
}

void SortByEndpoint(std::vector<ListError>& errors) {
    std::stable_sort(errors.begin(), errors.end(),
                     [](const ListError& a, const ListError& b) {
                         return a.endpoint < b.endpoint;
                     });
}

} // namespace azlist
