#pragma once

#include <azlist/core/resource_id.hpp>
#include <azlist/core/result.hpp>

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace azlist {

// ---------------------------------------------------------------------------
// Resource: an ARM resource, i.e. its parsed id plus the raw JSON document the
// service returned for it. Immutable once constructed.
// ---------------------------------------------------------------------------
class Resource {
public:
    Resource(ResourceId id, nlohmann::json properties)
        : id_(std::move(id)), properties_(std::move(properties)) {}

    /// Build from a document carrying a string "id" field.
    static Result<Resource, std::string> FromDocument(nlohmann::json document);

    [[nodiscard]] const ResourceId& Id() const noexcept { return id_; }
    [[nodiscard]] const nlohmann::json& Properties() const noexcept { return properties_; }

private:
    ResourceId id_;
    nlohmann::json properties_;
};

// ---------------------------------------------------------------------------
// ListError: a non-fatal failure listing one collection under one parent.
// `endpoint` is the uppercased "<parentId>/<childType>".
// ---------------------------------------------------------------------------
struct ListError {
    std::string endpoint;
    std::string api_version;
    std::string message;

    /// "listing <endpoint> (api-version=<v>): <message>"
    [[nodiscard]] std::string ToString() const;

    bool operator==(const ListError& other) const {
        return endpoint == other.endpoint && api_version == other.api_version &&
               message == other.message;
    }
};

/// "<parentId>/<childType>", the collection a listing call walks.
std::string ChildCollectionPath(const ResourceId& parent, std::string_view child_type);

/// Uppercased ChildCollectionPath(), the key ListErrors are deduped by.
std::string ListEndpointKey(const ResourceId& parent, std::string_view child_type);

// ---------------------------------------------------------------------------
// ListResult: resources and the partial failures met while finding them.
// ---------------------------------------------------------------------------
struct ListResult {
    std::vector<Resource> resources;
    std::vector<ListError> errors;
};

// -- Narrow document accessors ----------------------------------------------

/// Top-level string field, nullopt if absent or not a string.
std::optional<std::string> GetStringField(const nlohmann::json& doc,
                                          std::string_view key);

/// True if "managedBy" holds a value other than null or "".
bool IsManaged(const nlohmann::json& doc);

/// "properties.scope" as a string, if present.
std::optional<std::string> GetPropertiesScope(const nlohmann::json& doc);

// -- Ordering ---------------------------------------------------------------

void SortById(std::vector<Resource>& resources);
void SortByEndpoint(std::vector<ListError>& errors);

} // namespace azlist
