#pragma once

#include <azlist/arm/i_arm_client.hpp>
#include <azlist/arm/i_arm_session.hpp>
#include <azlist/core/log.hpp>

#include <optional>
#include <string>

namespace azlist {

// Resource Graph query endpoint and the api-versions this client speaks.
inline constexpr const char* kResourceGraphPath = "/providers/Microsoft.ResourceGraph/resources";
inline constexpr const char* kResourceGraphApiVersion = "2022-10-01";
inline constexpr const char* kResourceGroupApiVersion = "2021-04-01";

// ---------------------------------------------------------------------------
// ArmClient: IArmClient over an IArmSession, JSON via nlohmann.
//
// Endpoints:
//   POST /providers/Microsoft.ResourceGraph/resources?api-version=2022-10-01
//   GET  {parentId}/{childType}?api-version={v}   (then nextLink)
//   GET  {resourceGroupId}?api-version=2021-04-01
//
// Non-2xx responses become Error::FromHttpStatus() with the ARM error body
// ("code: message") attached as arm_error.
// ---------------------------------------------------------------------------
class ArmClient : public IArmClient {
public:
    explicit ArmClient(IArmSession& session, Logger& logger = Logger::Null());

    [[nodiscard]] Result<QueryPage, Error> QueryResources(
        const QueryRequest& request,
        const CancellationToken& cancel = {}) override;

    [[nodiscard]] Result<ListPage, Error> ListChildrenPage(
        const ResourceId& parent,
        std::string_view child_type,
        std::string_view api_version,
        const std::optional<std::string>& next_link,
        const CancellationToken& cancel = {}) override;

    [[nodiscard]] Result<nlohmann::json, Error> GetResourceGroup(
        const ResourceId& group,
        const CancellationToken& cancel = {}) override;

private:
    IArmSession& session_;
    Logger& logger_;
};

/// Pull "<code>: <message>" out of an ARM error body
/// ({"error":{"code":...,"message":...}}). nullopt if the body has no such
/// shape.
std::optional<std::string> ExtractArmError(std::string_view body);

/// Request body for a Resource Graph query.
nlohmann::json BuildQueryBody(const QueryRequest& request);

} // namespace azlist
