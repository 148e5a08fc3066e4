#pragma once

#include <azlist/core/result.hpp>

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace azlist {

// ---------------------------------------------------------------------------
// ResourceId: parsed Azure Resource Manager id.
//
// Accepted forms (keywords are case-insensitive):
//   /                                              tenant
//   /providers/Microsoft.Management/managementGroups/{mg}
//   /subscriptions/{sub}
//   /subscriptions/{sub}/resourceGroups/{rg}
//   {scope}/providers/{namespace}/{type}/{name}[/{type}/{name}]...
//
// A resource may itself be the scope of an extension resource:
//   .../providers/Microsoft.Network/virtualNetworks/vnet1
//       /providers/Microsoft.Authorization/roleAssignments/ra1
//
// The canonical string drops any trailing '/', keeps the input casing and
// is the basis for equality: two ids are equal iff their Key() matches.
// ---------------------------------------------------------------------------
class ResourceId {
public:
    enum class Kind {
        Tenant,
        ManagementGroup,
        Subscription,
        ResourceGroup,
        Resource,
    };

    static Result<ResourceId, std::string> Parse(std::string_view id);

    [[nodiscard]] Kind GetKind() const noexcept { return kind_; }

    /// Canonical display string.
    [[nodiscard]] const std::string& String() const noexcept { return canonical_; }

    /// Uppercased canonical string, used for dedup and lookups.
    [[nodiscard]] const std::string& Key() const noexcept { return key_; }

    /// Last name segment ("" for the tenant).
    [[nodiscard]] const std::string& Name() const noexcept { return name_; }

    /// Provider namespace, e.g. "Microsoft.Network" (resources only).
    [[nodiscard]] const std::string& Provider() const noexcept { return provider_; }

    /// Type segments below the provider, e.g. {"virtualNetworks", "subnets"}.
    [[nodiscard]] const std::vector<std::string>& Types() const noexcept { return types_; }

    /// Type path used for schema lookups:
    ///   "/Microsoft.Network/virtualNetworks/subnets" for resources,
    ///   "/subscriptions", "/resourceGroups", "/managementGroups" or "/"
    ///   for scopes.
    [[nodiscard]] std::string RouteScopeString() const;

    /// Full resource type, e.g. "Microsoft.Network/virtualNetworks/subnets".
    [[nodiscard]] std::string ResourceType() const;

    /// The scope this id lives under (nullptr for the tenant).
    [[nodiscard]] const ResourceId* Parent() const noexcept { return parent_.get(); }

    /// Closest tenant, management group, subscription or resource group
    /// ancestor. For a scope id this is the id itself.
    [[nodiscard]] ResourceId RootScope() const;

    [[nodiscard]] std::optional<std::string> SubscriptionId() const;
    [[nodiscard]] std::optional<std::string> ResourceGroupName() const;

    bool operator==(const ResourceId& other) const { return key_ == other.key_; }
    bool operator!=(const ResourceId& other) const { return key_ != other.key_; }
    bool operator<(const ResourceId& other) const { return canonical_ < other.canonical_; }

private:
    ResourceId() = default;

    void Finalize();

    Kind kind_ = Kind::Tenant;
    std::string canonical_;
    std::string key_;
    std::string name_;
    std::string provider_;
    std::vector<std::string> types_;
    std::vector<std::string> names_;
    std::shared_ptr<const ResourceId> parent_;
};

} // namespace azlist
