#pragma once

#include <azlist/discovery/extension_resolver.hpp>

#include <string>
#include <string_view>

namespace azlist {

inline constexpr const char* kRoleAssignmentType = "Microsoft.Authorization/roleAssignments";

/// True when the candidate's properties.scope equals the parent's id,
/// ignoring case.
bool RoleAssignmentAtParentScope(const nlohmann::json& parent,
                                 const nlohmann::json& candidate);

/// ExtensionResourceSpec for `type`, with the built-in filter attached when
/// one exists.
ExtensionResourceSpec MakeExtensionSpec(std::string type);

} // namespace azlist
