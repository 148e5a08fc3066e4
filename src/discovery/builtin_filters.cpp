#include <azlist/discovery/builtin_filters.hpp>
#include <azlist/core/strings.hpp>

namespace azlist {

bool RoleAssignmentAtParentScope(const nlohmann::json& parent,
                                 const nlohmann::json& candidate) {
    auto id = GetStringField(parent, "id");
    if (!id.has_value()) {
        return false;
    }
    auto scope = GetPropertiesScope(candidate);
    if (!scope.has_value()) {
        return false;
    }
    return IEquals(*id, *scope);
}

ExtensionResourceSpec MakeExtensionSpec(std::string type) {
    ExtensionResourceSpec spec{std::move(type), nullptr};
    if (IEquals(spec.type, kRoleAssignmentType)) {
        spec.filter = RoleAssignmentAtParentScope;
    }
    return spec;
}

} // namespace azlist
