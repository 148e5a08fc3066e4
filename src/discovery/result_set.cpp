#include <azlist/discovery/result_set.hpp>
#include <azlist/core/strings.hpp>

namespace azlist {

bool ResultSet::AddResource(Resource resource) {
    if (!resource_keys_.insert(resource.Id().Key()).second) {
        return false;
    }
    resources_.push_back(std::move(resource));
    return true;
}

bool ResultSet::AddError(ListError error) {
    if (!error_keys_.insert(ToUpper(error.endpoint)).second) {
        return false;
    }
    errors_.push_back(std::move(error));
    return true;
}

bool ResultSet::ContainsResource(const ResourceId& id) const {
    return resource_keys_.count(id.Key()) != 0;
}

ListResult ResultSet::Finish() && {
    ListResult result{std::move(resources_), std::move(errors_)};
    SortById(result.resources);
    SortByEndpoint(result.errors);
    resource_keys_.clear();
    error_keys_.clear();
    return result;
}

} // namespace azlist
