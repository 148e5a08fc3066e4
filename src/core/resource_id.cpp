#include <azlist/core/resource_id.hpp>
#include <azlist/core/strings.hpp>

namespace azlist {

namespace {

using ParseResult = Result<ResourceId, std::string>;

constexpr std::string_view kProviders = "providers";

} // anonymous namespace

// ---------------------------------------------------------------------------
// Parse
// ---------------------------------------------------------------------------
Result<ResourceId, std::string> ResourceId::Parse(std::string_view id) {
    if (id.empty()) {
        return ParseResult::Err("Resource id must not be empty");
    }
    if (id.front() != '/') {
        return ParseResult::Err("Resource id must start with '/': " + std::string(id));
    }

    auto trimmed = id.substr(1);
    if (!trimmed.empty() && trimmed.back() == '/') {
        trimmed.remove_suffix(1);
    }

    ResourceId tenant;
    tenant.kind_ = Kind::Tenant;
    tenant.canonical_ = "/";
    tenant.Finalize();
    if (trimmed.empty()) {
        return ParseResult::Ok(std::move(tenant));
    }

    const auto segs = Split(trimmed, '/');
    for (const auto& seg : segs) {
        if (seg.empty()) {
            return ParseResult::Err("Resource id contains an empty segment: " +
                                    std::string(id));
        }
    }

    // -- Scope prefix --------------------------------------------------------
    auto scope = std::make_shared<const ResourceId>(tenant);
    size_t pos = 0;
    std::string prefix;

    if (IEquals(segs[0], "subscriptions")) {
        if (segs.size() < 2) {
            return ParseResult::Err("Missing subscription id: " + std::string(id));
        }
        ResourceId sub;
        sub.kind_ = Kind::Subscription;
        sub.name_ = segs[1];
        sub.canonical_ = "/" + segs[0] + "/" + segs[1];
        sub.parent_ = scope;
        sub.Finalize();
        prefix = sub.canonical_;
        scope = std::make_shared<const ResourceId>(std::move(sub));
        pos = 2;

        if (segs.size() > 2 && IEquals(segs[2], "resourceGroups")) {
            if (segs.size() < 4) {
                return ParseResult::Err("Missing resource group name: " + std::string(id));
            }
            ResourceId rg;
            rg.kind_ = Kind::ResourceGroup;
            rg.name_ = segs[3];
            rg.canonical_ = prefix + "/" + segs[2] + "/" + segs[3];
            rg.parent_ = scope;
            rg.Finalize();
            prefix = rg.canonical_;
            scope = std::make_shared<const ResourceId>(std::move(rg));
            pos = 4;
        }
    } else if (segs.size() >= 4 && IEquals(segs[0], kProviders) &&
               IEquals(segs[1], "Microsoft.Management") &&
               IEquals(segs[2], "managementGroups")) {
        ResourceId mg;
        mg.kind_ = Kind::ManagementGroup;
        mg.name_ = segs[3];
        mg.canonical_ = "/" + segs[0] + "/" + segs[1] + "/" + segs[2] + "/" + segs[3];
        mg.parent_ = scope;
        mg.Finalize();
        prefix = mg.canonical_;
        scope = std::make_shared<const ResourceId>(std::move(mg));
        pos = 4;
    } else if (!IEquals(segs[0], kProviders)) {
        return ParseResult::Err("Unrecognised scope '" + segs[0] + "' in: " +
                                std::string(id));
    }

    if (pos == segs.size()) {
        return ParseResult::Ok(ResourceId(*scope));
    }

    // -- Provider blocks -----------------------------------------------------
    // Each "providers/{ns}/{type}/{name}[/{type}/{name}]..." block produces a
    // resource whose scope is everything before it.
    std::optional<ResourceId> current;
    while (pos < segs.size()) {
        if (!IEquals(segs[pos], kProviders)) {
            return ParseResult::Err("Expected 'providers' at segment " +
                                    std::to_string(pos + 1) + " of: " + std::string(id));
        }
        if (pos + 1 >= segs.size()) {
            return ParseResult::Err("Missing provider namespace: " + std::string(id));
        }

        ResourceId res;
        res.kind_ = Kind::Resource;
        res.provider_ = segs[pos + 1];
        res.parent_ = scope;
        std::string canonical = prefix + "/" + segs[pos] + "/" + segs[pos + 1];
        pos += 2;

        while (pos < segs.size() && !IEquals(segs[pos], kProviders)) {
            if (pos + 1 >= segs.size()) {
                return ParseResult::Err("Resource type '" + segs[pos] +
                                        "' has no name in: " + std::string(id));
            }
            res.types_.push_back(segs[pos]);
            res.names_.push_back(segs[pos + 1]);
            canonical += "/" + segs[pos] + "/" + segs[pos + 1];
            pos += 2;
        }
        if (res.types_.empty()) {
            return ParseResult::Err("Provider '" + res.provider_ +
                                    "' has no resource type in: " + std::string(id));
        }

        res.name_ = res.names_.back();
        res.canonical_ = canonical;
        res.Finalize();
        prefix = res.canonical_;
        current = res;
        scope = std::make_shared<const ResourceId>(std::move(res));
    }

    return ParseResult::Ok(std::move(*current));
}

void ResourceId::Finalize() {
    key_ = ToUpper(canonical_);
}

// ---------------------------------------------------------------------------
// Accessors
// ---------------------------------------------------------------------------
std::string ResourceId::RouteScopeString() const {
    switch (kind_) {
        case Kind::Tenant:          return "/";
        case Kind::ManagementGroup: return "/managementGroups";
        case Kind::Subscription:    return "/subscriptions";
        case Kind::ResourceGroup:   return "/resourceGroups";
        case Kind::Resource:        return "/" + ResourceType();
    }
    return "/";
}

std::string ResourceId::ResourceType() const {
    if (kind_ != Kind::Resource) {
        return "";
    }
    return provider_ + "/" + Join(types_, "/");
}

ResourceId ResourceId::RootScope() const {
    const ResourceId* node = this;
    while (node->kind_ == Kind::Resource && node->parent_) {
        node = node->parent_.get();
    }
    return *node;
}

std::optional<std::string> ResourceId::SubscriptionId() const {
    for (const ResourceId* node = this; node != nullptr; node = node->parent_.get()) {
        if (node->kind_ == Kind::Subscription) {
            return node->name_;
        }
    }
    return std::nullopt;
}

std::optional<std::string> ResourceId::ResourceGroupName() const {
    for (const ResourceId* node = this; node != nullptr; node = node->parent_.get()) {
        if (node->kind_ == Kind::ResourceGroup) {
            return node->name_;
        }
    }
    return std::nullopt;
}

} // namespace azlist
