#include "provider.hpp"
#include <algorithm>

namespace hookgate {

const char* event_kind_name(EventKind kind) {
    switch (kind) {
        case EventKind::Push:        return "push";
        case EventKind::PullRequest: return "pull_request";
        case EventKind::Other:       return "other";
    }
    return "other";
}

ProviderRegistry& ProviderRegistry::instance() {
    static ProviderRegistry registry;
    return registry;
}

void ProviderRegistry::register_provider(ProviderSpec spec) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::string name = spec.name;
    providers_[name] = std::move(spec);
}

std::optional<ProviderSpec> ProviderRegistry::find(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = providers_.find(name);
    if (it == providers_.end()) return std::nullopt;
    return it->second;
}

bool ProviderRegistry::has_provider(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return providers_.count(name) > 0;
}

std::vector<std::string> ProviderRegistry::names() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> names;
    names.reserve(providers_.size());
    for (const auto& [name, _] : providers_) {
        names.push_back(name);
    }
    std::sort(names.begin(), names.end());
    return names;
}

} // namespace hookgate
