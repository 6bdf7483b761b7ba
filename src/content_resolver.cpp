#include "coursedl/content_resolver.hpp"
#include "coursedl/errors.hpp"

#include <utility>

namespace coursedl {

ResolvedSource DirectResolver::resolve(const DownloadTask& task) const {
    if (task.url.empty()) {
        throw ResolveError("task " + task.id + " has no url");
    }
    return {task.url, task.headers};
}

ResolverRegistry::ResolverRegistry() : fallback_(std::make_shared<DirectResolver>()) {}

void ResolverRegistry::add(const std::string& category, std::shared_ptr<const ContentResolver> resolver) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (resolver) {
        resolvers_[category] = std::move(resolver);
    } else {
        resolvers_.erase(category);
    }
}

std::shared_ptr<const ContentResolver> ResolverRegistry::resolverFor(const std::string& category) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = resolvers_.find(category);
    return it != resolvers_.end() ? it->second : fallback_;
}

ResolvedSource ResolverRegistry::resolve(const DownloadTask& task) const {
    return resolverFor(task.category)->resolve(task);
}

} // namespace coursedl
