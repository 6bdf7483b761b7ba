#pragma once

#include "download_task.hpp"

#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace coursedl {

// Final request parameters for a task.
struct ResolvedSource {
    std::string url;
    HeaderList headers;
};

// Turns a task into a concrete request. Implementations throw ResolveError.
class ContentResolver {
public:
    virtual ~ContentResolver() = default;

    [[nodiscard]] virtual ResolvedSource resolve(const DownloadTask& task) const = 0;
};

// Passes the task's url and headers through unchanged.
class DirectResolver : public ContentResolver {
public:
    [[nodiscard]] ResolvedSource resolve(const DownloadTask& task) const override;
};

class ResolverRegistry {
public:
    ResolverRegistry();

    // Replaces any resolver registered for `category`.
    void add(const std::string& category, std::shared_ptr<const ContentResolver> resolver);

    // Falls back to the direct resolver for unknown categories.
    [[nodiscard]] std::shared_ptr<const ContentResolver> resolverFor(const std::string& category) const;

    [[nodiscard]] ResolvedSource resolve(const DownloadTask& task) const;

private:
    std::shared_ptr<const ContentResolver> fallback_;
    std::map<std::string, std::shared_ptr<const ContentResolver>> resolvers_;
    mutable std::mutex mutex_;
};

} // namespace coursedl
