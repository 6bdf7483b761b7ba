#include "coursedl/manifest.hpp"

#include <fstream>
#include <memory>
#include <sstream>

#include <fmt/format.h>
#include <json/json.h>

namespace coursedl {

namespace {

DownloadTask taskFromJson(const Json::Value& entry, Json::ArrayIndex index, const std::filesystem::path& base_dir) {
    if (!entry.isObject()) {
        throw ManifestError(fmt::format("task #{} is not an object", index));
    }
    if (!entry["url"].isString() || entry["url"].asString().empty()) {
        throw ManifestError(fmt::format("task #{} has no url", index));
    }
    if (!entry["destination"].isString() || entry["destination"].asString().empty()) {
        throw ManifestError(fmt::format("task #{} has no destination", index));
    }

    DownloadTask task;
    task.url = entry["url"].asString();
    task.destination = entry["destination"].asString();
    if (task.destination.is_relative()) {
        task.destination = base_dir / task.destination;
    }
    task.id = entry["id"].isString() ? entry["id"].asString() : task.destination.lexically_normal().string();

    const Json::Value& size = entry["expected_size"];
    if (!size.isNull()) {
        if (!size.isUInt64()) {
            throw ManifestError(fmt::format("task {}: expected_size must be a non-negative integer", task.id));
        }
        task.expected_size = size.asUInt64();
    }
    if (entry["checksum"].isString()) {
        task.expected_checksum = entry["checksum"].asString();
    }
    if (entry["category"].isString()) {
        task.category = entry["category"].asString();
    }
    if (entry["priority"].isInt()) {
        task.priority = entry["priority"].asInt();
    }

    const Json::Value& headers = entry["headers"];
    if (headers.isObject()) {
        for (const auto& name : headers.getMemberNames()) {
            if (!headers[name].isString()) {
                throw ManifestError(fmt::format("task {}: header {} must be a string", task.id, name));
            }
            task.headers.emplace_back(name, headers[name].asString());
        }
    } else if (!headers.isNull()) {
        throw ManifestError(fmt::format("task {}: headers must be an object", task.id));
    }
    return task;
}

} // namespace

std::vector<DownloadTask> parseManifest(const std::string& text, const std::filesystem::path& base_dir) {
    Json::CharReaderBuilder builder;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());

    Json::Value root;
    std::string errors;
    if (!reader->parse(text.data(), text.data() + text.size(), &root, &errors)) {
        throw ManifestError("manifest is not valid JSON: " + errors);
    }

    const Json::Value& list = root.isObject() ? root["tasks"] : root;
    if (!list.isArray()) {
        throw ManifestError("manifest must be an array of tasks or an object with a \"tasks\" array");
    }

    std::vector<DownloadTask> tasks;
    tasks.reserve(list.size());
    for (Json::ArrayIndex i = 0; i < list.size(); ++i) {
        tasks.push_back(taskFromJson(list[i], i, base_dir));
    }
    return tasks;
}

std::vector<DownloadTask> loadManifest(const std::filesystem::path& path, const std::filesystem::path& base_dir) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw ManifestError("cannot open manifest " + path.string());
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return parseManifest(buffer.str(), base_dir);
}

} // namespace coursedl
