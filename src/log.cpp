#include "coursedl/log.hpp"

#include <algorithm>
#include <cctype>
#include <mutex>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace coursedl::log {

namespace {

constexpr const char* kLoggerName = "coursedl";

std::mutex& sinkMutex() {
    static std::mutex mutex;
    return mutex;
}

} // namespace

std::shared_ptr<spdlog::logger> get() {
    static std::once_flag flag;
    std::call_once(flag, [] {
        if (!spdlog::get(kLoggerName)) {
            auto logger = spdlog::stderr_color_mt(kLoggerName);
            logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v");
            logger->set_level(spdlog::level::info);
        }
    });
    return spdlog::get(kLoggerName);
}

void setLevel(spdlog::level::level_enum level) {
    get()->set_level(level);
}

void setLevelFromString(const std::string& level) {
    std::string lowered(level);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    if (lowered == "warning") {
        lowered = "warn";
    }
    auto parsed = spdlog::level::from_str(lowered);
    if (parsed == spdlog::level::off && lowered != "off") {
        parsed = spdlog::level::info;
    }
    setLevel(parsed);
}

bool addFileSink(const std::string& path) {
    std::lock_guard<std::mutex> lock(sinkMutex());
    try {
        auto sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(path, false);
        get()->sinks().push_back(std::move(sink));
        return true;
    } catch (const spdlog::spdlog_ex& ex) {
        get()->error("cannot open log file {}: {}", path, ex.what());
        return false;
    }
}

} // namespace coursedl::log
