#pragma once

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace coursedl::log {

// Named "coursedl" logger writing to stderr. Created on first use.
std::shared_ptr<spdlog::logger> get();

void setLevel(spdlog::level::level_enum level);
void setLevelFromString(const std::string& level);

// Adds a file sink next to the stderr sink. Returns false if the file cannot be opened.
bool addFileSink(const std::string& path);

} // namespace coursedl::log
