#pragma once

#include <optional>
#include <string>

#include <spdlog/spdlog.h>

namespace bulkfetch::logging {

using Level = spdlog::level::level_enum;

// Installs the default logger: coloured stderr, plus a file when given.
// The library itself only logs through spdlog's default logger.
void init(Level level, const std::optional<std::string>& log_file = std::nullopt);

[[nodiscard]] Level parseLevel(const std::string& name);

} // namespace bulkfetch::logging
