#include "bulkfetch/logging.hpp"

#include <memory>
#include <stdexcept>
#include <vector>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace bulkfetch::logging {

void init(Level level, const std::optional<std::string>& log_file) {
    std::vector<spdlog::sink_ptr> sinks;

    // stderr keeps log lines out of the progress panel on stdout.
    auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console_sink->set_pattern("\033[36m[%Y-%m-%d %H:%M:%S.%e] \033[0m%^[%l]%$ %v");
    sinks.push_back(console_sink);

    if (log_file) {
        auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(*log_file, false);
        file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v");
        sinks.push_back(file_sink);
    }

    auto logger = std::make_shared<spdlog::logger>("bulkfetch", sinks.begin(), sinks.end());
    logger->set_level(level);
    logger->flush_on(Level::warn);
    spdlog::set_default_logger(logger);
}

Level parseLevel(const std::string& name) {
    const Level level = spdlog::level::from_str(name);
    if (level == Level::off && name != "off") {
        throw std::invalid_argument("Unknown log level: " + name);
    }
    return level;
}

} // namespace bulkfetch::logging
