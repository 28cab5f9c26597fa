#include "imgkit/logging.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

namespace imgkit {

std::shared_ptr<spdlog::logger> make_ui_logger(bool verbose, bool quiet) {
    auto sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>("imgkit", sink);

    logger->set_pattern("%v");
    if (verbose) {
        logger->set_level(spdlog::level::debug);
    } else if (quiet) {
        logger->set_level(spdlog::level::warn);
    } else {
        logger->set_level(spdlog::level::info);
    }
    logger->flush_on(spdlog::level::info);

    return logger;
}

} // namespace imgkit
