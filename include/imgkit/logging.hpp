#pragma once

#include <memory>

#include <spdlog/logger.h>

namespace imgkit {

// ============================================================================
// UI Logger
// ============================================================================
//
// Progress lines ("dir: ...", "Pulling image ...") go to stdout without
// decoration. Verbose enables debug output (HTTP requests, auth challenges);
// quiet keeps only warnings and errors.

std::shared_ptr<spdlog::logger> make_ui_logger(bool verbose, bool quiet);

} // namespace imgkit
