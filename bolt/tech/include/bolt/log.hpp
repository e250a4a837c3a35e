#pragma once

// Logging goes through spdlog. Call sites use bolt::log::info("...{}...", arg) and friends,
// and applications tune verbosity with bolt::log::set_level(bolt::log::level::debug).
#include <spdlog/common.h>  // IWYU pragma: export
#include <spdlog/spdlog.h>  // IWYU pragma: export

namespace bolt {

namespace log = spdlog;

}  // namespace bolt
