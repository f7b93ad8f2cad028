#pragma once

#include "types.hpp"
#include "config.hpp"

namespace sharecost
{
    /**
     * Apply level and pattern to the default spdlog logger.
     * ConfigError for an unknown level name.
     */
    Result<void> configure_logging(const LoggingConfig &cfg);
}
