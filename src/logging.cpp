#include "sharecost/logging.hpp"
#include <spdlog/spdlog.h>

namespace sharecost
{

    Result<void> configure_logging(const LoggingConfig &cfg)
    {
        auto level = spdlog::level::from_str(cfg.level);
        // from_str maps unknown names to off; only "off" itself may mean that
        if (level == spdlog::level::off && cfg.level != "off")
        {
            return std::unexpected(SharecostError::config("unknown log level: " + cfg.level));
        }
        spdlog::set_level(level);
        if (!cfg.pattern.empty())
            spdlog::set_pattern(cfg.pattern);
        return {};
    }

} // namespace sharecost
