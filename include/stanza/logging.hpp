#pragma once


/*
    --------------
    Stanza logging
    --------------
    Stanza logs through spdlog under the logger name `"stanza"`. The logger
    is created on first use as a clone of spdlog's default logger, so sinks,
    pattern and level follow whatever the application configured. With no
    default logger set, it writes to a colored stdout sink instead:

        spdlog::set_level(spdlog::level::debug);
        auto registry = builder.build();   // "Built adapter registry with 3 factories"

    To configure Stanza separately, register a logger named `"stanza"`
    before the first registry is built.

    Levels used:
        - debug: registry built, descriptor resolved, lookup failed,
          record decoded with missing properties
        - trace: cache hits, placeholders handed out for recursive types,
          record adapters constructed
*/

#include <memory>

#include <spdlog/logger.h>

#include "stanza/config.hpp"

namespace Stanza {

    using Logger = spdlog::logger;
    using LoggerPtr = std::shared_ptr<Logger>;

    /// @brief The `"stanza"` logger, registering it with spdlog on first use.
    [[nodiscard]] STANZA_API LoggerPtr get_logger();

} // namespace Stanza
