#include "stanza/logging.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>


namespace Stanza {

    namespace {
        constexpr const char* logger_name = "stanza";
    } // namespace

    LoggerPtr get_logger() {
        if (auto logger = spdlog::get(logger_name)) return logger;

        LoggerPtr logger;
        if (auto fallback = spdlog::default_logger()) logger = fallback->clone(logger_name);
        else logger = std::make_shared<Logger>(logger_name, std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
        try {
            spdlog::register_logger(logger);
        } catch (const spdlog::spdlog_ex&) {
            // Another thread registered it first.
            if (auto existing = spdlog::get(logger_name)) return existing;
            throw;
        }
        return logger;
    }

} // namespace Stanza
