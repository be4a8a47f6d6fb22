#include "marcyb/logging.hpp"
#include <spdlog/sinks/stdout_color_sinks.h>

namespace marcyb {

std::shared_ptr<spdlog::logger> logger() {
    static std::shared_ptr<spdlog::logger> instance = [] {
        auto existing = spdlog::get("marcyb");
        if (existing) {
            return existing;
        }
        auto created = spdlog::stderr_color_mt("marcyb");
        created->set_level(spdlog::level::warn);
        created->set_pattern("[%H:%M:%S.%e] [%n] [%^%l%$] %v");
        return created;
    }();
    return instance;
}

void setLogLevel(spdlog::level::level_enum level) {
    logger()->set_level(level);
}

} // namespace marcyb
