#include "Logger.hpp"
#include <spdlog/sinks/stdout_color_sinks.h>

namespace shard {

std::shared_ptr<spdlog::logger>& logger() {
    static std::shared_ptr<spdlog::logger> shard_logger = [] {
        if(auto existing = spdlog::get("shard")) return existing;
        return spdlog::stderr_color_mt("shard");
    }();
    return shard_logger;
}

}
