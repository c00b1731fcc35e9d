#ifndef DIASPORA_SHARD_DRIVER_LOGGER_HPP
#define DIASPORA_SHARD_DRIVER_LOGGER_HPP

#include <spdlog/spdlog.h>
#include <memory>

namespace shard {

// The "shard" logger. Its level is independent of spdlog's default logger.
std::shared_ptr<spdlog::logger>& logger();

}

#endif
