#pragma once

#include <cstdint>
#include <string>

#include "chunkdrive/server/event_dispatcher.hpp"

namespace chunkdrive::server
{

    std::string format_bytes(std::uint64_t bytes);

    // Writes lifecycle events to the default spdlog logger; progress goes to debug.
    EventDispatcher::Listener make_logging_listener();

} // namespace chunkdrive::server
