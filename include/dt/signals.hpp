#pragma once

namespace dt {

/// Routes SIGINT and SIGTERM into a flag. The handler does nothing else, so
/// the bot polls stop_requested() from a timer and shuts down there.
void install_stop_handlers();

bool stop_requested();
void clear_stop_request();

} // namespace dt
