#include "dt/signals.hpp"

#include <csignal>

namespace dt {

namespace {

volatile std::sig_atomic_t g_stop_requested = 0;

void handle_stop_signal(int) {
    g_stop_requested = 1;
}

} // namespace

void install_stop_handlers() {
    std::signal(SIGINT, handle_stop_signal);
    std::signal(SIGTERM, handle_stop_signal);
}

bool stop_requested() {
    return g_stop_requested != 0;
}

void clear_stop_request() {
    g_stop_requested = 0;
}

} // namespace dt
