#include "dt/logging.hpp"

#include <dpp/cluster.h>

namespace dt {

log_sink cluster_sink(dpp::cluster& cluster) {
    return [&cluster](dpp::loglevel level, const std::string& message) {
        cluster.log(level, message);
    };
}

log_sink null_sink() {
    return [](dpp::loglevel, const std::string&) {};
}

} // namespace dt
