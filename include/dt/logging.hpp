#pragma once

#include <functional>
#include <string>

#include <dpp/misc-enum.h>

namespace dpp {
class cluster;
}

namespace dt {

/// Where core components send their log lines. main() binds this to
/// dpp::cluster::log so everything ends up in the cluster's on_log handler.
using log_sink = std::function<void(dpp::loglevel, const std::string&)>;

/// Sink that forwards to cluster.log(). The cluster must outlive the sink.
log_sink cluster_sink(dpp::cluster& cluster);

/// Sink that drops everything.
log_sink null_sink();

} // namespace dt
