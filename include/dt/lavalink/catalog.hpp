#pragma once

#include <string>

#include "dt/catalog/catalog_client.hpp"
#include "dt/lavalink/client.hpp"

namespace dt::lavalink {

/// Catalog backed by Lavalink's /v4/loadtracks and a search source plugin.
/// Recommendations around a seed use the source's mix playlist for that
/// track, everything else is a text search built from the steering.
class lavalink_catalog : public catalog::catalog_client {
public:
    explicit lavalink_catalog(node& lavalink, std::string search_prefix = "ytsearch:");

    catalog::catalog_result search(const std::string& text) override;
    catalog::catalog_result recommend(const catalog::steering& request) override;

    /// Text search for a steering request (without the source prefix).
    static std::string steering_query(const catalog::steering& request);

    /// Identifier of the mix playlist seeded by a track id.
    static std::string mix_identifier(const std::string& seed_id);

    /// Maps a loadtracks result onto the catalog contract.
    static catalog::catalog_result to_catalog_result(load_result res);

private:
    node&       m_node;
    std::string m_search_prefix;
};

} // namespace dt::lavalink
