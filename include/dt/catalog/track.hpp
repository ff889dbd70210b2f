#pragma once

#include <cstdint>
#include <string>

namespace dt::catalog {

struct track {
    std::string  id;          // stable external identifier (YouTube video id etc.)
    std::string  title;
    std::string  artist;      // author / channel
    std::int64_t duration_ms = 0;
    std::string  uri;
    std::string  encoded;     // opaque handle the playback backend plays
    bool         is_stream = false;
};

inline bool operator==(const track& a, const track& b) {
    return a.id == b.id;
}

inline bool operator!=(const track& a, const track& b) {
    return !(a == b);
}

} // namespace dt::catalog
