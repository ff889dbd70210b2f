#include "dt/session/tuning.hpp"

#include <algorithm>

namespace dt::session {

tuning tuning::fresh(const std::string& description) {
    tuning t;
    t.description = description;
    t.directions.push_back(description);
    return t;
}

void tuning::tune(const std::string& direction) {
    description = direction;
    directions.push_back(direction);
}

int tuning::dial(int delta) {
    energy = std::clamp(energy + delta, min_energy, max_energy);
    return energy;
}

bool operator==(const tuning& a, const tuning& b) {
    return a.description == b.description
        && a.energy == b.energy
        && a.directions == b.directions;
}

const char* energy_modifier(int energy) {
    if (energy <= -2) {
        return "slow ambient calm relaxing";
    }
    switch (energy) {
    case -1: return "chill mellow laid back";
    case 0:  return "";
    case 1:  return "upbeat energetic";
    default: return "hype intense bangers high energy";
    }
}

std::string build_radio_query(const std::string& description, int energy) {
    std::string query = description + " " + energy_modifier(energy);

    const auto first = query.find_first_not_of(' ');
    if (first == std::string::npos) {
        return {};
    }
    const auto last = query.find_last_not_of(' ');
    return query.substr(first, last - first + 1);
}

} // namespace dt::session
