#pragma once

#include <string>
#include <vector>

namespace dt::session {

constexpr int min_energy = -2;
constexpr int max_energy = 2;

/// What radio mode is steering towards. The first entry of `directions` is
/// the description the station started with; every tune appends one.
struct tuning {
    std::string              description;
    int                      energy = 0;
    std::vector<std::string> directions;

    static tuning fresh(const std::string& description);

    /// Replace the description and remember the new direction.
    void tune(const std::string& direction);

    /// Move energy by delta, clamped to [min_energy, max_energy].
    /// Returns the new level.
    int dial(int delta);
};

bool operator==(const tuning& a, const tuning& b);
inline bool operator!=(const tuning& a, const tuning& b) { return !(a == b); }

/// Search words that bias results towards the energy level. Empty at 0;
/// levels past the bounds use the strongest modifier.
const char* energy_modifier(int energy);

/// Free-text query for a description at an energy level, trimmed.
std::string build_radio_query(const std::string& description, int energy);

} // namespace dt::session
