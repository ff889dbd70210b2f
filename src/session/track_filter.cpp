#include "dt/session/track_filter.hpp"

#include <algorithm>
#include <cctype>
#include <regex>
#include <vector>

namespace dt::session {

namespace {

const std::vector<std::regex>& non_song_patterns() {
    static const std::vector<std::regex> patterns = [] {
        const char* sources[] = {
            R"(\binterview\b)",
            R"(\bpodcast\b)",
            R"(\breaction\b)",
            R"(\breview\b)",
            R"(\bfull album\b)",
            R"(\bcomplete album\b)",
            R"(\blive stream\b)",
            R"(\blivestream\b)",
            R"(\bmaking of\b)",
            R"(\bbehind the scenes\b)",
            R"(\bdocumentary\b)",
            R"(\btutorial\b)",
            R"(\blesson\b)",
            R"(\bhow to\b)",
            R"(\bcompilation\b)",
            R"(\bmix 20\d\d\b)",
            R"(\b1 hour\b)",
            R"(\b2 hour\b)",
            R"(\b3 hour\b)",
            R"(\bplaylist\b)",
            R"(\bnonstop\b)",
            R"(\bmegamix\b)",
        };
        std::vector<std::regex> out;
        for (const char* src : sources) {
            out.emplace_back(src, std::regex::icase | std::regex::optimize);
        }
        return out;
    }();
    return patterns;
}

const std::vector<std::regex>& title_noise_patterns() {
    static const std::vector<std::regex> patterns = [] {
        const char* sources[] = {
            R"(\(official\s*(music\s*)?video\))",
            R"(\(official\s*audio\))",
            R"(\(official\s*lyric\s*video\))",
            R"(\(lyric\s*video\))",
            R"(\(lyrics?\))",
            R"(\(audio\))",
            R"(\(visualizer\))",
            R"(\(official\s*visualizer\))",
            R"(\[official\s*(music\s*)?video\])",
            R"(\[official\s*audio\])",
            R"(\[lyrics?\])",
            R"(\(hd\))",
            R"(\(hq\))",
            R"(\(4k\))",
            R"(\(remaster(ed)?\))",
            R"(\(live\))",
            R"(\(acoustic\))",
            R"(official\s*(music\s*)?video)",
            R"(\|.*$)",
            R"(-\s*topic$)",
        };
        std::vector<std::regex> out;
        for (const char* src : sources) {
            out.emplace_back(src, std::regex::icase | std::regex::optimize);
        }
        return out;
    }();
    return patterns;
}

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string trim(const std::string& s) {
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return {};
    }
    const auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

} // namespace

std::string normalize_title(const std::string& title) {
    std::string normalized = trim(to_lower(title));

    for (const auto& pattern : title_noise_patterns()) {
        normalized = std::regex_replace(normalized, pattern, "");
    }

    static const std::regex whitespace(R"(\s+)");
    normalized = std::regex_replace(normalized, whitespace, " ");
    return trim(normalized);
}

bool is_likely_song(const std::string& title, std::int64_t duration_ms) {
    const std::string lowered = to_lower(title);

    for (const auto& pattern : non_song_patterns()) {
        if (std::regex_search(lowered, pattern)) {
            return false;
        }
    }

    if (duration_ms > 0) {
        if (duration_ms < min_song_duration_ms || duration_ms > max_song_duration_ms) {
            return false;
        }
    }

    return true;
}

} // namespace dt::session
