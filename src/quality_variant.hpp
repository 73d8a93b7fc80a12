#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace sdc {

// Encoding preset for one rung of the ABR ladder
struct QualityVariant {
    std::string name;
    int width = 0;
    int height = 0;
    int video_bitrate_kbps = 0;
    int audio_bitrate_kbps = 0;
    int fps = 0;
    std::string profile;
    std::string level;

    std::string resolution() const;

    // Advertised in the master playlist: video + audio, in bits per second
    int64_t bandwidth_bps() const;
};

// Fixed preset table, ordered from lowest to highest quality
const std::vector<QualityVariant>& quality_presets();

// nullptr when the name is not a known preset
const QualityVariant* find_variant(const std::string& name);

// Position in the ladder (0 = lowest), -1 for unknown names
int variant_rank(const std::string& name);

// Sorts names by ladder position and drops duplicates; unknown names are kept out
std::vector<std::string> order_variants(const std::vector<std::string>& names);

} // namespace sdc
