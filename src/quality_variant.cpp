#include "quality_variant.hpp"
#include <algorithm>

namespace sdc {

std::string QualityVariant::resolution() const {
    return std::to_string(width) + "x" + std::to_string(height);
}

int64_t QualityVariant::bandwidth_bps() const {
    return static_cast<int64_t>(video_bitrate_kbps) * 1000 +
           static_cast<int64_t>(audio_bitrate_kbps) * 1000;
}

const std::vector<QualityVariant>& quality_presets() {
    static const std::vector<QualityVariant> presets = {
        {"240p",   426,  240,  400,  64, 15, "baseline", "3.0"},
        {"360p",   640,  360,  800,  96, 30, "baseline", "3.1"},
        {"480p",   854,  480, 1200, 128, 30, "main",     "3.1"},
        {"720p",  1280,  720, 2500, 128, 30, "high",     "3.1"},
        {"1080p", 1920, 1080, 4500, 192, 30, "high",     "4.0"},
    };
    return presets;
}

const QualityVariant* find_variant(const std::string& name) {
    const auto& presets = quality_presets();
    auto it = std::find_if(presets.begin(), presets.end(),
                           [&name](const QualityVariant& v) { return v.name == name; });
    return it != presets.end() ? &*it : nullptr;
}

int variant_rank(const std::string& name) {
    const auto& presets = quality_presets();
    for (size_t i = 0; i < presets.size(); i++) {
        if (presets[i].name == name) {
            return static_cast<int>(i);
        }
    }
    return -1;
}

std::vector<std::string> order_variants(const std::vector<std::string>& names) {
    std::vector<std::string> out;
    for (const auto& preset : quality_presets()) {
        if (std::find(names.begin(), names.end(), preset.name) != names.end()) {
            out.push_back(preset.name);
        }
    }
    return out;
}

} // namespace sdc
