#include "manifest.hpp"
#include "quality_variant.hpp"
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <system_error>

namespace fs = std::filesystem;

namespace sdc {

std::string build_master_playlist(const std::vector<std::string>& variants) {
    std::ostringstream oss;
    oss << "#EXTM3U\n#EXT-X-VERSION:3\n\n";

    for (const auto& name : variants) {
        const QualityVariant* preset = find_variant(name);
        if (!preset) {
            throw std::invalid_argument("Unknown quality variant: " + name);
        }
        oss << "#EXT-X-STREAM-INF:BANDWIDTH=" << preset->bandwidth_bps()
            << ",RESOLUTION=" << preset->resolution()
            << ",FRAME-RATE=" << preset->fps << "\n"
            << variant_playlist_uri(name) << "\n\n";
    }

    return oss.str();
}

std::string variant_playlist_uri(const std::string& variant) {
    return variant + "/index.m3u8";
}

fs::path write_master_playlist(const fs::path& dir, const std::vector<std::string>& variants) {
    std::string content = build_master_playlist(variants);

    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        throw std::runtime_error("Cannot create " + dir.string() + ": " + ec.message());
    }

    fs::path target = dir / "master.m3u8";
    fs::path tmp = dir / "master.m3u8.tmp";
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            throw std::runtime_error("Cannot write " + tmp.string());
        }
        out << content;
        if (!out) {
            throw std::runtime_error("Short write to " + tmp.string());
        }
    }

    fs::rename(tmp, target, ec);
    if (ec) {
        throw std::runtime_error("Cannot replace " + target.string() + ": " + ec.message());
    }
    return target;
}

} // namespace sdc
