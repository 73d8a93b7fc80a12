#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace sdc {

// HLS master playlist over the given variant names (ladder order is kept as given)
std::string build_master_playlist(const std::vector<std::string>& variants);

// Relative URI of a variant playlist inside the stream directory
std::string variant_playlist_uri(const std::string& variant);

// Writes <dir>/master.m3u8 through a temp file + rename so readers never see a
// half-written manifest. Throws std::runtime_error on I/O failure.
std::filesystem::path write_master_playlist(const std::filesystem::path& dir,
                                            const std::vector<std::string>& variants);

} // namespace sdc
