#pragma once

#include <filesystem>
#include <string>
#include <string_view>

namespace relsync::artifacts {

// Lowercase hex SHA-256 of the full file contents. Streams the file, so large
// artifacts are never held in memory.
bool ComputeFileSha256(const std::filesystem::path& path, std::string& hex_digest,
                       std::string& error);

std::string ComputeSha256(std::string_view data);

} // namespace relsync::artifacts
