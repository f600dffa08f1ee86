#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace scrape_core::auth {

// $HOME, else the passwd entry of the current user
std::filesystem::path homeDirectory();

// Parsed JSON object, nullopt when the file is missing; throws on unreadable or malformed content
std::optional<nlohmann::json> readJsonFile(const std::filesystem::path& path);

/**
 * Replace a file through a temporary sibling, creating parent directories.
 * The file is left with owner-only permissions (0600).
 * @return false on I/O failure (logged)
 */
bool writePrivateFile(const std::filesystem::path& path, const std::string& content);

} // namespace scrape_core::auth
