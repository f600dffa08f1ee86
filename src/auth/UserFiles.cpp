#include "UserFiles.h"
#include "../../include/scrape_core/common/Errors.h"
#include "../../include/Logger.h"

#include <cstdlib>
#include <fstream>
#include <sstream>
#include <pwd.h>
#include <sys/stat.h>
#include <unistd.h>

namespace scrape_core::auth {

namespace fs = std::filesystem;

fs::path homeDirectory() {
    const char* home = std::getenv("HOME");
    if (home && *home) {
        return fs::path(home);
    }
    struct passwd* entry = getpwuid(getuid());
    if (entry && entry->pw_dir) {
        return fs::path(entry->pw_dir);
    }
    LOG_WARNING("Unable to determine home directory, using current directory");
    return fs::current_path();
}

std::optional<nlohmann::json> readJsonFile(const fs::path& path) {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        return std::nullopt;
    }
    std::ifstream file(path);
    if (!file) {
        throw common::ScrapeError("Cannot open " + path.string());
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    try {
        nlohmann::json j = nlohmann::json::parse(buffer.str());
        if (!j.is_object()) {
            throw common::ScrapeError(path.string() + " does not hold a JSON object");
        }
        return j;
    } catch (const nlohmann::json::parse_error& e) {
        throw common::ScrapeError("Malformed JSON in " + path.string() + ": " + e.what());
    }
}

bool writePrivateFile(const fs::path& path, const std::string& content) {
    std::error_code ec;
    if (path.has_parent_path()) {
        fs::create_directories(path.parent_path(), ec);
        if (ec) {
            LOG_ERROR("Failed to create " + path.parent_path().string() + ": " + ec.message());
            return false;
        }
    }

    fs::path tmp = path;
    tmp += ".tmp";
    {
        // Restrict before any secret byte is written
        std::ofstream out(tmp, std::ios::trunc);
        if (!out) {
            LOG_ERROR("Failed to open " + tmp.string() + " for writing");
            return false;
        }
        if (chmod(tmp.c_str(), S_IRUSR | S_IWUSR) != 0) {
            LOG_WARNING("Failed to restrict permissions on " + tmp.string());
        }
        out << content;
        out.flush();
        if (!out) {
            LOG_ERROR("Failed to write " + tmp.string());
            fs::remove(tmp, ec);
            return false;
        }
    }

    fs::rename(tmp, path, ec);
    if (ec) {
        LOG_ERROR("Failed to replace " + path.string() + ": " + ec.message());
        fs::remove(tmp, ec);
        return false;
    }
    return true;
}

} // namespace scrape_core::auth
