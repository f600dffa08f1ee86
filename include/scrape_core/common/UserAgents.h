#pragma once

#include <string>
#include <vector>

namespace scrape_core::common {

// Browser user-agent strings used when user-agent rotation is enabled
const std::vector<std::string>& knownUserAgents();

// Never a mobile agent
std::string randomDesktopUserAgent();

} // namespace scrape_core::common
