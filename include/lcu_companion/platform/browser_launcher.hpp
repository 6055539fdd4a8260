#pragma once

#include <expected>
#include <memory>
#include <string>

namespace lcu_companion::platform {

enum class BrowserLaunchError {
    NotSupported,
    LaunchFailed,
    InvalidUrl
};

std::string to_string(BrowserLaunchError error);

// Opens URLs in the user's default browser
class BrowserLauncher {
public:
    virtual ~BrowserLauncher() = default;

    virtual std::expected<void, BrowserLaunchError> open_url(const std::string& url) = 0;
};

std::unique_ptr<BrowserLauncher> create_browser_launcher();

} // namespace lcu_companion::platform
