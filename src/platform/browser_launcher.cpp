#include "lcu_companion/platform/browser_launcher.hpp"
#include "lcu_companion/utils/logger.hpp"
#include "lcu_companion/utils/url_utils.hpp"

#include <cerrno>

#ifdef _WIN32
#include <windows.h>
#include <shellapi.h>
#else
#include <sys/wait.h>
#include <unistd.h>
#endif

namespace lcu_companion::platform {

std::string to_string(BrowserLaunchError error) {
    switch (error) {
        case BrowserLaunchError::NotSupported: return "Not supported";
        case BrowserLaunchError::LaunchFailed: return "Launch failed";
        case BrowserLaunchError::InvalidUrl: return "Invalid URL";
    }
    return "Unknown";
}

namespace {

#ifndef _WIN32
// Runs `opener url` without a shell and waits for it to exit
bool run_opener(const char* opener, const std::string& url) {
    pid_t pid = fork();
    if (pid == 0) {
        execlp(opener, opener, url.c_str(), static_cast<char*>(nullptr));
        _exit(127);
    }
    if (pid < 0) {
        LCU_LOG_ERROR("BrowserLauncher", "Failed to fork process for opening URL");
        return false;
    }

    int status = 0;
    pid_t result;
    do {
        result = waitpid(pid, &status, 0);
    } while (result == -1 && errno == EINTR);

    return result != -1 && WIFEXITED(status) && WEXITSTATUS(status) == 0;
}
#endif

class NativeBrowserLauncher : public BrowserLauncher {
public:
    std::expected<void, BrowserLaunchError> open_url(const std::string& url) override {
        if (!utils::UrlUtils::is_valid_url(url)) {
            return std::unexpected(BrowserLaunchError::InvalidUrl);
        }

        LCU_LOG_INFO("BrowserLauncher", "Opening URL: " + url);

#ifdef _WIN32
        HINSTANCE result = ShellExecuteA(nullptr, "open", url.c_str(), nullptr, nullptr, SW_SHOWNORMAL);
        if (reinterpret_cast<INT_PTR>(result) <= 32) {
            LCU_LOG_ERROR("BrowserLauncher", "ShellExecute failed with code " +
                          std::to_string(reinterpret_cast<INT_PTR>(result)));
            return std::unexpected(BrowserLaunchError::LaunchFailed);
        }
#elif defined(__APPLE__)
        if (!run_opener("open", url)) {
            LCU_LOG_ERROR("BrowserLauncher", "Failed to open URL via 'open'");
            return std::unexpected(BrowserLaunchError::LaunchFailed);
        }
#else
        if (!run_opener("xdg-open", url)) {
            LCU_LOG_ERROR("BrowserLauncher", "Failed to open URL via xdg-open");
            return std::unexpected(BrowserLaunchError::LaunchFailed);
        }
#endif
        return {};
    }
};

} // namespace

std::unique_ptr<BrowserLauncher> create_browser_launcher() {
    return std::make_unique<NativeBrowserLauncher>();
}

} // namespace lcu_companion::platform
