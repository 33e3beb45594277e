#pragma once

#include "tool.h"
#include <string>
#include <vector>

namespace voxlink {

/**
 * @brief ToolExecutor backed by the desktop: xdg-open / open, direct app launch.
 *
 * URLs and paths go through the platform opener and are waited for (the
 * opener returns quickly). Applications are launched and left running; a
 * launch counts as failed only if the process exits non-zero within
 * app_grace_ms.
 */
class SystemToolExecutor : public ToolExecutor {
public:
    explicit SystemToolExecutor(int app_grace_ms = 300);

    ToolResult open_url(const std::string& url) override;
    ToolResult open_path(const std::string& path) override;
    ToolResult run_app(const std::string& app_name) override;

private:
    int app_grace_ms_;
};

namespace process {

/**
 * @brief Spawn argv[0] (searched in PATH) and wait for it
 * @return Exit code, or -1 if it could not be spawned or was killed
 */
int run_and_wait(const std::vector<std::string>& args, std::string& error);

/**
 * @brief Spawn argv[0] and give it grace_ms to fail
 * @return true if it is still running or exited 0
 */
bool launch_detached(const std::vector<std::string>& args, int grace_ms, std::string& error);

/**
 * @brief pipe() whose ends are closed on exec.
 *
 * Children spawned by other threads never inherit them, so the reader sees
 * EOF as soon as its own writer closes.
 * @return false with errno set on failure
 */
bool open_pipe(int fds[2]);

} // namespace process

} // namespace voxlink
