#include "tool_executor.h"
#include "logger.h"
#include "path_utils.h"
#include <cerrno>
#include <chrono>
#include <cstring>
#include <thread>
#include <fcntl.h>
#include <spawn.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace voxlink {

const char* tool_action_name(ToolAction action) {
    switch (action) {
        case ToolAction::OpenUrl: return "open_url";
        case ToolAction::OpenPath: return "open_path";
        case ToolAction::RunApp: return "run_app";
        default: return "unknown";
    }
}

const char* tool_argument_key(ToolAction action) {
    switch (action) {
        case ToolAction::OpenUrl: return "url";
        case ToolAction::OpenPath: return "path";
        case ToolAction::RunApp: return "app_name";
        default: return "";
    }
}

std::optional<ToolAction> parse_tool_action(const std::string& name) {
    if (name == "open_url") return ToolAction::OpenUrl;
    if (name == "open_path") return ToolAction::OpenPath;
    if (name == "run_app") return ToolAction::RunApp;
    return std::nullopt;
}

ToolResult ToolExecutor::execute(const ToolInvocation& invocation) {
    const std::string arg = invocation.argument();
    if (arg.empty()) {
        return ToolResult::error_result("Error: missing argument \"" +
                                        std::string(tool_argument_key(invocation.action)) +
                                        "\" for " + invocation.name());
    }
    switch (invocation.action) {
        case ToolAction::OpenUrl: return open_url(arg);
        case ToolAction::OpenPath: return open_path(arg);
        case ToolAction::RunApp: return run_app(arg);
    }
    return ToolResult::error_result("Error: unsupported tool " + invocation.name());
}

namespace process {

namespace {

bool spawn(const std::vector<std::string>& args, pid_t& pid, std::string& error) {
    if (args.empty()) {
        error = "empty command";
        return false;
    }
    std::vector<char*> argv;
    argv.reserve(args.size() + 1);
    for (const auto& arg : args) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    int rc = posix_spawnp(&pid, args[0].c_str(), nullptr, nullptr, argv.data(), environ);
    if (rc != 0) {
        error = "failed to start " + args[0] + ": " + std::strerror(rc);
        return false;
    }
    return true;
}

} // namespace

int run_and_wait(const std::vector<std::string>& args, std::string& error) {
    pid_t pid = -1;
    if (!spawn(args, pid, error)) return -1;

    int status = 0;
    if (waitpid(pid, &status, 0) != pid) {
        error = "waitpid failed for " + args[0];
        return -1;
    }
    if (!WIFEXITED(status)) {
        error = args[0] + " terminated abnormally";
        return -1;
    }
    int code = WEXITSTATUS(status);
    if (code != 0) {
        error = args[0] + " exited with status " + std::to_string(code);
    }
    return code;
}

bool launch_detached(const std::vector<std::string>& args, int grace_ms, std::string& error) {
    pid_t pid = -1;
    if (!spawn(args, pid, error)) return false;

    const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(grace_ms);
    int status = 0;
    while (std::chrono::steady_clock::now() < deadline) {
        pid_t ret = waitpid(pid, &status, WNOHANG);
        if (ret == pid) {
            if (WIFEXITED(status) && WEXITSTATUS(status) == 0) return true;
            error = args[0] + " exited early with status " +
                    std::to_string(WIFEXITED(status) ? WEXITSTATUS(status) : -1);
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }

    // Still running: reap it whenever it exits
    std::thread([pid]() {
        int st = 0;
        waitpid(pid, &st, 0);
    }).detach();
    return true;
}

bool open_pipe(int fds[2]) {
#if defined(__linux__)
    return pipe2(fds, O_CLOEXEC) == 0;
#else
    if (pipe(fds) == -1) return false;
    for (int i = 0; i < 2; i++) {
        if (fcntl(fds[i], F_SETFD, FD_CLOEXEC) == -1) {
            int saved = errno;
            close(fds[0]);
            close(fds[1]);
            errno = saved;
            return false;
        }
    }
    return true;
#endif
}

} // namespace process

SystemToolExecutor::SystemToolExecutor(int app_grace_ms)
    : app_grace_ms_(app_grace_ms) {}

ToolResult SystemToolExecutor::open_url(const std::string& url) {
#if defined(__APPLE__)
    std::vector<std::string> cmd = {"open", url};
#else
    std::vector<std::string> cmd = {"xdg-open", url};
#endif
    std::string error;
    if (process::run_and_wait(cmd, error) != 0) {
        LOG_TOOL("open_url failed: " + error);
        return ToolResult::error_result("Error opening URL: " + error);
    }
    LOG_TOOL("Opened URL: " + url);
    return ToolResult::success_result("Opened URL: " + url);
}

ToolResult SystemToolExecutor::open_path(const std::string& path) {
    const std::string expanded = expand_path(path);
    struct stat st;
    if (stat(expanded.c_str(), &st) != 0) {
        LOG_TOOL("open_path: no such path " + expanded);
        return ToolResult::error_result("Error: Path does not exist: " + path);
    }

#if defined(__APPLE__)
    std::vector<std::string> cmd = {"open", expanded};
#else
    std::vector<std::string> cmd = {"xdg-open", expanded};
#endif
    std::string error;
    if (process::run_and_wait(cmd, error) != 0) {
        LOG_TOOL("open_path failed: " + error);
        return ToolResult::error_result("Error opening path: " + error);
    }
    LOG_TOOL("Opened path: " + expanded);
    return ToolResult::success_result("Opened path: " + path);
}

ToolResult SystemToolExecutor::run_app(const std::string& app_name) {
#if defined(__APPLE__)
    std::vector<std::string> cmd = {"open", "-a", app_name};
    std::string error;
    bool ok = process::run_and_wait(cmd, error) == 0;
#else
    std::vector<std::string> cmd = {app_name};
    std::string error;
    bool ok = process::launch_detached(cmd, app_grace_ms_, error);
#endif
    if (!ok) {
        LOG_TOOL("run_app failed: " + error);
        return ToolResult::error_result("Error launching app '" + app_name + "': " + error);
    }
    LOG_TOOL("Launched application: " + app_name);
    return ToolResult::success_result("Launched application: " + app_name);
}

} // namespace voxlink
