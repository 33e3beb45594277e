/**
 * Tool invocations from model output and their execution.
 * Asserts:
 * - Text commands (CMD_OPEN_URL, CMD_RUN_APP, open_url()) yield invocations
 *   in order of appearance and leave no marker in the spoken text.
 * - Decorations are stripped without invocations; strip() is idempotent.
 * - Structured calls are validated by name.
 * - Executor dispatch, missing arguments, process helpers.
 * - Pipes handed to child processes are close-on-exec.
 *
 * Run from build dir: ./test_tool_call_extractor
 */

#include "fakes.h"
#include "tool_call_extractor.h"
#include "tool_executor.h"
#include <iostream>
#include <string>
#include <fcntl.h>
#include <poll.h>
#include <unistd.h>

using namespace voxlink;

static int failed = 0;

#define ASSERT(cond) do { if (!(cond)) { std::cerr << "FAIL: " << #cond << " (line " << __LINE__ << ")\n"; failed++; } } while(0)

static const std::string kTool = "\xF0\x9F\x9B\xA0\xEF\xB8\x8F";  // 🛠️

int main() {
    ToolCallExtractor extractor;

    // --- CMD_OPEN_URL: first token only, marker removed ---
    {
        auto ex = extractor.extract("CMD_OPEN_URL: https://youtube.com Открываю ютуб.");
        ASSERT(ex.invocations.size() == 1);
        if (!ex.invocations.empty()) {
            ASSERT(ex.invocations[0].action == ToolAction::OpenUrl);
            ASSERT(ex.invocations[0].argument() == "https://youtube.com");
            ASSERT(ex.invocations[0].name() == "open_url");
        }
        ASSERT(ex.text == "Открываю ютуб.");
        ASSERT(ex.text.find("CMD_") == std::string::npos);
    }

    // --- Trailing period and quotes are not part of the URL ---
    {
        auto ex = extractor.extract("Готово, CMD_OPEN_URL: \"https://example.org/a?b=1\".");
        ASSERT(ex.invocations.size() == 1);
        if (!ex.invocations.empty()) {
            ASSERT(ex.invocations[0].argument() == "https://example.org/a?b=1");
        }
        ASSERT(ex.text == "Готово,");
    }

    // --- CMD_RUN_APP: up to the next period ---
    {
        auto ex = extractor.extract("Запускаю. CMD_RUN_APP: Visual Studio Code. Готово.");
        ASSERT(ex.invocations.size() == 1);
        if (!ex.invocations.empty()) {
            ASSERT(ex.invocations[0].action == ToolAction::RunApp);
            ASSERT(ex.invocations[0].argument() == "Visual Studio Code");
        }
        ASSERT(ex.text == "Запускаю. Готово.");

        auto tail = extractor.extract("CMD_RUN_APP: firefox");
        ASSERT(tail.invocations.size() == 1);
        if (!tail.invocations.empty()) {
            ASSERT(tail.invocations[0].argument() == "firefox");
        }
        ASSERT(tail.text.empty());
    }

    // --- open_url(...) form, several commands in order ---
    {
        auto ex = extractor.extract(
            "Сначала CMD_RUN_APP: telegram. Потом open_url(https://a.example) и CMD_OPEN_URL: https://b.example");
        ASSERT(ex.invocations.size() == 3);
        if (ex.invocations.size() == 3) {
            ASSERT(ex.invocations[0].action == ToolAction::RunApp);
            ASSERT(ex.invocations[0].argument() == "telegram");
            ASSERT(ex.invocations[1].argument() == "https://a.example");
            ASSERT(ex.invocations[2].argument() == "https://b.example");
        }
        ASSERT(ex.text == "Сначала Потом и");

        auto quoted = extractor.extract("open_url('https://c.example')");
        ASSERT(quoted.invocations.size() == 1);
        if (!quoted.invocations.empty()) {
            ASSERT(quoted.invocations[0].argument() == "https://c.example");
        }
    }

    // --- Plain text passes through, whitespace collapsed ---
    {
        auto ex = extractor.extract("  Просто   ответ\nбез команд.  ");
        ASSERT(ex.invocations.empty());
        ASSERT(ex.text == "Просто ответ без команд.");
    }

    // --- Decorations are stripped, no invocations ---
    {
        auto ex = extractor.extract("[" + kTool + " open_url] Открыла. <function=open_url>{\"url\":\"x\"}</function>");
        ASSERT(ex.invocations.empty());
        ASSERT(ex.text == "Открыла.");

        auto marker_only = extractor.extract("[" + kTool + " run_app] Error: Path does not exist: /x");
        ASSERT(marker_only.text == "Error: Path does not exist: /x");
    }

    // --- strip() is idempotent and complete ---
    {
        const std::string inputs[] = {
            "CMD_OPEN_URL: https://youtube.com Открываю ютуб.",
            "A CMD_RUN_APP: x. B open_url(y) C",
            "[" + kTool + " open_path] done",
            "nothing to strip",
        };
        for (const auto& in : inputs) {
            std::string once = extractor.strip(in);
            ASSERT(extractor.strip(once) == once);
            ASSERT(once.find("CMD_OPEN_URL") == std::string::npos);
            ASSERT(once.find("CMD_RUN_APP") == std::string::npos);
            ASSERT(once.find("open_url(") == std::string::npos);
            ASSERT(extractor.extract(once).invocations.empty());
        }
    }

    // --- Structured calls ---
    {
        auto ok = extractor.from_structured(ToolCall{"open_path", {{"path", "~/Documents"}}});
        ASSERT(ok.has_value());
        if (ok) {
            ASSERT(ok->action == ToolAction::OpenPath);
            ASSERT(ok->argument() == "~/Documents");
        }
        ASSERT(!extractor.from_structured(ToolCall{"rm_rf", {{"path", "/"}}}).has_value());
        ASSERT(!extractor.from_structured(ToolCall{"", {}}).has_value());
    }

    // --- Names and markers ---
    {
        ASSERT(parse_tool_action("run_app") == ToolAction::RunApp);
        ASSERT(!parse_tool_action("Run_App").has_value());
        ASSERT(std::string(tool_argument_key(ToolAction::RunApp)) == "app_name");

        ToolInvocation inv;
        inv.action = ToolAction::OpenPath;
        inv.arguments["path"] = "/tmp";
        ASSERT(tool_marker(inv, ToolResult::success_result("Opened path: /tmp")) ==
               "[" + kTool + " open_path]");
        ASSERT(tool_marker(inv, ToolResult::error_result("Error: Path does not exist: /tmp")) ==
               "[" + kTool + " open_path] Error: Path does not exist: /tmp");
    }

    // --- ToolExecutor::execute dispatch ---
    {
        fakes::FakeToolExecutor tools;
        ToolInvocation url;
        url.action = ToolAction::OpenUrl;
        url.arguments["url"] = "https://youtube.com";
        ToolResult r = tools.execute(url);
        ASSERT(r.success);
        ASSERT(r.status == "Opened URL: https://youtube.com");

        ToolInvocation missing;
        missing.action = ToolAction::RunApp;
        missing.arguments["url"] = "wrong key";
        r = tools.execute(missing);
        ASSERT(!r.success);
        ASSERT(r.status.find("app_name") != std::string::npos);

        auto calls = tools.calls();
        ASSERT(calls.size() == 1 && calls[0] == "open_url:https://youtube.com");
    }

    // --- System executor and process helpers (no desktop needed) ---
    {
        SystemToolExecutor system;
        ToolResult r = system.open_path("/definitely/not/here/voxlink");
        ASSERT(!r.success);
        ASSERT(r.status == "Error: Path does not exist: /definitely/not/here/voxlink");

        std::string error;
        ASSERT(process::run_and_wait({"true"}, error) == 0);
        error.clear();
        ASSERT(process::run_and_wait({"false"}, error) == 1);
        ASSERT(!error.empty());
        error.clear();
        ASSERT(process::run_and_wait({}, error) == -1);

        error.clear();
        ASSERT(process::launch_detached({"true"}, 500, error));
        error.clear();
        ASSERT(!process::launch_detached({"false"}, 500, error));
        ASSERT(error.find("exited early") != std::string::npos);
    }

    // --- Pipes are not inherited by concurrently spawned children ---
    {
        int fds[2] = {-1, -1};
        ASSERT(process::open_pipe(fds));
        ASSERT((fcntl(fds[0], F_GETFD) & FD_CLOEXEC) != 0);
        ASSERT((fcntl(fds[1], F_GETFD) & FD_CLOEXEC) != 0);

        // A long-lived child started while the pipe is open
        std::string error;
        ASSERT(process::launch_detached({"sleep", "3"}, 50, error));

        close(fds[1]);
        struct pollfd pfd = {fds[0], POLLIN, 0};
        ASSERT(poll(&pfd, 1, 1000) == 1);
        char byte = 0;
        ASSERT(read(fds[0], &byte, 1) == 0);  // EOF right away
        close(fds[0]);
    }

    if (failed == 0) {
        std::cout << "test_tool_call_extractor: all assertions passed\n";
        return 0;
    }
    std::cerr << "test_tool_call_extractor: " << failed << " assertion(s) failed\n";
    return 1;
}
