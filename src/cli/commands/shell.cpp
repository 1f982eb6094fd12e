#include "../base_cli.hpp"
#include "../theme.hpp"
#include <platform/terminal.hpp>
#include <iostream>

namespace {

constexpr char kDetachKey = 0x1d;   // Ctrl-]

} // namespace

static void do_exec(BaseCLI& cli, const BaseCLI::Args& args) {
    if (args.size() < 2) {
        std::cout << "Usage: exec <connection-id> <command...>\n";
        return;
    }
    auto* engine = cli.engine();
    if (!engine) return;

    auto result = engine->exec(args[0], join_args(args, 1));
    if (result.is_err()) {
        std::cout << theme::fail(result.error);
        return;
    }
    std::cout << result.value.stdout_data;
    if (!result.value.stderr_data.empty()) std::cerr << result.value.stderr_data;
    if (result.value.failed()) {
        std::cout << theme::dim("    exit " + std::to_string(result.value.exit_code)) << "\n";
    }
}

static void do_shell(BaseCLI& cli, const BaseCLI::Args& args) {
    if (args.size() != 1) {
        std::cout << "Usage: shell <connection-id>\n";
        return;
    }
    auto* engine = cli.engine();
    if (!engine) return;
    if (!platform::stdin_is_tty()) {
        std::cout << theme::fail("shell needs an interactive terminal");
        return;
    }

    std::cout << theme::step("Connecting to " + args[0] + "...");
    auto connected = engine->terminal_connect(args[0]);
    if (connected.is_err()) {
        std::cout << theme::fail(connected.error);
        return;
    }
    const std::string session_id = connected.value;
    std::cout << theme::dim("    Ctrl-] detaches") << "\n";

    cli.events.watch_session(session_id, [&]() {
        auto backlog = engine->read_output_buffer(session_id);
        return backlog.is_ok() ? backlog.value : OutputSnapshot{};
    });

    auto size = platform::term_size();
    engine->terminal_resize(session_id, size.cols, size.rows);

    {
        platform::RawModeGuard raw;
        platform::watch_resize();
        char buf[4096];
        bool detached = false;
        while (!detached && !cli.events.session_ended()) {
            if (platform::take_resize()) {
                size = platform::term_size();
                engine->terminal_resize(session_id, size.cols, size.rows);
            }
            if (!platform::poll_stdin(SHELL_POLL_MS)) continue;
            int n = platform::read_stdin(buf, sizeof(buf));
            if (n <= 0) break;
            std::string data(buf, static_cast<size_t>(n));
            auto pos = data.find(kDetachKey);
            if (pos != std::string::npos) {
                data.resize(pos);
                detached = true;
            }
            if (!data.empty()) engine->terminal_send(session_id, data);
        }
        platform::unwatch_resize();
    }

    cli.events.unwatch_session();
    engine->terminal_disconnect(session_id);
    std::cout << "\n" << theme::info("Session closed");
}

void register_shell_commands(BaseCLI& cli) {
    cli.add_command("exec", do_exec, "exec <id> <command...>", "Run a remote command");
    cli.add_command("shell", do_shell, "shell <id>", "Interactive remote shell");
}
