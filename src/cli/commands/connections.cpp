#include "../base_cli.hpp"
#include "../theme.hpp"
#include <iostream>
#include <fmt/format.h>

static void do_connections(BaseCLI& cli, const BaseCLI::Args&) {
    auto* engine = cli.engine();
    if (!engine) return;

    auto connections = engine->list_connections();
    if (connections.empty()) {
        std::cout << theme::info("No saved connections.");
        return;
    }
    std::cout << theme::section("Connections");
    for (const auto& c : connections) {
        std::string target = fmt::format("{}@{}:{}", c.username, c.host, c.port);
        if (c.proxy_jump) target += " via " + *c.proxy_jump;
        std::cout << fmt::format("    {:<24} {:<20} ", c.id, c.name) << theme::dim(target)
                  << theme::dim(fmt::format("  [{}]", auth_type_name(c.auth_type))) << "\n";
    }
    std::cout << "\n";
}

static void do_test(BaseCLI& cli, const BaseCLI::Args& args) {
    if (args.size() != 1) {
        std::cout << "Usage: test <connection-id>\n";
        return;
    }
    auto* engine = cli.engine();
    if (!engine) return;

    std::cout << theme::step("Connecting to " + args[0] + "...");
    auto result = engine->test_connection(args[0]);
    if (result.is_ok()) {
        std::cout << theme::ok("Connection works");
    } else {
        std::cout << theme::fail(result.error);
    }
}

void register_connection_commands(BaseCLI& cli) {
    cli.add_command("connections", do_connections, "connections", "List saved connections");
    cli.add_command("test", do_test, "test <id>", "Open and close a test connection");
}
