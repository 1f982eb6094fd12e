#include "../base_cli.hpp"
#include "../theme.hpp"
#include <platform/platform.hpp>
#include <iostream>

static void do_upload(BaseCLI& cli, const BaseCLI::Args& args) {
    if (args.size() != 3) {
        std::cout << "Usage: upload <connection-id> <local-path> <remote-dir>\n";
        return;
    }
    auto* engine = cli.engine();
    if (!engine) return;

    cli.events.reset_upload();
    auto started = engine->upload_start(args[0], args[2], args[1]);
    if (started.is_err()) {
        std::cout << theme::fail(started.error);
        return;
    }
    std::cout << theme::step("Upload " + started.value + " started");
    engine->transfers().wait_all();
}

static void do_download(BaseCLI& cli, const BaseCLI::Args& args) {
    if (args.size() != 3) {
        std::cout << "Usage: download <connection-id> <remote-path> <local-path>\n";
        return;
    }
    auto* engine = cli.engine();
    if (!engine) return;

    auto result = engine->download(args[0], args[1], args[2]);
    std::cout << "\n";
    if (result.is_ok()) {
        std::cout << theme::ok("Saved " + args[2]);
    } else {
        std::cout << theme::fail(result.error);
    }
}

void register_transfer_commands(BaseCLI& cli) {
    cli.add_command("upload", do_upload, "upload <id> <local> <remote-dir>",
                    "Upload a file or folder");
    cli.add_command("download", do_download, "download <id> <remote> <local>",
                    "Download a remote file");
}
