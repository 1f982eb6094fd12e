#include "../base_cli.hpp"
#include "../theme.hpp"
#include <core/utils.hpp>
#include <iostream>
#include <fmt/format.h>

static void print_entries(const std::vector<SftpListEntry>& entries) {
    for (const auto& e : entries) {
        std::string name = e.name;
        if (e.type == EntryType::Directory) name = theme::teal(name + "/");
        else if (e.type == EntryType::Symlink) name = theme::sand(name + "@");
        std::cout << fmt::format("    {:>12}  ", e.size) << name << "\n";
    }
}

static void do_ls(BaseCLI& cli, const BaseCLI::Args& raw) {
    BaseCLI::Args args = raw;
    auto limit = take_option(args, "--limit");
    bool refresh = false;
    for (auto it = args.begin(); it != args.end();) {
        if (*it == "--refresh") {
            refresh = true;
            it = args.erase(it);
        } else {
            ++it;
        }
    }
    if (args.empty() || args.size() > 2) {
        std::cout << "Usage: ls <connection-id> [path] [--limit N] [--refresh]\n";
        return;
    }
    auto* engine = cli.engine();
    if (!engine) return;

    ListDirOptions options;
    options.refresh = refresh;
    if (limit) options.limit = safe_stoi(*limit, DEFAULT_PAGE_LIMIT);
    std::string path = args.size() > 1 ? args[1] : "~";

    // Page through until the listing is exhausted.
    size_t total = 0;
    while (true) {
        auto result = engine->list_dir(args[0], path, options);
        if (result.is_err()) {
            std::cout << theme::fail(result.error);
            return;
        }
        print_entries(result.value.entries);
        total += result.value.entries.size();
        if (!result.value.page || !result.value.page->has_more) break;
        options.cursor = result.value.page->next_cursor;
        options.refresh = false;
    }
    std::cout << theme::dim(fmt::format("    {} entries", total)) << "\n";
}

static void do_home(BaseCLI& cli, const BaseCLI::Args& args) {
    if (args.size() != 1) {
        std::cout << "Usage: home <connection-id>\n";
        return;
    }
    auto* engine = cli.engine();
    if (!engine) return;
    auto result = engine->home_dir(args[0]);
    if (result.is_err()) {
        std::cout << theme::fail(result.error);
        return;
    }
    std::cout << result.value << "\n";
}

static void do_cat(BaseCLI& cli, const BaseCLI::Args& raw) {
    BaseCLI::Args args = raw;
    auto offset = take_option(args, "--offset");
    auto limit = take_option(args, "--limit");
    if (args.size() != 2) {
        std::cout << "Usage: cat <connection-id> <path> [--offset N] [--limit N]\n";
        return;
    }
    auto* engine = cli.engine();
    if (!engine) return;

    std::optional<int> off, lim;
    if (offset) off = safe_stoi(*offset, 1);
    if (limit) lim = safe_stoi(*limit, 0);
    auto result = engine->read_file(args[0], args[1], off, lim);
    if (result.is_err()) {
        std::cout << theme::fail(result.error);
        return;
    }
    std::cout << result.value;
    if (!result.value.empty() && result.value.back() != '\n') std::cout << "\n";
}

static void report(const Result<void>& result, const std::string& done) {
    if (result.is_ok()) {
        std::cout << theme::ok(done);
    } else {
        std::cout << theme::fail(result.error);
    }
}

static void do_mkdir(BaseCLI& cli, const BaseCLI::Args& args) {
    if (args.size() != 2) {
        std::cout << "Usage: mkdir <connection-id> <path>\n";
        return;
    }
    if (auto* engine = cli.engine()) report(engine->mkdir(args[0], args[1]), "Created " + args[1]);
}

static void do_rm(BaseCLI& cli, const BaseCLI::Args& args) {
    if (args.size() != 2) {
        std::cout << "Usage: rm <connection-id> <path>\n";
        return;
    }
    if (auto* engine = cli.engine()) report(engine->remove(args[0], args[1]), "Deleted " + args[1]);
}

static void do_mv(BaseCLI& cli, const BaseCLI::Args& args) {
    if (args.size() != 3) {
        std::cout << "Usage: mv <connection-id> <from> <to>\n";
        return;
    }
    if (auto* engine = cli.engine()) {
        report(engine->move(args[0], args[1], args[2]), args[1] + " -> " + args[2]);
    }
}

static void do_glob(BaseCLI& cli, const BaseCLI::Args& args) {
    if (args.size() < 2 || args.size() > 3) {
        std::cout << "Usage: glob <connection-id> <pattern> [dir]\n";
        return;
    }
    auto* engine = cli.engine();
    if (!engine) return;
    std::optional<std::string> dir;
    if (args.size() == 3) dir = args[2];
    auto result = engine->glob(args[0], args[1], dir);
    if (result.is_err()) {
        std::cout << theme::fail(result.error);
        return;
    }
    for (const auto& path : result.value) std::cout << path << "\n";
}

static void do_grep(BaseCLI& cli, const BaseCLI::Args& raw) {
    BaseCLI::Args args = raw;
    auto include = take_option(args, "--include");
    if (args.size() < 2 || args.size() > 3) {
        std::cout << "Usage: grep <connection-id> <pattern> [dir] [--include GLOB]\n";
        return;
    }
    auto* engine = cli.engine();
    if (!engine) return;
    std::optional<std::string> dir;
    if (args.size() == 3) dir = args[2];
    auto result = engine->grep(args[0], args[1], dir, include);
    if (result.is_err()) {
        std::cout << theme::fail(result.error);
        return;
    }
    for (const auto& m : result.value) {
        std::cout << theme::teal(m.file) << ":" << theme::sand(std::to_string(m.line))
                  << ":" << m.text << "\n";
    }
}

static void do_zip(BaseCLI& cli, const BaseCLI::Args& args) {
    if (args.size() != 2) {
        std::cout << "Usage: zip <connection-id> <remote-dir>\n";
        return;
    }
    auto* engine = cli.engine();
    if (!engine) return;
    auto result = engine->zip_dir(args[0], args[1]);
    if (result.is_err()) {
        std::cout << theme::fail(result.error);
        return;
    }
    std::cout << theme::ok("Archive at " + result.value);
}

void register_file_commands(BaseCLI& cli) {
    cli.add_command("ls", do_ls, "ls <id> [path] [--limit N] [--refresh]", "List a remote directory");
    cli.add_command("home", do_home, "home <id>", "Print the remote home directory");
    cli.add_command("cat", do_cat, "cat <id> <path> [--offset N] [--limit N]", "Print a remote file");
    cli.add_command("mkdir", do_mkdir, "mkdir <id> <path>", "Create a remote directory");
    cli.add_command("rm", do_rm, "rm <id> <path>", "Delete a remote file or directory");
    cli.add_command("mv", do_mv, "mv <id> <from> <to>", "Move or rename a remote path");
    cli.add_command("glob", do_glob, "glob <id> <pattern> [dir]", "Find remote files by name");
    cli.add_command("grep", do_grep, "grep <id> <pattern> [dir] [--include G]", "Search remote files");
    cli.add_command("zip", do_zip, "zip <id> <dir>", "Zip a remote directory on the host");
}
