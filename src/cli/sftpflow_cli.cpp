#include "sftpflow_cli.hpp"
#include "request_parser.hpp"
#include "theme.hpp"
#include <core/utils.hpp>
#include <fmt/format.h>
#include <iostream>
#include <fstream>
#include <cstdlib>
#include <readline/readline.h>
#include <readline/history.h>

static std::string status_line(const std::string& node, const Status& s) {
    if (s.cleared()) return theme::kv(node, theme::dim("idle"));
    std::string ansi;
    switch (s.color) {
        case StatusColor::Blue:   ansi = theme::color::BLUE; break;
        case StatusColor::Yellow: ansi = theme::color::YELLOW; break;
        case StatusColor::Green:  ansi = theme::color::GREEN; break;
        case StatusColor::Red:    ansi = theme::color::RED; break;
        case StatusColor::None:   break;
    }
    return theme::kv(node, theme::marker(ansi, s.shape == StatusShape::Ring, s.text));
}

SftpFlowCLI::SftpFlowCLI(std::string config_path) : BaseCLI(std::move(config_path)) {
    register_all_commands();
}

void SftpFlowCLI::register_all_commands() {
    add_command("help", [this](BaseCLI&, const std::string&) {
        this->print_help();
    }, "Show this help message");

    add_command("quit", [this](BaseCLI&, const std::string&) {
        quit_ = true;
    }, "Close sessions and exit");

    add_command("exit", [this](BaseCLI&, const std::string&) {
        quit_ = true;
    }, "Close sessions and exit");

    add_command("run", [this](BaseCLI&, const std::string& arg) {
        run_request(split_args(arg));
    }, "run NODE [key=value ...]");

    add_command("close", [this](BaseCLI&, const std::string& arg) {
        if (arg.empty()) {
            std::cout << theme::fail("Usage: close NODE");
            return;
        }
        run_request({arg, "op=close"});
    }, "Close the cached session of a node");

    add_command("nodes", [](BaseCLI& cli, const std::string&) {
        if (!cli.require_service()) return;
        const Config& config = cli.service->config();
        std::cout << theme::section("Nodes");
        for (const auto& [name, node] : config.nodes()) {
            std::string desc = node.operation + " " + node.workdir;
            if (!node.filename.empty()) desc += " " + node.filename;
            desc += theme::dim(" (" + node.credentials + ")");
            if (!node.setup_error.empty()) desc += " " + theme::red(node.setup_error);
            std::cout << theme::kv(name, desc);
        }
        std::cout << "\n";
    }, "List configured nodes");

    add_command("sessions", [](BaseCLI& cli, const std::string&) {
        if (!cli.require_service()) return;
        auto keys = cli.service->cache().cached_keys();
        std::cout << theme::section("Sessions");
        if (keys.empty()) {
            std::cout << theme::dim("    No open sessions.") << "\n";
        }
        for (const auto& key : keys) {
            std::cout << theme::info(key);
        }
        std::cout << "\n";
    }, "List cached sessions");

    add_command("status", [](BaseCLI& cli, const std::string&) {
        if (!cli.require_service()) return;
        std::cout << theme::section("Status");
        for (const auto& name : cli.service->node_names()) {
            std::cout << status_line(name, cli.service->status(name));
        }
        std::cout << "\n";
    }, "Show node status");
}

bool SftpFlowCLI::run_request(const std::vector<std::string>& args) {
    auto parsed = parse_request(args);
    if (parsed.is_err()) {
        std::cout << theme::fail(parsed.error);
        std::cout << theme::step("Usage: run NODE [op=..] [workdir=..] [filename=..] [payload=..]");
        return false;
    }
    if (!require_service()) return false;

    const CliRequest& cr = parsed.value;
    Completion done = service->submit(cr.node, cr.request).get();
    if (done.is_err()) {
        std::cout << theme::fail(fmt::format("{}: {}", error_category(done.kind), done.error));
        return false;
    }

    if (auto* content = std::get_if<FileContent>(&done.value)) {
        if (!cr.out_path.empty()) {
            std::ofstream out(cr.out_path, std::ios::binary);
            if (!out) {
                std::cout << theme::fail("Cannot write " + cr.out_path);
                return false;
            }
            out << content->data;
            std::cout << theme::ok(describe_result(done.value) + " -> " + cr.out_path);
        } else {
            std::cout << content->data;
            if (!content->data.empty() && content->data.back() != '\n') std::cout << "\n";
        }
        return true;
    }

    std::cout << theme::ok(describe_result(done.value));
    return true;
}

int SftpFlowCLI::run_once(const std::vector<std::string>& args) {
    bool ok = run_request(args);
    if (service) service->shutdown();
    return ok ? 0 : 1;
}

void SftpFlowCLI::run_repl() {
    std::cout << theme::banner();
    if (!require_service()) return;

    service->set_status_listener([](const std::string& node, const Status& s) {
        if (s.color == StatusColor::Blue) {
            std::cout << theme::log(node + ": connecting") << std::flush;
        }
    });

    std::cout << theme::kv("Config", config_path.empty() ? get_config_path().string() : config_path);
    std::cout << theme::kv("Nodes", std::to_string(service->config().nodes().size()));
    std::cout << theme::divider();
    std::cout << theme::dim("    Type 'help' for commands, 'quit' to exit.") << "\n\n";

    std::string line;
    while (!quit_) {
        std::string prompt = get_prompt_string();
        char* raw = readline(prompt.c_str());
        if (!raw) {
            break;  // EOF / Ctrl-D
        }

        line = raw;
        free(raw);

        trim(line);
        if (line.empty()) continue;
        add_history(line.c_str());

        auto space = line.find(' ');
        std::string command = line.substr(0, space);
        std::string args = space == std::string::npos ? "" : line.substr(space + 1);
        trim(args);
        execute_command(command, args);
    }

    std::cout << theme::dim("Closing sessions...") << "\n";
    service->shutdown();
}
