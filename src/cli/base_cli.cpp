#include "base_cli.hpp"
#include "theme.hpp"
#include <core/credentials.hpp>
#include <ssh/sftp_session.hpp>
#include <iostream>
#include <fmt/format.h>

BaseCLI::BaseCLI(std::string path) : config_path(std::move(path)) {}

void BaseCLI::add_command(const std::string& name,
                         CommandHandler handler,
                         const std::string& help) {
    commands_[name] = {handler, help};
}

bool BaseCLI::require_service() {
    if (service) return true;

    auto config_result = config_path.empty() ? Config::load_default() : Config::load(config_path);
    if (config_result.is_err()) {
        std::cout << theme::fail(config_result.error);
        if (config_path.empty()) {
            auto created = create_default_config();
            if (created.is_ok()) {
                std::cout << theme::step("Edit " + get_config_path().string() + " and try again.");
            }
        }
        return false;
    }

    const Config& config = config_result.value;
    for (const auto& [name, node] : config.nodes()) {
        if (!node.setup_error.empty()) {
            std::cout << theme::fail(fmt::format("{}: {}", name, node.setup_error));
        }
    }

    auto factory = SftpSession::factory(config.settings().connect_timeout);
    service = std::make_unique<SftpFlowService>(config, CredentialStore(), factory);
    return true;
}

void BaseCLI::execute_command(const std::string& command, const std::string& args) {
    auto it = commands_.find(command);
    if (it == commands_.end()) {
        std::cout << theme::fail("Unknown command: " + command);
        std::cout << theme::step("Type 'help' for available commands.");
        return;
    }

    try {
        it->second.first(*this, args);
    } catch (const std::exception& e) {
        std::cout << theme::fail(std::string(e.what()));
    }
}

void BaseCLI::print_help() const {
    // Group commands by category
    std::vector<std::pair<std::string, std::vector<std::string>>> categories = {
        {"Operations", {"run", "close"}},
        {"State",      {"nodes", "sessions", "status"}},
        {"General",    {"help", "quit", "exit"}},
    };

    for (const auto& [cat_name, cmd_names] : categories) {
        std::cout << "\n" << theme::color::BROWN << theme::color::BOLD
                  << "  " << cat_name << theme::color::RESET << "\n";

        for (const auto& name : cmd_names) {
            auto it = commands_.find(name);
            if (it != commands_.end()) {
                std::cout << theme::color::BLUE
                          << fmt::format("    {:<14}", name)
                          << theme::color::RESET
                          << theme::color::DIM
                          << it->second.second
                          << theme::color::RESET << "\n";
            }
        }
    }
    std::cout << "\n";
}

std::string BaseCLI::get_prompt_string() const {
    // Readline uses \001 and \002 to wrap non-printing chars so it can
    // compute the visible prompt width correctly for cursor positioning.
    auto rl_esc = [](const std::string& code) {
        return std::string("\001") + code + std::string("\002");
    };

    size_t open = service ? service->cache().cached_keys().size() : 0;
    if (open == 0) {
        return rl_esc(theme::color::BROWN) + "sftpflow"
             + rl_esc(theme::color::RESET) + "> ";
    }
    return rl_esc(theme::color::BROWN) + "sftpflow"
         + rl_esc(theme::color::RESET) + ":"
         + rl_esc(theme::color::GREEN) + std::to_string(open) + " open"
         + rl_esc(theme::color::RESET) + "> ";
}
