#pragma once

#include <string>
#include <map>
#include <memory>
#include <functional>
#include <optional>
#include <core/config.hpp>
#include <managers/sftpflow_service.hpp>

class BaseCLI {
public:
    explicit BaseCLI(std::string config_path = "");
    virtual ~BaseCLI() = default;

    using CommandHandler = std::function<void(BaseCLI&, const std::string&)>;

    void add_command(const std::string& name,
                    CommandHandler handler,
                    const std::string& help);

    // Load config and start the service on first use
    bool require_service();

    void execute_command(const std::string& command, const std::string& args = "");
    void print_help() const;

    // Public state
    std::string config_path;
    std::unique_ptr<SftpFlowService> service;

    // Returns the prompt string for readline
    std::string get_prompt_string() const;

protected:
    std::map<std::string, std::pair<CommandHandler, std::string>> commands_;
};
