#pragma once

#include "base_cli.hpp"
#include <string>
#include <vector>

class SftpFlowCLI : public BaseCLI {
public:
    explicit SftpFlowCLI(std::string config_path = "");

    // Interactive readline loop
    void run_repl();

    // One-shot: "run NODE key=value ...". Returns the process exit code.
    int run_once(const std::vector<std::string>& args);

private:
    void register_all_commands();

    // Submit, wait and print. Returns false on failure.
    bool run_request(const std::vector<std::string>& args);

    bool quit_ = false;
};
