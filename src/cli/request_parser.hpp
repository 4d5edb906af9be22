#pragma once

#include <string>
#include <vector>
#include <core/types.hpp>

// A request typed on the command line plus CLI-only options.
struct CliRequest {
    std::string node;
    OperationRequest request;
    std::string out_path;         // get: write content here instead of stdout
};

// Split a command line on whitespace; double quotes group, backslash escapes.
std::vector<std::string> split_args(const std::string& line);

// "NODE key=value ..." -> CliRequest
//   op workdir filename host port user password key reuse payload_as_path cd
//   payload=TEXT | payload=- (stdin) | payload_file=PATH | name=N data=TEXT
//   out=PATH
Result<CliRequest> parse_request(const std::vector<std::string>& args);

// One-line human description of a completed operation.
std::string describe_result(const OperationResult& result);
