#pragma once

#include <string>

// Debug log file. Defaults to <tmp>/sftpflow_debug.log.
std::string sftpflow_log_path();
void set_sftpflow_log_path(const std::string& path);

// Append a timestamped line to the debug log. Safe to call from lane threads.
void sftpflow_log(const std::string& msg);
