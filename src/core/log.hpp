#pragma once

#include <string>
#include <core/types.hpp>

// Path of the debug log (defaults to <tmp>/hostlink_debug.log).
std::string hostlink_log_path();
void set_hostlink_log_path(const std::string& path);

// Append a timestamped line to the debug log. Safe from any thread.
void hostlink_log(const std::string& msg);

// Record a remote command with its exit code and truncated output.
void hostlink_log_ssh(const std::string& label, const std::string& cmd, const SSHResult& r);
