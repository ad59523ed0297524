#pragma once

#include <string>
#include <core/types.hpp>

// Path of the debug log (<temp dir>/delta_debug.log)
std::string delta_log_path();

// Append a timestamped line to the debug log. Never throws.
void delta_log(const std::string& msg);

// Log a remote command and its (truncated) result
void delta_log_ssh(const std::string& label, const std::string& cmd, const SSHResult& r);
