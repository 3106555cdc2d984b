#pragma once

#include <string>
#include <vector>
#include <core/types.hpp>
#include <core/target.hpp>
#include <core/config.hpp>

// Delegated mode: replace this process with the system ssh client.
//
// Not a Transport: there is no bridge, no state machine and nothing to tear
// down. The password check happens in validate_target before any exec.

// ssh argv (without argv[0]):
//   [-p port] [-i key] [-o opt]... [-t] user@host [command]
std::vector<std::string> build_ssh_argv(const ConnectTarget& target,
                                        const Settings& settings,
                                        const std::string& command = "");

// Validates, then execvp()s. Returns only on failure (CONFIG or SUBPROCESS).
Result<void> exec_system_ssh(const ConnectTarget& target,
                             const Settings& settings,
                             const std::string& command = "");
