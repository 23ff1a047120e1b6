#pragma once

#include <string>
#include <vector>
#include <filesystem>
#include <core/types.hpp>

namespace platform {

// Run a program to completion and capture its output.
//
// program:     resolved through PATH (execvp semantics)
// args:        arguments, not including argv[0]
// working_dir: if non-empty, the child changes into it before exec
//
// The child's stdin is /dev/null. Blocks until the child exits; there is no
// timeout. Exit code is the process status, 128+N if killed by signal N,
// 127 if the program could not be executed, and -1 if fork itself failed
// (the reason is placed in stderr_data).
ProcessResult run_process(const std::string& program,
                          const std::vector<std::string>& args,
                          const std::filesystem::path& working_dir = {});

} // namespace platform
