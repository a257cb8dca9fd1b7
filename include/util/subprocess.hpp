#ifndef SUBPROCESS_HPP
#define SUBPROCESS_HPP

#include <string>
#include <vector>

struct ProcessResult {
    int exitStatus = -1;   // -1 when the child did not exit normally
    std::string output;    // captured stdout
};

// Runs argv[0] from PATH with argv and waits for it. stderr goes to /dev/null.
// Throws std::runtime_error when the process cannot be spawned.
ProcessResult runProcess(const std::vector<std::string>& argv, bool captureStdout = true);

// `command -v <program>` through /bin/sh.
bool commandExists(const std::string& program);

#endif
