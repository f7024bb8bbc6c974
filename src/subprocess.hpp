#pragma once
#include <string>
#include <vector>
#include <sys/types.h>

namespace execrelay {

// An engine process with piped stdout. stderr is inherited so engine
// diagnostics reach the terminal directly.
class ChildProcess {
public:
    // Throws std::runtime_error naming the failing syscall. When stdin_data
    // is non-empty it is written to the child's stdin, which is then closed;
    // otherwise stdin is closed immediately.
    ChildProcess(const std::string& program, const std::vector<std::string>& args,
                 const std::string& stdin_data = "");
    ~ChildProcess();

    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;

    int stdout_fd() const { return stdout_fd_; }
    pid_t pid() const { return pid_; }

    // Reaps the child. Returns its exit code, 128 + signal number when it was
    // killed, or the cached result on repeated calls.
    int wait();

    // SIGTERM to the child's process group.
    void terminate();

private:
    static void write_stdin(int fd, const std::string& data);

    pid_t pid_ = -1;
    int stdout_fd_ = -1;
    bool reaped_ = false;
    int exit_code_ = -1;
};

} // namespace execrelay
