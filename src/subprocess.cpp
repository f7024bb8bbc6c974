#include "subprocess.hpp"
#include <cerrno>
#include <csignal>
#include <cstring>
#include <pthread.h>
#include <signal.h>
#include <stdexcept>
#include <sys/wait.h>
#include <unistd.h>

namespace execrelay {

static std::runtime_error sys_error(const char* call) {
    return std::runtime_error(std::string(call) + " failed: " + std::strerror(errno));
}

ChildProcess::ChildProcess(const std::string& program, const std::vector<std::string>& args,
                           const std::string& stdin_data) {
    int stdin_pipe[2];
    int stdout_pipe[2];

    if (pipe(stdin_pipe) != 0) {
        throw sys_error("pipe");
    }
    if (pipe(stdout_pipe) != 0) {
        auto err = sys_error("pipe");
        close(stdin_pipe[0]);
        close(stdin_pipe[1]);
        throw err;
    }

    std::vector<std::string> argv_storage;
    argv_storage.reserve(args.size() + 1);
    argv_storage.push_back(program);
    argv_storage.insert(argv_storage.end(), args.begin(), args.end());
    std::vector<char*> argv;
    for (auto& a : argv_storage) argv.push_back(a.data());
    argv.push_back(nullptr);

    pid_t pid = fork();
    if (pid < 0) {
        auto err = sys_error("fork");
        close(stdin_pipe[0]);
        close(stdin_pipe[1]);
        close(stdout_pipe[0]);
        close(stdout_pipe[1]);
        throw err;
    }

    if (pid == 0) {
        // Own process group so terminate() reaches the engine's children
        setpgid(0, 0);
        close(stdin_pipe[1]);
        close(stdout_pipe[0]);
        dup2(stdin_pipe[0], STDIN_FILENO);
        dup2(stdout_pipe[1], STDOUT_FILENO);
        close(stdin_pipe[0]);
        close(stdout_pipe[1]);
        execvp(argv[0], argv.data());
        _exit(127);
    }

    pid_ = pid;
    setpgid(pid, pid);  // both sides set it; whichever runs first wins the race
    close(stdin_pipe[0]);
    close(stdout_pipe[1]);
    stdout_fd_ = stdout_pipe[0];

    write_stdin(stdin_pipe[1], stdin_data);
    close(stdin_pipe[1]);
}

// The engine reads the whole prompt before it starts streaming, so a
// blocking write cannot deadlock against our unread stdout. An engine that
// exits without reading (exec failure included) yields EPIPE, never SIGPIPE.
void ChildProcess::write_stdin(int fd, const std::string& data) {
    if (data.empty()) return;

    sigset_t pipe_set;
    sigset_t old_set;
    sigemptyset(&pipe_set);
    sigaddset(&pipe_set, SIGPIPE);
    pthread_sigmask(SIG_BLOCK, &pipe_set, &old_set);

    bool broken = false;
    size_t written = 0;
    while (written < data.size()) {
        ssize_t n = write(fd, data.data() + written, data.size() - written);
        if (n < 0 && errno == EINTR) continue;
        if (n < 0 && errno == EPIPE) {
            broken = true;
            break;
        }
        if (n <= 0) break;
        written += static_cast<size_t>(n);
    }

    // Consume the SIGPIPE raised by a broken write before unblocking.
    if (broken && !sigismember(&old_set, SIGPIPE)) {
        struct timespec zero = {0, 0};
        while (sigtimedwait(&pipe_set, nullptr, &zero) > 0) {
        }
    }
    pthread_sigmask(SIG_SETMASK, &old_set, nullptr);
}

ChildProcess::~ChildProcess() {
    if (!reaped_ && pid_ > 0) {
        kill(-pid_, SIGKILL);
        kill(pid_, SIGKILL);
        int status = 0;
        waitpid(pid_, &status, 0);
    }
    if (stdout_fd_ >= 0) close(stdout_fd_);
}

int ChildProcess::wait() {
    if (reaped_) return exit_code_;
    int status = 0;
    pid_t r;
    do {
        r = waitpid(pid_, &status, 0);
    } while (r < 0 && errno == EINTR);
    if (r < 0) {
        throw sys_error("waitpid");
    }
    reaped_ = true;
    if (WIFEXITED(status)) {
        exit_code_ = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        exit_code_ = 128 + WTERMSIG(status);
    }
    return exit_code_;
}

void ChildProcess::terminate() {
    if (reaped_ || pid_ <= 0) return;
    kill(-pid_, SIGTERM);
}

} // namespace execrelay
