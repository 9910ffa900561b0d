#include "include/shell_pipe.hpp"
#include "include/interrupts.hpp"

#include <array>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <stdexcept>
#include <system_error>
#include <thread>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/syscall.h>
#include <sys/wait.h>
#include <unistd.h>

static int pidfd_open(pid_t pid, unsigned int flags) {
#ifdef __NR_pidfd_open
    return static_cast<int>(syscall(__NR_pidfd_open, pid, flags));
#else
    errno = ENOSYS;
    return -1;
#endif
}

static int decode_status(int status) {
    if (WIFEXITED(status))
        return WEXITSTATUS(status);
    if (WIFSIGNALED(status))
        return 128 + WTERMSIG(status);
    return -1;
}

ShellPipe::ShellPipe(const std::vector<std::string>& args) {
    if (args.empty()) {
        throw std::invalid_argument("ShellPipe: Empty argument list");
    }

    std::vector<std::string> args_copy = args;
    std::vector<char*> c_args;
    c_args.reserve(args_copy.size() + 1);
    for (auto& arg : args_copy) {
        c_args.push_back(arg.data());
    }
    c_args.push_back(nullptr);

    int pipe_fds[2];
    if (::pipe2(pipe_fds, O_CLOEXEC) == -1) {
        throw std::system_error(errno, std::generic_category(), "Failed to create pipe");
    }

    pid_t pid = ::fork();
    if (pid == -1) {
        int saved = errno;
        ::close(pipe_fds[0]);
        ::close(pipe_fds[1]);
        throw std::system_error(saved, std::generic_category(), "Failed to fork process");
    }

    if (pid == 0) {
        int null_fd = ::open("/dev/null", O_RDONLY);
        if (null_fd >= 0) {
            ::dup2(null_fd, STDIN_FILENO);
            ::close(null_fd);
        }
        if (::dup2(pipe_fds[1], STDOUT_FILENO) == -1)
            ::_exit(126);
        if (::dup2(pipe_fds[1], STDERR_FILENO) == -1)
            ::_exit(126);

        ::execvp(c_args[0], c_args.data());

        const char* msg = "Failed to execute binary\n";
        [[maybe_unused]] auto val = ::write(STDOUT_FILENO, msg, std::strlen(msg));
        ::_exit(127);
    }

    ::close(pipe_fds[1]);
    read_fd_.reset(pipe_fds[0]);
    pid_ = pid;
}

ShellPipe::~ShellPipe() {
    read_fd_.reset();

    if (pid_ == -1 || exit_status_) {
        return;
    }

    int status;
    if (::waitpid(pid_, &status, WNOHANG) == pid_) {
        return;
    }

    ::kill(pid_, SIGTERM);

    bool reaped = false;
    int pfd = pidfd_open(pid_, 0);
    if (pfd >= 0) {
        struct pollfd pfd_struct;
        pfd_struct.fd = pfd;
        pfd_struct.events = POLLIN;

        int ret = ::poll(&pfd_struct, 1, 1000);
        ::close(pfd);

        if (ret > 0) {
            ::waitpid(pid_, &status, 0);
            reaped = true;
        }
    }

    if (!reaped) {
        for (int i = 0; i < 5; ++i) {
            if (::waitpid(pid_, &status, WNOHANG) == pid_) {
                reaped = true;
                break;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }

        if (!reaped) {
            ::kill(pid_, SIGKILL);
            ::waitpid(pid_, nullptr, 0);
        }
    }
}

std::string ShellPipe::read_all(std::size_t max_bytes) {
    std::string output;
    std::array<char, 4096> buffer;
    bool truncated = false;

    while (true) {
        check_interrupted();

        ssize_t bytes_read = ::read(read_fd_.get(), buffer.data(), buffer.size());

        if (bytes_read > 0) {
            if (truncated)
                continue;
            auto n = static_cast<std::size_t>(bytes_read);
            if (output.size() + n > max_bytes) {
                output.append(buffer.data(), max_bytes - output.size());
                output += "\n[Output truncated (too large)]";
                truncated = true;
                continue;
            }
            output.append(buffer.data(), n);
        } else if (bytes_read == 0) {
            break;
        } else {
            if (errno == EINTR)
                continue;
            throw std::system_error(errno, std::generic_category(), "Failed to read from pipe");
        }
    }

    return output;
}

int ShellPipe::wait() {
    if (exit_status_) {
        return *exit_status_;
    }

    int status = 0;
    while (::waitpid(pid_, &status, 0) == -1) {
        if (errno != EINTR) {
            throw std::system_error(errno, std::generic_category(), "Failed to wait for child");
        }
        check_interrupted();
    }

    exit_status_ = decode_status(status);
    return *exit_status_;
}
