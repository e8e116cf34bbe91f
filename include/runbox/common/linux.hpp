#pragma once

#include <runbox/common/expected.hpp>
#include <runbox/logging.hpp>

#include <gsl/util>

#include <cerrno>
#include <csignal>
#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <stdlib.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

/// Thin wrappers around the Linux syscalls used to supervise child processes.
/// Every wrapper returns success/failure and logs failure at debug level; callers decide severity.
namespace runbox::linux {

inline std::error_code make_error_code(int err = errno) {
    return {err, std::generic_category()};
}

/// writes to a file descriptor. See write(2)
inline Expected<ssize_t> write(int fd, std::string_view data) {
    ssize_t res = ::write(fd, data.data(), data.size());

    if (res == -1) {
        auto err = make_error_code(errno);

        LOG_DEBUG("write failed: '{}'", err.message());
        return err;
    }

    return res;
}

/// reads at most ``count`` bytes from a file descriptor. See read(2)
/// An empty string means end-of-file.
inline Expected<std::string> read(int fd, std::size_t count) {
    std::string buffer(count, '\0');

    ssize_t res = ::read(fd, buffer.data(), count);

    if (res == -1) {
        auto err = make_error_code(errno);

        // EAGAIN is the normal way for a drained non-blocking pipe to say "nothing left"
        if (err != std::errc::resource_unavailable_try_again) {
            LOG_DEBUG("read failed: '{}'", err.message());
        }
        return err;
    }

    buffer.resize(gsl::narrow_cast<std::size_t>(res));

    return buffer;
}

/// closes a file descriptor. See close(2)
inline Expected<> close(int fd) {
    int res = ::close(fd);

    if (res == -1) {
        auto err = make_error_code(errno);

        LOG_DEBUG("close failed: '{}'", err.message());
        return err;
    }

    return {};
}

/// see kill(2). A negative ``pid`` signals the whole process group.
inline Expected<> kill(pid_t pid, int sig) {
    int res = ::kill(pid, sig);

    if (res == -1) {
        auto err = make_error_code(errno);

        LOG_DEBUG("kill(pid={}, sig={}) failed: '{}'", pid, sig, err.message());
        return err;
    }

    return {};
}

/// see setpgid(2)
inline Expected<> setpgid(pid_t pid, pid_t pgid) {
    int res = ::setpgid(pid, pgid);

    if (res == -1) {
        auto err = make_error_code(errno);

        LOG_DEBUG("setpgid failed: '{}'", err.message());
        return err;
    }

    return {};
}

struct Fork
{
    enum { Parent, Child } which;

    pid_t pid; // Only valid if which == Parent
};

/// see fork(2)
inline Expected<Fork> fork() {
    pid_t res = ::fork();

    if (res == -1) {
        auto err = make_error_code(errno);
        LOG_DEBUG("fork failed: '{}'", err.message());
        return err;
    }

    if (res == 0) {
        return Fork{.which = Fork::Child, .pid = 0};
    }

    return Fork{.which = Fork::Parent, .pid = res};
}

/// see open(2)
inline Expected<int> open(const std::string& pathname, int flags, mode_t mode = 0) {
    // NOLINTNEXTLINE(*vararg)
    int res = ::open(pathname.c_str(), flags, mode);

    if (res == -1) {
        auto err = make_error_code(errno);
        LOG_DEBUG("open({:?}) failed: '{}'", pathname, err.message());
        return err;
    }

    return res;
}

/// see fcntl(2)
inline Expected<int> fcntl(int fd, int cmd, std::optional<int> arg = std::nullopt) {
    int res{};

    if (arg) {
        // NOLINTNEXTLINE(*vararg)
        res = ::fcntl(fd, cmd, arg.value());
    } else {
        // NOLINTNEXTLINE(*vararg)
        res = ::fcntl(fd, cmd);
    }

    if (res == -1) {
        auto err = make_error_code(errno);

        LOG_DEBUG("fcntl failed: '{}'", err.message());

        return err;
    }

    return res;
}

/// see waitid(2)
/// With WNOHANG, a returned ``si_pid`` of 0 means the child has not changed state yet.
inline Expected<siginfo_t> waitid(idtype_t idtype, id_t id, int options = WEXITED) {
    siginfo_t info{};
    int res = ::waitid(idtype, id, &info, options);

    if (res == -1) {
        auto err = make_error_code(errno);

        LOG_DEBUG("waitid failed: '{}'", err.message());

        return err;
    }

    return info;
}

/// see poll(2). Returns the number of fds with events; 0 on timeout.
inline Expected<int> poll(std::span<pollfd> fds, int timeout_ms) {
    int res = ::poll(fds.data(), fds.size(), timeout_ms);

    if (res == -1) {
        auto err = make_error_code(errno);

        if (err != std::errc::interrupted) {
            LOG_DEBUG("poll failed: '{}'", err.message());
        }

        return err;
    }

    return res;
}

struct Pipe
{
    int read_fd;
    int write_fd;
};

// Ensure that fds are packed so that pipe works properly
static_assert(offsetof(Pipe, read_fd) + sizeof(Pipe::read_fd) == offsetof(Pipe, write_fd));

/// see pipe2(2)
inline Expected<Pipe> pipe2(int flags = 0) {
    Pipe pipe{-1, -1};

    int res = ::pipe2(&pipe.read_fd, flags);

    if (res == -1) {
        auto err = make_error_code(errno);

        LOG_DEBUG("pipe failed: '{}'", err.message());

        return err;
    }

    return pipe;
}

/// see mkdtemp(3). ``path_template`` must end in "XXXXXX"; returns the created directory.
inline Expected<std::string> mkdtemp(std::string path_template) {
    char* res = ::mkdtemp(path_template.data());

    if (res == nullptr) {
        auto err = make_error_code(errno);

        LOG_DEBUG("mkdtemp({:?}) failed: '{}'", path_template, err.message());

        return err;
    }

    return path_template;
}

/// see access(2)
inline bool is_executable(const std::string& pathname) {
    struct ::stat info{};

    return ::stat(pathname.c_str(), &info) == 0 && S_ISREG(info.st_mode) && ::access(pathname.c_str(), X_OK) == 0;
}

} // namespace runbox::linux
