#include "skyline/proc.h"
#include "skyline/cancel.h"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <mutex>

#include <fcntl.h>
#include <poll.h>
#include <sys/resource.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#ifdef __linux__
  #include <sys/prctl.h>
#endif

namespace skyline {

static void set_rlimit(int resource, rlim_t v) {
    struct rlimit rl;
    rl.rlim_cur = v;
    rl.rlim_max = v;
    (void)setrlimit(resource, &rl);
}

static void set_nonblock(int fd) {
    int flags = fcntl(fd, F_GETFL, 0);
    if (flags >= 0) (void)fcntl(fd, F_SETFL, flags | O_NONBLOCK);
}

static void close_pair(int p[2]) {
    if (p[0] >= 0) close(p[0]);
    if (p[1] >= 0) close(p[1]);
    p[0] = p[1] = -1;
}

namespace {

// One captured output stream with its own cap.
struct Sink {
    int fd{-1};
    size_t max_bytes{0};
    std::string* buf{nullptr};
    bool* truncated{nullptr};

    void append(const char* data, ssize_t n) {
        size_t can = max_bytes > buf->size() ? (max_bytes - buf->size()) : 0;
        size_t take = (size_t)n;
        if (take > can) {
            take = can;
            *truncated = true;
        }
        if (take > 0) buf->append(data, take);
    }

    // Reads until EAGAIN. Returns false once the pipe reached EOF.
    bool drain() {
        if (fd < 0) return false;
        char tmp[4096];
        while (true) {
            ssize_t n = read(fd, tmp, sizeof(tmp));
            if (n > 0) { append(tmp, n); continue; }
            if (n == -1 && errno == EINTR) continue;
            if (n == -1 && (errno == EAGAIN || errno == EWOULDBLOCK)) return true;
            close(fd);
            fd = -1;
            return false;
        }
    }
};

} // namespace

bool proc_run_capture(const std::vector<std::string>& argv,
                      const std::string& cwd,
                      const std::string& stdin_data,
                      const ProcLimits& lim,
                      ProcResult* res) {
    if (!res) return false;
    *res = ProcResult{};

    if (argv.empty() || argv[0].empty()) {
        res->error = "empty argv";
        return false;
    }

    int in_pipe[2] = {-1, -1};
    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    if (pipe(in_pipe) != 0 || pipe(out_pipe) != 0 || pipe(err_pipe) != 0) {
        res->error = std::string("pipe failed: ") + std::strerror(errno);
        close_pair(in_pipe); close_pair(out_pipe); close_pair(err_pipe);
        return false;
    }

    pid_t pid = fork();
    if (pid < 0) {
        res->error = std::string("fork failed: ") + std::strerror(errno);
        close_pair(in_pipe); close_pair(out_pipe); close_pair(err_pipe);
        return false;
    }

    if (pid == 0) {
        // child
        (void)dup2(in_pipe[0], STDIN_FILENO);
        (void)dup2(out_pipe[1], STDOUT_FILENO);
        (void)dup2(err_pipe[1], STDERR_FILENO);

        // isolate process group so timeout/cancel can kill the whole subtree
        (void)setpgid(0, 0);
        (void)umask(077);

        long maxfd = sysconf(_SC_OPEN_MAX);
        if (maxfd < 256) maxfd = 256;
        for (int fd = 3; fd < maxfd; fd++) {
            (void)close(fd);
        }

        if (!cwd.empty() && chdir(cwd.c_str()) != 0) {
            _exit(126);
        }

        unsetenv("LD_PRELOAD");
        unsetenv("LD_LIBRARY_PATH");

#ifdef __linux__
        if (lim.no_new_privs) {
            (void)prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0);
        }
        (void)prctl(PR_SET_PDEATHSIG, SIGKILL);
#endif

        if (lim.rlimit_cpu_sec > 0) set_rlimit(RLIMIT_CPU, (rlim_t)lim.rlimit_cpu_sec);
        if (lim.rlimit_as_mb > 0) set_rlimit(RLIMIT_AS, (rlim_t)lim.rlimit_as_mb * 1024ULL * 1024ULL);
        if (lim.rlimit_fsize_mb > 0) set_rlimit(RLIMIT_FSIZE, (rlim_t)lim.rlimit_fsize_mb * 1024ULL * 1024ULL);
        if (lim.rlimit_nofile > 0) set_rlimit(RLIMIT_NOFILE, (rlim_t)lim.rlimit_nofile);

        std::vector<char*> cargv;
        cargv.reserve(argv.size() + 1);
        for (const auto& s : argv) cargv.push_back(const_cast<char*>(s.c_str()));
        cargv.push_back(nullptr);

        execvp(cargv[0], cargv.data());
        _exit(127);
    }

    // parent
    (void)setpgid(pid, pid);
    close(in_pipe[0]);
    close(out_pipe[1]);
    close(err_pipe[1]);

    // A child that exits early must not kill us through SIGPIPE on the stdin write.
    static std::once_flag sigpipe_once;
    std::call_once(sigpipe_once, []() { (void)signal(SIGPIPE, SIG_IGN); });

    int in_fd = in_pipe[1];
    if (stdin_data.empty()) {
        close(in_fd);
        in_fd = -1;
    } else {
        set_nonblock(in_fd);
    }
    size_t write_off = 0;

    Sink out_sink{out_pipe[0], lim.stdout_max_bytes, &res->out, &res->output_truncated};
    Sink err_sink{err_pipe[0], lim.stderr_max_bytes, &res->err, &res->output_truncated};
    set_nonblock(out_sink.fd);
    set_nonblock(err_sink.fd);

    auto start = std::chrono::steady_clock::now();
    bool child_exited = false;
    int status = 0;

    auto kill_child = [&]() {
        (void)kill(-pid, SIGKILL);
        (void)kill(pid, SIGKILL);
        (void)waitpid(pid, &status, 0);
        child_exited = true;
    };

    while (true) {
        if (lim.cancel && lim.cancel->cancelled()) {
            res->cancelled = true;
            kill_child();
            break;
        }

        int elapsed_ms = (int)std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start).count();
        int slice = 50;
        if (lim.timeout_ms > 0) {
            int remaining = lim.timeout_ms - elapsed_ms;
            if (remaining <= 0) {
                res->timed_out = true;
                kill_child();
                break;
            }
            slice = std::min(slice, remaining);
        }

        struct pollfd fds[3];
        nfds_t nfds = 0;
        int in_idx = -1;
        if (in_fd >= 0) {
            in_idx = (int)nfds;
            fds[nfds].fd = in_fd;
            fds[nfds].events = POLLOUT;
            nfds++;
        }
        if (out_sink.fd >= 0) {
            fds[nfds].fd = out_sink.fd;
            fds[nfds].events = POLLIN;
            nfds++;
        }
        if (err_sink.fd >= 0) {
            fds[nfds].fd = err_sink.fd;
            fds[nfds].events = POLLIN;
            nfds++;
        }

        if (nfds > 0) {
            int pr = poll(fds, nfds, slice);
            if (pr < 0 && errno != EINTR) {
                res->error = std::string("poll failed: ") + std::strerror(errno);
                kill_child();
                break;
            }
        } else {
            (void)poll(nullptr, 0, slice);
        }

        // Interleave stdin writes with output reads so large payloads cannot deadlock.
        if (in_idx >= 0 && (fds[in_idx].revents & (POLLOUT | POLLERR | POLLHUP))) {
            while (write_off < stdin_data.size()) {
                ssize_t n = write(in_fd, stdin_data.data() + write_off, stdin_data.size() - write_off);
                if (n > 0) { write_off += (size_t)n; continue; }
                if (n == -1 && errno == EINTR) continue;
                if (n == -1 && (errno == EAGAIN || errno == EWOULDBLOCK)) break;
                write_off = stdin_data.size(); // reader went away
                break;
            }
            if (write_off >= stdin_data.size()) {
                close(in_fd);
                in_fd = -1;
            }
        }

        out_sink.drain();
        err_sink.drain();

        pid_t w = waitpid(pid, &status, WNOHANG);
        if (w == pid) {
            child_exited = true;
            break;
        }
    }

    if (in_fd >= 0) close(in_fd);

    // collect what the child wrote before exiting; a grandchild still
    // holding the pipe open must not block us
    out_sink.drain();
    err_sink.drain();
    if (out_sink.fd >= 0) close(out_sink.fd);
    if (err_sink.fd >= 0) close(err_sink.fd);

    if (!child_exited) {
        res->exit_code = 128;
        if (res->error.empty()) res->error = "child did not exit";
        return true;
    }

    if (WIFEXITED(status)) res->exit_code = WEXITSTATUS(status);
    else if (WIFSIGNALED(status)) res->exit_code = 128 + WTERMSIG(status);
    else res->exit_code = 128;

    return true;
}

} // namespace skyline
