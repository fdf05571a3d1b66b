#include "sandbox/subprocess.hpp"
#include <fcntl.h>
#include <glog/logging.h>
#include <poll.h>
#include <signal.h>
#include <sys/resource.h>
#include <sys/wait.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <optional>
#include <stdexcept>
#include <system_error>
#include <thread>

namespace codegrade::sandbox {
using namespace std;

static constexpr int PIPE_OUT = 0;
static constexpr int PIPE_IN = 1;
static constexpr chrono::milliseconds POLL_INTERVAL(10);

namespace {

struct unique_fd {
    explicit unique_fd(int fd) : fd(fd) {}
    unique_fd(const unique_fd &) = delete;
    unique_fd &operator=(const unique_fd &) = delete;
    ~unique_fd() { reset(); }

    void reset() {
        if (fd >= 0) ::close(fd);
        fd = -1;
    }

    int fd;
};

struct output_stream {
    unique_fd &fd;
    string &text;
};

}  // namespace

static void make_pipe(int fds[2]) {
    if (pipe2(fds, O_CLOEXEC) != 0)
        throw system_error(errno, generic_category(), "Unable to create pipe");
}

static void set_rlimit(int resource, rlim_t value) {
    struct rlimit lim;
    lim.rlim_cur = lim.rlim_max = value;
    setrlimit(resource, &lim);
}

static void write_all(int fd, const char *text) {
    size_t len = strlen(text);
    while (len > 0) {
        ssize_t nwritten = ::write(fd, text, len);
        if (nwritten < 0 && errno == EINTR) continue;
        if (nwritten <= 0) return;
        text += nwritten;
        len -= nwritten;
    }
}

static void child_fail(const char *what, const char *arg) {
    // stderr is already the pipe, the parent reports it as program output
    write_all(STDERR_FILENO, what);
    write_all(STDERR_FILENO, " ");
    write_all(STDERR_FILENO, arg);
    write_all(STDERR_FILENO, "\n");
    _exit(127);
}

/**
 * @brief Runs in the forked child, only async-signal-safe calls until exec
 */
[[noreturn]] static void exec_child(char *const *argv, const char *cwd, int out, int err, const process_limits &limits) {
    // a group of our own, so the parent can kill every descendant at once
    setpgid(0, 0);

    sigset_t mask;
    sigemptyset(&mask);
    sigprocmask(SIG_SETMASK, &mask, nullptr);
    signal(SIGPIPE, SIG_DFL);

    if (dup2(out, STDOUT_FILENO) < 0 || dup2(err, STDERR_FILENO) < 0) _exit(127);
    int devnull = open("/dev/null", O_RDONLY | O_CLOEXEC);
    if (devnull < 0 || dup2(devnull, STDIN_FILENO) < 0) child_fail("Unable to open", "/dev/null");
    if (devnull != STDIN_FILENO)
        ::close(devnull);
    else
        fcntl(STDIN_FILENO, F_SETFD, 0);

    if (*cwd && chdir(cwd) != 0) child_fail("Unable to enter", cwd);

    set_rlimit(RLIMIT_CORE, 0);
    if (limits.memory_kb > 0) set_rlimit(RLIMIT_DATA, (rlim_t)limits.memory_kb * 1024);
    if (limits.cpu_seconds > 0) set_rlimit(RLIMIT_CPU, limits.cpu_seconds);
    if (limits.file_size_bytes > 0) set_rlimit(RLIMIT_FSIZE, limits.file_size_bytes);
    if (limits.open_files > 0) set_rlimit(RLIMIT_NOFILE, limits.open_files);

    execvp(argv[0], argv);
    child_fail("Unable to execute", argv[0]);
    _exit(127);
}

/**
 * @brief Read what is available on a ready stream, closing it at EOF
 */
static void pump(output_stream &stream, size_t limit, bool &truncated) {
    char buf[4096];
    ssize_t nread = ::read(stream.fd.fd, buf, sizeof(buf));
    if (nread > 0) {
        size_t room = stream.text.size() < limit ? limit - stream.text.size() : 0;
        if ((size_t)nread > room) truncated = true;
        stream.text.append(buf, min(room, (size_t)nread));
    } else if (nread == 0 || (errno != EINTR && errno != EAGAIN)) {
        stream.fd.reset();
    }
}

process_result run_process(const vector<string> &argv, const process_options &options, const cancellation_token &cancel) {
    if (argv.empty()) throw invalid_argument("run_process: empty command line");

    // everything the child touches is prepared before fork
    vector<char *> args;
    for (auto &arg : argv) args.push_back(const_cast<char *>(arg.c_str()));
    args.push_back(nullptr);
    string cwd = options.working_directory.string();

    int out_pipe[2], err_pipe[2];
    make_pipe(out_pipe);
    unique_fd out_read(out_pipe[PIPE_OUT]), out_write(out_pipe[PIPE_IN]);
    make_pipe(err_pipe);
    unique_fd err_read(err_pipe[PIPE_OUT]), err_write(err_pipe[PIPE_IN]);

    auto start = chrono::steady_clock::now();
    pid_t pid = fork();
    if (pid < 0) throw system_error(errno, generic_category(), "Unable to fork");
    if (pid == 0) exec_child(args.data(), cwd.c_str(), out_write.fd, err_write.fd, options.limits);

    // also done in the parent so kill(-pid) is valid before the child gets scheduled
    setpgid(pid, pid);
    out_write.reset();
    err_write.reset();

    process_result result;
    output_stream streams[2] = {{out_read, result.stdout_text}, {err_read, result.stderr_text}};

    auto deadline = start + options.timeout;
    optional<chrono::steady_clock::time_point> term_sent;
    bool kill_sent = false, reaped = false;
    int status = 0;

    while (true) {
        if (!reaped) {
            pid_t ret = waitpid(pid, &status, WNOHANG);
            if (ret == pid) {
                reaped = true;
                result.elapsed = chrono::duration_cast<chrono::milliseconds>(chrono::steady_clock::now() - start);
                // descendants still holding the pipes open go with their leader
                ::kill(-pid, SIGKILL);
            } else if (ret < 0 && errno != EINTR) {
                LOG(ERROR) << "Lost track of child " << pid << ": " << strerror(errno);
                ::kill(-pid, SIGKILL);
                reaped = true;
                status = W_EXITCODE(127, 0);
            }
        }
        if (reaped && out_read.fd < 0 && err_read.fd < 0) break;

        auto now = chrono::steady_clock::now();
        if (!reaped) {
            if (!term_sent && (now >= deadline || cancel.cancelled())) {
                if (now >= deadline)
                    result.timed_out = true;
                else
                    result.cancelled = true;
                DLOG(INFO) << "Stopping process group " << pid << (result.timed_out ? " (timeout)" : " (cancelled)");
                if (::kill(-pid, SIGTERM) != 0 && errno != ESRCH)
                    LOG(ERROR) << "Unable to send SIGTERM to " << pid << ": " << strerror(errno);
                term_sent = now;
            } else if (term_sent && !kill_sent && now - *term_sent >= options.kill_grace) {
                if (::kill(-pid, SIGKILL) != 0 && errno != ESRCH)
                    LOG(ERROR) << "Unable to send SIGKILL to " << pid << ": " << strerror(errno);
                kill_sent = true;
            }
        } else if (now >= deadline + options.kill_grace) {
            LOG(WARNING) << "Output of process " << pid << " still open after exit, a descendant left its process group";
            break;
        }

        pollfd fds[2];
        output_stream *polled[2];
        nfds_t nfds = 0;
        for (auto &stream : streams) {
            if (stream.fd.fd < 0) continue;
            fds[nfds] = {stream.fd.fd, POLLIN, 0};
            polled[nfds++] = &stream;
        }

        if (nfds == 0) {
            this_thread::sleep_for(POLL_INTERVAL);
            continue;
        }

        int ready = poll(fds, nfds, (int)POLL_INTERVAL.count());
        if (ready < 0) {
            if (errno == EINTR) continue;
            throw system_error(errno, generic_category(), "poll");
        }
        for (nfds_t i = 0; i < nfds; ++i)
            if (fds[i].revents & (POLLIN | POLLHUP | POLLERR))
                pump(*polled[i], options.output_limit, result.truncated);
    }

    if (WIFEXITED(status)) {
        result.exited = true;
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.exit_code = -WTERMSIG(status);
    }
    if (result.truncated)
        LOG(WARNING) << "Output of process " << pid << " exceeded " << options.output_limit << " bytes and was truncated";
    return result;
}

}  // namespace codegrade::sandbox
