#include "process.hpp"
#include <fcntl.h>
#include <glog/logging.h>
#include <poll.h>
#include <signal.h>
#include <sys/eventfd.h>
#include <sys/syscall.h>
#include <sys/wait.h>
#include <unistd.h>
#include <boost/algorithm/string/join.hpp>
#include <algorithm>
#include <cerrno>
#include <system_error>
#include "common/defer.hpp"
#include "common/exceptions.hpp"
#include "common/utils.hpp"
#include "config.hpp"

namespace oj {
using namespace std;

cancellation_token::cancellation_token() : flag(false) {
    fd = eventfd(0, EFD_CLOEXEC | EFD_NONBLOCK);
    if (fd < 0) throw system_error(errno, system_category(), "unable to create eventfd");
}

cancellation_token::~cancellation_token() {
    close(fd);
}

void cancellation_token::cancel() {
    if (flag.exchange(true)) return;
    uint64_t one = 1;
    if (write(fd, &one, sizeof(one)) < 0)
        PLOG(WARNING) << "Unable to notify cancellation";
}

bool cancellation_token::canceled() const {
    return flag.load();
}

int cancellation_token::native_handle() const {
    return fd;
}

bool process_result::success() const {
    return !deadline_exceeded && !canceled && signal == 0 && exit_code == 0;
}

static int pidfd_open(pid_t pid) {
#ifdef SYS_pidfd_open
    return static_cast<int>(syscall(SYS_pidfd_open, pid, 0));
#else
    errno = ENOSYS;
    return -1;
#endif
}

static void close_fd(int &fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

static string error_message(int err) {
    return system_category().message(err);
}

static int open_file(const filesystem::path &path, int flags) {
    int fd = open(path.c_str(), flags | O_CLOEXEC, 0644);
    if (fd < 0) throw execution_error(fmt::format("Unable to open {}: {}", path, error_message(errno)));
    return fd;
}

/**
 * @param nonblock 父进程读端是否不阻塞
 * 输出管道的读端不阻塞，避免子进程迟迟不输出时卡住监视循环；
 * 报告 exec 错误的管道必须阻塞读，直到 exec 成功关闭管道或者子进程写入 errno
 */
static void open_pipe(int fds[2], bool nonblock) {
    if (pipe2(fds, O_CLOEXEC) < 0)
        throw execution_error("Unable to create pipe: " + error_message(errno));
    if (nonblock)
        fcntl(fds[0], F_SETFL, fcntl(fds[0], F_GETFL) | O_NONBLOCK);
}

/**
 * @brief 读取管道中当前可读的数据
 * 每次最多读取 64KB，以便监视循环能及时检查时间限制。
 * 超过 MAX_CAPTURE_SIZE 的部分会被丢弃。读到 EOF 时关闭管道。
 */
static void drain_pipe(int &fd, string &buffer) {
    char buf[4096];
    for (int i = 0; i < 16; ++i) {
        ssize_t n = read(fd, buf, sizeof(buf));
        if (n > 0) {
            if (buffer.size() < MAX_CAPTURE_SIZE)
                buffer.append(buf, min(static_cast<size_t>(n), MAX_CAPTURE_SIZE - buffer.size()));
            continue;
        }
        if (n < 0 && errno == EINTR) continue;
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) return;
        close_fd(fd);
        return;
    }
}

process_result run_process(const process_options &options) {
    process_result result;
    if (options.argv.empty()) throw execution_error("Command to execute is empty");
    if (options.token && options.token->canceled()) {
        result.canceled = true;
        return result;
    }

#ifndef NDEBUG
    LOG(INFO) << boost::algorithm::join(options.argv, " ");
#endif

    int stdin_fd = -1, stdout_fd = -1;
    int stdout_pipe[2] = {-1, -1}, stderr_pipe[2] = {-1, -1}, error_pipe[2] = {-1, -1};
    defer {
        close_fd(stdin_fd);
        close_fd(stdout_fd);
        for (int *p : {stdout_pipe, stderr_pipe, error_pipe}) {
            close_fd(p[0]);
            close_fd(p[1]);
        }
    };

    stdin_fd = open_file(options.stdin_path.empty() ? filesystem::path("/dev/null") : options.stdin_path, O_RDONLY);
    if (!options.stdout_path.empty())
        stdout_fd = open_file(options.stdout_path, O_WRONLY | O_CREAT | O_TRUNC);
    else
        open_pipe(stdout_pipe, true);
    open_pipe(stderr_pipe, true);
    open_pipe(error_pipe, false);

    vector<char *> argv;
    for (auto &arg : options.argv) argv.push_back(const_cast<char *>(arg.c_str()));
    argv.push_back(nullptr);
    const char *working_dir = options.working_dir.empty() ? nullptr : options.working_dir.c_str();

    elapsed_time timer;
    pid_t pid = fork();
    if (pid < 0) throw execution_error("Unable to fork: " + error_message(errno));

    if (pid == 0) {
        // 子进程，fork 之后只能调用 async-signal-safe 的函数
        setpgid(0, 0);
        int out = stdout_fd >= 0 ? stdout_fd : stdout_pipe[1];
        if (dup2(stdin_fd, STDIN_FILENO) >= 0 &&
            dup2(out, STDOUT_FILENO) >= 0 &&
            dup2(stderr_pipe[1], STDERR_FILENO) >= 0 &&
            (!working_dir || chdir(working_dir) == 0)) {
            execvp(argv[0], argv.data());
        }
        // exec 成功时 error_pipe 会因为 O_CLOEXEC 被关闭，父进程读到 EOF
        int err = errno;
        ssize_t written = write(error_pipe[1], &err, sizeof(err));
        (void)written;
        _exit(127);
    }

    // 父子进程都设置进程组，避免杀进程组时子进程还没来得及 setpgid
    setpgid(pid, pid);
    close_fd(stdin_fd);
    close_fd(stdout_fd);
    close_fd(stdout_pipe[1]);
    close_fd(stderr_pipe[1]);
    close_fd(error_pipe[1]);

    int status = 0;
    bool reaped = false;
    defer {
        if (!reaped) {
            kill(-pid, SIGKILL);
            waitpid(pid, &status, 0);
        }
    };

    int exec_errno = 0;
    ssize_t n;
    do {
        n = read(error_pipe[0], &exec_errno, sizeof(exec_errno));
    } while (n < 0 && errno == EINTR);
    close_fd(error_pipe[0]);
    if (n == sizeof(exec_errno)) {
        waitpid(pid, &status, 0);
        reaped = true;
        throw execution_error(fmt::format("Unable to execute {}: {}", options.argv[0], error_message(exec_errno)));
    }

    // pidfd 在子进程退出时变为可读，不支持 pidfd 的内核上退化为 10ms 的轮询
    int pidfd = pidfd_open(pid);
    defer { close_fd(pidfd); };

    const auto deadline = options.deadline;
    while (true) {
        struct pollfd fds[4];
        nfds_t nfds = 0;
        int out_index = -1, err_index = -1;
        if (pidfd >= 0) fds[nfds++] = {pidfd, POLLIN, 0};
        if (stdout_pipe[0] >= 0) {
            out_index = nfds;
            fds[nfds++] = {stdout_pipe[0], POLLIN, 0};
        }
        if (stderr_pipe[0] >= 0) {
            err_index = nfds;
            fds[nfds++] = {stderr_pipe[0], POLLIN, 0};
        }
        if (options.token) fds[nfds++] = {options.token->native_handle(), POLLIN, 0};

        auto wait = chrono::microseconds::max();
        if (deadline.count() > 0)
            wait = max(deadline - timer.duration<chrono::microseconds>(), chrono::microseconds(0));
        if (pidfd < 0)
            wait = min(wait, chrono::microseconds(10000));
        struct timespec timeout, *timeout_ptr = nullptr;
        if (wait != chrono::microseconds::max()) {
            timeout.tv_sec = wait.count() / 1000000;
            timeout.tv_nsec = (wait.count() % 1000000) * 1000;
            timeout_ptr = &timeout;
        }

        int ret = ppoll(fds, nfds, timeout_ptr, nullptr);
        if (ret < 0 && errno != EINTR)
            throw execution_error("Unable to wait for child process: " + error_message(errno));
        if (ret > 0) {
            if (out_index >= 0 && fds[out_index].revents) drain_pipe(stdout_pipe[0], result.captured_stdout);
            if (err_index >= 0 && fds[err_index].revents) drain_pipe(stderr_pipe[0], result.captured_stderr);
        }

        if (options.token && options.token->canceled()) {
            LOG(WARNING) << "Killing " << options.argv[0] << " (pid " << pid << ") since judging is canceled";
            result.canceled = true;
            break;
        }

        // WNOWAIT 使子进程保持僵尸状态，在杀进程组之前进程组号不会被复用
        siginfo_t info;
        info.si_pid = 0;
        if (waitid(P_PID, pid, &info, WEXITED | WNOHANG | WNOWAIT) == 0 && info.si_pid == pid) {
            result.elapsed = timer.duration<chrono::microseconds>();
            if (deadline.count() > 0 && result.elapsed > deadline)
                result.deadline_exceeded = true;
            break;
        }

        if (deadline.count() > 0 && timer.duration<chrono::microseconds>() >= deadline) {
            LOG(WARNING) << "Killing " << options.argv[0] << " (pid " << pid << ") since it exceeded time limit " << deadline.count() << "us";
            result.deadline_exceeded = true;
            break;
        }
    }

    // 子进程已经退出时，杀死进程组中残留的后台进程，它们可能仍然持有输出管道
    kill(-pid, SIGKILL);
    while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
    reaped = true;

    while (stdout_pipe[0] >= 0 || stderr_pipe[0] >= 0) {
        struct pollfd fds[2];
        nfds_t nfds = 0;
        if (stdout_pipe[0] >= 0) fds[nfds++] = {stdout_pipe[0], POLLIN, 0};
        if (stderr_pipe[0] >= 0) fds[nfds++] = {stderr_pipe[0], POLLIN, 0};
        int ret = poll(fds, nfds, 100);
        if (ret < 0 && errno == EINTR) continue;
        if (ret <= 0) break;
        if (stdout_pipe[0] >= 0) drain_pipe(stdout_pipe[0], result.captured_stdout);
        if (stderr_pipe[0] >= 0) drain_pipe(stderr_pipe[0], result.captured_stderr);
    }

    if (result.deadline_exceeded) {
        result.elapsed = deadline;
    } else if (result.canceled) {
        result.elapsed = timer.duration<chrono::microseconds>();
    } else if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.signal = WTERMSIG(status);
    }
    return result;
}

}  // namespace oj
