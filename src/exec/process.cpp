#include "codejudge/exec/process.hpp"
#include <fcntl.h>
#include <fmt/core.h>
#include <glog/logging.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>
#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <fstream>
#include <mutex>
#include <sstream>
#include <system_error>
#include "codejudge/common/exceptions.hpp"

namespace codejudge {
using namespace std;
using namespace std::chrono;

const int BUF_SIZE = 4096;

const int PIPE_IN = 1;
const int PIPE_OUT = 0;

// 子进程退出后，等待残留进程释放管道的最长时间
const milliseconds straggler_delay(100);

template <typename... Args>
static void error(int err, Args &&... args) {
    throw system_error(err, system_category(), fmt::format(args...));
}

static void close_fd(int &fd) {
    if (fd < 0) return;
    if (close(fd) != 0 && errno != EINTR)
        LOG(WARNING) << "closing fd " << fd << ": " << strerror(errno);
    fd = -1;
}

static void set_nonblocking(int fd) {
    int flags = fcntl(fd, F_GETFL);
    if (flags < 0 || fcntl(fd, F_SETFL, flags | O_NONBLOCK) < 0)
        error(errno, "setting O_NONBLOCK on fd {}", fd);
}

/**
 * @brief 杀死子进程所在的进程组
 * @param include_child 子进程尚未被回收时同时直接杀死子进程，
 * 覆盖子进程还没来得及 setpgid 的情况；回收之后 pid 可能被复用，不能再直接 kill
 */
static void kill_group(pid_t pid, bool include_child) {
    if (kill(-pid, SIGKILL) != 0 && errno != ESRCH)
        LOG(WARNING) << "unable to kill process group " << pid << ": " << strerror(errno);
    if (include_child && kill(pid, SIGKILL) != 0 && errno != ESRCH)
        LOG(WARNING) << "unable to kill process " << pid << ": " << strerror(errno);
}

optional<long> read_resident_memory_kb(pid_t pid) {
    ifstream fin("/proc/" + to_string(pid) + "/status");
    if (!fin) return nullopt;
    string line;
    while (getline(fin, line)) {
        if (line.compare(0, 6, "VmRSS:") != 0) continue;
        istringstream ss(line.substr(6));
        long kb;
        if (ss >> kb) return kb;
        return nullopt;
    }
    return nullopt;
}

/**
 * @brief 从管道读取数据，超出 limit 的部分读出后直接丢弃
 * @return false 若管道已经关闭
 */
static bool pump_pipe(int &fd, string &buffer, size_t limit) {
    char buf[BUF_SIZE];
    while (true) {
        ssize_t nread = read(fd, buf, BUF_SIZE);
        if (nread > 0) {
            if (buffer.size() < limit)
                buffer.append(buf, min((size_t)nread, limit - buffer.size()));
            continue;
        }
        if (nread == 0) {
            close_fd(fd);
            return false;
        }
        if (errno == EINTR) continue;
        if (errno == EAGAIN || errno == EWOULDBLOCK) return true;
        error(errno, "reading from child pipe fd {}", fd);
    }
}

/**
 * @brief 向子进程写入尽可能多的标准输入，写完或子进程关闭输入后关闭管道
 */
static void feed_stdin(int &fd, const string &data, size_t &written) {
    while (written < data.size()) {
        ssize_t n = write(fd, data.data() + written, data.size() - written);
        if (n > 0) {
            written += n;
            continue;
        }
        if (n < 0 && errno == EINTR) continue;
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) return;
        // EPIPE: 子进程不再读取标准输入
        break;
    }
    close_fd(fd);
}

process_result run_process(const process_options &opt) {
    if (opt.command.empty())
        throw invalid_argument("empty command");

    // 子进程提前关闭标准输入时，写管道会产生 SIGPIPE
    static once_flag sigpipe_once;
    call_once(sigpipe_once, [] { signal(SIGPIPE, SIG_IGN); });

    // fork 之后子进程中只能调用 async-signal-safe 的函数，因此提前准备好参数
    vector<char *> argv;
    for (auto &arg : opt.command)
        argv.push_back(const_cast<char *>(arg.c_str()));
    argv.push_back(nullptr);
    string workdir = opt.workdir.string();

    // 所有管道都带 O_CLOEXEC，避免其他线程同时 fork 的子进程继承管道导致读不到 EOF
    int child_pipefd[3][2] = {{-1, -1}, {-1, -1}, {-1, -1}};
    int exec_pipefd[2] = {-1, -1};
    auto close_all = [&] {
        for (auto &p : child_pipefd) {
            close_fd(p[PIPE_IN]);
            close_fd(p[PIPE_OUT]);
        }
        close_fd(exec_pipefd[PIPE_IN]);
        close_fd(exec_pipefd[PIPE_OUT]);
    };

    for (int i = 0; i < 3; ++i) {
        if (pipe2(child_pipefd[i], O_CLOEXEC) != 0) {
            int err = errno;
            close_all();
            error(err, "creating pipe for fd {}", i);
        }
    }
    if (pipe2(exec_pipefd, O_CLOEXEC) != 0) {
        int err = errno;
        close_all();
        error(err, "creating exec status pipe");
    }

    auto start = steady_clock::now();
    pid_t pid = fork();
    if (pid < 0) {
        int err = errno;
        close_all();
        error(err, "unable to fork");
    }

    if (pid == 0) {  // 子进程
        setpgid(0, 0);
        signal(SIGPIPE, SIG_DFL);
        sigset_t empty;
        sigemptyset(&empty);
        sigprocmask(SIG_SETMASK, &empty, nullptr);

        // stdin 连接管道的读端，stdout、stderr 连接管道的写端
        if (dup2(child_pipefd[0][PIPE_OUT], STDIN_FILENO) < 0 ||
            dup2(child_pipefd[1][PIPE_IN], STDOUT_FILENO) < 0 ||
            dup2(child_pipefd[2][PIPE_IN], STDERR_FILENO) < 0) {
            int err = errno;
            (void)!write(exec_pipefd[PIPE_IN], &err, sizeof(err));
            _exit(127);
        }
        if (!workdir.empty() && chdir(workdir.c_str()) != 0) {
            int err = errno;
            (void)!write(exec_pipefd[PIPE_IN], &err, sizeof(err));
            _exit(127);
        }
        execvp(argv[0], argv.data());
        int err = errno;
        (void)!write(exec_pipefd[PIPE_IN], &err, sizeof(err));
        _exit(127);
    }

    // 父进程
    close_fd(child_pipefd[0][PIPE_OUT]);
    close_fd(child_pipefd[1][PIPE_IN]);
    close_fd(child_pipefd[2][PIPE_IN]);
    close_fd(exec_pipefd[PIPE_IN]);

    int exec_errno = 0;
    {
        ssize_t n;
        do {
            n = read(exec_pipefd[PIPE_OUT], &exec_errno, sizeof(exec_errno));
        } while (n < 0 && errno == EINTR);
        if (n != (ssize_t)sizeof(exec_errno)) exec_errno = 0;
        close_fd(exec_pipefd[PIPE_OUT]);
    }

    if (exec_errno != 0) {
        int status;
        while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
        close_all();
        throw toolchain_missing_error(
            fmt::format("unable to execute {}: {}", opt.command[0], strerror(exec_errno)),
            opt.command[0]);
    }

    int &in_fd = child_pipefd[0][PIPE_IN];
    int &out_fd = child_pipefd[1][PIPE_OUT];
    int &err_fd = child_pipefd[2][PIPE_OUT];

    process_result result;
    size_t stdin_written = 0;
    try {
        set_nonblocking(in_fd);
        set_nonblocking(out_fd);
        set_nonblocking(err_fd);
        if (opt.stdin_text.empty()) close_fd(in_fd);

        auto deadline = start + milliseconds(opt.time_limit_ms);
        auto interval = milliseconds(max(1, opt.sample_interval_ms));
        auto next_sample = start;
        steady_clock::time_point finished;
        bool reaped = false;
        int wstatus = 0;

        while (true) {
            auto now = steady_clock::now();

            if (!reaped) {
                if (opt.time_limit_ms >= 0 && now >= deadline && !result.timed_out) {
                    kill_group(pid, true);
                    result.timed_out = true;
                }
                if (opt.token && opt.token->is_cancelled() && !result.cancelled) {
                    kill_group(pid, true);
                    result.cancelled = true;
                }
                if (now >= next_sample) {
                    // 采样是尽力而为的：读不到 VmRSS 时保留之前的最大值
                    if (auto rss = read_resident_memory_kb(pid))
                        result.peak_memory_kb = max(result.peak_memory_kb.value_or(0), *rss);
                    next_sample = now + interval;
                }

                pid_t r = waitpid(pid, &wstatus, WNOHANG);
                if (r == pid) {
                    reaped = true;
                    finished = steady_clock::now();
                    // 清理选手程序 fork 出来、仍然留在进程组中的进程
                    kill_group(pid, false);
                } else if (r < 0 && errno != EINTR) {
                    error(errno, "waiting for child {}", pid);
                }
            }

            if (reaped && out_fd < 0 && err_fd < 0) break;
            if (reaped && steady_clock::now() - finished > straggler_delay) {
                // 逃出进程组的后代进程仍然持有管道，不再等待
                LOG(WARNING) << "descendants of " << opt.command[0] << " still hold its output pipes";
                break;
            }

            // 已关闭的管道 fd 为 -1，poll 会忽略它们
            pollfd fds[3] = {{out_fd, POLLIN, 0}, {err_fd, POLLIN, 0}, {in_fd, POLLOUT, 0}};

            // 子进程的退出不会唤醒 poll，所以最多等待一个采样间隔
            auto wake = reaped ? steady_clock::now() + milliseconds(10) : next_sample;
            if (!reaped && opt.time_limit_ms >= 0 && !result.timed_out)
                wake = min(wake, deadline);
            auto wait = max(chrono::ceil<milliseconds>(wake - steady_clock::now()), milliseconds(1));

            int r = poll(fds, 3, (int)wait.count());
            if (r < 0) {
                if (errno == EINTR) continue;
                error(errno, "waiting for child pipes");
            }
            if (r == 0) continue;

            // 对端关闭时只有 POLLHUP，读到 EOF 后关闭管道
            const short ready = POLLIN | POLLHUP | POLLERR;
            if (out_fd >= 0 && (fds[0].revents & ready))
                pump_pipe(out_fd, result.stdout_text, opt.output_limit);
            if (err_fd >= 0 && (fds[1].revents & ready))
                pump_pipe(err_fd, result.stderr_text, opt.output_limit);
            if (in_fd >= 0 && (fds[2].revents & (POLLOUT | POLLHUP | POLLERR)))
                feed_stdin(in_fd, opt.stdin_text, stdin_written);
        }

        result.runtime_ms = duration_cast<milliseconds>(finished - start).count();
        if (WIFEXITED(wstatus)) {
            result.exit_code = WEXITSTATUS(wstatus);
        } else if (WIFSIGNALED(wstatus)) {
            result.exit_code = -1;
            result.signal = WTERMSIG(wstatus);
        }
    } catch (...) {
        // 出错时保证子进程被杀死并回收，然后继续抛出
        kill_group(pid, true);
        int status;
        while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
        close_all();
        throw;
    }

    close_all();
    return result;
}

}  // namespace codejudge
