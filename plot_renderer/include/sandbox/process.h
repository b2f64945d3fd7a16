/**
 * @file process.h
 * @brief 子进程执行与输出捕获
 *
 * 用法：
 *   auto outcome = Process(python)
 *                      .arg(script)
 *                      .work_dir(dir)
 *                      .env("MPLCONFIGDIR", mpl)
 *                      .run(std::chrono::milliseconds(5000));
 *
 * 子进程：
 * - 独立进程组（超时时整组 SIGKILL）
 * - 禁止 core dump
 * - stdin 为 /dev/null，stdout/stderr 通过管道捕获
 * 父进程在等待期间持续读取两个管道，输出再大也不会因管道写满而死锁。
 */

#ifndef PLOT_SANDBOX_PROCESS_H
#define PLOT_SANDBOX_PROCESS_H

#include <string>
#include <vector>
#include <map>
#include <chrono>
#include <thread>
#include <algorithm>
#include <cstring>
#include <cerrno>

#include <unistd.h>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <sys/resource.h>

#include "core/error.h"
#include "core/types.h"
#include "core/render_logger.h"

extern char **environ;

namespace plot {
namespace sandbox {

//==============================================================================
// 管道工具
//==============================================================================

namespace detail {

inline void close_fd(int &fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

/**
 * @brief 读取管道中当前可用的全部数据
 * @return false 表示已读到 EOF 或出错（fd 已关闭）
 */
inline bool drain_fd(int &fd, std::string &out) {
    char buf[65536];
    while (fd >= 0) {
        ssize_t n = read(fd, buf, sizeof(buf));
        if (n > 0) {
            out.append(buf, static_cast<size_t>(n));
            continue;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            return true;
        }
        close_fd(fd);
    }
    return false;
}

/**
 * @brief 在 timeout_ms 内等待任一管道可读并读取
 */
inline void pump(int &out_fd, int &err_fd, std::string &out, std::string &err, int timeout_ms) {
    struct pollfd fds[2];
    nfds_t n = 0;
    if (out_fd >= 0) {
        fds[n].fd = out_fd;
        fds[n].events = POLLIN;
        fds[n].revents = 0;
        n++;
    }
    if (err_fd >= 0) {
        fds[n].fd = err_fd;
        fds[n].events = POLLIN;
        fds[n].revents = 0;
        n++;
    }
    if (n == 0) {
        std::this_thread::sleep_for(std::chrono::milliseconds(timeout_ms));
        return;
    }
    int ret = poll(fds, n, timeout_ms);
    if (ret <= 0) {
        return;
    }
    for (nfds_t i = 0; i < n; i++) {
        if (fds[i].revents == 0) {
            continue;
        }
        if (fds[i].fd == out_fd) {
            drain_fd(out_fd, out);
        } else if (fds[i].fd == err_fd) {
            drain_fd(err_fd, err);
        }
    }
}

} // namespace detail

//==============================================================================
// Process
//==============================================================================

class Process {
private:
    std::string program_;
    std::vector<std::string> args_;
    std::string work_dir_;
    std::map<std::string, std::string> env_;

    // 在 fork 之前构造 envp：继承当前环境并应用覆盖
    std::vector<std::string> build_env() const {
        std::vector<std::string> result;
        for (char **e = environ; e && *e; e++) {
            std::string entry = *e;
            size_t eq = entry.find('=');
            std::string key = (eq == std::string::npos) ? entry : entry.substr(0, eq);
            if (env_.count(key) == 0) {
                result.push_back(entry);
            }
        }
        for (const auto &kv : env_) {
            result.push_back(kv.first + "=" + kv.second);
        }
        return result;
    }

    /**
     * @brief 子进程：设置环境后 exec，失败时通过 status_fd 回报 errno
     *
     * fork 之后只调用 async-signal-safe 的函数。
     */
    [[noreturn]] static void child_exec(const char *program,
                                        char *const *argv,
                                        char *const *envp,
                                        const char *work_dir,
                                        int out_fd, int err_fd, int status_fd) {
        setpgid(0, 0);

        struct rlimit core_limit;
        core_limit.rlim_cur = 0;
        core_limit.rlim_max = 0;
        setrlimit(RLIMIT_CORE, &core_limit);

        // 恢复默认信号处理
        signal(SIGPIPE, SIG_DFL);
        signal(SIGINT, SIG_DFL);
        signal(SIGTERM, SIG_DFL);

        int null_fd = open("/dev/null", O_RDONLY);
        if (null_fd < 0 ||
            dup2(null_fd, STDIN_FILENO) < 0 ||
            dup2(out_fd, STDOUT_FILENO) < 0 ||
            dup2(err_fd, STDERR_FILENO) < 0) {
            int err = errno;
            ssize_t unused = write(status_fd, &err, sizeof(err));
            (void)unused;
            _exit(127);
        }

        if (work_dir && *work_dir && chdir(work_dir) < 0) {
            int err = errno;
            ssize_t unused = write(status_fd, &err, sizeof(err));
            (void)unused;
            _exit(127);
        }

        execve(program, argv, envp);

        int err = errno;
        ssize_t unused = write(status_fd, &err, sizeof(err));
        (void)unused;
        _exit(127);
    }

    static void kill_group(pid_t pid) {
        // 进程组可能已全部退出
        if (kill(-pid, SIGKILL) < 0 && errno != ESRCH) {
            PLOG_WARN << "kill(-" << pid << ") failed: " << strerror(errno);
        }
    }

public:
    explicit Process(const std::string &program) : program_(program) {}

    Process& arg(const std::string &a) { args_.push_back(a); return *this; }
    Process& args(const std::vector<std::string> &a) {
        args_.insert(args_.end(), a.begin(), a.end());
        return *this;
    }
    Process& work_dir(const std::string &dir) { work_dir_ = dir; return *this; }
    Process& env(const std::string &key, const std::string &value) {
        env_[key] = value;
        return *this;
    }

    const std::string& program() const { return program_; }

    /**
     * @brief 运行并等待子进程
     * @param timeout 墙钟时间上限
     * @return 捕获结果；只有宿主侧失败（管道、fork、exec）才返回错误
     */
    Result<ProcessOutcome> run(std::chrono::milliseconds timeout) const {
        // 1. 准备参数和环境（fork 之前分配内存）
        std::vector<std::string> env_strings = build_env();
        std::vector<char*> envp;
        for (auto &e : env_strings) {
            envp.push_back(const_cast<char*>(e.c_str()));
        }
        envp.push_back(nullptr);

        std::vector<char*> argv;
        argv.push_back(const_cast<char*>(program_.c_str()));
        for (const auto &a : args_) {
            argv.push_back(const_cast<char*>(a.c_str()));
        }
        argv.push_back(nullptr);

        // 2. 创建管道
        int out_pipe[2] = {-1, -1};
        int err_pipe[2] = {-1, -1};
        int status_pipe[2] = {-1, -1};
        if (pipe2(out_pipe, O_CLOEXEC) < 0 ||
            pipe2(err_pipe, O_CLOEXEC) < 0 ||
            pipe2(status_pipe, O_CLOEXEC) < 0) {
            int err = errno;
            for (int *p : {out_pipe, err_pipe, status_pipe}) {
                detail::close_fd(p[0]);
                detail::close_fd(p[1]);
            }
            return PLOT_ERROR(ErrorCode::PIPE_FAILED, std::string("pipe2 failed: ") + strerror(err));
        }

        // 3. Fork
        auto start_time = std::chrono::steady_clock::now();
        pid_t pid = fork();

        if (pid < 0) {
            int err = errno;
            for (int *p : {out_pipe, err_pipe, status_pipe}) {
                detail::close_fd(p[0]);
                detail::close_fd(p[1]);
            }
            return PLOT_ERROR(ErrorCode::FORK_FAILED, std::string("fork failed: ") + strerror(err));
        }

        if (pid == 0) {
            child_exec(program_.c_str(), argv.data(), envp.data(), work_dir_.c_str(),
                       out_pipe[1], err_pipe[1], status_pipe[1]);
        }

        // 父进程
        setpgid(pid, pid);
        detail::close_fd(out_pipe[1]);
        detail::close_fd(err_pipe[1]);
        detail::close_fd(status_pipe[1]);

        // 4. exec 成功时 status 管道随 CLOEXEC 关闭，读到 EOF
        int child_errno = 0;
        ssize_t n;
        do {
            n = read(status_pipe[0], &child_errno, sizeof(child_errno));
        } while (n < 0 && errno == EINTR);
        detail::close_fd(status_pipe[0]);

        if (n > 0) {
            int status;
            while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
            detail::close_fd(out_pipe[0]);
            detail::close_fd(err_pipe[0]);
            PLOG_ERROR << "exec " << program_ << " failed: " << strerror(child_errno);
            return PLOT_ERROR(ErrorCode::EXEC_FAILED,
                              "Cannot execute " + program_ + ": " + strerror(child_errno));
        }

        PLOG_DEBUG << "Spawned pid " << pid << ": " << program_;

        fcntl(out_pipe[0], F_SETFL, fcntl(out_pipe[0], F_GETFL) | O_NONBLOCK);
        fcntl(err_pipe[0], F_SETFL, fcntl(err_pipe[0], F_GETFL) | O_NONBLOCK);

        // 5. 等待子进程，同时读取输出
        ProcessOutcome outcome;
        int out_fd = out_pipe[0];
        int err_fd = err_pipe[0];
        auto deadline = start_time + timeout;
        int status = 0;
        bool exited = false;

        while (true) {
            pid_t ret = waitpid(pid, &status, WNOHANG);
            if (ret == pid) {
                exited = true;
                break;
            }
            if (ret < 0 && errno != EINTR) {
                int err = errno;
                kill_group(pid);
                detail::close_fd(out_fd);
                detail::close_fd(err_fd);
                return PLOT_ERROR(ErrorCode::SYSTEM_ERROR, std::string("waitpid failed: ") + strerror(err));
            }

            auto now = std::chrono::steady_clock::now();
            if (now >= deadline) {
                outcome.timed_out = true;
                PLOG_WARN << "pid " << pid << " exceeded " << timeout.count()
                          << " ms, killing process group";
                kill_group(pid);
                while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
                exited = true;
                break;
            }

            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
            int slice = static_cast<int>(std::min<long long>(remaining.count() + 1, 50));
            detail::pump(out_fd, err_fd, outcome.stdout_text, outcome.stderr_text, slice);
        }

        // 6. 清理进程组中残留的后代进程，再读完剩余输出
        kill_group(pid);
        auto drain_deadline = std::chrono::steady_clock::now() + std::chrono::seconds(1);
        while ((out_fd >= 0 || err_fd >= 0) &&
               std::chrono::steady_clock::now() < drain_deadline) {
            detail::pump(out_fd, err_fd, outcome.stdout_text, outcome.stderr_text, 20);
        }
        if (out_fd >= 0 || err_fd >= 0) {
            PLOG_WARN << "Output pipes of pid " << pid << " still open, abandoning";
        }
        detail::close_fd(out_fd);
        detail::close_fd(err_fd);

        auto end_time = std::chrono::steady_clock::now();
        outcome.real_time_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            end_time - start_time).count();

        // 7. 分析结果
        if (outcome.timed_out) {
            outcome.status = RunStatus::TIME_LIMIT;
            if (WIFSIGNALED(status)) {
                outcome.signal = WTERMSIG(status);
            }
        } else if (exited && WIFEXITED(status)) {
            outcome.exit_code = WEXITSTATUS(status);
            outcome.status = (outcome.exit_code == 0) ? RunStatus::OK : RunStatus::RUNTIME_ERROR;
        } else if (exited && WIFSIGNALED(status)) {
            outcome.signal = WTERMSIG(status);
            outcome.status = RunStatus::KILLED_BY_SIGNAL;
        } else {
            outcome.status = RunStatus::INTERNAL_ERROR;
        }

        PLOG_DEBUG << "pid " << pid << " finished: status=" << outcome.status
                   << " exit_code=" << outcome.exit_code
                   << " signal=" << outcome.signal
                   << " time=" << outcome.real_time_ms << "ms"
                   << " stdout=" << outcome.stdout_text.size() << "B"
                   << " stderr=" << outcome.stderr_text.size() << "B";
        return Ok(std::move(outcome));
    }
};

} // namespace sandbox
} // namespace plot

#endif // PLOT_SANDBOX_PROCESS_H
