#include "execute/process.hpp"
#include <fcntl.h>
#include <fmt/core.h>
#include <glog/logging.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>
#include <boost/algorithm/string/join.hpp>
#include <cstring>
#include <system_error>
#include "common/exceptions.hpp"
#include "common/utils.hpp"

namespace grader {
using namespace std;
using namespace std::chrono;

static const struct timespec killdelay = {0, 100000000L};  // 0.1s

static void make_pipe(int fds[2]) {
    if (pipe2(fds, O_CLOEXEC) != 0)
        throw system_error(errno, system_category(), "creating pipe");
}

static void set_nonblock(int fd) {
    int flags = fcntl(fd, F_GETFL);
    if (flags == -1 || fcntl(fd, F_SETFL, flags | O_NONBLOCK) == -1)
        throw system_error(errno, system_category(), "fcntl, setting flags");
}

static void close_fd(int &fd) {
    if (fd >= 0) close(fd);
    fd = -1;
}

/**
 * @brief 先尝试 SIGTERM，再强制 SIGKILL 整个进程组
 */
static void terminate_group(pid_t pid) {
    LOG(INFO) << "sending SIGTERM";
    if (kill(-pid, SIGTERM) != 0 && errno != ESRCH)
        PLOG(WARNING) << "sending SIGTERM to command";

    nanosleep(&killdelay, nullptr);

    LOG(INFO) << "sending SIGKILL";
    if (kill(-pid, SIGKILL) != 0 && errno != ESRCH)
        PLOG(WARNING) << "sending SIGKILL to command";
}

/**
 * @brief 读取管道中当前可读的数据
 * @return 管道是否已经关闭
 */
static bool drain(int fd, string &buffer) {
    char buf[65536];
    while (true) {
        ssize_t n = read(fd, buf, sizeof(buf));
        if (n > 0) {
            buffer.append(buf, n);
        } else if (n == 0) {
            return true;
        } else if (errno == EINTR) {
            continue;
        } else if (errno == EAGAIN || errno == EWOULDBLOCK) {
            return false;
        } else {
            throw system_error(errno, system_category(), "reading child output");
        }
    }
}

process_result run_process(const vector<string> &command, const process_options &options) {
    if (command.empty())
        throw internal_error("Unable to run an empty command");

    // 子进程提前退出时写标准输入会收到 SIGPIPE
    signal(SIGPIPE, SIG_IGN);

    vector<char *> argv;
    for (auto &arg : command)
        argv.push_back(const_cast<char *>(arg.c_str()));
    argv.push_back(nullptr);

    int in_pipe[2], out_pipe[2], err_pipe[2], exec_pipe[2];
    make_pipe(in_pipe);
    make_pipe(out_pipe);
    make_pipe(err_pipe);
    make_pipe(exec_pipe);

    elapsed_time timer;
    pid_t pid = fork();
    switch (pid) {
        case -1:  // fork 失败
            throw system_error(errno, system_category(), "fork");
        case 0: {  // 子进程
            setpgid(0, 0);
            signal(SIGPIPE, SIG_DFL);
            // dup2 得到的文件描述符没有 O_CLOEXEC，其余管道在 exec 时自动关闭
            dup2(in_pipe[0], STDIN_FILENO);
            dup2(out_pipe[1], STDOUT_FILENO);
            dup2(err_pipe[1], STDERR_FILENO);
            if (options.working_dir.empty() || chdir(options.working_dir.c_str()) == 0) {
                for (auto &[key, value] : options.environment)
                    setenv(key.c_str(), value.c_str(), 1);
                execvp(argv[0], argv.data());
            }
            // exec 失败，通过 exec_pipe 告知父进程 errno
            int error_code = errno;
            if (write(exec_pipe[1], &error_code, sizeof(error_code)) < 0) _exit(127);
            _exit(127);
        }
        default:
            break;
    }

    // 父进程
    setpgid(pid, pid);
    close(in_pipe[0]);
    close(out_pipe[1]);
    close(err_pipe[1]);
    close(exec_pipe[1]);

    int error_code = 0;
    ssize_t n;
    do {
        n = read(exec_pipe[0], &error_code, sizeof(error_code));
    } while (n == -1 && errno == EINTR);
    close(exec_pipe[0]);

    if (n == sizeof(error_code)) {
        close(in_pipe[1]);
        close(out_pipe[0]);
        close(err_pipe[0]);
        waitpid(pid, nullptr, 0);
        throw spawn_error(fmt::format("Unable to start {}: {}", command[0], strerror(error_code)), error_code);
    }

    int in_fd = in_pipe[1], out_fd = out_pipe[0], err_fd = err_pipe[0];
    string input = options.input.value_or("");
    size_t written = 0;
    if (input.empty()) close_fd(in_fd);
    else set_nonblock(in_fd);
    set_nonblock(out_fd);
    set_nonblock(err_fd);

    process_result result;
    bool limited = options.time_limit.count() > 0;
    auto deadline = steady_clock::now() + options.time_limit;

    while (out_fd >= 0 || err_fd >= 0) {
        int timeout = -1;
        if (limited) {
            auto remaining = duration_cast<milliseconds>(deadline - steady_clock::now());
            if (remaining.count() <= 0) {
                LOG(WARNING) << "timelimit exceeded (hard wall time): aborting command";
                result.timed_out = true;
                break;
            }
            timeout = (int)remaining.count() + 1;
        }

        struct pollfd fds[3];
        int nfds = 0;
        if (in_fd >= 0) fds[nfds++] = {in_fd, POLLOUT, 0};
        if (out_fd >= 0) fds[nfds++] = {out_fd, POLLIN, 0};
        if (err_fd >= 0) fds[nfds++] = {err_fd, POLLIN, 0};

        int r = poll(fds, nfds, timeout);
        if (r == -1) {
            if (errno == EINTR) continue;
            throw system_error(errno, system_category(), "waiting for child data");
        }

        for (int i = 0; i < nfds; ++i) {
            if (!fds[i].revents) continue;
            if (fds[i].fd == in_fd) {
                ssize_t w = write(in_fd, input.data() + written, input.size() - written);
                if (w > 0) written += w;
                if ((w < 0 && errno != EAGAIN && errno != EINTR) || written == input.size())
                    close_fd(in_fd);
            } else if (fds[i].fd == out_fd) {
                if (drain(out_fd, result.out)) close_fd(out_fd);
            } else if (fds[i].fd == err_fd) {
                if (drain(err_fd, result.err)) close_fd(err_fd);
            }
        }
    }

    int status = 0;
    if (!result.timed_out && limited) {
        // 输出流已经关闭，但进程可能仍在运行
        pid_t w;
        while ((w = waitpid(pid, &status, WNOHANG)) == 0) {
            if (steady_clock::now() >= deadline) {
                LOG(WARNING) << "timelimit exceeded (hard wall time): aborting command";
                result.timed_out = true;
                break;
            }
            struct timespec interval = {0, 5000000L};
            nanosleep(&interval, nullptr);
        }
        if (w == -1 && errno != EINTR)
            throw system_error(errno, system_category(), "waiting on child");
        if (w == pid) pid = -1;
    }

    if (result.timed_out)
        terminate_group(pid);

    if (out_fd >= 0) drain(out_fd, result.out);
    if (err_fd >= 0) drain(err_fd, result.err);
    close_fd(in_fd);
    close_fd(out_fd);
    close_fd(err_fd);

    if (pid > 0) {
        while (waitpid(pid, &status, 0) == -1) {
            if (errno != EINTR)
                throw system_error(errno, system_category(), "waiting on child");
        }
    }

    result.wall_time = timer.duration<milliseconds>();
    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.signal = WTERMSIG(status);
        result.exit_code = result.signal + 128;
        if (!result.timed_out)
            LOG(WARNING) << "Command terminated with signal (" << result.signal << ", " << strsignal(result.signal) << ")";
    }

    LOG(INFO) << "Command " << boost::algorithm::join(command, " ") << " exited with code "
              << result.exit_code << " in " << result.wall_time.count() << "ms";
    return result;
}

execution_outcome classify(const process_result &result) {
    if (result.timed_out)
        return {outcome_status::TIMED_OUT, fmt::format("Time limit exceeded after {}ms", result.wall_time.count())};

    if (result.exit_code != 0) {
        if (!result.err.empty())
            return {outcome_status::ERROR, result.err};
        if (!result.out.empty())
            return {outcome_status::ERROR, result.out};
        if (result.signal != 0)
            return {outcome_status::ERROR, fmt::format("Terminated by signal {} ({})", result.signal, strsignal(result.signal))};
        throw execution_error(fmt::format("Program exited with code {} without any diagnostic output", result.exit_code));
    }

    return {outcome_status::CHECKED, trim_line_separators(result.out)};
}

program_driver::program_driver(vector<string> run_command, process_options options,
                               optional<vector<string>> compile_command)
    : run_command(move(run_command)), compile_command(move(compile_command)), options(move(options)) {}

optional<execution_outcome> program_driver::compile() {
    if (compiled) return compile_failure;
    compiled = true;
    if (!compile_command) return nullopt;

    process_options compile_options = options;
    compile_options.input.reset();
    execution_outcome outcome = classify(run_process(*compile_command, compile_options));
    if (!outcome.checked()) {
        LOG(WARNING) << "Compilation failed: " << outcome;
        compile_failure = outcome;
    }
    return compile_failure;
}

execution_outcome program_driver::run(const string &input) {
    if (auto failure = compile())
        return *failure;

    process_options run_options = options;
    run_options.input = input;
    return classify(run_process(run_command, run_options));
}

vector<execution_outcome> program_driver::run_all(const vector<string> &inputs) {
    vector<execution_outcome> outcomes;
    for (auto &input : inputs)
        outcomes.push_back(run(input));
    return outcomes;
}

}  // namespace grader
