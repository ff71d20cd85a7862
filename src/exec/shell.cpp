/*
 * Shell execution - AutoFix
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <autofix/exec/shell.hpp>
#include <autofix/config/settings.hpp>
#include <autofix/util/log.hpp>
#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

namespace autofix {

std::string shell_path() {
    const char* s = std::getenv("AUTOFIX_SHELL");
    return (s && *s) ? std::string(s) : std::string("/bin/sh");
}

static int decode_status(int st) {
    if (WIFEXITED(st)) return WEXITSTATUS(st);
    if (WIFSIGNALED(st)) return 128 + WTERMSIG(st);
    return 1;
}

static void exec_child(const std::string& shell, const std::string& script,
                       const std::map<std::string, std::string>& env) {
    std::signal(SIGINT, SIG_DFL);
    for (auto &[k, v] : env) setenv(k.c_str(), v.c_str(), 1);
    execl(shell.c_str(), "sh", "-c", script.c_str(), static_cast<char*>(nullptr));
    perror("execl");
    _exit(127);
}

RunResult run_shell(const std::string& script, const std::map<std::string, std::string>& env) {
    RunResult r;
    auto shell = shell_path();
    log::debug("running: " + script);
    pid_t pid = fork();
    if (pid < 0) { r.exit_code = 1; r.error = std::string("fork: ") + std::strerror(errno); return r; }
    if (pid == 0) exec_child(shell, script, env);
    int st = 0; while (waitpid(pid, &st, 0) < 0 && errno == EINTR) {}
    r.exit_code = decode_status(st);
    return r;
}

CaptureResult capture_output(const std::string& script, std::chrono::milliseconds timeout,
                             const std::map<std::string, std::string>& env) {
    CaptureResult r;
    int out_p[2], err_p[2];
    if (pipe(out_p) != 0) { r.exit_code = 1; r.error = std::string("pipe: ") + std::strerror(errno); return r; }
    if (pipe(err_p) != 0) {
        close(out_p[0]); close(out_p[1]);
        r.exit_code = 1; r.error = std::string("pipe: ") + std::strerror(errno); return r;
    }
    auto shell = shell_path();
    pid_t pid = fork();
    if (pid < 0) {
        close(out_p[0]); close(out_p[1]); close(err_p[0]); close(err_p[1]);
        r.exit_code = 1; r.error = std::string("fork: ") + std::strerror(errno); return r;
    }
    if (pid == 0) {
        setpgid(0, 0);
        int devnull = open("/dev/null", O_RDONLY);
        if (devnull >= 0) { dup2(devnull, STDIN_FILENO); close(devnull); }
        dup2(out_p[1], STDOUT_FILENO); dup2(err_p[1], STDERR_FILENO);
        close(out_p[0]); close(out_p[1]); close(err_p[0]); close(err_p[1]);
        exec_child(shell, script, env);
    }
    setpgid(pid, pid);
    close(out_p[1]); close(err_p[1]);

    std::string out, err;
    pollfd fds[2] = {{out_p[0], POLLIN, 0}, {err_p[0], POLLIN, 0}};
    int open_fds = 2;
    auto deadline = std::chrono::steady_clock::now() + timeout;
    char buf[4096];
    while (open_fds > 0) {
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
        if (left.count() <= 0) { r.timed_out = true; break; }
        int n = poll(fds, 2, static_cast<int>(left.count()));
        if (n < 0) { if (errno == EINTR) continue; r.error = std::string("poll: ") + std::strerror(errno); break; }
        if (n == 0) { r.timed_out = true; break; }
        for (int i = 0; i < 2; ++i) {
            if (fds[i].fd < 0 || !(fds[i].revents & (POLLIN | POLLHUP | POLLERR))) continue;
            ssize_t got = read(fds[i].fd, buf, sizeof(buf));
            if (got < 0 && errno == EINTR) continue;
            if (got <= 0) { close(fds[i].fd); fds[i].fd = -1; --open_fds; continue; }
            (i == 0 ? out : err).append(buf, static_cast<std::size_t>(got));
        }
    }
    if (r.timed_out || !r.error.empty()) {
        log::debug("killing command after timeout: " + script);
        kill(-pid, SIGKILL);
    }
    for (auto &p : fds) if (p.fd >= 0) close(p.fd);
    int st = 0; while (waitpid(pid, &st, 0) < 0 && errno == EINTR) {}
    r.exit_code = decode_status(st);
    r.output = err;
    if (!err.empty() && !out.empty() && err.back() != '\n') r.output += '\n';
    r.output += out;
    return r;
}

CaptureResult capture_output(const std::string& script, const Settings& settings) {
    auto secs = std::chrono::seconds(settings.get_wait_time(script));
    return capture_output(script, std::chrono::duration_cast<std::chrono::milliseconds>(secs), settings.env);
}

} // namespace autofix
