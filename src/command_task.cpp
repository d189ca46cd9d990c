#include "command_task.hpp"

#include <cerrno>
#include <chrono>
#include <stdexcept>
#include <system_error>
#include <utility>

#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include "logger.hpp"
#include "time_utils.hpp"

std::string command_line(const CommandSpec& spec) {
    std::string out;
    for (const auto& arg : spec.argv) {
        if (!out.empty())
            out += ' ';
        out += arg;
    }
    return out;
}

int run_command(const CommandSpec& spec, std::stop_token st) {
    if (spec.argv.empty())
        throw std::invalid_argument("No command to run");
    std::vector<std::string> args;
    if (spec.use_shell)
        args = {"/bin/sh", "-c", command_line(spec)};
    else
        args = spec.argv;
    std::vector<char*> cargv;
    cargv.reserve(args.size() + 1);
    for (auto& a : args)
        cargv.push_back(a.data());
    cargv.push_back(nullptr);
    std::string workdir = spec.working_dir.string();

    // A job-control shell only lets the foreground group read the terminal, so
    // an interactive child stays in our group and is signalled by pid.
    bool own_group = isatty(STDIN_FILENO) == 0;
    pid_t pid = fork();
    if (pid < 0) {
        std::error_code ec(errno, std::system_category());
        throw std::runtime_error("fork failed: " + ec.message());
    }
    if (pid == 0) {
        if (own_group)
            setpgid(0, 0);
        if (!workdir.empty() && chdir(workdir.c_str()) != 0)
            _exit(126);
        execvp(cargv[0], cargv.data());
        _exit(127);
    }
    if (own_group)
        setpgid(pid, pid);
    pid_t target = own_group ? -pid : pid;
    auto terminate = [target]() {
        kill(target, SIGTERM);
        kill(target, SIGCONT);
    };
    std::stop_callback on_stop(st, terminate);
    int status = 0;
    for (;;) {
        if (waitpid(pid, &status, WUNTRACED) < 0) {
            if (errno == EINTR)
                continue;
            std::error_code ec(errno, std::system_category());
            throw std::runtime_error("waitpid failed: " + ec.message());
        }
        if (!WIFSTOPPED(status))
            break;
        // SIGTERM stays pending while the child is stopped.
        if (st.stop_requested())
            terminate();
    }
    if (WIFEXITED(status))
        return WEXITSTATUS(status);
    if (WIFSIGNALED(status))
        return 128 + WTERMSIG(status);
    return status;
}

CommandTaskFactory::CommandTaskFactory(CommandSpec spec) : spec_(std::move(spec)) {
    if (spec_.argv.empty())
        throw std::invalid_argument("No command to run");
}

Task CommandTaskFactory::build() {
    CommandSpec spec = spec_;
    return [spec](std::stop_token st) {
        log_info("Running " + command_line(spec));
        auto start = std::chrono::steady_clock::now();
        int rc = run_command(spec, st);
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start);
        if (st.stop_requested()) {
            log_debug("Command cancelled after " + format_duration_short(elapsed));
            return;
        }
        if (rc != 0)
            throw std::runtime_error("Command exited with code " + std::to_string(rc));
        log_debug("Command finished after " + format_duration_short(elapsed));
    };
}
