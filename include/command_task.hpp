#ifndef COMMAND_TASK_HPP
#define COMMAND_TASK_HPP
#include <filesystem>
#include <stop_token>
#include <string>
#include <vector>

#include "supervisor.hpp"

/**
 * @brief External command supervised by watchrun.
 */
struct CommandSpec {
    std::vector<std::string> argv;
    /// Run the joined command line through `/bin/sh -c`.
    bool use_shell = false;
    /// Working directory of the child; the current directory when empty.
    std::filesystem::path working_dir;
};

/** @brief Join the command arguments with spaces for display. */
std::string command_line(const CommandSpec& spec);

/**
 * @brief Run @p spec to completion.
 *
 * The child is placed in its own process group unless stdin is a terminal, in
 * which case it shares ours so it can still read from the terminal. A stop
 * request on @p st sends `SIGTERM` followed by `SIGCONT`, so a child stopped by
 * job control is terminated as well.
 *
 * @return Exit code of the child, `128 + signal` when it was killed and `127`
 *         when the program could not be executed.
 * @throws std::invalid_argument if @p spec has no arguments.
 * @throws std::runtime_error if the child cannot be spawned or waited for.
 */
int run_command(const CommandSpec& spec, std::stop_token st);

/**
 * @brief Task factory running the same command on every start.
 *
 * A non-zero exit status surfaces as a task failure, except when the command
 * was terminated because its task was cancelled.
 */
class CommandTaskFactory : public TaskFactory {
  public:
    explicit CommandTaskFactory(CommandSpec spec);

    Task build() override;

    const CommandSpec& spec() const { return spec_; }

  private:
    CommandSpec spec_;
};

#endif // COMMAND_TASK_HPP
