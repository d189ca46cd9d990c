/**
 * @file watchrun.cpp
 * @brief CLI entry point supervising a command against filesystem changes.
 */

#include <iostream>

#include "cli_commands.hpp"
#include "help_text.hpp"
#include "logger.hpp"
#include "options.hpp"
#include "version.hpp"

/**
 * @brief Application entry point.
 *
 * @return int Zero after an interrupt or when printing help/version; 1 on
 *             invalid options or a fatal watch error.
 */
#ifndef WATCHRUN_NO_MAIN
int main(int argc, char* argv[]) {
    Options opts;
    try {
        opts = parse_options(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "error: " << e.what() << "\n";
        return 1;
    }
    if (opts.show_help) {
        print_help(argv[0]);
        return 0;
    }
    if (opts.print_version) {
        std::cout << WATCHRUN_VERSION << "\n";
        return 0;
    }
    cli::configure_logging(opts.logging);
    int rc = 0;
    try {
        rc = cli::handle_watch_run(opts);
    } catch (const std::exception& e) {
        log_error(e.what());
        rc = 1;
    }
    shutdown_logger();
    return rc;
}
#endif // WATCHRUN_NO_MAIN
