#pragma once

#include <codesim/codesim.hpp>
#include <codesim/util/logger.hpp>
#include "exit_codes.hpp"
#include <CLI/CLI.hpp>
#include <filesystem>
#include <iostream>
#include <string>

namespace codesim::cli {

/**
 * Context passed to command execution.
 * Contains shared resources like the logger.
 */
struct CommandContext {
    Logger* logger = nullptr;
    bool verbose = false;
};

/**
 * Base class for CLI commands.
 *
 * Each command implements:
 * - setup(): Configure CLI11 options and flags
 * - execute(): Perform the command action
 */
class Command {
public:
    virtual ~Command() = default;

    /**
     * Configure command options with CLI11.
     * Called during CLI initialization.
     *
     * @param app The CLI11 subcommand to configure
     */
    virtual void setup(CLI::App& app) = 0;

    /**
     * Execute the command.
     * Called after argument parsing succeeds.
     *
     * @param ctx Execution context with logger and settings
     * @return Exit code (0 = success)
     */
    virtual int execute(CommandContext& ctx) = 0;

    /**
     * Get the command name (e.g., "compare", "tree").
     */
    virtual std::string name() const = 0;

    /**
     * Get a brief description for help text.
     */
    virtual std::string description() const = 0;
};

// Helper functions used by multiple commands

/**
 * Print an error to stderr.
 * @return Exit code matching the error
 */
inline int report_error(const Error& error) {
    std::cerr << "Error: " << error.to_string() << "\n";
    return exit_code_for(error);
}

/**
 * Truncate a string for display, adding "..." if needed.
 *
 * @param s The string to truncate
 * @param max_len Maximum length (including "..." if truncated)
 * @return Truncated string
 */
inline std::string truncate(const std::string& s, size_t max_len) {
    if (max_len <= 3) return s.substr(0, max_len);
    if (s.length() <= max_len) return s;
    return s.substr(0, max_len - 3) + "...";
}

}  // namespace codesim::cli
