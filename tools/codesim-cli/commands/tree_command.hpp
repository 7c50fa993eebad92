#pragma once

#include "command.hpp"
#include "exit_codes.hpp"

namespace codesim::cli {

/**
 * Print the structure and code files of a directory.
 */
class TreeCommand : public Command {
public:
    void setup(CLI::App& app) override;
    int execute(CommandContext& ctx) override;

    std::string name() const override { return "tree"; }
    std::string description() const override {
        return "Show repository structure and code files";
    }

private:
    std::string dir_;
};

}  // namespace codesim::cli
