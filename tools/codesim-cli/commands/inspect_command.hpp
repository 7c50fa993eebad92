#pragma once

#include "command.hpp"
#include "exit_codes.hpp"

namespace codesim::cli {

/**
 * Show how a single file is tokenized, normalized and fingerprinted.
 */
class InspectCommand : public Command {
public:
    void setup(CLI::App& app) override;
    int execute(CommandContext& ctx) override;

    std::string name() const override { return "inspect"; }
    std::string description() const override {
        return "Show tokens and fingerprints of one file";
    }

private:
    std::string file_;
    int k_ = DEFAULT_SHINGLE_SIZE;
    size_t limit_ = 50;
};

}  // namespace codesim::cli
