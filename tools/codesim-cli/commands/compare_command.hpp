#pragma once

#include "command.hpp"
#include "exit_codes.hpp"

#include <vector>

namespace codesim::cli {

/**
 * Compare two source trees and write the JSON report.
 */
class CompareCommand : public Command {
public:
    void setup(CLI::App& app) override;
    int execute(CommandContext& ctx) override;

    std::string name() const override { return "compare"; }
    std::string description() const override {
        return "Compare two repositories";
    }

private:
    std::string repo_a_;
    std::string repo_b_;
    std::string output_ = "codesim_report.json";
    std::string config_path_;
    size_t top_ = 5;
    bool verbose_ = false;

    // Overrides, applied only when given on the command line
    int k_ = DEFAULT_SHINGLE_SIZE;
    size_t threads_ = 0;
    size_t max_file_bytes_ = 0;
    size_t max_tokens_ = 0;
    size_t preview_ = 0;

    CLI::Option* k_opt_ = nullptr;
    CLI::Option* threads_opt_ = nullptr;
    CLI::Option* max_file_bytes_opt_ = nullptr;
    CLI::Option* max_tokens_opt_ = nullptr;
    CLI::Option* preview_opt_ = nullptr;

    void apply_overrides(ComparisonConfig& config) const;
    void print_summary(const ComparisonResult& result) const;
};

}  // namespace codesim::cli
