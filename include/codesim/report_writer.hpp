#pragma once

#include <codesim/comparator.hpp>
#include <codesim/result.hpp>
#include <codesim/types.hpp>

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace codesim {

/**
 * Run information that does not come out of the Comparator itself.
 */
struct ReportContext {
    std::string repo1_root;
    std::string repo2_root;

    // Directory trees, only present when the inputs were directories
    bool has_trees = false;
    nlohmann::json repo1_tree;
    nlohmann::json repo2_tree;
    std::vector<std::string> repo1_code_files;
    std::vector<std::string> repo2_code_files;

    // UTC ISO-8601; filled with the current time when empty
    std::string timestamp;
};

/**
 * ReportWriter - serializes a ComparisonResult into the JSON report.
 */
class ReportWriter {
public:
    explicit ReportWriter(const ComparisonConfig& config);

    /**
     * Build the report document.
     *
     * @param result Output of Comparator
     * @param context Roots, trees and timestamp of the run
     * @return JSON document
     */
    nlohmann::json to_json(const ComparisonResult& result, const ReportContext& context) const;

    /**
     * Write a document with 2-space indentation.
     * The file is written next to the target and renamed into place, so a
     * reader never sees a partial report.
     */
    static Result<void> write(const nlohmann::json& document, const fs::path& output);

    static double round_to(double value, int decimals);
    static std::string utc_timestamp();

private:
    nlohmann::json file_details(const analysis::FileAnalysis& file) const;

    size_t fingerprint_preview_limit_;
};

}  // namespace codesim
