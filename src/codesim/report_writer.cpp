#include <codesim/report_writer.hpp>
#include <codesim/util/sha1.hpp>

#include <cmath>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>

namespace codesim {

using json = nlohmann::json;

ReportWriter::ReportWriter(const ComparisonConfig& config)
    : fingerprint_preview_limit_(config.fingerprint_preview_limit) {}

double ReportWriter::round_to(double value, int decimals) {
    const double scale = std::pow(10.0, decimals);
    return std::round(value * scale) / scale;
}

std::string ReportWriter::utc_timestamp() {
    const std::time_t t = std::time(nullptr);
    std::tm tm{};
    gmtime_r(&t, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

json ReportWriter::file_details(const analysis::FileAnalysis& file) const {
    json details;
    details["repo"] = collection_label(file.collection);
    details["file"] = file.path;
    details["language"] = file.language;
    details["raw_token_count"] = file.raw_token_count;
    details["normalized_token_count"] = file.normalized_token_count;
    details["unique_identifiers"] = file.identifier_map.size();
    details["raw_tokens"] = file.raw_token_preview;
    details["normalized_tokens"] = file.canonical_preview;

    json id_map = json::object();
    for (const auto& [identifier, canonical] : file.identifier_map) {
        id_map[identifier] = canonical;
    }
    details["identifier_map"] = std::move(id_map);

    // std::set keeps digests in byte order, which is also hex order
    json fingerprints = json::array();
    size_t shown = 0;
    for (const auto& fp : file.fingerprints) {
        if (shown++ >= fingerprint_preview_limit_) break;
        fingerprints.push_back(Sha1Hasher::to_hex(fp));
    }
    details["fingerprints"] = std::move(fingerprints);
    details["fingerprint_count"] = file.fingerprints.size();
    details["truncated"] = file.truncated;

    return details;
}

json ReportWriter::to_json(const ComparisonResult& result, const ReportContext& context) const {
    const auto& report = result.similarity;
    json doc;

    doc["metadata"] = {
        {"timestamp", context.timestamp.empty() ? utc_timestamp() : context.timestamp},
        {"repo1_root", context.repo1_root},
        {"repo2_root", context.repo2_root},
        {"shingle_size_k", result.shingle_size},
        {"repo1_files", result.files_a.size()},
        {"repo2_files", result.files_b.size()},
        {"total_comparisons", report.pairs.size()},
        {"empty_set_similarity", similarity::EMPTY_SET_SIMILARITY},
        {"aggregate_defined", report.aggregate.defined},
        {"threads", result.threads}
    };

    if (context.has_trees) {
        doc["tree"] = {
            {"repo1_tree", context.repo1_tree},
            {"repo2_tree", context.repo2_tree},
            {"repo1_code_files", context.repo1_code_files},
            {"repo2_code_files", context.repo2_code_files}
        };
    }

    json details = json::object();
    for (const auto* files : {&result.files_a, &result.files_b}) {
        for (const auto& file : *files) {
            json entry = file_details(file);
            entry["k"] = result.shingle_size;
            details[std::string(collection_label(file.collection)) + ":" + file.path] =
                std::move(entry);
        }
    }
    doc["per_file_details"] = std::move(details);

    json pairs = json::array();
    for (const auto& pair : report.pairs) {
        pairs.push_back({
            {"fileA", pair.file_a},
            {"fileB", pair.file_b},
            {"jaccard_similarity", round_to(pair.jaccard, 4)},
            {"similarity_percent", round_to(pair.jaccard * 100.0, 2)},
            {"fileA_fingerprints", pair.fingerprints_a},
            {"fileB_fingerprints", pair.fingerprints_b},
            {"fileA_tokens", pair.tokens_a},
            {"fileB_tokens", pair.tokens_b}
        });
    }
    doc["pairwise_similarities"] = std::move(pairs);

    doc["overall_repo_similarity"] = round_to(report.aggregate.score, 4);
    doc["overall_repo_similarity_percent"] = round_to(report.aggregate.score * 100.0, 2);
    doc["directional_similarity"] = {
        {"a_to_b", round_to(report.aggregate.a_to_b, 4)},
        {"b_to_a", round_to(report.aggregate.b_to_a, 4)}
    };

    json warnings = json::array();
    for (const auto& diag : result.warnings) {
        warnings.push_back({
            {"repo", collection_label(diag.collection)},
            {"file", diag.path},
            {"message", diag.message}
        });
    }
    doc["warnings"] = std::move(warnings);

    return doc;
}

Result<void> ReportWriter::write(const json& document, const fs::path& output) {
    std::error_code ec;
    if (output.has_parent_path()) {
        fs::create_directories(output.parent_path(), ec);
        if (ec) {
            return Error(ErrorCode::IO_ERROR,
                         "Cannot create " + output.parent_path().string() + ": " + ec.message());
        }
    }

    fs::path tmp = output;
    tmp += ".tmp";

    {
        std::ofstream file(tmp, std::ios::binary | std::ios::trunc);
        if (!file) {
            return Error(ErrorCode::IO_ERROR, "Cannot open " + tmp.string() + " for writing");
        }
        // Paths are not guaranteed to be UTF-8
        file << document.dump(2, ' ', false, json::error_handler_t::replace) << "\n";
        if (!file.good()) {
            fs::remove(tmp, ec);
            return Error(ErrorCode::IO_ERROR, "Write failed: " + tmp.string());
        }
    }

    fs::rename(tmp, output, ec);
    if (ec) {
        std::error_code cleanup_ec;
        fs::remove(tmp, cleanup_ec);
        return Error(ErrorCode::IO_ERROR,
                     "Cannot move report into place at " + output.string() + ": " + ec.message());
    }
    return Ok();
}

}  // namespace codesim
