#include "compare_command.hpp"
#include <iomanip>

namespace codesim::cli {

void CompareCommand::setup(CLI::App& app) {
    app.add_option("repoA", repo_a_, "First repository")
        ->required()
        ->type_name("<dir>");

    app.add_option("repoB", repo_b_, "Second repository")
        ->required()
        ->type_name("<dir>");

    k_opt_ = app.add_option("-k,--shingle-size", k_, "Tokens per shingle (default: 5)")
        ->type_name("<num>");

    app.add_option("-o,--output", output_, "Report path (default: codesim_report.json)")
        ->type_name("<file>");

    threads_opt_ = app.add_option("-j,--threads", threads_, "Worker threads (default: all cores)")
        ->type_name("<num>");

    app.add_option("--config", config_path_, "JSON configuration file")
        ->type_name("<file>");

    max_file_bytes_opt_ = app.add_option("--max-file-bytes", max_file_bytes_,
                                         "Skip files larger than this")
        ->type_name("<bytes>");

    max_tokens_opt_ = app.add_option("--max-tokens", max_tokens_,
                                     "Truncate token streams past this count")
        ->type_name("<num>");

    preview_opt_ = app.add_option("--preview", preview_,
                                  "Tokens shown per file in the report")
        ->type_name("<num>");

    app.add_option("--top", top_, "Top pairs printed (default: 5)")
        ->type_name("<num>");

    app.add_flag("-v,--verbose", verbose_, "Log per-file progress");
}

void CompareCommand::apply_overrides(ComparisonConfig& config) const {
    if (k_opt_->count() > 0) config.shingle_size = k_;
    if (threads_opt_->count() > 0) config.threads = threads_;
    if (max_file_bytes_opt_->count() > 0) config.max_file_bytes = max_file_bytes_;
    if (max_tokens_opt_->count() > 0) config.max_tokens_per_file = max_tokens_;
    if (preview_opt_->count() > 0) config.token_preview_limit = preview_;
}

int CompareCommand::execute(CommandContext& ctx) {
    ComparisonConfig config;
    CollectorConfig collector_config;

    if (!config_path_.empty()) {
        auto loaded = load_config_file(config_path_, config, collector_config);
        if (!loaded.ok()) {
            return report_error(loaded.error());
        }
    }
    apply_overrides(config);
    config.verbose = ctx.verbose || verbose_;
    if (config.verbose) {
        ctx.logger->set_min_level(LogLevel::DEBUG);
    }

    auto collector_valid = collector_config.validate();
    if (!collector_valid.ok()) {
        return report_error(collector_valid.error());
    }
    FileCollector collector(collector_config);

    const fs::path root_a(repo_a_);
    const fs::path root_b(repo_b_);

    auto files_a = collector.collect(root_a);
    if (!files_a.ok()) {
        return report_error(files_a.error());
    }
    auto files_b = collector.collect(root_b);
    if (!files_b.ok()) {
        return report_error(files_b.error());
    }

    ctx.logger->info("Found " + std::to_string(files_a.value().size()) + " code files in " +
                     repo_a_ + " and " + std::to_string(files_b.value().size()) + " in " +
                     repo_b_);

    Comparator comparator(config, ctx.logger);
    auto result = comparator.compare_locations(
        FileCollector::locate(root_a, files_a.value(), Collection::A),
        FileCollector::locate(root_b, files_b.value(), Collection::B));
    if (!result.ok()) {
        return report_error(result.error());
    }

    ReportContext report_ctx;
    report_ctx.repo1_root = repo_a_;
    report_ctx.repo2_root = repo_b_;
    report_ctx.repo1_code_files = files_a.value();
    report_ctx.repo2_code_files = files_b.value();

    auto tree_a = collector.build_tree(root_a);
    auto tree_b = collector.build_tree(root_b);
    if (tree_a.ok() && tree_b.ok()) {
        report_ctx.has_trees = true;
        report_ctx.repo1_tree = std::move(tree_a).value();
        report_ctx.repo2_tree = std::move(tree_b).value();
    }

    ReportWriter writer(config);
    auto written = ReportWriter::write(writer.to_json(result.value(), report_ctx), output_);
    if (!written.ok()) {
        return report_error(written.error());
    }

    print_summary(result.value());
    std::cout << "\nSaved: " << output_ << "\n";
    return CODESIM_EXIT_SUCCESS;
}

void CompareCommand::print_summary(const ComparisonResult& result) const {
    const auto& report = result.similarity;

    std::cout << "Compared " << result.files_a.size() << " x " << result.files_b.size()
              << " files (k=" << result.shingle_size << ")\n";

    if (!result.warnings.empty()) {
        std::cout << result.warnings.size() << " file(s) skipped or truncated, see report\n";
    }

    auto top = report.top_pairs(top_);
    if (!top.empty()) {
        std::cout << "\nTop matches:\n";
        for (const auto& pair : top) {
            std::cout << "  " << truncate(pair.file_a, 40) << " <-> "
                      << truncate(pair.file_b, 40) << " = "
                      << std::fixed << std::setprecision(4) << pair.jaccard
                      << " (fpA=" << pair.fingerprints_a
                      << ", fpB=" << pair.fingerprints_b << ")\n";
        }
    }

    std::cout << "\nOverall repo similarity = ";
    if (report.aggregate.defined) {
        std::cout << std::fixed << std::setprecision(2)
                  << report.aggregate.score * 100.0 << "%\n";
    } else {
        std::cout << "undefined (a repository has no code files)\n";
    }
}

}  // namespace codesim::cli
