#include "inspect_command.hpp"
#include <codesim/analysis/file_analyzer.hpp>
#include <codesim/util/sha1.hpp>

namespace codesim::cli {

namespace {

void print_tokens(const char* title, const std::vector<std::string>& tokens, size_t total) {
    std::cout << title << " (" << total << "):\n  ";
    for (size_t i = 0; i < tokens.size(); ++i) {
        if (i > 0) std::cout << ' ';
        std::cout << tokens[i];
    }
    if (tokens.size() < total) {
        std::cout << " ...";
    }
    std::cout << "\n";
}

}  // namespace

void InspectCommand::setup(CLI::App& app) {
    app.add_option("file", file_, "Source file")
        ->required()
        ->type_name("<file>");

    app.add_option("-k,--shingle-size", k_, "Tokens per shingle (default: 5)")
        ->type_name("<num>");

    app.add_option("-l,--limit", limit_, "Tokens shown (default: 50)")
        ->type_name("<num>");
}

int InspectCommand::execute(CommandContext& ctx) {
    ComparisonConfig config;
    config.shingle_size = k_;
    config.token_preview_limit = limit_;

    auto analyzer = analysis::FileAnalyzer::create(config);
    if (!analyzer.ok()) {
        return report_error(analyzer.error());
    }

    const fs::path path(file_);
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        return report_error(Error(ErrorCode::NOT_FOUND, "File not found: " + file_));
    }

    auto text = read_source_file(path, config.max_file_bytes);
    if (!text.ok()) {
        return report_error(text.error());
    }

    SourceFile source;
    source.path = path.filename().generic_string();
    source.text = std::move(text).value();

    auto result = analyzer.value().analyze(source);
    if (!result.ok()) {
        return report_error(result.error());
    }
    const auto& analysis = result.value();

    if (ctx.verbose) {
        ctx.logger->debug("Analyzed " + file_ + " with k=" + std::to_string(k_));
    }

    std::cout << "File:     " << file_ << "\n";
    std::cout << "Language: " << analysis.language << "\n\n";

    print_tokens("Raw tokens", analysis.raw_token_preview, analysis.raw_token_count);
    print_tokens("Normalized tokens", analysis.canonical_preview, analysis.normalized_token_count);
    if (analysis.truncated) {
        std::cout << "(token stream truncated)\n";
    }

    std::cout << "\nIdentifiers (" << analysis.identifier_map.size() << "):\n";
    for (const auto& [identifier, canonical] : analysis.identifier_map) {
        std::cout << "  " << canonical << "  " << identifier << "\n";
    }

    std::cout << "\nFingerprints: " << analysis.fingerprints.size() << " (k=" << k_ << ")\n";
    size_t shown = 0;
    for (const auto& fp : analysis.fingerprints) {
        if (shown++ >= 5) break;
        std::cout << "  " << Sha1Hasher::to_hex(fp) << "\n";
    }

    return CODESIM_EXIT_SUCCESS;
}

}  // namespace codesim::cli
