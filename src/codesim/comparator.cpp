#include <codesim/comparator.hpp>
#include <codesim/file_collector.hpp>
#include <codesim/util/thread_pool.hpp>

#include <algorithm>
#include <exception>
#include <memory>

namespace codesim {

namespace {

bool by_path(const analysis::FileAnalysis& lhs, const analysis::FileAnalysis& rhs) {
    return lhs.path < rhs.path;
}

std::vector<similarity::FileFingerprints> scoring_input(
        const std::vector<analysis::FileAnalysis>& files) {
    std::vector<similarity::FileFingerprints> input;
    input.reserve(files.size());
    for (const auto& file : files) {
        similarity::FileFingerprints entry;
        entry.path = file.path;
        entry.fingerprints = &file.fingerprints;
        entry.normalized_token_count = file.normalized_token_count;
        input.push_back(std::move(entry));
    }
    return input;
}

}  // namespace

Comparator::Comparator(ComparisonConfig config, Logger* logger)
    : config_(std::move(config))
    , logger_(logger ? logger : &null_logger()) {}

Result<ComparisonResult> Comparator::compare(const std::vector<SourceFile>& a,
                                             const std::vector<SourceFile>& b) {
    // The argument position decides the side, whatever SourceFile::collection says
    auto make_jobs = [](const std::vector<SourceFile>& files, Collection collection) {
        std::vector<Job> jobs;
        jobs.reserve(files.size());
        for (const auto& file : files) {
            Job job;
            job.path = file.path;
            job.collection = collection;
            const std::string* text = &file.text;
            job.load = [text]() -> Result<std::string> { return *text; };
            jobs.push_back(std::move(job));
        }
        return jobs;
    };

    return run(make_jobs(a, Collection::A), make_jobs(b, Collection::B));
}

Result<ComparisonResult> Comparator::compare_locations(const std::vector<SourceLocation>& a,
                                                       const std::vector<SourceLocation>& b) {
    const size_t max_bytes = config_.max_file_bytes;
    auto make_jobs = [max_bytes](const std::vector<SourceLocation>& locations,
                                 Collection collection) {
        std::vector<Job> jobs;
        jobs.reserve(locations.size());
        for (const auto& loc : locations) {
            Job job;
            job.path = loc.path;
            job.collection = collection;
            fs::path full_path = loc.full_path;
            job.load = [full_path, max_bytes]() {
                return read_source_file(full_path, max_bytes);
            };
            jobs.push_back(std::move(job));
        }
        return jobs;
    };

    return run(make_jobs(a, Collection::A), make_jobs(b, Collection::B));
}

Result<ComparisonResult> Comparator::run(std::vector<Job> jobs_a, std::vector<Job> jobs_b) {
    auto analyzer = analysis::FileAnalyzer::create(config_);
    if (!analyzer.ok()) {
        return analyzer.error();
    }

    // Cap is checked on input counts so an oversized run fails before any work
    if (config_.max_pairwise_comparisons > 0 && !jobs_a.empty() &&
        jobs_b.size() > config_.max_pairwise_comparisons / jobs_a.size()) {
        return Error(ErrorCode::LIMIT_EXCEEDED,
                     std::to_string(jobs_a.size()) + " x " + std::to_string(jobs_b.size()) +
                     " comparisons exceed the limit of " +
                     std::to_string(config_.max_pairwise_comparisons));
    }

    ComparisonResult result;
    result.shingle_size = config_.shingle_size;
    result.threads = config_.resolved_threads();

    logger_->debug("Comparing " + std::to_string(jobs_a.size()) + " files against " +
                   std::to_string(jobs_b.size()) + " with k=" +
                   std::to_string(config_.shingle_size) + " on " +
                   std::to_string(result.threads) + " threads");

    // Jobs [0, count_a) belong to A, the rest to B
    const size_t count_a = jobs_a.size();
    std::vector<Job> jobs;
    jobs.reserve(jobs_a.size() + jobs_b.size());
    for (auto& job : jobs_a) jobs.push_back(std::move(job));
    for (auto& job : jobs_b) jobs.push_back(std::move(job));

    std::unique_ptr<ThreadPool> pool;
    try {
        pool = std::make_unique<ThreadPool>(result.threads);
    } catch (const std::exception& e) {
        return Error(ErrorCode::INTERNAL_ERROR,
                     "Cannot start " + std::to_string(result.threads) + " worker threads: " +
                     e.what());
    }

    std::vector<JobOutcome> outcomes(jobs.size());
    const analysis::FileAnalyzer& shared_analyzer = analyzer.value();

    try {
        pool->parallel_for(jobs.size(), [&](size_t i) {
            outcomes[i] = process(shared_analyzer, jobs[i]);
        });
    } catch (const std::exception& e) {
        return Error(ErrorCode::INTERNAL_ERROR, std::string("File analysis failed: ") + e.what());
    }

    for (size_t i = 0; i < outcomes.size(); ++i) {
        auto& outcome = outcomes[i];
        for (auto& diag : outcome.diagnostics) {
            logger_->warning(std::string(collection_label(diag.collection)) + ":" +
                             diag.path + ": " + diag.message);
            result.warnings.push_back(std::move(diag));
        }
        if (!outcome.analyzed) {
            continue;
        }
        if (i < count_a) {
            result.files_a.push_back(std::move(outcome.analysis));
        } else {
            result.files_b.push_back(std::move(outcome.analysis));
        }
    }

    std::sort(result.files_a.begin(), result.files_a.end(), by_path);
    std::sort(result.files_b.begin(), result.files_b.end(), by_path);

    similarity::SimilarityEngine engine(pool.get());
    result.similarity = engine.compare(scoring_input(result.files_a),
                                       scoring_input(result.files_b));

    if (!result.similarity.aggregate.defined) {
        logger_->warning("Collection " +
                         std::string(result.files_a.empty() ? "A" : "B") +
                         " has no analyzable files; overall similarity is undefined");
    } else {
        logger_->debug("Scored " + std::to_string(result.similarity.pairs.size()) +
                       " pairs, overall " + std::to_string(result.similarity.aggregate.score));
    }

    return result;
}

Comparator::JobOutcome Comparator::process(const analysis::FileAnalyzer& analyzer,
                                           const Job& job) const {
    JobOutcome outcome;

    auto text = job.load();
    if (!text.ok()) {
        const auto& err = text.error();
        const char* what = err.code() == ErrorCode::LIMIT_EXCEEDED
            ? "skipped, too large: "
            : "skipped, unreadable: ";
        outcome.diagnostics.push_back({job.collection, job.path, what + err.message()});
        return outcome;
    }

    SourceFile file;
    file.path = job.path;
    file.collection = job.collection;
    file.text = std::move(text).value();

    auto analysis = analyzer.analyze(file);
    if (!analysis.ok()) {
        outcome.diagnostics.push_back(
            {job.collection, job.path, "skipped: " + analysis.error().message()});
        return outcome;
    }

    outcome.analysis = std::move(analysis).value();
    outcome.analyzed = true;

    if (outcome.analysis.truncated) {
        outcome.diagnostics.push_back(
            {job.collection, job.path,
             "token stream truncated at " + std::to_string(config_.max_tokens_per_file) +
             " tokens"});
    }

    if (config_.verbose) {
        logger_->debug(std::string(collection_label(job.collection)) + ":" + job.path +
                       " [" + outcome.analysis.language + "] " +
                       std::to_string(outcome.analysis.raw_token_count) + " tokens, " +
                       std::to_string(outcome.analysis.fingerprints.size()) + " fingerprints");
    }

    return outcome;
}

}  // namespace codesim
