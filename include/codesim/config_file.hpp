#pragma once

#include <codesim/file_collector.hpp>
#include <codesim/result.hpp>
#include <codesim/types.hpp>

#include <nlohmann/json.hpp>

namespace codesim {

/**
 * Apply a JSON configuration object on top of existing settings.
 *
 * Recognized keys: k, threads, max_file_bytes, max_tokens_per_file,
 * max_pairwise_comparisons, token_preview_limit, fingerprint_preview_limit,
 * extensions, ignore_dirs, extra_keywords. Keys that are absent leave the
 * current value alone; unknown keys are rejected.
 *
 * @return INVALID_CONFIG on a wrong type or unknown key
 */
Result<void> apply_config(const nlohmann::json& doc,
                          ComparisonConfig& comparison,
                          CollectorConfig& collector);

/**
 * Read and apply a configuration file.
 *
 * @return NOT_FOUND if the file is missing, INVALID_CONFIG if it does not parse
 */
Result<void> load_config_file(const fs::path& path,
                              ComparisonConfig& comparison,
                              CollectorConfig& collector);

}  // namespace codesim
