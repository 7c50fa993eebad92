#include <codesim/config_file.hpp>

#include <cstdint>
#include <fstream>
#include <limits>
#include <set>
#include <string>
#include <type_traits>
#include <vector>

namespace codesim {

using json = nlohmann::json;

namespace {

const std::set<std::string>& known_keys() {
    static const std::set<std::string> keys = {
        "k", "threads", "max_file_bytes", "max_tokens_per_file",
        "max_pairwise_comparisons", "token_preview_limit",
        "fingerprint_preview_limit", "extensions", "ignore_dirs",
        "extra_keywords"
    };
    return keys;
}

// nlohmann converts -1 to SIZE_MAX and 2.9 to 2, so numbers are checked first
template <typename T>
Result<void> read_if_present(const json& doc, const char* key, T& target) {
    if (!doc.contains(key)) {
        return Ok();
    }
    const json& value = doc.at(key);

    if constexpr (std::is_unsigned_v<T>) {
        if (!value.is_number_unsigned()) {
            return Error(ErrorCode::INVALID_CONFIG,
                         std::string(key) + " must be a non-negative integer, got " + value.dump());
        }
    } else if constexpr (std::is_integral_v<T>) {
        if (!value.is_number_integer()) {
            return Error(ErrorCode::INVALID_CONFIG,
                         std::string(key) + " must be an integer, got " + value.dump());
        }
        const auto wide = value.get<int64_t>();
        if (wide < std::numeric_limits<T>::min() || wide > std::numeric_limits<T>::max()) {
            return Error(ErrorCode::INVALID_CONFIG,
                         std::string(key) + " is out of range: " + value.dump());
        }
    }

    target = value.get<T>();
    return Ok();
}

}  // namespace

Result<void> apply_config(const json& doc,
                          ComparisonConfig& comparison,
                          CollectorConfig& collector) {
    if (!doc.is_object()) {
        return Error(ErrorCode::INVALID_CONFIG, "Configuration must be a JSON object");
    }

    for (auto it = doc.begin(); it != doc.end(); ++it) {
        if (known_keys().count(it.key()) == 0) {
            return Error(ErrorCode::INVALID_CONFIG, "Unknown configuration key: " + it.key());
        }
    }

    try {
        const Result<void> reads[] = {
            read_if_present(doc, "k", comparison.shingle_size),
            read_if_present(doc, "threads", comparison.threads),
            read_if_present(doc, "max_file_bytes", comparison.max_file_bytes),
            read_if_present(doc, "max_tokens_per_file", comparison.max_tokens_per_file),
            read_if_present(doc, "max_pairwise_comparisons", comparison.max_pairwise_comparisons),
            read_if_present(doc, "token_preview_limit", comparison.token_preview_limit),
            read_if_present(doc, "fingerprint_preview_limit", comparison.fingerprint_preview_limit),
            read_if_present(doc, "extensions", collector.extensions),
            read_if_present(doc, "ignore_dirs", collector.ignore_dirs),
        };
        for (const auto& read : reads) {
            if (!read.ok()) {
                return read;
            }
        }

        if (doc.contains("extra_keywords")) {
            auto extra = doc.at("extra_keywords").get<std::vector<std::string>>();
            comparison.keywords = comparison.keywords.with(extra);
        }
    } catch (const json::exception& e) {
        return Error(ErrorCode::INVALID_CONFIG, std::string("Bad configuration value: ") + e.what());
    }

    return Ok();
}

Result<void> load_config_file(const fs::path& path,
                              ComparisonConfig& comparison,
                              CollectorConfig& collector) {
    std::ifstream file(path);
    if (!file) {
        return Error(ErrorCode::NOT_FOUND, "Configuration file not found: " + path.string());
    }

    json doc;
    try {
        doc = json::parse(file);
    } catch (const json::parse_error& e) {
        return Error(ErrorCode::INVALID_CONFIG,
                     "Cannot parse " + path.string() + ": " + e.what());
    }

    return apply_config(doc, comparison, collector);
}

}  // namespace codesim
