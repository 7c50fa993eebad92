#include <codesim/types.hpp>
#include <codesim/util/thread_pool.hpp>

namespace codesim {

Result<void> ComparisonConfig::validate() const {
    if (shingle_size < 1) {
        return Error(ErrorCode::INVALID_CONFIG,
                     "Shingle size must be >= 1, got " + std::to_string(shingle_size));
    }
    if (keywords.empty()) {
        return Error(ErrorCode::INVALID_CONFIG, "Reserved keyword set is empty");
    }
    if (max_file_bytes == 0) {
        return Error(ErrorCode::INVALID_CONFIG, "max_file_bytes must be > 0");
    }
    if (threads > MAX_THREADS) {
        return Error(ErrorCode::INVALID_CONFIG,
                     "threads must be <= " + std::to_string(MAX_THREADS) + ", got " +
                     std::to_string(threads));
    }
    return Ok();
}

size_t ComparisonConfig::resolved_threads() const {
    if (threads > 0) {
        return threads;
    }
    return ThreadPool::default_thread_count();
}

}  // namespace codesim
