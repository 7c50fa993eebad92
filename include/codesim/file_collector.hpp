#pragma once

#include <codesim/result.hpp>
#include <codesim/types.hpp>

#include <nlohmann/json.hpp>

#include <filesystem>
#include <set>
#include <string>
#include <vector>

namespace codesim {

struct CollectorConfig {
    // Lowercase, with leading dot
    std::set<std::string> extensions = {
        ".py", ".java", ".c", ".cpp", ".js", ".ts",
        ".cs", ".go", ".rb", ".php", ".jsx", ".tsx"
    };

    // Directory names skipped at any depth
    std::set<std::string> ignore_dirs = {
        ".git", "__pycache__", "node_modules", ".metadata",
        ".idea", ".vscode", "target", "build"
    };

    Result<void> validate() const;
};

/**
 * FileCollector - enumerates the source files of one collection.
 *
 * Paths come back relative to the root, '/' separated and sorted, so two
 * walks of the same tree always produce the same list.
 */
class FileCollector {
public:
    explicit FileCollector(CollectorConfig config = {});

    /**
     * List code files under root.
     *
     * @param root Collection root directory
     * @return Sorted relative paths, or NOT_FOUND if root is not a directory
     */
    Result<std::vector<std::string>> collect(const fs::path& root) const;

    /**
     * Nested directory structure: directories map to objects, files to null.
     * Ignored directories are left out; all files are listed.
     */
    Result<nlohmann::json> build_tree(const fs::path& root) const;

    /**
     * ASCII rendering of a tree from build_tree().
     * Directories come before files, names compared case-insensitively.
     */
    static std::string render_tree(const nlohmann::json& tree, const std::string& root_name);

    // Pair relative paths with their location under root
    static std::vector<SourceLocation> locate(const fs::path& root,
                                              const std::vector<std::string>& paths,
                                              Collection collection);

    bool accepts(const fs::path& file) const;
    bool is_ignored_dir(const std::string& name) const;

    const CollectorConfig& config() const { return config_; }

private:
    void build_subtree(const fs::path& dir, nlohmann::json& node) const;

    CollectorConfig config_;
};

/**
 * Read a whole file.
 * Returns LIMIT_EXCEEDED if it is larger than max_bytes (0 = no limit).
 */
Result<std::string> read_source_file(const fs::path& path, size_t max_bytes = 0);

}  // namespace codesim
