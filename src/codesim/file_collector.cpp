#include <codesim/file_collector.hpp>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>

namespace codesim {

namespace {

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return result;
}

void render_children(const nlohmann::json& tree, const std::string& prefix,
                     std::ostringstream& out) {
    struct Item {
        std::string name;
        const nlohmann::json* node;
    };

    std::vector<Item> items;
    for (auto it = tree.begin(); it != tree.end(); ++it) {
        items.push_back({it.key(), &it.value()});
    }

    // Directories first, then case-insensitive by name
    std::sort(items.begin(), items.end(), [](const Item& a, const Item& b) {
        const bool a_file = a.node->is_null();
        const bool b_file = b.node->is_null();
        if (a_file != b_file) return !a_file;
        const std::string la = to_lower(a.name);
        const std::string lb = to_lower(b.name);
        if (la != lb) return la < lb;
        return a.name < b.name;
    });

    for (size_t i = 0; i < items.size(); ++i) {
        const bool last = (i + 1 == items.size());
        out << prefix << (last ? "└── " : "├── ") << items[i].name << "\n";
        if (items[i].node->is_object()) {
            render_children(*items[i].node, prefix + (last ? "    " : "│   "), out);
        }
    }
}

}  // namespace

Result<void> CollectorConfig::validate() const {
    if (extensions.empty()) {
        return Error(ErrorCode::INVALID_CONFIG, "No source extensions configured");
    }
    for (const auto& ext : extensions) {
        if (ext.size() < 2 || ext[0] != '.') {
            return Error(ErrorCode::INVALID_CONFIG,
                         "Extension must start with '.': " + ext);
        }
    }
    return Ok();
}

FileCollector::FileCollector(CollectorConfig config) {
    // Extensions are matched case-insensitively
    config_.extensions.clear();
    for (const auto& ext : config.extensions) {
        config_.extensions.insert(to_lower(ext));
    }
    config_.ignore_dirs = std::move(config.ignore_dirs);
}

bool FileCollector::accepts(const fs::path& file) const {
    const std::string ext = to_lower(file.extension().string());
    return !ext.empty() && config_.extensions.count(ext) > 0;
}

bool FileCollector::is_ignored_dir(const std::string& name) const {
    return config_.ignore_dirs.count(name) > 0;
}

Result<std::vector<std::string>> FileCollector::collect(const fs::path& root) const {
    std::error_code ec;
    if (!fs::is_directory(root, ec)) {
        return Error(ErrorCode::NOT_FOUND, "Not a directory: " + root.string());
    }

    std::vector<std::string> files;
    fs::recursive_directory_iterator it(
        root, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        return Error(ErrorCode::IO_ERROR,
                     "Cannot read directory " + root.string() + ": " + ec.message());
    }

    for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
        if (ec) {
            return Error(ErrorCode::IO_ERROR,
                         "Directory walk failed under " + root.string() + ": " + ec.message());
        }

        const auto& entry = *it;
        std::error_code type_ec;
        if (entry.is_directory(type_ec)) {
            if (is_ignored_dir(entry.path().filename().string())) {
                it.disable_recursion_pending();
            }
            continue;
        }
        if (!entry.is_regular_file(type_ec) || !accepts(entry.path())) {
            continue;
        }

        files.push_back(entry.path().lexically_relative(root).generic_string());
    }

    std::sort(files.begin(), files.end());
    return files;
}

void FileCollector::build_subtree(const fs::path& dir, nlohmann::json& node) const {
    std::error_code ec;
    fs::directory_iterator it(dir, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        return;
    }

    for (; it != fs::directory_iterator(); it.increment(ec)) {
        if (ec) {
            break;
        }
        const auto& entry = *it;
        const std::string name = entry.path().filename().string();

        std::error_code type_ec;
        if (entry.is_directory(type_ec)) {
            if (is_ignored_dir(name)) {
                continue;
            }
            nlohmann::json child = nlohmann::json::object();
            build_subtree(entry.path(), child);
            node[name] = std::move(child);
        } else {
            node[name] = nullptr;
        }
    }
}

Result<nlohmann::json> FileCollector::build_tree(const fs::path& root) const {
    std::error_code ec;
    if (!fs::is_directory(root, ec)) {
        return Error(ErrorCode::NOT_FOUND, "Not a directory: " + root.string());
    }

    nlohmann::json tree = nlohmann::json::object();
    build_subtree(root, tree);
    return tree;
}

std::string FileCollector::render_tree(const nlohmann::json& tree, const std::string& root_name) {
    std::ostringstream out;
    out << root_name << "\n";
    if (tree.is_object()) {
        render_children(tree, "", out);
    }
    return out.str();
}

std::vector<SourceLocation> FileCollector::locate(const fs::path& root,
                                                  const std::vector<std::string>& paths,
                                                  Collection collection) {
    std::vector<SourceLocation> locations;
    locations.reserve(paths.size());
    for (const auto& rel : paths) {
        SourceLocation loc;
        loc.path = rel;
        loc.full_path = root / fs::path(rel);
        loc.collection = collection;
        locations.push_back(std::move(loc));
    }
    return locations;
}

Result<std::string> read_source_file(const fs::path& path, size_t max_bytes) {
    std::error_code ec;
    const auto size = fs::file_size(path, ec);
    if (ec) {
        return Error(ErrorCode::IO_ERROR,
                     "Cannot stat " + path.string() + ": " + ec.message());
    }
    if (max_bytes > 0 && size > max_bytes) {
        return Error(ErrorCode::LIMIT_EXCEEDED,
                     "File is " + std::to_string(size) + " bytes, limit is " +
                     std::to_string(max_bytes));
    }

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return Error(ErrorCode::IO_ERROR, "Cannot open " + path.string());
    }

    std::ostringstream ss;
    ss << file.rdbuf();
    if (file.bad()) {
        return Error(ErrorCode::IO_ERROR, "Read error: " + path.string());
    }
    return ss.str();
}

}  // namespace codesim
