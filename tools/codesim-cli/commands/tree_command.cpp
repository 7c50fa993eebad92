#include "tree_command.hpp"

namespace codesim::cli {

void TreeCommand::setup(CLI::App& app) {
    app.add_option("dir", dir_, "Repository root")
        ->required()
        ->type_name("<dir>");
}

int TreeCommand::execute(CommandContext& /* ctx */) {
    FileCollector collector;
    const fs::path root(dir_);

    auto tree = collector.build_tree(root);
    if (!tree.ok()) {
        return report_error(tree.error());
    }

    auto files = collector.collect(root);
    if (!files.ok()) {
        return report_error(files.error());
    }

    std::string root_name = root.filename().string();
    if (root_name.empty()) {
        root_name = root.parent_path().filename().string();
    }

    std::cout << "=== Structure ===\n";
    std::cout << FileCollector::render_tree(tree.value(), root_name);

    std::cout << "\n=== Code Files ===\n";
    if (files.value().empty()) {
        std::cout << "(No code files found)\n";
    }
    for (const auto& path : files.value()) {
        std::cout << " - " << path << "\n";
    }

    return CODESIM_EXIT_SUCCESS;
}

}  // namespace codesim::cli
