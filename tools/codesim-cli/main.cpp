#include "commands/command.hpp"
#include "commands/compare_command.hpp"
#include "commands/exit_codes.hpp"
#include "commands/inspect_command.hpp"
#include "commands/tree_command.hpp"

#include <exception>
#include <iostream>
#include <memory>
#include <vector>

int main(int argc, char* argv[]) {
    using namespace codesim::cli;

    CLI::App app{"codesim - rename-resistant source similarity between two repositories"};
    app.require_subcommand(1);

    std::vector<std::unique_ptr<Command>> commands;
    commands.push_back(std::make_unique<CompareCommand>());
    commands.push_back(std::make_unique<InspectCommand>());
    commands.push_back(std::make_unique<TreeCommand>());

    Command* selected = nullptr;
    for (auto& cmd : commands) {
        CLI::App* sub = app.add_subcommand(cmd->name(), cmd->description());
        cmd->setup(*sub);
        Command* raw = cmd.get();
        sub->callback([&selected, raw]() { selected = raw; });
    }

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        // --help and --version exit 0; real usage errors map to our code
        return app.exit(e) == 0 ? CODESIM_EXIT_SUCCESS : CODESIM_EXIT_USER_ERROR;
    }

    if (selected == nullptr) {
        std::cerr << app.help();
        return CODESIM_EXIT_USER_ERROR;
    }

    codesim::ConsoleLogger logger;
    CommandContext ctx;
    ctx.logger = &logger;

    try {
        return selected->execute(ctx);
    } catch (const std::exception& e) {
        std::cerr << "Error: internal: " << e.what() << "\n";
        return CODESIM_EXIT_INTERNAL;
    }
}
