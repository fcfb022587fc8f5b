// gitv entry point: command pattern over an explicitly owned factory.

#include <algorithm>
#include <iostream>
#include <string>
#include <vector>

#include "cli/CommandFactory.hpp"
#include "cli/CommandInvoker.hpp"
#include "cli/ICommand.hpp"
#include "util/Config.hpp"
#include "util/Logger.hpp"

using namespace gitv;

int main(int argc, char** argv) {
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) args.emplace_back(argv[i]);

    auto verbose = std::find(args.begin(), args.end(), "--verbose");
    if (verbose != args.end()) {
        Logger::instance().setLevel(LogLevel::Debug);
        args.erase(verbose);
    }

    auto cfg = loadConfig();
    if (!cfg) {
        Logger::instance().error(cfg.error().message);
        return 1;
    }

    auto factory = CommandFactory::withBuiltins();
    AppContext ctx{cfg.value(), &std::cout};
    CommandInvoker invoker;

    if (args.empty() || args.front() == "-h" || args.front() == "--help") {
        auto cmd = factory->create("help");
        return invoker.invoke(*cmd, ctx, {}) ? 0 : 1;
    }
    std::string cmdName = args.front();
    args.erase(args.begin());
    auto cmd = factory->create(cmdName);
    if (!cmd) {
        std::cerr << "Unknown command: " << cmdName << "\n";
        auto help = factory->create("help");
        if (!invoker.invoke(*help, ctx, {})) {
            Logger::instance().debug("help failed after unknown command");
        }
        return 1;
    }
    auto res = invoker.invoke(*cmd, ctx, args);
    return res ? 0 : 1;
}
