#include "cli/CommandFactory.hpp"

#include <algorithm>

#include "cli/commands/AddCommand.hpp"
#include "cli/commands/HelpCommand.hpp"
#include "cli/commands/StatsCommand.hpp"

namespace gitv {

void CommandFactory::registerCreator(const std::string& name, Creator creator) {
    creators[name] = std::move(creator);
}

std::unique_ptr<ICommand> CommandFactory::create(const std::string& name) const {
    auto it = creators.find(name);
    if (it == creators.end()) return nullptr;
    return it->second();
}

void CommandFactory::listCommands(std::vector<std::unique_ptr<ICommand>>& out) const {
    out.clear();
    out.reserve(creators.size());
    for (const auto& kv : creators) {
        out.emplace_back(kv.second());
    }
    std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) {
        return std::string(a->name()) < std::string(b->name());
    });
}

std::unique_ptr<CommandFactory> CommandFactory::withBuiltins() {
    auto f = std::make_unique<CommandFactory>();
    const CommandFactory* self = f.get();
    f->registerCreator("help", [self] { return std::make_unique<HelpCommand>(*self); });
    f->registerCreator("add", [] { return std::make_unique<AddCommand>(); });
    f->registerCreator("stats", [] { return std::make_unique<StatsCommand>(); });
    return f;
}

}
