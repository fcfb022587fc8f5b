#pragma once

#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include "cli/ICommand.hpp"

namespace gitv {

/// Name -> command creator table, owned by main (or a test)
class CommandFactory {
public:
    using Creator = std::function<std::unique_ptr<ICommand>()>;

    void registerCreator(const std::string& name, Creator creator);
    std::unique_ptr<ICommand> create(const std::string& name) const;
    void listCommands(std::vector<std::unique_ptr<ICommand>>& out) const;

    /// Factory with help, add and stats registered
    static std::unique_ptr<CommandFactory> withBuiltins();

private:
    std::unordered_map<std::string, Creator> creators;
};

}
