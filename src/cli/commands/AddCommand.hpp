#pragma once

#include "cli/ICommand.hpp"

namespace gitv {

class AddCommand : public ICommand {
public:
    Expected<void> execute(const AppContext& ctx, const std::vector<std::string>& args) override;
    const char* name() const override { return "add"; }
    const char* description() const override { return "Add a new folder to scan for Git repositories"; }
    const char* helpNameLine() const override { return "add -  Register the repositories found below a folder"; }
    const char* helpSynopsis() const override { return "gitv add <folder>"; }
    const char* helpDescription() const override {
        return "Recursively scan <folder> for Git repositories and add them to the registry used by 'gitv stats'. "
               "node_modules and vendor directories are skipped, as are names matching GITV_IGNORE.";
    }
    std::vector<std::pair<std::string, std::string>> helpOptions() const override {
        return { {"<folder>", "The folder path to scan for repositories."} };
    }
};

}
