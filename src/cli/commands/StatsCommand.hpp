#pragma once

#include "cli/ICommand.hpp"

namespace gitv {

class StatsCommand : public ICommand {
public:
    Expected<void> execute(const AppContext& ctx, const std::vector<std::string>& args) override;
    const char* name() const override { return "stats"; }
    const char* description() const override { return "Generate a contribution graph for the specified email"; }
    const char* helpNameLine() const override { return "stats -  Show a six-month contribution calendar"; }
    const char* helpSynopsis() const override { return "gitv stats <email>"; }
    const char* helpDescription() const override {
        return "Count the commits authored by <email> in every registered repository over the last 183 days "
               "and draw them as a weekly calendar, today highlighted.";
    }
    std::vector<std::pair<std::string, std::string>> helpOptions() const override {
        return { {"<email>", "The author email to analyze commits for (exact match)."} };
    }
};

}
