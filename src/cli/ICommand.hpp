#pragma once

#include <iostream>
#include <string>
#include <vector>

#include "util/Config.hpp"
#include "util/Expected.hpp"

namespace gitv {

struct AppContext {
    AppConfig config;
    std::ostream* out{nullptr};  // command output; nullptr means std::cout

    std::ostream& output() const { return out ? *out : std::cout; }
};

class ICommand {
public:
    virtual ~ICommand() = default;
    virtual Expected<void> execute(const AppContext& ctx, const std::vector<std::string>& args) = 0;
    virtual const char* name() const = 0;
    virtual const char* description() const = 0;
    // Detailed help getters
    virtual const char* helpNameLine() const = 0;      // "<cmd> - <one line>"
    virtual const char* helpSynopsis() const = 0;      // usage synopsis
    virtual const char* helpDescription() const = 0;   // long description
    virtual std::vector<std::pair<std::string, std::string>> helpOptions() const = 0; // flag -> description
};

}
