#pragma once

#include <CLI/CLI.hpp>
#include <string>

namespace disk_analyzer {
namespace cli {

class MainCommand {
public:
    MainCommand();
    virtual ~MainCommand();
    
    virtual void setup(CLI::App* app) = 0;
    virtual int execute() = 0;
    
    virtual void validateArguments() const;

protected:
    CLI::App* app_ = nullptr;
    
    bool isInteractiveOutput() const;
    void enableDebugLogging() const;
};

}}
