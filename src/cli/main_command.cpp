#include "main_command.hpp"
#include "disk_analyzer/common/config.hpp"
#include "disk_analyzer/common/logger.hpp"
#include <unistd.h>

namespace disk_analyzer {
namespace cli {

MainCommand::MainCommand() = default;
MainCommand::~MainCommand() = default;

void MainCommand::validateArguments() const {}

bool MainCommand::isInteractiveOutput() const {
    return isatty(STDOUT_FILENO) && isatty(STDERR_FILENO);
}

void MainCommand::enableDebugLogging() const {
    common::Config::instance().global().log_level = common::LogLevel::DEBUG;
    common::Logger::instance().setLevel(common::LogLevel::DEBUG);
    common::Logger::instance().debug("[CLI] Debug logging enabled");
}

}}
