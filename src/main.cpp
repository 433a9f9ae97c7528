#include <CLI/CLI.hpp>
#include <iostream>
#include <memory>

#include "disk_analyzer/common/config.hpp"
#include "disk_analyzer/common/constants.hpp"
#include "disk_analyzer/common/logger.hpp"
#include "disk_analyzer/common/paths.hpp"
#include "disk_analyzer/core/error_codes.hpp"
#include "cli/analyze_command.hpp"

namespace {

void initialize_logging(const disk_analyzer::common::GlobalConfig& global) {
    auto options = disk_analyzer::common::LoggerOptions::fromConfig(
        global, disk_analyzer::common::PathManager::instance().getLogDir());
    disk_analyzer::common::Logger::instance().configure(options);
}

}

int main(int argc, char** argv) {
    namespace constants = disk_analyzer::constants;
    
    try {
        CLI::App app{std::string(constants::system::APPLICATION_NAME) + " - disk usage of a directory subtree",
                     constants::system::EXECUTABLE_NAME};
        app.set_version_flag("--version,-v", constants::version::getFullVersion());
        
        auto& config = disk_analyzer::common::Config::instance();
        auto config_path = config.findBestConfig();
        
        bool loaded = config_path ? config.load(*config_path) : config.load();
        if (!loaded) {
            throw disk_analyzer::core::ConfigError(
                disk_analyzer::core::AnalyzerErrorCode::CONFIG_PARSE_FAILED,
                "Failed to parse configuration file: " + config.getConfigPath());
        }
        
        initialize_logging(config.global());
        
        auto analyze_cmd = std::make_unique<disk_analyzer::cli::AnalyzeCommand>();
        analyze_cmd->setup(&app);
        
        try {
            app.parse(argc, argv);
        } catch (const CLI::ParseError& e) {
            int rc = app.exit(e);
            return rc == 0 ? constants::exit_codes::SUCCESS : constants::exit_codes::ARGUMENT_ERROR;
        }
        
        int rc = analyze_cmd->execute();
        disk_analyzer::common::Logger::instance().shutdown();
        return rc;
        
    } catch (const disk_analyzer::core::AnalyzerError& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        auto& logger = disk_analyzer::common::Logger::instance();
        logger.error("[Main] Aborted | code={}",
                     disk_analyzer::core::AnalyzerErrorCodeHelper::describe(e.code()));
        logger.shutdown();
        return e.exitCode();
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return constants::exit_codes::ARGUMENT_ERROR;
    }
}
