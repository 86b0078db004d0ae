#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include "core/asr_engine.hpp"
#include "core/dictation_service.hpp"
#include "core/websocket_server.hpp"
#include "utils/config.hpp"
#include "utils/logging.hpp"
#include "validation/medical_lexicon.hpp"

using namespace meddictate;

namespace {

void printUsage(const char* program) {
    std::cout << "Usage: " << program << " [options]\n"
              << "Options:\n"
              << "  --config <path>     Server configuration (default: config/server.json)\n"
              << "  --port <port>       Set server port (default: 8080)\n"
              << "  --lexicon <path>    Medical lexicon JSON\n"
              << "  --log-level <lvl>   DEBUG, INFO, WARN or ERROR\n"
              << "  --help, -h          Show this help message\n";
}

} // namespace

int main(int argc, char* argv[]) {
    try {
        // Initialize logging
        utils::Logger::initialize();
        
        std::string configPath = "config/server.json";
        std::string portArg;
        std::string lexiconArg;
        std::string logLevelArg;
        
        // Parse command line arguments
        for (int i = 1; i < argc; i++) {
            std::string arg = argv[i];
            if (arg == "--config" && i + 1 < argc) {
                configPath = argv[++i];
            } else if (arg == "--port" && i + 1 < argc) {
                portArg = argv[++i];
            } else if (arg == "--lexicon" && i + 1 < argc) {
                lexiconArg = argv[++i];
            } else if (arg == "--log-level" && i + 1 < argc) {
                logLevelArg = argv[++i];
            } else if (arg == "--help" || arg == "-h") {
                printUsage(argv[0]);
                return 0;
            } else {
                std::cerr << "Unknown option: " << arg << "\n";
                printUsage(argv[0]);
                return 1;
            }
        }
        
        // Load configuration; command line overrides the file
        auto config = utils::Config::load(configPath);
        if (!portArg.empty()) {
            config.setPort(std::stoi(portArg));
        }
        if (!lexiconArg.empty()) {
            config.setLexiconPath(lexiconArg);
        }
        if (!logLevelArg.empty()) {
            config.setLogLevel(logLevelArg);
        }
        if (!utils::Logger::setLevel(config.getLogLevel())) {
            utils::Logger::warn("Unknown log level '" + config.getLogLevel() + "', keeping INFO");
        }
        
        std::signal(SIGPIPE, SIG_IGN);
        
        auto lexicon = std::make_shared<const validation::MedicalLexicon>(
            validation::MedicalLexicon::loadFromFile(config.getLexiconPath()));
        
        audio::DecoderCommand decoderCommand;
        decoderCommand.program = config.getDecoder().command;
        decoderCommand.args = config.getDecoder().args;
        
        std::shared_ptr<core::AsrEngine> asrEngine;
        if (!config.getAsr().command.empty()) {
            core::AsrCommand asrCommand;
            asrCommand.program = config.getAsr().command;
            asrCommand.args = config.getAsr().args;
            asrCommand.timeout = std::chrono::milliseconds(config.getAsr().timeoutMs);
            asrEngine = std::make_shared<core::CommandAsrEngine>(asrCommand);
        }
        
        core::WebSocketServer server(config.getPort());
        core::DictationService service(core::optionsFromConfig(config),
                                       audio::makeProcessDecoderFactory(decoderCommand),
                                       lexicon, asrEngine, server.makeEventSink());
        server.setDictationService(&service);
        
        utils::Logger::info("Starting meddictate on port " + std::to_string(config.getPort()) +
                            " with " + std::to_string(lexicon->getTermCount()) + " lexicon terms");
        
        if (!server.run()) {
            return 1;
        }
        
        utils::Logger::info("Shutting down...");
        service.endAllSessions();
        
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
    
    return 0;
}
