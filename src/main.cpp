#include "vigil/ai/model_builder.h"
#include "vigil/ai/model_cache.h"
#include "vigil/ai/model_store.h"
#include "vigil/ai/trend_source.h"
#include "vigil/config.h"
#include "vigil/errors.h"
#include "vigil/stream/alert_emitter.h"
#include "vigil/stream/stream_engine.h"
#include <fstream>
#include <iostream>
#include <memory>
#include <string>

namespace {

void print_usage(const char* program) {
    std::cerr << "Usage: " << program
              << " [--config <file>] [--input <file>] [--alerts <file>]\n"
              << "  Reads newline-delimited JSON readings (stdin by default) and\n"
              << "  writes one JSON alert per line (stdout by default).\n";
}

} // anonymous namespace

int main(int argc, char** argv) {
    std::string config_path;
    std::string input_path;
    std::string alerts_path;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto next = [&](const char* flag) -> std::string {
            if (i + 1 >= argc) {
                throw vigil::ConfigError(std::string(flag) + " expects a value");
            }
            return argv[++i];
        };

        try {
            if (arg == "--config") config_path = next("--config");
            else if (arg == "--input") input_path = next("--input");
            else if (arg == "--alerts") alerts_path = next("--alerts");
            else if (arg == "--help" || arg == "-h") {
                print_usage(argv[0]);
                return 0;
            } else {
                std::cerr << "Unknown argument: " << arg << "\n";
                print_usage(argv[0]);
                return 1;
            }
        } catch (const vigil::ConfigError& e) {
            std::cerr << e.what() << "\n";
            return 1;
        }
    }

    vigil::EngineConfig config;
    std::shared_ptr<vigil::ai::ModelCache> cache;
    std::shared_ptr<vigil::stream::IAlertTransport> transport;
    std::ofstream alerts_file;
    std::ifstream input_file;

    // Startup: any failure here is fatal
    try {
        if (!config_path.empty()) {
            config = vigil::EngineConfig::load_file(config_path);
        }
        config.apply_environment();
        config.validate();

        auto store = std::make_shared<vigil::ai::FileModelStore>(config.store.directory,
                                                                 config.store.compression_level);
        auto trends = std::make_shared<vigil::ai::FileTrendSource>(config.trend.directory, config.feed);
        auto builder = std::make_shared<vigil::ai::TrendModelBuilder>(config.window, config.builder);
        cache = std::make_shared<vigil::ai::ModelCache>(config.cache, store, builder, trends);

        if (!alerts_path.empty()) {
            alerts_file.open(alerts_path, std::ios::app);
            if (!alerts_file.is_open()) {
                throw vigil::ConfigError("cannot open alert output " + alerts_path);
            }
            transport = std::make_shared<vigil::stream::StreamAlertTransport>(alerts_file);
        } else {
            transport = std::make_shared<vigil::stream::StreamAlertTransport>(std::cout);
        }

        if (!input_path.empty()) {
            input_file.open(input_path);
            if (!input_file.is_open()) {
                throw vigil::ConfigError("cannot open input " + input_path);
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        return 1;
    }

    if (config.debug) {
        std::cout << "[vigil] Configuration: " << config.to_json().dump(2) << std::endl;
    }

    vigil::stream::StreamEngine engine(config, cache, transport);
    engine.start();

    std::istream& input = input_path.empty() ? std::cin : input_file;
    std::string line;
    while (std::getline(input, line)) {
        if (line.find_first_not_of(" \t\r") == std::string::npos) {
            continue;
        }
        engine.submit_raw(line);
    }

    engine.stop();
    cache->shutdown();

    std::cout << "[vigil] Engine: " << engine.stats().to_json().dump() << std::endl;
    std::cout << "[vigil] Cache: " << cache->stats().to_json().dump() << std::endl;
    return 0;
}
