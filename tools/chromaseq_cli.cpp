#include <api/request_handler.hpp>
#include <config/engine_config.hpp>
#include <utils/logger.hpp>
#include <iostream>
#include <string>

using namespace Chromaseq;

static void print_usage(const char* argv0) {
    std::cerr << "Usage: " << argv0 << " <tool> [json-params]\n";
    std::cerr << "       " << argv0 << " --serve\n";
    std::cerr << "\nTools:";
    for (const auto& tool : RequestHandler::available_tools()) std::cerr << " " << tool;
    std::cerr << "\n\nExamples:\n";
    std::cerr << "  " << argv0 << " generate '{\"method\": \"plastic\", \"seed\": 42, \"count\": 5}'\n";
    std::cerr << "  " << argv0 << " invert '{\"hex\": \"#851BE4\", \"method\": \"plastic\", \"seed\": 42}'\n";
    std::cerr << "  echo '{\"tool\": \"convert\", \"params\": {\"hex\": \"#D4832B\"}}' | " << argv0 << " --serve\n";
}

// One request per line in, one compact response per line out, until EOF.
static int serve(const RequestHandler& handler) {
    Logger::info("Serving JSON requests on stdin");

    std::size_t handled = 0;
    std::string line;
    while (std::getline(std::cin, line)) {
        if (line.find_first_not_of(" \t\r") == std::string::npos) continue;
        try {
            std::cout << handler.handle_line(line) << std::endl;
        } catch (const std::exception& e) {
            Logger::error(std::string("Request failed: ") + e.what());
            std::cout << error_response(ErrorKind::Internal, e.what())
                      .dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) << std::endl;
        }
        ++handled;
    }

    Logger::success("Input closed after " + std::to_string(handled) + " requests");
    return 0;
}

int main(int argc, char** argv) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    try {
        const EngineConfig config = EngineConfig::load_from_env();
        Logger::set_level(config.log_level);

        const RequestHandler handler(config);
        const std::string command = argv[1];

        if (command == "--serve") return serve(handler);
        if (command == "--help" || command == "-h") {
            print_usage(argv[0]);
            return 0;
        }

        nlohmann::json params = nlohmann::json::object();
        if (argc >= 3) params = nlohmann::json::parse(argv[2]);

        Logger::step("Running '" + command + "'");
        const nlohmann::json response = handler.handle(command, params);
        std::cout << response.dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << "\n";
        return response.contains("error") ? 1 : 0;
    } catch (const std::exception& e) {
        Logger::error(e.what());
        return 1;
    }
}
