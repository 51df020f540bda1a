/**
 * @file prism_cli.cpp
 * @brief Command-line dispatcher for the Prism operations
 *
 * Usage: prism_cli <config.yaml> <operation> [json-args]
 *        prism_cli <config.yaml> list
 *
 * Examples:
 *   prism_cli config/prism.yaml cascade '{"threshold":"soft","beta":30}'
 *   prism_cli config/prism.yaml bo_run '{"n_calls":20}'
 *   prism_cli config/prism.yaml health
 *
 * Results are printed to stdout as JSON. Logs go to stderr.
 */

#include <prism/prism.hpp>

#include <iostream>

using namespace prism;

namespace {

int Usage(const char *argv0) {
    std::cerr << "Prism " << Version() << "\n"
              << "Usage: " << argv0 << " <config.yaml> <operation> [json-args]\n"
              << "       " << argv0 << " <config.yaml> list\n";
    return 2;
}

nlohmann::json ParseArgs(const std::string &text) {
    try {
        return nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error &e) {
        throw InvalidArgumentError("args", std::string("not valid JSON: ") + e.what());
    }
}

} // namespace

int main(int argc, char *argv[]) {
    if (argc < 3) {
        return Usage(argv[0]);
    }
    const std::string config_path = argv[1];
    const std::string operation = argv[2];

    try {
        auto config = ConfigLoader::Load(config_path);
        ConfigureLogging(config.logging);

        Orchestrator orchestrator(std::move(config));

        if (operation == "list") {
            std::cout << orchestrator.registry().DescriptorsJSON().dump(2) << "\n";
            return 0;
        }

        nlohmann::json args = argc > 3 ? ParseArgs(argv[3]) : nlohmann::json::object();
        auto out = orchestrator.registry().Invoke(operation, args);
        std::cout << out.dump(2) << "\n";
        return 0;
    } catch (const Error &e) {
        LogError(e, "cli");
        nlohmann::json failure = {{"error", ErrorKindName(e.kind())}, {"message", e.what()}};
        std::cout << failure.dump(2) << "\n";
        return 1;
    } catch (const std::exception &e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
