#include "livemap/config.hpp"
#include "livemap/data/diagnostic_log.hpp"
#include "livemap/data/raw_log.hpp"
#include "livemap/protocol/session.hpp"

#include <cstdio>
#include <exception>
#include <string>

int main(int argc, char *argv[]) {
    try {
        auto config = livemap::load_config_from_environment();
        livemap::apply_arguments(config, argc, argv);
        if (config.api_key.empty()) {
            std::fprintf(stderr, "[LiveMap] API_KEY is not set\n");
            return 1;
        }

        livemap::data::RawLogWriter writer(config.log_path);
        livemap::data::DiagnosticLog diagnostics;

        std::printf("[LiveMap] Endpoint: %s\n", config.endpoint.c_str());
        std::printf("[LiveMap] Appending frames to %s\n", config.log_path.c_str());

        livemap::protocol::FeedSession session(
            config.session, [&writer](const std::string &frame) { writer.append(frame); },
            diagnostics);
        session.run();
    } catch (const std::exception &e) {
        std::fprintf(stderr, "[LiveMap] Fatal: %s\n", e.what());
        return 1;
    }
    return 0;
}
