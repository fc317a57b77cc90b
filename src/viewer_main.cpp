#include "livemap/app.hpp"
#include "livemap/config.hpp"

#include <cstdio>
#include <exception>

int main(int argc, char *argv[]) {
    try {
        auto config = livemap::load_config_from_environment();
        livemap::apply_arguments(config, argc, argv);

        livemap::App app(config);
        return app.run(argc, argv);
    } catch (const std::exception &e) {
        std::fprintf(stderr, "[LiveMap] Fatal: %s\n", e.what());
        return 1;
    }
}
