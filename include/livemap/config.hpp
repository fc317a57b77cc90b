#pragma once

#include "livemap/protocol/session.hpp"

#include <chrono>
#include <cstddef>
#include <functional>
#include <optional>
#include <string>

namespace livemap {

/// Runtime settings for the scraper and the viewer.
struct Config {
    std::string api_key;
    std::string endpoint = "wss://api.geops.io/realtime-ws/v1/";
    std::string log_path = "s-bahn-munich-live-map.jsonl";
    protocol::SessionOptions session;
    std::chrono::milliseconds frame_delay{20};

    /// Replay wrap bound; 0 derives it from the longest vehicle timeline.
    size_t wrap_bound = 0;

    /// Endpoint with the API key embedded as a percent-encoded query value.
    [[nodiscard]] std::string feed_url() const;
};

using EnvLookup = std::function<std::optional<std::string>(const std::string &name)>;

/// Defaults overlaid with API_KEY, LIVEMAP_LOG and LIVEMAP_WRAP.
/// Throws std::invalid_argument for a malformed LIVEMAP_WRAP.
Config load_config(const EnvLookup &env);

/// load_config() against the process environment.
Config load_config_from_environment();

/// An optional positional argument overrides the log path.
void apply_arguments(Config &config, int argc, char *argv[]);

} // namespace livemap
