#include "livemap/config.hpp"

#include <cctype>
#include <cstdlib>
#include <stdexcept>

namespace livemap {

namespace {

size_t parse_wrap_bound(const std::string &text) {
    if (text.empty()) {
        throw std::invalid_argument("LIVEMAP_WRAP must not be empty");
    }
    for (unsigned char c : text) {
        if (!std::isdigit(c)) {
            throw std::invalid_argument("LIVEMAP_WRAP must be a non-negative integer, got '" +
                                        text + "'");
        }
    }
    try {
        return static_cast<size_t>(std::stoull(text));
    } catch (const std::out_of_range &) {
        throw std::invalid_argument("LIVEMAP_WRAP out of range: '" + text + "'");
    }
}

// RFC 3986 unreserved characters pass through, everything else is %XX.
std::string percent_encode(const std::string &text) {
    static constexpr char kHex[] = "0123456789ABCDEF";
    std::string out;
    out.reserve(text.size());
    for (unsigned char c : text) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            out.push_back(static_cast<char>(c));
        } else {
            out.push_back('%');
            out.push_back(kHex[c >> 4]);
            out.push_back(kHex[c & 0x0F]);
        }
    }
    return out;
}

} // namespace

std::string Config::feed_url() const { return endpoint + "?key=" + percent_encode(api_key); }

Config load_config(const EnvLookup &env) {
    Config config;

    if (auto key = env("API_KEY")) {
        config.api_key = *key;
    }
    if (auto path = env("LIVEMAP_LOG"); path && !path->empty()) {
        config.log_path = *path;
    }
    if (auto wrap = env("LIVEMAP_WRAP")) {
        config.wrap_bound = parse_wrap_bound(*wrap);
    }

    config.session.url = config.feed_url();
    return config;
}

Config load_config_from_environment() {
    return load_config([](const std::string &name) -> std::optional<std::string> {
        const char *value = std::getenv(name.c_str());
        if (value == nullptr) {
            return std::nullopt;
        }
        return std::string(value);
    });
}

void apply_arguments(Config &config, int argc, char *argv[]) {
    if (argc > 1 && argv[1] != nullptr && argv[1][0] != '\0') {
        config.log_path = argv[1];
    }
}

} // namespace livemap
