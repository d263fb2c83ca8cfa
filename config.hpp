#pragma once

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdlib>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>

#include "directory.hpp"

namespace Gateway {
    // Looks up one environment variable; nullptr when unset.
    using Environment = std::function<const char*(const char*)>;

    struct Config {
        std::string host = "127.0.0.1";
        int port = 8030;
        // tenant -> daemon address
        std::map<std::string, std::string> daemons;
        std::optional<std::string> defaultDaemon;
        std::chrono::seconds cacheTtl{0};
        std::chrono::seconds connectTimeout{10};
        std::chrono::seconds readTimeout{300};
        bool verbose = false;

        // DOCKGATE_CONFIG names an optional JSON file; the other variables override it.
        static Config load(const Environment& env = std::getenv);

        void applyJson(const nlohmann::json& json);
        void applyFile(const std::string& path);
        void applyEnvironment(const Environment& env);

        // Parses every daemon address; throws on the first invalid one.
        std::shared_ptr<Directory> makeDirectory() const;
    };
}
