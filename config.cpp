#include "config.hpp"

#include <fstream>
#include <stdexcept>

namespace {
    std::string readFileToString(const std::string& filename) {
        std::ifstream file(filename, std::ios::binary | std::ios::ate);
        if (!file) {
            throw std::runtime_error("Cannot open file: " + filename);
        }

        std::streamsize size = file.tellg();
        file.seekg(0, std::ios::beg);

        std::string buffer(size, '\0');
        if (!file.read(&buffer[0], size)) {
            throw std::runtime_error("Error reading file: " + filename);
        }

        return buffer;
    }

    int64_t parseInteger(const std::string& name, const std::string& value) {
        try {
            size_t consumed = 0;
            int64_t result = std::stoll(value, &consumed);
            if (consumed != value.size()) throw std::invalid_argument(value);
            return result;
        } catch (const std::logic_error&) {
            throw std::runtime_error(name + " must be an integer, got '" + value + "'");
        }
    }

    std::chrono::seconds parseSeconds(const std::string& name, int64_t value) {
        if (value < 0) throw std::runtime_error(name + " must not be negative");
        return std::chrono::seconds(value);
    }

    bool parseFlag(const std::string& name, const std::string& value) {
        if (value == "1" || value == "true" || value == "yes") return true;
        if (value == "0" || value == "false" || value == "no" || value.empty()) return false;
        throw std::runtime_error(name + " must be a boolean, got '" + value + "'");
    }

    int parseListenPort(const std::string& name, int64_t value) {
        if (value <= 0 || value > 65535) throw std::runtime_error(name + " is out of range: " + std::to_string(value));
        return static_cast<int>(value);
    }
}

namespace Gateway {
    Config Config::load(const Environment& env) {
        Config config;
        if (const char* path = env("DOCKGATE_CONFIG"); path != nullptr && *path != '\0') {
            config.applyFile(path);
        }
        config.applyEnvironment(env);
        return config;
    }

    void Config::applyJson(const nlohmann::json& json) {
        if (!json.is_object()) throw std::runtime_error("Configuration must be a JSON object");
        try {
            if (json.contains("host")) host = json.at("host").get<std::string>();
            if (json.contains("port")) port = parseListenPort("port", json.at("port").get<int64_t>());
            if (json.contains("daemons")) daemons = json.at("daemons").get<std::map<std::string, std::string>>();
            if (json.contains("default")) defaultDaemon = json.at("default").get<std::string>();
            if (json.contains("cache_ttl_s")) cacheTtl = parseSeconds("cache_ttl_s", json.at("cache_ttl_s").get<int64_t>());
            if (json.contains("connect_timeout_s")) connectTimeout = parseSeconds("connect_timeout_s", json.at("connect_timeout_s").get<int64_t>());
            if (json.contains("read_timeout_s")) readTimeout = parseSeconds("read_timeout_s", json.at("read_timeout_s").get<int64_t>());
            if (json.contains("verbose")) verbose = json.at("verbose").get<bool>();
        } catch (const nlohmann::json::exception& e) {
            throw std::runtime_error(std::string("Invalid configuration: ") + e.what());
        }
    }

    void Config::applyFile(const std::string& path) {
        nlohmann::json json;
        try {
            json = nlohmann::json::parse(readFileToString(path));
        } catch (const nlohmann::json::parse_error& e) {
            throw std::runtime_error("Cannot parse " + path + ": " + e.what());
        }
        applyJson(json);
    }

    void Config::applyEnvironment(const Environment& env) {
        auto value = [&env](const char* name) -> std::optional<std::string> {
            const char* raw = env(name);
            if (raw == nullptr) return std::nullopt;
            return std::string(raw);
        };

        if (auto v = value("DOCKGATE_HOST")) host = *v;
        if (auto v = value("DOCKGATE_PORT")) port = parseListenPort("DOCKGATE_PORT", parseInteger("DOCKGATE_PORT", *v));
        if (auto v = value("DOCKGATE_DEFAULT_DAEMON")) defaultDaemon = *v;
        if (auto v = value("DOCKGATE_CACHE_TTL_S")) cacheTtl = parseSeconds("DOCKGATE_CACHE_TTL_S", parseInteger("DOCKGATE_CACHE_TTL_S", *v));
        if (auto v = value("DOCKGATE_CONNECT_TIMEOUT_S")) connectTimeout = parseSeconds("DOCKGATE_CONNECT_TIMEOUT_S", parseInteger("DOCKGATE_CONNECT_TIMEOUT_S", *v));
        if (auto v = value("DOCKGATE_READ_TIMEOUT_S")) readTimeout = parseSeconds("DOCKGATE_READ_TIMEOUT_S", parseInteger("DOCKGATE_READ_TIMEOUT_S", *v));
        if (auto v = value("DOCKGATE_VERBOSE")) verbose = parseFlag("DOCKGATE_VERBOSE", *v);
    }

    std::shared_ptr<Directory> Config::makeDirectory() const {
        std::map<std::string, Docker::DaemonEndpoint> endpoints;
        for (const auto& [tenant, address] : daemons) {
            endpoints.emplace(tenant, Docker::DaemonEndpoint::parse(address));
        }
        std::optional<Docker::DaemonEndpoint> fallback;
        if (defaultDaemon && !defaultDaemon->empty()) fallback = Docker::DaemonEndpoint::parse(*defaultDaemon);

        auto directory = std::make_shared<StaticDirectory>(std::move(endpoints), fallback);
        if (cacheTtl.count() == 0) return directory;
        return std::make_shared<CachingDirectory>(directory, cacheTtl);
    }
}
