#include "gateway.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <exception>
#include <iostream>
#include <limits>
#include <memory>
#include <optional>
#include <stdexcept>

#include "gatewayErrors.hpp"
#include "lib/errors.hpp"

using Docker::Method;
using Docker::RequestBuildError;

namespace {
    // Typed access to the query string, header and body of an inbound request.
    class Params {
        const httplib::Request& req_;

    public:
        explicit Params(const httplib::Request& req) : req_(req) {}

        std::string match(size_t index) const { return req_.matches[index].str(); }

        std::optional<std::string> text(const std::string& key) const {
            if (!req_.has_param(key)) return std::nullopt;
            return req_.get_param_value(key);
        }

        std::string required(const std::string& key) const {
            auto value = text(key);
            if (!value || value->empty()) throw RequestBuildError("Missing query parameter '" + key + "'");
            return *value;
        }

        std::vector<std::string> all(const std::string& key) const {
            std::vector<std::string> values;
            auto range = req_.params.equal_range(key);
            for (auto it = range.first; it != range.second; ++it) values.push_back(it->second);
            return values;
        }

        std::optional<bool> flag(const std::string& key) const {
            auto value = text(key);
            if (!value) return std::nullopt;
            if (*value == "1" || *value == "true" || value->empty()) return true;
            if (*value == "0" || *value == "false") return false;
            throw RequestBuildError("Query parameter '" + key + "' must be a boolean, got '" + *value + "'");
        }

        std::optional<int64_t> number(const std::string& key) const {
            auto value = text(key);
            if (!value) return std::nullopt;
            const std::string message = "Query parameter '" + key + "' must be an integer, got '" + *value + "'";
            try {
                size_t consumed = 0;
                int64_t result = std::stoll(*value, &consumed);
                if (consumed != value->size()) throw RequestBuildError(message);
                return result;
            } catch (const std::logic_error&) {
                throw RequestBuildError(message);
            }
        }

        std::optional<int> count(const std::string& key) const {
            auto value = number(key);
            if (!value) return std::nullopt;
            if (*value < 0 || *value > std::numeric_limits<int>::max()) {
                throw RequestBuildError("Query parameter '" + key + "' is out of range: " + std::to_string(*value));
            }
            return static_cast<int>(*value);
        }

        // Docker's own shape: {"kind": ["value", ...], ...}
        std::optional<Docker::FilterMap> filters() const {
            auto value = text("filters");
            if (!value) return std::nullopt;
            try {
                return nlohmann::json::parse(*value).get<Docker::FilterMap>();
            } catch (const nlohmann::json::exception& e) {
                throw RequestBuildError(std::string("Query parameter 'filters' must map filter names to string lists: ") + e.what());
            }
        }

        nlohmann::json body() const {
            if (req_.body.empty()) return nlohmann::json::object();
            try {
                return nlohmann::json::parse(req_.body);
            } catch (const nlohmann::json::parse_error& e) {
                throw RequestBuildError(std::string("Request body is not valid JSON: ") + e.what());
            }
        }

        std::optional<Docker::RegistryAuth> auth() const {
            if (!req_.has_header(Docker::REGISTRY_AUTH_HEADER)) return std::nullopt;
            return Docker::RegistryAuth::parse(req_.get_header_value(Docker::REGISTRY_AUTH_HEADER));
        }

        // stop and restart take the grace period as "wait" or as the daemon's own "t"
        std::optional<std::chrono::seconds> grace() const {
            auto seconds = number("wait");
            if (!seconds) seconds = number("t");
            if (!seconds) return std::nullopt;
            return std::chrono::seconds(*seconds);
        }
    };

    template<typename Builder>
    Builder& applyFilters(Builder& builder, const Params& params) {
        if (auto filters = params.filters()) builder.rawFilters(*filters);
        return builder;
    }

    Docker::LogsOptions logsOptions(const Params& params) {
        Docker::LogsOptionsBuilder builder;
        if (auto v = params.flag("follow")) builder.follow(*v);
        if (auto v = params.flag("stdout")) builder.stdout(*v);
        if (auto v = params.flag("stderr")) builder.stderr(*v);
        if (auto v = params.number("since")) builder.since(*v);
        if (auto v = params.number("until")) builder.until(*v);
        if (auto v = params.flag("timestamps")) builder.timestamps(*v);
        if (auto v = params.flag("details")) builder.details(*v);
        if (auto v = params.text("tail")) builder.tail(*v);
        return builder.build();
    }

    Docker::RmContainerOptions rmContainerOptions(const Params& params) {
        Docker::RmContainerOptionsBuilder builder;
        if (auto v = params.flag("v")) builder.volumes(*v);
        if (auto v = params.flag("force")) builder.force(*v);
        if (auto v = params.flag("link")) builder.link(*v);
        return builder.build();
    }

    Docker::ServiceOptions serviceOptions(const Params& params) {
        auto builder = Docker::ServiceOptionsBuilder::fromJson(params.body());
        if (auto auth = params.auth()) builder.auth(*auth);
        return builder.build();
    }

    // Body bytes held per exchange while the caller reads slower than the daemon writes.
    constexpr size_t RELAY_BUFFER_BYTES = 1 << 20;
    constexpr std::chrono::milliseconds CANCEL_POLL(100);

    const std::string CORS_METHODS = "GET, POST, PUT, DELETE, OPTIONS";
}

namespace Gateway {
    void fail(httplib::Response& res, int status, const std::string& message, const std::string& path) {
        nlohmann::json body = {
            {"message", message},
            {"path", path}
        };
        res.status = status;
        res.set_content(body.dump(), Docker::CONTENT_TYPE_JSON);
    }

    Server::Server(std::shared_ptr<const Directory> directory, std::shared_ptr<const Transport> transport, bool verbose)
        : directory_(std::move(directory)), transport_(std::move(transport)), verbose_(verbose) {
        registerSystemRoutes();
        registerContainerRoutes();
        registerImageRoutes();
        registerVolumeRoutes();
        registerNetworkRoutes();
        registerServiceRoutes();

        server_.set_exception_handler([](const httplib::Request& req, httplib::Response& res, std::exception_ptr ep) {
            try {
                std::rethrow_exception(ep);
            } catch (const std::exception& e) {
                std::cerr << req.method << ' ' << req.path << " failed: " << e.what() << std::endl;
                fail(res, 500, e.what(), req.path);
            } catch (...) {
                std::cerr << req.method << ' ' << req.path << " failed with an unknown exception" << std::endl;
                fail(res, 500, "Unknown error", req.path);
            }
        });

        // Any origin may call the gateway; credentials are never allowed.
        server_.set_default_headers({
            {"Access-Control-Allow-Origin", "*"},
            {"Access-Control-Allow-Methods", CORS_METHODS}
        });
        server_.Options(R"(/.*)", [](const httplib::Request& req, httplib::Response& res) {
            std::string allowed = req.get_header_value("Access-Control-Request-Headers");
            res.status = 204;
            res.set_header("Access-Control-Allow-Headers", allowed.empty() ? "*" : allowed);
            res.set_header("Access-Control-Max-Age", "86400");
        });
    }

    void Server::route(Method method, const std::string& pattern, Operation operation) {
        auto handler = [this, operation = std::move(operation)](const httplib::Request& req, httplib::Response& res) {
            handle(req, res, operation);
        };
        // First capture group is always the tenant
        const std::string full = "/([^/]+)" + pattern;
        switch (method) {
            case Method::Get: server_.Get(full, handler); break;
            case Method::Post: server_.Post(full, handler); break;
            case Method::Put: server_.Put(full, handler); break;
            case Method::Patch: server_.Patch(full, handler); break;
            case Method::Delete: server_.Delete(full, handler); break;
            case Method::Head: throw std::logic_error("HEAD is served by GET routes");
        }
    }

    void Server::handle(const httplib::Request& req, httplib::Response& res, const Operation& operation) const {
        const std::string tenant = req.matches[1].str();
        try {
            Docker::Client client(directory_->resolve(tenant));
            Docker::RequestDescriptor request = operation(client, req);
            if (verbose_) std::cout << "[" << tenant << "] " << request.describe() << std::endl;

            const std::string daemon = request.endpoint().str();
            auto exchange = std::make_shared<UpstreamExchange>(transport_, std::move(request), RELAY_BUFFER_BYTES);
            ResponsePipe& pipe = exchange->pipe();
            auto wait = pipe.waitForHead([&req] {
                return req.is_connection_closed && req.is_connection_closed();
            }, CANCEL_POLL);

            if (wait == ResponsePipe::Wait::cancelled) {
                exchange->join(true);
                std::cerr << req.method << ' ' << req.path << ": caller disconnected before the daemon answered" << std::endl;
                return;
            }
            if (wait == ResponsePipe::Wait::finished) {
                exchange->join(false);
                if (auto error = pipe.error()) std::rethrow_exception(error);
                throw std::runtime_error("Daemon exchange ended without a response");
            }

            relayHead(pipe.status(), pipe.headers(), res);
            std::cout << req.method << ' ' << req.path << " -> " << daemon << ' ' << res.status << std::endl;
            relayBody(std::move(exchange), res);
        } catch (const ResolutionError& e) {
            std::cerr << req.method << ' ' << req.path << ": " << e.what() << std::endl;
            fail(res, 404, e.what(), req.path);
        } catch (const RequestBuildError& e) {
            std::cerr << req.method << ' ' << req.path << ": " << e.what() << std::endl;
            fail(res, 400, e.what(), req.path);
        } catch (const TransportError& e) {
            std::cerr << req.method << ' ' << req.path << ": " << e.what() << std::endl;
            fail(res, e.timedOut() ? 504 : 502, e.what(), req.path);
        }
    }

    void Server::registerSystemRoutes() {
        route(Method::Get, "/info", [](const Docker::Client& client, const httplib::Request&) {
            return client.info();
        });
        route(Method::Get, "/ping", [](const Docker::Client& client, const httplib::Request&) {
            return client.ping();
        });
        route(Method::Get, "/version", [](const Docker::Client& client, const httplib::Request&) {
            return client.version();
        });
        route(Method::Get, "/events", [](const Docker::Client& client, const httplib::Request& req) {
            Params params(req);
            Docker::EventsOptionsBuilder builder;
            if (auto v = params.number("since")) builder.since(*v);
            if (auto v = params.number("until")) builder.until(*v);
            return client.events(applyFilters(builder, params).build());
        });
    }

    void Server::registerContainerRoutes() {
        route(Method::Get, "/containers", [](const Docker::Client& client, const httplib::Request& req) {
            Params params(req);
            Docker::ContainerListOptionsBuilder builder;
            if (auto v = params.flag("all")) builder.all(*v);
            if (auto v = params.number("limit")) builder.limit(*v);
            if (auto v = params.flag("size")) builder.size(*v);
            return client.containers().list(applyFilters(builder, params).build());
        });
        route(Method::Post, "/containers", [](const Docker::Client& client, const httplib::Request& req) {
            Params params(req);
            auto builder = Docker::ContainerOptionsBuilder::fromJson(params.body());
            if (auto name = params.text("name")) builder.name(*name);
            return client.containers().create(builder.build());
        });

        const std::string container = "/containers/([^/]+)";
        route(Method::Get, container, [](const Docker::Client& client, const httplib::Request& req) {
            return client.containers().get(Params(req).match(2)).inspect();
        });
        route(Method::Delete, container, [](const Docker::Client& client, const httplib::Request& req) {
            Params params(req);
            return client.containers().get(params.match(2)).remove(rmContainerOptions(params));
        });
        route(Method::Get, container + "/top", [](const Docker::Client& client, const httplib::Request& req) {
            Params params(req);
            return client.containers().get(params.match(2)).top(params.text("ps_args"));
        });
        route(Method::Get, container + "/logs", [](const Docker::Client& client, const httplib::Request& req) {
            Params params(req);
            return client.containers().get(params.match(2)).logs(logsOptions(params));
        });
        route(Method::Get, container + "/changes", [](const Docker::Client& client, const httplib::Request& req) {
            return client.containers().get(Params(req).match(2)).changes();
        });
        route(Method::Get, container + "/export", [](const Docker::Client& client, const httplib::Request& req) {
            return client.containers().get(Params(req).match(2)).exportContainer();
        });
        route(Method::Get, container + "/stats", [](const Docker::Client& client, const httplib::Request& req) {
            Params params(req);
            return client.containers().get(params.match(2)).stats(params.flag("stream"));
        });
        route(Method::Post, container + "/start", [](const Docker::Client& client, const httplib::Request& req) {
            return client.containers().get(Params(req).match(2)).start();
        });
        route(Method::Post, container + "/stop", [](const Docker::Client& client, const httplib::Request& req) {
            Params params(req);
            return client.containers().get(params.match(2)).stop(params.grace());
        });
        route(Method::Post, container + "/restart", [](const Docker::Client& client, const httplib::Request& req) {
            Params params(req);
            return client.containers().get(params.match(2)).restart(params.grace());
        });
        route(Method::Post, container + "/kill", [](const Docker::Client& client, const httplib::Request& req) {
            Params params(req);
            return client.containers().get(params.match(2)).kill(params.text("signal"));
        });
        route(Method::Post, container + "/rename", [](const Docker::Client& client, const httplib::Request& req) {
            Params params(req);
            return client.containers().get(params.match(2)).rename(params.required("name"));
        });
        route(Method::Post, container + "/pause", [](const Docker::Client& client, const httplib::Request& req) {
            return client.containers().get(Params(req).match(2)).pause();
        });
        route(Method::Post, container + "/unpause", [](const Docker::Client& client, const httplib::Request& req) {
            return client.containers().get(Params(req).match(2)).unpause();
        });
        route(Method::Post, container + "/attach", [](const Docker::Client& client, const httplib::Request& req) {
            return client.containers().get(Params(req).match(2)).attach();
        });
        route(Method::Post, container + "/wait", [](const Docker::Client& client, const httplib::Request& req) {
            return client.containers().get(Params(req).match(2)).wait();
        });
        route(Method::Post, container + "/remove", [](const Docker::Client& client, const httplib::Request& req) {
            Params params(req);
            return client.containers().get(params.match(2)).remove(rmContainerOptions(params));
        });
    }

    void Server::registerImageRoutes() {
        route(Method::Get, "/images", [](const Docker::Client& client, const httplib::Request& req) {
            Params params(req);
            Docker::ImageListOptionsBuilder builder;
            if (auto v = params.flag("all")) builder.all(*v);
            if (auto v = params.flag("digests")) builder.digests(*v);
            if (auto v = params.text("filter")) builder.filterName(*v);
            return client.images().list(applyFilters(builder, params).build());
        });
        route(Method::Get, "/images/search", [](const Docker::Client& client, const httplib::Request& req) {
            Params params(req);
            return client.images().search(params.required("term"), params.count("limit"));
        });
        route(Method::Post, "/images/pull", [](const Docker::Client& client, const httplib::Request& req) {
            Params params(req);
            Docker::PullOptionsBuilder builder;
            if (auto v = params.text("fromImage")) builder.image(*v);
            else if (auto image = params.text("image")) builder.image(*image);
            if (auto v = params.text("fromSrc")) builder.src(*v);
            if (auto v = params.text("repo")) builder.repo(*v);
            if (auto v = params.text("tag")) builder.tag(*v);
            if (auto v = params.text("platform")) builder.platform(*v);
            if (auto auth = params.auth()) builder.auth(*auth);
            return client.images().pull(builder.build());
        });
        route(Method::Post, "/images/load", [](const Docker::Client& client, const httplib::Request& req) {
            return client.images().import(req.body);
        });
        route(Method::Get, "/images/export", [](const Docker::Client& client, const httplib::Request& req) {
            Params params(req);
            auto names = params.all("names");
            if (names.empty()) throw RequestBuildError("Missing query parameter 'names'");
            return client.images().exportImages(names);
        });

        // Image names may contain '/', so the more specific suffixes come first.
        const std::string image = "/images/(.+)";
        route(Method::Get, image + "/history", [](const Docker::Client& client, const httplib::Request& req) {
            return client.images().get(Params(req).match(2)).history();
        });
        route(Method::Get, image + "/export", [](const Docker::Client& client, const httplib::Request& req) {
            return client.images().get(Params(req).match(2)).exportImage();
        });
        route(Method::Post, image + "/tag", [](const Docker::Client& client, const httplib::Request& req) {
            Params params(req);
            Docker::TagOptionsBuilder builder;
            builder.repo(params.required("repo"));
            if (auto v = params.text("tag")) builder.tag(*v);
            return client.images().get(params.match(2)).tag(builder.build());
        });
        route(Method::Post, image + "/push", [](const Docker::Client& client, const httplib::Request& req) {
            Params params(req);
            Docker::PushOptionsBuilder builder;
            if (auto v = params.text("tag")) builder.tag(*v);
            if (auto auth = params.auth()) builder.auth(*auth);
            return client.images().get(params.match(2)).push(builder.build());
        });
        route(Method::Get, image, [](const Docker::Client& client, const httplib::Request& req) {
            return client.images().get(Params(req).match(2)).inspect();
        });
        route(Method::Delete, image, [](const Docker::Client& client, const httplib::Request& req) {
            Params params(req);
            Docker::RmImageOptionsBuilder builder;
            if (auto v = params.flag("force")) builder.force(*v);
            if (auto v = params.flag("noprune")) builder.noprune(*v);
            return client.images().get(params.match(2)).remove(builder.build());
        });
    }

    void Server::registerVolumeRoutes() {
        route(Method::Get, "/volumes", [](const Docker::Client& client, const httplib::Request& req) {
            Params params(req);
            Docker::VolumeListOptionsBuilder builder;
            return client.volumes().list(applyFilters(builder, params).build());
        });
        route(Method::Post, "/volumes", [](const Docker::Client& client, const httplib::Request& req) {
            return client.volumes().create(Docker::VolumeCreateOptionsBuilder::fromJson(Params(req).body()).build());
        });
        route(Method::Get, "/volumes/([^/]+)", [](const Docker::Client& client, const httplib::Request& req) {
            return client.volumes().get(Params(req).match(2)).inspect();
        });
        route(Method::Delete, "/volumes/([^/]+)", [](const Docker::Client& client, const httplib::Request& req) {
            Params params(req);
            return client.volumes().get(params.match(2)).remove(params.flag("force").value_or(false));
        });
    }

    void Server::registerNetworkRoutes() {
        route(Method::Get, "/networks", [](const Docker::Client& client, const httplib::Request& req) {
            Params params(req);
            Docker::NetworkListOptionsBuilder builder;
            return client.networks().list(applyFilters(builder, params).build());
        });
        route(Method::Post, "/networks", [](const Docker::Client& client, const httplib::Request& req) {
            return client.networks().create(Docker::NetworkCreateOptionsBuilder::fromJson(Params(req).body()).build());
        });

        const std::string network = "/networks/([^/]+)";
        route(Method::Get, network, [](const Docker::Client& client, const httplib::Request& req) {
            return client.networks().get(Params(req).match(2)).inspect();
        });
        route(Method::Delete, network, [](const Docker::Client& client, const httplib::Request& req) {
            return client.networks().get(Params(req).match(2)).remove();
        });
        route(Method::Post, network + "/connect", [](const Docker::Client& client, const httplib::Request& req) {
            Params params(req);
            auto options = Docker::ContainerConnectionOptionsBuilder::fromJson(params.body()).build();
            return client.networks().get(params.match(2)).connect(options);
        });
        route(Method::Post, network + "/disconnect", [](const Docker::Client& client, const httplib::Request& req) {
            Params params(req);
            auto options = Docker::ContainerConnectionOptionsBuilder::fromJson(params.body()).build();
            return client.networks().get(params.match(2)).disconnect(options);
        });
    }

    void Server::registerServiceRoutes() {
        route(Method::Get, "/services", [](const Docker::Client& client, const httplib::Request& req) {
            Params params(req);
            Docker::ServiceListOptionsBuilder builder;
            if (auto v = params.flag("status")) builder.status(*v);
            return client.services().list(applyFilters(builder, params).build());
        });
        route(Method::Post, "/services", [](const Docker::Client& client, const httplib::Request& req) {
            return client.services().create(serviceOptions(Params(req)));
        });

        const std::string service = "/services/([^/]+)";
        route(Method::Get, service, [](const Docker::Client& client, const httplib::Request& req) {
            return client.services().get(Params(req).match(2)).inspect();
        });
        route(Method::Delete, service, [](const Docker::Client& client, const httplib::Request& req) {
            return client.services().get(Params(req).match(2)).remove();
        });
        route(Method::Post, service + "/update", [](const Docker::Client& client, const httplib::Request& req) {
            Params params(req);
            auto version = params.number("version");
            if (!version || *version < 0) throw RequestBuildError("Missing or invalid query parameter 'version'");
            return client.services().get(params.match(2)).update(static_cast<uint64_t>(*version), serviceOptions(params));
        });
        route(Method::Get, service + "/logs", [](const Docker::Client& client, const httplib::Request& req) {
            Params params(req);
            return client.services().get(params.match(2)).logs(logsOptions(params));
        });
    }

    bool Server::listen(const std::string& host, int port) {
        return server_.listen(host, port);
    }

    int Server::bindToAnyPort(const std::string& host) {
        return server_.bind_to_any_port(host);
    }

    bool Server::listenAfterBind() {
        return server_.listen_after_bind();
    }

    void Server::stop() {
        server_.stop();
    }
}
