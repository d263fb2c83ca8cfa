#include "containers.hpp"

#include "errors.hpp"

namespace Docker {
    ContainerFilter ContainerFilter::exitCode(int code) { return {"exited", std::to_string(code)}; }
    ContainerFilter ContainerFilter::status(const std::string& status) { return {"status", status}; }
    ContainerFilter ContainerFilter::labelName(const std::string& name) { return {"label", name}; }
    ContainerFilter ContainerFilter::label(const std::string& name, const std::string& value) { return {"label", name + "=" + value}; }
    ContainerFilter ContainerFilter::name(const std::string& name) { return {"name", name}; }
    ContainerFilter ContainerFilter::id(const std::string& id) { return {"id", id}; }
    ContainerFilter ContainerFilter::ancestor(const std::string& image) { return {"ancestor", image}; }
    ContainerFilter ContainerFilter::network(const std::string& network) { return {"network", network}; }
    ContainerFilter ContainerFilter::volume(const std::string& volume) { return {"volume", volume}; }
    ContainerFilter ContainerFilter::health(const std::string& health) { return {"health", health}; }
    ContainerFilter ContainerFilter::before(const std::string& container) { return {"before", container}; }
    ContainerFilter ContainerFilter::since(const std::string& container) { return {"since", container}; }

    std::optional<std::string> ContainerOptions::serializeQuery() const {
        if (!name_) return std::nullopt;
        return encodeQuery({{"name", *name_}});
    }

    ContainerOptionsBuilder::ContainerOptionsBuilder(const std::string& image) {
        params_["Image"] = image;
    }

    ContainerOptionsBuilder ContainerOptionsBuilder::fromJson(const nlohmann::json& body) {
        if (!body.is_object()) throw RequestBuildError("Container create body must be a JSON object");
        // Field types are the daemon's to check
        ContainerOptionsBuilder builder;
        builder.params_ = body;
        return builder;
    }

    nlohmann::json& ContainerOptionsBuilder::hostConfig() {
        nlohmann::json& config = params_["HostConfig"];
        if (!config.is_object()) config = nlohmann::json::object();
        return config;
    }

    ContainerOptionsBuilder& ContainerOptionsBuilder::name(const std::string& name) {
        name_ = name;
        return *this;
    }

    ContainerOptionsBuilder& ContainerOptionsBuilder::image(const std::string& image) {
        params_["Image"] = image;
        return *this;
    }

    ContainerOptionsBuilder& ContainerOptionsBuilder::cmd(const std::vector<std::string>& cmd) {
        params_["Cmd"] = cmd;
        return *this;
    }

    ContainerOptionsBuilder& ContainerOptionsBuilder::entrypoint(const std::vector<std::string>& entrypoint) {
        params_["Entrypoint"] = entrypoint;
        return *this;
    }

    ContainerOptionsBuilder& ContainerOptionsBuilder::env(const std::map<std::string, std::string>& env) {
        std::vector<std::string> envList;
        for (const auto& [key, value] : env) {
            envList.push_back(key + "=" + value);
        }
        params_["Env"] = envList;
        return *this;
    }

    ContainerOptionsBuilder& ContainerOptionsBuilder::labels(const std::map<std::string, std::string>& labels) {
        params_["Labels"] = labels;
        return *this;
    }

    ContainerOptionsBuilder& ContainerOptionsBuilder::workingDir(const std::string& workingDir) {
        params_["WorkingDir"] = workingDir;
        return *this;
    }

    ContainerOptionsBuilder& ContainerOptionsBuilder::user(const std::string& user) {
        params_["User"] = user;
        return *this;
    }

    ContainerOptionsBuilder& ContainerOptionsBuilder::tty(bool tty) {
        params_["Tty"] = tty;
        return *this;
    }

    ContainerOptionsBuilder& ContainerOptionsBuilder::openStdin(bool openStdin) {
        params_["OpenStdin"] = openStdin;
        return *this;
    }

    ContainerOptionsBuilder& ContainerOptionsBuilder::attachStdin(bool attach) {
        params_["AttachStdin"] = attach;
        return *this;
    }

    ContainerOptionsBuilder& ContainerOptionsBuilder::attachStdout(bool attach) {
        params_["AttachStdout"] = attach;
        return *this;
    }

    ContainerOptionsBuilder& ContainerOptionsBuilder::attachStderr(bool attach) {
        params_["AttachStderr"] = attach;
        return *this;
    }

    ContainerOptionsBuilder& ContainerOptionsBuilder::expose(const std::string& containerPort, const std::string& hostPort) {
        const std::string port = containerPort.find('/') == std::string::npos ? containerPort + "/tcp" : containerPort;
        params_["ExposedPorts"][port] = nlohmann::json::object();
        if (!hostPort.empty()) {
            hostConfig()["PortBindings"][port] = {
                {{"HostPort", hostPort}}
            };
        }
        return *this;
    }

    ContainerOptionsBuilder& ContainerOptionsBuilder::volumes(const std::vector<std::string>& binds) {
        hostConfig()["Binds"] = binds;
        return *this;
    }

    ContainerOptionsBuilder& ContainerOptionsBuilder::memory(int64_t bytes) {
        hostConfig()["Memory"] = bytes;
        return *this;
    }

    ContainerOptionsBuilder& ContainerOptionsBuilder::networkMode(const std::string& mode) {
        hostConfig()["NetworkMode"] = mode;
        return *this;
    }

    ContainerOptionsBuilder& ContainerOptionsBuilder::privileged(bool privileged) {
        hostConfig()["Privileged"] = privileged;
        return *this;
    }

    ContainerOptionsBuilder& ContainerOptionsBuilder::restartPolicy(const std::string& name, int maximumRetryCount) {
        nlohmann::json policy = {{"Name", name}};
        if (name == "on-failure") policy["MaximumRetryCount"] = maximumRetryCount;
        hostConfig()["RestartPolicy"] = policy;
        return *this;
    }

    ContainerOptionsBuilder& ContainerOptionsBuilder::autoRemove(bool autoRemove) {
        hostConfig()["AutoRemove"] = autoRemove;
        return *this;
    }

    std::string Container::path(const std::string& suffix) const {
        return "/containers/" + pathSegment(id_) + suffix;
    }

    RequestDescriptor Container::inspect() const {
        return makeRequest(endpoint_, Method::Get, path("/json"));
    }

    RequestDescriptor Container::top(const std::optional<std::string>& psArgs) const {
        std::optional<std::string> query;
        if (psArgs) query = encodeQuery({{"ps_args", *psArgs}});
        return makeRequest(endpoint_, Method::Get, withQuery(path("/top"), query));
    }

    RequestDescriptor Container::logs(const LogsOptions& options) const {
        return makeRequest(endpoint_, Method::Get, withQuery(path("/logs"), options.serialize()));
    }

    RequestDescriptor Container::changes() const {
        return makeRequest(endpoint_, Method::Get, path("/changes"));
    }

    RequestDescriptor Container::exportContainer() const {
        return makeRequest(endpoint_, Method::Get, path("/export"));
    }

    RequestDescriptor Container::stats(std::optional<bool> stream) const {
        std::optional<std::string> query;
        if (stream) query = encodeQuery({{"stream", *stream ? "true" : "false"}});
        return makeRequest(endpoint_, Method::Get, withQuery(path("/stats"), query));
    }

    RequestDescriptor Container::start() const {
        return makeRequest(endpoint_, Method::Post, path("/start"));
    }

    RequestDescriptor Container::stop(std::optional<std::chrono::seconds> wait) const {
        std::optional<std::string> query;
        if (wait) query = encodeQuery({{"t", std::to_string(wait->count())}});
        return makeRequest(endpoint_, Method::Post, withQuery(path("/stop"), query));
    }

    RequestDescriptor Container::restart(std::optional<std::chrono::seconds> wait) const {
        std::optional<std::string> query;
        if (wait) query = encodeQuery({{"t", std::to_string(wait->count())}});
        return makeRequest(endpoint_, Method::Post, withQuery(path("/restart"), query));
    }

    RequestDescriptor Container::kill(const std::optional<std::string>& signal) const {
        std::optional<std::string> query;
        if (signal) query = encodeQuery({{"signal", *signal}});
        return makeRequest(endpoint_, Method::Post, withQuery(path("/kill"), query));
    }

    RequestDescriptor Container::rename(const std::string& name) const {
        return makeRequest(endpoint_, Method::Post, withQuery(path("/rename"), encodeQuery({{"name", name}})));
    }

    RequestDescriptor Container::pause() const {
        return makeRequest(endpoint_, Method::Post, path("/pause"));
    }

    RequestDescriptor Container::unpause() const {
        return makeRequest(endpoint_, Method::Post, path("/unpause"));
    }

    RequestDescriptor Container::attach() const {
        return makeRequest(endpoint_, Method::Post, withQuery(path("/attach"),
            encodeQuery({{"stderr", "1"}, {"stdout", "1"}, {"stream", "1"}})));
    }

    RequestDescriptor Container::wait() const {
        return makeRequest(endpoint_, Method::Post, path("/wait"));
    }

    RequestDescriptor Container::remove(const RmContainerOptions& options) const {
        return makeRequest(endpoint_, Method::Delete, withQuery(path(""), options.serialize()));
    }

    RequestDescriptor Containers::list(const ContainerListOptions& options) const {
        return makeRequest(endpoint_, Method::Get, withQuery("/containers/json", options.serialize()));
    }

    RequestDescriptor Containers::create(const ContainerOptions& options) const {
        return makeRequest(endpoint_, Method::Post, withQuery("/containers/create", options.serializeQuery()),
                           Body{options.serialize(), CONTENT_TYPE_JSON});
    }
}
