#ifndef DOCKGATE_CONTAINERS_HPP
#define DOCKGATE_CONTAINERS_HPP

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "endpoint.hpp"
#include "options.hpp"
#include "request.hpp"

namespace Docker {
    class ContainerFilter : public Filter {
    public:
        using Filter::Filter;

        static ContainerFilter exitCode(int code);
        // created, restarting, running, removing, paused, exited or dead
        static ContainerFilter status(const std::string& status);
        static ContainerFilter labelName(const std::string& name);
        static ContainerFilter label(const std::string& name, const std::string& value);
        static ContainerFilter name(const std::string& name);
        static ContainerFilter id(const std::string& id);
        static ContainerFilter ancestor(const std::string& image);
        static ContainerFilter network(const std::string& network);
        static ContainerFilter volume(const std::string& volume);
        static ContainerFilter health(const std::string& health);
        static ContainerFilter before(const std::string& container);
        static ContainerFilter since(const std::string& container);
    };

    class ContainerListOptions : public QueryOptions {
    public:
        using QueryOptions::QueryOptions;
    };

    class ContainerListOptionsBuilder : public QueryBuilder<ContainerListOptionsBuilder> {
    public:
        ContainerListOptionsBuilder& all(bool all = true) { return setFlag("all", all); }
        ContainerListOptionsBuilder& limit(int64_t limit) { return setNumber("limit", limit); }
        ContainerListOptionsBuilder& size(bool size) { return setFlag("size", size); }
        ContainerListOptionsBuilder& filter(const std::vector<ContainerFilter>& filters) { return accumulate(filters); }

        ContainerListOptions build() const { return ContainerListOptions(params_); }
    };

    // Logs of containers and services share these parameters.
    class LogsOptions : public QueryOptions {
    public:
        using QueryOptions::QueryOptions;
    };

    class LogsOptionsBuilder : public QueryBuilder<LogsOptionsBuilder> {
    public:
        LogsOptionsBuilder& follow(bool follow) { return setFlag("follow", follow); }
        LogsOptionsBuilder& stdout(bool stdout) { return setFlag("stdout", stdout); }
        LogsOptionsBuilder& stderr(bool stderr) { return setFlag("stderr", stderr); }
        LogsOptionsBuilder& since(int64_t timestamp) { return setNumber("since", timestamp); }
        LogsOptionsBuilder& until(int64_t timestamp) { return setNumber("until", timestamp); }
        LogsOptionsBuilder& timestamps(bool timestamps) { return setFlag("timestamps", timestamps); }
        LogsOptionsBuilder& details(bool details) { return setFlag("details", details); }
        // Number of lines from the end, or "all"
        LogsOptionsBuilder& tail(const std::string& tail) { return set("tail", tail); }

        LogsOptions build() const { return LogsOptions(params_); }
    };

    class RmContainerOptions : public QueryOptions {
    public:
        using QueryOptions::QueryOptions;
    };

    class RmContainerOptionsBuilder : public QueryBuilder<RmContainerOptionsBuilder> {
    public:
        RmContainerOptionsBuilder& volumes(bool volumes) { return setFlag("v", volumes); }
        RmContainerOptionsBuilder& force(bool force) { return setFlag("force", force); }
        RmContainerOptionsBuilder& link(bool link) { return setFlag("link", link); }

        RmContainerOptions build() const { return RmContainerOptions(params_); }
    };

    // Body of POST /containers/create; the name travels in the query string.
    class ContainerOptions : public JsonOptions {
        std::optional<std::string> name_;

    public:
        ContainerOptions(nlohmann::json params, std::optional<std::string> name)
            : JsonOptions(std::move(params)), name_(std::move(name)) {}

        const std::optional<std::string>& name() const { return name_; }
        std::optional<std::string> serializeQuery() const;
    };

    class ContainerOptionsBuilder {
        nlohmann::json params_ = nlohmann::json::object();
        std::optional<std::string> name_;

        ContainerOptionsBuilder() = default;
        nlohmann::json& hostConfig();

    public:
        explicit ContainerOptionsBuilder(const std::string& image);
        // Starts from a caller-supplied create body; typed setters still apply on top.
        static ContainerOptionsBuilder fromJson(const nlohmann::json& body);

        ContainerOptionsBuilder& name(const std::string& name);
        ContainerOptionsBuilder& image(const std::string& image);
        ContainerOptionsBuilder& cmd(const std::vector<std::string>& cmd);
        ContainerOptionsBuilder& entrypoint(const std::vector<std::string>& entrypoint);
        ContainerOptionsBuilder& env(const std::map<std::string, std::string>& env);
        ContainerOptionsBuilder& labels(const std::map<std::string, std::string>& labels);
        ContainerOptionsBuilder& workingDir(const std::string& workingDir);
        ContainerOptionsBuilder& user(const std::string& user);
        ContainerOptionsBuilder& tty(bool tty);
        ContainerOptionsBuilder& openStdin(bool openStdin);
        ContainerOptionsBuilder& attachStdin(bool attach);
        ContainerOptionsBuilder& attachStdout(bool attach);
        ContainerOptionsBuilder& attachStderr(bool attach);
        // containerPort is "80" or "80/udp"; hostPort empty leaves the port unpublished
        ContainerOptionsBuilder& expose(const std::string& containerPort, const std::string& hostPort = "");
        ContainerOptionsBuilder& volumes(const std::vector<std::string>& binds);
        ContainerOptionsBuilder& memory(int64_t bytes);
        ContainerOptionsBuilder& networkMode(const std::string& mode);
        ContainerOptionsBuilder& privileged(bool privileged);
        ContainerOptionsBuilder& restartPolicy(const std::string& name, int maximumRetryCount = 0);
        ContainerOptionsBuilder& autoRemove(bool autoRemove);

        ContainerOptions build() const { return {params_, name_}; }
    };

    // Operations on one container. Holds only the endpoint and the id.
    class Container {
        DaemonEndpoint endpoint_;
        std::string id_;

        std::string path(const std::string& suffix) const;

    public:
        Container(DaemonEndpoint endpoint, std::string id) : endpoint_(std::move(endpoint)), id_(std::move(id)) {}

        const std::string& id() const { return id_; }

        RequestDescriptor inspect() const;
        RequestDescriptor top(const std::optional<std::string>& psArgs = std::nullopt) const;
        RequestDescriptor logs(const LogsOptions& options = {}) const;
        RequestDescriptor changes() const;
        RequestDescriptor exportContainer() const;
        RequestDescriptor stats(std::optional<bool> stream = std::nullopt) const;
        RequestDescriptor start() const;
        RequestDescriptor stop(std::optional<std::chrono::seconds> wait = std::nullopt) const;
        RequestDescriptor restart(std::optional<std::chrono::seconds> wait = std::nullopt) const;
        RequestDescriptor kill(const std::optional<std::string>& signal = std::nullopt) const;
        RequestDescriptor rename(const std::string& name) const;
        RequestDescriptor pause() const;
        RequestDescriptor unpause() const;
        RequestDescriptor attach() const;
        RequestDescriptor wait() const;
        RequestDescriptor remove(const RmContainerOptions& options = {}) const;
    };

    class Containers {
        DaemonEndpoint endpoint_;

    public:
        explicit Containers(DaemonEndpoint endpoint) : endpoint_(std::move(endpoint)) {}

        RequestDescriptor list(const ContainerListOptions& options = {}) const;
        RequestDescriptor create(const ContainerOptions& options) const;
        Container get(const std::string& id) const { return {endpoint_, id}; }
    };
}

#endif // DOCKGATE_CONTAINERS_HPP
