#ifndef DOCKGATE_IMAGES_HPP
#define DOCKGATE_IMAGES_HPP

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "endpoint.hpp"
#include "options.hpp"
#include "registryAuth.hpp"
#include "request.hpp"

namespace Docker {
    class ImageFilter : public Filter {
    public:
        using Filter::Filter;

        static ImageFilter dangling(bool dangling = true);
        static ImageFilter labelName(const std::string& name);
        static ImageFilter label(const std::string& name, const std::string& value);
        static ImageFilter before(const std::string& image);
        static ImageFilter since(const std::string& image);
        static ImageFilter reference(const std::string& reference);
    };

    class ImageListOptions : public QueryOptions {
    public:
        using QueryOptions::QueryOptions;
    };

    class ImageListOptionsBuilder : public QueryBuilder<ImageListOptionsBuilder> {
    public:
        ImageListOptionsBuilder& all(bool all = true) { return setFlag("all", all); }
        ImageListOptionsBuilder& digests(bool digests) { return setFlag("digests", digests); }
        // Legacy repository-name match, superseded by filter(reference)
        ImageListOptionsBuilder& filterName(const std::string& name) { return set("filter", name); }
        ImageListOptionsBuilder& filter(const std::vector<ImageFilter>& filters) { return accumulate(filters); }

        ImageListOptions build() const { return ImageListOptions(params_); }
    };

    // Query of POST /build, plus the local directory packaged as the context.
    class BuildOptions : public QueryOptions {
        std::string path_;

    public:
        BuildOptions(std::string path, std::map<std::string, std::string> params)
            : QueryOptions(std::move(params)), path_(std::move(path)) {}

        const std::string& path() const { return path_; }
    };

    class BuildOptionsBuilder : public QueryBuilder<BuildOptionsBuilder> {
        std::string path_;

    public:
        // path is a directory holding a Dockerfile
        explicit BuildOptionsBuilder(std::string path) : path_(std::move(path)) {}

        BuildOptionsBuilder& dockerfile(const std::string& path) { return set("dockerfile", path); }
        BuildOptionsBuilder& tag(const std::string& tag) { return set("t", tag); }
        BuildOptionsBuilder& remote(const std::string& remote) { return set("remote", remote); }
        BuildOptionsBuilder& quiet(bool quiet) { return setFlag("q", quiet); }
        BuildOptionsBuilder& nocache(bool nocache) { return setFlag("nocache", nocache); }
        BuildOptionsBuilder& rm(bool rm) { return setFlag("rm", rm); }
        BuildOptionsBuilder& forcerm(bool forcerm) { return setFlag("forcerm", forcerm); }
        BuildOptionsBuilder& pull(bool pull) { return setFlag("pull", pull); }
        // bridge, host, none, container:<name|id> or a custom network name
        BuildOptionsBuilder& networkMode(const std::string& mode) { return set("networkmode", mode); }
        BuildOptionsBuilder& memory(int64_t bytes) { return setNumber("memory", bytes); }
        BuildOptionsBuilder& memswap(int64_t bytes) { return setNumber("memswap", bytes); }
        BuildOptionsBuilder& cpuShares(int64_t shares) { return setNumber("cpushares", shares); }
        BuildOptionsBuilder& cpusetCpus(const std::string& cpus) { return set("cpusetcpus", cpus); }
        BuildOptionsBuilder& cpuPeriod(int64_t period) { return setNumber("cpuperiod", period); }
        BuildOptionsBuilder& cpuQuota(int64_t quota) { return setNumber("cpuquota", quota); }
        BuildOptionsBuilder& buildArgs(const std::map<std::string, std::string>& args);
        BuildOptionsBuilder& labels(const std::map<std::string, std::string>& labels);
        BuildOptionsBuilder& platform(const std::string& platform) { return set("platform", platform); }

        BuildOptions build() const { return {path_, params_}; }
    };

    class PullOptions : public QueryOptions {
        std::optional<RegistryAuth> auth_;

    public:
        PullOptions() = default;
        PullOptions(std::map<std::string, std::string> params, std::optional<RegistryAuth> auth)
            : QueryOptions(std::move(params)), auth_(std::move(auth)) {}

        // Encoded X-Registry-Auth value, if credentials were given.
        std::optional<std::string> authHeader() const;
    };

    class PullOptionsBuilder : public QueryBuilder<PullOptionsBuilder> {
        std::optional<RegistryAuth> auth_;

    public:
        // May carry a tag or digest; without one and without tag(), every tag is pulled.
        PullOptionsBuilder& image(const std::string& image) { return set("fromImage", image); }
        PullOptionsBuilder& src(const std::string& src) { return set("fromSrc", src); }
        PullOptionsBuilder& repo(const std::string& repo) { return set("repo", repo); }
        PullOptionsBuilder& tag(const std::string& tag) { return set("tag", tag); }
        PullOptionsBuilder& platform(const std::string& platform) { return set("platform", platform); }
        PullOptionsBuilder& auth(const RegistryAuth& auth);

        PullOptions build() const { return {params_, auth_}; }
    };

    class PushOptions : public QueryOptions {
        std::optional<RegistryAuth> auth_;

    public:
        PushOptions() = default;
        PushOptions(std::map<std::string, std::string> params, std::optional<RegistryAuth> auth)
            : QueryOptions(std::move(params)), auth_(std::move(auth)) {}

        std::optional<std::string> authHeader() const;
    };

    class PushOptionsBuilder : public QueryBuilder<PushOptionsBuilder> {
        std::optional<RegistryAuth> auth_;

    public:
        PushOptionsBuilder& tag(const std::string& tag) { return set("tag", tag); }
        PushOptionsBuilder& auth(const RegistryAuth& auth);

        PushOptions build() const { return {params_, auth_}; }
    };

    class TagOptions : public QueryOptions {
    public:
        using QueryOptions::QueryOptions;
    };

    class TagOptionsBuilder : public QueryBuilder<TagOptionsBuilder> {
    public:
        TagOptionsBuilder& repo(const std::string& repo) { return set("repo", repo); }
        TagOptionsBuilder& tag(const std::string& tag) { return set("tag", tag); }

        TagOptions build() const { return TagOptions(params_); }
    };

    class RmImageOptions : public QueryOptions {
    public:
        using QueryOptions::QueryOptions;
    };

    class RmImageOptionsBuilder : public QueryBuilder<RmImageOptionsBuilder> {
    public:
        RmImageOptionsBuilder& force(bool force) { return setFlag("force", force); }
        RmImageOptionsBuilder& noprune(bool noprune) { return setFlag("noprune", noprune); }

        RmImageOptions build() const { return RmImageOptions(params_); }
    };

    // Operations on one image, addressed by name, name:tag or id.
    class Image {
        DaemonEndpoint endpoint_;
        std::string name_;

    public:
        Image(DaemonEndpoint endpoint, std::string name) : endpoint_(std::move(endpoint)), name_(std::move(name)) {}

        const std::string& name() const { return name_; }

        RequestDescriptor inspect() const;
        RequestDescriptor history() const;
        RequestDescriptor remove(const RmImageOptions& options = {}) const;
        RequestDescriptor exportImage() const;
        RequestDescriptor tag(const TagOptions& options) const;
        RequestDescriptor push(const PushOptions& options = {}) const;
    };

    class Images {
        DaemonEndpoint endpoint_;

    public:
        explicit Images(DaemonEndpoint endpoint) : endpoint_(std::move(endpoint)) {}

        // Reads and archives options.path() before building the request.
        RequestDescriptor build(const BuildOptions& options) const;
        RequestDescriptor list(const ImageListOptions& options = {}) const;
        RequestDescriptor search(const std::string& term, std::optional<int> limit = std::nullopt) const;
        RequestDescriptor pull(const PullOptions& options) const;
        RequestDescriptor exportImages(const std::vector<std::string>& names) const;
        RequestDescriptor import(std::string tarball) const;
        Image get(const std::string& name) const { return {endpoint_, name}; }
    };
}

#endif // DOCKGATE_IMAGES_HPP
