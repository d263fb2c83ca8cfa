#ifndef DOCKGATE_REGISTRY_AUTH_HPP
#define DOCKGATE_REGISTRY_AUTH_HPP

#include <optional>
#include <string>

namespace Docker {
    class RegistryAuthBuilder;

    // Credentials for a registry, sent base64-encoded in X-Registry-Auth.
    class RegistryAuth {
        std::string username_;
        std::string password_;
        std::optional<std::string> email_;
        std::optional<std::string> serverAddress_;
        std::optional<std::string> identityToken_;

        friend class RegistryAuthBuilder;

        RegistryAuth() = default;

    public:
        static RegistryAuth token(const std::string& identityToken);
        static RegistryAuthBuilder builder();
        // Decodes an X-Registry-Auth header value. Throws RequestBuildError when malformed.
        static RegistryAuth parse(const std::string& header);

        bool isToken() const { return identityToken_.has_value(); }

        std::string json() const;
        std::string serialize() const;
    };

    class RegistryAuthBuilder {
        RegistryAuth auth_;

    public:
        RegistryAuthBuilder& username(const std::string& username);
        RegistryAuthBuilder& password(const std::string& password);
        RegistryAuthBuilder& email(const std::string& email);
        RegistryAuthBuilder& serverAddress(const std::string& serverAddress);

        RegistryAuth build() const { return auth_; }
    };

    std::string base64UrlEncode(const std::string& data);
    std::string base64UrlDecode(const std::string& data);
}

#endif // DOCKGATE_REGISTRY_AUTH_HPP
