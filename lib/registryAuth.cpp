#include "registryAuth.hpp"

#include <boost/beast/core/detail/base64.hpp>
#include <nlohmann/json.hpp>

#include <algorithm>

#include "errors.hpp"

namespace base64 = boost::beast::detail::base64;

namespace Docker {
    std::string base64UrlEncode(const std::string& data) {
        std::string encoded(base64::encoded_size(data.size()), '\0');
        encoded.resize(base64::encode(encoded.data(), data.data(), data.size()));
        std::replace(encoded.begin(), encoded.end(), '+', '-');
        std::replace(encoded.begin(), encoded.end(), '/', '_');
        return encoded;
    }

    std::string base64UrlDecode(const std::string& data) {
        std::string standard = data;
        std::replace(standard.begin(), standard.end(), '-', '+');
        std::replace(standard.begin(), standard.end(), '_', '/');
        while (standard.size() % 4 != 0) standard += '=';

        std::string decoded(base64::decoded_size(standard.size()), '\0');
        auto [written, read] = base64::decode(decoded.data(), standard.data(), standard.size());
        // Decoding stops at the first '=' or foreign character; only padding may follow.
        if (standard.find_first_not_of('=', read) != std::string::npos) {
            throw RequestBuildError("Invalid base64 in registry credentials");
        }
        decoded.resize(written);
        return decoded;
    }

    RegistryAuth RegistryAuth::token(const std::string& identityToken) {
        RegistryAuth auth;
        auth.identityToken_ = identityToken;
        return auth;
    }

    RegistryAuthBuilder RegistryAuth::builder() {
        return {};
    }

    RegistryAuth RegistryAuth::parse(const std::string& header) {
        nlohmann::json body = nlohmann::json::parse(base64UrlDecode(header), nullptr, false);
        if (!body.is_object()) throw RequestBuildError("Registry credentials are not a JSON object");

        auto field = [&body](const char* key) -> std::optional<std::string> {
            auto it = body.find(key);
            if (it == body.end() || it->is_null()) return std::nullopt;
            if (!it->is_string()) throw RequestBuildError(std::string("Registry credential '") + key + "' must be a string");
            return it->get<std::string>();
        };

        if (auto identityToken = field("identitytoken"); identityToken && !identityToken->empty()) {
            return token(*identityToken);
        }
        RegistryAuth auth;
        auth.username_ = field("username").value_or("");
        auth.password_ = field("password").value_or("");
        auth.email_ = field("email");
        auth.serverAddress_ = field("serveraddress");
        return auth;
    }

    std::string RegistryAuth::json() const {
        // Insertion order is the order the daemon documents.
        nlohmann::ordered_json body = nlohmann::ordered_json::object();
        if (identityToken_) {
            body["identitytoken"] = *identityToken_;
            return body.dump();
        }
        body["username"] = username_;
        body["password"] = password_;
        if (email_) body["email"] = *email_;
        if (serverAddress_) body["serveraddress"] = *serverAddress_;
        return body.dump();
    }

    std::string RegistryAuth::serialize() const {
        return base64UrlEncode(json());
    }

    RegistryAuthBuilder& RegistryAuthBuilder::username(const std::string& username) {
        auth_.username_ = username;
        return *this;
    }

    RegistryAuthBuilder& RegistryAuthBuilder::password(const std::string& password) {
        auth_.password_ = password;
        return *this;
    }

    RegistryAuthBuilder& RegistryAuthBuilder::email(const std::string& email) {
        auth_.email_ = email;
        return *this;
    }

    RegistryAuthBuilder& RegistryAuthBuilder::serverAddress(const std::string& serverAddress) {
        auth_.serverAddress_ = serverAddress;
        return *this;
    }
}
