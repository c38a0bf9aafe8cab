#pragma once

#include <ostream>
#include <string>
#include <crow/json.h>
#include <yaml-cpp/yaml.h>

#include "error.hpp"

namespace bootstrap {

/**
 * Bootstrap token used by a new member to join the cluster.
 *
 * The token is a pair of id and secret with the combined form "<id>.<secret>".
 * Instances returned by the factory functions always satisfy TokenGrammar;
 * downstream code can rely on that and must not re-validate.
 *
 * In documents the token occupies a single string field holding the combined
 * form, never an object with separate id/secret members.
 *
 * The secret is sensitive. Use redacted() or operator<< for anything that
 * ends up in logs or user-facing output.
 *
 * Usage:
 *   auto token = BootstrapToken::parse("abcdef.0123456789abcdef");
 *   if (!token) {
 *       std::cerr << token.error().toString();
 *   }
 */
class BootstrapToken {
public:
    /**
     * Empty token with no id and no secret.
     * This is what a default-initialized document field holds; it is not a
     * valid credential and empty() reports it.
     */
    BootstrapToken() = default;

    /**
     * Parse the combined "<id>.<secret>" form.
     *
     * @param raw Combined token string
     * @return The token, or MalformedInput / InvalidId / InvalidSecret
     */
    static Result<BootstrapToken> parse(const std::string& raw);

    /**
     * Build a token from an id and a secret that were already split.
     *
     * @param id Token id
     * @param secret Token secret
     * @return The token, or InvalidId / InvalidSecret
     */
    static Result<BootstrapToken> fromIdAndSecret(const std::string& id, const std::string& secret);

    /**
     * Decode a JSON document consisting of a single string value.
     *
     * @param json Raw JSON bytes, e.g. "\"abcdef.0123456789abcdef\""
     * @return The token, Decode if the bytes are not a JSON string,
     *         otherwise whatever parse() reports
     */
    static Result<BootstrapToken> fromJson(const std::string& json);

    /**
     * Decode a token field of an already parsed JSON document.
     */
    static Result<BootstrapToken> fromJsonValue(const crow::json::rvalue& value);

    const std::string& id() const { return id_; }
    const std::string& secret() const { return secret_; }

    bool empty() const { return id_.empty() && secret_.empty(); }

    // Combined "<id>.<secret>" form
    std::string toString() const;

    // JSON string literal of the combined form. Does not re-validate.
    std::string toJson() const;

    // String value for embedding into a JSON document
    crow::json::wvalue toJsonValue() const;

    // "<id>." followed by one '*' per secret character
    std::string redacted() const;

    bool operator==(const BootstrapToken& other) const {
        return id_ == other.id_ && secret_ == other.secret_;
    }

    bool operator!=(const BootstrapToken& other) const {
        return !(*this == other);
    }

private:
    BootstrapToken(std::string id, std::string secret);

    std::string id_;
    std::string secret_;
};

// Writes the redacted form
std::ostream& operator<<(std::ostream& os, const BootstrapToken& token);

} // namespace bootstrap

namespace YAML {

// A token is a plain scalar in YAML documents
template<>
struct convert<bootstrap::BootstrapToken> {
    static Node encode(const bootstrap::BootstrapToken& token) {
        return Node(token.toString());
    }

    static bool decode(const Node& node, bootstrap::BootstrapToken& token) {
        if (!node.IsScalar()) {
            return false;
        }
        auto parsed = bootstrap::BootstrapToken::parse(node.Scalar());
        if (!parsed) {
            return false;
        }
        token = parsed.value();
        return true;
    }
};

} // namespace YAML
