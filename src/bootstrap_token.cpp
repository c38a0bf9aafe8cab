#include "bootstrap_token.hpp"

#include <algorithm>
#include <cctype>
#include <utility>

#include "token_grammar.hpp"

namespace bootstrap {

namespace {

// Echo the id only when it is kIdLength printable characters
Error invalidIdError(const std::string& id) {
    bool printable = std::all_of(id.begin(), id.end(), [](unsigned char c) {
        return std::isprint(c);
    });
    std::string subject = (id.size() == TokenGrammar::kIdLength && printable)
        ? "id '" + id + "'"
        : "id of length " + std::to_string(id.size());
    return Error::InvalidId(
        "Bootstrap token id is invalid",
        subject + " must be " + std::to_string(TokenGrammar::kIdLength) +
        " characters matching [a-z0-9]");
}

// The secret itself never appears in the message
Error invalidSecretError(const std::string& secret) {
    return Error::InvalidSecret(
        "Bootstrap token secret is invalid",
        "secret of length " + std::to_string(secret.size()) + " must be one of " +
        TokenGrammar::validSecretSizesString() + " characters matching [a-z0-9]");
}

std::string jsonTypeName(crow::json::type t) {
    switch (t) {
        case crow::json::type::Null:
            return "null";
        case crow::json::type::False:
        case crow::json::type::True:
            return "boolean";
        case crow::json::type::Number:
            return "number";
        case crow::json::type::String:
            return "string";
        case crow::json::type::List:
            return "array";
        case crow::json::type::Object:
            return "object";
        default:
            return "unknown";
    }
}

} // namespace

BootstrapToken::BootstrapToken(std::string id, std::string secret)
    : id_(std::move(id)), secret_(std::move(secret)) {}

Result<BootstrapToken> BootstrapToken::parse(const std::string& raw) {
    if (raw.empty()) {
        return Error::MalformedInput("Bootstrap token is empty",
                                     "expected the form <id>.<secret>");
    }

    auto separators = std::count(raw.begin(), raw.end(), TokenGrammar::kSeparator);
    if (separators != 1) {
        return Error::MalformedInput(
            "Bootstrap token is not of the form <id>.<secret>",
            "expected exactly one '" + std::string(1, TokenGrammar::kSeparator) +
            "' separator, found " + std::to_string(separators));
    }

    auto pos = raw.find(TokenGrammar::kSeparator);
    return fromIdAndSecret(raw.substr(0, pos), raw.substr(pos + 1));
}

Result<BootstrapToken> BootstrapToken::fromIdAndSecret(const std::string& id, const std::string& secret) {
    if (!TokenGrammar::isValidId(id)) {
        return invalidIdError(id);
    }
    if (!TokenGrammar::isValidSecret(secret)) {
        return invalidSecretError(secret);
    }
    return BootstrapToken(id, secret);
}

Result<BootstrapToken> BootstrapToken::fromJson(const std::string& json) {
    auto value = crow::json::load(json);
    if (!value) {
        return Error::Decode("Bootstrap token is not valid JSON",
                             "expected a JSON string such as \"<id>.<secret>\"");
    }
    return fromJsonValue(value);
}

Result<BootstrapToken> BootstrapToken::fromJsonValue(const crow::json::rvalue& value) {
    if (value.t() != crow::json::type::String) {
        return Error::Decode("Bootstrap token must be a JSON string",
                             "got " + jsonTypeName(value.t()));
    }
    return parse(std::string(value.s()));
}

std::string BootstrapToken::toString() const {
    return id_ + TokenGrammar::kSeparator + secret_;
}

std::string BootstrapToken::toJson() const {
    return toJsonValue().dump();
}

crow::json::wvalue BootstrapToken::toJsonValue() const {
    return crow::json::wvalue(toString());
}

std::string BootstrapToken::redacted() const {
    return id_ + TokenGrammar::kSeparator + std::string(secret_.size(), '*');
}

std::ostream& operator<<(std::ostream& os, const BootstrapToken& token) {
    return os << token.redacted();
}

} // namespace bootstrap
