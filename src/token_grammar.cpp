#include "token_grammar.hpp"

#include <algorithm>
#include <regex>

namespace bootstrap {

namespace {

const std::regex& idRegex() {
    static const std::regex pattern(TokenGrammar::kIdPattern);
    return pattern;
}

const std::regex& secretRegex() {
    static const std::regex pattern(TokenGrammar::kSecretPattern);
    return pattern;
}

const std::regex& tokenRegex() {
    static const std::regex pattern(TokenGrammar::kTokenPattern);
    return pattern;
}

} // namespace

bool TokenGrammar::isValidId(const std::string& id) {
    return std::regex_match(id, idRegex());
}

bool TokenGrammar::isValidSecret(const std::string& secret) {
    return std::regex_match(secret, secretRegex());
}

bool TokenGrammar::isValidToken(const std::string& token) {
    return std::regex_match(token, tokenRegex());
}

bool TokenGrammar::isValidSecretSize(std::size_t size) {
    return std::find(kValidSecretSizes.begin(), kValidSecretSizes.end(), size) != kValidSecretSizes.end();
}

std::string TokenGrammar::validSecretSizesString() {
    std::string result;
    for (std::size_t size : kValidSecretSizes) {
        if (!result.empty()) {
            result += ", ";
        }
        result += std::to_string(size);
    }
    return result;
}

} // namespace bootstrap
