#pragma once

#include <array>
#include <cstddef>
#include <string>

namespace bootstrap {

/**
 * Lexical grammar of a bootstrap token.
 *
 * A token is "<id>.<secret>" where the id is exactly six characters and the
 * secret is one of the valid secret sizes, both drawn from [a-z0-9].
 * The patterns are shared with other cluster components and must not drift.
 */
class TokenGrammar {
public:
    static constexpr std::size_t kIdLength = 6;
    static constexpr std::array<std::size_t, 2> kValidSecretSizes = {16, 24};
    static constexpr char kSeparator = '.';

    static constexpr const char* kIdPattern = "[a-z0-9]{6}";
    static constexpr const char* kSecretPattern = "[a-z0-9]{16}|[a-z0-9]{24}";
    static constexpr const char* kTokenPattern = "([a-z0-9]{6})\\.([a-z0-9]{16}|[a-z0-9]{24})";

    /**
     * Check a token id against kIdPattern.
     * @param id Candidate id, without separator
     * @return true if the whole string matches
     */
    static bool isValidId(const std::string& id);

    /**
     * Check a token secret against kSecretPattern.
     * @param secret Candidate secret, without separator
     * @return true if the whole string matches
     */
    static bool isValidSecret(const std::string& secret);

    /**
     * Check a combined "<id>.<secret>" string against kTokenPattern.
     */
    static bool isValidToken(const std::string& token);

    static bool isValidSecretSize(std::size_t size);

    // Accepted secret sizes for diagnostics, e.g. "16, 24"
    static std::string validSecretSizesString();
};

} // namespace bootstrap
