#pragma once

#include <filesystem>
#include <string>
#include <vector>
#include <yaml-cpp/yaml.h>

#include "bootstrap_token.hpp"
#include "error.hpp"

namespace bootstrap {

/**
 * Loads bootstrap tokens from YAML files.
 *
 * Each token is stored as a single string field in its combined form:
 *
 *   token: abcdef.0123456789abcdef
 *   tokens:
 *     - abcdef.0123456789abcdef
 *     - 123456.aabbccddeeffgghhiijjkkll
 *
 * Problems with the file itself are reported as Configuration errors;
 * a present but malformed token reports the error from BootstrapToken::parse.
 */
class TokenFileLoader {
public:
    /**
     * @param file_path Path to the YAML file (relative paths are made absolute)
     */
    explicit TokenFileLoader(const std::filesystem::path& file_path);

    /**
     * Load a single token stored under a top-level key.
     *
     * @param key Mapping key holding the token string
     * @return The token or the first error encountered
     */
    Result<BootstrapToken> load(const std::string& key = "token") const;

    /**
     * Load a list of tokens stored as a sequence under a top-level key.
     * Stops at the first invalid entry and reports its index.
     *
     * @param key Mapping key holding the sequence
     * @return All tokens in file order, or the first error encountered
     */
    Result<std::vector<BootstrapToken>> loadAll(const std::string& key = "tokens") const;

    /**
     * Render a token as a one-entry YAML mapping, e.g. "token: abcdef.0123456789abcdef".
     */
    static std::string toYaml(const std::string& key, const BootstrapToken& token);

    std::filesystem::path getFilePath() const { return file_path_; }

private:
    Result<YAML::Node> loadDocument() const;
    Result<YAML::Node> lookupKey(const std::string& key) const;

    std::filesystem::path file_path_;
};

} // namespace bootstrap
