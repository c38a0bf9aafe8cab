#include "token_file_loader.hpp"
#include <crow/logging.h>

namespace bootstrap {

TokenFileLoader::TokenFileLoader(const std::filesystem::path& file_path)
    : file_path_(std::filesystem::absolute(file_path)) {
    CROW_LOG_DEBUG << "TokenFileLoader initialized with token file: " << file_path_.string();
}

Result<YAML::Node> TokenFileLoader::loadDocument() const {
    std::string path_str = file_path_.string();

    std::error_code ec;
    if (!std::filesystem::is_regular_file(file_path_, ec)) {
        return Error::Config("Token file not found", path_str);
    }

    CROW_LOG_DEBUG << "Loading YAML file: " << path_str;

    YAML::Node document;
    try {
        document = YAML::LoadFile(path_str);
    } catch (const YAML::Exception& e) {
        return Error::Config("Failed to parse token file", path_str + ": " + e.what());
    }

    if (!document.IsMap()) {
        return Error::Config("Token file must contain a YAML mapping", path_str);
    }
    return document;
}

Result<YAML::Node> TokenFileLoader::lookupKey(const std::string& key) const {
    auto document = loadDocument();
    if (!document) {
        return document.error();
    }

    YAML::Node node = document.value()[key];
    if (!node.IsDefined() || node.IsNull()) {
        return Error::Config("Missing required field: " + key, file_path_.string());
    }
    return node;
}

Result<BootstrapToken> TokenFileLoader::load(const std::string& key) const {
    auto node = lookupKey(key);
    if (!node) {
        return node.error();
    }

    if (!node->IsScalar()) {
        return Error::Config("Field '" + key + "' must be a string", file_path_.string());
    }

    auto token = BootstrapToken::parse(node->Scalar());
    if (token) {
        CROW_LOG_DEBUG << "Loaded bootstrap token with id '" << token->id() << "' from " << file_path_.string();
    }
    return token;
}

Result<std::vector<BootstrapToken>> TokenFileLoader::loadAll(const std::string& key) const {
    auto node = lookupKey(key);
    if (!node) {
        return node.error();
    }

    if (!node->IsSequence()) {
        return Error::Config("Field '" + key + "' must be a list of strings", file_path_.string());
    }

    std::vector<BootstrapToken> tokens;
    tokens.reserve(node->size());

    for (std::size_t i = 0; i < node->size(); ++i) {
        YAML::Node entry = (*node)[i];
        std::string location = key + "[" + std::to_string(i) + "]";

        if (!entry.IsScalar()) {
            return Error::Config("Field '" + location + "' must be a string", file_path_.string());
        }

        auto token = BootstrapToken::parse(entry.Scalar());
        if (!token) {
            Error err = token.error();
            err.details = location + ": " + err.details;
            return err;
        }
        tokens.push_back(token.value());
    }

    CROW_LOG_DEBUG << "Loaded " << tokens.size() << " bootstrap tokens from " << file_path_.string();
    return tokens;
}

std::string TokenFileLoader::toYaml(const std::string& key, const BootstrapToken& token) {
    YAML::Node document;
    document[key] = token;

    YAML::Emitter out;
    out << document;
    return out.c_str();
}

} // namespace bootstrap
