#include "error.hpp"

namespace bootstrap {

std::string Error::getCategoryName() const {
    switch (category) {
        case ErrorCategory::MalformedInput:
            return "MalformedInput";
        case ErrorCategory::InvalidId:
            return "InvalidId";
        case ErrorCategory::InvalidSecret:
            return "InvalidSecret";
        case ErrorCategory::Decode:
            return "Decode";
        case ErrorCategory::Configuration:
            return "Configuration";
        default:
            return "Unknown";
    }
}

std::string Error::toString() const {
    std::string result = getCategoryName() + ": " + message;
    if (!details.empty()) {
        result += " (" + details + ")";
    }
    return result;
}

crow::json::wvalue Error::toJson() const {
    crow::json::wvalue error_json;
    error_json["success"] = false;
    error_json["error"]["category"] = getCategoryName();
    error_json["error"]["message"] = message;

    if (!details.empty()) {
        error_json["error"]["details"] = details;
    }

    return error_json;
}

} // namespace bootstrap
