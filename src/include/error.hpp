#pragma once

#include <new>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <crow/json.h>

namespace bootstrap {

// Error categories for classifying token failures
enum class ErrorCategory {
    MalformedInput,   // Combined form is empty or has the wrong number of separators
    InvalidId,        // Token id violates the id grammar
    InvalidSecret,    // Token secret violates the secret grammar
    Decode,           // Bytes are not a JSON string / field is not a string
    Configuration     // Token file missing, unreadable or badly structured
};

// Error details structure
struct Error {
    ErrorCategory category;
    std::string message;
    std::string details;

    static Error MalformedInput(const std::string& msg, const std::string& details = "") {
        return Error{ErrorCategory::MalformedInput, msg, details};
    }

    static Error InvalidId(const std::string& msg, const std::string& details = "") {
        return Error{ErrorCategory::InvalidId, msg, details};
    }

    static Error InvalidSecret(const std::string& msg, const std::string& details = "") {
        return Error{ErrorCategory::InvalidSecret, msg, details};
    }

    static Error Decode(const std::string& msg, const std::string& details = "") {
        return Error{ErrorCategory::Decode, msg, details};
    }

    static Error Config(const std::string& msg, const std::string& details = "") {
        return Error{ErrorCategory::Configuration, msg, details};
    }

    // Convert error to JSON representation
    crow::json::wvalue toJson() const;

    // Get category name as string
    std::string getCategoryName() const;

    // "<Category>: <message> (<details>)", details omitted when empty
    std::string toString() const;
};

// Expected<T, E> holds either a success value or an error.
// Every fallible token operation returns one instead of throwing.
template<typename T, typename E = Error>
class Expected {
public:
    template<typename U,
             typename std::enable_if_t<!std::is_same_v<std::decay_t<U>, E> &&
                                       !std::is_same_v<std::decay_t<U>, Expected>,
                                       int> = 0>
    Expected(U&& val) : has_value_(true) {
        new (&value_) T(std::forward<U>(val));
    }

    template<typename U,
             typename std::enable_if_t<std::is_same_v<std::decay_t<U>, E>,
                                       int> = 0>
    Expected(U&& err) : has_value_(false) {
        new (&error_) E(std::forward<U>(err));
    }

    Expected(const Expected& other) : has_value_(other.has_value_) {
        if (has_value_) {
            new (&value_) T(other.value_);
        } else {
            new (&error_) E(other.error_);
        }
    }

    Expected(Expected&& other) noexcept : has_value_(other.has_value_) {
        if (has_value_) {
            new (&value_) T(std::move(other.value_));
        } else {
            new (&error_) E(std::move(other.error_));
        }
    }

    Expected& operator=(const Expected& other) {
        if (this != &other) {
            Expected copy(other);
            *this = std::move(copy);
        }
        return *this;
    }

    Expected& operator=(Expected&& other) noexcept {
        if (this != &other) {
            destroy();
            has_value_ = other.has_value_;
            if (has_value_) {
                new (&value_) T(std::move(other.value_));
            } else {
                new (&error_) E(std::move(other.error_));
            }
        }
        return *this;
    }

    ~Expected() {
        destroy();
    }

    bool has_value() const { return has_value_; }
    explicit operator bool() const { return has_value_; }

    T& value() {
        if (!has_value_) throw std::runtime_error("Accessing value of error Expected: " + describe());
        return value_;
    }

    const T& value() const {
        if (!has_value_) throw std::runtime_error("Accessing value of error Expected: " + describe());
        return value_;
    }

    E& error() {
        if (has_value_) throw std::runtime_error("Accessing error of success Expected");
        return error_;
    }

    const E& error() const {
        if (has_value_) throw std::runtime_error("Accessing error of success Expected");
        return error_;
    }

    T& operator*() { return value(); }
    const T& operator*() const { return value(); }

    T* operator->() { return &value(); }
    const T* operator->() const { return &value(); }

private:
    void destroy() {
        if (has_value_) {
            value_.~T();
        } else {
            error_.~E();
        }
    }

    std::string describe() const {
        if constexpr (std::is_same_v<E, Error>) {
            return error_.toString();
        } else {
            return "error";
        }
    }

    union {
        T value_;
        E error_;
    };
    bool has_value_;
};

// Result<T> means Expected<T, Error>
template<typename T>
using Result = Expected<T, Error>;

} // namespace bootstrap
