#pragma once

#include "../common/error_framework.hpp"
#include <stdexcept>
#include <string>
#include <unordered_map>

namespace throttle {
namespace core {

enum class LoaderErrorCode {
    INVALID_STYLE = 100,
    INVALID_COLOR = 101,
    INVALID_FILL_CHAR = 102,
    INVALID_EMPTY_CHAR = 103,
    INVALID_TOTAL = 104,
    INVALID_BAR_LENGTH = 105,
    INVALID_REFRESH_INTERVAL = 106,
    INVALID_ITEM_DELAY = 107,

    EMPTY_INPUT = 200
};

using LoaderErrorCodeHelper = common::ErrorRegistry<LoaderErrorCode>;

// what() is "<detail>. <registry message>", or the registry message alone
// when detail is empty.
class LoaderError : public std::runtime_error {
public:
    LoaderError(LoaderErrorCode code, const std::string& detail);

    LoaderErrorCode code() const { return code_; }
    const char* codeString() const;

private:
    LoaderErrorCode code_;
};

class InvalidStyleError : public LoaderError {
public:
    explicit InvalidStyleError(const std::string& detail)
        : LoaderError(LoaderErrorCode::INVALID_STYLE, detail) {}
};

class InvalidColorError : public LoaderError {
public:
    explicit InvalidColorError(const std::string& detail)
        : LoaderError(LoaderErrorCode::INVALID_COLOR, detail) {}
};

class InvalidFillCharError : public LoaderError {
public:
    explicit InvalidFillCharError(const std::string& detail)
        : LoaderError(LoaderErrorCode::INVALID_FILL_CHAR, detail) {}
};

class InvalidEmptyCharError : public LoaderError {
public:
    explicit InvalidEmptyCharError(const std::string& detail)
        : LoaderError(LoaderErrorCode::INVALID_EMPTY_CHAR, detail) {}
};

class InvalidTotalError : public LoaderError {
public:
    explicit InvalidTotalError(const std::string& detail)
        : LoaderError(LoaderErrorCode::INVALID_TOTAL, detail) {}
};

class InvalidBarLengthError : public LoaderError {
public:
    explicit InvalidBarLengthError(const std::string& detail)
        : LoaderError(LoaderErrorCode::INVALID_BAR_LENGTH, detail) {}
};

class InvalidRefreshIntervalError : public LoaderError {
public:
    explicit InvalidRefreshIntervalError(const std::string& detail)
        : LoaderError(LoaderErrorCode::INVALID_REFRESH_INTERVAL, detail) {}
};

class InvalidItemDelayError : public LoaderError {
public:
    explicit InvalidItemDelayError(const std::string& detail)
        : LoaderError(LoaderErrorCode::INVALID_ITEM_DELAY, detail) {}
};

class EmptyInputError : public LoaderError {
public:
    explicit EmptyInputError(const std::string& detail)
        : LoaderError(LoaderErrorCode::EMPTY_INPUT, detail) {}
};

}
}

namespace throttle {
namespace common {

template<>
inline const std::unordered_map<core::LoaderErrorCode, ErrorInfo<core::LoaderErrorCode>>&
ErrorRegistry<core::LoaderErrorCode>::getInfoMap() {
    static const std::unordered_map<core::LoaderErrorCode, ErrorInfo<core::LoaderErrorCode>> map = {
        {core::LoaderErrorCode::INVALID_STYLE, {
            core::LoaderErrorCode::INVALID_STYLE,
            "INVALID_STYLE",
            "Valid styles are: bar, dots, time_clock"
        }},
        {core::LoaderErrorCode::INVALID_COLOR, {
            core::LoaderErrorCode::INVALID_COLOR,
            "INVALID_COLOR",
            "Valid colors are: blue, green, red"
        }},
        {core::LoaderErrorCode::INVALID_FILL_CHAR, {
            core::LoaderErrorCode::INVALID_FILL_CHAR,
            "INVALID_FILL_CHAR",
            "Fill character must be a single character"
        }},
        {core::LoaderErrorCode::INVALID_EMPTY_CHAR, {
            core::LoaderErrorCode::INVALID_EMPTY_CHAR,
            "INVALID_EMPTY_CHAR",
            "Empty character must be a single character"
        }},
        {core::LoaderErrorCode::INVALID_TOTAL, {
            core::LoaderErrorCode::INVALID_TOTAL,
            "INVALID_TOTAL",
            "Total must be a positive integer"
        }},
        {core::LoaderErrorCode::INVALID_BAR_LENGTH, {
            core::LoaderErrorCode::INVALID_BAR_LENGTH,
            "INVALID_BAR_LENGTH",
            "Bar length must be a positive integer"
        }},
        {core::LoaderErrorCode::INVALID_REFRESH_INTERVAL, {
            core::LoaderErrorCode::INVALID_REFRESH_INTERVAL,
            "INVALID_REFRESH_INTERVAL",
            "Refresh interval must be positive"
        }},
        {core::LoaderErrorCode::INVALID_ITEM_DELAY, {
            core::LoaderErrorCode::INVALID_ITEM_DELAY,
            "INVALID_ITEM_DELAY",
            "Item delay must not be negative"
        }},
        {core::LoaderErrorCode::EMPTY_INPUT, {
            core::LoaderErrorCode::EMPTY_INPUT,
            "EMPTY_INPUT",
            "Provide at least one item to process"
        }}
    };
    return map;
}

}}
