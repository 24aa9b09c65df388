#include "throttle/core/error_codes.hpp"

namespace throttle {
namespace core {

namespace {

std::string composeMessage(LoaderErrorCode code, const std::string& detail) {
    std::string message = LoaderErrorCodeHelper::getMessage(code);
    if (detail.empty()) {
        return message;
    }
    return detail + ". " + message;
}

}

LoaderError::LoaderError(LoaderErrorCode code, const std::string& detail)
    : std::runtime_error(composeMessage(code, detail)), code_(code) {}

const char* LoaderError::codeString() const {
    return LoaderErrorCodeHelper::toString(code_);
}

}}
