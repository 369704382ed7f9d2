#include "cumulus/cpi/error_classifier.hpp"
#include <unordered_map>

namespace cumulus {
namespace cpi {

namespace {

bool ends_with(const std::string& value, const std::string& suffix) {
    return value.size() >= suffix.size()
           && value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// EC2 error codes observed so far. Extend as new codes show up; anything missing
// falls through to the suffix and status rules.
const std::unordered_map<std::string, ErrorKind>& code_table() {
    static const std::unordered_map<std::string, ErrorKind> table = {
        // Credentials / authorization
        {"AuthFailure", ErrorKind::authentication_error},
        {"UnauthorizedOperation", ErrorKind::authentication_error},
        {"InvalidClientTokenId", ErrorKind::authentication_error},
        {"SignatureDoesNotMatch", ErrorKind::authentication_error},
        {"MissingAuthenticationToken", ErrorKind::authentication_error},
        {"ExpiredToken", ErrorKind::authentication_error},
        {"RequestExpired", ErrorKind::authentication_error},
        {"AccessDenied", ErrorKind::authentication_error},
        {"AccessDeniedException", ErrorKind::authentication_error},
        {"OptInRequired", ErrorKind::authentication_error},
        {"Blocked", ErrorKind::authentication_error},
        {"PendingVerification", ErrorKind::authentication_error},

        // Throttling
        {"RequestLimitExceeded", ErrorKind::rate_limited},
        {"Throttling", ErrorKind::rate_limited},
        {"ThrottlingException", ErrorKind::rate_limited},
        {"TooManyRequestsException", ErrorKind::rate_limited},
        {"SlowDown", ErrorKind::rate_limited},

        // Resource state conflicts
        {"VolumeInUse", ErrorKind::conflict},
        {"IncorrectState", ErrorKind::conflict},
        {"IncorrectInstanceState", ErrorKind::conflict},
        {"InvalidState", ErrorKind::conflict},
        {"InvalidSnapshot.InUse", ErrorKind::conflict},
        {"InvalidVolume.AttachmentInUse", ErrorKind::conflict},
        {"IncorrectModificationState", ErrorKind::conflict},
        {"DependencyViolation", ErrorKind::conflict},
        {"IdempotentParameterMismatch", ErrorKind::conflict},

        // Malformed requests
        {"InvalidParameter", ErrorKind::invalid_parameters},
        {"InvalidParameterValue", ErrorKind::invalid_parameters},
        {"InvalidParameterCombination", ErrorKind::invalid_parameters},
        {"MissingParameter", ErrorKind::invalid_parameters},
        {"UnknownParameter", ErrorKind::invalid_parameters},
        {"ValidationError", ErrorKind::invalid_parameters},
        {"InvalidInput", ErrorKind::invalid_parameters},
        {"Unsupported", ErrorKind::invalid_parameters},
        {"InvalidVolume.ZoneMismatch", ErrorKind::invalid_parameters},
        // A zone is a request argument, not a referenced resource
        {"InvalidZone.NotFound", ErrorKind::invalid_parameters},

        // Referenced resources
        {"InvalidInstanceID.NotFound", ErrorKind::not_found},
        {"InvalidVolume.NotFound", ErrorKind::not_found},
        {"InvalidSnapshot.NotFound", ErrorKind::not_found},
        {"InvalidAMIID.NotFound", ErrorKind::not_found},
        {"InvalidAttachment.NotFound", ErrorKind::not_found}
    };
    return table;
}

} // namespace

ErrorKind ErrorClassifier::classify_code(const std::string& code) {
    if (code.empty()) {
        return ErrorKind::unknown_backend_error;
    }

    const auto& table = code_table();
    auto it = table.find(code);
    if (it != table.end()) {
        return it->second;
    }

    if (ends_with(code, ".NotFound")) {
        return ErrorKind::not_found;
    }
    if (ends_with(code, ".Malformed")) {
        return ErrorKind::invalid_parameters;
    }
    return ErrorKind::unknown_backend_error;
}

ErrorKind ErrorClassifier::classify_http_status(int32_t http_status) {
    switch (http_status) {
        case 401:
        case 403:
            return ErrorKind::authentication_error;
        case 404:
            return ErrorKind::not_found;
        case 409:
            return ErrorKind::conflict;
        case 429:
            return ErrorKind::rate_limited;
        default:
            return ErrorKind::unknown_backend_error;
    }
}

ErrorKind ErrorClassifier::classify(const BackendError& error) {
    ErrorKind by_code = classify_code(error.code);
    if (by_code != ErrorKind::unknown_backend_error) {
        return by_code;
    }
    return classify_http_status(error.http_status);
}

ErrorKind ErrorClassifier::classify(const caf::error& error) {
    if (!error) {
        return ErrorKind::none;
    }
    if (is_backend_error(error)) {
        return classify(to_backend_error(error));
    }
    if (error.category() == caf::atom("cpi")) {
        auto code = error.code();
        if (code >= static_cast<uint8_t>(ErrorKind::invalid_parameters)
            && code <= static_cast<uint8_t>(ErrorKind::unsupported_action)) {
            return static_cast<ErrorKind>(code);
        }
    }
    return ErrorKind::unknown_backend_error;
}

std::string ErrorClassifier::kind_to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::none:
            return "None";
        case ErrorKind::invalid_parameters:
            return "InvalidParameters";
        case ErrorKind::not_found:
            return "NotFound";
        case ErrorKind::authentication_error:
            return "AuthenticationError";
        case ErrorKind::rate_limited:
            return "RateLimited";
        case ErrorKind::conflict:
            return "Conflict";
        case ErrorKind::unknown_backend_error:
            return "UnknownBackendError";
        case ErrorKind::unsupported_action:
            return "UnsupportedAction";
        default:
            return "UnknownBackendError";
    }
}

ErrorKind ErrorClassifier::string_to_kind(const std::string& name) {
    if (name == "None") {
        return ErrorKind::none;
    } else if (name == "InvalidParameters") {
        return ErrorKind::invalid_parameters;
    } else if (name == "NotFound") {
        return ErrorKind::not_found;
    } else if (name == "AuthenticationError") {
        return ErrorKind::authentication_error;
    } else if (name == "RateLimited") {
        return ErrorKind::rate_limited;
    } else if (name == "Conflict") {
        return ErrorKind::conflict;
    } else if (name == "UnsupportedAction") {
        return ErrorKind::unsupported_action;
    }
    return ErrorKind::unknown_backend_error;
}

} // namespace cpi
} // namespace cumulus
