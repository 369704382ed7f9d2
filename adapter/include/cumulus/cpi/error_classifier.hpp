#pragma once

#include "cumulus/cpi/core.hpp"
#include "cumulus/cpi/native_types.hpp"
#include <string>
#include <caf/error.hpp>

namespace cumulus {
namespace cpi {

// Backend failure -> ErrorKind. Pure and total; unmapped failures become
// unknown_backend_error. Lookup order: exact error code, code suffix, HTTP status.
class ErrorClassifier {
public:
    static ErrorKind classify(const BackendError& error);

    // Backend-category errors are decoded first; cpi-category errors keep their
    // kind; anything else (runtime, timeouts) is unknown_backend_error.
    static ErrorKind classify(const caf::error& error);

    static ErrorKind classify_code(const std::string& code);
    static ErrorKind classify_http_status(int32_t http_status);

    // Stable names used on the wire: "NotFound", "RateLimited", ...
    static std::string kind_to_string(ErrorKind kind);
    static ErrorKind string_to_kind(const std::string& name);
};

} // namespace cpi
} // namespace cumulus
