#include "cumulus/cpi/native_types.hpp"
#include "cumulus/cpi/core.hpp"
#include <caf/atom.hpp>
#include <caf/message.hpp>

namespace cumulus {
namespace cpi {

namespace {

constexpr uint8_t backend_request_failed = 1;

constexpr caf::atom_value backend_category = caf::atom("backend");

} // namespace

caf::error make_backend_error(BackendError err) {
    return caf::error{backend_request_failed, backend_category,
                      caf::make_message(err.http_status, std::move(err.code),
                                        std::move(err.message))};
}

caf::error make_backend_error(int32_t http_status, std::string code, std::string message) {
    return make_backend_error(BackendError{http_status, std::move(code), std::move(message)});
}

bool is_backend_error(const caf::error& err) {
    return err && err.category() == backend_category
           && err.context().match_elements<int32_t, std::string, std::string>();
}

BackendError to_backend_error(const caf::error& err) {
    BackendError result;
    if (is_backend_error(err)) {
        const auto& ctx = err.context();
        result.http_status = ctx.get_as<int32_t>(0);
        result.code = ctx.get_as<std::string>(1);
        result.message = ctx.get_as<std::string>(2);
        return result;
    }
    result.message = error_message(err);
    return result;
}

std::string error_message(const caf::error& err) {
    if (!err) {
        return "";
    }
    const auto& ctx = err.context();
    if (is_backend_error(err)) {
        return ctx.get_as<std::string>(2);
    }
    if (err.category() == caf::atom("cpi") && ctx.match_elements<std::string>()) {
        return ctx.get_as<std::string>(0);
    }
    return caf::to_string(err);
}

} // namespace cpi
} // namespace cumulus
