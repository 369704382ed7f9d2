#include <iostream>
#include <cassert>
#include <string>
#include "cumulus/cpi/error_classifier.hpp"
#include <caf/sec.hpp>

using namespace cumulus::cpi;

void test_exact_codes() {
    std::cout << "Testing exact error codes..." << std::endl;

    assert(ErrorClassifier::classify_code("AuthFailure") == ErrorKind::authentication_error);
    assert(ErrorClassifier::classify_code("UnauthorizedOperation") == ErrorKind::authentication_error);
    assert(ErrorClassifier::classify_code("RequestLimitExceeded") == ErrorKind::rate_limited);
    assert(ErrorClassifier::classify_code("VolumeInUse") == ErrorKind::conflict);
    assert(ErrorClassifier::classify_code("IncorrectInstanceState") == ErrorKind::conflict);
    assert(ErrorClassifier::classify_code("InvalidParameterValue") == ErrorKind::invalid_parameters);
    assert(ErrorClassifier::classify_code("MissingParameter") == ErrorKind::invalid_parameters);
    assert(ErrorClassifier::classify_code("InvalidInstanceID.NotFound") == ErrorKind::not_found);
    assert(ErrorClassifier::classify_code("InvalidVolume.NotFound") == ErrorKind::not_found);
    assert(ErrorClassifier::classify_code("InvalidSnapshot.NotFound") == ErrorKind::not_found);

    std::cout << "✓ Exact error codes test passed" << std::endl;
}

void test_code_suffixes() {
    std::cout << "Testing error code suffixes..." << std::endl;

    assert(ErrorClassifier::classify_code("InvalidKeyPair.NotFound") == ErrorKind::not_found);
    assert(ErrorClassifier::classify_code("InvalidInstanceID.Malformed") == ErrorKind::invalid_parameters);
    // Zone lookups are request arguments, not referenced resources
    assert(ErrorClassifier::classify_code("InvalidZone.NotFound") == ErrorKind::invalid_parameters);
    assert(ErrorClassifier::classify_code("") == ErrorKind::unknown_backend_error);
    assert(ErrorClassifier::classify_code("InsufficientInstanceCapacity") == ErrorKind::unknown_backend_error);

    std::cout << "✓ Error code suffixes test passed" << std::endl;
}

void test_http_status_fallback() {
    std::cout << "Testing HTTP status fallback..." << std::endl;

    assert(ErrorClassifier::classify(BackendError{401, "", "unauthorized"}) == ErrorKind::authentication_error);
    assert(ErrorClassifier::classify(BackendError{403, "Weird", "forbidden"}) == ErrorKind::authentication_error);
    assert(ErrorClassifier::classify(BackendError{404, "", ""}) == ErrorKind::not_found);
    assert(ErrorClassifier::classify(BackendError{409, "", ""}) == ErrorKind::conflict);
    assert(ErrorClassifier::classify(BackendError{429, "", ""}) == ErrorKind::rate_limited);
    assert(ErrorClassifier::classify(BackendError{500, "InternalError", ""}) == ErrorKind::unknown_backend_error);
    assert(ErrorClassifier::classify(BackendError{0, "", "connection refused"}) == ErrorKind::unknown_backend_error);

    // The code wins over the status
    assert(ErrorClassifier::classify(BackendError{400, "RequestLimitExceeded", ""}) == ErrorKind::rate_limited);

    std::cout << "✓ HTTP status fallback test passed" << std::endl;
}

void test_classify_caf_errors() {
    std::cout << "Testing classify on caf::error..." << std::endl;

    caf::error backend = make_backend_error(400, "InvalidVolume.NotFound", "The volume 'vol-1' does not exist");
    assert(is_backend_error(backend));
    assert(ErrorClassifier::classify(backend) == ErrorKind::not_found);

    BackendError native = to_backend_error(backend);
    assert(native.http_status == 400);
    assert(native.code == "InvalidVolume.NotFound");
    assert(native.message == "The volume 'vol-1' does not exist");
    assert(error_message(backend) == "The volume 'vol-1' does not exist");

    caf::error cpi = make_error(ErrorKind::conflict, "busy");
    assert(!is_backend_error(cpi));
    assert(ErrorClassifier::classify(cpi) == ErrorKind::conflict);
    assert(error_message(cpi) == "busy");

    caf::error runtime = caf::make_error(caf::sec::request_timeout);
    assert(ErrorClassifier::classify(runtime) == ErrorKind::unknown_backend_error);

    assert(ErrorClassifier::classify(caf::error{}) == ErrorKind::none);

    std::cout << "✓ classify on caf::error test passed" << std::endl;
}

void test_kind_names() {
    std::cout << "Testing kind names..." << std::endl;

    assert(ErrorClassifier::kind_to_string(ErrorKind::invalid_parameters) == "InvalidParameters");
    assert(ErrorClassifier::kind_to_string(ErrorKind::not_found) == "NotFound");
    assert(ErrorClassifier::kind_to_string(ErrorKind::authentication_error) == "AuthenticationError");
    assert(ErrorClassifier::kind_to_string(ErrorKind::rate_limited) == "RateLimited");
    assert(ErrorClassifier::kind_to_string(ErrorKind::conflict) == "Conflict");
    assert(ErrorClassifier::kind_to_string(ErrorKind::unknown_backend_error) == "UnknownBackendError");
    assert(ErrorClassifier::kind_to_string(ErrorKind::unsupported_action) == "UnsupportedAction");

    assert(ErrorClassifier::string_to_kind("RateLimited") == ErrorKind::rate_limited);
    assert(ErrorClassifier::string_to_kind("Bogus") == ErrorKind::unknown_backend_error);

    std::cout << "✓ Kind names test passed" << std::endl;
}

int main() {
    std::cout << "Running Error Classifier Tests..." << std::endl;
    std::cout << "===========================================" << std::endl;

    try {
        std::cout << "\n[Code Tests]" << std::endl;
        test_exact_codes();
        test_code_suffixes();

        std::cout << "\n[Status Tests]" << std::endl;
        test_http_status_fallback();

        std::cout << "\n[Error Transport Tests]" << std::endl;
        test_classify_caf_errors();
        test_kind_names();

        std::cout << "\n===========================================" << std::endl;
        std::cout << "✅ All error classifier tests passed!" << std::endl;
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "\n❌ Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
