#include "cumulus/cpi/backends/ec2_client.hpp"
#include "cumulus/cpi/core.hpp"
#include "aws_sdk_guard.hpp"
#include <aws/core/auth/AWSCredentialsProviderChain.h>
#include <chrono>

namespace cumulus {
namespace cpi {

namespace {

const char* const ALLOC_TAG = "cumulus-cpi";

} // namespace

AwsChainCredentialProvider::AwsChainCredentialProvider()
    : sdk_(AwsSdkGuard::acquire()),
      chain_(Aws::MakeShared<Aws::Auth::DefaultAWSCredentialsProviderChain>(ALLOC_TAG)) {}

AwsChainCredentialProvider::~AwsChainCredentialProvider() {
    // The chain must go before the SDK guard
    chain_.reset();
}

caf::expected<Credentials> AwsChainCredentialProvider::get_credentials() const {
    Aws::Auth::AWSCredentials resolved = chain_->GetAWSCredentials();
    if (resolved.IsEmpty()) {
        return make_error(ErrorKind::authentication_error,
                          "no AWS credentials found in the default provider chain");
    }

    Credentials credentials;
    credentials.access_key_id = resolved.GetAWSAccessKeyId().c_str();
    credentials.secret_access_key = resolved.GetAWSSecretKey().c_str();
    credentials.session_token = resolved.GetSessionToken().c_str();

    const Aws::Utils::DateTime& expiration = resolved.GetExpiration();
    // Static credentials carry time_point::max as their expiration
    if (expiration.WasParseSuccessful()
        && expiration.UnderlyingTimestamp() != (std::chrono::system_clock::time_point::max)()) {
        credentials.expiration = expiration.UnderlyingTimestamp();
    }
    return credentials;
}

} // namespace cpi
} // namespace cumulus
