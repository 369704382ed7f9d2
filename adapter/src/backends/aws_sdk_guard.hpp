#pragma once

#include <aws/core/Aws.h>
#include <memory>
#include <mutex>

namespace cumulus {
namespace cpi {

// Reference-counted Aws::InitAPI / Aws::ShutdownAPI.
// The SDK is initialized by the first holder and shut down with the last one.
class AwsSdkGuard {
public:
    static std::shared_ptr<AwsSdkGuard> acquire() {
        static std::mutex mutex;
        static std::weak_ptr<AwsSdkGuard> current;

        std::lock_guard<std::mutex> guard(mutex);
        if (auto existing = current.lock()) {
            return existing;
        }
        std::shared_ptr<AwsSdkGuard> created(new AwsSdkGuard());
        current = created;
        return created;
    }

    ~AwsSdkGuard() {
        Aws::ShutdownAPI(options_);
    }

    AwsSdkGuard(const AwsSdkGuard&) = delete;
    AwsSdkGuard& operator=(const AwsSdkGuard&) = delete;

private:
    AwsSdkGuard() {
        Aws::InitAPI(options_);
    }

    Aws::SDKOptions options_;
};

} // namespace cpi
} // namespace cumulus
