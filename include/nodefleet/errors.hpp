#pragma once
#include <stdexcept>
#include <string>

#include <grpcpp/grpcpp.h>

namespace nodefleet {
    // Fatal: the fleet could not be brought up at all.
    class StartupError : public std::runtime_error {
    public:
        explicit StartupError(const std::string& what) : std::runtime_error(what) {}
    };

    // The provider refused or failed a launch request.
    class LaunchError : public std::runtime_error {
    public:
        LaunchError(grpc::StatusCode code, const std::string& what)
            : std::runtime_error(what), code_(code) {}

        grpc::StatusCode code() const { return code_; }

        bool is_auth_failure() const {
            return code_ == grpc::StatusCode::UNAUTHENTICATED
                || code_ == grpc::StatusCode::PERMISSION_DENIED;
        }

    private:
        grpc::StatusCode code_;
    };
} // namespace nodefleet
