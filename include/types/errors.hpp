#pragma once

#include <stdexcept>
#include <string>
#include <vector>

namespace ppt {

struct ConfigError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// Token acquisition failed. oauthError carries the AAD `error` code when the
// response body could be parsed (invalid_client, invalid_scope, ...).
struct AuthError : std::runtime_error {
    AuthError(const std::string& msg, long status = 0, std::string oauthError = {})
        : std::runtime_error(msg), status(status), oauthError(std::move(oauthError)) {}

    long status;
    std::string oauthError;
};

struct ApiError : std::runtime_error {
    ApiError(const std::string& msg, long status, std::string body, std::string method, std::string url)
        : std::runtime_error(msg), status(status), body(std::move(body)),
          method(std::move(method)), url(std::move(url)) {}

    long status;
    std::string body;
    std::string method;
    std::string url;
};

// 401 from Dataverse: the app registration has no application user in the
// environment, or admin consent was never granted.
struct UnauthorizedError : ApiError {
    using ApiError::ApiError;
};

struct NotFoundError : std::runtime_error {
    NotFoundError(std::string kind, std::string name)
        : std::runtime_error(kind + " not found: '" + name + "'"),
          kind(std::move(kind)), name(std::move(name)) {}

    std::string kind;
    std::string name;
};

struct RoleAssignmentError : std::runtime_error {
    RoleAssignmentError(const std::string& msg, long lastStatus, std::vector<std::string> attempts)
        : std::runtime_error(msg), lastStatus(lastStatus), attempts(std::move(attempts)) {}

    long lastStatus;
    std::vector<std::string> attempts;
};

struct BootstrapError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// The test runner could not be launched at all. A clean non-zero exit from
// the runner is a test failure, not this.
struct TestExecutionError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

}
