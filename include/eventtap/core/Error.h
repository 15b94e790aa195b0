#pragma once
#include <stdexcept>
#include <string>

namespace eventtap::core {
// Fatal setup failure (port bind, proxy launch). The session must not continue.
class SetupError : public std::runtime_error {
public:
    explicit SetupError(const std::string& what) : std::runtime_error(what) {}
};

// An expected event was not observed, or a background check failed.
class VerificationFailure : public std::runtime_error {
public:
    explicit VerificationFailure(const std::string& what) : std::runtime_error(what) {}
};

class VerificationTimeout : public VerificationFailure {
public:
    VerificationTimeout(const std::string& what, std::string filter, std::string window, std::string observed)
        : VerificationFailure(what), filter_(std::move(filter)), window_(std::move(window)), observed_(std::move(observed)) {}
    const std::string& filter() const { return filter_; }
    const std::string& window() const { return window_; }
    const std::string& observed() const { return observed_; }
private:
    std::string filter_;
    std::string window_;
    std::string observed_;
};

// Raised from a wait that was abandoned through EventVerifier::cancel().
class VerificationCancelled : public VerificationFailure {
public:
    explicit VerificationCancelled(const std::string& what) : VerificationFailure(what) {}
};
}
