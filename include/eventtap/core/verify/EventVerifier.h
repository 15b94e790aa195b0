#pragma once
#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <vector>
#include <list>
#include <thread>
#include <mutex>
#include <atomic>
#include <condition_variable>
#include "eventtap/core/event/EventFilter.h"
#include "eventtap/core/verify/EventSource.h"

namespace eventtap::core::verify {
struct VerifierOptions {
    std::chrono::milliseconds poll_interval { 100 };
    std::chrono::milliseconds default_timeout { 10000 };
    std::size_t observed_cap { 20 };  // events listed in an assertion failure
};

// Polls an EventSource until an event satisfies a filter. Holds no event state
// of its own; every wait reads the source afresh.
class EventVerifier {
public:
    explicit EventVerifier(const EventSource& source, VerifierOptions opts = {});
    // Cancels and joins outstanding background checks.
    ~EventVerifier();
    EventVerifier(const EventVerifier&) = delete;
    EventVerifier& operator=(const EventVerifier&) = delete;

    // Earliest matching record by insertion order. Throws VerificationTimeout,
    // or VerificationCancelled when cancel() interrupts the wait.
    event::EventRecord wait_for(const event::EventFilter& filter, std::chrono::milliseconds timeout,
                                std::optional<std::chrono::milliseconds> poll_interval = std::nullopt);
    // nullopt on timeout; cancellation still throws.
    std::optional<event::EventRecord> try_wait_for(const event::EventFilter& filter, std::chrono::milliseconds timeout,
                                                   std::optional<std::chrono::milliseconds> poll_interval = std::nullopt);
    // wait_for whose failure lists the events observed in the window.
    event::EventRecord assert_contains(const event::EventFilter& filter, std::chrono::milliseconds timeout);
    event::EventRecord assert_contains(const event::EventFilter& filter) { return assert_contains(filter, options.default_timeout); }
    // Only events received after the action started can satisfy the filter.
    event::EventRecord correlate_with_action(const std::function<void()>& action, event::EventFilter filter,
                                             std::chrono::milliseconds pre_delay, std::chrono::milliseconds post_timeout);
    std::vector<event::EventRecord> query_all(const event::EventFilter& filter) const;

    void expect_async(event::EventFilter filter, std::chrono::milliseconds timeout);
    // Joins every background check; throws VerificationFailure naming each one that failed.
    void await_all();
    std::size_t pending_checks();

    void cancel();
    void reset_cancel();
    bool cancelled() const { return cancel_flag.load(); }

    const VerifierOptions& config() const { return options; }

private:
    struct Check {
        std::string description;
        std::thread thread;
        std::optional<std::string> failure;
        bool done { false };
    };
    const EventSource& source;
    VerifierOptions options;
    std::atomic<bool> cancel_flag { false };
    std::mutex wait_mu;
    std::condition_variable wake;
    std::mutex checks_mu;
    std::list<Check> checks;

    // false when cancelled during the pause
    bool pause(std::chrono::milliseconds d);
    // Last observed_cap records inside the filter's time window.
    std::string observed_summary(const event::EventFilter& filter) const;
};
}
