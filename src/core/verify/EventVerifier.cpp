#include "eventtap/core/verify/EventVerifier.h"
#include "eventtap/core/Error.h"
#include "eventtap/core/util/Logger.h"
#include <fmt/format.h>
#include <algorithm>

namespace eventtap::core::verify {
using eventtap::core::util::log_debug;
using eventtap::core::util::log_info;
using eventtap::core::util::log_warn;
using namespace std::chrono;

namespace {
std::string window_of(const event::EventFilter& filter, system_clock::time_point started, milliseconds timeout) {
    auto lo = filter.since ? event::format_iso8601(*filter.since) : std::string("any time");
    auto hi = filter.until ? event::format_iso8601(*filter.until) : event::format_iso8601(system_clock::now());
    return fmt::format("[{}, {}) polled from {} for {} ms", lo, hi, event::format_iso8601(started), timeout.count());
}
}

EventVerifier::EventVerifier(const EventSource& src, VerifierOptions opts) : source(src), options(opts) {
    if (options.poll_interval <= milliseconds::zero()) options.poll_interval = milliseconds(1);
}

EventVerifier::~EventVerifier() {
    cancel();
    std::list<Check> remaining;
    {
        std::lock_guard lock(checks_mu);
        remaining.swap(checks);
    }
    for (auto& c : remaining) if (c.thread.joinable()) c.thread.join();
}

bool EventVerifier::pause(milliseconds d) {
    std::unique_lock lock(wait_mu);
    return !wake.wait_for(lock, d, [this]{ return cancel_flag.load(); });
}

event::EventRecord EventVerifier::wait_for(const event::EventFilter& filter, milliseconds timeout, std::optional<milliseconds> poll_interval) {
    auto interval = poll_interval.value_or(options.poll_interval);
    if (interval <= milliseconds::zero()) interval = milliseconds(1);
    auto started = system_clock::now();
    auto deadline = steady_clock::now() + timeout;
    auto description = filter.describe();
    log_debug(fmt::format("waiting up to {} ms for {}", timeout.count(), description));
    uint64_t cursor = 0;
    while (true) {
        if (cancelled()) throw VerificationCancelled(fmt::format("wait for {} cancelled", description));
        auto fresh = source.snapshot_since(cursor);
        for (auto& r : fresh) {
            cursor = std::max(cursor, r.seq);
            if (filter.matches(r)) {
                log_info(fmt::format("matched #{} '{}' for {}", r.seq, r.name, description));
                return std::move(r);
            }
        }
        if (fresh.empty() && cursor > 0) {
            auto last = source.last_seq();
            if (last && *last < cursor) {
                log_warn(fmt::format("event source restarted at seq {} (cursor was {}), rescanning", *last, cursor));
                cursor = 0;
                continue;
            }
        }
        auto now = steady_clock::now();
        if (now >= deadline) {
            throw VerificationTimeout(fmt::format("no event matching {} within {} ms", description, timeout.count()),
                                      description, window_of(filter, started, timeout), observed_summary(filter));
        }
        if (!pause(std::min(interval, std::chrono::ceil<milliseconds>(deadline - now)))) {
            throw VerificationCancelled(fmt::format("wait for {} cancelled", description));
        }
    }
}

std::optional<event::EventRecord> EventVerifier::try_wait_for(const event::EventFilter& filter, milliseconds timeout, std::optional<milliseconds> poll_interval) {
    try {
        return wait_for(filter, timeout, poll_interval);
    } catch (const VerificationTimeout& e) {
        log_debug(e.what());
        return std::nullopt;
    }
}

event::EventRecord EventVerifier::assert_contains(const event::EventFilter& filter, milliseconds timeout) {
    try {
        return wait_for(filter, timeout);
    } catch (const VerificationTimeout& e) {
        auto report = fmt::format("expected event not observed\n  filter: {}\n  window: {}\n  observed:\n{}",
                                  e.filter(), e.window(), e.observed());
        log_warn(report);
        throw VerificationTimeout(report, e.filter(), e.window(), e.observed());
    }
}

event::EventRecord EventVerifier::correlate_with_action(const std::function<void()>& action, event::EventFilter filter,
                                                        milliseconds pre_delay, milliseconds post_timeout) {
    if (pre_delay > milliseconds::zero() && !pause(pre_delay)) {
        throw VerificationCancelled(fmt::format("correlation for {} cancelled before the action", filter.describe()));
    }
    auto action_start = system_clock::now();
    action();
    if (!filter.since || *filter.since < action_start) filter.since = action_start;
    return assert_contains(filter, post_timeout);
}

std::vector<event::EventRecord> EventVerifier::query_all(const event::EventFilter& filter) const {
    return event::select(source.snapshot_since(0), filter);
}

std::string EventVerifier::observed_summary(const event::EventFilter& filter) const {
    event::EventFilter window;
    window.since = filter.since;
    window.until = filter.until;
    auto seen = event::select(source.snapshot_since(0), window);
    if (seen.empty()) return "    (none)";
    std::string out;
    std::size_t skip = seen.size() > options.observed_cap ? seen.size() - options.observed_cap : 0;
    if (skip > 0) out += fmt::format("    ... {} earlier events not shown\n", skip);
    for (std::size_t i = skip; i < seen.size(); ++i) {
        const auto& r = seen[i];
        out += fmt::format("    #{} {} at {} batch {}", r.seq, r.name, event::format_iso8601(r.received_at), r.source_batch_id);
        if (i + 1 < seen.size()) out += '\n';
    }
    return out;
}

void EventVerifier::expect_async(event::EventFilter filter, milliseconds timeout) {
    std::lock_guard lock(checks_mu);
    checks.emplace_back();
    Check& check = checks.back();
    check.description = filter.describe();
    check.thread = std::thread([this, &check, filter = std::move(filter), timeout] {
        std::optional<std::string> failure;
        try {
            wait_for(filter, timeout);
        } catch (const VerificationFailure& e) {
            failure = e.what();
        } catch (const std::exception& e) {
            failure = fmt::format("check raised: {}", e.what());
        }
        std::lock_guard done_lock(checks_mu);
        check.failure = std::move(failure);
        check.done = true;
    });
}

std::size_t EventVerifier::pending_checks() {
    std::lock_guard lock(checks_mu);
    return static_cast<std::size_t>(std::count_if(checks.begin(), checks.end(), [](const Check& c){ return !c.done; }));
}

void EventVerifier::await_all() {
    std::list<Check> joined;
    {
        std::lock_guard lock(checks_mu);
        joined.swap(checks);
    }
    for (auto& c : joined) if (c.thread.joinable()) c.thread.join();
    std::string failures;
    std::size_t failed = 0;
    for (const auto& c : joined) {
        if (!c.failure) continue;
        ++failed;
        failures += fmt::format("\n  - {}: {}", c.description, *c.failure);
    }
    if (failed > 0) {
        throw VerificationFailure(fmt::format("{} of {} background checks failed:{}", failed, joined.size(), failures));
    }
}

void EventVerifier::cancel() {
    {
        std::lock_guard lock(wait_mu);
        cancel_flag.store(true);
    }
    wake.notify_all();
}

void EventVerifier::reset_cancel() {
    std::lock_guard lock(wait_mu);
    cancel_flag.store(false);
}
}
