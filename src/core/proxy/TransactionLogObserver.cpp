#include "eventtap/core/proxy/TransactionLogObserver.h"
#include <fmt/format.h>

namespace eventtap::core::proxy {
using eventtap::core::util::Logger;

void TransactionLogObserver::on_request(const InterceptedRequest& r) {
    if (!Logger::instance().enabled(Logger::Level::debug)) return;
    Logger::instance().log(Logger::Level::debug, fmt::format("req {} {}{}:{}{} body {}", r.session_id, r.method, r.tls ? " https://" : " http://", r.host, r.port, r.path, r.body.size()));
}

void TransactionLogObserver::on_transaction(const Transaction& t) {
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - t.startTime).count();
    std::string extra;
    if (!t.mitmOutcome.empty()) extra = fmt::format(" tls {}", t.mitmOutcome);
    Logger::instance().log(Logger::Level::info, fmt::format("tx {} {} status {} bytes_in {} bytes_out {} {}ms{}", t.id, t.requestLine, t.status, t.bytesIn, t.bytesOut, ms, extra));
}

std::shared_ptr<TransactionLogObserver> make_transaction_log_observer(TransactionDispatcher& d) {
    auto o = std::make_shared<TransactionLogObserver>();
    d.add(o);
    return o;
}
}
