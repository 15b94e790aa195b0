#include "eventtap/core/proxy/TransactionDispatcher.h"
#include <algorithm>

namespace eventtap::core::proxy {
void TransactionDispatcher::add(std::shared_ptr<TransactionObserver> obs) {
    std::lock_guard lock(guard);
    observers.push_back(obs);
}

std::vector<std::shared_ptr<TransactionObserver>> TransactionDispatcher::alive() {
    std::vector<std::shared_ptr<TransactionObserver>> out;
    std::lock_guard lock(guard);
    for (auto& w : observers) {
        if (auto s = w.lock()) out.push_back(std::move(s));
    }
    // drop expired observers
    observers.erase(std::remove_if(observers.begin(), observers.end(), [](const auto& w){ return w.expired(); }), observers.end());
    return out;
}

void TransactionDispatcher::publish_request(const InterceptedRequest& r) {
    for (auto& o : alive()) o->on_request(r);
}

void TransactionDispatcher::publish(const Transaction& t) {
    for (auto& o : alive()) o->on_transaction(t);
}
}
