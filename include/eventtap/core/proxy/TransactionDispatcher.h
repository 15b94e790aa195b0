#pragma once
#include <vector>
#include <memory>
#include <mutex>
#include "eventtap/core/proxy/Transaction.h"

namespace eventtap::core::proxy {
class TransactionDispatcher {
public:
    void add(std::shared_ptr<TransactionObserver> obs);
    void publish_request(const InterceptedRequest& r);
    void publish(const Transaction& t);
private:
    std::mutex guard;
    std::vector<std::weak_ptr<TransactionObserver>> observers;
    std::vector<std::shared_ptr<TransactionObserver>> alive();
};
}
