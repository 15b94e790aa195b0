#pragma once
#include "eventtap/core/proxy/Transaction.h"
#include "eventtap/core/proxy/TransactionDispatcher.h"
#include "eventtap/core/util/Logger.h"
#include <memory>

namespace eventtap::core::proxy {
class TransactionLogObserver : public TransactionObserver, public std::enable_shared_from_this<TransactionLogObserver> {
public:
    void on_request(const InterceptedRequest& r) override;
    void on_transaction(const Transaction& t) override;
};
std::shared_ptr<TransactionLogObserver> make_transaction_log_observer(TransactionDispatcher& d);
}
