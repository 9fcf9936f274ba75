#pragma once

#include "betting.hpp"

#include <memory>

namespace hilo {

// Outbound value movement provided by the host. Used for payouts, rescues and
// fee delivery to the treasury. A recipient may refuse (return false) and may
// run arbitrary code, including calls back into the market, before returning.
class TransferGateway {
public:
    virtual ~TransferGateway() = default;
    virtual bool send(const Address& recipient, Amount amount) = 0;
};

using TransferGatewayPtr = std::shared_ptr<TransferGateway>;

} // namespace hilo
