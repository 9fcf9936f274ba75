#pragma once

#include "fixed_point.hpp"

#include <memory>
#include <string>

namespace hilo {

struct OutcomeReport {
    Centi value;
    std::string evidence;
};

// Trusted report channel. Reports are taken at face value.
class OutcomeSource {
public:
    virtual ~OutcomeSource() = default;
    virtual OutcomeReport fetchReport() = 0;
};

using OutcomeSourcePtr = std::shared_ptr<OutcomeSource>;

} // namespace hilo
