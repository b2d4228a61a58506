#pragma once
#include "lokiship/transport/transport_interface.hpp"

namespace lokiship {

class NullTransport : public ITransport {
public:
    long send(const PushPayload&) override { return 204; }
};

} // namespace lokiship
