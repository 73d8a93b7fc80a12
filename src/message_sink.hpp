#pragma once

#include <nlohmann/json.hpp>
#include <string>

namespace sdc {

// Outbound delivery to one signaling connection. Implementations must not
// call back into the room registry from send().
class MessageSink {
public:
    virtual ~MessageSink() = default;

    // False when the connection is gone or the transport refused the message
    virtual bool send(const std::string& connection_id, const nlohmann::json& message) = 0;
};

} // namespace sdc
