#pragma once

#include <QByteArray>

// Outbound half of the player control channel.  One call carries exactly
// one serialized message; framing is the transport's job.
class IControlTransport {
public:
    virtual ~IControlTransport() = default;

    // false when the message could not be handed to the player
    virtual bool writeMessage(const QByteArray& message) = 0;
};
