#pragma once

#include <chrono>
#include <memory>
#include <optional>

#include <voxturn/core/messages.hpp>

namespace voxturn {

// Sequence of inbound messages for one turn.
class InboundStream {
public:
    virtual ~InboundStream() = default;

    // Blocks for the next message. Empty optional on a clean end of stream;
    // throws TransportError when the call failed.
    virtual std::optional<InboundMessage> read() = 0;
};

// One duplex call (one turn attempt).
class AssistCall : public InboundStream {
public:
    // Blocks until the transport can take the message. False once the call
    // is no longer writable.
    virtual bool write(const OutboundMessage& msg) = 0;

    // Half-close: no more outbound messages.
    virtual void writesDone() = 0;

    // Tear the call down; unblocks pending read()/write().
    virtual void cancel() = 0;
};

class AssistTransport {
public:
    virtual ~AssistTransport() = default;

    virtual std::unique_ptr<AssistCall> open(std::chrono::seconds deadline) = 0;
};

} // namespace voxturn
