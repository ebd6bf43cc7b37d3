/**
 * @file MessageDispatcher.h
 * @brief Routes reassembled messages to exactly one consumer
 *
 * Priority consumers (interceptors) are offered each message first, in
 * registration order; the first one that claims it consumes it. The voice
 * pipeline registers here so latency-sensitive voice traffic never waits
 * behind general handling. Everything else goes to the single generic
 * handler. Types outside the message catalogue, and messages with no
 * consumer, are dropped silently.
 */
#pragma once

#include "LinkTypes.h"
#include "Messages.h"
#include "Bytes.h"

#include <functional>
#include <mutex>
#include <vector>

namespace Tapir { namespace BLE {

/**
 * @brief Priority consumer of application messages
 */
class IMessageInterceptor {
public:
    virtual ~IMessageInterceptor() = default;

    /**
     * @brief Offer a message
     * @return true if the message was consumed
     */
    virtual bool intercept(const Message& message) = 0;
};

class MessageDispatcher {
public:
    using Handler = std::function<void(const Message& message)>;

    struct Stats {
        uint32_t dispatched = 0;
        uint32_t intercepted = 0;
        uint32_t handled = 0;
        uint32_t dropped_unknown = 0;
        uint32_t dropped_unhandled = 0;
        uint32_t malformed = 0;
    };

public:
    MessageDispatcher() = default;

    /**
     * @brief Register a priority consumer (not owned)
     */
    void addInterceptor(IMessageInterceptor* interceptor);
    void removeInterceptor(IMessageInterceptor* interceptor);

    /**
     * @brief Set the generic handler for everything not intercepted
     */
    void setHandler(Handler handler);

    /**
     * @brief Parse raw message bytes and route them
     * @return true if a consumer took the message
     */
    bool dispatch(const Bytes& raw);

    bool dispatch(const Message& message);

    Stats stats() const;

private:
    std::vector<IMessageInterceptor*> _interceptors;
    Handler _handler = nullptr;
    Stats _stats;
    mutable std::recursive_mutex _mutex;
};

}} // namespace Tapir::BLE
