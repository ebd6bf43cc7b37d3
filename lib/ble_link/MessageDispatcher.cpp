/**
 * @file MessageDispatcher.cpp
 * @brief Message dispatcher implementation
 */

#include "MessageDispatcher.h"
#include "Log.h"

#include <algorithm>
#include <cstdio>

namespace Tapir { namespace BLE {

void MessageDispatcher::addInterceptor(IMessageInterceptor* interceptor) {
    if (!interceptor) return;
    std::lock_guard<std::recursive_mutex> lock(_mutex);
    if (std::find(_interceptors.begin(), _interceptors.end(), interceptor) == _interceptors.end()) {
        _interceptors.push_back(interceptor);
    }
}

void MessageDispatcher::removeInterceptor(IMessageInterceptor* interceptor) {
    std::lock_guard<std::recursive_mutex> lock(_mutex);
    _interceptors.erase(std::remove(_interceptors.begin(), _interceptors.end(), interceptor),
                        _interceptors.end());
}

void MessageDispatcher::setHandler(Handler handler) {
    std::lock_guard<std::recursive_mutex> lock(_mutex);
    _handler = handler;
}

bool MessageDispatcher::dispatch(const Bytes& raw) {
    Message message;
    if (!Message::parse(raw, message)) {
        std::lock_guard<std::recursive_mutex> lock(_mutex);
        _stats.malformed++;
        TRACE("MessageDispatcher: Empty message dropped");
        return false;
    }
    return dispatch(message);
}

bool MessageDispatcher::dispatch(const Message& message) {
    std::vector<IMessageInterceptor*> interceptors;
    Handler handler;
    {
        std::lock_guard<std::recursive_mutex> lock(_mutex);
        _stats.dispatched++;

        if (!isKnownMessageType(message.typeByte())) {
            _stats.dropped_unknown++;
            char buf[64];
            snprintf(buf, sizeof(buf), "MessageDispatcher: Unknown type 0x%02X dropped", message.typeByte());
            TRACE(buf);
            return false;
        }

        interceptors = _interceptors;
        handler = _handler;
    }

    // Consumers run unlocked; voice processing can take a while
    for (IMessageInterceptor* interceptor : interceptors) {
        if (interceptor->intercept(message)) {
            std::lock_guard<std::recursive_mutex> lock(_mutex);
            _stats.intercepted++;
            return true;
        }
    }

    if (!handler) {
        std::lock_guard<std::recursive_mutex> lock(_mutex);
        _stats.dropped_unhandled++;
        TRACE(std::string("MessageDispatcher: No handler for ") + messageTypeToString(message.type));
        return false;
    }

    {
        std::lock_guard<std::recursive_mutex> lock(_mutex);
        _stats.handled++;
    }
    handler(message);
    return true;
}

MessageDispatcher::Stats MessageDispatcher::stats() const {
    std::lock_guard<std::recursive_mutex> lock(_mutex);
    return _stats;
}

}} // namespace Tapir::BLE
