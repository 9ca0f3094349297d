#pragma once

/**
 * @file transport.h
 * @brief Message transport interface for the upstream realtime connection
 */

#include "errors.h"
#include <functional>
#include <map>
#include <memory>
#include <string>

namespace rtvoice {
namespace realtime {

/**
 * @brief Callbacks invoked on the transport's I/O thread
 *
 * on_close fires at most once, and only when the connection ends without a
 * local close() call.
 */
struct TransportHandlers {
    std::function<void(const std::string& text)> on_message;
    std::function<void(int code, const std::string& reason)> on_close;
};

/**
 * @brief One physical text-message connection
 *
 * Instances are single-use: a reconnect creates a new transport.
 */
class ITransport {
public:
    virtual ~ITransport() = default;

    /**
     * @brief Open the connection (blocks until open or failed)
     * @param url Full endpoint URL including query
     * @param headers Extra handshake headers
     */
    virtual VoidResult connect(const std::string& url,
                               const std::map<std::string, std::string>& headers,
                               TransportHandlers handlers) = 0;

    /**
     * @brief Send one text message; safe from any thread, including handlers
     */
    virtual VoidResult send(const std::string& text) = 0;

    /**
     * @brief Close locally; idempotent, safe from handlers
     */
    virtual void close() = 0;

    virtual bool is_open() const = 0;
};

using TransportFactory = std::function<std::shared_ptr<ITransport>()>;

} // namespace realtime
} // namespace rtvoice
