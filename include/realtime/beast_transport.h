#pragma once

#include "realtime/transport.h"
#include <memory>

namespace rtvoice {
namespace realtime {

/**
 * @brief Secure WebSocket transport (Boost.Beast over OpenSSL)
 *
 * Connects synchronously with SNI and certificate host verification, then
 * runs an I/O thread that reads messages and performs writes posted from
 * other threads. Only wss:// URLs are supported.
 */
class BeastTransport : public ITransport {
public:
    explicit BeastTransport(int connect_timeout_ms = 10000);
    ~BeastTransport() override;

    BeastTransport(const BeastTransport&) = delete;
    BeastTransport& operator=(const BeastTransport&) = delete;

    VoidResult connect(const std::string& url,
                       const std::map<std::string, std::string>& headers,
                       TransportHandlers handlers) override;
    VoidResult send(const std::string& text) override;
    void close() override;
    bool is_open() const override;

    /**
     * @brief Factory producing a fresh transport per connection
     */
    static TransportFactory factory(int connect_timeout_ms = 10000);

private:
    class Impl;
    std::shared_ptr<Impl> pimpl_;
};

} // namespace realtime
} // namespace rtvoice
