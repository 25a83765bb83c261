/**
 * @file relay_transport.h
 * @brief Abstract transport interface between the pool and the network
 *
 * A transport owns the actual sockets. The pool asks it to connect, send
 * and disconnect; everything the transport observes on its own (dropped
 * sockets, protocol errors, round-trip times) is reported back through
 * the RelayConnection lifecycle hooks.
 */

#ifndef RELAYPOOL_TRANSPORT_RELAY_TRANSPORT_H
#define RELAYPOOL_TRANSPORT_RELAY_TRANSPORT_H

#include <memory>
#include <string>

namespace relaypool {

class RelayConnection;

/**
 * @brief Transport error codes
 */
enum class TransportError {
    SUCCESS = 0,
    NOT_CONNECTED,
    CONNECTION_FAILED,
    CONNECTION_TIMEOUT,
    SEND_FAILED,
    ENDPOINT_NOT_FOUND,
    UNKNOWN_ERROR
};

const char* transportErrorToString(TransportError error);

/**
 * @brief Result type for transport operations
 */
template<typename T>
struct TransportResult {
    TransportError error = TransportError::SUCCESS;
    T value = T{};
    std::string error_message;

    bool success() const { return error == TransportError::SUCCESS; }
    explicit operator bool() const { return success(); }

    static TransportResult ok(T v) {
        TransportResult result;
        result.value = std::move(v);
        return result;
    }

    static TransportResult fail(TransportError err, std::string message) {
        TransportResult result;
        result.error = err;
        result.error_message = std::move(message);
        return result;
    }
};

/**
 * @brief Abstract relay transport
 *
 * Implementations must be thread-safe: connect() runs on pool worker
 * threads while send() and disconnect() run on caller threads, possibly
 * for different relays at the same time.
 *
 * connect() may block; the pool bounds it with the relay's configured
 * timeout and treats a late completion as a failure.
 */
class IRelayTransport {
public:
    virtual ~IRelayTransport() = default;

    /**
     * @brief Open the connection to relay.getUrl()
     * @return success with value true once the relay is reachable
     */
    virtual TransportResult<bool> connect(RelayConnection& relay) = 0;

    /**
     * @brief Hand an opaque payload to a connected relay
     */
    virtual TransportResult<bool> send(RelayConnection& relay, const std::string& message) = 0;

    /**
     * @brief Close the connection if open; never fails
     */
    virtual void disconnect(RelayConnection& relay) = 0;
};

using RelayTransportPtr = std::shared_ptr<IRelayTransport>;

} // namespace relaypool

#endif // RELAYPOOL_TRANSPORT_RELAY_TRANSPORT_H
