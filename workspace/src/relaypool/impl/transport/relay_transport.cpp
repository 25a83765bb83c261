#include "transport/relay_transport.h"

namespace relaypool {

const char* transportErrorToString(TransportError error) {
    switch (error) {
        case TransportError::SUCCESS: return "SUCCESS";
        case TransportError::NOT_CONNECTED: return "NOT_CONNECTED";
        case TransportError::CONNECTION_FAILED: return "CONNECTION_FAILED";
        case TransportError::CONNECTION_TIMEOUT: return "CONNECTION_TIMEOUT";
        case TransportError::SEND_FAILED: return "SEND_FAILED";
        case TransportError::ENDPOINT_NOT_FOUND: return "ENDPOINT_NOT_FOUND";
        case TransportError::UNKNOWN_ERROR: return "UNKNOWN_ERROR";
        default: return "UNKNOWN";
    }
}

} // namespace relaypool
