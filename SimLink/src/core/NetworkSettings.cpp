// File: NetworkSettings.cpp
#include "../../include/core/NetworkSettings.hpp"
#include "../../include/core/Logger.hpp"

namespace SimLink::Networking {

    bool NetworkSettings::Validate() const {
        using std::chrono::milliseconds;

        if (reliability.resendTimeout <= milliseconds::zero()) {
            SL_NETWORK_ERROR("NetworkSettings: resendTimeout must be positive");
            return false;
        }
        if (reliability.maxResendCount < 0) {
            SL_NETWORK_ERROR("NetworkSettings: maxResendCount must not be negative");
            return false;
        }
        if (reliability.ackFlushInterval <= milliseconds::zero()) {
            SL_NETWORK_ERROR("NetworkSettings: ackFlushInterval must be positive");
            return false;
        }
        if (reliability.maxPiggybackAcks > Protocol::MAX_APPENDED_ACKS) {
            SL_NETWORK_ERROR("NetworkSettings: maxPiggybackAcks {} exceeds {}",
                reliability.maxPiggybackAcks, Protocol::MAX_APPENDED_ACKS);
            return false;
        }
        if (reliability.pendingAckFlushThreshold == 0 || reliability.seenWindowSize == 0) {
            SL_NETWORK_ERROR("NetworkSettings: ack threshold and seen window must be non-zero");
            return false;
        }
        if (handshakeTimeout <= milliseconds::zero() || maxHandshakeAttempts < 1) {
            SL_NETWORK_ERROR("NetworkSettings: handshake timeout and attempts must be positive");
            return false;
        }
        if (tickInterval <= milliseconds::zero()) {
            SL_NETWORK_ERROR("NetworkSettings: tickInterval must be positive");
            return false;
        }
        if (maxPacketSize < Protocol::HEADER_WIRE_SIZE + 4 || receiveBufferSize < maxPacketSize) {
            SL_NETWORK_ERROR("NetworkSettings: packet size {} / receive buffer {} are inconsistent",
                maxPacketSize, receiveBufferSize);
            return false;
        }
        return true;
    }

} // namespace SimLink::Networking
