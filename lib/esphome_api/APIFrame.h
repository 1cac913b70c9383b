#pragma once

#include "Bytes.h"
#include "APITypes.h"

#include <google/protobuf/io/coded_stream.h>

#include <stdint.h>

namespace BLEBridge { namespace ESPHome {

/**
 * ESPHome native API plaintext framing.
 *
 * Wire format: [0x00][varint payload_size][varint message_type][payload]
 *
 * A frame starting with 0x01 belongs to the Noise-encrypted transport,
 * which is not supported; extract() reports it as ENCRYPTED so the caller
 * can fail the link with a clear message.
 */
class APIFrame {
public:
    static constexpr uint8_t PLAINTEXT_PREAMBLE = 0x00;
    static constexpr uint8_t NOISE_PREAMBLE = 0x01;
    static constexpr size_t MAX_VARINT_BYTES = 10;
    static constexpr size_t MAX_VARINT32_BYTES = 5;

    enum class Extract : uint8_t {
        FRAME,          // A complete frame was removed from the buffer
        INCOMPLETE,     // Need more bytes
        INVALID,        // Garbage or oversized frame, link must be dropped
        ENCRYPTED       // Peer speaks the Noise transport
    };

    /**
     * Create a framed message for transmission.
     *
     * @param type Message type identifier
     * @param payload Encoded protobuf payload
     * @return Framed data
     */
    static RNS::Bytes frame(uint32_t type, const RNS::Bytes& payload) {
        using google::protobuf::io::CodedOutputStream;

        uint8_t header[1 + 2 * MAX_VARINT32_BYTES];
        header[0] = PLAINTEXT_PREAMBLE;
        uint8_t* end = CodedOutputStream::WriteVarint32ToArray(static_cast<uint32_t>(payload.size()), header + 1);
        end = CodedOutputStream::WriteVarint32ToArray(type, end);

        RNS::Bytes framed;
        framed.reserve(payload.size() + sizeof(header));
        framed.append(header, static_cast<size_t>(end - header));
        if (payload.size() > 0) {
            framed.append(payload);
        }
        return framed;
    }

    /**
     * Remove the first complete frame from a receive buffer.
     *
     * @param buffer Accumulated received bytes, consumed on FRAME
     * @param type Set to the message type on FRAME
     * @param payload Set to the payload on FRAME
     */
    static Extract extract(RNS::Bytes& buffer, uint32_t& type, RNS::Bytes& payload) {
        if (buffer.size() == 0) {
            return Extract::INCOMPLETE;
        }

        uint8_t preamble = buffer.data()[0];
        if (preamble == NOISE_PREAMBLE) {
            return Extract::ENCRYPTED;
        }
        if (preamble != PLAINTEXT_PREAMBLE) {
            return Extract::INVALID;
        }

        google::protobuf::io::CodedInputStream input(buffer.data() + 1, static_cast<int>(buffer.size() - 1));
        uint32_t length = 0;
        uint32_t msg_type = 0;
        if (!input.ReadVarint32(&length)) {
            return varintComplete(buffer, 1) ? Extract::INVALID : Extract::INCOMPLETE;
        }
        if (length > Limits::MAX_FRAME_SIZE) {
            return Extract::INVALID;
        }
        size_t type_start = 1 + static_cast<size_t>(input.CurrentPosition());
        if (!input.ReadVarint32(&msg_type)) {
            return varintComplete(buffer, type_start) ? Extract::INVALID : Extract::INCOMPLETE;
        }
        size_t pos = 1 + static_cast<size_t>(input.CurrentPosition());
        if (buffer.size() - pos < length) {
            return Extract::INCOMPLETE;
        }

        type = msg_type;
        payload = (length > 0) ? buffer.mid(pos, length) : RNS::Bytes();
        size_t consumed = pos + length;
        buffer = (consumed < buffer.size()) ? buffer.mid(consumed) : RNS::Bytes();
        return Extract::FRAME;
    }

private:
    // True when the varint starting at pos is terminated inside the buffer,
    // meaning a read failure was an overlong encoding rather than a short read
    static bool varintComplete(const RNS::Bytes& buffer, size_t pos) {
        for (size_t i = pos; i < buffer.size(); ++i) {
            if ((buffer.data()[i] & 0x80) == 0) {
                return true;
            }
        }
        return buffer.size() - pos >= MAX_VARINT_BYTES;
    }
};

}} // namespace BLEBridge::ESPHome
