#include "message_framer.hpp"
#include "bit_codec.hpp"
#include "keyed_permutation.hpp"
#include "slot_extractor.hpp"
#include "stego_config.hpp"

#include <iostream>
#include <limits>

namespace svgstego {

    bool frame(const std::vector<uint8_t>& payload,
               std::vector<uint8_t>& outBits,
               StegoError& outError)
    {
        outBits.clear();

        const uint64_t payloadBits = static_cast<uint64_t>(payload.size()) * BITS_PER_BYTE;
        if (payloadBits > std::numeric_limits<uint32_t>::max()) {
            std::cerr << "[frame] Payload of " << payload.size()
                      << " bytes does not fit a 32-bit length header\n";
            outError = StegoError::CapacityExceeded;
            return false;
        }
        const uint32_t msgBits = static_cast<uint32_t>(payloadBits);

        outBits.reserve(HEADER_BITS + msgBits);

        // 长度（32 bit，大端）
        for (int i = static_cast<int>(HEADER_BITS) - 1; i >= 0; --i) {
            outBits.push_back((msgBits >> i) & 1);
        }

        // 内容
        for (uint8_t byte : payload) {
            for (int i = 7; i >= 0; --i) {
                outBits.push_back((byte >> i) & 1);
            }
        }

        outError = StegoError::None;
        return true;
    }

    bool unframe(const BitReader& readBit, size_t slotCount,
                 std::vector<uint8_t>& outPayload,
                 StegoError& outError)
    {
        outPayload.clear();

        if (slotCount < HEADER_BITS) {
            std::cerr << "[extract] Not enough slots for length header: "
                      << slotCount << "\n";
            outError = StegoError::CapacityMismatch;
            return false;
        }

        // 前 32 bit 还原长度（大端）
        uint32_t msgBits = 0;
        for (size_t i = 0; i < HEADER_BITS; ++i) {
            int bit = 0;
            if (!readBit(i, bit, outError)) {
                return false;
            }
            msgBits = (msgBits << 1) | static_cast<uint32_t>(bit & 1);
        }

        // 长度比 slot 还多：key 错了或者根本不是 stego-object
        if (static_cast<uint64_t>(msgBits) + HEADER_BITS > slotCount) {
            std::cerr << "[extract] Declared length " << msgBits << " bits exceeds "
                      << slotCount - HEADER_BITS << " available slots\n";
            outError = StegoError::CapacityMismatch;
            return false;
        }

        if (msgBits % BITS_PER_BYTE != 0) {
            std::cerr << "[extract] Declared length " << msgBits
                      << " bits is not a whole number of bytes\n";
            outError = StegoError::CorruptHeader;
            return false;
        }

        outPayload.reserve(msgBits / BITS_PER_BYTE);

        size_t bitPos = HEADER_BITS;
        for (uint32_t b = 0; b < msgBits / BITS_PER_BYTE; ++b) {
            uint8_t curByte = 0;
            for (size_t i = 0; i < BITS_PER_BYTE; ++i) {
                int bit = 0;
                if (!readBit(bitPos++, bit, outError)) {
                    outPayload.clear();
                    return false;
                }
                curByte = static_cast<uint8_t>((curByte << 1) | (bit & 1));
            }
            outPayload.push_back(curByte);
        }

        outError = StegoError::None;
        return true;
    }

    bool embedMessage(SvgDocument& doc, const std::string& key,
                      const std::vector<uint8_t>& payload,
                      StegoError& outError)
    {
        // 先把所有 slot 找齐再改文档
        std::vector<EmbeddingSlot> slots;
        if (!permuteSlots(discoverSlots(doc), key, slots)) {
            outError = StegoError::InvalidDocument;
            return false;
        }

        std::vector<uint8_t> bits;
        if (!frame(payload, bits, outError)) {
            return false;
        }

        if (bits.size() > slots.size()) {
            std::cerr << "[embed] Message too long. Need " << bits.size()
                      << " bits, capacity = " << slots.size() << " bits.\n";
            outError = StegoError::CapacityExceeded;
            return false;
        }

        for (size_t i = 0; i < bits.size(); ++i) {
            if (!embedBit(doc, bits[i], slots[i], outError)) {
                std::cerr << "[embed] Failed at bit " << i << " of " << bits.size() << "\n";
                return false;
            }
        }

        outError = StegoError::None;
        return true;
    }

    bool extractMessage(const SvgDocument& doc, const std::string& key,
                        std::vector<uint8_t>& outPayload,
                        StegoError& outError)
    {
        outPayload.clear();

        std::vector<EmbeddingSlot> slots;
        if (!permuteSlots(discoverSlots(doc), key, slots)) {
            outError = StegoError::InvalidDocument;
            return false;
        }

        BitReader readBit = [&](size_t i, int& bit, StegoError& err) {
            return extractBit(doc, slots[i], bit, err);
        };

        return unframe(readBit, slots.size(), outPayload, outError);
    }

}
