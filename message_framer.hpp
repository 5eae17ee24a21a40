#ifndef MESSAGE_FRAMER_HPP
#define MESSAGE_FRAMER_HPP

#include "stego_error.hpp"
#include "svg_document.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace svgstego {

    // bit 流：[32 bit payload bit 数, big-endian] + payload（每字节 MSB first）
    bool frame(const std::vector<uint8_t>& payload,
               std::vector<uint8_t>& outBits,
               StegoError& outError);

    // readBit(i, bit, err) yields the i-th bit of the channel; on failure
    // err says why and unframe reports it unchanged.
    typedef std::function<bool(size_t, int&, StegoError&)> BitReader;

    // Reads the header, checks it against slotCount, then the payload.
    // A declared length that is not a whole number of bytes is rejected
    // as CorruptHeader.
    bool unframe(const BitReader& readBit, size_t slotCount,
                 std::vector<uint8_t>& outPayload,
                 StegoError& outError);

    bool embedMessage(SvgDocument& doc, const std::string& key,
                      const std::vector<uint8_t>& payload,
                      StegoError& outError);

    bool extractMessage(const SvgDocument& doc, const std::string& key,
                        std::vector<uint8_t>& outPayload,
                        StegoError& outError);

}

#endif
