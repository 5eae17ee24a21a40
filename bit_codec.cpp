#include "bit_codec.hpp"
#include "crypto.hpp"

#include <cstdint>
#include <iostream>
#include <string>

namespace svgstego {

    static const char EVEN_DIGITS[4] = { '2', '4', '6', '8' };
    static const char ODD_DIGITS[4]  = { '3', '5', '7', '9' };

    static bool isDigit(char c) {
        return c >= '0' && c <= '9';
    }

    // 当前属性值里 span 的位置还是不是一个小数（最后一位是数字）
    static bool readSlotValue(const SvgDocument& doc, const EmbeddingSlot& slot,
                              std::string& outValue)
    {
        if (!doc.getAttribute(slot.element, slot.attribute, outValue)) {
            std::cerr << "[codec] Attribute '" << slot.attribute << "' vanished\n";
            return false;
        }
        if (slot.end <= slot.start || slot.end > outValue.size()
            || !isDigit(outValue[slot.end - 1]))
        {
            std::cerr << "[codec] Slot [" << slot.start << ", " << slot.end
                      << ") no longer holds a literal in '" << slot.attribute << "'\n";
            return false;
        }
        return true;
    }

    char digitForBit(int bit, uint8_t randomByte)
    {
        // 256 % 4 == 0，低两位是均匀的
        const char* digits = (bit & 1) ? ODD_DIGITS : EVEN_DIGITS;
        return digits[randomByte & 0x03];
    }

    bool embedBit(SvgDocument& doc, int bit, const EmbeddingSlot& slot,
                  StegoError& outError)
    {
        std::string value;
        if (!readSlotValue(doc, slot, value)) {
            outError = StegoError::InvalidDocument;
            return false;
        }

        uint8_t r = 0;
        if (!crypto::randomBytes(&r, 1)) {
            outError = StegoError::InvalidDocument;
            return false;
        }

        value[slot.end - 1] = digitForBit(bit, r);

        if (!doc.setAttribute(slot.element, slot.attribute, value)) {
            outError = StegoError::InvalidDocument;
            return false;
        }

        outError = StegoError::None;
        return true;
    }

    bool extractBit(const SvgDocument& doc, const EmbeddingSlot& slot,
                    int& outBit, StegoError& outError)
    {
        std::string value;
        if (!readSlotValue(doc, slot, value)) {
            outError = StegoError::InvalidDocument;
            return false;
        }

        outBit = (value[slot.end - 1] - '0') % 2;
        outError = StegoError::None;
        return true;
    }

}
