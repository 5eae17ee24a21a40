#ifndef BIT_CODEC_HPP
#define BIT_CODEC_HPP

#include "slot_extractor.hpp"
#include "stego_error.hpp"
#include "svg_document.hpp"

#include <cstdint>

namespace svgstego {

    // 把 slot 里小数的最后一位换成随机的偶数(bit=0: 2/4/6/8)或奇数(bit=1: 3/5/7/9)。
    // 0 和 1 永远不写。长度、整数部分不变。
    bool embedBit(SvgDocument& doc, int bit, const EmbeddingSlot& slot,
                  StegoError& outError);

    // 读最后一位的奇偶，不改文档
    bool extractBit(const SvgDocument& doc, const EmbeddingSlot& slot,
                    int& outBit, StegoError& outError);

    // Digit written for bit given a random byte. Exposed for tests.
    char digitForBit(int bit, uint8_t randomByte);

}

#endif
