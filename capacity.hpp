#ifndef CAPACITY_HPP
#define CAPACITY_HPP

#include "svg_document.hpp"

#include <cstddef>
#include <cstdint>

namespace svgstego {

    struct CapacityReport {
        size_t  slotCount;
        size_t  headerBits;
        int64_t bytes;      // 可能是负数（slot 不够放 header）
    };

    // floor((slotCount - 32) / 8), rounding toward negative infinity.
    int64_t capacityBytes(size_t slotCount);

    CapacityReport capacity(const SvgDocument& doc);

}

#endif
