#include "capacity.hpp"
#include "slot_extractor.hpp"
#include "stego_config.hpp"

#include <iostream>

namespace svgstego {

    int64_t capacityBytes(size_t slotCount)
    {
        const int64_t spare = static_cast<int64_t>(slotCount) - static_cast<int64_t>(HEADER_BITS);
        const int64_t perByte = static_cast<int64_t>(BITS_PER_BYTE);

        // C++ 整除向 0 取整，这里要向下取整
        int64_t q = spare / perByte;
        if (spare % perByte != 0 && spare < 0) {
            --q;
        }
        return q;
    }

    CapacityReport capacity(const SvgDocument& doc)
    {
        CapacityReport report;
        report.slotCount = discoverSlots(doc).size();
        report.headerBits = HEADER_BITS;
        report.bytes = capacityBytes(report.slotCount);
        if (report.bytes < 0) {
            std::cerr << "[capacity] Only " << report.slotCount << " slots, "
                      << HEADER_BITS << " are needed for the length header\n";
        }
        return report;
    }

}
