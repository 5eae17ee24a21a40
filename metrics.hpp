#ifndef METRICS_HPP
#define METRICS_HPP

#include "stego_error.hpp"
#include "svg_document.hpp"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace metrics {

    // BER for extracted vs original payload
    double computeBER(const std::vector<uint8_t>& original,
                      const std::vector<uint8_t>& extracted);

    struct LiteralDistortion {
        size_t slotCount;
        size_t changedLiterals;
        double maxAbsDelta;
        double meanAbsDelta;   // 对所有 slot 取平均
    };

    // Compares the literals of a cover with those of its stego-object, slot
    // by slot in canonical order. Fails if the slot layouts differ.
    bool computeLiteralDistortion(const svgstego::SvgDocument& cover,
                                  const svgstego::SvgDocument& stego,
                                  LiteralDistortion& outDistortion,
                                  svgstego::StegoError& outError);
}

#endif
