#include "metrics.hpp"
#include "slot_extractor.hpp"

#include <cmath>
#include <cstdlib>
#include <iostream>
#include <string>

namespace metrics {

    // --- BER ---
    double computeBER(const std::vector<uint8_t>& original,
                      const std::vector<uint8_t>& extracted)
    {
        if (original.size() != extracted.size()) {
            return 1.0; // 100% wrong
        }
        if (original.empty()) {
            return 0.0;
        }

        size_t bitErrors = 0;
        const size_t totalBits = original.size() * 8;

        for (size_t i = 0; i < original.size(); i++) {
            uint8_t diff = original[i] ^ extracted[i];
            bitErrors += __builtin_popcount(diff);
        }

        return static_cast<double>(bitErrors) / totalBits;
    }

    // --- literal distortion ---
    bool computeLiteralDistortion(const svgstego::SvgDocument& cover,
                                  const svgstego::SvgDocument& stego,
                                  LiteralDistortion& outDistortion,
                                  svgstego::StegoError& outError)
    {
        using svgstego::EmbeddingSlot;

        outDistortion = LiteralDistortion{ 0, 0, 0.0, 0.0 };

        const std::vector<EmbeddingSlot> a = svgstego::discoverSlots(cover);
        const std::vector<EmbeddingSlot> b = svgstego::discoverSlots(stego);

        if (a.size() != b.size()) {
            std::cerr << "[metrics] Slot count differs: " << a.size()
                      << " vs " << b.size() << "\n";
            outError = svgstego::StegoError::InvalidDocument;
            return false;
        }

        double sumAbs = 0.0;
        std::string va, vb;

        for (size_t i = 0; i < a.size(); i++) {
            // 两边的 element 不是同一棵树，只能比位置
            if (a[i].element.order != b[i].element.order
                || a[i].attribute != b[i].attribute
                || a[i].start != b[i].start || a[i].end != b[i].end)
            {
                std::cerr << "[metrics] Slot layout differs at slot " << i << "\n";
                outError = svgstego::StegoError::InvalidDocument;
                return false;
            }

            if (!cover.getAttribute(a[i].element, a[i].attribute, va)
                || !stego.getAttribute(b[i].element, b[i].attribute, vb))
            {
                std::cerr << "[metrics] Attribute '" << a[i].attribute << "' missing\n";
                outError = svgstego::StegoError::InvalidDocument;
                return false;
            }

            const std::string la = va.substr(a[i].start, a[i].end - a[i].start);
            const std::string lb = vb.substr(b[i].start, b[i].end - b[i].start);
            if (la == lb) {
                continue;
            }

            const double delta = std::fabs(std::strtod(la.c_str(), nullptr)
                                         - std::strtod(lb.c_str(), nullptr));
            outDistortion.changedLiterals++;
            sumAbs += delta;
            if (delta > outDistortion.maxAbsDelta) {
                outDistortion.maxAbsDelta = delta;
            }
        }

        outDistortion.slotCount = a.size();
        outDistortion.meanAbsDelta = a.empty() ? 0.0 : sumAbs / a.size();
        outError = svgstego::StegoError::None;
        return true;
    }

}
