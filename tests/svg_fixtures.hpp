#ifndef SVG_FIXTURES_HPP
#define SVG_FIXTURES_HPP

#include "svg_document.hpp"

#include <gtest/gtest.h>

#include <cstdio>
#include <sstream>
#include <string>

namespace fixtures {

    const char* const SVG11_PROLOG =
        "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n"
        "<!DOCTYPE svg PUBLIC \"-//W3C//DTD SVG 1.1//EN\" "
        "\"http://www.w3.org/Graphics/SVG/1.1/DTD/svg11.dtd\">\n";

    const char* const SVG10_PROLOG =
        "<?xml version=\"1.0\"?>\n"
        "<!DOCTYPE svg PUBLIC \"-//W3C//DTD SVG 20010904//EN\" "
        "\"http://www.w3.org/TR/2001/REC-SVG-20010904/DTD/svg10.dtd\">\n";

    // i-th literal of a generated cover; always ends in '0' so every
    // embedded digit is visible
    inline std::string makeLiteral(size_t i)
    {
        char buf[32];
        std::snprintf(buf, sizeof(buf), "%zu.%02zu0", i % 97 + 1, (i * 7) % 100);
        return buf;
    }

    // Cover with exactly slotCount eligible literals: one linearGradient
    // (4 slots) and paths of up to 8 literals each. Ineligible numbers
    // (integers, fill colours, stroke-width) are sprinkled in.
    inline std::string makeCover(size_t slotCount)
    {
        std::ostringstream out;
        out << SVG11_PROLOG
            << "<svg xmlns=\"http://www.w3.org/2000/svg\" width=\"100\" height=\"100\">\n";

        size_t i = 0;
        if (slotCount >= 4) {
            out << "  <defs>\n"
                << "    <linearGradient id=\"g0\" x1=\"" << makeLiteral(0)
                << "\" y1=\"" << makeLiteral(1)
                << "\" x2=\"" << makeLiteral(2)
                << "\" y2=\"" << makeLiteral(3) << "\"/>\n"
                << "  </defs>\n";
            i = 4;
        }

        while (i < slotCount) {
            out << "  <path fill=\"#102030\" stroke-width=\"1.5\" d=\"M 10 20";
            for (size_t k = 0; k < 8 && i < slotCount; ++k, ++i) {
                out << " L" << makeLiteral(i);
            }
            out << " Z\"/>\n";
        }

        out << "  <rect x=\"1.25\" y=\"2.50\" width=\"3\" height=\"4\"/>\n"
            << "</svg>\n";
        return out.str();
    }

    inline void load(svgstego::SvgDocument& doc, const std::string& text)
    {
        svgstego::StegoError err = svgstego::StegoError::None;
        ASSERT_TRUE(doc.loadMemory(text, err)) << text;
        ASSERT_EQ(svgstego::StegoError::None, err);
    }

    inline std::string toString(const std::vector<uint8_t>& bytes)
    {
        return std::string(bytes.begin(), bytes.end());
    }

    inline std::vector<uint8_t> toBytes(const std::string& s)
    {
        return std::vector<uint8_t>(s.begin(), s.end());
    }
}

#endif
