#ifndef SLOT_EXTRACTOR_HPP
#define SLOT_EXTRACTOR_HPP

#include "stego_config.hpp"
#include "svg_document.hpp"

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

namespace svgstego {

    // 一个可以藏 1 bit 的位置：某 element 某属性里的一个小数 [start, end)
    struct EmbeddingSlot {
        SvgElement  element;
        std::string attribute;
        size_t      start;
        size_t      end;
    };

    bool operator==(const EmbeddingSlot& a, const EmbeddingSlot& b);
    bool operator!=(const EmbeddingSlot& a, const EmbeddingSlot& b);

    // Canonical order: element document order, attribute name, start offset.
    bool canonicalLess(const EmbeddingSlot& a, const EmbeddingSlot& b);

    // Spans of every "digits.digits" literal in value, left to right,
    // non-overlapping. Signs and exponents are never part of a literal.
    std::vector<std::pair<size_t, size_t>> findDecimalLiterals(const std::string& value);

    std::vector<EmbeddingSlot> discoverSlots(const SvgDocument& doc,
                                             const TagAttributeMap& embedTags);

    std::vector<EmbeddingSlot> discoverSlots(const SvgDocument& doc);

}

#endif
