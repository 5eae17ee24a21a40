#include "slot_extractor.hpp"

#include <algorithm>
#include <iostream>
#include <tuple>

namespace svgstego {

    static bool isDigit(char c) {
        return c >= '0' && c <= '9';
    }

    bool operator==(const EmbeddingSlot& a, const EmbeddingSlot& b)
    {
        return a.element.node == b.element.node
            && a.element.order == b.element.order
            && a.attribute == b.attribute
            && a.start == b.start
            && a.end == b.end;
    }

    bool operator!=(const EmbeddingSlot& a, const EmbeddingSlot& b)
    {
        return !(a == b);
    }

    bool canonicalLess(const EmbeddingSlot& a, const EmbeddingSlot& b)
    {
        return std::tie(a.element.order, a.attribute, a.start)
             < std::tie(b.element.order, b.attribute, b.start);
    }

    std::vector<std::pair<size_t, size_t>> findDecimalLiterals(const std::string& value)
    {
        std::vector<std::pair<size_t, size_t>> spans;
        const size_t n = value.size();
        size_t i = 0;

        while (i < n) {
            if (!isDigit(value[i])) {
                ++i;
                continue;
            }

            // 整数部分
            size_t j = i;
            while (j < n && isDigit(value[j])) {
                ++j;
            }

            // 需要 '.' 后面至少一位数字
            if (j + 1 < n && value[j] == '.' && isDigit(value[j + 1])) {
                size_t k = j + 1;
                while (k < n && isDigit(value[k])) {
                    ++k;
                }
                spans.push_back(std::make_pair(i, k));
                i = k;
            } else {
                i = j;
            }
        }

        return spans;
    }

    std::vector<EmbeddingSlot> discoverSlots(const SvgDocument& doc,
                                             const TagAttributeMap& embedTags)
    {
        std::vector<EmbeddingSlot> slots;
        if (!doc.isLoaded()) {
            std::cerr << "[slots] discoverSlots called on empty document\n";
            return slots;
        }

        std::string value;
        for (const auto& entry : embedTags) {
            const std::vector<SvgElement> elements = doc.elementsByTag(entry.first);

            for (const SvgElement& element : elements) {
                for (const std::string& attr : entry.second) {
                    if (!doc.getAttribute(element, attr, value)) {
                        continue;
                    }
                    for (const auto& span : findDecimalLiterals(value)) {
                        slots.push_back(EmbeddingSlot{ element, attr, span.first, span.second });
                    }
                }
            }
        }

        // 遍历顺序跟 map 有关，排序之后才是 embed / extract 共用的顺序
        std::sort(slots.begin(), slots.end(), canonicalLess);
        return slots;
    }

    std::vector<EmbeddingSlot> discoverSlots(const SvgDocument& doc)
    {
        return discoverSlots(doc, defaultEmbedTags());
    }

}
