#include "slot_extractor.hpp"
#include "svg_fixtures.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

using namespace svgstego;

namespace {

    std::vector<std::string> literals(const std::string& value)
    {
        std::vector<std::string> out;
        for (const auto& span : findDecimalLiterals(value)) {
            out.push_back(value.substr(span.first, span.second - span.first));
        }
        return out;
    }

    std::string literalAt(const SvgDocument& doc, const EmbeddingSlot& slot)
    {
        std::string value;
        EXPECT_TRUE(doc.getAttribute(slot.element, slot.attribute, value));
        return value.substr(slot.start, slot.end - slot.start);
    }

}

TEST(FindDecimalLiterals, OnlyPlainDecimalsMatch)
{
    std::vector<std::string> expected = { "10.5", "3.25", "7.0", "12.345" };
    EXPECT_EQ(expected, literals("M10.5,-3.25 L4 1 7.0 .5 8. 12.345.6"));
}

TEST(FindDecimalLiterals, ExponentIsNotPartOfLiteral)
{
    // only the mantissa is a literal, as with a plain regex scan
    std::vector<std::string> expected = { "1.5", "2.25" };
    EXPECT_EQ(expected, literals("1.5e3 2.25E-2 4e1"));
}

TEST(FindDecimalLiterals, SpansPointIntoValue)
{
    const std::string value = "matrix(0.75,0,0,1.125,-3.5,0)";
    std::vector<std::pair<size_t, size_t>> spans = findDecimalLiterals(value);
    ASSERT_EQ(3u, spans.size());
    EXPECT_EQ(value.find("0.75"), spans[0].first);
    EXPECT_EQ(value.find("0.75") + 4, spans[0].second);
    EXPECT_EQ(value.find("3.5"), spans[2].first);
}

TEST(FindDecimalLiterals, EmptyAndIntegerOnly)
{
    EXPECT_TRUE(findDecimalLiterals("").empty());
    EXPECT_TRUE(findDecimalLiterals("M 10 20 L 30 40 Z").empty());
    EXPECT_TRUE(findDecimalLiterals("5.").empty());
}

TEST(DiscoverSlots, CountsOnlyMappedAttributes)
{
    SvgDocument doc;
    fixtures::load(doc, fixtures::makeCover(21));
    // rect x/y and stroke-width hold decimals but are not carriers
    EXPECT_EQ(21u, discoverSlots(doc).size());
}

TEST(DiscoverSlots, CanonicalOrderByElementThenAttributeThenOffset)
{
    const std::string svg = std::string(fixtures::SVG11_PROLOG) +
        "<svg xmlns=\"http://www.w3.org/2000/svg\">\n"
        "  <path d=\"M 9.5 8.5\"/>\n"
        "  <radialGradient r=\"4.5\" gradientTransform=\"scale(2.5 3.5)\" cy=\"1.5\" cx=\"0.5\"/>\n"
        "  <linearGradient y2=\"7.25\" x1=\"6.25\"/>\n"
        "</svg>\n";

    SvgDocument doc;
    fixtures::load(doc, svg);

    std::vector<EmbeddingSlot> slots = discoverSlots(doc);
    ASSERT_EQ(9u, slots.size());

    std::vector<std::string> attrs;
    std::vector<std::string> values;
    for (const EmbeddingSlot& slot : slots) {
        attrs.push_back(slot.attribute);
        values.push_back(literalAt(doc, slot));
    }

    // path comes first in the document although the map lists it last
    std::vector<std::string> expectedAttrs = {
        "d", "d",
        "cx", "cy", "gradientTransform", "gradientTransform", "r",
        "x1", "y2"
    };
    std::vector<std::string> expectedValues = {
        "9.5", "8.5", "0.5", "1.5", "2.5", "3.5", "4.5", "6.25", "7.25"
    };
    EXPECT_EQ(expectedAttrs, attrs);
    EXPECT_EQ(expectedValues, values);

    for (size_t i = 1; i < slots.size(); ++i) {
        EXPECT_TRUE(canonicalLess(slots[i - 1], slots[i])) << "at " << i;
    }
}

TEST(DiscoverSlots, RepeatedDiscoveryIsIdentical)
{
    SvgDocument doc;
    fixtures::load(doc, fixtures::makeCover(50));

    std::vector<EmbeddingSlot> first = discoverSlots(doc);
    std::vector<EmbeddingSlot> second = discoverSlots(doc);
    ASSERT_EQ(50u, first.size());
    EXPECT_TRUE(first == second);
}

TEST(DiscoverSlots, CustomTagMap)
{
    SvgDocument doc;
    fixtures::load(doc, fixtures::makeCover(12));

    TagAttributeMap rectOnly = { { "rect", { "x", "y", "width" } } };
    std::vector<EmbeddingSlot> slots = discoverSlots(doc, rectOnly);
    ASSERT_EQ(2u, slots.size());
    EXPECT_EQ("x", slots[0].attribute);
    EXPECT_EQ("1.25", literalAt(doc, slots[0]));
    EXPECT_EQ("y", slots[1].attribute);
    EXPECT_EQ("2.50", literalAt(doc, slots[1]));
}

TEST(DiscoverSlots, ForeignNamespaceElementsAreNotCarriers)
{
    const std::string svg = std::string(fixtures::SVG11_PROLOG) +
        "<svg xmlns=\"http://www.w3.org/2000/svg\" xmlns:foo=\"urn:foo\"\n"
        "     xmlns:s=\"http://www.w3.org/2000/svg\">\n"
        "  <path d=\"M 1.50 2.50\"/>\n"
        "  <foo:path d=\"1.10 2.10\"/>\n"
        "  <foo:linearGradient x1=\"0.25\" y1=\"0.75\"/>\n"
        "  <g xmlns=\"urn:other\"><path d=\"3.30\"/></g>\n"
        "  <s:path d=\"4.40\"/>\n"
        "</svg>\n";

    SvgDocument doc;
    fixtures::load(doc, svg);

    std::vector<EmbeddingSlot> slots = discoverSlots(doc);
    std::vector<std::string> values;
    for (const EmbeddingSlot& slot : slots) {
        values.push_back(literalAt(doc, slot));
    }

    // prefixed SVG elements still count, other namespaces never do
    std::vector<std::string> expected = { "1.50", "2.50", "4.40" };
    EXPECT_EQ(expected, values);
}

TEST(DiscoverSlots, UnprefixedDocumentWithoutNamespace)
{
    const std::string svg = std::string(fixtures::SVG11_PROLOG) +
        "<svg><path d=\"M 1.50 2.50\"/></svg>";

    SvgDocument doc;
    fixtures::load(doc, svg);
    EXPECT_EQ(2u, discoverSlots(doc).size());
}

TEST(DiscoverSlots, EmptyDocumentHasNoSlots)
{
    SvgDocument doc;
    ::testing::internal::CaptureStderr();
    EXPECT_TRUE(discoverSlots(doc).empty());
    const std::string log = ::testing::internal::GetCapturedStderr();
    EXPECT_NE(std::string::npos, log.find("[slots]")) << log;
}
