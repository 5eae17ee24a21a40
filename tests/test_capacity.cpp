#include "capacity.hpp"
#include "message_framer.hpp"
#include "svg_fixtures.hpp"

#include <gtest/gtest.h>

#include <string>

using namespace svgstego;

TEST(Capacity, Arithmetic)
{
    EXPECT_EQ(1, capacityBytes(40));
    EXPECT_EQ(0, capacityBytes(32));
    EXPECT_EQ(0, capacityBytes(39));
    EXPECT_EQ(2, capacityBytes(48));
    EXPECT_EQ(121, capacityBytes(1000));
}

TEST(Capacity, SmallDocumentsGoNegative)
{
    // floor, not truncation toward zero
    EXPECT_EQ(-1, capacityBytes(31));
    EXPECT_EQ(-1, capacityBytes(24));
    EXPECT_EQ(-2, capacityBytes(23));
    EXPECT_EQ(-3, capacityBytes(10));
    EXPECT_EQ(-4, capacityBytes(0));
}

TEST(Capacity, ReportForDocument)
{
    SvgDocument doc;
    fixtures::load(doc, fixtures::makeCover(40));

    CapacityReport report = capacity(doc);
    EXPECT_EQ(40u, report.slotCount);
    EXPECT_EQ(32u, report.headerBits);
    EXPECT_EQ(1, report.bytes);
}

TEST(Capacity, ReportedCapacityIsEmbeddable)
{
    SvgDocument doc;
    fixtures::load(doc, fixtures::makeCover(123));

    CapacityReport report = capacity(doc);
    ASSERT_EQ(11, report.bytes);

    StegoError err = StegoError::None;
    std::string msg(static_cast<size_t>(report.bytes), 'x');
    ASSERT_TRUE(embedMessage(doc, "cap", fixtures::toBytes(msg), err));

    std::vector<uint8_t> out;
    ASSERT_TRUE(extractMessage(doc, "cap", out, err));
    EXPECT_EQ(msg, fixtures::toString(out));

    SvgDocument full;
    fixtures::load(full, fixtures::makeCover(123));
    msg.push_back('x');
    EXPECT_FALSE(embedMessage(full, "cap", fixtures::toBytes(msg), err));
    EXPECT_EQ(StegoError::CapacityExceeded, err);
}

TEST(Capacity, EmptyDocumentIsNegative)
{
    SvgDocument doc;
    fixtures::load(doc, std::string(fixtures::SVG11_PROLOG) +
                        "<svg xmlns=\"http://www.w3.org/2000/svg\"/>");
    ::testing::internal::CaptureStderr();
    CapacityReport report = capacity(doc);
    const std::string log = ::testing::internal::GetCapturedStderr();

    EXPECT_EQ(0u, report.slotCount);
    EXPECT_EQ(-4, report.bytes);
    EXPECT_NE(std::string::npos, log.find("[capacity] Only 0 slots")) << log;
}
