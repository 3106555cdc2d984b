#include <gtest/gtest.h>
#include <bridge/oob_detector.hpp>
#include <string>

static std::optional<DetectionEvent> scan_str(Direction dir, const std::string& s) {
    return scan(dir, s.data(), s.size());
}

TEST(OobDetector, RzCommandIsUpload) {
    auto ev = scan_str(Direction::OUTBOUND, "rz\r");
    ASSERT_TRUE(ev.has_value());
    EXPECT_EQ(ev->kind, DetectionKind::UPLOAD);
    EXPECT_EQ(ev->offset, 0u);
}

TEST(OobDetector, RzWithoutCarriageReturnIsIgnored) {
    EXPECT_FALSE(scan_str(Direction::OUTBOUND, "rz").has_value());
    EXPECT_FALSE(scan_str(Direction::OUTBOUND, "r").has_value());
}

TEST(OobDetector, RzMustStartTheChunk) {
    EXPECT_FALSE(scan_str(Direction::OUTBOUND, "xrz\r").has_value());
}

TEST(OobDetector, SzCarriesTheFileName) {
    auto ev = scan_str(Direction::OUTBOUND, "sz report.txt");
    ASSERT_TRUE(ev.has_value());
    EXPECT_EQ(ev->kind, DetectionKind::DOWNLOAD);
    EXPECT_EQ(ev->argument, "report.txt");
}

TEST(OobDetector, SzArgumentIsTrimmed) {
    auto ev = scan_str(Direction::OUTBOUND, "sz  data/out.bin \r");
    ASSERT_TRUE(ev.has_value());
    EXPECT_EQ(ev->argument, "data/out.bin");
}

TEST(OobDetector, OrdinaryKeystrokesAreIgnored) {
    EXPECT_FALSE(scan_str(Direction::OUTBOUND, "ls -la\r").has_value());
    EXPECT_FALSE(scan_str(Direction::OUTBOUND, "s").has_value());
    EXPECT_FALSE(scan(Direction::OUTBOUND, nullptr, 0).has_value());
}

TEST(OobDetector, InboundHeaderInOneChunk) {
    std::string chunk = "prompt$ **";
    chunk += '\x18';
    chunk += "B00000000000000\r\n";
    auto ev = scan_str(Direction::INBOUND, chunk);
    ASSERT_TRUE(ev.has_value());
    EXPECT_EQ(ev->kind, DetectionKind::DOWNLOAD);
    EXPECT_EQ(ev->offset, 8u);
}

TEST(OobDetector, InboundHeaderAtTheVeryEnd) {
    std::string chunk = "abc";
    chunk.append(ZMODEM_HEADER, ZMODEM_HEADER_LEN);
    auto ev = scan_str(Direction::INBOUND, chunk);
    ASSERT_TRUE(ev.has_value());
    EXPECT_EQ(ev->offset, 3u);
}

TEST(OobDetector, InboundHeaderSplitAcrossChunksIsNotSeen) {
    std::string first = "output **";
    std::string second = "\x18" "B0000";
    EXPECT_FALSE(scan_str(Direction::INBOUND, first).has_value());
    EXPECT_FALSE(scan_str(Direction::INBOUND, second).has_value());
}

TEST(OobDetector, InboundTextIsIgnored) {
    EXPECT_FALSE(scan_str(Direction::INBOUND, "** bold markdown **").has_value());
    EXPECT_FALSE(scan_str(Direction::INBOUND, "**").has_value());
}

TEST(OobDetector, OutboundRzTextInboundIsNotAnUpload) {
    EXPECT_FALSE(scan_str(Direction::INBOUND, "rz\r").has_value());
}
