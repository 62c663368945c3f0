#include <gtest/gtest.h>
#include "../../RawCarve/src/carving/MultiPatternMatcher.h"
#include "../../RawCarve/src/carving/WindowBuffer.h"
#include "TestSignatures.h"
#include <algorithm>
#include <vector>

// ============================================================================
// 多模式匹配器测试
// ============================================================================

class MatcherTest : public ::testing::Test {
protected:
    // 辅助：按块送入窗口并收集全部匹配事件
    std::vector<MatchEvent> ScanInChunks(const SignatureCatalog& catalog,
                                         const std::vector<BYTE>& data, size_t chunkSize) {
        MultiPatternMatcher matcher(catalog);
        WindowBuffer window(catalog.MaxPatternLength() - 1);
        std::vector<MatchEvent> events;

        for (size_t offset = 0; offset < data.size(); offset += chunkSize) {
            size_t size = std::min(chunkSize, data.size() - offset);
            EXPECT_TRUE(window.Advance(data.data() + offset, size).IsSuccess());
            matcher.Scan(window.View(), events);
        }
        EXPECT_TRUE(window.Advance(nullptr, 0).IsSuccess());
        matcher.Scan(window.View(), events);
        return events;
    }

    std::vector<BYTE> CreateTestData(size_t totalSize) {
        return std::vector<BYTE>(totalSize, 0xCC);
    }
};

// ============================================================================
// 基础匹配
// ============================================================================

TEST_F(MatcherTest, FindsHeadersAndFooters) {
    SignatureCatalog catalog = MakeCatalog({
        MakeFooterSignature("jpeg", "FF D8 FF E0", "FF D9"),
        MakeFooterSignature("pdf", "25 50 44 46", "25 25 45 4F 46")
    });

    auto data = CreateTestData(64);
    PutBytes(data, 3, { 0xFF, 0xD8, 0xFF, 0xE0 });
    PutBytes(data, 20, { 0x25, 0x50, 0x44, 0x46 });
    PutBytes(data, 30, { 0xFF, 0xD9 });
    PutBytes(data, 40, { 0x25, 0x25, 0x45, 0x4F, 0x46 });

    auto events = ScanInChunks(catalog, data, 64);
    ASSERT_EQ(events.size(), 4u);

    EXPECT_EQ(events[0].TypeId(), "jpeg");
    EXPECT_EQ(events[0].kind, MatchKind::Header);
    EXPECT_EQ(events[0].absoluteOffset, 3u);

    EXPECT_EQ(events[1].TypeId(), "pdf");
    EXPECT_EQ(events[1].absoluteOffset, 20u);

    EXPECT_EQ(events[2].kind, MatchKind::Footer);
    EXPECT_EQ(events[2].absoluteOffset, 30u);
    EXPECT_EQ(events[2].patternLength, 2u);

    EXPECT_EQ(events[3].TypeId(), "pdf");
    EXPECT_EQ(events[3].kind, MatchKind::Footer);
    EXPECT_EQ(events[3].absoluteOffset, 40u);
}

TEST_F(MatcherTest, OverlappingAnchorsAllReported) {
    // 一个锚点是另一个的后缀，靠失败链输出
    SignatureCatalog catalog = MakeCatalog({
        MakeFixedSignature("long", "AA BB CC DD", 8),
        MakeFixedSignature("short", "CC DD", 8)
    });

    auto data = CreateTestData(16);
    PutBytes(data, 4, { 0xAA, 0xBB, 0xCC, 0xDD });

    auto events = ScanInChunks(catalog, data, 16);
    ASSERT_EQ(events.size(), 2u);
    EXPECT_EQ(events[0].TypeId(), "long");
    EXPECT_EQ(events[0].absoluteOffset, 4u);
    EXPECT_EQ(events[1].TypeId(), "short");
    EXPECT_EQ(events[1].absoluteOffset, 6u);
}

TEST_F(MatcherTest, AutomatonSharesAnchorPrefixes) {
    SignatureCatalog catalog = MakeCatalog({
        MakeFooterSignature("jfif", "FF D8 FF E0", "FF D9"),
        MakeFooterSignature("exif", "FF D8 FF E1", "FF D9")
    });

    // 根 + FF D8 FF + E0/E1 + D9
    MultiPatternMatcher matcher(catalog);
    EXPECT_EQ(matcher.GetPatternCount(), 4u);
    EXPECT_EQ(matcher.GetNodeCount(), 7u);
}

TEST_F(MatcherTest, ZeroFilledImageDoesNotHitBmpAnchor) {
    SignatureCatalog catalog = MakeCatalog({
        MakeCappedSignature("bmp", "42 4D ?? ?? ?? ?? 00 00 00 00", 1000)
    });

    // 锚点只含 "BM"
    MultiPatternMatcher matcher(catalog);
    EXPECT_EQ(matcher.GetNodeCount(), 3u);

    std::vector<BYTE> data(256, 0x00);
    PutBytes(data, 100, { 0x42, 0x4D, 0x36, 0x10, 0x0E, 0x00 });

    auto events = ScanInChunks(catalog, data, 64);
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].absoluteOffset, 100u);
}

TEST_F(MatcherTest, WildcardPatternVerified) {
    SignatureCatalog catalog = MakeCatalog({
        MakeCappedSignature("wav", "52 49 46 46 ?? ?? ?? ?? 57 41 56 45", 100)
    });

    auto data = CreateTestData(48);
    // 合法：RIFF xxxx WAVE
    PutBytes(data, 2, { 0x52, 0x49, 0x46, 0x46, 0x01, 0x02, 0x03, 0x04, 0x57, 0x41, 0x56, 0x45 });
    // 锚点命中但尾部不符：RIFF xxxx AVI
    PutBytes(data, 24, { 0x52, 0x49, 0x46, 0x46, 0x01, 0x02, 0x03, 0x04, 0x41, 0x56, 0x49, 0x20 });

    auto events = ScanInChunks(catalog, data, 48);
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].absoluteOffset, 2u);
}

TEST_F(MatcherTest, LeadingWildcardsNeedRoomBeforeAnchor) {
    // 锚点前的通配位置落在流起点之前时不能匹配
    SignatureCatalog catalog = MakeCatalog({
        MakeCappedSignature("late", "?? ?? ?? 75 73 74", 100)
    });

    auto data = CreateTestData(20);
    PutBytes(data, 1, { 0x75, 0x73, 0x74 });    // 起点会是 -2
    PutBytes(data, 10, { 0x75, 0x73, 0x74 });   // 起点 7

    auto events = ScanInChunks(catalog, data, 20);
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].absoluteOffset, 7u);
}

// ============================================================================
// 块边界
// ============================================================================

TEST_F(MatcherTest, PatternSplitAtEveryBoundary) {
    SignatureCatalog catalog = MakeCatalog({
        MakeFooterSignature("png", "89 50 4E 47 0D 0A 1A 0A", "49 45 4E 44 AE 42 60 82")
    });
    std::vector<BYTE> header = { 0x89, 0x50, 0x4E, 0x47, 0x0D, 0x0A, 0x1A, 0x0A };

    const size_t chunkSize = 16;
    for (size_t start = 0; start + header.size() <= 48; start++) {
        auto data = CreateTestData(48);
        PutBytes(data, start, header);

        auto events = ScanInChunks(catalog, data, chunkSize);
        ASSERT_EQ(events.size(), 1u) << "header at " << start;
        EXPECT_EQ(events[0].absoluteOffset, start);
    }
}

TEST_F(MatcherTest, ChunkSizeDoesNotChangeResults) {
    SignatureCatalog catalog = MakeCatalog({
        MakeFooterSignature("jpeg", "FF D8 FF", "FF D9"),
        MakeFixedSignature("tag", "54 41 47 21", 16)
    });

    auto data = CreateTestData(200);
    PutBytes(data, 0, { 0xFF, 0xD8, 0xFF });
    PutBytes(data, 50, { 0x54, 0x41, 0x47, 0x21 });
    PutBytes(data, 97, { 0xFF, 0xD9 });
    PutBytes(data, 196, { 0x54, 0x41, 0x47, 0x21 });

    auto reference = ScanInChunks(catalog, data, data.size());
    ASSERT_EQ(reference.size(), 4u);

    for (size_t chunk : { 3u, 4u, 7u, 13u, 64u, 199u }) {
        auto events = ScanInChunks(catalog, data, chunk);
        ASSERT_EQ(events.size(), reference.size()) << "chunk " << chunk;
        for (size_t i = 0; i < events.size(); i++) {
            EXPECT_EQ(events[i].absoluteOffset, reference[i].absoluteOffset);
            EXPECT_EQ(events[i].typeIndex, reference[i].typeIndex);
            EXPECT_EQ(events[i].kind, reference[i].kind);
        }
    }
}

// ============================================================================
// 同一偏移的冲突
// ============================================================================

TEST_F(MatcherTest, MoreSpecificHeaderWins) {
    // jfif 比通用 jpeg 多两个字面量字节
    SignatureCatalog catalog = MakeCatalog({
        MakeFooterSignature("jpeg", "FF D8 FF", "FF D9"),
        MakeFooterSignature("jpeg-jfif", "FF D8 FF E0 00 10", "FF D9")
    });

    auto data = CreateTestData(32);
    PutBytes(data, 5, { 0xFF, 0xD8, 0xFF, 0xE0, 0x00, 0x10 });

    auto events = ScanInChunks(catalog, data, 32);
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].TypeId(), "jpeg-jfif");
}

TEST_F(MatcherTest, LongerPatternWinsOnEqualLiterals) {
    SignatureCatalog catalog = MakeCatalog({
        MakeCappedSignature("short", "AA BB CC", 100),
        MakeCappedSignature("long", "AA BB ?? CC", 100)
    });

    auto data = CreateTestData(32);
    PutBytes(data, 0, { 0xAA, 0xBB, 0xCC, 0xCC });

    auto events = ScanInChunks(catalog, data, 32);
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].TypeId(), "long");
}

TEST_F(MatcherTest, DeclarationOrderBreaksFullTie) {
    SignatureCatalog catalog = MakeCatalog({
        MakeCappedSignature("first", "12 34 56", 100),
        MakeCappedSignature("second", "12 34 56", 200)
    });

    auto data = CreateTestData(16);
    PutBytes(data, 8, { 0x12, 0x34, 0x56 });

    auto events = ScanInChunks(catalog, data, 16);
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].TypeId(), "first");
}

TEST_F(MatcherTest, FooterOrderedBeforeHeaderAtSameOffset) {
    SignatureCatalog catalog = MakeCatalog({
        MakeFooterSignature("ole", "D0 CF 11 E0", "D0 CF 11 E0", 1000, FooterMode::Exclusive)
    });

    auto data = CreateTestData(40);
    PutBytes(data, 0, { 0xD0, 0xCF, 0x11, 0xE0 });
    PutBytes(data, 20, { 0xD0, 0xCF, 0x11, 0xE0 });

    auto events = ScanInChunks(catalog, data, 40);
    ASSERT_EQ(events.size(), 4u);
    EXPECT_EQ(events[0].kind, MatchKind::Footer);
    EXPECT_EQ(events[1].kind, MatchKind::Header);
    EXPECT_EQ(events[2].kind, MatchKind::Footer);
    EXPECT_EQ(events[2].absoluteOffset, 20u);
    EXPECT_EQ(events[3].kind, MatchKind::Header);
}
