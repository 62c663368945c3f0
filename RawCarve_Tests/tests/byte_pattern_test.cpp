#include <gtest/gtest.h>
#include "../../RawCarve/src/carving/BytePattern.h"
#include <vector>

// ============================================================================
// 字节模式解析测试
// ============================================================================

TEST(BytePatternTest, ParseSpacedHex) {
    auto r = BytePattern::Parse("FF D8 ff e0");
    ASSERT_TRUE(r.IsSuccess());

    const BytePattern& p = r.Value();
    ASSERT_EQ(p.Length(), 4u);
    EXPECT_EQ(p.At(0), 0xFF);
    EXPECT_EQ(p.At(1), 0xD8);
    EXPECT_EQ(p.At(3), 0xE0);
    EXPECT_EQ(p.LiteralCount(), 4u);
    EXPECT_EQ(p.ToString(), "FF D8 FF E0");
}

TEST(BytePatternTest, ParseCompactWithWildcards) {
    auto r = BytePattern::Parse("52494646????????57415645");
    ASSERT_TRUE(r.IsSuccess());

    const BytePattern& p = r.Value();
    EXPECT_EQ(p.Length(), 12u);
    EXPECT_EQ(p.LiteralCount(), 8u);
    EXPECT_TRUE(p.IsWildcard(4));
    EXPECT_TRUE(p.IsWildcard(7));
    EXPECT_FALSE(p.IsWildcard(8));
    EXPECT_EQ(p.ToString(), "52 49 46 46 ?? ?? ?? ?? 57 41 56 45");
}

TEST(BytePatternTest, EmptyTextGivesEmptyPattern) {
    auto r = BytePattern::Parse("   ");
    ASSERT_TRUE(r.IsSuccess());
    EXPECT_TRUE(r.Value().Empty());
}

TEST(BytePatternTest, RejectsOddDigits) {
    auto r = BytePattern::Parse("FF D");
    ASSERT_TRUE(r.IsFailure());
    EXPECT_EQ(r.Error().code, RC::ErrorCode::ConfigInvalidPattern);
}

TEST(BytePatternTest, RejectsInvalidToken) {
    EXPECT_TRUE(BytePattern::Parse("FG").IsFailure());
    EXPECT_TRUE(BytePattern::Parse("F?").IsFailure());
}

// ============================================================================
// 锚点选择测试
// ============================================================================

TEST(BytePatternTest, AnchorIsLongestLiteralRun) {
    // AA ?? BB CC DD ?? EE
    auto p = BytePattern::Parse("AA ?? BB CC DD ?? EE").Value();
    EXPECT_EQ(p.AnchorOffset(), 2u);
    EXPECT_EQ(p.AnchorLength(), 3u);
}

TEST(BytePatternTest, AnchorPrefersEarlierRunOnTie) {
    auto p = BytePattern::Parse("AA BB ?? CC DD").Value();
    EXPECT_EQ(p.AnchorOffset(), 0u);
    EXPECT_EQ(p.AnchorLength(), 2u);
}

TEST(BytePatternTest, AnchorAvoidsFillByteRuns) {
    // bmp：较长的 00 段在镜像中随处可见，锚点应落在 "BM" 上
    auto bmp = BytePattern::Parse("42 4D ?? ?? ?? ?? 00 00 00 00").Value();
    EXPECT_EQ(bmp.AnchorOffset(), 0u);
    EXPECT_EQ(bmp.AnchorLength(), 2u);

    // 段内混有填充字节时按非填充字节数比较
    auto mixed = BytePattern::Parse("FF D8 FF E0 ?? ?? 4A 46").Value();
    EXPECT_EQ(mixed.AnchorOffset(), 0u);
    EXPECT_EQ(mixed.AnchorLength(), 4u);

    // 只有填充字节时退回最长段
    auto fill = BytePattern::Parse("00 ?? FF FF FF").Value();
    EXPECT_EQ(fill.AnchorOffset(), 2u);
    EXPECT_EQ(fill.AnchorLength(), 3u);
}

TEST(BytePatternTest, TarStyleAnchorAfterWildcards) {
    std::string text;
    for (int i = 0; i < 257; i++) {
        text += "??";
    }
    text += "7573746172";
    auto p = BytePattern::Parse(text).Value();

    EXPECT_EQ(p.Length(), 262u);
    EXPECT_EQ(p.AnchorOffset(), 257u);
    EXPECT_EQ(p.AnchorLength(), 5u);
}

// ============================================================================
// 匹配测试
// ============================================================================

TEST(BytePatternTest, MatchesAtHonoursWildcards) {
    auto p = BytePattern::Parse("42 4D ?? ?? 00").Value();

    std::vector<BYTE> good = { 0x42, 0x4D, 0x12, 0x34, 0x00, 0xFF };
    std::vector<BYTE> bad = { 0x42, 0x4D, 0x12, 0x34, 0x01 };

    EXPECT_TRUE(p.MatchesAt(good.data(), good.size()));
    EXPECT_FALSE(p.MatchesAt(bad.data(), bad.size()));
}

TEST(BytePatternTest, MatchesAtNeedsFullLength) {
    auto p = BytePattern::Parse("FF D8 FF").Value();
    std::vector<BYTE> data = { 0xFF, 0xD8 };
    EXPECT_FALSE(p.MatchesAt(data.data(), data.size()));
}
