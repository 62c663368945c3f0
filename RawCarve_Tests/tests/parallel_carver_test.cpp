#include <gtest/gtest.h>
#include "../../RawCarve/src/carving/ParallelCarver.h"
#include "../../RawCarve/src/carving/CarveEngine.h"
#include "../../RawCarve/src/carving/ByteSource.h"
#include "TestSignatures.h"
#include <algorithm>
#include <vector>

// ============================================================================
// 并行分段雕刻测试
// ============================================================================

class ParallelCarverTest : public ::testing::Test {
protected:
    SignatureCatalog catalog = MakeCatalog({
        MakeFooterSignature("pdf", "25 50 44 46", "25 25 45 4F 46", 3000),
        MakeCappedSignature("bin", "B1 B2 B3", 700),
        MakeFixedSignature("tag", "7A 7B", 40)
    }, 3000);

    std::vector<BYTE> pdfHeader = { 0x25, 0x50, 0x44, 0x46 };
    std::vector<BYTE> pdfFooter = { 0x25, 0x25, 0x45, 0x4F, 0x46 };

    void PutPdf(std::vector<BYTE>& data, size_t start, size_t length) {
        PutBytes(data, start, pdfHeader);
        PutBytes(data, start + length - pdfFooter.size(), pdfFooter);
    }

    // 辅助：顺序扫描作为参照
    std::vector<CarveSession> CarveSequential(const std::vector<BYTE>& data) {
        CarveEngine engine(catalog);
        std::vector<CarveSession> out;
        for (size_t offset = 0; offset < data.size(); offset += 512) {
            size_t size = std::min<size_t>(512, data.size() - offset);
            EXPECT_TRUE(engine.Advance(data.data() + offset, size).IsSuccess());
            while (auto s = engine.NextFinalized()) out.push_back(*s);
        }
        EXPECT_TRUE(engine.Finish().IsSuccess());
        while (auto s = engine.NextFinalized()) out.push_back(*s);
        return out;
    }

    void ExpectSameSessions(const std::vector<CarveSession>& a, const std::vector<CarveSession>& b) {
        ASSERT_EQ(a.size(), b.size());
        for (size_t i = 0; i < a.size(); i++) {
            EXPECT_EQ(a[i].TypeId(), b[i].TypeId()) << "session " << i;
            EXPECT_EQ(a[i].startOffset, b[i].startOffset) << "session " << i;
            EXPECT_EQ(*a[i].endOffset, *b[i].endOffset) << "session " << i;
            EXPECT_EQ(a[i].footerFound, b[i].footerFound) << "session " << i;
        }
    }
};

TEST_F(ParallelCarverTest, OverlapCoversLargestSession) {
    ParallelCarveConfig config;
    ParallelCarver carver(catalog, config);
    EXPECT_EQ(carver.OverlapLength(), 3000u + 5u);
}

TEST_F(ParallelCarverTest, MatchesSequentialWithFilesAcrossSegments) {
    std::vector<BYTE> data(40000, 0x00);
    PutPdf(data, 100, 500);
    PutPdf(data, 3990, 2000);        // 跨过 4000 段边界
    PutBytes(data, 7998, { 0xB1, 0xB2, 0xB3 });   // 文件头本身跨边界
    PutBytes(data, 12030, { 0x7A, 0x7B });
    PutPdf(data, 15990, 2900);       // 延伸进下一段的重叠区
    PutBytes(data, 23999, { 0x7A, 0x7B });
    PutPdf(data, 36000, 3990);       // 超过 maxSize，丢弃
    PutBytes(data, 39500, { 0xB1, 0xB2, 0xB3 });  // 流末尾截断，不完整

    auto reference = CarveSequential(data);
    ASSERT_EQ(reference.size(), 6u);

    for (int workers : { 1, 2, 4 }) {
        ParallelCarveConfig config;
        config.workerCount = workers;
        config.chunkSize = 1024;
        config.segmentSize = 4000;

        ParallelCarver carver(catalog, config);
        MemoryByteSource source(data);
        auto r = carver.Scan(source);
        ASSERT_TRUE(r.IsSuccess()) << r.Error().ToString();

        EXPECT_EQ(r.Value().segmentCount, 10);
        EXPECT_FALSE(r.Value().cancelled);
        EXPECT_TRUE(r.Value().error.IsSuccess());
        ExpectSameSessions(reference, r.Value().sessions);
    }
}

TEST_F(ParallelCarverTest, SingleSegmentInput) {
    std::vector<BYTE> data(1000, 0x00);
    PutPdf(data, 10, 200);

    ParallelCarveConfig config;
    config.workerCount = 2;
    config.segmentSize = 1 << 20;
    ParallelCarver carver(catalog, config);
    MemoryByteSource source(data);

    auto r = carver.Scan(source);
    ASSERT_TRUE(r.IsSuccess());
    EXPECT_EQ(r.Value().segmentCount, 1);
    ExpectSameSessions(CarveSequential(data), r.Value().sessions);
}

TEST_F(ParallelCarverTest, ZeroSegmentSizeRejected) {
    ParallelCarveConfig config;
    config.segmentSize = 0;
    ParallelCarver carver(catalog, config);
    MemoryByteSource source(std::vector<BYTE>(100, 0x00));

    auto r = carver.Scan(source);
    ASSERT_TRUE(r.IsFailure());
    EXPECT_EQ(r.Error().code, RC::ErrorCode::LogicInvalidArgument);
}

TEST_F(ParallelCarverTest, ProgressReportsTotal) {
    std::vector<BYTE> data(20000, 0x00);
    ParallelCarveConfig config;
    config.workerCount = 2;
    config.segmentSize = 5000;
    ParallelCarver carver(catalog, config);
    MemoryByteSource source(data);

    ULONGLONG lastDone = 0;
    ULONGLONG lastFound = 0;
    auto r = carver.Scan(source, [&](ULONGLONG done, ULONGLONG total, ULONGLONG found) {
        EXPECT_EQ(total, 20000u);
        lastDone = done;
        lastFound = found;
    });
    ASSERT_TRUE(r.IsSuccess());
    EXPECT_EQ(lastDone, 20000u);
    EXPECT_EQ(lastFound, 0u);
}

TEST_F(ParallelCarverTest, ProgressReportsFoundSessions) {
    std::vector<BYTE> data(20000, 0x00);
    PutPdf(data, 1000, 400);
    PutPdf(data, 11000, 400);
    PutBytes(data, 16000, { 0x7A, 0x7B });

    ParallelCarveConfig config;
    config.workerCount = 2;
    config.segmentSize = 5000;
    ParallelCarver carver(catalog, config);
    MemoryByteSource source(data);

    ULONGLONG lastFound = 0;
    auto r = carver.Scan(source, [&lastFound](ULONGLONG, ULONGLONG, ULONGLONG found) {
        lastFound = found;
    });
    ASSERT_TRUE(r.IsSuccess());
    EXPECT_EQ(r.Value().sessions.size(), 3u);
    EXPECT_EQ(lastFound, 3u);
}

// ============================================================================
// 跨段接续：前一段的会话挡住的文件头
// ============================================================================

TEST_F(ParallelCarverTest, NestedHeaderAfterBoundaryDoesNotHideLaterFile) {
    std::vector<BYTE> data(10000, 0x00);
    PutBytes(data, 3800, { 0xB1, 0xB2, 0xB3 });   // [3800, 4500) 跨过 4000
    PutBytes(data, 4100, { 0xB1, 0xB2, 0xB3 });   // 嵌套
    PutBytes(data, 4600, { 0xB1, 0xB2, 0xB3 });   // 合法，不能被 4100 挡掉

    auto reference = CarveSequential(data);
    ASSERT_EQ(reference.size(), 2u);
    EXPECT_EQ(reference[1].startOffset, 4600u);
    EXPECT_EQ(*reference[1].endOffset, 5300u);

    ParallelCarveConfig config;
    config.workerCount = 2;
    config.segmentSize = 4000;
    ParallelCarver carver(catalog, config);
    MemoryByteSource source(data);

    auto r = carver.Scan(source);
    ASSERT_TRUE(r.IsSuccess()) << r.Error().ToString();
    EXPECT_EQ(r.Value().rescannedSegments, 1);
    ExpectSameSessions(reference, r.Value().sessions);
}

TEST_F(ParallelCarverTest, ClaimsChainAcrossSeveralSegments) {
    std::vector<BYTE> data(16000, 0x00);
    for (size_t offset : { 3800, 4100, 4600, 5200, 5400, 7900, 8200, 8650 }) {
        PutBytes(data, offset, { 0xB1, 0xB2, 0xB3 });
    }
    // pdf 在 11500 打开，12300 的文件头嵌套其中；14499 的文件尾使结果超过 3000，
    // 整个会话丢弃，12300 开始的会话也不能出现
    PutBytes(data, 11500, pdfHeader);
    PutBytes(data, 12300, pdfHeader);
    PutBytes(data, 14499, pdfFooter);

    auto reference = CarveSequential(data);
    ASSERT_EQ(reference.size(), 5u);
    const ULONGLONG expectedStarts[] = { 3800, 4600, 5400, 7900, 8650 };
    for (size_t i = 0; i < reference.size(); i++) {
        EXPECT_EQ(reference[i].startOffset, expectedStarts[i]);
        EXPECT_EQ(reference[i].TypeId(), "bin");
    }

    for (int workers : { 1, 3 }) {
        ParallelCarveConfig config;
        config.workerCount = workers;
        config.chunkSize = 700;
        config.segmentSize = 4000;
        ParallelCarver carver(catalog, config);
        MemoryByteSource source(data);

        auto r = carver.Scan(source);
        ASSERT_TRUE(r.IsSuccess()) << r.Error().ToString();
        EXPECT_EQ(r.Value().segmentCount, 4);
        EXPECT_EQ(r.Value().rescannedSegments, 3);
        ExpectSameSessions(reference, r.Value().sessions);
    }
}

TEST_F(ParallelCarverTest, SegmentsWithoutCarryOverAreNotRescanned) {
    std::vector<BYTE> data(12000, 0x00);
    PutPdf(data, 3500, 1000);           // 跨边界，但下一段里没有同类型文件头
    PutPdf(data, 4700, 300);
    PutBytes(data, 8100, { 0xB1, 0xB2, 0xB3 });

    ParallelCarveConfig config;
    config.workerCount = 2;
    config.segmentSize = 4000;
    ParallelCarver carver(catalog, config);
    MemoryByteSource source(data);

    auto r = carver.Scan(source);
    ASSERT_TRUE(r.IsSuccess());
    EXPECT_EQ(r.Value().rescannedSegments, 0);
    ExpectSameSessions(CarveSequential(data), r.Value().sessions);
}

// ============================================================================
// 合并
// ============================================================================

TEST_F(ParallelCarverTest, MergeDropsDuplicatesAndNested) {
    auto make = [this](size_t typeIndex, ULONGLONG start, ULONGLONG end) {
        CarveSession s;
        s.signature = &catalog.At(typeIndex);
        s.typeIndex = typeIndex;
        s.startOffset = start;
        s.endOffset = end;
        s.state = SessionState::Finalized;
        return s;
    };

    std::vector<CarveSession> parts = {
        make(0, 500, 900),
        make(0, 100, 600),
        make(0, 100, 600),      // 重复
        make(1, 120, 820),      // 其它类型，保留
        make(0, 950, 1000)
    };

    auto merged = ParallelCarver::MergeSegmentSessions(parts);
    ASSERT_EQ(merged.size(), 3u);
    EXPECT_EQ(merged[0].startOffset, 100u);
    EXPECT_EQ(merged[1].startOffset, 120u);
    EXPECT_EQ(merged[1].typeIndex, 1u);
    EXPECT_EQ(merged[2].startOffset, 950u);
}

TEST_F(ParallelCarverTest, MergeKeepsOverlapAllowedTypes) {
    SignatureDefinition def = MakeFooterSignature("nest", "11 22", "33 44", 1000);
    def.allowOverlap = true;
    SignatureCatalog overlapping = MakeCatalog({ def });

    CarveSession outer;
    outer.signature = &overlapping.At(0);
    outer.startOffset = 0;
    outer.endOffset = 100;
    outer.state = SessionState::Finalized;
    CarveSession inner = outer;
    inner.startOffset = 10;

    auto merged = ParallelCarver::MergeSegmentSessions({ inner, outer });
    ASSERT_EQ(merged.size(), 2u);
    EXPECT_EQ(merged[0].startOffset, 0u);
}
