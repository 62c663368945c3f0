#include <gtest/gtest.h>
#include "../../RawCarve/src/carving/CarveEngine.h"
#include "TestSignatures.h"
#include <algorithm>
#include <vector>

// ============================================================================
// 雕刻引擎测试
// ============================================================================

class CarveEngineTest : public ::testing::Test {
protected:
    static constexpr ULONGLONG TEN_MB = 10ULL * 1000 * 1000;

    SignatureCatalog catalog = MakeCatalog({
        MakeFooterSignature("jpeg", "FF D8 FF E0", "FF D9", TEN_MB)
    });

    std::vector<BYTE> header = { 0xFF, 0xD8, 0xFF, 0xE0 };
    std::vector<BYTE> footer = { 0xFF, 0xD9 };

    // 辅助：按块送入引擎并收集全部完成的会话
    std::vector<CarveSession> CarveAll(CarveEngine& engine, const std::vector<BYTE>& data,
                                       size_t chunkSize) {
        std::vector<CarveSession> sessions;
        for (size_t offset = 0; offset < data.size(); offset += chunkSize) {
            size_t size = std::min(chunkSize, data.size() - offset);
            EXPECT_TRUE(engine.Advance(data.data() + offset, size).IsSuccess());
            while (auto s = engine.NextFinalized()) {
                sessions.push_back(*s);
            }
        }
        EXPECT_TRUE(engine.Finish().IsSuccess());
        while (auto s = engine.NextFinalized()) {
            sessions.push_back(*s);
        }
        return sessions;
    }

    // 辅助：count 个 jpeg，每个 header + body 字节 + footer，之间以 gap 字节分隔
    std::vector<BYTE> CreateJpegStream(int count, size_t body, size_t gap) {
        std::vector<BYTE> data;
        for (int i = 0; i < count; i++) {
            data.insert(data.end(), gap, 0x00);
            data.insert(data.end(), header.begin(), header.end());
            data.insert(data.end(), body, 0x11);
            data.insert(data.end(), footer.begin(), footer.end());
        }
        data.insert(data.end(), gap, 0x00);
        return data;
    }
};

// ============================================================================
// 基本场景
// ============================================================================

TEST_F(CarveEngineTest, SingleJpegWithPadding) {
    auto data = CreateJpegStream(1, 100, 5);
    ASSERT_EQ(data.size(), 116u);

    CarveEngine engine(catalog);
    auto sessions = CarveAll(engine, data, data.size());

    ASSERT_EQ(sessions.size(), 1u);
    EXPECT_EQ(sessions[0].startOffset, 5u);
    EXPECT_EQ(*sessions[0].endOffset, 111u);
    EXPECT_TRUE(sessions[0].footerFound);
    EXPECT_TRUE(engine.IsFinished());
}

TEST_F(CarveEngineTest, HeaderWithoutFooterDiscarded) {
    std::vector<BYTE> data(20 * 1000 * 1000, 0x00);
    PutBytes(data, 0, header);

    CarveEngine engine(catalog);
    auto sessions = CarveAll(engine, data, 1024 * 1024);

    EXPECT_TRUE(sessions.empty());
    CarveEngineStats stats = engine.GetStats();
    EXPECT_EQ(stats.tracker.sessionsOpened, 1u);
    EXPECT_EQ(stats.tracker.sessionsDiscarded, 1u);
    EXPECT_EQ(stats.tracker.discardedExceededMaxSize, 1u);
}

TEST_F(CarveEngineTest, EmptyStream) {
    CarveEngine engine(catalog);
    int events = 0;
    engine.SetMatchObserver([&events](const MatchEvent&) { events++; });

    ASSERT_TRUE(engine.Finish().IsSuccess());
    EXPECT_FALSE(engine.HasFinalized());
    EXPECT_EQ(events, 0);

    CarveEngineStats stats = engine.GetStats();
    EXPECT_EQ(stats.bytesScanned, 0u);
    EXPECT_EQ(stats.tracker.sessionsOpened, 0u);
    EXPECT_EQ(stats.tracker.sessionsDiscarded, 0u);
}

// ============================================================================
// 块边界与恰好一次
// ============================================================================

TEST_F(CarveEngineTest, ExactlyOnceAcrossChunkSizes) {
    auto data = CreateJpegStream(20, 37, 11);

    for (size_t chunk : { 3u, 4u, 5u, 8u, 17u, 64u, 1000u }) {
        CarveEngine engine(catalog);
        int headerEvents = 0;
        engine.SetMatchObserver([&headerEvents](const MatchEvent& e) {
            if (e.kind == MatchKind::Header) headerEvents++;
        });

        auto sessions = CarveAll(engine, data, chunk);
        EXPECT_EQ(headerEvents, 20) << "chunk " << chunk;
        ASSERT_EQ(sessions.size(), 20u) << "chunk " << chunk;

        ULONGLONG expectedStart = 11;
        for (const auto& s : sessions) {
            EXPECT_EQ(s.startOffset, expectedStart);
            EXPECT_EQ(s.Length(), 4u + 37u + 2u);
            expectedStart += 11 + 4 + 37 + 2;
        }
    }
}

TEST_F(CarveEngineTest, Idempotent) {
    auto data = CreateJpegStream(5, 200, 3);

    CarveEngine first(catalog);
    CarveEngine second(catalog);
    auto a = CarveAll(first, data, 64);
    auto b = CarveAll(second, data, 64);

    ASSERT_EQ(a.size(), b.size());
    for (size_t i = 0; i < a.size(); i++) {
        EXPECT_EQ(a[i].startOffset, b[i].startOffset);
        EXPECT_EQ(*a[i].endOffset, *b[i].endOffset);
    }
}

TEST_F(CarveEngineTest, SessionsStrictlyInsideStream) {
    // 文件尾恰好位于流末尾
    auto data = CreateJpegStream(1, 10, 0);

    CarveEngine engine(catalog);
    auto sessions = CarveAll(engine, data, 4);
    ASSERT_EQ(sessions.size(), 1u);
    EXPECT_EQ(sessions[0].startOffset, 0u);
    EXPECT_EQ(*sessions[0].endOffset, data.size());
}

// ============================================================================
// 错误处理
// ============================================================================

TEST_F(CarveEngineTest, ShortChunkMidStreamLeavesStateUnchanged) {
    CarveEngine engine(catalog);
    std::vector<BYTE> chunk(16, 0x00);
    PutBytes(chunk, 4, header);

    ASSERT_TRUE(engine.Advance(chunk).IsSuccess());
    ASSERT_TRUE(engine.Advance(chunk.data(), 1).IsSuccess());     // 短块

    auto r = engine.Advance(chunk);
    ASSERT_TRUE(r.IsFailure());
    EXPECT_EQ(r.Error().code, RC::ErrorCode::BufferChunkTooSmall);
    EXPECT_EQ(engine.GetOpenSessionCount(), 1u);
    EXPECT_EQ(engine.StreamPosition(), 17u);
}

TEST_F(CarveEngineTest, AdvanceAfterFinishFails) {
    CarveEngine engine(catalog);
    ASSERT_TRUE(engine.Finish().IsSuccess());

    auto r = engine.Advance(std::vector<BYTE>(8, 0x00));
    ASSERT_TRUE(r.IsFailure());
    EXPECT_EQ(r.Error().code, RC::ErrorCode::BufferStreamEnded);
}

TEST_F(CarveEngineTest, CancelDiscardsOpenSessions) {
    CarveEngine engine(catalog);
    std::vector<BYTE> chunk(64, 0x00);
    PutBytes(chunk, 0, header);

    ASSERT_TRUE(engine.Advance(chunk).IsSuccess());
    EXPECT_EQ(engine.GetOpenSessionCount(), 1u);

    engine.Cancel();
    EXPECT_TRUE(engine.IsCancelled());
    EXPECT_FALSE(engine.HasFinalized());
    EXPECT_EQ(engine.GetStats().tracker.discardedCancelled, 1u);

    auto r = engine.Advance(chunk);
    ASSERT_TRUE(r.IsFailure());
    EXPECT_EQ(r.Error().code, RC::ErrorCode::LogicOperationCancelled);
}

TEST_F(CarveEngineTest, MinimumChunkSizeFollowsLongestPattern) {
    CarveEngine engine(catalog);
    EXPECT_EQ(engine.MinimumChunkSize(), 3u);
}
