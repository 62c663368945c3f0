#pragma once
#include "PlatformConfig.h"
#include "Result.h"
#include "SignatureCatalog.h"
#include "WindowBuffer.h"
#include "MultiPatternMatcher.h"
#include "CarveSessionTracker.h"
#include <functional>
#include <optional>
#include <vector>

using namespace std;

// 引擎统计
struct CarveEngineStats {
    ULONGLONG bytesScanned = 0;
    ULONGLONG chunksProcessed = 0;
    ULONGLONG headerMatches = 0;
    ULONGLONG footerMatches = 0;
    TrackerStats tracker;
};

// ============================================================================
// 雕刻引擎
// 每次推进：窗口缓冲 -> 匹配器扫描已确定前缀 -> 会话跟踪器。
// 输出为按起始偏移排序的完成会话序列，通过 NextFinalized() 逐个取出。
// ============================================================================
class CarveEngine {
private:
    const SignatureCatalog& catalog;
    WindowBuffer window;
    MultiPatternMatcher matcher;
    CarveSessionTracker tracker;

    vector<MatchEvent> events;      // 复用的事件缓冲
    function<void(const MatchEvent&)> matchObserver;

    CarveEngineStats stats;
    bool cancelled;

    CarveEngine(const CarveEngine&) = delete;
    CarveEngine& operator=(const CarveEngine&) = delete;

public:
    explicit CarveEngine(const SignatureCatalog& catalog);

    // 送入下一个数据块；失败时会话状态不变
    RC::Result<void> Advance(const BYTE* chunk, size_t size);
    RC::Result<void> Advance(const vector<BYTE>& chunk) {
        return Advance(chunk.data(), chunk.size());
    }

    // 流结束（等价于送入长度为 0 的块）
    RC::Result<void> Finish();

    // 取消扫描：打开的会话全部丢弃，之后的推进返回 LogicOperationCancelled
    void Cancel();

    optional<CarveSession> NextFinalized() { return tracker.PopFinalized(); }
    bool HasFinalized() const { return tracker.HasFinalized(); }

    bool IsFinished() const { return tracker.IsFinished(); }
    bool IsCancelled() const { return cancelled; }

    // 流中间的数据块最小长度
    size_t MinimumChunkSize() const { return window.MinimumChunkSize(); }

    ULONGLONG StreamPosition() const { return window.StreamPosition(); }

    // 起始位置小于该值的匹配都已处理
    ULONGLONG SettledPosition() const { return tracker.GetPosition(); }
    size_t GetOpenSessionCount() const { return tracker.GetOpenCount(); }
    optional<ULONGLONG> EarliestOpenStart() const { return tracker.EarliestOpenStart(); }

    // 分段扫描接续：claimEnd 之前的同类型文件头视为嵌套
    void ClaimUntil(size_t typeIndex, ULONGLONG claimEnd) { tracker.ClaimUntil(typeIndex, claimEnd); }

    // 每个会话完成或丢弃时回调（会话、占用终点）
    void SetResolvedObserver(function<void(const CarveSession&, ULONGLONG)> observer) {
        tracker.SetResolvedObserver(move(observer));
    }

    CarveEngineStats GetStats() const;

    // 观察每个送往跟踪器的匹配事件（测试和诊断用）
    void SetMatchObserver(function<void(const MatchEvent&)> observer) {
        matchObserver = move(observer);
    }

    const SignatureCatalog& GetCatalog() const { return catalog; }
};
