#pragma once
#include "PlatformConfig.h"
#include "SignatureCatalog.h"
#include "MultiPatternMatcher.h"
#include <deque>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

using namespace std;

enum class SessionState {
    Open,
    Finalized,
    Discarded
};

// 丢弃原因（丢弃是预期结果，不是错误）
enum class DiscardReason {
    None,
    ExceededMaxSize,        // 超过 maxSize 仍未找到文件尾
    FooterBeyondMaxSize,    // 找到文件尾，但结果超过 maxSize
    IncompleteAtEnd,        // 流结束时仍未满足结束条件
    Cancelled               // 扫描被取消
};

const char* DiscardReasonName(DiscardReason reason);

// ============================================================================
// 雕刻会话 - 一个候选文件从文件头到完成/丢弃的全过程
// ============================================================================
struct CarveSession {
    const SignatureDefinition* signature;
    size_t typeIndex;
    ULONGLONG startOffset;
    optional<ULONGLONG> endOffset;      // 打开期间为空，结束位置不含
    SessionState state;
    DiscardReason discardReason;
    bool footerFound;

    CarveSession()
        : signature(nullptr), typeIndex(0), startOffset(0),
          state(SessionState::Open), discardReason(DiscardReason::None), footerFound(false) {}

    const string& TypeId() const { return signature->typeId; }
    ULONGLONG Length() const { return endOffset ? *endOffset - startOffset : 0; }
};

// 会话统计
struct TrackerStats {
    ULONGLONG headersSeen = 0;
    ULONGLONG headersNested = 0;            // 因同类型会话已打开而忽略的文件头
    ULONGLONG footersSeen = 0;
    ULONGLONG footersUnmatched = 0;         // 没有对应会话的文件尾
    ULONGLONG sessionsOpened = 0;
    ULONGLONG sessionsFinalized = 0;
    ULONGLONG sessionsDiscarded = 0;
    ULONGLONG discardedExceededMaxSize = 0;
    ULONGLONG discardedFooterBeyondMaxSize = 0;
    ULONGLONG discardedIncomplete = 0;
    ULONGLONG discardedCancelled = 0;
};

// ============================================================================
// 雕刻会话跟踪器
// 由位置驱动：AdvanceTo(p) 表示起始位置小于 p 的匹配都已送达、
// p 之前的数据都已可用。完成的会话按起始偏移非递减顺序释放。
// ============================================================================
class CarveSessionTracker {
private:
    const SignatureCatalog& catalog;

    vector<CarveSession> openSessions;                          // 按起始偏移有序
    map<pair<ULONGLONG, size_t>, CarveSession> finalizedPending; // 等待更早的会话结束
    deque<CarveSession> ready;                                  // 可按序输出
    vector<ULONGLONG> claimedUntil;                             // 每种类型：此偏移之前的文件头视为嵌套

    ULONGLONG position;
    bool finished;
    TrackerStats stats;
    function<void(const CarveSession&, ULONGLONG)> resolvedObserver;

    void HandleHeader(const MatchEvent& event);
    void HandleFooter(const MatchEvent& event);

    void Finalize(CarveSession& session, ULONGLONG endOffset, bool footerFound);
    // claimEnd：该会话挡住同类型文件头直到此偏移（不含）
    void Discard(CarveSession& session, DiscardReason reason, ULONGLONG claimEnd);

    // 从 openSessions 中移除已结束的会话
    void CollectResolved();

    // 把不再被更早会话阻挡的完成会话移入 ready
    void ReleaseReady();

public:
    explicit CarveSessionTracker(const SignatureCatalog& catalog);

    // 处理一个匹配事件（事件须按偏移顺序送达）
    void OnMatch(const MatchEvent& event);

    // 把 claimEnd 之前的同类型文件头视为嵌套（接续前一段扫描留下的占用范围）
    void ClaimUntil(size_t typeIndex, ULONGLONG claimEnd);

    // 会话完成或丢弃时回调，第二个参数为该会话的占用终点
    void SetResolvedObserver(function<void(const CarveSession&, ULONGLONG)> observer) {
        resolvedObserver = move(observer);
    }

    // 推进到流位置 p，按固定长度/上限/超限规则结算会话
    void AdvanceTo(ULONGLONG p);

    // 流结束：结算到 streamLength，其余打开的会话作为不完整丢弃
    void Finish(ULONGLONG streamLength);

    // 取消：所有打开的会话丢弃，不会被补成完成状态
    void Cancel();

    // 取出下一个完成的会话（按起始偏移顺序，每个只输出一次）
    optional<CarveSession> PopFinalized();
    bool HasFinalized() const { return !ready.empty(); }

    size_t GetOpenCount() const { return openSessions.size(); }

    // 最早的打开会话起始位置（没有打开的会话时为空）
    optional<ULONGLONG> EarliestOpenStart() const {
        if (openSessions.empty()) {
            return nullopt;
        }
        return openSessions.front().startOffset;
    }
    ULONGLONG GetPosition() const { return position; }
    bool IsFinished() const { return finished; }
    const TrackerStats& GetStats() const { return stats; }
};
