#include "ParallelCarver.h"
#include "SegmentScanThreadPool.h"
#include "Logger.h"
#include <algorithm>
#include <chrono>
#include <thread>
#include <unordered_map>

ParallelCarver::ParallelCarver(const SignatureCatalog& sigCatalog, const ParallelCarveConfig& cfg)
    : catalog(sigCatalog), config(cfg), stopRequested(false) {
}

ULONGLONG ParallelCarver::OverlapLength() const {
    ULONGLONG largest = catalog.LargestEffectiveMaxSize();
    return largest + catalog.MaxPatternLength();
}

namespace {

void AddStats(CarveEngineStats& total, const CarveEngineStats& part) {
    total.bytesScanned += part.bytesScanned;
    total.chunksProcessed += part.chunksProcessed;
    total.headerMatches += part.headerMatches;
    total.footerMatches += part.footerMatches;

    TrackerStats& t = total.tracker;
    const TrackerStats& p = part.tracker;
    t.headersSeen += p.headersSeen;
    t.headersNested += p.headersNested;
    t.footersSeen += p.footersSeen;
    t.footersUnmatched += p.footersUnmatched;
    t.sessionsOpened += p.sessionsOpened;
    t.sessionsFinalized += p.sessionsFinalized;
    t.sessionsDiscarded += p.sessionsDiscarded;
    t.discardedExceededMaxSize += p.discardedExceededMaxSize;
    t.discardedFooterBeyondMaxSize += p.discardedFooterBeyondMaxSize;
    t.discardedIncomplete += p.discardedIncomplete;
    t.discardedCancelled += p.discardedCancelled;
}

// 是否有会话起始于前面各段留下的同类型占用范围内
bool StartsInsideClaim(const vector<SessionClaim>& claims, const vector<ULONGLONG>& claimed) {
    for (const SessionClaim& claim : claims) {
        if (claim.startOffset < claimed[claim.typeIndex]) {
            return true;
        }
    }
    return false;
}

} // namespace

// ============================================================================
// 分段扫描
// ============================================================================
RC::Result<ParallelCarveResult> ParallelCarver::Scan(ByteSource& source,
                                                     function<void(ULONGLONG, ULONGLONG, ULONGLONG)> progress) {
    if (config.segmentSize == 0) {
        return RC::Result<ParallelCarveResult>::Failure(
            RC::ErrorCode::LogicInvalidArgument, "segment size must be positive");
    }

    ParallelCarveResult result;
    ULONGLONG length = source.Length();
    ULONGLONG overlap = OverlapLength();

    SegmentScanConfig poolConfig;
    poolConfig.workerCount = config.workerCount;
    poolConfig.autoDetectThreads = (config.workerCount <= 0);
    poolConfig.chunkSize = config.chunkSize;

    SegmentScanThreadPool pool(catalog, source, poolConfig, &stopRequested);
    result.workerCount = pool.GetWorkerCount();

    LOG_INFO_FMT("Parallel scan of %s: %llu bytes, segment %llu, overlap %llu, %d workers",
                 source.Describe().c_str(), (unsigned long long)length,
                 (unsigned long long)config.segmentSize, (unsigned long long)overlap,
                 result.workerCount);

    pool.Start();

    // 提交任务与进度显示放在同一线程：队列满时 SubmitTask 会阻塞
    vector<SegmentTask> tasks;
    for (ULONGLONG start = 0; start < length && !stopRequested.load(); start += config.segmentSize) {
        SegmentTask task;
        task.segmentStart = start;
        task.segmentEnd = (length - start > config.segmentSize) ? start + config.segmentSize : length;
        ULONGLONG scanEnd = task.segmentEnd + overlap;
        task.scanEnd = (scanEnd < task.segmentEnd || scanEnd > length) ? length : scanEnd;
        task.taskId = static_cast<int>(tasks.size());
        tasks.push_back(task);
        pool.SubmitTask(task);
    }
    result.segmentCount = static_cast<int>(tasks.size());

    while (!pool.IsComplete()) {
        if (progress) {
            progress(min(pool.GetTotalBytesScanned(), length), length, pool.GetTotalSessionsFound());
        }
        this_thread::sleep_for(chrono::milliseconds(100));
    }
    pool.Stop();

    // 按段顺序接续：claimed 记录前面各段的会话对每种类型的占用终点。
    // 段内若有会话起始于这个范围内，说明该段从空状态开始时打开了本应嵌套的会话，
    // 它可能挡掉了后面合法的文件头，用接续状态重扫该段。
    vector<SegmentTaskResult> parts = pool.TakeResults();
    vector<ULONGLONG> claimed(catalog.Size(), 0);
    vector<CarveSession> all;
    for (SegmentTaskResult& part : parts) {
        if (!stopRequested.load() && part.error.IsSuccess() && !part.cancelled &&
            StartsInsideClaim(part.claims, claimed)) {
            SegmentTask task = tasks[part.taskId];
            task.claimedUntil = claimed;

            LOG_INFO_FMT("Segment %d opened sessions inside a range claimed by earlier segments, rescanning",
                         part.taskId);

            SegmentTaskResult rescanned;
            rescanned.taskId = part.taskId;
            rescanned.bytesScanned = 0;
            rescanned.cancelled = false;
            SegmentScanThreadPool::ScanSegment(catalog, source, config.chunkSize, task, rescanned,
                                               [this] { return stopRequested.load(); });
            result.bytesScanned += part.bytesScanned;     // 第一遍扫描的字节
            result.rescannedSegments++;
            part = move(rescanned);
        }

        for (const SessionClaim& claim : part.claims) {
            claimed[claim.typeIndex] = max(claimed[claim.typeIndex], claim.claimEnd);
        }

        AddStats(result.stats, part.stats);
        result.bytesScanned += part.bytesScanned;
        result.cancelled = result.cancelled || part.cancelled;
        if (!part.error.IsSuccess() && result.error.IsSuccess()) {
            result.error = part.error;
        }
        all.insert(all.end(), part.sessions.begin(), part.sessions.end());
    }
    if (stopRequested.load()) {
        result.cancelled = true;
    }

    result.sessions = MergeSegmentSessions(move(all));

    if (progress) {
        progress(length, length, result.sessions.size());
    }

    LOG_INFO_FMT("Parallel scan finished: %d segments (%d rescanned), %zu sessions%s",
                 result.segmentCount, result.rescannedSegments, result.sessions.size(),
                 result.cancelled ? " (cancelled)" : "");
    return RC::Result<ParallelCarveResult>::Success(move(result));
}

// ============================================================================
// 合并
// ============================================================================
vector<CarveSession> ParallelCarver::MergeSegmentSessions(vector<CarveSession> sessions) {
    sort(sessions.begin(), sessions.end(), [](const CarveSession& a, const CarveSession& b) {
        if (a.startOffset != b.startOffset) {
            return a.startOffset < b.startOffset;
        }
        if (a.typeIndex != b.typeIndex) {
            return a.typeIndex < b.typeIndex;
        }
        return *a.endOffset < *b.endOffset;
    });

    vector<CarveSession> merged;
    merged.reserve(sessions.size());
    unordered_map<size_t, ULONGLONG> acceptedEnd;   // 每种类型已接受会话的最远结束位置

    for (const CarveSession& session : sessions) {
        if (!merged.empty()) {
            const CarveSession& prev = merged.back();
            if (prev.startOffset == session.startOffset && prev.typeIndex == session.typeIndex &&
                prev.endOffset == session.endOffset) {
                continue;   // 重复
            }
        }

        if (!session.signature->allowOverlap) {
            auto it = acceptedEnd.find(session.typeIndex);
            if (it != acceptedEnd.end() && session.startOffset < it->second) {
                LOG_DEBUG_FMT("Merge dropped nested '%s' session at %llu",
                              session.TypeId().c_str(), (unsigned long long)session.startOffset);
                continue;
            }
        }

        ULONGLONG& end = acceptedEnd[session.typeIndex];
        end = max(end, *session.endOffset);
        merged.push_back(session);
    }

    return merged;
}
