#include "SegmentScanThreadPool.h"
#include "Logger.h"
#include <algorithm>
#include <exception>

// ============================================================================
// 构造函数
// ============================================================================
SegmentScanThreadPool::SegmentScanThreadPool(const SignatureCatalog& sigCatalog, ByteSource& byteSource,
                                             const SegmentScanConfig& cfg,
                                             const atomic<bool>* externalCancel)
    : stopFlag(false)
    , cancelFlag(externalCancel)
    , catalog(sigCatalog)
    , source(byteSource)
    , completedTasks(0)
    , totalTasks(0)
    , totalSessionsFound(0)
    , totalBytesScanned(0)
    , config(cfg)
{
    if (config.autoDetectThreads || config.workerCount <= 0) {
        config.workerCount = GetOptimalThreadCount();
    }

    LOG_INFO_FMT("SegmentScanThreadPool created with %d workers, chunk size: %zu KB",
                 config.workerCount, config.chunkSize / 1024);
}

SegmentScanThreadPool::~SegmentScanThreadPool() {
    Stop();
}

// ============================================================================
// 启动/停止
// ============================================================================
void SegmentScanThreadPool::Start() {
    if (!workers.empty()) {
        LOG_WARNING("Thread pool already started");
        return;
    }

    stopFlag = false;
    completedTasks = 0;
    totalTasks = 0;

    for (int i = 0; i < config.workerCount; ++i) {
        workers.emplace_back(&SegmentScanThreadPool::WorkerFunction, this, i);
    }

    LOG_DEBUG_FMT("Thread pool started with %d workers", config.workerCount);
}

void SegmentScanThreadPool::Stop() {
    if (stopFlag.load() && workers.empty()) return;

    stopFlag = true;

    // 唤醒所有等待的线程
    taskAvailable.notify_all();
    queueNotFull.notify_all();

    for (auto& worker : workers) {
        if (worker.joinable()) {
            worker.join();
        }
    }

    workers.clear();
    LOG_DEBUG("Thread pool stopped");
}

// ============================================================================
// 工作线程主函数
// ============================================================================
void SegmentScanThreadPool::WorkerFunction(int workerIndex) {
    Logger::SetThreadTag("seg-" + to_string(workerIndex));

    while (true) {
        SegmentTask task;

        {
            unique_lock<mutex> lock(queueMutex);

            taskAvailable.wait(lock, [this] {
                return stopFlag.load() || !taskQueue.empty();
            });

            if (taskQueue.empty()) {
                // stopFlag 已置位且没有剩余任务
                return;
            }

            task = taskQueue.front();
            taskQueue.pop();
        }

        queueNotFull.notify_one();

        SegmentTaskResult result;
        result.taskId = task.taskId;
        result.bytesScanned = 0;
        result.cancelled = false;

        try {
            ScanSegment(catalog, source, config.chunkSize, task, result,
                        [this] { return ShouldStop(); }, &totalBytesScanned);
        }
        catch (const exception& e) {
            LOG_ERROR_FMT("Exception in segment %d: %s", task.taskId, e.what());
            result.error = RC::ErrorInfo(RC::ErrorCode::IOReadFailed,
                                         string("segment scan failed: ") + e.what(),
                                         "segment " + to_string(task.taskId));
        }

        totalSessionsFound += result.sessions.size();

        {
            lock_guard<mutex> lock(resultsMutex);
            results.push_back(move(result));
        }

        completedTasks++;

        int completed = completedTasks.load();
        if (completed % 10 == 0) {
            LOG_DEBUG_FMT("Progress: %d/%d segments (%.1f%%)",
                          completed, totalTasks.load(), GetProgress());
        }
    }
}

// ============================================================================
// 扫描单个段
// ============================================================================
void SegmentScanThreadPool::ScanSegment(const SignatureCatalog& catalog, ByteSource& source,
                                        size_t chunkSize, const SegmentTask& task,
                                        SegmentTaskResult& result,
                                        const function<bool()>& shouldStop,
                                        atomic<ULONGLONG>* bytesCounter) {
    ULONGLONG scanEnd = min(task.scanEnd, source.Length());
    if (scanEnd <= task.segmentStart) {
        return;
    }

    // 引擎内偏移相对于段起点
    ULONGLONG span = scanEnd - task.segmentStart;
    ULONGLONG ownedEnd = task.segmentEnd - task.segmentStart;

    CarveEngine engine(catalog);
    for (size_t i = 0; i < task.claimedUntil.size(); i++) {
        if (task.claimedUntil[i] > task.segmentStart) {
            engine.ClaimUntil(i, task.claimedUntil[i] - task.segmentStart);
        }
    }

    engine.SetResolvedObserver([&](const CarveSession& session, ULONGLONG claimEnd) {
        if (session.signature->allowOverlap || session.startOffset >= ownedEnd) {
            return;
        }
        SessionClaim claim;
        claim.typeIndex = session.typeIndex;
        claim.startOffset = session.startOffset + task.segmentStart;
        claim.claimEnd = claimEnd + task.segmentStart;
        result.claims.push_back(claim);
    });

    vector<BYTE> buffer(static_cast<size_t>(min<ULONGLONG>(max<size_t>(chunkSize, 1), span)));
    ULONGLONG position = 0;

    auto collect = [&]() {
        while (auto session = engine.NextFinalized()) {
            if (session->startOffset >= ownedEnd) {
                continue;   // 属于后一个段
            }
            session->startOffset += task.segmentStart;
            session->endOffset = *session->endOffset + task.segmentStart;
            result.sessions.push_back(*session);
        }
    };

    while (position < span) {
        if (shouldStop && shouldStop()) {
            engine.Cancel();
            result.cancelled = true;
            break;
        }

        size_t want = static_cast<size_t>(min<ULONGLONG>(buffer.size(), span - position));
        size_t got = 0;
        while (got < want) {
            auto read = source.ReadAt(task.segmentStart + position + got, buffer.data() + got, want - got);
            if (read.IsFailure()) {
                result.error = read.Error();
                break;
            }
            if (read.Value() == 0) {
                break;
            }
            got += read.Value();
        }

        if (!result.error.IsSuccess()) {
            LOG_ERROR_FMT("Segment %d read failed: %s", task.taskId, result.error.ToString().c_str());
            engine.Cancel();
            break;
        }
        if (got == 0) {
            break;
        }

        auto advanced = engine.Advance(buffer.data(), got);
        if (advanced.IsFailure()) {
            result.error = advanced.Error();
            LOG_ERROR_FMT("Segment %d advance failed: %s", task.taskId, result.error.ToString().c_str());
            engine.Cancel();
            break;
        }

        position += got;
        result.bytesScanned += got;
        if (bytesCounter != nullptr) {
            *bytesCounter += got;
        }
        collect();

        // 拥有区间已全部确定，且不再有起始于拥有区间的打开会话
        if (engine.SettledPosition() >= ownedEnd) {
            auto earliest = engine.EarliestOpenStart();
            if (!earliest || *earliest >= ownedEnd) {
                break;
            }
        }

        if (got < want) {
            break;
        }
    }

    if (!engine.IsFinished()) {
        auto finished = engine.Finish();
        if (finished.IsFailure()) {
            LOG_WARNING_FMT("Segment %d finish failed: %s", task.taskId, finished.Error().ToString().c_str());
        }
    }
    collect();

    result.stats = engine.GetStats();
}

// ============================================================================
// 任务管理
// ============================================================================
void SegmentScanThreadPool::SubmitTask(const SegmentTask& task) {
    {
        unique_lock<mutex> lock(queueMutex);

        queueNotFull.wait(lock, [this] {
            return taskQueue.size() < config.maxQueueSize || stopFlag.load();
        });

        if (stopFlag.load()) return;

        taskQueue.push(task);
        totalTasks++;
    }

    taskAvailable.notify_one();
}

vector<SegmentTaskResult> SegmentScanThreadPool::TakeResults() {
    lock_guard<mutex> lock(resultsMutex);

    sort(results.begin(), results.end(),
         [](const SegmentTaskResult& a, const SegmentTaskResult& b) {
             return a.taskId < b.taskId;
         });

    vector<SegmentTaskResult> taken;
    taken.swap(results);
    return taken;
}

double SegmentScanThreadPool::GetProgress() const {
    int total = totalTasks.load();
    if (total == 0) return 0.0;
    return (double)completedTasks.load() / total * 100.0;
}

// ============================================================================
// 获取最优线程数
// ============================================================================
int SegmentScanThreadPool::GetOptimalThreadCount() {
    int cores = ThreadPoolUtils::GetLogicalCoreCount();

    // 留出一个核心给读取和提取
    int optimalCount;
    if (cores >= 16) {
        optimalCount = cores - 4;
    } else if (cores >= 8) {
        optimalCount = cores - 2;
    } else if (cores >= 4) {
        optimalCount = cores - 1;
    } else {
        optimalCount = max(2, cores);
    }

    LOG_INFO_FMT("Detected %d logical cores, using %d worker threads", cores, optimalCount);
    return optimalCount;
}

namespace ThreadPoolUtils {

int GetLogicalCoreCount() {
    unsigned int cores = thread::hardware_concurrency();
    return (cores > 0) ? (int)cores : 4;  // 默认4核
}

}
