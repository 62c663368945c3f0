#include "CarveRunner.h"
#include "ParallelCarver.h"
#include "Logger.h"
#include <algorithm>
#include <chrono>

CarveRunner::CarveRunner(const SignatureCatalog& sigCatalog, const CarveRunConfig& cfg)
    : catalog(sigCatalog), config(cfg), stopFlag(false), bytesProcessed(0), totalBytes(0) {
}

double CarveRunner::GetProgress() const {
    ULONGLONG total = totalBytes.load();
    if (total == 0) return 0.0;
    return (double)bytesProcessed.load() / total * 100.0;
}

void CarveRunner::ReportProgress(ULONGLONG done, ULONGLONG total, ULONGLONG found) {
    bytesProcessed = done;
    if (progressCallback) {
        progressCallback(done, total, found);
    }
}

// ============================================================================
// 入口
// ============================================================================
RC::Result<CarveReport> CarveRunner::Run(ByteSource& source, ArtifactSink* sink) {
    size_t minimumChunk = catalog.MaxPatternLength() > 0 ? catalog.MaxPatternLength() - 1 : 0;
    if (config.chunkSize == 0 || config.chunkSize < minimumChunk) {
        return RC::Result<CarveReport>::Failure(RC::ErrorInfo(
            RC::ErrorCode::LogicInvalidArgument,
            "chunk size must be at least " + to_string(max<size_t>(minimumChunk, 1)) + " bytes",
            "chunkSize " + to_string(config.chunkSize)));
    }

    CarveReport report;
    report.source = source.Describe();
    report.sourceLength = source.Length();

    bytesProcessed = 0;
    totalBytes = report.sourceLength;

    auto startTime = chrono::steady_clock::now();

    bool parallel = config.workerCount != 1 && report.sourceLength > config.segmentSize;
    LOG_INFO_FMT("Carving %s (%llu bytes) with %zu signatures, %s scan",
                 report.source.c_str(), (unsigned long long)report.sourceLength,
                 catalog.Size(), parallel ? "parallel" : "sequential");

    RC::Result<void> scanned = parallel
        ? RunParallel(source, sink, report)
        : RunSequential(source, sink, report);
    if (scanned.IsFailure()) {
        return scanned.ForwardError<CarveReport>();
    }

    report.elapsedSeconds = chrono::duration<double>(chrono::steady_clock::now() - startTime).count();

    LOG_INFO_FMT("Carving finished: %zu files, %zu extraction failures, %llu discarded, %.2f s%s%s",
                 report.files.size(), report.failures.size(),
                 (unsigned long long)report.stats.tracker.sessionsDiscarded,
                 report.elapsedSeconds,
                 report.cancelled ? " (cancelled)" : "",
                 report.aborted ? " (aborted)" : "");

    return RC::Result<CarveReport>::Success(move(report));
}

// ============================================================================
// 顺序扫描
// ============================================================================
RC::Result<void> CarveRunner::RunSequential(ByteSource& source, ArtifactSink* sink, CarveReport& report) {
    CarveEngine engine(catalog);
    report.workersUsed = 1;

    ULONGLONG length = source.Length();
    vector<BYTE> buffer(static_cast<size_t>(min<ULONGLONG>(config.chunkSize, max<ULONGLONG>(length, 1))));
    ULONGLONG offset = 0;
    bool limitReached = false;

    auto drain = [&]() {
        while (auto session = engine.NextFinalized()) {
            if (limitReached) {
                continue;
            }
            if (!HandleSession(*session, source, sink, report)) {
                limitReached = true;
            }
        }
    };

    while (offset < length) {
        if (stopFlag.load()) {
            LOG_INFO_FMT("Scan cancelled at offset %llu", (unsigned long long)offset);
            report.cancelled = true;
            engine.Cancel();
            break;
        }

        size_t want = static_cast<size_t>(min<ULONGLONG>(buffer.size(), length - offset));
        size_t got = 0;
        RC::ErrorInfo readError;
        while (got < want) {
            auto read = source.ReadAt(offset + got, buffer.data() + got, want - got);
            if (read.IsFailure()) {
                readError = read.Error();
                break;
            }
            if (read.Value() == 0) {
                break;
            }
            got += read.Value();
        }

        if (!readError.IsSuccess()) {
            LOG_ERROR_FMT("Read failed at offset %llu: %s", (unsigned long long)(offset + got),
                          readError.ToString().c_str());
            report.aborted = true;
            report.abortError = readError;
            engine.Cancel();
            break;
        }
        if (got == 0) {
            LOG_WARNING_FMT("Source ended early at %llu of %llu bytes",
                            (unsigned long long)offset, (unsigned long long)length);
            break;
        }

        auto advanced = engine.Advance(buffer.data(), got);
        if (advanced.IsFailure()) {
            LOG_ERROR_FMT("Engine advance failed: %s", advanced.Error().ToString().c_str());
            report.aborted = true;
            report.abortError = advanced.Error();
            engine.Cancel();
            break;
        }

        offset += got;
        drain();
        ReportProgress(offset, length, report.files.size());

        if (limitReached) {
            LOG_WARNING_FMT("Result limit of %zu reached, stopping scan", config.maxResults);
            report.truncated = true;
            engine.Cancel();
            break;
        }

        if (got < want) {
            LOG_WARNING_FMT("Source ended early at %llu of %llu bytes",
                            (unsigned long long)offset, (unsigned long long)length);
            break;
        }
    }

    if (!engine.IsFinished()) {
        auto finished = engine.Finish();
        if (finished.IsFailure()) {
            return finished;
        }
    }
    drain();
    if (limitReached && !report.truncated) {
        LOG_WARNING_FMT("Result limit of %zu reached at end of stream", config.maxResults);
        report.truncated = true;
    }

    report.bytesScanned = engine.StreamPosition();
    report.stats = engine.GetStats();
    ReportProgress(report.bytesScanned, length, report.files.size());
    return RC::Result<void>::Success();
}

// ============================================================================
// 并行分段扫描：先扫描，再按起始偏移顺序提取
// ============================================================================
RC::Result<void> CarveRunner::RunParallel(ByteSource& source, ArtifactSink* sink, CarveReport& report) {
    ParallelCarveConfig parallelConfig;
    parallelConfig.workerCount = config.workerCount;
    parallelConfig.chunkSize = config.chunkSize;
    parallelConfig.segmentSize = config.segmentSize;

    ParallelCarver carver(catalog, parallelConfig);

    // 扫描期间的找到数来自各段，合并后以最终结果为准
    auto scanned = carver.Scan(source, [this, &carver](ULONGLONG done, ULONGLONG total, ULONGLONG found) {
        if (stopFlag.load()) {
            carver.Stop();
        }
        ReportProgress(done, total, found);
    });
    if (scanned.IsFailure()) {
        return RC::Result<void>::Failure(scanned.Error());
    }

    ParallelCarveResult& result = scanned.Value();
    report.workersUsed = result.workerCount;
    report.bytesScanned = min(result.bytesScanned, report.sourceLength);
    report.stats = result.stats;
    report.cancelled = result.cancelled;
    if (!result.error.IsSuccess()) {
        report.aborted = true;
        report.abortError = result.error;
    }

    for (const CarveSession& session : result.sessions) {
        if (!HandleSession(session, source, sink, report)) {
            LOG_WARNING_FMT("Result limit of %zu reached", config.maxResults);
            report.truncated = true;
            break;
        }
    }

    return RC::Result<void>::Success();
}

// ============================================================================
// 处理完成的会话
// ============================================================================
bool CarveRunner::HandleSession(const CarveSession& session, ByteSource& source,
                                ArtifactSink* sink, CarveReport& report) {
    if (config.maxResults > 0 && report.files.size() >= config.maxResults) {
        return false;
    }

    CarvedFileRecord record;
    record.typeId = session.TypeId();
    record.extension = session.signature->Extension();
    record.description = session.signature->description;
    record.startOffset = session.startOffset;
    record.endOffset = *session.endOffset;
    record.footerFound = session.footerFound;

    if (config.extract && sink != nullptr) {
        auto extracted = extractor.ExtractTo(session, source, *sink, &record.outputName);
        if (extracted.IsFailure()) {
            // 单个会话提取失败不影响其它会话
            LOG_WARNING_FMT("Extraction of '%s' at %llu failed: %s", record.typeId.c_str(),
                            (unsigned long long)record.startOffset,
                            extracted.Error().ToString().c_str());
            ExtractionFailure failure;
            failure.typeId = record.typeId;
            failure.startOffset = record.startOffset;
            failure.endOffset = record.endOffset;
            failure.error = extracted.Error();
            report.failures.push_back(failure);
            return true;
        }
    }

    LOG_DEBUG_FMT("Carved '%s' [%llu, %llu)", record.typeId.c_str(),
                  (unsigned long long)record.startOffset, (unsigned long long)record.endOffset);
    report.files.push_back(record);
    return true;
}
