#include "Extractor.h"
#include "Logger.h"
#include <algorithm>

namespace {

string RangeContext(ULONGLONG start, ULONGLONG end) {
    return "[" + to_string(start) + ", " + to_string(end) + ")";
}

// 检查区间有效且字节源能完整提供
RC::Result<void> CheckRange(ULONGLONG start, ULONGLONG end, const ByteSource& source) {
    if (end <= start) {
        return RC::Result<void>::Failure(RC::ErrorInfo(
            RC::ErrorCode::ExtractInvalidRange, "empty or inverted range", RangeContext(start, end)));
    }
    if (end > source.Length()) {
        return RC::Result<void>::Failure(RC::ErrorInfo(
            RC::ErrorCode::ExtractSourceUnavailable,
            "range beyond end of source (" + to_string(source.Length()) + " bytes)",
            source.Describe() + " " + RangeContext(start, end)));
    }
    return RC::Result<void>::Success();
}

// 读满 size 字节；字节源提前结束或读取失败均视为不可用
RC::Result<void> ReadFully(ByteSource& source, ULONGLONG offset, BYTE* buffer, size_t size) {
    size_t done = 0;
    while (done < size) {
        auto read = source.ReadAt(offset + done, buffer + done, size - done);
        if (read.IsFailure()) {
            return RC::Result<void>::Failure(RC::ErrorInfo(
                RC::ErrorCode::ExtractSourceUnavailable, read.Error().ToString(),
                source.Describe(), read.Error().systemErrorCode));
        }
        if (read.Value() == 0) {
            return RC::Result<void>::Failure(RC::ErrorInfo(
                RC::ErrorCode::ExtractSourceUnavailable, "source ended early",
                source.Describe() + " @" + to_string(offset + done)));
        }
        done += read.Value();
    }
    return RC::Result<void>::Success();
}

} // namespace

Extractor::Extractor(size_t block, ULONGLONG limit)
    : blockSize(block > 0 ? block : DEFAULT_BLOCK_SIZE), memoryLimit(limit) {
}

// ============================================================================
// 内存提取
// ============================================================================
RC::Result<vector<BYTE>> Extractor::Extract(ULONGLONG start, ULONGLONG end, ByteSource& source) const {
    auto valid = CheckRange(start, end, source);
    if (valid.IsFailure()) {
        return valid.ForwardError<vector<BYTE>>();
    }

    ULONGLONG length = end - start;
    if (length > memoryLimit) {
        return RC::Result<vector<BYTE>>::Failure(RC::ErrorInfo(
            RC::ErrorCode::ExtractRangeTooLarge,
            "range exceeds in-memory limit of " + to_string(memoryLimit) + " bytes",
            RangeContext(start, end)));
    }

    vector<BYTE> data(static_cast<size_t>(length));
    auto read = ReadFully(source, start, data.data(), data.size());
    if (read.IsFailure()) {
        return read.ForwardError<vector<BYTE>>();
    }
    return RC::Result<vector<BYTE>>::Success(move(data));
}

RC::Result<Artifact> Extractor::Extract(const CarveSession& session, ByteSource& source) const {
    if (session.state != SessionState::Finalized || !session.endOffset) {
        return RC::Result<Artifact>::Failure(RC::ErrorInfo(
            RC::ErrorCode::ExtractInvalidRange, "session is not finalized",
            "start " + to_string(session.startOffset)));
    }

    auto bytes = Extract(session.startOffset, *session.endOffset, source);
    if (bytes.IsFailure()) {
        return bytes.ForwardError<Artifact>();
    }

    Artifact artifact;
    artifact.typeId = session.TypeId();
    artifact.extension = session.signature->Extension();
    artifact.startOffset = session.startOffset;
    artifact.endOffset = *session.endOffset;
    artifact.footerFound = session.footerFound;
    artifact.data = bytes.TakeValue();
    return RC::Result<Artifact>::Success(move(artifact));
}

// ============================================================================
// 流式提取
// ============================================================================
RC::Result<ULONGLONG> Extractor::ExtractTo(const CarveSession& session, ByteSource& source,
                                           ArtifactSink& sink, string* outputName) const {
    if (session.state != SessionState::Finalized || !session.endOffset) {
        return RC::Result<ULONGLONG>::Failure(RC::ErrorInfo(
            RC::ErrorCode::ExtractInvalidRange, "session is not finalized",
            "start " + to_string(session.startOffset)));
    }

    ULONGLONG start = session.startOffset;
    ULONGLONG end = *session.endOffset;

    auto valid = CheckRange(start, end, source);
    if (valid.IsFailure()) {
        return valid.ForwardError<ULONGLONG>();
    }

    auto begun = sink.Begin(session);
    if (begun.IsFailure()) {
        sink.Abort();
        return RC::Result<ULONGLONG>::Failure(RC::ErrorInfo(
            RC::ErrorCode::ExtractSinkFailed, begun.Error().ToString(), RangeContext(start, end)));
    }

    vector<BYTE> block(static_cast<size_t>(min<ULONGLONG>(blockSize, end - start)));
    ULONGLONG offset = start;

    while (offset < end) {
        size_t toCopy = static_cast<size_t>(min<ULONGLONG>(block.size(), end - offset));

        auto read = ReadFully(source, offset, block.data(), toCopy);
        if (read.IsFailure()) {
            sink.Abort();
            return read.ForwardError<ULONGLONG>();
        }

        auto written = sink.Write(block.data(), toCopy);
        if (written.IsFailure()) {
            sink.Abort();
            return RC::Result<ULONGLONG>::Failure(RC::ErrorInfo(
                RC::ErrorCode::ExtractSinkFailed, written.Error().ToString(), RangeContext(start, end)));
        }

        offset += toCopy;
    }

    auto committed = sink.Commit();
    if (committed.IsFailure()) {
        sink.Abort();
        return RC::Result<ULONGLONG>::Failure(RC::ErrorInfo(
            RC::ErrorCode::ExtractSinkFailed, committed.Error().ToString(), RangeContext(start, end)));
    }

    if (outputName) {
        *outputName = committed.Value();
    }

    LOG_DEBUG_FMT("Extracted '%s' %s -> %s", session.TypeId().c_str(),
                  RangeContext(start, end).c_str(), committed.Value().c_str());
    return RC::Result<ULONGLONG>::Success(end - start);
}
