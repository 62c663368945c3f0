#include "WindowBuffer.h"
#include "Logger.h"
#include <algorithm>
#include <cstring>

WindowBuffer::WindowBuffer(size_t tail)
    : tailLength(tail), windowOffset(0), physicalOffset(0), streamPosition(0),
      settledLength(0), shortChunkSeen(false), endOfStream(false) {
}

RC::Result<void> WindowBuffer::Advance(const BYTE* chunk, size_t size) {
    if (endOfStream) {
        return RC::Result<void>::Failure(RC::ErrorInfo(
            RC::ErrorCode::BufferStreamEnded, "advance after end of stream",
            "offset " + to_string(streamPosition)));
    }

    if (size > 0 && chunk == nullptr) {
        return RC::Result<void>::Failure(RC::ErrorCode::LogicInvalidArgument, "null chunk with non-zero size");
    }

    // 上一个块过短，说明它不是最后一个数据块
    if (size > 0 && shortChunkSeen) {
        return RC::Result<void>::Failure(RC::ErrorInfo(
            RC::ErrorCode::BufferChunkTooSmall,
            "chunk shorter than " + to_string(tailLength) + " bytes supplied mid-stream",
            "offset " + to_string(streamPosition)));
    }

    // 保留上一个窗口的尾部
    size_t keep = min(tailLength, data.size());
    if (keep > 0 && keep < data.size()) {
        memmove(data.data(), data.data() + (data.size() - keep), keep);
    }
    windowOffset = streamPosition - keep;

    if (size == 0) {
        // 流结束：窗口只剩尾部，其中的起始位置全部在此确定
        data.resize(keep);
        settledLength = keep;
        physicalOffset = streamPosition;
        endOfStream = true;
        LOG_DEBUG_FMT("Window buffer reached end of stream at %llu", (unsigned long long)streamPosition);
        return RC::Result<void>::Success();
    }

    data.resize(keep + size);
    memcpy(data.data() + keep, chunk, size);

    physicalOffset = streamPosition;
    streamPosition += size;
    settledLength = (data.size() > tailLength) ? data.size() - tailLength : 0;

    if (size < tailLength) {
        shortChunkSeen = true;
    }

    return RC::Result<void>::Success();
}

WindowView WindowBuffer::View() const {
    WindowView view;
    view.data = data.data();
    view.size = data.size();
    view.absoluteOffset = windowOffset;
    view.settledLength = settledLength;
    view.endOfStream = endOfStream;
    return view;
}
