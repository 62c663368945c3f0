#pragma once
#include "PlatformConfig.h"
#include "Result.h"
#include <vector>

using namespace std;

// ============================================================================
// 窗口视图 - 当前窗口的只读切片
// ============================================================================
struct WindowView {
    const BYTE* data;           // 窗口数据（保留尾部 + 新块）
    size_t size;                // 窗口字节数
    ULONGLONG absoluteOffset;   // data[0] 在流中的绝对偏移
    size_t settledLength;       // 本次推进中起始位置已确定的前缀长度
    bool endOfStream;           // 流是否已结束

    ULONGLONG EndOffset() const { return absoluteOffset + size; }
    ULONGLONG SettledEndOffset() const { return absoluteOffset + settledLength; }
};

// ============================================================================
// 窗口缓冲区
// 每次推进保留上一个窗口末尾 tailLength 字节，使跨越两次读取的签名不会丢失。
// 起始位置在 [窗口起点, 窗口终点 - tailLength) 内的匹配在本次推进中确定，
// 相邻两次推进的确定区间首尾相接，覆盖整个流且互不重叠。
// ============================================================================
class WindowBuffer {
private:
    vector<BYTE> data;
    size_t tailLength;              // >= 最长模式长度 - 1
    ULONGLONG windowOffset;         // data[0] 的绝对偏移
    ULONGLONG physicalOffset;       // 最新块第一个字节的绝对偏移
    ULONGLONG streamPosition;       // 已接收的总字节数
    size_t settledLength;
    bool shortChunkSeen;            // 已收到过短块（只允许作为最后一个数据块）
    bool endOfStream;

public:
    explicit WindowBuffer(size_t tailLength);

    // 追加一个数据块；长度为 0 表示流结束
    RC::Result<void> Advance(const BYTE* chunk, size_t size);
    RC::Result<void> Advance(const vector<BYTE>& chunk) {
        return Advance(chunk.data(), chunk.size());
    }

    WindowView View() const;

    size_t TailLength() const { return tailLength; }

    // 流中间的数据块不得短于该值
    size_t MinimumChunkSize() const { return tailLength; }

    ULONGLONG PhysicalOffset() const { return physicalOffset; }
    ULONGLONG StreamPosition() const { return streamPosition; }
    bool IsEndOfStream() const { return endOfStream; }
};
