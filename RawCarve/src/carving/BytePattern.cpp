#include "BytePattern.h"
#include <cctype>
#include <iomanip>
#include <sstream>

BytePattern::BytePattern()
    : literalCount(0), anchorOffset(0), anchorLength(0) {
}

BytePattern::BytePattern(vector<BYTE> literalBytes)
    : bytes(move(literalBytes)), literalCount(0), anchorOffset(0), anchorLength(0) {
    wildcards.assign(bytes.size(), false);
    ComputeAnchor();
}

BytePattern::BytePattern(vector<BYTE> patternBytes, vector<bool> wildcardMask)
    : bytes(move(patternBytes)), wildcards(move(wildcardMask)),
      literalCount(0), anchorOffset(0), anchorLength(0) {
    wildcards.resize(bytes.size(), false);
    ComputeAnchor();
}

namespace {

// 磁盘镜像里大片的 00 / FF 填充，用作锚点会让自动机频繁命中
bool IsFillByte(BYTE b) {
    return b == 0x00 || b == 0xFF;
}

} // namespace

// 锚点：非填充字节最多的字面量段，其次取更长的段，再其次取靠前的段
void BytePattern::ComputeAnchor() {
    literalCount = 0;
    anchorOffset = 0;
    anchorLength = 0;

    size_t anchorScore = 0;
    size_t runStart = 0;
    size_t runLength = 0;
    size_t runScore = 0;
    for (size_t i = 0; i < bytes.size(); i++) {
        if (wildcards[i]) {
            runLength = 0;
            runScore = 0;
            continue;
        }
        literalCount++;
        if (runLength == 0) {
            runStart = i;
        }
        runLength++;
        if (!IsFillByte(bytes[i])) {
            runScore++;
        }
        if (runScore > anchorScore || (runScore == anchorScore && runLength > anchorLength)) {
            anchorScore = runScore;
            anchorLength = runLength;
            anchorOffset = runStart;
        }
    }
}

RC::Result<BytePattern> BytePattern::Parse(const string& text) {
    // 去掉所有空白后按两个字符一组解析
    string compact;
    compact.reserve(text.size());
    for (char c : text) {
        if (!isspace(static_cast<unsigned char>(c))) {
            compact.push_back(c);
        }
    }

    if (compact.size() % 2 != 0) {
        return RC::Result<BytePattern>::Failure(RC::ErrorInfo(
            RC::ErrorCode::ConfigInvalidPattern, "odd number of hex digits", text));
    }

    vector<BYTE> parsedBytes;
    vector<bool> parsedMask;
    parsedBytes.reserve(compact.size() / 2);
    parsedMask.reserve(compact.size() / 2);

    for (size_t i = 0; i < compact.size(); i += 2) {
        char hi = compact[i];
        char lo = compact[i + 1];

        if (hi == '?' && lo == '?') {
            parsedBytes.push_back(0);
            parsedMask.push_back(true);
            continue;
        }

        if (!isxdigit(static_cast<unsigned char>(hi)) || !isxdigit(static_cast<unsigned char>(lo))) {
            return RC::Result<BytePattern>::Failure(RC::ErrorInfo(
                RC::ErrorCode::ConfigInvalidPattern,
                "invalid token '" + compact.substr(i, 2) + "'", text));
        }

        parsedBytes.push_back(static_cast<BYTE>(stoul(compact.substr(i, 2), nullptr, 16)));
        parsedMask.push_back(false);
    }

    return RC::Result<BytePattern>::Success(BytePattern(move(parsedBytes), move(parsedMask)));
}

bool BytePattern::MatchesAt(const BYTE* data, size_t available) const {
    if (available < bytes.size()) {
        return false;
    }
    for (size_t i = 0; i < bytes.size(); i++) {
        if (!wildcards[i] && data[i] != bytes[i]) {
            return false;
        }
    }
    return true;
}

string BytePattern::ToString() const {
    ostringstream oss;
    for (size_t i = 0; i < bytes.size(); i++) {
        if (i > 0) {
            oss << ' ';
        }
        if (wildcards[i]) {
            oss << "??";
        } else {
            oss << uppercase << hex << setw(2) << setfill('0') << static_cast<int>(bytes[i]);
        }
    }
    return oss.str();
}
