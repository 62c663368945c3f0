#include "ErrorCodes.h"
#include <sstream>
#include <iomanip>
#include <cerrno>
#include <cstring>

namespace RC {

// 获取错误代码的名称
std::string ErrorInfo::GetErrorCodeName() const {
    switch (code) {
        // 成功
        case ErrorCode::Success:
            return "Success";

        // 签名库/配置错误
        case ErrorCode::CatalogDuplicateType:
            return "CatalogDuplicateType";
        case ErrorCode::CatalogEmptyPattern:
            return "CatalogEmptyPattern";
        case ErrorCode::CatalogWildcardOnlyPattern:
            return "CatalogWildcardOnlyPattern";
        case ErrorCode::CatalogInvalidSizePolicy:
            return "CatalogInvalidSizePolicy";
        case ErrorCode::CatalogInvalidDefinition:
            return "CatalogInvalidDefinition";
        case ErrorCode::CatalogEmpty:
            return "CatalogEmpty";
        case ErrorCode::CatalogUnknownType:
            return "CatalogUnknownType";
        case ErrorCode::ConfigFileNotFound:
            return "ConfigFileNotFound";
        case ErrorCode::ConfigParseFailed:
            return "ConfigParseFailed";
        case ErrorCode::ConfigInvalidField:
            return "ConfigInvalidField";
        case ErrorCode::ConfigInvalidPattern:
            return "ConfigInvalidPattern";

        // 流错误
        case ErrorCode::BufferChunkTooSmall:
            return "BufferChunkTooSmall";
        case ErrorCode::BufferStreamEnded:
            return "BufferStreamEnded";

        // 逻辑错误
        case ErrorCode::LogicInvalidArgument:
            return "LogicInvalidArgument";
        case ErrorCode::LogicOperationCancelled:
            return "LogicOperationCancelled";
        case ErrorCode::LogicBufferTooSmall:
            return "LogicBufferTooSmall";
        case ErrorCode::LogicOutOfRange:
            return "LogicOutOfRange";

        // I/O 错误
        case ErrorCode::IOReadFailed:
            return "IOReadFailed";
        case ErrorCode::IOWriteFailed:
            return "IOWriteFailed";
        case ErrorCode::IOSeekFailed:
            return "IOSeekFailed";
        case ErrorCode::IOHandleInvalid:
            return "IOHandleInvalid";

        // 提取错误
        case ErrorCode::ExtractSourceUnavailable:
            return "ExtractSourceUnavailable";
        case ErrorCode::ExtractInvalidRange:
            return "ExtractInvalidRange";
        case ErrorCode::ExtractSinkFailed:
            return "ExtractSinkFailed";
        case ErrorCode::ExtractRangeTooLarge:
            return "ExtractRangeTooLarge";

        default:
            return "UnknownError";
    }
}

// 获取错误类别
std::string ErrorInfo::GetCategory() const {
    uint32_t category = (static_cast<uint32_t>(code) >> 24) & 0xFF;

    switch (category) {
        case 0x01:
            return "Config";
        case 0x02:
            return "Buffer";
        case 0x04:
            return "Logic";
        case 0x05:
            return "IO";
        case 0x07:
            return "Extract";
        default:
            return "Unknown";
    }
}

// 转换为字符串描述
std::string ErrorInfo::ToString() const {
    if (IsSuccess()) {
        return "Success";
    }

    std::ostringstream oss;
    oss << "[" << GetCategory() << "] " << GetErrorCodeName();

    if (!message.empty()) {
        oss << ": " << message;
    }

    if (!context.empty()) {
        oss << " (Context: " << context << ")";
    }

    if (systemErrorCode != 0) {
        oss << " [System Error: " << std::dec << systemErrorCode
            << " - " << std::strerror(static_cast<int>(systemErrorCode)) << "]";
    }

    return oss.str();
}

// 从 errno 创建 ErrorInfo
ErrorInfo MakeSystemError(ErrorCode code, const std::string& message, const std::string& context) {
    int lastError = errno;
    return ErrorInfo(code, message, context, static_cast<uint32_t>(lastError));
}

// 创建简单错误
ErrorInfo MakeError(ErrorCode code, const std::string& message) {
    return ErrorInfo(code, message, "", 0);
}

} // namespace RC
