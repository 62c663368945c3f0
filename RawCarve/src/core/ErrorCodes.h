#pragma once
#include <string>
#include <cstdint>

namespace RC {

// 错误代码枚举 - 使用分类编号
enum class ErrorCode : uint32_t {
    Success = 0,

    // 签名库/配置错误 (0x0100xxxx)
    CatalogDuplicateType = 0x01000001,
    CatalogEmptyPattern = 0x01000002,
    CatalogWildcardOnlyPattern = 0x01000003,
    CatalogInvalidSizePolicy = 0x01000004,
    CatalogInvalidDefinition = 0x01000005,
    CatalogEmpty = 0x01000006,
    CatalogUnknownType = 0x01000007,
    ConfigFileNotFound = 0x01000010,
    ConfigParseFailed = 0x01000011,
    ConfigInvalidField = 0x01000012,
    ConfigInvalidPattern = 0x01000013,

    // 流/窗口缓冲区错误 (0x0200xxxx)
    BufferChunkTooSmall = 0x02000001,
    BufferStreamEnded = 0x02000002,

    // 逻辑错误 (0x0400xxxx)
    LogicInvalidArgument = 0x04000001,
    LogicOperationCancelled = 0x04000002,
    LogicBufferTooSmall = 0x04000003,
    LogicOutOfRange = 0x04000004,

    // I/O 错误 (0x0500xxxx)
    IOReadFailed = 0x05000001,
    IOWriteFailed = 0x05000002,
    IOSeekFailed = 0x05000003,
    IOHandleInvalid = 0x05000004,

    // 提取错误 (0x0700xxxx)
    ExtractSourceUnavailable = 0x07000001,
    ExtractInvalidRange = 0x07000002,
    ExtractSinkFailed = 0x07000003,
    ExtractRangeTooLarge = 0x07000004,
};

// 错误信息类
class ErrorInfo {
public:
    ErrorCode code;
    std::string message;
    std::string context;
    uint32_t systemErrorCode;  // errno 或其他系统错误码

    // 默认构造函数 - 成功状态
    ErrorInfo()
        : code(ErrorCode::Success)
        , message("")
        , context("")
        , systemErrorCode(0)
    {}

    // 完整构造函数
    ErrorInfo(ErrorCode ec,
              const std::string& msg = "",
              const std::string& ctx = "",
              uint32_t sysErr = 0)
        : code(ec)
        , message(msg)
        , context(ctx)
        , systemErrorCode(sysErr)
    {}

    // 判断是否成功
    bool IsSuccess() const { return code == ErrorCode::Success; }

    // 转换为字符串描述
    std::string ToString() const;

    // 获取错误代码的名称
    std::string GetErrorCodeName() const;

    // 获取错误类别
    std::string GetCategory() const;
};

// 辅助函数：从 errno 创建 ErrorInfo
ErrorInfo MakeSystemError(ErrorCode code, const std::string& message, const std::string& context);

// 辅助函数：创建简单错误
ErrorInfo MakeError(ErrorCode code, const std::string& message);

} // namespace RC
