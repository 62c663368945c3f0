#pragma once
#include "PlatformConfig.h"
#include "Result.h"
#include "SignatureCatalog.h"
#include <optional>
#include <string>
#include <vector>

using namespace std;

// 配置文件中的引擎设置（未出现的字段为空，由调用方决定默认值）
struct EngineSettings {
    optional<size_t> chunkSize;         // 字节
    optional<int> workers;
    optional<ULONGLONG> segmentSize;    // 字节
};

// ============================================================================
// 签名库配置
// {
//   "sanityLimit": 4294967296,
//   "engine": { "chunkSize": 8388608, "workers": 4, "segmentSize": 268435456 },
//   "signatures": [
//     { "type": "jpeg", "extension": "jpg", "header": "FF D8 FF E0", "footer": "FF D9",
//       "footerMode": "inclusive", "policy": "footer-terminated", "maxSize": 10000000 }
//   ]
// }
// 没有 "signatures" 时使用内置签名表
// ============================================================================
struct CatalogConfig {
    vector<SignatureDefinition> signatures;
    bool useBuiltinSignatures = true;
    ULONGLONG sanityLimit = DEFAULT_SANITY_LIMIT;
    EngineSettings engine;

    RC::Result<SignatureCatalog> BuildCatalog() const;
};

class CatalogLoader {
public:
    static RC::Result<CatalogConfig> LoadFromFile(const string& path);
    static RC::Result<CatalogConfig> Parse(const string& text, const string& sourceName = "<text>");
};
