#pragma once
#include "PlatformConfig.h"
#include "Result.h"
#include "SignatureCatalog.h"
#include <vector>

using namespace std;

// 内置签名表（声明顺序即同偏移冲突时的最终优先级）
RC::Result<vector<SignatureDefinition>> BuildDefaultSignatures();

// 用内置签名表构造签名库
RC::Result<SignatureCatalog> CreateDefaultCatalog(ULONGLONG sanityLimit = DEFAULT_SANITY_LIMIT);
