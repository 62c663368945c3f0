#include "SignatureCatalog.h"
#include "Logger.h"
#include <algorithm>
#include <set>

const char* SizePolicyName(SizePolicy policy) {
    switch (policy) {
    case SizePolicy::FooterTerminated: return "footer-terminated";
    case SizePolicy::FixedLength:      return "fixed-length";
    case SizePolicy::MaxSizeCapped:    return "max-size-capped";
    default:                           return "unknown";
    }
}

const char* FooterModeName(FooterMode mode) {
    return mode == FooterMode::Exclusive ? "exclusive" : "inclusive";
}

SignatureCatalog::SignatureCatalog()
    : maxPatternLength(0), sanityLimit(DEFAULT_SANITY_LIMIT) {
}

// ============================================================================
// 单条签名校验
// ============================================================================
RC::ErrorInfo SignatureCatalog::ValidateDefinition(const SignatureDefinition& def) {
    using RC::ErrorCode;
    using RC::ErrorInfo;

    if (def.typeId.empty()) {
        return ErrorInfo(ErrorCode::CatalogInvalidDefinition, "signature without type id");
    }

    if (def.header.Empty()) {
        return ErrorInfo(ErrorCode::CatalogEmptyPattern, "empty header pattern", def.typeId);
    }
    if (def.header.LiteralCount() == 0) {
        return ErrorInfo(ErrorCode::CatalogWildcardOnlyPattern, "header has no literal byte", def.typeId);
    }
    if (def.HasFooter() && def.footer.LiteralCount() == 0) {
        return ErrorInfo(ErrorCode::CatalogWildcardOnlyPattern, "footer has no literal byte", def.typeId);
    }

    switch (def.sizePolicy) {
    case SizePolicy::FooterTerminated:
        if (!def.HasFooter()) {
            return ErrorInfo(ErrorCode::CatalogEmptyPattern,
                             "footer-terminated signature needs a footer pattern", def.typeId);
        }
        if (def.maxSize < def.header.Length() + def.footer.Length() &&
            def.footerMode == FooterMode::Inclusive) {
            return ErrorInfo(ErrorCode::CatalogInvalidSizePolicy,
                             "maxSize smaller than header plus footer", def.typeId);
        }
        break;

    case SizePolicy::FixedLength:
        if (def.fixedSize == 0) {
            return ErrorInfo(ErrorCode::CatalogInvalidSizePolicy, "fixed-length signature needs fixedSize", def.typeId);
        }
        if (def.fixedSize < def.header.Length()) {
            return ErrorInfo(ErrorCode::CatalogInvalidSizePolicy, "fixedSize smaller than header", def.typeId);
        }
        if (def.fixedSize > def.maxSize) {
            return ErrorInfo(ErrorCode::CatalogInvalidSizePolicy, "fixedSize exceeds maxSize", def.typeId);
        }
        if (def.HasFooter()) {
            return ErrorInfo(ErrorCode::CatalogInvalidSizePolicy, "fixed-length signature cannot have a footer", def.typeId);
        }
        break;

    case SizePolicy::MaxSizeCapped:
        if (def.maxSize == UNBOUNDED_SIZE) {
            return ErrorInfo(ErrorCode::CatalogInvalidSizePolicy, "max-size-capped signature needs maxSize", def.typeId);
        }
        if (def.maxSize < def.header.Length()) {
            return ErrorInfo(ErrorCode::CatalogInvalidSizePolicy, "maxSize smaller than header", def.typeId);
        }
        break;
    }

    return ErrorInfo();
}

// ============================================================================
// 构造签名库
// ============================================================================
RC::Result<SignatureCatalog> SignatureCatalog::Create(vector<SignatureDefinition> defs,
                                                      ULONGLONG sanityLimit) {
    if (defs.empty()) {
        return RC::Result<SignatureCatalog>::Failure(RC::ErrorCode::CatalogEmpty, "no signatures defined");
    }
    if (sanityLimit == 0) {
        return RC::Result<SignatureCatalog>::Failure(RC::ErrorCode::CatalogInvalidSizePolicy, "sanity limit must be positive");
    }

    SignatureCatalog catalog;
    catalog.sanityLimit = sanityLimit;

    for (size_t i = 0; i < defs.size(); i++) {
        const SignatureDefinition& def = defs[i];

        RC::ErrorInfo error = ValidateDefinition(def);
        if (!error.IsSuccess()) {
            LOG_ERROR("Invalid signature: " + error.ToString());
            return RC::Result<SignatureCatalog>::Failure(error);
        }

        // 固定长度同样受兜底上限约束，并行扫描的重叠区才能覆盖它
        if (def.sizePolicy == SizePolicy::FixedLength && def.fixedSize > sanityLimit) {
            RC::ErrorInfo tooLarge(RC::ErrorCode::CatalogInvalidSizePolicy,
                                   "fixedSize exceeds sanity limit", def.typeId);
            LOG_ERROR("Invalid signature: " + tooLarge.ToString());
            return RC::Result<SignatureCatalog>::Failure(tooLarge);
        }

        if (!catalog.typeIndex.emplace(def.typeId, i).second) {
            RC::ErrorInfo dup(RC::ErrorCode::CatalogDuplicateType, "duplicate type id", def.typeId);
            LOG_ERROR("Invalid signature: " + dup.ToString());
            return RC::Result<SignatureCatalog>::Failure(dup);
        }

        catalog.maxPatternLength = max(catalog.maxPatternLength, def.header.Length());
        catalog.maxPatternLength = max(catalog.maxPatternLength, def.footer.Length());
    }

    catalog.definitions = move(defs);

    LOG_DEBUG_FMT("Signature catalog created: %zu types, longest pattern %zu bytes",
                  catalog.definitions.size(), catalog.maxPatternLength);

    return RC::Result<SignatureCatalog>::Success(move(catalog));
}

const SignatureDefinition* SignatureCatalog::Find(const string& typeId) const {
    auto it = typeIndex.find(typeId);
    if (it == typeIndex.end()) {
        return nullptr;
    }
    return &definitions[it->second];
}

const SignatureDefinition* SignatureCatalog::LookupFooter(const string& typeId) const {
    const SignatureDefinition* def = Find(typeId);
    if (def == nullptr || !def->HasFooter()) {
        return nullptr;
    }
    return def;
}

ULONGLONG SignatureCatalog::EffectiveMaxSize(const SignatureDefinition& def) const {
    return min(def.maxSize, sanityLimit);
}

ULONGLONG SignatureCatalog::LargestEffectiveMaxSize() const {
    ULONGLONG largest = 0;
    for (const auto& def : definitions) {
        largest = max(largest, EffectiveMaxSize(def));
    }
    return largest;
}

RC::Result<SignatureCatalog> SignatureCatalog::Select(const vector<string>& typeIds) const {
    set<string> wanted;
    for (const auto& id : typeIds) {
        if (Find(id) == nullptr) {
            return RC::Result<SignatureCatalog>::Failure(RC::ErrorInfo(
                RC::ErrorCode::CatalogUnknownType, "unknown signature type", id));
        }
        wanted.insert(id);
    }

    vector<SignatureDefinition> selected;
    for (const auto& def : definitions) {
        if (wanted.count(def.typeId) > 0) {
            selected.push_back(def);
        }
    }

    return Create(move(selected), sanityLimit);
}

vector<string> SignatureCatalog::GetTypeIds() const {
    vector<string> ids;
    ids.reserve(definitions.size());
    for (const auto& def : definitions) {
        ids.push_back(def.typeId);
    }
    return ids;
}
