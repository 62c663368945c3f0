#include "CatalogLoader.h"
#include "DefaultSignatures.h"
#include "Logger.h"
#include <nlohmann/json.hpp>
#include <filesystem>
#include <fstream>
#include <sstream>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace {

RC::ErrorInfo FieldError(const string& field, const string& message) {
    return RC::ErrorInfo(RC::ErrorCode::ConfigInvalidField, message, field);
}

// 读取可选的非负整数字段
RC::Result<optional<ULONGLONG>> ReadUnsigned(const json& obj, const string& key, const string& path) {
    if (!obj.contains(key) || obj[key].is_null()) {
        return RC::Result<optional<ULONGLONG>>::Success(nullopt);
    }
    const json& value = obj[key];
    if (!value.is_number_unsigned()) {
        if (value.is_number_integer() || value.is_number_float()) {
            return RC::Result<optional<ULONGLONG>>::Failure(FieldError(path + key, "must be a non-negative integer"));
        }
        return RC::Result<optional<ULONGLONG>>::Failure(FieldError(path + key, "must be a number"));
    }
    return RC::Result<optional<ULONGLONG>>::Success(value.get<ULONGLONG>());
}

RC::Result<string> ReadString(const json& obj, const string& key, const string& path, bool required) {
    if (!obj.contains(key) || obj[key].is_null()) {
        if (required) {
            return RC::Result<string>::Failure(FieldError(path + key, "missing required field"));
        }
        return RC::Result<string>::Success("");
    }
    if (!obj[key].is_string()) {
        return RC::Result<string>::Failure(FieldError(path + key, "must be a string"));
    }
    return RC::Result<string>::Success(obj[key].get<string>());
}

RC::Result<BytePattern> ReadPattern(const json& obj, const string& key, const string& path, bool required) {
    auto text = ReadString(obj, key, path, required);
    if (text.IsFailure()) {
        return text.ForwardError<BytePattern>();
    }
    if (text.Value().empty()) {
        return RC::Result<BytePattern>::Success(BytePattern());
    }

    auto pattern = BytePattern::Parse(text.Value());
    if (pattern.IsFailure()) {
        return RC::Result<BytePattern>::Failure(RC::ErrorInfo(
            RC::ErrorCode::ConfigInvalidPattern, pattern.Error().message, path + key));
    }
    return pattern;
}

RC::Result<SignatureDefinition> ParseSignature(const json& entry, size_t index) {
    string path = "signatures[" + to_string(index) + "].";
    if (!entry.is_object()) {
        return RC::Result<SignatureDefinition>::Failure(FieldError(path, "signature entry must be an object"));
    }

    SignatureDefinition def;

    auto type = ReadString(entry, "type", path, true);
    if (type.IsFailure()) return type.ForwardError<SignatureDefinition>();
    def.typeId = type.Value();

    auto extension = ReadString(entry, "extension", path, false);
    if (extension.IsFailure()) return extension.ForwardError<SignatureDefinition>();
    def.extension = extension.Value();

    auto description = ReadString(entry, "description", path, false);
    if (description.IsFailure()) return description.ForwardError<SignatureDefinition>();
    def.description = description.Value();

    auto header = ReadPattern(entry, "header", path, true);
    if (header.IsFailure()) return header.ForwardError<SignatureDefinition>();
    def.header = header.TakeValue();

    auto footer = ReadPattern(entry, "footer", path, false);
    if (footer.IsFailure()) return footer.ForwardError<SignatureDefinition>();
    def.footer = footer.TakeValue();

    auto footerMode = ReadString(entry, "footerMode", path, false);
    if (footerMode.IsFailure()) return footerMode.ForwardError<SignatureDefinition>();
    if (footerMode.Value().empty() || footerMode.Value() == "inclusive") {
        def.footerMode = FooterMode::Inclusive;
    } else if (footerMode.Value() == "exclusive") {
        def.footerMode = FooterMode::Exclusive;
    } else {
        return RC::Result<SignatureDefinition>::Failure(
            FieldError(path + "footerMode", "expected 'inclusive' or 'exclusive', got '" + footerMode.Value() + "'"));
    }

    auto maxSize = ReadUnsigned(entry, "maxSize", path);
    if (maxSize.IsFailure()) return maxSize.ForwardError<SignatureDefinition>();
    def.maxSize = maxSize.Value().value_or(UNBOUNDED_SIZE);

    auto fixedSize = ReadUnsigned(entry, "fixedSize", path);
    if (fixedSize.IsFailure()) return fixedSize.ForwardError<SignatureDefinition>();
    def.fixedSize = fixedSize.Value().value_or(0);

    // 未指定策略时按字段推断
    auto policy = ReadString(entry, "policy", path, false);
    if (policy.IsFailure()) return policy.ForwardError<SignatureDefinition>();
    if (policy.Value().empty()) {
        if (def.fixedSize > 0) {
            def.sizePolicy = SizePolicy::FixedLength;
        } else if (def.HasFooter()) {
            def.sizePolicy = SizePolicy::FooterTerminated;
        } else {
            def.sizePolicy = SizePolicy::MaxSizeCapped;
        }
    } else if (policy.Value() == "footer-terminated") {
        def.sizePolicy = SizePolicy::FooterTerminated;
    } else if (policy.Value() == "fixed-length") {
        def.sizePolicy = SizePolicy::FixedLength;
    } else if (policy.Value() == "max-size-capped") {
        def.sizePolicy = SizePolicy::MaxSizeCapped;
    } else {
        return RC::Result<SignatureDefinition>::Failure(
            FieldError(path + "policy", "unknown size policy '" + policy.Value() + "'"));
    }

    if (entry.contains("allowOverlap") && !entry["allowOverlap"].is_null()) {
        if (!entry["allowOverlap"].is_boolean()) {
            return RC::Result<SignatureDefinition>::Failure(FieldError(path + "allowOverlap", "must be a boolean"));
        }
        def.allowOverlap = entry["allowOverlap"].get<bool>();
    }

    return RC::Result<SignatureDefinition>::Success(move(def));
}

} // namespace

// ============================================================================
// 解析
// ============================================================================
RC::Result<CatalogConfig> CatalogLoader::Parse(const string& text, const string& sourceName) {
    json root;
    try {
        root = json::parse(text);
    } catch (const json::parse_error& e) {
        LOG_ERROR_FMT("Cannot parse catalog %s: %s", sourceName.c_str(), e.what());
        return RC::Result<CatalogConfig>::Failure(RC::ErrorInfo(
            RC::ErrorCode::ConfigParseFailed, e.what(), sourceName));
    }

    if (!root.is_object()) {
        return RC::Result<CatalogConfig>::Failure(RC::ErrorInfo(
            RC::ErrorCode::ConfigParseFailed, "top-level value must be an object", sourceName));
    }

    CatalogConfig config;

    try {
        auto sanity = ReadUnsigned(root, "sanityLimit", "");
        if (sanity.IsFailure()) return sanity.ForwardError<CatalogConfig>();
        if (sanity.Value()) {
            config.sanityLimit = *sanity.Value();
        }

        if (root.contains("engine") && !root["engine"].is_null()) {
            const json& engine = root["engine"];
            if (!engine.is_object()) {
                return RC::Result<CatalogConfig>::Failure(FieldError("engine", "must be an object"));
            }

            auto chunkSize = ReadUnsigned(engine, "chunkSize", "engine.");
            if (chunkSize.IsFailure()) return chunkSize.ForwardError<CatalogConfig>();
            if (chunkSize.Value()) {
                if (*chunkSize.Value() == 0) {
                    return RC::Result<CatalogConfig>::Failure(FieldError("engine.chunkSize", "must be positive"));
                }
                config.engine.chunkSize = static_cast<size_t>(*chunkSize.Value());
            }

            auto workers = ReadUnsigned(engine, "workers", "engine.");
            if (workers.IsFailure()) return workers.ForwardError<CatalogConfig>();
            if (workers.Value()) {
                config.engine.workers = static_cast<int>(*workers.Value());
            }

            auto segmentSize = ReadUnsigned(engine, "segmentSize", "engine.");
            if (segmentSize.IsFailure()) return segmentSize.ForwardError<CatalogConfig>();
            if (segmentSize.Value()) {
                if (*segmentSize.Value() == 0) {
                    return RC::Result<CatalogConfig>::Failure(FieldError("engine.segmentSize", "must be positive"));
                }
                config.engine.segmentSize = *segmentSize.Value();
            }
        }

        if (root.contains("signatures")) {
            const json& signatures = root["signatures"];
            if (!signatures.is_array()) {
                return RC::Result<CatalogConfig>::Failure(FieldError("signatures", "must be an array"));
            }

            config.useBuiltinSignatures = false;
            for (size_t i = 0; i < signatures.size(); i++) {
                auto def = ParseSignature(signatures[i], i);
                if (def.IsFailure()) {
                    LOG_ERROR_FMT("Invalid signature in %s: %s", sourceName.c_str(),
                                  def.Error().ToString().c_str());
                    return def.ForwardError<CatalogConfig>();
                }
                config.signatures.push_back(def.TakeValue());
            }
        }
    } catch (const json::exception& e) {
        return RC::Result<CatalogConfig>::Failure(RC::ErrorInfo(
            RC::ErrorCode::ConfigParseFailed, e.what(), sourceName));
    }

    LOG_INFO_FMT("Loaded catalog config %s: %s signatures",
                 sourceName.c_str(),
                 config.useBuiltinSignatures ? "built-in" : to_string(config.signatures.size()).c_str());

    return RC::Result<CatalogConfig>::Success(move(config));
}

RC::Result<CatalogConfig> CatalogLoader::LoadFromFile(const string& path) {
    error_code ec;
    if (!fs::exists(path, ec)) {
        return RC::Result<CatalogConfig>::Failure(RC::ErrorInfo(
            RC::ErrorCode::ConfigFileNotFound, "catalog file not found", path));
    }

    ifstream file(path);
    if (!file.is_open()) {
        return RC::Result<CatalogConfig>::Failure(
            RC::MakeSystemError(RC::ErrorCode::ConfigFileNotFound, "cannot open catalog file", path));
    }

    stringstream buffer;
    buffer << file.rdbuf();
    return Parse(buffer.str(), path);
}

RC::Result<SignatureCatalog> CatalogConfig::BuildCatalog() const {
    if (useBuiltinSignatures) {
        return CreateDefaultCatalog(sanityLimit);
    }
    return SignatureCatalog::Create(signatures, sanityLimit);
}
