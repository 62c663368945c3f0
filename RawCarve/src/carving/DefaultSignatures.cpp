#include "DefaultSignatures.h"
#include "Logger.h"
#include <string>

namespace {

constexpr ULONGLONG MB = 1000ULL * 1000;

struct SignatureRow {
    const char* typeId;
    const char* extension;
    const char* description;
    const char* header;
    const char* footer;             // 空字符串 = 无文件尾
    FooterMode footerMode;
    SizePolicy sizePolicy;
    ULONGLONG maxSize;
};

// tar 的 "ustar" 魔数位于头块偏移 257 处
string TarHeader() {
    string hex;
    for (int i = 0; i < 257; i++) {
        hex += "??";
    }
    return hex + "7573746172";
}

} // namespace

// ============================================================================
// 内置签名表
// ============================================================================
RC::Result<vector<SignatureDefinition>> BuildDefaultSignatures() {
    static const string tarHeader = TarHeader();

    const SignatureRow rows[] = {
        // ==================== 压缩包/容器 ====================
        { "zip", "zip", "ZIP Archive",
          "50 4B 03 04", "50 4B 05 06 ?? ?? ?? ?? ?? ?? ?? ?? ?? ?? ?? ?? ?? ?? ?? ?? ?? ??",
          FooterMode::Inclusive, SizePolicy::FooterTerminated, 10 * MB },
        { "rar", "rar", "RAR Archive",
          "52 61 72 21 1A 07", "",
          FooterMode::Inclusive, SizePolicy::MaxSizeCapped, 10 * MB },
        { "7z", "7z", "7-Zip Archive",
          "37 7A BC AF 27 1C", "",
          FooterMode::Inclusive, SizePolicy::MaxSizeCapped, 10 * MB },
        { "tar", "tar", "TAR Archive",
          tarHeader.c_str(), "",
          FooterMode::Inclusive, SizePolicy::MaxSizeCapped, 10 * MB },
        { "iso", "iso", "ISO 9660 Volume Descriptor",
          "01 43 44 30 30 31", "",
          FooterMode::Inclusive, SizePolicy::MaxSizeCapped, 10 * MB },

        // ==================== 文档 ====================
        // 下一个复合文档头即为本文件的结束位置
        { "ole", "doc", "OLE Compound Document",
          "D0 CF 11 E0 A1 B1 1A E1", "D0 CF 11 E0 A1 B1 1A E1",
          FooterMode::Exclusive, SizePolicy::MaxSizeCapped, 10 * MB },
        { "html", "html", "HTML Document",
          "3C 68 74 6D 6C", "3C 2F 68 74 6D 6C 3E",
          FooterMode::Inclusive, SizePolicy::FooterTerminated, 10 * MB },
        { "html-doctype", "html", "HTML Document (DOCTYPE)",
          "3C 21 44 4F 43 54 59 50 45 20 68 74 6D 6C", "3C 2F 68 74 6D 6C 3E",
          FooterMode::Inclusive, SizePolicy::FooterTerminated, 10 * MB },
        { "pdf", "pdf", "PDF Document",
          "25 50 44 46 2D", "25 25 45 4F 46",
          FooterMode::Inclusive, SizePolicy::FooterTerminated, 10 * MB },
        { "rtf", "rtf", "Rich Text Format",
          "7B 5C 72 74 66 31", "",
          FooterMode::Inclusive, SizePolicy::MaxSizeCapped, 10 * MB },

        // ==================== 图片 ====================
        { "bmp", "bmp", "Bitmap Image",
          "42 4D ?? ?? ?? ?? 00 00 00 00", "",
          FooterMode::Inclusive, SizePolicy::MaxSizeCapped, 10 * MB },
        { "gif87a", "gif", "GIF Image (87a)",
          "47 49 46 38 37 61", "00 3B",
          FooterMode::Inclusive, SizePolicy::FooterTerminated, 5 * MB },
        { "gif89a", "gif", "GIF Image (89a)",
          "47 49 46 38 39 61", "00 3B",
          FooterMode::Inclusive, SizePolicy::FooterTerminated, 5 * MB },
        { "jpeg-jfif", "jpg", "JPEG Image (JFIF)",
          "FF D8 FF E0 00 10", "FF D9",
          FooterMode::Inclusive, SizePolicy::FooterTerminated, 200 * MB },
        { "jpeg-exif", "jpg", "JPEG Image (EXIF)",
          "FF D8 FF E1", "FF D9",
          FooterMode::Inclusive, SizePolicy::FooterTerminated, 200 * MB },
        { "png", "png", "PNG Image",
          "89 50 4E 47 0D 0A 1A 0A", "49 45 4E 44 AE 42 60 82",
          FooterMode::Inclusive, SizePolicy::FooterTerminated, 10 * MB },
        { "tiff-le", "tif", "TIFF Image (little-endian)",
          "49 49 2A 00", "",
          FooterMode::Inclusive, SizePolicy::MaxSizeCapped, 10 * MB },
        { "tiff-be", "tif", "TIFF Image (big-endian)",
          "4D 4D 00 2A", "",
          FooterMode::Inclusive, SizePolicy::MaxSizeCapped, 10 * MB },

        // ==================== 音视频 ====================
        { "avi", "avi", "AVI Video",
          "52 49 46 46 ?? ?? ?? ?? 41 56 49 20", "",
          FooterMode::Inclusive, SizePolicy::MaxSizeCapped, 10 * MB },
        { "wav", "wav", "WAV Audio",
          "52 49 46 46 ?? ?? ?? ?? 57 41 56 45", "",
          FooterMode::Inclusive, SizePolicy::MaxSizeCapped, 10 * MB },
        { "mp4", "mp4", "MP4/QuickTime Video",
          "00 00 00 ?? 66 74 79 70", "",
          FooterMode::Inclusive, SizePolicy::MaxSizeCapped, 10 * MB },
        { "mp3", "mp3", "MP3 Audio (ID3v2)",
          "49 44 33 ?? 00", "",
          FooterMode::Inclusive, SizePolicy::MaxSizeCapped, 10 * MB },
    };

    vector<SignatureDefinition> defs;
    for (const SignatureRow& row : rows) {
        SignatureDefinition def;
        def.typeId = row.typeId;
        def.extension = row.extension;
        def.description = row.description;
        def.footerMode = row.footerMode;
        def.sizePolicy = row.sizePolicy;
        def.maxSize = row.maxSize;

        auto header = BytePattern::Parse(row.header);
        if (header.IsFailure()) {
            return header.ForwardError<vector<SignatureDefinition>>();
        }
        def.header = header.TakeValue();

        if (row.footer[0] != '\0') {
            auto footer = BytePattern::Parse(row.footer);
            if (footer.IsFailure()) {
                return footer.ForwardError<vector<SignatureDefinition>>();
            }
            def.footer = footer.TakeValue();
        }

        defs.push_back(move(def));
    }

    return RC::Result<vector<SignatureDefinition>>::Success(move(defs));
}

RC::Result<SignatureCatalog> CreateDefaultCatalog(ULONGLONG sanityLimit) {
    auto defs = BuildDefaultSignatures();
    if (defs.IsFailure()) {
        LOG_ERROR("Built-in signature table is invalid: " + defs.Error().ToString());
        return defs.ForwardError<SignatureCatalog>();
    }
    return SignatureCatalog::Create(defs.TakeValue(), sanityLimit);
}
