#include <gtest/gtest.h>
#include "../../RawCarve/src/carving/SignatureCatalog.h"
#include "../../RawCarve/src/carving/DefaultSignatures.h"
#include "TestSignatures.h"
#include <set>
#include <vector>

// ============================================================================
// 签名库校验测试
// ============================================================================

class SignatureCatalogTest : public ::testing::Test {
protected:
    RC::ErrorCode CreateError(std::vector<SignatureDefinition> defs) {
        auto r = SignatureCatalog::Create(std::move(defs));
        return r.IsFailure() ? r.Error().code : RC::ErrorCode::Success;
    }
};

TEST_F(SignatureCatalogTest, ValidCatalog) {
    auto r = SignatureCatalog::Create({
        MakeFooterSignature("jpeg", "FF D8 FF E0", "FF D9", 1000),
        MakeFixedSignature("blk", "AB CD", 512),
        MakeCappedSignature("riff", "52 49 46 46 ?? ?? ?? ?? 41 56 49 20", 4096)
    });
    ASSERT_TRUE(r.IsSuccess());

    const SignatureCatalog& catalog = r.Value();
    EXPECT_EQ(catalog.Size(), 3u);
    EXPECT_EQ(catalog.MaxPatternLength(), 12u);
    EXPECT_NE(catalog.Find("blk"), nullptr);
    EXPECT_EQ(catalog.Find("nope"), nullptr);

    // 只有定义了文件尾的类型能查到文件尾
    EXPECT_NE(catalog.LookupFooter("jpeg"), nullptr);
    EXPECT_EQ(catalog.LookupFooter("blk"), nullptr);
}

TEST_F(SignatureCatalogTest, RejectsEmptyCatalog) {
    EXPECT_EQ(CreateError({}), RC::ErrorCode::CatalogEmpty);
}

TEST_F(SignatureCatalogTest, RejectsDuplicateType) {
    EXPECT_EQ(CreateError({
        MakeFixedSignature("a", "01 02", 10),
        MakeFixedSignature("a", "03 04", 10)
    }), RC::ErrorCode::CatalogDuplicateType);
}

TEST_F(SignatureCatalogTest, RejectsEmptyHeader) {
    SignatureDefinition def = MakeFixedSignature("a", "01", 10);
    def.header = BytePattern();
    EXPECT_EQ(CreateError({ def }), RC::ErrorCode::CatalogEmptyPattern);
}

TEST_F(SignatureCatalogTest, RejectsWildcardOnlyPatterns) {
    EXPECT_EQ(CreateError({ MakeFixedSignature("a", "?? ??", 10) }),
              RC::ErrorCode::CatalogWildcardOnlyPattern);
    EXPECT_EQ(CreateError({ MakeFooterSignature("b", "01 02", "?? ??") }),
              RC::ErrorCode::CatalogWildcardOnlyPattern);
}

TEST_F(SignatureCatalogTest, RejectsFooterTerminatedWithoutFooter) {
    SignatureDefinition def = MakeFooterSignature("a", "01 02", "03");
    def.footer = BytePattern();
    EXPECT_EQ(CreateError({ def }), RC::ErrorCode::CatalogEmptyPattern);
}

TEST_F(SignatureCatalogTest, RejectsInconsistentSizes) {
    // 固定长度为 0
    EXPECT_EQ(CreateError({ MakeFixedSignature("a", "01 02", 0) }),
              RC::ErrorCode::CatalogInvalidSizePolicy);

    // 固定长度小于文件头
    EXPECT_EQ(CreateError({ MakeFixedSignature("a", "01 02 03", 2) }),
              RC::ErrorCode::CatalogInvalidSizePolicy);

    // 固定长度超过 maxSize
    SignatureDefinition fixed = MakeFixedSignature("a", "01 02", 100);
    fixed.maxSize = 50;
    EXPECT_EQ(CreateError({ fixed }), RC::ErrorCode::CatalogInvalidSizePolicy);

    // 上限策略没有 maxSize
    EXPECT_EQ(CreateError({ MakeCappedSignature("a", "01 02", UNBOUNDED_SIZE) }),
              RC::ErrorCode::CatalogInvalidSizePolicy);

    // maxSize 容不下文件头加文件尾
    EXPECT_EQ(CreateError({ MakeFooterSignature("a", "01 02 03", "04 05", 4) }),
              RC::ErrorCode::CatalogInvalidSizePolicy);
}

TEST_F(SignatureCatalogTest, RejectsFixedSizeAboveSanityLimit) {
    auto r = SignatureCatalog::Create({ MakeFixedSignature("blk", "AB CD", UNBOUNDED_SIZE - 1) });
    ASSERT_TRUE(r.IsFailure());
    EXPECT_EQ(r.Error().code, RC::ErrorCode::CatalogInvalidSizePolicy);
    EXPECT_EQ(r.Error().context, "blk");

    // 恰好等于上限仍然有效
    auto atLimit = SignatureCatalog::Create({ MakeFixedSignature("blk", "AB CD", 1000) }, 1000);
    ASSERT_TRUE(atLimit.IsSuccess());
    EXPECT_EQ(atLimit.Value().LargestEffectiveMaxSize(), 1000u);
}

TEST_F(SignatureCatalogTest, RejectsZeroSanityLimit) {
    auto r = SignatureCatalog::Create({ MakeFixedSignature("a", "01 02", 10) }, 0);
    ASSERT_TRUE(r.IsFailure());
    EXPECT_EQ(r.Error().code, RC::ErrorCode::CatalogInvalidSizePolicy);
}

TEST_F(SignatureCatalogTest, EffectiveMaxSizeAppliesSanityLimit) {
    SignatureCatalog catalog = MakeCatalog({
        MakeFooterSignature("open", "01 02", "03 04"),
        MakeCappedSignature("capped", "05 06", 500)
    }, 1000);

    EXPECT_EQ(catalog.EffectiveMaxSize(*catalog.Find("open")), 1000u);
    EXPECT_EQ(catalog.EffectiveMaxSize(*catalog.Find("capped")), 500u);
    EXPECT_EQ(catalog.LargestEffectiveMaxSize(), 1000u);
}

// ============================================================================
// 子集选择
// ============================================================================

TEST_F(SignatureCatalogTest, SelectKeepsDeclarationOrder) {
    SignatureCatalog catalog = MakeCatalog({
        MakeFixedSignature("a", "01 01", 10),
        MakeFixedSignature("b", "02 02", 10),
        MakeFixedSignature("c", "03 03", 10)
    });

    auto subset = catalog.Select({ "c", "a" });
    ASSERT_TRUE(subset.IsSuccess());
    EXPECT_EQ(subset.Value().GetTypeIds(), (std::vector<std::string>{ "a", "c" }));
}

TEST_F(SignatureCatalogTest, SelectUnknownType) {
    SignatureCatalog catalog = MakeCatalog({ MakeFixedSignature("a", "01 01", 10) });

    auto subset = catalog.Select({ "a", "zzz" });
    ASSERT_TRUE(subset.IsFailure());
    EXPECT_EQ(subset.Error().code, RC::ErrorCode::CatalogUnknownType);
    EXPECT_EQ(subset.Error().context, "zzz");
}

// ============================================================================
// 内置签名表
// ============================================================================

TEST_F(SignatureCatalogTest, DefaultCatalogIsValid) {
    auto r = CreateDefaultCatalog();
    ASSERT_TRUE(r.IsSuccess()) << r.Error().ToString();

    const SignatureCatalog& catalog = r.Value();
    std::set<std::string> ids;
    for (const auto& id : catalog.GetTypeIds()) {
        ids.insert(id);
    }

    for (const char* expected : { "zip", "pdf", "png", "jpeg-jfif", "jpeg-exif", "gif89a", "tar", "ole" }) {
        EXPECT_EQ(ids.count(expected), 1u) << expected;
    }

    // tar 的魔数在偏移 257
    EXPECT_EQ(catalog.MaxPatternLength(), 262u);
}

TEST_F(SignatureCatalogTest, DefaultCatalogPolicies) {
    SignatureCatalog catalog = CreateDefaultCatalog().TakeValue();

    const SignatureDefinition* jpeg = catalog.Find("jpeg-jfif");
    ASSERT_NE(jpeg, nullptr);
    EXPECT_EQ(jpeg->sizePolicy, SizePolicy::FooterTerminated);
    EXPECT_EQ(jpeg->Extension(), "jpg");
    EXPECT_EQ(jpeg->footer.ToString(), "FF D9");

    const SignatureDefinition* rar = catalog.Find("rar");
    ASSERT_NE(rar, nullptr);
    EXPECT_EQ(rar->sizePolicy, SizePolicy::MaxSizeCapped);
    EXPECT_FALSE(rar->HasFooter());

    const SignatureDefinition* ole = catalog.Find("ole");
    ASSERT_NE(ole, nullptr);
    EXPECT_EQ(ole->footerMode, FooterMode::Exclusive);
}
