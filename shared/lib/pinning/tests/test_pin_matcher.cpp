/**
 * @file test_pin_matcher.cpp
 * @brief Unit tests for PinMatcher
 */

#include <gtest/gtest.h>
#include <certpin/pinning/pin_matcher.h>
#include "test_helpers.h"

using namespace certpin::pinning;
using namespace test_helpers;

class PinMatcherTest : public ::testing::Test {
protected:
    TestPki pki_;
    std::optional<CertificateModel> root_;

    void SetUp() override {
        pki_ = TestPki::create("api.example.com", "Example Root CA", "Example Trust Services");
        root_ = pki_.rootModel();
    }

    PinningReference referenceWith(const std::string& subjectCN,
                                   const std::string& issuerCN,
                                   const std::string& issuerO) const {
        return PinningReference(subjectCN, issuerCN, issuerO, root_->thumbprint(), root_->digest());
    }
};

// ============================================================================
// Match
// ============================================================================

TEST_F(PinMatcherTest, ExactReferenceMatches) {
    auto result = PinMatcher::matches(*root_, PinningReference::fromCertificate(*root_));
    EXPECT_TRUE(result.matched);
    EXPECT_EQ(result.field, PinField::NONE);
}

TEST_F(PinMatcherTest, SubstringFieldsMatch) {
    // Reference names only need to be contained in the root's names
    auto result = PinMatcher::matches(*root_, referenceWith("Root", "Example", "Trust"));
    EXPECT_TRUE(result.matched);
}

TEST_F(PinMatcherTest, EmptyReferenceNamesMatch) {
    EXPECT_TRUE(PinMatcher::matches(*root_, referenceWith("", "", "")).matched);
}

TEST_F(PinMatcherTest, Deterministic) {
    auto ref = PinningReference::fromCertificate(*root_);
    for (int i = 0; i < 5; i++) {
        EXPECT_TRUE(PinMatcher::matches(*root_, ref).matched);
    }
}

// ============================================================================
// Mismatch
// ============================================================================

TEST_F(PinMatcherTest, ThumbprintMismatch) {
    auto other = TestPki::create("api.example.com", "Example Root CA", "Example Trust Services");
    // Same names, different key: only the thumbprint differs
    auto result = PinMatcher::matches(other.rootModel(), PinningReference::fromCertificate(*root_));
    EXPECT_FALSE(result.matched);
    EXPECT_EQ(result.field, PinField::THUMBPRINT);
    EXPECT_FALSE(result.message.empty());
}

TEST_F(PinMatcherTest, ThumbprintOffByOneByte) {
    // Every name field agrees; the last thumbprint byte differs by one bit
    std::vector<uint8_t> flipped = root_->thumbprint();
    ASSERT_FALSE(flipped.empty());
    flipped.back() ^= 0x01;
    PinningReference reference(root_->subjectCN(), root_->issuerCN(), root_->issuerO(),
                               flipped, root_->digest());

    auto result = PinMatcher::matches(*root_, reference);
    EXPECT_FALSE(result.matched);
    EXPECT_EQ(result.field, PinField::THUMBPRINT);
}

TEST_F(PinMatcherTest, ThumbprintReportedBeforeNames) {
    auto other = TestPki::create("api.example.com", "Other Root", "Other Org");
    auto result = PinMatcher::matches(other.rootModel(), PinningReference::fromCertificate(*root_));
    EXPECT_EQ(result.field, PinField::THUMBPRINT);
}

TEST_F(PinMatcherTest, DigestMismatchIsThumbprintMismatch) {
    auto sha256Root = pki_.rootModel(ThumbprintDigest::SHA256);
    auto result = PinMatcher::matches(sha256Root, PinningReference::fromCertificate(*root_));
    EXPECT_FALSE(result.matched);
    EXPECT_EQ(result.field, PinField::THUMBPRINT);
}

TEST_F(PinMatcherTest, SubjectCnMismatch) {
    auto result = PinMatcher::matches(*root_, referenceWith("Another Root", "Example Root CA", "Example"));
    EXPECT_FALSE(result.matched);
    EXPECT_EQ(result.field, PinField::SUBJECT_CN);
}

TEST_F(PinMatcherTest, IssuerCnMismatch) {
    auto result = PinMatcher::matches(*root_, referenceWith("Example Root CA", "Another Issuer", "Example"));
    EXPECT_FALSE(result.matched);
    EXPECT_EQ(result.field, PinField::ISSUER_CN);
}

TEST_F(PinMatcherTest, IssuerOMismatch) {
    auto result = PinMatcher::matches(*root_, referenceWith("Example Root CA", "Example Root CA", "Acme"));
    EXPECT_FALSE(result.matched);
    EXPECT_EQ(result.field, PinField::ISSUER_O);
}

TEST_F(PinMatcherTest, NameComparisonIsCaseSensitive) {
    auto result = PinMatcher::matches(*root_, referenceWith("example root ca", "Example Root CA", "Example"));
    EXPECT_FALSE(result.matched);
    EXPECT_EQ(result.field, PinField::SUBJECT_CN);
}
