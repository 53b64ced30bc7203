// tests/object_verifier_test.cpp
#include <gtest/gtest.h>

#include "object_verifier.hpp"
#include "upload_errors.hpp"

namespace MultipartUploader {
namespace Verification {
namespace test {

Session::FinalizedObject storedObject(const std::string& digest, uint64_t size) {
    Session::FinalizedObject object;
    object.bucket = "bucket";
    object.key = "key";
    object.digest = digest;
    object.size = size;
    return object;
}

TEST(ObjectVerifierTest, MatchingObjectPassesBothChecks) {
    VerificationReport report = ObjectVerifier::verify(storedObject("CoM0C8BkxBNJJJyzEO+PYw==", 50),
                                                       "CoM0C8BkxBNJJJyzEO+PYw==", 50);
    ASSERT_EQ(report.checks.size(), 2u);
    EXPECT_TRUE(report.passed());
    EXPECT_EQ(report.checks[0].description, ObjectVerifier::DIGEST_CHECK);
    EXPECT_EQ(report.checks[1].description, ObjectVerifier::SIZE_CHECK);
}

TEST(ObjectVerifierTest, DigestMismatchOnly) {
    try {
        ObjectVerifier::verify(storedObject("other", 50), "CoM0C8BkxBNJJJyzEO+PYw==", 50);
        FAIL() << "digest mismatch not detected";
    } catch (const MismatchError& e) {
        ASSERT_EQ(e.failedChecks().size(), 1u);
        EXPECT_EQ(e.failedChecks()[0].description, ObjectVerifier::DIGEST_CHECK);
        EXPECT_EQ(e.failedChecks()[0].found, "other");
    }
}

TEST(ObjectVerifierTest, SizeMismatchOnly) {
    try {
        ObjectVerifier::verify(storedObject("d", 49), "d", 50);
        FAIL() << "size mismatch not detected";
    } catch (const MismatchError& e) {
        ASSERT_EQ(e.failedChecks().size(), 1u);
        EXPECT_EQ(e.failedChecks()[0].description, ObjectVerifier::SIZE_CHECK);
        EXPECT_EQ(e.failedChecks()[0].expected, "50");
        EXPECT_EQ(e.failedChecks()[0].found, "49");
    }
}

TEST(ObjectVerifierTest, BothChecksAreReportedWhenBothFail) {
    try {
        ObjectVerifier::verify(storedObject("other", 1), "d", 50);
        FAIL() << "mismatch not detected";
    } catch (const MismatchError& e) {
        ASSERT_EQ(e.failedChecks().size(), 2u);
        EXPECT_EQ(e.failedChecks()[0].description, ObjectVerifier::DIGEST_CHECK);
        EXPECT_EQ(e.failedChecks()[1].description, ObjectVerifier::SIZE_CHECK);
        std::string message = e.what();
        EXPECT_NE(message.find(ObjectVerifier::DIGEST_CHECK), std::string::npos);
        EXPECT_NE(message.find(ObjectVerifier::SIZE_CHECK), std::string::npos);
    }
}

TEST(ObjectVerifierTest, MissingStoredDigestNeverMatches) {
    VerificationReport report = ObjectVerifier::evaluate(storedObject("", 0), "", 0);
    EXPECT_FALSE(report.checks[0].passed);
    EXPECT_TRUE(report.checks[1].passed);
    EXPECT_FALSE(report.passed());
}

} // namespace test
} // namespace Verification
} // namespace MultipartUploader
