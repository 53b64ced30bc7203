// include/object_verifier.hpp
#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "upload_session.hpp"

namespace MultipartUploader
{
    namespace Verification
    {

        struct CheckResult
        {
            std::string description;
            std::string expected;
            std::string found;
            bool passed = false;
        };

        struct VerificationReport
        {
            std::vector<CheckResult> checks;

            bool passed() const;
        };

        class ObjectVerifier
        {
        public:
            static const std::string DIGEST_CHECK;
            static const std::string SIZE_CHECK;

            // Compare the finalized object's stored digest and size with the expected values.
            // Both checks always run. Throws MismatchError listing every failed check.
            static VerificationReport verify(const Session::FinalizedObject &object,
                                             const std::string &expected_digest,
                                             uint64_t expected_size);

            // Same comparison without throwing.
            static VerificationReport evaluate(const Session::FinalizedObject &object,
                                               const std::string &expected_digest,
                                               uint64_t expected_size);
        };

    } // namespace Verification
} // namespace MultipartUploader
