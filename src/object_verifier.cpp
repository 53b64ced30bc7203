// src/object_verifier.cpp
#include "object_verifier.hpp"
#include "upload_errors.hpp"

#include <spdlog/spdlog.h>

namespace MultipartUploader
{
    namespace Verification
    {

        const std::string ObjectVerifier::DIGEST_CHECK = "hashes for combined files are equal";
        const std::string ObjectVerifier::SIZE_CHECK = "file sizes of combined files are equal";

        bool VerificationReport::passed() const
        {
            for (const auto &check : checks)
            {
                if (!check.passed)
                {
                    return false;
                }
            }
            return !checks.empty();
        }

        VerificationReport ObjectVerifier::evaluate(const Session::FinalizedObject &object,
                                                    const std::string &expected_digest,
                                                    uint64_t expected_size)
        {
            VerificationReport report;
            report.checks.push_back(CheckResult{DIGEST_CHECK, expected_digest, object.digest,
                                                !expected_digest.empty() && expected_digest == object.digest});
            report.checks.push_back(CheckResult{SIZE_CHECK, std::to_string(expected_size), std::to_string(object.size),
                                                expected_size == object.size});
            return report;
        }

        VerificationReport ObjectVerifier::verify(const Session::FinalizedObject &object,
                                                  const std::string &expected_digest,
                                                  uint64_t expected_size)
        {
            VerificationReport report = evaluate(object, expected_digest, expected_size);

            std::vector<FailedCheck> failed;
            for (const auto &check : report.checks)
            {
                if (check.passed)
                {
                    spdlog::info("Passed check '{}'.", check.description);
                }
                else
                {
                    spdlog::error("Failed check '{}': expected {}, found {}", check.description, check.expected, check.found);
                    failed.push_back(FailedCheck{check.description, check.expected, check.found});
                }
            }

            if (!failed.empty())
            {
                throw MismatchError(std::move(failed));
            }
            return report;
        }

    } // namespace Verification
} // namespace MultipartUploader
