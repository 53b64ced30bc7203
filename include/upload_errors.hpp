// include/upload_errors.hpp
#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace MultipartUploader
{

    // Root of every error raised by the uploader.
    class UploadError : public std::runtime_error
    {
    public:
        explicit UploadError(const std::string &message) : std::runtime_error(message) {}

        // Outcome of the abort that this error triggered, if that abort failed.
        void attachAbortFailure(std::string failure) { abort_failure = std::move(failure); }
        const std::optional<std::string> &abortFailure() const { return abort_failure; }

    private:
        std::optional<std::string> abort_failure;
    };

    // Filesystem read/write failure.
    class IOError : public UploadError
    {
    public:
        using UploadError::UploadError;
    };

    class UnsupportedAlgorithm : public UploadError
    {
    public:
        explicit UnsupportedAlgorithm(const std::string &algorithm)
            : UploadError("Unsupported digest algorithm: " + algorithm), algorithm_name(algorithm) {}

        const std::string &algorithm() const { return algorithm_name; }

    private:
        std::string algorithm_name;
    };

    // OpenSSL refused to allocate, update or finalize a digest context.
    class DigestError : public UploadError
    {
    public:
        using UploadError::UploadError;
    };

    // Arguments that can never lead to a valid upload (zero piece size, empty source file, ...).
    class InvalidInput : public UploadError
    {
    public:
        using UploadError::UploadError;
    };

    // Rejection reported by the object store. `code` follows S3 naming (NoSuchUpload, BadDigest, ...).
    class StoreError : public UploadError
    {
    public:
        StoreError(std::string code, const std::string &message)
            : UploadError(code + ": " + message), error_code(std::move(code)) {}

        const std::string &code() const { return error_code; }

    private:
        std::string error_code;
    };

    class PartUploadError : public UploadError
    {
    public:
        PartUploadError(int part_number, const std::string &message)
            : UploadError("Failed to upload part " + std::to_string(part_number) + ": " + message),
              part(part_number) {}

        int partNumber() const { return part; }

    private:
        int part;
    };

    class FinalizeError : public UploadError
    {
    public:
        using UploadError::UploadError;
    };

    class AbortError : public UploadError
    {
    public:
        using UploadError::UploadError;
    };

    // Operation attempted in a state that does not allow it.
    class SessionStateError : public UploadError
    {
    public:
        using UploadError::UploadError;
    };

    // Stop requested (SIGINT/SIGTERM) while an upload was in progress.
    class Interrupted : public UploadError
    {
    public:
        using UploadError::UploadError;
    };

    struct FailedCheck
    {
        std::string description;
        std::string expected;
        std::string found;
    };

    // Post-finalize verification failure. Carries every check that failed, not only the first.
    class MismatchError : public UploadError
    {
    public:
        explicit MismatchError(std::vector<FailedCheck> failed);

        const std::vector<FailedCheck> &failedChecks() const { return failed_checks; }

    private:
        static std::string describe(const std::vector<FailedCheck> &failed);

        std::vector<FailedCheck> failed_checks;
    };

} // namespace MultipartUploader
