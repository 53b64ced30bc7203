// src/upload_errors.cpp
#include "upload_errors.hpp"

namespace MultipartUploader
{

    MismatchError::MismatchError(std::vector<FailedCheck> failed)
        : UploadError(describe(failed)), failed_checks(std::move(failed))
    {
    }

    std::string MismatchError::describe(const std::vector<FailedCheck> &failed)
    {
        std::string message = "Verification failed:";
        for (const auto &check : failed)
        {
            message += " [Failed check '" + check.description + "': expected " + check.expected +
                       ", found " + check.found + "]";
        }
        return message;
    }

} // namespace MultipartUploader
