// src/upload_session.cpp
#include "upload_session.hpp"
#include "digest_utility.hpp"
#include "upload_errors.hpp"

#include <spdlog/spdlog.h>

namespace MultipartUploader
{
    namespace Session
    {

        const char *toString(SessionState state)
        {
            switch (state)
            {
            case SessionState::NotStarted:
                return "NotStarted";
            case SessionState::InProgress:
                return "InProgress";
            case SessionState::Completed:
                return "Completed";
            case SessionState::Aborted:
                return "Aborted";
            }
            return "Unknown";
        }

        UploadSession::UploadSession(Store::ObjectStore &object_store, std::string algorithm, bool strict)
            : store(object_store), digest_algorithm(std::move(algorithm)), strict_order(strict)
        {
            Digest::DigestUtility::requireSupported(digest_algorithm);
        }

        SessionState UploadSession::state() const
        {
            std::lock_guard<std::mutex> lock(state_mutex);
            return current_state;
        }

        void UploadSession::requireState(SessionState expected, const char *operation) const
        {
            if (current_state != expected)
            {
                throw SessionStateError(std::string("Cannot ") + operation + " a session in state " +
                                        toString(current_state) + " (expected " + toString(expected) + ")");
            }
        }

        std::string UploadSession::begin(const std::string &bucket, const std::string &key, const std::string &expected_digest)
        {
            {
                std::lock_guard<std::mutex> lock(state_mutex);
                requireState(SessionState::NotStarted, "begin");
            }

            std::string id;
            try
            {
                id = store.createMultipartUpload(bucket, key, {{digest_algorithm, expected_digest}});
            }
            catch (const StoreError &)
            {
                throw;
            }
            catch (const std::exception &e)
            {
                throw StoreError("InternalError", std::string("Failed to create multipart upload: ") + e.what());
            }

            std::lock_guard<std::mutex> lock(state_mutex);
            bucket_name = bucket;
            object_key = key;
            upload_id = id;
            current_state = SessionState::InProgress;
            spdlog::info("Started multipart upload {} for {}/{}", upload_id, bucket_name, object_key);
            return upload_id;
        }

        Store::PartAck UploadSession::uploadPart(int part_number, const std::vector<char> &body)
        {
            return transmit(part_number, body, Digest::DigestUtility::digestBuffer(body, digest_algorithm));
        }

        Store::PartAck UploadSession::uploadPart(const Pieces::FilePiece &piece, int total_parts)
        {
            // Hash the bytes that are about to be sent, not the file as it was at split time.
            std::vector<char> body = piece.loadData();
            std::string digest = Digest::DigestUtility::digestBuffer(body, digest_algorithm);
            spdlog::info("Uploading {} (part {} of {}), hash: {}", piece.path.string(), piece.index, total_parts, digest);
            return transmit(piece.index, body, digest);
        }

        Store::PartAck UploadSession::transmit(int part_number, const std::vector<char> &body, const std::string &digest)
        {
            {
                std::lock_guard<std::mutex> lock(state_mutex);
                requireState(SessionState::InProgress, "upload a part to");
                if (strict_order && part_number != next_part)
                {
                    throw SessionStateError("Expected part " + std::to_string(next_part) + ", got part " +
                                            std::to_string(part_number));
                }
                if (part_number < 1 || uploaded_parts.count(part_number) != 0)
                {
                    throw SessionStateError("Part " + std::to_string(part_number) + " is invalid or already uploaded");
                }
            }

            std::string etag;
            try
            {
                etag = store.uploadPart(bucket_name, object_key, upload_id, part_number, body,
                                        Store::ContentDigest{digest_algorithm, digest});
            }
            catch (const std::exception &e)
            {
                spdlog::error("Upload of part {} failed: {}", part_number, e.what());
                throw PartUploadError(part_number, e.what());
            }

            std::lock_guard<std::mutex> lock(state_mutex);
            uploaded_parts[part_number] = etag;
            if (strict_order)
            {
                ++next_part;
            }
            spdlog::debug("Part {} acknowledged with ETag {}", part_number, etag);
            return Store::PartAck{part_number, etag};
        }

        FinalizedObject UploadSession::finalize(const std::vector<Store::PartAck> &ordered_acks)
        {
            {
                std::lock_guard<std::mutex> lock(state_mutex);
                requireState(SessionState::InProgress, "finalize");

                if (ordered_acks.empty() || ordered_acks.size() != uploaded_parts.size())
                {
                    throw FinalizeError("Finalize needs an ack for each of the " + std::to_string(uploaded_parts.size()) +
                                        " uploaded parts, got " + std::to_string(ordered_acks.size()));
                }
                for (size_t i = 0; i < ordered_acks.size(); ++i)
                {
                    const auto &ack = ordered_acks[i];
                    const int expected_number = static_cast<int>(i) + 1;
                    if (ack.part_number != expected_number)
                    {
                        throw FinalizeError("Part acks must be numbered 1.." + std::to_string(ordered_acks.size()) +
                                            " in ascending order; position " + std::to_string(expected_number) +
                                            " holds part " + std::to_string(ack.part_number));
                    }
                    auto uploaded = uploaded_parts.find(ack.part_number);
                    if (uploaded == uploaded_parts.end() || uploaded->second != ack.etag)
                    {
                        throw FinalizeError("Part " + std::to_string(ack.part_number) + " was not uploaded in this session");
                    }
                }
            }

            try
            {
                store.completeMultipartUpload(bucket_name, object_key, upload_id, ordered_acks);
            }
            catch (const std::exception &e)
            {
                spdlog::error("Completing multipart upload {} failed: {}", upload_id, e.what());
                throw FinalizeError(std::string("Failed to complete multipart upload: ") + e.what());
            }

            {
                std::lock_guard<std::mutex> lock(state_mutex);
                current_state = SessionState::Completed;
            }
            spdlog::info("Finished uploading.");

            Store::ObjectInfo info = store.headObject(bucket_name, object_key);
            FinalizedObject finalized;
            finalized.bucket = bucket_name;
            finalized.key = object_key;
            finalized.upload_id = upload_id;
            finalized.size = info.content_length;
            finalized.etag = info.etag;
            auto stored_digest = info.metadata.find(digest_algorithm);
            if (stored_digest != info.metadata.end())
            {
                finalized.digest = stored_digest->second;
            }
            return finalized;
        }

        void UploadSession::abort()
        {
            {
                std::lock_guard<std::mutex> lock(state_mutex);
                requireState(SessionState::InProgress, "abort");
                current_state = SessionState::Aborted;
            }

            spdlog::warn("Exiting and the upload is incomplete. Aborting multipart upload {}...", upload_id);
            try
            {
                store.abortMultipartUpload(bucket_name, object_key, upload_id);
            }
            catch (const std::exception &e)
            {
                abort_failure = std::string("Failed to abort multipart upload ") + upload_id + ": " + e.what();
                throw AbortError(*abort_failure);
            }
            spdlog::info("Upload aborted.");
        }

        void UploadSession::abortIfOpen() noexcept
        {
            if (!isOpen())
            {
                return;
            }
            try
            {
                abort();
            }
            catch (const std::exception &e)
            {
                if (!abort_failure)
                {
                    abort_failure = e.what();
                }
                spdlog::error("{}", e.what());
            }
        }

    } // namespace Session
} // namespace MultipartUploader
