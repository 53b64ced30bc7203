// include/upload_session.hpp
#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "file_piece.hpp"
#include "object_store.hpp"

namespace MultipartUploader
{
    namespace Session
    {

        // NotStarted -> InProgress -> {Completed | Aborted}. Each state is entered at most once.
        enum class SessionState
        {
            NotStarted,
            InProgress,
            Completed,
            Aborted
        };

        const char *toString(SessionState state);

        // What the store holds once the upload is completed.
        struct FinalizedObject
        {
            std::string bucket;
            std::string key;
            std::string upload_id;
            uint64_t size = 0;
            std::string digest; // Stored digest metadata; empty if the store lost it
            std::string etag;
        };

        // One multipart upload against an object store, from begin to finalize or abort.
        class UploadSession
        {
        public:
            // Throws UnsupportedAlgorithm before any remote call if the digest algorithm is unknown.
            // With strict_order, parts must arrive as 1, 2, 3, ...; otherwise any order, each once.
            UploadSession(Store::ObjectStore &store, std::string digest_algorithm, bool strict_order = true);

            UploadSession(const UploadSession &) = delete;
            UploadSession &operator=(const UploadSession &) = delete;

            // Register the upload, attaching {digest_algorithm: expected_digest} as object metadata.
            std::string begin(const std::string &bucket, const std::string &key, const std::string &expected_digest);

            // Digest the bytes and send them with that digest; the store rejects them on mismatch.
            // Store failures are raised as PartUploadError.
            Store::PartAck uploadPart(int part_number, const std::vector<char> &body);

            // Re-read the piece file and upload exactly the bytes read.
            Store::PartAck uploadPart(const Pieces::FilePiece &piece, int total_parts);

            // Assemble the parts into one object and read back its size and stored digest.
            // ordered_acks must be exactly parts 1..N in ascending order, N being every part uploaded.
            FinalizedObject finalize(const std::vector<Store::PartAck> &ordered_acks);

            // Discard the upload. Throws AbortError if the store fails; the session is Aborted either way.
            void abort();

            // Abort if still InProgress. Never throws; a failure is logged and kept in abortFailure().
            void abortIfOpen() noexcept;

            SessionState state() const;
            bool isOpen() const { return state() == SessionState::InProgress; }

            const std::string &uploadId() const { return upload_id; }
            const std::string &bucket() const { return bucket_name; }
            const std::string &key() const { return object_key; }
            const std::string &algorithm() const { return digest_algorithm; }

            // Failure of the abort attempt, if there was one and it failed.
            const std::optional<std::string> &abortFailure() const { return abort_failure; }

        private:
            Store::PartAck transmit(int part_number, const std::vector<char> &body, const std::string &digest);

            void requireState(SessionState expected, const char *operation) const;

            Store::ObjectStore &store;
            const std::string digest_algorithm;
            const bool strict_order;

            std::string bucket_name;
            std::string object_key;
            std::string upload_id;

            SessionState current_state = SessionState::NotStarted;
            std::map<int, std::string> uploaded_parts; // part number -> ETag
            int next_part = 1;
            std::optional<std::string> abort_failure;
            mutable std::mutex state_mutex; // Guards current_state, uploaded_parts, next_part
        };

        // Aborts the session on scope exit unless it reached Completed (or was already aborted).
        class SessionAbortGuard
        {
        public:
            explicit SessionAbortGuard(UploadSession &session) : guarded(session) {}
            ~SessionAbortGuard() { guarded.abortIfOpen(); }

            SessionAbortGuard(const SessionAbortGuard &) = delete;
            SessionAbortGuard &operator=(const SessionAbortGuard &) = delete;

        private:
            UploadSession &guarded;
        };

    } // namespace Session
} // namespace MultipartUploader
