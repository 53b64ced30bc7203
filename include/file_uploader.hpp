// include/file_uploader.hpp
#pragma once

#include <atomic>
#include <string>
#include <vector>
#include <filesystem>

#include "upload_config.hpp"
#include "upload_errors.hpp"
#include "digest_utility.hpp"
#include "file_piece.hpp"
#include "file_splitter.hpp"
#include "source_file.hpp"
#include "object_store.hpp"
#include "part_ack_registry.hpp"
#include "upload_session.hpp"
#include "object_verifier.hpp"
#include "upload_manifest.hpp"
#include "scoped_temp_directory.hpp"

namespace MultipartUploader
{

    struct UploadResult
    {
        std::string bucket;
        std::string key;
        std::string upload_id;
        std::string digest_algorithm;
        std::string digest;
        uint64_t size = 0;
        int piece_count = 0;
        Verification::VerificationReport report;
        std::filesystem::path piece_directory; // Empty unless the pieces were kept
    };

    // Runs one verified multipart upload of a local file: split, upload every piece, finalize or abort, verify.
    class FileUploader
    {
    public:
        explicit FileUploader(Store::ObjectStore &store);

        // The object key is the source file's base name. Temporary pieces are deleted on every exit path
        // unless options.keep_file_pieces is set. Any failure between begin and finalize aborts the upload.
        UploadResult uploadFile(const Config::UploadOptions &options);

        // Ask running uploads to stop after the part in flight; they abort and unwind with Interrupted.
        // Safe to call from a signal handler.
        static void requestStop() noexcept;
        static bool stopRequested() noexcept;
        static void clearStopRequest() noexcept;

    private:
        std::vector<Store::PartAck> uploadPiecesSequentially(Session::UploadSession &session,
                                                             const std::vector<Pieces::FilePiece> &pieces);

        std::vector<Store::PartAck> uploadPiecesInParallel(Session::UploadSession &session,
                                                           const std::vector<Pieces::FilePiece> &pieces,
                                                           size_t max_in_flight);

        // Write the manifest; failure is logged, not raised, so it never hides the upload's own outcome.
        static void writeManifest(const Manifest::UploadManifest &manifest, const std::filesystem::path &dir);

        Store::ObjectStore &store;

        static std::atomic<bool> stop_requested;
    };

} // namespace MultipartUploader
