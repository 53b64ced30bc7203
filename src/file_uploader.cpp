// src/file_uploader.cpp
#include "file_uploader.hpp"
#include "part_dispatcher.hpp"

#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

namespace MultipartUploader
{

    std::atomic<bool> FileUploader::stop_requested{false};

    FileUploader::FileUploader(Store::ObjectStore &object_store) : store(object_store)
    {
    }

    void FileUploader::requestStop() noexcept
    {
        stop_requested.store(true);
    }

    bool FileUploader::stopRequested() noexcept
    {
        return stop_requested.load();
    }

    void FileUploader::clearStopRequest() noexcept
    {
        stop_requested.store(false);
    }

    std::vector<Store::PartAck> FileUploader::uploadPiecesSequentially(Session::UploadSession &session,
                                                                       const std::vector<Pieces::FilePiece> &pieces)
    {
        const int total = static_cast<int>(pieces.size());
        Session::PartAckRegistry registry(total);
        for (const auto &piece : pieces)
        {
            if (stopRequested())
            {
                throw Interrupted("Upload interrupted before part " + std::to_string(piece.index) + " of " +
                                  std::to_string(total));
            }
            registry.record(session.uploadPart(piece, total));
        }
        return registry.orderedAcks();
    }

    std::vector<Store::PartAck> FileUploader::uploadPiecesInParallel(Session::UploadSession &session,
                                                                     const std::vector<Pieces::FilePiece> &pieces,
                                                                     size_t max_in_flight)
    {
        const int total = static_cast<int>(pieces.size());
        Session::PartAckRegistry registry(total);

        Concurrency::PartDispatcher dispatcher(max_in_flight);
        dispatcher.dispatch(
            pieces,
            [&](const Pieces::FilePiece &piece)
            { registry.record(session.uploadPart(piece, total)); },
            &FileUploader::stopRequested);

        if (!registry.complete())
        {
            throw Interrupted("Upload interrupted after " + std::to_string(registry.count()) + " of " +
                              std::to_string(total) + " parts");
        }
        return registry.orderedAcks();
    }

    void FileUploader::writeManifest(const Manifest::UploadManifest &manifest, const fs::path &dir)
    {
        try
        {
            manifest.save(dir);
        }
        catch (const std::exception &e)
        {
            spdlog::warn("Could not write upload manifest: {}", e.what());
        }
    }

    UploadResult FileUploader::uploadFile(const Config::UploadOptions &options)
    {
        // Configuration errors are reported before anything touches the store.
        Digest::DigestUtility::requireSupported(options.digest_algorithm);
        if (options.bucket_name.empty())
        {
            throw InvalidInput("Bucket name must not be empty.");
        }
        if (options.file_piece_size == 0)
        {
            throw InvalidInput("File piece size must be greater than zero.");
        }
        if (options.file_piece_size < Config::UploadConfig::MIN_FILE_PIECE_SIZE)
        {
            spdlog::warn("File piece size {} is below the {} byte minimum most object stores enforce for every part but the last.",
                         options.file_piece_size, Config::UploadConfig::MIN_FILE_PIECE_SIZE);
        }

        Pieces::SourceFile source(options.original_filename, options.digest_algorithm);
        if (source.size() == 0)
        {
            throw InvalidInput("Input file " + source.path().string() + " is empty; there is nothing to upload.");
        }

        fs::path temp_root = options.temp_root.empty()
                                 ? Config::UploadConfig::resolveTempRoot(std::nullopt)
                                 : Config::UploadConfig::ensureDirectoryExists(options.temp_root);

        // Deleted on every exit path below unless the caller keeps the pieces.
        Config::ScopedTempDirectory piece_dir(temp_root, Config::UploadConfig::TEMP_DIR_PREFIX);
        if (options.keep_file_pieces)
        {
            piece_dir.retain();
        }

        std::vector<Pieces::FilePiece> pieces =
            Pieces::FileSplitter::split(source.path(), piece_dir.path(), options.file_piece_size);

        Manifest::UploadManifest manifest(source.key(), source.size(), options.digest_algorithm, pieces);
        manifest.bucket = options.bucket_name;
        manifest.key = source.key();
        manifest.digest = source.digest();

        const bool parallel = options.parallel_parts > 1 && pieces.size() > 1;
        Session::UploadSession session(store, options.digest_algorithm, !parallel);

        try
        {
            manifest.upload_id = session.begin(options.bucket_name, source.key(), source.digest());

            Session::FinalizedObject finalized;
            {
                Session::SessionAbortGuard abort_guard(session);

                std::vector<Store::PartAck> acks = parallel
                                                       ? uploadPiecesInParallel(session, pieces, options.parallel_parts)
                                                       : uploadPiecesSequentially(session, pieces);
                for (const auto &ack : acks)
                {
                    manifest.recordEtag(ack.part_number, ack.etag);
                }
                finalized = session.finalize(acks);
            }

            manifest.state = Session::toString(session.state());
            writeManifest(manifest, piece_dir.path());

            UploadResult result;
            result.report = Verification::ObjectVerifier::verify(finalized, source.digest(), source.size());
            result.bucket = finalized.bucket;
            result.key = finalized.key;
            result.upload_id = finalized.upload_id;
            result.digest_algorithm = options.digest_algorithm;
            result.digest = source.digest();
            result.size = source.size();
            result.piece_count = static_cast<int>(pieces.size());
            if (piece_dir.retained())
            {
                result.piece_directory = piece_dir.path();
            }

            spdlog::info("Upload successful!");
            return result;
        }
        catch (UploadError &e)
        {
            if (session.abortFailure() && !e.abortFailure())
            {
                e.attachAbortFailure(*session.abortFailure());
            }
            manifest.state = Session::toString(session.state());
            writeManifest(manifest, piece_dir.path());
            throw;
        }
    }

} // namespace MultipartUploader
