// main.cpp
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>

#include <boost/program_options.hpp>
#include <spdlog/spdlog.h>

// Our project includes
#include "file_uploader.hpp"
#include "local_object_store.hpp"
#include "upload_config.hpp"

namespace po = boost::program_options;

namespace
{
    const int EXIT_UPLOAD_FAILED = 1;
    const int EXIT_USAGE = 2;

    void handleStopSignal(int)
    {
        MultipartUploader::FileUploader::requestStop();
    }

    void printUsage(std::ostream &out, const po::options_description &visible)
    {
        out << "Usage: multipart_uploader [options] bucket-name original-filename\n\n"
            << "Do a multipart file upload to an object store with file integrity checking.\n"
            << "Each piece is sent with its digest, the finished object is checked against the\n"
            << "whole file's digest and size, and an incomplete upload is always aborted.\n\n"
            << visible << std::endl;
    }
} // namespace

int main(int argc, char *argv[])
{
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");

    MultipartUploader::Config::UploadOptions options;
    std::string store_root;
    std::string temp_dir;
    std::string file_piece_size;
    std::string parallel_parts;

    po::options_description visible("Options");
    visible.add_options()
        ("help,h", "show this help message and exit")
        ("file-piece-size", po::value<std::string>(&file_piece_size)->default_value(std::to_string(MultipartUploader::Config::UploadConfig::DEFAULT_FILE_PIECE_SIZE)),
         "max size in bytes of each file piece")
        ("keep-file-pieces", po::bool_switch(&options.keep_file_pieces), "keep file pieces after program is finished")
        ("digest-algorithm", po::value<std::string>(&options.digest_algorithm)->default_value(MultipartUploader::Config::UploadConfig::DEFAULT_DIGEST_ALGORITHM),
         "digest used for part integrity and final verification (md5, sha256, ...)")
        ("parallel-parts", po::value<std::string>(&parallel_parts)->default_value("1"), "number of parts uploaded at the same time")
        ("store-root", po::value<std::string>(&store_root), "object store directory (default: $MPU_STORE_ROOT or ./object-store)")
        ("temp-dir", po::value<std::string>(&temp_dir), "directory in which the file piece directory is created")
        ("verbose,v", "log store and session internals");

    std::string original_filename;
    po::options_description hidden;
    hidden.add_options()
        ("bucket-name", po::value<std::string>(&options.bucket_name), "name of destination bucket")
        ("original-filename", po::value<std::string>(&original_filename), "name of file to upload");

    po::options_description all;
    all.add(visible).add(hidden);

    po::positional_options_description positional;
    positional.add("bucket-name", 1).add("original-filename", 1);

    po::variables_map vm;
    try
    {
        po::store(po::command_line_parser(argc, argv).options(all).positional(positional).run(), vm);
        po::notify(vm);
    }
    catch (const po::error &e)
    {
        std::cerr << "error: " << e.what() << "\n\n";
        printUsage(std::cerr, visible);
        return EXIT_USAGE;
    }

    if (vm.count("help"))
    {
        printUsage(std::cout, visible);
        return EXIT_SUCCESS;
    }
    if (!vm.count("bucket-name") || !vm.count("original-filename"))
    {
        std::cerr << "error: the following arguments are required: bucket-name, original-filename\n\n";
        printUsage(std::cerr, visible);
        return EXIT_USAGE;
    }
    try
    {
        options.file_piece_size =
            MultipartUploader::Config::UploadConfig::parsePositiveCount("file-piece-size", file_piece_size);
        options.parallel_parts =
            MultipartUploader::Config::UploadConfig::parsePositiveCount("parallel-parts", parallel_parts);
    }
    catch (const MultipartUploader::InvalidInput &e)
    {
        std::cerr << "error: " << e.what() << "\n\n";
        printUsage(std::cerr, visible);
        return EXIT_USAGE;
    }
    if (vm.count("verbose"))
    {
        spdlog::set_level(spdlog::level::debug);
    }

    options.original_filename = original_filename;

    std::signal(SIGINT, handleStopSignal);
    std::signal(SIGTERM, handleStopSignal);

    try
    {
        options.temp_root = MultipartUploader::Config::UploadConfig::resolveTempRoot(
            temp_dir.empty() ? std::nullopt : std::optional<std::string>(temp_dir));

        MultipartUploader::Store::LocalObjectStore store(MultipartUploader::Config::UploadConfig::resolveStoreRoot(
            store_root.empty() ? std::nullopt : std::optional<std::string>(store_root)));

        MultipartUploader::FileUploader uploader(store);
        MultipartUploader::UploadResult result = uploader.uploadFile(options);

        spdlog::info("Stored {}/{} ({} bytes in {} part(s), {} {})", result.bucket, result.key, result.size,
                     result.piece_count, result.digest_algorithm, result.digest);
        return EXIT_SUCCESS;
    }
    catch (const MultipartUploader::UploadError &e)
    {
        spdlog::error("{}", e.what());
        if (e.abortFailure())
        {
            spdlog::error("Additionally, the abort failed: {}", *e.abortFailure());
        }
        return EXIT_UPLOAD_FAILED;
    }
    catch (const std::exception &e)
    {
        spdlog::error("Unexpected error: {}", e.what());
        return EXIT_UPLOAD_FAILED;
    }
}
