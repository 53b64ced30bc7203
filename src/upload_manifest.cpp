// src/upload_manifest.cpp
#include "upload_manifest.hpp"
#include "upload_errors.hpp"

#include <fstream>

namespace fs = std::filesystem;

namespace MultipartUploader {
namespace Manifest {

void to_json(nlohmann::json& j, const PieceEntry& p) {
    j = nlohmann::json{
        {"index", p.index},
        {"file", p.file},
        {"offset", p.offset},
        {"size", p.size},
        {"etag", p.etag}
    };
}

void from_json(const nlohmann::json& j, PieceEntry& p) {
    j.at("index").get_to(p.index);
    j.at("file").get_to(p.file);
    j.at("offset").get_to(p.offset);
    j.at("size").get_to(p.size);
    j.at("etag").get_to(p.etag);
}

void to_json(nlohmann::json& j, const UploadManifest& m) {
    j = nlohmann::json{
        {"filename", m.original_filename},
        {"size", m.file_size_bytes},
        {"digest_algorithm", m.digest_algorithm},
        {"digest", m.digest},
        {"bucket", m.bucket},
        {"key", m.key},
        {"upload_id", m.upload_id},
        {"state", m.state},
        {"created_at", m.created_at},
        {"pieces", m.pieces}
    };
}

void from_json(const nlohmann::json& j, UploadManifest& m) {
    j.at("filename").get_to(m.original_filename);
    j.at("size").get_to(m.file_size_bytes);
    j.at("digest_algorithm").get_to(m.digest_algorithm);
    j.at("digest").get_to(m.digest);
    j.at("bucket").get_to(m.bucket);
    j.at("key").get_to(m.key);
    j.at("upload_id").get_to(m.upload_id);
    j.at("state").get_to(m.state);
    j.at("created_at").get_to(m.created_at);
    j.at("pieces").get_to(m.pieces);
}

void UploadManifest::recordEtag(int part_number, const std::string& etag) {
    for (auto& piece : pieces) {
        if (piece.index == part_number) {
            piece.etag = etag;
            return;
        }
    }
}

nlohmann::json UploadManifest::toJson() const {
    return *this; // Uses the to_json helper function
}

UploadManifest UploadManifest::fromJson(const nlohmann::json& j) {
    UploadManifest manifest;
    j.get_to(manifest);
    return manifest;
}

fs::path UploadManifest::getFullPath(const fs::path& dir) const {
    return dir / (fs::path(original_filename).filename().string() + ".manifest.json");
}

void UploadManifest::save(const fs::path& dir) const {
    fs::path manifest_path = getFullPath(dir);

    std::ofstream ofs(manifest_path);
    if (!ofs.is_open()) {
        throw IOError("Failed to open file for writing manifest: " + manifest_path.string());
    }
    ofs << toJson().dump(4);
    ofs.close();
    if (ofs.fail()) {
        throw IOError("Failed to write all data to manifest file: " + manifest_path.string());
    }
}

UploadManifest UploadManifest::load(const fs::path& manifest_path) {
    std::ifstream ifs(manifest_path);
    if (!ifs.is_open()) {
        throw IOError("Failed to open manifest file for reading: " + manifest_path.string());
    }

    nlohmann::json j;
    try {
        ifs >> j;
        return fromJson(j);
    } catch (const nlohmann::json::exception& e) {
        throw IOError("Error parsing manifest file " + manifest_path.string() + ": " + e.what());
    }
}

} // namespace Manifest
} // namespace MultipartUploader
