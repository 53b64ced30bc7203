// include/object_store.hpp
#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace MultipartUploader
{
    namespace Store
    {

        // Digest sent with a part so the store can reject corrupted bytes.
        struct ContentDigest
        {
            std::string algorithm; // e.g. "md5"
            std::string value;     // base64 encoded
        };

        // Acknowledgment of one uploaded part: its number and the opaque token (ETag) needed to complete.
        struct PartAck
        {
            int part_number = 0;
            std::string etag;
        };

        struct ObjectInfo
        {
            uint64_t content_length = 0;
            std::string etag;
            std::map<std::string, std::string> metadata;
        };

        // Remote object store with multipart upload semantics. Implementations report rejections as StoreError.
        class ObjectStore
        {
        public:
            virtual ~ObjectStore() = default;

            // Register a new multipart upload; metadata is attached to the object once it is completed.
            virtual std::string createMultipartUpload(const std::string &bucket,
                                                      const std::string &key,
                                                      const std::map<std::string, std::string> &metadata) = 0;

            // Store one part. Must reject the body (BadDigest) if its digest differs from content_digest.
            // Returns the part's ETag.
            virtual std::string uploadPart(const std::string &bucket,
                                           const std::string &key,
                                           const std::string &upload_id,
                                           int part_number,
                                           const std::vector<char> &body,
                                           const ContentDigest &content_digest) = 0;

            // Assemble the listed parts, in the given order, into one object.
            virtual void completeMultipartUpload(const std::string &bucket,
                                                 const std::string &key,
                                                 const std::string &upload_id,
                                                 const std::vector<PartAck> &parts) = 0;

            // Discard every uploaded part and release the upload id.
            virtual void abortMultipartUpload(const std::string &bucket,
                                              const std::string &key,
                                              const std::string &upload_id) = 0;

            virtual ObjectInfo headObject(const std::string &bucket, const std::string &key) = 0;
        };

    } // namespace Store
} // namespace MultipartUploader
