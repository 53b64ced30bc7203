// include/part_ack_registry.hpp
#pragma once

#include <map>
#include <mutex>
#include <string>
#include <vector>

#include "object_store.hpp"

namespace MultipartUploader
{
    namespace Session
    {

        // Collects the acknowledgment of every uploaded part, possibly from several threads,
        // and hands them back in ascending part-number order for finalize.
        class PartAckRegistry
        {
        public:
            explicit PartAckRegistry(int expected_parts);

            // Record the ack of one part. Throws SessionStateError for an out-of-range or repeated part number.
            void record(const Store::PartAck &ack);

            // Acks in ascending part-number order. Throws SessionStateError unless exactly 1..N are present.
            std::vector<Store::PartAck> orderedAcks() const;

            // Number of acks recorded so far.
            int count() const;

            int expected() const { return expected_parts; }

            bool complete() const;

        private:
            const int expected_parts;
            std::map<int, std::string> etags; // part number -> ETag
            mutable std::mutex mtx;           // Guards etags
        };

    } // namespace Session
} // namespace MultipartUploader
