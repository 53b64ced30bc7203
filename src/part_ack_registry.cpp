// src/part_ack_registry.cpp
#include "part_ack_registry.hpp"
#include "upload_errors.hpp"

namespace MultipartUploader
{
    namespace Session
    {

        PartAckRegistry::PartAckRegistry(int expected) : expected_parts(expected)
        {
            if (expected_parts < 1)
            {
                throw InvalidInput("A multipart upload needs at least one part.");
            }
        }

        void PartAckRegistry::record(const Store::PartAck &ack)
        {
            if (ack.part_number < 1 || ack.part_number > expected_parts)
            {
                throw SessionStateError("Part number " + std::to_string(ack.part_number) + " is outside 1.." +
                                        std::to_string(expected_parts));
            }
            std::lock_guard<std::mutex> lock(mtx);
            if (!etags.emplace(ack.part_number, ack.etag).second)
            {
                throw SessionStateError("Part " + std::to_string(ack.part_number) + " was acknowledged twice.");
            }
        }

        std::vector<Store::PartAck> PartAckRegistry::orderedAcks() const
        {
            std::lock_guard<std::mutex> lock(mtx);
            if (static_cast<int>(etags.size()) != expected_parts)
            {
                throw SessionStateError("Only " + std::to_string(etags.size()) + " of " +
                                        std::to_string(expected_parts) + " parts were acknowledged.");
            }

            // std::map iterates in ascending key order; with N unique keys in 1..N that is exactly 1..N.
            std::vector<Store::PartAck> acks;
            acks.reserve(etags.size());
            for (const auto &[part_number, etag] : etags)
            {
                acks.push_back(Store::PartAck{part_number, etag});
            }
            return acks;
        }

        int PartAckRegistry::count() const
        {
            std::lock_guard<std::mutex> lock(mtx);
            return static_cast<int>(etags.size());
        }

        bool PartAckRegistry::complete() const
        {
            return count() == expected_parts;
        }

    } // namespace Session
} // namespace MultipartUploader
