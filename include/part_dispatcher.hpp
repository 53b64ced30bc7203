// include/part_dispatcher.hpp
#pragma once

#include <exception>
#include <functional>
#include <mutex>
#include <vector>

#include "file_piece.hpp"

namespace MultipartUploader {
namespace Concurrency {

// Runs a job for every file piece on at most max_in_flight threads, handing pieces out in index order.
// The first job that throws halts dispatch: no further piece is started, pieces already in flight
// run to completion, and the error is rethrown once every thread has joined.
class PartDispatcher {
public:
    using PartJob = std::function<void(const Pieces::FilePiece&)>;
    using StopCheck = std::function<bool()>;

    explicit PartDispatcher(size_t max_in_flight);

    PartDispatcher(const PartDispatcher&) = delete;
    PartDispatcher& operator=(const PartDispatcher&) = delete;

    // Returns the number of pieces whose job completed. Fewer than pieces.size() only when
    // stop_requested returned true, in which case nothing is thrown.
    size_t dispatch(const std::vector<Pieces::FilePiece>& pieces,
                    const PartJob& job,
                    const StopCheck& stop_requested = StopCheck());

    size_t maxInFlight() const { return max_in_flight; }

private:
    // Next piece to start, or nullptr once dispatch is exhausted or halted.
    const Pieces::FilePiece* claimNext(const std::vector<Pieces::FilePiece>& pieces, const StopCheck& stop_requested);

    void recordSuccess();
    void recordFailure(std::exception_ptr error);

    const size_t max_in_flight;

    std::mutex dispatch_mutex; // Guards everything below
    size_t next_piece;
    size_t completed;
    bool halted;
    std::exception_ptr first_error;
};

} // namespace Concurrency
} // namespace MultipartUploader
