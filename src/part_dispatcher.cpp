// src/part_dispatcher.cpp
#include "part_dispatcher.hpp"
#include "upload_errors.hpp"

#include <algorithm>
#include <system_error>
#include <thread>

#include <spdlog/spdlog.h>

namespace MultipartUploader
{
    namespace Concurrency
    {

        PartDispatcher::PartDispatcher(size_t max_parts_in_flight)
            : max_in_flight(max_parts_in_flight), next_piece(0), completed(0), halted(false)
        {
            if (max_in_flight == 0)
            {
                throw InvalidInput("At least one part must be allowed in flight.");
            }
        }

        size_t PartDispatcher::dispatch(const std::vector<Pieces::FilePiece> &pieces,
                                        const PartJob &job,
                                        const StopCheck &stop_requested)
        {
            {
                std::lock_guard<std::mutex> lock(dispatch_mutex);
                next_piece = 0;
                completed = 0;
                halted = false;
                first_error = nullptr;
            }

            const size_t thread_count = std::min(max_in_flight, pieces.size());
            spdlog::debug("Dispatching {} part(s) on {} thread(s).", pieces.size(), thread_count);

            std::vector<std::thread> threads;
            threads.reserve(thread_count);
            try
            {
                for (size_t i = 0; i < thread_count; ++i)
                {
                    threads.emplace_back(
                        [&]
                        {
                            while (const Pieces::FilePiece *piece = claimNext(pieces, stop_requested))
                            {
                                try
                                {
                                    job(*piece);
                                    recordSuccess();
                                }
                                catch (...)
                                {
                                    recordFailure(std::current_exception());
                                }
                            }
                        });
                }
            }
            catch (const std::system_error &)
            {
                // Could not start another thread; let the running ones finish what they claimed.
                recordFailure(std::current_exception());
            }

            for (std::thread &thread : threads)
            {
                thread.join();
            }

            std::lock_guard<std::mutex> lock(dispatch_mutex);
            if (first_error)
            {
                std::rethrow_exception(first_error);
            }
            if (completed < pieces.size())
            {
                spdlog::warn("Part dispatch stopped after {} of {} part(s).", completed, pieces.size());
            }
            return completed;
        }

        const Pieces::FilePiece *PartDispatcher::claimNext(const std::vector<Pieces::FilePiece> &pieces,
                                                           const StopCheck &stop_requested)
        {
            std::lock_guard<std::mutex> lock(dispatch_mutex);
            if (halted || next_piece >= pieces.size())
            {
                return nullptr;
            }
            if (stop_requested && stop_requested())
            {
                halted = true;
                return nullptr;
            }
            return &pieces[next_piece++];
        }

        void PartDispatcher::recordSuccess()
        {
            std::lock_guard<std::mutex> lock(dispatch_mutex);
            ++completed;
        }

        void PartDispatcher::recordFailure(std::exception_ptr error)
        {
            std::lock_guard<std::mutex> lock(dispatch_mutex);
            if (!first_error)
            {
                first_error = error;
                spdlog::debug("Halting part dispatch after the first failure.");
            }
            halted = true;
        }

    } // namespace Concurrency
} // namespace MultipartUploader
