#include "FrameQueue.hpp"
#include "utils/ErrorReporter.hpp"

#include <exception>
#include <string>
#include <utility>

namespace springy
{

FrameRequestId FrameQueue::requestFrame(FrameCallback callback)
{
    const FrameRequestId id = next_id_++;
    pending_.emplace(id, std::move(callback));
    return id;
}

void FrameQueue::cancelFrame(FrameRequestId id)
{
    pending_.erase(id);
    running_.erase(id);
}

std::size_t FrameQueue::runFrame(double timestamp_ms)
{
    running_.swap(pending_);

    std::size_t ran = 0;
    while (!running_.empty())
    {
        auto it = running_.begin();
        const FrameRequestId id = it->first;
        FrameCallback callback = std::move(it->second);
        running_.erase(it);

        if (!callback)
            continue;

        ++ran;
        try
        {
            callback(timestamp_ms);
        }
        catch (const std::exception& ex)
        {
            utils::ErrorReporter::ReportError(utils::ErrorCategory::Scheduling, "Frame callback failed",
                                              "request " + std::to_string(id) + ": " + ex.what());
        }
        catch (...)
        {
            utils::ErrorReporter::ReportError(utils::ErrorCategory::Scheduling, "Frame callback failed",
                                              "request " + std::to_string(id) + ": unknown exception");
        }
    }
    return ran;
}

} // namespace springy
