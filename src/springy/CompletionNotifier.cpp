#include "CompletionNotifier.hpp"
#include "utils/ErrorReporter.hpp"

#include <plog/Log.h>

#include <exception>
#include <string>
#include <utility>

namespace springy
{

void CompletionNotifier::registerCallback(double target, Callback callback)
{
    if (!callback)
        return;

    auto [it, inserted] = pending_.insert_or_assign(target, std::move(callback));
    if (!inserted)
    {
        PLOG_DEBUG << "Completion callback for target " << target << " replaced before it fired";
    }
}

void CompletionNotifier::notifySettled(double target)
{
    // Take ownership first so the callback can register follow-up completions.
    std::unordered_map<double, Callback> pending;
    pending.swap(pending_);

    auto it = pending.find(target);
    if (it == pending.end())
    {
        if (!pending.empty())
        {
            PLOG_DEBUG << "Settled at " << target << "; discarding " << pending.size()
                       << " completion callback(s) for other targets";
        }
        return;
    }

    Callback callback = std::move(it->second);
    pending.clear();

    PLOG_DEBUG << "Spring reached " << target << ", running completion callback";
    try
    {
        callback();
    }
    catch (const std::exception& ex)
    {
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Callback, "Spring completion callback failed",
                                          "target=" + std::to_string(target) + ": " + ex.what());
    }
    catch (...)
    {
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Callback, "Spring completion callback failed",
                                          "target=" + std::to_string(target) + ": unknown exception");
    }
}

} // namespace springy
