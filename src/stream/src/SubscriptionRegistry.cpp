/**
 * @file SubscriptionRegistry.cpp
 * @brief SubscriptionRegistry implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#include <seis/stream/SubscriptionRegistry.hpp>
#include <seis/core/Log.hpp>

#include <algorithm>
#include <exception>
#include <string>

namespace seis::stream {

namespace {

constexpr std::string_view kTag = "REGISTRY";

} // namespace

core::Expected<SubscriptionId> SubscriptionRegistry::subscribe(Subscriber callback)
{
    if (!callback)
    {
        return core::makeError(core::ErrorCode::kInvalidArgument, "empty subscriber callback");
    }

    auto entry = std::make_shared<Entry>();
    entry->callback = std::move(callback);

    std::lock_guard<std::mutex> lock{_stateMutex};
    entry->id = _nextId++;
    _entries.push_back(entry);
    return entry->id;
}

core::ExpectedVoid SubscriptionRegistry::unsubscribe(SubscriptionId id)
{
    std::lock_guard<std::mutex> lock{_stateMutex};
    const auto it = std::find_if(_entries.begin(), _entries.end(),
                                 [id](const auto& entry) { return entry->id == id; });
    if (it == _entries.end())
    {
        return core::makeError(core::ErrorCode::kInvalidArgument,
                               "unknown subscription " + std::to_string(id));
    }
    (*it)->active.store(false);
    _entries.erase(it);
    return {};
}

core::usize SubscriptionRegistry::clear()
{
    std::lock_guard<std::mutex> lock{_stateMutex};
    for (const auto& entry : _entries)
    {
        entry->active.store(false);
    }
    const auto removed = _entries.size();
    _entries.clear();
    return removed;
}

DeliveryReport SubscriptionRegistry::deliver(std::span<const protocol::Sample> batch)
{
    DeliveryReport report;
    if (batch.empty())
    {
        return report;
    }

    std::lock_guard<std::mutex> delivery{_deliveryMutex};

    std::vector<std::shared_ptr<Entry>> snapshot;
    {
        std::lock_guard<std::mutex> lock{_stateMutex};
        snapshot = _entries;
    }

    for (const auto& entry : snapshot)
    {
        if (!entry->active.load())
        {
            continue;
        }
        try
        {
            entry->callback(batch);
            ++report.delivered;
        }
        catch (const std::exception& e)
        {
            ++report.failed;
            core::Log::error(kTag, "subscriber " + std::to_string(entry->id) + " threw: " + e.what());
        }
        catch (...)
        {
            ++report.failed;
            core::Log::error(kTag, "subscriber " + std::to_string(entry->id) +
                                   " threw a non-standard exception");
        }
    }

    _batches.fetch_add(1);
    _failures.fetch_add(report.failed);
    return report;
}

core::usize SubscriptionRegistry::size() const
{
    std::lock_guard<std::mutex> lock{_stateMutex};
    return _entries.size();
}

} // namespace seis::stream
