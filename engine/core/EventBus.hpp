#pragma once

#include <cstddef>
#include <functional>
#include <queue>
#include <string>
#include <unordered_map>
#include <vector>

namespace engine::core
{
struct Event
{
    std::string name;
    std::vector<std::string> args;
    float value = 0.0F;

    [[nodiscard]] std::string Arg(std::size_t index) const
    {
        return index < args.size() ? args[index] : std::string{};
    }
};

/// Queued publish/subscribe channel.
/// Publishing never calls handlers; handlers run only from DispatchQueued(),
/// so subscribers always observe the state after the mutation that raised the event.
class EventBus
{
public:
    using Handler = std::function<void(const Event&)>;

    void Subscribe(const std::string& eventName, Handler handler);
    void Publish(Event event);

    /// Runs handlers for every queued event, including events published by handlers.
    /// @return Number of events dispatched.
    std::size_t DispatchQueued();

    void ClearQueue();

    [[nodiscard]] std::size_t QueuedCount() const { return m_queue.size(); }

private:
    std::unordered_map<std::string, std::vector<Handler>> m_handlers;
    std::queue<Event> m_queue;
};
} // namespace engine::core
