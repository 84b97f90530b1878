#include "engine/core/EventBus.hpp"

#include <utility>

namespace engine::core
{
void EventBus::Subscribe(const std::string& eventName, Handler handler)
{
    m_handlers[eventName].push_back(std::move(handler));
}

void EventBus::Publish(Event event)
{
    m_queue.push(std::move(event));
}

std::size_t EventBus::DispatchQueued()
{
    std::size_t dispatched = 0;
    while (!m_queue.empty())
    {
        Event event = std::move(m_queue.front());
        m_queue.pop();
        ++dispatched;

        const auto it = m_handlers.find(event.name);
        if (it == m_handlers.end())
        {
            continue;
        }

        // Handlers may subscribe more handlers for this name; iterate a copy.
        const std::vector<Handler> handlers = it->second;
        for (const Handler& handler : handlers)
        {
            handler(event);
        }
    }
    return dispatched;
}

void EventBus::ClearQueue()
{
    std::queue<Event> empty;
    m_queue.swap(empty);
}
} // namespace engine::core
