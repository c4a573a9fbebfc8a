#pragma once

#include <deque>
#include <iterator>
#include <mutex>
#include <optional>
#include <utility>
#include <vector>

namespace ConverterPro
{
    /**
     * @brief FIFO channel between the conversion worker (producer) and the UI
     * (consumer). push() and tryPop() never block on each other for longer
     * than one container operation.
     */
    template <typename T>
    class MessageQueue
    {
    public:
        void push(T message)
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_items.push_back(std::move(message));
        }

        std::optional<T> tryPop()
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (m_items.empty()) {
                return std::nullopt;
            }
            T front = std::move(m_items.front());
            m_items.pop_front();
            return front;
        }

        // All pending messages, oldest first
        std::vector<T> drain()
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            std::vector<T> out(std::make_move_iterator(m_items.begin()), std::make_move_iterator(m_items.end()));
            m_items.clear();
            return out;
        }

        bool empty() const
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            return m_items.empty();
        }

        size_t size() const
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            return m_items.size();
        }

    private:
        mutable std::mutex m_mutex;
        std::deque<T> m_items;
    };

} // namespace ConverterPro
