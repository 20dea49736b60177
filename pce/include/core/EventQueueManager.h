#pragma once

#include <deque>
#include <stdexcept>
#include <string>

namespace PCE::Core {

/**
 * @brief FIFO event queue of one instance
 *
 * Events are appended at the back and consumed from the front. Events that
 * an instance could not consume yet are put back at the front with
 * requeueFront() so they keep their place ahead of later arrivals.
 */
template <typename EventType = std::string> class EventQueueManager {
public:
    /**
     * @brief Append an event at the back of the queue
     */
    void raise(const EventType &event) {
        queue_.push_back(event);
    }

    /**
     * @brief Put an event ahead of everything queued (cancellation)
     */
    void raiseFront(const EventType &event) {
        queue_.push_front(event);
    }

    /**
     * @brief Put previously deferred events back at the front, in their original order
     */
    template <typename Container> void requeueFront(const Container &events) {
        for (auto it = events.rbegin(); it != events.rend(); ++it) {
            queue_.push_front(*it);
        }
    }

    bool hasEvents() const {
        return !queue_.empty();
    }

    size_t size() const {
        return queue_.size();
    }

    /**
     * @brief Pop the next event (FIFO)
     * @throws std::runtime_error if the queue is empty
     */
    EventType pop() {
        if (queue_.empty()) {
            throw std::runtime_error("EventQueueManager: Cannot pop from empty queue");
        }
        EventType event = queue_.front();
        queue_.pop_front();
        return event;
    }

    const EventType &front() const {
        if (queue_.empty()) {
            throw std::runtime_error("EventQueueManager: Cannot peek into empty queue");
        }
        return queue_.front();
    }

    void clear() {
        queue_.clear();
    }

    /**
     * @brief Drain the queue through a handler in FIFO order
     *
     * Events raised by the handler are processed in the same drain.
     */
    template <typename Handler> void processAll(Handler handler) {
        while (!queue_.empty()) {
            EventType event = queue_.front();
            queue_.pop_front();
            handler(event);
        }
    }

private:
    std::deque<EventType> queue_;
};

}  // namespace PCE::Core
