#pragma once

/**
 * EventBus.hpp
 *
 * Thread-safe typed publish/subscribe bus.
 * Used for the transfer engine's update broadcast and for per-item
 * progress streams (topic = item id).
 */

#include "Logger.hpp"

#include <algorithm>
#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace kitzi::core {

/**
 * Event subscription handle
 */
class Subscription {
public:
    Subscription(uint64_t id, const std::string& topic)
        : m_id(id), m_topic(topic), m_active(true) {}

    uint64_t getId() const { return m_id; }
    const std::string& getTopic() const { return m_topic; }
    bool isActive() const { return m_active; }
    void cancel() { m_active = false; }

private:
    uint64_t m_id;
    std::string m_topic;
    std::atomic<bool> m_active;
};

using SubscriptionPtr = std::shared_ptr<Subscription>;

/**
 * EventBus - publish/subscribe for a single payload type
 *
 * Features:
 * - Named topics, any number of subscribers per topic
 * - Callbacks run outside the lock, so a callback may subscribe,
 *   unsubscribe or emit again
 * - A throwing subscriber is logged and does not stop delivery
 */
template<typename Payload>
class EventBus {
public:
    using Callback = std::function<void(const Payload&)>;

    EventBus() = default;
    ~EventBus() = default;

    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    /**
     * Subscribe to a topic
     * @param topic Topic name
     * @param callback Callback function
     * @return Subscription handle for unsubscribing
     */
    SubscriptionPtr subscribe(const std::string& topic, Callback callback) {
        std::lock_guard<std::mutex> lock(m_mutex);

        uint64_t id = m_nextId++;
        auto subscription = std::make_shared<Subscription>(id, topic);

        m_subscribers[topic].push_back({id, std::move(callback), subscription});

        return subscription;
    }

    /**
     * Unsubscribe
     * @param subscription Subscription handle
     */
    void unsubscribe(const SubscriptionPtr& subscription) {
        if (!subscription) return;

        subscription->cancel();

        std::lock_guard<std::mutex> lock(m_mutex);

        auto it = m_subscribers.find(subscription->getTopic());
        if (it == m_subscribers.end()) return;

        auto& subscribers = it->second;
        subscribers.erase(
            std::remove_if(subscribers.begin(), subscribers.end(),
                [id = subscription->getId()](const SubscriberEntry& entry) {
                    return entry.id == id;
                }),
            subscribers.end()
        );
        if (subscribers.empty()) {
            m_subscribers.erase(it);
        }
    }

    /**
     * Deliver a payload to every active subscriber of a topic
     * @param topic Topic name
     * @param payload Event data
     */
    void emit(const std::string& topic, const Payload& payload) {
        std::vector<std::pair<SubscriptionPtr, Callback>> callbacks;

        {
            std::lock_guard<std::mutex> lock(m_mutex);

            auto it = m_subscribers.find(topic);
            if (it != m_subscribers.end()) {
                for (const auto& entry : it->second) {
                    if (entry.subscription->isActive()) {
                        callbacks.emplace_back(entry.subscription, entry.callback);
                    }
                }
            }
        }

        for (const auto& [subscription, callback] : callbacks) {
            if (!subscription->isActive()) continue;
            try {
                callback(payload);
            } catch (const std::exception& e) {
                LOG_ERROR("Subscriber of '{}' threw: {}", topic, e.what());
            }
        }
    }

    bool hasSubscribers(const std::string& topic) const {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_subscribers.find(topic);
        return it != m_subscribers.end() && !it->second.empty();
    }

    size_t getSubscriberCount(const std::string& topic) const {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_subscribers.find(topic);
        return it != m_subscribers.end() ? it->second.size() : 0;
    }

    /**
     * Topics that currently have at least one subscriber
     */
    std::vector<std::string> topics() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        std::vector<std::string> result;
        result.reserve(m_subscribers.size());
        for (const auto& [topic, subscribers] : m_subscribers) {
            if (!subscribers.empty()) {
                result.push_back(topic);
            }
        }
        return result;
    }

    void clear() {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (auto& [topic, subscribers] : m_subscribers) {
            for (auto& entry : subscribers) {
                entry.subscription->cancel();
            }
        }
        m_subscribers.clear();
    }

private:
    struct SubscriberEntry {
        uint64_t id;
        Callback callback;
        SubscriptionPtr subscription;
    };

    mutable std::mutex m_mutex;
    std::unordered_map<std::string, std::vector<SubscriberEntry>> m_subscribers;
    std::atomic<uint64_t> m_nextId{0};
};

} // namespace kitzi::core
