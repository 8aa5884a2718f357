#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include "broker_messaging/broker.hpp"

namespace broker_messaging {

// One-shot settlement handle for an inbound delivery. The first ack, nack or
// reject is forwarded to the channel; every later call fails without touching it.
class DeliveryHandle {
public:
    DeliveryHandle(std::weak_ptr<IBrokerChannel> channel, uint64_t deliveryTag);

    DeliveryHandle(const DeliveryHandle&) = delete;
    DeliveryHandle& operator=(const DeliveryHandle&) = delete;

    uint64_t getDeliveryTag() const { return deliveryTag_; }
    bool isSettled() const { return settled_.load(); }

    Result<void> ack();
    Result<void> nack(bool requeue);
    Result<void> reject(bool requeue);

private:
    std::shared_ptr<IBrokerChannel> claim(Result<void>& failure);

    std::weak_ptr<IBrokerChannel> channel_;
    uint64_t deliveryTag_;
    std::atomic<bool> settled_{false};
};

} // namespace broker_messaging
