#include "broker_messaging/delivery.hpp"

namespace broker_messaging {

std::string confirmStatusToString(ConfirmStatus status) {
    switch (status) {
        case ConfirmStatus::Ack: return "Ack";
        case ConfirmStatus::Nack: return "Nack";
        case ConfirmStatus::Timeout: return "Timeout";
        case ConfirmStatus::ChannelClosed: return "ChannelClosed";
        default: return "Unknown";
    }
}

DeliveryHandle::DeliveryHandle(std::weak_ptr<IBrokerChannel> channel, uint64_t deliveryTag)
    : channel_(std::move(channel)), deliveryTag_(deliveryTag) {}

Result<void> DeliveryHandle::ack() {
    Result<void> failure;
    auto channel = claim(failure);
    if (!channel) {
        return failure;
    }
    return channel->ack(deliveryTag_);
}

Result<void> DeliveryHandle::nack(bool requeue) {
    Result<void> failure;
    auto channel = claim(failure);
    if (!channel) {
        return failure;
    }
    return channel->nack(deliveryTag_, requeue);
}

Result<void> DeliveryHandle::reject(bool requeue) {
    Result<void> failure;
    auto channel = claim(failure);
    if (!channel) {
        return failure;
    }
    return channel->reject(deliveryTag_, requeue);
}

std::shared_ptr<IBrokerChannel> DeliveryHandle::claim(Result<void>& failure) {
    if (settled_.exchange(true)) {
        failure = Result<void>(ErrorType::ChannelError,
                               "Delivery " + std::to_string(deliveryTag_) + " already settled");
        return nullptr;
    }

    auto channel = channel_.lock();
    if (!channel || !channel->isOpen()) {
        failure = Result<void>(ErrorType::ChannelError,
                               "Channel for delivery " + std::to_string(deliveryTag_) + " is closed");
        return nullptr;
    }
    return channel;
}

} // namespace broker_messaging
