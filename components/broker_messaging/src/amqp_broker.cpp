// src/amqp_broker.cpp
#include "broker_messaging/amqp_broker.hpp"
#include <amqp_tcp_socket.h>
#include <poll.h>
#include <sys/time.h>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace broker_messaging {

namespace {

constexpr int kReaderPollMs = 100;
constexpr int kMaxFramesPerDrain = 256;
constexpr uint16_t kAccessRefused = 403;

std::string bytesToString(const amqp_bytes_t& bytes) {
    if (bytes.len == 0 || bytes.bytes == nullptr) {
        return std::string();
    }
    return std::string(static_cast<const char*>(bytes.bytes), bytes.len);
}

amqp_bytes_t stringBytes(const std::string& value) {
    amqp_bytes_t bytes;
    bytes.len = value.size();
    bytes.bytes = const_cast<char*>(value.data());
    return bytes;
}

timeval toTimeval(std::chrono::milliseconds duration) {
    timeval tv;
    tv.tv_sec = static_cast<long>(duration.count() / 1000);
    tv.tv_usec = static_cast<long>((duration.count() % 1000) * 1000);
    return tv;
}

nlohmann::json fieldToJson(const amqp_field_value_t& field);

nlohmann::json tableToJson(const amqp_table_t& table) {
    nlohmann::json object = nlohmann::json::object();
    for (int i = 0; i < table.num_entries; ++i) {
        object[bytesToString(table.entries[i].key)] = fieldToJson(table.entries[i].value);
    }
    return object;
}

nlohmann::json fieldToJson(const amqp_field_value_t& field) {
    switch (field.kind) {
        case AMQP_FIELD_KIND_BOOLEAN: return field.value.boolean != 0;
        case AMQP_FIELD_KIND_I8: return field.value.i8;
        case AMQP_FIELD_KIND_U8: return field.value.u8;
        case AMQP_FIELD_KIND_I16: return field.value.i16;
        case AMQP_FIELD_KIND_U16: return field.value.u16;
        case AMQP_FIELD_KIND_I32: return field.value.i32;
        case AMQP_FIELD_KIND_U32: return field.value.u32;
        case AMQP_FIELD_KIND_I64: return field.value.i64;
        case AMQP_FIELD_KIND_U64: return field.value.u64;
        case AMQP_FIELD_KIND_TIMESTAMP: return field.value.u64;
        case AMQP_FIELD_KIND_F32: return field.value.f32;
        case AMQP_FIELD_KIND_F64: return field.value.f64;
        case AMQP_FIELD_KIND_UTF8:
        case AMQP_FIELD_KIND_BYTES:
            return bytesToString(field.value.bytes);
        case AMQP_FIELD_KIND_TABLE:
            return tableToJson(field.value.table);
        case AMQP_FIELD_KIND_ARRAY: {
            nlohmann::json array = nlohmann::json::array();
            for (int i = 0; i < field.value.array.num_entries; ++i) {
                array.push_back(fieldToJson(field.value.array.entries[i]));
            }
            return array;
        }
        default:
            return nullptr;
    }
}

std::string fieldToString(const amqp_field_value_t& field) {
    if (field.kind == AMQP_FIELD_KIND_UTF8 || field.kind == AMQP_FIELD_KIND_BYTES) {
        return bytesToString(field.value.bytes);
    }
    auto value = fieldToJson(field);
    return value.is_null() ? std::string() : value.dump();
}

void extractProperties(const amqp_basic_properties_t& properties, Message& message) {
    if (properties._flags & AMQP_BASIC_CONTENT_TYPE_FLAG) {
        message.setContentType(bytesToString(properties.content_type));
    }
    if (properties._flags & AMQP_BASIC_MESSAGE_ID_FLAG) {
        message.setMessageId(bytesToString(properties.message_id));
    }
    if (properties._flags & AMQP_BASIC_CORRELATION_ID_FLAG) {
        message.setCorrelationId(bytesToString(properties.correlation_id));
    }
    if (properties._flags & AMQP_BASIC_TIMESTAMP_FLAG) {
        message.setTimestamp(std::chrono::system_clock::time_point(
            std::chrono::seconds(static_cast<int64_t>(properties.timestamp))));
    }
    if (properties._flags & AMQP_BASIC_DELIVERY_MODE_FLAG) {
        message.setPersistent(properties.delivery_mode == AMQP_DELIVERY_PERSISTENT);
    }
    if (properties._flags & AMQP_BASIC_HEADERS_FLAG) {
        message.setHeaders(amqpTableToHeaders(properties.headers));
    }
}

} // namespace

// AmqpConnectionFactory

std::shared_ptr<IBrokerConnection> AmqpConnectionFactory::connect(const ConnectionConfig& config) {
    amqp_connection_state_t state = amqp_new_connection();
    if (!state) {
        throw ConnectionException("Failed to allocate AMQP connection");
    }

    amqp_socket_t* socket = amqp_tcp_socket_new(state);
    if (!socket) {
        amqp_destroy_connection(state);
        throw ConnectionException("Failed to create TCP socket");
    }

    timeval timeout = toTimeval(config.connectionTimeout);
    int status = amqp_socket_open_noblock(socket, config.host.c_str(), config.port, &timeout);
    if (status != AMQP_STATUS_OK) {
        amqp_destroy_connection(state);
        throw ConnectionException("Failed to open socket to " + config.host + ":" +
                                  std::to_string(config.port) + ": " + amqpErrorToString(status));
    }

    // Capabilities so the broker reports blocking, consumer cancellation and
    // refused logins instead of dropping the socket
    amqp_table_entry_t capabilityEntries[3];
    const char* capabilityNames[3] = {"connection.blocked", "consumer_cancel_notify",
                                      "authentication_failure_close"};
    for (int i = 0; i < 3; ++i) {
        capabilityEntries[i].key = amqp_cstring_bytes(capabilityNames[i]);
        capabilityEntries[i].value.kind = AMQP_FIELD_KIND_BOOLEAN;
        capabilityEntries[i].value.value.boolean = 1;
    }

    std::string connectionName = config.connectionName.empty() ? "broker_messaging" : config.connectionName;
    amqp_table_entry_t propertyEntries[2];
    propertyEntries[0].key = amqp_cstring_bytes("capabilities");
    propertyEntries[0].value.kind = AMQP_FIELD_KIND_TABLE;
    propertyEntries[0].value.value.table.num_entries = 3;
    propertyEntries[0].value.value.table.entries = capabilityEntries;
    propertyEntries[1].key = amqp_cstring_bytes("connection_name");
    propertyEntries[1].value.kind = AMQP_FIELD_KIND_UTF8;
    propertyEntries[1].value.value.bytes = stringBytes(connectionName);

    amqp_table_t clientProperties;
    clientProperties.num_entries = 2;
    clientProperties.entries = propertyEntries;

    amqp_rpc_reply_t reply = amqp_login_with_properties(
        state,
        config.vhost.c_str(),
        config.channelMax,
        static_cast<int>(config.frameMax),
        static_cast<int>(config.heartbeat.count()),
        &clientProperties,
        AMQP_SASL_METHOD_PLAIN,
        config.username.c_str(),
        config.password.c_str());

    if (reply.reply_type != AMQP_RESPONSE_NORMAL) {
        std::string error = describeReply(reply);
        bool authFailure = isAuthenticationFailure(reply);
        if (reply.reply_type == AMQP_RESPONSE_SERVER_EXCEPTION &&
            reply.reply.id == AMQP_CONNECTION_CLOSE_METHOD) {
            amqp_connection_close_ok_t closeOk;
            amqp_send_method(state, 0, AMQP_CONNECTION_CLOSE_OK_METHOD, &closeOk);
        }
        amqp_destroy_connection(state);

        if (authFailure) {
            throw AuthenticationException("Login refused for user '" + config.username + "': " + error);
        }
        throw ConnectionException("Login to " + config.host + ":" + std::to_string(config.port) +
                                  " failed: " + error);
    }

    auto connection = std::make_shared<AmqpConnection>(state, config);
    connection->start();
    return connection;
}

// AmqpConnection

AmqpConnection::AmqpConnection(amqp_connection_state_t state, const ConnectionConfig& config)
    : state_(state), config_(config) {
    spdlog::debug("AMQP connection to {}:{} established", config_.host, config_.port);
}

AmqpConnection::~AmqpConnection() {
    close();
}

void AmqpConnection::start() {
    if (running_.exchange(true)) {
        return;
    }
    reader_ = std::thread(&AmqpConnection::readerLoop, this);
}

bool AmqpConnection::isOpen() const {
    return open_ && !closing_;
}

std::shared_ptr<IBrokerChannel> AmqpConnection::openChannel() {
    if (!isOpen()) {
        throw ChannelException("Cannot open channel: connection is closed");
    }

    std::shared_ptr<AmqpChannel> channel;
    std::vector<std::shared_ptr<AmqpChannel>> doomed;
    {
        std::lock_guard<std::mutex> io(ioMutex_);
        if (!open_) {
            throw ChannelException("Cannot open channel: connection is closed");
        }

        uint16_t id = 0;
        {
            std::lock_guard<std::mutex> lock(channelsMutex_);
            int limit = amqp_get_channel_max(state_);
            if (limit <= 0) {
                limit = 65535;
            }
            for (int tries = 0; tries < limit; ++tries) {
                uint16_t candidate = nextChannelId_;
                nextChannelId_ = static_cast<uint16_t>(candidate >= limit ? 1 : candidate + 1);
                auto it = channels_.find(candidate);
                if (it == channels_.end() || it->second.expired()) {
                    id = candidate;
                    break;
                }
            }
        }
        if (id == 0) {
            throw ChannelException("No free channel ids on connection");
        }

        amqp_channel_open(state_, id);
        Result<void> opened = checkReply(amqp_get_rpc_reply(state_), id, "channel.open");
        amqp_maybe_release_buffers_on_channel(state_, id);
        doomed.swap(graveyard_);
        if (!opened) {
            throw ChannelException(opened.message);
        }

        channel = std::make_shared<AmqpChannel>(shared_from_this(), id);
        std::lock_guard<std::mutex> lock(channelsMutex_);
        channels_[id] = channel;
    }

    spdlog::debug("Opened AMQP channel {}", channel->getId());
    return channel;
}

void AmqpConnection::setObserver(std::weak_ptr<IConnectionObserver> observer) {
    std::lock_guard<std::mutex> lock(observerMutex_);
    observer_ = std::move(observer);
}

void AmqpConnection::close() {
    if (closing_.exchange(true)) {
        return;
    }

    running_ = false;
    if (reader_.joinable()) {
        if (reader_.get_id() == std::this_thread::get_id()) {
            reader_.detach();
        } else {
            reader_.join();
        }
    }

    std::vector<std::shared_ptr<AmqpChannel>> doomed;
    {
        std::lock_guard<std::mutex> io(ioMutex_);
        if (state_) {
            if (open_) {
                amqp_rpc_reply_t reply = amqp_connection_close(state_, AMQP_REPLY_SUCCESS);
                if (reply.reply_type != AMQP_RESPONSE_NORMAL) {
                    spdlog::debug("Tried to close connection: {}", describeReply(reply));
                }
            }
            failConnection("closed by application");
            int status = amqp_destroy_connection(state_);
            if (status != AMQP_STATUS_OK) {
                spdlog::debug("Tried to destroy connection: {}", amqpErrorToString(status));
            }
            state_ = nullptr;
        }
        doomed.swap(graveyard_);
    }

    spdlog::debug("AMQP connection to {}:{} closed", config_.host, config_.port);
}

void AmqpConnection::readerLoop() {
    while (running_) {
        bool pending = false;
        int fd = -1;
        {
            std::lock_guard<std::mutex> io(ioMutex_);
            if (!open_ || !state_) {
                break;
            }
            pending = amqp_frames_enqueued(state_) || amqp_data_in_buffer(state_);
            fd = amqp_get_sockfd(state_);
        }

        if (!pending && fd >= 0) {
            pollfd pfd;
            pfd.fd = fd;
            pfd.events = POLLIN;
            pfd.revents = 0;
            int rc = ::poll(&pfd, 1, kReaderPollMs);
            if (rc < 0 && errno != EINTR) {
                std::lock_guard<std::mutex> io(ioMutex_);
                failConnection(std::string("poll failed: ") + std::strerror(errno));
                break;
            }
        }

        // Drain even on poll timeout so rabbitmq-c can send heartbeats
        std::vector<Event> events;
        bool healthy = drainFrames(events);
        dispatchEvents(events);
        if (!healthy) {
            break;
        }
    }

    if (!closing_ && !shutdownReported_.exchange(true)) {
        std::string reason;
        {
            std::lock_guard<std::mutex> io(ioMutex_);
            reason = lostReason_.empty() ? "connection lost" : lostReason_;
        }
        spdlog::warn("AMQP connection to {}:{} shut down: {}", config_.host, config_.port, reason);
        dispatchEvents({Event{EventKind::Shutdown, reason}});
    }
}

bool AmqpConnection::drainFrames(std::vector<Event>& events) {
    std::vector<std::shared_ptr<AmqpChannel>> doomed;
    bool healthy = true;
    {
        std::lock_guard<std::mutex> io(ioMutex_);
        if (!open_ || !state_) {
            return false;
        }

        timeval immediate{0, 0};
        for (int i = 0; i < kMaxFramesPerDrain; ++i) {
            amqp_frame_t frame;
            int status = amqp_simple_wait_frame_noblock(state_, &frame, &immediate);
            if (status == AMQP_STATUS_TIMEOUT) {
                break;
            }
            if (status != AMQP_STATUS_OK) {
                failConnection(amqpErrorToString(status));
                healthy = false;
                break;
            }
            handleFrame(frame, events);
            if (!open_) {
                healthy = false;
                break;
            }
        }

        if (state_) {
            amqp_maybe_release_buffers(state_);
        }
        doomed.swap(graveyard_);
    }
    return healthy;
}

void AmqpConnection::handleFrame(const amqp_frame_t& frame, std::vector<Event>& events) {
    if (frame.channel == 0) {
        if (frame.frame_type != AMQP_FRAME_METHOD) {
            return;
        }
        switch (frame.payload.method.id) {
            case AMQP_CONNECTION_CLOSE_METHOD: {
                auto* close = static_cast<amqp_connection_close_t*>(frame.payload.method.decoded);
                std::string reason = "server connection error " + std::to_string(close->reply_code) +
                                     ", message: " + bytesToString(close->reply_text);
                amqp_connection_close_ok_t closeOk;
                amqp_send_method(state_, 0, AMQP_CONNECTION_CLOSE_OK_METHOD, &closeOk);
                failConnection(reason);
                break;
            }
            case AMQP_CONNECTION_BLOCKED_METHOD: {
                auto* blocked = static_cast<amqp_connection_blocked_t*>(frame.payload.method.decoded);
                events.push_back(Event{EventKind::Blocked, bytesToString(blocked->reason)});
                break;
            }
            case AMQP_CONNECTION_UNBLOCKED_METHOD:
                events.push_back(Event{EventKind::Unblocked, ""});
                break;
            default:
                spdlog::debug("Ignoring connection method 0x{:08x}", frame.payload.method.id);
                break;
        }
        return;
    }

    auto channel = findChannel(frame.channel);
    if (!channel) {
        return;
    }
    graveyard_.push_back(channel);

    switch (frame.frame_type) {
        case AMQP_FRAME_METHOD:
            switch (frame.payload.method.id) {
                case AMQP_BASIC_DELIVER_METHOD:
                    channel->onDeliver(*static_cast<amqp_basic_deliver_t*>(frame.payload.method.decoded));
                    break;
                case AMQP_BASIC_ACK_METHOD: {
                    auto* ack = static_cast<amqp_basic_ack_t*>(frame.payload.method.decoded);
                    channel->onConfirm(ack->delivery_tag, ack->multiple != 0, ConfirmStatus::Ack);
                    break;
                }
                case AMQP_BASIC_NACK_METHOD: {
                    auto* nack = static_cast<amqp_basic_nack_t*>(frame.payload.method.decoded);
                    channel->onConfirm(nack->delivery_tag, nack->multiple != 0, ConfirmStatus::Nack);
                    break;
                }
                case AMQP_BASIC_RETURN_METHOD: {
                    auto* returned = static_cast<amqp_basic_return_t*>(frame.payload.method.decoded);
                    spdlog::warn("Broker returned message on channel {}: {} {} (routing key '{}')",
                                 frame.channel, returned->reply_code, bytesToString(returned->reply_text),
                                 bytesToString(returned->routing_key));
                    break;
                }
                case AMQP_BASIC_CANCEL_METHOD:
                    channel->markClosed("consumer cancelled by broker", false);
                    break;
                case AMQP_CHANNEL_CLOSE_METHOD: {
                    auto* close = static_cast<amqp_channel_close_t*>(frame.payload.method.decoded);
                    std::string reason = "server channel error " + std::to_string(close->reply_code) +
                                         ", message: " + bytesToString(close->reply_text);
                    amqp_channel_close_ok_t closeOk;
                    amqp_send_method(state_, frame.channel, AMQP_CHANNEL_CLOSE_OK_METHOD, &closeOk);
                    spdlog::warn("Channel {} closed by broker: {}", frame.channel, reason);
                    channel->markClosed(reason, true);
                    break;
                }
                default:
                    break;
            }
            break;
        case AMQP_FRAME_HEADER:
            channel->onHeader(*static_cast<amqp_basic_properties_t*>(frame.payload.properties.decoded),
                              frame.payload.properties.body_size);
            break;
        case AMQP_FRAME_BODY:
            channel->onBody(frame.payload.body_fragment);
            break;
        default:
            break;
    }
}

void AmqpConnection::dispatchEvents(const std::vector<Event>& events) {
    if (events.empty()) {
        return;
    }

    std::shared_ptr<IConnectionObserver> observer;
    {
        std::lock_guard<std::mutex> lock(observerMutex_);
        observer = observer_.lock();
    }
    if (!observer) {
        return;
    }

    for (const auto& event : events) {
        switch (event.kind) {
            case EventKind::Blocked:
                observer->onBlocked(event.reason);
                break;
            case EventKind::Unblocked:
                observer->onUnblocked();
                break;
            case EventKind::Shutdown:
                observer->onShutdown(event.reason, false);
                break;
        }
    }
}

Result<void> AmqpConnection::checkReply(const amqp_rpc_reply_t& reply, uint16_t channelId,
                                        const std::string& context) {
    if (reply.reply_type == AMQP_RESPONSE_NORMAL) {
        return Result<void>();
    }

    std::string error = context + ": " + describeReply(reply);

    if (reply.reply_type == AMQP_RESPONSE_SERVER_EXCEPTION) {
        if (reply.reply.id == AMQP_CHANNEL_CLOSE_METHOD) {
            amqp_channel_close_ok_t closeOk;
            amqp_send_method(state_, channelId, AMQP_CHANNEL_CLOSE_OK_METHOD, &closeOk);
            if (auto channel = findChannel(channelId)) {
                graveyard_.push_back(channel);
                channel->markClosed(error, true);
            }
            return Result<void>(ErrorType::ChannelError, error);
        }
        if (reply.reply.id == AMQP_CONNECTION_CLOSE_METHOD) {
            amqp_connection_close_ok_t closeOk;
            amqp_send_method(state_, 0, AMQP_CONNECTION_CLOSE_OK_METHOD, &closeOk);
            failConnection(error);
            return Result<void>(ErrorType::ConnectionError, error);
        }
        return Result<void>(ErrorType::ProtocolError, error);
    }

    if (reply.reply_type == AMQP_RESPONSE_LIBRARY_EXCEPTION) {
        ErrorType type = amqpErrorToErrorType(reply.library_error);
        if (type == ErrorType::NetworkError || type == ErrorType::ConnectionError ||
            reply.library_error == AMQP_STATUS_HEARTBEAT_TIMEOUT) {
            failConnection(error);
        }
        return Result<void>(type, error);
    }

    return Result<void>(ErrorType::ProtocolError, error);
}

void AmqpConnection::failConnection(const std::string& reason) {
    if (open_.exchange(false)) {
        lostReason_ = reason;
    }

    std::lock_guard<std::mutex> lock(channelsMutex_);
    for (auto& entry : channels_) {
        if (auto channel = entry.second.lock()) {
            graveyard_.push_back(channel);
            channel->markClosed(reason, true);
        }
    }
    channels_.clear();
}

std::shared_ptr<AmqpChannel> AmqpConnection::findChannel(uint16_t id) {
    std::lock_guard<std::mutex> lock(channelsMutex_);
    auto it = channels_.find(id);
    if (it == channels_.end()) {
        return nullptr;
    }
    return it->second.lock();
}

void AmqpConnection::forgetChannel(uint16_t id) {
    std::lock_guard<std::mutex> lock(channelsMutex_);
    auto it = channels_.find(id);
    if (it != channels_.end() && it->second.expired()) {
        channels_.erase(it);
    }
}

// AmqpChannel

AmqpChannel::AmqpChannel(std::weak_ptr<AmqpConnection> connection, uint16_t id)
    : connection_(std::move(connection)), id_(id) {}

AmqpChannel::~AmqpChannel() {
    close();
}

bool AmqpChannel::isOpen() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return open_;
}

template<typename Call>
Result<void> AmqpChannel::rpc(const std::string& context, Call&& call) {
    auto connection = connection_.lock();
    if (!connection) {
        return Result<void>(ErrorType::ChannelError, context + ": connection released");
    }
    if (!isOpen()) {
        return Result<void>(ErrorType::ChannelError, context + ": channel " + std::to_string(id_) + " is closed");
    }

    std::vector<std::shared_ptr<AmqpChannel>> doomed;
    Result<void> result;
    {
        std::lock_guard<std::mutex> io(connection->ioMutex_);
        if (!connection->open_ || !connection->state_) {
            return Result<void>(ErrorType::ConnectionError, context + ": connection is closed");
        }
        call(connection->state_);
        result = connection->checkReply(amqp_get_rpc_reply(connection->state_), id_, context);
        amqp_maybe_release_buffers_on_channel(connection->state_, id_);
        doomed.swap(connection->graveyard_);
    }
    return result;
}

Result<void> AmqpChannel::declareExchange(const ExchangeDeclaration& exchange) {
    std::string type = exchangeTypeToString(exchange.type);
    return rpc("exchange.declare " + exchange.name, [&](amqp_connection_state_t state) {
        amqp_exchange_declare(state, id_,
                              stringBytes(exchange.name),
                              stringBytes(type),
                              0,
                              exchange.durable ? 1 : 0,
                              exchange.autoDelete ? 1 : 0,
                              0,
                              amqp_empty_table);
    });
}

Result<void> AmqpChannel::declareQueue(const QueueDeclaration& queue) {
    amqp_table_entry_t entries[2];
    int count = 0;
    if (!queue.deadLetterExchange.empty()) {
        entries[count].key = amqp_cstring_bytes("x-dead-letter-exchange");
        entries[count].value.kind = AMQP_FIELD_KIND_UTF8;
        entries[count].value.value.bytes = stringBytes(queue.deadLetterExchange);
        ++count;
    }
    if (queue.messageTtl.count() > 0) {
        entries[count].key = amqp_cstring_bytes("x-message-ttl");
        entries[count].value.kind = AMQP_FIELD_KIND_I32;
        entries[count].value.value.i32 = static_cast<int32_t>(queue.messageTtl.count());
        ++count;
    }
    amqp_table_t arguments;
    arguments.num_entries = count;
    arguments.entries = count > 0 ? entries : nullptr;

    return rpc("queue.declare " + queue.name, [&](amqp_connection_state_t state) {
        amqp_queue_declare(state, id_,
                           stringBytes(queue.name),
                           0,
                           queue.durable ? 1 : 0,
                           queue.exclusive ? 1 : 0,
                           queue.autoDelete ? 1 : 0,
                           arguments);
    });
}

Result<void> AmqpChannel::bindQueue(const std::string& queue, const std::string& exchange,
                                    const std::string& routingKey) {
    return rpc("queue.bind " + queue + " -> " + exchange + " (" + routingKey + ")",
               [&](amqp_connection_state_t state) {
        amqp_queue_bind(state, id_, stringBytes(queue), stringBytes(exchange),
                        stringBytes(routingKey), amqp_empty_table);
    });
}

Result<void> AmqpChannel::setQos(uint16_t prefetchCount) {
    return rpc("basic.qos", [&](amqp_connection_state_t state) {
        amqp_basic_qos(state, id_, 0, prefetchCount, 0);
    });
}

Result<void> AmqpChannel::enableConfirms() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (confirmsEnabled_) {
            return Result<void>();
        }
    }

    auto result = rpc("confirm.select", [&](amqp_connection_state_t state) {
        amqp_confirm_select(state, id_);
    });
    if (result) {
        std::lock_guard<std::mutex> lock(mutex_);
        confirmsEnabled_ = true;
    }
    return result;
}

Result<uint64_t> AmqpChannel::publish(const std::string& exchange, const Message& message) {
    auto connection = connection_.lock();
    if (!connection || !isOpen()) {
        return Result<uint64_t>(ErrorType::ChannelError, "Channel " + std::to_string(id_) + " is closed");
    }

    // Header strings must outlive the publish call
    std::vector<amqp_table_entry_t> headerEntries;
    headerEntries.reserve(message.getHeaders().size());
    for (const auto& header : message.getHeaders()) {
        amqp_table_entry_t entry;
        entry.key = stringBytes(header.first);
        entry.value.kind = AMQP_FIELD_KIND_UTF8;
        entry.value.value.bytes = stringBytes(header.second);
        headerEntries.push_back(entry);
    }

    amqp_basic_properties_t properties;
    std::memset(&properties, 0, sizeof(properties));
    properties._flags = AMQP_BASIC_CONTENT_TYPE_FLAG | AMQP_BASIC_DELIVERY_MODE_FLAG;
    properties.content_type = stringBytes(message.getContentType());
    properties.delivery_mode = message.isPersistent() ? AMQP_DELIVERY_PERSISTENT : AMQP_DELIVERY_NONPERSISTENT;
    if (!message.getMessageId().empty()) {
        properties._flags |= AMQP_BASIC_MESSAGE_ID_FLAG;
        properties.message_id = stringBytes(message.getMessageId());
    }
    if (!message.getCorrelationId().empty()) {
        properties._flags |= AMQP_BASIC_CORRELATION_ID_FLAG;
        properties.correlation_id = stringBytes(message.getCorrelationId());
    }
    if (message.getTimestamp().time_since_epoch().count() != 0) {
        properties._flags |= AMQP_BASIC_TIMESTAMP_FLAG;
        properties.timestamp = static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::seconds>(
            message.getTimestamp().time_since_epoch()).count());
    }
    if (!headerEntries.empty()) {
        properties._flags |= AMQP_BASIC_HEADERS_FLAG;
        properties.headers.num_entries = static_cast<int>(headerEntries.size());
        properties.headers.entries = headerEntries.data();
    }

    amqp_bytes_t body;
    body.len = message.getPayload().size();
    body.bytes = const_cast<uint8_t*>(message.getPayload().data());

    std::vector<std::shared_ptr<AmqpChannel>> doomed;
    std::lock_guard<std::mutex> io(connection->ioMutex_);
    if (!connection->open_ || !connection->state_) {
        return Result<uint64_t>(ErrorType::ConnectionError, "Connection is closed");
    }

    // Sequence numbers must follow the order frames hit the wire
    uint64_t sequence = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!open_) {
            return Result<uint64_t>(ErrorType::ChannelError, "Channel " + std::to_string(id_) + " is closed");
        }
        if (confirmsEnabled_) {
            sequence = ++publishSequence_;
            pendingConfirms_.insert(sequence);
        }
    }

    int status = amqp_basic_publish(connection->state_, id_,
                                    stringBytes(exchange),
                                    stringBytes(message.getRoutingKey()),
                                    0, 0, &properties, body);
    if (status != AMQP_STATUS_OK) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            pendingConfirms_.erase(sequence);
        }
        ErrorType type = amqpErrorToErrorType(status);
        if (type == ErrorType::NetworkError || type == ErrorType::ConnectionError) {
            connection->failConnection("publish failed: " + amqpErrorToString(status));
        }
        doomed.swap(connection->graveyard_);
        return Result<uint64_t>(type, "basic.publish failed: " + amqpErrorToString(status));
    }

    return Result<uint64_t>(sequence);
}

ConfirmStatus AmqpChannel::waitForConfirm(uint64_t sequenceNumber, std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!confirmsEnabled_ || sequenceNumber == 0) {
        return ConfirmStatus::Ack;
    }

    cv_.wait_for(lock, timeout, [&] {
        return confirmed_.count(sequenceNumber) > 0 || !open_;
    });

    auto it = confirmed_.find(sequenceNumber);
    if (it != confirmed_.end()) {
        ConfirmStatus status = it->second;
        confirmed_.erase(it);
        return status;
    }

    pendingConfirms_.erase(sequenceNumber);
    return open_ ? ConfirmStatus::Timeout : ConfirmStatus::ChannelClosed;
}

Result<std::string> AmqpChannel::consume(const std::string& queue, const std::string& consumerTag) {
    std::string assignedTag;
    auto result = rpc("basic.consume " + queue, [&](amqp_connection_state_t state) {
        amqp_basic_consume_ok_t* ok = amqp_basic_consume(state, id_,
                                                         stringBytes(queue),
                                                         consumerTag.empty() ? amqp_empty_bytes : stringBytes(consumerTag),
                                                         0, 0, 0,
                                                         amqp_empty_table);
        if (ok) {
            assignedTag = bytesToString(ok->consumer_tag);
        }
    });
    if (!result) {
        return Result<std::string>(result.error, result.message);
    }
    return Result<std::string>(assignedTag);
}

Result<void> AmqpChannel::cancel(const std::string& consumerTag) {
    return rpc("basic.cancel " + consumerTag, [&](amqp_connection_state_t state) {
        amqp_basic_cancel(state, id_, stringBytes(consumerTag));
    });
}

std::optional<InboundDelivery> AmqpChannel::nextDelivery(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_for(lock, timeout, [&] { return !deliveries_.empty() || !open_; });
    if (deliveries_.empty()) {
        return std::nullopt;
    }
    InboundDelivery delivery = std::move(deliveries_.front());
    deliveries_.pop_front();
    return delivery;
}

Result<void> AmqpChannel::settle(const std::string& context, int status) {
    if (status == AMQP_STATUS_OK) {
        return Result<void>();
    }
    return Result<void>(amqpErrorToErrorType(status), context + " failed: " + amqpErrorToString(status));
}

Result<void> AmqpChannel::ack(uint64_t deliveryTag) {
    auto connection = connection_.lock();
    if (!connection || !isOpen()) {
        return Result<void>(ErrorType::ChannelError, "basic.ack: channel is closed");
    }
    std::lock_guard<std::mutex> io(connection->ioMutex_);
    if (!connection->open_ || !connection->state_) {
        return Result<void>(ErrorType::ConnectionError, "basic.ack: connection is closed");
    }
    return settle("basic.ack", amqp_basic_ack(connection->state_, id_, deliveryTag, 0));
}

Result<void> AmqpChannel::nack(uint64_t deliveryTag, bool requeue) {
    auto connection = connection_.lock();
    if (!connection || !isOpen()) {
        return Result<void>(ErrorType::ChannelError, "basic.nack: channel is closed");
    }
    std::lock_guard<std::mutex> io(connection->ioMutex_);
    if (!connection->open_ || !connection->state_) {
        return Result<void>(ErrorType::ConnectionError, "basic.nack: connection is closed");
    }
    return settle("basic.nack", amqp_basic_nack(connection->state_, id_, deliveryTag, 0, requeue ? 1 : 0));
}

Result<void> AmqpChannel::reject(uint64_t deliveryTag, bool requeue) {
    auto connection = connection_.lock();
    if (!connection || !isOpen()) {
        return Result<void>(ErrorType::ChannelError, "basic.reject: channel is closed");
    }
    std::lock_guard<std::mutex> io(connection->ioMutex_);
    if (!connection->open_ || !connection->state_) {
        return Result<void>(ErrorType::ConnectionError, "basic.reject: connection is closed");
    }
    return settle("basic.reject", amqp_basic_reject(connection->state_, id_, deliveryTag, requeue ? 1 : 0));
}

void AmqpChannel::close() {
    bool needsBrokerClose = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        needsBrokerClose = !brokerSideClosed_;
        open_ = false;
        brokerSideClosed_ = true;
        if (closeReason_.empty()) {
            closeReason_ = "closed by application";
        }
    }
    cv_.notify_all();

    auto connection = connection_.lock();
    if (!connection) {
        return;
    }

    if (needsBrokerClose) {
        std::lock_guard<std::mutex> io(connection->ioMutex_);
        if (connection->open_ && connection->state_) {
            amqp_rpc_reply_t reply = amqp_channel_close(connection->state_, id_, AMQP_REPLY_SUCCESS);
            if (reply.reply_type != AMQP_RESPONSE_NORMAL) {
                spdlog::debug("Tried to close channel {}: {}", id_, describeReply(reply));
            }
            amqp_maybe_release_buffers_on_channel(connection->state_, id_);
        }
    }
    connection->forgetChannel(id_);
}

void AmqpChannel::onDeliver(const amqp_basic_deliver_t& deliver) {
    assembly_ = Assembly();
    assembly_.active = true;
    assembly_.delivery.deliveryTag = deliver.delivery_tag;
    assembly_.delivery.consumerTag = bytesToString(deliver.consumer_tag);

    Message& message = assembly_.delivery.message;
    message.setRoutingKey(bytesToString(deliver.routing_key));
    message.setExchange(bytesToString(deliver.exchange));
    message.setRedelivered(deliver.redelivered != 0);
    message.setDeliveryTag(deliver.delivery_tag);
}

void AmqpChannel::onHeader(const amqp_basic_properties_t& properties, uint64_t bodySize) {
    if (!assembly_.active) {
        return;
    }
    extractProperties(properties, assembly_.delivery.message);
    assembly_.bodySize = bodySize;
    assembly_.body.reserve(static_cast<size_t>(bodySize));
    if (bodySize == 0) {
        completeDelivery();
    }
}

void AmqpChannel::onBody(const amqp_bytes_t& fragment) {
    if (!assembly_.active) {
        return;
    }
    const auto* data = static_cast<const uint8_t*>(fragment.bytes);
    assembly_.body.insert(assembly_.body.end(), data, data + fragment.len);
    if (assembly_.body.size() >= assembly_.bodySize) {
        completeDelivery();
    }
}

void AmqpChannel::completeDelivery() {
    assembly_.delivery.message.setPayload(std::move(assembly_.body));
    {
        std::lock_guard<std::mutex> lock(mutex_);
        deliveries_.push_back(std::move(assembly_.delivery));
    }
    assembly_ = Assembly();
    cv_.notify_all();
}

void AmqpChannel::onConfirm(uint64_t deliveryTag, bool multiple, ConfirmStatus status) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (multiple) {
            auto end = pendingConfirms_.upper_bound(deliveryTag);
            for (auto it = pendingConfirms_.begin(); it != end; ++it) {
                confirmed_[*it] = status;
            }
            pendingConfirms_.erase(pendingConfirms_.begin(), end);
        } else if (pendingConfirms_.erase(deliveryTag) > 0) {
            confirmed_[deliveryTag] = status;
        }
    }
    cv_.notify_all();
}

void AmqpChannel::markClosed(const std::string& reason, bool brokerSideClosed) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        open_ = false;
        if (brokerSideClosed) {
            brokerSideClosed_ = true;
        }
        if (closeReason_.empty()) {
            closeReason_ = reason;
        }
    }
    cv_.notify_all();
}

// Utility functions

std::string amqpErrorToString(int error) {
    switch (error) {
        case AMQP_STATUS_OK: return "OK";
        case AMQP_STATUS_NO_MEMORY: return "No memory";
        case AMQP_STATUS_BAD_AMQP_DATA: return "Bad AMQP data";
        case AMQP_STATUS_UNKNOWN_CLASS: return "Unknown class";
        case AMQP_STATUS_UNKNOWN_METHOD: return "Unknown method";
        case AMQP_STATUS_HOSTNAME_RESOLUTION_FAILED: return "Hostname resolution failed";
        case AMQP_STATUS_INCOMPATIBLE_AMQP_VERSION: return "Incompatible AMQP version";
        case AMQP_STATUS_CONNECTION_CLOSED: return "Connection closed";
        case AMQP_STATUS_BAD_URL: return "Bad URL";
        case AMQP_STATUS_SOCKET_ERROR: return "Socket error";
        case AMQP_STATUS_INVALID_PARAMETER: return "Invalid parameter";
        case AMQP_STATUS_TABLE_TOO_BIG: return "Table too big";
        case AMQP_STATUS_WRONG_METHOD: return "Wrong method";
        case AMQP_STATUS_TIMEOUT: return "Timeout";
        case AMQP_STATUS_TIMER_FAILURE: return "Timer failure";
        case AMQP_STATUS_HEARTBEAT_TIMEOUT: return "Heartbeat timeout";
        case AMQP_STATUS_UNEXPECTED_STATE: return "Unexpected state";
        case AMQP_STATUS_SOCKET_CLOSED: return "Socket closed";
        case AMQP_STATUS_SOCKET_INUSE: return "Socket in use";
        case AMQP_STATUS_BROKER_UNSUPPORTED_SASL_METHOD: return "Broker unsupported SASL method";
        case AMQP_STATUS_UNSUPPORTED: return "Unsupported";
        default:
            return "Unknown error (" + std::to_string(error) + ")";
    }
}

ErrorType amqpErrorToErrorType(int error) {
    switch (error) {
        case AMQP_STATUS_OK:
            return ErrorType::None;
        case AMQP_STATUS_NO_MEMORY:
        case AMQP_STATUS_TABLE_TOO_BIG:
            return ErrorType::ResourceError;
        case AMQP_STATUS_HOSTNAME_RESOLUTION_FAILED:
        case AMQP_STATUS_SOCKET_ERROR:
        case AMQP_STATUS_SOCKET_CLOSED:
        case AMQP_STATUS_SOCKET_INUSE:
            return ErrorType::NetworkError;
        case AMQP_STATUS_CONNECTION_CLOSED:
            return ErrorType::ConnectionError;
        case AMQP_STATUS_TIMEOUT:
        case AMQP_STATUS_HEARTBEAT_TIMEOUT:
        case AMQP_STATUS_TIMER_FAILURE:
            return ErrorType::TimeoutError;
        case AMQP_STATUS_BROKER_UNSUPPORTED_SASL_METHOD:
            return ErrorType::AuthenticationError;
        default:
            return ErrorType::ProtocolError;
    }
}

std::string describeReply(const amqp_rpc_reply_t& reply) {
    switch (reply.reply_type) {
        case AMQP_RESPONSE_NORMAL:
            return "normal response";
        case AMQP_RESPONSE_NONE:
            return "missing RPC reply type";
        case AMQP_RESPONSE_LIBRARY_EXCEPTION:
            return amqp_error_string2(reply.library_error);
        case AMQP_RESPONSE_SERVER_EXCEPTION:
            switch (reply.reply.id) {
                case AMQP_CONNECTION_CLOSE_METHOD: {
                    auto* m = static_cast<amqp_connection_close_t*>(reply.reply.decoded);
                    return "server connection error " + std::to_string(m->reply_code) +
                           ", message: " + bytesToString(m->reply_text);
                }
                case AMQP_CHANNEL_CLOSE_METHOD: {
                    auto* m = static_cast<amqp_channel_close_t*>(reply.reply.decoded);
                    return "server channel error " + std::to_string(m->reply_code) +
                           ", message: " + bytesToString(m->reply_text);
                }
                default: {
                    char buf[64];
                    std::snprintf(buf, sizeof(buf), "unknown server error, method ID 0x%08X", reply.reply.id);
                    return buf;
                }
            }
        default:
            return "unknown reply type";
    }
}

bool isAuthenticationFailure(const amqp_rpc_reply_t& reply) {
    if (reply.reply_type == AMQP_RESPONSE_LIBRARY_EXCEPTION) {
        return reply.library_error == AMQP_STATUS_BROKER_UNSUPPORTED_SASL_METHOD;
    }
    if (reply.reply_type == AMQP_RESPONSE_SERVER_EXCEPTION &&
        reply.reply.id == AMQP_CONNECTION_CLOSE_METHOD && reply.reply.decoded != nullptr) {
        auto* m = static_cast<amqp_connection_close_t*>(reply.reply.decoded);
        return m->reply_code == kAccessRefused;
    }
    return false;
}

Headers amqpTableToHeaders(const amqp_table_t& table) {
    Headers result;
    for (int i = 0; i < table.num_entries; ++i) {
        result[bytesToString(table.entries[i].key)] = fieldToString(table.entries[i].value);
    }
    return result;
}

} // namespace broker_messaging
