// src/connection_manager.cpp
#include "broker_messaging/connection_manager.hpp"
#include "broker_messaging/backoff.hpp"
#include <algorithm>
#include <spdlog/spdlog.h>

namespace broker_messaging {

// Forwards broker events to the manager until the manager detaches it
class ConnectionManager::Observer : public IConnectionObserver {
public:
    explicit Observer(ConnectionManager* manager) : manager_(manager) {}

    void detach() {
        std::lock_guard<std::mutex> lock(mutex_);
        manager_ = nullptr;
    }

    void onBlocked(const std::string& reason) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (manager_) {
            manager_->handleBlocked(reason);
        }
    }

    void onUnblocked() override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (manager_) {
            manager_->handleUnblocked();
        }
    }

    void onShutdown(const std::string& reason, bool initiatedByApplication) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (manager_) {
            manager_->handleShutdown(reason, initiatedByApplication);
        }
    }

private:
    std::mutex mutex_;
    ConnectionManager* manager_;
};

ConnectionManager::ConnectionManager(ConnectionConfig config, std::shared_ptr<IConnectionFactory> factory)
    : config_(std::move(config)),
      factory_(std::move(factory)),
      observer_(std::make_shared<Observer>(this)) {
    if (!factory_) {
        throw ConfigException("ConnectionManager requires a connection factory");
    }
    spdlog::debug("ConnectionManager created for {}:{}{}", config_.host, config_.port, config_.vhost);
}

ConnectionManager::~ConnectionManager() {
    close();
    observer_->detach();
}

std::shared_ptr<IBrokerConnection> ConnectionManager::getConnection() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (true) {
        if (closed_) {
            throw ConnectionException("Connection manager is closed");
        }
        if (connection_ && connection_->isOpen()) {
            return connection_;
        }
        if (!establishing_) {
            break;
        }

        // Share the outcome of the attempt already in progress
        uint64_t observed = generation_;
        cv_.wait(lock, [&] { return !establishing_ || closed_; });
        if (!closed_ && generation_ != observed && lastFailure_ &&
            !(connection_ && connection_->isOpen())) {
            std::rethrow_exception(lastFailure_);
        }
    }

    std::shared_ptr<IBrokerConnection> stale = std::move(connection_);
    establishing_ = true;
    const bool reconnecting = everConnected_;
    lock.unlock();

    if (stale) {
        stale->setObserver(std::weak_ptr<IConnectionObserver>());
        stale->close();
    }

    setState(ConnectionState::Connecting, reconnecting ? "re-establishing connection" : "establishing connection");

    std::shared_ptr<IBrokerConnection> connection;
    std::exception_ptr failure;
    std::string lastError;
    const int maxAttempts = std::max(1, config_.retry.maxAttempts);

    for (int attempt = 1; attempt <= maxAttempts; ++attempt) {
        ++connectAttempts_;
        try {
            spdlog::info("Connecting to broker {}:{} (attempt {}/{})",
                         config_.host, config_.port, attempt, maxAttempts);
            connection = factory_->connect(config_);
            break;
        } catch (const AuthenticationException& e) {
            ++failedConnects_;
            spdlog::critical("Broker refused credentials for user '{}': {}", config_.username, e.what());
            notifyError("AUTHENTICATION_FAILED", e.what());
            failure = std::current_exception();
            break;
        } catch (const std::exception& e) {
            ++failedConnects_;
            lastError = e.what();
        }

        if (attempt == maxAttempts) {
            spdlog::error("Giving up on broker {}:{} after {} attempts: {}",
                          config_.host, config_.port, maxAttempts, lastError);
            break;
        }

        auto delay = computeBackoffDelay(attempt, config_.retry);
        spdlog::warn("Connection attempt {}/{} failed: {}. Retrying in {}ms",
                     attempt, maxAttempts, lastError, delay.count());

        std::unique_lock<std::mutex> waitLock(mutex_);
        if (cv_.wait_for(waitLock, delay, [this] { return closed_; })) {
            break;
        }
    }

    if (connection) {
        connection->setObserver(observer_);
    } else if (!failure) {
        failure = std::make_exception_ptr(ConnectionException(
            "Failed to connect to " + config_.host + ":" + std::to_string(config_.port) +
            " after " + std::to_string(maxAttempts) + " attempts: " + lastError));
    }

    lock.lock();
    establishing_ = false;
    ++generation_;

    if (connection && !closed_) {
        connection_ = connection;
        everConnected_ = true;
        lastFailure_ = nullptr;
        lock.unlock();
        cv_.notify_all();

        ++successfulConnects_;
        if (reconnecting) {
            ++reconnects_;
        }
        spdlog::info("Connected to broker {}:{}{}", config_.host, config_.port, config_.vhost);
        if (connection->isOpen()) {
            setState(ConnectionState::Connected, reconnecting ? "reconnected" : "connected");
        }
        return connection;
    }

    const bool wasClosed = closed_;
    if (wasClosed) {
        failure = std::make_exception_ptr(ConnectionException("Connection manager closed while connecting"));
    }
    lastFailure_ = failure;
    lock.unlock();
    cv_.notify_all();

    if (connection) {
        connection->setObserver(std::weak_ptr<IConnectionObserver>());
        connection->close();
    }
    if (!wasClosed) {
        setState(ConnectionState::Disconnected, "connection attempts exhausted");
        if (!lastError.empty()) {
            notifyError("CONNECTION_FAILED", lastError);
        }
    }
    std::rethrow_exception(failure);
}

std::shared_ptr<IBrokerChannel> ConnectionManager::openChannel() {
    auto connection = getConnection();
    try {
        return connection->openChannel();
    } catch (const ChannelException& e) {
        if (connection->isOpen()) {
            throw;
        }
        // Connection died between getConnection() and the channel open
        spdlog::warn("Channel open failed on a lost connection, reconnecting: {}", e.what());
        return getConnection()->openChannel();
    }
}

void ConnectionManager::close() {
    std::shared_ptr<IBrokerConnection> connection;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return;
        }
        closed_ = true;
        connection = std::move(connection_);
    }
    cv_.notify_all();

    setState(ConnectionState::ShuttingDown, "close requested");

    if (connection) {
        spdlog::info("Closing broker connection to {}:{}", config_.host, config_.port);
        connection->setObserver(std::weak_ptr<IConnectionObserver>());
        connection->close();
    } else {
        spdlog::debug("ConnectionManager closed before any connection was established");
    }
}

ConnectionState ConnectionManager::getState() const {
    return state_.load();
}

bool ConnectionManager::isConnected() const {
    auto state = state_.load();
    return state == ConnectionState::Connected || state == ConnectionState::Blocked;
}

bool ConnectionManager::waitWhileBlocked(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, timeout, [this] {
        return state_.load() != ConnectionState::Blocked || closed_;
    }) && state_.load() != ConnectionState::Blocked;
}

void ConnectionManager::addStateListener(StateListener listener) {
    std::lock_guard<std::mutex> lock(callbackMutex_);
    listeners_.push_back(std::move(listener));
}

void ConnectionManager::setErrorCallback(ErrorCallback callback) {
    std::lock_guard<std::mutex> lock(callbackMutex_);
    errorCallback_ = std::move(callback);
}

ConnectionStats ConnectionManager::getStats() const {
    ConnectionStats stats;
    stats.connectAttempts = connectAttempts_.load();
    stats.successfulConnects = successfulConnects_.load();
    stats.failedConnects = failedConnects_.load();
    stats.reconnects = reconnects_.load();
    stats.blockedEpisodes = blockedEpisodes_.load();
    stats.state = state_.load();
    return stats;
}

void ConnectionManager::handleBlocked(const std::string& reason) {
    ++blockedEpisodes_;
    spdlog::warn("Broker blocked the connection: {}", reason);
    setState(ConnectionState::Blocked, reason);
}

void ConnectionManager::handleUnblocked() {
    spdlog::info("Broker unblocked the connection");
    if (state_.load() == ConnectionState::Blocked) {
        setState(ConnectionState::Connected, "unblocked");
    }
}

void ConnectionManager::handleShutdown(const std::string& reason, bool initiatedByApplication) {
    if (initiatedByApplication) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return;
        }
    }
    spdlog::warn("Broker connection shut down: {}", reason);
    setState(ConnectionState::Disconnected, reason);
    notifyError("CONNECTION_LOST", reason);
}

void ConnectionManager::setState(ConnectionState state, const std::string& reason) {
    // ShuttingDown is terminal; a connect racing close() must not leave it
    ConnectionState previous = state_.load();
    do {
        if (previous == state || previous == ConnectionState::ShuttingDown) {
            return;
        }
    } while (!state_.compare_exchange_weak(previous, state));

    spdlog::info("Connection state {} -> {} ({})",
                 connectionStateToString(previous), connectionStateToString(state), reason);

    {
        // Pairs with the predicate checks in waitWhileBlocked()
        std::lock_guard<std::mutex> lock(mutex_);
    }
    cv_.notify_all();

    std::vector<StateListener> listeners;
    {
        std::lock_guard<std::mutex> lock(callbackMutex_);
        listeners = listeners_;
    }
    for (const auto& listener : listeners) {
        try {
            listener(previous, state, reason);
        } catch (const std::exception& e) {
            spdlog::error("Connection state listener threw: {}", e.what());
        }
    }
}

void ConnectionManager::notifyError(const std::string& code, const std::string& message) {
    ErrorCallback callback;
    {
        std::lock_guard<std::mutex> lock(callbackMutex_);
        callback = errorCallback_;
    }
    if (callback) {
        callback(code, message, "ConnectionManager");
    }
}

} // namespace broker_messaging
