#pragma once

#include <atomic>
#include <condition_variable>
#include <exception>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "broker_messaging/broker.hpp"
#include "broker_messaging/types.hpp"

namespace broker_messaging {

/**
 * @brief Owns the single broker connection of the process.
 *
 * The connection is established lazily on the first getConnection() call and
 * re-established after the broker drops it. Establishment retries transient
 * failures with exponential backoff; an authentication failure is fatal and is
 * surfaced immediately. Publishers and consumers borrow channels through
 * openChannel() and never keep the connection itself.
 */
class ConnectionManager {
public:
    ConnectionManager(ConnectionConfig config, std::shared_ptr<IConnectionFactory> factory);
    ~ConnectionManager();

    ConnectionManager(const ConnectionManager&) = delete;
    ConnectionManager& operator=(const ConnectionManager&) = delete;

    /**
     * @brief Return the open connection, establishing it if necessary.
     *
     * Concurrent callers arriving while an attempt is in progress wait for that
     * attempt and share its outcome.
     *
     * @throws AuthenticationException when the broker refuses the credentials
     * @throws ConnectionException when all attempts fail or the manager is closed
     */
    std::shared_ptr<IBrokerConnection> getConnection();

    // getConnection() followed by opening a channel on it
    std::shared_ptr<IBrokerChannel> openChannel();

    /**
     * @brief Release the connection if one was established.
     *
     * Interrupts an establishment backoff in progress. Calling close() on a
     * manager that never connected is a no-op.
     */
    void close();

    ConnectionState getState() const;
    bool isConnected() const;

    /**
     * @brief Wait until the broker lifts a flow-control block.
     * @return true if the connection is not blocked on return
     */
    bool waitWhileBlocked(std::chrono::milliseconds timeout);

    void addStateListener(StateListener listener);
    void setErrorCallback(ErrorCallback callback);

    ConnectionStats getStats() const;
    const ConnectionConfig& getConfig() const { return config_; }

private:
    class Observer;
    friend class Observer;

    void handleBlocked(const std::string& reason);
    void handleUnblocked();
    void handleShutdown(const std::string& reason, bool initiatedByApplication);

    // Never called with mutex_ held
    void setState(ConnectionState state, const std::string& reason);
    void notifyError(const std::string& code, const std::string& message);

    ConnectionConfig config_;
    std::shared_ptr<IConnectionFactory> factory_;
    std::shared_ptr<Observer> observer_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::shared_ptr<IBrokerConnection> connection_;
    bool establishing_{false};
    bool closed_{false};
    bool everConnected_{false};
    uint64_t generation_{0};
    std::exception_ptr lastFailure_;

    std::atomic<ConnectionState> state_{ConnectionState::Disconnected};

    mutable std::mutex callbackMutex_;
    std::vector<StateListener> listeners_;
    ErrorCallback errorCallback_;

    std::atomic<uint64_t> connectAttempts_{0};
    std::atomic<uint64_t> successfulConnects_{0};
    std::atomic<uint64_t> failedConnects_{0};
    std::atomic<uint64_t> reconnects_{0};
    std::atomic<uint64_t> blockedEpisodes_{0};
};

} // namespace broker_messaging
