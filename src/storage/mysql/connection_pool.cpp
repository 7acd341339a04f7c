#include "storage/mysql/connection_pool.hpp"

#include "common/logger.hpp"
#include "storage/mysql/mysql_utils.hpp"

#include <chrono>

namespace quota {
namespace storage {

ConnectionPool::ConnectionPool(Options options): options_(std::move(options)) {}

ConnectionPool::Lease::Lease(ConnectionPool* pool, std::unique_ptr<Connection> connection)
    : pool_(pool), connection_(std::move(connection)) {}

ConnectionPool::Lease::Lease(Lease&& other) noexcept
    : pool_(other.pool_), connection_(std::move(other.connection_)) {
    other.pool_ = nullptr;
}

ConnectionPool::Lease& ConnectionPool::Lease::operator=(Lease&& other) noexcept {
    if (this != &other) {
        Release();
        pool_ = other.pool_;
        connection_ = std::move(other.connection_);
        other.pool_ = nullptr;
    }
    return *this;
}

ConnectionPool::Lease::~Lease() {
    Release();
}

void ConnectionPool::Lease::Release() noexcept {
    if (pool_ && connection_) {
        pool_->Return(std::move(connection_));
    }
    pool_ = nullptr;
}

void ConnectionPool::Lease::CheckHealth() noexcept {
    if (connection_ && IsConnectionLost(mysql_errno(connection_->Raw()))) {
        connection_->MarkBroken();
    }
}

quota::common::StatusOr<ConnectionPool::Lease> ConnectionPool::Acquire() {
    std::unique_ptr<Connection> connection;
    {
        std::unique_lock<std::mutex> lock(mutex_);
        if (idle_.empty() && total_connections_ < options_.pool_size) {
            // 未达上限: 在锁外建立新连接
            ++total_connections_;
            lock.unlock();
            auto created = Connection::Create(options_);
            if (!created.IsOk()) {
                std::lock_guard<std::mutex> guard(mutex_);
                --total_connections_;
                cv_.notify_one();
                QUOTA_LOG_WARN("[MySqlPool] connect failed: {}", created.GetStatus().Message());
                return created.GetStatus();
            }
            connection = std::move(created.Value());
        } else {
            if (!cv_.wait_for(lock, options_.acquire_timeout, [this]() {
                    return !idle_.empty() || total_connections_ < options_.pool_size;
                })) {
                return quota::common::Status::Unavailable("Acquire mysql connection timeout");
            }
            if (idle_.empty()) {
                // 有连接被丢弃, 腾出了名额
                ++total_connections_;
                lock.unlock();
                auto created = Connection::Create(options_);
                if (!created.IsOk()) {
                    std::lock_guard<std::mutex> guard(mutex_);
                    --total_connections_;
                    cv_.notify_one();
                    return created.GetStatus();
                }
                connection = std::move(created.Value());
            } else {
                connection = std::move(idle_.front());
                idle_.pop();
            }
        }
    }
    return quota::common::StatusOr<Lease>(Lease(this, std::move(connection)));
}

void ConnectionPool::Return(std::unique_ptr<Connection> connection) {
    if (connection->Broken() || mysql_ping(connection->Raw()) != 0) {
        QUOTA_LOG_WARN("[MySqlPool] dropping broken connection");
        connection.reset();
        std::lock_guard<std::mutex> lock(mutex_);
        --total_connections_;
        cv_.notify_one();
        return;
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        idle_.push(std::move(connection));
    }
    cv_.notify_one();
}

} // namespace storage
} // namespace quota
