/**
 * @file Channel.hpp
 * @brief Canal borné multi-producteurs / consommateur unique
 *
 * Un stream possède une paire de canaux (entrée de contextes, sortie de
 * décisions). Le canal se ferme quand le dernier Sender disparaît ou sur
 * close() explicite ; le Receiver vide alors le tampon puis reçoit nullopt.
 */

#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <utility>

namespace morphine {

/**
 * @brief Issue d'un envoi sur un canal
 */
enum class SendResult {
    SENT,
    FULL,       // tampon plein (envoi non bloquant uniquement)
    CLOSED      // canal fermé ou récepteur disparu
};

/**
 * @class Channel
 * @brief État partagé du canal (tampon + synchronisation)
 */
template <typename T>
class Channel {
public:
    explicit Channel(size_t capacity) : capacity_(capacity) {
        if (capacity_ == 0) {
            throw std::invalid_argument("Channel: capacité nulle");
        }
    }

    Channel(const Channel&) = delete;
    Channel& operator=(const Channel&) = delete;

    SendResult send(T value) {
        std::unique_lock<std::mutex> lock(mutex_);
        not_full_cv_.wait(lock, [this] { return closed_ || buffer_.size() < capacity_; });
        if (closed_) {
            return SendResult::CLOSED;
        }
        buffer_.push_back(std::move(value));
        not_empty_cv_.notify_one();
        return SendResult::SENT;
    }

    SendResult trySend(T value) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return SendResult::CLOSED;
        }
        if (buffer_.size() >= capacity_) {
            return SendResult::FULL;
        }
        buffer_.push_back(std::move(value));
        not_empty_cv_.notify_one();
        return SendResult::SENT;
    }

    std::optional<T> receive() {
        std::unique_lock<std::mutex> lock(mutex_);
        not_empty_cv_.wait(lock, [this] { return closed_ || !buffer_.empty(); });
        return popLocked();
    }

    std::optional<T> tryReceive() {
        std::lock_guard<std::mutex> lock(mutex_);
        return popLocked();
    }

    template <typename Rep, typename Period>
    std::optional<T> receiveFor(const std::chrono::duration<Rep, Period>& timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        not_empty_cv_.wait_for(lock, timeout, [this] { return closed_ || !buffer_.empty(); });
        return popLocked();
    }

    void close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        not_empty_cv_.notify_all();
        not_full_cv_.notify_all();
    }

    bool isClosed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return buffer_.size();
    }

    size_t capacity() const { return capacity_; }

    void addSender() {
        std::lock_guard<std::mutex> lock(mutex_);
        ++sender_count_;
    }

    void releaseSender() {
        bool last = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (sender_count_ > 0 && --sender_count_ == 0) {
                last = true;
            }
        }
        if (last) {
            close();
        }
    }

private:
    std::optional<T> popLocked() {
        if (buffer_.empty()) {
            return std::nullopt;
        }
        T value = std::move(buffer_.front());
        buffer_.pop_front();
        not_full_cv_.notify_one();
        return value;
    }

    const size_t capacity_;
    std::deque<T> buffer_;
    bool closed_ = false;
    size_t sender_count_ = 0;

    mutable std::mutex mutex_;
    std::condition_variable not_empty_cv_;
    std::condition_variable not_full_cv_;
};

/**
 * @class Sender
 * @brief Extrémité d'émission (copiable)
 */
template <typename T>
class Sender {
public:
    Sender() = default;

    explicit Sender(std::shared_ptr<Channel<T>> channel) : channel_(std::move(channel)) {
        if (channel_) {
            channel_->addSender();
        }
    }

    Sender(const Sender& other) : channel_(other.channel_) {
        if (channel_) {
            channel_->addSender();
        }
    }

    Sender(Sender&& other) noexcept : channel_(std::move(other.channel_)) {}

    Sender& operator=(Sender other) noexcept {
        std::swap(channel_, other.channel_);
        return *this;
    }

    ~Sender() {
        if (channel_) {
            channel_->releaseSender();
        }
    }

    SendResult send(T value) const {
        if (!channel_) return SendResult::CLOSED;
        return channel_->send(std::move(value));
    }

    SendResult trySend(T value) const {
        if (!channel_) return SendResult::CLOSED;
        return channel_->trySend(std::move(value));
    }

    /**
     * @brief Ferme le canal pour tous les émetteurs
     */
    void close() const {
        if (channel_) {
            channel_->close();
        }
    }

    bool isClosed() const { return !channel_ || channel_->isClosed(); }
    bool valid() const { return static_cast<bool>(channel_); }

private:
    std::shared_ptr<Channel<T>> channel_;
};

/**
 * @class Receiver
 * @brief Extrémité de réception (consommateur unique, déplaçable)
 */
template <typename T>
class Receiver {
public:
    Receiver() = default;
    explicit Receiver(std::shared_ptr<Channel<T>> channel) : channel_(std::move(channel)) {}

    Receiver(const Receiver&) = delete;
    Receiver& operator=(const Receiver&) = delete;
    Receiver(Receiver&&) noexcept = default;

    Receiver& operator=(Receiver&& other) noexcept {
        if (this != &other) {
            if (channel_) {
                channel_->close();
            }
            channel_ = std::move(other.channel_);
        }
        return *this;
    }

    // Un récepteur disparu ferme le canal : les envois suivants échouent
    ~Receiver() {
        if (channel_) {
            channel_->close();
        }
    }

    std::optional<T> receive() {
        if (!channel_) return std::nullopt;
        return channel_->receive();
    }

    std::optional<T> tryReceive() {
        if (!channel_) return std::nullopt;
        return channel_->tryReceive();
    }

    template <typename Rep, typename Period>
    std::optional<T> receiveFor(const std::chrono::duration<Rep, Period>& timeout) {
        if (!channel_) return std::nullopt;
        return channel_->receiveFor(timeout);
    }

    void close() {
        if (channel_) {
            channel_->close();
        }
    }

    bool valid() const { return static_cast<bool>(channel_); }
    size_t pending() const { return channel_ ? channel_->size() : 0; }

    /**
     * @brief Accès à l'état partagé (fermeture côté propriétaire)
     */
    std::shared_ptr<Channel<T>> channel() const { return channel_; }

private:
    std::shared_ptr<Channel<T>> channel_;
};

/**
 * @brief Crée une paire (émetteur, récepteur) de capacité donnée
 */
template <typename T>
std::pair<Sender<T>, Receiver<T>> makeChannel(size_t capacity) {
    auto channel = std::make_shared<Channel<T>>(capacity);
    return {Sender<T>(channel), Receiver<T>(channel)};
}

} // namespace morphine
