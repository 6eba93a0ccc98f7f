#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>

namespace printfleet::camera {

    enum class ReceiveStatus {
        Ok,
        Timeout,
        Closed
    };

    /**
     * @brief Bounded single-producer / multi-consumer topic.
     *
     * Every receiver sees every published value unless it falls more than `capacity` values
     * behind, in which case the oldest unread values are dropped for that receiver. publish()
     * never blocks. close() wakes all existing receivers with ReceiveStatus::Closed once they
     * have drained what is buffered; receivers subscribed afterwards are not affected.
     */
    template<typename T>
    class BroadcastTopic {
        struct Entry {
            uint64_t seq;
            uint64_t epoch;
            T value;
        };

        struct State {
            explicit State(size_t cap) : capacity(cap == 0 ? 1 : cap) {}

            std::mutex mutex;
            std::condition_variable cv;
            std::deque<Entry> buffer;
            const size_t capacity;
            uint64_t nextSeq = 0;
            size_t receivers = 0;
            uint64_t epoch = 0;
        };

    public:
        struct Received {
            ReceiveStatus status = ReceiveStatus::Timeout;
            std::optional<T> value;
            uint64_t skipped = 0;
        };

        class Receiver {
        public:
            Receiver(Receiver &&other) noexcept
                    : state_(std::move(other.state_)), nextSeq_(other.nextSeq_), epoch_(other.epoch_) {
            }

            Receiver &operator=(Receiver &&other) noexcept {
                if (this != &other) {
                    release();
                    state_ = std::move(other.state_);
                    nextSeq_ = other.nextSeq_;
                    epoch_ = other.epoch_;
                }
                return *this;
            }

            Receiver(const Receiver &) = delete;

            Receiver &operator=(const Receiver &) = delete;

            ~Receiver() {
                release();
            }

            /**
             * @brief Waits up to `timeout` for the next value.
             *
             * `skipped` reports how many values were dropped because this receiver lagged.
             */
            Received receive(std::chrono::milliseconds timeout) {
                Received result;
                if (!state_) {
                    result.status = ReceiveStatus::Closed;
                    return result;
                }

                std::unique_lock<std::mutex> lock(state_->mutex);
                bool ready = state_->cv.wait_for(lock, timeout, [this] {
                    return nextSeq_ < state_->nextSeq || state_->epoch != epoch_;
                });

                if (!ready) {
                    result.status = ReceiveStatus::Timeout;
                    return result;
                }

                if (nextSeq_ < state_->nextSeq && !state_->buffer.empty()) {
                    uint64_t oldest = state_->buffer.front().seq;
                    if (nextSeq_ < oldest) {
                        result.skipped = oldest - nextSeq_;
                        nextSeq_ = oldest;
                    }

                    // Values published after a close belong to the next generation of receivers
                    const Entry &entry = state_->buffer[nextSeq_ - oldest];
                    if (entry.epoch == epoch_) {
                        result.status = ReceiveStatus::Ok;
                        result.value = entry.value;
                        ++nextSeq_;
                        return result;
                    }
                }

                result.status = ReceiveStatus::Closed;
                return result;
            }

        private:
            friend class BroadcastTopic;

            Receiver(std::shared_ptr<State> state, uint64_t nextSeq, uint64_t epoch)
                    : state_(std::move(state)), nextSeq_(nextSeq), epoch_(epoch) {
            }

            void release() {
                if (state_) {
                    std::lock_guard<std::mutex> lock(state_->mutex);
                    --state_->receivers;
                    state_.reset();
                }
            }

            std::shared_ptr<State> state_;
            uint64_t nextSeq_ = 0;
            uint64_t epoch_ = 0;
        };

        explicit BroadcastTopic(size_t capacity)
                : state_(std::make_shared<State>(capacity)) {
        }

        /**
         * @brief New receiver that sees values published from now on.
         */
        Receiver subscribe() {
            std::lock_guard<std::mutex> lock(state_->mutex);
            ++state_->receivers;
            return Receiver(state_, state_->nextSeq, state_->epoch);
        }

        /**
         * @brief Publishes to all current receivers.
         * @return false if there is no receiver, the value is then discarded
         */
        bool publish(T value) {
            {
                std::lock_guard<std::mutex> lock(state_->mutex);
                if (state_->receivers == 0) {
                    return false;
                }

                state_->buffer.push_back(Entry{state_->nextSeq++, state_->epoch, std::move(value)});
                while (state_->buffer.size() > state_->capacity) {
                    state_->buffer.pop_front();
                }
            }
            state_->cv.notify_all();
            return true;
        }

        void close() {
            {
                std::lock_guard<std::mutex> lock(state_->mutex);
                ++state_->epoch;
            }
            state_->cv.notify_all();
        }

        size_t receiverCount() const {
            std::lock_guard<std::mutex> lock(state_->mutex);
            return state_->receivers;
        }

        size_t capacity() const {
            return state_->capacity;
        }

    private:
        std::shared_ptr<State> state_;
    };

} // namespace printfleet::camera
