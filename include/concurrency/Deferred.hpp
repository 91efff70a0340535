#pragma once

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/post.hpp>

#include <exception>
#include <functional>
#include <memory>
#include <optional>
#include <stdexcept>
#include <utility>
#include <vector>

// Single-executor promise/future pair. Neither side is thread-safe: settle and
// observe only from handlers running on the executor the Deferred was built with.

namespace vl::concurrency {

namespace detail {

template <typename T>
struct SharedState : std::enable_shared_from_this<SharedState<T>> {
    using Waiter = std::function<void(const SharedState&)>;

    explicit SharedState(boost::asio::any_io_executor ex) : executor(std::move(ex)) {}

    boost::asio::any_io_executor executor;
    std::optional<T> value;
    std::exception_ptr error;
    bool settled = false;
    std::vector<Waiter> waiters;

    void settle() {
        settled = true;
        auto pending = std::exchange(waiters, {});
        for (auto& w : pending)
            boost::asio::post(executor, [self = this->shared_from_this(), w = std::move(w)] { w(*self); });
    }
};

}

template <typename T>
class Future {
public:
    Future() = default;
    explicit Future(std::shared_ptr<detail::SharedState<T>> state) : state_(std::move(state)) {}

    [[nodiscard]] bool valid() const { return static_cast<bool>(state_); }
    [[nodiscard]] bool settled() const { return state_ && state_->settled; }
    [[nodiscard]] bool fulfilled() const { return settled() && !state_->error; }
    [[nodiscard]] bool rejected() const { return settled() && state_->error; }

    // Continuations are always posted to the executor, never run inline.
    void then(std::function<void(const T&)> onValue,
              std::function<void(std::exception_ptr)> onError = {}) const {
        onSettledImpl([onValue = std::move(onValue), onError = std::move(onError)](const detail::SharedState<T>& s) {
            if (s.error) {
                if (onError) onError(s.error);
            } else if (onValue) {
                onValue(*s.value);
            }
        });
    }

    void onSettled(std::function<void()> fn) const {
        onSettledImpl([fn = std::move(fn)](const detail::SharedState<T>&) { fn(); });
    }

    bool operator==(const Future& other) const { return state_ == other.state_; }

private:
    std::shared_ptr<detail::SharedState<T>> state_;

    void onSettledImpl(typename detail::SharedState<T>::Waiter w) const {
        if (!state_) throw std::logic_error("Future has no shared state");
        if (state_->settled) {
            boost::asio::post(state_->executor, [s = state_, w = std::move(w)] { w(*s); });
            return;
        }
        state_->waiters.push_back(std::move(w));
    }
};

template <typename T>
class Deferred {
public:
    explicit Deferred(boost::asio::any_io_executor ex)
        : state_(std::make_shared<detail::SharedState<T>>(std::move(ex))) {}

    [[nodiscard]] Future<T> future() const { return Future<T>(state_); }
    [[nodiscard]] bool settled() const { return state_->settled; }

    // Only the first resolve/reject takes effect; later calls return false.
    bool resolve(T value) const {
        if (state_->settled) return false;
        state_->value = std::move(value);
        state_->settle();
        return true;
    }

    bool reject(std::exception_ptr error) const {
        if (state_->settled) return false;
        state_->error = std::move(error);
        state_->settle();
        return true;
    }

private:
    std::shared_ptr<detail::SharedState<T>> state_;
};

template <typename T>
Future<T> makeRejected(const boost::asio::any_io_executor& ex, std::exception_ptr error) {
    const Deferred<T> d(ex);
    d.reject(std::move(error));
    return d.future();
}

// Calls handler once every future has settled, fulfilled or rejected.
template <typename T>
void whenAllSettled(const boost::asio::any_io_executor& ex, const std::vector<Future<T>>& futures,
                    std::function<void()> handler) {
    if (futures.empty()) {
        boost::asio::post(ex, std::move(handler));
        return;
    }

    auto remaining = std::make_shared<size_t>(futures.size());
    auto done = std::make_shared<std::function<void()>>(std::move(handler));
    for (const auto& f : futures)
        f.onSettled([remaining, done] {
            if (--*remaining == 0) (*done)();
        });
}

}
