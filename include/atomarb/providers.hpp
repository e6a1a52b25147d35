// AtomArb - External Collaborators
// Snapshot providers, bundle submission channel and notification sink

#pragma once

#include <atomarb/bundle.hpp>
#include <atomarb/orderbook.hpp>
#include <atomarb/pool.hpp>
#include <chrono>
#include <exception>
#include <future>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <type_traits>

namespace atomarb {

// Snapshot or submission call failed or exceeded its bound
class ProviderError : public std::runtime_error {
public:
    enum class Kind : uint8_t {
        Timeout = 0,
        Connectivity = 1,
        BadResponse = 2
    };

    ProviderError(Kind kind, const std::string& msg)
        : std::runtime_error(msg), kind_(kind) {}

    [[nodiscard]] Kind kind() const noexcept { return kind_; }

private:
    Kind kind_;
};

inline constexpr const char* to_string(ProviderError::Kind k) noexcept {
    switch (k) {
        case ProviderError::Kind::Timeout: return "timeout";
        case ProviderError::Kind::Connectivity: return "connectivity";
        case ProviderError::Kind::BadResponse: return "bad_response";
    }
    return "unknown";
}

// Order-book snapshots by market id
class BookProvider {
public:
    virtual ~BookProvider() = default;
    virtual BookSnapshot fetch_book(const std::string& market_id) = 0;
};

// Pool snapshots by pool id
class PoolProvider {
public:
    virtual ~PoolProvider() = default;
    virtual PoolSnapshot fetch_pool(const std::string& pool_id) = 0;
};

enum class SubmitStatus : uint8_t {
    Confirmed = 0,
    Rejected = 1,
    TimedOut = 2
};

inline constexpr const char* to_string(SubmitStatus s) noexcept {
    switch (s) {
        case SubmitStatus::Confirmed: return "confirmed";
        case SubmitStatus::Rejected: return "rejected";
        case SubmitStatus::TimedOut: return "timed_out";
    }
    return "unknown";
}

struct SubmitResult {
    SubmitStatus status = SubmitStatus::Rejected;
    std::string bundle_id;   // relay identifier, set when the relay accepted it
    std::string reason;

    [[nodiscard]] bool confirmed() const noexcept { return status == SubmitStatus::Confirmed; }

    static SubmitResult landed(std::string id) {
        return SubmitResult{SubmitStatus::Confirmed, std::move(id), ""};
    }

    static SubmitResult rejected(std::string why, std::string id = "") {
        return SubmitResult{SubmitStatus::Rejected, std::move(id), std::move(why)};
    }

    static SubmitResult timed_out(std::string why, std::string id = "") {
        return SubmitResult{SubmitStatus::TimedOut, std::move(id), std::move(why)};
    }
};

// All-or-nothing bundle relay. Blocks until the bundle landed or failed.
class SubmissionChannel {
public:
    virtual ~SubmissionChannel() = default;
    virtual SubmitResult submit(const Bundle& bundle) = 0;
};

// Observational event sink
class Notifier {
public:
    virtual ~Notifier() = default;
    virtual void notify(const std::string& message) = 0;
};

// Writes events to the log
class LogNotifier : public Notifier {
public:
    void notify(const std::string& message) override;
};

// Run `fn` on a worker thread and wait at most `timeout` for it. On expiry the
// worker is abandoned (it keeps what it captured alive) and ProviderError
// {Timeout} is thrown. Exceptions from `fn` are rethrown to the caller.
template <typename F>
std::invoke_result_t<F> with_timeout(F fn, std::chrono::milliseconds timeout, const std::string& what) {
    using R = std::invoke_result_t<F>;
    auto promise = std::make_shared<std::promise<R>>();
    std::future<R> future = promise->get_future();

    std::thread([promise, fn = std::move(fn)]() mutable {
        try {
            promise->set_value(fn());
        } catch (...) {
            promise->set_exception(std::current_exception());
        }
    }).detach();

    if (future.wait_for(timeout) != std::future_status::ready) {
        throw ProviderError(ProviderError::Kind::Timeout,
                            what + " timed out after " + std::to_string(timeout.count()) + "ms");
    }
    return future.get();
}

}  // namespace atomarb
