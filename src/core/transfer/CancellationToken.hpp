#pragma once

#include <atomic>

namespace Ferry {

// Cooperative stop signal shared between the scheduler and a running
// transfer. The transfer polls it between chunks; a cancel request always
// wins over a pause request.
class CancellationToken {
public:
    enum class Request {
        None,
        Pause,
        Cancel
    };

    void requestPause() {
        Request expected = Request::None;
        request_.compare_exchange_strong(expected, Request::Pause);
    }

    void requestCancel() { request_.store(Request::Cancel); }

    Request request() const { return request_.load(); }
    bool isPauseRequested() const { return request_.load() == Request::Pause; }
    bool isCancelled() const { return request_.load() == Request::Cancel; }
    bool stopRequested() const { return request_.load() != Request::None; }

private:
    std::atomic<Request> request_{Request::None};
};

} // namespace Ferry
