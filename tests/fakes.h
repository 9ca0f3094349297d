#pragma once

/**
 * In-process stand-ins for the network, audio hardware, HTTP and timers.
 * Shared by the test executables; none of them touch a real device or socket.
 */

#include "common.h"
#include "errors.h"
#include "http_client.h"
#include "audio/audio_device.h"
#include "core/timer_queue.h"
#include "realtime/transport.h"
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace rtvoice {
namespace testing {

class FakeTransport : public realtime::ITransport {
public:
    explicit FakeTransport(bool fail_connect = false) : fail_connect_(fail_connect) {}

    VoidResult connect(const std::string& url,
                       const std::map<std::string, std::string>& headers,
                       realtime::TransportHandlers handlers) override {
        std::lock_guard<std::mutex> lock(mutex_);
        url_ = url;
        headers_ = headers;
        if (fail_connect_) {
            return Error(ErrorType::ConnectionFailed, "connection refused");
        }
        handlers_ = std::move(handlers);
        open_ = true;
        return VoidResult();
    }

    VoidResult send(const std::string& text) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!open_) {
            return Error(ErrorType::ConnectionLost, "not open");
        }
        sent_.push_back(text);
        return VoidResult();
    }

    void close() override {
        std::lock_guard<std::mutex> lock(mutex_);
        open_ = false;
        ++close_calls_;
    }

    bool is_open() const override {
        realtime::TransportHandlers handlers;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!close_after_handshake_) {
                return open_;
            }
            close_after_handshake_ = false;
            open_ = false;
            handlers = handlers_;
        }
        // Reports the stale "open" answer after the close was delivered
        if (handlers.on_close) handlers.on_close(1006, "closed after handshake");
        return true;
    }

    /// The peer closes right after the first is_open() check
    void close_after_handshake() {
        std::lock_guard<std::mutex> lock(mutex_);
        close_after_handshake_ = true;
    }

    /// Simulate an inbound message
    void deliver(const json& message) {
        realtime::TransportHandlers handlers;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            handlers = handlers_;
        }
        if (handlers.on_message) handlers.on_message(message.dump());
    }

    void deliver_raw(const std::string& text) {
        realtime::TransportHandlers handlers;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            handlers = handlers_;
        }
        if (handlers.on_message) handlers.on_message(text);
    }

    /// Simulate the peer dropping the connection
    void drop(int code = 1006, const std::string& reason = "") {
        realtime::TransportHandlers handlers;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            open_ = false;
            handlers = handlers_;
        }
        if (handlers.on_close) handlers.on_close(code, reason);
    }

    std::vector<json> sent_messages() const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<json> out;
        for (const auto& text : sent_) {
            out.push_back(json::parse(text));
        }
        return out;
    }

    size_t count_sent(const std::string& type) const {
        size_t n = 0;
        for (const auto& msg : sent_messages()) {
            if (msg.value("type", "") == type) ++n;
        }
        return n;
    }

    std::vector<std::string> sent_types() const {
        std::vector<std::string> types;
        for (const auto& msg : sent_messages()) {
            types.push_back(msg.value("type", ""));
        }
        return types;
    }

    std::string url() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return url_;
    }

    std::map<std::string, std::string> headers() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return headers_;
    }

    int close_calls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return close_calls_;
    }

private:
    mutable std::mutex mutex_;
    bool fail_connect_;
    mutable bool open_ = false;
    mutable bool close_after_handshake_ = false;
    int close_calls_ = 0;
    std::string url_;
    std::map<std::string, std::string> headers_;
    realtime::TransportHandlers handlers_;
    std::vector<std::string> sent_;
};

/**
 * Hands out transports in order; once the script runs out every connect fails
 * when fail_after_script is set, otherwise fresh working transports are made.
 */
class TransportScript {
public:
    void push(std::shared_ptr<FakeTransport> transport) {
        std::lock_guard<std::mutex> lock(mutex_);
        script_.push_back(std::move(transport));
    }

    void set_fail_after_script(bool fail) {
        std::lock_guard<std::mutex> lock(mutex_);
        fail_after_script_ = fail;
    }

    realtime::TransportFactory factory() {
        return [this]() -> std::shared_ptr<realtime::ITransport> {
            std::lock_guard<std::mutex> lock(mutex_);
            std::shared_ptr<FakeTransport> next;
            if (!script_.empty()) {
                next = script_.front();
                script_.pop_front();
            } else {
                next = std::make_shared<FakeTransport>(fail_after_script_);
            }
            created_.push_back(next);
            return next;
        };
    }

    std::shared_ptr<FakeTransport> last() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return created_.empty() ? nullptr : created_.back();
    }

    size_t created() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return created_.size();
    }

private:
    mutable std::mutex mutex_;
    std::deque<std::shared_ptr<FakeTransport>> script_;
    std::vector<std::shared_ptr<FakeTransport>> created_;
    bool fail_after_script_ = false;
};

/**
 * Collects delayed tasks; the test fires them explicitly.
 */
class ManualScheduler {
public:
    DelayScheduler scheduler() {
        return [this](std::chrono::milliseconds delay, std::function<void()> task) {
            std::lock_guard<std::mutex> lock(mutex_);
            delays_.push_back(delay);
            tasks_.push_back(std::move(task));
        };
    }

    /// Run the oldest pending task; false if none
    bool run_next() {
        std::function<void()> task;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (tasks_.empty()) return false;
            task = std::move(tasks_.front());
            tasks_.pop_front();
        }
        task();
        return true;
    }

    size_t pending() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return tasks_.size();
    }

    std::vector<std::chrono::milliseconds> delays() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return delays_;
    }

private:
    mutable std::mutex mutex_;
    std::deque<std::function<void()>> tasks_;
    std::vector<std::chrono::milliseconds> delays_;
};

class FakeAudioDevice : public audio::IAudioDevice {
public:
    explicit FakeAudioDevice(int input_rate = 48000, int output_rate = 24000)
        : input_rate_(input_rate), output_rate_(output_rate) {}

    void fail_input_with(ErrorType type) {
        std::lock_guard<std::mutex> lock(mutex_);
        input_error_ = type;
    }

    /// Make open_input() block until release_open()
    void hold_open() {
        std::lock_guard<std::mutex> lock(mutex_);
        held_ = true;
    }

    void release_open() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            held_ = false;
        }
        gate_.notify_all();
    }

    VoidResult open_input(const std::string&, int sample_rate, audio::InputCallback callback) override {
        std::unique_lock<std::mutex> lock(mutex_);
        ++open_input_calls_;
        gate_.wait(lock, [this] { return !held_; });
        if (input_error_ != ErrorType::None) {
            return Error(input_error_, "fake input failure");
        }
        if (sample_rate > 0) input_rate_ = sample_rate;
        callback_ = std::move(callback);
        input_open_ = true;
        return VoidResult();
    }

    std::string input_device_id() const override { return device_id_; }

    void set_device_id(const std::string& id) { device_id_ = id; }

    int input_sample_rate() const override { return input_rate_; }

    void close_input() override {
        std::lock_guard<std::mutex> lock(mutex_);
        input_open_ = false;
        callback_ = nullptr;
    }

    VoidResult open_output(const std::string&, int) override {
        std::lock_guard<std::mutex> lock(mutex_);
        output_open_ = true;
        return VoidResult();
    }

    int output_sample_rate() const override { return output_rate_; }

    VoidResult write_output(const Sample* samples, size_t count) override {
        std::lock_guard<std::mutex> lock(mutex_);
        written_.insert(written_.end(), samples, samples + count);
        return VoidResult();
    }

    void abort_output() override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++abort_calls_;
    }

    void close_output() override {
        std::unique_lock<std::mutex> lock(mutex_);
        ++close_output_calls_;
        gate_.wait(lock, [this] { return !close_held_; });
        output_open_ = false;
    }

    /// Make close_output() block until release_close_output()
    void hold_close_output() {
        std::lock_guard<std::mutex> lock(mutex_);
        close_held_ = true;
    }

    void release_close_output() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            close_held_ = false;
        }
        gate_.notify_all();
    }

    int close_output_calls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return close_output_calls_;
    }

    std::vector<audio::DeviceInfo> list_devices() override {
        audio::DeviceInfo info;
        info.index = 0;
        info.name = "Fake Microphone";
        info.max_input_channels = 1;
        info.max_output_channels = 1;
        info.default_sample_rate = input_rate_;
        return {info};
    }

    /// Simulate the host audio thread delivering a block
    void push_input(const std::vector<float>& block) {
        audio::InputCallback callback;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            callback = callback_;
        }
        if (callback) callback(block.data(), block.size());
    }

    bool input_open() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return input_open_;
    }

    int open_input_calls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return open_input_calls_;
    }

    size_t written_samples() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return written_.size();
    }

    std::vector<Sample> written() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return written_;
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable gate_;
    bool held_ = false;
    bool close_held_ = false;
    int close_output_calls_ = 0;
    int input_rate_;
    int output_rate_;
    std::string device_id_ = "fake-mic";
    ErrorType input_error_ = ErrorType::None;
    audio::InputCallback callback_;
    bool input_open_ = false;
    bool output_open_ = false;
    int open_input_calls_ = 0;
    int abort_calls_ = 0;
    std::vector<Sample> written_;
};

struct RecordedRequest {
    std::string url;
    json body;
    std::map<std::string, std::string> headers;
};

/**
 * Answers POSTs from a handler; records every request.
 */
class FakeHttpClient : public HttpClient {
public:
    using Handler = std::function<Result<HttpResponse>(const std::string& url, const json& body)>;

    void set_handler(Handler handler) {
        std::lock_guard<std::mutex> lock(mutex_);
        handler_ = std::move(handler);
    }

    Result<HttpResponse> post_json(const std::string& url,
                                   const std::string& body,
                                   const std::map<std::string, std::string>& headers,
                                   int) override {
        Handler handler;
        json parsed = json::parse(body, nullptr, false);
        {
            std::lock_guard<std::mutex> lock(mutex_);
            requests_.push_back(RecordedRequest{url, parsed, headers});
            handler = handler_;
        }
        if (!handler) {
            return make_network_error("no handler");
        }
        return handler(url, parsed);
    }

    std::vector<RecordedRequest> requests() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_;
    }

private:
    mutable std::mutex mutex_;
    Handler handler_;
    std::vector<RecordedRequest> requests_;
};

inline HttpResponse http_ok(const json& body) {
    HttpResponse response;
    response.status = 200;
    response.body = body.dump();
    return response;
}

inline HttpResponse http_status(long status, const json& body) {
    HttpResponse response;
    response.status = status;
    response.body = body.dump();
    return response;
}

/// Poll until cond holds or timeout elapses
template<typename Cond>
bool wait_until(Cond cond, int timeout_ms = 2000) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    while (std::chrono::steady_clock::now() < deadline) {
        if (cond()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return cond();
}

} // namespace testing
} // namespace rtvoice
