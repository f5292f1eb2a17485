#include "mcpwire/connection/connection_manager.hpp"
#include "mcpwire/log/logger.hpp"
#include "mcpwire/protocol/codec.hpp"

#include <exception>

namespace mcpwire {

namespace {

constexpr std::string_view kLog = "connection";

// Set while this thread runs an inbound handler, of any connection.
thread_local bool t_delivering = false;

void join_unless_self(std::thread& thread) {
    const bool joinable = thread.joinable() && (thread.get_id() != std::this_thread::get_id());
    if (joinable) {
        thread.join();
    }
}

}  // namespace

ConnectionManager::ConnectionManager(std::unique_ptr<ITransport> transport,
                                     ConnectionOptions options,
                                     AuthTokenProvider auth)
    : ConnectionManager(std::move(transport), options, std::move(auth),
                        std::make_unique<ExponentialBackoff>(options.backoff_base,
                                                             options.backoff_multiplier,
                                                             options.backoff_cap,
                                                             options.backoff_jitter)) {}

ConnectionManager::ConnectionManager(std::unique_ptr<ITransport> transport,
                                     ConnectionOptions options,
                                     AuthTokenProvider auth,
                                     std::unique_ptr<IBackoffPolicy> backoff)
    : transport_(std::move(transport))
    , options_(options)
    , auth_(std::move(auth))
    , backoff_(std::move(backoff)) {}

ConnectionManager::~ConnectionManager() {
    shutdown();
    // shutdown() run from a callback on one of our own threads could not join it.
    for (auto* thread : {&control_thread_, &reader_thread_, &sweeper_thread_}) {
        join_unless_self(*thread);
        if (thread->joinable()) {
            thread->detach();
        }
    }
}

// ─────────────────────────────────────────────────────────────────────────────
// Lifecycle
// ─────────────────────────────────────────────────────────────────────────────

void ConnectionManager::start() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (started_ || shutdown_requested_) {
            get_logger().warn_fmt(kLog, "start() ignored in state {}", to_string(state_));
            return;
        }
        started_ = true;
    }

    get_logger().info_fmt(kLog, "starting {} connection", to_string(transport_->kind()));
    sweeper_thread_ = std::thread([this]() { sweeper_loop(); });
    control_thread_ = std::thread([this]() { control_loop(); });
}

void ConnectionManager::shutdown() {
    std::lock_guard<std::mutex> serial(shutdown_mutex_);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (shutdown_requested_) {
            return;
        }
        shutdown_requested_ = true;
    }
    cv_.notify_all();

    transition_to(ConnectionState::Closed);

    reader_stop_.store(true);
    (void)transport_->close();
    join_unless_self(control_thread_);

    // The control thread may have reopened the transport before it saw the
    // request.
    reader_stop_.store(true);
    (void)transport_->close();
    join_unless_self(reader_thread_);
    join_unless_self(sweeper_thread_);

    correlation_.fail_all(CallError::connection_closed());
    get_logger().info_fmt(kLog, "{} connection shut down", to_string(transport_->kind()));
}

// ─────────────────────────────────────────────────────────────────────────────
// State Machine
// ─────────────────────────────────────────────────────────────────────────────

void ConnectionManager::control_loop() {
    const bool opened = try_open();
    if (opened) {
        start_reader();
        transition_to(ConnectionState::Active);
    } else if (options_.max_reconnect_attempts > 0) {
        transition_to(ConnectionState::Reconnecting);
    } else {
        enter_failed("open failed: " + last_error());
        return;
    }

    while (true) {
        switch (state()) {
            case ConnectionState::Active:
                run_active();
                break;
            case ConnectionState::Degraded:
                run_degraded();
                break;
            case ConnectionState::Reconnecting:
                run_reconnecting();
                break;
            case ConnectionState::Initializing:
            case ConnectionState::Closed:
            case ConnectionState::Failed:
                MCPWIRE_LOG_DEBUG(kLog, "control loop exiting");
                return;
        }
    }
}

void ConnectionManager::run_active() {
    const bool heartbeat_enabled = (options_.heartbeat_interval.count() > 0);
    auto next_heartbeat = std::chrono::steady_clock::now() + options_.heartbeat_interval;

    std::unique_lock<std::mutex> lock(mutex_);
    while (true) {
        const auto woken = [this]() { return shutdown_requested_ || fault_pending_; };

        if (heartbeat_enabled) {
            cv_.wait_until(lock, next_heartbeat, woken);
        } else {
            cv_.wait(lock, woken);
        }

        if (shutdown_requested_) {
            return;
        }

        if (fault_pending_) {
            fault_pending_ = false;
            const std::string reason = fault_reason_;
            last_error_ = reason;
            lock.unlock();
            get_logger().warn_fmt(kLog, "fault while active: {}", reason);
            transition_to(ConnectionState::Degraded);
            return;
        }

        if (std::chrono::steady_clock::now() >= next_heartbeat) {
            lock.unlock();
            auto probed = transport_->probe(options_.heartbeat_timeout);
            lock.lock();
            if (probed.has_value() == false) {
                fault_pending_ = true;
                fault_reason_ = "heartbeat missed: " + probed.error().message;
            } else {
                MCPWIRE_LOG_TRACE(kLog, "heartbeat ok");
            }
            next_heartbeat = std::chrono::steady_clock::now() + options_.heartbeat_interval;
        }
    }
}

void ConnectionManager::run_degraded() {
    std::string reason;
    for (std::size_t probe = 0; probe < options_.confirmation_probes; ++probe) {
        if (probe > 0) {
            const bool keep_going = wait_unless_shutdown(options_.probe_interval);
            if (keep_going == false) {
                return;
            }
        }

        // A reader that has stopped means the channel ended; probing cannot
        // bring it back.
        const bool reader_alive = reader_running_.load();
        if (reader_alive == false) {
            reason = "reader stopped";
            break;
        }

        auto probed = transport_->probe(options_.heartbeat_timeout);
        if (probed.has_value() && reader_running_.load()) {
            get_logger().info_fmt(kLog, "confirmation probe {} succeeded, recovering", probe + 1);
            transition_to(ConnectionState::Active);
            return;
        }
        reason = probed.has_value() ? std::string("reader stopped") : probed.error().message;
        get_logger().debug_fmt(kLog, "confirmation probe {} failed: {}", probe + 1, reason);
    }

    if (reason.empty() == false) {
        std::lock_guard<std::mutex> lock(mutex_);
        last_error_ = reason;
    }
    transition_to(ConnectionState::Reconnecting);
}

void ConnectionManager::run_reconnecting() {
    stop_reader();

    while (true) {
        std::size_t attempt = 0;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (shutdown_requested_) {
                return;
            }
            attempt = reconnect_attempts_;
        }

        if (attempt >= options_.max_reconnect_attempts) {
            enter_failed("gave up after " + std::to_string(attempt) + " reconnect attempt(s): " + last_error());
            return;
        }

        const auto delay = backoff_->next_delay(attempt);
        {
            std::lock_guard<std::mutex> lock(mutex_);
            reconnect_attempts_ = attempt + 1;
            backoff_history_.push_back(delay);
        }
        get_logger().info_fmt(kLog, "reconnect attempt {}/{} in {}ms",
                              attempt + 1, options_.max_reconnect_attempts, delay.count());

        const bool keep_going = wait_unless_shutdown(delay);
        if (keep_going == false) {
            return;
        }

        const bool opened = try_open();
        if (opened) {
            const std::size_t reset = correlation_.fail_all(CallError::connection_reset());
            if (reset > 0) {
                get_logger().info_fmt(kLog, "{} call(s) from before the drop failed with ConnectionReset", reset);
            }
            backoff_->reset();
            {
                std::lock_guard<std::mutex> lock(mutex_);
                reconnect_attempts_ = 0;
            }
            start_reader();
            transition_to(ConnectionState::Active);
            return;
        }
    }
}

void ConnectionManager::enter_failed(const std::string& reason) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        last_error_ = reason;
    }
    const bool entered = transition_to(ConnectionState::Failed);
    if (entered == false) {
        return;
    }

    get_logger().error_fmt(kLog, "{} connection failed: {}", to_string(transport_->kind()), reason);
    (void)transport_->close();
    correlation_.fail_all(CallError::reconnect_exhausted(reason));

    std::vector<FailedCallback> callbacks;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        callbacks = failed_callbacks_;
    }
    for (const auto& callback : callbacks) {
        callback(reason);
    }
}

bool ConnectionManager::try_open() {
    if (auth_) {
        tl::expected<std::string, std::string> token = tl::unexpected(std::string("no token"));
        try {
            token = auth_();
        } catch (const std::exception& e) {
            token = tl::unexpected(std::string(e.what()));
        }
        if (token.has_value() == false) {
            std::lock_guard<std::mutex> lock(mutex_);
            last_error_ = "auth provider failed: " + token.error();
            get_logger().warn_fmt(kLog, "{}", last_error_);
            return false;
        }
        transport_->set_auth_token(std::move(*token));
    }

    auto opened = transport_->open();
    if (opened.has_value() == false) {
        std::lock_guard<std::mutex> lock(mutex_);
        last_error_ = "open failed: " + opened.error().message;
        get_logger().warn_fmt(kLog, "{}", last_error_);
        return false;
    }
    return true;
}

bool ConnectionManager::wait_unless_shutdown(std::chrono::milliseconds delay) {
    std::unique_lock<std::mutex> lock(mutex_);
    const bool stopping = cv_.wait_for(lock, delay, [this]() { return shutdown_requested_; });
    return stopping == false;
}

bool ConnectionManager::transition_to(ConnectionState next) {
    ConnectionState previous = ConnectionState::Initializing;
    std::vector<StateChangeCallback> callbacks;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        previous = state_;
        if (is_valid_transition(previous, next) == false) {
            if (previous != next) {
                get_logger().debug_fmt(kLog, "ignoring transition {} -> {}", to_string(previous), to_string(next));
            }
            return false;
        }
        // Once shutdown is requested the only way forward is Closed.
        if (shutdown_requested_ && (next != ConnectionState::Closed)) {
            return false;
        }
        state_ = next;
        if (next == ConnectionState::Active) {
            fault_pending_ = false;
        }
        callbacks = state_callbacks_;
    }
    cv_.notify_all();

    get_logger().info_fmt(kLog, "{}: {} -> {}", to_string(transport_->kind()), to_string(previous), to_string(next));
    for (const auto& callback : callbacks) {
        callback(previous, next);
    }
    return true;
}

void ConnectionManager::report_fault(std::string reason) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        // Only an Active connection has anything to learn from a new fault.
        if (state_ != ConnectionState::Active) {
            return;
        }
        fault_pending_ = true;
        fault_reason_ = std::move(reason);
    }
    cv_.notify_all();
}

// ─────────────────────────────────────────────────────────────────────────────
// Traffic
// ─────────────────────────────────────────────────────────────────────────────

CallResult<void> ConnectionManager::send(const Message& message) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (accepts_traffic(state_) == false) {
            return tl::unexpected(CallError::not_connected(
                std::string(to_string(transport_->kind())) + " connection is " + std::string(to_string(state_))));
        }
    }

    const std::string payload = encode_message(message);

    std::lock_guard<std::mutex> send_lock(send_mutex_);
    auto sent = transport_->send(payload);
    if (sent.has_value() == false) {
        const std::string reason = "send failed: " + sent.error().message;
        get_logger().warn_fmt(kLog, "{}", reason);
        report_fault(reason);
        return tl::unexpected(CallError::transport(reason));
    }
    get_logger().trace_fmt(kLog, "sent {} ({} bytes)", message_kind(message), payload.size());
    return {};
}

void ConnectionManager::set_inbound_handler(InboundHandler handler) {
    std::unique_lock<std::mutex> lock(mutex_);
    inbound_handler_ = std::move(handler);
    if (t_delivering) {
        return;
    }
    delivery_cv_.wait(lock, [this]() { return deliveries_in_flight_ == 0; });
}

// ─────────────────────────────────────────────────────────────────────────────
// Reader
// ─────────────────────────────────────────────────────────────────────────────

void ConnectionManager::start_reader() {
    join_unless_self(reader_thread_);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (shutdown_requested_) {
            return;
        }
    }
    reader_stop_.store(false);
    reader_running_.store(true);
    reader_thread_ = std::thread([this]() { reader_loop(); });
}

void ConnectionManager::stop_reader() {
    reader_stop_.store(true);
    (void)transport_->close();
    join_unless_self(reader_thread_);
}

void ConnectionManager::reader_loop() {
    MCPWIRE_LOG_DEBUG(kLog, "reader started");

    while (reader_stop_.load() == false) {
        auto payload = transport_->receive();
        if (reader_stop_.load()) {
            break;
        }

        if (payload.has_value() == false) {
            const auto& error = payload.error();
            if (error.is_transient()) {
                continue;
            }
            report_fault("receive failed: " + error.message);
            // A bad message leaves the channel usable; anything else ends it.
            if (error.category == TransportError::Category::Protocol) {
                continue;
            }
            break;
        }

        auto message = decode_message(*payload);
        if (message.has_value() == false) {
            get_logger().warn_fmt(kLog, "dropping undecodable message ({}): {}",
                                  to_string(message.error().code), message.error().message);
            continue;
        }
        deliver(*message);
    }

    reader_running_.store(false);
    MCPWIRE_LOG_DEBUG(kLog, "reader exiting");
}

void ConnectionManager::deliver(const Message& message) {
    InboundHandler handler;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        handler = inbound_handler_;
        if (handler == nullptr) {
            get_logger().debug_fmt(kLog, "no inbound handler, dropping {}", message_kind(message));
            return;
        }
        ++deliveries_in_flight_;
    }

    // Counted out however the handler leaves, so set_inbound_handler() never waits forever.
    struct DeliveryScope {
        ConnectionManager& self;
        explicit DeliveryScope(ConnectionManager& owner) : self(owner) { t_delivering = true; }
        ~DeliveryScope() {
            t_delivering = false;
            {
                std::lock_guard<std::mutex> lock(self.mutex_);
                --self.deliveries_in_flight_;
            }
            self.delivery_cv_.notify_all();
        }
    } scope(*this);

    try {
        handler(message);
    } catch (const std::exception& e) {
        get_logger().error_fmt(kLog, "inbound handler threw: {}", e.what());
    }
}

// ─────────────────────────────────────────────────────────────────────────────
// Deadline Sweep
// ─────────────────────────────────────────────────────────────────────────────

void ConnectionManager::sweeper_loop() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (shutdown_requested_ == false) {
        cv_.wait_for(lock, options_.sweep_interval, [this]() { return shutdown_requested_; });
        if (shutdown_requested_) {
            break;
        }
        lock.unlock();
        correlation_.expire(std::chrono::steady_clock::now());
        lock.lock();
    }
}

// ─────────────────────────────────────────────────────────────────────────────
// Observation
// ─────────────────────────────────────────────────────────────────────────────

ConnectionState ConnectionManager::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

std::size_t ConnectionManager::reconnect_attempts() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return reconnect_attempts_;
}

std::vector<std::chrono::milliseconds> ConnectionManager::backoff_history() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return backoff_history_;
}

std::string ConnectionManager::last_error() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_error_;
}

bool ConnectionManager::wait_for_state(ConnectionState target, std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, timeout, [this, target]() { return state_ == target; });
}

void ConnectionManager::on_state_change(StateChangeCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    state_callbacks_.push_back(std::move(callback));
}

void ConnectionManager::on_failed(FailedCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    failed_callbacks_.push_back(std::move(callback));
}

}  // namespace mcpwire
