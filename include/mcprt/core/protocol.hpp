#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Protocol Engine
// ═══════════════════════════════════════════════════════════════════════════
// Shared by both connection roles. Owns one transport, correlates outbound
// requests with their responses, manages per-request timeouts, progress and
// cancellation, and dispatches inbound requests and notifications to
// registered handlers.
//
// Usage:
//   asio::co_spawn(io, [&]() -> asio::awaitable<void> {
//       auto connected = co_await engine.connect(transport);
//       auto result = co_await engine.request("tools/list", Json::object());
//       if (!result) { ... result.error().code ... }
//   }, asio::detached);
//
// Threading: every member must be used from the transport's executor. The
// engine itself never blocks and never spawns threads.

#include "mcprt/core/cancellation.hpp"
#include "mcprt/core/timer_service.hpp"
#include "mcprt/protocol/json_rpc.hpp"
#include "mcprt/protocol/mcp_types.hpp"
#include "mcprt/protocol/protocol_error.hpp"
#include "mcprt/transport.hpp"

#include <asio/any_io_executor.hpp>
#include <asio/awaitable.hpp>
#include <asio/experimental/channel.hpp>

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <unordered_map>

namespace mcprt {

inline constexpr std::chrono::milliseconds DEFAULT_REQUEST_TIMEOUT{60000};

// ═══════════════════════════════════════════════════════════════════════════
// Options
// ═══════════════════════════════════════════════════════════════════════════

struct ProtocolOptions {
    /// Check the peer's capabilities before every outbound request and
    /// throw CapabilityError when the method is not covered
    bool enforce_strict_capabilities{false};

    /// Per-attempt timeout for requests that do not set their own
    std::chrono::milliseconds default_request_timeout{DEFAULT_REQUEST_TIMEOUT};

    /// Clock and timers; an AsioTimerService on the transport executor is
    /// created at connect() when left empty
    std::shared_ptr<ITimerService> timer_service;

    ProtocolOptions& with_strict_capabilities(bool enabled = true) {
        enforce_strict_capabilities = enabled;
        return *this;
    }

    ProtocolOptions& with_default_request_timeout(std::chrono::milliseconds timeout) {
        default_request_timeout = timeout;
        return *this;
    }

    ProtocolOptions& with_timer_service(std::shared_ptr<ITimerService> service) {
        timer_service = std::move(service);
        return *this;
    }
};

using ProgressCallback = std::function<void(const ProgressNotification&)>;

struct RequestOptions {
    /// Cancelling the source rejects the request with the source's reason
    std::optional<CancellationToken> signal;

    /// Per-attempt timeout; ProtocolOptions::default_request_timeout if empty
    std::optional<std::chrono::milliseconds> timeout;

    /// Re-arm the per-attempt timer whenever progress arrives
    bool reset_timeout_on_progress{false};

    /// Ceiling on total time across resets. Only checked when progress
    /// arrives.
    std::optional<std::chrono::milliseconds> max_total_timeout;

    /// Setting this attaches a progress token (the request id)
    ProgressCallback on_progress;

    RequestOptions& with_signal(CancellationToken token) {
        signal = std::move(token);
        return *this;
    }

    RequestOptions& with_timeout(std::chrono::milliseconds value) {
        timeout = value;
        return *this;
    }

    RequestOptions& with_progress(ProgressCallback callback, bool reset_timeout = false) {
        on_progress = std::move(callback);
        reset_timeout_on_progress = reset_timeout;
        return *this;
    }

    RequestOptions& with_max_total_timeout(std::chrono::milliseconds value) {
        max_total_timeout = value;
        return *this;
    }
};

// ═══════════════════════════════════════════════════════════════════════════
// Handler types
// ═══════════════════════════════════════════════════════════════════════════

/// Checks (and may reshape) a successful result before it reaches the caller.
using ResultValidator = std::function<JsonResult<Json>(const Json&)>;

/// Passed to every inbound request handler.
struct RequestContext {
    /// Cancelled when the peer sends notifications/cancelled for this id
    CancellationToken signal;
    RequestId request_id;
    std::optional<std::string> session_id;

    /// params._meta of the request, if present
    std::optional<Json> meta;

    /// Send a notification related to this request (progress, logging)
    std::function<asio::awaitable<ProtocolResult<void>>(JsonRpcNotification)> send_notification;

    [[nodiscard]] std::optional<ProgressToken> progress_token() const;
};

using HandlerResult = tl::expected<Json, McpError>;

using RequestHandler = std::function<HandlerResult(const JsonRpcRequest&, const RequestContext&)>;
using AsyncRequestHandler = std::function<asio::awaitable<HandlerResult>(JsonRpcRequest, RequestContext)>;
using NotificationHandler = std::function<void(const JsonRpcNotification&)>;
using ErrorCallback = std::function<void(const ProtocolError&)>;

// ═══════════════════════════════════════════════════════════════════════════
// Protocol
// ═══════════════════════════════════════════════════════════════════════════

class Protocol {
public:
    explicit Protocol(ProtocolOptions options = {});
    virtual ~Protocol();

    Protocol(const Protocol&) = delete;
    Protocol& operator=(const Protocol&) = delete;
    Protocol(Protocol&&) = delete;
    Protocol& operator=(Protocol&&) = delete;

    // ─────────────────────────────────────────────────────────────────────────
    // Connection
    // ─────────────────────────────────────────────────────────────────────────

    /// Install handlers on `transport` and start it. An engine connects once;
    /// a second call fails with AlreadyConnected, even after close().
    [[nodiscard]] virtual asio::awaitable<ProtocolResult<void>> connect(std::shared_ptr<ITransport> transport);

    /// Close the transport. Every pending request is rejected with
    /// ConnectionClosed. A second call does nothing.
    [[nodiscard]] asio::awaitable<void> close();

    [[nodiscard]] bool is_connected() const noexcept { return transport_ != nullptr; }

    [[nodiscard]] std::shared_ptr<ITransport> transport() const noexcept { return transport_; }

    // ─────────────────────────────────────────────────────────────────────────
    // Outbound
    // ─────────────────────────────────────────────────────────────────────────

    /// Send a request and suspend until exactly one of response, error,
    /// timeout, cancellation or close settles it.
    [[nodiscard]] asio::awaitable<ProtocolResult<Json>> request(
        std::string method,
        std::optional<Json> params = std::nullopt,
        RequestOptions options = {},
        ResultValidator validator = {}
    );

    /// Fire-and-forget. Throws CapabilityError if the local side has not
    /// declared what the notification requires.
    [[nodiscard]] asio::awaitable<ProtocolResult<void>> notification(
        std::string method,
        std::optional<Json> params = std::nullopt
    );

    // ─────────────────────────────────────────────────────────────────────────
    // Handler registration
    // ─────────────────────────────────────────────────────────────────────────
    // A request handler may be registered once per method; registering a
    // second one throws UsageError. Built-in handlers (ping) can be replaced
    // once.

    void set_request_handler(const std::string& method, RequestHandler handler);
    void set_async_request_handler(const std::string& method, AsyncRequestHandler handler);
    void remove_request_handler(const std::string& method);

    void set_notification_handler(const std::string& method, NotificationHandler handler);
    void remove_notification_handler(const std::string& method);

    /// Used when no handler matches; MethodNotFound is sent when unset.
    void set_fallback_request_handler(AsyncRequestHandler handler);
    void set_fallback_notification_handler(NotificationHandler handler);

    /// Non-fatal problems: transport errors, unknown response ids, failing
    /// notification handlers.
    void on_error(ErrorCallback callback) { on_error_ = std::move(callback); }
    void on_close(std::function<void()> callback) { on_close_ = std::move(callback); }

    // ─────────────────────────────────────────────────────────────────────────
    // Bookkeeping (all zero once every request has settled)
    // ─────────────────────────────────────────────────────────────────────────

    [[nodiscard]] std::size_t pending_request_count() const noexcept { return pending_.size(); }
    [[nodiscard]] std::size_t progress_handler_count() const noexcept { return progress_handlers_.size(); }
    [[nodiscard]] std::size_t active_timeout_count() const noexcept { return timeouts_.size(); }
    [[nodiscard]] std::size_t inbound_request_count() const noexcept { return inbound_.size(); }

protected:
    // ─────────────────────────────────────────────────────────────────────────
    // Capability gate (implemented per role; each throws CapabilityError)
    // ─────────────────────────────────────────────────────────────────────────

    /// Remote capability needed to send request `method`.
    virtual void assert_capability_for_method(std::string_view method) const = 0;

    /// Local capability needed to send notification `method`.
    virtual void assert_notification_capability(std::string_view method) const = 0;

    /// Local capability needed to handle request `method`.
    virtual void assert_request_handler_capability(std::string_view method) const = 0;

    /// Register without capability or duplicate checks. `replaceable`
    /// lets a later set_*_request_handler override it once.
    void install_request_handler(const std::string& method, AsyncRequestHandler handler, bool replaceable);

    void report_error(const ProtocolError& error);

    [[nodiscard]] const ProtocolOptions& protocol_options() const noexcept { return options_; }

private:
    // ─────────────────────────────────────────────────────────────────────────
    // Bookkeeping types
    // ─────────────────────────────────────────────────────────────────────────

    using ResponseChannel = asio::experimental::channel<void(asio::error_code, ProtocolResult<Json>)>;

    /// Completes its channel at most once; complete() consumes the slot.
    class ResponseSlot {
    public:
        ResponseSlot() = default;
        explicit ResponseSlot(std::shared_ptr<ResponseChannel> channel) : channel_(std::move(channel)) {}

        void complete(ProtocolResult<Json> outcome) &&;

    private:
        std::shared_ptr<ResponseChannel> channel_;
    };

    struct PendingRequest {
        std::string method;
        ResponseSlot slot;
        ResultValidator validator;
        CancellationRegistration cancel_registration;
    };

    struct TimeoutInfo {
        TimerId timer{0};
        ITimerService::TimePoint start_time;
        std::chrono::milliseconds timeout{0};
        std::optional<std::chrono::milliseconds> max_total_timeout;
        bool reset_on_progress{false};
    };

    struct InboundRequest {
        CancellationSource source;
        std::uint64_t serial{0};
    };

    // ─────────────────────────────────────────────────────────────────────────
    // Dispatch
    // ─────────────────────────────────────────────────────────────────────────

    void handle_message(Json raw);
    void handle_response(const RequestId& id, ProtocolResult<Json> outcome);
    void handle_request(JsonRpcRequest request);
    void handle_notification(const JsonRpcNotification& notification);
    void handle_cancelled(const JsonRpcNotification& notification);
    void handle_progress(const JsonRpcNotification& notification);
    void handle_transport_close();

    asio::awaitable<void> run_request_handler(
        AsyncRequestHandler handler,
        JsonRpcRequest request,
        RequestContext context,
        std::string key,
        std::uint64_t serial
    );

    // ─────────────────────────────────────────────────────────────────────────
    // Outbound helpers
    // ─────────────────────────────────────────────────────────────────────────

    /// Remove every table entry for `id` and complete its slot. No-op when
    /// the request already settled.
    void settle(std::int64_t id, ProtocolResult<Json> outcome);

    /// Settle with `error` and tell the peer to stop working on `id`.
    void cancel_outbound(std::int64_t id, ProtocolError error, std::string reason);

    void arm_timeout(std::int64_t id, TimeoutInfo info);
    void on_timeout(std::int64_t id);
    void clear_timeout(std::int64_t id);

    /// Re-arm after progress; fails once max_total_timeout has elapsed.
    [[nodiscard]] ProtocolResult<void> reset_timeout(std::int64_t id);

    /// Send without awaiting; failures go to report_error().
    void send_detached(Json message, std::string what);

    ProtocolOptions options_;
    std::shared_ptr<ITransport> transport_;
    bool connected_once_{false};
    asio::any_io_executor executor_;
    std::shared_ptr<ITimerService> timer_service_;

    std::int64_t next_request_id_{0};
    std::uint64_t next_inbound_serial_{0};

    std::map<std::int64_t, PendingRequest> pending_;
    std::unordered_map<std::int64_t, ProgressCallback> progress_handlers_;
    std::unordered_map<std::int64_t, TimeoutInfo> timeouts_;
    std::unordered_map<std::string, InboundRequest> inbound_;

    std::unordered_map<std::string, AsyncRequestHandler> request_handlers_;
    std::set<std::string> replaceable_handlers_;
    std::unordered_map<std::string, NotificationHandler> notification_handlers_;
    AsyncRequestHandler fallback_request_handler_;
    NotificationHandler fallback_notification_handler_;

    ErrorCallback on_error_;
    std::function<void()> on_close_;

    // Expires with the engine; deferred work checks it before touching members.
    std::shared_ptr<bool> lifetime_ = std::make_shared<bool>(true);
};

}  // namespace mcprt
