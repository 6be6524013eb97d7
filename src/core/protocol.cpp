#include "mcprt/core/protocol.hpp"
#include "mcprt/log/logger.hpp"

#include <asio/co_spawn.hpp>
#include <asio/detached.hpp>
#include <asio/dispatch.hpp>
#include <asio/post.hpp>
#include <asio/use_awaitable.hpp>

#include <charconv>
#include <system_error>

namespace mcprt {

namespace {

// notifications/cancelled carries a string reason.
std::string reason_text(const Json& reason) {
    if (reason.is_string()) {
        return reason.get<std::string>();
    }
    return reason.dump();
}

// We only issue integer ids; a string token is accepted if it spells one.
std::optional<std::int64_t> outbound_id_from_token(const ProgressToken& token) {
    if (const auto* id = std::get_if<std::int64_t>(&token)) {
        return *id;
    }
    const auto& text = std::get<std::string>(token);
    std::int64_t value = 0;
    const auto* end = text.data() + text.size();
    const auto [ptr, ec] = std::from_chars(text.data(), end, value);
    if ((ec != std::errc{}) || (ptr != end)) {
        return std::nullopt;
    }
    return value;
}

std::string token_text(const ProgressToken& token) {
    return std::visit([](const auto& value) { return Json(value).dump(); }, token);
}

// A rejected message still gets an answer when it names a method and an id.
std::optional<RequestId> answerable_id(const Json& raw) {
    if (!raw.is_object() || !raw.contains("method") || !raw.contains("id")) {
        return std::nullopt;
    }
    auto id = RequestId::from_json(raw.at("id"));
    if (!id) {
        return std::nullopt;
    }
    return *id;
}

asio::awaitable<ProtocolResult<void>> not_connected_result() {
    co_return tl::unexpected(ProtocolError::not_connected());
}

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// RequestContext
// ═══════════════════════════════════════════════════════════════════════════

std::optional<ProgressToken> RequestContext::progress_token() const {
    if (!meta || (meta->is_object() == false)) {
        return std::nullopt;
    }
    const auto token = meta->find("progressToken");
    if (token == meta->end()) {
        return std::nullopt;
    }
    if (token->is_number_integer()) {
        return ProgressToken{token->get<std::int64_t>()};
    }
    if (token->is_string()) {
        return ProgressToken{token->get<std::string>()};
    }
    return std::nullopt;
}

// ═══════════════════════════════════════════════════════════════════════════
// ResponseSlot
// ═══════════════════════════════════════════════════════════════════════════

void Protocol::ResponseSlot::complete(ProtocolResult<Json> outcome) && {
    auto channel = std::exchange(channel_, nullptr);
    if (channel) {
        channel->try_send(asio::error_code{}, std::move(outcome));
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// Construction / Destruction
// ═══════════════════════════════════════════════════════════════════════════

Protocol::Protocol(ProtocolOptions options)
    : options_(std::move(options))
    , timer_service_(options_.timer_service)
{
    install_request_handler(
        methods::Ping,
        [](JsonRpcRequest, RequestContext) -> asio::awaitable<HandlerResult> {
            co_return Json::object();
        },
        true
    );

    notification_handlers_[methods::Cancelled] = [this](const JsonRpcNotification& n) {
        handle_cancelled(n);
    };
    notification_handlers_[methods::Progress] = [this](const JsonRpcNotification& n) {
        handle_progress(n);
    };
}

Protocol::~Protocol() {
    lifetime_.reset();

    if (timer_service_) {
        for (const auto& [id, info] : timeouts_) {
            timer_service_->cancel(info.timer);
        }
    }
    timeouts_.clear();
    progress_handlers_.clear();

    if (transport_) {
        transport_->clear_handlers();
    }

    // Waiting request() frames no longer touch the engine once resumed.
    auto pending = std::exchange(pending_, {});
    for (auto& [id, entry] : pending) {
        entry.cancel_registration.reset();
        std::move(entry.slot).complete(tl::unexpected(ProtocolError::connection_closed()));
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// Connection Lifecycle
// ═══════════════════════════════════════════════════════════════════════════

asio::awaitable<ProtocolResult<void>> Protocol::connect(std::shared_ptr<ITransport> transport) {
    if (transport_ || connected_once_) {
        co_return tl::unexpected(ProtocolError::already_connected());
    }
    if (!transport) {
        co_return tl::unexpected(ProtocolError::transport_error("No transport given"));
    }
    connected_once_ = true;

    executor_ = transport->get_executor();
    if (!timer_service_) {
        timer_service_ = std::make_shared<AsioTimerService>(executor_);
    }

    transport_ = transport;
    transport->set_handlers(TransportHandlers{
        [this](Json message) { handle_message(std::move(message)); },
        [this](const TransportError& error) {
            report_error(ProtocolError::transport_error(error.message));
        },
        [this]() { handle_transport_close(); }
    });

    std::weak_ptr<bool> alive = lifetime_;
    auto started = co_await transport->async_start();
    if (!started) {
        transport->clear_handlers();
        if (!alive.expired() && (transport_ == transport)) {
            transport_.reset();
            connected_once_ = false;
        }
        co_return tl::unexpected(ProtocolError::transport_error(started.error().message));
    }
    MCPRT_LOG_DEBUG("Protocol connected to transport");
    co_return ProtocolResult<void>{};
}

asio::awaitable<void> Protocol::close() {
    if (!transport_) {
        co_return;
    }
    auto transport = transport_;
    std::weak_ptr<bool> alive = lifetime_;
    co_await transport->async_close();

    // A transport that did not report its close is torn down here.
    if (!alive.expired() && (transport_ == transport)) {
        handle_transport_close();
    }
}

void Protocol::handle_transport_close() {
    if (!transport_) {
        return;
    }

    auto transport = std::exchange(transport_, nullptr);
    transport->clear_handlers();
    // We may be running inside one of the transport's own members.
    asio::post(executor_, [transport = std::move(transport)]() {});

    auto pending = std::exchange(pending_, {});
    progress_handlers_.clear();
    for (const auto& [id, info] : timeouts_) {
        timer_service_->cancel(info.timer);
    }
    timeouts_.clear();

    auto inbound = std::exchange(inbound_, {});
    for (auto& [key, entry] : inbound) {
        entry.source.cancel("Connection closed");
    }

    MCPRT_LOG_DEBUG("Protocol connection closed with " + std::to_string(pending.size()) +
                    " pending request(s)");

    auto on_close = on_close_;
    if (on_close) {
        on_close();
    }

    for (auto& [id, entry] : pending) {
        entry.cancel_registration.reset();
        std::move(entry.slot).complete(tl::unexpected(ProtocolError::connection_closed()));
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// Outbound Requests
// ═══════════════════════════════════════════════════════════════════════════

asio::awaitable<ProtocolResult<Json>> Protocol::request(
    std::string method,
    std::optional<Json> params,
    RequestOptions options,
    ResultValidator validator
) {
    if (!transport_) {
        co_return tl::unexpected(ProtocolError::not_connected());
    }
    if (options_.enforce_strict_capabilities) {
        assert_capability_for_method(method);
    }
    if (options.signal && options.signal->is_cancelled()) {
        co_return tl::unexpected(ProtocolError::cancelled(options.signal->reason()));
    }

    const std::int64_t id = next_request_id_++;

    if (options.on_progress) {
        if (!params) {
            params = Json::object();
        }
        if (params->is_object()) {
            (*params)["_meta"]["progressToken"] = id;
        }
    }

    auto channel = std::make_shared<ResponseChannel>(executor_, 1);

    PendingRequest entry;
    entry.method = method;
    entry.slot = ResponseSlot(channel);
    entry.validator = std::move(validator);
    pending_.emplace(id, std::move(entry));

    if (options.on_progress) {
        progress_handlers_.emplace(id, std::move(options.on_progress));
    }

    if (options.signal) {
        std::weak_ptr<bool> alive = lifetime_;
        auto registration = options.signal->on_cancel([this, id, alive, executor = executor_](const Json& reason) {
            asio::dispatch(executor, [this, id, alive, reason]() {
                if (alive.expired()) {
                    return;
                }
                cancel_outbound(id, ProtocolError::cancelled(reason), reason_text(reason));
            });
        });
        if (auto it = pending_.find(id); it != pending_.end()) {
            it->second.cancel_registration = std::move(registration);
        }
    }

    TimeoutInfo timeout;
    timeout.start_time = timer_service_->now();
    timeout.timeout = options.timeout.value_or(options_.default_request_timeout);
    timeout.max_total_timeout = options.max_total_timeout;
    timeout.reset_on_progress = options.reset_timeout_on_progress;
    if (pending_.contains(id)) {
        arm_timeout(id, timeout);
    }

    MCPRT_LOG_DEBUG("Sending request " + std::to_string(id) + ": " + method);

    auto transport = transport_;
    std::weak_ptr<bool> alive = lifetime_;
    if (pending_.contains(id)) {
        JsonRpcRequest message(method, RequestId::integer(id), std::move(params));
        auto sent = co_await transport->async_send(message.to_json());
        if (!sent && !alive.expired()) {
            settle(id, tl::unexpected(ProtocolError::transport_error(sent.error().message)));
        }
    }

    try {
        co_return co_await channel->async_receive(asio::use_awaitable);
    } catch (const std::system_error& e) {
        if (!alive.expired()) {
            settle(id, tl::unexpected(ProtocolError::transport_error(e.what())));
        }
        co_return tl::unexpected(ProtocolError::transport_error(e.what()));
    }
}

asio::awaitable<ProtocolResult<void>> Protocol::notification(
    std::string method,
    std::optional<Json> params
) {
    if (!transport_) {
        co_return tl::unexpected(ProtocolError::not_connected());
    }
    assert_notification_capability(method);

    auto transport = transport_;
    JsonRpcNotification message(std::move(method), std::move(params));
    auto sent = co_await transport->async_send(message.to_json());
    if (!sent) {
        co_return tl::unexpected(ProtocolError::transport_error(sent.error().message));
    }
    co_return ProtocolResult<void>{};
}

void Protocol::settle(std::int64_t id, ProtocolResult<Json> outcome) {
    auto node = pending_.extract(id);
    if (node.empty()) {
        return;
    }
    progress_handlers_.erase(id);
    clear_timeout(id);
    node.mapped().cancel_registration.reset();
    std::move(node.mapped().slot).complete(std::move(outcome));
}

void Protocol::cancel_outbound(std::int64_t id, ProtocolError error, std::string reason) {
    if (pending_.contains(id) == false) {
        return;
    }
    settle(id, tl::unexpected(std::move(error)));

    CancelledNotification cancelled;
    cancelled.request_id = RequestId::integer(id);
    cancelled.reason = std::move(reason);
    send_detached(JsonRpcNotification(methods::Cancelled, cancelled.to_json()).to_json(),
                  "cancellation notice");
}

void Protocol::send_detached(Json message, std::string what) {
    if (!transport_) {
        return;
    }
    auto transport = transport_;
    std::weak_ptr<bool> alive = lifetime_;
    asio::co_spawn(
        executor_,
        [this, transport, alive, message = std::move(message), what = std::move(what)]() mutable
            -> asio::awaitable<void> {
            auto sent = co_await transport->async_send(std::move(message));
            if (!sent && !alive.expired()) {
                report_error(ProtocolError::transport_error(
                    "Failed to send " + what + ": " + sent.error().message));
            }
        },
        asio::detached
    );
}

// ═══════════════════════════════════════════════════════════════════════════
// Timeouts
// ═══════════════════════════════════════════════════════════════════════════

void Protocol::arm_timeout(std::int64_t id, TimeoutInfo info) {
    info.timer = timer_service_->schedule(info.timeout, [this, id]() { on_timeout(id); });
    timeouts_.insert_or_assign(id, info);
}

void Protocol::on_timeout(std::int64_t id) {
    const auto it = timeouts_.find(id);
    if (it == timeouts_.end()) {
        return;
    }
    const auto timeout = it->second.timeout;
    MCPRT_LOG_DEBUG("Request " + std::to_string(id) + " timed out after " +
                    std::to_string(timeout.count()) + "ms");
    cancel_outbound(id, ProtocolError::request_timeout(timeout.count()), "Request timed out");
}

void Protocol::clear_timeout(std::int64_t id) {
    const auto it = timeouts_.find(id);
    if (it == timeouts_.end()) {
        return;
    }
    timer_service_->cancel(it->second.timer);
    timeouts_.erase(it);
}

ProtocolResult<void> Protocol::reset_timeout(std::int64_t id) {
    const auto it = timeouts_.find(id);
    if (it == timeouts_.end()) {
        return ProtocolResult<void>{};
    }

    TimeoutInfo info = it->second;
    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        timer_service_->now() - info.start_time);
    if (info.max_total_timeout && (elapsed >= *info.max_total_timeout)) {
        return tl::unexpected(ProtocolError::max_total_timeout_exceeded(
            info.max_total_timeout->count(), elapsed.count()));
    }

    timer_service_->cancel(info.timer);
    arm_timeout(id, info);
    return ProtocolResult<void>{};
}

// ═══════════════════════════════════════════════════════════════════════════
// Inbound Dispatch
// ═══════════════════════════════════════════════════════════════════════════

void Protocol::handle_message(Json raw) {
    auto parsed = parse_message(raw);
    if (!parsed) {
        if (auto id = answerable_id(raw)) {
            MCPRT_LOG_WARN("Rejecting invalid request " + to_string(*id) + ": " + parsed.error().message);
            const int code = (parsed.error().code == JsonError::Code::InvalidParams)
                ? ErrorCode::InvalidParams
                : ErrorCode::InvalidRequest;
            JsonRpcErrorResponse response{*id, McpError{code, parsed.error().message, std::nullopt}};
            send_detached(response.to_json(), "error response");
            return;
        }
        MCPRT_LOG_WARN("Dropping malformed message: " + parsed.error().message);
        report_error(ProtocolError::protocol_error("Invalid JSON-RPC message: " + parsed.error().message));
        return;
    }

    if (auto* request = std::get_if<JsonRpcRequest>(&*parsed)) {
        handle_request(std::move(*request));
    } else if (auto* notification = std::get_if<JsonRpcNotification>(&*parsed)) {
        handle_notification(*notification);
    } else if (auto* response = std::get_if<JsonRpcResponse>(&*parsed)) {
        handle_response(response->id, std::move(response->result));
    } else {
        auto& error = std::get<JsonRpcErrorResponse>(*parsed);
        if (!error.id) {
            report_error(ProtocolError::from_rpc_error(std::move(error.error)));
            return;
        }
        handle_response(*error.id, tl::unexpected(ProtocolError::from_rpc_error(std::move(error.error))));
    }
}

void Protocol::handle_response(const RequestId& id, ProtocolResult<Json> outcome) {
    const auto* numeric = std::get_if<std::int64_t>(&id.value);
    const auto it = (numeric != nullptr) ? pending_.find(*numeric) : pending_.end();
    if (it == pending_.end()) {
        MCPRT_LOG_WARN("Received response for unknown request ID: " + to_string(id));
        report_error(ProtocolError::protocol_error(
            "Received a response for an unknown message ID: " + to_string(id)));
        return;
    }

    const std::int64_t key = *numeric;
    auto validator = it->second.validator;
    if (outcome && validator) {
        auto checked = validator(*outcome);
        if (checked) {
            outcome = std::move(*checked);
        } else {
            outcome = tl::unexpected(ProtocolError::invalid_result(
                "Invalid result for " + it->second.method + ": " + checked.error().message));
        }
    }
    settle(key, std::move(outcome));
}

void Protocol::handle_request(JsonRpcRequest request) {
    AsyncRequestHandler handler;
    if (auto it = request_handlers_.find(request.method()); it != request_handlers_.end()) {
        handler = it->second;
    } else {
        handler = fallback_request_handler_;
    }

    if (!handler) {
        MCPRT_LOG_DEBUG("No handler for request: " + request.method());
        JsonRpcErrorResponse response{request.id(), McpError{ErrorCode::MethodNotFound, "Method not found", std::nullopt}};
        send_detached(response.to_json(), "error response");
        return;
    }

    MCPRT_LOG_DEBUG("Handling request: " + request.method());

    std::string key = request.id().key();
    const std::uint64_t serial = ++next_inbound_serial_;
    InboundRequest inbound;
    inbound.serial = serial;

    RequestContext context;
    context.signal = inbound.source.token();
    context.request_id = request.id();
    context.session_id = transport_ ? transport_->session_id() : std::nullopt;
    if (request.params() && request.params()->is_object() && request.params()->contains("_meta")) {
        context.meta = request.params()->at("_meta");
    }
    context.send_notification = [this, alive = std::weak_ptr<bool>(lifetime_)](JsonRpcNotification n) {
        if (alive.expired()) {
            return not_connected_result();
        }
        return notification(n.method(), n.params());
    };

    inbound_.insert_or_assign(key, std::move(inbound));
    asio::co_spawn(
        executor_,
        run_request_handler(std::move(handler), std::move(request), std::move(context), std::move(key), serial),
        asio::detached
    );
}

asio::awaitable<void> Protocol::run_request_handler(
    AsyncRequestHandler handler,
    JsonRpcRequest request,
    RequestContext context,
    std::string key,
    std::uint64_t serial
) {
    std::weak_ptr<bool> alive = lifetime_;
    const RequestId id = request.id();
    const CancellationToken signal = context.signal;

    Json response;
    try {
        auto result = co_await handler(std::move(request), std::move(context));
        if (result) {
            response = JsonRpcResponse{id, std::move(*result)}.to_json();
        } else {
            response = JsonRpcErrorResponse{id, std::move(result.error())}.to_json();
        }
    } catch (const McpException& e) {
        response = JsonRpcErrorResponse{id, e.to_error()}.to_json();
    } catch (const std::exception& e) {
        response = JsonRpcErrorResponse{id, McpError{ErrorCode::InternalError, e.what(), std::nullopt}}.to_json();
    } catch (...) {
        response = JsonRpcErrorResponse{id, McpError{ErrorCode::InternalError, "Unknown error", std::nullopt}}.to_json();
    }

    if (alive.expired()) {
        co_return;
    }
    if (auto it = inbound_.find(key); (it != inbound_.end()) && (it->second.serial == serial)) {
        inbound_.erase(it);
    }

    if (signal.is_cancelled()) {
        MCPRT_LOG_DEBUG("Discarding response for cancelled request " + to_string(id));
        co_return;
    }
    if (!transport_) {
        co_return;
    }

    auto transport = transport_;
    auto sent = co_await transport->async_send(std::move(response));
    if (!sent && !alive.expired()) {
        MCPRT_LOG_ERROR("Failed to send response: " + sent.error().message);
        report_error(ProtocolError::transport_error("Failed to send response: " + sent.error().message));
    }
}

void Protocol::handle_notification(const JsonRpcNotification& notification) {
    NotificationHandler handler;
    if (auto it = notification_handlers_.find(notification.method()); it != notification_handlers_.end()) {
        handler = it->second;
    } else {
        handler = fallback_notification_handler_;
    }
    if (!handler) {
        return;
    }

    try {
        handler(notification);
    } catch (const std::exception& e) {
        report_error(ProtocolError::protocol_error(
            "Uncaught error in notification handler: " + std::string(e.what())));
    } catch (...) {
        report_error(ProtocolError::protocol_error("Uncaught error in notification handler: unknown error"));
    }
}

void Protocol::handle_cancelled(const JsonRpcNotification& notification) {
    auto parsed = CancelledNotification::from_json(notification.params().value_or(Json::object()));
    if (!parsed) {
        report_error(ProtocolError::protocol_error("Invalid cancellation notification: " + parsed.error().message));
        return;
    }

    const auto it = inbound_.find(parsed->request_id.key());
    if (it == inbound_.end()) {
        return;
    }
    MCPRT_LOG_DEBUG("Peer cancelled request " + to_string(parsed->request_id));
    it->second.source.cancel(parsed->reason ? Json(*parsed->reason) : Json("Cancelled by peer"));
}

void Protocol::handle_progress(const JsonRpcNotification& notification) {
    auto parsed = ProgressNotification::from_json(notification.params().value_or(Json::object()));
    if (!parsed) {
        report_error(ProtocolError::protocol_error("Invalid progress notification: " + parsed.error().message));
        return;
    }

    const auto id = outbound_id_from_token(parsed->progress_token);
    const auto handler = id ? progress_handlers_.find(*id) : progress_handlers_.end();
    if (handler == progress_handlers_.end()) {
        report_error(ProtocolError::protocol_error(
            "Received a progress notification for an unknown token: " + token_text(parsed->progress_token)));
        return;
    }

    // Copied: the callback may issue requests of its own.
    auto callback = handler->second;

    const auto timeout = timeouts_.find(*id);
    if ((timeout != timeouts_.end()) && timeout->second.reset_on_progress) {
        auto reset = reset_timeout(*id);
        if (!reset) {
            cancel_outbound(*id, std::move(reset.error()), "Maximum total timeout exceeded");
            return;
        }
    }

    try {
        callback(*parsed);
    } catch (const std::exception& e) {
        report_error(ProtocolError::protocol_error(
            "Uncaught error in progress handler: " + std::string(e.what())));
    } catch (...) {
        report_error(ProtocolError::protocol_error("Uncaught error in progress handler: unknown error"));
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// Handler Registration
// ═══════════════════════════════════════════════════════════════════════════

void Protocol::set_request_handler(const std::string& method, RequestHandler handler) {
    set_async_request_handler(
        method,
        [handler = std::move(handler)](JsonRpcRequest request, RequestContext context)
            -> asio::awaitable<HandlerResult> {
            co_return handler(request, context);
        }
    );
}

void Protocol::set_async_request_handler(const std::string& method, AsyncRequestHandler handler) {
    assert_request_handler_capability(method);

    if (request_handlers_.contains(method) && (replaceable_handlers_.contains(method) == false)) {
        throw UsageError("A request handler for " + method + " already exists, which would be overridden");
    }
    replaceable_handlers_.erase(method);
    request_handlers_.insert_or_assign(method, std::move(handler));
}

void Protocol::install_request_handler(const std::string& method, AsyncRequestHandler handler, bool replaceable) {
    request_handlers_.insert_or_assign(method, std::move(handler));
    if (replaceable) {
        replaceable_handlers_.insert(method);
    } else {
        replaceable_handlers_.erase(method);
    }
}

void Protocol::remove_request_handler(const std::string& method) {
    request_handlers_.erase(method);
    replaceable_handlers_.erase(method);
}

void Protocol::set_notification_handler(const std::string& method, NotificationHandler handler) {
    notification_handlers_.insert_or_assign(method, std::move(handler));
}

void Protocol::remove_notification_handler(const std::string& method) {
    notification_handlers_.erase(method);
}

void Protocol::set_fallback_request_handler(AsyncRequestHandler handler) {
    fallback_request_handler_ = std::move(handler);
}

void Protocol::set_fallback_notification_handler(NotificationHandler handler) {
    fallback_notification_handler_ = std::move(handler);
}

void Protocol::report_error(const ProtocolError& error) {
    auto callback = on_error_;
    if (callback) {
        callback(error);
    } else {
        MCPRT_LOG_WARN(std::string(to_string(error.code)) + ": " + error.message);
    }
}

}  // namespace mcprt
