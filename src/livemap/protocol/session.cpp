#include "livemap/protocol/session.hpp"

#include <stdexcept>
#include <utility>

namespace livemap::protocol {

FeedSession::FeedSession(SessionOptions options, FrameHandler on_frame, data::DiagnosticLog &log)
    : options_(std::move(options)), on_frame_(std::move(on_frame)), log_(log),
      dispatcher_([this](const std::string &frame) { on_frame_(frame); },
                  [this] { transmit_ping(); }, options_.heartbeat_interval) {
    ws_.setUrl(options_.url);

    // Reconnects are driven by run(), immediately and without backoff.
    ws_.disableAutomaticReconnection();

    ws_.setOnMessageCallback([this](const ix::WebSocketMessagePtr &msg) { on_message(msg); });
}

FeedSession::~FeedSession() { ws_.close(); }

void FeedSession::run() {
    bool first_attempt = true;

    while (!stop_requested_.load(std::memory_order_relaxed)) {
        if (!connect_once()) {
            if (first_attempt) {
                throw std::runtime_error("Unable to establish a connection to the feed");
            }
            reconnects_.fetch_add(1, std::memory_order_relaxed);
            continue;
        }
        first_attempt = false;

        subscribe();
        dispatcher_.ping(Heartbeat::Clock::now());

        // Blocks until the connection is closed or fails.
        ws_.run();

        state_.store(ConnectionState::Disconnected, std::memory_order_relaxed);
        if (!stop_requested_.load(std::memory_order_relaxed)) {
            log_.add(data::DiagnosticType::Session, "Connection lost, reconnecting");
            reconnects_.fetch_add(1, std::memory_order_relaxed);
        }
    }
}

void FeedSession::stop() {
    stop_requested_.store(true, std::memory_order_relaxed);
    ws_.close();
}

bool FeedSession::connect_once() {
    state_.store(ConnectionState::Connecting, std::memory_order_relaxed);

    const ix::WebSocketInitResult result = ws_.connect(options_.connect_timeout_secs);
    if (!result.success) {
        state_.store(ConnectionState::Error, std::memory_order_relaxed);
        log_.add(data::DiagnosticType::Error, "Connection failed: " + result.errorStr,
                 "http status " + std::to_string(result.http_status));
        return false;
    }

    state_.store(ConnectionState::Connected, std::memory_order_relaxed);
    log_.add(data::DiagnosticType::Session, "Connected");
    return true;
}

void FeedSession::subscribe() {
    for (const auto &command : subscription_commands(options_)) {
        const auto info = ws_.sendText(command);
        if (!info.success) {
            log_.add(data::DiagnosticType::Warning, "Failed to send command", command);
        }
    }
}

void FeedSession::transmit_ping() {
    const auto info = ws_.sendText(kPingCommand);
    if (!info.success) {
        log_.add(data::DiagnosticType::Warning, "Failed to send keepalive");
    }
}

std::vector<std::string> FeedSession::subscription_commands(const SessionOptions &options) {
    std::vector<std::string> commands;
    commands.reserve(2 + options.topics.size() * 2);
    commands.push_back("BBOX " + options.bbox + " " + std::to_string(options.zoom) +
                       " tenant=" + options.tenant);
    commands.push_back("BUFFER " + std::to_string(options.buffer) + " " +
                       std::to_string(options.buffer));
    for (const auto &topic : options.topics) {
        commands.push_back("GET " + topic);
        commands.push_back("SUB " + topic);
    }
    return commands;
}

void FeedSession::on_message(const ix::WebSocketMessagePtr &msg) {
    switch (msg->type) {
    case ix::WebSocketMessageType::Open:
        state_.store(ConnectionState::Connected, std::memory_order_relaxed);
        break;

    case ix::WebSocketMessageType::Close:
        state_.store(ConnectionState::Disconnected, std::memory_order_relaxed);
        log_.add(data::DiagnosticType::Session, "Closed by remote",
                 std::to_string(msg->closeInfo.code) + " " + msg->closeInfo.reason);
        break;

    case ix::WebSocketMessageType::Error:
        state_.store(ConnectionState::Error, std::memory_order_relaxed);
        log_.add(data::DiagnosticType::Error, "Connection error: " + msg->errorInfo.reason);
        break;

    default:
        break;
    }

    // With automatic reconnection disabled, ws_.run() returns by itself
    // once the transport is no longer connected.
    const FrameAction action =
        dispatcher_.dispatch(msg->type, msg->binary, msg->str, Heartbeat::Clock::now());
    if (action == FrameAction::Forwarded) {
        frames_received_.fetch_add(1, std::memory_order_relaxed);
    }
}

FrameDispatcher::FrameDispatcher(FrameHandler on_frame, PingSender send_ping,
                                 Heartbeat::Clock::duration interval)
    : on_frame_(std::move(on_frame)), send_ping_(std::move(send_ping)), heartbeat_(interval) {}

FrameAction FrameDispatcher::dispatch(ix::WebSocketMessageType type, bool binary,
                                      const std::string &payload,
                                      Heartbeat::Clock::time_point now) {
    FrameAction action = FrameAction::Ignored;

    switch (type) {
    case ix::WebSocketMessageType::Message:
        if (!binary) {
            on_frame_(payload);
            ++frames_forwarded_;
            action = FrameAction::Forwarded;
        }
        break;

    case ix::WebSocketMessageType::Ping:
    case ix::WebSocketMessageType::Pong:
    case ix::WebSocketMessageType::Fragment:
        break;

    case ix::WebSocketMessageType::Close:
        return FrameAction::Closed;

    case ix::WebSocketMessageType::Error:
        return FrameAction::Failed;

    case ix::WebSocketMessageType::Open:
        return FrameAction::Ignored;
    }

    if (heartbeat_.due(now)) {
        ping(now);
    }
    return action;
}

void FrameDispatcher::ping(Heartbeat::Clock::time_point now) {
    send_ping_();
    ++pings_sent_;
    heartbeat_.reset(now);
}

} // namespace livemap::protocol
