#pragma once

#include "livemap/data/diagnostic_log.hpp"

#include <ixwebsocket/IXWebSocket.h>

#include <atomic>
#include <chrono>
#include <functional>
#include <string>
#include <vector>

namespace livemap::protocol {

enum class ConnectionState { Disconnected, Connecting, Connected, Error };

/// Subscription parameters sent after every connect.
struct SessionOptions {
    std::string url;
    std::string bbox = "1152072 6048052 1433666 6205578";
    int zoom = 5;
    std::string tenant = "sbm";
    int buffer = 100;
    std::vector<std::string> topics = {
        "extra_geoms",
        "healthcheck",
        "sbm_newsticker",
        "station_schematic",
        "deleted_vehicles_schematic",
        "trajectory_schematic",
        "station",
        "deleted_vehicles",
        "trajectory",
    };
    std::chrono::seconds heartbeat_interval{10};
    int connect_timeout_secs = 10;
};

/// Keepalive bookkeeping. Checked after each received frame rather than
/// on a timer, so a silent connection only pings once something arrives
/// or the transport gives up.
class Heartbeat {
  public:
    using Clock = std::chrono::steady_clock;

    explicit Heartbeat(Clock::duration interval = std::chrono::seconds(10))
        : interval_(interval) {}

    void reset(Clock::time_point now) { last_ = now; }

    [[nodiscard]] bool due(Clock::time_point now) const { return now - last_ >= interval_; }

    [[nodiscard]] Clock::duration interval() const { return interval_; }

  private:
    Clock::duration interval_;
    Clock::time_point last_{};
};

inline constexpr char kPingCommand[] = "PING";

/// What the session did with one transport event.
enum class FrameAction { Forwarded, Ignored, Closed, Failed };

/// Per-frame policy of the read loop, kept apart from the socket.
/// Text frames go to the frame handler verbatim; binary, ping, pong and
/// fragment frames are dropped. After every received frame the keepalive
/// is checked and a ping goes out once the interval has elapsed. Close
/// and error events end the current connection and never ping.
class FrameDispatcher {
  public:
    using FrameHandler = std::function<void(const std::string &frame)>;
    using PingSender = std::function<void()>;

    FrameDispatcher(FrameHandler on_frame, PingSender send_ping,
                    Heartbeat::Clock::duration interval = std::chrono::seconds(10));

    FrameAction dispatch(ix::WebSocketMessageType type, bool binary, const std::string &payload,
                         Heartbeat::Clock::time_point now);

    /// Send a keepalive now and restart the interval.
    void ping(Heartbeat::Clock::time_point now);

    [[nodiscard]] size_t frames_forwarded() const { return frames_forwarded_; }
    [[nodiscard]] size_t pings_sent() const { return pings_sent_; }

  private:
    FrameHandler on_frame_;
    PingSender send_ping_;
    Heartbeat heartbeat_;
    size_t frames_forwarded_ = 0;
    size_t pings_sent_ = 0;
};

/// Streaming session against the realtime feed.
/// run() blocks: connect, subscribe, read until the transport closes or
/// fails, then reconnect immediately. Every text frame is handed to the
/// frame handler verbatim.
class FeedSession {
  public:
    using FrameHandler = std::function<void(const std::string &frame)>;

    FeedSession(SessionOptions options, FrameHandler on_frame, data::DiagnosticLog &log);
    ~FeedSession();

    FeedSession(const FeedSession &) = delete;
    FeedSession &operator=(const FeedSession &) = delete;

    /// Blocking outer loop. Throws std::runtime_error if the very first
    /// connection attempt fails; later failures only trigger a reconnect.
    void run();

    /// Ask run() to return after the current connection ends.
    void stop();

    [[nodiscard]] ConnectionState state() const { return state_.load(std::memory_order_relaxed); }

    [[nodiscard]] size_t frames_received() const {
        return frames_received_.load(std::memory_order_relaxed);
    }

    [[nodiscard]] size_t reconnects() const { return reconnects_.load(std::memory_order_relaxed); }

    /// Ordered command list sent after connect: BBOX, BUFFER, then a
    /// GET/SUB pair per topic.
    static std::vector<std::string> subscription_commands(const SessionOptions &options);

  private:
    bool connect_once();
    void subscribe();
    void transmit_ping();
    void on_message(const ix::WebSocketMessagePtr &msg);

    SessionOptions options_;
    FrameHandler on_frame_;
    data::DiagnosticLog &log_;
    ix::WebSocket ws_;
    FrameDispatcher dispatcher_;
    std::atomic<ConnectionState> state_{ConnectionState::Disconnected};
    std::atomic<bool> stop_requested_{false};
    std::atomic<size_t> frames_received_{0};
    std::atomic<size_t> reconnects_{0};
};

} // namespace livemap::protocol
