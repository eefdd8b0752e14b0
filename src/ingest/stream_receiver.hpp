#pragma once
#include <asio.hpp>
#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <vector>
#include "protocol.hpp"
#include "stats.hpp"

namespace goesrx {

// Cuts an arbitrary byte stream into frame-sized transport units.
class UnitFramer {
public:
    using Handler = std::function<void(TransportUnit&&)>;

    UnitFramer(const MissionProfile& profile, Stats& stats, Handler handler);

    void feed(const uint8_t* data, size_t len);
    // End of stream: discards the partial tail and returns its size.
    size_t finish();
    // Connection lost: drops the partial frame.
    void reset();
    size_t buffered() const { return inbuf_.size(); }

private:
    size_t discard_tail(const char* why);

    MissionProfile profile_;
    Stats& stats_;
    Handler handler_;
    std::vector<uint8_t> inbuf_;
};

struct ReceiverConfig {
    std::string host{"127.0.0.1"};
    uint16_t port{5004};
    std::chrono::milliseconds reconnect_delay{5000};
    size_t read_size{64 * 1024};
};

class TcpStreamReceiver : public std::enable_shared_from_this<TcpStreamReceiver> {
public:
    using tcp = asio::ip::tcp;
    // Returns true to reconnect after `reconnect_delay`, false to give up.
    using DisconnectHandler = std::function<bool(const std::error_code&)>;
    // Called on every successful connect; `reconnect` is false for the first one.
    using ConnectHandler = std::function<void(bool reconnect)>;

    TcpStreamReceiver(asio::io_context& io, const ReceiverConfig& cfg, UnitFramer& framer);

    void on_connect(ConnectHandler h) { on_connect_ = std::move(h); }
    void on_disconnect(DisconnectHandler h) { on_disconnect_ = std::move(h); }
    void start();
    void stop();

private:
    void connect_one();
    void do_read();
    void lost(const std::error_code& ec, const char* what);

    asio::io_context& io_;
    ReceiverConfig cfg_;
    UnitFramer& framer_;
    tcp::socket sock_;
    asio::steady_timer timer_;
    std::vector<uint8_t> read_buf_;
    ConnectHandler on_connect_;
    DisconnectHandler on_disconnect_;
    bool connected_once_{false};
    bool stopped_{false};
};

// Feeds a capture of concatenated units through the framer, then finishes it.
bool replay_file(const std::string& path, UnitFramer& framer, std::string& err);

} // namespace goesrx
