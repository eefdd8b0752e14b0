#include "stream_receiver.hpp"
#include "logging.hpp"
#include <fstream>

namespace goesrx {

UnitFramer::UnitFramer(const MissionProfile &profile, Stats &stats,
                       Handler handler)
    : profile_(profile), stats_(stats), handler_(std::move(handler)) {}

void UnitFramer::feed(const uint8_t *data, size_t len) {
  inbuf_.insert(inbuf_.end(), data, data + len);
  const size_t frame = profile_.frame_len;
  size_t off = 0;
  while (inbuf_.size() - off >= frame) {
    stats_.add(Counter::Frames);
    TransportUnit unit;
    if (!parse_unit(inbuf_.data() + off, frame, profile_, unit)) {
      Logger::instance().log(LogLevel::DEBUG,
                             "%s: implausible unit header %02x%02x",
                             error_name(ErrorKind::FramingError),
                             inbuf_[off], inbuf_[off + 1]);
      stats_.add(Counter::FramingErrors);
      off += frame;
      continue;
    }
    off += frame;
    if (unit.is_fill()) {
      stats_.add(Counter::FillUnits);
      continue;
    }
    handler_(std::move(unit));
  }
  if (off > 0)
    inbuf_.erase(inbuf_.begin(), inbuf_.begin() + off);
}

size_t UnitFramer::discard_tail(const char *why) {
  size_t tail = inbuf_.size();
  if (tail > 0) {
    Logger::instance().log(LogLevel::WARN, "%s: discarding %zu byte partial unit",
                           why, tail);
    stats_.add(Counter::PartialTailBytes, tail);
  }
  inbuf_.clear();
  return tail;
}

size_t UnitFramer::finish() { return discard_tail("end of stream"); }

void UnitFramer::reset() { discard_tail("connection lost"); }

TcpStreamReceiver::TcpStreamReceiver(asio::io_context &io,
                                     const ReceiverConfig &cfg,
                                     UnitFramer &framer)
    : io_(io), cfg_(cfg), framer_(framer), sock_(io), timer_(io),
      read_buf_(cfg.read_size) {}

void TcpStreamReceiver::start() { connect_one(); }

void TcpStreamReceiver::stop() {
  stopped_ = true;
  timer_.cancel();
  std::error_code ec;
  sock_.close(ec);
}

void TcpStreamReceiver::connect_one() {
  if (stopped_)
    return;
  std::error_code ec;
  tcp::resolver res(io_);
  auto results = res.resolve(cfg_.host, std::to_string(cfg_.port), ec);
  if (ec) {
    lost(ec, "resolve failed");
    return;
  }
  auto self = shared_from_this();
  asio::async_connect(
      sock_, results, [this, self](std::error_code ec, const tcp::endpoint &) {
        if (stopped_)
          return;
        if (ec) {
          lost(ec, "connect failed");
          return;
        }
        Logger::instance().log(LogLevel::INFO, "connected to %s:%u",
                               cfg_.host.c_str(), (unsigned)cfg_.port);
        bool reconnect = connected_once_;
        connected_once_ = true;
        if (on_connect_)
          on_connect_(reconnect);
        do_read();
      });
}

void TcpStreamReceiver::do_read() {
  auto self = shared_from_this();
  sock_.async_read_some(
      asio::buffer(read_buf_), [this, self](std::error_code ec, std::size_t n) {
        if (stopped_)
          return;
        if (ec) {
          framer_.reset();
          lost(ec, "read error");
          return;
        }
        framer_.feed(read_buf_.data(), n);
        do_read();
      });
}

void TcpStreamReceiver::lost(const std::error_code &ec, const char *what) {
  Logger::instance().log(LogLevel::WARN, "%s:%u %s: %s", cfg_.host.c_str(),
                         (unsigned)cfg_.port, what, ec.message().c_str());
  std::error_code ec2;
  sock_.close(ec2);
  if (!on_disconnect_ || !on_disconnect_(ec)) {
    Logger::instance().log(LogLevel::ERROR, "ingest socket lost, not reconnecting");
    stopped_ = true;
    return;
  }
  auto self = shared_from_this();
  timer_.expires_after(cfg_.reconnect_delay);
  timer_.async_wait([this, self](std::error_code ec) {
    if (!ec)
      connect_one();
  });
}

bool replay_file(const std::string &path, UnitFramer &framer,
                 std::string &err) {
  std::ifstream f(path, std::ios::binary);
  if (!f) {
    err = "cannot open " + path;
    return false;
  }
  std::vector<char> buf(64 * 1024);
  while (f) {
    f.read(buf.data(), (std::streamsize)buf.size());
    std::streamsize n = f.gcount();
    if (n > 0)
      framer.feed((const uint8_t *)buf.data(), (size_t)n);
  }
  if (f.bad()) {
    err = "read error on " + path;
    framer.finish();
    return false;
  }
  framer.finish();
  return true;
}

} // namespace goesrx
