#include <voxturn/transport/websocket_transport.hpp>

#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>

#include <voxturn/transport/wire_codec.hpp>

namespace voxturn {

StatusCode statusFromCloseCode(uint16_t code) {
  namespace cs = websocketpp::close::status;
  switch (code) {
    case cs::normal:                return StatusCode::Ok;
    case cs::going_away:            // server shutting down
    case cs::service_restart:
    case cs::try_again_later:
    case cs::abnormal_close:        // connection dropped without a close frame
      return StatusCode::Unavailable;
    case cs::policy_violation:      return StatusCode::PermissionDenied;
    case cs::unsupported_data:
    case cs::invalid_payload:
    case cs::message_too_big:       return StatusCode::InvalidArgument;
    case cs::internal_endpoint_error: return StatusCode::Internal;
    default:                        return StatusCode::Unknown;
  }
}

StatusCode statusFromHttpStatus(int http_status) {
  switch (http_status) {
    case 0:   return StatusCode::Unavailable; // never reached the server
    case 400: return StatusCode::InvalidArgument;
    case 401: return StatusCode::Unauthenticated;
    case 403: return StatusCode::PermissionDenied;
    case 408:
    case 504: return StatusCode::DeadlineExceeded;
    case 429:
    case 502:
    case 503: return StatusCode::Unavailable;
    default:  return StatusCode::Unknown;
  }
}

// ---------- one duplex call ----------

struct CallState {
  std::mutex mtx;
  std::condition_variable cv;
  bool open = false;
  bool closed = false;
  bool closed_locally = false;
  StatusCode status = StatusCode::Ok;
  std::string detail;
  std::deque<std::string> inbound;
};

class WebSocketCall : public AssistCall {
public:
  WebSocketCall(WebSocketTransport& transport,
                websocketpp::connection_hdl hdl,
                std::shared_ptr<CallState> state,
                std::chrono::steady_clock::time_point deadline)
  : transport_(transport), hdl_(std::move(hdl)), state_(std::move(state)), deadline_(deadline) {}

  ~WebSocketCall() override {
    closeConnection(websocketpp::close::status::normal, "turn complete", StatusCode::Cancelled);
  }

  bool write(const OutboundMessage& msg) override {
    if (!waitWritable()) return false;
    return send(wire::encodeOutbound(msg).dump());
  }

  void writesDone() override {
    if (!waitWritable()) return;
    send(wire::encodeAudioInDone().dump());
  }

  void cancel() override {
    closeConnection(websocketpp::close::status::going_away, "cancelled", StatusCode::Cancelled);
  }

  std::optional<InboundMessage> read() override {
    while (true) {
      std::unique_lock<std::mutex> lk(state_->mtx);
      if (!state_->cv.wait_until(lk, deadline_, [this]{ return !state_->inbound.empty() || state_->closed; })) {
        lk.unlock();
        closeConnection(websocketpp::close::status::going_away, "deadline", StatusCode::DeadlineExceeded);
        throw TransportError(StatusCode::DeadlineExceeded, "assist call exceeded its deadline");
      }
      if (!state_->inbound.empty()) {
        std::string payload = std::move(state_->inbound.front());
        state_->inbound.pop_front();
        lk.unlock();
        try {
          InboundMessage m = wire::parseInbound(payload);
          transport_.ctx_.log().debug("WS", wire::summarize(m));
          return m;
        } catch (const std::exception& e) {
          transport_.ctx_.log().warn("WS", std::string("dropping undecodable frame: ") + e.what());
          continue;
        }
      }
      // closed and drained
      if (state_->status == StatusCode::Ok) return std::nullopt;
      throw TransportError(state_->status, state_->detail);
    }
  }

private:
  // Waits for the handshake, then for the send buffer to drain below the limit.
  bool waitWritable() {
    {
      std::unique_lock<std::mutex> lk(state_->mtx);
      state_->cv.wait_until(lk, deadline_, [this]{ return state_->open || state_->closed; });
      if (!state_->open || state_->closed) return false;
    }
    while (true) {
      websocketpp::lib::error_code ec;
      auto con = transport_.client_.get_con_from_hdl(hdl_, ec);
      if (ec) return false;
      if (con->get_buffered_amount() <= transport_.opts_.max_buffered_bytes) return true;
      {
        std::lock_guard<std::mutex> lk(state_->mtx);
        if (state_->closed) return false;
      }
      if (std::chrono::steady_clock::now() >= deadline_) return false;
      std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
  }

  bool send(const std::string& payload) {
    websocketpp::lib::error_code ec;
    transport_.client_.send(hdl_, payload, websocketpp::frame::opcode::text, ec);
    if (ec) {
      transport_.ctx_.log().warn("WS", "send failed: " + ec.message());
      return false;
    }
    return true;
  }

  void closeConnection(websocketpp::close::status::value code, const std::string& reason, StatusCode status) {
    {
      std::lock_guard<std::mutex> lk(state_->mtx);
      if (state_->closed) return;
      state_->closed = true;
      state_->closed_locally = true;
      state_->status = status;
      state_->detail = reason;
    }
    state_->cv.notify_all();
    websocketpp::lib::error_code ec;
    transport_.client_.close(hdl_, code, reason, ec);
    if (ec) transport_.ctx_.log().debug("WS", "close: " + ec.message());
  }

  WebSocketTransport& transport_;
  websocketpp::connection_hdl hdl_;
  std::shared_ptr<CallState> state_;
  std::chrono::steady_clock::time_point deadline_;
};

// ---------- transport ----------

WebSocketTransport::WebSocketTransport(Context& ctx, Options opts)
: ctx_(ctx), opts_(std::move(opts)) {}

WebSocketTransport::~WebSocketTransport() { stop(); }

bool WebSocketTransport::start() {
  if (started_.load()) return true;
  try {
    client_.clear_access_channels(websocketpp::log::alevel::all);
    client_.init_asio();
    client_.start_perpetual();

    const bool verify = opts_.verify_peer;
    const std::string ca_file = opts_.ca_file;
    client_.set_tls_init_handler([verify, ca_file](websocketpp::connection_hdl) {
      auto ctx = std::make_shared<boost::asio::ssl::context>(boost::asio::ssl::context::tlsv12_client);
      ctx->set_options(boost::asio::ssl::context::default_workarounds |
                       boost::asio::ssl::context::no_sslv2 |
                       boost::asio::ssl::context::no_sslv3 |
                       boost::asio::ssl::context::single_dh_use);
      if (verify) {
        ctx->set_verify_mode(boost::asio::ssl::verify_peer);
        ctx->set_default_verify_paths();
        if (!ca_file.empty()) ctx->load_verify_file(ca_file);
      } else {
        ctx->set_verify_mode(boost::asio::ssl::verify_none);
      }
      return ctx;
    });

    io_thread_ = std::thread([this]() { client_.run(); });
    started_.store(true);
    ctx_.log().info("WS", "Connecting to " + opts_.endpoint);
    return true;
  } catch (const std::exception& e) {
    ctx_.log().error("WS", std::string("start() exception: ") + e.what());
    return false;
  }
}

void WebSocketTransport::stop() {
  if (!started_.load()) return;
  if (!stopped_.exchange(true)) {
    client_.stop_perpetual();
    if (io_thread_.joinable()) io_thread_.join();
  }
}

std::unique_ptr<AssistCall> WebSocketTransport::open(std::chrono::seconds deadline) {
  if (stopped_.load()) throw TransportError(StatusCode::Unavailable, "websocket transport stopped");
  if (!started_.load() && !start()) {
    throw TransportError(StatusCode::Unavailable, "websocket client failed to start");
  }

  websocketpp::lib::error_code ec;
  client_t::connection_ptr con = client_.get_connection(opts_.endpoint, ec);
  if (ec) {
    throw TransportError(StatusCode::InvalidArgument, "bad endpoint " + opts_.endpoint + ": " + ec.message());
  }
  if (!opts_.access_token.empty()) {
    con->replace_header("Authorization", std::string("Bearer ") + opts_.access_token);
  } else {
    ctx_.log().warn("WS", "No access token provided");
  }

  auto state = std::make_shared<CallState>();
  Context& ctx = ctx_;
  client_t& client = client_;

  con->set_open_handler([state](websocketpp::connection_hdl) {
    { std::lock_guard<std::mutex> lk(state->mtx); state->open = true; }
    state->cv.notify_all();
  });

  con->set_message_handler([state, &ctx](websocketpp::connection_hdl, client_t::message_ptr msg) {
    if (msg->get_opcode() != websocketpp::frame::opcode::text) {
      ctx.log().debug("WS", "ignoring binary frame");
      return;
    }
    { std::lock_guard<std::mutex> lk(state->mtx); state->inbound.push_back(msg->get_payload()); }
    state->cv.notify_all();
  });

  con->set_close_handler([state, &client](websocketpp::connection_hdl hdl) {
    websocketpp::lib::error_code cec;
    auto c = client.get_con_from_hdl(hdl, cec);
    {
      std::lock_guard<std::mutex> lk(state->mtx);
      if (!state->closed_locally && c) {
        state->status = statusFromCloseCode(c->get_remote_close_code());
        state->detail = "closed by server (" + std::to_string(c->get_remote_close_code()) + ") " +
                        c->get_remote_close_reason();
      }
      state->closed = true;
    }
    state->cv.notify_all();
  });

  con->set_fail_handler([state, &client, &ctx](websocketpp::connection_hdl hdl) {
    websocketpp::lib::error_code cec;
    auto c = client.get_con_from_hdl(hdl, cec);
    {
      std::lock_guard<std::mutex> lk(state->mtx);
      if (!state->closed_locally) {
        int http = c ? static_cast<int>(c->get_response_code()) : 0;
        state->status = statusFromHttpStatus(http);
        state->detail = "connection failed";
        if (http) state->detail += " (HTTP " + std::to_string(http) + ")";
        if (c) state->detail += ": " + c->get_ec().message();
      }
      state->closed = true;
    }
    state->cv.notify_all();
    ctx.log().debug("WS", "fail handler fired");
  });

  websocketpp::connection_hdl hdl = con->get_handle();
  client_.connect(con);

  auto until = std::chrono::steady_clock::now() + deadline;
  return std::make_unique<WebSocketCall>(*this, hdl, state, until);
}

} // namespace voxturn
