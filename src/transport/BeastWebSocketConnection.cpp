#include "BeastWebSocketConnection.hpp"

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>

namespace st {
namespace {
namespace asio = boost::asio;
namespace beast = boost::beast;
namespace websocket = beast::websocket;
using tcp = asio::ip::tcp;

const std::chrono::seconds PING_INTERVAL(30);
const std::chrono::seconds IDLE_TIMEOUT(120);
const std::chrono::seconds CLOSE_WAIT(2);

typedef function<void(beast::error_code)> StepHandler;

struct PlainLayer {
  typedef websocket::stream<beast::tcp_stream> Stream;

  static unique_ptr<Stream> create(asio::io_context& ioContext,
                                   asio::ssl::context*) {
    return unique_ptr<Stream>(new Stream(ioContext));
  }

  static void handshake(Stream&, const string&, StepHandler handler) {
    handler(beast::error_code());
  }
};

struct TlsLayer {
  typedef websocket::stream<beast::ssl_stream<beast::tcp_stream>> Stream;

  static unique_ptr<Stream> create(asio::io_context& ioContext,
                                   asio::ssl::context* sslContext) {
    return unique_ptr<Stream>(new Stream(ioContext, *sslContext));
  }

  static void handshake(Stream& ws, const string& host, StepHandler handler) {
    if (!SSL_set_tlsext_host_name(ws.next_layer().native_handle(),
                                  host.c_str())) {
      handler(beast::error_code(static_cast<int>(::ERR_get_error()),
                                asio::error::get_ssl_category()));
      return;
    }
    ws.next_layer().set_verify_callback(asio::ssl::host_name_verification(host));
    ws.next_layer().async_handshake(asio::ssl::stream_base::client, handler);
  }
};

template <class Layer>
class BeastWebSocketConnection : public WebSocketConnection {
 public:
  explicit BeastWebSocketConnection(const WebSocketUrl& _url)
      : url(_url), pingTimer(ioContext), failed(false), closed(false),
        closeFinished(false) {
    if (url.secure) {
      sslContext.reset(new asio::ssl::context(asio::ssl::context::tls_client));
      sslContext->set_default_verify_paths();
      sslContext->set_verify_mode(asio::ssl::verify_peer);
    }
    ws = Layer::create(ioContext, sslContext.get());
  }

  virtual ~BeastWebSocketConnection() { close(); }

  void connect(std::chrono::milliseconds timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    tcp::resolver resolver(ioContext);
    tcp::resolver::results_type endpoints;
    runStep(
        deadline, "resolve",
        [this, &resolver, &endpoints](StepHandler handler) {
          resolver.async_resolve(
              url.host, url.port,
              [&endpoints, handler](beast::error_code ec,
                                    tcp::resolver::results_type results) {
                endpoints = results;
                handler(ec);
              });
        },
        [&resolver]() { resolver.cancel(); });
    runStep(deadline, "connect", [this, &endpoints](StepHandler handler) {
      beast::get_lowest_layer(*ws).async_connect(
          endpoints,
          [handler](beast::error_code ec, tcp::endpoint) { handler(ec); });
    });
    if (url.secure) {
      runStep(deadline, "TLS handshake", [this](StepHandler handler) {
        Layer::handshake(*ws, url.host, handler);
      });
    }

    ws->set_option(
        websocket::stream_base::decorator([](websocket::request_type& req) {
          req.set(beast::http::field::user_agent,
                  string("shareterm/") + ST_VERSION);
        }));
    string hostHeader = url.host + ":" + url.port;
    runStep(deadline, "WebSocket handshake",
            [this, &hostHeader](StepHandler handler) {
              ws->async_handshake(hostHeader, url.target, handler);
            });

    // The websocket layer enforces its own timeouts from here on
    beast::get_lowest_layer(*ws).expires_never();
    websocket::stream_base::timeout options;
    options.handshake_timeout = timeout;
    options.idle_timeout = IDLE_TIMEOUT;
    options.keep_alive_pings = false;
    ws->set_option(options);
    ws->text(true);
  }

  virtual void start(MessageHandler _onMessage, CloseHandler _onClose) {
    onMessage = _onMessage;
    onClose = _onClose;
    workGuard.reset(new asio::executor_work_guard<
                    asio::io_context::executor_type>(ioContext.get_executor()));
    ioContext.restart();
    asio::post(ioContext, [this]() {
      doRead();
      schedulePing();
    });
    ioThread = std::thread([this]() {
      el::Helpers::setThreadName("websocket-io");
      ioContext.run();
    });
  }

  virtual void send(const string& frame) {
    if (failed || closed) {
      throw runtime_error("WebSocket connection is closed");
    }
    asio::post(ioContext, [this, frame]() {
      writeQueue.push_back(frame);
      if (writeQueue.size() == 1) {
        writeNext();
      }
    });
  }

  virtual void close() {
    if (closed.exchange(true)) {
      return;
    }
    if (ioThread.joinable()) {
      asio::post(ioContext, [this]() {
        pingTimer.cancel();
        if (failed) {
          closeFinished = true;
          return;
        }
        ws->async_close(websocket::close_code::normal,
                        [this](beast::error_code ec) {
                          if (ec) {
                            VLOG(1) << "WebSocket close failed: "
                                    << ec.message();
                          }
                          closeFinished = true;
                        });
      });
      auto deadline = std::chrono::steady_clock::now() + CLOSE_WAIT;
      while (!closeFinished && std::chrono::steady_clock::now() < deadline) {
        ::usleep(10 * 1000);
      }
      workGuard.reset();
      ioContext.stop();
      ioThread.join();
    }
    beast::error_code ignored;
    beast::get_lowest_layer(*ws).socket().close(ignored);
  }

  virtual bool isOpen() const { return !failed && !closed; }

 protected:
  void runStep(std::chrono::steady_clock::time_point deadline,
               const string& stage, function<void(StepHandler)> initiate,
               function<void()> abort = function<void()>()) {
    bool done = false;
    beast::error_code result;
    ioContext.restart();
    initiate([&done, &result](beast::error_code ec) {
      result = ec;
      done = true;
    });
    while (!done && ioContext.run_one_until(deadline) > 0) {
    }
    if (!done) {
      // Abort the pending operation and let its handler run
      if (abort) {
        abort();
      } else {
        beast::error_code ignored;
        beast::get_lowest_layer(*ws).socket().close(ignored);
      }
      ioContext.restart();
      ioContext.run();
      throw runtime_error("WebSocket " + stage + " to " + url.host +
                          " timed out");
    }
    if (result) {
      throw runtime_error("WebSocket " + stage + " to " + url.host +
                          " failed: " + result.message());
    }
  }

  void doRead() {
    ws->async_read(readBuffer, [this](beast::error_code ec, size_t) {
      if (ec) {
        fail(ec == websocket::error::closed ? string("closed by server")
                                            : ec.message());
        return;
      }
      string frame = beast::buffers_to_string(readBuffer.data());
      bool binary = ws->got_binary();
      readBuffer.consume(readBuffer.size());
      onMessage(frame, binary);
      doRead();
    });
  }

  void schedulePing() {
    pingTimer.expires_after(PING_INTERVAL);
    pingTimer.async_wait([this](beast::error_code ec) {
      if (ec || failed || closed) {
        return;
      }
      ws->async_ping({}, [this](beast::error_code pingEc) {
        if (pingEc) {
          fail("ping failed: " + pingEc.message());
          return;
        }
        schedulePing();
      });
    });
  }

  void writeNext() {
    ws->async_write(asio::buffer(writeQueue.front()),
                    [this](beast::error_code ec, size_t) {
                      if (ec) {
                        fail("write failed: " + ec.message());
                        return;
                      }
                      writeQueue.pop_front();
                      if (!writeQueue.empty()) {
                        writeNext();
                      }
                    });
  }

  void fail(const string& reason) {
    if (failed.exchange(true)) {
      return;
    }
    pingTimer.cancel();
    writeQueue.clear();
    if (onClose) {
      onClose(reason);
    }
  }

  WebSocketUrl url;
  asio::io_context ioContext;
  unique_ptr<asio::ssl::context> sslContext;
  unique_ptr<typename Layer::Stream> ws;
  unique_ptr<asio::executor_work_guard<asio::io_context::executor_type>>
      workGuard;
  asio::steady_timer pingTimer;
  beast::flat_buffer readBuffer;
  deque<string> writeQueue;
  MessageHandler onMessage;
  CloseHandler onClose;
  std::thread ioThread;
  std::atomic<bool> failed;
  std::atomic<bool> closed;
  std::atomic<bool> closeFinished;
};

template <class Layer>
shared_ptr<WebSocketConnection> dial(const WebSocketUrl& url,
                                     std::chrono::milliseconds timeout) {
  shared_ptr<BeastWebSocketConnection<Layer>> connection(
      new BeastWebSocketConnection<Layer>(url));
  connection->connect(timeout);
  return connection;
}
}  // namespace

WebSocketUrl parseWebSocketUrl(const string& url) {
  WebSocketUrl result;
  string rest;
  if (startsWith(url, "wss://")) {
    result.secure = true;
    rest = url.substr(6);
  } else if (startsWith(url, "ws://")) {
    result.secure = false;
    rest = url.substr(5);
  } else {
    throw runtime_error("Not a WebSocket url: " + url);
  }

  size_t slash = rest.find('/');
  string authority = rest.substr(0, slash);
  result.target = slash == string::npos ? string("/") : rest.substr(slash);

  size_t colon = authority.rfind(':');
  size_t bracket = authority.rfind(']');
  if (colon != string::npos && (bracket == string::npos || colon > bracket)) {
    result.host = authority.substr(0, colon);
    result.port = authority.substr(colon + 1);
  } else {
    result.host = authority;
    result.port = result.secure ? "443" : "80";
  }
  if (result.host.size() >= 2 && result.host.front() == '[' &&
      result.host.back() == ']') {
    result.host = result.host.substr(1, result.host.size() - 2);
  }
  if (result.host.empty() || result.port.empty()) {
    throw runtime_error("Missing host in WebSocket url: " + url);
  }
  return result;
}

shared_ptr<WebSocketConnection> connectWebSocket(
    const string& url, std::chrono::milliseconds timeout) {
  WebSocketUrl parsed = parseWebSocketUrl(url);
  if (parsed.secure) {
    return dial<TlsLayer>(parsed, timeout);
  }
  return dial<PlainLayer>(parsed, timeout);
}
}  // namespace st
