#include "network/gateway.hpp"
#include <boost/beast/core.hpp>
#include <boost/log/trivial.hpp>
#include <cstdint>
#include <limits>
#include <system_error>
#include "utils/url.hpp"

namespace xs {
namespace network {

namespace http = boost::beast::http;
using stream_protocol = boost::asio::local::stream_protocol;

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

Gateway::Gateway(store::Store store, std::size_t workers)
  : store_(std::move(store))
  , socket_path_(store_.path() / "sock")
  , workers_(workers) {
  BOOST_LOG_TRIVIAL(info) << "Gateway: Initializing gateway on " << socket_path_.string();
}

Gateway::~Gateway() {
  shutdown();
}


//==============================================
// INITIALIZATION AND TEARDOWN
//==============================================

bool Gateway::start() {
  if (is_running_) {
    BOOST_LOG_TRIVIAL(warning) << "Gateway: Gateway already running";
    return false;
  }

  try {
    // A socket file left behind by an earlier process would make bind fail
    std::error_code ec;
    std::filesystem::remove(socket_path_, ec);

    acceptor_ = std::make_unique<stream_protocol::acceptor>(
      io_context_,
      stream_protocol::endpoint(socket_path_.string())
    );
    pool_ = std::make_unique<utils::ThreadPool>(workers_);

    is_running_ = true;
    io_context_.restart();

    BOOST_LOG_TRIVIAL(debug) << "Gateway: Starting to accept connections";
    start_accept();

    io_thread_ = std::make_unique<std::thread>([this]() {
      try {
        io_context_.run();
      } catch (const std::exception& e) {
        BOOST_LOG_TRIVIAL(error) << "Gateway: IO context error: " << e.what();
        is_running_ = false;
      }
    });

    BOOST_LOG_TRIVIAL(info) << "Gateway: Listening on " << socket_path_.string();
    return true;
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Gateway: Failed to start gateway: " << e.what();
    acceptor_.reset();
    pool_.reset();
    is_running_ = false;
    return false;
  }
}

void Gateway::shutdown() {
  if (!is_running_.exchange(false)) {
    return;
  }

  BOOST_LOG_TRIVIAL(info) << "Gateway: Initiating gateway shutdown";

  // Stop accepting new connections
  boost::asio::post(io_context_, [this]() {
    boost::system::error_code ec;
    acceptor_->close(ec);
    if (ec) {
      BOOST_LOG_TRIVIAL(error) << "Gateway: Error closing acceptor: " << ec.message();
    }
  });

  // Unblock workers waiting on idle connections
  {
    std::lock_guard<std::mutex> lock(connections_mutex_);
    for (const auto& socket : connections_) {
      boost::system::error_code ec;
      socket->shutdown(stream_protocol::socket::shutdown_both, ec);
    }
  }

  if (io_thread_ && io_thread_->joinable()) {
    io_thread_->join();
  }
  io_thread_.reset();
  pool_.reset();
  acceptor_.reset();

  std::error_code ec;
  std::filesystem::remove(socket_path_, ec);

  BOOST_LOG_TRIVIAL(info) << "Gateway: Gateway shutdown complete";
}


//==============================================
// CONNECTION HANDLING
//==============================================

void Gateway::start_accept() {
  if (!acceptor_ || !is_running_) {
    return;
  }

  auto socket = std::make_shared<Socket>(io_context_);

  acceptor_->async_accept(*socket,
    [this, socket](const boost::system::error_code& error) {
      if (error) {
        if (error != boost::asio::error::operation_aborted) {
          BOOST_LOG_TRIVIAL(error) << "Gateway: Accept error: " << error.message();
        }
      } else {
        {
          std::lock_guard<std::mutex> lock(connections_mutex_);
          connections_.insert(socket);
        }
        // Blocks while every worker is busy, which holds back further accepts
        pool_->execute([this, socket]() { serve_connection(socket); });
      }

      if (is_running_) {
        start_accept();
      }
    });
}

void Gateway::serve_connection(std::shared_ptr<Socket> socket) {
  if (!is_running_) {
    // Accepted just before shutdown; nothing will unblock a read on it
    std::lock_guard<std::mutex> lock(connections_mutex_);
    connections_.erase(socket);
    return;
  }

  boost::beast::flat_buffer buffer;
  Request parser;
  // Bodies are streamed into the CAS, so they have no size cap
  parser.body_limit((std::numeric_limits<std::uint64_t>::max)());

  try {
    http::read_header(*socket, buffer, parser);
    BOOST_LOG_TRIVIAL(debug) << "Gateway: " << parser.get().method_string() << " " << parser.get().target();

    // One request per connection
    Response response = handle_request(*socket, buffer, parser);
    response.keep_alive(false);
    response.prepare_payload();
    http::write(*socket, response);

    boost::system::error_code ec;
    socket->shutdown(stream_protocol::socket::shutdown_send, ec);
  } catch (const boost::system::system_error& e) {
    if (e.code() != http::error::end_of_stream) {
      BOOST_LOG_TRIVIAL(warning) << "Gateway: Connection error: " << e.what();
    }
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Gateway: Failed to serve connection: " << e.what();
  }

  std::lock_guard<std::mutex> lock(connections_mutex_);
  connections_.erase(socket);
}

Gateway::Response Gateway::handle_request(Socket& socket, boost::beast::flat_buffer& buffer, Request& parser) {
  const unsigned version = parser.get().version();
  try {
    switch (parser.get().method()) {
      case http::verb::get:
        return handle_get(version);
      case http::verb::post:
        return handle_post(socket, buffer, parser);
      default:
        return not_found(version);
    }
  } catch (const boost::system::system_error&) {
    // Socket failures: no response can be written
    throw;
  } catch (const std::invalid_argument& e) {
    BOOST_LOG_TRIVIAL(warning) << "Gateway: Rejected request: " << e.what();
    Response response{http::status::bad_request, version};
    response.set(http::field::content_type, "text/plain");
    response.body() = e.what();
    return response;
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Gateway: Request failed: " << e.what();
    Response response{http::status::internal_server_error, version};
    response.set(http::field::content_type, "text/plain");
    response.body() = e.what();
    return response;
  }
}


//==============================================
// REQUEST HANDLERS
//==============================================

Gateway::Response Gateway::handle_get(unsigned version) {
  // Placeholder page, no routes are served over GET
  Response response{http::status::ok, version};
  response.set(http::field::content_type, "text/html");
  response.body() = "hai";
  return response;
}

Gateway::Response Gateway::handle_post(Socket& socket, boost::beast::flat_buffer& buffer, Request& parser) {
  const auto target = parser.get().target();
  // The topic is the decoded path; any query string is ignored
  std::string topic(target.data(), target.size());
  topic = topic.substr(0, topic.find('?'));
  if (!topic.empty() && topic.front() == '/') {
    topic.erase(0, 1);
  }
  topic = utils::url_decode(topic);
  if (topic.empty()) {
    topic = DEFAULT_TOPIC;
  }

  cas::Writer writer = store_.cas_writer();
  char chunk[8192];

  // Each pass fills chunk with whatever body bytes are available
  while (!parser.is_done()) {
    parser.get().body().data = chunk;
    parser.get().body().size = sizeof(chunk);

    boost::system::error_code ec;
    http::read(socket, buffer, parser, ec);
    if (ec == http::error::need_buffer) {
      ec = {};
    }
    if (ec) {
      throw boost::system::system_error(ec);
    }
    writer.write(chunk, sizeof(chunk) - parser.get().body().size);
  }

  store::FrameDraft draft = store::FrameDraft::with_topic(topic);
  draft.hash = writer.commit();
  store::Frame frame = store_.append(std::move(draft));
  BOOST_LOG_TRIVIAL(info) << "Gateway: Stored " << writer.bytes_written() << " bytes as " << frame.id
                          << " on topic '" << topic << "'";

  Response response{http::status::ok, parser.get().version()};
  response.set(http::field::content_type, "application/json");
  response.body() = store::serialize_frame(frame);
  return response;
}

Gateway::Response Gateway::not_found(unsigned version) {
  return Response{http::status::not_found, version};
}

} // namespace network
} // namespace xs
