#pragma once

#include <atomic>
#include <filesystem>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include "store/store.hpp"
#include "utils/thread_pool.hpp"

namespace xs {
namespace network {

/*
  HTTP/1.1 gateway on a unix-domain socket at {store path}/sock.
    GET  *        placeholder page
    POST /topic   body goes to the CAS, a frame on topic references it
    other         404
  Connections are served one request each, on a worker pool.
*/
class Gateway {
public:
  using Socket = boost::asio::local::stream_protocol::socket;

  static constexpr std::size_t DEFAULT_WORKERS = 4;
  static constexpr const char* DEFAULT_TOPIC = "stream";

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit Gateway(store::Store store, std::size_t workers = DEFAULT_WORKERS);
  ~Gateway();

  Gateway(const Gateway&) = delete;
  Gateway& operator=(const Gateway&) = delete;


  // ---- INITIALIZATION AND TEARDOWN ----
  // Binds the socket and starts accepting; false if running or bind fails
  bool start();
  void shutdown();


  // ---- GETTERS ----
  const std::filesystem::path& socket_path() const { return socket_path_; }
  bool is_running() const { return is_running_; }

private:
  using Request = boost::beast::http::request_parser<boost::beast::http::buffer_body>;
  using Response = boost::beast::http::response<boost::beast::http::string_body>;

  // ---- PARAMETERS ----
  store::Store store_;
  std::filesystem::path socket_path_;
  const std::size_t workers_;
  std::atomic<bool> is_running_{false};

  boost::asio::io_context io_context_;
  std::unique_ptr<boost::asio::local::stream_protocol::acceptor> acceptor_;
  std::unique_ptr<std::thread> io_thread_;
  std::unique_ptr<utils::ThreadPool> pool_;

  // Open connections, so shutdown can unblock their workers
  std::mutex connections_mutex_;
  std::set<std::shared_ptr<Socket>> connections_;


  // ---- CONNECTION HANDLING ----
  void start_accept();
  void serve_connection(std::shared_ptr<Socket> socket);
  Response handle_request(Socket& socket, boost::beast::flat_buffer& buffer, Request& parser);


  // ---- REQUEST HANDLERS ----
  Response handle_get(unsigned version);
  // Streams the remaining body into the CAS and appends a frame for it
  Response handle_post(Socket& socket, boost::beast::flat_buffer& buffer, Request& parser);
  Response not_found(unsigned version);
};

} // namespace network
} // namespace xs
