#include <gtest/gtest.h>
#include <future>
#include <thread>
#include "common/restful/http_server.hpp"

using namespace std::chrono_literals;

namespace {

// Answers every request after a short pause, signalling when it has started.
class SlowHandler : public common::RestApiHandlerBase {
public:
  std::promise<void> started;

protected:
  http::response<http::string_body> doHandleRequest(
      http::request<http::string_body, http::basic_fields<std::allocator<char>>>&& req) override {
    started.set_value();
    std::this_thread::sleep_for(300ms);
    return createTextResponse(http::status::ok, "done " + std::string(req.target().data(), req.target().size()));
  }
};

} // namespace

TEST(HttpServerTest, StopFinishesInFlightRequestThenReturns) {
  net::io_context ioc;
  auto handler = std::make_shared<SlowHandler>();
  common::HttpServer server(ioc, tcp::endpoint{net::ip::make_address("127.0.0.1"), 0}, handler, 5s);
  server.run();
  std::thread runner([&ioc] { ioc.run(); });

  auto response = std::async(std::launch::async, [port = server.port()] {
    net::io_context client_ioc;
    tcp::socket socket(client_ioc);
    socket.connect(tcp::endpoint{net::ip::make_address("127.0.0.1"), port});
    http::request<http::string_body> req{http::verb::get, "/slow", 11};
    req.set(http::field::host, "localhost");
    http::write(socket, req);
    beast::flat_buffer buffer;
    http::response<http::string_body> res;
    http::read(socket, buffer, res);
    beast::error_code ec;
    socket.shutdown(tcp::socket::shutdown_both, ec);
    return res;
  });

  handler->started.get_future().wait();
  server.stop();

  auto res = response.get();
  EXPECT_EQ(res.result(), http::status::ok);
  EXPECT_EQ(res.body(), "done /slow");

  // No open sessions and a closed acceptor leave run() nothing to wait for.
  runner.join();
  EXPECT_TRUE(ioc.stopped());
}
