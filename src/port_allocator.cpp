#include "port_allocator.hpp"

#include <string>

#include <boost/asio/ip/udp.hpp>

#include "errors.hpp"

int PortAllocator::allocate() {
  using boost::asio::ip::udp;

  std::string last_error = "port already reserved";
  for (int attempt = 0; attempt < kMaxAttempts; ++attempt) {
    boost::system::error_code ec;
    udp::socket sock(io_);
    sock.open(udp::v4(), ec);
    if (!ec)
      sock.bind(udp::endpoint(udp::v4(), 0), ec);
    if (ec) {
      last_error = ec.message();
      continue;
    }
    const int port = sock.local_endpoint(ec).port();
    if (ec) {
      last_error = ec.message();
      continue;
    }
    sock.close(ec);
    if (reserved_.insert(port).second)
      return port;
  }
  throw PortAllocationError("No ephemeral UDP port available: " + last_error);
}

void PortAllocator::release(int port) { reserved_.erase(port); }
