#pragma once

#include <cstddef>
#include <set>

#include <boost/asio/io_context.hpp>

// Hands out ephemeral UDP ports. A port stays reserved until released, so two
// live sessions never share one even if the kernel would hand it out again.
class PortAllocator {
public:
  explicit PortAllocator(boost::asio::io_context &io) : io_(io) {}

  // Throws PortAllocationError.
  int allocate();
  void release(int port);
  bool reserved(int port) const { return reserved_.count(port) != 0; }
  size_t reserved_count() const { return reserved_.size(); }

private:
  static constexpr int kMaxAttempts = 16;

  boost::asio::io_context &io_;
  std::set<int> reserved_;
};
