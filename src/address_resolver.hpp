#pragma once

#include <string>
#include <vector>

#include "types.hpp"

struct InterfaceAddress {
  std::string interface_name;
  std::string address;
  AddressFamily family = AddressFamily::V4;
  bool internal = false;   // loopback
  bool link_local = false; // fe80::/10
};

// Picks the local address advertised as the stream return path.
class AddressResolver {
public:
  virtual ~AddressResolver() = default;

  // Empty interface_name means the system's default outbound interface.
  // Throws AddressResolutionError.
  virtual std::string resolve(AddressFamily family,
                              const std::string &interface_name) = 0;
};

class SystemAddressResolver : public AddressResolver {
public:
  std::string resolve(AddressFamily family,
                      const std::string &interface_name) override;

  // Interface owning the default route (IPv4 table first, then IPv6).
  static std::string default_interface();
  static std::vector<InterfaceAddress> list_addresses();
};

// Prefer a non-internal address of the requested family on interface_name,
// else the first non-internal address of any family there.
// Throws AddressResolutionError when the interface has none.
std::string choose_address(const std::vector<InterfaceAddress> &addresses,
                           const std::string &interface_name,
                           AddressFamily family);
