#include "address_resolver.hpp"

#include <arpa/inet.h>
#include <ifaddrs.h>
#include <net/if.h>
#include <netinet/in.h>

#include <cstdlib>
#include <fstream>
#include <limits>
#include <sstream>

#include "errors.hpp"

namespace {
// /proc/net/route: Iface Destination Gateway Flags RefCnt Use Metric ...
std::string default_v4_interface() {
  std::ifstream in("/proc/net/route");
  if (!in)
    return "";
  std::string line;
  std::getline(in, line); // header
  std::string best;
  unsigned long best_metric = std::numeric_limits<unsigned long>::max();
  while (std::getline(in, line)) {
    std::istringstream ss(line);
    std::string iface, dest, gateway, flags_hex;
    unsigned long refcnt = 0, use = 0, metric = 0;
    if (!(ss >> iface >> dest >> gateway >> flags_hex >> refcnt >> use >>
          metric))
      continue;
    const unsigned long flags = std::strtoul(flags_hex.c_str(), nullptr, 16);
    if (dest != "00000000" || !(flags & 0x1)) // RTF_UP
      continue;
    if (metric < best_metric) {
      best = iface;
      best_metric = metric;
    }
  }
  return best;
}

// /proc/net/ipv6_route: dest plen src splen next metric refcnt use flags iface
std::string default_v6_interface() {
  std::ifstream in("/proc/net/ipv6_route");
  if (!in)
    return "";
  std::string line;
  while (std::getline(in, line)) {
    std::istringstream ss(line);
    std::string dest, plen, src, splen, next, metric, refcnt, use, flags, iface;
    if (!(ss >> dest >> plen >> src >> splen >> next >> metric >> refcnt >>
          use >> flags >> iface))
      continue;
    if (dest == std::string(32, '0') && plen == "00" && iface != "lo")
      return iface;
  }
  return "";
}
} // namespace

std::string SystemAddressResolver::default_interface() {
  std::string iface = default_v4_interface();
  if (iface.empty())
    iface = default_v6_interface();
  return iface;
}

std::vector<InterfaceAddress> SystemAddressResolver::list_addresses() {
  std::vector<InterfaceAddress> out;
  struct ifaddrs *addrs = nullptr;
  if (getifaddrs(&addrs) != 0)
    return out;

  for (struct ifaddrs *ifa = addrs; ifa; ifa = ifa->ifa_next) {
    if (!ifa->ifa_addr)
      continue;
    const int af = ifa->ifa_addr->sa_family;
    if (af != AF_INET && af != AF_INET6)
      continue;

    InterfaceAddress entry;
    entry.interface_name = ifa->ifa_name;
    entry.internal = (ifa->ifa_flags & IFF_LOOPBACK) != 0;
    char buf[INET6_ADDRSTRLEN] = {0};
    if (af == AF_INET) {
      auto *sin = reinterpret_cast<struct sockaddr_in *>(ifa->ifa_addr);
      inet_ntop(AF_INET, &sin->sin_addr, buf, sizeof(buf));
      entry.family = AddressFamily::V4;
    } else {
      auto *sin6 = reinterpret_cast<struct sockaddr_in6 *>(ifa->ifa_addr);
      inet_ntop(AF_INET6, &sin6->sin6_addr, buf, sizeof(buf));
      entry.family = AddressFamily::V6;
      entry.link_local = IN6_IS_ADDR_LINKLOCAL(&sin6->sin6_addr);
    }
    entry.address = buf;
    out.push_back(entry);
  }

  freeifaddrs(addrs);
  return out;
}

std::string choose_address(const std::vector<InterfaceAddress> &addresses,
                           const std::string &interface_name,
                           AddressFamily family) {
  const InterfaceAddress *first_external = nullptr;
  const InterfaceAddress *family_match = nullptr;
  for (const auto &a : addresses) {
    if (a.interface_name != interface_name || a.internal)
      continue;
    if (!first_external)
      first_external = &a;
    if (a.family != family)
      continue;
    // A routable IPv6 address beats a link-local one.
    if (!family_match || (family_match->link_local && !a.link_local))
      family_match = &a;
  }
  if (family_match)
    return family_match->address;
  if (first_external)
    return first_external->address;
  throw AddressResolutionError("Unable to get network address for \"" +
                               interface_name + "\"!");
}

std::string SystemAddressResolver::resolve(AddressFamily family,
                                           const std::string &interface_name) {
  std::string iface = interface_name;
  if (iface.empty()) {
    iface = default_interface();
    if (iface.empty())
      throw AddressResolutionError("Unable to determine default network "
                                   "interface!");
  }
  return choose_address(list_addresses(), iface, family);
}
