#include "platform/Net.h"

#include <arpa/inet.h>
#include <ifaddrs.h>
#include <net/if.h>
#include <netinet/in.h>

namespace platform::net {
namespace {

bool firstUsableAddress(std::string* outIp) {
  ifaddrs* addrs = nullptr;
  if (getifaddrs(&addrs) != 0 || addrs == nullptr) {
    return false;
  }
  bool found = false;
  for (ifaddrs* it = addrs; it != nullptr && !found; it = it->ifa_next) {
    if (it->ifa_addr == nullptr) {
      continue;
    }
    if ((it->ifa_flags & IFF_UP) == 0 || (it->ifa_flags & IFF_RUNNING) == 0 ||
        (it->ifa_flags & IFF_LOOPBACK) != 0) {
      continue;
    }
    const int family = it->ifa_addr->sa_family;
    if (family != AF_INET && family != AF_INET6) {
      continue;
    }
    if (family == AF_INET6) {
      const sockaddr_in6* addr6 = reinterpret_cast<const sockaddr_in6*>(it->ifa_addr);
      // Link-local addresses exist without any upstream connectivity.
      if (IN6_IS_ADDR_LINKLOCAL(&addr6->sin6_addr)) {
        continue;
      }
    }
    found = true;
    if (outIp != nullptr) {
      char buf[INET6_ADDRSTRLEN] = {0};
      const void* raw = family == AF_INET
                            ? static_cast<const void*>(
                                  &reinterpret_cast<const sockaddr_in*>(it->ifa_addr)->sin_addr)
                            : static_cast<const void*>(
                                  &reinterpret_cast<const sockaddr_in6*>(it->ifa_addr)->sin6_addr);
      if (inet_ntop(family, raw, buf, sizeof(buf)) != nullptr) {
        outIp->assign(buf);
      }
    }
  }
  freeifaddrs(addrs);
  return found;
}

}  // namespace

bool isConnected() { return firstUsableAddress(nullptr); }

bool getLocalIp(std::string& out) {
  out.clear();
  return firstUsableAddress(&out) && !out.empty();
}

}  // namespace platform::net
