#pragma once

#include <string>

namespace platform::net {

// True when a non-loopback interface is up and carries an address.
bool isConnected();
bool getLocalIp(std::string& out);

}  // namespace platform::net
