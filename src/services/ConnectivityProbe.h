#pragma once

#include <string>

#include "KioskSettings.h"
#include "services/HttpClient.h"

class ConnectivityProbe {
 public:
  virtual ~ConnectivityProbe() = default;
  // Bounded by the probe timeout. Unreachable and timed out both read false.
  virtual bool isOnline() = 0;
};

class NetConnectivityProbe : public ConnectivityProbe {
 public:
  NetConnectivityProbe(const KioskSettings& settings, const HttpClient& http);

  bool isOnline() override;

  bool lastResult() const { return lastResult_; }
  const std::string& lastReason() const { return lastReason_; }

 private:
  const KioskSettings& settings_;
  const HttpClient& http_;
  bool lastResult_ = false;
  bool hasResult_ = false;
  std::string lastReason_;
};
