#pragma once

#include <cstdint>

namespace relay::model {

enum class ConnectionStatus : std::uint8_t {
  kConnecting   = 0,
  kStreaming    = 1,
  kCompleted    = 2,
  kError        = 3,
  kDisconnected = 4,
};

constexpr bool IsTerminal(ConnectionStatus status) {
  return status == ConnectionStatus::kDisconnected;
}

// A stream is finished once it completed or failed; only closing remains.
constexpr bool IsFinished(ConnectionStatus status) {
  return status == ConnectionStatus::kCompleted || status == ConnectionStatus::kError || IsTerminal(status);
}

/*
  connecting -> streaming -> {completed | error} -> disconnected

  Any live state may move to disconnected (explicit close, idle reap)
  and a stream that fails before its first fragment may go straight
  from connecting to error.
*/
constexpr bool CanTransition(ConnectionStatus from, ConnectionStatus to) {
  if (from == to) {
    return true;
  }
  if (IsTerminal(from)) {
    return false;
  }
  if (to == ConnectionStatus::kDisconnected) {
    return true;
  }

  switch (from) {
    case ConnectionStatus::kConnecting:
      return to == ConnectionStatus::kStreaming || to == ConnectionStatus::kError;
    case ConnectionStatus::kStreaming:
      return to == ConnectionStatus::kCompleted || to == ConnectionStatus::kError;
    default:
      return false;
  }
}

} // namespace relay::model
