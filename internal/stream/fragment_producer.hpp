#pragma once

#include <optional>

#include "internal/model/chunk.hpp"
#include "internal/stream/cancellation.hpp"

namespace relay::stream {

/*
  Upstream generation sequence for one connection.

  Next() blocks until a fragment is available and returns nullopt when
  the sequence is exhausted or the token is cancelled. Implementations
  must observe the token while blocked. Failures of the upstream are
  thrown from Next().

  Close() releases the upstream; Next() returns nullopt afterwards.
*/
class FragmentProducer {
 public:
  virtual ~FragmentProducer() = default;

  virtual std::optional<model::Fragment> Next(const CancellationToken& token) = 0;
  virtual void                           Close()                              = 0;
};

} // namespace relay::stream
