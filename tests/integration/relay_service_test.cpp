#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "internal/model/event.hpp"
#include "internal/service/relay_service.hpp"
#include "internal/util/errors.hpp"
#include "relay/v1.hpp"
#include "tests/support/relay_fixture.hpp"

namespace {

using relay::model::EventType;
using relay::testing::RelayFixture;

struct EventLog {
  std::mutex             mutex;
  std::vector<EventType> types;
  std::vector<std::string> frames;

  relay::stream::EventChannel::Writer Writer() {
    return [this](const relay::model::Event& event, const std::string& sse) {
      std::lock_guard lock(mutex);
      types.push_back(event.type);
      frames.push_back(sse);
      return true;
    };
  }
};

std::string Create(relay::service::RelayService& service) {
  relay::v1::CreateConnectionRequest req;
  req.set_client_id("integration");
  req.set_request_id("req-1");
  req.set_provider("openai");
  req.set_model("gpt-4o");
  return service.CreateConnection(req).connection().id();
}

relay::v1::PublishRequest Fragment(const std::string& connection_id, const std::string& content, const std::string& finish_reason = "") {
  relay::v1::PublishRequest msg;
  msg.set_connection_id(connection_id);
  msg.mutable_fragment()->set_content(content);
  msg.mutable_fragment()->set_delta(content);
  if (!finish_reason.empty()) msg.mutable_fragment()->set_finish_reason(finish_reason);
  return msg;
}

relay::service::RelayService::PublishReader ReaderOver(std::vector<relay::v1::PublishRequest> messages) {
  auto next = std::make_shared<std::size_t>(0);
  auto all  = std::make_shared<std::vector<relay::v1::PublishRequest>>(std::move(messages));
  return [next, all](relay::v1::PublishRequest& out) {
    if (*next >= all->size()) return false;
    out = (*all)[(*next)++];
    return true;
  };
}

void TestPublishSubscribeReplayAndMetrics() {
  RelayFixture f;
  auto&        service = *f.service;
  const auto   id      = Create(service);

  EventLog                     log;
  relay::stream::StreamOutcome outcome = relay::stream::StreamOutcome::kFailed;
  std::thread                  subscriber([&] {
    relay::v1::SubscribeRequest req;
    req.set_connection_id(id);
    outcome = service.Subscribe(req, log.Writer(), nullptr);
  });

  auto published = service.Publish(ReaderOver({Fragment(id, "Hel"), Fragment(id, "lo, "), Fragment(id, "world", "stop")}));
  subscriber.join();

  assert(published.fragments_accepted() == 3);
  assert(outcome == relay::stream::StreamOutcome::kCompleted);
  assert((log.types ==
          std::vector<EventType>{EventType::kStart, EventType::kChunk, EventType::kChunk, EventType::kChunk, EventType::kComplete}));
  assert(log.frames.front().rfind("event: start\n", 0) == 0);
  assert(log.frames.back().rfind("event: complete\n", 0) == 0);

  relay::v1::GetConnectionRequest get;
  get.set_connection_id(id);
  assert(service.GetConnection(get).connection().status() == relay::v1::CONNECTION_STATUS_COMPLETED);

  relay::v1::ReplayRequest replay;
  replay.set_connection_id(id);
  auto chunks = service.Replay(replay);
  assert(chunks.chunks_size() == 3);
  for (int i = 0; i < chunks.chunks_size(); ++i) assert(chunks.chunks(i).sequence() == static_cast<uint64_t>(i));
  assert(chunks.chunks(0).payload_json().find("Hel") != std::string::npos);
  assert(chunks.chunks(2).payload_json().find("world") != std::string::npos);

  replay.set_from_sequence(1);
  replay.set_max_chunks(1);
  auto partial = service.Replay(replay);
  assert(partial.chunks_size() == 1);
  assert(partial.chunks(0).sequence() == 1);

  relay::v1::GetMetricsRequest per_connection;
  per_connection.set_connection_id(id);
  per_connection.set_period(relay::v1::METRICS_PERIOD_HOUR);
  auto connection_metrics = service.GetMetrics(per_connection);
  assert(connection_metrics.has_connection());
  assert(connection_metrics.connection().total_chunks() == 3);

  auto aggregate = service.GetMetrics(relay::v1::GetMetricsRequest{});
  assert(aggregate.has_aggregate());
  assert(aggregate.aggregate().connections_created() == 1);
  assert(aggregate.aggregate().connections_completed() == 1);

  assert(f.ctx.sessions->Find(id) != nullptr);
  relay::v1::CloseConnectionRequest close;
  close.set_connection_id(id);
  service.CloseConnection(close);
  service.CloseConnection(close);
  assert(f.ctx.sessions->Find(id) == nullptr);
  assert(service.GetConnection(get).connection().status() == relay::v1::CONNECTION_STATUS_DISCONNECTED);
}

void TestAbortedPublishEmitsErrorEvent() {
  RelayFixture f;
  auto&        service = *f.service;
  const auto   id      = Create(service);

  relay::v1::PublishRequest abort;
  abort.set_abort(true);
  abort.set_abort_message("provider hung up");
  service.Publish(ReaderOver({Fragment(id, "partial"), abort}));

  EventLog                    log;
  relay::v1::SubscribeRequest req;
  req.set_connection_id(id);
  auto outcome = service.Subscribe(req, log.Writer(), nullptr);

  assert(outcome == relay::stream::StreamOutcome::kFailed);
  assert((log.types == std::vector<EventType>{EventType::kStart, EventType::kChunk, EventType::kError}));
  assert(log.frames.back().find("UpstreamGenerationError") != std::string::npos);

  relay::v1::GetConnectionRequest get;
  get.set_connection_id(id);
  assert(service.GetConnection(get).connection().status() == relay::v1::CONNECTION_STATUS_ERROR);
}

void TestClientDisconnectCancelsStream() {
  RelayFixture f;
  auto&        service = *f.service;
  const auto   id      = Create(service);

  std::atomic<bool>            gone{false};
  EventLog                     log;
  relay::stream::StreamOutcome outcome = relay::stream::StreamOutcome::kCompleted;
  std::thread                  subscriber([&] {
    relay::v1::SubscribeRequest req;
    req.set_connection_id(id);
    outcome = service.Subscribe(req, log.Writer(), [&] { return gone.load(); });
  });

  // the upstream stays open until the client has gone away
  bool        sent = false;
  std::thread publisher([&] {
    service.Publish([&](relay::v1::PublishRequest& out) {
      if (!sent) {
        out  = Fragment(id, "one");
        sent = true;
        return true;
      }
      while (!gone.load()) std::this_thread::sleep_for(std::chrono::milliseconds(5));
      return false;
    });
  });

  while (true) {
    {
      std::lock_guard lock(log.mutex);
      if (log.types.size() >= 2) break;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  gone = true;
  subscriber.join();
  publisher.join();

  assert(outcome == relay::stream::StreamOutcome::kCancelled);
  assert(f.ctx.sessions->Find(id) == nullptr);
  assert(log.types.back() == EventType::kChunk);

  relay::v1::GetConnectionRequest get;
  get.set_connection_id(id);
  assert(service.GetConnection(get).connection().status() == relay::v1::CONNECTION_STATUS_DISCONNECTED);
}

void TestClosedConnectionLeavesNoSession() {
  RelayFixture f;
  auto&        service = *f.service;
  const auto   id      = Create(service);

  relay::v1::CloseConnectionRequest close;
  close.set_connection_id(id);
  service.CloseConnection(close);
  assert(f.ctx.sessions->Size() == 0);

  for (int attempt = 0; attempt < 3; ++attempt) {
    EventLog                    log;
    relay::v1::SubscribeRequest req;
    req.set_connection_id(id);
    bool threw = false;
    try {
      service.Subscribe(req, log.Writer(), nullptr);
    } catch (const relay::util::InvalidState&) {
      threw = true;
    }
    assert(threw);
    assert(log.types.empty());

    threw = false;
    try {
      service.Publish(ReaderOver({Fragment(id, "late", "stop")}));
    } catch (const relay::util::InvalidState&) {
      threw = true;
    }
    assert(threw);
  }
  assert(f.ctx.sessions->Find(id) == nullptr);
  assert(f.ctx.sessions->Size() == 0);

  relay::v1::SubscribeRequest unknown;
  unknown.set_connection_id("no-such-connection");
  bool threw = false;
  try {
    EventLog log;
    service.Subscribe(unknown, log.Writer(), nullptr);
  } catch (const relay::util::ConnectionNotFound&) {
    threw = true;
  }
  assert(threw);
  assert(f.ctx.sessions->Size() == 0);
}

} // namespace

int main() {
  TestPublishSubscribeReplayAndMetrics();
  TestAbortedPublishEmitsErrorEvent();
  TestClientDisconnectCancelsStream();
  TestClosedConnectionLeavesNoSession();

  std::cout << "relay_integration_relay_service: pass\n";
  return 0;
}
