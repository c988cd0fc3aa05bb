#include "server.hpp"

#include "internal/observability/logging.hpp"

namespace castproxy::runtime {

using castproxy::observability::IntField;
using castproxy::observability::StringField;

Server::Server(factory::Application app) : app_(std::move(app)) {
}

Server::~Server() {
  Stop();
}

void Server::Start() {
  if (started_.exchange(true)) return;

  app_.workers->Start();
  app_.listener->SetHandler([this](net::Datagram datagram) { Dispatch(std::move(datagram)); });
  try {
    app_.listener->Start();
  } catch (...) {
    app_.workers->Stop();
    started_ = false;
    throw;
  }
}

void Server::Stop() {
  if (!started_.exchange(false)) return;

  app_.listener->Stop();
  app_.workers->Stop();
}

void Server::Dispatch(net::Datagram datagram) {
  auto pipeline = app_.proxy;
  auto source   = datagram.source.ToString();

  const bool accepted = app_.workers->Submit([pipeline, datagram = std::move(datagram)] {
    const auto outcome = pipeline->Handle(datagram);
    CASTPROXY_LOG_DEBUG("datagram handled", {StringField("source", datagram.source.ToString()), StringField("outcome", proxy::ToString(outcome.disposition)),
                                             IntField("responses", static_cast<int64_t>(outcome.responses_sent))});
  });

  if (!accepted) {
    ++dropped_;
    CASTPROXY_LOG_WARN("work queue full, dropping datagram", {StringField("source", source), IntField("dropped_total", static_cast<int64_t>(dropped_.load()))});
  }
}

} // namespace castproxy::runtime
