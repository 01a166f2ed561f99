#include "internal/db/engine/change_channel.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

using practicedb::db::ChangeChannel;
using practicedb::db::ChangeEvent;
using practicedb::db::ChangeKind;
using practicedb::db::Subscription;

ChangeEvent MakeEvent(const std::string& collection, ChangeKind kind, const std::string& id) {
  ChangeEvent event;
  event.collection   = collection;
  event.kind         = kind;
  event.document_ids = {id};
  return event;
}

void TestHandlersOnlySeeTheirTopic() {
  ChangeChannel channel;
  int           patients = 0;
  int           claims   = 0;

  auto a = channel.Subscribe("db_patients", [&](const ChangeEvent&) { ++patients; });
  auto b = channel.Subscribe("db_claims", [&](const ChangeEvent&) { ++claims; });

  channel.Publish(MakeEvent("db_patients", ChangeKind::Created, "p1"));
  channel.Publish(MakeEvent("db_patients", ChangeKind::Updated, "p1"));

  assert(patients == 2);
  assert(claims == 0);
  assert(channel.SubscriberCount("db_patients") == 1);
}

void TestUnsubscribeStopsDelivery() {
  ChangeChannel channel;
  int           calls = 0;

  auto sub = channel.Subscribe("db_patients", [&](const ChangeEvent&) { ++calls; });
  channel.Publish(MakeEvent("db_patients", ChangeKind::Created, "p1"));
  sub.Unsubscribe();
  channel.Publish(MakeEvent("db_patients", ChangeKind::Created, "p2"));

  assert(calls == 1);
  assert(!sub.Active());
  assert(channel.SubscriberCount("db_patients") == 0);
}

void TestSubscriptionDestructorDetaches() {
  ChangeChannel channel;
  int           calls = 0;
  {
    auto sub = channel.Subscribe("db_patients", [&](const ChangeEvent&) { ++calls; });
    assert(channel.SubscriberCount("db_patients") == 1);
  }
  channel.Publish(MakeEvent("db_patients", ChangeKind::Created, "p1"));
  assert(calls == 0);
}

void TestSubscriptionOutlivesChannel() {
  Subscription sub;
  {
    ChangeChannel channel;
    sub = channel.Subscribe("db_patients", [](const ChangeEvent&) {});
  }
  sub.Unsubscribe();
  assert(!sub.Active());
}

void TestThrowingHandlerDoesNotStopOthers() {
  ChangeChannel channel;
  int           calls = 0;

  auto bad  = channel.Subscribe("db_patients", [](const ChangeEvent&) { throw std::runtime_error("boom"); });
  auto good = channel.Subscribe("db_patients", [&](const ChangeEvent&) { ++calls; });

  channel.Publish(MakeEvent("db_patients", ChangeKind::Deleted, "p1"));
  assert(calls == 1);
}

void TestReentrantPublishIsQueuedInOrder() {
  ChangeChannel            channel;
  std::vector<std::string> seen;

  auto sub = channel.Subscribe("db_patients", [&](const ChangeEvent& event) {
    seen.push_back("begin:" + event.document_ids.front());
    if (event.document_ids.front() == "p1") {
      channel.Publish(MakeEvent("db_patients", ChangeKind::Updated, "p2"));
    }
    seen.push_back("end:" + event.document_ids.front());
  });

  channel.Publish(MakeEvent("db_patients", ChangeKind::Created, "p1"));

  const std::vector<std::string> expected = {"begin:p1", "end:p1", "begin:p2", "end:p2"};
  assert(seen == expected);
}

} // namespace

int main() {
  TestHandlersOnlySeeTheirTopic();
  TestUnsubscribeStopsDelivery();
  TestSubscriptionDestructorDetaches();
  TestSubscriptionOutlivesChannel();
  TestThrowingHandlerDoesNotStopOthers();
  TestReentrantPublishIsQueuedInOrder();

  std::cout << "practicedb_unit_change_channel: pass\n";
  return 0;
}
