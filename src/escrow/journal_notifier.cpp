#include <spdlog/spdlog.h>
#include <vouch/escrow/event_notifier.hpp>
#include <vouch/schema/key/escrow_keys.hpp>
#include <algorithm>

using namespace vouch::schema;

namespace vouch::escrow {

namespace {

void log_event(const uint64_t sequence, const escrow_event_t& event) {
  std::visit(overloaded{[&](const challenge_issued_t& issued) {
                          spdlog::info(
                              "event #{} challenge_issued item={} buyer={} "
                              "challenge={}",
                              sequence, to_hex(issued.item_id),
                              to_hex(issued.buyer), to_hex(issued.challenge));
                        },
                        [&](const challenge_withdrawn_t& withdrawn) {
                          spdlog::info(
                              "event #{} challenge_withdrawn item={} buyer={}",
                              sequence, to_hex(withdrawn.item_id),
                              to_hex(withdrawn.buyer));
                        }},
             event);
}

}  // namespace

journal_notifier::journal_notifier(encoder_t& encoder, storage_t& storage)
    : encoder_{encoder}, storage_{storage} {}

void journal_notifier::publish(const escrow_event_t& event) {
  auto sequence = last_sequence() + 1;
  storage_.put(encoder_, key::make_event_key(encoder_, sequence),
               escrow_event_record_t{.sequence = sequence, .event = event});
  storage_.put(encoder_, key::make_prefix_key(encoder_, key::kEventSeqKey),
               sequence);
  log_event(sequence, event);
}

std::vector<escrow_event_record_t> journal_notifier::events(
    const uint64_t from,
    const uint64_t to) const {
  auto records = std::vector<escrow_event_record_t>{};
  auto first = std::max<uint64_t>(from, 1);
  auto last = std::min(to, last_sequence());
  for (auto sequence = first; sequence <= last; ++sequence) {
    auto record = storage_.get<escrow_event_record_t>(
        encoder_, key::make_event_key(encoder_, sequence));
    if (!record) {
      vouch::common::critical("event journal has a gap at #{}", sequence);
    }
    records.push_back(std::move(*record));
  }
  return records;
}

uint64_t journal_notifier::last_sequence() const {
  return storage_
      .get<uint64_t>(encoder_, key::make_prefix_key(encoder_, key::kEventSeqKey))
      .value_or(0);
}

}  // namespace vouch::escrow
