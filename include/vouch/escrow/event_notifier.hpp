#pragma once

#include <vouch/escrow/backend.hpp>
#include <vouch/schema/escrow_event.hpp>
#include <cstdint>
#include <vector>

namespace vouch::escrow {

class event_notifier {
 public:
  virtual ~event_notifier() = default;
  virtual void publish(const vouch::schema::escrow_event_t& event) = 0;
};

/// Appends events to a sequence-numbered journal in the store. Writes join
/// the caller's transaction scope, so a rolled back operation leaves no
/// journal entry behind.
class journal_notifier final : public event_notifier {
 public:
  journal_notifier(encoder_t& encoder, storage_t& storage);

  void publish(const vouch::schema::escrow_event_t& event) override;

  /// Records with `from <= sequence <= to`, in sequence order.
  std::vector<vouch::schema::escrow_event_record_t> events(uint64_t from,
                                                           uint64_t to) const;

  /// 0 when nothing was published yet.
  uint64_t last_sequence() const;

 private:
  encoder_t& encoder_;
  storage_t& storage_;
};

}  // namespace vouch::escrow
