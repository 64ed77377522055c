#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include "core/model/types.hpp"

namespace totem {

using UserRecords = std::map<std::string, TotemRecords, std::less<>>;

struct StateSnapshot {
  std::uint32_t format_version = 0;
  bool migrated_from_legacy = false;
  UserRecords records;
  std::unordered_map<std::string, std::int64_t> consumed_signatures;
  std::map<RequestId, PendingPremiumRequest> pending;
  std::map<std::string, std::string> settings;
  MintedBadgeCounts minted_badges;
  bool paused = false;
};

// Owns the BoostRecord table and the engine journal. With a state directory
// the journal and rejections are appended to disk and checkpoints are written
// as versioned text snapshots; without one everything stays in memory.
class Store {
public:
  Result open(std::string_view state_dir);
  [[nodiscard]] bool persistent() const { return !state_dir_.empty(); }

  [[nodiscard]] const BoostRecord* find_record(std::string_view user, std::string_view totem) const;
  [[nodiscard]] BoostRecord record_or_default(std::string_view user, std::string_view totem) const;
  void put_record(std::string_view user, std::string_view totem, BoostRecord record);
  [[nodiscard]] TotemRecords* records_for(std::string_view user);
  [[nodiscard]] const TotemRecords* records_for(std::string_view user) const;
  [[nodiscard]] const UserRecords& all_records() const { return records_; }
  [[nodiscard]] std::size_t record_count() const;

  const EngineEvent& append_event(EventKind kind, std::int64_t unix_ts,
                                  std::vector<std::pair<std::string, std::string>> fields);
  void record_rejection(std::string_view operation, BoostError error, std::string_view message,
                        std::int64_t unix_ts);
  [[nodiscard]] const std::vector<EngineEvent>& events() const { return events_; }
  [[nodiscard]] std::uint64_t journal_write_failures() const { return journal_write_failures_; }

  // Write failures are also counted in journal_write_failures().
  Result save_snapshot(StateSnapshot snapshot, std::int64_t now_unix);
  // Loads state.snapshot into out (records are installed into the store).
  // data is "absent" when there is nothing to load.
  Result load_snapshot(const std::vector<std::uint64_t>& milestones, StateSnapshot& out);

  [[nodiscard]] std::string state_dir() const { return state_dir_; }
  [[nodiscard]] std::string events_path() const { return event_log_path_; }
  [[nodiscard]] std::string snapshot_path() const { return snapshot_path_; }
  [[nodiscard]] std::int64_t last_checkpoint_unix() const { return last_checkpoint_unix_; }

  static std::string event_kind_to_string(EventKind kind);

private:
  Result parse_snapshot_text(std::string_view text, const std::vector<std::uint64_t>& milestones,
                             StateSnapshot& out) const;
  void append_line(const std::string& path, const std::string& line);

  std::string state_dir_;
  std::string event_log_path_;
  std::string rejection_log_path_;
  std::string snapshot_path_;

  UserRecords records_;
  std::vector<EngineEvent> events_;
  std::uint64_t next_sequence_ = 1;
  std::uint64_t journal_write_failures_ = 0;
  std::int64_t last_checkpoint_unix_ = 0;
};

}  // namespace totem
