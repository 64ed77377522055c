#include "core/storage/store.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>

#include "core/model/app_meta.hpp"
#include "core/model/errors.hpp"
#include "core/util/canonical.hpp"
#include "core/util/hash.hpp"

namespace totem {
namespace {

constexpr std::string_view kEventLogFile = "events.log";
constexpr std::string_view kRejectionLogFile = "rejections.log";
constexpr std::string_view kSnapshotFile = "state.snapshot";
constexpr std::string_view kSnapshotHeader = "# totem-boost state snapshot";
constexpr std::uint32_t kLegacySnapshotFormatVersion = 1;
constexpr std::uint32_t kLegacyBadgeBits = 8;

EventKind event_kind_from_string(std::string_view text) {
  if (text == "PremiumBoostRequested") {
    return EventKind::PremiumBoostRequested;
  }
  if (text == "PremiumBoostFulfilled") {
    return EventKind::PremiumBoostFulfilled;
  }
  if (text == "GraceDayEarned") {
    return EventKind::GraceDayEarned;
  }
  if (text == "GraceDaysConsumed") {
    return EventKind::GraceDaysConsumed;
  }
  if (text == "StreakReset") {
    return EventKind::StreakReset;
  }
  if (text == "MilestoneReached") {
    return EventKind::MilestoneReached;
  }
  if (text == "BadgeMinted") {
    return EventKind::BadgeMinted;
  }
  if (text == "ConfigUpdated") {
    return EventKind::ConfigUpdated;
  }
  if (text == "Paused") {
    return EventKind::Paused;
  }
  if (text == "Unpaused") {
    return EventKind::Unpaused;
  }
  return EventKind::FreeBoosted;
}

std::string serialize_event_line(const EngineEvent& event) {
  std::ostringstream out;
  out << event.sequence << '\t' << Store::event_kind_to_string(event.kind) << '\t' << event.unix_ts << '\t'
      << util::to_hex(event.payload) << '\n';
  return out.str();
}

bool parse_event_line(std::string_view line, EngineEvent& out) {
  const auto fields = util::split_fields(line, '\t');
  if (fields.size() != 4) {
    return false;
  }
  const auto sequence = util::parse_uint64(fields[0]);
  const auto unix_ts = util::parse_int64(fields[2]);
  if (!sequence.has_value() || !unix_ts.has_value()) {
    return false;
  }
  out.sequence = *sequence;
  out.kind = event_kind_from_string(fields[1]);
  out.unix_ts = *unix_ts;
  out.payload = util::from_hex(fields[3]);
  return true;
}

std::string serialize_badges(const BadgeCounts& badges) {
  std::string out;
  for (const auto& [milestone, count] : badges) {
    if (!out.empty()) {
      out.push_back(',');
    }
    out += std::to_string(milestone) + ":" + std::to_string(count);
  }
  return out.empty() ? "-" : out;
}

bool parse_badges(std::string_view text, BadgeCounts& out) {
  if (text == "-") {
    return true;
  }
  for (const auto& item : util::split_csv(text)) {
    const auto split = item.find(':');
    if (split == std::string::npos) {
      return false;
    }
    const auto milestone = util::parse_uint64(std::string_view{item}.substr(0, split));
    const auto count = util::parse_uint64(std::string_view{item}.substr(split + 1));
    if (!milestone.has_value() || !count.has_value()) {
      return false;
    }
    if (*count > 0) {
      out[*milestone] = *count;
    }
  }
  return true;
}

// Format 1 packed the unminted counters into one integer, eight bits per
// milestone in milestone order.
BadgeCounts unpack_legacy_badges(std::uint64_t packed, const std::vector<std::uint64_t>& milestones) {
  BadgeCounts out;
  const std::size_t slots = std::min<std::size_t>(milestones.size(), 64 / kLegacyBadgeBits);
  for (std::size_t i = 0; i < slots; ++i) {
    const std::uint64_t count = (packed >> (i * kLegacyBadgeBits)) & 0xFFU;
    if (count > 0) {
      out[milestones[i]] = count;
    }
  }
  return out;
}

std::string serialize_pending_ids(const std::vector<RequestId>& ids) {
  std::string out;
  for (const RequestId id : ids) {
    if (!out.empty()) {
      out.push_back(',');
    }
    out += std::to_string(id);
  }
  return out.empty() ? "-" : out;
}

bool parse_pending_ids(std::string_view text, std::vector<RequestId>& out) {
  if (text == "-") {
    return true;
  }
  for (const auto& item : util::split_csv(text)) {
    const auto id = util::parse_uint64(item);
    if (!id.has_value()) {
      return false;
    }
    out.push_back(*id);
  }
  return true;
}

std::string read_file(const std::filesystem::path& path) {
  std::ifstream in(path, std::ios::in | std::ios::binary);
  if (!in) {
    return {};
  }

  std::ostringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

}  // namespace

Result Store::open(std::string_view state_dir) {
  state_dir_ = std::string{state_dir};
  events_.clear();
  next_sequence_ = 1;
  if (state_dir_.empty()) {
    return Result::success("Store running in memory.");
  }

  std::error_code ec;
  std::filesystem::create_directories(state_dir_, ec);
  if (ec) {
    return Result::failure(BoostError::StorageFailure, "Failed to create state directory: " + ec.message());
  }

  const std::filesystem::path root{state_dir_};
  event_log_path_ = (root / std::string{kEventLogFile}).string();
  rejection_log_path_ = (root / std::string{kRejectionLogFile}).string();
  snapshot_path_ = (root / std::string{kSnapshotFile}).string();

  std::ifstream in(event_log_path_);
  if (!in) {
    return Result::success("Event log will be created on first write.");
  }

  std::string line;
  std::size_t dropped = 0;
  while (std::getline(in, line)) {
    if (line.empty()) {
      continue;
    }
    EngineEvent event;
    if (!parse_event_line(line, event)) {
      ++dropped;
      continue;
    }
    next_sequence_ = std::max(next_sequence_, event.sequence + 1);
    events_.push_back(std::move(event));
  }

  if (dropped > 0) {
    return Result::success("Event log loaded; dropped " + std::to_string(dropped) + " unreadable lines.");
  }
  return Result::success("Event log loaded.");
}

const BoostRecord* Store::find_record(std::string_view user, std::string_view totem) const {
  const TotemRecords* records = records_for(user);
  if (records == nullptr) {
    return nullptr;
  }
  const auto it = records->find(totem);
  return it == records->end() ? nullptr : &it->second;
}

BoostRecord Store::record_or_default(std::string_view user, std::string_view totem) const {
  const BoostRecord* record = find_record(user, totem);
  return record == nullptr ? BoostRecord{} : *record;
}

void Store::put_record(std::string_view user, std::string_view totem, BoostRecord record) {
  auto user_it = records_.find(user);
  if (user_it == records_.end()) {
    user_it = records_.emplace(std::string{user}, TotemRecords{}).first;
  }
  user_it->second.insert_or_assign(std::string{totem}, std::move(record));
}

TotemRecords* Store::records_for(std::string_view user) {
  const auto it = records_.find(user);
  return it == records_.end() ? nullptr : &it->second;
}

const TotemRecords* Store::records_for(std::string_view user) const {
  const auto it = records_.find(user);
  return it == records_.end() ? nullptr : &it->second;
}

std::size_t Store::record_count() const {
  std::size_t count = 0;
  for (const auto& [user, totems] : records_) {
    count += totems.size();
  }
  return count;
}

const EngineEvent& Store::append_event(EventKind kind, std::int64_t unix_ts,
                                       std::vector<std::pair<std::string, std::string>> fields) {
  EngineEvent event{
      .sequence = next_sequence_++,
      .kind = kind,
      .unix_ts = unix_ts,
      .payload = util::canonical_join(std::move(fields)),
  };
  if (persistent()) {
    append_line(event_log_path_, serialize_event_line(event));
  }
  events_.push_back(std::move(event));
  return events_.back();
}

void Store::record_rejection(std::string_view operation, BoostError error, std::string_view message,
                             std::int64_t unix_ts) {
  if (!persistent()) {
    return;
  }
  std::ostringstream out;
  out << unix_ts << '\t' << operation << '\t' << error_to_string(error) << '\t' << util::to_hex(message) << '\n';
  append_line(rejection_log_path_, out.str());
}

void Store::append_line(const std::string& path, const std::string& line) {
  std::ofstream out(path, std::ios::out | std::ios::app);
  if (!out) {
    ++journal_write_failures_;
    return;
  }
  out << line;
  out.flush();
  if (!out) {
    ++journal_write_failures_;
  }
}

Result Store::save_snapshot(StateSnapshot snapshot, std::int64_t now_unix) {
  if (!persistent()) {
    return Result::failure(BoostError::StorageFailure, "Checkpoint failed: no state directory is configured.");
  }

  std::ostringstream out;
  out << kSnapshotHeader << '\n';
  out << "format_version=" << kSnapshotFormatVersion << '\n';
  out << "paused\t" << (snapshot.paused ? 1 : 0) << '\n';
  for (const auto& [key, value] : snapshot.settings) {
    out << "setting\t" << key << '\t' << value << '\n';
  }
  for (const auto& [user, totems] : records_) {
    for (const auto& [totem, record] : totems) {
      out << "record\t" << util::to_hex(user) << '\t' << util::to_hex(totem) << '\t' << record.last_free_boost_at
          << '\t' << record.last_premium_boost_at << '\t' << record.streak_anchor_at << '\t'
          << record.streak_length << '\t' << record.grace_days_earned << '\t' << record.grace_days_used << '\t'
          << record.total_free_boosts << '\t' << record.total_premium_boosts << '\t'
          << serialize_badges(record.unminted_badges) << '\t'
          << serialize_pending_ids(record.pending_premium_requests) << '\n';
    }
  }
  for (const auto& [digest, timestamp] : snapshot.consumed_signatures) {
    out << "consumed\t" << digest << '\t' << timestamp << '\n';
  }
  for (const auto& [key, count] : snapshot.minted_badges) {
    out << "minted\t" << util::to_hex(key.first) << '\t' << key.second << '\t' << count << '\n';
  }
  for (const auto& [id, pending] : snapshot.pending) {
    out << "pending\t" << id << '\t' << util::to_hex(pending.user) << '\t' << util::to_hex(pending.totem) << '\t'
        << pending.streak_length << '\t' << pending.requested_unix << '\n';
  }

  const std::filesystem::path target{snapshot_path_};
  const std::filesystem::path staging{snapshot_path_ + ".tmp"};
  {
    std::ofstream file(staging, std::ios::out | std::ios::binary | std::ios::trunc);
    if (!file) {
      ++journal_write_failures_;
      return Result::failure(BoostError::StorageFailure, "Checkpoint failed: unable to open snapshot file.");
    }
    const std::string text = out.str();
    file.write(text.data(), static_cast<std::streamsize>(text.size()));
    if (!file) {
      ++journal_write_failures_;
      return Result::failure(BoostError::StorageFailure, "Checkpoint failed: unable to write snapshot file.");
    }
  }

  std::error_code ec;
  std::filesystem::rename(staging, target, ec);
  if (ec) {
    ++journal_write_failures_;
    return Result::failure(BoostError::StorageFailure, "Checkpoint failed: " + ec.message());
  }

  last_checkpoint_unix_ = now_unix;
  return Result::success("Checkpoint written.", snapshot_path_);
}

Result Store::load_snapshot(const std::vector<std::uint64_t>& milestones, StateSnapshot& out) {
  if (!persistent()) {
    return Result::success("No state directory configured.", "absent");
  }

  std::error_code ec;
  if (!std::filesystem::exists(snapshot_path_, ec)) {
    return Result::success("No snapshot present yet.", "absent");
  }

  const std::string text = read_file(snapshot_path_);
  StateSnapshot parsed;
  const Result result = parse_snapshot_text(text, milestones, parsed);
  if (!result.ok) {
    return result;
  }

  records_ = parsed.records;
  out = std::move(parsed);
  return result;
}

Result Store::parse_snapshot_text(std::string_view text, const std::vector<std::uint64_t>& milestones,
                                  StateSnapshot& out) const {
  std::istringstream in{std::string{text}};
  std::string line;
  std::size_t line_no = 0;
  while (std::getline(in, line)) {
    ++line_no;
    if (line.empty() || line.front() == '#') {
      continue;
    }

    const auto malformed = [&](std::string_view what) {
      return Result::failure(BoostError::StorageFailure,
                             "Snapshot line " + std::to_string(line_no) + " is malformed (" + std::string{what} + ").");
    };

    if (line.starts_with("format_version=")) {
      const auto version = util::parse_uint64(std::string_view{line}.substr(15));
      if (!version.has_value()) {
        return malformed("format_version");
      }
      if (*version != kSnapshotFormatVersion && *version != kLegacySnapshotFormatVersion) {
        return Result::failure(BoostError::StorageFailure,
                               "Snapshot format version " + std::to_string(*version) + " is not supported.");
      }
      out.format_version = static_cast<std::uint32_t>(*version);
      continue;
    }

    if (out.format_version == 0) {
      return malformed("missing format_version");
    }

    const auto fields = util::split_fields(line, '\t');
    const std::string& tag = fields.front();

    if (tag == "paused" && fields.size() == 2) {
      out.paused = fields[1] == "1";
    } else if (tag == "setting" && fields.size() == 3) {
      out.settings[fields[1]] = fields[2];
    } else if (tag == "consumed" && fields.size() == 3) {
      const auto timestamp = util::parse_int64(fields[2]);
      if (!timestamp.has_value()) {
        return malformed("consumed timestamp");
      }
      out.consumed_signatures[fields[1]] = *timestamp;
    } else if (tag == "minted" && fields.size() == 4) {
      const auto milestone = util::parse_uint64(fields[2]);
      const auto count = util::parse_uint64(fields[3]);
      const std::string user = util::from_hex(fields[1]);
      if (!milestone.has_value() || !count.has_value() || user.empty()) {
        return malformed("minted");
      }
      out.minted_badges[{user, *milestone}] = *count;
    } else if (tag == "pending" && fields.size() == 6) {
      const auto id = util::parse_uint64(fields[1]);
      const auto length = util::parse_uint64(fields[4]);
      const auto requested = util::parse_int64(fields[5]);
      if (!id.has_value() || !length.has_value() || !requested.has_value()) {
        return malformed("pending");
      }
      out.pending[*id] = {
          .request_id = *id,
          .user = util::from_hex(fields[2]),
          .totem = util::from_hex(fields[3]),
          .streak_length = *length,
          .requested_unix = *requested,
      };
    } else if (tag == "record") {
      const bool legacy = out.format_version == kLegacySnapshotFormatVersion;
      const std::size_t expected = legacy ? 10 : 13;
      if (fields.size() != expected) {
        return malformed("record field count");
      }

      BoostRecord record;
      const auto last_free = util::parse_int64(fields[3]);
      const auto last_premium = util::parse_int64(fields[4]);
      const auto anchor = util::parse_int64(fields[5]);
      const auto length = util::parse_uint64(fields[6]);
      const auto earned = util::parse_uint64(fields[7]);
      const auto used = util::parse_uint64(fields[8]);
      if (!last_free || !last_premium || !anchor || !length || !earned || !used || *used > *earned) {
        return malformed("record values");
      }
      record.last_free_boost_at = *last_free;
      record.last_premium_boost_at = *last_premium;
      record.streak_anchor_at = *anchor;
      record.streak_length = *length;
      record.grace_days_earned = *earned;
      record.grace_days_used = *used;

      if (legacy) {
        const auto packed = util::parse_uint64(fields[9]);
        if (!packed.has_value()) {
          return malformed("packed badges");
        }
        record.unminted_badges = unpack_legacy_badges(*packed, milestones);
        // Format 1 kept no counters; a nonzero timestamp proves at least one boost.
        record.total_free_boosts = record.last_free_boost_at > 0 ? 1 : 0;
        record.total_premium_boosts = record.last_premium_boost_at > 0 ? 1 : 0;
      } else {
        const auto total_free = util::parse_uint64(fields[9]);
        const auto total_premium = util::parse_uint64(fields[10]);
        if (!total_free || !total_premium || !parse_badges(fields[11], record.unminted_badges) ||
            !parse_pending_ids(fields[12], record.pending_premium_requests)) {
          return malformed("record counters");
        }
        record.total_free_boosts = *total_free;
        record.total_premium_boosts = *total_premium;
      }

      const std::string user = util::from_hex(fields[1]);
      const std::string totem = util::from_hex(fields[2]);
      if (user.empty() || totem.empty()) {
        return malformed("record identity");
      }
      out.records[user].insert_or_assign(totem, std::move(record));
    } else {
      return malformed("unknown entry");
    }
  }

  if (out.format_version == 0) {
    return Result::failure(BoostError::StorageFailure, "Snapshot has no format_version.");
  }

  // Pending requests are re-linked to their records; format 1 did not store the link.
  for (const auto& [id, pending] : out.pending) {
    auto user_it = out.records.find(pending.user);
    if (user_it == out.records.end()) {
      continue;
    }
    auto record_it = user_it->second.find(pending.totem);
    if (record_it == user_it->second.end()) {
      continue;
    }
    auto& ids = record_it->second.pending_premium_requests;
    if (std::ranges::find(ids, id) == ids.end()) {
      ids.push_back(id);
    }
  }

  out.migrated_from_legacy = out.format_version == kLegacySnapshotFormatVersion;
  if (out.migrated_from_legacy) {
    out.format_version = kSnapshotFormatVersion;
    return Result::success("Snapshot migrated from format 1.", "migrated");
  }
  return Result::success("Snapshot loaded.", "loaded");
}

std::string Store::event_kind_to_string(EventKind kind) {
  switch (kind) {
    case EventKind::FreeBoosted:
      return "FreeBoosted";
    case EventKind::PremiumBoostRequested:
      return "PremiumBoostRequested";
    case EventKind::PremiumBoostFulfilled:
      return "PremiumBoostFulfilled";
    case EventKind::GraceDayEarned:
      return "GraceDayEarned";
    case EventKind::GraceDaysConsumed:
      return "GraceDaysConsumed";
    case EventKind::StreakReset:
      return "StreakReset";
    case EventKind::MilestoneReached:
      return "MilestoneReached";
    case EventKind::BadgeMinted:
      return "BadgeMinted";
    case EventKind::ConfigUpdated:
      return "ConfigUpdated";
    case EventKind::Paused:
      return "Paused";
    case EventKind::Unpaused:
      return "Unpaused";
  }
  return "FreeBoosted";
}

}  // namespace totem
