#include <shotimport/core/import_session.hpp>
#include <algorithm>

namespace shotimport::core {

namespace {

const ValidatedPayload* find_entry(const std::vector<StageEntry>& data,
                                   std::string_view stage) noexcept {
  const auto it = std::find_if(data.begin(), data.end(),
                               [&](const StageEntry& e) { return e.stage == stage; });
  return it == data.end() ? nullptr : &it->payload;
}

}  // namespace

void ImportSession::merge(StageEntry entry) {
  const auto it = std::find_if(stage_data.begin(), stage_data.end(),
                               [&](const StageEntry& e) { return e.stage == entry.stage; });
  if (it != stage_data.end()) {
    stage_data.erase(it, stage_data.end());
  }
  stage_data.push_back(std::move(entry));
}

const ValidatedPayload* ImportSession::find(std::string_view stage) const noexcept {
  return find_entry(stage_data, stage);
}

const ValidatedPayload* SessionSnapshot::find(std::string_view stage) const noexcept {
  return find_entry(stage_data, stage);
}

SessionSnapshot make_snapshot(const ImportSession& session) {
  SessionSnapshot s;
  s.session_id = session.session_id;
  s.state = session.state;
  s.stage_data = session.stage_data;
  s.started_at = session.started_at;
  s.deadline_at = session.deadline_at;
  s.cancelled = session.cancel_token.stop_requested();
  s.last_error = session.last_error;
  s.last_hint = session.last_hint;
  return s;
}

}  // namespace shotimport::core
