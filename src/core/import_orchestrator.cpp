#include <shotimport/core/import_orchestrator.hpp>
#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <cmath>
#include <condition_variable>
#include <exception>
#include <stdexcept>
#include <utility>

namespace shotimport::core {

namespace {

using Clock = std::chrono::steady_clock;

std::string new_session_id() {
  static std::atomic<std::uint64_t> counter{0};
  const auto ticks = std::chrono::system_clock::now().time_since_epoch().count();
  return fmt::format("import-{:x}-{}", static_cast<std::uint64_t>(ticks), ++counter);
}

std::string_view contract_for(PipelineStage stage) noexcept {
  switch (stage) {
    case PipelineStage::RoiDetection:
      return contract_names::kRoiResult;
    case PipelineStage::GridMapping:
      return contract_names::kGridMap;
    case PipelineStage::RegionExtraction:
      return contract_names::kRegionMap;
    case PipelineStage::Recognition:
      return contract_names::kRecognitionResult;
  }
  return contract_names::kRoiResult;
}

ImportError missing_input(std::string_view contract) {
  return make_error(ErrorCode::Aborted,
                    fmt::format("session holds no validated {} payload", contract));
}

HeuristicResult run_guarded(const TaskWork& work, std::stop_token stop) {
  try {
    return work(std::move(stop));
  } catch (const std::exception& e) {
    return std::unexpected(make_error(ErrorCode::TaskExecution, e.what()));
  }
}

}  // namespace

class ImportOrchestrator::DriveClaim {
 public:
  explicit DriveClaim(ImportOrchestrator& owner) : owner_(owner) {}
  ~DriveClaim() { owner_.release_drive(); }

  DriveClaim(const DriveClaim&) = delete;
  DriveClaim& operator=(const DriveClaim&) = delete;

 private:
  ImportOrchestrator& owner_;
};

template <typename T>
std::optional<T> ImportOrchestrator::stage_value(std::string_view contract) const {
  std::lock_guard lock(state_mutex_);
  const ValidatedPayload* payload = session_.find(contract);
  if (payload == nullptr) return std::nullopt;
  const T* value = payload->get_if<T>();
  if (value == nullptr) return std::nullopt;
  return *value;
}

ImportOrchestrator::ImportOrchestrator(std::shared_ptr<TaskScheduler> scheduler,
                                       ContractValidator validator,
                                       FallbackResolver resolver,
                                       StageHeuristics heuristics,
                                       OrchestratorOptions options)
    : scheduler_(std::move(scheduler)),
      validator_(std::move(validator)),
      resolver_(std::move(resolver)),
      heuristics_(std::move(heuristics)),
      options_(options) {
  if (!scheduler_) throw std::invalid_argument("ImportOrchestrator: scheduler is null");
  if (!heuristics_.roi_detector || !heuristics_.grid_mapper || !heuristics_.region_extractor ||
      !heuristics_.recognizer) {
    throw std::invalid_argument("ImportOrchestrator: every stage heuristic is required");
  }
}

ImportOrchestrator::~ImportOrchestrator() {
  timer_.disarm();
  std::string active;
  {
    std::lock_guard lock(state_mutex_);
    if (!session_.session_id.empty() && !is_terminal(session_.state)) {
      session_.cancel_token.request_stop();
      active = session_.session_id;
    }
  }
  if (!active.empty()) scheduler_->cancel_session(active);
}

// --- Session entry points ---------------------------------------------------------------------

ImportOrchestrator::Outcome ImportOrchestrator::start_import(const Record& raw_input) {
  auto claimed = claim_drive(ImportState::Idle);
  if (!claimed) return std::unexpected(claimed.error());
  DriveClaim claim(*this);

  const std::size_t depth = scheduler_->queue_depth();
  if (depth > options_.max_queue_depth) {
    spdlog::warn("[orchestrator] admission denied: {} tasks queued (max {})", depth,
                 options_.max_queue_depth);
    return std::unexpected(make_error(
        ErrorCode::AdmissionDenied,
        fmt::format("{} tasks queued, limit {}", depth, options_.max_queue_depth)));
  }

  auto raw = validator_.validate(contract_names::kRawInput, raw_input);
  if (!raw) {
    spdlog::warn("[orchestrator] raw input rejected: {}", describe(raw.error()));
    return std::unexpected(raw.error());
  }

  const std::string id = new_session_id();
  const auto now = Clock::now();
  const auto deadline = now + options_.session_timeout;
  {
    std::lock_guard lock(state_mutex_);
    session_ = ImportSession{};
    session_.session_id = id;
    session_.started_at = now;
    session_.deadline_at = deadline;
  }
  // Armed only once the session is installed so an immediate expiry finds it.
  timer_.arm(deadline, [this, id] { on_deadline(id); });
  spdlog::info("[orchestrator] session {} started, budget {} ms", id,
               options_.session_timeout.count());

  StageEntry entry{std::string(contract_names::kRawInput), std::move(*raw)};

  if (!scheduler_->available()) {
    const RawInput* input = entry.payload.get_if<RawInput>();
    SuggestedHint hint;
    if (input != nullptr) {
      const double w = input->width;
      const double h = input->height;
      hint.bounds = Bounds{w * 0.1, h * 0.1, w * 0.8, h * 0.8};
    }
    hint.note = "automatic detection unavailable; crop manually";
    spdlog::warn("[orchestrator] scheduler unavailable, session {} goes straight to manual crop",
                 id);
    auto moved = do_transition(ImportState::AwaitingManualCrop, std::move(entry),
                               TransitionExtras{std::move(hint), std::nullopt}, &id);
    if (!moved) return std::unexpected(moved.error());
    return state();
  }

  auto step = move_to(id, ImportState::AnalyzingRoi, std::move(entry), {},
                      PipelineStage::RoiDetection);
  if (!step) return std::unexpected(step.error());
  if (!*step) return state();
  return drive(id, **step);
}

ImportOrchestrator::Outcome ImportOrchestrator::supply_manual_crop(const Record& roi) {
  auto claimed = claim_drive(ImportState::AwaitingManualCrop);
  if (!claimed) return std::unexpected(claimed.error());
  DriveClaim claim(*this);
  const std::string id = *claimed;

  auto validated = validator_.validate(contract_names::kRoiResult, roi);
  if (!validated) {
    spdlog::warn("[orchestrator] manual crop rejected: {}", describe(validated.error()));
    return std::unexpected(validated.error());
  }
  if (cancel_requested()) {
    auto step = finish_cancelled(id);
    if (!step) return std::unexpected(step.error());
    return state();
  }

  spdlog::info("[orchestrator] manual crop supplied for session {}", id);
  auto step = move_to(id, ImportState::MappingGrid,
                      StageEntry{std::string(contract_names::kRoiResult), std::move(*validated)},
                      {}, PipelineStage::GridMapping);
  if (!step) return std::unexpected(step.error());
  if (!*step) return state();
  return drive(id, **step);
}

ImportOrchestrator::Outcome ImportOrchestrator::complete_review(const Record& review) {
  auto claimed = claim_drive(ImportState::Reviewing);
  if (!claimed) return std::unexpected(claimed.error());
  DriveClaim claim(*this);
  const std::string id = *claimed;

  auto validated = validator_.validate(contract_names::kReviewResult, review);
  if (!validated) {
    spdlog::warn("[orchestrator] review rejected: {}", describe(validated.error()));
    return std::unexpected(validated.error());
  }
  auto moved = do_transition(
      ImportState::Complete,
      StageEntry{std::string(contract_names::kReviewResult), std::move(*validated)}, {}, &id);
  if (!moved) return std::unexpected(moved.error());
  return state();
}

ImportOrchestrator::Outcome ImportOrchestrator::request_recrop() {
  auto claimed = claim_drive(ImportState::Reviewing);
  if (!claimed) return std::unexpected(claimed.error());
  DriveClaim claim(*this);
  const std::string id = *claimed;

  SuggestedHint hint;
  if (auto roi = stage_value<RoiResult>(contract_names::kRoiResult)) {
    hint.bounds = roi->bounds;
    hint.confidence = roi->confidence;
  }
  hint.note = "re-crop requested from review";
  auto moved = do_transition(ImportState::AwaitingManualCrop, std::nullopt,
                             TransitionExtras{std::move(hint), std::nullopt}, &id);
  if (!moved) return std::unexpected(moved.error());
  return state();
}

void ImportOrchestrator::cancel() {
  std::string id;
  ImportError reason;
  {
    std::lock_guard lock(state_mutex_);
    if (session_.session_id.empty() || is_terminal(session_.state)) return;
    if (!session_.cancel_reason) {
      session_.cancel_reason = make_error(ErrorCode::Cancelled, "import cancelled");
    }
    reason = *session_.cancel_reason;
    id = session_.session_id;
    session_.cancel_token.request_stop();
    // Called from an observer: the running transition applies it once observers return.
    if (transition_owner_.load() == std::this_thread::get_id()) pending_cancel_ = id;
  }
  spdlog::info("[orchestrator] session {} cancelled", id);
  scheduler_->cancel_session(id);
  if (transition_owner_.load() == std::this_thread::get_id()) return;
  auto moved = do_transition(ImportState::Error, std::nullopt,
                             TransitionExtras{std::nullopt, std::move(reason)}, &id);
  if (!moved) {
    spdlog::debug("[orchestrator] cancel transition not applied: {}", describe(moved.error()));
  }
}

std::expected<void, ImportError> ImportOrchestrator::reset() {
  auto moved = do_transition(ImportState::Idle, std::nullopt, {}, nullptr);
  if (!moved) return moved;
  timer_.disarm();
  return {};
}

std::expected<void, ImportError> ImportOrchestrator::transition_to(
    ImportState next,
    std::optional<StageEntry> payload) {
  return do_transition(next, std::move(payload), {}, nullptr);
}

// --- Observers and readers --------------------------------------------------------------------

ObserverId ImportOrchestrator::subscribe(TransitionObserver observer) {
  std::lock_guard lock(state_mutex_);
  const ObserverId id = next_observer_id_++;
  observers_.emplace(id, std::move(observer));
  return id;
}

bool ImportOrchestrator::unsubscribe(ObserverId id) {
  std::lock_guard lock(state_mutex_);
  return observers_.erase(id) > 0;
}

ImportState ImportOrchestrator::state() const {
  std::lock_guard lock(state_mutex_);
  return session_.state;
}

SessionSnapshot ImportOrchestrator::snapshot() const {
  std::lock_guard lock(state_mutex_);
  return make_snapshot(session_);
}

std::optional<ReviewResult> ImportOrchestrator::final_selection() const {
  std::lock_guard lock(state_mutex_);
  if (session_.state != ImportState::Complete) return std::nullopt;
  if (const auto* p = session_.find(contract_names::kReviewResult)) {
    if (const auto* review = p->get_if<ReviewResult>()) return *review;
  }
  if (const auto* p = session_.find(contract_names::kRecognitionResult)) {
    if (const auto* result = p->get_if<RecognitionResult>()) {
      return ReviewResult{result->items, result->stats.average_confidence, false};
    }
  }
  return std::nullopt;
}

// --- Transition function ----------------------------------------------------------------------

std::expected<void, ImportError> ImportOrchestrator::do_transition(
    ImportState next,
    std::optional<StageEntry> payload,
    TransitionExtras extras,
    const std::string* session_id) {
  if (transition_owner_.load() == std::this_thread::get_id()) {
    return std::unexpected(make_error(
        ErrorCode::InvalidTransition,
        fmt::format("re-entrant transition to {} rejected", to_string(next))));
  }
  std::lock_guard transition_lock(transition_mutex_);
  transition_owner_.store(std::this_thread::get_id());
  struct OwnerReset {
    std::atomic<std::thread::id>& owner;
    ~OwnerReset() { owner.store(std::thread::id{}); }
  } owner_reset{transition_owner_};

  auto applied = apply_transition(next, std::move(payload), std::move(extras), session_id);
  if (!applied) return applied;

  // A cancel() issued by an observer could not transition itself; finish it here.
  while (auto pending = take_pending_cancel()) {
    auto cancelled = apply_transition(ImportState::Error, std::nullopt,
                                      TransitionExtras{std::nullopt, std::move(pending->second)},
                                      &pending->first);
    if (!cancelled) {
      spdlog::debug("[orchestrator] deferred cancel not applied: {}",
                    describe(cancelled.error()));
    }
  }
  return {};
}

std::optional<std::pair<std::string, ImportError>> ImportOrchestrator::take_pending_cancel() {
  std::lock_guard lock(state_mutex_);
  if (!pending_cancel_) return std::nullopt;
  std::string id = std::move(*pending_cancel_);
  pending_cancel_.reset();
  if (session_.session_id != id || is_terminal(session_.state) || !session_.cancel_reason) {
    return std::nullopt;
  }
  return std::make_pair(std::move(id), *session_.cancel_reason);
}

std::expected<void, ImportError> ImportOrchestrator::apply_transition(
    ImportState next,
    std::optional<StageEntry> payload,
    TransitionExtras extras,
    const std::string* session_id) {
  TransitionEvent event;
  std::vector<TransitionObserver> observers;
  {
    std::lock_guard lock(state_mutex_);
    if (session_id != nullptr && session_.session_id != *session_id) {
      return std::unexpected(make_error(ErrorCode::InvalidTransition,
                                        fmt::format("session {} is no longer active", *session_id)));
    }
    const ImportState from = session_.state;
    if (!is_allowed_transition(from, next)) {
      return std::unexpected(make_error(
          ErrorCode::InvalidTransition,
          fmt::format("{} -> {} is not allowed", to_string(from), to_string(next))));
    }
    if (session_.cancel_token.stop_requested() && next != ImportState::Error &&
        next != ImportState::Idle) {
      return std::unexpected(make_error(
          ErrorCode::Cancelled,
          fmt::format("session cancelled, {} -> {} refused", to_string(from), to_string(next))));
    }

    session_.state = next;
    if (payload) session_.merge(*payload);
    if (extras.hint) session_.last_hint = extras.hint;
    if (extras.error) session_.last_error = extras.error;
    if (next == ImportState::Idle) session_ = ImportSession{};

    event.from = from;
    event.to = next;
    event.payload = std::move(payload);
    event.timestamp = std::chrono::system_clock::now();
    event.hint = std::move(extras.hint);
    event.error = std::move(extras.error);
    event.session = make_snapshot(session_);
    observers.reserve(observers_.size());
    for (const auto& [id, observer] : observers_) observers.push_back(observer);
  }

  if (event.error) {
    spdlog::error("[orchestrator] {} -> {}: {}", to_string(event.from), to_string(event.to),
                  describe(*event.error));
  } else {
    spdlog::info("[orchestrator] {} -> {}", to_string(event.from), to_string(event.to));
  }
  if (is_terminal(next)) timer_.cancel();

  for (const auto& observer : observers) {
    try {
      observer(event);
    } catch (const std::exception& e) {
      spdlog::error("[orchestrator] observer failed on {} -> {}: {}", to_string(event.from),
                    to_string(event.to), e.what());
    }
  }
  return {};
}

std::expected<std::string, ImportError> ImportOrchestrator::claim_drive(ImportState required) {
  std::lock_guard lock(state_mutex_);
  if (driving_) {
    return std::unexpected(
        make_error(ErrorCode::SessionBusy, "another call is already driving the session"));
  }
  if (session_.state != required) {
    if (required == ImportState::Idle) {
      return std::unexpected(make_error(
          ErrorCode::SessionBusy,
          fmt::format("session {} is {}", session_.session_id, to_string(session_.state))));
    }
    return std::unexpected(make_error(ErrorCode::InvalidTransition,
                                      fmt::format("requires {}, session is {}",
                                                  to_string(required),
                                                  to_string(session_.state))));
  }
  driving_ = true;
  return session_.session_id;
}

void ImportOrchestrator::release_drive() {
  std::lock_guard lock(state_mutex_);
  driving_ = false;
}

// --- Stage loop -------------------------------------------------------------------------------

ImportOrchestrator::Outcome ImportOrchestrator::drive(const std::string& session_id,
                                                      PipelineStage first) {
  std::optional<PipelineStage> stage = first;
  while (stage) {
    auto step = run_stage(session_id, *stage);
    if (!step) return std::unexpected(step.error());
    stage = *step;
  }
  return state();
}

ImportOrchestrator::StageStep ImportOrchestrator::run_stage(const std::string& session_id,
                                                            PipelineStage stage) {
  const std::string_view contract = contract_for(stage);
  const double threshold = threshold_for(stage);
  StageParams params;
  params.timeout = timeout_for(stage);
  std::uint32_t attempts = 0;
  std::uint32_t degrades = 0;

  for (;;) {
    if (cancel_requested()) return finish_cancelled(session_id);
    if (attempts >= options_.max_stage_attempts) {
      return fail(session_id,
                  make_error(ErrorCode::Aborted, fmt::format("{} gave up after {} attempts",
                                                             to_string(stage), attempts)));
    }
    ++attempts;

    HeuristicResult output = execute(session_id, stage, params);
    if (cancel_requested()) return finish_cancelled(session_id);

    std::variant<ImportError, LowConfidenceResult> cause;
    if (!output) {
      cause = std::move(output.error());
    } else if (!std::isfinite(output->confidence) || output->confidence < 0.0 ||
               output->confidence > 1.0) {
      ImportError err = make_error(ErrorCode::ContractViolation,
                                   fmt::format("confidence {} outside [0, 1]", output->confidence));
      err.contract = std::string(contract);
      err.field = "confidence";
      cause = std::move(err);
    } else {
      auto validated = validator_.validate(contract, output->payload);
      if (!validated) {
        cause = std::move(validated.error());
      } else if (output->confidence >= threshold) {
        spdlog::debug("[orchestrator] {} accepted, confidence {:.2f}", to_string(stage),
                      output->confidence);
        return advance(session_id, stage, std::move(*validated));
      } else {
        cause = LowConfidenceResult{output->confidence, threshold, std::move(*validated)};
      }
    }

    FailureContext ctx{stage, std::move(cause), attempts, degrades, params};
    if (const ImportError* err = ctx.error()) {
      spdlog::warn("[orchestrator] {} attempt {} failed: {}", to_string(stage), attempts,
                   describe(*err));
    } else {
      spdlog::info("[orchestrator] {} confidence {:.2f} below threshold {:.2f}", to_string(stage),
                   ctx.low_confidence()->confidence, threshold);
    }

    RecoveryOutcome outcome = resolver_.resolve(ctx);
    if (const auto* retry = std::get_if<RetrySameStage>(&outcome)) {
      spdlog::warn("[orchestrator] retrying {} in {} ms", to_string(stage),
                   retry->backoff.count());
      if (!wait_backoff(retry->backoff)) return finish_cancelled(session_id);
      continue;
    }
    if (const auto* degrade = std::get_if<DegradeAndRetry>(&outcome)) {
      spdlog::warn("[orchestrator] degrading {} to scale {:.2f}, quality level {}",
                   to_string(stage), degrade->params.scale, degrade->params.quality_level);
      params = degrade->params;
      ++degrades;
      if (!wait_backoff(degrade->backoff)) return finish_cancelled(session_id);
      continue;
    }
    if (auto* manual = std::get_if<SwitchToManual>(&outcome)) {
      return switch_to_manual(session_id, stage, std::move(*manual), ctx.low_confidence());
    }
    const auto& abort = std::get<AbortSession>(outcome);
    ImportError err = make_error(abort.code, abort.reason);
    if (const ImportError* original = ctx.error(); original && original->code == abort.code) {
      err.contract = original->contract;
      err.field = original->field;
    }
    return fail(session_id, std::move(err));
  }
}

HeuristicResult ImportOrchestrator::execute(const std::string& session_id,
                                            PipelineStage stage,
                                            const StageParams& params) {
  auto input = stage_value<RawInput>(contract_names::kRawInput);
  if (!input) return std::unexpected(missing_input(contract_names::kRawInput));

  switch (stage) {
    case PipelineStage::RoiDetection:
      return run_heavy(
          session_id, TaskKind::RoiDetection,
          [detector = heuristics_.roi_detector, in = std::move(*input),
           params](std::stop_token stop) { return detector->detect(in, params, stop); },
          params.timeout);

    case PipelineStage::GridMapping: {
      auto roi = stage_value<RoiResult>(contract_names::kRoiResult);
      if (!roi) return std::unexpected(missing_input(contract_names::kRoiResult));
      try {
        return heuristics_.grid_mapper->map(*input, *roi);
      } catch (const std::exception& e) {
        return std::unexpected(make_error(ErrorCode::TaskExecution, e.what()));
      }
    }

    case PipelineStage::RegionExtraction: {
      auto grid = stage_value<GridMap>(contract_names::kGridMap);
      if (!grid) return std::unexpected(missing_input(contract_names::kGridMap));
      return run_heavy(
          session_id, TaskKind::RegionExtraction,
          [extractor = heuristics_.region_extractor, in = std::move(*input),
           g = std::move(*grid), params](std::stop_token stop) {
            return extractor->extract(in, g, params, stop);
          },
          params.timeout);
    }

    case PipelineStage::Recognition: {
      auto regions = stage_value<RegionMap>(contract_names::kRegionMap);
      if (!regions) return std::unexpected(missing_input(contract_names::kRegionMap));
      return run_heavy(
          session_id, TaskKind::Recognition,
          [recognizer = heuristics_.recognizer, r = std::move(*regions),
           params](std::stop_token stop) { return recognizer->recognize(r, params, stop); },
          params.timeout);
    }
  }
  return std::unexpected(make_error(ErrorCode::Aborted, "unknown stage"));
}

HeuristicResult ImportOrchestrator::run_heavy(const std::string& session_id,
                                              TaskKind kind,
                                              TaskWork work,
                                              std::chrono::milliseconds timeout) {
  if (!scheduler_->available()) {
    // Degraded mode after a manual crop: run on the driving thread. No per-task timeout here;
    // the session deadline stops the work through the session token.
    spdlog::debug("[orchestrator] running {} inline, scheduler unavailable", to_string(kind));
    return run_guarded(work, session_token());
  }

  TaskTicket ticket = scheduler_->submit(WorkerTask{session_id, kind, timeout, std::move(work)});
  spdlog::debug("[orchestrator] {} submitted as task {}", to_string(kind), ticket.id());
  // cancel() may have run between the last check and submit.
  if (cancel_requested()) scheduler_->cancel_session(session_id);
  return ticket.get();
}

ImportOrchestrator::StageStep ImportOrchestrator::advance(const std::string& session_id,
                                                          PipelineStage stage,
                                                          ValidatedPayload payload) {
  StageEntry entry{payload.contract(), payload};
  switch (stage) {
    case PipelineStage::RoiDetection:
      return move_to(session_id, ImportState::MappingGrid, std::move(entry), {},
                     PipelineStage::GridMapping);
    case PipelineStage::GridMapping:
      return move_to(session_id, ImportState::ExtractingRegions, std::move(entry), {},
                     PipelineStage::RegionExtraction);
    case PipelineStage::RegionExtraction:
      return move_to(session_id, ImportState::Recognizing, std::move(entry), {},
                     PipelineStage::Recognition);
    case PipelineStage::Recognition:
      break;
  }

  const RecognitionResult* result = payload.get_if<RecognitionResult>();
  if (result == nullptr) return fail(session_id, missing_input(contract_names::kRecognitionResult));

  std::size_t flagged = 0;
  auto reviewed = flag_for_review(*result, &flagged);
  if (!reviewed) return fail(session_id, reviewed.error());
  if (flagged == 0) {
    return move_to(session_id, ImportState::Complete, std::move(entry), {}, std::nullopt);
  }

  SuggestedHint hint;
  hint.confidence = result->stats.average_confidence;
  hint.note = fmt::format("{} of {} items need review", flagged, result->items.size());
  spdlog::info("[orchestrator] {}", hint.note);
  return move_to(session_id, ImportState::Reviewing,
                 StageEntry{reviewed->contract(), std::move(*reviewed)},
                 TransitionExtras{std::move(hint), std::nullopt}, std::nullopt);
}

ImportOrchestrator::StageStep ImportOrchestrator::move_to(const std::string& session_id,
                                                          ImportState next,
                                                          std::optional<StageEntry> entry,
                                                          TransitionExtras extras,
                                                          std::optional<PipelineStage> next_stage) {
  auto moved = do_transition(next, std::move(entry), std::move(extras), &session_id);
  if (!moved) {
    if (cancel_requested()) return finish_cancelled(session_id);
    return std::unexpected(moved.error());
  }
  return next_stage;
}

ImportOrchestrator::StageStep ImportOrchestrator::switch_to_manual(const std::string& session_id,
                                                                   PipelineStage stage,
                                                                   SwitchToManual manual,
                                                                   const LowConfidenceResult* low) {
  SuggestedHint hint = manual.hint.value_or(SuggestedHint{});
  if (hint.note.empty()) hint.note = manual.reason;

  if (stage == PipelineStage::Recognition) {
    // The review UI pre-populates from whatever recognition produced.
    std::optional<StageEntry> entry;
    if (low != nullptr && low->payload) {
      if (const auto* result = low->payload->get_if<RecognitionResult>()) {
        std::size_t flagged = 0;
        auto reviewed = flag_for_review(*result, &flagged);
        if (!reviewed) return fail(session_id, reviewed.error());
        entry = StageEntry{reviewed->contract(), std::move(*reviewed)};
      }
    }
    spdlog::info("[orchestrator] recognition handed to review: {}", manual.reason);
    return move_to(session_id, ImportState::Reviewing, std::move(entry),
                   TransitionExtras{std::move(hint), std::nullopt}, std::nullopt);
  }

  if (!hint.bounds) {
    if (auto roi = stage_value<RoiResult>(contract_names::kRoiResult)) hint.bounds = roi->bounds;
  }
  spdlog::warn("[orchestrator] switching to manual crop: {}", manual.reason);
  return move_to(session_id, ImportState::AwaitingManualCrop, std::nullopt,
                 TransitionExtras{std::move(hint), std::nullopt}, std::nullopt);
}

ImportOrchestrator::StageStep ImportOrchestrator::fail(const std::string& session_id,
                                                       ImportError error) {
  auto moved = do_transition(ImportState::Error, std::nullopt,
                             TransitionExtras{std::nullopt, std::move(error)}, &session_id);
  if (!moved && !is_terminal(state())) return std::unexpected(moved.error());
  return std::nullopt;
}

ImportOrchestrator::StageStep ImportOrchestrator::finish_cancelled(const std::string& session_id) {
  ImportError reason;
  {
    std::lock_guard lock(state_mutex_);
    if (session_.session_id != session_id || is_terminal(session_.state)) return std::nullopt;
    reason = session_.cancel_reason.value_or(make_error(ErrorCode::Cancelled, "import cancelled"));
  }
  auto moved = do_transition(ImportState::Error, std::nullopt,
                             TransitionExtras{std::nullopt, std::move(reason)}, &session_id);
  if (!moved) {
    spdlog::debug("[orchestrator] cancellation already applied: {}", describe(moved.error()));
  }
  return std::nullopt;
}

bool ImportOrchestrator::wait_backoff(std::chrono::milliseconds backoff) {
  if (backoff.count() > 0) {
    std::mutex m;
    std::condition_variable_any cv;
    std::unique_lock lock(m);
    cv.wait_for(lock, session_token(), backoff, [] { return false; });
  }
  return !cancel_requested();
}

void ImportOrchestrator::on_deadline(const std::string& session_id) {
  ImportError reason;
  {
    std::lock_guard lock(state_mutex_);
    if (session_.session_id != session_id || is_terminal(session_.state)) return;
    if (!session_.cancel_reason) {
      session_.cancel_reason =
          make_error(ErrorCode::SessionDeadlineExceeded,
                     fmt::format("session budget of {} ms spent in {}",
                                 options_.session_timeout.count(), to_string(session_.state)));
    }
    reason = *session_.cancel_reason;
    session_.cancel_token.request_stop();
  }
  const std::size_t cancelled = scheduler_->cancel_session(session_id);
  spdlog::error("[orchestrator] session {} deadline exceeded, {} task(s) cancelled", session_id,
                cancelled);
  auto moved = do_transition(ImportState::Error, std::nullopt,
                             TransitionExtras{std::nullopt, std::move(reason)}, &session_id);
  if (!moved) {
    spdlog::debug("[orchestrator] deadline transition not applied: {}", describe(moved.error()));
  }
}

std::expected<ValidatedPayload, ImportError> ImportOrchestrator::flag_for_review(
    const RecognitionResult& result,
    std::size_t* flagged) const {
  RecognitionResult copy = result;
  std::size_t count = 0;
  for (auto& item : copy.items) {
    if (item.confidence < options_.item_review_threshold) {
      item.needs_review = true;
      ++count;
    }
  }
  if (flagged != nullptr) *flagged = count;
  return validator_.validate(contract_names::kRecognitionResult, to_record(copy));
}

bool ImportOrchestrator::cancel_requested() const {
  std::lock_guard lock(state_mutex_);
  return session_.cancel_token.stop_requested();
}

std::stop_token ImportOrchestrator::session_token() const {
  std::lock_guard lock(state_mutex_);
  return session_.cancel_token.get_token();
}

double ImportOrchestrator::threshold_for(PipelineStage stage) const noexcept {
  switch (stage) {
    case PipelineStage::RoiDetection:
      return options_.roi_threshold;
    case PipelineStage::GridMapping:
      return options_.grid_threshold;
    case PipelineStage::RegionExtraction:
      return options_.extraction_threshold;
    case PipelineStage::Recognition:
      return options_.recognition_threshold;
  }
  return 1.0;
}

std::chrono::milliseconds ImportOrchestrator::timeout_for(PipelineStage stage) const noexcept {
  switch (stage) {
    case PipelineStage::RoiDetection:
      return options_.roi_timeout;
    case PipelineStage::RegionExtraction:
      return options_.extraction_timeout;
    case PipelineStage::Recognition:
      return options_.recognition_timeout;
    case PipelineStage::GridMapping:
      break;
  }
  return std::chrono::milliseconds{0};
}

Record build_review_record(const RecognitionResult& result,
                           std::span<const ItemCorrection> corrections,
                           bool reviewed_by_user) {
  ReviewResult review;
  review.items = result.items;
  review.reviewed_by_user = reviewed_by_user;

  for (const auto& correction : corrections) {
    if (correction.kind == ItemCorrection::Kind::Remove) {
      std::erase_if(review.items,
                    [&](const DetectedItem& item) { return item.name == correction.name; });
      continue;
    }
    for (auto& item : review.items) {
      if (item.name == correction.name) {
        item.name = correction.new_name;
        item.confidence = 1.0;
      }
    }
  }

  double sum = 0.0;
  for (auto& item : review.items) {
    item.needs_review = false;
    sum += item.confidence;
  }
  review.confidence =
      review.items.empty() ? 0.0 : sum / static_cast<double>(review.items.size());
  return to_record(review);
}

}  // namespace shotimport::core
