#pragma once

#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

#include "shipcoord/core/session.h"

namespace shipcoord {

using Clock = std::function<TimeMs()>;

// Held by futures returned from a host that has already been stopped.
class CrewHostStopped : public std::runtime_error {
 public:
  CrewHostStopped() : std::runtime_error("crew host is stopped") {}
};

// Single-writer host for one crew's Session.
//
// A worker thread owns the session. Every operation is queued and runs on
// that thread; callers get a future. Between commands the worker sleeps until
// the current stage deadline and then ticks the session, so stages advance
// even when nobody submits anything.
class CrewHost {
 public:
  // Throws ConfigurationError if the session cannot be created.
  CrewHost(CrewId crew_id, const SessionConfig& cfg, const Crew& crew, Clock clock = wall_clock_ms);
  explicit CrewHost(Session session, Clock clock = wall_clock_ms);
  ~CrewHost();

  CrewHost(const CrewHost&) = delete;
  CrewHost& operator=(const CrewHost&) = delete;

  CrewId crew_id() const;

  std::future<bool> start();
  std::future<ActionVerdict> submit_action(int round_no, Role role, Action action);
  std::future<RejectReason> post_message(int round_no, Role from, std::optional<Role> to, std::string text);
  std::future<RoundView> round_view(Role role);
  std::future<bool> abort(std::string reason);
  std::future<SessionStatus> status();

  // Serialized snapshot (see serialize_session_to_json).
  std::future<std::string> snapshot();

  // Re-check deadlines against the clock now. Useful with a manual clock.
  std::future<void> tick();

  // The listener runs on the worker thread.
  std::future<void> set_resolved_listener(Session::ResolvedListener listener);

  // Runs every already-queued command, then joins the worker. Later calls
  // return futures holding a CrewHostStopped.
  void stop();

 private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

// Entry point for a transport layer hosting many crews.
//
// The registry mutex guards only the id -> host map; crews share no state.
class CrewRegistry {
 public:
  explicit CrewRegistry(Clock clock = wall_clock_ms);
  ~CrewRegistry();

  // Creates (but does not start) a hosted session. Throws ConfigurationError.
  CrewId create_crew(const SessionConfig& cfg, const Crew& crew);

  // Adopt a restored session under its own crew id. Returns false if the id is taken.
  bool adopt(Session session);

  bool start(CrewId crew_id);

  // Unknown crew ids are rejected with RejectReason::UnknownCrew. A crew
  // removed while the call is in flight counts as unknown.
  ActionVerdict submit_action(CrewId crew_id, int round_no, Role role, const Action& action);
  RejectReason post_message(CrewId crew_id, int round_no, Role from, std::optional<Role> to, const std::string& text);

  std::optional<RoundView> get_round_view(CrewId crew_id, Role role);
  bool abort(CrewId crew_id, const std::string& reason);

  // Stops and forgets a crew. Returns false if unknown.
  bool remove(CrewId crew_id);

  std::shared_ptr<CrewHost> find(CrewId crew_id) const;
  std::vector<CrewId> crew_ids() const;
  std::size_t size() const;

 private:
  Clock clock_;
  mutable std::mutex mu_;
  std::unordered_map<CrewId, std::shared_ptr<CrewHost>> hosts_;
  CrewId next_id_{1};
};

} // namespace shipcoord
