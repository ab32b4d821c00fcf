#include "shipcoord/core/crew_host.h"

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <exception>
#include <stdexcept>
#include <thread>
#include <utility>

#include "shipcoord/core/serialization.h"
#include "shipcoord/util/log.h"

namespace shipcoord {

struct CrewHost::Impl {
  Impl(Session s, Clock c) : session(std::move(s)), clock(std::move(c)) {
    worker = std::thread([this]() { this->worker_loop(); });
  }

  ~Impl() { shutdown(); }

  void shutdown() {
    {
      std::lock_guard<std::mutex> lk(m);
      if (stop) return;
      stop = true;
    }
    cv.notify_all();
    if (worker.joinable()) worker.join();
  }

  template <typename R, typename F>
  std::future<R> enqueue(F fn) {
    auto task = std::make_shared<std::packaged_task<R()>>(std::move(fn));
    std::future<R> fut = task->get_future();
    {
      std::lock_guard<std::mutex> lk(m);
      if (stop) {
        std::promise<R> p;
        p.set_exception(std::make_exception_ptr(CrewHostStopped()));
        return p.get_future();
      }
      q.push_back([task]() { (*task)(); });
    }
    cv.notify_one();
    return fut;
  }

  void worker_loop() {
    std::unique_lock<std::mutex> lk(m);
    for (;;) {
      if (!q.empty()) {
        auto job = std::move(q.front());
        q.pop_front();
        lk.unlock();
        // Deadlines due before the command are applied first.
        session.tick(clock());
        job();
        lk.lock();
        continue;
      }
      if (stop) break;

      const auto deadline = session.next_deadline();
      if (!deadline) {
        cv.wait(lk, [&]() { return stop || !q.empty(); });
        continue;
      }

      const TimeMs wait_ms = *deadline - clock();
      if (wait_ms <= 0) {
        lk.unlock();
        session.tick(clock());
        lk.lock();
        continue;
      }
      cv.wait_for(lk, std::chrono::milliseconds(wait_ms), [&]() { return stop || !q.empty(); });
    }
  }

  Session session;
  Clock clock;

  std::mutex m;
  std::condition_variable cv;
  std::deque<std::function<void()>> q;
  bool stop{false};
  std::thread worker;
};

CrewHost::CrewHost(CrewId crew_id, const SessionConfig& cfg, const Crew& crew, Clock clock)
    : CrewHost(Session(crew_id, cfg, crew, clock()), clock) {}

CrewHost::CrewHost(Session session, Clock clock)
    : impl_(std::make_unique<Impl>(std::move(session), std::move(clock))) {}

CrewHost::~CrewHost() = default;

CrewId CrewHost::crew_id() const {
  // Immutable after construction; safe to read from any thread.
  return impl_->session.crew_id();
}

std::future<bool> CrewHost::start() {
  Impl* impl = impl_.get();
  return impl->enqueue<bool>([impl]() { return impl->session.start(impl->clock()); });
}

std::future<ActionVerdict> CrewHost::submit_action(int round_no, Role role, Action action) {
  Impl* impl = impl_.get();
  return impl->enqueue<ActionVerdict>([impl, round_no, role, action = std::move(action)]() {
    return impl->session.submit_action(round_no, role, action, impl->clock());
  });
}

std::future<RejectReason> CrewHost::post_message(int round_no, Role from, std::optional<Role> to, std::string text) {
  Impl* impl = impl_.get();
  return impl->enqueue<RejectReason>([impl, round_no, from, to, text = std::move(text)]() {
    return impl->session.post_message(round_no, from, to, text, impl->clock());
  });
}

std::future<RoundView> CrewHost::round_view(Role role) {
  Impl* impl = impl_.get();
  return impl->enqueue<RoundView>([impl, role]() { return impl->session.round_view(role, impl->clock()); });
}

std::future<bool> CrewHost::abort(std::string reason) {
  Impl* impl = impl_.get();
  return impl->enqueue<bool>(
      [impl, reason = std::move(reason)]() { return impl->session.abort(impl->clock(), reason); });
}

std::future<SessionStatus> CrewHost::status() {
  Impl* impl = impl_.get();
  return impl->enqueue<SessionStatus>([impl]() { return impl->session.status(); });
}

std::future<std::string> CrewHost::snapshot() {
  Impl* impl = impl_.get();
  return impl->enqueue<std::string>(
      [impl]() { return serialize_session_to_json(impl->session.state(), impl->clock()); });
}

std::future<void> CrewHost::tick() {
  return impl_->enqueue<void>([]() {});
}

std::future<void> CrewHost::set_resolved_listener(Session::ResolvedListener listener) {
  Impl* impl = impl_.get();
  return impl->enqueue<void>(
      [impl, listener = std::move(listener)]() mutable { impl->session.set_resolved_listener(std::move(listener)); });
}

void CrewHost::stop() { impl_->shutdown(); }

// --- CrewRegistry ---

namespace {

// Empty when the host was stopped after the registry lookup.
template <typename R>
std::optional<R> get_unless_stopped(std::future<R> fut) {
  try {
    return fut.get();
  } catch (const CrewHostStopped&) {
    return std::nullopt;
  }
}

} // namespace

CrewRegistry::CrewRegistry(Clock clock) : clock_(std::move(clock)) {}

CrewRegistry::~CrewRegistry() {
  std::unordered_map<CrewId, std::shared_ptr<CrewHost>> hosts;
  {
    std::lock_guard<std::mutex> lk(mu_);
    hosts.swap(hosts_);
  }
  for (auto& [_, h] : hosts) h->stop();
}

CrewId CrewRegistry::create_crew(const SessionConfig& cfg, const Crew& crew) {
  CrewId id = kInvalidCrewId;
  {
    std::lock_guard<std::mutex> lk(mu_);
    while (hosts_.count(next_id_) != 0) ++next_id_;
    id = next_id_++;
  }
  // Built outside the lock: session validation may throw.
  auto host = std::make_shared<CrewHost>(id, cfg, crew, clock_);
  {
    std::lock_guard<std::mutex> lk(mu_);
    hosts_[id] = std::move(host);
  }
  log::info("registry: crew " + std::to_string(id) + " created");
  return id;
}

bool CrewRegistry::adopt(Session session) {
  const CrewId id = session.crew_id();
  {
    std::lock_guard<std::mutex> lk(mu_);
    if (hosts_.count(id) != 0) return false;
    next_id_ = std::max(next_id_, id + 1);
  }
  auto host = std::make_shared<CrewHost>(std::move(session), clock_);
  std::lock_guard<std::mutex> lk(mu_);
  // Another thread may have claimed the id in between.
  if (!hosts_.emplace(id, host).second) {
    host->stop();
    return false;
  }
  return true;
}

std::shared_ptr<CrewHost> CrewRegistry::find(CrewId crew_id) const {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = hosts_.find(crew_id);
  return it == hosts_.end() ? nullptr : it->second;
}

bool CrewRegistry::start(CrewId crew_id) {
  auto host = find(crew_id);
  if (!host) return false;
  return get_unless_stopped(host->start()).value_or(false);
}

ActionVerdict CrewRegistry::submit_action(CrewId crew_id, int round_no, Role role, const Action& action) {
  auto host = find(crew_id);
  if (!host) return ActionVerdict::reject(RejectReason::UnknownCrew);
  return get_unless_stopped(host->submit_action(round_no, role, action))
      .value_or(ActionVerdict::reject(RejectReason::UnknownCrew));
}

RejectReason CrewRegistry::post_message(CrewId crew_id, int round_no, Role from, std::optional<Role> to,
                                        const std::string& text) {
  auto host = find(crew_id);
  if (!host) return RejectReason::UnknownCrew;
  return get_unless_stopped(host->post_message(round_no, from, to, text)).value_or(RejectReason::UnknownCrew);
}

std::optional<RoundView> CrewRegistry::get_round_view(CrewId crew_id, Role role) {
  auto host = find(crew_id);
  if (!host) return std::nullopt;
  return get_unless_stopped(host->round_view(role));
}

bool CrewRegistry::abort(CrewId crew_id, const std::string& reason) {
  auto host = find(crew_id);
  if (!host) return false;
  return get_unless_stopped(host->abort(reason)).value_or(false);
}

bool CrewRegistry::remove(CrewId crew_id) {
  std::shared_ptr<CrewHost> host;
  {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = hosts_.find(crew_id);
    if (it == hosts_.end()) return false;
    host = std::move(it->second);
    hosts_.erase(it);
  }
  host->stop();
  return true;
}

std::vector<CrewId> CrewRegistry::crew_ids() const {
  std::vector<CrewId> ids;
  {
    std::lock_guard<std::mutex> lk(mu_);
    ids.reserve(hosts_.size());
    for (const auto& [id, _] : hosts_) ids.push_back(id);
  }
  std::sort(ids.begin(), ids.end());
  return ids;
}

std::size_t CrewRegistry::size() const {
  std::lock_guard<std::mutex> lk(mu_);
  return hosts_.size();
}

} // namespace shipcoord
