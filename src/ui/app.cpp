#include "ui/app.h"

#include <cstdio>
#include <exception>
#include <string>

#include <imgui.h>

#include "shipcoord/core/enum_strings.h"
#include "shipcoord/core/serialization.h"
#include "shipcoord/util/file_io.h"
#include "shipcoord/util/log.h"

namespace shipcoord::ui {
namespace {

ImVec4 status_color(SessionStatus s) {
  switch (s) {
    case SessionStatus::Pending: return ImVec4(0.7f, 0.7f, 0.7f, 1.0f);
    case SessionStatus::Running: return ImVec4(0.4f, 0.9f, 0.4f, 1.0f);
    case SessionStatus::Complete: return ImVec4(0.4f, 0.7f, 1.0f, 1.0f);
    case SessionStatus::Aborted: return ImVec4(1.0f, 0.45f, 0.35f, 1.0f);
  }
  return ImVec4(1.0f, 1.0f, 1.0f, 1.0f);
}

constexpr std::size_t kMaxLogLines = 500;

std::string opt_int(const std::optional<int>& v) { return v ? std::to_string(*v) : std::string("?"); }

ImVec4 level_color(log::Level l) {
  switch (l) {
    case log::Level::Warn: return ImVec4(1.0f, 0.8f, 0.3f, 1.0f);
    case log::Level::Error: return ImVec4(1.0f, 0.4f, 0.4f, 1.0f);
    case log::Level::Debug: return ImVec4(0.6f, 0.6f, 0.6f, 1.0f);
    default: return ImVec4(0.9f, 0.9f, 0.9f, 1.0f);
  }
}

} // namespace

App::App(Session session) : session_(std::move(session)) {
  session_.set_resolved_listener([this](const RoundResolvedEvent& ev) { rounds_.push_back(ev); });
  log::set_sink([this](log::Level l, const std::string& msg) {
    std::lock_guard<std::mutex> lock(log_mu_);
    log_lines_.emplace_back(l, msg);
    if (log_lines_.size() > kMaxLogLines) log_lines_.pop_front();
  });
}

App::~App() { log::set_sink({}); }

void App::on_event(const SDL_Event& e) {
  if (e.type != SDL_KEYDOWN || e.key.repeat) return;
  if (e.key.keysym.sym == SDLK_s && (e.key.keysym.mod & KMOD_CTRL)) save_snapshot(wall_clock_ms());
}

void App::frame() {
  const TimeMs now = wall_clock_ms();
  session_.tick(now);

  draw_session_window(now);
  draw_crew_window(now);
  draw_rounds_window();
  draw_log_window();
}

void App::save_snapshot(TimeMs now) {
  try {
    write_text_file(save_path_, serialize_session_to_json(session_.state(), now));
    status_line_ = std::string("Saved ") + save_path_;
    log::info(status_line_);
  } catch (const std::exception& e) {
    status_line_ = std::string("Save failed: ") + e.what();
    log::warn(status_line_);
  }
}

void App::draw_session_window(TimeMs now) {
  ImGui::SetNextWindowPos(ImVec2(10, 10), ImGuiCond_FirstUseEver);
  ImGui::SetNextWindowSize(ImVec2(360, 260), ImGuiCond_FirstUseEver);
  ImGui::Begin("Session");

  const SessionState& st = session_.state();
  ImGui::Text("Crew %llu", static_cast<unsigned long long>(st.crew_id));
  ImGui::SameLine();
  ImGui::TextColored(status_color(st.status), "[%s]", session_status_to_string(st.status));

  ImGui::Text("Pressure: %s   Complexity: %s   Captain: %s", pressure_to_string(st.config.pressure),
              complexity_to_string(st.config.complexity), captain_type_to_string(st.config.captain_type));

  if (st.status == SessionStatus::Running) {
    const int r = st.round.number;
    ImGui::Text("Round %d%s of %d", r, r == 0 ? " (training)" : "", st.config.last_round());
    ImGui::Text("Stage: %s   %s left", stage_to_string(st.round.stage),
                format_countdown(st.round.deadline_ms - now).c_str());
  }
  ImGui::Text("Location: %s", asteroid_to_string(st.location));
  ImGui::Text("Minerals: %d   PU spent: %d", st.cumulative_minerals, st.cumulative_pu_spent);

  ImGui::Separator();
  if (st.status == SessionStatus::Pending) {
    if (ImGui::Button("Start session") && !session_.start(now)) status_line_ = "Session could not be started";
  } else if (st.status == SessionStatus::Running) {
    if (ImGui::Button("Abort session") && !session_.abort(now, "aborted from console")) {
      status_line_ = "Session already ended";
    }
  }

  ImGui::Separator();
  ImGui::InputText("Snapshot", save_path_, sizeof(save_path_));
  if (ImGui::Button("Save snapshot")) save_snapshot(now);
  if (!status_line_.empty()) ImGui::TextWrapped("%s", status_line_.c_str());

  ImGui::End();
}

void App::draw_crew_window(TimeMs now) {
  ImGui::SetNextWindowPos(ImVec2(380, 10), ImGuiCond_FirstUseEver);
  ImGui::SetNextWindowSize(ImVec2(620, 560), ImGuiCond_FirstUseEver);
  ImGui::Begin("Crew");

  if (ImGui::BeginTabBar("roles")) {
    for (Role role : kAllRoles) {
      if (ImGui::BeginTabItem(role_to_string(role))) {
        draw_role_tab(role, now);
        ImGui::EndTabItem();
      }
    }
    ImGui::EndTabBar();
  }

  ImGui::End();
}

void App::draw_role_tab(Role role, TimeMs now) {
  const RoundView view = session_.round_view(role, now);
  const std::string& who = session_.state().crew.slot(role).participant_id;
  ImGui::Text("%s (%s)", role_to_string(role), who.c_str());

  if (view.status == SessionStatus::Running) {
    ImGui::Text("Round %d%s  |  %s  |  %s left", view.round, view.training ? " (training)" : "",
                stage_to_string(view.stage), format_countdown(view.remaining_ms).c_str());
  } else {
    ImGui::TextDisabled("Session %s", session_status_to_string(view.status));
  }

  ImGui::Text("PU %d / %d  (available to you: %d)", view.pu_remaining, view.pu_per_round, view.pu_available);
  ImGui::Text("Probes left: %d   Robots left: %d   Minerals: %d", view.probes_left, view.robots_left,
              view.cumulative_minerals);

  if (view.last_outcome) {
    const MiningOutcome& o = *view.last_outcome;
    ImGui::Text("Last mining: %s %s, p=%.2f, %s, %d minerals", asteroid_to_string(o.asteroid),
                depth_to_string(o.depth), o.probability, o.success ? "success" : "failure", o.minerals);
  }

  ImGui::Separator();
  draw_asteroid_table(view);

  ImGui::Separator();
  draw_action_buttons(view, now);

  ImGui::Separator();
  draw_chat(view, now);
}

void App::draw_asteroid_table(const RoundView& view) {
  if (!ImGui::BeginTable("asteroids", 6, ImGuiTableFlags_Borders | ImGuiTableFlags_RowBg)) return;
  ImGui::TableSetupColumn("Asteroid");
  ImGui::TableSetupColumn("Travel");
  ImGui::TableSetupColumn("Max minerals");
  ImGui::TableSetupColumn("Shallow cost");
  ImGui::TableSetupColumn("Deep cost");
  ImGui::TableSetupColumn("Notes");
  ImGui::TableHeadersRow();

  for (const auto& row : view.asteroids) {
    ImGui::TableNextRow();
    ImGui::TableNextColumn();
    ImGui::TextUnformatted(asteroid_to_string(row.asteroid));
    ImGui::TableNextColumn();
    ImGui::Text("%d", row.travel_cost);
    ImGui::TableNextColumn();
    ImGui::TextUnformatted(opt_int(row.max_minerals).c_str());
    ImGui::TableNextColumn();
    ImGui::TextUnformatted(opt_int(row.shallow_cost).c_str());
    ImGui::TableNextColumn();
    ImGui::TextUnformatted(opt_int(row.deep_cost).c_str());
    ImGui::TableNextColumn();
    std::string notes;
    if (row.here) notes += "crew here ";
    if (row.mined) notes += "mined";
    ImGui::TextUnformatted(notes.c_str());
  }
  ImGui::EndTable();
}

void App::draw_action_buttons(const RoundView& view, TimeMs now) {
  const Role role = view.role;
  const std::size_t ri = role_index(role);

  if (view.own_action) {
    ImGui::Text("Submitted: %s", action_to_string(*view.own_action).c_str());
  }

  if (role == Role::Captain) {
    ImGui::TextDisabled("The Captain advises in Briefing and takes no actions.");
  } else {
    ImGui::BeginDisabled(!view.can_act);
    if (role == Role::Navigator) {
      for (Asteroid a : kAllAsteroids) {
        if (a == view.location) continue;
        const std::string label = std::string("Travel to ") + asteroid_to_string(a);
        if (ImGui::Button(label.c_str())) submit(role, view.round, Travel{a}, now);
        ImGui::SameLine();
      }
      if (ImGui::Button("Send probe")) submit(role, view.round, SendProbe{}, now);
    } else {
      if (ImGui::Button("Deploy robot")) submit(role, view.round, DeployRobot{}, now);
      ImGui::SameLine();
      if (ImGui::Button("Mine shallow")) submit(role, view.round, Mine{Depth::Shallow, std::nullopt}, now);
      ImGui::SameLine();
      if (ImGui::Button("Mine deep")) submit(role, view.round, Mine{Depth::Deep, std::nullopt}, now);
    }
    ImGui::SameLine();
    if (ImGui::Button("Do nothing")) submit(role, view.round, NoOp{}, now);
    ImGui::EndDisabled();
  }

  if (!feedback_[ri].empty()) ImGui::TextWrapped("%s", feedback_[ri].c_str());
}

void App::draw_chat(const RoundView& view, TimeMs now) {
  const Role role = view.role;
  const std::size_t ri = role_index(role);

  ImGui::TextUnformatted("Messages");
  ImGui::BeginChild("messages", ImVec2(0, 140), true);
  for (const auto& m : view.messages) {
    const char* to = m.to ? role_to_string(*m.to) : "all";
    ImGui::TextWrapped("[r%d] %s -> %s: %s", m.round, role_to_string(m.from), to, m.text.c_str());
  }
  ImGui::EndChild();

  const bool briefing = view.status == SessionStatus::Running && view.stage == Stage::Briefing;
  ImGui::BeginDisabled(!briefing);
  const char* targets[] = {"everyone", "Captain", "Navigator", "Driller"};
  ImGui::SetNextItemWidth(120);
  ImGui::Combo("##to", &chat_to_[ri], targets, IM_ARRAYSIZE(targets));
  ImGui::SameLine();
  ImGui::SetNextItemWidth(-80);
  ImGui::InputText("##msg", chat_buf_[ri], sizeof(chat_buf_[ri]));
  ImGui::SameLine();
  if (ImGui::Button("Send")) {
    std::optional<Role> to;
    if (chat_to_[ri] > 0) to = kAllRoles[static_cast<std::size_t>(chat_to_[ri] - 1)];
    const RejectReason r = session_.post_message(view.round, role, to, chat_buf_[ri], now);
    if (r == RejectReason::None) {
      chat_buf_[ri][0] = '\0';
      feedback_[ri].clear();
    } else {
      feedback_[ri] = std::string("Message rejected: ") + reject_reason_to_string(r);
    }
  }
  ImGui::EndDisabled();
}

void App::draw_rounds_window() {
  ImGui::SetNextWindowPos(ImVec2(10, 280), ImGuiCond_FirstUseEver);
  ImGui::SetNextWindowSize(ImVec2(360, 290), ImGuiCond_FirstUseEver);
  ImGui::Begin("Rounds");

  if (rounds_.empty()) ImGui::TextDisabled("No rounds resolved yet.");
  for (auto it = rounds_.rbegin(); it != rounds_.rend(); ++it) {
    const RoundResolvedEvent& ev = *it;
    ImGui::Text("Round %d%s: %s -> %s", ev.round, ev.training ? " (training)" : "",
                asteroid_to_string(ev.location_before), asteroid_to_string(ev.location_after));
    ImGui::Text("  Nav: %s   Drl: %s", action_to_string(ev.steps[role_index(Role::Navigator)].action).c_str(),
                action_to_string(ev.steps[role_index(Role::Driller)].action).c_str());
    if (ev.outcome) {
      ImGui::Text("  %s mining p=%.2f draw=%.3f -> %d minerals", depth_to_string(ev.outcome->depth),
                  ev.outcome->probability, ev.outcome->draw, ev.outcome->minerals);
    }
    ImGui::Text("  PU left %d, total minerals %d", ev.pu_remaining, ev.cumulative_minerals);
  }

  ImGui::End();
}

void App::draw_log_window() {
  ImGui::SetNextWindowPos(ImVec2(10, 580), ImGuiCond_FirstUseEver);
  ImGui::SetNextWindowSize(ImVec2(990, 150), ImGuiCond_FirstUseEver);
  ImGui::Begin("Log");

  ImGui::Checkbox("Auto-scroll", &log_autoscroll_);
  ImGui::SameLine();
  if (ImGui::Button("Clear")) {
    std::lock_guard<std::mutex> lock(log_mu_);
    log_lines_.clear();
  }

  ImGui::BeginChild("log_lines");
  {
    std::lock_guard<std::mutex> lock(log_mu_);
    for (const auto& [level, msg] : log_lines_) {
      ImGui::TextColored(level_color(level), "[%s] %s", log::level_to_string(level), msg.c_str());
    }
  }
  if (log_autoscroll_ && ImGui::GetScrollY() >= ImGui::GetScrollMaxY()) ImGui::SetScrollHereY(1.0f);
  ImGui::EndChild();

  ImGui::End();
}

void App::submit(Role role, int round_no, const Action& action, TimeMs now) {
  const ActionVerdict v = session_.submit_action(round_no, role, action, now);
  std::string& fb = feedback_[role_index(role)];
  if (v.accepted) {
    fb = "Accepted: " + action_to_string(action);
  } else {
    fb = std::string("Rejected (") + reject_reason_to_string(v.reason) + "): " + action_to_string(action);
  }
}

} // namespace shipcoord::ui
