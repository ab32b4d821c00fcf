#pragma once

#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <SDL.h>

#include "shipcoord/core/session.h"
#include "shipcoord/util/log.h"

namespace shipcoord::ui {

// Hot-seat crew console: one window, one tab per role, all driven from the
// same Session on the wall clock.
class App {
 public:
  explicit App(Session session);
  ~App();

  App(const App&) = delete;
  App& operator=(const App&) = delete;

  // Called once per frame.
  void frame();

  // Ctrl+S writes a snapshot to the path in the Session window.
  void on_event(const SDL_Event& e);

 private:
  void draw_session_window(TimeMs now);
  void draw_crew_window(TimeMs now);
  void draw_role_tab(Role role, TimeMs now);
  void draw_asteroid_table(const RoundView& view);
  void draw_action_buttons(const RoundView& view, TimeMs now);
  void draw_chat(const RoundView& view, TimeMs now);
  void draw_rounds_window();
  void draw_log_window();

  void submit(Role role, int round_no, const Action& action, TimeMs now);
  void save_snapshot(TimeMs now);

  Session session_;
  std::vector<RoundResolvedEvent> rounds_;

  // Feedback line for the last submit/post, per role.
  std::string feedback_[kRoleCount];

  char chat_buf_[kRoleCount][256] = {};
  int chat_to_[kRoleCount] = {};  // 0 = everyone, otherwise role index + 1

  char save_path_[256] = "saves/session.json";
  std::string status_line_;

  // Filled by the log sink; the newest lines are kept.
  std::mutex log_mu_;
  std::deque<std::pair<log::Level, std::string>> log_lines_;
  bool log_autoscroll_{true};
};

} // namespace shipcoord::ui
