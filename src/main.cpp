#include <SDL.h>

#include <iostream>
#include <optional>
#include <string>

#include <imgui.h>
#include <imgui_impl_sdl2.h>
#include <imgui_impl_sdlrenderer2.h>

#include "shipcoord/util/file_io.h"
#include "shipcoord/util/log.h"

#include "shipcoord/core/crew.h"
#include "shipcoord/core/serialization.h"
#include "shipcoord/core/session.h"
#include "shipcoord/core/session_config.h"
#include "ui/app.h"

namespace {

std::string get_str_arg(int argc, char** argv, const std::string& key, const std::string& def) {
  for (int i = 1; i < argc - 1; ++i) {
    if (argv[i] == key) return argv[i + 1];
  }
  return def;
}

// Either a fresh session from a config file or a resumed snapshot.
std::optional<shipcoord::Session> open_session(int argc, char** argv) {
  using namespace shipcoord;
  const TimeMs now = wall_clock_ms();

  const std::string load_path = get_str_arg(argc, argv, "--load", "");
  if (!load_path.empty()) {
    SessionSnapshot snap = deserialize_session_from_json(read_text_file(load_path));
    return Session::restore(std::move(snap.state), snap.saved_at_ms, now);
  }

  const std::string config_path = get_str_arg(argc, argv, "--config", "data/config/default_session.json");
  SessionConfig cfg;
  try {
    cfg = load_session_config_from_file(config_path);
  } catch (const ConfigurationError& e) {
    std::cerr << "Config validation failed (" << config_path << "):\n";
    for (const auto& err : e.errors()) std::cerr << "  - " << err << "\n";
    return std::nullopt;
  }
  const Crew crew = make_crew("captain", "navigator", "driller", cfg.captain_type == CaptainType::Llm);
  return Session(1, cfg, crew, now);
}

} // namespace

int main(int argc, char** argv) {
  try {
    shipcoord::log::Level level = shipcoord::log::Level::Info;
    const std::string level_s = get_str_arg(argc, argv, "--log-level", "info");
    if (!shipcoord::log::level_from_string(level_s, &level)) {
      std::cerr << "Unknown --log-level: '" << level_s << "'\n";
      return 2;
    }
    shipcoord::log::set_level(level);

    std::optional<shipcoord::Session> session = open_session(argc, argv);
    if (!session) return 1;
    const std::string title = "shipcoord crew console - crew " + std::to_string(session->crew_id());

    shipcoord::ui::App app(std::move(*session));

    if (SDL_Init(SDL_INIT_VIDEO | SDL_INIT_TIMER) != 0) {
      shipcoord::log::error(std::string("SDL_Init failed: ") + SDL_GetError());
      return 1;
    }

    SDL_Window* window = SDL_CreateWindow(title.c_str(), SDL_WINDOWPOS_CENTERED, SDL_WINDOWPOS_CENTERED,
                                          1024, 600, SDL_WINDOW_RESIZABLE);
    if (!window) {
      shipcoord::log::error(std::string("SDL_CreateWindow failed: ") + SDL_GetError());
      return 1;
    }

    SDL_Renderer* renderer = SDL_CreateRenderer(window, -1, SDL_RENDERER_ACCELERATED | SDL_RENDERER_PRESENTVSYNC);
    if (!renderer) {
      shipcoord::log::error(std::string("SDL_CreateRenderer failed: ") + SDL_GetError());
      return 1;
    }

    IMGUI_CHECKVERSION();
    ImGui::CreateContext();
    ImGui::StyleColorsDark();

    ImGuiIO& io = ImGui::GetIO();
    io.ConfigFlags |= ImGuiConfigFlags_NavEnableKeyboard;

    ImGui_ImplSDL2_InitForSDLRenderer(window, renderer);
    ImGui_ImplSDLRenderer2_Init(renderer);

    bool running = true;
    while (running) {
      SDL_Event e;
      while (SDL_PollEvent(&e)) {
        ImGui_ImplSDL2_ProcessEvent(&e);
        if (e.type == SDL_QUIT) running = false;
        if (e.type == SDL_WINDOWEVENT && e.window.event == SDL_WINDOWEVENT_CLOSE &&
            e.window.windowID == SDL_GetWindowID(window))
          running = false;
        app.on_event(e);
      }

      ImGui_ImplSDLRenderer2_NewFrame();
      ImGui_ImplSDL2_NewFrame();
      ImGui::NewFrame();

      app.frame();

      ImGui::Render();
      SDL_SetRenderDrawColor(renderer, 0, 0, 0, 255);
      SDL_RenderClear(renderer);
      ImGui_ImplSDLRenderer2_RenderDrawData(ImGui::GetDrawData(), renderer);
      SDL_RenderPresent(renderer);
    }

    ImGui_ImplSDLRenderer2_Shutdown();
    ImGui_ImplSDL2_Shutdown();
    ImGui::DestroyContext();

    SDL_DestroyRenderer(renderer);
    SDL_DestroyWindow(window);
    SDL_Quit();
    return 0;
  } catch (const std::exception& e) {
    shipcoord::log::error(std::string("Fatal: ") + e.what());
    return 1;
  }
}
