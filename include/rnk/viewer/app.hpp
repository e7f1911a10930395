#pragma once
#include <cstddef>
#include <memory>
#include <string>
#include <rnk/config.hpp>
#include <rnk/kinematic.hpp>
#include <rnk/presets.hpp>
#include <rnk/session.hpp>

namespace rnk {

// RAII window that steps a kinematic session each frame and draws the
// linearized network with the selected vehicle's lane neighbors.
class ViewerApp {
public:
  explicit ViewerApp(SessionConfig cfg = {});
  int run(); // returns 0 on normal exit

private:
  // Input & data flow
  void process_input_();
  void advance_(double frame_dt);
  void load_preset_(NetworkPreset p);
  // Rendering
  void render_frame_();
  void draw_network_();
  void draw_vehicles_();
  void draw_neighbors_();
  void draw_hud_();

  // Helpers
  struct Vec2f { float x; float y; };
  Vec2f axisToScreen_(double global_pos, int lane) const;
  std::string selected_id_() const;

  SessionConfig cfg_;
  NetworkPreset preset_{NetworkPreset::Ring};
  std::unique_ptr<KinematicBackend> backend_;
  std::unique_ptr<Session> session_;

  // Sim pacing
  double time_scale_{1.0};   // 0.0 = paused
  double accum_{0.0};

  // UI state
  float scale_px_per_m_{2.0f};
  float pan_x_m_{0.0f};
  std::size_t selected_{0};
  std::string status_;

  // N-cycle for quick reseed (4,8,12,20)
  int n_cycle_idx_{2};
};

} // namespace rnk
