#include <raylib.h>
#include <algorithm>
#include <cstddef>
#include <string>
#include <utility>
#include <fmt/format.h>

#include <rnk/log.hpp>
#include <rnk/position_map.hpp>
#include <rnk/viewer/app.hpp>

namespace rnk {

namespace {

static const char* warpLabel(double w) {
  if (w == 0.0)  return "Paused";
  if (w == 0.25) return "0.25x";
  if (w == 0.5)  return "0.5x";
  if (w == 1.0)  return "1x";
  if (w == 2.0)  return "2x";
  if (w == 4.0)  return "4x";
  return "custom";
}

static Color colorFor(std::size_t idx) {
  static const Color PAL[] = {
    {52, 152, 219, 255},  // blue
    {46, 204, 113, 255},  // green
    {241, 196, 15, 255},  // yellow
    {155, 89, 182, 255},  // purple
    {26, 188, 156, 255},  // teal
    {230, 126, 34, 255},  // orange
    {127, 140, 141, 255}, // gray
    {33, 97, 140, 255},   // steel blue
  };
  return PAL[idx % (sizeof(PAL) / sizeof(PAL[0]))];
}

static constexpr Color kRlColor       {231, 76, 60, 255};
static constexpr Color kLeaderColor   {80, 220, 120, 255};
static constexpr Color kFollowerColor {240, 150, 60, 255};

// --- Layout (pixels) ---
static constexpr float kLeftMargin  = 40.0f;
static constexpr float kRoadBaseY   = 320.0f;  // bottom of lane 0
static constexpr float kLanePx      = 16.0f;
static constexpr int   kHUD_LINE1_Y = 20;
static constexpr int   kHUD_LINE2_Y = 46;
static constexpr int   kHUD_LINE3_Y = 72;

static const int N_CYCLE[4] = {4, 8, 12, 20};

} // namespace

// ---- ViewerApp ----

ViewerApp::ViewerApp(SessionConfig cfg) : cfg_(std::move(cfg)) {
  load_preset_(preset_);
}

void ViewerApp::load_preset_(NetworkPreset p) {
  preset_ = p;
  NetworkDescription net = make_preset(p);
  // Session keeps a reference to the backend: drop it first.
  session_.reset();
  backend_ = std::make_unique<KinematicBackend>(net, preset_vehicles(p, static_cast<std::size_t>(N_CYCLE[n_cycle_idx_])));
  session_ = std::make_unique<Session>(make_scenario(std::move(net)), *backend_, cfg_);
  selected_ = 0;
  accum_ = 0.0;
  status_ = fmt::format("preset {} loaded", preset_name(p));
}

ViewerApp::Vec2f ViewerApp::axisToScreen_(double global_pos, int lane) const {
  const float x = kLeftMargin + float((global_pos + pan_x_m_) * scale_px_per_m_);
  const float y = kRoadBaseY - (float(lane) + 1.0f) * kLanePx;
  return {x, y};
}

std::string ViewerApp::selected_id_() const {
  const auto& ids = session_->vehicles().ids();
  if (ids.empty()) return {};
  return ids[selected_ % ids.size()];
}

int ViewerApp::run() {
  const int W = 1024, H = 480;
  InitWindow(W, H, "RNK - Network Viewer");
  SetTargetFPS(60);

  while (!WindowShouldClose()) {
    process_input_();
    advance_(GetFrameTime());
    render_frame_();
  }

  CloseWindow();
  return 0;
}

void ViewerApp::process_input_() {
  // Time warp controls
  if (IsKeyPressed(KEY_SPACE)) time_scale_ = (time_scale_ == 0.0 ? 1.0 : 0.0);
  if (IsKeyPressed(KEY_ONE))   time_scale_ = 0.25;
  if (IsKeyPressed(KEY_TWO))   time_scale_ = 0.5;
  if (IsKeyPressed(KEY_THREE)) time_scale_ = 1.0;
  if (IsKeyPressed(KEY_FOUR))  time_scale_ = 2.0;
  if (IsKeyPressed(KEY_FIVE))  time_scale_ = 4.0;

  // Zoom
  if (IsKeyDown(KEY_W) || IsKeyDown(KEY_KP_ADD))      scale_px_per_m_ *= 1.01f;
  if (IsKeyDown(KEY_S) || IsKeyDown(KEY_KP_SUBTRACT)) scale_px_per_m_ *= 0.99f;

  // Camera pan
  const float pan_step = 2.0f; // meters per frame while key held
  if (IsKeyDown(KEY_LEFT))  pan_x_m_ += pan_step;
  if (IsKeyDown(KEY_RIGHT)) pan_x_m_ -= pan_step;
  if (IsKeyPressed(KEY_C))  { pan_x_m_ = 0.0f; scale_px_per_m_ = 2.0f; }

  // Vehicle selection
  if (IsKeyPressed(KEY_TAB)) {
    auto& table = session_->vehicles();
    const std::string prev = selected_id_();
    ++selected_;
    if (!prev.empty()) table.remove_observed(prev);
    const std::string cur = selected_id_();
    if (!cur.empty()) table.set_observed(cur);
  }

  // Reseed: cycle vehicle count
  if (IsKeyPressed(KEY_N)) {
    n_cycle_idx_ = (n_cycle_idx_ + 1) % 4;
    load_preset_(preset_);
  }
  if (IsKeyPressed(KEY_R)) {
    session_->reset();
    status_ = "session reset";
  }

  // Toggle network preset
  if (IsKeyPressed(KEY_T)) {
    int next = (static_cast<int>(preset_) + 1) % static_cast<int>(NetworkPreset::Count);
    load_preset_(static_cast<NetworkPreset>(next));
  }

  // Export the offset table
  if (IsKeyPressed(KEY_E)) {
    const std::string path = fmt::format("offsets_{}.csv", preset_name(preset_));
    if (save_offset_table_csv(path, session_->scenario().positions())) {
      status_ = fmt::format("wrote {}", path);
    } else {
      status_ = fmt::format("could not write {}", path);
      log_warn("viewer: {}", status_);
    }
  }
}

void ViewerApp::advance_(double frame_dt) {
  accum_ += frame_dt * time_scale_;
  const double step = session_->config().sim_step;
  // Bounded catch-up after a stall.
  int budget = 16;
  while (accum_ >= step && budget-- > 0) {
    session_->step();
    accum_ -= step;
  }
  if (budget < 0) accum_ = 0.0;
}

void ViewerApp::render_frame_() {
  BeginDrawing();
  ClearBackground(Color{30, 34, 40, 255});
  draw_network_();
  draw_vehicles_();
  draw_neighbors_();
  draw_hud_();
  EndDrawing();
}

void ViewerApp::draw_network_() {
  const auto& topo = session_->scenario().topology();
  for (const auto& entry : session_->scenario().positions().offsets()) {
    const Edge* e = topo.edge(entry.edge);
    if (!e) continue;   // intersection-level name without an edge
    const Color asphalt = entry.internal ? Color{70, 60, 40, 255} : Color{55, 55, 62, 255};
    for (int l = 0; l < e->lanes; ++l) {
      auto a = axisToScreen_(entry.offset, l);
      const float w = std::max(1.0f, float(e->length * scale_px_per_m_));
      DrawRectangleRec(Rectangle{a.x, a.y, w, kLanePx - 2.0f}, asphalt);
    }
    // Edge boundary + label
    auto top = axisToScreen_(entry.offset, e->lanes - 1);
    DrawLineEx({top.x, top.y - 4.0f}, {top.x, kRoadBaseY}, 1.0f, Color{200, 200, 210, 120});
    if (!entry.internal) DrawText(entry.edge.c_str(), int(top.x) + 2, int(top.y) - 16, 10, Color{200, 200, 210, 255});
  }
}

void ViewerApp::draw_vehicles_() {
  const auto& table = session_->vehicles();
  const auto& engine = session_->neighbors();
  const std::string sel = selected_id_();
  const auto& ids = table.ids();
  for (std::size_t i = 0; i < ids.size(); ++i) {
    const VehicleRecord* r = table.find(ids[i]);
    if (!r) continue;
    const double g = engine.global_position(table, r->id);
    if (g == kUnknown) continue;
    auto front = axisToScreen_(g, r->lane);
    const float len_px = std::max(2.0f, float(r->length * scale_px_per_m_));
    const Color c = r->kind == VehicleKind::Autonomous ? kRlColor : colorFor(i);
    DrawRectangleRec(Rectangle{front.x - len_px, front.y + 3.0f, len_px, kLanePx - 8.0f}, c);
    if (r->id == sel) {
      DrawRectangleLinesEx(Rectangle{front.x - len_px - 2.0f, front.y + 1.0f, len_px + 4.0f, kLanePx - 4.0f},
                           2.0f, RAYWHITE);
    }
  }
}

void ViewerApp::draw_neighbors_() {
  const auto& table = session_->vehicles();
  const auto& engine = session_->neighbors();
  const std::string sel = selected_id_();
  if (sel.empty()) return;
  const double g = engine.global_position(table, sel);
  if (g == kUnknown) return;

  const LaneNeighbors n = engine.lane_neighbors(table, sel);
  int y = int(kRoadBaseY) + 16;
  DrawText(fmt::format("{} lane {} edge {}", sel, table.lane(sel), table.edge(sel)).c_str(),
           int(kLeftMargin), y, 14, RAYWHITE);
  y += 18;
  for (std::size_t l = 0; l < n.leaders.size(); ++l) {
    const int lane = static_cast<int>(l);
    const auto self_pt = axisToScreen_(g, lane);
    const float mid = self_pt.y + kLanePx * 0.5f;
    auto mark = [&](const std::string& id, bool ahead, Color color) {
      if (id.empty()) return;
      const double og = engine.global_position(table, id);
      if (og == kUnknown) return;
      const auto other = axisToScreen_(og, lane);
      DrawCircleV({other.x, mid}, 3.0f, color);
      // A neighbor found across the ring's wrap point sits on the far side.
      if (ahead == (og >= g)) DrawLineEx({self_pt.x, mid}, {other.x, mid}, 1.5f, color);
    };
    mark(n.leaders[l], true, kLeaderColor);
    mark(n.followers[l], false, kFollowerColor);
    const std::string line = fmt::format("lane {}: leader {:<8} headway {:7.2f} | follower {:<8} tailway {:7.2f}",
                                         l, n.leaders[l].empty() ? "-" : n.leaders[l], n.headways[l],
                                         n.followers[l].empty() ? "-" : n.followers[l], n.tailways[l]);
    DrawText(line.c_str(), int(kLeftMargin), y, 12, Color{210, 210, 220, 255});
    y += 16;
  }
}

void ViewerApp::draw_hud_() {
  const auto& table = session_->vehicles();
  const auto& topo = session_->scenario().topology();
  DrawText(fmt::format("{} | t = {:.1f} s | step {} | {}", preset_name(preset_), session_->time(),
                       session_->step_count(), warpLabel(time_scale_)).c_str(),
           20, kHUD_LINE1_Y, 20, RAYWHITE);
  DrawText(fmt::format("vehicles {} (rl {}) | inflow {:.0f} veh/h | outflow {:.0f} veh/h | length {:.1f} m",
                       table.num_vehicles(), table.num_rl_vehicles(), table.inflow_rate(60.0),
                       table.outflow_rate(60.0), topo.total_length()).c_str(),
           20, kHUD_LINE2_Y, 18, Color{200, 200, 210, 255});
  DrawText(fmt::format("[Space] pause [1-5] warp [W/S] zoom [Arrows] pan [Tab] select [N] count [T] preset "
                       "[R] reset [E] export  {}", status_).c_str(),
           20, kHUD_LINE3_Y, 14, Color{160, 160, 170, 255});
}

} // namespace rnk
