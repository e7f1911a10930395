#include <rnk/session.hpp>
#include <utility>
#include <rnk/log.hpp>

namespace rnk {

Scenario::Scenario(NetworkDescription net)
    : net_(std::move(net)), topo_(net_), map_(topo_, net_.starts) {
  log_debug("scenario: {} edges, {} junction links, {} offsets, total length {}",
            topo_.edge_list().size(), topo_.junction_list().size(), map_.size(), topo_.total_length());
}

std::shared_ptr<const Scenario> make_scenario(NetworkDescription net) {
  return std::make_shared<const Scenario>(std::move(net));
}

static const std::shared_ptr<const Scenario>& require(const std::shared_ptr<const Scenario>& s) {
  if (!s) throw TopologyError("session needs a scenario");
  return s;
}

Session::Session(std::shared_ptr<const Scenario> scenario, SimulatorBackend& backend, SessionConfig cfg)
    : scenario_(require(scenario)),
      backend_(backend),
      cfg_(std::move(cfg)),
      table_(cfg_.sim_step),
      engine_(scenario_->topology(), scenario_->positions(), cfg_.neighbors) {
  if (cfg_.log_level) set_log_level(*cfg_.log_level);
  if (backend_.network().edges.size() != scenario_->network().edges.size()) {
    log_warn("session: backend reports {} edges, scenario has {}",
             backend_.network().edges.size(), scenario_->network().edges.size());
  }
  reset();
}

void Session::reset() {
  backend_.reset();
  table_.clear();
  table_.refresh(backend_.snapshot());
  steps_ = 0;
  log_debug("session reset: {} vehicles", table_.num_vehicles());
}

void Session::step() {
  backend_.advance(cfg_.sim_step);
  table_.refresh(backend_.snapshot());
  ++steps_;
  log_debug("step {} t={}: {} vehicles, {} departed, {} arrived, {} teleported",
            steps_, table_.time(), table_.num_vehicles(), table_.num_departed(),
            table_.num_arrived(), table_.teleported_ids().size());
}

} // namespace rnk
