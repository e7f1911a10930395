#pragma once
#include <rnk/network.hpp>
#include <rnk/snap.hpp>

namespace rnk {

// What the core needs from a traffic simulator. One adapter per simulator;
// everything above this seam only sees NetworkDescription and StepSnapshot.
class SimulatorBackend {
public:
  virtual ~SimulatorBackend() = default;

  virtual const NetworkDescription& network() const = 0;

  // Back to the initial vehicle population at t = 0.
  virtual void reset() = 0;

  // Advance simulated time by dt seconds.
  virtual void advance(double dt) = 0;

  // State after the last reset/advance.
  virtual StepSnapshot snapshot() const = 0;
};

} // namespace rnk
