#pragma once

namespace tripsense {

// What the trip state machine needs from the location adapter.
class LocationControl {
public:
  virtual ~LocationControl() = default;

  virtual bool start_tracking() = 0;
  virtual void stop_tracking() = 0;
  virtual bool tracking() const = 0;
};

} // namespace tripsense
