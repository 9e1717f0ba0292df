#pragma once
#include <chrono>
#include <cstdint>
#include <optional>
#include <vector>

enum class Edge { Rising, Falling };

struct EdgeStamp {
  Edge edge;
  std::chrono::nanoseconds ts;
};

enum class PressAction {
  Tap,             // released before the long-press threshold
  LongPressReady,  // long-press threshold crossed while held (tactile cue)
  LongPress,       // released between the long-press and factory-reset thresholds
  FactoryReset     // factory-reset threshold crossed while held
};

const char* to_string(PressAction a);

struct PressThresholds {
  std::chrono::nanoseconds long_press = std::chrono::seconds(5);
  std::chrono::nanoseconds factory_reset = std::chrono::seconds(15);
  std::chrono::nanoseconds debounce = std::chrono::milliseconds(50);
};

// Classifies one button press session (falling edge .. rising edge) by hold
// duration. Pure: time only enters through the timestamps passed in.
class PressTracker {
public:
  explicit PressTracker(PressThresholds t = {});

  std::vector<PressAction> on_edge(const EdgeStamp& es);
  // periodic hold check while pressed
  std::vector<PressAction> on_tick(std::chrono::nanoseconds now);

  bool pressed() const { return pressed_; }
  const PressThresholds& thresholds() const { return t_; }

private:
  enum Triggered : uint8_t { kNone = 0, kLongPressThreshold = 1, kFactoryReset = 2 };

  void check_thresholds(std::chrono::nanoseconds now, std::vector<PressAction>& out);
  void reset();

  PressThresholds t_;
  bool pressed_ = false;
  std::chrono::nanoseconds press_start_{};
  uint8_t triggered_ = kNone;
  // last edge that changed state; anything closer than debounce is bounce
  std::optional<std::chrono::nanoseconds> last_edge_{};
};
