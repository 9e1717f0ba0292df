#include "press_tracker.hpp"

const char* to_string(PressAction a){
  switch (a){
    case PressAction::Tap:            return "tap";
    case PressAction::LongPressReady: return "long-press-ready";
    case PressAction::LongPress:      return "long-press";
    case PressAction::FactoryReset:   return "factory-reset";
  }
  return "?";
}

PressTracker::PressTracker(PressThresholds t) : t_(t) {}

std::vector<PressAction> PressTracker::on_edge(const EdgeStamp& es){
  std::vector<PressAction> out;
  if (last_edge_ && es.ts - *last_edge_ < t_.debounce) return out;
  if (es.edge == Edge::Falling){
    if (pressed_) return out;  // spurious, edges must alternate
    reset();
    pressed_ = true;
    press_start_ = es.ts;
    last_edge_ = es.ts;
    return out;
  }

  if (!pressed_) return out;
  auto held = es.ts - press_start_;
  // a release can land past the reset threshold before the next tick saw it
  if (held >= t_.factory_reset && !(triggered_ & kFactoryReset)){
    triggered_ |= kFactoryReset;
    out.push_back(PressAction::FactoryReset);
  }
  if (triggered_ & kFactoryReset){
    // already handled while held
  } else if (held >= t_.long_press && held < t_.factory_reset){
    out.push_back(PressAction::LongPress);
  } else if (triggered_ == kNone){
    out.push_back(PressAction::Tap);
  }
  reset();
  last_edge_ = es.ts;
  return out;
}

std::vector<PressAction> PressTracker::on_tick(std::chrono::nanoseconds now){
  std::vector<PressAction> out;
  if (pressed_) check_thresholds(now, out);
  return out;
}

void PressTracker::check_thresholds(std::chrono::nanoseconds now, std::vector<PressAction>& out){
  auto held = now - press_start_;
  if (held >= t_.long_press && !(triggered_ & kLongPressThreshold)){
    triggered_ |= kLongPressThreshold;
    out.push_back(PressAction::LongPressReady);
  }
  if (held >= t_.factory_reset && !(triggered_ & kFactoryReset)){
    triggered_ |= kFactoryReset;
    out.push_back(PressAction::FactoryReset);
  }
}

void PressTracker::reset(){
  pressed_ = false;
  press_start_ = {};
  triggered_ = kNone;
}
