// File: src/core/types.cpp
#include "nm/core/types.hpp"

namespace nm {

const char* to_string(ObjectClass c) noexcept {
  switch (c) {
    case ObjectClass::kHuman:
      return "human";
    case ObjectClass::kVehicle:
      return "vehicle";
    case ObjectClass::kPalletTruck:
      return "pallet_truck";
    case ObjectClass::kAgv:
      return "agv";
  }
  return "human";
}

std::optional<ObjectClass> parse_object_class(std::string_view s) {
  if (s == "human") return ObjectClass::kHuman;
  if (s == "vehicle") return ObjectClass::kVehicle;
  if (s == "pallet_truck") return ObjectClass::kPalletTruck;
  if (s == "agv") return ObjectClass::kAgv;
  return std::nullopt;
}

const char* to_string(Severity s) noexcept {
  switch (s) {
    case Severity::kHigh:
      return "HIGH";
    case Severity::kMedium:
      return "MEDIUM";
    case Severity::kLow:
      return "LOW";
  }
  return "LOW";
}

std::optional<ZoneId> CloseCall::zone() const {
  if (vehicle.zone && !vehicle.zone->empty()) return vehicle.zone;
  if (human.zone && !human.zone->empty()) return human.zone;
  return std::nullopt;
}

}  // namespace nm
