// Copyright 2010-2025 Google LLC
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.


// Time model of the shift-assignment engine: shift types, their daily time
// windows, and the calendar arithmetic built on absl::CivilDay.

#ifndef STAFFING_SCHEDULING_SHIFT_CALENDAR_H_
#define STAFFING_SCHEDULING_SHIFT_CALENDAR_H_

#include <array>
#include <cstdint>
#include <ostream>
#include <string>

#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "absl/time/civil_time.h"
#include "staffing/scheduling/scheduling.pb.h"

namespace staffing {

// Canonical order is the declaration order: it is the order in which slots of
// the same date are processed.
enum class ShiftType { kMorning = 0, kAfternoon = 1, kNight = 2 };

inline constexpr int kNumShiftTypes = 3;
inline constexpr std::array<ShiftType, kNumShiftTypes> kAllShiftTypes = {
    ShiftType::kMorning, ShiftType::kAfternoon, ShiftType::kNight};

inline constexpr int kMinutesPerDay = 24 * 60;

absl::string_view ShiftTypeName(ShiftType type);
std::ostream& operator<<(std::ostream& out, ShiftType type);

ShiftTypeProto ShiftTypeToProto(ShiftType type);
absl::StatusOr<ShiftType> ShiftTypeFromProto(ShiftTypeProto proto);

absl::Weekday WeekdayFromProto(WeekdayProto proto);
WeekdayProto WeekdayToProto(absl::Weekday weekday);

// Parses a YYYY-MM-DD date. Anything else, including out-of-range fields
// that absl would normalize (e.g. "2025-02-30"), is an InvalidArgument error.
absl::StatusOr<absl::CivilDay> ParseDate(absl::string_view text);
std::string FormatDate(absl::CivilDay day);

// Monday of the week containing `day`.
absl::CivilDay WeekStart(absl::CivilDay day);

// Half-open interval [start, end) in minutes since 1970-01-01 00:00.
struct TimeInterval {
  int64_t start = 0;
  int64_t end = 0;

  bool Overlaps(const TimeInterval& other) const {
    return start < other.end && other.start < end;
  }
};

// Daily window of a shift type, in minutes after midnight. When end_minute is
// not greater than start_minute the shift ends on the following day.
struct ShiftWindow {
  int start_minute = 0;
  int end_minute = 0;

  int DurationMinutes() const {
    return end_minute > start_minute
               ? end_minute - start_minute
               : end_minute + kMinutesPerDay - start_minute;
  }
  double DurationHours() const { return DurationMinutes() / 60.0; }
};

// The time windows of the three shift types.
//
// The default catalog holds the canonical windows: morning 06:00-14:00,
// afternoon 14:00-22:00 and night 22:00-06:00, contiguous and pairwise
// disjoint on a given date.
class ShiftCatalog {
 public:
  ShiftCatalog();

  // Builds the catalog from the canonical windows overridden by
  // params.shift_windows(). Fails on an unspecified shift type, a duplicate
  // override, a minute outside [0, 1440), a window that starts where it ends,
  // or a duration above params.max_shift_hours().
  static absl::StatusOr<ShiftCatalog> FromParameters(
      const ShiftSchedulerParameters& params);

  const ShiftWindow& window(ShiftType type) const {
    return windows_[static_cast<int>(type)];
  }

  double Hours(ShiftType type) const { return window(type).DurationHours(); }

  // Absolute time interval of a shift of the given type starting on `day`.
  TimeInterval IntervalOn(absl::CivilDay day, ShiftType type) const;

 private:
  std::array<ShiftWindow, kNumShiftTypes> windows_;
};

}  // namespace staffing

#endif  // STAFFING_SCHEDULING_SHIFT_CALENDAR_H_
