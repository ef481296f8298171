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


#include "staffing/scheduling/shift_calendar.h"

#include <cstdint>
#include <ostream>
#include <string>

#include "absl/log/check.h"
#include "absl/log/log.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "absl/time/civil_time.h"
#include "staffing/base/status_macros.h"
#include "staffing/scheduling/scheduling.pb.h"

namespace staffing {

absl::string_view ShiftTypeName(ShiftType type) {
  switch (type) {
    case ShiftType::kMorning:
      return "morning";
    case ShiftType::kAfternoon:
      return "afternoon";
    case ShiftType::kNight:
      return "night";
  }
  LOG(FATAL) << "Invalid shift type: " << static_cast<int>(type);
}

std::ostream& operator<<(std::ostream& out, ShiftType type) {
  return out << ShiftTypeName(type);
}

ShiftTypeProto ShiftTypeToProto(ShiftType type) {
  switch (type) {
    case ShiftType::kMorning:
      return MORNING;
    case ShiftType::kAfternoon:
      return AFTERNOON;
    case ShiftType::kNight:
      return NIGHT;
  }
  LOG(FATAL) << "Invalid shift type: " << static_cast<int>(type);
}

absl::StatusOr<ShiftType> ShiftTypeFromProto(ShiftTypeProto proto) {
  switch (proto) {
    case MORNING:
      return ShiftType::kMorning;
    case AFTERNOON:
      return ShiftType::kAfternoon;
    case NIGHT:
      return ShiftType::kNight;
    default:
      return absl::InvalidArgumentError(
          absl::StrCat("unspecified or unknown shift type ",
                       ShiftTypeProto_Name(proto)));
  }
}

absl::Weekday WeekdayFromProto(WeekdayProto proto) {
  DCHECK_GE(proto, MONDAY);
  DCHECK_LE(proto, SUNDAY);
  // absl::Weekday counts from monday == 0.
  return static_cast<absl::Weekday>(static_cast<int>(proto) - 1);
}

WeekdayProto WeekdayToProto(absl::Weekday weekday) {
  return static_cast<WeekdayProto>(static_cast<int>(weekday) + 1);
}

absl::StatusOr<absl::CivilDay> ParseDate(absl::string_view text) {
  absl::CivilDay day;
  // The round trip rejects what ParseCivilTime() would silently normalize.
  if (!absl::ParseCivilTime(text, &day) || FormatDate(day) != text) {
    return absl::InvalidArgumentError(
        absl::StrCat("invalid date '", text, "', expected YYYY-MM-DD"));
  }
  return day;
}

std::string FormatDate(absl::CivilDay day) {
  return absl::FormatCivilTime(day);
}

absl::CivilDay WeekStart(absl::CivilDay day) {
  return absl::PrevWeekday(day + 1, absl::Weekday::monday);
}

ShiftCatalog::ShiftCatalog() {
  windows_[static_cast<int>(ShiftType::kMorning)] = {6 * 60, 14 * 60};
  windows_[static_cast<int>(ShiftType::kAfternoon)] = {14 * 60, 22 * 60};
  windows_[static_cast<int>(ShiftType::kNight)] = {22 * 60, 6 * 60};
}

absl::StatusOr<ShiftCatalog> ShiftCatalog::FromParameters(
    const ShiftSchedulerParameters& params) {
  ShiftCatalog catalog;
  std::array<bool, kNumShiftTypes> overridden = {false, false, false};
  for (const ShiftWindowProto& window_proto : params.shift_windows()) {
    ASSIGN_OR_RETURN(const ShiftType type,
                     ShiftTypeFromProto(window_proto.shift_type()));
    const int index = static_cast<int>(type);
    if (overridden[index]) {
      return absl::InvalidArgumentError(
          absl::StrCat("duplicate window for shift type ", ShiftTypeName(type)));
    }
    overridden[index] = true;
    const ShiftWindow window = {window_proto.start_minute(),
                                window_proto.end_minute()};
    if (window.start_minute < 0 || window.start_minute >= kMinutesPerDay ||
        window.end_minute < 0 || window.end_minute >= kMinutesPerDay) {
      return absl::InvalidArgumentError(absl::StrCat(
          "window of ", ShiftTypeName(type), " must use minutes in [0, ",
          kMinutesPerDay, "), got ", window.start_minute, "-",
          window.end_minute));
    }
    if (window.start_minute == window.end_minute) {
      return absl::InvalidArgumentError(absl::StrCat(
          "window of ", ShiftTypeName(type), " starts and ends at minute ",
          window.start_minute, ", its duration is zero"));
    }
    if (window.DurationHours() > params.max_shift_hours()) {
      return absl::InvalidArgumentError(absl::StrCat(
          "window of ", ShiftTypeName(type), " lasts ", window.DurationHours(),
          " hours, more than max_shift_hours = ", params.max_shift_hours()));
    }
    catalog.windows_[index] = window;
  }
  return catalog;
}

TimeInterval ShiftCatalog::IntervalOn(absl::CivilDay day,
                                      ShiftType type) const {
  const ShiftWindow& shift_window = window(type);
  const int64_t days_since_epoch = day - absl::CivilDay(1970, 1, 1);
  const int64_t start =
      days_since_epoch * kMinutesPerDay + shift_window.start_minute;
  return {start, start + shift_window.DurationMinutes()};
}

}  // namespace staffing
