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


// In-memory snapshot read by the shift-assignment engine, and the coverage
// plan it produces.
//
// The engine never mutates a RosterSnapshot. Callers persist the Assignments
// of an accepted CoveragePlan themselves.

#ifndef STAFFING_SCHEDULING_ROSTER_MODEL_H_
#define STAFFING_SCHEDULING_ROSTER_MODEL_H_

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "absl/container/btree_set.h"
#include "absl/status/status.h"
#include "absl/strings/string_view.h"
#include "absl/time/civil_time.h"
#include "staffing/scheduling/shift_calendar.h"

namespace staffing {

// Inclusive range of dates a run plans for.
struct PlanningWindow {
  absl::CivilDay first_day;
  absl::CivilDay last_day;

  bool Contains(absl::CivilDay day) const {
    return first_day <= day && day <= last_day;
  }
};

absl::Status ValidatePlanningWindow(const PlanningWindow& window);

using ShiftOnWeekday = std::pair<ShiftType, absl::Weekday>;
using ShiftOnDate = std::pair<ShiftType, absl::CivilDay>;

struct Employee {
  std::string id;
  std::string display_name;
  std::string email;
  std::string phone;
  // Not read by the engine.
  bool is_admin = false;
  bool active = true;

  // Hard constraints. Blocked dates override everything else.
  absl::btree_set<ShiftOnWeekday> availability;
  absl::btree_set<absl::CivilDay> blocked_dates;
  // When non-empty, the employee works on these dates only.
  absl::btree_set<absl::CivilDay> allowed_dates;

  // Soft constraints.
  absl::btree_set<ShiftOnDate> preferred_dates;
  absl::btree_set<ShiftOnWeekday> preferred_weekdays;
  absl::btree_set<ShiftOnDate> avoided_dates;
  absl::btree_set<ShiftOnWeekday> avoided_weekdays;

  void SetAvailable(ShiftType type, absl::Weekday weekday) {
    availability.insert({type, weekday});
  }
  // Available for `type` on every day of the week.
  void SetAvailableAllWeek(ShiftType type);
};

// Every `weekdays` date, optionally bounded by valid_from and valid_until.
struct WeeklyRecurrence {
  absl::btree_set<absl::Weekday> weekdays;
  std::optional<absl::CivilDay> valid_from;
  std::optional<absl::CivilDay> valid_until;
};

// Every date from first_day to last_day, inclusive.
struct DateRangeRecurrence {
  absl::CivilDay first_day;
  absl::CivilDay last_day;
};

using Recurrence = std::variant<WeeklyRecurrence, DateRangeRecurrence>;

struct ShiftRequirement {
  std::string project_id;
  ShiftType shift_type = ShiftType::kMorning;
  Recurrence recurrence;
  int headcount = 1;
};

struct Project {
  std::string id;
  std::string name;
  // In minor currency units, e.g. cents.
  int64_t hourly_rate_minor = 0;
  bool active = true;
  std::vector<ShiftRequirement> requirements;
};

enum class AssignmentStatus { kAssigned, kReported, kCancelled };

absl::string_view AssignmentStatusName(AssignmentStatus status);

struct Assignment {
  std::string employee_id;
  std::string project_id;
  absl::CivilDay date;
  ShiftType shift_type = ShiftType::kMorning;
  AssignmentStatus status = AssignmentStatus::kAssigned;

  bool operator==(const Assignment& other) const {
    return employee_id == other.employee_id &&
           project_id == other.project_id && date == other.date &&
           shift_type == other.shift_type && status == other.status;
  }
  bool operator!=(const Assignment& other) const { return !(*this == other); }
};

std::ostream& operator<<(std::ostream& out, const Assignment& assignment);

// A concrete unit of required coverage. Immutable once expanded.
struct ShiftSlot {
  absl::CivilDay date;
  ShiftType shift_type = ShiftType::kMorning;
  std::string project_id;
  int required_count = 0;

  bool operator==(const ShiftSlot& other) const {
    return date == other.date && shift_type == other.shift_type &&
           project_id == other.project_id &&
           required_count == other.required_count;
  }
};

std::ostream& operator<<(std::ostream& out, const ShiftSlot& slot);

struct UnfilledSlot {
  ShiftSlot slot;
  int shortfall = 0;

  bool operator==(const UnfilledSlot& other) const {
    return slot == other.slot && shortfall == other.shortfall;
  }
};

// Output of one run. Assignments are listed in slot order, and within a slot
// in ranking order.
struct CoveragePlan {
  std::vector<Assignment> assignments;
  std::vector<UnfilledSlot> unfilled_slots;
  int num_slots = 0;
  int num_seats_required = 0;

  int num_seats_filled() const { return static_cast<int>(assignments.size()); }

  bool operator==(const CoveragePlan& other) const {
    return assignments == other.assignments &&
           unfilled_slots == other.unfilled_slots &&
           num_slots == other.num_slots &&
           num_seats_required == other.num_seats_required;
  }
};

struct RosterSnapshot {
  std::vector<Employee> employees;
  std::vector<Project> projects;
  // Assignments already persisted, whatever their status.
  std::vector<Assignment> existing_assignments;
};

// Checks the identifiers of the snapshot: non-empty and unique employee and
// project ids, non-negative hourly rates, and existing assignments that refer
// to known employees and projects. Requirements are checked by
// ValidateShiftRequirement().
absl::Status ValidateRosterSnapshot(const RosterSnapshot& snapshot);

}  // namespace staffing

#endif  // STAFFING_SCHEDULING_ROSTER_MODEL_H_
