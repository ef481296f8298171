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


#include "staffing/scheduling/coverage_plan_checker.h"

#include <algorithm>
#include <cstdint>
#include <limits>
#include <string>
#include <tuple>
#include <utility>
#include <vector>

#include "absl/container/btree_map.h"
#include "absl/container/flat_hash_map.h"
#include "absl/status/status.h"
#include "absl/strings/string_view.h"
#include "absl/time/civil_time.h"
#include "absl/types/span.h"
#include "staffing/base/status_builder.h"
#include "staffing/scheduling/eligibility.h"
#include "staffing/scheduling/roster_model.h"
#include "staffing/scheduling/scheduling.pb.h"
#include "staffing/scheduling/shift_calendar.h"

namespace staffing {
namespace {

using SlotKey = std::tuple<absl::CivilDay, ShiftType, std::string>;

SlotKey KeyOf(const ShiftSlot& slot) {
  return {slot.date, slot.shift_type, slot.project_id};
}

SlotKey KeyOf(const Assignment& assignment) {
  return {assignment.date, assignment.shift_type, assignment.project_id};
}

struct HeldShift {
  TimeInterval interval;
  bool from_plan = false;
  const Assignment* assignment = nullptr;
};

absl::Status CheckAssignmentFeasibility(
    const Assignment& assignment, const Employee& employee,
    const ShiftSchedulerParameters& params) {
  if (!employee.active) {
    return InternalErrorBuilder()
           << assignment << " assigns inactive employee " << employee.id;
  }
  if (IsBlockedOn(employee, assignment.date)) {
    return InternalErrorBuilder() << assignment << " falls on a blocked date";
  }
  if (!IsAllowedOn(employee, assignment.date)) {
    return InternalErrorBuilder()
           << assignment << " falls outside the allowed dates";
  }
  if (!IsAvailableFor(employee, assignment.shift_type, assignment.date)) {
    return InternalErrorBuilder()
           << assignment << " does not match the availability of "
           << employee.id;
  }
  if (params.avoided_shifts_are_hard() &&
      Avoids(employee, assignment.shift_type, assignment.date) &&
      !Prefers(employee, assignment.shift_type, assignment.date)) {
    return InternalErrorBuilder()
           << assignment << " is avoided by " << employee.id;
  }
  return absl::OkStatus();
}

}  // namespace

absl::Status CheckCoveragePlan(const CoveragePlan& plan,
                               const RosterSnapshot& snapshot,
                               absl::Span<const ShiftSlot> slots,
                               const ShiftCatalog& catalog,
                               const ShiftSchedulerParameters& params) {
  if (plan.num_slots != static_cast<int>(slots.size())) {
    return InternalErrorBuilder() << "plan counts " << plan.num_slots
                                  << " slots instead of " << slots.size();
  }
  absl::btree_map<SlotKey, int> required;
  int num_seats_required = 0;
  for (const ShiftSlot& slot : slots) {
    required[KeyOf(slot)] += slot.required_count;
    num_seats_required += slot.required_count;
  }
  if (plan.num_seats_required != num_seats_required) {
    return InternalErrorBuilder()
           << "plan counts " << plan.num_seats_required
           << " required seats instead of " << num_seats_required;
  }

  absl::flat_hash_map<absl::string_view, const Employee*> employees;
  for (const Employee& employee : snapshot.employees) {
    employees[employee.id] = &employee;
  }

  absl::btree_map<SlotKey, int> assigned;
  absl::flat_hash_map<absl::string_view, std::vector<HeldShift>> held;
  for (const Assignment& assignment : plan.assignments) {
    if (assignment.status != AssignmentStatus::kAssigned) {
      return InternalErrorBuilder()
             << assignment << " does not have status ASSIGNED";
    }
    const SlotKey key = KeyOf(assignment);
    if (!required.contains(key)) {
      return InternalErrorBuilder() << assignment << " covers no slot";
    }
    const auto it = employees.find(assignment.employee_id);
    if (it == employees.end()) {
      return InternalErrorBuilder() << assignment << " has an unknown employee";
    }
    if (const absl::Status status =
            CheckAssignmentFeasibility(assignment, *it->second, params);
        !status.ok()) {
      return status;
    }
    ++assigned[key];
    held[assignment.employee_id].push_back(
        {catalog.IntervalOn(assignment.date, assignment.shift_type),
         /*from_plan=*/true, &assignment});
  }
  for (const Assignment& existing : snapshot.existing_assignments) {
    if (existing.status == AssignmentStatus::kCancelled) continue;
    held[existing.employee_id].push_back(
        {catalog.IntervalOn(existing.date, existing.shift_type),
         /*from_plan=*/false, &existing});
  }

  // Only dates with a planned shift are capped.
  if (params.max_shifts_per_day() > 0) {
    absl::btree_map<std::pair<absl::string_view, absl::CivilDay>, int>
        shifts_per_day;
    for (const auto& [employee_id, shifts] : held) {
      for (const HeldShift& shift : shifts) {
        ++shifts_per_day[{employee_id, shift.assignment->date}];
      }
    }
    for (const Assignment& assignment : plan.assignments) {
      const int num_shifts =
          shifts_per_day[{assignment.employee_id, assignment.date}];
      if (num_shifts > params.max_shifts_per_day()) {
        return InternalErrorBuilder()
               << "employee " << assignment.employee_id << " works "
               << num_shifts << " shifts on " << FormatDate(assignment.date)
               << ", more than max_shifts_per_day = "
               << params.max_shifts_per_day();
      }
    }
  }

  // Existing assignments are not checked against each other.
  for (auto& [employee_id, shifts] : held) {
    std::sort(shifts.begin(), shifts.end(),
              [](const HeldShift& a, const HeldShift& b) {
                return a.interval.start < b.interval.start;
              });
    int64_t latest_end = std::numeric_limits<int64_t>::min();
    int64_t latest_plan_end = std::numeric_limits<int64_t>::min();
    const Assignment* latest = nullptr;
    const Assignment* latest_from_plan = nullptr;
    for (const HeldShift& shift : shifts) {
      const bool clashes_with_any =
          shift.from_plan && latest_end > shift.interval.start;
      const bool clashes_with_plan = latest_plan_end > shift.interval.start;
      if (clashes_with_any || clashes_with_plan) {
        return InternalErrorBuilder()
               << "employee " << employee_id << " is double-booked: "
               << *shift.assignment << " overlaps "
               << *(clashes_with_plan ? latest_from_plan : latest);
      }
      if (shift.interval.end > latest_end) {
        latest_end = shift.interval.end;
        latest = shift.assignment;
      }
      if (shift.from_plan && shift.interval.end > latest_plan_end) {
        latest_plan_end = shift.interval.end;
        latest_from_plan = shift.assignment;
      }
    }
  }

  absl::btree_map<SlotKey, int> shortfalls;
  for (const UnfilledSlot& unfilled : plan.unfilled_slots) {
    if (unfilled.shortfall <= 0) {
      return InternalErrorBuilder()
             << "unfilled slot " << unfilled.slot << " has shortfall "
             << unfilled.shortfall;
    }
    if (!required.contains(KeyOf(unfilled.slot))) {
      return InternalErrorBuilder()
             << "plan reports a shortfall on unknown slot " << unfilled.slot;
    }
    shortfalls[KeyOf(unfilled.slot)] += unfilled.shortfall;
  }
  for (const auto& [key, required_count] : required) {
    const auto assigned_it = assigned.find(key);
    const int num_assigned =
        assigned_it == assigned.end() ? 0 : assigned_it->second;
    const auto shortfall_it = shortfalls.find(key);
    const int shortfall =
        shortfall_it == shortfalls.end() ? 0 : shortfall_it->second;
    if (num_assigned > required_count ||
        num_assigned + shortfall != required_count) {
      return InternalErrorBuilder()
             << "slot " << FormatDate(std::get<0>(key)) << " "
             << std::get<1>(key) << " of project '" << std::get<2>(key)
             << "' requires " << required_count << " employee(s) but has "
             << num_assigned << " assigned and a shortfall of " << shortfall;
    }
  }
  return absl::OkStatus();
}

}  // namespace staffing
