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


// Builders of small rosters shared by the scheduling tests.

#ifndef STAFFING_SCHEDULING_ROSTER_TEST_UTIL_H_
#define STAFFING_SCHEDULING_ROSTER_TEST_UTIL_H_

#include <cstdint>
#include <initializer_list>
#include <string>
#include <utility>
#include <vector>

#include "absl/container/btree_set.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "absl/time/civil_time.h"
#include "staffing/scheduling/roster_model.h"
#include "staffing/scheduling/shift_calendar.h"

namespace staffing {

// Dates in November 2025. Nov(3) is a Monday.
inline absl::CivilDay Nov(int day) { return absl::CivilDay(2025, 11, day); }

// Monday 2025-11-03 to Sunday 2025-11-09.
inline PlanningWindow FirstWeek() { return {Nov(3), Nov(9)}; }

inline absl::btree_set<absl::Weekday> MondayToFriday() {
  return {absl::Weekday::monday, absl::Weekday::tuesday,
          absl::Weekday::wednesday, absl::Weekday::thursday,
          absl::Weekday::friday};
}

inline Employee MakeEmployee(absl::string_view id) {
  Employee employee;
  employee.id = std::string(id);
  employee.display_name = std::string(id);
  return employee;
}

// An employee available for `types` on every day of the week.
inline Employee AvailableEmployee(absl::string_view id,
                                  std::initializer_list<ShiftType> types) {
  Employee employee = MakeEmployee(id);
  for (const ShiftType type : types) employee.SetAvailableAllWeek(type);
  return employee;
}

inline ShiftRequirement WeeklyRequirement(
    absl::string_view project_id, ShiftType type,
    absl::btree_set<absl::Weekday> weekdays, int headcount = 1) {
  ShiftRequirement requirement;
  requirement.project_id = std::string(project_id);
  requirement.shift_type = type;
  WeeklyRecurrence weekly;
  weekly.weekdays = std::move(weekdays);
  requirement.recurrence = std::move(weekly);
  requirement.headcount = headcount;
  return requirement;
}

inline ShiftRequirement DateRangeRequirement(absl::string_view project_id,
                                             ShiftType type,
                                             absl::CivilDay first_day,
                                             absl::CivilDay last_day,
                                             int headcount = 1) {
  ShiftRequirement requirement;
  requirement.project_id = std::string(project_id);
  requirement.shift_type = type;
  requirement.recurrence = DateRangeRecurrence{first_day, last_day};
  requirement.headcount = headcount;
  return requirement;
}

inline Project MakeProject(absl::string_view id, int64_t hourly_rate_minor,
                           std::vector<ShiftRequirement> requirements = {}) {
  Project project;
  project.id = std::string(id);
  project.name = absl::StrCat("Project ", id);
  project.hourly_rate_minor = hourly_rate_minor;
  project.requirements = std::move(requirements);
  return project;
}

inline Assignment MakeAssignment(
    absl::string_view employee_id, absl::string_view project_id,
    absl::CivilDay date, ShiftType type,
    AssignmentStatus status = AssignmentStatus::kAssigned) {
  return {std::string(employee_id), std::string(project_id), date, type,
          status};
}

}  // namespace staffing

#endif  // STAFFING_SCHEDULING_ROSTER_TEST_UTIL_H_
