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


#include "staffing/scheduling/roster_model.h"

#include <ostream>
#include <string>

#include "absl/container/flat_hash_set.h"
#include "absl/log/log.h"
#include "absl/status/status.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "absl/time/civil_time.h"
#include "staffing/base/status_builder.h"
#include "staffing/scheduling/shift_calendar.h"

namespace staffing {

absl::Status ValidatePlanningWindow(const PlanningWindow& window) {
  if (window.last_day < window.first_day) {
    return InvalidArgumentErrorBuilder()
           << "planning window ends on " << FormatDate(window.last_day)
           << ", before its start " << FormatDate(window.first_day);
  }
  return absl::OkStatus();
}

void Employee::SetAvailableAllWeek(ShiftType type) {
  for (const absl::Weekday weekday :
       {absl::Weekday::monday, absl::Weekday::tuesday,
        absl::Weekday::wednesday, absl::Weekday::thursday,
        absl::Weekday::friday, absl::Weekday::saturday,
        absl::Weekday::sunday}) {
    SetAvailable(type, weekday);
  }
}

absl::string_view AssignmentStatusName(AssignmentStatus status) {
  switch (status) {
    case AssignmentStatus::kAssigned:
      return "assigned";
    case AssignmentStatus::kReported:
      return "reported";
    case AssignmentStatus::kCancelled:
      return "cancelled";
  }
  LOG(FATAL) << "Invalid assignment status: " << static_cast<int>(status);
}

std::ostream& operator<<(std::ostream& out, const Assignment& assignment) {
  return out << assignment.employee_id << "@" << assignment.project_id << " "
             << FormatDate(assignment.date) << " " << assignment.shift_type
             << " (" << AssignmentStatusName(assignment.status) << ")";
}

std::ostream& operator<<(std::ostream& out, const ShiftSlot& slot) {
  return out << slot.project_id << " " << FormatDate(slot.date) << " "
             << slot.shift_type << " x" << slot.required_count;
}

absl::Status ValidateRosterSnapshot(const RosterSnapshot& snapshot) {
  absl::flat_hash_set<std::string> employee_ids;
  for (int i = 0; i < snapshot.employees.size(); ++i) {
    const Employee& employee = snapshot.employees[i];
    if (employee.id.empty()) {
      return InvalidArgumentErrorBuilder() << "employee #" << i
                                           << " has an empty id";
    }
    if (!employee_ids.insert(employee.id).second) {
      return InvalidArgumentErrorBuilder() << "duplicate employee id '"
                                           << employee.id << "'";
    }
  }
  absl::flat_hash_set<std::string> project_ids;
  for (int i = 0; i < snapshot.projects.size(); ++i) {
    const Project& project = snapshot.projects[i];
    if (project.id.empty()) {
      return InvalidArgumentErrorBuilder() << "project #" << i
                                           << " has an empty id";
    }
    if (!project_ids.insert(project.id).second) {
      return InvalidArgumentErrorBuilder() << "duplicate project id '"
                                           << project.id << "'";
    }
    if (project.hourly_rate_minor < 0) {
      return InvalidArgumentErrorBuilder()
             << "project '" << project.id << "' has a negative hourly rate "
             << project.hourly_rate_minor;
    }
  }
  for (const Assignment& assignment : snapshot.existing_assignments) {
    if (!employee_ids.contains(assignment.employee_id)) {
      return InvalidArgumentErrorBuilder()
             << "existing assignment " << assignment
             << " refers to unknown employee '" << assignment.employee_id
             << "'";
    }
    if (!project_ids.contains(assignment.project_id)) {
      return InvalidArgumentErrorBuilder()
             << "existing assignment " << assignment
             << " refers to unknown project '" << assignment.project_id
             << "'";
    }
  }
  return absl::OkStatus();
}

}  // namespace staffing
