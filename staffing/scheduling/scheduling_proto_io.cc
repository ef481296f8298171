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


#include "staffing/scheduling/scheduling_proto_io.h"

#include <optional>
#include <string>
#include <utility>

#include "absl/container/btree_set.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/time/civil_time.h"
#include "google/protobuf/repeated_field.h"
#include "staffing/base/status_builder.h"
#include "staffing/base/status_macros.h"
#include "staffing/scheduling/cost_summary.h"
#include "staffing/scheduling/roster_model.h"
#include "staffing/scheduling/scheduling.pb.h"
#include "staffing/scheduling/shift_calendar.h"

namespace staffing {
namespace {

absl::StatusOr<absl::Weekday> CheckedWeekdayFromProto(WeekdayProto proto) {
  if (proto < MONDAY || proto > SUNDAY) {
    return InvalidArgumentErrorBuilder()
           << "unspecified or unknown weekday " << WeekdayProto_Name(proto);
  }
  return WeekdayFromProto(proto);
}

absl::StatusOr<absl::btree_set<absl::Weekday>> WeekdaysFromProto(
    const google::protobuf::RepeatedField<int>& weekdays) {
  absl::btree_set<absl::Weekday> result;
  for (const int weekday : weekdays) {
    ASSIGN_OR_RETURN(
        const absl::Weekday day,
        CheckedWeekdayFromProto(static_cast<WeekdayProto>(weekday)));
    result.insert(day);
  }
  return result;
}

absl::StatusOr<absl::btree_set<absl::CivilDay>> DatesFromProto(
    const google::protobuf::RepeatedPtrField<std::string>& dates) {
  absl::btree_set<absl::CivilDay> result;
  for (const std::string& date : dates) {
    ASSIGN_OR_RETURN(const absl::CivilDay day, ParseDate(date));
    result.insert(day);
  }
  return result;
}

absl::StatusOr<std::optional<absl::CivilDay>> OptionalDateFromProto(
    bool has_date, const std::string& date) {
  if (!has_date) return std::optional<absl::CivilDay>();
  ASSIGN_OR_RETURN(const absl::CivilDay day, ParseDate(date));
  return std::optional<absl::CivilDay>(day);
}

absl::Status AddPreference(const ShiftPreferenceProto& proto,
                           Employee& employee) {
  ASSIGN_OR_RETURN(const ShiftType type, ShiftTypeFromProto(proto.shift_type()));
  const bool avoided = proto.kind() == ShiftPreferenceProto::AVOIDED;
  if (!avoided && proto.kind() != ShiftPreferenceProto::PREFERRED) {
    return absl::InvalidArgumentError("unspecified preference kind");
  }
  if (proto.has_date() && proto.has_weekday()) {
    return absl::InvalidArgumentError(
        "a preference sets either a date or a weekday, not both");
  }
  if (proto.has_date()) {
    ASSIGN_OR_RETURN(const absl::CivilDay day, ParseDate(proto.date()));
    (avoided ? employee.avoided_dates : employee.preferred_dates)
        .insert(ShiftOnDate(type, day));
    return absl::OkStatus();
  }
  auto& weekdays =
      avoided ? employee.avoided_weekdays : employee.preferred_weekdays;
  if (proto.has_weekday()) {
    ASSIGN_OR_RETURN(const absl::Weekday weekday,
                     CheckedWeekdayFromProto(proto.weekday()));
    weekdays.insert(ShiftOnWeekday(type, weekday));
    return absl::OkStatus();
  }
  for (int i = 0; i < 7; ++i) {
    weekdays.insert(ShiftOnWeekday(type, static_cast<absl::Weekday>(i)));
  }
  return absl::OkStatus();
}

}  // namespace

absl::StatusOr<Employee> EmployeeFromProto(const EmployeeProto& proto) {
  Employee employee;
  employee.id = proto.id();
  employee.display_name = proto.display_name();
  employee.email = proto.email();
  employee.phone = proto.phone();
  employee.is_admin = proto.is_admin();
  employee.active = proto.active();
  for (const AvailabilityProto& availability : proto.availability()) {
    ASSIGN_OR_RETURN(const ShiftType type,
                     ShiftTypeFromProto(availability.shift_type()));
    if (availability.weekdays().empty()) {
      employee.SetAvailableAllWeek(type);
      continue;
    }
    ASSIGN_OR_RETURN(const absl::btree_set<absl::Weekday> weekdays,
                     WeekdaysFromProto(availability.weekdays()));
    for (const absl::Weekday weekday : weekdays) {
      employee.SetAvailable(type, weekday);
    }
  }
  ASSIGN_OR_RETURN(employee.blocked_dates,
                   DatesFromProto(proto.blocked_dates()));
  ASSIGN_OR_RETURN(employee.allowed_dates,
                   DatesFromProto(proto.allowed_dates()));
  for (const ShiftPreferenceProto& preference : proto.preferences()) {
    RETURN_IF_ERROR(AddPreference(preference, employee));
  }
  return employee;
}

absl::StatusOr<ShiftRequirement> ShiftRequirementFromProto(
    const ShiftRequirementProto& proto) {
  ShiftRequirement requirement;
  requirement.project_id = proto.project_id();
  ASSIGN_OR_RETURN(requirement.shift_type,
                   ShiftTypeFromProto(proto.shift_type()));
  requirement.headcount = proto.headcount();
  switch (proto.recurrence_case()) {
    case ShiftRequirementProto::kWeekly: {
      WeeklyRecurrence weekly;
      ASSIGN_OR_RETURN(weekly.weekdays,
                       WeekdaysFromProto(proto.weekly().weekdays()));
      ASSIGN_OR_RETURN(weekly.valid_from,
                       OptionalDateFromProto(proto.weekly().has_valid_from(),
                                             proto.weekly().valid_from()));
      ASSIGN_OR_RETURN(weekly.valid_until,
                       OptionalDateFromProto(proto.weekly().has_valid_until(),
                                             proto.weekly().valid_until()));
      requirement.recurrence = std::move(weekly);
      break;
    }
    case ShiftRequirementProto::kDateRange: {
      DateRangeRecurrence range;
      ASSIGN_OR_RETURN(range.first_day,
                       ParseDate(proto.date_range().first_date()));
      ASSIGN_OR_RETURN(range.last_day,
                       ParseDate(proto.date_range().last_date()));
      requirement.recurrence = range;
      break;
    }
    case ShiftRequirementProto::RECURRENCE_NOT_SET:
      return absl::InvalidArgumentError("requirement without recurrence");
  }
  return requirement;
}

absl::StatusOr<Project> ProjectFromProto(const ProjectProto& proto) {
  Project project;
  project.id = proto.id();
  project.name = proto.name();
  project.hourly_rate_minor = proto.hourly_rate_minor();
  project.active = proto.active();
  for (int i = 0; i < proto.requirements_size(); ++i) {
    absl::StatusOr<ShiftRequirement> requirement =
        ShiftRequirementFromProto(proto.requirements(i));
    RETURN_IF_ERROR(requirement.status()) << "in requirement #" << i;
    project.requirements.push_back(*std::move(requirement));
  }
  return project;
}

absl::StatusOr<AssignmentStatus> AssignmentStatusFromProto(
    AssignmentStatusProto proto) {
  switch (proto) {
    case ASSIGNMENT_STATUS_UNSPECIFIED:
    case ASSIGNED:
      return AssignmentStatus::kAssigned;
    case REPORTED:
      return AssignmentStatus::kReported;
    case CANCELLED:
      return AssignmentStatus::kCancelled;
  }
  return InvalidArgumentErrorBuilder()
         << "unknown assignment status " << static_cast<int>(proto);
}

AssignmentStatusProto AssignmentStatusToProto(AssignmentStatus status) {
  switch (status) {
    case AssignmentStatus::kAssigned:
      return ASSIGNED;
    case AssignmentStatus::kReported:
      return REPORTED;
    case AssignmentStatus::kCancelled:
      return CANCELLED;
  }
  return ASSIGNMENT_STATUS_UNSPECIFIED;
}

absl::StatusOr<Assignment> AssignmentFromProto(const AssignmentProto& proto) {
  Assignment assignment;
  assignment.employee_id = proto.employee_id();
  assignment.project_id = proto.project_id();
  ASSIGN_OR_RETURN(assignment.date, ParseDate(proto.date()));
  ASSIGN_OR_RETURN(assignment.shift_type,
                   ShiftTypeFromProto(proto.shift_type()));
  ASSIGN_OR_RETURN(assignment.status, AssignmentStatusFromProto(proto.status()));
  return assignment;
}

AssignmentProto AssignmentToProto(const Assignment& assignment) {
  AssignmentProto proto;
  proto.set_employee_id(assignment.employee_id);
  proto.set_project_id(assignment.project_id);
  proto.set_date(FormatDate(assignment.date));
  proto.set_shift_type(ShiftTypeToProto(assignment.shift_type));
  proto.set_status(AssignmentStatusToProto(assignment.status));
  return proto;
}

absl::StatusOr<RosterSnapshot> RosterSnapshotFromProto(
    const ScheduleRequest& request) {
  RosterSnapshot snapshot;
  for (int i = 0; i < request.employees_size(); ++i) {
    absl::StatusOr<Employee> employee = EmployeeFromProto(request.employees(i));
    RETURN_IF_ERROR(employee.status())
        << "in employee #" << i << " '" << request.employees(i).id() << "'";
    snapshot.employees.push_back(*std::move(employee));
  }
  for (int i = 0; i < request.projects_size(); ++i) {
    absl::StatusOr<Project> project = ProjectFromProto(request.projects(i));
    RETURN_IF_ERROR(project.status())
        << "in project #" << i << " '" << request.projects(i).id() << "'";
    snapshot.projects.push_back(*std::move(project));
  }
  for (int i = 0; i < request.existing_assignments_size(); ++i) {
    absl::StatusOr<Assignment> assignment =
        AssignmentFromProto(request.existing_assignments(i));
    RETURN_IF_ERROR(assignment.status()) << "in existing assignment #" << i;
    snapshot.existing_assignments.push_back(*std::move(assignment));
  }
  return snapshot;
}

absl::StatusOr<PlanningWindow> PlanningWindowFromProto(
    const ScheduleRequest& request) {
  if (!request.has_window_start() || !request.has_window_end()) {
    return absl::InvalidArgumentError(
        "the planning window needs both window_start and window_end");
  }
  PlanningWindow window;
  ASSIGN_OR_RETURN(window.first_day, ParseDate(request.window_start()));
  ASSIGN_OR_RETURN(window.last_day, ParseDate(request.window_end()));
  RETURN_IF_ERROR(ValidatePlanningWindow(window));
  return window;
}

CoveragePlanProto CoveragePlanToProto(const CoveragePlan& plan) {
  CoveragePlanProto proto;
  for (const Assignment& assignment : plan.assignments) {
    *proto.add_assignments() = AssignmentToProto(assignment);
  }
  for (const UnfilledSlot& unfilled : plan.unfilled_slots) {
    UnfilledSlotProto* const slot = proto.add_unfilled_slots();
    slot->set_project_id(unfilled.slot.project_id);
    slot->set_date(FormatDate(unfilled.slot.date));
    slot->set_shift_type(ShiftTypeToProto(unfilled.slot.shift_type));
    slot->set_required_count(unfilled.slot.required_count);
    slot->set_shortfall_count(unfilled.shortfall);
  }
  proto.set_num_slots(plan.num_slots);
  proto.set_num_seats_required(plan.num_seats_required);
  return proto;
}

ScheduleSummaryProto ScheduleSummaryToProto(const ScheduleSummary& summary) {
  ScheduleSummaryProto proto;
  for (const EmployeeTotals& totals : summary.employees) {
    EmployeeTotalsProto* const entry = proto.add_employee_totals();
    entry->set_employee_id(totals.employee_id);
    entry->set_hours(totals.hours);
    entry->set_cost_minor(totals.cost_minor);
    entry->set_num_assignments(totals.num_assignments);
  }
  for (const ProjectTotals& totals : summary.projects) {
    ProjectTotalsProto* const entry = proto.add_project_totals();
    entry->set_project_id(totals.project_id);
    entry->set_project_name(totals.project_name);
    entry->set_hours(totals.hours);
    entry->set_cost_minor(totals.cost_minor);
    entry->set_num_assignments(totals.num_assignments);
    entry->set_num_employees(totals.num_employees);
  }
  proto.set_total_hours(summary.total_hours);
  proto.set_total_cost_minor(summary.total_cost_minor);
  proto.set_num_assignments(summary.num_assignments);
  return proto;
}

}  // namespace staffing
