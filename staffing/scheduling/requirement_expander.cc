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


#include "staffing/scheduling/requirement_expander.h"

#include <string>
#include <tuple>
#include <utility>
#include <variant>
#include <vector>

#include "absl/container/btree_map.h"
#include "absl/log/log.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/time/civil_time.h"
#include "absl/types/span.h"
#include "staffing/base/status_builder.h"
#include "staffing/base/status_macros.h"
#include "staffing/scheduling/roster_model.h"
#include "staffing/scheduling/shift_calendar.h"

namespace staffing {
namespace {

absl::Status ValidateRecurrence(const WeeklyRecurrence& weekly) {
  if (weekly.weekdays.empty()) {
    return absl::InvalidArgumentError("weekly recurrence without weekdays");
  }
  if (weekly.valid_from.has_value() && weekly.valid_until.has_value() &&
      *weekly.valid_until < *weekly.valid_from) {
    return InvalidArgumentErrorBuilder()
           << "weekly recurrence valid until " << FormatDate(*weekly.valid_until)
           << ", before " << FormatDate(*weekly.valid_from);
  }
  return absl::OkStatus();
}

absl::Status ValidateRecurrence(const DateRangeRecurrence& range) {
  if (range.last_day < range.first_day) {
    return InvalidArgumentErrorBuilder()
           << "date range ends on " << FormatDate(range.last_day)
           << ", before its start " << FormatDate(range.first_day);
  }
  return absl::OkStatus();
}

// Sort key of a slot: date, then canonical shift order, then project id.
using SlotKey = std::tuple<absl::CivilDay, int, std::string>;

}  // namespace

absl::Status ValidateShiftRequirement(const ShiftRequirement& requirement) {
  if (requirement.headcount < 1) {
    return InvalidArgumentErrorBuilder()
           << "headcount must be at least 1, got " << requirement.headcount;
  }
  return std::visit(
      [](const auto& recurrence) { return ValidateRecurrence(recurrence); },
      requirement.recurrence);
}

bool RecurrenceMatches(const Recurrence& recurrence, absl::CivilDay day) {
  if (const auto* weekly = std::get_if<WeeklyRecurrence>(&recurrence)) {
    if (weekly->valid_from.has_value() && day < *weekly->valid_from) {
      return false;
    }
    if (weekly->valid_until.has_value() && *weekly->valid_until < day) {
      return false;
    }
    return weekly->weekdays.contains(absl::GetWeekday(day));
  }
  const auto& range = std::get<DateRangeRecurrence>(recurrence);
  return range.first_day <= day && day <= range.last_day;
}

absl::StatusOr<std::vector<ShiftRequirement>> CollectRequirements(
    absl::Span<const Project> projects) {
  std::vector<ShiftRequirement> requirements;
  for (const Project& project : projects) {
    for (int i = 0; i < project.requirements.size(); ++i) {
      ShiftRequirement requirement = project.requirements[i];
      if (requirement.project_id.empty()) {
        requirement.project_id = project.id;
      } else if (requirement.project_id != project.id) {
        return InvalidArgumentErrorBuilder()
               << "requirement #" << i << " of project '" << project.id
               << "' refers to project '" << requirement.project_id << "'";
      }
      requirements.push_back(std::move(requirement));
    }
  }
  return requirements;
}

RequirementExpander::RequirementExpander(absl::Span<const Project> projects) {
  for (const Project& project : projects) {
    is_active_[project.id] = project.active;
  }
}

absl::StatusOr<std::vector<ShiftSlot>> RequirementExpander::Expand(
    absl::Span<const ShiftRequirement> requirements,
    const PlanningWindow& window) const {
  RETURN_IF_ERROR(ValidatePlanningWindow(window));
  for (int i = 0; i < requirements.size(); ++i) {
    const ShiftRequirement& requirement = requirements[i];
    RETURN_IF_ERROR(ValidateShiftRequirement(requirement))
        << "in requirement #" << i << " (project '" << requirement.project_id
        << "', " << requirement.shift_type << ")";
    if (!is_active_.contains(requirement.project_id)) {
      return InvalidArgumentErrorBuilder()
             << "requirement #" << i << " refers to unknown project '"
             << requirement.project_id << "'";
    }
  }

  absl::btree_map<SlotKey, int> required_counts;
  for (const ShiftRequirement& requirement : requirements) {
    if (!is_active_.at(requirement.project_id)) {
      VLOG(1) << "Skipping requirement of inactive project '"
              << requirement.project_id << "'";
      continue;
    }
    for (absl::CivilDay day = window.first_day; day <= window.last_day; ++day) {
      if (!RecurrenceMatches(requirement.recurrence, day)) continue;
      required_counts[SlotKey(day, static_cast<int>(requirement.shift_type),
                              requirement.project_id)] +=
          requirement.headcount;
    }
  }

  std::vector<ShiftSlot> slots;
  slots.reserve(required_counts.size());
  for (const auto& [key, required_count] : required_counts) {
    const auto& [day, shift_order, project_id] = key;
    slots.push_back({day, static_cast<ShiftType>(shift_order), project_id,
                     required_count});
  }
  VLOG(1) << "Expanded " << requirements.size() << " requirements into "
          << slots.size() << " slots between " << FormatDate(window.first_day)
          << " and " << FormatDate(window.last_day);
  return slots;
}

}  // namespace staffing
