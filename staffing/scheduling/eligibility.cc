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


#include "staffing/scheduling/eligibility.h"

#include "absl/log/check.h"
#include "absl/strings/string_view.h"
#include "absl/time/civil_time.h"
#include "staffing/scheduling/roster_model.h"
#include "staffing/scheduling/run_ledger.h"
#include "staffing/scheduling/scheduling.pb.h"
#include "staffing/scheduling/shift_calendar.h"

namespace staffing {

bool IsBlockedOn(const Employee& employee, absl::CivilDay day) {
  return employee.blocked_dates.contains(day);
}

bool IsAllowedOn(const Employee& employee, absl::CivilDay day) {
  return employee.allowed_dates.empty() ||
         employee.allowed_dates.contains(day);
}

bool IsAvailableFor(const Employee& employee, ShiftType type,
                    absl::CivilDay day) {
  return employee.availability.contains(
      ShiftOnWeekday(type, absl::GetWeekday(day)));
}

bool Prefers(const Employee& employee, ShiftType type, absl::CivilDay day) {
  if (IsBlockedOn(employee, day)) return false;
  return employee.preferred_dates.contains(ShiftOnDate(type, day)) ||
         employee.preferred_weekdays.contains(
             ShiftOnWeekday(type, absl::GetWeekday(day)));
}

bool Avoids(const Employee& employee, ShiftType type, absl::CivilDay day) {
  if (IsBlockedOn(employee, day)) return false;
  return employee.avoided_dates.contains(ShiftOnDate(type, day)) ||
         employee.avoided_weekdays.contains(
             ShiftOnWeekday(type, absl::GetWeekday(day)));
}

bool Overlaps(const ShiftSlot& a, const ShiftSlot& b,
              const ShiftCatalog& catalog) {
  return catalog.IntervalOn(a.date, a.shift_type)
      .Overlaps(catalog.IntervalOn(b.date, b.shift_type));
}

EligibilityEvaluator::EligibilityEvaluator(
    const ShiftCatalog* catalog, const ShiftSchedulerParameters& params) {
  CHECK(catalog != nullptr);
  hard_constraints_ = {
      {"inactive",
       [](const CandidateContext& c) { return c.employee.active; }},
      {"blocked_date",
       [](const CandidateContext& c) {
         return !IsBlockedOn(c.employee, c.slot.date);
       }},
      {"outside_allowed_dates",
       [](const CandidateContext& c) {
         return IsAllowedOn(c.employee, c.slot.date);
       }},
      {"unavailable",
       [](const CandidateContext& c) {
         return IsAvailableFor(c.employee, c.slot.shift_type, c.slot.date);
       }},
      {"overlap",
       [catalog](const CandidateContext& c) {
         return !c.ledger.HasOverlap(
             c.employee_index,
             catalog->IntervalOn(c.slot.date, c.slot.shift_type));
       }},
  };
  if (params.avoided_shifts_are_hard()) {
    hard_constraints_.push_back(
        {"avoided", [](const CandidateContext& c) {
           return !Avoids(c.employee, c.slot.shift_type, c.slot.date) ||
                  Prefers(c.employee, c.slot.shift_type, c.slot.date);
         }});
  }
  const int max_shifts_per_day = params.max_shifts_per_day();
  if (max_shifts_per_day > 0) {
    hard_constraints_.push_back(
        {"max_shifts_per_day",
         [max_shifts_per_day](const CandidateContext& c) {
           return c.ledger.ShiftsOn(c.employee_index, c.slot.date) <
                  max_shifts_per_day;
         }});
  }

  if (params.preferred_shift_bonus() != 0) {
    soft_constraints_.push_back(
        {"preferred", params.preferred_shift_bonus(),
         [](const CandidateContext& c) {
           return Prefers(c.employee, c.slot.shift_type, c.slot.date);
         }});
  }
  if (params.avoided_shift_penalty() != 0) {
    soft_constraints_.push_back(
        {"avoided", -params.avoided_shift_penalty(),
         [](const CandidateContext& c) {
           return Avoids(c.employee, c.slot.shift_type, c.slot.date);
         }});
  }
  const double soft_max_weekly_hours = params.soft_max_weekly_hours();
  if (soft_max_weekly_hours > 0 && params.near_weekly_cap_penalty() != 0) {
    soft_constraints_.push_back(
        {"near_weekly_cap", -params.near_weekly_cap_penalty(),
         [catalog, soft_max_weekly_hours](const CandidateContext& c) {
           return c.ledger.HoursInWeekOf(c.employee_index, c.slot.date) +
                      catalog->Hours(c.slot.shift_type) >
                  soft_max_weekly_hours;
         }});
  }
}

bool EligibilityEvaluator::IsEligible(const Employee& employee,
                                      int employee_index,
                                      const ShiftSlot& slot,
                                      const RunLedger& ledger) const {
  return FirstViolation(employee, employee_index, slot, ledger).empty();
}

absl::string_view EligibilityEvaluator::FirstViolation(
    const Employee& employee, int employee_index, const ShiftSlot& slot,
    const RunLedger& ledger) const {
  const CandidateContext context{employee, employee_index, slot, ledger};
  for (const HardConstraint& constraint : hard_constraints_) {
    if (!constraint.holds(context)) return constraint.name;
  }
  return "";
}

int EligibilityEvaluator::PreferenceScore(const Employee& employee,
                                          int employee_index,
                                          const ShiftSlot& slot,
                                          const RunLedger& ledger) const {
  const CandidateContext context{employee, employee_index, slot, ledger};
  int score = 0;
  for (const SoftConstraint& constraint : soft_constraints_) {
    if (constraint.applies(context)) score += constraint.weight;
  }
  return score;
}

}  // namespace staffing
