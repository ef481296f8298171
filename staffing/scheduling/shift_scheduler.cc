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


#include "staffing/scheduling/shift_scheduler.h"

#include <algorithm>
#include <ostream>
#include <string>
#include <vector>

#include "absl/container/flat_hash_map.h"
#include "absl/log/log.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "absl/time/clock.h"
#include "absl/time/time.h"
#include "absl/types/span.h"
#include "staffing/base/status_builder.h"
#include "staffing/base/status_macros.h"
#include "staffing/scheduling/coverage_plan_checker.h"
#include "staffing/scheduling/eligibility.h"
#include "staffing/scheduling/requirement_expander.h"
#include "staffing/scheduling/roster_model.h"
#include "staffing/scheduling/run_ledger.h"
#include "staffing/scheduling/scheduling.pb.h"
#include "staffing/scheduling/shift_calendar.h"

namespace staffing {
namespace {

struct RankedCandidate {
  int employee_index = 0;
  int score = 0;
  double load_hours = 0.0;
};

absl::Status ValidateSlots(absl::Span<const ShiftSlot> slots,
                           const RosterSnapshot& snapshot,
                           const PlanningWindow& window) {
  absl::flat_hash_map<absl::string_view, bool> is_active;
  for (const Project& project : snapshot.projects) {
    is_active[project.id] = project.active;
  }
  for (int i = 0; i < slots.size(); ++i) {
    const ShiftSlot& slot = slots[i];
    if (slot.required_count < 1) {
      return InvalidArgumentErrorBuilder()
             << "slot #" << i << " " << slot
             << " must require at least one employee";
    }
    const auto it = is_active.find(slot.project_id);
    if (it == is_active.end()) {
      return InvalidArgumentErrorBuilder()
             << "slot #" << i << " refers to unknown project '"
             << slot.project_id << "'";
    }
    if (!it->second) {
      return InvalidArgumentErrorBuilder()
             << "slot #" << i << " refers to inactive project '"
             << slot.project_id << "'";
    }
    if (!window.Contains(slot.date)) {
      return InvalidArgumentErrorBuilder()
             << "slot #" << i << " " << slot << " is outside the window "
             << FormatDate(window.first_day) << " - "
             << FormatDate(window.last_day);
    }
  }
  return absl::OkStatus();
}

}  // namespace

absl::Status ValidateShiftSchedulerParameters(
    const ShiftSchedulerParameters& params) {
  if (params.preferred_shift_bonus() < 0) {
    return InvalidArgumentErrorBuilder()
           << "preferred_shift_bonus must be non-negative, got "
           << params.preferred_shift_bonus();
  }
  if (params.avoided_shift_penalty() < 0) {
    return InvalidArgumentErrorBuilder()
           << "avoided_shift_penalty must be non-negative, got "
           << params.avoided_shift_penalty();
  }
  if (params.near_weekly_cap_penalty() < 0) {
    return InvalidArgumentErrorBuilder()
           << "near_weekly_cap_penalty must be non-negative, got "
           << params.near_weekly_cap_penalty();
  }
  if (params.soft_max_weekly_hours() < 0) {
    return InvalidArgumentErrorBuilder()
           << "soft_max_weekly_hours must be non-negative, got "
           << params.soft_max_weekly_hours();
  }
  if (params.max_shifts_per_day() < 0) {
    return InvalidArgumentErrorBuilder()
           << "max_shifts_per_day must be non-negative, got "
           << params.max_shifts_per_day();
  }
  if (params.max_shift_hours() <= 0) {
    return InvalidArgumentErrorBuilder()
           << "max_shift_hours must be positive, got "
           << params.max_shift_hours();
  }
  if (params.num_workers() < 1) {
    return InvalidArgumentErrorBuilder()
           << "num_workers must be at least 1, got " << params.num_workers();
  }
  return ShiftCatalog::FromParameters(params).status();
}

absl::string_view RunPhaseName(RunPhase phase) {
  switch (phase) {
    case RunPhase::kInitialized:
      return "INITIALIZED";
    case RunPhase::kExpanding:
      return "EXPANDING";
    case RunPhase::kAssigning:
      return "ASSIGNING";
    case RunPhase::kFinalized:
      return "FINALIZED";
  }
  return "UNKNOWN";
}

std::ostream& operator<<(std::ostream& out, RunPhase phase) {
  return out << RunPhaseName(phase);
}

ShiftScheduler::ShiftScheduler(const ShiftSchedulerParameters& params)
    : params_(params) {}

absl::StatusOr<CoveragePlan> ShiftScheduler::Schedule(
    const RosterSnapshot& snapshot, const PlanningWindow& window) {
  phase_ = RunPhase::kInitialized;
  RETURN_IF_ERROR(ValidateShiftSchedulerParameters(params_));
  RETURN_IF_ERROR(ValidateRosterSnapshot(snapshot));
  RETURN_IF_ERROR(ValidatePlanningWindow(window));
  ASSIGN_OR_RETURN(const ShiftCatalog catalog,
                   ShiftCatalog::FromParameters(params_));

  phase_ = RunPhase::kExpanding;
  ASSIGN_OR_RETURN(const std::vector<ShiftRequirement> requirements,
                   CollectRequirements(snapshot.projects));
  const RequirementExpander expander(snapshot.projects);
  ASSIGN_OR_RETURN(const std::vector<ShiftSlot> slots,
                   expander.Expand(requirements, window));
  return Assign(snapshot, window, slots, catalog);
}

absl::StatusOr<CoveragePlan> ShiftScheduler::AssignSlots(
    const RosterSnapshot& snapshot, const PlanningWindow& window,
    absl::Span<const ShiftSlot> slots) {
  phase_ = RunPhase::kInitialized;
  RETURN_IF_ERROR(ValidateShiftSchedulerParameters(params_));
  RETURN_IF_ERROR(ValidateRosterSnapshot(snapshot));
  RETURN_IF_ERROR(ValidatePlanningWindow(window));
  ASSIGN_OR_RETURN(const ShiftCatalog catalog,
                   ShiftCatalog::FromParameters(params_));

  phase_ = RunPhase::kExpanding;
  RETURN_IF_ERROR(ValidateSlots(slots, snapshot, window));
  return Assign(snapshot, window, slots, catalog);
}

absl::StatusOr<CoveragePlan> ShiftScheduler::Assign(
    const RosterSnapshot& snapshot, const PlanningWindow& window,
    absl::Span<const ShiftSlot> slots, const ShiftCatalog& catalog) {
  phase_ = RunPhase::kAssigning;
  const absl::Time start_time = absl::Now();
  const std::vector<Employee>& employees = snapshot.employees;
  const int num_employees = static_cast<int>(employees.size());

  RunLedger ledger(&catalog, num_employees);
  absl::flat_hash_map<absl::string_view, int> employee_index;
  for (int e = 0; e < num_employees; ++e) {
    employee_index[employees[e].id] = e;
  }
  for (const Assignment& existing : snapshot.existing_assignments) {
    if (existing.status == AssignmentStatus::kCancelled) continue;
    const bool counts_toward_load =
        params_.count_existing_assignments_in_load() &&
        window.Contains(existing.date);
    ledger.AddExisting(employee_index.at(existing.employee_id), existing.date,
                       existing.shift_type, counts_toward_load);
  }

  const EligibilityEvaluator evaluator(&catalog, params_);
  CoveragePlan plan;
  plan.num_slots = static_cast<int>(slots.size());
  std::vector<RankedCandidate> candidates;
  candidates.reserve(num_employees);
  for (const ShiftSlot& slot : slots) {
    plan.num_seats_required += slot.required_count;
    candidates.clear();
    for (int e = 0; e < num_employees; ++e) {
      const Employee& employee = employees[e];
      if (!evaluator.IsEligible(employee, e, slot, ledger)) {
        VLOG(2) << "  " << employee.id << " rejected for " << slot << ": "
                << evaluator.FirstViolation(employee, e, slot, ledger);
        continue;
      }
      candidates.push_back({e, evaluator.PreferenceScore(employee, e, slot,
                                                         ledger),
                            ledger.load_hours(e)});
    }
    std::sort(candidates.begin(), candidates.end(),
              [&employees](const RankedCandidate& a, const RankedCandidate& b) {
                if (a.score != b.score) return a.score > b.score;
                if (a.load_hours != b.load_hours) {
                  return a.load_hours < b.load_hours;
                }
                return employees[a.employee_index].id <
                       employees[b.employee_index].id;
              });

    const int num_chosen = std::min(slot.required_count,
                                    static_cast<int>(candidates.size()));
    for (int k = 0; k < num_chosen; ++k) {
      const RankedCandidate& chosen = candidates[k];
      ledger.Book(chosen.employee_index, slot.date, slot.shift_type);
      plan.assignments.push_back({employees[chosen.employee_index].id,
                                  slot.project_id, slot.date, slot.shift_type,
                                  AssignmentStatus::kAssigned});
      VLOG(1) << "Slot " << slot << ": assigned "
              << employees[chosen.employee_index].id << " (score "
              << chosen.score << ", load " << chosen.load_hours << "h)";
    }
    if (num_chosen < slot.required_count) {
      const int shortfall = slot.required_count - num_chosen;
      plan.unfilled_slots.push_back({slot, shortfall});
      LOG_IF(WARNING, params_.log_search_progress())
          << "Slot " << slot << " is short of " << shortfall << " employee(s), "
          << candidates.size() << " eligible";
    }
  }

  if (params_.verify_plan()) {
    RETURN_IF_ERROR(CheckCoveragePlan(plan, snapshot, slots, catalog,
                                      params_))
        << "while verifying the coverage plan";
  }
  phase_ = RunPhase::kFinalized;
  LOG_IF(INFO, params_.log_search_progress())
      << "Assigned " << plan.num_seats_filled() << " of "
      << plan.num_seats_required << " seats over " << plan.num_slots
      << " slots, " << plan.unfilled_slots.size() << " slot(s) short, in "
      << absl::FormatDuration(absl::Now() - start_time);
  return plan;
}

}  // namespace staffing
