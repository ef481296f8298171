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


// Constraint evaluation for one (employee, slot) candidate pair.
//
// Every constraint is a predicate over set-valued employee data. Hard
// constraints are combined with a logical AND and decide eligibility; soft
// constraints carry a weight and are summed into a preference score that
// only ranks eligible candidates.

#ifndef STAFFING_SCHEDULING_ELIGIBILITY_H_
#define STAFFING_SCHEDULING_ELIGIBILITY_H_

#include <functional>
#include <vector>

#include "absl/strings/string_view.h"
#include "absl/time/civil_time.h"
#include "staffing/scheduling/roster_model.h"
#include "staffing/scheduling/run_ledger.h"
#include "staffing/scheduling/scheduling.pb.h"
#include "staffing/scheduling/shift_calendar.h"

namespace staffing {

bool IsBlockedOn(const Employee& employee, absl::CivilDay day);

// False only when the employee has an allowed-date list without `day`.
bool IsAllowedOn(const Employee& employee, absl::CivilDay day);

bool IsAvailableFor(const Employee& employee, ShiftType type,
                    absl::CivilDay day);

// Preference lookups. A blocked date is neither preferred nor avoided.
bool Prefers(const Employee& employee, ShiftType type, absl::CivilDay day);
bool Avoids(const Employee& employee, ShiftType type, absl::CivilDay day);

// Whether the time windows of two slots intersect.
bool Overlaps(const ShiftSlot& a, const ShiftSlot& b,
              const ShiftCatalog& catalog);

struct CandidateContext {
  const Employee& employee;
  int employee_index;
  const ShiftSlot& slot;
  const RunLedger& ledger;
};

class EligibilityEvaluator {
 public:
  // The catalog must outlive the evaluator.
  EligibilityEvaluator(const ShiftCatalog* catalog,
                       const ShiftSchedulerParameters& params);

  EligibilityEvaluator(const EligibilityEvaluator&) = delete;
  EligibilityEvaluator& operator=(const EligibilityEvaluator&) = delete;

  // True iff every hard constraint holds: the employee is active, the date is
  // neither blocked nor outside the allowed dates, the (shift type, weekday)
  // pair is in the availability, the slot is not avoided (unless also
  // preferred) when avoided_shifts_are_hard, the shift overlaps nothing the
  // employee holds in `ledger`, and the daily shift cap is not reached.
  bool IsEligible(const Employee& employee, int employee_index,
                  const ShiftSlot& slot, const RunLedger& ledger) const;

  // Name of the first hard constraint that fails, or an empty string.
  absl::string_view FirstViolation(const Employee& employee,
                                   int employee_index, const ShiftSlot& slot,
                                   const RunLedger& ledger) const;

  // Weighted sum of the soft constraints: +preferred_shift_bonus for a
  // preferred slot, -avoided_shift_penalty for an avoided one, and
  // -near_weekly_cap_penalty when the slot would bring the week over
  // soft_max_weekly_hours. Higher is better.
  int PreferenceScore(const Employee& employee, int employee_index,
                      const ShiftSlot& slot, const RunLedger& ledger) const;

 private:
  using Predicate = std::function<bool(const CandidateContext&)>;

  struct HardConstraint {
    absl::string_view name;
    Predicate holds;
  };

  struct SoftConstraint {
    absl::string_view name;
    int weight;
    Predicate applies;
  };

  std::vector<HardConstraint> hard_constraints_;
  std::vector<SoftConstraint> soft_constraints_;
};

}  // namespace staffing

#endif  // STAFFING_SCHEDULING_ELIGIBILITY_H_
