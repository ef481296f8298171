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


// Greedy shift-assignment engine.
//
// A run walks the slots produced by RequirementExpander in their order. For
// each slot, the employees that pass every hard constraint are ranked by
// preference score (descending), then by load in hours (ascending), then by
// employee id (ascending), and the first required_count of them are booked.
// Every booking is recorded in a RunLedger before the next slot is looked at,
// so that a run is a pure function of its inputs.

#ifndef STAFFING_SCHEDULING_SHIFT_SCHEDULER_H_
#define STAFFING_SCHEDULING_SHIFT_SCHEDULER_H_

#include <ostream>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "absl/types/span.h"
#include "staffing/scheduling/roster_model.h"
#include "staffing/scheduling/scheduling.pb.h"
#include "staffing/scheduling/shift_calendar.h"

namespace staffing {

// Checks the weights and caps of `params`, and the shift windows through
// ShiftCatalog::FromParameters().
absl::Status ValidateShiftSchedulerParameters(
    const ShiftSchedulerParameters& params);

enum class RunPhase { kInitialized, kExpanding, kAssigning, kFinalized };

absl::string_view RunPhaseName(RunPhase phase);
std::ostream& operator<<(std::ostream& out, RunPhase phase);

class ShiftScheduler {
 public:
  explicit ShiftScheduler(const ShiftSchedulerParameters& params);

  ShiftScheduler(const ShiftScheduler&) = delete;
  ShiftScheduler& operator=(const ShiftScheduler&) = delete;

  // Validates the parameters, the snapshot, the window and every requirement
  // of the active projects, expands the requirements and assigns the slots.
  // Any invalid input fails the run with InvalidArgumentError before the
  // first assignment; slots that cannot be covered are reported in
  // CoveragePlan::unfilled_slots. When verify_plan is set, the plan is
  // checked by CheckCoveragePlan() before being returned.
  absl::StatusOr<CoveragePlan> Schedule(const RosterSnapshot& snapshot,
                                        const PlanningWindow& window);

  // Same as Schedule(), starting from already expanded slots, which are
  // assigned in the given order. Every slot must refer to a known active
  // project and have a positive required_count. Existing assignments dated inside
  // `window` count toward the load.
  absl::StatusOr<CoveragePlan> AssignSlots(const RosterSnapshot& snapshot,
                                           const PlanningWindow& window,
                                           absl::Span<const ShiftSlot> slots);

  // Phase reached by the last run. A run that failed validation stays in the
  // phase where it failed.
  RunPhase phase() const { return phase_; }

  const ShiftSchedulerParameters& parameters() const { return params_; }

 private:
  absl::StatusOr<CoveragePlan> Assign(const RosterSnapshot& snapshot,
                                      const PlanningWindow& window,
                                      absl::Span<const ShiftSlot> slots,
                                      const ShiftCatalog& catalog);

  const ShiftSchedulerParameters params_;
  RunPhase phase_ = RunPhase::kInitialized;
};

}  // namespace staffing

#endif  // STAFFING_SCHEDULING_SHIFT_SCHEDULER_H_
