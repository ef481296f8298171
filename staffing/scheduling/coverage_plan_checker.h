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


#ifndef STAFFING_SCHEDULING_COVERAGE_PLAN_CHECKER_H_
#define STAFFING_SCHEDULING_COVERAGE_PLAN_CHECKER_H_

#include "absl/status/status.h"
#include "absl/types/span.h"
#include "staffing/scheduling/roster_model.h"
#include "staffing/scheduling/scheduling.pb.h"
#include "staffing/scheduling/shift_calendar.h"

namespace staffing {

// Verifies that `plan` is a consistent answer for `slots` over `snapshot`:
//  - the counters of the plan match the slots,
//  - every assignment has status ASSIGNED, covers one of the slots, and
//    names an active employee that is available on that date, shift type
//    and weekday, not blocked, inside its allowed dates, and not avoided
//    (unless also preferred) when params.avoided_shifts_are_hard(),
//  - no employee holds two overlapping shifts, nor more than
//    params.max_shifts_per_day() shifts on a date that has a planned one,
//    counting the non-cancelled existing assignments of the snapshot,
//  - every slot gets at most required_count employees, and the number of
//    assigned employees plus the recorded shortfall equals required_count.
// Returns an InternalError describing the first violation found.
absl::Status CheckCoveragePlan(const CoveragePlan& plan,
                               const RosterSnapshot& snapshot,
                               absl::Span<const ShiftSlot> slots,
                               const ShiftCatalog& catalog,
                               const ShiftSchedulerParameters& params);

}  // namespace staffing

#endif  // STAFFING_SCHEDULING_COVERAGE_PLAN_CHECKER_H_
