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


#ifndef STAFFING_SCHEDULING_SCENARIO_RUNNER_H_
#define STAFFING_SCHEDULING_SCENARIO_RUNNER_H_

#include <vector>

#include "absl/status/statusor.h"
#include "absl/types/span.h"
#include "staffing/scheduling/roster_model.h"
#include "staffing/scheduling/scheduling.pb.h"

namespace staffing {

// Runs one ShiftScheduler per planning window over the same snapshot, on a
// pool of params.num_workers() threads. Runs share nothing but the snapshot,
// which none of them modifies, so result i is what a sequential
// ShiftScheduler(params).Schedule(snapshot, windows[i]) returns. Results are
// in the order of `windows`.
std::vector<absl::StatusOr<CoveragePlan>> RunIndependentScenarios(
    const RosterSnapshot& snapshot, absl::Span<const PlanningWindow> windows,
    const ShiftSchedulerParameters& params);

}  // namespace staffing

#endif  // STAFFING_SCHEDULING_SCENARIO_RUNNER_H_
