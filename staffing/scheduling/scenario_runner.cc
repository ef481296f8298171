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


#include "staffing/scheduling/scenario_runner.h"

#include <algorithm>
#include <vector>

#include "absl/log/log.h"
#include "absl/status/statusor.h"
#include "absl/types/span.h"
#include "staffing/base/threadpool.h"
#include "staffing/scheduling/roster_model.h"
#include "staffing/scheduling/scheduling.pb.h"
#include "staffing/scheduling/shift_scheduler.h"

namespace staffing {

std::vector<absl::StatusOr<CoveragePlan>> RunIndependentScenarios(
    const RosterSnapshot& snapshot, absl::Span<const PlanningWindow> windows,
    const ShiftSchedulerParameters& params) {
  const int num_windows = static_cast<int>(windows.size());
  std::vector<absl::StatusOr<CoveragePlan>> results(num_windows);
  if (num_windows == 0) return results;
  // An invalid num_workers is reported by each run; one thread is enough then.
  const int num_threads = std::clamp(params.num_workers(), 1, num_windows);
  VLOG(1) << "Running " << num_windows << " scenarios on " << num_threads
          << " thread(s)";
  {
    ThreadPool pool("scenarios", num_threads);
    pool.StartWorkers();
    for (int i = 0; i < num_windows; ++i) {
      pool.Schedule([&snapshot, &params, &results, window = windows[i], i] {
        ShiftScheduler scheduler(params);
        results[i] = scheduler.Schedule(snapshot, window);
      });
    }
  }
  return results;
}

}  // namespace staffing
