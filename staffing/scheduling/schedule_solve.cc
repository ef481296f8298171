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


// Reads a text-format ScheduleRequest, assigns its shifts and writes the
// coverage plan and its cost summary as a text-format ScheduleResponse.
//
// Example:
//   schedule_solve --input=request.textproto --output=response.textproto

#include <string>
#include <vector>

#include "absl/flags/flag.h"
#include "absl/log/log.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "staffing/base/file.h"
#include "staffing/base/init_google.h"
#include "staffing/base/status_macros.h"
#include "staffing/scheduling/cost_summary.h"
#include "staffing/scheduling/roster_model.h"
#include "staffing/scheduling/scheduling.pb.h"
#include "staffing/scheduling/scheduling_proto_io.h"
#include "staffing/scheduling/shift_calendar.h"
#include "staffing/scheduling/shift_scheduler.h"

ABSL_FLAG(std::string, input, "",
          "REQUIRED: Text-format ScheduleRequest to solve.");
ABSL_FLAG(std::string, params, "",
          "Text-format ShiftSchedulerParameters merged over the parameters "
          "of the request.");
ABSL_FLAG(std::string, output, "",
          "If non-empty, where to write the text-format ScheduleResponse.");
ABSL_FLAG(bool, include_existing_in_summary, false,
          "Whether the summary also counts the non-cancelled existing "
          "assignments dated inside the planning window.");

namespace staffing {

absl::Status Run() {
  const std::string input = absl::GetFlag(FLAGS_input);
  if (input.empty()) {
    return absl::InvalidArgumentError("--input is required");
  }
  ASSIGN_OR_RETURN(const ScheduleRequest request,
                   file::GetTextProto<ScheduleRequest>(input));

  ShiftSchedulerParameters params = request.parameters();
  if (!absl::GetFlag(FLAGS_params).empty()) {
    ShiftSchedulerParameters overrides;
    RETURN_IF_ERROR(file::ParseTextProto(absl::GetFlag(FLAGS_params),
                                         &overrides))
        << "in --params";
    params.MergeFrom(overrides);
  }

  ASSIGN_OR_RETURN(const RosterSnapshot snapshot,
                   RosterSnapshotFromProto(request));
  ASSIGN_OR_RETURN(const PlanningWindow window,
                   PlanningWindowFromProto(request));
  LOG(INFO) << "Scheduling " << snapshot.employees.size() << " employees and "
            << snapshot.projects.size() << " projects from "
            << FormatDate(window.first_day) << " to "
            << FormatDate(window.last_day);

  ShiftScheduler scheduler(params);
  ASSIGN_OR_RETURN(const CoveragePlan plan,
                   scheduler.Schedule(snapshot, window));
  LOG(INFO) << "Filled " << plan.num_seats_filled() << " of "
            << plan.num_seats_required << " seats, "
            << plan.unfilled_slots.size() << " slot(s) short";
  for (const UnfilledSlot& unfilled : plan.unfilled_slots) {
    LOG(WARNING) << "Unfilled: " << unfilled.slot << ", shortfall "
                 << unfilled.shortfall;
  }

  std::vector<Assignment> summarized = plan.assignments;
  if (absl::GetFlag(FLAGS_include_existing_in_summary)) {
    summarized.insert(summarized.end(), snapshot.existing_assignments.begin(),
                      snapshot.existing_assignments.end());
  }
  ASSIGN_OR_RETURN(const ShiftCatalog catalog,
                   ShiftCatalog::FromParameters(params));
  SummaryFilter filter;
  filter.window = window;
  ASSIGN_OR_RETURN(const ScheduleSummary summary,
                   Summarize(summarized, snapshot.projects, catalog, filter));
  LOG(INFO) << "Total: " << summary.total_hours << " hours, "
            << summary.total_cost_minor << " in minor currency units";

  ScheduleResponse response;
  *response.mutable_plan() = CoveragePlanToProto(plan);
  *response.mutable_summary() = ScheduleSummaryToProto(summary);
  const std::string output = absl::GetFlag(FLAGS_output);
  if (output.empty()) {
    LOG(INFO) << response.DebugString();
    return absl::OkStatus();
  }
  return file::SetTextProto(output, response);
}

}  // namespace staffing

int main(int argc, char** argv) {
  InitGoogle(argv[0], &argc, &argv);
  const absl::Status status = staffing::Run();
  if (!status.ok()) {
    LOG(ERROR) << status;
    return 1;
  }
  return 0;
}
