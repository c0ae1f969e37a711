// Licensed to the Apache Software Foundation (ASF) under one
// or more contributor license agreements.  See the NOTICE file
// distributed with this work for additional information
// regarding copyright ownership.  The ASF licenses this file
// to you under the Apache License, Version 2.0 (the
// "License"); you may not use this file except in compliance
// with the License.  You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#include "instance/instance.hpp"

#include <ostream>
#include <vector>

#include <glog/logging.h>

#include <process/clock.hpp>

#include <stout/error.hpp>
#include <stout/foreach.hpp>
#include <stout/none.hpp>
#include <stout/stringify.hpp>

using std::ostream;
using std::vector;

using process::Clock;
using process::Time;

namespace stride {
namespace internal {

bool isTerminal(const InstanceStatus& status)
{
  switch (status) {
    case InstanceStatus::KILLED:
    case InstanceStatus::FINISHED:
    case InstanceStatus::FAILED:
    case InstanceStatus::ERROR:
    case InstanceStatus::GONE:
    case InstanceStatus::DROPPED:
      return true;
    case InstanceStatus::CREATED:
    case InstanceStatus::STAGING:
    case InstanceStatus::STARTING:
    case InstanceStatus::RUNNING:
    case InstanceStatus::KILLING:
    case InstanceStatus::UNREACHABLE:
      return false;
  }

  UNREACHABLE();
}


bool isLaunched(const InstanceStatus& status)
{
  switch (status) {
    case InstanceStatus::STAGING:
    case InstanceStatus::STARTING:
    case InstanceStatus::RUNNING:
    case InstanceStatus::KILLING:
    case InstanceStatus::UNREACHABLE:
      return true;
    case InstanceStatus::CREATED:
    case InstanceStatus::KILLED:
    case InstanceStatus::FINISHED:
    case InstanceStatus::FAILED:
    case InstanceStatus::ERROR:
    case InstanceStatus::GONE:
    case InstanceStatus::DROPPED:
      return false;
  }

  UNREACHABLE();
}


// Lower values are more severe. FINISHED is never ranked; it only
// wins when every task finished.
static int severity(const InstanceStatus& status)
{
  switch (status) {
    case InstanceStatus::ERROR:       return 0;
    case InstanceStatus::FAILED:      return 1;
    case InstanceStatus::GONE:        return 2;
    case InstanceStatus::DROPPED:     return 3;
    case InstanceStatus::UNREACHABLE: return 4;
    case InstanceStatus::KILLING:     return 5;
    case InstanceStatus::KILLED:      return 6;
    case InstanceStatus::STAGING:     return 7;
    case InstanceStatus::STARTING:    return 8;
    case InstanceStatus::RUNNING:     return 9;
    case InstanceStatus::CREATED:     return 10;
    case InstanceStatus::FINISHED:
      LOG(FATAL) << "FINISHED has no severity";
  }

  UNREACHABLE();
}


bool InstanceState::operator==(const InstanceState& that) const
{
  return status == that.status &&
         since == that.since &&
         activeSince == that.activeSince &&
         healthy == that.healthy &&
         runSpecVersion == that.runSpecVersion;
}


ostream& operator<<(ostream& stream, const InstanceState& state)
{
  stream << state.status << " since " << state.since;

  if (state.activeSince.isSome()) {
    stream << ", active since " << state.activeSince.get();
  }

  if (state.healthy.isSome()) {
    stream << (state.healthy.get() ? ", healthy" : ", unhealthy");
  }

  return stream;
}


InstanceState newInstanceState(
    const InstanceState& previous,
    const vector<InstanceStatus>& taskStatuses,
    const Time& now,
    const Time& runSpecVersion)
{
  if (taskStatuses.empty()) {
    return previous;
  }

  Option<InstanceStatus> mostSevere;
  foreach (const InstanceStatus& status, taskStatuses) {
    if (status == InstanceStatus::FINISHED) {
      continue;
    }

    if (mostSevere.isNone() || severity(status) < severity(mostSevere.get())) {
      mostSevere = status;
    }
  }

  const InstanceStatus status = mostSevere.isSome()
    ? mostSevere.get()
    : InstanceStatus::FINISHED;

  const bool changed = status != previous.status;

  Option<Time> activeSince = previous.activeSince;
  if (status == InstanceStatus::RUNNING && activeSince.isNone()) {
    activeSince = now;
  }

  Option<bool> healthy = None();
  if (status == InstanceStatus::RUNNING &&
      previous.status == InstanceStatus::RUNNING) {
    healthy = previous.healthy;
  }

  return InstanceState(
      status,
      changed ? now : previous.since,
      activeSince,
      healthy,
      runSpecVersion);
}


Instance::Instance(const Task& task)
  : instanceId(task.taskId.instanceId()),
    agentInfo(task.agentInfo),
    state(
        task.status,
        task.stagedAt.isSome() ? task.stagedAt.get() : Clock::now(),
        None(),
        None(),
        task.runSpecVersion),
    runSpecVersion(task.runSpecVersion)
{
  if (task.status == InstanceStatus::RUNNING) {
    state.activeSince = state.since;
  }

  tasks.put(task.taskId, task);
}


Try<Nothing> Instance::updateTaskStatus(
    const Task::Id& taskId,
    const InstanceStatus& status,
    const Time& now)
{
  auto task = tasks.find(taskId);
  if (task == tasks.end()) {
    return Error(
        "Unknown task " + stringify(taskId) +
        " of instance " + stringify(instanceId));
  }

  task->second.status = status;
  if (status == InstanceStatus::STAGING && task->second.stagedAt.isNone()) {
    task->second.stagedAt = now;
  }

  vector<InstanceStatus> statuses;
  foreachvalue (const Task& _task, tasks) {
    statuses.push_back(_task.status);
  }

  const InstanceState previous = state;
  state = newInstanceState(previous, statuses, now, runSpecVersion);

  if (state.status != previous.status) {
    VLOG(1) << "Instance " << instanceId << " changed from "
            << previous.status << " to " << state.status
            << " after task " << taskId << " became " << status;
  }

  return Nothing();
}


ostream& operator<<(ostream& stream, const Instance& instance)
{
  stream << "instance " << instance.instanceId
         << " on " << instance.agentInfo.host
         << " (" << instance.state << ") with tasks [";

  bool first = true;
  foreachpair (const Task::Id& taskId, const Task& task, instance.tasks) {
    if (!first) {
      stream << ", ";
    }
    stream << taskId << ": " << task.status;
    first = false;
  }

  return stream << "]";
}

} // namespace internal {
} // namespace stride {
