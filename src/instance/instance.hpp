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

#ifndef __INSTANCE_INSTANCE_HPP__
#define __INSTANCE_INSTANCE_HPP__

#include <ostream>
#include <string>
#include <vector>

#include <stride/stride.hpp>

#include <process/time.hpp>

#include <stout/hashmap.hpp>
#include <stout/nothing.hpp>
#include <stout/option.hpp>
#include <stout/try.hpp>
#include <stout/unreachable.hpp>

#include "instance/ids.hpp"

namespace stride {
namespace internal {

// The lifecycle status of a task. The status of an instance is
// aggregated from the statuses of its tasks and uses the same values.
enum class InstanceStatus
{
  CREATED,
  STAGING,
  STARTING,
  RUNNING,
  KILLING,
  KILLED,
  FINISHED,
  FAILED,
  ERROR,
  GONE,
  DROPPED,
  UNREACHABLE
};


inline std::ostream& operator<<(
    std::ostream& stream,
    const InstanceStatus& status)
{
  switch (status) {
    case InstanceStatus::CREATED:     return stream << "Created";
    case InstanceStatus::STAGING:     return stream << "Staging";
    case InstanceStatus::STARTING:    return stream << "Starting";
    case InstanceStatus::RUNNING:     return stream << "Running";
    case InstanceStatus::KILLING:     return stream << "Killing";
    case InstanceStatus::KILLED:      return stream << "Killed";
    case InstanceStatus::FINISHED:    return stream << "Finished";
    case InstanceStatus::FAILED:      return stream << "Failed";
    case InstanceStatus::ERROR:       return stream << "Error";
    case InstanceStatus::GONE:        return stream << "Gone";
    case InstanceStatus::DROPPED:     return stream << "Dropped";
    case InstanceStatus::UNREACHABLE: return stream << "Unreachable";
  }

  UNREACHABLE();
}


// Returns true for the statuses a task never leaves.
bool isTerminal(const InstanceStatus& status);


// Returns true for the statuses of a task which has been handed to
// an agent and has not terminated.
bool isLaunched(const InstanceStatus& status);


// The agent an instance was placed on.
struct AgentInfo
{
  std::string host;
  Option<AgentID> agentId;
};


struct InstanceState
{
  InstanceState(
      const InstanceStatus& _status,
      const process::Time& _since,
      const Option<process::Time>& _activeSince,
      const Option<bool>& _healthy,
      const process::Time& _runSpecVersion)
    : status(_status),
      since(_since),
      activeSince(_activeSince),
      healthy(_healthy),
      runSpecVersion(_runSpecVersion) {}

  bool operator==(const InstanceState& that) const;

  InstanceStatus status;

  // When the instance changed into 'status'.
  process::Time since;

  // When the instance first became RUNNING.
  Option<process::Time> activeSince;

  Option<bool> healthy;
  process::Time runSpecVersion;
};


std::ostream& operator<<(std::ostream& stream, const InstanceState& state);


struct Task
{
  typedef TaskId Id;

  // Resources reserved on an agent for a task, including the
  // persistent volumes created from them.
  struct Reservation
  {
    std::vector<LocalVolumeId> volumeIds;
  };

  Task(
      const Id& _taskId,
      const AgentInfo& _agentInfo,
      const InstanceStatus& _status,
      const process::Time& _runSpecVersion)
    : taskId(_taskId),
      agentInfo(_agentInfo),
      status(_status),
      runSpecVersion(_runSpecVersion) {}

  // A task which only holds a reservation (and possibly volumes) but
  // has not been launched yet.
  bool isReserved() const
  {
    return reservation.isSome() && status == InstanceStatus::CREATED;
  }

  Id taskId;
  AgentInfo agentInfo;
  InstanceStatus status;
  Option<process::Time> stagedAt;
  Option<Reservation> reservation;
  process::Time runSpecVersion;
};


// An instance of a run specification placed on one agent. An app
// instance has exactly one task, a pod instance has one task per
// container.
class Instance
{
public:
  typedef InstanceId Id;

  struct LaunchRequest;

  Instance(
      const Id& _instanceId,
      const AgentInfo& _agentInfo,
      const InstanceState& _state,
      const hashmap<Task::Id, Task>& _tasks,
      const process::Time& _runSpecVersion)
    : instanceId(_instanceId),
      agentInfo(_agentInfo),
      state(_state),
      tasks(_tasks),
      runSpecVersion(_runSpecVersion) {}

  // An instance holding exactly the given task.
  explicit Instance(const Task& task);

  // Applies a status update of one of the tasks and recomputes the
  // aggregated state.
  Try<Nothing> updateTaskStatus(
      const Task::Id& taskId,
      const InstanceStatus& status,
      const process::Time& now);

  bool isLaunched() const { return internal::isLaunched(state.status); }

  bool isTerminal() const { return internal::isTerminal(state.status); }

  Id instanceId;
  AgentInfo agentInfo;
  InstanceState state;
  hashmap<Task::Id, Task> tasks;
  process::Time runSpecVersion;
};


// The request to launch all tasks of a pod instance as a task group.
struct Instance::LaunchRequest
{
  explicit LaunchRequest(const Instance& _instance) : instance(_instance) {}

  Instance instance;
};


// Computes the aggregated state of an instance from the statuses of
// its tasks:
//
//   (1) If every status is FINISHED the instance is FINISHED.
//   (2) Otherwise the FINISHED statuses are ignored and the most
//       severe remaining status wins, using the order
//         ERROR > FAILED > GONE > DROPPED > UNREACHABLE > KILLING >
//         KILLED > STAGING > STARTING > RUNNING > CREATED.
//
// 'since' only moves when the status changes. Health is only kept
// while the instance stays RUNNING. Without any task status the
// previous state is returned unchanged.
InstanceState newInstanceState(
    const InstanceState& previous,
    const std::vector<InstanceStatus>& taskStatuses,
    const process::Time& now,
    const process::Time& runSpecVersion);


std::ostream& operator<<(std::ostream& stream, const Instance& instance);

} // namespace internal {
} // namespace stride {

#endif // __INSTANCE_INSTANCE_HPP__
