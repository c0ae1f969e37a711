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

#include "matcher/task_op.hpp"

#include <ostream>
#include <vector>

#include <glog/logging.h>

#include <stout/check.hpp>
#include <stout/foreach.hpp>
#include <stout/try.hpp>

#include "common/resources_utils.hpp"

using std::ostream;
using std::vector;

namespace stride {
namespace internal {

TaskOp TaskOp::createLaunch(
    const TaskInfo& taskInfo,
    const InstanceUpdateOperation& stateOp,
    const Option<Instance>& oldInstance,
    const vector<Offer::Operation>& offerOperations)
{
  Try<TaskId> taskId = TaskId::parse(taskInfo.task_id());

  CHECK(taskId.isSome() && stateOp.instance.tasks.contains(taskId.get()))
    << "Task id " << taskInfo.task_id() << " of the launched task does not"
    << " match a task of instance " << stateOp.instanceId();

  TaskOp op(Type::LAUNCH, stateOp, oldInstance, offerOperations);
  op.launch = Launch{taskInfo};
  return op;
}


TaskOp TaskOp::createLaunchTaskGroup(
    const ExecutorInfo& executorInfo,
    const TaskGroupInfo& groupInfo,
    const InstanceUpdateOperation& stateOp,
    const Option<Instance>& oldInstance,
    const vector<Offer::Operation>& offerOperations)
{
  CHECK_EQ(
      executorInfo.executor_id().value(),
      stateOp.instanceId().executorIdString())
    << "Executor id of the task group does not match instance "
    << stateOp.instanceId();

  CHECK_GT(groupInfo.tasks_size(), 0)
    << "Task group of instance " << stateOp.instanceId() << " is empty";

  TaskOp op(Type::LAUNCH_TASK_GROUP, stateOp, oldInstance, offerOperations);
  op.launchTaskGroup = LaunchTaskGroup{executorInfo, groupInfo};
  return op;
}


TaskOp TaskOp::createReserveAndCreateVolumes(
    const Resources& resources,
    const vector<Resources>& volumes,
    const InstanceUpdateOperation& stateOp,
    const vector<Offer::Operation>& offerOperations)
{
  CHECK(!stateOp.instance.tasks.empty())
    << "Reserved instance " << stateOp.instanceId() << " has no task";

  TaskOp op(Type::RESERVE_AND_CREATE_VOLUMES, stateOp, None(), offerOperations);
  op.reserveAndCreateVolumes = ReserveAndCreateVolumes{resources, volumes};
  return op;
}


Task::Id TaskOp::taskId() const
{
  switch (type) {
    case Type::LAUNCH: {
      CHECK_SOME(launch);

      Try<TaskId> taskId = TaskId::parse(launch->taskInfo.task_id());
      CHECK_SOME(taskId);

      return taskId.get();
    }
    case Type::LAUNCH_TASK_GROUP: {
      CHECK_SOME(launchTaskGroup);

      Try<TaskId> taskId =
        TaskId::parse(launchTaskGroup->groupInfo.tasks(0).task_id());
      CHECK_SOME(taskId);

      return taskId.get();
    }
    case Type::RESERVE_AND_CREATE_VOLUMES: {
      CHECK_SOME(reserveAndCreateVolumes);

      // A reserved instance holds exactly the task of the reservation.
      return newInstance().tasks.begin()->first;
    }
  }

  UNREACHABLE();
}


Resources TaskOp::requiredResources() const
{
  switch (type) {
    case Type::LAUNCH: {
      CHECK_SOME(launch);

      Resources resources = launch->taskInfo.resources();
      if (launch->taskInfo.has_executor()) {
        resources += launch->taskInfo.executor().resources();
      }

      return resources;
    }
    case Type::LAUNCH_TASK_GROUP: {
      CHECK_SOME(launchTaskGroup);

      Resources resources = launchTaskGroup->executorInfo.resources();
      foreach (const TaskInfo& task, launchTaskGroup->groupInfo.tasks()) {
        resources += task.resources();
      }

      return resources;
    }
    case Type::RESERVE_AND_CREATE_VOLUMES: {
      CHECK_SOME(reserveAndCreateVolumes);

      // The volumes are created from the reserved resources.
      return reserveAndCreateVolumes->resources;
    }
  }

  UNREACHABLE();
}


Offer TaskOp::applyToOffer(const Offer& offer) const
{
  switch (type) {
    case Type::LAUNCH:
    case Type::LAUNCH_TASK_GROUP:
      return consumeResourcesFromOffer(offer, requiredResources());
    case Type::RESERVE_AND_CREATE_VOLUMES: {
      CHECK_SOME(reserveAndCreateVolumes);

      Offer remaining =
        consumeResourcesFromOffer(offer, reserveAndCreateVolumes->resources);

      foreach (const Resources& volume, reserveAndCreateVolumes->volumes) {
        remaining = consumeResourcesFromOffer(remaining, volume);
      }

      return remaining;
    }
  }

  UNREACHABLE();
}


ostream& operator<<(ostream& stream, const TaskOp& op)
{
  stream << op.type << " of task " << op.taskId()
         << " for instance " << op.stateOp.instanceId() << " (";

  for (size_t i = 0; i < op.offerOperations.size(); i++) {
    if (i > 0) {
      stream << ", ";
    }
    stream << Offer::Operation::Type_Name(op.offerOperations[i].type());
  }

  return stream << ")";
}

} // namespace internal {
} // namespace stride {
