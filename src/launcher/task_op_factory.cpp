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

#include "launcher/task_op_factory.hpp"

#include <string>
#include <vector>

#include <glog/logging.h>

#include <stout/bytes.hpp>
#include <stout/check.hpp>
#include <stout/error.hpp>
#include <stout/foreach.hpp>

#include "common/protobuf_utils.hpp"

using std::string;
using std::vector;

namespace stride {
namespace internal {

const char FRAMEWORK_ID_LABEL[] = "stride_framework_id";
const char INSTANCE_ID_LABEL[] = "stride_instance_id";


TaskOp TaskOpFactory::launchEphemeral(
    const TaskInfo& taskInfo,
    const Task& newTask) const
{
  return launchEphemeral(taskInfo, newTask, Instance(newTask));
}


TaskOp TaskOpFactory::launchEphemeral(
    const TaskInfo& taskInfo,
    const Task& newTask,
    const Instance& instance) const
{
  CHECK_EQ(newTask.taskId.value(), taskInfo.task_id().value())
    << "Task id and the id of the launched task must be equal";

  return TaskOp::createLaunch(
      taskInfo,
      InstanceUpdateOperation::launchEphemeral(instance),
      None(),
      {protobuf::createLaunchOperation({taskInfo})});
}


TaskOp TaskOpFactory::launchEphemeral(
    const ExecutorInfo& executorInfo,
    const TaskGroupInfo& groupInfo,
    const Instance::LaunchRequest& launchRequest) const
{
  return TaskOp::createLaunchTaskGroup(
      executorInfo,
      groupInfo,
      InstanceUpdateOperation::launchEphemeral(launchRequest.instance),
      None(),
      {protobuf::createLaunchGroupOperation(executorInfo, groupInfo)});
}


TaskOp TaskOpFactory::launchOnReservation(
    const TaskInfo& taskInfo,
    const InstanceUpdateOperation& launchOnReservationState,
    const Task& oldTask) const
{
  return TaskOp::createLaunch(
      taskInfo,
      launchOnReservationState,
      Instance(oldTask),
      {protobuf::createLaunchOperation({taskInfo})});
}


Try<TaskOp> TaskOpFactory::reserveAndCreateVolumes(
    const FrameworkID& frameworkId,
    const InstanceUpdateOperation& reserveState,
    const Resources& resources,
    const vector<LocalVolume>& localVolumes) const
{
  if (!canReserve()) {
    return Error(
        "Cannot reserve resources for instance " +
        reserveState.instanceId().value() +
        " without a principal and a role");
  }

  const Resource::ReservationInfo reservationInfo =
    reservation(frameworkId, reserveState.instanceId());

  vector<Offer::Operation> offerOperations;
  offerOperations.push_back(protobuf::createReserveOperation(
      resources.flatten(role.get(), reservationInfo)));

  vector<Resources> volumes;
  foreach (const LocalVolume& localVolume, localVolumes) {
    Resource volume;
    volume.set_name("disk");
    volume.set_type(Value::SCALAR);
    volume.mutable_scalar()->set_value(
        static_cast<double>(localVolume.volume.size.bytes()) /
        Megabytes(1).bytes());
    volume.set_role(role.get());
    volume.mutable_reservation()->CopyFrom(reservationInfo);

    Resource::DiskInfo* disk = volume.mutable_disk();
    disk->mutable_persistence()->set_id(localVolume.id.idString());
    disk->mutable_persistence()->set_principal(principal.get());
    disk->mutable_volume()->set_container_path(
        localVolume.volume.containerPath);
    disk->mutable_volume()->set_mode(localVolume.volume.mode);

    if (localVolume.volume.source.isSome()) {
      disk->mutable_source()->CopyFrom(localVolume.volume.source.get());
    }

    volumes.push_back(volume);
    offerOperations.push_back(protobuf::createCreateOperation(volume));
  }

  return TaskOp::createReserveAndCreateVolumes(
      resources,
      volumes,
      reserveState,
      offerOperations);
}


Resource::ReservationInfo TaskOpFactory::reservation(
    const FrameworkID& frameworkId,
    const Instance::Id& instanceId) const
{
  CHECK_SOME(principal);

  Labels labels;
  labels.add_labels()->CopyFrom(
      protobuf::createLabel(FRAMEWORK_ID_LABEL, frameworkId.value()));
  labels.add_labels()->CopyFrom(
      protobuf::createLabel(INSTANCE_ID_LABEL, instanceId.value()));

  return protobuf::createReservationInfo(principal.get(), labels);
}

} // namespace internal {
} // namespace stride {
