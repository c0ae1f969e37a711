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

#include "matcher/launch_queue_matcher.hpp"

#include <cmath>
#include <deque>
#include <string>
#include <vector>

#include <glog/logging.h>

#include <stride/resources.hpp>

#include <process/clock.hpp>
#include <process/defer.hpp>
#include <process/dispatch.hpp>
#include <process/id.hpp>
#include <process/process.hpp>

#include <stout/bytes.hpp>
#include <stout/check.hpp>
#include <stout/foreach.hpp>
#include <stout/hashmap.hpp>
#include <stout/lambda.hpp>
#include <stout/option.hpp>
#include <stout/try.hpp>
#include <stout/unreachable.hpp>

#include "common/resources_utils.hpp"

using namespace process;

using std::deque;
using std::string;
using std::vector;

namespace stride {
namespace internal {

static bool sameSource(
    const Resource::DiskInfo::Source& left,
    const Resource::DiskInfo::Source& right)
{
  if (left.type() != right.type()) {
    return false;
  }

  switch (left.type()) {
    case Resource::DiskInfo::Source::PATH:
      return left.path().root() == right.path().root();
    case Resource::DiskInfo::Source::MOUNT:
      return left.mount().root() == right.mount().root();
    case Resource::DiskInfo::Source::UNKNOWN:
      return true;
  }

  UNREACHABLE();
}


// Picks the unreserved disk in 'available' which a persistent volume
// is created on, taken from the offered resource itself so that the
// reservation and the volume agree on the disk source. A volume
// without a source goes to the root disk and a PATH disk is split by
// size; a MOUNT disk can only be used whole.
static Option<Resource> volumeDisk(
    const PersistentVolume& volume,
    const Resources& available)
{
  Value::Scalar size;
  size.set_value(
      static_cast<double>(volume.size.bytes()) / Megabytes(1).bytes());

  foreach (const Resource& resource, available.unreserved().get("disk")) {
    if (resource.type() != Value::SCALAR ||
        Resources::isPersistentVolume(resource) ||
        !(size <= resource.scalar())) {
      continue;
    }

    const bool hasSource =
      resource.has_disk() && resource.disk().has_source();

    if (hasSource != volume.source.isSome()) {
      continue;
    }

    if (hasSource &&
        !sameSource(resource.disk().source(), volume.source.get())) {
      continue;
    }

    Resource disk = resource;
    if (!hasSource ||
        disk.disk().source().type() != Resource::DiskInfo::Source::MOUNT) {
      disk.mutable_scalar()->CopyFrom(size);
    }

    return disk;
  }

  return None();
}


class LaunchQueueMatcherProcess : public Process<LaunchQueueMatcherProcess>
{
public:
  LaunchQueueMatcherProcess(
      const TaskOpFactory& _factory,
      const FrameworkID& _frameworkId,
      size_t _maxTasksPerOffer)
    : ProcessBase(ID::generate("launch-queue-matcher")),
      factory(_factory),
      frameworkId(_frameworkId),
      maxTasksPerOffer(_maxTasksPerOffer) {}

  void add(const RunSpec& runSpec, size_t count)
  {
    if (runSpec.isResident() && !factory.canReserve()) {
      LOG(ERROR) << "Dropping " << count << " instance(s) of " << runSpec.id
                 << ": persistent volumes need a principal and a role";
      return;
    }

    LOG(INFO) << "Queueing " << count << " instance(s) of " << runSpec.id;

    for (size_t i = 0; i < count; i++) {
      queue.push_back(runSpec);
    }
  }

  MatchedTaskOps matchOffer(const Time& deadline, const Offer& offer)
  {
    if (Clock::now() >= deadline) {
      LOG(INFO) << "Deadline for offer " << offer.id() << " has passed";
      return MatchedTaskOps(offer.id(), vector<TaskOpWithSource>(), true);
    }

    Offer remaining = offer;
    vector<TaskOpWithSource> ops;
    bool resendThisOffer = false;

    // Reserved instances first, their reservation can only be used by
    // them.
    foreach (const Instance::Id& instanceId, reservations.keys()) {
      if (ops.size() >= maxTasksPerOffer) {
        break;
      }

      const Reservation& reservation = reservations.at(instanceId);

      Option<TaskOp> op = launchOnReservation(reservation.instance, remaining);
      if (op.isNone()) {
        continue;
      }

      remaining = op->applyToOffer(remaining);
      ops.push_back(withSource(reservation.runSpec, op.get()));
      reservations.erase(instanceId);
    }

    while (!queue.empty() && ops.size() < maxTasksPerOffer) {
      if (Clock::now() >= deadline) {
        resendThisOffer = true;
        break;
      }

      const RunSpec runSpec = queue.front();

      Try<Option<TaskOp>> op = match(runSpec, remaining);
      if (op.isError()) {
        // No offer can ever fit it, so it must not hold up the queue.
        LOG(ERROR) << "Dropping an instance of " << runSpec.id << ": "
                   << op.error();
        queue.pop_front();
        continue;
      }

      if (op->isNone()) {
        // Keep the launch order: nothing behind the head of the queue
        // overtakes it.
        break;
      }

      queue.pop_front();

      remaining = op.get()->applyToOffer(remaining);
      ops.push_back(withSource(runSpec, op.get().get()));
    }

    VLOG(1) << "Matched " << ops.size() << " operation(s) on offer "
            << offer.id() << ", " << queue.size() << " instance(s) queued";

    return MatchedTaskOps(offer.id(), ops, resendThisOffer);
  }

  vector<Instance> instances()
  {
    vector<Instance> result;
    foreachvalue (const Instance& instance, launched) {
      result.push_back(instance);
    }

    foreachvalue (const Reservation& reservation, reservations) {
      result.push_back(reservation.instance);
    }
    return result;
  }

  size_t queued()
  {
    return queue.size();
  }

private:
  struct Reservation
  {
    RunSpec runSpec;
    Instance instance;
  };

  TaskOpWithSource withSource(const RunSpec& runSpec, const TaskOp& op)
  {
    return TaskOpWithSource(
        TaskOpSource(
            defer(self(), &Self::accepted, runSpec, lambda::_1),
            defer(self(), &Self::rejected, runSpec, lambda::_1, lambda::_2)),
        op);
  }

  void accepted(const RunSpec& runSpec, const TaskOp& op)
  {
    LOG(INFO) << "Accepted " << op;

    const Instance& instance = op.newInstance();

    switch (op.stateOp.type) {
      case InstanceUpdateOperation::Type::LAUNCH_EPHEMERAL:
      case InstanceUpdateOperation::Type::LAUNCH_ON_RESERVATION:
        launched.put(instance.instanceId, instance);
        return;
      case InstanceUpdateOperation::Type::RESERVE:
        reservations.put(instance.instanceId, Reservation{runSpec, instance});
        return;
    }

    UNREACHABLE();
  }

  void rejected(const RunSpec& runSpec, const TaskOp& op, const string& reason)
  {
    LOG(WARNING) << "Rejected " << op << ": " << reason;

    switch (op.stateOp.type) {
      case InstanceUpdateOperation::Type::LAUNCH_EPHEMERAL:
      case InstanceUpdateOperation::Type::RESERVE:
        queue.push_front(runSpec);
        return;
      case InstanceUpdateOperation::Type::LAUNCH_ON_RESERVATION:
        CHECK_SOME(op.oldInstance);
        reservations.put(
            op.oldInstance->instanceId,
            Reservation{runSpec, op.oldInstance.get()});
        return;
    }

    UNREACHABLE();
  }

  Try<Option<TaskOp>> match(const RunSpec& runSpec, const Offer& offer)
  {
    if (runSpec.isPod()) {
      return launchTaskGroup(runSpec, offer);
    } else if (runSpec.isResident()) {
      return reserveAndCreateVolumes(runSpec, offer);
    }

    return launchEphemeral(runSpec, offer);
  }

  Option<TaskOp> launchEphemeral(const RunSpec& runSpec, const Offer& offer)
  {
    if (!Resources(offer.resources()).contains(runSpec.resources)) {
      return None();
    }

    const Instance::Id instanceId = InstanceId::forRunSpec(runSpec.id);
    const Task::Id taskId = TaskId::forInstance(instanceId);

    TaskInfo taskInfo;
    taskInfo.set_name(runSpec.id.safePath());
    taskInfo.mutable_task_id()->CopyFrom(taskId.toTaskID());
    taskInfo.mutable_agent_id()->CopyFrom(offer.agent_id());
    taskInfo.mutable_resources()->CopyFrom(runSpec.resources);
    taskInfo.mutable_command()->set_value(runSpec.command);

    return factory.launchEphemeral(
        taskInfo,
        stagedTask(taskId, offer, runSpec.version));
  }

  Option<TaskOp> launchTaskGroup(const RunSpec& runSpec, const Offer& offer)
  {
    Resources required = runSpec.executorResources;
    foreach (const ContainerSpec& container, runSpec.containers) {
      required += container.resources;
    }

    if (!Resources(offer.resources()).contains(required)) {
      return None();
    }

    const Instance::Id instanceId = InstanceId::forRunSpec(runSpec.id);

    ExecutorInfo executorInfo;
    executorInfo.mutable_executor_id()->set_value(
        instanceId.executorIdString());
    executorInfo.mutable_framework_id()->CopyFrom(frameworkId);
    executorInfo.mutable_resources()->CopyFrom(runSpec.executorResources);
    executorInfo.set_name(runSpec.id.path());

    TaskGroupInfo groupInfo;
    hashmap<Task::Id, Task> tasks;

    foreach (const ContainerSpec& container, runSpec.containers) {
      const Task::Id taskId = TaskId::forInstance(instanceId, container.name);

      TaskInfo* taskInfo = groupInfo.add_tasks();
      taskInfo->set_name(container.name);
      taskInfo->mutable_task_id()->CopyFrom(taskId.toTaskID());
      taskInfo->mutable_agent_id()->CopyFrom(offer.agent_id());
      taskInfo->mutable_resources()->CopyFrom(container.resources);
      taskInfo->mutable_command()->set_value(container.command);

      tasks.put(taskId, stagedTask(taskId, offer, runSpec.version));
    }

    const Time now = Clock::now();

    const Instance instance(
        instanceId,
        agentInfo(offer),
        InstanceState(InstanceStatus::STAGING, now, None(), None(),
                      runSpec.version),
        tasks,
        runSpec.version);

    return factory.launchEphemeral(
        executorInfo,
        groupInfo,
        Instance::LaunchRequest(instance));
  }

  Try<Option<TaskOp>> reserveAndCreateVolumes(
      const RunSpec& runSpec,
      const Offer& offer)
  {
    Resources available = offer.resources();
    if (!available.contains(runSpec.resources)) {
      return Option<TaskOp>::none();
    }

    available -= runSpec.resources;

    const Instance::Id instanceId = InstanceId::forRunSpec(runSpec.id);

    Resources resources = runSpec.resources;
    vector<LocalVolume> localVolumes;
    Task::Reservation reservation;

    foreach (const PersistentVolume& volume, runSpec.persistentVolumes) {
      const Option<Resource> disk = volumeDisk(volume, available);
      if (disk.isNone()) {
        return Option<TaskOp>::none();
      }

      available -= disk.get();
      resources += disk.get();

      // The volume takes up all of the disk it is placed on, which is
      // more than asked for on a MOUNT disk.
      PersistentVolume placed = volume;
      placed.size = Bytes(static_cast<uint64_t>(
          std::llround(disk->scalar().value() * Megabytes(1).bytes())));

      const LocalVolumeId volumeId =
        LocalVolumeId::forVolume(runSpec.id, volume.containerPath);

      localVolumes.push_back(LocalVolume(volumeId, placed));
      reservation.volumeIds.push_back(volumeId);
    }

    Task reservedTask(
        TaskId::forInstance(instanceId),
        agentInfo(offer),
        InstanceStatus::CREATED,
        runSpec.version);

    reservedTask.reservation = reservation;

    Try<TaskOp> op = factory.reserveAndCreateVolumes(
        frameworkId,
        InstanceUpdateOperation::reserve(Instance(reservedTask)),
        resources,
        localVolumes);

    if (op.isError()) {
      return Error(op.error());
    }

    return Option<TaskOp>(op.get());
  }

  Option<TaskOp> launchOnReservation(
      const Instance& instance,
      const Offer& offer)
  {
    const Resources reserved = Resources(offer.resources()).filter(
        [&instance](const Resource& resource) {
          return hasReservationLabel(
              resource, INSTANCE_ID_LABEL, instance.instanceId.value());
        });

    if (reserved.empty()) {
      return None();
    }

    CHECK(!instance.tasks.empty());
    const Task& oldTask = instance.tasks.begin()->second;

    // Wait for an offer which carries every volume of the reservation.
    if (oldTask.reservation.isSome() &&
        reserved.persistentVolumes().size() <
          oldTask.reservation->volumeIds.size()) {
      return None();
    }

    TaskInfo taskInfo;
    taskInfo.set_name(instance.instanceId.runSpecId().safePath());
    taskInfo.mutable_task_id()->CopyFrom(oldTask.taskId.toTaskID());
    taskInfo.mutable_agent_id()->CopyFrom(offer.agent_id());
    taskInfo.mutable_resources()->CopyFrom(reserved);

    const Time now = Clock::now();

    Task newTask = oldTask;
    newTask.status = InstanceStatus::STAGING;
    newTask.stagedAt = now;

    Instance newInstance = instance;
    newInstance.tasks.put(newTask.taskId, newTask);
    newInstance.state = newInstanceState(
        instance.state,
        {newTask.status},
        now,
        instance.runSpecVersion);

    return factory.launchOnReservation(
        taskInfo,
        InstanceUpdateOperation::launchOnReservation(newInstance),
        oldTask);
  }

  static AgentInfo agentInfo(const Offer& offer)
  {
    AgentInfo agent;
    agent.host = offer.hostname();
    agent.agentId = offer.agent_id();
    return agent;
  }

  static Task stagedTask(
      const Task::Id& taskId,
      const Offer& offer,
      const Time& runSpecVersion)
  {
    Task task(
        taskId, agentInfo(offer), InstanceStatus::STAGING, runSpecVersion);
    task.stagedAt = Clock::now();
    return task;
  }

  const TaskOpFactory factory;
  const FrameworkID frameworkId;
  const size_t maxTasksPerOffer;

  deque<RunSpec> queue;
  hashmap<Instance::Id, Instance> launched;

  // Instances holding a reservation and waiting for an offer which
  // carries it.
  hashmap<Instance::Id, Reservation> reservations;
};


LaunchQueueMatcher::LaunchQueueMatcher(
    const TaskOpFactory& factory,
    const FrameworkID& frameworkId,
    size_t maxTasksPerOffer)
{
  process = new LaunchQueueMatcherProcess(
      factory, frameworkId, maxTasksPerOffer);

  spawn(process);
}


LaunchQueueMatcher::~LaunchQueueMatcher()
{
  terminate(process);
  process::wait(process);
  delete process;
}


void LaunchQueueMatcher::add(const RunSpec& runSpec, size_t count)
{
  dispatch(process, &LaunchQueueMatcherProcess::add, runSpec, count);
}


Future<MatchedTaskOps> LaunchQueueMatcher::matchOffer(
    const Time& deadline,
    const Offer& offer)
{
  return dispatch(
      process, &LaunchQueueMatcherProcess::matchOffer, deadline, offer);
}


Future<vector<Instance>> LaunchQueueMatcher::instances()
{
  return dispatch(process, &LaunchQueueMatcherProcess::instances);
}


Future<size_t> LaunchQueueMatcher::queued()
{
  return dispatch(process, &LaunchQueueMatcherProcess::queued);
}

} // namespace internal {
} // namespace stride {
