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

#ifndef __LAUNCHER_TASK_OP_FACTORY_HPP__
#define __LAUNCHER_TASK_OP_FACTORY_HPP__

#include <string>
#include <vector>

#include <stride/resources.hpp>
#include <stride/stride.hpp>

#include <stout/option.hpp>
#include <stout/try.hpp>

#include "instance/instance.hpp"
#include "instance/instance_update_operation.hpp"
#include "instance/run_spec.hpp"

#include "matcher/task_op.hpp"

namespace stride {
namespace internal {

// The labels attached to dynamic reservations to find them again in
// later offers.
extern const char FRAMEWORK_ID_LABEL[];
extern const char INSTANCE_ID_LABEL[];


// Builds task operations from placement decisions. The principal and
// role are the identity of the framework; both are needed to reserve
// resources and create volumes.
class TaskOpFactory
{
public:
  TaskOpFactory(
      const Option<std::string>& _principal,
      const Option<std::string>& _role)
    : principal(_principal), role(_role) {}

  // Whether reservations can be made, i.e., both the principal and
  // the role are known.
  bool canReserve() const { return principal.isSome() && role.isSome(); }

  TaskOp launchEphemeral(
      const TaskInfo& taskInfo,
      const Task& newTask) const;

  TaskOp launchEphemeral(
      const TaskInfo& taskInfo,
      const Task& newTask,
      const Instance& instance) const;

  TaskOp launchEphemeral(
      const ExecutorInfo& executorInfo,
      const TaskGroupInfo& groupInfo,
      const Instance::LaunchRequest& launchRequest) const;

  TaskOp launchOnReservation(
      const TaskInfo& taskInfo,
      const InstanceUpdateOperation& launchOnReservationState,
      const Task& oldTask) const;

  // Returns the operations to reserve all of 'resources' (cpus, mem,
  // ports, disk, ...) and to create the local volumes from them.
  // Fails if the principal or role are not known.
  Try<TaskOp> reserveAndCreateVolumes(
      const FrameworkID& frameworkId,
      const InstanceUpdateOperation& reserveState,
      const Resources& resources,
      const std::vector<LocalVolume>& localVolumes) const;

private:
  Resource::ReservationInfo reservation(
      const FrameworkID& frameworkId,
      const Instance::Id& instanceId) const;

  const Option<std::string> principal;
  const Option<std::string> role;
};

} // namespace internal {
} // namespace stride {

#endif // __LAUNCHER_TASK_OP_FACTORY_HPP__
