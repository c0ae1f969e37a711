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

#ifndef __MATCHER_TASK_OP_HPP__
#define __MATCHER_TASK_OP_HPP__

#include <ostream>
#include <vector>

#include <stride/resources.hpp>
#include <stride/stride.hpp>

#include <stout/option.hpp>
#include <stout/unreachable.hpp>

#include "instance/instance.hpp"
#include "instance/instance_update_operation.hpp"

namespace stride {
namespace internal {

// An operation on an offer which relates to one instance. It pairs
// what is sent to the cluster manager (the offer operations) with the
// authoritative instance change which becomes effective once the
// operation has been accepted.
struct TaskOp
{
  enum class Type
  {
    LAUNCH,
    LAUNCH_TASK_GROUP,
    RESERVE_AND_CREATE_VOLUMES
  };

  friend std::ostream& operator<<(std::ostream& stream, const Type& type) {
    switch (type) {
      case Type::LAUNCH:
        return stream << "LAUNCH";
      case Type::LAUNCH_TASK_GROUP:
        return stream << "LAUNCH_TASK_GROUP";
      case Type::RESERVE_AND_CREATE_VOLUMES:
        return stream << "RESERVE_AND_CREATE_VOLUMES";
    }

    UNREACHABLE();
  }

  struct Launch
  {
    TaskInfo taskInfo;
  };

  struct LaunchTaskGroup
  {
    ExecutorInfo executorInfo;
    TaskGroupInfo groupInfo;
  };

  struct ReserveAndCreateVolumes
  {
    // The offered resources which are reserved, excluding the
    // volumes created from them.
    Resources resources;

    // The resources of each created volume, in declaration order.
    std::vector<Resources> volumes;
  };

  // NOTE: The task id of 'taskInfo' must match the task of the new
  // instance; a mismatch is fatal.
  static TaskOp createLaunch(
      const TaskInfo& taskInfo,
      const InstanceUpdateOperation& stateOp,
      const Option<Instance>& oldInstance,
      const std::vector<Offer::Operation>& offerOperations);

  // NOTE: The executor id must match the executor id of the new
  // instance; a mismatch is fatal.
  static TaskOp createLaunchTaskGroup(
      const ExecutorInfo& executorInfo,
      const TaskGroupInfo& groupInfo,
      const InstanceUpdateOperation& stateOp,
      const Option<Instance>& oldInstance,
      const std::vector<Offer::Operation>& offerOperations);

  static TaskOp createReserveAndCreateVolumes(
      const Resources& resources,
      const std::vector<Resources>& volumes,
      const InstanceUpdateOperation& stateOp,
      const std::vector<Offer::Operation>& offerOperations);

  // The task affected by this operation. For a task group this is the
  // first task of the group.
  Task::Id taskId() const;

  const Instance& newInstance() const { return stateOp.instance; }

  // The resources which have to be available in the offer for this
  // operation to succeed.
  Resources requiredResources() const;

  // Returns the offer as it would look like after the cluster manager
  // executed this operation.
  Offer applyToOffer(const Offer& offer) const;

  Type type;

  Option<Launch> launch;
  Option<LaunchTaskGroup> launchTaskGroup;
  Option<ReserveAndCreateVolumes> reserveAndCreateVolumes;

  InstanceUpdateOperation stateOp;

  // None for an instance which did not exist before.
  Option<Instance> oldInstance;

  std::vector<Offer::Operation> offerOperations;

private:
  TaskOp(
      const Type& _type,
      const InstanceUpdateOperation& _stateOp,
      const Option<Instance>& _oldInstance,
      const std::vector<Offer::Operation>& _offerOperations)
    : type(_type),
      stateOp(_stateOp),
      oldInstance(_oldInstance),
      offerOperations(_offerOperations) {}
};


std::ostream& operator<<(std::ostream& stream, const TaskOp& op);

} // namespace internal {
} // namespace stride {

#endif // __MATCHER_TASK_OP_HPP__
