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

#include <string>
#include <vector>

#include <gtest/gtest.h>

#include <stride/resources.hpp>
#include <stride/stride.hpp>

#include <process/clock.hpp>
#include <process/future.hpp>
#include <process/gtest.hpp>
#include <process/time.hpp>

#include <stout/bytes.hpp>
#include <stout/foreach.hpp>
#include <stout/gtest.hpp>

#include "common/resources_utils.hpp"

#include "instance/instance.hpp"
#include "instance/instance_update_operation.hpp"
#include "instance/run_spec.hpp"

#include "launcher/task_op_factory.hpp"

#include "matcher/launch_queue_matcher.hpp"
#include "matcher/offer_matcher.hpp"
#include "matcher/task_op.hpp"

#include "tests/stride.hpp"

using process::Clock;
using process::Future;
using process::Time;

using std::string;
using std::vector;

namespace stride {
namespace internal {
namespace tests {

class LaunchQueueMatcherTest : public ::testing::Test
{
protected:
  LaunchQueueMatcherTest()
    : factory(string("stride-principal"), string("stride"))
  {
    frameworkId.set_value("framework-1");
  }

  RunSpec createApp(const string& id, const string& resources)
  {
    RunSpec runSpec(createRunSpecId(id), Time::epoch());
    runSpec.resources = createResources(resources);
    runSpec.command = "sleep 1000";
    return runSpec;
  }

  TaskOpFactory factory;
  FrameworkID frameworkId;
};


TEST_F(LaunchQueueMatcherTest, LaunchApps)
{
  LaunchQueueMatcher matcher(factory, frameworkId, 2);

  matcher.add(createApp("/app", "cpus:1;mem:128"), 3);

  AWAIT_EXPECT_EQ(3u, matcher.queued());

  const Offer offer = createOffer(createResources("cpus:4;mem:1024"));

  Future<MatchedTaskOps> matched =
    matcher.matchOffer(Clock::now() + Seconds(1), offer);

  AWAIT_READY(matched);

  EXPECT_FALSE(matched->resendThisOffer);
  ASSERT_EQ(2u, matched->opsWithSource.size());
  EXPECT_EQ(2u, matched->launchedTaskInfos().size());

  foreach (const TaskOp& op, matched->ops()) {
    EXPECT_EQ(TaskOp::Type::LAUNCH, op.type);
    EXPECT_EQ(
        InstanceUpdateOperation::Type::LAUNCH_EPHEMERAL,
        op.stateOp.type);
    EXPECT_EQ(InstanceStatus::STAGING, op.newInstance().state.status);
    EXPECT_EQ(createRunSpecId("/app"), op.taskId().runSpecId());
  }

  EXPECT_NONE(validateOfferConsumption(offer, matched->ops()));

  AWAIT_EXPECT_EQ(1u, matcher.queued());

  // A rejected operation puts its instance back into the queue.
  matched->opsWithSource[0].reject("declined");
  matched->opsWithSource[1].accept();

  AWAIT_EXPECT_EQ(2u, matcher.queued());

  Future<vector<Instance>> instances = matcher.instances();
  AWAIT_READY(instances);
  ASSERT_EQ(1u, instances->size());
  EXPECT_EQ(
      matched->opsWithSource[1].op.newInstance().instanceId,
      instances->at(0).instanceId);
}


TEST_F(LaunchQueueMatcherTest, NoMatch)
{
  LaunchQueueMatcher matcher(factory, frameworkId, 5);

  matcher.add(createApp("/big", "cpus:8;mem:128"), 1);
  matcher.add(createApp("/small", "cpus:0.1;mem:16"), 1);

  Future<MatchedTaskOps> matched = matcher.matchOffer(
      Clock::now() + Seconds(1),
      createOffer(createResources("cpus:4;mem:1024")));

  AWAIT_READY(matched);

  // The head of the queue does not fit and nothing overtakes it.
  EXPECT_TRUE(matched->opsWithSource.empty());
  EXPECT_FALSE(matched->resendThisOffer);

  AWAIT_EXPECT_EQ(2u, matcher.queued());
}


TEST_F(LaunchQueueMatcherTest, DeadlinePassed)
{
  Clock::pause();

  LaunchQueueMatcher matcher(factory, frameworkId, 5);

  matcher.add(createApp("/app", "cpus:1;mem:128"), 1);

  Future<MatchedTaskOps> matched = matcher.matchOffer(
      Clock::now() - Seconds(1),
      createOffer(createResources("cpus:4;mem:1024")));

  AWAIT_READY(matched);

  EXPECT_TRUE(matched->opsWithSource.empty());
  EXPECT_TRUE(matched->resendThisOffer);

  AWAIT_EXPECT_EQ(1u, matcher.queued());

  Clock::resume();
}


TEST_F(LaunchQueueMatcherTest, LaunchPod)
{
  LaunchQueueMatcher matcher(factory, frameworkId, 5);

  RunSpec pod(createRunSpecId("/web"), Time::epoch());
  pod.executorResources = createResources("cpus:0.1;mem:32");

  ContainerSpec nginx;
  nginx.name = "nginx";
  nginx.resources = createResources("cpus:0.5;mem:64");
  nginx.command = "nginx";

  ContainerSpec sidecar;
  sidecar.name = "sidecar";
  sidecar.resources = createResources("cpus:0.2;mem:32");
  sidecar.command = "sidecar";

  pod.containers = {nginx, sidecar};

  matcher.add(pod, 1);

  const Offer offer = createOffer(createResources("cpus:1;mem:256"));

  Future<MatchedTaskOps> matched =
    matcher.matchOffer(Clock::now() + Seconds(1), offer);

  AWAIT_READY(matched);
  ASSERT_EQ(1u, matched->opsWithSource.size());

  const TaskOp& op = matched->opsWithSource[0].op;

  EXPECT_EQ(TaskOp::Type::LAUNCH_TASK_GROUP, op.type);
  ASSERT_SOME(op.launchTaskGroup);
  EXPECT_EQ(2, op.launchTaskGroup->groupInfo.tasks_size());
  EXPECT_EQ(
      op.newInstance().instanceId.executorIdString(),
      op.launchTaskGroup->executorInfo.executor_id().value());

  EXPECT_EQ(
      TaskId::forInstance(op.newInstance().instanceId, "nginx"),
      op.taskId());

  EXPECT_EQ(2u, op.newInstance().tasks.size());
  EXPECT_EQ(InstanceStatus::STAGING, op.newInstance().state.status);

  // Task groups are not part of the launched task infos.
  EXPECT_TRUE(matched->launchedTaskInfos().empty());

  EXPECT_EQ(
      createResources("cpus:0.2;mem:128"),
      Resources(op.applyToOffer(offer).resources()));
}


// Resident apps first reserve resources and create their volumes,
// then they are launched on an offer which carries the reservation.
TEST_F(LaunchQueueMatcherTest, LaunchResidentApp)
{
  LaunchQueueMatcher matcher(factory, frameworkId, 5);

  RunSpec app = createApp("/db", "cpus:1;mem:128");

  PersistentVolume volume;
  volume.containerPath = "data";
  volume.size = Megabytes(100);
  volume.mode = Volume::RW;

  app.persistentVolumes.push_back(volume);

  matcher.add(app, 1);

  Future<MatchedTaskOps> reserve = matcher.matchOffer(
      Clock::now() + Seconds(1),
      createOffer(createResources("cpus:4;mem:1024;disk:1024")));

  AWAIT_READY(reserve);
  ASSERT_EQ(1u, reserve->opsWithSource.size());

  const TaskOp& reserveOp = reserve->opsWithSource[0].op;

  EXPECT_EQ(TaskOp::Type::RESERVE_AND_CREATE_VOLUMES, reserveOp.type);
  ASSERT_EQ(2u, reserveOp.offerOperations.size());
  EXPECT_EQ(Offer::Operation::RESERVE, reserveOp.offerOperations[0].type());
  EXPECT_EQ(Offer::Operation::CREATE, reserveOp.offerOperations[1].type());

  const Instance::Id instanceId = reserveOp.newInstance().instanceId;
  const Task::Id taskId = reserveOp.taskId();

  EXPECT_EQ(InstanceStatus::CREATED, reserveOp.newInstance().state.status);
  EXPECT_TRUE(reserveOp.newInstance().tasks.at(taskId).isReserved());

  reserve->opsWithSource[0].accept();

  AWAIT_EXPECT_EQ(0u, matcher.queued());

  // The next offer carries the reservation with the created volume.
  const Resources reserved =
    reserveOp.offerOperations[0].reserve().resources();

  const Resources volumes =
    reserveOp.offerOperations[1].create().volumes();

  const Resources offered =
    reserved - reserved.get("disk") + volumes +
    createResources("cpus:2;mem:512");

  Future<MatchedTaskOps> launch = matcher.matchOffer(
      Clock::now() + Seconds(1),
      createOffer(offered, "offer-2"));

  AWAIT_READY(launch);
  ASSERT_EQ(1u, launch->opsWithSource.size());

  const TaskOp& launchOp = launch->opsWithSource[0].op;

  EXPECT_EQ(TaskOp::Type::LAUNCH, launchOp.type);
  EXPECT_EQ(
      InstanceUpdateOperation::Type::LAUNCH_ON_RESERVATION,
      launchOp.stateOp.type);

  // The reserved task is launched with its original id.
  EXPECT_EQ(taskId, launchOp.taskId());
  EXPECT_EQ(instanceId, launchOp.newInstance().instanceId);
  EXPECT_EQ(InstanceStatus::STAGING, launchOp.newInstance().state.status);
  ASSERT_SOME(launchOp.oldInstance);
  EXPECT_EQ(instanceId, launchOp.oldInstance->instanceId);

  // Only the reserved resources are used.
  EXPECT_EQ(
      createResources("cpus:2;mem:512"),
      Resources(launchOp.applyToOffer(createOffer(offered)).resources()));

  foreach (const Resource& resource, launchOp.requiredResources()) {
    EXPECT_TRUE(hasReservationLabel(
        resource, INSTANCE_ID_LABEL, instanceId.value()));
  }

  launch->opsWithSource[0].accept();

  Future<vector<Instance>> instances = matcher.instances();
  AWAIT_READY(instances);
  ASSERT_EQ(1u, instances->size());
  EXPECT_EQ(instanceId, instances->at(0).instanceId);
  EXPECT_EQ(InstanceStatus::STAGING, instances->at(0).state.status);
}


TEST_F(LaunchQueueMatcherTest, LaunchResidentAppOnMountDisk)
{
  LaunchQueueMatcher matcher(factory, frameworkId, 5);

  RunSpec app = createApp("/db", "cpus:1;mem:128");

  Resource::DiskInfo::Source source;
  source.set_type(Resource::DiskInfo::Source::MOUNT);
  source.mutable_mount()->set_root("/mnt/disk1");

  PersistentVolume volume;
  volume.containerPath = "data";
  volume.size = Megabytes(100);
  volume.source = source;

  app.persistentVolumes.push_back(volume);

  matcher.add(app, 1);

  const Resource mount = createMountDisk(200, "/mnt/disk1");

  const Offer offer =
    createOffer(createResources("cpus:4;mem:1024;disk:1024") + mount);

  Future<MatchedTaskOps> matched =
    matcher.matchOffer(Clock::now() + Seconds(1), offer);

  AWAIT_READY(matched);
  ASSERT_EQ(1u, matched->opsWithSource.size());

  const TaskOp& op = matched->opsWithSource[0].op;

  EXPECT_EQ(TaskOp::Type::RESERVE_AND_CREATE_VOLUMES, op.type);
  ASSERT_EQ(2u, op.offerOperations.size());
  EXPECT_EQ(Offer::Operation::RESERVE, op.offerOperations[0].type());
  EXPECT_EQ(Offer::Operation::CREATE, op.offerOperations[1].type());

  const Resources reserved = op.offerOperations[0].reserve().resources();

  ASSERT_EQ(1, op.offerOperations[1].create().volumes_size());
  const Resource& created = op.offerOperations[1].create().volumes(0);

  // The whole MOUNT disk is reserved and the volume is created on it.
  ASSERT_TRUE(created.disk().has_source());
  EXPECT_EQ("/mnt/disk1", created.disk().source().mount().root());
  EXPECT_EQ(200, created.scalar().value());
  EXPECT_TRUE(reserved.contains(volumeBacking(created)));

  // The root disk is left alone.
  EXPECT_EQ(1u, reserved.get("disk").size());

  EXPECT_NONE(validateOfferConsumption(offer, matched->ops()));

  EXPECT_EQ(
      createResources("cpus:3;mem:896;disk:1024"),
      Resources(op.applyToOffer(offer).resources()));
}


TEST_F(LaunchQueueMatcherTest, MountDiskTooSmall)
{
  LaunchQueueMatcher matcher(factory, frameworkId, 5);

  RunSpec app = createApp("/db", "cpus:1;mem:128");

  Resource::DiskInfo::Source source;
  source.set_type(Resource::DiskInfo::Source::MOUNT);
  source.mutable_mount()->set_root("/mnt/disk1");

  PersistentVolume volume;
  volume.containerPath = "data";
  volume.size = Megabytes(300);
  volume.source = source;

  app.persistentVolumes.push_back(volume);

  matcher.add(app, 1);

  Future<MatchedTaskOps> matched = matcher.matchOffer(
      Clock::now() + Seconds(1),
      createOffer(createResources("cpus:4;mem:1024;disk:1024") +
                  createMountDisk(200, "/mnt/disk1")));

  AWAIT_READY(matched);
  EXPECT_TRUE(matched->opsWithSource.empty());

  AWAIT_EXPECT_EQ(1u, matcher.queued());
}


TEST_F(LaunchQueueMatcherTest, ResidentAppWithoutRole)
{
  const TaskOpFactory anonymous(None(), None());

  LaunchQueueMatcher matcher(anonymous, frameworkId, 5);

  RunSpec resident = createApp("/db", "cpus:1;mem:128");

  PersistentVolume volume;
  volume.containerPath = "data";
  volume.size = Megabytes(100);

  resident.persistentVolumes.push_back(volume);

  // Without a principal and a role the resident app can never be
  // placed, so it is not queued and does not hold up the app behind.
  matcher.add(resident, 1);
  matcher.add(createApp("/web", "cpus:1;mem:128"), 1);

  AWAIT_EXPECT_EQ(1u, matcher.queued());

  Future<MatchedTaskOps> matched = matcher.matchOffer(
      Clock::now() + Seconds(1),
      createOffer(createResources("cpus:4;mem:1024;disk:1024")));

  AWAIT_READY(matched);
  ASSERT_EQ(1u, matched->opsWithSource.size());

  const TaskOp& op = matched->opsWithSource[0].op;

  EXPECT_EQ(TaskOp::Type::LAUNCH, op.type);
  EXPECT_EQ(createRunSpecId("/web"), op.taskId().runSpecId());

  AWAIT_EXPECT_EQ(0u, matcher.queued());
}

} // namespace tests {
} // namespace internal {
} // namespace stride {
