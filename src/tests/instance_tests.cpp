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

#include <process/clock.hpp>
#include <process/gtest.hpp>
#include <process/time.hpp>

#include <stout/foreach.hpp>
#include <stout/gtest.hpp>
#include <stout/nothing.hpp>
#include <stout/strings.hpp>

#include "instance/ids.hpp"
#include "instance/instance.hpp"

#include "tests/stride.hpp"

using process::Clock;
using process::Time;

using std::string;
using std::vector;

namespace stride {
namespace internal {
namespace tests {

TEST(IdsTest, RunSpecId)
{
  Try<RunSpecId> runSpecId = RunSpecId::parse("/prod/db");
  ASSERT_SOME(runSpecId);
  EXPECT_EQ("/prod/db", runSpecId->path());
  EXPECT_EQ("prod_db", runSpecId->safePath());

  EXPECT_SOME_EQ(runSpecId.get(), RunSpecId::fromSafePath("prod_db"));

  EXPECT_ERROR(RunSpecId::parse("prod/db"));
  EXPECT_ERROR(RunSpecId::parse("/"));
  EXPECT_ERROR(RunSpecId::parse("/prod//db"));
  EXPECT_ERROR(RunSpecId::parse("/prod/db/"));
  EXPECT_ERROR(RunSpecId::parse("/Prod"));
  EXPECT_ERROR(RunSpecId::parse("/prod.db"));
  EXPECT_ERROR(RunSpecId::parse("/prod_db"));
}


TEST(IdsTest, InstanceId)
{
  const RunSpecId runSpecId = createRunSpecId("/prod/db");
  const InstanceId instanceId = InstanceId::forRunSpec(runSpecId);

  EXPECT_TRUE(strings::startsWith(instanceId.value(), "prod_db.instance-"));
  EXPECT_EQ(runSpecId, instanceId.runSpecId());
  EXPECT_EQ("instance-" + instanceId.value(), instanceId.executorIdString());

  // Every instance gets a new id.
  EXPECT_NE(instanceId, InstanceId::forRunSpec(runSpecId));

  Try<InstanceId> parsed = InstanceId::parse(instanceId.value());
  ASSERT_SOME(parsed);
  EXPECT_EQ(instanceId, parsed.get());
  EXPECT_EQ(instanceId.uuid(), parsed->uuid());

  EXPECT_ERROR(InstanceId::parse("prod_db.1234"));
  EXPECT_ERROR(InstanceId::parse("prod_db.instance-"));
}


TEST(IdsTest, AppTaskId)
{
  const InstanceId instanceId =
    InstanceId::forRunSpec(createRunSpecId("/prod/db"));

  const TaskId taskId = TaskId::forInstance(instanceId);

  EXPECT_EQ("prod_db." + instanceId.uuid(), taskId.value());
  EXPECT_EQ(instanceId, taskId.instanceId());
  EXPECT_NONE(taskId.containerName());

  Try<TaskId> parsed = TaskId::parse(taskId.toTaskID());
  ASSERT_SOME(parsed);
  EXPECT_EQ(taskId, parsed.get());
  EXPECT_EQ(instanceId, parsed->instanceId());
}


TEST(IdsTest, PodTaskId)
{
  const InstanceId instanceId =
    InstanceId::forRunSpec(createRunSpecId("/prod/web"));

  const TaskId taskId = TaskId::forInstance(instanceId, "nginx");

  EXPECT_EQ(instanceId.value() + ".nginx", taskId.value());
  EXPECT_SOME_EQ("nginx", taskId.containerName());

  Try<TaskId> parsed = TaskId::parse(taskId.value());
  ASSERT_SOME(parsed);
  EXPECT_EQ(instanceId, parsed->instanceId());
  EXPECT_SOME_EQ("nginx", parsed->containerName());

  EXPECT_ERROR(TaskId::parse(instanceId.value()));
  EXPECT_ERROR(TaskId::parse(instanceId.value() + "."));
  EXPECT_ERROR(TaskId::parse("prod_web"));
}


TEST(IdsTest, LocalVolumeId)
{
  const RunSpecId runSpecId = createRunSpecId("/prod/db");
  const LocalVolumeId volumeId = LocalVolumeId::forVolume(runSpecId, "data");

  EXPECT_EQ("prod_db#data#" + volumeId.uuid(), volumeId.idString());

  Try<LocalVolumeId> parsed = LocalVolumeId::parse(volumeId.idString());
  ASSERT_SOME(parsed);
  EXPECT_EQ(volumeId, parsed.get());
  EXPECT_EQ(runSpecId, parsed->runSpecId());
  EXPECT_EQ("data", parsed->containerPath());

  EXPECT_ERROR(LocalVolumeId::parse("prod_db#data"));
}


class InstanceStateTest : public ::testing::Test
{
protected:
  void SetUp() override
  {
    Clock::pause();
  }

  void TearDown() override
  {
    Clock::resume();
  }

  InstanceState initial() const
  {
    return InstanceState(
        InstanceStatus::CREATED,
        Time::epoch(),
        None(),
        None(),
        Time::epoch());
  }

  InstanceStatus aggregate(const vector<InstanceStatus>& statuses) const
  {
    return newInstanceState(initial(), statuses, Clock::now(), Time::epoch())
      .status;
  }
};


TEST_F(InstanceStateTest, AllCreated)
{
  EXPECT_EQ(
      InstanceStatus::CREATED,
      aggregate({InstanceStatus::CREATED,
                 InstanceStatus::CREATED,
                 InstanceStatus::CREATED}));
}


TEST_F(InstanceStateTest, OneStaging)
{
  EXPECT_EQ(
      InstanceStatus::STAGING,
      aggregate({InstanceStatus::CREATED,
                 InstanceStatus::CREATED,
                 InstanceStatus::STAGING}));
}


TEST_F(InstanceStateTest, FailedWins)
{
  EXPECT_EQ(
      InstanceStatus::FAILED,
      aggregate({InstanceStatus::STAGING,
                 InstanceStatus::STARTING,
                 InstanceStatus::RUNNING,
                 InstanceStatus::KILLING,
                 InstanceStatus::FINISHED,
                 InstanceStatus::FAILED}));
}


TEST_F(InstanceStateTest, ErrorWins)
{
  EXPECT_EQ(
      InstanceStatus::ERROR,
      aggregate({InstanceStatus::STAGING,
                 InstanceStatus::STARTING,
                 InstanceStatus::RUNNING,
                 InstanceStatus::KILLING,
                 InstanceStatus::FINISHED,
                 InstanceStatus::FAILED,
                 InstanceStatus::ERROR}));
}


TEST_F(InstanceStateTest, GoneAndDropped)
{
  EXPECT_EQ(
      InstanceStatus::GONE,
      aggregate({InstanceStatus::RUNNING,
                 InstanceStatus::GONE,
                 InstanceStatus::DROPPED}));

  EXPECT_EQ(
      InstanceStatus::DROPPED,
      aggregate({InstanceStatus::UNREACHABLE, InstanceStatus::DROPPED}));
}


TEST_F(InstanceStateTest, Killing)
{
  EXPECT_EQ(
      InstanceStatus::KILLING,
      aggregate({InstanceStatus::RUNNING,
                 InstanceStatus::KILLING,
                 InstanceStatus::KILLED}));

  const InstanceState killing = newInstanceState(
      initial(),
      {InstanceStatus::RUNNING, InstanceStatus::KILLING},
      Clock::now(),
      Time::epoch());

  ASSERT_EQ(InstanceStatus::KILLING, killing.status);

  const InstanceState killed = newInstanceState(
      killing,
      {InstanceStatus::KILLED, InstanceStatus::KILLED},
      Clock::now(),
      Time::epoch());

  EXPECT_EQ(InstanceStatus::KILLED, killed.status);
  EXPECT_TRUE(isTerminal(killed.status));
}


TEST_F(InstanceStateTest, AllFinished)
{
  EXPECT_EQ(
      InstanceStatus::FINISHED,
      aggregate({InstanceStatus::FINISHED, InstanceStatus::FINISHED}));

  // A single unfinished task decides.
  EXPECT_EQ(
      InstanceStatus::RUNNING,
      aggregate({InstanceStatus::FINISHED, InstanceStatus::RUNNING}));
}


// For any set of unfinished statuses the most severe one wins.
TEST_F(InstanceStateTest, SeverityOrder)
{
  const vector<InstanceStatus> order = {
    InstanceStatus::ERROR,
    InstanceStatus::FAILED,
    InstanceStatus::GONE,
    InstanceStatus::DROPPED,
    InstanceStatus::UNREACHABLE,
    InstanceStatus::KILLING,
    InstanceStatus::KILLED,
    InstanceStatus::STAGING,
    InstanceStatus::STARTING,
    InstanceStatus::RUNNING,
    InstanceStatus::CREATED
  };

  // Every non-empty subset of the order, each one also followed by
  // a FINISHED status which never changes the result.
  for (size_t subset = 1; subset < (1u << order.size()); subset++) {
    vector<InstanceStatus> statuses;
    Option<InstanceStatus> expected;

    for (size_t i = 0; i < order.size(); i++) {
      if (subset & (1u << i)) {
        statuses.push_back(order[i]);
        if (expected.isNone()) {
          expected = order[i];
        }
      }
    }

    ASSERT_SOME(expected);
    EXPECT_EQ(expected.get(), aggregate(statuses));

    // The input order does not matter.
    vector<InstanceStatus> reversed(statuses.rbegin(), statuses.rend());
    reversed.push_back(InstanceStatus::FINISHED);
    EXPECT_EQ(expected.get(), aggregate(reversed));
  }
}


TEST_F(InstanceStateTest, Idempotent)
{
  const vector<InstanceStatus> statuses = {
    InstanceStatus::RUNNING,
    InstanceStatus::STAGING
  };

  const InstanceState once =
    newInstanceState(initial(), statuses, Clock::now(), Time::epoch());

  Clock::advance(Seconds(10));

  const InstanceState twice =
    newInstanceState(once, statuses, Clock::now(), Time::epoch());

  EXPECT_EQ(once, twice);
}


TEST_F(InstanceStateTest, EmptyStatusesKeepPreviousState)
{
  const InstanceState previous = initial();

  Clock::advance(Seconds(10));

  EXPECT_EQ(
      previous,
      newInstanceState(previous, {}, Clock::now(), Clock::now()));
}


TEST_F(InstanceStateTest, SinceOnlyMovesOnChange)
{
  const Time start = Clock::now();

  const InstanceState staging = newInstanceState(
      initial(), {InstanceStatus::STAGING}, start, Time::epoch());

  EXPECT_EQ(start, staging.since);
  EXPECT_NONE(staging.activeSince);

  Clock::advance(Seconds(5));

  const InstanceState running = newInstanceState(
      staging, {InstanceStatus::RUNNING}, Clock::now(), Time::epoch());

  EXPECT_EQ(InstanceStatus::RUNNING, running.status);
  EXPECT_EQ(Clock::now(), running.since);
  EXPECT_SOME_EQ(Clock::now(), running.activeSince);

  const Time runningSince = Clock::now();

  Clock::advance(Seconds(5));

  InstanceState healthy = running;
  healthy.healthy = true;

  const InstanceState stillRunning = newInstanceState(
      healthy, {InstanceStatus::RUNNING}, Clock::now(), Time::epoch());

  EXPECT_EQ(runningSince, stillRunning.since);
  EXPECT_SOME_EQ(runningSince, stillRunning.activeSince);
  EXPECT_SOME_TRUE(stillRunning.healthy);

  // Health is cleared once the instance is no longer running, the
  // time it became active is kept.
  const InstanceState killing = newInstanceState(
      stillRunning, {InstanceStatus::KILLING}, Clock::now(), Time::epoch());

  EXPECT_EQ(Clock::now(), killing.since);
  EXPECT_NONE(killing.healthy);
  EXPECT_SOME_EQ(runningSince, killing.activeSince);
}


TEST_F(InstanceStateTest, UpdateTaskStatus)
{
  Instance instance = createInstance(
      createRunSpecId("/prod/web"),
      {InstanceStatus::STAGING, InstanceStatus::STAGING});

  ASSERT_EQ(InstanceStatus::STAGING, instance.state.status);
  EXPECT_TRUE(instance.isLaunched());

  vector<Task::Id> taskIds;
  foreachkey (const Task::Id& taskId, instance.tasks) {
    taskIds.push_back(taskId);
  }

  ASSERT_EQ(2u, taskIds.size());

  EXPECT_SOME(instance.updateTaskStatus(
      taskIds[0], InstanceStatus::RUNNING, Clock::now()));

  EXPECT_EQ(InstanceStatus::STAGING, instance.state.status);

  EXPECT_SOME(instance.updateTaskStatus(
      taskIds[1], InstanceStatus::RUNNING, Clock::now()));

  EXPECT_EQ(InstanceStatus::RUNNING, instance.state.status);
  EXPECT_EQ(InstanceStatus::RUNNING, instance.tasks.at(taskIds[1]).status);

  EXPECT_SOME(instance.updateTaskStatus(
      taskIds[0], InstanceStatus::FINISHED, Clock::now()));

  EXPECT_SOME(instance.updateTaskStatus(
      taskIds[1], InstanceStatus::FINISHED, Clock::now()));

  EXPECT_EQ(InstanceStatus::FINISHED, instance.state.status);
  EXPECT_TRUE(instance.isTerminal());
  EXPECT_FALSE(instance.isLaunched());

  // Updates of tasks of other instances are rejected.
  const Instance other = createInstance(
      createRunSpecId("/prod/web"), {InstanceStatus::RUNNING});

  EXPECT_ERROR(instance.updateTaskStatus(
      other.tasks.begin()->first, InstanceStatus::FAILED, Clock::now()));
}


TEST_F(InstanceStateTest, InstanceFromTask)
{
  const InstanceId instanceId =
    InstanceId::forRunSpec(createRunSpecId("/prod/db"));

  const Task task = createTask(
      TaskId::forInstance(instanceId), InstanceStatus::STAGING);

  const Instance instance(task);

  EXPECT_EQ(instanceId, instance.instanceId);
  EXPECT_EQ(InstanceStatus::STAGING, instance.state.status);
  ASSERT_EQ(1u, instance.tasks.size());
  EXPECT_TRUE(instance.tasks.contains(task.taskId));
}


TEST(InstanceStatusTest, Terminal)
{
  EXPECT_TRUE(isTerminal(InstanceStatus::KILLED));
  EXPECT_TRUE(isTerminal(InstanceStatus::FINISHED));
  EXPECT_TRUE(isTerminal(InstanceStatus::FAILED));
  EXPECT_TRUE(isTerminal(InstanceStatus::ERROR));
  EXPECT_TRUE(isTerminal(InstanceStatus::GONE));
  EXPECT_TRUE(isTerminal(InstanceStatus::DROPPED));

  EXPECT_FALSE(isTerminal(InstanceStatus::CREATED));
  EXPECT_FALSE(isTerminal(InstanceStatus::RUNNING));
  EXPECT_FALSE(isTerminal(InstanceStatus::KILLING));
  EXPECT_FALSE(isTerminal(InstanceStatus::UNREACHABLE));
}

} // namespace tests {
} // namespace internal {
} // namespace stride {
