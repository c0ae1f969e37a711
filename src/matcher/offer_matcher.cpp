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

#include "matcher/offer_matcher.hpp"

#include <algorithm>
#include <string>
#include <vector>

#include <glog/logging.h>

#include <process/clock.hpp>

#include <stout/check.hpp>
#include <stout/duration.hpp>
#include <stout/foreach.hpp>
#include <stout/none.hpp>
#include <stout/stringify.hpp>

#include <stride/resources.hpp>

using std::string;
using std::vector;

using process::Clock;
using process::Future;
using process::Time;

namespace stride {
namespace internal {

void TaskOpWithSource::deliver() const
{
  CHECK(!delivered->exchange(true))
    << "The outcome of " << op << " has already been delivered";
}


void TaskOpWithSource::accept() const
{
  deliver();
  source.accepted(op);
}


void TaskOpWithSource::reject(const string& reason) const
{
  deliver();
  source.rejected(op, reason);
}


vector<TaskOp> MatchedTaskOps::ops() const
{
  vector<TaskOp> result;
  foreach (const TaskOpWithSource& opWithSource, opsWithSource) {
    result.push_back(opWithSource.op);
  }
  return result;
}


vector<TaskInfo> MatchedTaskOps::launchedTaskInfos() const
{
  vector<TaskInfo> result;
  foreach (const TaskOpWithSource& opWithSource, opsWithSource) {
    if (opWithSource.op.type == TaskOp::Type::LAUNCH) {
      CHECK_SOME(opWithSource.op.launch);
      result.push_back(opWithSource.op.launch->taskInfo);
    }
  }
  return result;
}


hashmap<Task::Id, Task> MatchedTaskOps::tasks() const
{
  hashmap<Task::Id, Task> result;
  foreach (const TaskOpWithSource& opWithSource, opsWithSource) {
    const Task::Id taskId = opWithSource.op.taskId();
    const Instance& instance = opWithSource.op.newInstance();

    CHECK(instance.tasks.contains(taskId))
      << "Instance " << instance.instanceId << " has no task " << taskId;

    result.put(taskId, instance.tasks.at(taskId));
  }
  return result;
}


static void rejectAll(const MatchedTaskOps& matched, const string& reason)
{
  foreach (const TaskOpWithSource& opWithSource, matched.opsWithSource) {
    LOG(WARNING) << "Rejecting " << opWithSource.op
                 << " for offer " << matched.offerId << ": " << reason;
    opWithSource.reject(reason);
  }
}


Future<MatchedTaskOps> matchOfferBefore(
    OfferMatcher* matcher,
    const Time& deadline,
    const Offer& offer)
{
  const OfferID offerId = offer.id();

  const Duration timeout = std::max(Duration::zero(), deadline - Clock::now());

  return matcher->matchOffer(deadline, offer)
    .after(timeout, [=](const Future<MatchedTaskOps>& future) {
      LOG(WARNING) << "Matching offer " << offerId << " did not finish within "
                   << timeout << "; resending the offer";

      // Whatever the matcher still returns can no longer be submitted.
      future.onReady(lambda::bind(
          &rejectAll, lambda::_1, "offer matching timed out"));

      Future<MatchedTaskOps> pending = future;
      pending.discard();

      return Future<MatchedTaskOps>(
          MatchedTaskOps(offerId, vector<TaskOpWithSource>(), true));
    })
    .repair([=](const Future<MatchedTaskOps>& future) {
      LOG(WARNING) << "Matching offer " << offerId << " "
                   << (future.isFailed() ? "failed: " + future.failure()
                                         : string("was discarded"))
                   << "; resending the offer";

      return MatchedTaskOps(offerId, vector<TaskOpWithSource>(), true);
    });
}


Option<Error> validateOfferConsumption(
    const Offer& offer,
    const vector<TaskOp>& ops)
{
  Offer remaining = offer;

  foreach (const TaskOp& op, ops) {
    const Resources required = op.requiredResources();

    if (!Resources(remaining.resources()).contains(required)) {
      return Error(
          "Offer " + stringify(offer.id()) + " is overcommitted by " +
          stringify(op) + ": requires " + stringify(required) +
          " but only " + stringify(Resources(remaining.resources())) +
          " remain");
    }

    remaining = op.applyToOffer(remaining);
  }

  return None();
}

} // namespace internal {
} // namespace stride {
