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

#ifndef __MATCHER_LAUNCH_QUEUE_MATCHER_HPP__
#define __MATCHER_LAUNCH_QUEUE_MATCHER_HPP__

#include <stddef.h>

#include <vector>

#include <stride/stride.hpp>

#include <process/future.hpp>
#include <process/time.hpp>

#include "instance/instance.hpp"
#include "instance/run_spec.hpp"

#include "launcher/task_op_factory.hpp"

#include "matcher/offer_matcher.hpp"

namespace stride {
namespace internal {

// Forward declarations.
class LaunchQueueMatcherProcess;


// An offer matcher which launches queued instances of run specs.
// Apps are launched as single tasks, pods as task groups. Apps with
// persistent volumes first reserve resources and create their volumes,
// then they are launched on the reservation once an offer carries it.
class LaunchQueueMatcher : public OfferMatcher
{
public:
  LaunchQueueMatcher(
      const TaskOpFactory& factory,
      const FrameworkID& frameworkId,
      size_t maxTasksPerOffer);

  ~LaunchQueueMatcher() override;

  // Queues 'count' new instances of the run spec.
  void add(const RunSpec& runSpec, size_t count);

  process::Future<MatchedTaskOps> matchOffer(
      const process::Time& deadline,
      const Offer& offer) override;

  // Instances which were accepted by the cluster manager, including
  // the ones only holding a reservation.
  process::Future<std::vector<Instance>> instances();

  // Number of instances waiting for an offer to launch on.
  process::Future<size_t> queued();

private:
  LaunchQueueMatcher(const LaunchQueueMatcher&) = delete;
  LaunchQueueMatcher& operator=(const LaunchQueueMatcher&) = delete;

  LaunchQueueMatcherProcess* process;
};

} // namespace internal {
} // namespace stride {

#endif // __MATCHER_LAUNCH_QUEUE_MATCHER_HPP__
