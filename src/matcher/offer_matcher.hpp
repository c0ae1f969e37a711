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

#ifndef __MATCHER_OFFER_MATCHER_HPP__
#define __MATCHER_OFFER_MATCHER_HPP__

#include <atomic>
#include <memory>
#include <string>
#include <vector>

#include <stride/stride.hpp>

#include <process/future.hpp>
#include <process/time.hpp>

#include <stout/error.hpp>
#include <stout/hashmap.hpp>
#include <stout/lambda.hpp>
#include <stout/option.hpp>

#include "instance/instance.hpp"

#include "matcher/task_op.hpp"

namespace stride {
namespace internal {

// The originator of a task operation. It is told whether the
// operation was ultimately submitted to the cluster manager or
// rejected (e.g., because of a timeout or throttling).
struct TaskOpSource
{
  TaskOpSource(
      const lambda::function<void(const TaskOp&)>& _accepted,
      const lambda::function<
          void(const TaskOp&, const std::string&)>& _rejected)
    : accepted(_accepted), rejected(_rejected) {}

  lambda::function<void(const TaskOp&)> accepted;
  lambda::function<void(const TaskOp&, const std::string&)> rejected;
};


// A task operation together with its source. The outcome has to be
// delivered exactly once through 'accept' or 'reject'; copies share
// that obligation, and a second delivery is fatal.
class TaskOpWithSource
{
public:
  TaskOpWithSource(const TaskOpSource& _source, const TaskOp& _op)
    : source(_source),
      op(_op),
      delivered(new std::atomic_bool(false)) {}

  Task::Id taskId() const { return op.taskId(); }

  void accept() const;
  void reject(const std::string& reason) const;

  TaskOpSource source;
  TaskOp op;

private:
  void deliver() const;

  std::shared_ptr<std::atomic_bool> delivered;
};


// The reply of an offer matcher for one offer. No operations is a
// normal "no match". 'resendThisOffer' is set when the offer could
// not be processed completely (e.g., on a timeout) and should be
// offered again.
struct MatchedTaskOps
{
  MatchedTaskOps(
      const OfferID& _offerId,
      const std::vector<TaskOpWithSource>& _opsWithSource,
      bool _resendThisOffer = false)
    : offerId(_offerId),
      opsWithSource(_opsWithSource),
      resendThisOffer(_resendThisOffer) {}

  // All included operations without their source.
  std::vector<TaskOp> ops() const;

  // The task infos of all LAUNCH operations.
  std::vector<TaskInfo> launchedTaskInfos() const;

  // The state of every affected task after the operations have been
  // applied. Later operations win.
  hashmap<Task::Id, Task> tasks() const;

  OfferID offerId;
  std::vector<TaskOpWithSource> opsWithSource;
  bool resendThisOffer;
};


// Matches offers against pending work.
class OfferMatcher
{
public:
  virtual ~OfferMatcher() {}

  // Processes the offer and returns the operations the matcher wants
  // to execute on it. For every returned operation the matcher can
  // expect either an 'accepted' or a 'rejected' call on its source.
  // The matcher should stop matching once 'deadline' has passed.
  virtual process::Future<MatchedTaskOps> matchOffer(
      const process::Time& deadline,
      const Offer& offer) = 0;
};


// Asks the matcher to match the offer and enforces the deadline: if
// the matcher has not replied by then the result has no operations
// and 'resendThisOffer' is set. Operations the matcher returns after
// the deadline are rejected. A failed or discarded match is treated
// the same way as a timeout.
process::Future<MatchedTaskOps> matchOfferBefore(
    OfferMatcher* matcher,
    const process::Time& deadline,
    const Offer& offer);


// Applies the operations to the offer one after the other and
// returns an error for the first operation whose resources are not
// available in what is left of the offer.
Option<Error> validateOfferConsumption(
    const Offer& offer,
    const std::vector<TaskOp>& ops);

} // namespace internal {
} // namespace stride {

#endif // __MATCHER_OFFER_MATCHER_HPP__
