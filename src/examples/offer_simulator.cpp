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

#include <iostream>
#include <string>
#include <vector>

#include <glog/logging.h>

#include <stride/resources.hpp>
#include <stride/stride.hpp>

#include <process/clock.hpp>
#include <process/future.hpp>
#include <process/time.hpp>

#include <stout/exit.hpp>
#include <stout/flags.hpp>
#include <stout/foreach.hpp>
#include <stout/option.hpp>
#include <stout/path.hpp>
#include <stout/try.hpp>

#include "instance/ids.hpp"
#include "instance/instance.hpp"
#include "instance/run_spec.hpp"

#include "launcher/task_op_factory.hpp"

#include "logging/logging.hpp"

#include "matcher/launch_queue_matcher.hpp"
#include "matcher/offer_matcher.hpp"

#include "scheduler/flags.hpp"

using namespace stride;
using namespace stride::internal;

using process::Clock;
using process::Future;

using std::cerr;
using std::cout;
using std::endl;
using std::string;
using std::vector;


void usage(const char* argv0, const flags::FlagsBase& flags)
{
  cerr << "Usage: " << Path(argv0).basename() << " [...]" << endl
       << endl
       << "Supported options:" << endl
       << flags.usage();
}


class Flags : public virtual scheduler::Flags
{
public:
  Flags()
  {
    add(&Flags::offer,
        "offer",
        "Resources of the simulated offer.",
        "cpus:4;mem:4096;disk:8192;ports:[31000-31100]");

    add(&Flags::hostname,
        "hostname",
        "Hostname of the agent making the offer.",
        "agent-1.example.com");

    add(&Flags::app,
        "app",
        "Id of the simulated app.",
        "/simulated/app");

    add(&Flags::app_resources,
        "app_resources",
        "Resources of one instance of the app.",
        "cpus:0.5;mem:256");

    add(&Flags::instances,
        "instances",
        "Number of instances of the app to launch.",
        3);
  }

  string offer;
  string hostname;
  string app;
  string app_resources;
  size_t instances;
};


int main(int argc, char** argv)
{
  Flags flags;

  Try<flags::Warnings> load = flags.load("STRIDE_", argc, argv);

  if (load.isError()) {
    cerr << load.error() << endl;
    usage(argv[0], flags);
    exit(EXIT_FAILURE);
  }

  logging::initialize(argv[0], true, flags); // Catch signals.

  // Log any flag warnings (after logging is initialized).
  foreach (const flags::Warning& warning, load->warnings) {
    LOG(WARNING) << warning.message;
  }

  Try<Resources> offered = Resources::parse(flags.offer);
  if (offered.isError()) {
    EXIT(EXIT_FAILURE) << "Invalid --offer: " << offered.error();
  }

  Try<Resources> appResources = Resources::parse(flags.app_resources);
  if (appResources.isError()) {
    EXIT(EXIT_FAILURE) << "Invalid --app_resources: " << appResources.error();
  }

  Try<RunSpecId> runSpecId = RunSpecId::parse(flags.app);
  if (runSpecId.isError()) {
    EXIT(EXIT_FAILURE) << "Invalid --app: " << runSpecId.error();
  }

  FrameworkID frameworkId;
  frameworkId.set_value(flags.framework_id.getOrElse("stride-simulator"));

  Offer offer;
  offer.mutable_id()->set_value("offer-1");
  offer.mutable_framework_id()->CopyFrom(frameworkId);
  offer.mutable_agent_id()->set_value("agent-1");
  offer.set_hostname(flags.hostname);
  offer.mutable_resources()->CopyFrom(offered.get());

  RunSpec runSpec(runSpecId.get(), Clock::now());
  runSpec.resources = appResources.get();
  runSpec.command = "sleep 1000";

  TaskOpFactory factory(flags.principal, flags.role);
  LaunchQueueMatcher matcher(factory, frameworkId, flags.max_tasks_per_offer);

  matcher.add(runSpec, flags.instances);

  Future<MatchedTaskOps> matched = matchOfferBefore(
      &matcher,
      Clock::now() + flags.offer_matching_timeout,
      offer);

  matched.await();

  if (!matched.isReady()) {
    EXIT(EXIT_FAILURE) << "Failed to match offer " << offer.id();
  }

  Option<Error> error = validateOfferConsumption(offer, matched->ops());
  if (error.isSome()) {
    EXIT(EXIT_FAILURE) << error->message;
  }

  Offer remaining = offer;
  foreach (const TaskOpWithSource& opWithSource, matched->opsWithSource) {
    LOG(INFO) << "Submitting " << opWithSource.op;

    foreach (const Offer::Operation& operation,
             opWithSource.op.offerOperations) {
      VLOG(1) << operation.DebugString();
    }

    remaining = opWithSource.op.applyToOffer(remaining);
    opWithSource.accept();
  }

  if (matched->resendThisOffer) {
    LOG(WARNING) << "Offer " << offer.id() << " was not matched completely";
  }

  LOG(INFO) << "Remaining resources of offer " << offer.id() << ": "
            << Resources(remaining.resources());

  Future<vector<Instance>> instances = matcher.instances();
  instances.await();

  if (!instances.isReady()) {
    EXIT(EXIT_FAILURE) << "Failed to get the launched instances";
  }

  foreach (const Instance& instance, instances.get()) {
    cout << instance << endl;
  }

  Future<size_t> queued = matcher.queued();
  queued.await();

  cout << instances->size() << " instance(s) launched, "
       << (queued.isReady() ? queued.get() : 0) << " still queued" << endl;

  return EXIT_SUCCESS;
}
