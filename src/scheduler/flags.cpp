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

#include "scheduler/flags.hpp"

#include <stout/error.hpp>
#include <stout/none.hpp>

using std::string;


stride::internal::scheduler::Flags::Flags()
{
  add(&Flags::principal,
      "principal",
      "The principal used when reserving resources and creating\n"
      "persistent volumes.");

  add(&Flags::role,
      "role",
      "The role resources are reserved for. Without a role apps with\n"
      "persistent volumes cannot be placed.",
      [](const Option<string>& value) -> Option<Error> {
        if (value.isSome() && (value.get().empty() || value.get() == "*")) {
          return Error("The role '" + value.get() + "' cannot be reserved");
        }
        return None();
      });

  add(&Flags::framework_id,
      "framework_id",
      "The framework id assigned by the cluster manager.");

  add(&Flags::offer_matching_timeout,
      "offer_matching_timeout",
      "The time an offer matcher has to match an offer. Offers which\n"
      "are not matched in time are resent.",
      Seconds(1));

  add(&Flags::max_tasks_per_offer,
      "max_tasks_per_offer",
      "The maximum number of instances launched on a single offer.",
      5,
      [](size_t value) -> Option<Error> {
        if (value == 0) {
          return Error("Expected --max_tasks_per_offer to be positive");
        }
        return None();
      });
}
