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

#include "common/protobuf_utils.hpp"

#include <string>
#include <vector>

#include <stout/foreach.hpp>

using std::string;
using std::vector;

namespace stride {
namespace internal {
namespace protobuf {

Label createLabel(const string& key, const Option<string>& value)
{
  Label label;
  label.set_key(key);
  if (value.isSome()) {
    label.set_value(value.get());
  }
  return label;
}


Option<string> getLabel(const Labels& labels, const string& key)
{
  foreach (const Label& label, labels.labels()) {
    if (label.key() == key && label.has_value()) {
      return label.value();
    }
  }

  return None();
}


Resource::ReservationInfo createReservationInfo(
    const string& principal,
    const Labels& labels)
{
  Resource::ReservationInfo reservation;
  reservation.set_principal(principal);

  if (labels.labels_size() > 0) {
    reservation.mutable_labels()->CopyFrom(labels);
  }

  return reservation;
}


Offer::Operation createLaunchOperation(const vector<TaskInfo>& tasks)
{
  Offer::Operation operation;
  operation.set_type(Offer::Operation::LAUNCH);

  foreach (const TaskInfo& task, tasks) {
    operation.mutable_launch()->add_task_infos()->CopyFrom(task);
  }

  return operation;
}


Offer::Operation createLaunchGroupOperation(
    const ExecutorInfo& executorInfo,
    const TaskGroupInfo& taskGroup)
{
  Offer::Operation operation;
  operation.set_type(Offer::Operation::LAUNCH_GROUP);
  operation.mutable_launch_group()->mutable_executor()->CopyFrom(executorInfo);
  operation.mutable_launch_group()->mutable_task_group()->CopyFrom(taskGroup);
  return operation;
}


Offer::Operation createReserveOperation(const Resources& resources)
{
  Offer::Operation operation;
  operation.set_type(Offer::Operation::RESERVE);
  operation.mutable_reserve()->mutable_resources()->CopyFrom(resources);
  return operation;
}


Offer::Operation createCreateOperation(const Resources& volumes)
{
  Offer::Operation operation;
  operation.set_type(Offer::Operation::CREATE);
  operation.mutable_create()->mutable_volumes()->CopyFrom(volumes);
  return operation;
}

} // namespace protobuf {
} // namespace internal {
} // namespace stride {
