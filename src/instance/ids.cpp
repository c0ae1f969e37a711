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

#include "instance/ids.hpp"

#include <cstring>
#include <string>
#include <vector>

#include <glog/logging.h>

#include <stout/error.hpp>
#include <stout/foreach.hpp>
#include <stout/none.hpp>
#include <stout/strings.hpp>
#include <stout/uuid.hpp>

using std::string;
using std::vector;

namespace stride {
namespace internal {

static const char INSTANCE_SEPARATOR[] = ".instance-";
static const char VOLUME_SEPARATOR[] = "#";


static bool isValidSegment(const string& segment)
{
  if (segment.empty()) {
    return false;
  }

  foreach (char c, segment) {
    if (!((c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '-')) {
      return false;
    }
  }

  return true;
}


Try<RunSpecId> RunSpecId::parse(const string& path)
{
  if (!strings::startsWith(path, "/")) {
    return Error("Run spec id '" + path + "' is not an absolute path");
  }

  const vector<string> segments = strings::split(path.substr(1), "/");

  foreach (const string& segment, segments) {
    if (!isValidSegment(segment)) {
      return Error(
          "Run spec id '" + path + "' contains an invalid segment '" +
          segment + "'");
    }
  }

  return RunSpecId(path);
}


Try<RunSpecId> RunSpecId::fromSafePath(const string& safePath)
{
  return parse("/" + strings::replace(safePath, "_", "/"));
}


string RunSpecId::safePath() const
{
  return strings::replace(path_.substr(1), "/", "_");
}


InstanceId::InstanceId(const RunSpecId& runSpecId, const string& uuid)
  : runSpecId_(runSpecId),
    uuid_(uuid),
    value_(runSpecId.safePath() + INSTANCE_SEPARATOR + uuid) {}


InstanceId InstanceId::forRunSpec(const RunSpecId& runSpecId)
{
  return InstanceId(runSpecId, id::UUID::random().toString());
}


Try<InstanceId> InstanceId::parse(const string& value)
{
  size_t separator = value.find(INSTANCE_SEPARATOR);
  if (separator == string::npos) {
    return Error("Instance id '" + value + "' has no instance part");
  }

  const string uuid = value.substr(separator + strlen(INSTANCE_SEPARATOR));
  if (uuid.empty() || uuid.find('.') != string::npos) {
    return Error("Instance id '" + value + "' has an invalid uuid");
  }

  Try<RunSpecId> runSpecId =
    RunSpecId::fromSafePath(value.substr(0, separator));

  if (runSpecId.isError()) {
    return Error(
        "Failed to parse instance id '" + value + "': " + runSpecId.error());
  }

  return InstanceId(runSpecId.get(), uuid);
}


TaskId::TaskId(
    const string& value,
    const InstanceId& instanceId,
    const Option<string>& containerName)
  : value_(value),
    instanceId_(instanceId),
    containerName_(containerName) {}


TaskId TaskId::forInstance(const InstanceId& instanceId)
{
  return TaskId(
      instanceId.runSpecId().safePath() + "." + instanceId.uuid(),
      instanceId,
      None());
}


TaskId TaskId::forInstance(
    const InstanceId& instanceId,
    const string& containerName)
{
  CHECK(!containerName.empty() && containerName.find('.') == string::npos)
    << "Invalid container name '" << containerName << "'";

  return TaskId(
      instanceId.value() + "." + containerName,
      instanceId,
      containerName);
}


Try<TaskId> TaskId::parse(const string& value)
{
  size_t separator = value.find(INSTANCE_SEPARATOR);

  if (separator != string::npos) {
    // A pod task: "<instanceId>.<containerName>".
    size_t dot = value.find('.', separator + strlen(INSTANCE_SEPARATOR));
    if (dot == string::npos || dot + 1 == value.size()) {
      return Error("Task id '" + value + "' has no container name");
    }

    Try<InstanceId> instanceId = InstanceId::parse(value.substr(0, dot));
    if (instanceId.isError()) {
      return Error(instanceId.error());
    }

    const string containerName = value.substr(dot + 1);
    if (containerName.find('.') != string::npos) {
      return Error(
          "Task id '" + value + "' has an invalid container name");
    }

    return TaskId(value, instanceId.get(), containerName);
  }

  // An app task: "<safePath>.<uuid>".
  size_t dot = value.find('.');
  if (dot == string::npos || dot + 1 == value.size()) {
    return Error("Task id '" + value + "' has no uuid");
  }

  const string uuid = value.substr(dot + 1);
  if (uuid.find('.') != string::npos) {
    return Error("Task id '" + value + "' has an invalid uuid");
  }

  Try<RunSpecId> runSpecId = RunSpecId::fromSafePath(value.substr(0, dot));
  if (runSpecId.isError()) {
    return Error(
        "Failed to parse task id '" + value + "': " + runSpecId.error());
  }

  return forInstance(InstanceId(runSpecId.get(), uuid));
}


TaskID TaskId::toTaskID() const
{
  TaskID taskId;
  taskId.set_value(value_);
  return taskId;
}


LocalVolumeId::LocalVolumeId(
    const RunSpecId& runSpecId,
    const string& containerPath,
    const string& uuid)
  : runSpecId_(runSpecId),
    containerPath_(containerPath),
    uuid_(uuid) {}


LocalVolumeId LocalVolumeId::forVolume(
    const RunSpecId& runSpecId,
    const string& containerPath)
{
  CHECK(containerPath.find(VOLUME_SEPARATOR) == string::npos)
    << "Container path '" << containerPath << "' contains '"
    << VOLUME_SEPARATOR << "'";

  return LocalVolumeId(
      runSpecId,
      containerPath,
      id::UUID::random().toString());
}


Try<LocalVolumeId> LocalVolumeId::parse(const string& value)
{
  const vector<string> parts = strings::split(value, VOLUME_SEPARATOR);
  if (parts.size() != 3 || parts[1].empty() || parts[2].empty()) {
    return Error("Local volume id '" + value + "' is malformed");
  }

  Try<RunSpecId> runSpecId = RunSpecId::fromSafePath(parts[0]);
  if (runSpecId.isError()) {
    return Error(
        "Failed to parse local volume id '" + value + "': " +
        runSpecId.error());
  }

  return LocalVolumeId(runSpecId.get(), parts[1], parts[2]);
}


string LocalVolumeId::idString() const
{
  return strings::join(
      VOLUME_SEPARATOR,
      runSpecId_.safePath(),
      containerPath_,
      uuid_);
}

} // namespace internal {
} // namespace stride {
