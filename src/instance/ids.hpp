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

#ifndef __INSTANCE_IDS_HPP__
#define __INSTANCE_IDS_HPP__

#include <functional>
#include <ostream>
#include <string>

#include <boost/functional/hash.hpp>

#include <stride/stride.hpp>

#include <stout/option.hpp>
#include <stout/try.hpp>

namespace stride {
namespace internal {

// Identifies a run specification (an app or a pod) by its absolute
// path, e.g., "/prod/db". Each path segment consists of lower case
// letters, digits and dashes.
class RunSpecId
{
public:
  static Try<RunSpecId> parse(const std::string& path);

  // Returns the form used inside of other identifiers: the leading
  // separator is dropped and the remaining separators become '_',
  // e.g., "/prod/db" becomes "prod_db".
  static Try<RunSpecId> fromSafePath(const std::string& safePath);

  const std::string& path() const { return path_; }

  std::string safePath() const;

  bool operator==(const RunSpecId& that) const { return path_ == that.path_; }
  bool operator!=(const RunSpecId& that) const { return path_ != that.path_; }
  bool operator<(const RunSpecId& that) const { return path_ < that.path_; }

private:
  explicit RunSpecId(const std::string& path) : path_(path) {}

  std::string path_;
};


// Identifies one instance of a run specification:
// "<safePath>.instance-<uuid>".
class InstanceId
{
public:
  static InstanceId forRunSpec(const RunSpecId& runSpecId);

  static Try<InstanceId> parse(const std::string& value);

  const std::string& value() const { return value_; }
  const RunSpecId& runSpecId() const { return runSpecId_; }
  const std::string& uuid() const { return uuid_; }

  // The executor id used when launching the tasks of a pod instance
  // as a task group.
  std::string executorIdString() const { return "instance-" + value_; }

  bool operator==(const InstanceId& that) const
  {
    return value_ == that.value_;
  }

  bool operator!=(const InstanceId& that) const
  {
    return value_ != that.value_;
  }

  bool operator<(const InstanceId& that) const { return value_ < that.value_; }

private:
  InstanceId(const RunSpecId& runSpecId, const std::string& uuid);

  RunSpecId runSpecId_;
  std::string uuid_;
  std::string value_;
};


// Identifies a task. The task of an app instance shares the uuid of
// its instance: "<safePath>.<uuid>". The tasks of a pod instance are
// named after their container: "<instanceId>.<containerName>". Both
// forms derive the id of the owning instance.
class TaskId
{
public:
  static TaskId forInstance(const InstanceId& instanceId);

  static TaskId forInstance(
      const InstanceId& instanceId,
      const std::string& containerName);

  static Try<TaskId> parse(const std::string& value);

  static Try<TaskId> parse(const TaskID& taskId)
  {
    return parse(taskId.value());
  }

  const std::string& value() const { return value_; }
  const InstanceId& instanceId() const { return instanceId_; }
  const RunSpecId& runSpecId() const { return instanceId_.runSpecId(); }
  const Option<std::string>& containerName() const { return containerName_; }

  TaskID toTaskID() const;

  bool operator==(const TaskId& that) const { return value_ == that.value_; }
  bool operator!=(const TaskId& that) const { return value_ != that.value_; }
  bool operator<(const TaskId& that) const { return value_ < that.value_; }

private:
  TaskId(
      const std::string& value,
      const InstanceId& instanceId,
      const Option<std::string>& containerName);

  std::string value_;
  InstanceId instanceId_;
  Option<std::string> containerName_;
};


// Identifies a persistent local volume:
// "<safePath>#<containerPath>#<uuid>". Used as the persistence id of
// the volume created on the agent.
class LocalVolumeId
{
public:
  static LocalVolumeId forVolume(
      const RunSpecId& runSpecId,
      const std::string& containerPath);

  static Try<LocalVolumeId> parse(const std::string& value);

  const RunSpecId& runSpecId() const { return runSpecId_; }
  const std::string& containerPath() const { return containerPath_; }
  const std::string& uuid() const { return uuid_; }

  std::string idString() const;

  bool operator==(const LocalVolumeId& that) const
  {
    return idString() == that.idString();
  }

  bool operator!=(const LocalVolumeId& that) const
  {
    return !(*this == that);
  }

private:
  LocalVolumeId(
      const RunSpecId& runSpecId,
      const std::string& containerPath,
      const std::string& uuid);

  RunSpecId runSpecId_;
  std::string containerPath_;
  std::string uuid_;
};


inline std::ostream& operator<<(std::ostream& stream, const RunSpecId& id)
{
  return stream << id.path();
}


inline std::ostream& operator<<(std::ostream& stream, const InstanceId& id)
{
  return stream << id.value();
}


inline std::ostream& operator<<(std::ostream& stream, const TaskId& id)
{
  return stream << id.value();
}


inline std::ostream& operator<<(
    std::ostream& stream,
    const LocalVolumeId& id)
{
  return stream << id.idString();
}

} // namespace internal {
} // namespace stride {

namespace std {

template <>
struct hash<stride::internal::InstanceId>
{
  typedef size_t result_type;

  typedef stride::internal::InstanceId argument_type;

  result_type operator()(const argument_type& instanceId) const
  {
    size_t seed = 0;
    boost::hash_combine(seed, instanceId.value());
    return seed;
  }
};


template <>
struct hash<stride::internal::TaskId>
{
  typedef size_t result_type;

  typedef stride::internal::TaskId argument_type;

  result_type operator()(const argument_type& taskId) const
  {
    size_t seed = 0;
    boost::hash_combine(seed, taskId.value());
    return seed;
  }
};

} // namespace std {

#endif // __INSTANCE_IDS_HPP__
