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

#ifndef __INSTANCE_RUN_SPEC_HPP__
#define __INSTANCE_RUN_SPEC_HPP__

#include <string>
#include <vector>

#include <stride/resources.hpp>
#include <stride/stride.hpp>

#include <process/time.hpp>

#include <stout/bytes.hpp>
#include <stout/option.hpp>

#include "instance/ids.hpp"

namespace stride {
namespace internal {

// A persistent volume declared by an app. It is created on the
// agent from reserved disk before the app is launched there.
struct PersistentVolume
{
  PersistentVolume() : mode(Volume::RW) {}

  std::string containerPath;
  Bytes size;
  Volume::Mode mode;

  // Where the volume lives on the agent, e.g., a PATH or MOUNT disk.
  Option<Resource::DiskInfo::Source> source;
};


// A persistent volume bound to one instance.
struct LocalVolume
{
  LocalVolume(const LocalVolumeId& _id, const PersistentVolume& _volume)
    : id(_id), volume(_volume) {}

  LocalVolumeId id;
  PersistentVolume volume;
};


// A container of a pod, launched as one task of the task group.
struct ContainerSpec
{
  std::string name;
  Resources resources;
  std::string command;
};


// What to run: an app (a command with resources, optionally with
// persistent volumes) or a pod (a group of containers).
struct RunSpec
{
  RunSpec(const RunSpecId& _id, const process::Time& _version)
    : id(_id), version(_version) {}

  bool isPod() const { return !containers.empty(); }

  bool isResident() const { return !persistentVolumes.empty(); }

  RunSpecId id;
  process::Time version;

  // Used by apps.
  Resources resources;
  std::string command;
  std::vector<PersistentVolume> persistentVolumes;

  // Used by pods.
  Resources executorResources;
  std::vector<ContainerSpec> containers;
};

} // namespace internal {
} // namespace stride {

#endif // __INSTANCE_RUN_SPEC_HPP__
