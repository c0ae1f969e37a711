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

#ifndef __INSTANCE_INSTANCE_UPDATE_OPERATION_HPP__
#define __INSTANCE_INSTANCE_UPDATE_OPERATION_HPP__

#include <ostream>

#include <stout/unreachable.hpp>

#include "instance/instance.hpp"

namespace stride {
namespace internal {

// The authoritative change to the instance store which becomes
// effective once the operation carrying it has been accepted.
struct InstanceUpdateOperation
{
  enum class Type
  {
    LAUNCH_EPHEMERAL,
    LAUNCH_ON_RESERVATION,
    RESERVE
  };

  friend std::ostream& operator<<(std::ostream& stream, const Type& type) {
    switch (type) {
      case Type::LAUNCH_EPHEMERAL:
        return stream << "LAUNCH_EPHEMERAL";
      case Type::LAUNCH_ON_RESERVATION:
        return stream << "LAUNCH_ON_RESERVATION";
      case Type::RESERVE:
        return stream << "RESERVE";
    }

    UNREACHABLE();
  }

  static InstanceUpdateOperation launchEphemeral(const Instance& instance)
  {
    return InstanceUpdateOperation(Type::LAUNCH_EPHEMERAL, instance);
  }

  static InstanceUpdateOperation launchOnReservation(const Instance& instance)
  {
    return InstanceUpdateOperation(Type::LAUNCH_ON_RESERVATION, instance);
  }

  static InstanceUpdateOperation reserve(const Instance& instance)
  {
    return InstanceUpdateOperation(Type::RESERVE, instance);
  }

  const Instance::Id& instanceId() const { return instance.instanceId; }

  Type type;
  Instance instance;

private:
  InstanceUpdateOperation(const Type& _type, const Instance& _instance)
    : type(_type), instance(_instance) {}
};


inline std::ostream& operator<<(
    std::ostream& stream,
    const InstanceUpdateOperation& operation)
{
  return stream << operation.type << " " << operation.instance;
}

} // namespace internal {
} // namespace stride {

#endif // __INSTANCE_INSTANCE_UPDATE_OPERATION_HPP__
