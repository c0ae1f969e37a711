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

#ifndef __STRIDE_HPP__
#define __STRIDE_HPP__

#include <ostream>
#include <string>

#include <boost/functional/hash.hpp>

#include <stride/stride.pb.h> // ONLY USEFUL AFTER RUNNING PROTOC.

namespace stride {

bool operator==(const Labels& left, const Labels& right);
bool operator!=(const Labels& left, const Labels& right);

bool operator==(const Volume& left, const Volume& right);

bool operator==(
    const Resource::ReservationInfo& left,
    const Resource::ReservationInfo& right);

bool operator!=(
    const Resource::ReservationInfo& left,
    const Resource::ReservationInfo& right);

bool operator==(
    const Resource::DiskInfo& left,
    const Resource::DiskInfo& right);

bool operator!=(
    const Resource::DiskInfo& left,
    const Resource::DiskInfo& right);


inline bool operator==(const ExecutorID& left, const ExecutorID& right)
{
  return left.value() == right.value();
}


inline bool operator==(const FrameworkID& left, const FrameworkID& right)
{
  return left.value() == right.value();
}


inline bool operator==(const OfferID& left, const OfferID& right)
{
  return left.value() == right.value();
}


inline bool operator==(const AgentID& left, const AgentID& right)
{
  return left.value() == right.value();
}


inline bool operator==(const TaskID& left, const TaskID& right)
{
  return left.value() == right.value();
}


inline bool operator==(const TaskID& left, const std::string& right)
{
  return left.value() == right;
}


inline bool operator!=(const ExecutorID& left, const ExecutorID& right)
{
  return left.value() != right.value();
}


inline bool operator!=(const OfferID& left, const OfferID& right)
{
  return left.value() != right.value();
}


inline bool operator!=(const TaskID& left, const TaskID& right)
{
  return left.value() != right.value();
}


inline bool operator<(const TaskID& left, const TaskID& right)
{
  return left.value() < right.value();
}


inline std::ostream& operator<<(
    std::ostream& stream,
    const ExecutorID& executorId)
{
  return stream << executorId.value();
}


inline std::ostream& operator<<(
    std::ostream& stream,
    const FrameworkID& frameworkId)
{
  return stream << frameworkId.value();
}


inline std::ostream& operator<<(std::ostream& stream, const OfferID& offerId)
{
  return stream << offerId.value();
}


inline std::ostream& operator<<(std::ostream& stream, const AgentID& agentId)
{
  return stream << agentId.value();
}


inline std::ostream& operator<<(std::ostream& stream, const TaskID& taskId)
{
  return stream << taskId.value();
}


inline std::ostream& operator<<(std::ostream& stream, const TaskInfo& task)
{
  return stream << task.DebugString();
}


inline std::ostream& operator<<(
    std::ostream& stream,
    const Offer::Operation::Type& type)
{
  return stream << Offer::Operation::Type_Name(type);
}

} // namespace stride {

namespace std {

template <>
struct hash<stride::OfferID>
{
  typedef size_t result_type;

  typedef stride::OfferID argument_type;

  result_type operator()(const argument_type& offerId) const
  {
    size_t seed = 0;
    boost::hash_combine(seed, offerId.value());
    return seed;
  }
};


template <>
struct hash<stride::AgentID>
{
  typedef size_t result_type;

  typedef stride::AgentID argument_type;

  result_type operator()(const argument_type& agentId) const
  {
    size_t seed = 0;
    boost::hash_combine(seed, agentId.value());
    return seed;
  }
};


template <>
struct hash<stride::TaskID>
{
  typedef size_t result_type;

  typedef stride::TaskID argument_type;

  result_type operator()(const argument_type& taskId) const
  {
    size_t seed = 0;
    boost::hash_combine(seed, taskId.value());
    return seed;
  }
};

} // namespace std {

#endif // __STRIDE_HPP__
