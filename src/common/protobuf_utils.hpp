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

#ifndef __PROTOBUF_UTILS_HPP__
#define __PROTOBUF_UTILS_HPP__

#include <string>
#include <vector>

#include <stride/resources.hpp>
#include <stride/stride.hpp>

#include <stout/none.hpp>
#include <stout/option.hpp>

namespace stride {
namespace internal {
namespace protobuf {

Label createLabel(
    const std::string& key,
    const Option<std::string>& value = None());


// Returns the value of the first label with the given key.
Option<std::string> getLabel(const Labels& labels, const std::string& key);


Resource::ReservationInfo createReservationInfo(
    const std::string& principal,
    const Labels& labels = Labels());


// Low-level offer operations submitted when accepting an offer.
Offer::Operation createLaunchOperation(const std::vector<TaskInfo>& tasks);


Offer::Operation createLaunchGroupOperation(
    const ExecutorInfo& executorInfo,
    const TaskGroupInfo& taskGroup);


Offer::Operation createReserveOperation(const Resources& resources);


Offer::Operation createCreateOperation(const Resources& volumes);

} // namespace protobuf {
} // namespace internal {
} // namespace stride {

#endif // __PROTOBUF_UTILS_HPP__
