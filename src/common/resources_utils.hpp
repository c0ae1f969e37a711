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

#ifndef __RESOURCES_UTILS_HPP__
#define __RESOURCES_UTILS_HPP__

#include <string>

#include <stride/resources.hpp>
#include <stride/stride.hpp>

namespace stride {

// Returns a new snapshot of the offer with the given resources
// subtracted from the matching entries. An entry matches on name,
// type, role, reservation and disk info; used resources without a
// match are ignored, and entries which become empty are dropped.
// Consuming is associative and commutative as long as the used
// resources are contained in the offer.
Offer consumeResourcesFromOffer(const Offer& offer, const Resources& used);


// Tests if the resource is dynamically reserved with a reservation
// carrying the label 'key' with the given value.
bool hasReservationLabel(
    const Resource& resource,
    const std::string& key,
    const std::string& value);

} // namespace stride {

#endif // __RESOURCES_UTILS_HPP__
