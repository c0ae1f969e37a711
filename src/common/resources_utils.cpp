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

#include "common/resources_utils.hpp"

#include <string>

#include <stout/option.hpp>

#include "common/protobuf_utils.hpp"

using std::string;

namespace stride {

Offer consumeResourcesFromOffer(const Offer& offer, const Resources& used)
{
  Resources remaining = Resources(offer.resources()) - used;

  Offer result = offer;
  result.mutable_resources()->CopyFrom(
      static_cast<const google::protobuf::RepeatedPtrField<Resource>&>(
          remaining));

  return result;
}


bool hasReservationLabel(
    const Resource& resource,
    const string& key,
    const string& value)
{
  if (!Resources::isDynamicallyReserved(resource) ||
      !resource.reservation().has_labels()) {
    return false;
  }

  const Option<string> label =
    internal::protobuf::getLabel(resource.reservation().labels(), key);

  return label.isSome() && label.get() == value;
}

} // namespace stride {
