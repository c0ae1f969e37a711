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

#include <stdint.h>

#include <cmath>
#include <limits>
#include <ostream>
#include <string>
#include <vector>

#include <glog/logging.h>

#include <google/protobuf/repeated_field.h>

#include <stride/resources.hpp>
#include <stride/values.hpp>

#include <stout/foreach.hpp>
#include <stout/lambda.hpp>
#include <stout/stringify.hpp>
#include <stout/strings.hpp>
#include <stout/unreachable.hpp>

using std::ostream;
using std::string;
using std::vector;

using google::protobuf::RepeatedPtrField;

namespace stride {

bool operator==(const Labels& left, const Labels& right)
{
  if (left.labels_size() != right.labels_size()) {
    return false;
  }

  // Labels are compared as a multiset; order does not matter.
  foreach (const Label& label, left.labels()) {
    bool found = false;
    foreach (const Label& other, right.labels()) {
      if (label.key() == other.key() &&
          label.has_value() == other.has_value() &&
          label.value() == other.value()) {
        found = true;
        break;
      }
    }

    if (!found) {
      return false;
    }
  }

  return true;
}


bool operator!=(const Labels& left, const Labels& right)
{
  return !(left == right);
}


bool operator==(const Volume& left, const Volume& right)
{
  return left.mode() == right.mode() &&
         left.container_path() == right.container_path() &&
         left.host_path() == right.host_path();
}


bool operator==(
    const Resource::ReservationInfo& left,
    const Resource::ReservationInfo& right)
{
  if (left.has_principal() != right.has_principal() ||
      left.has_labels() != right.has_labels()) {
    return false;
  }

  return left.principal() == right.principal() &&
         (!left.has_labels() || left.labels() == right.labels());
}


bool operator!=(
    const Resource::ReservationInfo& left,
    const Resource::ReservationInfo& right)
{
  return !(left == right);
}


static string sourceRoot(const Resource::DiskInfo::Source& source)
{
  switch (source.type()) {
    case Resource::DiskInfo::Source::PATH:
      return source.path().root();
    case Resource::DiskInfo::Source::MOUNT:
      return source.mount().root();
    case Resource::DiskInfo::Source::UNKNOWN:
      return "";
  }

  UNREACHABLE();
}


bool operator==(const Resource::DiskInfo& left, const Resource::DiskInfo& right)
{
  if (left.has_source() != right.has_source() ||
      left.has_persistence() != right.has_persistence() ||
      left.has_volume() != right.has_volume()) {
    return false;
  }

  if (left.has_source() &&
      (left.source().type() != right.source().type() ||
       sourceRoot(left.source()) != sourceRoot(right.source()))) {
    return false;
  }

  if (left.has_persistence() &&
      left.persistence().id() != right.persistence().id()) {
    return false;
  }

  return !left.has_volume() || left.volume() == right.volume();
}


bool operator!=(const Resource::DiskInfo& left, const Resource::DiskInfo& right)
{
  return !(left == right);
}


// Whether two Resource objects describe the same kind of resource,
// i.e. everything but the value agrees.
static bool sameKind(const Resource& left, const Resource& right)
{
  if (left.name() != right.name() ||
      left.type() != right.type() ||
      left.role() != right.role() ||
      left.has_reservation() != right.has_reservation() ||
      left.has_disk() != right.has_disk()) {
    return false;
  }

  if (left.has_reservation() && left.reservation() != right.reservation()) {
    return false;
  }

  return !left.has_disk() || left.disk() == right.disk();
}


static bool isMountDisk(const Resource& resource)
{
  return resource.has_disk() &&
         resource.disk().has_source() &&
         resource.disk().source().type() == Resource::DiskInfo::Source::MOUNT;
}


bool operator==(const Resource& left, const Resource& right)
{
  if (!sameKind(left, right)) {
    return false;
  }

  switch (left.type()) {
    case Value::SCALAR: return left.scalar() == right.scalar();
    case Value::RANGES: return left.ranges() == right.ranges();
    case Value::SET:    return left.set() == right.set();
    default:            return false;
  }
}


bool operator!=(const Resource& left, const Resource& right)
{
  return !(left == right);
}


namespace internal {

// Persistent volumes and MOUNT disks are indivisible: they never merge
// with another Resource object, and can only be taken away whole.
static bool addable(const Resource& left, const Resource& right)
{
  return sameKind(left, right) &&
         !Resources::isPersistentVolume(left) &&
         !isMountDisk(left);
}


// NOTE: Set subtraction is always well defined; 'right' need not be
// contained in 'left'.
static bool subtractable(const Resource& left, const Resource& right)
{
  if (!sameKind(left, right)) {
    return false;
  }

  if (Resources::isPersistentVolume(left) || isMountDisk(left)) {
    return left == right;
  }

  return true;
}


// Tests if 'right' fits inside 'left'.
static bool contains(const Resource& left, const Resource& right)
{
  if (!subtractable(left, right)) {
    return false;
  }

  switch (left.type()) {
    case Value::SCALAR: return right.scalar() <= left.scalar();
    case Value::RANGES: return right.ranges() <= left.ranges();
    case Value::SET:    return right.set() <= left.set();
    default:            return false;
  }
}


// Adds (or subtracts) the value of 'right' into 'left'; the caller
// has checked that the two are of the same kind.
static void combine(Resource* left, const Resource& right, bool add)
{
  switch (left->type()) {
    case Value::SCALAR:
      if (add) {
        *left->mutable_scalar() += right.scalar();
      } else {
        *left->mutable_scalar() -= right.scalar();
      }
      break;
    case Value::RANGES:
      if (add) {
        *left->mutable_ranges() += right.ranges();
      } else {
        *left->mutable_ranges() -= right.ranges();
      }
      break;
    case Value::SET:
      if (add) {
        *left->mutable_set() += right.set();
      } else {
        *left->mutable_set() -= right.set();
      }
      break;
    default:
      break;
  }
}

} // namespace internal {


Try<Resource> Resources::parse(
    const string& name,
    const string& value,
    const string& role)
{
  Try<Value> parsed = internal::values::parse(value);
  if (parsed.isError()) {
    return Error(
        "Failed to parse value '" + value + "' of resource '" + name +
        "': " + parsed.error());
  }

  Resource resource;
  resource.set_name(name);
  resource.set_role(role);
  resource.set_type(parsed->type());

  switch (parsed->type()) {
    case Value::SCALAR:
      resource.mutable_scalar()->CopyFrom(parsed->scalar());
      break;
    case Value::RANGES:
      resource.mutable_ranges()->CopyFrom(parsed->ranges());
      break;
    case Value::SET:
      resource.mutable_set()->CopyFrom(parsed->set());
      break;
    default:
      return Error(
          "Resource '" + name + "' cannot hold a " +
          Value::Type_Name(parsed->type()) + " value");
  }

  return resource;
}


// Parses a single "name(role):value" token.
static Try<Resource> parseToken(const string& token, const string& defaultRole)
{
  const size_t colon = token.find(':');
  if (colon == string::npos || token.find(':', colon + 1) != string::npos) {
    return Error("Expected exactly one ':' in '" + token + "'");
  }

  string head = token.substr(0, colon);
  string role = defaultRole;

  const size_t open = head.find('(');
  if (open != string::npos) {
    const size_t close = head.find(')', open);
    if (close == string::npos) {
      return Error("Unbalanced parentheses in '" + token + "'");
    }

    role = strings::trim(head.substr(open + 1, close - open - 1));
    head = head.substr(0, open);
  }

  return Resources::parse(
      strings::trim(head),
      strings::trim(token.substr(colon + 1)),
      role);
}


Try<Resources> Resources::parse(
    const string& text,
    const string& defaultRole)
{
  Resources result;

  foreach (const string& token, strings::tokenize(text, ";")) {
    Try<Resource> resource = parseToken(token, defaultRole);
    if (resource.isError()) {
      return Error(
          "Bad value for resources: " + resource.error());
    }

    // A malformed resource is an error here rather than being stripped
    // by the arithmetic below.
    Option<Error> error = validate(resource.get());
    if (error.isSome()) {
      return Error("Invalid resource '" + token + "': " + error->message);
    }

    result += resource.get();
  }

  return result;
}


// Checks that exactly the value field matching the type is set and
// that the value itself is well formed.
static Option<Error> validateValue(const Resource& resource)
{
  const bool scalar = resource.has_scalar();
  const bool ranges = resource.has_ranges();
  const bool set = resource.has_set();

  switch (resource.type()) {
    case Value::SCALAR: {
      if (!scalar || ranges || set) {
        return Error("Invalid scalar resource");
      }

      const double value = resource.scalar().value();
      if (value < 0 || !std::isfinite(value)) {
        return Error("Invalid scalar resource: value < 0 or not finite");
      }
      return None();
    }

    case Value::RANGES: {
      if (scalar || !ranges || set) {
        return Error("Invalid ranges resource");
      }

      foreach (const Value::Range& range, resource.ranges().range()) {
        if (range.begin() > range.end()) {
          return Error("Invalid ranges resource: inverted range");
        }

        // Ranges are closed intervals, the largest value has no
        // successor to bound them with.
        if (range.end() == std::numeric_limits<uint64_t>::max()) {
          return Error("Invalid ranges resource: range end out of bounds");
        }
      }
      return None();
    }

    case Value::SET: {
      if (scalar || ranges || !set) {
        return Error("Invalid set resource");
      }

      const RepeatedPtrField<string>& items = resource.set().item();
      for (int i = 0; i < items.size(); i++) {
        for (int j = 0; j < i; j++) {
          if (items.Get(i) == items.Get(j)) {
            return Error(
                "Invalid set resource: duplicated element " + items.Get(i));
          }
        }
      }
      return None();
    }

    default:
      return Error("Unsupported resource type");
  }
}


Option<Error> Resources::validate(const Resource& resource)
{
  if (resource.name().empty()) {
    return Error("Empty resource name");
  }

  if (!Value::Type_IsValid(resource.type())) {
    return Error("Invalid resource type");
  }

  Option<Error> error = validateValue(resource);
  if (error.isSome()) {
    return error;
  }

  if (resource.role().empty()) {
    return Error("Empty role");
  }

  const bool unreservedRole = resource.role() == "*";

  if (resource.has_reservation() && unreservedRole) {
    return Error("Invalid reservation: role \"*\" cannot be reserved");
  }

  if (!resource.has_disk()) {
    return None();
  }

  if (resource.name() != "disk") {
    return Error(
        "DiskInfo should not be set for " + resource.name() + " resource");
  }

  if (resource.disk().has_persistence()) {
    if (unreservedRole) {
      return Error(
          "Persistent volumes cannot be created from unreserved resources");
    }

    if (!resource.disk().has_volume()) {
      return Error("Persistent volume is missing the volume info");
    }
  }

  return None();
}


Option<Error> Resources::validate(const RepeatedPtrField<Resource>& resources)
{
  foreach (const Resource& resource, resources) {
    Option<Error> error = validate(resource);
    if (error.isSome()) {
      return Error(
          "Resource '" + stringify(resource) +
          "' is invalid: " + error->message);
    }
  }

  return None();
}


bool Resources::isEmpty(const Resource& resource)
{
  switch (resource.type()) {
    case Value::SCALAR: return resource.scalar() == Value::Scalar();
    case Value::RANGES: return resource.ranges().range_size() == 0;
    case Value::SET:    return resource.set().item_size() == 0;
    default:            return false;
  }
}


bool Resources::isPersistentVolume(const Resource& resource)
{
  return resource.has_disk() && resource.disk().has_persistence();
}


bool Resources::isReserved(
    const Resource& resource,
    const Option<string>& role)
{
  if (isUnreserved(resource)) {
    return false;
  }

  return role.isNone() || role.get() == resource.role();
}


bool Resources::isUnreserved(const Resource& resource)
{
  return resource.role() == "*" && !resource.has_reservation();
}


bool Resources::isDynamicallyReserved(const Resource& resource)
{
  return resource.has_reservation() && isReserved(resource);
}


Resources::Resources(const Resource& resource)
{
  *this += resource;
}


Resources::Resources(const vector<Resource>& _resources)
{
  foreach (const Resource& resource, _resources) {
    *this += resource;
  }
}


Resources::Resources(const RepeatedPtrField<Resource>& _resources)
{
  foreach (const Resource& resource, _resources) {
    *this += resource;
  }
}


bool Resources::contains(const Resources& that) const
{
  Resources remaining = *this;

  // Everything in 'that' is already valid, hence '_contains'.
  foreach (const Resource& resource, that.resources) {
    if (!remaining._contains(resource)) {
      return false;
    }

    remaining -= resource;
  }

  return true;
}


bool Resources::contains(const Resource& that) const
{
  // An invalid Resource such as "cpus:-1" would otherwise look
  // contained.
  return validate(that).isNone() && _contains(that);
}


Resources Resources::filter(
    const lambda::function<bool(const Resource&)>& predicate) const
{
  Resources result;
  foreach (const Resource& resource, resources) {
    if (predicate(resource)) {
      result += resource;
    }
  }
  return result;
}


Resources Resources::reserved(const Option<string>& role) const
{
  return filter(lambda::bind(isReserved, lambda::_1, role));
}


Resources Resources::unreserved() const
{
  return filter(isUnreserved);
}


Resources Resources::persistentVolumes() const
{
  return filter(isPersistentVolume);
}


Resources Resources::flatten(
    const string& role,
    const Option<Resource::ReservationInfo>& reservation) const
{
  Resources result;

  foreach (Resource resource, resources) {
    resource.set_role(role);
    resource.clear_reservation();
    if (reservation.isSome()) {
      resource.mutable_reservation()->CopyFrom(reservation.get());
    }
    result += resource;
  }

  return result;
}


Resources Resources::get(const string& name) const
{
  return filter([=](const Resource& resource) {
    return resource.name() == name;
  });
}


// Sums the scalar resources named 'name' across roles.
static Option<double> scalarTotal(
    const Resources& resources,
    const string& name)
{
  Option<Value::Scalar> total;

  foreach (const Resource& resource, resources) {
    if (resource.name() != name || resource.type() != Value::SCALAR) {
      continue;
    }

    if (total.isNone()) {
      total = resource.scalar();
    } else {
      total = total.get() + resource.scalar();
    }
  }

  if (total.isNone()) {
    return None();
  }

  return total->value();
}


Option<double> Resources::cpus() const
{
  return scalarTotal(*this, "cpus");
}


Option<double> Resources::gpus() const
{
  return scalarTotal(*this, "gpus");
}


Option<Bytes> Resources::mem() const
{
  Option<double> value = scalarTotal(*this, "mem");
  if (value.isNone()) {
    return None();
  }

  return Megabytes(static_cast<uint64_t>(value.get()));
}


Option<Bytes> Resources::disk() const
{
  Option<double> value = scalarTotal(*this, "disk");
  if (value.isNone()) {
    return None();
  }

  return Megabytes(static_cast<uint64_t>(value.get()));
}


Option<Value::Ranges> Resources::ports() const
{
  Option<Value::Ranges> total;

  foreach (const Resource& resource, resources) {
    if (resource.name() != "ports" || resource.type() != Value::RANGES) {
      continue;
    }

    if (total.isNone()) {
      total = Value::Ranges();
    }

    total.get() += resource.ranges();
  }

  return total;
}


bool Resources::_contains(const Resource& that) const
{
  foreach (const Resource& resource, resources) {
    if (internal::contains(resource, that)) {
      return true;
    }
  }

  return false;
}


Resources::operator const RepeatedPtrField<Resource>&() const
{
  return resources;
}


bool Resources::operator==(const Resources& that) const
{
  return contains(that) && that.contains(*this);
}


bool Resources::operator!=(const Resources& that) const
{
  return !(*this == that);
}


Resources Resources::operator+(const Resource& that) const
{
  Resources result(*this);
  result += that;
  return result;
}


Resources Resources::operator+(const Resources& that) const
{
  Resources result(*this);
  result += that;
  return result;
}


Resources& Resources::operator+=(const Resource& that)
{
  if (validate(that).isSome() || isEmpty(that)) {
    return *this;
  }

  for (int i = 0; i < resources.size(); i++) {
    if (internal::addable(resources.Get(i), that)) {
      internal::combine(resources.Mutable(i), that, true);
      return *this;
    }
  }

  resources.Add()->CopyFrom(that);
  return *this;
}


Resources& Resources::operator+=(const Resources& that)
{
  foreach (const Resource& resource, that.resources) {
    *this += resource;
  }

  return *this;
}


Resources Resources::operator-(const Resource& that) const
{
  Resources result(*this);
  result -= that;
  return result;
}


Resources Resources::operator-(const Resources& that) const
{
  Resources result(*this);
  result -= that;
  return result;
}


Resources& Resources::operator-=(const Resource& that)
{
  if (validate(that).isSome() || isEmpty(that)) {
    return *this;
  }

  for (int i = 0; i < resources.size(); i++) {
    if (!internal::subtractable(resources.Get(i), that)) {
      continue;
    }

    internal::combine(resources.Mutable(i), that, false);

    // Drop the entry once it is used up (or went negative), keeping
    // the order of the others.
    if (validate(resources.Get(i)).isSome() || isEmpty(resources.Get(i))) {
      resources.DeleteSubrange(i, 1);
    }

    break;
  }

  return *this;
}


Resources& Resources::operator-=(const Resources& that)
{
  foreach (const Resource& resource, that.resources) {
    *this -= resource;
  }

  return *this;
}


ostream& operator<<(ostream& stream, const Resource& resource)
{
  stream << resource.name() << "(" << resource.role();

  if (resource.has_reservation() && resource.reservation().has_principal()) {
    stream << ", " << resource.reservation().principal();
  }

  stream << ")";

  if (resource.has_disk()) {
    const Resource::DiskInfo& disk = resource.disk();

    vector<string> parts;
    if (disk.has_source()) {
      string source =
        Resource::DiskInfo::Source::Type_Name(disk.source().type());

      const string root = sourceRoot(disk.source());
      if (!root.empty()) {
        source += ":" + root;
      }

      parts.push_back(source);
    }

    if (disk.has_persistence()) {
      parts.push_back(disk.persistence().id());
    }

    stream << "[" << strings::join(",", parts);

    if (disk.has_volume()) {
      stream << ":" << disk.volume().container_path();
    }

    stream << "]";
  }

  stream << ":";

  switch (resource.type()) {
    case Value::SCALAR: return stream << resource.scalar();
    case Value::RANGES: return stream << resource.ranges();
    case Value::SET:    return stream << resource.set();
    default:
      LOG(FATAL) << "Unexpected value type " << resource.type()
                 << " for resource " << resource.name();
  }

  UNREACHABLE();
}


ostream& operator<<(ostream& stream, const Resources& resources)
{
  if (resources.empty()) {
    return stream << "{}";
  }

  vector<string> parts;
  foreach (const Resource& resource, resources) {
    parts.push_back(stringify(resource));
  }

  return stream << strings::join("; ", parts);
}

} // namespace stride {
