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

#include <stride/values.hpp>

#include <stout/error.hpp>
#include <stout/foreach.hpp>
#include <stout/interval.hpp>
#include <stout/numify.hpp>
#include <stout/stringify.hpp>
#include <stout/strings.hpp>

using std::ostream;
using std::string;
using std::vector;

namespace stride {

// Scalars are compared and combined as fixed point numbers with
// three decimal digits, so that 0.1 + 0.2 == 0.3.

static long long toFixed(const Value::Scalar& scalar)
{
  return std::llround(scalar.value() * 1000);
}


static Value::Scalar fromFixed(long long fixed)
{
  // The integer quotient and remainder are converted separately to
  // avoid a floating point division of the whole value.
  Value::Scalar scalar;
  scalar.set_value(
      static_cast<double>(fixed / 1000) +
      static_cast<double>(fixed % 1000) / 1000.0);
  return scalar;
}


ostream& operator<<(ostream& stream, const Value::Scalar& scalar)
{
  const std::streamsize precision =
    stream.precision(std::numeric_limits<double>::digits10);

  stream << fromFixed(toFixed(scalar)).value();
  stream.precision(precision);

  return stream;
}


bool operator==(const Value::Scalar& left, const Value::Scalar& right)
{
  return toFixed(left) == toFixed(right);
}


bool operator!=(const Value::Scalar& left, const Value::Scalar& right)
{
  return toFixed(left) != toFixed(right);
}


bool operator<=(const Value::Scalar& left, const Value::Scalar& right)
{
  return toFixed(left) <= toFixed(right);
}


bool operator<(const Value::Scalar& left, const Value::Scalar& right)
{
  return toFixed(left) < toFixed(right);
}


Value::Scalar operator+(const Value::Scalar& left, const Value::Scalar& right)
{
  return fromFixed(toFixed(left) + toFixed(right));
}


Value::Scalar operator-(const Value::Scalar& left, const Value::Scalar& right)
{
  return fromFixed(toFixed(left) - toFixed(right));
}


Value::Scalar& operator+=(Value::Scalar& left, const Value::Scalar& right)
{
  left = left + right;
  return left;
}


Value::Scalar& operator-=(Value::Scalar& left, const Value::Scalar& right)
{
  left = left - right;
  return left;
}


// Ranges are manipulated as interval sets, which keep them sorted and
// merge overlapping or adjacent ranges, e.g., [1-3, 2-5, 6-6] is
// [1-6].

static IntervalSet<uint64_t> toIntervalSet(const Value::Ranges& ranges)
{
  IntervalSet<uint64_t> set;

  foreach (const Value::Range& range, ranges.range()) {
    set += (Bound<uint64_t>::closed(range.begin()),
            Bound<uint64_t>::closed(range.end()));
  }

  return set;
}


static Value::Ranges toRanges(const IntervalSet<uint64_t>& set)
{
  Value::Ranges ranges;

  foreach (const Interval<uint64_t>& interval, set) {
    Value::Range* range = ranges.add_range();
    range->set_begin(interval.lower());
    range->set_end(interval.upper() - 1);
  }

  return ranges;
}


void coalesce(Value::Ranges* result)
{
  *result = toRanges(toIntervalSet(*result));
}


ostream& operator<<(ostream& stream, const Value::Ranges& ranges)
{
  vector<string> formatted;
  foreach (const Value::Range& range, ranges.range()) {
    formatted.push_back(stringify(range.begin()) + "-" +
                        stringify(range.end()));
  }

  return stream << "[" << strings::join(", ", formatted) << "]";
}


bool operator==(const Value::Ranges& left, const Value::Ranges& right)
{
  const Value::Ranges _left = toRanges(toIntervalSet(left));
  const Value::Ranges _right = toRanges(toIntervalSet(right));

  if (_left.range_size() != _right.range_size()) {
    return false;
  }

  for (int i = 0; i < _left.range_size(); i++) {
    if (_left.range(i).begin() != _right.range(i).begin() ||
        _left.range(i).end() != _right.range(i).end()) {
      return false;
    }
  }

  return true;
}


bool operator<=(const Value::Ranges& left, const Value::Ranges& right)
{
  return toIntervalSet(right).contains(toIntervalSet(left));
}


Value::Ranges operator+(const Value::Ranges& left, const Value::Ranges& right)
{
  Value::Ranges result = left;
  return result += right;
}


Value::Ranges operator-(const Value::Ranges& left, const Value::Ranges& right)
{
  Value::Ranges result = left;
  return result -= right;
}


Value::Ranges& operator+=(Value::Ranges& left, const Value::Ranges& right)
{
  IntervalSet<uint64_t> set = toIntervalSet(left);
  set += toIntervalSet(right);
  left = toRanges(set);
  return left;
}


Value::Ranges& operator-=(Value::Ranges& left, const Value::Ranges& right)
{
  IntervalSet<uint64_t> set = toIntervalSet(left);
  set -= toIntervalSet(right);
  left = toRanges(set);
  return left;
}


// Sets keep the order in which items were added and never hold an
// item twice.

static bool contains(const Value::Set& set, const string& item)
{
  foreach (const string& _item, set.item()) {
    if (_item == item) {
      return true;
    }
  }

  return false;
}


ostream& operator<<(ostream& stream, const Value::Set& set)
{
  vector<string> items(set.item().begin(), set.item().end());
  return stream << "{" << strings::join(", ", items) << "}";
}


bool operator==(const Value::Set& left, const Value::Set& right)
{
  return left.item_size() == right.item_size() && left <= right;
}


bool operator<=(const Value::Set& left, const Value::Set& right)
{
  foreach (const string& item, left.item()) {
    if (!contains(right, item)) {
      return false;
    }
  }

  return true;
}


Value::Set operator+(const Value::Set& left, const Value::Set& right)
{
  Value::Set result = left;
  return result += right;
}


Value::Set operator-(const Value::Set& left, const Value::Set& right)
{
  Value::Set result = left;
  return result -= right;
}


Value::Set& operator+=(Value::Set& left, const Value::Set& right)
{
  foreach (const string& item, right.item()) {
    if (!contains(left, item)) {
      left.add_item(item);
    }
  }

  return left;
}


Value::Set& operator-=(Value::Set& left, const Value::Set& right)
{
  Value::Set result;
  foreach (const string& item, left.item()) {
    if (!contains(right, item)) {
      result.add_item(item);
    }
  }

  left = result;
  return left;
}


ostream& operator<<(ostream& stream, const Value::Text& value)
{
  return stream << value.value();
}


bool operator==(const Value::Text& left, const Value::Text& right)
{
  return left.value() == right.value();
}


namespace internal {
namespace values {

static Try<Value> parseRanges(const string& text)
{
  const vector<string> tokens = strings::tokenize(text, "[]-,\n");
  if (tokens.empty() || tokens.size() % 2 != 0) {
    return Error("Expecting one or more ranges in '" + text + "'");
  }

  Value value;
  value.set_type(Value::RANGES);

  for (size_t i = 0; i < tokens.size(); i += 2) {
    Try<uint64_t> begin = numify<uint64_t>(tokens[i]);
    Try<uint64_t> end = numify<uint64_t>(tokens[i + 1]);

    const string range = tokens[i] + "-" + tokens[i + 1];

    if (begin.isError() || end.isError()) {
      return Error("Expecting non-negative integers in '" + range + "'");
    } else if (begin.get() > end.get()) {
      return Error("Range '" + range + "' is inverted");
    } else if (end.get() == std::numeric_limits<uint64_t>::max()) {
      return Error("Range '" + range + "' ends out of bounds");
    }

    Value::Range* added = value.mutable_ranges()->add_range();
    added->set_begin(begin.get());
    added->set_end(end.get());
  }

  coalesce(value.mutable_ranges());

  return value;
}


static Try<Value> parseSet(const string& text)
{
  Value value;
  value.set_type(Value::SET);

  foreach (const string& item, strings::tokenize(text, "{},\n")) {
    if (contains(value.set(), item)) {
      return Error("Duplicate item '" + item + "' in set '" + text + "'");
    }

    value.mutable_set()->add_item(item);
  }

  return value;
}


Try<Value> parse(const string& text)
{
  const string trimmed = strings::replace(text, " ", "");

  if (trimmed.empty()) {
    return Error("Expecting non-empty string");
  }

  if (!strings::checkBracketsMatching(trimmed, '{', '}') ||
      !strings::checkBracketsMatching(trimmed, '[', ']') ||
      !strings::checkBracketsMatching(trimmed, '(', ')')) {
    return Error("Mismatched brackets in '" + trimmed + "'");
  }

  if (strings::startsWith(trimmed, "[")) {
    return parseRanges(trimmed);
  } else if (strings::startsWith(trimmed, "{")) {
    return parseSet(trimmed);
  } else if (strings::contains(trimmed, "[") ||
             strings::contains(trimmed, "{")) {
    return Error("Unexpected bracket in '" + trimmed + "'");
  }

  Value value;

  Try<double> scalar = numify<double>(trimmed);
  if (scalar.isSome()) {
    value.set_type(Value::SCALAR);
    value.mutable_scalar()->set_value(scalar.get());
  } else {
    value.set_type(Value::TEXT);
    value.mutable_text()->set_value(trimmed);
  }

  return value;
}

} // namespace values {
} // namespace internal {

} // namespace stride {
