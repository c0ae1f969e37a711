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

#include "tests/flags.hpp"

#include <process/gtest.hpp>

namespace stride {
namespace internal {
namespace tests {

Flags flags;


Flags::Flags()
{
  // Test output stays quiet unless asked for.
  add(&Flags::verbose,
      "verbose",
      "Show log output of every severity while the tests run.",
      false);

  add(&Flags::test_await_timeout,
      "test_await_timeout",
      "How long the AWAIT_* assertions wait before failing.",
      process::TEST_AWAIT_TIMEOUT);
}

} // namespace tests {
} // namespace internal {
} // namespace stride {
