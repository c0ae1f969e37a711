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

#include "logging/flags.hpp"

#include <stout/error.hpp>
#include <stout/none.hpp>
#include <stout/option.hpp>
#include <stout/try.hpp>

#include "logging/logging.hpp"

using std::string;

namespace stride {
namespace internal {
namespace logging {

static Option<Error> validateLevel(const string& value)
{
  Try<google::LogSeverity> severity = getLogSeverity(value);
  if (severity.isError()) {
    return Error(severity.error());
  }

  return None();
}


Flags::Flags()
{
  add(&Flags::quiet,
      "quiet",
      "Suppress log output on stderr.",
      false);

  add(&Flags::logging_level,
      "logging_level",
      "Lowest severity that gets logged: `INFO`, `WARNING` or `ERROR`.\n"
      "Together with `--quiet` this only applies to the files written\n"
      "under `--log_dir`.",
      "INFO",
      validateLevel);

  add(&Flags::log_dir,
      "log_dir",
      "Directory for log files. When unset logs only go to stderr.");

  add(&Flags::logbufsecs,
      "logbufsecs",
      "Seconds a log line may sit in the buffer before being flushed.",
      0);
}

} // namespace logging {
} // namespace internal {
} // namespace stride {
