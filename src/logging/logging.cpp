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

#include <signal.h> // For sigaction(), sigemptyset().
#include <stdlib.h> // For exit().

#include <glog/logging.h>
#include <glog/raw_logging.h>

#include <iostream>
#include <string>

#include <process/once.hpp>

#include <stout/error.hpp>
#include <stout/nothing.hpp>
#include <stout/os.hpp>
#include <stout/try.hpp>

#include <stout/os/signals.hpp>

#include "logging/logging.hpp"

using process::Once;

using std::cerr;
using std::endl;
using std::string;

namespace stride {
namespace internal {
namespace logging {

// glog keeps the pointer handed to InitGoogleLogging, so the program
// name must outlive the call.
static string programName;


// Runs in signal context: only RAW_LOG is safe here.
static void sigtermHandler(int signal, siginfo_t* info, void*)
{
  if (signal != SIGTERM) {
    RAW_LOG(FATAL, "Unexpected signal %d in SIGTERM handler", signal);
  }

  // A positive si_code means the kernel sent the signal; otherwise the
  // sender is known.
  if (info->si_code <= 0 ||
      info->si_code == SI_USER ||
      info->si_code == SI_QUEUE) {
    RAW_LOG(WARNING, "Terminated by SIGTERM from pid %d (uid %d)",
            info->si_pid, info->si_uid);
  } else {
    RAW_LOG(WARNING, "Terminated by SIGTERM");
  }

  // Re-raise with the default disposition so no stack trace is dumped.
  os::signals::reset(signal);
  raise(signal);
}


Try<google::LogSeverity> getLogSeverity(const string& logging_level)
{
  static const struct {
    const char* name;
    google::LogSeverity severity;
  } levels[] = {
    {"INFO", google::INFO},
    {"WARNING", google::WARNING},
    {"ERROR", google::ERROR},
  };

  for (size_t i = 0; i < sizeof(levels) / sizeof(levels[0]); i++) {
    if (logging_level == levels[i].name) {
      return levels[i].severity;
    }
  }

  return Error(
      "Unknown logging level '" + logging_level + "'; expected one of"
      " 'INFO', 'WARNING' or 'ERROR'");
}


// Points glog at either the log directory or stderr.
static Try<Nothing> configureOutput(const Flags& flags)
{
  FLAGS_logbufsecs = flags.logbufsecs;

  if (flags.log_dir.isNone()) {
    FLAGS_logtostderr = true;
  } else {
    Try<Nothing> mkdir = os::mkdir(flags.log_dir.get());
    if (mkdir.isError()) {
      return Error(
          "Failed to create log directory '" + flags.log_dir.get() +
          "': " + mkdir.error());
    }

    FLAGS_log_dir = flags.log_dir.get();
    FLAGS_logtostderr = false;
  }

  if (!flags.quiet) {
    // Mirror everything at or above the minimum level to stderr.
    FLAGS_stderrthreshold = FLAGS_minloglevel;
  } else if (FLAGS_logtostderr) {
    // glog ignores the threshold when stderr is the only sink.
    FLAGS_stderrthreshold = google::FATAL;
    FLAGS_minloglevel = google::FATAL;
  } else {
    FLAGS_stderrthreshold = google::FATAL;
  }

  return Nothing();
}


static void installSigtermHandler()
{
  struct sigaction action;
  action.sa_sigaction = sigtermHandler;
  action.sa_flags = SA_SIGINFO;
  sigemptyset(&action.sa_mask);

  if (sigaction(SIGTERM, &action, nullptr) < 0) {
    PLOG(FATAL) << "Failed to install the SIGTERM handler";
  }
}


void initialize(
    const string& argv0,
    bool installFailureSignalHandler,
    const Option<Flags>& _flags)
{
  static Once* initialized = new Once();

  if (initialized->once()) {
    return;
  }

  const Flags flags = _flags.isSome() ? _flags.get() : Flags();

  Try<google::LogSeverity> severity = getLogSeverity(flags.logging_level);
  if (severity.isError()) {
    cerr << severity.error() << endl;
    exit(EXIT_FAILURE);
  }

  FLAGS_minloglevel = severity.get();

  Try<Nothing> output = configureOutput(flags);
  if (output.isError()) {
    cerr << "Could not initialize logging: " << output.error() << endl;
    exit(EXIT_FAILURE);
  }

  programName = argv0;
  google::InitGoogleLogging(programName.c_str());

  if (flags.log_dir.isSome()) {
    // glog opens the log file on the first message.
    LOG_AT_LEVEL(FLAGS_minloglevel)
      << "Logging at " << google::GetLogSeverityName(FLAGS_minloglevel)
      << " level to " << flags.log_dir.get();
  }

  if (installFailureSignalHandler) {
    google::InstallFailureSignalHandler();

    // A SIGTERM is a request to stop, not a crash: no stack trace.
    installSigtermHandler();
  }

  initialized->done();
}

} // namespace logging {
} // namespace internal {
} // namespace stride {
