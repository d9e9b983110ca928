// +-------------------------------------------------------------------------
// | Copyright (C) 2017 Yunify, Inc.
// +-------------------------------------------------------------------------
// | Licensed under the Apache License, Version 2.0 (the "License");
// | You may not use this work except in compliance with the License.
// | You may obtain a copy of the License in the LICENSE file, or at:
// |
// | http://www.apache.org/licenses/LICENSE-2.0
// |
// | Unless required by applicable law or agreed to in writing, software
// | distributed under the License is distributed on an "AS IS" BASIS,
// | WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// | See the License for the specific language governing permissions and
// | limitations under the License.
// +-------------------------------------------------------------------------

#include <sstream>
#include <string>

#include "boost/thread/once.hpp"

#include "base/LogMacros.h"
#include "base/Logging.h"
#include "configure/Initializer.h"
#include "configure/Options.h"
#include "transfer/MimeTypes.h"

using XF::Configure::Initializer;
using XF::Configure::Priority;
using XF::Configure::PriorityInitFuncPair;
using std::string;

// --------------------------------------------------------------------------
void LoggingInitializer() {
  const XF::Configure::Options &options = XF::Configure::Options::Instance();
  XF::Logging::Log &log = XF::Logging::Log::Instance();
  if (options.IsLogToConsole()) {
    log.Initialize();
  } else {
    log.Initialize(options.GetLogDirectory());
  }
  if (options.IsDebug()) {
    log.SetDebug(true);
  }
  log.SetLogLevel(options.GetLogLevel());
}

// --------------------------------------------------------------------------
void MimeTypesInitializer() {
  XF::Transfer::InitializeMimeTypes(XF::Transfer::FindMimeFile());
}

// --------------------------------------------------------------------------
void PrintOptions() {
  // Notice: this should only be invoked after logging initialization
  const XF::Configure::Options &options = XF::Configure::Options::Instance();
  std::stringstream ss;
  ss << "<<Options>> " << options;
  DebugInfo(ss.str());
}

namespace {

// Register the initializers
static Initializer logInitializer(PriorityInitFuncPair(Priority::First,
                                                       LoggingInitializer));
static Initializer mimeTypesInitializer(
    PriorityInitFuncPair(Priority::Second, MimeTypesInitializer));

// Priority must be lower than log initializer
static Initializer printOptions(PriorityInitFuncPair(Priority::Third,
                                                     PrintOptions));

boost::once_flag initFromOptionsOnceFlag = BOOST_ONCE_INIT;

}  // namespace

namespace XF {

namespace Configure {

// Defined along with the registrations so that linking a caller of it keeps
// them in the binary.
void InitializeFromOptions() {
  boost::call_once(initFromOptionsOnceFlag, Initializer::RunInitializers);
}

}  // namespace Configure
}  // namespace XF
