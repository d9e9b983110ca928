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

#ifndef XFER_BASE_LOGMACROS_H_
#define XFER_BASE_LOGMACROS_H_

#include "glog/logging.h"

#include "base/LogLevel.h"
#include "base/Logging.h"

#ifdef DISABLE_XFER_LOGGING
#define Info(msg)
#define Warning(msg)
#define Error(msg)
#define Fatal(msg)

#define InfoIf(condition, msg)
#define WarningIf(condition, msg)
#define ErrorIf(condition, msg)
#define FatalIf(condition, msg)

#define DebugInfo(msg)
#define DebugWarning(msg)
#define DebugError(msg)
#define DebugFatal(msg)

#define DebugInfoIf(condition, msg)
#define DebugWarningIf(condition, msg)
#define DebugErrorIf(condition, msg)
#define DebugFatalIf(condition, msg)

#else  // !DISABLE_XFER_LOGGING

#define XFER_LOG_PREFIX(level) \
  XF::Logging::GetLogLevelPrefix(XF::Logging::LogLevel::level)

// glog buffers the INFO stream, flush it after every non-fatal message so the
// log file always holds the latest output (tests read it back).
#define XFER_LOG(severity, level, msg)                 \
  {                                                    \
    LOG(severity) << XFER_LOG_PREFIX(level) << msg;    \
    google::FlushLogFiles(google::INFO);               \
  }

#define XFER_LOG_IF(severity, level, condition, msg)                 \
  {                                                                  \
    LOG_IF(severity, (condition)) << XFER_LOG_PREFIX(level) << msg;  \
    google::FlushLogFiles(google::INFO);                             \
  }

#define XFER_DEBUG_ONLY(statement)                \
  {                                               \
    if (XF::Logging::Log::Instance().IsDebug()) { \
      statement                                   \
    }                                             \
  }

#define Info(msg) XFER_LOG(INFO, Info, msg)
#define Warning(msg) XFER_LOG(WARNING, Warn, msg)
#define Error(msg) XFER_LOG(ERROR, Error, msg)
#define Fatal(msg) \
  { LOG(FATAL) << XFER_LOG_PREFIX(Fatal) << msg; }

#define InfoIf(condition, msg) XFER_LOG_IF(INFO, Info, condition, msg)
#define WarningIf(condition, msg) XFER_LOG_IF(WARNING, Warn, condition, msg)
#define ErrorIf(condition, msg) XFER_LOG_IF(ERROR, Error, condition, msg)
#define FatalIf(condition, msg) \
  { LOG_IF(FATAL, (condition)) << XFER_LOG_PREFIX(Fatal) << msg; }

#define DebugInfo(msg) XFER_DEBUG_ONLY(Info(msg))
#define DebugWarning(msg) XFER_DEBUG_ONLY(Warning(msg))
#define DebugError(msg) XFER_DEBUG_ONLY(Error(msg))
#define DebugFatal(msg) XFER_DEBUG_ONLY(Fatal(msg))

#define DebugInfoIf(condition, msg) XFER_DEBUG_ONLY(InfoIf(condition, msg))
#define DebugWarningIf(condition, msg) \
  XFER_DEBUG_ONLY(WarningIf(condition, msg))
#define DebugErrorIf(condition, msg) XFER_DEBUG_ONLY(ErrorIf(condition, msg))
#define DebugFatalIf(condition, msg) XFER_DEBUG_ONLY(FatalIf(condition, msg))

#endif  // DISABLE_XFER_LOGGING

#endif  // XFER_BASE_LOGMACROS_H_
