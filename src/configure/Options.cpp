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

#include "configure/Options.h"

#include <ostream>
#include <string>

#include "boost/foreach.hpp"

#include "base/LogLevel.h"
#include "base/SizeUtils.h"
#include "configure/Default.h"

namespace XF {

namespace Configure {

using XF::Configure::Default::GetDefaultListPageSize;
using XF::Configure::Default::GetDefaultLogDirectory;
using XF::Configure::Default::GetDefaultLogLevelName;
using XF::Configure::Default::GetDefaultMaxPriority;
using XF::Configure::Default::GetDefaultMaxQueueSize;
using XF::Configure::Default::GetDefaultMultipartChunkSize;
using XF::Configure::Default::GetDefaultMultipartThreshold;
using XF::Logging::GetLogLevelByName;
using XF::Logging::GetLogLevelName;
using XF::SizeUtils::HumanReadableSize;
using std::ostream;
using std::string;

// --------------------------------------------------------------------------
Options::Options()
    : m_logDirectory(GetDefaultLogDirectory()),
      m_logLevel(GetLogLevelByName(GetDefaultLogLevelName())),
      m_debug(false),
      m_logToConsole(false),
      m_multipartChunkSize(GetDefaultMultipartChunkSize()),
      m_multipartThreshold(GetDefaultMultipartThreshold()),
      m_maxQueueSize(GetDefaultMaxQueueSize()),
      m_maxPriority(GetDefaultMaxPriority()),
      m_listPageSize(GetDefaultListPageSize()),
      m_mimeFile(),
      m_encryptionParams() {}

// --------------------------------------------------------------------------
ostream &operator<<(ostream &os, const Options &opts) {
  os << "[log directory: " << opts.m_logDirectory << "] "
     << "[log level: " << GetLogLevelName(opts.m_logLevel) << "] "
     << std::boolalpha << "[debug: " << opts.m_debug << "] "
     << "[console: " << opts.m_logToConsole << "] "
     << "[multipart chunksize: " << HumanReadableSize(opts.m_multipartChunkSize)
     << "] "
     << "[multipart threshold: " << HumanReadableSize(opts.m_multipartThreshold)
     << "] "
     << "[max queue size: " << opts.m_maxQueueSize << "] "
     << "[max priority: " << opts.m_maxPriority << "] "
     << "[page size: " << opts.m_listPageSize << "] "
     << "[mime file: " << opts.m_mimeFile << "]";

  typedef CliParams::value_type Param;
  BOOST_FOREACH(const Param &param, opts.m_encryptionParams) {
    // never print keys
    bool isKey = param.first == "sse_c_key" ||
                 param.first == "sse_c_copy_source_key";
    os << " [" << param.first << ": " << (isKey ? "****" : param.second)
       << "]";
  }
  return os;
}

}  // namespace Configure
}  // namespace XF
