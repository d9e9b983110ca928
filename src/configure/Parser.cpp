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

#include "configure/Parser.h"

#include <stdint.h>

#include <iostream>
#include <string>

#include "boost/exception/to_string.hpp"
#include "boost/foreach.hpp"
#include "boost/lexical_cast.hpp"
#include "boost/tokenizer.hpp"

#include "base/Exception.h"
#include "base/LogLevel.h"
#include "base/SizeUtils.h"
#include "base/StringUtils.h"
#include "configure/Default.h"
#include "configure/Options.h"

namespace XF {

namespace Configure {

namespace Parser {

namespace {

using boost::to_string;
using XF::Configure::Default::GetDefaultListPageSize;
using XF::Configure::Default::GetDefaultMaxPriority;
using XF::Configure::Default::GetDefaultMultipartChunkSize;
using XF::Configure::Default::GetDefaultMultipartThreshold;
using XF::Exception::XFException;
using XF::SizeUtils::HumanReadableToBytes;
using XF::StringUtils::Trim;
using std::string;

typedef boost::tokenizer<boost::char_separator<char> > Tokenizer;

void PrintWarnMsg(const string &opt, const string &invalidVal,
                  const string &defaultVal) {
  std::cerr << "[" << XF::Configure::Default::GetProgramName()
            << "] invalid parameter in option " << opt << "=" << invalidVal
            << ", " << defaultVal << " is used." << std::endl;
}

int64_t ToInteger(const string &key, const string &value) {
  try {
    return boost::lexical_cast<int64_t>(value);
  } catch (const boost::bad_lexical_cast &) {
    throw XFException("Invalid integer value in option " + key + "=" + value);
  }
}

void RequireValue(const string &key, const string &value) {
  if (value.empty()) {
    throw XFException("Missing value for option " + key);
  }
}

void CheckEncryptionAlgorithm(const string &key, const string &value,
                              bool allowKms) {
  if (value == "AES256" || (allowKms && value == "aws:kms")) {
    return;
  }
  throw XFException("Invalid value in option " + key + "=" + value +
                    (allowKms ? ", expect AES256 or aws:kms"
                              : ", expect AES256"));
}

}  // namespace

void Parse(const string &options) {
  Options &opts = Options::Instance();

  boost::char_separator<char> sep(",");
  Tokenizer tokens(options, sep);
  BOOST_FOREACH(const string &token, tokens) {
    string option = Trim(token, ' ');
    if (option.empty()) {
      continue;
    }
    string::size_type pos = option.find('=');
    string key = Trim(option.substr(0, pos), ' ');
    string value =
        pos == string::npos ? string() : Trim(option.substr(pos + 1), ' ');
    if (key == "logdir") {
      RequireValue(key, value);
      opts.SetLogDirectory(value);
    } else if (key == "loglevel") {
      if (!XF::Logging::IsLogLevelName(value)) {
        PrintWarnMsg(key, value, Default::GetDefaultLogLevelName());
        opts.SetLogLevel(
            XF::Logging::GetLogLevelByName(Default::GetDefaultLogLevelName()));
      } else {
        opts.SetLogLevel(XF::Logging::GetLogLevelByName(value));
      }
    } else if (key == "debug") {
      opts.SetDebug(true);
    } else if (key == "console") {
      opts.SetLogToConsole(true);
    } else if (key == "multipart_chunksize") {
      RequireValue(key, value);
      uint64_t size = HumanReadableToBytes(value);
      if (size == 0) {
        PrintWarnMsg(key, value, to_string(GetDefaultMultipartChunkSize()));
        size = GetDefaultMultipartChunkSize();
      }
      opts.SetMultipartChunkSize(size);
    } else if (key == "multipart_threshold") {
      RequireValue(key, value);
      uint64_t size = HumanReadableToBytes(value);
      if (size == 0) {
        PrintWarnMsg(key, value, to_string(GetDefaultMultipartThreshold()));
        size = GetDefaultMultipartThreshold();
      }
      opts.SetMultipartThreshold(size);
    } else if (key == "max_queue_size") {
      RequireValue(key, value);
      int64_t size = ToInteger(key, value);
      if (size < 0) {
        PrintWarnMsg(key, value, to_string(Default::GetDefaultMaxQueueSize()));
        size = Default::GetDefaultMaxQueueSize();
      }
      opts.SetMaxQueueSize(static_cast<size_t>(size));
    } else if (key == "max_priority") {
      RequireValue(key, value);
      int64_t priority = ToInteger(key, value);
      if (priority < 0) {
        PrintWarnMsg(key, value, to_string(GetDefaultMaxPriority()));
        priority = GetDefaultMaxPriority();
      }
      opts.SetMaxPriority(priority);
    } else if (key == "page_size") {
      RequireValue(key, value);
      int64_t size = ToInteger(key, value);
      if (size <= 0 || size > GetDefaultListPageSize()) {
        PrintWarnMsg(key, value, to_string(GetDefaultListPageSize()));
        size = GetDefaultListPageSize();
      }
      opts.SetListPageSize(static_cast<uint16_t>(size));
    } else if (key == "mime_file") {
      RequireValue(key, value);
      opts.SetMimeFile(value);
    } else if (key == "sse") {
      CheckEncryptionAlgorithm(key, value, true);
      opts.SetEncryptionParam(key, value);
    } else if (key == "sse_c" || key == "sse_c_copy_source") {
      CheckEncryptionAlgorithm(key, value, false);
      opts.SetEncryptionParam(key, value);
    } else if (key == "sse_kms_key_id" || key == "sse_c_key" ||
               key == "sse_c_copy_source_key") {
      RequireValue(key, value);
      opts.SetEncryptionParam(key, value);
    } else {
      throw XFException("Unknown option " + key);
    }
  }
}

}  // namespace Parser
}  // namespace Configure
}  // namespace XF
