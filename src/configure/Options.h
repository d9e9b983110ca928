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

#ifndef XFER_CONFIGURE_OPTIONS_H_
#define XFER_CONFIGURE_OPTIONS_H_

#include <stddef.h>
#include <stdint.h>

#include <map>
#include <ostream>
#include <string>

#include "base/LogLevel.h"
#include "base/Singleton.hpp"

namespace XF {

namespace Configure {

namespace Parser {
void Parse(const std::string &options);
}  // namespace Parser

using XF::Logging::LogLevel;

// Flat map of cli parameter name to value, e.g. {"sse": "AES256"}
typedef std::map<std::string, std::string> CliParams;

class Options : public Singleton<Options> {
 public:
  ~Options() {}

 public:
  // accessor
  const std::string &GetLogDirectory() const { return m_logDirectory; }
  LogLevel::Value GetLogLevel() const { return m_logLevel; }
  bool IsDebug() const { return m_debug; }
  bool IsLogToConsole() const { return m_logToConsole; }
  uint64_t GetMultipartChunkSize() const { return m_multipartChunkSize; }
  uint64_t GetMultipartThreshold() const { return m_multipartThreshold; }
  size_t GetMaxQueueSize() const { return m_maxQueueSize; }
  int64_t GetMaxPriority() const { return m_maxPriority; }
  uint16_t GetListPageSize() const { return m_listPageSize; }
  const std::string &GetMimeFile() const { return m_mimeFile; }

  // Encryption parameters given on command line, keyed by cli name
  // (sse, sse_kms_key_id, sse_c, sse_c_key, sse_c_copy_source,
  // sse_c_copy_source_key). Only parameters which are set are present.
  const CliParams &GetEncryptionParams() const { return m_encryptionParams; }

 private:
  Options();

  // mutator
  void SetLogDirectory(const std::string &path) { m_logDirectory = path; }
  void SetLogLevel(LogLevel::Value level) { m_logLevel = level; }
  void SetDebug(bool debug) { m_debug = debug; }
  void SetLogToConsole(bool console) { m_logToConsole = console; }
  void SetMultipartChunkSize(uint64_t size) { m_multipartChunkSize = size; }
  void SetMultipartThreshold(uint64_t size) { m_multipartThreshold = size; }
  void SetMaxQueueSize(size_t size) { m_maxQueueSize = size; }
  void SetMaxPriority(int64_t priority) { m_maxPriority = priority; }
  void SetListPageSize(uint16_t size) { m_listPageSize = size; }
  void SetMimeFile(const std::string &path) { m_mimeFile = path; }
  void SetEncryptionParam(const std::string &name, const std::string &value) {
    m_encryptionParams[name] = value;
  }

  std::string m_logDirectory;
  LogLevel::Value m_logLevel;
  bool m_debug;
  bool m_logToConsole;
  uint64_t m_multipartChunkSize;  // requested part size in bytes
  uint64_t m_multipartThreshold;  // files above use multipart transfers
  size_t m_maxQueueSize;          // 0 for unbounded
  int64_t m_maxPriority;
  uint16_t m_listPageSize;  // max keys per list objects request
  std::string m_mimeFile;   // empty to search the default mime files
  CliParams m_encryptionParams;

  friend class Singleton<Options>;
  friend void XF::Configure::Parser::Parse(const std::string &options);
  friend std::ostream &operator<<(std::ostream &os, const Options &opts);
};

std::ostream &operator<<(std::ostream &os, const Options &opts);

}  // namespace Configure
}  // namespace XF

#endif  // XFER_CONFIGURE_OPTIONS_H_
