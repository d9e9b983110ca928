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

#include "base/LogLevel.h"

#include <string>

#include "base/StringUtils.h"

namespace XF {

namespace Logging {

using std::string;

namespace {

struct LevelName {
  LogLevel::Value level;
  const char *name;
};

const LevelName levelNames[] = {
    {LogLevel::Info, "INFO"},   {LogLevel::Warn, "WARN"},
    {LogLevel::Warn, "WARNING"}, {LogLevel::Error, "ERROR"},
    {LogLevel::Fatal, "FATAL"}};

const size_t levelNameCount = sizeof(levelNames) / sizeof(levelNames[0]);

// Return index into levelNames or levelNameCount if not found
size_t FindLevelName(const string &name) {
  string upper = XF::StringUtils::ToUpper(name);
  for (size_t i = 0; i < levelNameCount; ++i) {
    if (upper == levelNames[i].name) {
      return i;
    }
  }
  return levelNameCount;
}

}  // namespace

// --------------------------------------------------------------------------
string GetLogLevelName(LogLevel::Value logLevel) {
  for (size_t i = 0; i < levelNameCount; ++i) {
    if (levelNames[i].level == logLevel) {
      return levelNames[i].name;
    }
  }
  return string();
}

// --------------------------------------------------------------------------
LogLevel::Value GetLogLevelByName(const string &name) {
  size_t idx = FindLevelName(name);
  return idx == levelNameCount ? LogLevel::Info : levelNames[idx].level;
}

// --------------------------------------------------------------------------
bool IsLogLevelName(const string &name) {
  return FindLevelName(name) != levelNameCount;
}

// --------------------------------------------------------------------------
string GetLogLevelPrefix(LogLevel::Value logLevel) {
  return "[" + GetLogLevelName(logLevel) + "] ";
}

}  // namespace Logging
}  // namespace XF
