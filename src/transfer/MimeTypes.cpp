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

#include "transfer/MimeTypes.h"

#include <fstream>
#include <sstream>
#include <string>

#include "boost/bind.hpp"
#include "boost/foreach.hpp"
#include "boost/thread/once.hpp"

#include "base/LogMacros.h"
#include "base/Utils.h"
#include "configure/Default.h"
#include "configure/Options.h"

namespace XF {

namespace Transfer {

using XF::Configure::Default::GetMimeFiles;
using XF::Utils::FileExists;
using std::string;

static boost::once_flag initOnceFlag = BOOST_ONCE_INIT;

// --------------------------------------------------------------------------
void InitializeMimeTypes(const string &mimeFile) {
  MimeTypes &instance = MimeTypes::Instance();
  boost::call_once(initOnceFlag,
                   boost::bind(boost::type<void>(), &MimeTypes::Initialize,
                               &instance, mimeFile));
}

// --------------------------------------------------------------------------
void InitializeMimeTypesOnFirstUse() {
  boost::call_once(initOnceFlag, &MimeTypes::LoadOnFirstUse);
}

// --------------------------------------------------------------------------
string FindMimeFile() {
  string mimeFile = XF::Configure::Options::Instance().GetMimeFile();
  if (!mimeFile.empty()) {
    return mimeFile;
  }
  BOOST_FOREACH(const string &filePath, GetMimeFiles()) {
    if (FileExists(filePath)) {
      return filePath;
    }
  }
  return string();
}

// --------------------------------------------------------------------------
void MimeTypes::LoadOnFirstUse() {
  string mimeFile = FindMimeFile();
  Info("Mime types are loaded on first use from "
       << (mimeFile.empty() ? string("built-in table") : mimeFile)
       << ", later initialization takes no effect");
  Instance().Initialize(mimeFile);
}

// --------------------------------------------------------------------------
string MimeTypes::Find(const string &ext) const {
  ExtToMimetypeMapConstIterator it = m_extToMimeTypeMap.find(ext);
  return it != m_extToMimeTypeMap.end() ? it->second : string();
}

// --------------------------------------------------------------------------
void MimeTypes::Initialize(const string &mimeFile) {
  if (mimeFile.empty()) {
    DoDefaultInitialize();
    return;
  }
  std::ifstream file(mimeFile.c_str());
  if (!file) {
    Info("Unable to open file " + mimeFile + ", use built-in mime types");
    DoDefaultInitialize();
    return;
  }

  // line format: "text/html  html htm"
  string line;
  while (getline(file, line)) {
    if (line.empty() || line[0] == '#') continue;

    std::stringstream ss(line);
    string mimeType;
    ss >> mimeType;
    string ext;
    while (ss >> ext) {
      m_extToMimeTypeMap[ext] = mimeType;
    }
  }

  if (m_extToMimeTypeMap.empty()) {
    Info("No mime type found in " + mimeFile + ", use built-in mime types");
    DoDefaultInitialize();
  }
}

// --------------------------------------------------------------------------
void MimeTypes::DoDefaultInitialize() {
  m_extToMimeTypeMap["gz"] = "application/gzip";
  m_extToMimeTypeMap["jar"] = "application/java-archive";
  m_extToMimeTypeMap["js"] = "application/javascript";
  m_extToMimeTypeMap["json"] = "application/json";
  m_extToMimeTypeMap["doc"] = "application/msword";
  m_extToMimeTypeMap["bin"] = "application/octet-stream";
  m_extToMimeTypeMap["pdf"] = "application/pdf";
  m_extToMimeTypeMap["rtf"] = "application/rtf";
  m_extToMimeTypeMap["xml"] = "application/xml";
  m_extToMimeTypeMap["zip"] = "application/zip";
  m_extToMimeTypeMap["xls"] = "application/vnd.ms-excel";
  m_extToMimeTypeMap["ppt"] = "application/vnd.ms-powerpoint";
  m_extToMimeTypeMap["7z"] = "application/x-7z-compressed";
  m_extToMimeTypeMap["bz2"] = "application/x-bzip2";
  m_extToMimeTypeMap["iso"] = "application/x-iso9660-image";
  m_extToMimeTypeMap["sh"] = "application/x-sh";
  m_extToMimeTypeMap["tar"] = "application/x-tar";
  m_extToMimeTypeMap["flac"] = "audio/flac";
  m_extToMimeTypeMap["mp3"] = "audio/mpeg";
  m_extToMimeTypeMap["ogg"] = "audio/ogg";
  m_extToMimeTypeMap["wav"] = "audio/x-wav";
  m_extToMimeTypeMap["bmp"] = "image/bmp";
  m_extToMimeTypeMap["gif"] = "image/gif";
  m_extToMimeTypeMap["jpeg"] = "image/jpeg";
  m_extToMimeTypeMap["jpg"] = "image/jpeg";
  m_extToMimeTypeMap["png"] = "image/png";
  m_extToMimeTypeMap["svg"] = "image/svg+xml";
  m_extToMimeTypeMap["tif"] = "image/tiff";
  m_extToMimeTypeMap["tiff"] = "image/tiff";
  m_extToMimeTypeMap["ico"] = "image/vnd.microsoft.icon";
  m_extToMimeTypeMap["css"] = "text/css";
  m_extToMimeTypeMap["csv"] = "text/csv";
  m_extToMimeTypeMap["htm"] = "text/html";
  m_extToMimeTypeMap["html"] = "text/html";
  m_extToMimeTypeMap["md"] = "text/markdown";
  m_extToMimeTypeMap["txt"] = "text/plain";
  m_extToMimeTypeMap["log"] = "text/plain";
  m_extToMimeTypeMap["c"] = "text/x-csrc";
  m_extToMimeTypeMap["h"] = "text/x-chdr";
  m_extToMimeTypeMap["cpp"] = "text/x-c++src";
  m_extToMimeTypeMap["py"] = "text/x-python";
  m_extToMimeTypeMap["mp4"] = "video/mp4";
  m_extToMimeTypeMap["mpeg"] = "video/mpeg";
  m_extToMimeTypeMap["mov"] = "video/quicktime";
  m_extToMimeTypeMap["webm"] = "video/webm";
  m_extToMimeTypeMap["avi"] = "video/x-msvideo";
}

// --------------------------------------------------------------------------
string GuessContentType(const string &path) {
  InitializeMimeTypesOnFirstUse();

  string name = XF::Utils::GetBaseName(path);

  string::size_type dotPos = name.find_last_of('.');
  // no extension, or a hidden file such as ".bashrc"
  if (dotPos == string::npos || dotPos == 0 || dotPos + 1 == name.size()) {
    return string();
  }
  return MimeTypes::Instance().Find(name.substr(dotPos + 1));
}

}  // namespace Transfer
}  // namespace XF
