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

#ifndef XFER_TRANSFER_MIMETYPES_H_
#define XFER_TRANSFER_MIMETYPES_H_

#include <string.h>  // for strcasecmp

#include <map>
#include <string>

#include "base/Singleton.hpp"

namespace XF {

namespace Transfer {

// Load mime types from the file, or the built-in table if the file is empty
// or cannot be read. Only the first call of the process takes effect.
void InitializeMimeTypes(const std::string &mimeFile);

// Load mime types from FindMimeFile if they are not loaded yet
void InitializeMimeTypesOnFirstUse();

// Get the mime file of Options, else the first existing default mime file,
// else an empty string for the built-in table
std::string FindMimeFile();

struct CaseInsensitiveCmp {
  bool operator()(const std::string &lhs, const std::string &rhs) const {
    return strcasecmp(lhs.c_str(), rhs.c_str()) < 0;
  }
};

typedef std::map<std::string, std::string, CaseInsensitiveCmp> ExtToMimetypeMap;
typedef ExtToMimetypeMap::const_iterator ExtToMimetypeMapConstIterator;

class MimeTypes : public Singleton<MimeTypes> {
 public:
  ~MimeTypes() {}

 public:
  // Find Mime Type by extension
  //
  // @param  : ext, without the leading '.'
  // @return : mime type, or empty string if not found
  std::string Find(const std::string &ext) const;

  size_t Size() const { return m_extToMimeTypeMap.size(); }

 private:
  MimeTypes() {}
  void Initialize(const std::string &mimeFile);
  void DoDefaultInitialize();
  static void LoadOnFirstUse();

  // extension to mime type map
  ExtToMimetypeMap m_extToMimeTypeMap;

  friend class Singleton<MimeTypes>;
  friend void InitializeMimeTypes(const std::string &mimeFile);
  friend void InitializeMimeTypesOnFirstUse();
};

// Guess the content type of a file from its name
//
// @param  : file path or object key, e.g. "dir/index.html"
// @return : e.g. "text/html", or empty string if unknown
//
// Mime types are loaded on first use if they were not initialized.
std::string GuessContentType(const std::string &path);

}  // namespace Transfer
}  // namespace XF


#endif  // XFER_TRANSFER_MIMETYPES_H_
