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

#include "transfer/ObjectPath.h"

#include <errno.h>
#include <limits.h>  // for PATH_MAX
#include <string.h>  // for strerror
#include <unistd.h>  // for getcwd

#include <string>
#include <utility>
#include <vector>

#include "boost/tokenizer.hpp"

#include "base/Exception.h"
#include "transfer/Constants.h"

namespace XF {

namespace Transfer {

using XF::Exception::OSError;
using XF::Transfer::Constants::BucketKeyDelim;
using std::make_pair;
using std::pair;
using std::string;
using std::vector;

namespace {

const char *const S3Scheme = "s3://";

// Split an absolute path into normalized components
vector<string> SplitPath(const string &path) {
  typedef boost::tokenizer<boost::char_separator<char> > Tokenizer;
  boost::char_separator<char> sep("/");
  Tokenizer tokens(path, sep);
  vector<string> components;
  for (Tokenizer::iterator it = tokens.begin(); it != tokens.end(); ++it) {
    if (*it == ".") continue;
    if (*it == "..") {
      // ".." of root is root
      if (!components.empty()) components.pop_back();
      continue;
    }
    components.push_back(*it);
  }
  return components;
}

string GetCurrentDirectory() {
  char buf[PATH_MAX];
  if (getcwd(buf, sizeof(buf)) == NULL) {
    throw OSError(errno, string("Unable to get current directory: ") +
                             strerror(errno));
  }
  return buf;
}

string ToAbsolutePath(const string &path) {
  if (!path.empty() && path[0] == '/') {
    return path;
  }
  return GetCurrentDirectory() + "/" + path;
}

// Same as RelativePath, but without the file name part
string RelativeDirectory(const string &dir, const string &start) {
  vector<string> to = SplitPath(dir);
  vector<string> from = SplitPath(start);
  size_t common = 0;
  while (common < to.size() && common < from.size() &&
         to[common] == from[common]) {
    ++common;
  }

  string rel;
  for (size_t i = common; i < from.size(); ++i) {
    rel += rel.empty() ? ".." : "/..";
  }
  for (size_t i = common; i < to.size(); ++i) {
    if (!rel.empty()) rel += "/";
    rel += to[i];
  }
  return rel.empty() ? string(".") : rel;
}

}  // namespace

// --------------------------------------------------------------------------
pair<string, string> FindBucketKey(const string &path) {
  string::size_type pos = path.find(BucketKeyDelim);
  if (pos == string::npos) {
    return make_pair(path, string());
  }
  return make_pair(path.substr(0, pos), path.substr(pos + 1));
}

// --------------------------------------------------------------------------
pair<string, string> SplitS3BucketKey(const string &path) {
  string scheme(S3Scheme);
  if (path.compare(0, scheme.size(), scheme) == 0) {
    return FindBucketKey(path.substr(scheme.size()));
  }
  return FindBucketKey(path);
}

// --------------------------------------------------------------------------
string RelativePath(const string &path, const string &start) {
  string absPath = ToAbsolutePath(path);
  string::size_type pos = absPath.find_last_of('/');
  string dir = pos == 0 ? string("/") : absPath.substr(0, pos);
  string name = absPath.substr(pos + 1);
  return RelativeDirectory(dir, ToAbsolutePath(start)) + "/" + name;
}

}  // namespace Transfer
}  // namespace XF
