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

#include "base/Utils.h"

#include <errno.h>
#include <stdlib.h>  // for free
#include <string.h>  // for strerror, strdup

#include <dirent.h>  // for opendir readdir
#include <libgen.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>  // for access

#include <string>
#include <utility>

#include "boost/scope_exit.hpp"

#include "base/StringUtils.h"
#include "configure/Default.h"

namespace XF {

namespace Utils {

using XF::StringUtils::FormatPath;
using std::make_pair;
using std::pair;
using std::string;

static const char PATH_DELIM = '/';

namespace {

string PostErrMsg(const string &path) {
  return string(": ") + strerror(errno) + " " + FormatPath(path);
}

}  // namespace

// --------------------------------------------------------------------------
int MakeDirectories(const string &path, mode_t mode) {
  if (path.empty()) {
    return ENOENT;
  }

  string::size_type pos = (path[0] == PATH_DELIM) ? 1 : 0;
  while (pos != string::npos) {
    pos = path.find(PATH_DELIM, pos);
    string prefix = path.substr(0, pos);
    if (pos != string::npos) {
      ++pos;
    }
    if (prefix.empty() || prefix[prefix.size() - 1] == PATH_DELIM) {
      continue;  // duplicated delimiter
    }
    if (mkdir(prefix.c_str(), mode) != 0 && errno != EEXIST) {
      return errno;
    }
  }
  return 0;
}

// --------------------------------------------------------------------------
bool CreateDirectoryIfNotExists(const string &path) {
  if (path.empty()) {
    return false;
  }
  if (IsRootDirectory(path)) {
    return true;
  }
  int errorCode =
      MakeDirectories(path, XF::Configure::Default::GetDefineDirMode());
  return errorCode == 0 && IsDirectory(path).first;
}

// --------------------------------------------------------------------------
bool RemoveFileIfExists(const string &path) {
  int errorCode = unlink(path.c_str());
  return (errorCode == 0 || errno == ENOENT);
}

// --------------------------------------------------------------------------
pair<bool, string> DeleteFilesInDirectory(const std::string &path,
                                          bool deleteSelf) {
  bool success = true;
  string msg;

  DIR *dir = opendir(path.c_str());
  BOOST_SCOPE_EXIT((dir)) {
    if (dir) {
      closedir(dir);
      dir = NULL;
    }
  }
  BOOST_SCOPE_EXIT_END

  if (dir) {
    struct dirent *nextDir = NULL;
    while ((nextDir = readdir(dir)) != NULL) {
      if (strcmp(nextDir->d_name, ".") == 0 ||
          strcmp(nextDir->d_name, "..") == 0) {
        continue;
      }

      string fullPath = AppendPathDelim(path) + nextDir->d_name;
      struct stat st;
      if (lstat(fullPath.c_str(), &st) != 0) {
        success = false;
        msg.assign("Could not get stats of file " + PostErrMsg(fullPath));
        break;
      }

      if (S_ISDIR(st.st_mode)) {
        pair<bool, string> outcome = DeleteFilesInDirectory(fullPath, true);
        if (!outcome.first) {
          success = false;
          msg.assign(outcome.second);
          break;
        }
      } else if (unlink(fullPath.c_str()) != 0) {
        success = false;
        msg.assign("Could not remove file " + PostErrMsg(fullPath));
        break;
      }
    }
  } else {
    success = false;
    msg.assign("Could not open directory " + PostErrMsg(path));
  }

  if (success && deleteSelf && rmdir(path.c_str()) != 0) {
    success = false;
    msg.assign("Could not remove dir " + PostErrMsg(path));
  }

  return make_pair(success, msg);
}

// --------------------------------------------------------------------------
bool FileExists(const string &path) {
  int errorCode = access(path.c_str(), F_OK);
  return errorCode == 0;
}

// --------------------------------------------------------------------------
pair<bool, string> IsDirectory(const string &path) {
  bool success = true;
  string msg;

  struct stat stBuf;
  if (stat(path.c_str(), &stBuf) != 0) {
    msg.assign("Unable to access path " + PostErrMsg(path));
    success = false;
  } else {
    success = S_ISDIR(stBuf.st_mode);
  }

  return make_pair(success, msg);
}

// --------------------------------------------------------------------------
bool IsRootDirectory(const std::string &path) { return path == "/"; }

// --------------------------------------------------------------------------
string AppendPathDelim(const string &path) {
  string cpy(path);
  if (path.empty() || path[path.size() - 1] != PATH_DELIM) {
    cpy.append(1, PATH_DELIM);
  }
  return cpy;
}

// --------------------------------------------------------------------------
string GetDirName(const string &path) {
  if (IsRootDirectory(path)) {
    return path;
  }

  // dirname may modify its argument
  char *cpy = strdup(path.c_str());
  string ret = AppendPathDelim(dirname(cpy));
  free(cpy);
  return ret;
}

// --------------------------------------------------------------------------
string GetBaseName(const string &path) {
  char *cpy = strdup(path.c_str());
  string ret(basename(cpy));
  free(cpy);
  return ret;
}

// --------------------------------------------------------------------------
uid_t GetProcessEffectiveUserID() {
  static uid_t uid = geteuid();
  return uid;
}

}  // namespace Utils
}  // namespace XF
