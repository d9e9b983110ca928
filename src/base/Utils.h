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

#ifndef XFER_BASE_UTILS_H_
#define XFER_BASE_UTILS_H_

#include <sys/stat.h>
#include <sys/types.h>

#include <string>
#include <utility>

namespace XF {

namespace Utils {

// Create directory and all missing parents
//
// @param  : dir path, mode of created dirs
// @return : 0 or errno of the first failing mkdir
//
// EEXIST of any level is not a failure, so a path which exists as a
// regular file also returns 0.
int MakeDirectories(const std::string &path, mode_t mode);

// Create directory recursively if it doesn't exists
//
// @param  : dir path
// @return : true if path is a directory afterwards
bool CreateDirectoryIfNotExists(const std::string &path);

// Remove file if it exists
//
// @param  : file path
// @return : bool
bool RemoveFileIfExists(const std::string &path);

// Delete files in dir recursively
//
// @param  : dir path, flag to delete dir itself
// @return : a pair of {true,""} or {false, message}
//
std::pair<bool, std::string> DeleteFilesInDirectory(const std::string &path,
                                                    bool deleteDirectorySelf);

// Check if file exists
bool FileExists(const std::string &path);

// Check if file is a directory
std::pair<bool, std::string> IsDirectory(const std::string &path);

// Check if path is root
bool IsRootDirectory(const std::string &path);

// Append delim to path
//
// @param  : file path
// @return : path appended
std::string AppendPathDelim(const std::string &path);

// Get dir name where the file belongs to
//
// @param  : file path
// @return : dir name ending with "/"
//
// For a path without any "/" return "./"
std::string GetDirName(const std::string &path);

// Get file name from file path
//
// @param  : file path
// @return : file name
std::string GetBaseName(const std::string &path);

// Get calling process effective user id
uid_t GetProcessEffectiveUserID();

}  // namespace Utils
}  // namespace XF

#endif  // XFER_BASE_UTILS_H_
