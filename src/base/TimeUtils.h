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

#ifndef XFER_BASE_TIMEUTILS_H_
#define XFER_BASE_TIMEUTILS_H_

#include <time.h>

#include <string>

namespace XF {

namespace TimeUtils {

// Convert rfc822 GMT date to time in seconds
//
// @param  : date string in rfc822 GMT format
// @return : time in seconds
//
// Throw XFException if date is not in rfc822 GMT format.
time_t RFC822GMTToSeconds(const std::string &date);

// Convert time to rfc822 GMT date string
//
// @param  : time in seconds
// @return : date string in rfc822 GMT format
std::string SecondsToRFC822GMT(time_t time);

// Convert ISO 8601 UTC date to time in seconds
//
// @param  : date string, e.g. "2014-02-27T04:20:38.000Z"
// @return : time in seconds
//
// Fractional seconds are dropped, a "+hh:mm" or "-hh:mm" offset is applied.
// Throw XFException if date is not in ISO 8601 format.
time_t ISO8601ToSeconds(const std::string &date);

// Convert time to ISO 8601 UTC date string, e.g. "2014-02-27T04:20:38Z"
std::string SecondsToISO8601(time_t time);

// Parse a last modified time as the object storage service reports it,
// ISO 8601 in listings or rfc822 GMT in object headers
//
// @param  : date string
// @return : time in seconds
//
// Throw XFException if date is in neither format.
time_t ParseLastModified(const std::string &date);

}  // namespace TimeUtils
}  // namespace XF


#endif  // XFER_BASE_TIMEUTILS_H_
