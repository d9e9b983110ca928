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

#ifndef XFER_TRANSFER_REQUESTPARAMSMAPPER_H_
#define XFER_TRANSFER_REQUESTPARAMSMAPPER_H_

#include <map>
#include <string>

#include "configure/Options.h"

namespace XF {

namespace Transfer {

// Parameters of a remote request, e.g. {"SSECustomerAlgorithm": "AES256"}
typedef std::map<std::string, std::string> RequestParams;

//
// Map the encryption parameters given on command line to the parameters of
// each remote request. A parameter absent from cliParams is never set.
//
namespace RequestParamsMapper {

void MapHeadObjectParams(RequestParams *params,
                         const XF::Configure::CliParams &cliParams);
void MapGetObjectParams(RequestParams *params,
                        const XF::Configure::CliParams &cliParams);
void MapPutObjectParams(RequestParams *params,
                        const XF::Configure::CliParams &cliParams);
void MapCopyObjectParams(RequestParams *params,
                         const XF::Configure::CliParams &cliParams);
void MapCreateMultipartUploadParams(RequestParams *params,
                                    const XF::Configure::CliParams &cliParams);
void MapUploadPartParams(RequestParams *params,
                         const XF::Configure::CliParams &cliParams);
void MapUploadPartCopyParams(RequestParams *params,
                             const XF::Configure::CliParams &cliParams);

}  // namespace RequestParamsMapper
}  // namespace Transfer
}  // namespace XF

#endif  // XFER_TRANSFER_REQUESTPARAMSMAPPER_H_
