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

#include "transfer/RequestParamsMapper.h"

#include <string>

namespace XF {

namespace Transfer {

namespace RequestParamsMapper {

using XF::Configure::CliParams;
using std::string;

namespace {

void CopyIfPresent(RequestParams *params, const string &paramName,
                   const CliParams &cliParams, const string &cliName) {
  CliParams::const_iterator it = cliParams.find(cliName);
  if (it != cliParams.end()) {
    (*params)[paramName] = it->second;
  }
}

void SetSSEParams(RequestParams *params, const CliParams &cliParams) {
  CopyIfPresent(params, "ServerSideEncryption", cliParams, "sse");
  CopyIfPresent(params, "SSEKMSKeyId", cliParams, "sse_kms_key_id");
}

void SetSSECParams(RequestParams *params, const CliParams &cliParams) {
  CopyIfPresent(params, "SSECustomerAlgorithm", cliParams, "sse_c");
  CopyIfPresent(params, "SSECustomerKey", cliParams, "sse_c_key");
}

void SetSSECCopySourceParams(RequestParams *params,
                             const CliParams &cliParams) {
  CopyIfPresent(params, "CopySourceSSECustomerAlgorithm", cliParams,
                "sse_c_copy_source");
  CopyIfPresent(params, "CopySourceSSECustomerKey", cliParams,
                "sse_c_copy_source_key");
}

}  // namespace

// --------------------------------------------------------------------------
void MapHeadObjectParams(RequestParams *params, const CliParams &cliParams) {
  SetSSECParams(params, cliParams);
}

// --------------------------------------------------------------------------
void MapGetObjectParams(RequestParams *params, const CliParams &cliParams) {
  SetSSECParams(params, cliParams);
}

// --------------------------------------------------------------------------
void MapPutObjectParams(RequestParams *params, const CliParams &cliParams) {
  SetSSEParams(params, cliParams);
  SetSSECParams(params, cliParams);
}

// --------------------------------------------------------------------------
void MapCopyObjectParams(RequestParams *params, const CliParams &cliParams) {
  SetSSEParams(params, cliParams);
  SetSSECParams(params, cliParams);
  SetSSECCopySourceParams(params, cliParams);
}

// --------------------------------------------------------------------------
void MapCreateMultipartUploadParams(RequestParams *params,
                                    const CliParams &cliParams) {
  SetSSEParams(params, cliParams);
  SetSSECParams(params, cliParams);
}

// --------------------------------------------------------------------------
void MapUploadPartParams(RequestParams *params, const CliParams &cliParams) {
  SetSSECParams(params, cliParams);
}

// --------------------------------------------------------------------------
void MapUploadPartCopyParams(RequestParams *params,
                             const CliParams &cliParams) {
  SetSSECParams(params, cliParams);
  SetSSECCopySourceParams(params, cliParams);
}

}  // namespace RequestParamsMapper
}  // namespace Transfer
}  // namespace XF
