// Copyright (c) 2012-2024 LG Electronics, Inc.
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
// http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.
//
// SPDX-License-Identifier: Apache-2.0

#include <util/Logging.h>

static const char* s_logContextName = "DownloadQueue";

PmLogContext GetPmLogContext()
{
    static PmLogContext s_logContext = 0;
    if (0 == s_logContext) {
        (void) PmLogGetContext(s_logContextName, &s_logContext);
    }
    return s_logContext;
}
