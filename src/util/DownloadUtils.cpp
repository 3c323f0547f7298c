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

#include <util/DownloadUtils.h>

std::string trimWhitespace(const std::string& s, const std::string& drop)
{
    std::string::size_type first = s.find_first_not_of(drop);
    if (first == std::string::npos)
        return std::string();
    return s.substr(first, s.find_last_not_of(drop) - first + 1);
}

bool splitExtension(const std::string& filename, std::string& r_stem, std::string& r_extension)
{
    std::string::size_type dot = filename.rfind('.');
    if (dot == std::string::npos || dot == 0 || dot + 1 == filename.size())
        return false;

    r_stem = filename.substr(0, dot);
    r_extension = filename.substr(dot + 1);
    return true;
}

std::string filenameStem(const std::string& filename)
{
    std::string::size_type dot = filename.find('.');
    if (dot == std::string::npos)
        return filename;
    return filename.substr(0, dot);
}

std::string joinPath(const std::string& dir, const std::string& name)
{
    if (dir.empty())
        return name;
    if (dir[dir.size() - 1] == '/')
        return dir + name;
    return dir + "/" + name;
}
