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

#ifndef UTIL_DOWNLOADUTILS_H_
#define UTIL_DOWNLOADUTILS_H_

#include <string>

std::string trimWhitespace(const std::string& s, const std::string& drop = "\r\n\t ");

// "a.tar.gz" -> ("a.tar", "gz"). False for names without an extension,
// dot-files and names ending in a dot.
bool splitExtension(const std::string& filename, std::string& r_stem, std::string& r_extension);

// Name up to the first dot, the record id for files laid down by the queue
std::string filenameStem(const std::string& filename);

// dir + "/" + name, without doubling the separator
std::string joinPath(const std::string& dir, const std::string& name);

#endif /* UTIL_DOWNLOADUTILS_H_ */
