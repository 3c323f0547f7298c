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

#include <util/UrlRep.h>
#include <util/DownloadUtils.h>

#include <glib.h>

static std::string unescape(const std::string& s)
{
    gchar* raw = g_uri_unescape_string(s.c_str(), NULL);
    if (!raw)
        return s;
    std::string result(raw);
    g_free(raw);
    return result;
}

UrlRep UrlRep::fromUrl(const char* uri)
{
    if (!uri)
        return UrlRep();
    return fromUrl(std::string(uri));
}

UrlRep UrlRep::fromUrl(const std::string& uri)
{
    UrlRep rep;

    std::string::size_type schemeEnd = uri.find("://");
    if (schemeEnd == std::string::npos || schemeEnd == 0)
        return rep;

    rep.m_scheme = uri.substr(0, schemeEnd);

    // query and fragment never name the file
    std::string rest = uri.substr(schemeEnd + 3);
    std::string::size_type cut = rest.find_first_of("?#");
    if (cut != std::string::npos)
        rest.erase(cut);

    std::string::size_type pathPos = rest.find('/');
    rep.m_path = (pathPos == std::string::npos) ? std::string("/") : rest.substr(pathPos);
    rep.m_fileName = unescape(rep.m_path.substr(rep.m_path.rfind('/') + 1));

    rep.m_valid = true;
    return rep;
}

std::string UrlRep::resourceExtension() const
{
    if (!m_valid || m_fileName.empty())
        return "";

    std::string stem;
    std::string extension;
    if (!splitExtension(m_fileName, stem, extension) || extension.size() > MAX_EXTENSION_LENGTH)
        return "";

    for (std::string::size_type i = 0; i < extension.size(); ++i) {
        if (!g_ascii_isalnum(extension[i]))
            return "";
    }
    return extension;
}
