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

#include <util/LocalFileStore.h>
#include <util/Logging.h>

#include <errno.h>
#include <string.h>
#include <sys/types.h>
#include <sys/stat.h>
#include <glib.h>
#include <glib/gstdio.h>

LocalFileStore::LocalFileStore()
{
}

LocalFileStore::~LocalFileStore()
{
}

bool LocalFileStore::exists(const std::string& path)
{
    if (path.empty())
        return false;

    struct stat buf;
    if (-1 == ::stat(path.c_str(), &buf))
        return false;
    return S_ISREG(buf.st_mode);
}

bool LocalFileStore::unlink(const std::string& path)
{
    if (path.empty())
        return false;

    if (g_remove(path.c_str()) == 0)
        return true;

    int err = errno;
    if (err == ENOENT)
        return true;

    LOG_WARNING_PAIRS(LOGID_FILE_DELETE_FAIL, 2, PMLOGKS("path", path.c_str()), PMLOGKS("error", strerror(err)), "");
    return false;
}

bool LocalFileStore::listDirectory(const std::string& path, std::vector<std::string>& r_names)
{
    GError* error = 0;
    GDir* dir = g_dir_open(path.c_str(), 0, &error);
    if (!dir) {
        bool missing = error && g_error_matches(error, G_FILE_ERROR, G_FILE_ERROR_NOENT);
        if (error) {
            if (!missing)
                LOG_DEBUG("%s: failed to open %s: %s", __FUNCTION__, path.c_str(), error->message);
            g_error_free(error);
        }
        return missing;
    }

    // g_dir_read_name skips "." and ".."
    const gchar* name = 0;
    while ((name = g_dir_read_name(dir)) != NULL)
        r_names.push_back(name);

    g_dir_close(dir);
    return true;
}

bool LocalFileStore::stat(const std::string& path, uint64_t& r_size)
{
    if (path.empty())
        return false;

    struct stat buf;
    if (-1 == ::stat(path.c_str(), &buf))
        return false;

    r_size = (uint64_t) buf.st_size;
    return true;
}

bool LocalFileStore::makeDirectory(const std::string& path)
{
    if (path.empty())
        return false;

    if (g_mkdir_with_parents(path.c_str(), 0755) != 0) {
        LOG_DEBUG("%s: failed to create %s: %s", __FUNCTION__, path.c_str(), strerror(errno));
        return false;
    }
    return true;
}
