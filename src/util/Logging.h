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

#ifndef UTIL_LOGGING_H_
#define UTIL_LOGGING_H_

#include <PmLogLib.h>

/** LOGIDs */
#define LOGID_QUEUE_INIT                                "QUEUE_INIT"                         // init - queue reconciled and ready
#define LOGID_QUEUE_INIT_FAIL                           "QUEUE_INIT_FAIL"                    // init failed, queue left uninitialized
#define LOGID_QUEUE_TERMINATE                           "QUEUE_TERMINATE"                    // terminate - all tasks stopped
#define LOGID_QUEUE_NOT_INITIALIZED                     "QUEUE_NOT_INITIALIZED"              // public call rejected before init
#define LOGID_QUEUE_INVALID_CONFIG                      "QUEUE_INVALID_CONFIG"               // activeNetworkTypes given without a network monitor
#define LOGID_DOWNLOAD_START                            "DOWNLOAD_START"                     // start - transfer requested from provider
#define LOGID_DOWNLOAD_REVIVE                           "DOWNLOAD_REVIVE"                    // in-flight task re-attached at startup
#define LOGID_DOWNLOAD_COMPLETE                         "DOWNLOAD_COMPLETE"                  // complete - transfer done
#define LOGID_DOWNLOAD_PAUSE                            "DOWNLOAD_PAUSE"                     // pause - all tasks paused
#define LOGID_DOWNLOAD_RESUME                           "DOWNLOAD_RESUME"                    // resume - all tasks resumed
#define LOGID_DOWNLOAD_FAIL                             "DOWNLOAD_FAIL"                      // fail - transfer reported an error
#define LOGID_DOWNLOAD_RETRY                            "DOWNLOAD_RETRY"                     // retry - errored transfer restarted
#define LOGID_DOWNLOAD_ORPHAN_TASK                      "DOWNLOAD_ORPHAN_TASK"               // in-flight task without a record, stopped
#define LOGID_RECORD_REMOVE                             "RECORD_REMOVE"                      // record removed (eager)
#define LOGID_RECORD_LAZY_REMOVE                        "RECORD_LAZY_REMOVE"                 // record marked for deferred deletion
#define LOGID_RECORD_PURGE                              "RECORD_PURGE"                       // deferred deletion executed
#define LOGID_RECORD_PERSIST_FAIL                       "RECORD_PERSIST_FAIL"                // failed to write record to the store
#define LOGID_RECORD_PARSE_FAIL                         "RECORD_PARSE_FAIL"                  // persisted record could not be decoded
#define LOGID_ORPHAN_FILE_DELETE                        "ORPHAN_FILE_DELETE"                 // file without a record deleted at startup
#define LOGID_FILE_DELETE_FAIL                          "FILE_DELETE_FAIL"                   // unlink failed for reasons other than a missing file
#define LOGID_ROGUE_CALLBACK                            "ROGUE_CALLBACK"                     // task callback for a detached task or missing record
#define LOGID_DB_OPEN_ERROR                             "DB_OPEN_ERROR"                      // record db open error
#define LOGID_DB_INTEGRITY_ERROR                        "DB_INTEGRITY_ERROR"                 // failed to check record DB integrity and couldn't recreate it
#define LOGID_DB_RECREATION_FAIL                        "DB_RECREATION_FAIL"                 // failed to create QueueRecords table
#define LOGID_DB_STMT_PREPARE_FAIL                      "DB_STMT_PREPARE_FAIL"               // failed to prepare sql statement
#define LOGID_DB_EXEC_FAIL                              "DB_EXEC_FAIL"                       // failed to execute sql statement
#define LOGID_NETWORK_STATE_CHANGE                      "NETWORK_STATE_CHANGE"               // auto-pause decision flipped
#define LOGID_NETWORK_FETCH_FAIL                        "NETWORK_FETCH_FAIL"                 // current connectivity could not be fetched
#define LOGID_CNCTNMGR_GETSTUS_ERR                      "CNCTNMGR_GETSTUS_ERR"               // call to connectionmanager/getstatus failed
#define LOGID_CNCTNMGR_SERSTUS_PARM_MISS                "CNCTNMGR_SERSTUS_PARM_MISS"         // connectionmanager status reply without returnValue
#define LOGID_CONF_FILE_ERR                             "CONF_FILE_ERR"                      // conf file could not be loaded, defaults in use
#define LOGID_CONF_VALUE_INVALID                        "CONF_VALUE_INVALID"                 // conf value rejected, default kept
#define LOGID_JSON_PARSE_SYNTX_ERR                      "JSON_SYNTX_ERR"                     // json parse syntax error
#define LOGID_JSON_PARSE_MISC_ERR                       "JSON_MISC_ERR"                      // json parse misc error
#define LOGID_JSON_PARSE_FAIL                           "JSON_PARSE_FAIL"                    // json parse failed

/** use these for key-value pair printing with no free text format*/
#define LOG_WARNING_PAIRS_ONLY(...)     PmLogWarning(GetPmLogContext(), ##__VA_ARGS__, " ")
#define LOG_INFO_PAIRS_ONLY(...)        PmLogInfo(GetPmLogContext(), ##__VA_ARGS__, " ")

/** use these for key-value pair printing with free text format*/
#define LOG_ERROR_PAIRS(...)            PmLogError(GetPmLogContext(), ##__VA_ARGS__)
#define LOG_WARNING_PAIRS(...)          PmLogWarning(GetPmLogContext(), ##__VA_ARGS__)
#define LOG_INFO_PAIRS(...)             PmLogInfo(GetPmLogContext(), ##__VA_ARGS__)

/** use these for no pairs */
#define LOG_DEBUG(...)         PmLogDebug(GetPmLogContext(), ##__VA_ARGS__)

extern PmLogContext GetPmLogContext();

#endif // UTIL_LOGGING_H_
