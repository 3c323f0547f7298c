// Copyright (c) 2013-2024 LG Electronics, Inc.
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

#include <util/JUtil.h>
#include <util/Logging.h>

// Keeps the first reason pbnjson gives for rejecting a document
class ParseFailureCollector: public pbnjson::JErrorHandler {
public:
    ParseFailureCollector()
        : m_failed(false)
    {
    }

    bool failed() const
    {
        return m_failed;
    }

    const std::string& reason() const
    {
        return m_reason;
    }

    virtual void syntax(pbnjson::JParser*, SyntaxError code, const std::string& reason)
    {
        LOG_WARNING_PAIRS(LOGID_JSON_PARSE_SYNTX_ERR, 2, PMLOGKFV("ERRCODE", "%d", code), PMLOGKS("REASON", reason.c_str()), "");
        fail(reason);
    }

    virtual void schema(pbnjson::JParser*, SchemaError, const std::string&)
    {
    }

    virtual void misc(pbnjson::JParser*, const std::string& reason)
    {
        LOG_WARNING_PAIRS(LOGID_JSON_PARSE_MISC_ERR, 1, PMLOGKS("REASON", reason.c_str()), "");
        fail(reason);
    }

    virtual void badObject(pbnjson::JParser*, BadObject) { fail("bad object"); }
    virtual void badArray(pbnjson::JParser*, BadArray) { fail("bad array"); }
    virtual void badString(pbnjson::JParser*, const std::string&) { fail("bad string"); }
    virtual void badNumber(pbnjson::JParser*, const std::string&) { fail("bad number"); }
    virtual void badBoolean(pbnjson::JParser*) { fail("bad boolean"); }
    virtual void badNull(pbnjson::JParser*) { fail("bad null"); }

    virtual void parseFailed(pbnjson::JParser*, const std::string& reason)
    {
        LOG_WARNING_PAIRS(LOGID_JSON_PARSE_FAIL, 1, PMLOGKS("ERRTEXT", reason.c_str()), "");
        fail(reason);
    }

private:
    void fail(const std::string& reason)
    {
        if (!m_failed && !reason.empty())
            m_reason = reason;
        m_failed = true;
    }

    bool m_failed;
    std::string m_reason;
};

//static
pbnjson::JValue JUtil::parse(const char* rawData, std::string* r_reason)
{
    if (!rawData) {
        if (r_reason)
            *r_reason = "no data";
        return pbnjson::JValue();
    }

    ParseFailureCollector collector;
    pbnjson::JDomParser parser;
    if (!parser.parse(rawData, pbnjson::JSchemaFragment("{}"), &collector) || collector.failed()) {
        if (r_reason)
            *r_reason = collector.reason().empty() ? "malformed json" : collector.reason();
        return pbnjson::JValue();
    }
    return parser.getDom();
}

//static
std::string JUtil::toSimpleString(pbnjson::JValue json)
{
    return pbnjson::JGenerator::serialize(json, pbnjson::JSchemaFragment("{}"));
}

//static
std::string JUtil::getString(const pbnjson::JValue& obj, const char* key, const std::string& fallback)
{
    if (!obj.isObject() || !obj.hasKey(key) || !obj[key].isString())
        return fallback;
    return obj[key].asString();
}

//static
int64_t JUtil::getInt64(const pbnjson::JValue& obj, const char* key, int64_t fallback)
{
    if (!obj.isObject() || !obj.hasKey(key) || !obj[key].isNumber())
        return fallback;
    return obj[key].asNumber<int64_t>();
}

//static
bool JUtil::getBool(const pbnjson::JValue& obj, const char* key, bool fallback)
{
    if (!obj.isObject() || !obj.hasKey(key) || !obj[key].isBoolean())
        return fallback;
    return obj[key].asBool();
}
