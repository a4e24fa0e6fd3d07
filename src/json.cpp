/*
 * rootledger - Single-Writer Result Ledger
 * Copyright (c) 2025 The rootledger Authors
 * SPDX-License-Identifier: MIT
 */

#include "rootledger/json.hpp"
#include <memory>
#include <sstream>

namespace rootledger {

namespace {
std::string writeWith(const Json::StreamWriterBuilder& builder, const Json::Value& value) {
    std::unique_ptr<Json::StreamWriter> writer(builder.newStreamWriter());
    std::ostringstream out;
    writer->write(value, &out);
    return out.str();
}
}

std::string canonicalJson(const Json::Value& value) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    builder["commentStyle"] = "None";
    builder["emitUTF8"] = true;
    builder["precision"] = 17;
    builder["precisionType"] = "significant";
    return writeWith(builder, value);
}

std::string prettyJson(const Json::Value& value) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "  ";
    builder["commentStyle"] = "None";
    builder["emitUTF8"] = true;
    builder["precision"] = 17;
    return writeWith(builder, value);
}

bool parseJson(const std::string& text, Json::Value& out, std::string* error) {
    Json::CharReaderBuilder builder;
    Json::CharReaderBuilder::strictMode(&builder.settings_);
    builder["collectComments"] = false;

    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    std::string errs;
    const char* begin = text.data();
    bool ok = reader->parse(begin, begin + text.size(), &out, &errs);
    if (!ok && error) {
        *error = errs;
    }
    return ok;
}

}
