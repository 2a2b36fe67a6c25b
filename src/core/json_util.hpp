#pragma once

#include <string>
#include <vector>
#include <json/json.h>

// Parse text into out. False (and out left null) on malformed input.
bool parse_json(const std::string& text, Json::Value& out);

// Serialize. Empty indent gives a single line.
std::string write_json(const Json::Value& value, const std::string& indent = "");

// Scalars as text: strings verbatim, integers without a fraction, booleans
// as "true"/"false". Null and containers give "".
std::string json_scalar_string(const Json::Value& value);

Json::Value json_string_array(const std::vector<std::string>& items);
