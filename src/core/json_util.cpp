#include "json_util.hpp"
#include <memory>

bool parse_json(const std::string& text, Json::Value& out) {
    Json::CharReaderBuilder builder;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    std::string errors;
    out = Json::Value();
    if (!reader->parse(text.data(), text.data() + text.size(), &out, &errors)) {
        out = Json::Value();
        return false;
    }
    return true;
}

std::string write_json(const Json::Value& value, const std::string& indent) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = indent;
    return Json::writeString(builder, value);
}

std::string json_scalar_string(const Json::Value& value) {
    if (value.isString()) return value.asString();
    if (value.isBool()) return value.asBool() ? "true" : "false";
    if (value.isInt64()) return std::to_string(value.asInt64());
    if (value.isUInt64()) return std::to_string(value.asUInt64());
    if (value.isDouble()) return write_json(value);
    return "";
}

Json::Value json_string_array(const std::vector<std::string>& items) {
    Json::Value out(Json::arrayValue);
    for (const auto& item : items) out.append(item);
    return out;
}
