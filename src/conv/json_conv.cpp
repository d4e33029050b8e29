#include "json_conv.hpp"
#include "errors/errors.hpp"
#include <cmath>
#include <rapidjson/error/en.h>

namespace conv {

    data::Struct JsonReader::parseObject(std::string_view json) {
        rapidjson::Document doc;
        doc.Parse(json.data(), json.size());
        if(doc.HasParseError()) {
            throw errors::JsonParseError(
                std::string("JSON parse error at offset ") + std::to_string(doc.GetErrorOffset())
                + ": " + rapidjson::GetParseError_En(doc.GetParseError()));
        }
        if(!doc.IsObject()) {
            throw errors::JsonParseError("Expected a JSON object");
        }
        return toStruct(doc);
    }

    // NOLINTNEXTLINE(*-no-recursion)
    data::StructElement JsonReader::toElement(const rapidjson::Value &value) {
        switch(value.GetType()) {
            case rapidjson::kFalseType:
                return false;
            case rapidjson::kTrueType:
                return true;
            case rapidjson::kStringType:
                return std::string{value.GetString(), value.GetStringLength()};
            case rapidjson::kNumberType:
                if(value.IsInt64()) {
                    return value.GetInt64();
                } else if(value.IsUint64()) {
                    return static_cast<double>(value.GetUint64());
                }
                return value.GetDouble();
            case rapidjson::kObjectType:
                return toStruct(value);
            case rapidjson::kArrayType:
                return toList(value);
            default:
                return {};
        }
    }

    // NOLINTNEXTLINE(*-no-recursion)
    data::Struct JsonReader::toStruct(const rapidjson::Value &value) {
        data::Struct target;
        for(auto i = value.MemberBegin(); i != value.MemberEnd(); ++i) {
            target.put(
                std::string_view{i->name.GetString(), i->name.GetStringLength()},
                toElement(i->value));
        }
        return target;
    }

    // NOLINTNEXTLINE(*-no-recursion)
    data::List JsonReader::toList(const rapidjson::Value &value) {
        data::List target;
        for(const auto &el : value.GetArray()) {
            target.push(toElement(el));
        }
        return target;
    }

    std::string JsonHelper::serialize(const data::Struct &value) {
        return serialize(data::StructElement{value});
    }

    std::string JsonHelper::serialize(const data::StructElement &value) {
        rapidjson::StringBuffer buffer;
        Writer writer(buffer);
        serialize(writer, value);
        return {buffer.GetString(), buffer.GetSize()};
    }

    // NOLINTNEXTLINE(*-no-recursion)
    void JsonHelper::serialize(Writer &writer, const data::StructElement &value) {
        std::visit([&writer](auto &&x) { serialize(writer, x); }, value.get().base());
    }

    void JsonHelper::serialize(Writer &writer, std::monostate) {
        writer.Null();
    }

    void JsonHelper::serialize(Writer &writer, bool b) {
        writer.Bool(b);
    }

    void JsonHelper::serialize(Writer &writer, int64_t i) {
        writer.Int64(i);
    }

    void JsonHelper::serialize(Writer &writer, double d) {
        if(!std::isfinite(d)) {
            // JSON has no representation for NaN or infinity
            writer.Null();
            return;
        }
        writer.Double(d);
    }

    void JsonHelper::serialize(Writer &writer, const std::string &str) {
        writer.String(str.c_str(), static_cast<rapidjson::SizeType>(str.length()));
    }

    // NOLINTNEXTLINE(*-no-recursion)
    void JsonHelper::serialize(Writer &writer, const std::shared_ptr<data::List> &list) {
        if(!list) {
            writer.Null();
            return;
        }
        writer.StartArray();
        for(const auto &el : *list) {
            serialize(writer, el);
        }
        writer.EndArray();
    }

    // NOLINTNEXTLINE(*-no-recursion)
    void JsonHelper::serialize(Writer &writer, const std::shared_ptr<data::Struct> &obj) {
        if(!obj) {
            writer.Null();
            return;
        }
        writer.StartObject();
        for(const auto &[key, value] : *obj) {
            writer.Key(key.c_str(), static_cast<rapidjson::SizeType>(key.length()));
            serialize(writer, value);
        }
        writer.EndObject();
    }
} // namespace conv
