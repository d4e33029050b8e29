#pragma once

#include "data/struct_model.hpp"
#include <rapidjson/document.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>
#include <string>
#include <string_view>

namespace conv {

    /**
     * Converts a JSON document into the data model. Only a JSON object is accepted at the top
     * level, as every request and attribute set is a mapping.
     */
    class JsonReader {
        static data::StructElement toElement(const rapidjson::Value &value);
        static data::Struct toStruct(const rapidjson::Value &value);
        static data::List toList(const rapidjson::Value &value);

    public:
        [[nodiscard]] static data::Struct parseObject(std::string_view json);
    };

    struct JsonHelper {
        using Writer = rapidjson::Writer<rapidjson::StringBuffer>;

        [[nodiscard]] static std::string serialize(const data::Struct &value);
        [[nodiscard]] static std::string serialize(const data::StructElement &value);

        static void serialize(Writer &writer, const data::StructElement &value);
        static void serialize(Writer &writer, std::monostate);
        static void serialize(Writer &writer, bool b);
        static void serialize(Writer &writer, int64_t i);
        static void serialize(Writer &writer, double d);
        static void serialize(Writer &writer, const std::string &str);
        static void serialize(Writer &writer, const std::shared_ptr<data::List> &list);
        static void serialize(Writer &writer, const std::shared_ptr<data::Struct> &obj);
    };
} // namespace conv
