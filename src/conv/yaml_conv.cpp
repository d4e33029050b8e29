#include "yaml_conv.hpp"
#include "errors/errors.hpp"
#include "util/string_util.hpp"
#include <fstream>

namespace conv {

    data::Struct YamlReader::read(const std::filesystem::path &path) {
        std::ifstream stream{path};
        if(!stream.is_open()) {
            throw errors::YamlParseError("Unable to read config file " + path.string());
        }
        return read(stream);
    }

    data::Struct YamlReader::read(std::istream &stream) {
        try {
            return begin(YAML::Load(stream));
        } catch(const YAML::Exception &e) {
            throw errors::YamlParseError(e.what());
        }
    }

    data::Struct YamlReader::readString(const std::string &text) {
        try {
            return begin(YAML::Load(text));
        } catch(const YAML::Exception &e) {
            throw errors::YamlParseError(e.what());
        }
    }

    data::Struct YamlReader::begin(const YAML::Node &root) {
        if(root.IsNull()) {
            return {};
        }
        if(!root.IsMap()) {
            throw errors::YamlParseError("Expecting a map at the top of the document");
        }
        return rawMapValue(root);
    }

    // NOLINTNEXTLINE(*-no-recursion)
    data::StructElement YamlReader::rawValue(const YAML::Node &node) {
        switch(node.Type()) {
            case YAML::NodeType::Map:
                return rawMapValue(node);
            case YAML::NodeType::Sequence:
                return rawSequenceValue(node);
            case YAML::NodeType::Scalar:
                return rawScalarValue(node);
            default:
                break;
        }
        return {};
    }

    data::StructElement YamlReader::rawScalarValue(const YAML::Node &node) {
        // quoted scalars are always strings
        if(node.Tag() == "!") {
            return node.as<std::string>();
        }
        bool b{};
        if(YAML::convert<bool>::decode(node, b)) {
            return b;
        }
        int64_t i{};
        if(YAML::convert<int64_t>::decode(node, i)) {
            return i;
        }
        double d{};
        if(YAML::convert<double>::decode(node, d)) {
            return d;
        }
        return node.as<std::string>();
    }

    // NOLINTNEXTLINE(*-no-recursion)
    data::List YamlReader::rawSequenceValue(const YAML::Node &node) {
        data::List newList;
        for(const auto &i : node) {
            newList.push(rawValue(i));
        }
        return newList;
    }

    // NOLINTNEXTLINE(*-no-recursion)
    data::Struct YamlReader::rawMapValue(const YAML::Node &node) {
        data::Struct newMap;
        for(const auto &i : node) {
            newMap.put(i.first.as<std::string>(), rawValue(i.second));
        }
        return newMap;
    }
} // namespace conv
