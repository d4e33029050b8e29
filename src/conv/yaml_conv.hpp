#pragma once

#include "data/struct_model.hpp"
#include <filesystem>
#include <istream>
#include <yaml-cpp/yaml.h>

namespace conv {

    /**
     * Reads a YAML configuration document into the data model. Scalars are typed on read:
     * booleans, integers and decimals become native values, anything else stays a string.
     */
    class YamlReader {
    public:
        [[nodiscard]] static data::Struct read(const std::filesystem::path &path);
        [[nodiscard]] static data::Struct read(std::istream &stream);
        [[nodiscard]] static data::Struct readString(const std::string &text);

        static data::StructElement rawValue(const YAML::Node &node);
        static data::StructElement rawScalarValue(const YAML::Node &node);
        static data::Struct rawMapValue(const YAML::Node &node);
        static data::List rawSequenceValue(const YAML::Node &node);

    private:
        static data::Struct begin(const YAML::Node &root);
    };
} // namespace conv
