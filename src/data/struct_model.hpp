#pragma once
#include "data/value_type.hpp"
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace data {

    /**
     * Data storage element with implicit type conversion. Values read from YAML or JSON keep the
     * type the parser inferred; getters convert between scalar types where that is meaningful and
     * raise InvalidTypeError otherwise.
     */
    class StructElement : public ValueTypes {
        ValueType _value;

    public:
        StructElement() = default;

        template<typename T>
        // NOLINTNEXTLINE(*-explicit-constructor)
        StructElement(T v) : _value(std::move(v)) {
        }

        // NOLINTNEXTLINE(*-explicit-constructor)
        StructElement(Struct v);
        // NOLINTNEXTLINE(*-explicit-constructor)
        StructElement(List v);

        StructElement(const StructElement &) = default;
        StructElement(StructElement &&) = default;
        StructElement &operator=(const StructElement &) = default;
        StructElement &operator=(StructElement &&) noexcept = default;
        ~StructElement() noexcept = default;

        [[nodiscard]] const ValueType &get() const {
            return _value;
        }

        [[nodiscard]] int getType() const {
            return static_cast<int>(_value.index());
        }

        [[nodiscard]] bool isNull() const {
            return getType() == NONE;
        }

        [[nodiscard]] bool isBool() const {
            return getType() == BOOL;
        }

        [[nodiscard]] bool isNumber() const {
            return getType() == INT || getType() == DOUBLE;
        }

        [[nodiscard]] bool isString() const {
            return getType() == STRING;
        }

        [[nodiscard]] bool isList() const {
            return getType() == LIST;
        }

        [[nodiscard]] bool isStruct() const {
            return getType() == STRUCT;
        }

        [[nodiscard]] bool isScalar() const {
            return !isNull() && !isList() && !isStruct();
        }

        [[nodiscard]] bool getBool() const;
        [[nodiscard]] int64_t getInt() const;
        [[nodiscard]] double getDouble() const;
        [[nodiscard]] std::string getString() const;
        [[nodiscard]] std::shared_ptr<List> getList() const;
        [[nodiscard]] std::shared_ptr<Struct> getStruct() const;

        bool operator==(const StructElement &other) const;
        bool operator!=(const StructElement &other) const {
            return !(*this == other);
        }
    };

    /**
     * Ordered sequence of elements.
     */
    class List {
        std::vector<StructElement> _elements;

    public:
        using const_iterator = std::vector<StructElement>::const_iterator;

        List() = default;

        template<typename T>
        explicit List(const std::vector<T> &values) {
            _elements.reserve(values.size());
            for(const auto &v : values) {
                _elements.emplace_back(v);
            }
        }

        List &push(StructElement value) {
            _elements.emplace_back(std::move(value));
            return *this;
        }

        [[nodiscard]] const StructElement &get(size_t idx) const {
            return _elements.at(idx);
        }

        [[nodiscard]] size_t size() const noexcept {
            return _elements.size();
        }

        [[nodiscard]] bool empty() const noexcept {
            return _elements.empty();
        }

        [[nodiscard]] const_iterator begin() const noexcept {
            return _elements.begin();
        }

        [[nodiscard]] const_iterator end() const noexcept {
            return _elements.end();
        }

        [[nodiscard]] std::vector<std::string> toStrings() const;

        bool operator==(const List &other) const {
            return _elements == other._elements;
        }
        bool operator!=(const List &other) const {
            return !(*this == other);
        }
    };

    /**
     * Key/value structure. Keys keep insertion order so results serialize in the order they
     * were built.
     */
    class Struct {
        std::vector<std::pair<std::string, StructElement>> _elements;

        [[nodiscard]] std::vector<std::pair<std::string, StructElement>>::const_iterator find(
            std::string_view key) const;

    public:
        using const_iterator = std::vector<std::pair<std::string, StructElement>>::const_iterator;

        Struct &put(std::string_view key, StructElement value);

        [[nodiscard]] bool hasKey(std::string_view key) const {
            return find(key) != _elements.end();
        }

        // Missing keys return a NONE element
        [[nodiscard]] StructElement get(std::string_view key) const;

        [[nodiscard]] std::vector<std::string> getKeys() const;

        [[nodiscard]] size_t size() const noexcept {
            return _elements.size();
        }

        [[nodiscard]] bool empty() const noexcept {
            return _elements.empty();
        }

        [[nodiscard]] const_iterator begin() const noexcept {
            return _elements.begin();
        }

        [[nodiscard]] const_iterator end() const noexcept {
            return _elements.end();
        }

        bool operator==(const Struct &other) const {
            return _elements == other._elements;
        }
        bool operator!=(const Struct &other) const {
            return !(*this == other);
        }
    };

    inline StructElement::StructElement(Struct v)
        : _value(std::make_shared<Struct>(std::move(v))) {
    }

    inline StructElement::StructElement(List v) : _value(std::make_shared<List>(std::move(v))) {
    }

} // namespace data
