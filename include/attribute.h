/**
 *    Copyright (C) 2025 EloqData Inc.
 *
 *    This program is free software: you can redistribute it and/or  modify
 *    it under either of the following two licenses:
 *    1. GNU Affero General Public License, version 3, as published by the Free
 *    Software Foundation.
 *    2. GNU General Public License as published by the Free Software
 *    Foundation; version 2 of the License.
 *
 *    This program is distributed in the hope that it will be useful,
 *    but WITHOUT ANY WARRANTY; without even the implied warranty of
 *    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 *    GNU Affero General Public License or GNU General Public License for more
 *    details.
 *
 *    You should have received a copy of the GNU Affero General Public License
 *    and GNU General Public License V2 along with this program.  If not, see
 *    <http://www.gnu.org/licenses/>.
 *
 */
#pragma once

#include <aws/core/Aws.h>
#include <aws/dynamodb/model/AttributeValue.h>

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <utility>

#include "attribute_value.h"

namespace EloqDM
{
// Semantic type of an attribute. Each kind is stored with one wire type.
enum class AttributeKind : uint8_t
{
    Unicode = 0,
    Number,
    Binary,
    Boolean,
    UnicodeSet,
    NumberSet,
    BinarySet,
    List,
    Map,
    UTCDateTime,
    JSON,
    Version
};

// Tag of the single-key wire object, e.g. {"S": ...}, {"NS": [...]}.
enum class WireType : uint8_t
{
    String = 0,
    Number,
    Binary,
    Boolean,
    StringSet,
    NumberSet,
    BinarySet,
    List,
    Map
};

const char *WireTypeName(WireType type);

// "%Y-%m-%dT%H:%M:%S.ffffff+0000"
std::string FormatUTCDateTime(const Timestamp &ts);
Timestamp ParseUTCDateTime(const std::string &text);

/**
 * @brief Marshal a value by its runtime type, used for elements of List and
 * Map attributes. Null becomes {"NULL": true}.
 * @throws MarshalError for empty sets and non-finite numbers.
 */
Aws::DynamoDB::Model::AttributeValue SerializeDynamic(const Value &value);

/**
 * @brief Inverse of SerializeDynamic. Timestamps come back as strings.
 */
Value DeserializeDynamic(const Aws::DynamoDB::Model::AttributeValue &av);

/**
 * @brief Describes one attribute of a model: its name, type, key role and
 * how values are converted to and from the store's tagged wire values.
 *
 * Attributes are configured with the chaining setters while the model is
 * being defined. Once registered into a Schema they are only reachable as
 * `std::shared_ptr<const Attribute>` and never change again.
 */
class Attribute
{
public:
    using DefaultProvider = std::function<Value()>;

    Attribute(std::string name, AttributeKind kind);

    Attribute &HashKey();
    Attribute &RangeKey();
    Attribute &Nullable(bool nullable = true);
    Attribute &Default(Value value);
    Attribute &DefaultFactory(DefaultProvider provider);
    // Binary kinds only: store the base64 text of the bytes instead of the
    // bytes themselves, as older clients did.
    Attribute &LegacyEncoding(bool legacy);

    const std::string &Name() const
    {
        return name_;
    }

    AttributeKind Kind() const
    {
        return kind_;
    }

    WireType GetWireType() const;

    bool IsNullable() const
    {
        return nullable_;
    }

    bool IsHashKey() const
    {
        return hash_key_;
    }

    bool IsRangeKey() const
    {
        return range_key_;
    }

    bool IsKey() const
    {
        return hash_key_ || range_key_;
    }

    bool IsVersion() const
    {
        return kind_ == AttributeKind::Version;
    }

    bool IsLegacyEncoding() const
    {
        return legacy_encoding_;
    }

    bool IsSetType() const;

    // String, Binary and set attributes support begins_with/contains.
    bool SupportsContainment() const;

    bool HasDefault() const
    {
        return default_provider_ != nullptr;
    }

    Value MakeDefault() const;

    /**
     * @brief Convert a native value into the wire value.
     * @return std::nullopt when nothing is to be stored: the value is null or
     * an empty set (the store refuses empty sets).
     * @throws MarshalError if the value type does not match the attribute
     * kind, a number is NaN/Infinite, or the value is null for an attribute
     * that is not nullable.
     */
    std::optional<Aws::DynamoDB::Model::AttributeValue> Serialize(
        const Value &value) const;

    /**
     * @brief Marshal one element of a set attribute (e.g. the operand of
     * contains() or the element of a DELETE action), or the value itself for
     * scalar attributes.
     */
    Aws::DynamoDB::Model::AttributeValue SerializeElement(
        const Value &value) const;

    /**
     * @brief Convert a wire value into the native value.
     * @throws UnmarshalError if the tag does not match the attribute kind.
     */
    Value Deserialize(const Aws::DynamoDB::Model::AttributeValue &av) const;

private:
    [[noreturn]] void ThrowTypeMismatch(const Value &value) const;
    std::string EncodeBinary(const std::string &raw) const;
    std::string DecodeBinary(const Aws::Utils::ByteBuffer &buf) const;

    std::string name_;
    AttributeKind kind_;
    bool nullable_{false};
    bool hash_key_{false};
    bool range_key_{false};
    bool legacy_encoding_{false};
    DefaultProvider default_provider_{nullptr};
};

inline Attribute UnicodeAttribute(std::string name)
{
    return Attribute(std::move(name), AttributeKind::Unicode);
}

inline Attribute NumberAttribute(std::string name)
{
    return Attribute(std::move(name), AttributeKind::Number);
}

inline Attribute BinaryAttribute(std::string name, bool legacy_encoding = false)
{
    Attribute attr(std::move(name), AttributeKind::Binary);
    attr.LegacyEncoding(legacy_encoding);
    return attr;
}

inline Attribute BooleanAttribute(std::string name)
{
    return Attribute(std::move(name), AttributeKind::Boolean);
}

inline Attribute UnicodeSetAttribute(std::string name)
{
    return Attribute(std::move(name), AttributeKind::UnicodeSet);
}

inline Attribute NumberSetAttribute(std::string name)
{
    return Attribute(std::move(name), AttributeKind::NumberSet);
}

inline Attribute BinarySetAttribute(std::string name,
                                    bool legacy_encoding = false)
{
    Attribute attr(std::move(name), AttributeKind::BinarySet);
    attr.LegacyEncoding(legacy_encoding);
    return attr;
}

inline Attribute ListAttribute(std::string name)
{
    return Attribute(std::move(name), AttributeKind::List);
}

inline Attribute MapAttribute(std::string name)
{
    return Attribute(std::move(name), AttributeKind::Map);
}

inline Attribute UTCDateTimeAttribute(std::string name)
{
    return Attribute(std::move(name), AttributeKind::UTCDateTime);
}

inline Attribute JSONAttribute(std::string name)
{
    return Attribute(std::move(name), AttributeKind::JSON);
}

inline Attribute VersionAttribute(std::string name)
{
    return Attribute(std::move(name), AttributeKind::Version);
}

}  // namespace EloqDM
