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
#include "attribute.h"

#include <aws/core/utils/Array.h>
#include <aws/core/utils/HashingUtils.h>
#include <aws/core/utils/json/JsonSerializer.h>
#include <time.h>

#include <cstdio>
#include <memory>
#include <string_view>

#include "model_errors.h"

namespace EloqDM
{
using Aws::DynamoDB::Model::AttributeValue;
using Aws::DynamoDB::Model::ValueType;
using Aws::Utils::ByteBuffer;
using Aws::Utils::Json::JsonValue;
using Aws::Utils::Json::JsonView;

namespace
{
const char *ValueTypeTag(ValueType type)
{
    switch (type)
    {
    case ValueType::STRING:
        return "S";
    case ValueType::NUMBER:
        return "N";
    case ValueType::BYTEBUFFER:
        return "B";
    case ValueType::STRING_SET:
        return "SS";
    case ValueType::NUMBER_SET:
        return "NS";
    case ValueType::BYTEBUFFER_SET:
        return "BS";
    case ValueType::ATTRIBUTE_MAP:
        return "M";
    case ValueType::ATTRIBUTE_LIST:
        return "L";
    case ValueType::BOOL:
        return "BOOL";
    case ValueType::NULLVALUE:
        return "NULL";
    }
    return "?";
}

ValueType ExpectedValueType(WireType type)
{
    switch (type)
    {
    case WireType::String:
        return ValueType::STRING;
    case WireType::Number:
        return ValueType::NUMBER;
    case WireType::Binary:
        return ValueType::BYTEBUFFER;
    case WireType::Boolean:
        return ValueType::BOOL;
    case WireType::StringSet:
        return ValueType::STRING_SET;
    case WireType::NumberSet:
        return ValueType::NUMBER_SET;
    case WireType::BinarySet:
        return ValueType::BYTEBUFFER_SET;
    case WireType::List:
        return ValueType::ATTRIBUTE_LIST;
    case WireType::Map:
        return ValueType::ATTRIBUTE_MAP;
    }
    return ValueType::NULLVALUE;
}

ByteBuffer ToByteBuffer(const std::string &bytes)
{
    return ByteBuffer(reinterpret_cast<const unsigned char *>(bytes.data()),
                      bytes.size());
}

std::string FromByteBuffer(const ByteBuffer &buf)
{
    return std::string(reinterpret_cast<const char *>(buf.GetUnderlyingData()),
                       buf.GetLength());
}

const Number &CheckedNumber(const Number &n, const std::string &name)
{
    if (!n.IsFinite())
    {
        throw MarshalError("attribute '" + name +
                           "': NaN or Infinity cannot be stored as a number");
    }
    return n;
}

bool IsBase64Text(std::string_view text)
{
    if (text.size() % 4 != 0)
    {
        return false;
    }
    size_t pad = 0;
    for (size_t i = 0; i < text.size(); ++i)
    {
        char c = text[i];
        if (c == '=')
        {
            pad++;
            continue;
        }
        if (pad > 0)
        {
            return false;
        }
        if (!((c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
              (c >= '0' && c <= '9') || c == '+' || c == '/'))
        {
            return false;
        }
    }
    return pad <= 2;
}

JsonValue JsonFromValue(const Value &value, const std::string &name)
{
    JsonValue json;
    switch (value.GetType())
    {
    case Value::Type::Null:
        return JsonValue(Aws::String("null"));
    case Value::Type::String:
        json.AsString(value.Get<std::string>());
        break;
    case Value::Type::Number:
    {
        const Number &n = CheckedNumber(value.Get<Number>(), name);
        if (n.IsInteger())
        {
            json.AsInt64(n.AsInt());
        }
        else
        {
            json.AsDouble(n.AsDouble());
        }
        break;
    }
    case Value::Type::Bool:
        json.AsBool(value.Get<bool>());
        break;
    case Value::Type::List:
    {
        const ValueList &list = value.Get<ValueList>();
        Aws::Utils::Array<JsonValue> arr(list.size());
        for (size_t i = 0; i < list.size(); ++i)
        {
            arr[i] = JsonFromValue(list[i], name);
        }
        json.AsArray(std::move(arr));
        break;
    }
    case Value::Type::Map:
        for (const auto &[key, elem] : value.Get<ValueMap>())
        {
            json.WithObject(key, JsonFromValue(elem, name));
        }
        break;
    default:
        throw MarshalError("attribute '" + name + "': a " +
                           std::string(value.TypeName()) +
                           " cannot be written as JSON");
    }
    return json;
}

Value ValueFromJson(const JsonView &json)
{
    if (json.IsNull())
    {
        return Value();
    }
    if (json.IsBool())
    {
        return Value(json.AsBool());
    }
    if (json.IsString())
    {
        return Value(std::string(json.AsString()));
    }
    if (json.IsIntegerType())
    {
        return Value(Number(static_cast<int64_t>(json.AsInt64())));
    }
    if (json.IsFloatingPointType())
    {
        return Value(Number(json.AsDouble()));
    }
    if (json.IsListType())
    {
        Aws::Utils::Array<JsonView> arr = json.AsArray();
        ValueList list;
        list.reserve(arr.GetLength());
        for (size_t i = 0; i < arr.GetLength(); ++i)
        {
            list.push_back(ValueFromJson(arr[i]));
        }
        return Value(std::move(list));
    }

    ValueMap map;
    for (const auto &[key, elem] : json.GetAllObjects())
    {
        map.emplace(key, ValueFromJson(elem));
    }
    return Value(std::move(map));
}

int ParseDigits(const std::string &text, size_t pos, size_t len)
{
    int v = 0;
    for (size_t i = pos; i < pos + len; ++i)
    {
        char c = text[i];
        if (c < '0' || c > '9')
        {
            return -1;
        }
        v = v * 10 + (c - '0');
    }
    return v;
}

}  // namespace

const char *WireTypeName(WireType type)
{
    return ValueTypeTag(ExpectedValueType(type));
}

std::string FormatUTCDateTime(const Timestamp &ts)
{
    int64_t total_us = ts.time_since_epoch().count();
    int64_t secs = total_us / 1000000;
    int64_t micros = total_us % 1000000;
    if (micros < 0)
    {
        micros += 1000000;
        secs -= 1;
    }
    time_t t = static_cast<time_t>(secs);
    struct tm tm;
    gmtime_r(&t, &tm);

    char buf[64];
    std::snprintf(buf,
                  sizeof(buf),
                  "%04d-%02d-%02dT%02d:%02d:%02d.%06lld+0000",
                  tm.tm_year + 1900,
                  tm.tm_mon + 1,
                  tm.tm_mday,
                  tm.tm_hour,
                  tm.tm_min,
                  tm.tm_sec,
                  static_cast<long long>(micros));
    return std::string(buf);
}

Timestamp ParseUTCDateTime(const std::string &text)
{
    // 2024-01-31T23:59:59.123456+0000
    static constexpr size_t expected_len = 31;
    if (text.size() != expected_len || text[4] != '-' || text[7] != '-' ||
        text[10] != 'T' || text[13] != ':' || text[16] != ':' ||
        text[19] != '.' || text.compare(26, 5, "+0000") != 0)
    {
        throw UnmarshalError("invalid UTC datetime '" + text + "'");
    }

    int year = ParseDigits(text, 0, 4);
    int month = ParseDigits(text, 5, 2);
    int day = ParseDigits(text, 8, 2);
    int hour = ParseDigits(text, 11, 2);
    int minute = ParseDigits(text, 14, 2);
    int second = ParseDigits(text, 17, 2);
    int micros = ParseDigits(text, 20, 6);
    if (year < 0 || month < 1 || month > 12 || day < 1 || day > 31 ||
        hour < 0 || hour > 23 || minute < 0 || minute > 59 || second < 0 ||
        second > 60 || micros < 0)
    {
        throw UnmarshalError("invalid UTC datetime '" + text + "'");
    }

    struct tm tm = {};
    tm.tm_year = year - 1900;
    tm.tm_mon = month - 1;
    tm.tm_mday = day;
    tm.tm_hour = hour;
    tm.tm_min = minute;
    tm.tm_sec = second;
    time_t secs = timegm(&tm);
    return Timestamp(std::chrono::microseconds(
        static_cast<int64_t>(secs) * 1000000 + micros));
}

AttributeValue SerializeDynamic(const Value &value)
{
    AttributeValue av;
    switch (value.GetType())
    {
    case Value::Type::Null:
        av.SetNull(true);
        break;
    case Value::Type::String:
        av.SetS(value.Get<std::string>());
        break;
    case Value::Type::Number:
        av.SetN(CheckedNumber(value.Get<Number>(), "<element>").ToString());
        break;
    case Value::Type::Binary:
        av.SetB(ToByteBuffer(value.Get<Binary>().bytes_));
        break;
    case Value::Type::Bool:
        av.SetBool(value.Get<bool>());
        break;
    case Value::Type::StringSet:
    case Value::Type::NumberSet:
    case Value::Type::BinarySet:
    {
        if (value.Size() == 0)
        {
            throw MarshalError(
                "empty sets cannot be stored inside a list or map");
        }
        if (value.Is<StringSet>())
        {
            const StringSet &ss = value.Get<StringSet>();
            av.SetSS(Aws::Vector<Aws::String>(ss.begin(), ss.end()));
        }
        else if (value.Is<NumberSet>())
        {
            Aws::Vector<Aws::String> ns;
            for (const Number &n : value.Get<NumberSet>())
            {
                ns.push_back(CheckedNumber(n, "<element>").ToString());
            }
            av.SetNS(std::move(ns));
        }
        else
        {
            Aws::Vector<ByteBuffer> bs;
            for (const Binary &b : value.Get<BinarySet>())
            {
                bs.push_back(ToByteBuffer(b.bytes_));
            }
            av.SetBS(std::move(bs));
        }
        break;
    }
    case Value::Type::List:
    {
        Aws::Vector<std::shared_ptr<AttributeValue>> list;
        for (const Value &elem : value.Get<ValueList>())
        {
            list.push_back(
                std::make_shared<AttributeValue>(SerializeDynamic(elem)));
        }
        av.SetL(std::move(list));
        break;
    }
    case Value::Type::Map:
    {
        Aws::Map<Aws::String, const std::shared_ptr<AttributeValue>> map;
        for (const auto &[key, elem] : value.Get<ValueMap>())
        {
            map.emplace(key,
                        std::make_shared<AttributeValue>(SerializeDynamic(elem)));
        }
        av.SetM(std::move(map));
        break;
    }
    case Value::Type::Timestamp:
        av.SetS(FormatUTCDateTime(value.Get<Timestamp>()));
        break;
    }
    return av;
}

Value DeserializeDynamic(const AttributeValue &av)
{
    switch (av.GetType())
    {
    case ValueType::STRING:
        return Value(std::string(av.GetS()));
    case ValueType::NUMBER:
        return Value(Number::Parse(av.GetN()));
    case ValueType::BYTEBUFFER:
        return Value(Binary(FromByteBuffer(av.GetB())));
    case ValueType::BOOL:
        return Value(av.GetBool());
    case ValueType::NULLVALUE:
        return Value();
    case ValueType::STRING_SET:
    {
        const auto &ss = av.GetSS();
        return Value(StringSet(ss.begin(), ss.end()));
    }
    case ValueType::NUMBER_SET:
    {
        NumberSet ns;
        for (const Aws::String &n : av.GetNS())
        {
            ns.insert(Number::Parse(n));
        }
        return Value(std::move(ns));
    }
    case ValueType::BYTEBUFFER_SET:
    {
        BinarySet bs;
        for (const ByteBuffer &b : av.GetBS())
        {
            bs.insert(Binary(FromByteBuffer(b)));
        }
        return Value(std::move(bs));
    }
    case ValueType::ATTRIBUTE_LIST:
    {
        ValueList list;
        for (const auto &elem : av.GetL())
        {
            list.push_back(DeserializeDynamic(*elem));
        }
        return Value(std::move(list));
    }
    case ValueType::ATTRIBUTE_MAP:
    {
        ValueMap map;
        for (const auto &[key, elem] : av.GetM())
        {
            map.emplace(key, DeserializeDynamic(*elem));
        }
        return Value(std::move(map));
    }
    }
    throw UnmarshalError("unknown wire value tag");
}

Attribute::Attribute(std::string name, AttributeKind kind)
    : name_(std::move(name)), kind_(kind)
{
    // The store has no empty sets, so an unset set is the common case.
    nullable_ = IsSetType() || kind_ == AttributeKind::Version;
}

Attribute &Attribute::HashKey()
{
    hash_key_ = true;
    return *this;
}

Attribute &Attribute::RangeKey()
{
    range_key_ = true;
    return *this;
}

Attribute &Attribute::Nullable(bool nullable)
{
    nullable_ = nullable;
    return *this;
}

Attribute &Attribute::Default(Value value)
{
    default_provider_ = [value]() { return value; };
    return *this;
}

Attribute &Attribute::DefaultFactory(DefaultProvider provider)
{
    default_provider_ = std::move(provider);
    return *this;
}

Attribute &Attribute::LegacyEncoding(bool legacy)
{
    legacy_encoding_ = legacy;
    return *this;
}

WireType Attribute::GetWireType() const
{
    switch (kind_)
    {
    case AttributeKind::Unicode:
    case AttributeKind::UTCDateTime:
    case AttributeKind::JSON:
        return WireType::String;
    case AttributeKind::Number:
    case AttributeKind::Version:
        return WireType::Number;
    case AttributeKind::Binary:
        return WireType::Binary;
    case AttributeKind::Boolean:
        return WireType::Boolean;
    case AttributeKind::UnicodeSet:
        return WireType::StringSet;
    case AttributeKind::NumberSet:
        return WireType::NumberSet;
    case AttributeKind::BinarySet:
        return WireType::BinarySet;
    case AttributeKind::List:
        return WireType::List;
    case AttributeKind::Map:
        return WireType::Map;
    }
    return WireType::String;
}

bool Attribute::IsSetType() const
{
    return kind_ == AttributeKind::UnicodeSet ||
           kind_ == AttributeKind::NumberSet ||
           kind_ == AttributeKind::BinarySet;
}

bool Attribute::SupportsContainment() const
{
    WireType wt = GetWireType();
    return wt == WireType::String || wt == WireType::Binary || IsSetType();
}

Value Attribute::MakeDefault() const
{
    if (default_provider_ == nullptr)
    {
        return Value();
    }
    return default_provider_();
}

void Attribute::ThrowTypeMismatch(const Value &value) const
{
    throw MarshalError("attribute '" + name_ + "' of type " +
                       WireTypeName(GetWireType()) + " cannot hold a " +
                       value.TypeName() + " value");
}

std::string Attribute::EncodeBinary(const std::string &raw) const
{
    if (!legacy_encoding_)
    {
        return raw;
    }
    return std::string(Aws::Utils::HashingUtils::Base64Encode(ToByteBuffer(raw)));
}

std::string Attribute::DecodeBinary(const ByteBuffer &buf) const
{
    std::string stored = FromByteBuffer(buf);
    if (!legacy_encoding_)
    {
        return stored;
    }
    if (!IsBase64Text(stored))
    {
        throw UnmarshalError("attribute '" + name_ +
                             "': legacy binary value is not valid base64");
    }
    return FromByteBuffer(Aws::Utils::HashingUtils::Base64Decode(stored));
}

std::optional<AttributeValue> Attribute::Serialize(const Value &value) const
{
    if (value.IsNull() || (value.IsSet() && value.Size() == 0))
    {
        if (!nullable_)
        {
            throw MarshalError("Attribute '" + name_ + "' cannot be None");
        }
        return std::nullopt;
    }

    AttributeValue av;
    switch (kind_)
    {
    case AttributeKind::Unicode:
    {
        if (!value.Is<std::string>())
        {
            ThrowTypeMismatch(value);
        }
        const std::string &s = value.Get<std::string>();
        if (s.empty() && IsKey())
        {
            throw MarshalError("key attribute '" + name_ +
                               "' cannot be an empty string");
        }
        av.SetS(s);
        break;
    }
    case AttributeKind::Number:
        if (!value.Is<Number>())
        {
            ThrowTypeMismatch(value);
        }
        av.SetN(CheckedNumber(value.Get<Number>(), name_).ToString());
        break;
    case AttributeKind::Version:
        if (!value.Is<Number>() || !value.Get<Number>().IsInteger())
        {
            throw MarshalError("version attribute '" + name_ +
                               "' must hold an integer");
        }
        av.SetN(value.Get<Number>().ToString());
        break;
    case AttributeKind::Binary:
    {
        if (!value.Is<Binary>())
        {
            ThrowTypeMismatch(value);
        }
        const std::string &bytes = value.Get<Binary>().bytes_;
        if (bytes.empty() && IsKey())
        {
            throw MarshalError("key attribute '" + name_ +
                               "' cannot be empty binary");
        }
        av.SetB(ToByteBuffer(EncodeBinary(bytes)));
        break;
    }
    case AttributeKind::Boolean:
        if (!value.Is<bool>())
        {
            ThrowTypeMismatch(value);
        }
        av.SetBool(value.Get<bool>());
        break;
    case AttributeKind::UnicodeSet:
    {
        if (!value.Is<StringSet>())
        {
            ThrowTypeMismatch(value);
        }
        Aws::Vector<Aws::String> ss;
        for (const std::string &s : value.Get<StringSet>())
        {
            if (s.empty())
            {
                throw MarshalError("attribute '" + name_ +
                                   "': string sets cannot contain empty "
                                   "strings");
            }
            ss.push_back(s);
        }
        av.SetSS(std::move(ss));
        break;
    }
    case AttributeKind::NumberSet:
    {
        if (!value.Is<NumberSet>())
        {
            ThrowTypeMismatch(value);
        }
        Aws::Vector<Aws::String> ns;
        for (const Number &n : value.Get<NumberSet>())
        {
            ns.push_back(CheckedNumber(n, name_).ToString());
        }
        av.SetNS(std::move(ns));
        break;
    }
    case AttributeKind::BinarySet:
    {
        if (!value.Is<BinarySet>())
        {
            ThrowTypeMismatch(value);
        }
        Aws::Vector<ByteBuffer> bs;
        for (const Binary &b : value.Get<BinarySet>())
        {
            if (b.bytes_.empty())
            {
                throw MarshalError("attribute '" + name_ +
                                   "': binary sets cannot contain empty "
                                   "values");
            }
            bs.push_back(ToByteBuffer(EncodeBinary(b.bytes_)));
        }
        av.SetBS(std::move(bs));
        break;
    }
    case AttributeKind::List:
        if (!value.Is<ValueList>())
        {
            ThrowTypeMismatch(value);
        }
        av = SerializeDynamic(value);
        break;
    case AttributeKind::Map:
        if (!value.Is<ValueMap>())
        {
            ThrowTypeMismatch(value);
        }
        av = SerializeDynamic(value);
        break;
    case AttributeKind::UTCDateTime:
        if (!value.Is<Timestamp>())
        {
            ThrowTypeMismatch(value);
        }
        av.SetS(FormatUTCDateTime(value.Get<Timestamp>()));
        break;
    case AttributeKind::JSON:
        av.SetS(JsonFromValue(value, name_).View().WriteCompact());
        break;
    }
    return av;
}

AttributeValue Attribute::SerializeElement(const Value &value) const
{
    AttributeValue av;
    switch (kind_)
    {
    case AttributeKind::UnicodeSet:
        if (!value.Is<std::string>())
        {
            ThrowTypeMismatch(value);
        }
        av.SetS(value.Get<std::string>());
        return av;
    case AttributeKind::NumberSet:
        if (!value.Is<Number>())
        {
            ThrowTypeMismatch(value);
        }
        av.SetN(CheckedNumber(value.Get<Number>(), name_).ToString());
        return av;
    case AttributeKind::BinarySet:
        if (!value.Is<Binary>())
        {
            ThrowTypeMismatch(value);
        }
        av.SetB(ToByteBuffer(EncodeBinary(value.Get<Binary>().bytes_)));
        return av;
    case AttributeKind::List:
        return SerializeDynamic(value);
    default:
        break;
    }

    std::optional<AttributeValue> scalar = Serialize(value);
    if (!scalar.has_value())
    {
        throw MarshalError("attribute '" + name_ +
                           "': a null value cannot be used as an operand");
    }
    return std::move(*scalar);
}

Value Attribute::Deserialize(const AttributeValue &av) const
{
    ValueType type = av.GetType();
    if (type == ValueType::NULLVALUE && nullable_)
    {
        return Value();
    }

    ValueType expected = ExpectedValueType(GetWireType());
    if (type != expected)
    {
        throw UnmarshalError("attribute '" + name_ + "' expects " +
                             ValueTypeTag(expected) + ", got " +
                             ValueTypeTag(type));
    }

    switch (kind_)
    {
    case AttributeKind::Unicode:
        return Value(std::string(av.GetS()));
    case AttributeKind::Number:
        return Value(Number::Parse(av.GetN()));
    case AttributeKind::Version:
    {
        Number n = Number::Parse(av.GetN());
        if (!n.IsInteger())
        {
            throw UnmarshalError("version attribute '" + name_ +
                                 "' holds a non integer " + av.GetN());
        }
        return Value(n);
    }
    case AttributeKind::Binary:
        return Value(Binary(DecodeBinary(av.GetB())));
    case AttributeKind::Boolean:
        return Value(av.GetBool());
    case AttributeKind::UnicodeSet:
    case AttributeKind::NumberSet:
    case AttributeKind::List:
    case AttributeKind::Map:
        return DeserializeDynamic(av);
    case AttributeKind::BinarySet:
    {
        BinarySet bs;
        for (const ByteBuffer &b : av.GetBS())
        {
            bs.insert(Binary(DecodeBinary(b)));
        }
        return Value(std::move(bs));
    }
    case AttributeKind::UTCDateTime:
        return Value(ParseUTCDateTime(av.GetS()));
    case AttributeKind::JSON:
    {
        JsonValue json(av.GetS());
        if (!json.WasParseSuccessful())
        {
            throw UnmarshalError("attribute '" + name_ +
                                 "' holds invalid JSON: " +
                                 json.GetErrorMessage());
        }
        return ValueFromJson(json.View());
    }
    }
    throw UnmarshalError("attribute '" + name_ + "' has an unknown kind");
}

}  // namespace EloqDM
