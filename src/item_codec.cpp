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
#include "item_codec.h"

#include <glog/logging.h>

#include <sstream>

namespace EloqDM
{
using Aws::DynamoDB::Model::AttributeValue;
using Aws::DynamoDB::Model::ValueType;

namespace
{
AttributeValue EncodeKeyValue(const Attribute &attr, const Value &value)
{
    if (value.IsNull())
    {
        throw MarshalError("key attribute '" + attr.Name() +
                           "' has no value");
    }
    std::optional<AttributeValue> av = attr.Serialize(value);
    if (!av.has_value())
    {
        throw MarshalError("key attribute '" + attr.Name() +
                           "' has no value");
    }
    return std::move(*av);
}

Item DecodeDocument(const AttributeMap &document,
                    const std::shared_ptr<const Schema> &schema)
{
    // Defaults must not resurrect attributes the store does not have.
    Item item = Item::WithoutDefaults(schema);

    const Attribute &hash_key = schema->HashKey();
    if (document.find(hash_key.Name()) == document.end())
    {
        throw DecodeError("document for table '" + schema->TableName() +
                          "' has no hash key '" + hash_key.Name() + "'");
    }
    const Attribute *range_key = schema->RangeKey();
    if (range_key != nullptr &&
        document.find(range_key->Name()) == document.end())
    {
        throw DecodeError("document for table '" + schema->TableName() +
                          "' has no range key '" + range_key->Name() + "'");
    }

    for (const auto &[name, av] : document)
    {
        const Attribute *attr = schema->Find(name);
        if (attr == nullptr)
        {
            item.SetRaw(name, av);
            continue;
        }
        Value v = attr->Deserialize(av);
        if (!v.IsNull())
        {
            item.Set(name, std::move(v));
        }
    }
    return item;
}
}  // namespace

AttributeMap Encode(const Item &item)
{
    AttributeMap document;
    const Schema &schema = item.GetSchema();
    for (const auto &attr : schema.Attributes())
    {
        const Value &v = item.Get(attr->Name());
        if (attr->IsKey())
        {
            document[attr->Name()] = EncodeKeyValue(*attr, v);
            continue;
        }
        std::optional<AttributeValue> av = attr->Serialize(v);
        if (av.has_value())
        {
            document[attr->Name()] = std::move(*av);
        }
    }
    for (const auto &[name, av] : item.RawAttributes())
    {
        document.emplace(name, av);
    }
    return document;
}

AttributeMap EncodeKey(const Item &item)
{
    const Schema &schema = item.GetSchema();
    std::optional<Value> range;
    if (schema.RangeKey() != nullptr)
    {
        range = item.RangeKeyValue();
    }
    return EncodeKey(schema, item.HashKeyValue(), range);
}

AttributeMap EncodeKey(const Schema &schema,
                       const Value &hash_key,
                       const std::optional<Value> &range_key)
{
    AttributeMap key;
    key[schema.HashKey().Name()] = EncodeKeyValue(schema.HashKey(), hash_key);

    const Attribute *range = schema.RangeKey();
    if (range != nullptr)
    {
        if (!range_key.has_value())
        {
            throw MarshalError("table '" + schema.TableName() +
                               "' requires a value for range key '" +
                               range->Name() + "'");
        }
        key[range->Name()] = EncodeKeyValue(*range, *range_key);
    }
    else if (range_key.has_value() && !range_key->IsNull())
    {
        throw MarshalError("table '" + schema.TableName() +
                           "' has no range key");
    }
    return key;
}

Item Decode(const AttributeMap &document,
            const std::shared_ptr<const Schema> &schema)
{
    return DecodeDocument(document, schema);
}

Item DecodeRaw(const AttributeMap &document,
               const std::shared_ptr<const Schema> &schema)
{
    DLOG(INFO) << "decoding raw document of table " << schema->TableName()
               << ", key: " << DescribeKey(document, *schema);
    return DecodeDocument(document, schema);
}

std::string DescribeKey(const AttributeMap &document, const Schema &schema)
{
    std::ostringstream os;
    const Attribute *parts[] = {&schema.HashKey(), schema.RangeKey()};
    const char *sep = "";
    for (const Attribute *attr : parts)
    {
        if (attr == nullptr)
        {
            continue;
        }
        os << sep << attr->Name() << '=';
        sep = ", ";
        auto it = document.find(attr->Name());
        if (it == document.end())
        {
            os << "<missing>";
            continue;
        }
        const AttributeValue &av = it->second;
        switch (av.GetType())
        {
        case ValueType::STRING:
            os << '"' << av.GetS() << '"';
            break;
        case ValueType::NUMBER:
            os << av.GetN();
            break;
        case ValueType::BYTEBUFFER:
            os << '<' << av.GetB().GetLength() << " bytes>";
            break;
        default:
            os << "<invalid>";
            break;
        }
    }
    return os.str();
}

}  // namespace EloqDM
