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
#include "item.h"

#include <sstream>

namespace EloqDM
{
namespace
{
const Value &NullValue()
{
    static const Value null_value;
    return null_value;
}
}  // namespace

Item::Item(std::shared_ptr<const Schema> schema)
    : Item(std::move(schema), NoDefaults{})
{
    ApplyDefaults();
}

Item::Item(std::shared_ptr<const Schema> schema, NoDefaults)
    : schema_(std::move(schema))
{
    if (schema_ == nullptr)
    {
        throw SchemaError("item created without a schema");
    }
}

void Item::ApplyDefaults()
{
    for (const auto &attr : schema_->Attributes())
    {
        if (attr->HasDefault())
        {
            Value v = attr->MakeDefault();
            if (!v.IsNull())
            {
                values_[attr->Name()] = std::move(v);
            }
        }
    }
}

Item::Item(std::shared_ptr<const Schema> schema,
           Value hash_key,
           std::optional<Value> range_key)
    : Item(std::move(schema))
{
    Set(schema_->HashKey().Name(), std::move(hash_key));
    if (range_key.has_value())
    {
        const Attribute *range = schema_->RangeKey();
        if (range == nullptr)
        {
            throw SchemaError("table '" + schema_->TableName() +
                              "' has no range key");
        }
        Set(range->Name(), std::move(*range_key));
    }
}

Item Item::WithoutDefaults(std::shared_ptr<const Schema> schema)
{
    return Item(std::move(schema), NoDefaults{});
}

Item &Item::Set(std::string_view name, Value value)
{
    const Attribute &attr = schema_->Get(name);
    if (value.IsNull())
    {
        values_.erase(attr.Name());
    }
    else
    {
        values_[attr.Name()] = std::move(value);
    }
    return *this;
}

const Value &Item::Get(std::string_view name) const
{
    auto it = values_.find(std::string(name));
    if (it == values_.end())
    {
        // Unknown names are an error, declared but unset ones are null.
        schema_->Get(name);
        return NullValue();
    }
    return it->second;
}

bool Item::Has(std::string_view name) const
{
    return values_.find(std::string(name)) != values_.end();
}

void Item::Unset(std::string_view name)
{
    std::string key(name);
    values_.erase(key);
    raw_.erase(key);
}

const Value &Item::HashKeyValue() const
{
    return Get(schema_->HashKey().Name());
}

const Value &Item::RangeKeyValue() const
{
    const Attribute *range = schema_->RangeKey();
    return range == nullptr ? NullValue() : Get(range->Name());
}

std::optional<int64_t> Item::Version() const
{
    const Attribute *version = schema_->VersionAttribute();
    if (version == nullptr)
    {
        return std::nullopt;
    }
    const Number *n = Get(version->Name()).GetIf<Number>();
    if (n == nullptr)
    {
        return std::nullopt;
    }
    return n->AsInt();
}

std::string Item::DebugString() const
{
    std::ostringstream os;
    os << schema_->TableName() << '{';
    const char *sep = "";
    for (const auto &attr : schema_->Attributes())
    {
        auto it = values_.find(attr->Name());
        if (it == values_.end())
        {
            continue;
        }
        os << sep << attr->Name() << ": " << it->second.DebugString();
        sep = ", ";
    }
    for (const auto &[name, av] : raw_)
    {
        os << sep << name << ": <raw>";
        sep = ", ";
    }
    os << '}';
    return os.str();
}

}  // namespace EloqDM
