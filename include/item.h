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

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

#include "attribute_value.h"
#include "model_errors.h"
#include "schema.h"

namespace EloqDM
{
/**
 * @brief One instance of a model. Holds the native values of the attributes
 * declared by its schema plus, for items read from the store, the raw wire
 * values of attributes the schema does not know about.
 */
class Item
{
public:
    explicit Item(std::shared_ptr<const Schema> schema);
    Item(std::shared_ptr<const Schema> schema,
         Value hash_key,
         std::optional<Value> range_key = std::nullopt);

    // Item with no value at all, the starting point of decoding.
    static Item WithoutDefaults(std::shared_ptr<const Schema> schema);

    const Schema &GetSchema() const
    {
        return *schema_;
    }

    const std::shared_ptr<const Schema> &SchemaPtr() const
    {
        return schema_;
    }

    // @throws SchemaError if the attribute is not declared.
    Item &Set(std::string_view name, Value value);

    // Null when the attribute is declared but has no value.
    const Value &Get(std::string_view name) const;

    bool Has(std::string_view name) const;

    void Unset(std::string_view name);

    const std::unordered_map<std::string, Value> &Values() const
    {
        return values_;
    }

    const AttributeMap &RawAttributes() const
    {
        return raw_;
    }

    void SetRaw(const std::string &name,
                Aws::DynamoDB::Model::AttributeValue value)
    {
        raw_[name] = std::move(value);
    }

    const Value &HashKeyValue() const;
    // Null for models without a range key.
    const Value &RangeKeyValue() const;

    // Stored version, std::nullopt for new items or unversioned models.
    std::optional<int64_t> Version() const;

    bool operator==(const Item &rhs) const
    {
        return schema_ == rhs.schema_ && values_ == rhs.values_ &&
               raw_ == rhs.raw_;
    }

    std::string DebugString() const;

private:
    struct NoDefaults
    {
    };
    Item(std::shared_ptr<const Schema> schema, NoDefaults);
    void ApplyDefaults();

    std::shared_ptr<const Schema> schema_;
    std::unordered_map<std::string, Value> values_;
    AttributeMap raw_;
};

}  // namespace EloqDM
