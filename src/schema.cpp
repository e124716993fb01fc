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
#include "schema.h"

#include <glog/logging.h>

#include <unordered_set>

#include "model_errors.h"

namespace EloqDM
{
namespace
{
bool IsScalarKeyType(WireType type)
{
    return type == WireType::String || type == WireType::Number ||
           type == WireType::Binary;
}

std::string JoinNames(const std::vector<std::string> &names)
{
    std::string out;
    for (size_t i = 0; i < names.size(); ++i)
    {
        if (i > 0)
        {
            out.append(", ");
        }
        out.append(names[i]);
    }
    return out;
}

void CheckKeyAttribute(const Attribute &attr, const char *role)
{
    if (attr.IsNullable())
    {
        throw SchemaError(std::string(role) + " '" + attr.Name() +
                          "' cannot be nullable");
    }
    if (!IsScalarKeyType(attr.GetWireType()))
    {
        throw SchemaError(std::string(role) + " '" + attr.Name() +
                          "' must be stored as S, N or B, not " +
                          WireTypeName(attr.GetWireType()));
    }
}
}  // namespace

const Attribute *Schema::Find(std::string_view name) const
{
    auto it = attribute_idx_.find(std::string(name));
    if (it == attribute_idx_.end())
    {
        return nullptr;
    }
    return attributes_[it->second].get();
}

const Attribute &Schema::Get(std::string_view name) const
{
    const Attribute *attr = Find(name);
    if (attr == nullptr)
    {
        throw SchemaError("table '" + table_name_ + "' has no attribute '" +
                          std::string(name) + "'");
    }
    return *attr;
}

const IndexDescriptor *Schema::FindIndex(std::string_view name) const
{
    for (const IndexDescriptor &index : indexes_)
    {
        if (index.name_ == name)
        {
            return &index;
        }
    }
    return nullptr;
}

std::pair<const Attribute *, const Attribute *> Schema::KeyAttributes(
    std::string_view index_name) const
{
    if (index_name.empty())
    {
        return {&HashKey(), RangeKey()};
    }

    const IndexDescriptor *index = FindIndex(index_name);
    if (index == nullptr)
    {
        throw SchemaError("table '" + table_name_ + "' has no index '" +
                          std::string(index_name) + "'");
    }
    const Attribute *range = nullptr;
    if (index->range_key_.has_value())
    {
        range = &Get(*index->range_key_);
    }
    return {&Get(index->hash_key_), range};
}

std::shared_ptr<const Schema> RegisterSchema(const SchemaDefinition &definition,
                                             const Schema *parent)
{
    std::shared_ptr<Schema> schema(new Schema());

    // Merge attributes: parent order first, overrides replace in place.
    if (parent != nullptr)
    {
        schema->attributes_ = parent->attributes_;
        schema->attribute_idx_ = parent->attribute_idx_;
        schema->indexes_ = parent->indexes_;
        schema->table_name_ = parent->table_name_;
        schema->provisioning_ = parent->provisioning_;
        schema->billing_mode_ = parent->billing_mode_;
    }

    std::unordered_set<std::string> declared;
    for (const Attribute &attr : definition.attributes_)
    {
        if (attr.Name().empty())
        {
            throw SchemaError("attribute name cannot be empty");
        }
        if (!declared.insert(attr.Name()).second)
        {
            throw SchemaError("attribute '" + attr.Name() +
                              "' is defined more than once");
        }

        auto shared = std::make_shared<const Attribute>(attr);
        auto it = schema->attribute_idx_.find(attr.Name());
        if (it != schema->attribute_idx_.end())
        {
            schema->attributes_[it->second] = std::move(shared);
        }
        else
        {
            schema->attribute_idx_.emplace(attr.Name(),
                                           schema->attributes_.size());
            schema->attributes_.push_back(std::move(shared));
        }
    }

    if (!definition.table_name_.empty())
    {
        schema->table_name_ = definition.table_name_;
    }
    if (schema->table_name_.empty())
    {
        throw SchemaError("model has no table name");
    }
    if (definition.provisioning_.has_value())
    {
        schema->provisioning_ = definition.provisioning_;
    }
    if (definition.billing_mode_.has_value())
    {
        schema->billing_mode_ = *definition.billing_mode_;
    }

    // Key and version roles.
    std::vector<std::string> hash_keys;
    std::vector<std::string> range_keys;
    std::vector<std::string> versions;
    for (size_t idx = 0; idx < schema->attributes_.size(); ++idx)
    {
        const Attribute &attr = *schema->attributes_[idx];
        if (attr.IsHashKey())
        {
            hash_keys.push_back(attr.Name());
            schema->hash_key_idx_ = idx;
        }
        if (attr.IsRangeKey())
        {
            range_keys.push_back(attr.Name());
            schema->range_key_idx_ = idx;
        }
        if (attr.IsVersion())
        {
            versions.push_back(attr.Name());
            schema->version_idx_ = idx;
        }
    }

    if (versions.size() > 1)
    {
        throw SchemaError("The model has more than one Version attribute: " +
                          JoinNames(versions));
    }
    if (hash_keys.empty())
    {
        throw SchemaError("table '" + schema->table_name_ +
                          "' has no hash key attribute");
    }
    if (hash_keys.size() > 1)
    {
        throw SchemaError("table '" + schema->table_name_ +
                          "' has more than one hash key: " +
                          JoinNames(hash_keys));
    }
    if (range_keys.size() > 1)
    {
        throw SchemaError("table '" + schema->table_name_ +
                          "' has more than one range key: " +
                          JoinNames(range_keys));
    }

    const Attribute &hash_key = *schema->attributes_[schema->hash_key_idx_];
    if (hash_key.IsRangeKey())
    {
        throw SchemaError("attribute '" + hash_key.Name() +
                          "' cannot be both hash and range key");
    }
    CheckKeyAttribute(hash_key, "hash key");
    if (schema->range_key_idx_.has_value())
    {
        CheckKeyAttribute(*schema->attributes_[*schema->range_key_idx_],
                          "range key");
    }
    if (schema->version_idx_.has_value() &&
        schema->attributes_[*schema->version_idx_]->IsKey())
    {
        throw SchemaError("version attribute '" +
                          schema->attributes_[*schema->version_idx_]->Name() +
                          "' cannot be a key attribute");
    }

    // Child indexes override parent indexes of the same name.
    std::unordered_set<std::string> index_names;
    for (const IndexDescriptor &index : definition.indexes_)
    {
        if (!index_names.insert(index.name_).second)
        {
            throw SchemaError("index '" + index.name_ +
                              "' is defined more than once");
        }
        bool replaced = false;
        for (IndexDescriptor &existing : schema->indexes_)
        {
            if (existing.name_ == index.name_)
            {
                existing = index;
                replaced = true;
                break;
            }
        }
        if (!replaced)
        {
            schema->indexes_.push_back(index);
        }
    }

    for (const IndexDescriptor &index : schema->indexes_)
    {
        if (index.name_.empty())
        {
            throw SchemaError("table '" + schema->table_name_ +
                              "' has an index without a name");
        }
        const Attribute *index_hash = schema->Find(index.hash_key_);
        if (index_hash == nullptr)
        {
            throw SchemaError("index '" + index.name_ +
                              "' references undeclared attribute '" +
                              index.hash_key_ + "'");
        }
        CheckKeyAttribute(*index_hash, "index hash key");
        if (index.range_key_.has_value())
        {
            const Attribute *index_range = schema->Find(*index.range_key_);
            if (index_range == nullptr)
            {
                throw SchemaError("index '" + index.name_ +
                                  "' references undeclared attribute '" +
                                  *index.range_key_ + "'");
            }
            CheckKeyAttribute(*index_range, "index range key");
        }
        if (index.kind_ == IndexKind::Local)
        {
            if (index.hash_key_ != hash_key.Name())
            {
                throw SchemaError("local index '" + index.name_ +
                                  "' must use the table hash key '" +
                                  hash_key.Name() + "'");
            }
            if (!index.range_key_.has_value())
            {
                throw SchemaError("local index '" + index.name_ +
                                  "' must define a range key");
            }
        }
        if (index.projection_.type_ == ProjectionType::Include)
        {
            for (const std::string &name :
                 index.projection_.non_key_attributes_)
            {
                if (schema->Find(name) == nullptr)
                {
                    throw SchemaError("index '" + index.name_ +
                                      "' projects undeclared attribute '" +
                                      name + "'");
                }
            }
        }
    }

    DLOG(INFO) << "registered model for table " << schema->table_name_
               << " with " << schema->attributes_.size() << " attributes and "
               << schema->indexes_.size() << " indexes";
    return schema;
}

SchemaBuilder &SchemaBuilder::AddLocalIndex(std::string name,
                                            std::string hash_key,
                                            std::string range_key,
                                            Projection projection)
{
    IndexDescriptor index;
    index.name_ = std::move(name);
    index.kind_ = IndexKind::Local;
    index.hash_key_ = std::move(hash_key);
    index.range_key_ = std::move(range_key);
    index.projection_ = std::move(projection);
    def_.indexes_.push_back(std::move(index));
    return *this;
}

SchemaBuilder &SchemaBuilder::AddGlobalIndex(
    std::string name,
    std::string hash_key,
    std::optional<std::string> range_key,
    Projection projection,
    std::optional<Throughput> provisioning)
{
    IndexDescriptor index;
    index.name_ = std::move(name);
    index.kind_ = IndexKind::Global;
    index.hash_key_ = std::move(hash_key);
    index.range_key_ = std::move(range_key);
    index.projection_ = std::move(projection);
    index.provisioning_ = provisioning;
    def_.indexes_.push_back(std::move(index));
    return *this;
}

}  // namespace EloqDM
