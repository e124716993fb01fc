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

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include "attribute.h"

namespace EloqDM
{
enum class IndexKind : uint8_t
{
    Local = 0,
    Global
};

enum class ProjectionType : uint8_t
{
    All = 0,
    KeysOnly,
    Include
};

struct Projection
{
    static Projection All()
    {
        return Projection{ProjectionType::All, {}};
    }

    static Projection KeysOnly()
    {
        return Projection{ProjectionType::KeysOnly, {}};
    }

    static Projection Include(std::vector<std::string> attrs)
    {
        return Projection{ProjectionType::Include, std::move(attrs)};
    }

    ProjectionType type_{ProjectionType::All};
    std::vector<std::string> non_key_attributes_;
};

struct Throughput
{
    int64_t read_capacity_units_{1};
    int64_t write_capacity_units_{1};
};

enum class BillingMode : uint8_t
{
    Provisioned = 0,
    PayPerRequest
};

struct IndexDescriptor
{
    std::string name_;
    IndexKind kind_{IndexKind::Global};
    std::string hash_key_;
    std::optional<std::string> range_key_;
    Projection projection_;
    // Global indexes of provisioned tables only.
    std::optional<Throughput> provisioning_;
};

/**
 * @brief Everything a model definition declares, before validation.
 */
struct SchemaDefinition
{
    // Empty means "same table as the parent model".
    std::string table_name_;
    std::vector<Attribute> attributes_;
    std::vector<IndexDescriptor> indexes_;
    std::optional<Throughput> provisioning_;
    std::optional<BillingMode> billing_mode_;
};

class Schema;

/**
 * @brief Merge a model definition with the schema of the model it derives
 * from and validate the result.
 *
 * Parent attributes keep their position, an attribute redefined by the child
 * replaces the parent's one in place, new attributes follow in declaration
 * order. The call is pure: the same inputs always produce an equal schema.
 *
 * @throws SchemaError on a missing or repeated hash key, a repeated range key,
 * more than one version attribute, or an index over undeclared attributes.
 */
std::shared_ptr<const Schema> RegisterSchema(const SchemaDefinition &definition,
                                             const Schema *parent = nullptr);

/**
 * @brief Validated, immutable description of one model: its table, ordered
 * attributes, key attributes and indexes. Built once by RegisterSchema() and
 * shared read-only by every item and request of that model.
 */
class Schema
{
public:
    using AttributeList = std::vector<std::shared_ptr<const Attribute>>;

    const std::string &TableName() const
    {
        return table_name_;
    }

    const AttributeList &Attributes() const
    {
        return attributes_;
    }

    // nullptr if the model has no attribute with this name.
    const Attribute *Find(std::string_view name) const;

    // Same as Find() but raises SchemaError for unknown names.
    const Attribute &Get(std::string_view name) const;

    const Attribute &HashKey() const
    {
        return *attributes_[hash_key_idx_];
    }

    const Attribute *RangeKey() const
    {
        return range_key_idx_ ? attributes_[*range_key_idx_].get() : nullptr;
    }

    const Attribute *VersionAttribute() const
    {
        return version_idx_ ? attributes_[*version_idx_].get() : nullptr;
    }

    const std::vector<IndexDescriptor> &Indexes() const
    {
        return indexes_;
    }

    const IndexDescriptor *FindIndex(std::string_view name) const;

    /**
     * @brief Key attributes of the table (index_name empty) or of one of its
     * indexes.
     * @throws SchemaError for unknown index names.
     */
    std::pair<const Attribute *, const Attribute *> KeyAttributes(
        std::string_view index_name = {}) const;

    const std::optional<Throughput> &Provisioning() const
    {
        return provisioning_;
    }

    BillingMode GetBillingMode() const
    {
        return billing_mode_;
    }

private:
    Schema() = default;

    friend std::shared_ptr<const Schema> RegisterSchema(
        const SchemaDefinition &definition, const Schema *parent);

    std::string table_name_;
    AttributeList attributes_;
    std::unordered_map<std::string, size_t> attribute_idx_;
    size_t hash_key_idx_{0};
    std::optional<size_t> range_key_idx_;
    std::optional<size_t> version_idx_;
    std::vector<IndexDescriptor> indexes_;
    std::optional<Throughput> provisioning_;
    BillingMode billing_mode_{BillingMode::Provisioned};
};


/**
 * @brief Fluent helper to write a SchemaDefinition.
 *
 *   auto schema = SchemaBuilder("thread")
 *                     .Add(UnicodeAttribute("forum").HashKey())
 *                     .Add(UnicodeAttribute("subject").RangeKey())
 *                     .Add(NumberAttribute("views").Default(0))
 *                     .Add(VersionAttribute("version"))
 *                     .Register();
 */
class SchemaBuilder
{
public:
    SchemaBuilder() = default;
    explicit SchemaBuilder(std::string table_name)
    {
        def_.table_name_ = std::move(table_name);
    }

    SchemaBuilder &Add(Attribute attr)
    {
        def_.attributes_.push_back(std::move(attr));
        return *this;
    }

    SchemaBuilder &AddIndex(IndexDescriptor index)
    {
        def_.indexes_.push_back(std::move(index));
        return *this;
    }

    SchemaBuilder &AddLocalIndex(std::string name,
                                 std::string hash_key,
                                 std::string range_key,
                                 Projection projection = Projection::All());

    SchemaBuilder &AddGlobalIndex(
        std::string name,
        std::string hash_key,
        std::optional<std::string> range_key = std::nullopt,
        Projection projection = Projection::All(),
        std::optional<Throughput> provisioning = std::nullopt);

    SchemaBuilder &Provisioning(int64_t read_capacity_units,
                                int64_t write_capacity_units)
    {
        def_.provisioning_ =
            Throughput{read_capacity_units, write_capacity_units};
        return *this;
    }

    SchemaBuilder &Billing(BillingMode mode)
    {
        def_.billing_mode_ = mode;
        return *this;
    }

    const SchemaDefinition &Definition() const
    {
        return def_;
    }

    std::shared_ptr<const Schema> Register(const Schema *parent = nullptr) const
    {
        return RegisterSchema(def_, parent);
    }

private:
    SchemaDefinition def_;
};

}  // namespace EloqDM
