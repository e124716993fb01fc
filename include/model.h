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

#include <aws/dynamodb/model/TableDescription.h>

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "batch_executor.h"
#include "condition.h"
#include "item.h"
#include "model_config.h"
#include "model_errors.h"
#include "result_scanner.h"
#include "retry_policy.h"
#include "schema.h"
#include "transport.h"
#include "update_action.h"

namespace EloqDM
{
enum class ReturnValuesOnConditionFailure : uint8_t
{
    None = 0,
    // Attach the stored item to the ConditionalCheckFailed error.
    AllOld
};

struct QueryOptions
{
    // Empty to query the table itself.
    std::string index_name_;
    bool consistent_read_{false};
    bool scan_index_forward_{true};
    // Max items yielded by the scanner.
    std::optional<size_t> limit_;
    // Max items per request, defaults to limit_.
    std::optional<int> page_size_;
    std::vector<std::string> attributes_to_get_;
    std::optional<AttributeMap> exclusive_start_key_;
};

struct ScanOptions
{
    std::string index_name_;
    bool consistent_read_{false};
    std::optional<size_t> limit_;
    std::optional<int> page_size_;
    std::vector<std::string> attributes_to_get_;
    std::optional<AttributeMap> exclusive_start_key_;
    // Parallel scan: this worker's segment out of total_segments_.
    std::optional<int> segment_;
    std::optional<int> total_segments_;
};

struct ItemKey
{
    Value hash_;
    std::optional<Value> range_;
};

enum class BatchOpKind : uint8_t
{
    Put = 0,
    Delete
};

struct BatchOperation
{
    BatchOpKind kind_;
    Item item_;
};

/**
 * @brief Reads and writes the items of one registered schema through a
 * transport.
 *
 * Every call is synchronous. Failures are raised as exceptions:
 * TransportError carrying the store's error unchanged, ConditionalCheckFailed
 * when a condition did not hold and VersionConflict when the version guard
 * did not hold.
 */
class Model
{
public:
    Model(std::shared_ptr<const Schema> schema,
          std::shared_ptr<Transport> transport,
          const ClientConfig &config = ClientConfig());

    const Schema &GetSchema() const
    {
        return *schema_;
    }

    const std::shared_ptr<const Schema> &SchemaPtr() const
    {
        return schema_;
    }

    void SetBatchRetryPolicy(RetryPolicy policy)
    {
        retry_policy_ = std::move(policy);
    }

    Item NewItem(Value hash_key,
                 std::optional<Value> range_key = std::nullopt) const;

    std::optional<Item> Get(
        const Value &hash_key,
        const std::optional<Value> &range_key = std::nullopt,
        bool consistent_read = false,
        const std::vector<std::string> &attributes_to_get = {}) const;

    /**
     * @brief Write the whole item with PutItem. For versioned models the
     * item's version is bumped on success.
     */
    void Save(Item &item,
              const std::optional<Condition> &condition = std::nullopt,
              ReturnValuesOnConditionFailure return_values =
                  ReturnValuesOnConditionFailure::None) const;

    /**
     * @brief Apply update actions with UpdateItem. The attributes the store
     * returns are copied back onto the item, attributes it no longer has
     * are unset.
     */
    void Update(Item &item,
                UpdateActions actions,
                const std::optional<Condition> &condition = std::nullopt,
                ReturnValuesOnConditionFailure return_values =
                    ReturnValuesOnConditionFailure::None) const;

    void Delete(const Item &item,
                const std::optional<Condition> &condition = std::nullopt,
                ReturnValuesOnConditionFailure return_values =
                    ReturnValuesOnConditionFailure::None) const;

    // @throws DoesNotExist if the item is gone.
    void Refresh(Item &item, bool consistent_read = false) const;

    // Item from a raw document, e.g. ConditionalCheckFailed::RawOldItem().
    Item FromRawData(const AttributeMap &document) const;

    /**
     * @brief Items with the given hash key, optionally narrowed by a
     * condition on the range key of the table or index (=, <, <=, >, >=,
     * BETWEEN, begins_with) and filtered after being read.
     * @throws BuildError for any other range key condition.
     */
    std::unique_ptr<ResultScanner> Query(
        const Value &hash_key,
        const std::optional<Condition> &range_key_condition = std::nullopt,
        const std::optional<Condition> &filter_condition = std::nullopt,
        const QueryOptions &options = QueryOptions()) const;

    std::unique_ptr<ResultScanner> Scan(
        const std::optional<Condition> &filter_condition = std::nullopt,
        const ScanOptions &options = ScanOptions()) const;

    // Number of items a Query would yield, without reading them.
    int64_t Count(
        const Value &hash_key,
        const std::optional<Condition> &range_key_condition = std::nullopt,
        const std::optional<Condition> &filter_condition = std::nullopt,
        const QueryOptions &options = QueryOptions()) const;

    BatchGetScanner BatchGet(
        const std::vector<ItemKey> &keys,
        bool consistent_read = false,
        const std::vector<std::string> &attributes_to_get = {}) const;

    // @throws BatchIncomplete listing the operations that were not applied.
    void BatchWrite(const std::vector<BatchOperation> &operations) const;

    std::unique_ptr<BatchWriter> NewBatchWriter() const;

    /**
     * @brief Run fn with a batch writer and flush it when fn returns. If fn
     * throws, what it queued is still flushed and its exception propagates.
     */
    void WithBatchWrite(const std::function<void(BatchWriter &)> &fn) const;

    /**
     * @brief Create the table, its key attributes and indexes as the schema
     * declares them. Throughput and billing mode default to the schema's.
     */
    void CreateTable(bool wait = false,
                     std::optional<Throughput> provisioning = std::nullopt,
                     std::optional<BillingMode> billing_mode =
                         std::nullopt) const;

    bool Exists() const;

    Aws::DynamoDB::Model::TableDescription DescribeTable() const;

    void DeleteTable(bool wait = false) const;

private:
    void CheckRangeKeyCondition(const Condition &condition,
                                const Attribute *range_key) const;
    Aws::DynamoDB::Model::QueryRequest BuildQuery(
        const Value &hash_key,
        const std::optional<Condition> &range_key_condition,
        const std::optional<Condition> &filter_condition,
        const QueryOptions &options) const;
    bool WaitForTable(bool deleted) const;

    std::shared_ptr<const Schema> schema_;
    std::shared_ptr<Transport> transport_;
    RetryPolicy retry_policy_;
};

}  // namespace EloqDM
