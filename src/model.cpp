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
#include "model.h"

#include <aws/dynamodb/DynamoDBErrors.h>
#include <aws/dynamodb/model/AttributeDefinition.h>
#include <aws/dynamodb/model/ConditionalCheckFailedException.h>
#include <aws/dynamodb/model/GlobalSecondaryIndex.h>
#include <aws/dynamodb/model/KeySchemaElement.h>
#include <aws/dynamodb/model/LocalSecondaryIndex.h>
#include <aws/dynamodb/model/Projection.h>
#include <aws/dynamodb/model/ProvisionedThroughput.h>
#include <aws/dynamodb/model/ReturnValue.h>
#include <aws/dynamodb/model/ReturnValuesOnConditionCheckFailure.h>
#include <aws/dynamodb/model/Select.h>
#include <glog/logging.h>

#include <chrono>
#include <thread>
#include <unordered_set>

#include "expression_builder.h"
#include "item_codec.h"
#include "version_control.h"

namespace EloqDM
{
namespace DDB = Aws::DynamoDB::Model;
using Aws::DynamoDB::DynamoDBError;
using Aws::DynamoDB::DynamoDBErrors;

namespace
{
// Polls of DescribeTable while waiting for a table to change state.
const int kTableWaitRetry = 120;
const std::chrono::milliseconds kTableWaitInterval(500);

std::optional<AttributeMap> OldItemOf(const DynamoDBError &error)
{
    DynamoDBError copy = error;
    DDB::ConditionalCheckFailedException ex =
        copy.GetModeledError<DDB::ConditionalCheckFailedException>();
    if (!ex.ItemHasBeenSet())
    {
        return std::nullopt;
    }
    return AttributeMap(ex.GetItem().begin(), ex.GetItem().end());
}

/*
 * Raise the exception matching a failed write. Conditional failures become
 * ConditionalCheckFailed or VersionConflict, anything else passes through
 * as TransportError.
 */
[[noreturn]] void ThrowWriteError(const std::string &operation,
                                  const std::string &table_name,
                                  const DynamoDBError &error,
                                  const VersionGuard &guard)
{
    if (error.GetErrorType() == DynamoDBErrors::CONDITIONAL_CHECK_FAILED)
    {
        DLOG(INFO) << operation << " on table " << table_name
                   << ", condition failed: " << error.GetMessage();
        guard.ThrowConditionFailed(operation, error, OldItemOf(error));
    }
    LOG(ERROR) << operation << " on table " << table_name
               << " failed: " << error.GetMessage();
    throw TransportError(operation, error);
}

DDB::ScalarAttributeType ScalarTypeOf(const Attribute &attr)
{
    switch (attr.GetWireType())
    {
    case WireType::Number:
        return DDB::ScalarAttributeType::N;
    case WireType::Binary:
        return DDB::ScalarAttributeType::B;
    default:
        return DDB::ScalarAttributeType::S;
    }
}

DDB::KeySchemaElement KeyElement(const std::string &name, DDB::KeyType type)
{
    DDB::KeySchemaElement element;
    element.WithAttributeName(name).WithKeyType(type);
    return element;
}

DDB::Projection ProjectionOf(const Projection &projection)
{
    DDB::Projection out;
    switch (projection.type_)
    {
    case ProjectionType::All:
        out.SetProjectionType(DDB::ProjectionType::ALL);
        break;
    case ProjectionType::KeysOnly:
        out.SetProjectionType(DDB::ProjectionType::KEYS_ONLY);
        break;
    case ProjectionType::Include:
        out.SetProjectionType(DDB::ProjectionType::INCLUDE);
        for (const std::string &name : projection.non_key_attributes_)
        {
            out.AddNonKeyAttributes(name);
        }
        break;
    }
    return out;
}

DDB::ProvisionedThroughput ThroughputOf(const Throughput &throughput)
{
    DDB::ProvisionedThroughput out;
    out.WithReadCapacityUnits(throughput.read_capacity_units_)
        .WithWriteCapacityUnits(throughput.write_capacity_units_);
    return out;
}

bool IsRangeKeyOperator(ConditionOp op)
{
    switch (op)
    {
    case ConditionOp::Equals:
    case ConditionOp::LessThan:
    case ConditionOp::LessOrEqual:
    case ConditionOp::GreaterThan:
    case ConditionOp::GreaterOrEqual:
    case ConditionOp::Between:
    case ConditionOp::BeginsWith:
        return true;
    default:
        return false;
    }
}
}  // namespace

Model::Model(std::shared_ptr<const Schema> schema,
             std::shared_ptr<Transport> transport,
             const ClientConfig &config)
    : schema_(std::move(schema)),
      transport_(std::move(transport)),
      retry_policy_(config.BatchRetryPolicy())
{
    if (schema_ == nullptr || transport_ == nullptr)
    {
        throw ModelError("model needs a schema and a transport");
    }
}

Item Model::NewItem(Value hash_key, std::optional<Value> range_key) const
{
    return Item(schema_, std::move(hash_key), std::move(range_key));
}

std::optional<Item> Model::Get(
    const Value &hash_key,
    const std::optional<Value> &range_key,
    bool consistent_read,
    const std::vector<std::string> &attributes_to_get) const
{
    DDB::GetItemRequest req;
    req.SetTableName(schema_->TableName());
    req.SetKey(EncodeKey(*schema_, hash_key, range_key));
    req.SetConsistentRead(consistent_read);
    if (!attributes_to_get.empty())
    {
        ExpressionBuilder builder;
        req.SetProjectionExpression(
            builder.CompileProjection(attributes_to_get));
        builder.ApplyNamesTo(req);
    }

    DDB::GetItemOutcome outcome = transport_->GetItem(req);
    if (!outcome.IsSuccess())
    {
        LOG(ERROR) << "GetItem on table " << schema_->TableName()
                   << " failed: " << outcome.GetError().GetMessage();
        throw TransportError("GetItem", outcome.GetError());
    }
    const auto &document = outcome.GetResult().GetItem();
    if (document.empty())
    {
        return std::nullopt;
    }
    return Decode(AttributeMap(document.begin(), document.end()), schema_);
}

void Model::Save(Item &item,
                 const std::optional<Condition> &condition,
                 ReturnValuesOnConditionFailure return_values) const
{
    VersionGuard guard(item, WriteKind::Put);
    AttributeMap document = Encode(item);
    guard.ApplyTo(document);

    DDB::PutItemRequest req;
    req.SetTableName(schema_->TableName());
    req.SetItem(std::move(document));
    std::optional<Condition> full_condition = guard.Combine(condition);
    ExpressionBuilder builder;
    if (full_condition.has_value())
    {
        req.SetConditionExpression(builder.CompileCondition(*full_condition));
        builder.ApplyTo(req);
    }
    if (return_values == ReturnValuesOnConditionFailure::AllOld)
    {
        req.SetReturnValuesOnConditionCheckFailure(
            DDB::ReturnValuesOnConditionCheckFailure::ALL_OLD);
    }

    DDB::PutItemOutcome outcome = transport_->PutItem(req);
    if (!outcome.IsSuccess())
    {
        ThrowWriteError(
            "PutItem", schema_->TableName(), outcome.GetError(), guard);
    }
    guard.Commit(item);
}

void Model::Update(Item &item,
                   UpdateActions actions,
                   const std::optional<Condition> &condition,
                   ReturnValuesOnConditionFailure return_values) const
{
    VersionGuard guard(item, WriteKind::Update);
    guard.ApplyTo(actions);

    DDB::UpdateItemRequest req;
    req.SetTableName(schema_->TableName());
    req.SetKey(EncodeKey(item));
    ExpressionBuilder builder;
    req.SetUpdateExpression(builder.CompileUpdate(actions));
    std::optional<Condition> full_condition = guard.Combine(condition);
    if (full_condition.has_value())
    {
        req.SetConditionExpression(builder.CompileCondition(*full_condition));
    }
    builder.ApplyTo(req);
    req.SetReturnValues(DDB::ReturnValue::ALL_NEW);
    if (return_values == ReturnValuesOnConditionFailure::AllOld)
    {
        req.SetReturnValuesOnConditionCheckFailure(
            DDB::ReturnValuesOnConditionCheckFailure::ALL_OLD);
    }

    DDB::UpdateItemOutcome outcome = transport_->UpdateItem(req);
    if (!outcome.IsSuccess())
    {
        ThrowWriteError(
            "UpdateItem", schema_->TableName(), outcome.GetError(), guard);
    }

    const auto &attributes = outcome.GetResult().GetAttributes();
    if (attributes.empty())
    {
        guard.Commit(item);
        return;
    }
    item = Decode(AttributeMap(attributes.begin(), attributes.end()), schema_);
}

void Model::Delete(const Item &item,
                   const std::optional<Condition> &condition,
                   ReturnValuesOnConditionFailure return_values) const
{
    VersionGuard guard(item, WriteKind::Delete);

    DDB::DeleteItemRequest req;
    req.SetTableName(schema_->TableName());
    req.SetKey(EncodeKey(item));
    std::optional<Condition> full_condition = guard.Combine(condition);
    if (full_condition.has_value())
    {
        ExpressionBuilder builder;
        req.SetConditionExpression(builder.CompileCondition(*full_condition));
        builder.ApplyTo(req);
    }
    if (return_values == ReturnValuesOnConditionFailure::AllOld)
    {
        req.SetReturnValuesOnConditionCheckFailure(
            DDB::ReturnValuesOnConditionCheckFailure::ALL_OLD);
    }

    DDB::DeleteItemOutcome outcome = transport_->DeleteItem(req);
    if (!outcome.IsSuccess())
    {
        ThrowWriteError(
            "DeleteItem", schema_->TableName(), outcome.GetError(), guard);
    }
}

void Model::Refresh(Item &item, bool consistent_read) const
{
    std::optional<Value> range;
    if (schema_->RangeKey() != nullptr)
    {
        range = item.RangeKeyValue();
    }
    std::optional<Item> stored =
        Get(item.HashKeyValue(), range, consistent_read);
    if (!stored.has_value())
    {
        throw DoesNotExist("item " + DescribeKey(EncodeKey(item), *schema_) +
                           " does not exist in table " +
                           schema_->TableName());
    }
    item = std::move(*stored);
}

Item Model::FromRawData(const AttributeMap &document) const
{
    return DecodeRaw(document, schema_);
}

void Model::CheckRangeKeyCondition(const Condition &condition,
                                   const Attribute *range_key) const
{
    if (range_key == nullptr)
    {
        throw BuildError("range key condition on table " +
                         schema_->TableName() + " which has no range key");
    }
    if (condition.IsLogical() || !IsRangeKeyOperator(condition.Op()))
    {
        throw BuildError(std::string("operator ") +
                         ConditionOpName(condition.Op()) +
                         " is not allowed in a range key condition");
    }
    if (condition.GetAttribute()->Name() != range_key->Name())
    {
        throw BuildError("range key condition on '" +
                         condition.GetAttribute()->Name() +
                         "', the range key is '" + range_key->Name() + "'");
    }
}

DDB::QueryRequest Model::BuildQuery(
    const Value &hash_key,
    const std::optional<Condition> &range_key_condition,
    const std::optional<Condition> &filter_condition,
    const QueryOptions &options) const
{
    auto [hash_attr, range_attr] = schema_->KeyAttributes(options.index_name_);
    std::optional<Condition> key_condition = Eq(*hash_attr, hash_key);
    if (range_key_condition.has_value())
    {
        CheckRangeKeyCondition(*range_key_condition, range_attr);
        key_condition = AndMaybe(key_condition, range_key_condition);
    }

    DDB::QueryRequest req;
    req.SetTableName(schema_->TableName());
    if (!options.index_name_.empty())
    {
        req.SetIndexName(options.index_name_);
    }
    ExpressionBuilder builder;
    req.SetKeyConditionExpression(builder.CompileCondition(*key_condition));
    if (filter_condition.has_value())
    {
        req.SetFilterExpression(builder.CompileCondition(*filter_condition));
    }
    if (!options.attributes_to_get_.empty())
    {
        req.SetProjectionExpression(
            builder.CompileProjection(options.attributes_to_get_));
    }
    builder.ApplyTo(req);
    req.SetConsistentRead(options.consistent_read_);
    req.SetScanIndexForward(options.scan_index_forward_);
    if (options.page_size_.has_value())
    {
        req.SetLimit(*options.page_size_);
    }
    else if (options.limit_.has_value())
    {
        req.SetLimit(static_cast<int>(*options.limit_));
    }
    if (options.exclusive_start_key_.has_value())
    {
        req.SetExclusiveStartKey(*options.exclusive_start_key_);
    }
    return req;
}

std::unique_ptr<ResultScanner> Model::Query(
    const Value &hash_key,
    const std::optional<Condition> &range_key_condition,
    const std::optional<Condition> &filter_condition,
    const QueryOptions &options) const
{
    DDB::QueryRequest req = BuildQuery(
        hash_key, range_key_condition, filter_condition, options);
    return std::make_unique<QueryScanner>(
        transport_.get(), schema_, std::move(req), options.limit_);
}

std::unique_ptr<ResultScanner> Model::Scan(
    const std::optional<Condition> &filter_condition,
    const ScanOptions &options) const
{
    DDB::ScanRequest req;
    req.SetTableName(schema_->TableName());
    if (!options.index_name_.empty())
    {
        if (schema_->FindIndex(options.index_name_) == nullptr)
        {
            throw SchemaError("table '" + schema_->TableName() +
                              "' has no index '" + options.index_name_ + "'");
        }
        req.SetIndexName(options.index_name_);
    }
    ExpressionBuilder builder;
    if (filter_condition.has_value())
    {
        req.SetFilterExpression(builder.CompileCondition(*filter_condition));
    }
    if (!options.attributes_to_get_.empty())
    {
        req.SetProjectionExpression(
            builder.CompileProjection(options.attributes_to_get_));
    }
    builder.ApplyTo(req);
    req.SetConsistentRead(options.consistent_read_);
    if (options.page_size_.has_value())
    {
        req.SetLimit(*options.page_size_);
    }
    else if (options.limit_.has_value())
    {
        req.SetLimit(static_cast<int>(*options.limit_));
    }
    if (options.segment_.has_value() != options.total_segments_.has_value())
    {
        throw BuildError("parallel scan needs both segment and total segments");
    }
    if (options.segment_.has_value())
    {
        req.SetSegment(*options.segment_);
        req.SetTotalSegments(*options.total_segments_);
    }
    if (options.exclusive_start_key_.has_value())
    {
        req.SetExclusiveStartKey(*options.exclusive_start_key_);
    }
    return std::make_unique<TableScanner>(
        transport_.get(), schema_, std::move(req), options.limit_);
}

int64_t Model::Count(const Value &hash_key,
                     const std::optional<Condition> &range_key_condition,
                     const std::optional<Condition> &filter_condition,
                     const QueryOptions &options) const
{
    QueryOptions count_options = options;
    count_options.attributes_to_get_.clear();
    DDB::QueryRequest req = BuildQuery(
        hash_key, range_key_condition, filter_condition, count_options);
    req.SetSelect(DDB::Select::COUNT);

    int64_t count = 0;
    while (true)
    {
        DDB::QueryOutcome outcome = transport_->Query(req);
        if (!outcome.IsSuccess())
        {
            LOG(ERROR) << "Query count on table " << schema_->TableName()
                       << " failed: " << outcome.GetError().GetMessage();
            throw TransportError("Query", outcome.GetError());
        }
        count += outcome.GetResult().GetCount();
        if (options.limit_.has_value() &&
            count >= static_cast<int64_t>(*options.limit_))
        {
            return static_cast<int64_t>(*options.limit_);
        }
        const auto &last_key = outcome.GetResult().GetLastEvaluatedKey();
        if (last_key.size() == 0)
        {
            break;
        }
        req.SetExclusiveStartKey(last_key);
    }
    return count;
}

BatchGetScanner Model::BatchGet(
    const std::vector<ItemKey> &keys,
    bool consistent_read,
    const std::vector<std::string> &attributes_to_get) const
{
    std::vector<AttributeMap> encoded;
    encoded.reserve(keys.size());
    for (const ItemKey &key : keys)
    {
        encoded.push_back(EncodeKey(*schema_, key.hash_, key.range_));
    }
    return BatchGetScanner(transport_.get(),
                           schema_,
                           std::move(encoded),
                           retry_policy_,
                           consistent_read,
                           attributes_to_get);
}

void Model::BatchWrite(const std::vector<BatchOperation> &operations) const
{
    std::vector<DDB::WriteRequest> requests;
    requests.reserve(operations.size());
    for (const BatchOperation &op : operations)
    {
        DDB::WriteRequest request;
        if (op.kind_ == BatchOpKind::Put)
        {
            DDB::PutRequest put;
            put.SetItem(Encode(op.item_));
            request.SetPutRequest(std::move(put));
        }
        else
        {
            DDB::DeleteRequest del;
            del.SetKey(EncodeKey(op.item_));
            request.SetDeleteRequest(std::move(del));
        }
        requests.push_back(std::move(request));
    }
    EloqDM::BatchWrite(transport_.get(),
                       *schema_,
                       std::move(requests),
                       retry_policy_);
}

std::unique_ptr<BatchWriter> Model::NewBatchWriter() const
{
    return std::make_unique<BatchWriter>(
        transport_.get(), schema_, retry_policy_);
}

void Model::WithBatchWrite(const std::function<void(BatchWriter &)> &fn) const
{
    // On exception the writer's destructor flushes what fn queued.
    BatchWriter writer(transport_.get(), schema_, retry_policy_);
    fn(writer);
    writer.Commit();
}

void Model::CreateTable(bool wait,
                        std::optional<Throughput> provisioning,
                        std::optional<BillingMode> billing_mode) const
{
    BillingMode mode = billing_mode.value_or(schema_->GetBillingMode());
    Throughput table_throughput =
        provisioning.value_or(schema_->Provisioning().value_or(Throughput()));

    DDB::CreateTableRequest ctr;
    ctr.SetTableName(schema_->TableName());

    std::unordered_set<std::string> defined;
    auto define = [&](const Attribute &attr)
    {
        if (!defined.insert(attr.Name()).second)
        {
            return;
        }
        DDB::AttributeDefinition definition;
        definition.WithAttributeName(attr.Name())
            .WithAttributeType(ScalarTypeOf(attr));
        ctr.AddAttributeDefinitions(std::move(definition));
    };

    define(schema_->HashKey());
    ctr.AddKeySchema(
        KeyElement(schema_->HashKey().Name(), DDB::KeyType::HASH));
    if (schema_->RangeKey() != nullptr)
    {
        define(*schema_->RangeKey());
        ctr.AddKeySchema(
            KeyElement(schema_->RangeKey()->Name(), DDB::KeyType::RANGE));
    }

    for (const IndexDescriptor &index : schema_->Indexes())
    {
        define(schema_->Get(index.hash_key_));
        Aws::Vector<DDB::KeySchemaElement> key_schema;
        key_schema.push_back(KeyElement(index.hash_key_, DDB::KeyType::HASH));
        if (index.range_key_.has_value())
        {
            define(schema_->Get(*index.range_key_));
            key_schema.push_back(
                KeyElement(*index.range_key_, DDB::KeyType::RANGE));
        }

        if (index.kind_ == IndexKind::Local)
        {
            DDB::LocalSecondaryIndex lsi;
            lsi.WithIndexName(index.name_)
                .WithKeySchema(std::move(key_schema))
                .WithProjection(ProjectionOf(index.projection_));
            ctr.AddLocalSecondaryIndexes(std::move(lsi));
        }
        else
        {
            DDB::GlobalSecondaryIndex gsi;
            gsi.WithIndexName(index.name_)
                .WithKeySchema(std::move(key_schema))
                .WithProjection(ProjectionOf(index.projection_));
            if (mode == BillingMode::Provisioned)
            {
                gsi.SetProvisionedThroughput(ThroughputOf(
                    index.provisioning_.value_or(table_throughput)));
            }
            ctr.AddGlobalSecondaryIndexes(std::move(gsi));
        }
    }

    if (mode == BillingMode::PayPerRequest)
    {
        ctr.SetBillingMode(DDB::BillingMode::PAY_PER_REQUEST);
    }
    else
    {
        ctr.SetBillingMode(DDB::BillingMode::PROVISIONED);
        ctr.SetProvisionedThroughput(ThroughputOf(table_throughput));
    }

    DDB::CreateTableOutcome outcome = transport_->CreateTable(ctr);
    if (!outcome.IsSuccess())
    {
        LOG(ERROR) << "Create table " << schema_->TableName()
                   << " failed: " << outcome.GetError().GetMessage();
        throw TransportError("CreateTable", outcome.GetError());
    }
    LOG(INFO) << "Create table " << schema_->TableName() << " submitted";

    if (wait && !WaitForTable(false))
    {
        throw ModelError("table " + schema_->TableName() +
                         " did not become active in time");
    }
}

bool Model::Exists() const
{
    DDB::DescribeTableRequest dtr;
    dtr.SetTableName(schema_->TableName());
    DDB::DescribeTableOutcome outcome = transport_->DescribeTable(dtr);
    if (outcome.IsSuccess())
    {
        return true;
    }
    if (outcome.GetError().GetErrorType() ==
        DynamoDBErrors::RESOURCE_NOT_FOUND)
    {
        return false;
    }
    LOG(ERROR) << "Describe table " << schema_->TableName()
               << " failed: " << outcome.GetError().GetMessage();
    throw TransportError("DescribeTable", outcome.GetError());
}

DDB::TableDescription Model::DescribeTable() const
{
    DDB::DescribeTableRequest dtr;
    dtr.SetTableName(schema_->TableName());
    DDB::DescribeTableOutcome outcome = transport_->DescribeTable(dtr);
    if (!outcome.IsSuccess())
    {
        LOG(ERROR) << "Describe table " << schema_->TableName()
                   << " failed: " << outcome.GetError().GetMessage();
        throw TransportError("DescribeTable", outcome.GetError());
    }
    return outcome.GetResult().GetTable();
}

void Model::DeleteTable(bool wait) const
{
    DDB::DeleteTableRequest req;
    req.SetTableName(schema_->TableName());
    DDB::DeleteTableOutcome outcome = transport_->DeleteTable(req);
    if (!outcome.IsSuccess())
    {
        LOG(ERROR) << "Delete table " << schema_->TableName()
                   << " failed: " << outcome.GetError().GetMessage();
        throw TransportError("DeleteTable", outcome.GetError());
    }
    LOG(INFO) << "Delete table " << schema_->TableName() << " submitted";

    if (wait && !WaitForTable(true))
    {
        throw ModelError("table " + schema_->TableName() +
                         " was not deleted in time");
    }
}

bool Model::WaitForTable(bool deleted) const
{
    DDB::DescribeTableRequest dtr;
    dtr.SetTableName(schema_->TableName());
    for (int retry = 0; retry < kTableWaitRetry; ++retry)
    {
        DDB::DescribeTableOutcome outcome = transport_->DescribeTable(dtr);
        if (!outcome.IsSuccess())
        {
            if (deleted && outcome.GetError().GetErrorType() ==
                               DynamoDBErrors::RESOURCE_NOT_FOUND)
            {
                return true;
            }
            LOG(ERROR) << "Describe table " << schema_->TableName()
                       << " failed: " << outcome.GetError().GetMessage();
            throw TransportError("DescribeTable", outcome.GetError());
        }

        const DDB::TableDescription &table = outcome.GetResult().GetTable();
        if (!deleted && table.GetTableStatus() == DDB::TableStatus::ACTIVE)
        {
            bool indexes_active = true;
            for (const auto &gsi : table.GetGlobalSecondaryIndexes())
            {
                if (gsi.GetIndexStatus() != DDB::IndexStatus::ACTIVE)
                {
                    indexes_active = false;
                }
            }
            if (indexes_active)
            {
                return true;
            }
        }
        std::this_thread::sleep_for(kTableWaitInterval);
    }
    return false;
}

}  // namespace EloqDM
