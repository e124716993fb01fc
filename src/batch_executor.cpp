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
#include "batch_executor.h"

#include <aws/dynamodb/model/BatchGetItemRequest.h>
#include <aws/dynamodb/model/BatchWriteItemRequest.h>
#include <aws/dynamodb/model/DeleteRequest.h>
#include <aws/dynamodb/model/KeysAndAttributes.h>
#include <aws/dynamodb/model/PutRequest.h>
#include <glog/logging.h>

#include <algorithm>
#include <iterator>

#include "expression_builder.h"
#include "item_codec.h"

namespace EloqDM
{
using namespace Aws::DynamoDB::Model;

namespace
{
std::vector<WriteRequest> TakeTable(
    Aws::Map<Aws::String, Aws::Vector<WriteRequest>> &items,
    const std::string &table_name)
{
    auto it = items.find(table_name);
    if (it == items.end())
    {
        return {};
    }
    return std::vector<WriteRequest>(std::make_move_iterator(it->second.begin()),
                                     std::make_move_iterator(it->second.end()));
}

std::vector<WriteRequest> ToVector(const Aws::Vector<WriteRequest> &requests)
{
    return std::vector<WriteRequest>(requests.begin(), requests.end());
}

/*
 * Submit one chunk and resubmit what the store leaves unprocessed until
 * everything is written or the policy gives up. Returns the leftovers. A
 * rejected request raises TransportError after logging the requests of the
 * chunk that were not applied.
 */
std::vector<WriteRequest> SubmitWriteChunk(Transport *transport,
                                           const Schema &schema,
                                           std::vector<WriteRequest> chunk,
                                           const RetryPolicy &policy)
{
    const std::string &table_name = schema.TableName();
    BatchWriteItemRequest req;
    req.AddRequestItems(table_name,
                        Aws::Vector<WriteRequest>(chunk.begin(), chunk.end()));
    BatchWriteItemOutcome outcome = transport->BatchWriteItem(req);
    if (!outcome.IsSuccess())
    {
        LOG(ERROR) << "BatchWriteItemRequest failed: "
                   << outcome.GetError().GetMessage();
        LogUnappliedWrites(schema, chunk);
        throw TransportError("BatchWriteItem", outcome.GetError());
    }
    auto unprocessed = outcome.GetResult().GetUnprocessedItems();

    for (int retry = 1; unprocessed.size() > 0; retry++)
    {
        if (!policy.ShouldRetry(retry))
        {
            LOG(WARNING) << "BatchWriteItem on table " << table_name
                         << " gives up with "
                         << unprocessed[table_name].size()
                         << " unprocessed items";
            break;
        }
        policy.Sleep(policy.DelayFor(retry));

        BatchWriteItemRequest retry_req;
        retry_req.SetRequestItems(unprocessed);
        BatchWriteItemOutcome retry_res = transport->BatchWriteItem(retry_req);
        if (!retry_res.IsSuccess())
        {
            LOG(ERROR) << "BatchWriteItemRequest failed: "
                       << retry_res.GetError().GetMessage();
            LogUnappliedWrites(schema, ToVector(unprocessed[table_name]));
            throw TransportError("BatchWriteItem", retry_res.GetError());
        }
        unprocessed = retry_res.GetResult().GetUnprocessedItems();
    }
    return TakeTable(unprocessed, table_name);
}
}  // namespace

void LogUnappliedWrites(const Schema &schema,
                        const std::vector<WriteRequest> &requests)
{
    for (const WriteRequest &request : requests)
    {
        if (request.PutRequestHasBeenSet())
        {
            LOG(ERROR) << "batch write on table " << schema.TableName()
                       << " did not apply put of "
                       << DescribeKey(request.GetPutRequest().GetItem(),
                                      schema);
        }
        else
        {
            LOG(ERROR) << "batch write on table " << schema.TableName()
                       << " did not apply delete of "
                       << DescribeKey(request.GetDeleteRequest().GetKey(),
                                      schema);
        }
    }
}

size_t WriteRequestSize(const WriteRequest &request)
{
    return request.Jsonize().View().WriteCompact().size();
}

std::vector<std::vector<WriteRequest>> ChunkWriteRequests(
    std::vector<WriteRequest> requests)
{
    std::vector<std::vector<WriteRequest>> chunks;
    std::vector<WriteRequest> chunk;
    size_t chunk_bytes = 0;
    for (WriteRequest &request : requests)
    {
        size_t size = WriteRequestSize(request);
        if (!chunk.empty() && (chunk.size() == kMaxBatchWriteItems ||
                               chunk_bytes + size > kMaxBatchWriteBytes))
        {
            chunks.push_back(std::move(chunk));
            chunk.clear();
            chunk_bytes = 0;
        }
        chunk.push_back(std::move(request));
        chunk_bytes += size;
    }
    if (!chunk.empty())
    {
        chunks.push_back(std::move(chunk));
    }
    return chunks;
}

std::vector<WriteRequest> SubmitWriteRequests(
    Transport *transport,
    const Schema &schema,
    std::vector<WriteRequest> requests,
    const RetryPolicy &policy)
{
    std::vector<WriteRequest> unresolved;
    std::vector<std::vector<WriteRequest>> chunks =
        ChunkWriteRequests(std::move(requests));
    for (size_t i = 0; i < chunks.size(); ++i)
    {
        std::vector<WriteRequest> left;
        try
        {
            left = SubmitWriteChunk(
                transport, schema, std::move(chunks[i]), policy);
        }
        catch (const TransportError &)
        {
            // Written chunks stay written. Report what is lost with the
            // error.
            LogUnappliedWrites(schema, unresolved);
            for (size_t j = i + 1; j < chunks.size(); ++j)
            {
                LogUnappliedWrites(schema, chunks[j]);
            }
            throw;
        }
        unresolved.insert(unresolved.end(),
                          std::make_move_iterator(left.begin()),
                          std::make_move_iterator(left.end()));
    }
    return unresolved;
}

void BatchWrite(Transport *transport,
                const Schema &schema,
                std::vector<WriteRequest> requests,
                const RetryPolicy &policy)
{
    std::vector<WriteRequest> unresolved =
        SubmitWriteRequests(transport, schema, std::move(requests), policy);
    if (!unresolved.empty())
    {
        throw BatchIncomplete("BatchWriteItem on table " + schema.TableName() +
                                  " left " + std::to_string(unresolved.size()) +
                                  " unprocessed items",
                              std::move(unresolved));
    }
}

BatchGetScanner::BatchGetScanner(Transport *transport,
                                 std::shared_ptr<const Schema> schema,
                                 std::vector<AttributeMap> keys,
                                 RetryPolicy policy,
                                 bool consistent_read,
                                 std::vector<std::string> attributes_to_get)
    : transport_(transport),
      schema_(std::move(schema)),
      keys_(std::move(keys)),
      policy_(std::move(policy)),
      consistent_read_(consistent_read),
      attributes_to_get_(std::move(attributes_to_get))
{
}

bool BatchGetScanner::MoveNext()
{
    while (pos_ >= buffer_.size())
    {
        if (next_key_ >= keys_.size())
        {
            current_.reset();
            if (!unprocessed_.empty())
            {
                size_t count = unprocessed_.size();
                throw BatchIncomplete(
                    "BatchGetItem on table " + schema_->TableName() +
                        " left " + std::to_string(count) + " unprocessed keys",
                    std::move(unprocessed_));
            }
            return false;
        }
        FetchChunk();
    }
    current_.emplace(Decode(buffer_[pos_++], schema_));
    return true;
}

void BatchGetScanner::FetchChunk()
{
    const std::string &table_name = schema_->TableName();
    size_t end = std::min(keys_.size(), next_key_ + kMaxBatchGetKeys);

    KeysAndAttributes keys_and_attrs;
    for (size_t i = next_key_; i < end; ++i)
    {
        keys_and_attrs.AddKeys(keys_[i]);
    }
    next_key_ = end;
    keys_and_attrs.SetConsistentRead(consistent_read_);
    if (!attributes_to_get_.empty())
    {
        ExpressionBuilder builder;
        keys_and_attrs.SetProjectionExpression(
            builder.CompileProjection(attributes_to_get_));
        builder.ApplyNamesTo(keys_and_attrs);
    }

    buffer_.clear();
    pos_ = 0;

    BatchGetItemRequest req;
    req.AddRequestItems(table_name, keys_and_attrs);
    request_count_++;
    BatchGetItemOutcome outcome = transport_->BatchGetItem(req);
    if (!outcome.IsSuccess())
    {
        LOG(ERROR) << "BatchGetItemRequest failed: "
                   << outcome.GetError().GetMessage();
        throw TransportError("BatchGetItem", outcome.GetError());
    }

    auto collect = [&](const BatchGetItemResult &result)
    {
        const auto &responses = result.GetResponses();
        auto it = responses.find(table_name);
        if (it != responses.end())
        {
            buffer_.insert(buffer_.end(), it->second.begin(), it->second.end());
        }
    };
    collect(outcome.GetResult());
    auto unprocessed = outcome.GetResult().GetUnprocessedKeys();

    for (int retry = 1; unprocessed.size() > 0; retry++)
    {
        if (!policy_.ShouldRetry(retry))
        {
            LOG(WARNING) << "BatchGetItem on table " << table_name
                         << " gives up with unprocessed keys";
            break;
        }
        policy_.Sleep(policy_.DelayFor(retry));

        BatchGetItemRequest retry_req;
        retry_req.SetRequestItems(unprocessed);
        request_count_++;
        BatchGetItemOutcome retry_res = transport_->BatchGetItem(retry_req);
        if (!retry_res.IsSuccess())
        {
            LOG(ERROR) << "BatchGetItemRequest failed: "
                       << retry_res.GetError().GetMessage();
            throw TransportError("BatchGetItem", retry_res.GetError());
        }
        collect(retry_res.GetResult());
        unprocessed = retry_res.GetResult().GetUnprocessedKeys();
    }

    auto left = unprocessed.find(table_name);
    if (left != unprocessed.end())
    {
        const auto &left_keys = left->second.GetKeys();
        unprocessed_.insert(
            unprocessed_.end(), left_keys.begin(), left_keys.end());
    }
}

BatchWriter::BatchWriter(Transport *transport,
                         std::shared_ptr<const Schema> schema,
                         RetryPolicy policy)
    : transport_(transport),
      schema_(std::move(schema)),
      policy_(std::move(policy))
{
}

BatchWriter::~BatchWriter()
{
    if (pending_.empty() && failed_.empty())
    {
        return;
    }
    try
    {
        Commit();
    }
    catch (const BatchIncomplete &e)
    {
        LOG(ERROR) << "batch write on table " << schema_->TableName()
                   << " failed while closing the batch: " << e.what();
        LogUnappliedWrites(*schema_, e.UnprocessedWrites());
    }
    catch (const std::exception &e)
    {
        // Unapplied requests were logged where the error was raised.
        LOG(ERROR) << "batch write on table " << schema_->TableName()
                   << " failed while closing the batch: " << e.what();
    }
}

void BatchWriter::Save(const Item &item)
{
    PutRequest put;
    put.SetItem(Encode(item));
    WriteRequest request;
    request.SetPutRequest(std::move(put));
    pending_.push_back(std::move(request));
    if (pending_.size() >= kMaxBatchWriteItems)
    {
        Flush();
    }
}

void BatchWriter::Delete(const Item &item)
{
    DeleteRequest del;
    del.SetKey(EncodeKey(item));
    WriteRequest request;
    request.SetDeleteRequest(std::move(del));
    pending_.push_back(std::move(request));
    if (pending_.size() >= kMaxBatchWriteItems)
    {
        Flush();
    }
}

void BatchWriter::Flush()
{
    if (pending_.empty())
    {
        return;
    }
    std::vector<WriteRequest> requests;
    requests.swap(pending_);
    std::vector<WriteRequest> left =
        SubmitWriteRequests(transport_, *schema_, std::move(requests), policy_);
    failed_.insert(failed_.end(),
                   std::make_move_iterator(left.begin()),
                   std::make_move_iterator(left.end()));
}

void BatchWriter::Commit()
{
    Flush();
    if (!failed_.empty())
    {
        std::vector<WriteRequest> failed;
        failed.swap(failed_);
        size_t count = failed.size();
        throw BatchIncomplete("batch write on table " + schema_->TableName() +
                                  " left " + std::to_string(count) +
                                  " unprocessed items",
                              std::move(failed));
    }
}

}  // namespace EloqDM
