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

#include <aws/dynamodb/model/WriteRequest.h>

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "item.h"
#include "model_errors.h"
#include "retry_policy.h"
#include "schema.h"
#include "transport.h"

namespace EloqDM
{
// Limits of one BatchGetItem / BatchWriteItem request.
constexpr size_t kMaxBatchGetKeys = 100;
constexpr size_t kMaxBatchWriteItems = 25;
constexpr size_t kMaxBatchWriteBytes = 16 * 1024 * 1024;

/**
 * @brief Serialized size of a write request, the measure used against
 * kMaxBatchWriteBytes.
 */
size_t WriteRequestSize(const Aws::DynamoDB::Model::WriteRequest &request);

/**
 * @brief Split write requests into chunks that fit into one BatchWriteItem
 * call, keeping the input order.
 */
std::vector<std::vector<Aws::DynamoDB::Model::WriteRequest>> ChunkWriteRequests(
    std::vector<Aws::DynamoDB::Model::WriteRequest> requests);

// Logs the key of every request at ERROR, one line each.
void LogUnappliedWrites(
    const Schema &schema,
    const std::vector<Aws::DynamoDB::Model::WriteRequest> &requests);

/**
 * @brief Submit write requests chunk by chunk, in input order. Items the
 * store reports as unprocessed are resubmitted following the policy. A chunk
 * left with unprocessed items does not stop the following ones.
 *
 * A rejected request raises TransportError with the store's error. Chunks
 * written before stay written, the requests not applied are logged.
 *
 * @return the requests that are still unprocessed, empty on success.
 */
std::vector<Aws::DynamoDB::Model::WriteRequest> SubmitWriteRequests(
    Transport *transport,
    const Schema &schema,
    std::vector<Aws::DynamoDB::Model::WriteRequest> requests,
    const RetryPolicy &policy);

/**
 * @brief SubmitWriteRequests() that raises BatchIncomplete listing every
 * unprocessed request.
 */
void BatchWrite(Transport *transport,
                const Schema &schema,
                std::vector<Aws::DynamoDB::Model::WriteRequest> requests,
                const RetryPolicy &policy);

/**
 * @brief Lazily reads items by primary key, kMaxBatchGetKeys keys per
 * request. Items come in the order the store returns them, which is not the
 * order of the keys. Missing items are skipped. Keys are sent as given,
 * duplicates included.
 *
 * After the last item, MoveNext() raises BatchIncomplete if some keys were
 * still unprocessed after the retries. A rejected request raises
 * TransportError.
 */
class BatchGetScanner
{
public:
    BatchGetScanner(Transport *transport,
                    std::shared_ptr<const Schema> schema,
                    std::vector<AttributeMap> keys,
                    RetryPolicy policy,
                    bool consistent_read = false,
                    std::vector<std::string> attributes_to_get = {});

    bool MoveNext();

    const Item &Current() const
    {
        return *current_;
    }

    // Requests issued so far, retries included.
    int RequestCount() const
    {
        return request_count_;
    }

private:
    void FetchChunk();

    Transport *transport_;
    std::shared_ptr<const Schema> schema_;
    std::vector<AttributeMap> keys_;
    RetryPolicy policy_;
    bool consistent_read_;
    std::vector<std::string> attributes_to_get_;

    size_t next_key_{0};
    Aws::Vector<AttributeMap> buffer_;
    size_t pos_{0};
    std::vector<AttributeMap> unprocessed_;
    std::optional<Item> current_;
    int request_count_{0};
};

/**
 * @brief Accumulates puts and deletes of one model and writes them with
 * BatchWriteItem, kMaxBatchWriteItems at a time.
 *
 * Pending operations are flushed automatically once a full request is
 * pending, by Commit() and by the destructor. Commit() raises BatchIncomplete
 * if any operation could not be written, the destructor logs it instead.
 * Batch writes carry no condition, so versions are not checked.
 */
class BatchWriter
{
public:
    BatchWriter(Transport *transport,
                std::shared_ptr<const Schema> schema,
                RetryPolicy policy);
    ~BatchWriter();

    BatchWriter(const BatchWriter &) = delete;
    BatchWriter &operator=(const BatchWriter &) = delete;

    void Save(const Item &item);
    void Delete(const Item &item);

    void Commit();

    size_t PendingCount() const
    {
        return pending_.size();
    }

private:
    void Flush();

    Transport *transport_;
    std::shared_ptr<const Schema> schema_;
    RetryPolicy policy_;
    std::vector<Aws::DynamoDB::Model::WriteRequest> pending_;
    std::vector<Aws::DynamoDB::Model::WriteRequest> failed_;
};

}  // namespace EloqDM
