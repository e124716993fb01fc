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

#include <aws/dynamodb/model/QueryRequest.h>
#include <aws/dynamodb/model/ScanRequest.h>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "item.h"
#include "model_errors.h"
#include "schema.h"
#include "transport.h"

namespace EloqDM
{
/**
 * @brief Lazily iterates the items of a Query or Scan, requesting the next
 * page with the previous LastEvaluatedKey when the current one is consumed.
 *
 *   while (scanner->MoveNext())
 *   {
 *       const Item &item = scanner->Current();
 *   }
 *
 * Not restartable: once consumed, a new scanner must be created, possibly
 * starting from LastEvaluatedKey().
 */
class ResultScanner
{
public:
    virtual ~ResultScanner() = default;

    /**
     * @brief Advance to the next item, fetching a page if needed.
     * @return false when the results or the item limit are exhausted.
     * @throws TransportError if a page request fails.
     */
    bool MoveNext();

    const Item &Current() const
    {
        return *current_;
    }

    /**
     * @brief Where a new request should start to continue after the items
     * yielded so far. Empty once every result was read.
     */
    const AttributeMap &LastEvaluatedKey() const
    {
        return last_evaluated_key_;
    }

    size_t YieldedCount() const
    {
        return yielded_;
    }

    // Items the store examined, before the filter was applied.
    int64_t ScannedCount() const
    {
        return scanned_count_;
    }

    int PageCount() const
    {
        return page_count_;
    }

protected:
    struct Page
    {
        Aws::Vector<AttributeMap> items_;
        AttributeMap last_evaluated_key_;
        int64_t scanned_count_{0};
    };

    ResultScanner(std::shared_ptr<const Schema> schema,
                  std::string index_name,
                  std::optional<AttributeMap> start_key,
                  std::optional<size_t> limit);

    virtual Page FetchPage(const AttributeMap *start_key) = 0;

private:
    // Table and index key attributes of a returned document.
    AttributeMap KeyOf(const AttributeMap &document) const;

    std::shared_ptr<const Schema> schema_;
    std::string index_name_;
    std::optional<size_t> limit_;

    Page page_;
    size_t pos_{0};
    bool exhausted_{false};
    AttributeMap last_evaluated_key_;

    std::optional<Item> current_;
    size_t yielded_{0};
    int64_t scanned_count_{0};
    int page_count_{0};
};

class QueryScanner : public ResultScanner
{
public:
    QueryScanner(Transport *transport,
                 std::shared_ptr<const Schema> schema,
                 Aws::DynamoDB::Model::QueryRequest request,
                 std::optional<size_t> limit);

protected:
    Page FetchPage(const AttributeMap *start_key) override;

private:
    Transport *transport_;
    Aws::DynamoDB::Model::QueryRequest request_;
};

class TableScanner : public ResultScanner
{
public:
    TableScanner(Transport *transport,
                 std::shared_ptr<const Schema> schema,
                 Aws::DynamoDB::Model::ScanRequest request,
                 std::optional<size_t> limit);

protected:
    Page FetchPage(const AttributeMap *start_key) override;

private:
    Transport *transport_;
    Aws::DynamoDB::Model::ScanRequest request_;
};

}  // namespace EloqDM
