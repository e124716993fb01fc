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
#include "result_scanner.h"

#include <glog/logging.h>

#include "item_codec.h"

namespace EloqDM
{
using namespace Aws::DynamoDB::Model;

namespace
{
std::optional<AttributeMap> StartKeyOf(const AttributeMap &key)
{
    if (key.empty())
    {
        return std::nullopt;
    }
    return key;
}
}  // namespace

ResultScanner::ResultScanner(std::shared_ptr<const Schema> schema,
                             std::string index_name,
                             std::optional<AttributeMap> start_key,
                             std::optional<size_t> limit)
    : schema_(std::move(schema)),
      index_name_(std::move(index_name)),
      limit_(limit)
{
    if (start_key.has_value())
    {
        last_evaluated_key_ = std::move(*start_key);
    }
}

bool ResultScanner::MoveNext()
{
    if (limit_.has_value() && yielded_ >= *limit_)
    {
        return false;
    }

    while (pos_ >= page_.items_.size())
    {
        if (exhausted_)
        {
            current_.reset();
            return false;
        }
        const AttributeMap *start =
            last_evaluated_key_.empty() ? nullptr : &last_evaluated_key_;
        page_ = FetchPage(start);
        pos_ = 0;
        page_count_++;
        scanned_count_ += page_.scanned_count_;
        last_evaluated_key_ = page_.last_evaluated_key_;
        if (last_evaluated_key_.empty())
        {
            exhausted_ = true;
        }
        DLOG(INFO) << "page " << page_count_ << " of table "
                   << schema_->TableName() << ": " << page_.items_.size()
                   << " items, more: " << (exhausted_ ? "no" : "yes");
    }

    const AttributeMap &document = page_.items_[pos_++];
    current_.emplace(Decode(document, schema_));
    yielded_++;

    if (limit_.has_value() && yielded_ >= *limit_ && pos_ < page_.items_.size())
    {
        // Stopped in the middle of a page: resume right after this item.
        last_evaluated_key_ = KeyOf(document);
    }
    return true;
}

AttributeMap ResultScanner::KeyOf(const AttributeMap &document) const
{
    AttributeMap key;
    auto copy_attr = [&](const Attribute *attr)
    {
        if (attr == nullptr)
        {
            return;
        }
        auto it = document.find(attr->Name());
        if (it != document.end())
        {
            key[attr->Name()] = it->second;
        }
    };

    copy_attr(&schema_->HashKey());
    copy_attr(schema_->RangeKey());
    if (!index_name_.empty())
    {
        auto [hash, range] = schema_->KeyAttributes(index_name_);
        copy_attr(hash);
        copy_attr(range);
    }
    return key;
}

QueryScanner::QueryScanner(Transport *transport,
                           std::shared_ptr<const Schema> schema,
                           QueryRequest request,
                           std::optional<size_t> limit)
    : ResultScanner(std::move(schema),
                    request.GetIndexName(),
                    StartKeyOf(request.GetExclusiveStartKey()),
                    limit),
      transport_(transport),
      request_(std::move(request))
{
}

ResultScanner::Page QueryScanner::FetchPage(const AttributeMap *start_key)
{
    if (start_key != nullptr)
    {
        request_.SetExclusiveStartKey(*start_key);
    }
    QueryOutcome outcome = transport_->Query(request_);
    if (!outcome.IsSuccess())
    {
        LOG(ERROR) << "Query on table " << request_.GetTableName()
                   << " failed: " << outcome.GetError().GetMessage();
        throw TransportError("Query", outcome.GetError());
    }
    Page page;
    page.items_ = outcome.GetResult().GetItems();
    page.last_evaluated_key_ = outcome.GetResult().GetLastEvaluatedKey();
    page.scanned_count_ = outcome.GetResult().GetScannedCount();
    return page;
}

TableScanner::TableScanner(Transport *transport,
                           std::shared_ptr<const Schema> schema,
                           ScanRequest request,
                           std::optional<size_t> limit)
    : ResultScanner(std::move(schema),
                    request.GetIndexName(),
                    StartKeyOf(request.GetExclusiveStartKey()),
                    limit),
      transport_(transport),
      request_(std::move(request))
{
}

ResultScanner::Page TableScanner::FetchPage(const AttributeMap *start_key)
{
    if (start_key != nullptr)
    {
        request_.SetExclusiveStartKey(*start_key);
    }
    ScanOutcome outcome = transport_->Scan(request_);
    if (!outcome.IsSuccess())
    {
        LOG(ERROR) << "Scan on table " << request_.GetTableName()
                   << " failed: " << outcome.GetError().GetMessage();
        throw TransportError("Scan", outcome.GetError());
    }
    Page page;
    page.items_ = outcome.GetResult().GetItems();
    page.last_evaluated_key_ = outcome.GetResult().GetLastEvaluatedKey();
    page.scanned_count_ = outcome.GetResult().GetScannedCount();
    return page;
}

}  // namespace EloqDM
