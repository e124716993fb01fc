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
#include <aws/dynamodb/model/Select.h>
#include <glog/logging.h>

#include <catch2/catch_all.hpp>
#include <memory>
#include <string>
#include <vector>

#include "fake_transport.h"
#include "model.h"

using namespace EloqDM;
using namespace EloqDM::Test;

namespace
{
std::shared_ptr<const Schema> ThreadSchema()
{
    return SchemaBuilder("thread")
        .Add(UnicodeAttribute("forum_name").HashKey())
        .Add(UnicodeAttribute("subject").RangeKey())
        .Add(NumberAttribute("views").Default(0))
        .Add(UnicodeAttribute("author").Nullable())
        .AddLocalIndex("by_views", "forum_name", "views")
        .AddGlobalIndex("by_author", "author", std::string("subject"))
        .Register();
}

AttributeMap ThreadDoc(int n)
{
    AttributeMap doc;
    doc["forum_name"] = S("forum");
    doc["subject"] = S(std::to_string(n));
    doc["views"] = N(std::to_string(n * 10));
    doc["author"] = S("author" + std::to_string(n % 2));
    return doc;
}

AttributeMap KeyDoc(int n)
{
    AttributeMap key;
    key["forum_name"] = S("forum");
    key["subject"] = S(std::to_string(n));
    return key;
}

// Pages of thread items: {0, 1, 2} then {3, 4}.
struct TwoPages
{
    template <typename ResultT>
    ResultT Page(const AttributeMap &start_key) const
    {
        ResultT result;
        Aws::Vector<AttributeMap> items;
        if (start_key.empty())
        {
            for (int i = 0; i < 3; ++i)
            {
                items.push_back(ThreadDoc(i));
            }
            result.SetLastEvaluatedKey(KeyDoc(2));
            result.SetScannedCount(4);
        }
        else
        {
            for (int i = 3; i < 5; ++i)
            {
                items.push_back(ThreadDoc(i));
            }
            result.SetScannedCount(2);
        }
        result.SetCount(static_cast<int>(items.size()));
        result.SetItems(items);
        return result;
    }
};
}  // namespace

TEST_CASE("query-request-shape")
{
    LOG(INFO) << "running: query-request-shape: ";

    auto transport = std::make_shared<FakeTransport>();
    Model model(ThreadSchema(), transport);
    const Schema &schema = model.GetSchema();

    QueryOptions options;
    options.consistent_read_ = true;
    options.scan_index_forward_ = false;
    options.page_size_ = 7;
    options.attributes_to_get_ = {"subject", "views"};
    auto scanner = model.Query(Value("forum"),
                               BeginsWith(schema.Get("subject"), Value("a")),
                               Gt(schema.Get("views"), Value(1)),
                               options);
    // Nothing is requested before the first item is asked for.
    REQUIRE(transport->queries_.empty());
    REQUIRE_FALSE(scanner->MoveNext());

    REQUIRE(transport->queries_.size() == 1);
    const auto &req = transport->queries_[0];
    REQUIRE(req.GetTableName() == "thread");
    REQUIRE(req.GetKeyConditionExpression() ==
            "(#a0 = :v0 AND begins_with (#a1, :v1))");
    REQUIRE(req.GetFilterExpression() == "#a2 > :v2");
    REQUIRE(req.GetProjectionExpression() == "#a1, #a2");
    REQUIRE(req.GetExpressionAttributeNames().at("#a0") == "forum_name");
    REQUIRE(req.GetConsistentRead());
    REQUIRE_FALSE(req.GetScanIndexForward());
    REQUIRE(req.GetLimit() == 7);
    REQUIRE_FALSE(req.IndexNameHasBeenSet());
}

TEST_CASE("query-pagination")
{
    LOG(INFO) << "running: query-pagination: ";

    auto transport = std::make_shared<FakeTransport>();
    Model model(ThreadSchema(), transport);
    transport->on_query_ = [](const DDB::QueryRequest &req)
    {
        return DDB::QueryOutcome(
            TwoPages().Page<DDB::QueryResult>(req.GetExclusiveStartKey()));
    };

    auto scanner = model.Query(Value("forum"));
    std::vector<std::string> subjects;
    while (scanner->MoveNext())
    {
        subjects.push_back(
            scanner->Current().RangeKeyValue().Get<std::string>());
    }
    REQUIRE(subjects == std::vector<std::string>{"0", "1", "2", "3", "4"});
    REQUIRE(scanner->PageCount() == 2);
    REQUIRE(scanner->YieldedCount() == 5);
    REQUIRE(scanner->ScannedCount() == 6);
    REQUIRE(scanner->LastEvaluatedKey().empty());
    REQUIRE(transport->queries_[1].GetExclusiveStartKey().at("subject").GetS() ==
            "2");
    // Exhausted scanners stay exhausted.
    REQUIRE_FALSE(scanner->MoveNext());
    REQUIRE(transport->queries_.size() == 2);
}

TEST_CASE("query-limit")
{
    LOG(INFO) << "running: query-limit: ";

    auto transport = std::make_shared<FakeTransport>();
    Model model(ThreadSchema(), transport);
    transport->on_query_ = [](const DDB::QueryRequest &req)
    {
        return DDB::QueryOutcome(
            TwoPages().Page<DDB::QueryResult>(req.GetExclusiveStartKey()));
    };

    SECTION("limit in the middle of a page")
    {
        QueryOptions options;
        options.limit_ = 4;
        auto scanner = model.Query(Value("forum"), std::nullopt, std::nullopt,
                                   options);
        size_t count = 0;
        while (scanner->MoveNext())
        {
            count++;
        }
        REQUIRE(count == 4);
        REQUIRE(transport->queries_[0].GetLimit() == 4);
        // Resume right after the last item handed out.
        REQUIRE(scanner->LastEvaluatedKey() == KeyDoc(3));

        options.exclusive_start_key_ = scanner->LastEvaluatedKey();
        options.limit_.reset();
        auto rest = model.Query(Value("forum"), std::nullopt, std::nullopt,
                                options);
        REQUIRE(rest->MoveNext());
        REQUIRE(transport->queries_.back().GetExclusiveStartKey() ==
                KeyDoc(3));
    }

    SECTION("limit at the end of a page")
    {
        QueryOptions options;
        options.limit_ = 3;
        options.page_size_ = 10;
        auto scanner = model.Query(Value("forum"), std::nullopt, std::nullopt,
                                   options);
        size_t count = 0;
        while (scanner->MoveNext())
        {
            count++;
        }
        REQUIRE(count == 3);
        REQUIRE(transport->queries_.size() == 1);
        REQUIRE(transport->queries_[0].GetLimit() == 10);
        REQUIRE(scanner->LastEvaluatedKey() == KeyDoc(2));
    }
}

TEST_CASE("query-index")
{
    LOG(INFO) << "running: query-index: ";

    auto transport = std::make_shared<FakeTransport>();
    Model model(ThreadSchema(), transport);
    const Schema &schema = model.GetSchema();
    transport->on_query_ = [](const DDB::QueryRequest &req)
    {
        return DDB::QueryOutcome(
            TwoPages().Page<DDB::QueryResult>(req.GetExclusiveStartKey()));
    };

    QueryOptions options;
    options.index_name_ = "by_author";
    options.limit_ = 1;
    auto scanner = model.Query(
        Value("author0"), Eq(schema.Get("subject"), Value("0")), std::nullopt,
        options);
    REQUIRE(scanner->MoveNext());
    REQUIRE_FALSE(scanner->MoveNext());
    REQUIRE(transport->queries_[0].GetIndexName() == "by_author");
    REQUIRE(transport->queries_[0].GetKeyConditionExpression() ==
            "(#a0 = :v0 AND #a1 = :v1)");
    REQUIRE(transport->queries_[0].GetExpressionAttributeNames().at("#a0") ==
            "author");
    // The resume key of an index carries the table and the index keys.
    const AttributeMap &last = scanner->LastEvaluatedKey();
    REQUIRE(last.size() == 3);
    REQUIRE(last.at("author").GetS() == "author0");

    QueryOptions local;
    local.index_name_ = "by_views";
    REQUIRE_NOTHROW(model.Query(
        Value("forum"), Gt(schema.Get("views"), Value(5)), std::nullopt, local));

    QueryOptions unknown;
    unknown.index_name_ = "missing";
    REQUIRE_THROWS_AS(model.Query(Value("forum"), std::nullopt, std::nullopt,
                                  unknown),
                      SchemaError);
}

TEST_CASE("query-range-key-condition-errors")
{
    LOG(INFO) << "running: query-range-key-condition-errors: ";

    auto transport = std::make_shared<FakeTransport>();
    Model model(ThreadSchema(), transport);
    const Schema &schema = model.GetSchema();
    const Attribute &subject = schema.Get("subject");

    REQUIRE_THROWS_AS(
        model.Query(Value("forum"), Eq(schema.Get("views"), Value(1))),
        BuildError);
    REQUIRE_THROWS_AS(model.Query(Value("forum"), Ne(subject, Value("a"))),
                      BuildError);
    REQUIRE_THROWS_AS(model.Query(Value("forum"), Contains(subject, Value("a"))),
                      BuildError);
    REQUIRE_THROWS_AS(model.Query(Value("forum"), Exists(subject)), BuildError);
    REQUIRE_THROWS_AS(
        model.Query(Value("forum"),
                    And(Ge(subject, Value("a")), Le(subject, Value("c")))),
        BuildError);
    REQUIRE_NOTHROW(model.Query(
        Value("forum"), Between(subject, Value("a"), Value("c"))));
    REQUIRE(transport->queries_.empty());
}

TEST_CASE("query-transport-error")
{
    LOG(INFO) << "running: query-transport-error: ";

    auto transport = std::make_shared<FakeTransport>();
    Model model(ThreadSchema(), transport);
    transport->on_query_ = [](const DDB::QueryRequest &)
    {
        return DDB::QueryOutcome(MakeError(DynamoDBErrors::RESOURCE_NOT_FOUND,
                                           "ResourceNotFoundException",
                                           "Requested resource not found"));
    };

    auto scanner = model.Query(Value("forum"));
    try
    {
        scanner->MoveNext();
        FAIL("query was expected to fail");
    }
    catch (const TransportError &e)
    {
        REQUIRE(e.Operation() == "Query");
        REQUIRE(e.Error().GetErrorType() == DynamoDBErrors::RESOURCE_NOT_FOUND);
    }
}

TEST_CASE("scan-pagination-and-options")
{
    LOG(INFO) << "running: scan-pagination-and-options: ";

    auto transport = std::make_shared<FakeTransport>();
    Model model(ThreadSchema(), transport);
    const Schema &schema = model.GetSchema();
    transport->on_scan_ = [](const DDB::ScanRequest &req)
    {
        return DDB::ScanOutcome(
            TwoPages().Page<DDB::ScanResult>(req.GetExclusiveStartKey()));
    };

    ScanOptions options;
    options.segment_ = 1;
    options.total_segments_ = 4;
    auto scanner = model.Scan(Ge(schema.Get("views"), Value(0)), options);
    size_t count = 0;
    while (scanner->MoveNext())
    {
        count++;
    }
    REQUIRE(count == 5);
    REQUIRE(scanner->ScannedCount() == 6);
    REQUIRE(transport->scans_.size() == 2);
    REQUIRE(transport->scans_[0].GetFilterExpression() == "#a0 >= :v0");
    REQUIRE(transport->scans_[0].GetSegment() == 1);
    REQUIRE(transport->scans_[0].GetTotalSegments() == 4);

    ScanOptions half;
    half.segment_ = 0;
    REQUIRE_THROWS_AS(model.Scan(std::nullopt, half), BuildError);

    ScanOptions unknown;
    unknown.index_name_ = "missing";
    REQUIRE_THROWS_AS(model.Scan(std::nullopt, unknown), SchemaError);
}

TEST_CASE("query-count")
{
    LOG(INFO) << "running: query-count: ";

    auto transport = std::make_shared<FakeTransport>();
    Model model(ThreadSchema(), transport);
    transport->on_query_ = [](const DDB::QueryRequest &req)
    {
        return DDB::QueryOutcome(
            TwoPages().Page<DDB::QueryResult>(req.GetExclusiveStartKey()));
    };

    REQUIRE(model.Count(Value("forum")) == 5);
    REQUIRE(transport->queries_.size() == 2);
    REQUIRE(transport->queries_[0].GetSelect() == DDB::Select::COUNT);
    REQUIRE_FALSE(transport->queries_[0].ProjectionExpressionHasBeenSet());

    QueryOptions options;
    options.limit_ = 2;
    REQUIRE(model.Count(Value("forum"), std::nullopt, std::nullopt, options) ==
            2);
    REQUIRE(transport->queries_.size() == 3);
}
