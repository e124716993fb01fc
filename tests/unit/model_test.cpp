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
#include <aws/dynamodb/model/BillingMode.h>
#include <aws/dynamodb/model/GlobalSecondaryIndexDescription.h>
#include <aws/dynamodb/model/IndexStatus.h>
#include <aws/dynamodb/model/KeyType.h>
#include <aws/dynamodb/model/ProjectionType.h>
#include <aws/dynamodb/model/ReturnValue.h>
#include <aws/dynamodb/model/ReturnValuesOnConditionCheckFailure.h>
#include <aws/dynamodb/model/ScalarAttributeType.h>
#include <aws/dynamodb/model/TableDescription.h>
#include <aws/dynamodb/model/TableStatus.h>
#include <glog/logging.h>

#include <catch2/catch_all.hpp>
#include <memory>
#include <string>

#include "fake_transport.h"
#include "item_codec.h"
#include "model.h"

using namespace EloqDM;
using namespace EloqDM::Test;

namespace
{
std::shared_ptr<const Schema> UserSchema()
{
    return SchemaBuilder("user")
        .Add(UnicodeAttribute("user_id").HashKey())
        .Add(UnicodeAttribute("created_at").RangeKey())
        .Add(MapAttribute("data").Nullable())
        .Add(NumberAttribute("views").Default(0))
        .Add(UnicodeAttribute("body").Nullable())
        .Add(VersionAttribute("version"))
        .Register();
}

AttributeMap UserDoc(const std::string &views, const std::string &version)
{
    AttributeMap doc;
    doc["user_id"] = S("1");
    doc["created_at"] = S("2");
    doc["views"] = N(views);
    doc["version"] = N(version);
    return doc;
}

DDB::DescribeTableOutcome ActiveTable()
{
    DDB::GlobalSecondaryIndexDescription gsi;
    gsi.SetIndexName("by_email");
    gsi.SetIndexStatus(DDB::IndexStatus::ACTIVE);
    DDB::TableDescription table;
    table.SetTableName("user");
    table.SetTableStatus(DDB::TableStatus::ACTIVE);
    table.AddGlobalSecondaryIndexes(gsi);
    DDB::DescribeTableResult result;
    result.SetTable(table);
    return DDB::DescribeTableOutcome(std::move(result));
}
}  // namespace

TEST_CASE("model-conditional-failure-payload")
{
    LOG(INFO) << "running: model-conditional-failure-payload: ";

    auto transport = std::make_shared<FakeTransport>();
    Model model(UserSchema(), transport);

    // What the store holds after a concurrent writer saved version 2.
    auto foo = std::make_shared<DDB::AttributeValue>(S("bar"));
    DDB::AttributeValue data;
    data.AddMEntry("foo", foo);
    AttributeMap stored;
    stored["user_id"] = S("1");
    stored["created_at"] = S("2");
    stored["data"] = data;
    stored["version"] = N("2");

    transport->on_put_ = [&stored](const DDB::PutItemRequest &)
    {
        return DDB::PutItemOutcome(
            MakeConditionalError("The conditional request failed", stored));
    };

    Item stale = model.NewItem(Value("1"), Value("2"));
    stale.Set("version", Value(1));
    stale.Set("data", Value(ValueMap{{"foo", Value("second_bar")}}));
    try
    {
        model.Save(stale, std::nullopt, ReturnValuesOnConditionFailure::AllOld);
        FAIL("stale save was expected to fail");
    }
    catch (const VersionConflict &e)
    {
        REQUIRE(e.ExpectedVersion() == 1);
        REQUIRE(e.HasOldItem());
        Item old_item = model.FromRawData(*e.RawOldItem());
        REQUIRE(old_item.Get("data") == Value(ValueMap{{"foo", Value("bar")}}));
        REQUIRE(old_item.Version() == 2);
    }
    REQUIRE(transport->puts_[0].GetReturnValuesOnConditionCheckFailure() ==
            DDB::ReturnValuesOnConditionCheckFailure::ALL_OLD);
    REQUIRE(stale.Version() == 1);
}

TEST_CASE("model-get")
{
    LOG(INFO) << "running: model-get: ";

    auto transport = std::make_shared<FakeTransport>();
    Model model(UserSchema(), transport);

    REQUIRE_FALSE(model.Get(Value("1"), Value("2")).has_value());

    transport->on_get_ = [](const DDB::GetItemRequest &)
    {
        DDB::GetItemResult result;
        result.SetItem(UserDoc("3", "4"));
        return DDB::GetItemOutcome(std::move(result));
    };
    std::optional<Item> item =
        model.Get(Value("1"), Value("2"), true, {"views", "version"});
    REQUIRE(item.has_value());
    REQUIRE(item->Get("views") == Value(3));
    REQUIRE(item->Version() == 4);

    const auto &req = transport->gets_.back();
    REQUIRE(req.GetKey().size() == 2);
    REQUIRE(req.GetKey().at("created_at").GetS() == "2");
    REQUIRE(req.GetConsistentRead());
    REQUIRE(req.GetProjectionExpression() == "#a0, #a1");

    // A range key is required for this model.
    REQUIRE_THROWS_AS(model.Get(Value("1")), MarshalError);
}

TEST_CASE("model-refresh")
{
    LOG(INFO) << "running: model-refresh: ";

    auto transport = std::make_shared<FakeTransport>();
    Model model(UserSchema(), transport);
    Item item = model.NewItem(Value("1"), Value("2"));
    REQUIRE_THROWS_AS(model.Refresh(item), DoesNotExist);

    transport->on_get_ = [](const DDB::GetItemRequest &)
    {
        DDB::GetItemResult result;
        result.SetItem(UserDoc("9", "3"));
        return DDB::GetItemOutcome(std::move(result));
    };
    item.Set("body", Value("local only"));
    model.Refresh(item, true);
    REQUIRE(item.Get("views") == Value(9));
    REQUIRE(item.Version() == 3);
    REQUIRE_FALSE(item.Has("body"));
}

TEST_CASE("model-update-all-new")
{
    LOG(INFO) << "running: model-update-all-new: ";

    auto transport = std::make_shared<FakeTransport>();
    Model model(UserSchema(), transport);
    const Schema &schema = model.GetSchema();
    transport->on_update_ = [](const DDB::UpdateItemRequest &)
    {
        DDB::UpdateItemResult result;
        result.SetAttributes(UserDoc("7", "2"));
        return DDB::UpdateItemOutcome(std::move(result));
    };

    Item item = model.NewItem(Value("1"), Value("2"));
    item.Set("version", Value(1));
    item.Set("body", Value("gone"));
    model.Update(item,
                 {Add(schema.Get("views"), Value(7)), Remove(schema.Get("body"))},
                 Gt(schema.Get("views"), Value(-1)));

    const auto &req = transport->updates_.back();
    REQUIRE(req.GetReturnValues() == DDB::ReturnValue::ALL_NEW);
    REQUIRE(req.GetUpdateExpression() ==
            "SET #a0 = :v0 REMOVE #a1 ADD #a2 :v1");
    REQUIRE(req.GetConditionExpression() == "(#a2 > :v2 AND #a0 = :v3)");
    REQUIRE(req.GetKey().size() == 2);

    // The item now mirrors what the store returned.
    REQUIRE(item.Get("views") == Value(7));
    REQUIRE(item.Version() == 2);
    REQUIRE_FALSE(item.Has("body"));
}

TEST_CASE("model-write-errors")
{
    LOG(INFO) << "running: model-write-errors: ";

    auto transport = std::make_shared<FakeTransport>();
    Model model(UserSchema(), transport);
    transport->on_put_ = [](const DDB::PutItemRequest &)
    {
        return DDB::PutItemOutcome(
            MakeError(DynamoDBErrors::THROTTLING, "ThrottlingException",
                      "Rate exceeded", true));
    };
    transport->on_delete_ = [](const DDB::DeleteItemRequest &)
    {
        return DDB::DeleteItemOutcome(
            MakeError(DynamoDBErrors::CONDITIONAL_CHECK_FAILED,
                      "ConditionalCheckFailedException",
                      "The conditional request failed"));
    };

    Item item = model.NewItem(Value("1"), Value("2"));
    try
    {
        model.Save(item);
        FAIL("save was expected to fail");
    }
    catch (const ConditionalCheckFailed &)
    {
        FAIL("a throttled write is not a condition failure");
    }
    catch (const TransportError &e)
    {
        REQUIRE(e.Operation() == "PutItem");
        REQUIRE(e.Error().GetErrorType() == DynamoDBErrors::THROTTLING);
        REQUIRE(e.Error().ShouldRetry());
    }
    REQUIRE_FALSE(item.Version().has_value());

    REQUIRE_THROWS_AS(
        model.Delete(item, Exists(model.GetSchema().Get("body"))),
        ConditionalCheckFailed);
    const auto &del = transport->deletes_.back();
    REQUIRE(del.GetConditionExpression() == "attribute_exists (#a0)");
    REQUIRE_FALSE(del.ExpressionAttributeValuesHasBeenSet());
}

TEST_CASE("model-create-table")
{
    LOG(INFO) << "running: model-create-table: ";

    auto schema =
        SchemaBuilder("user")
            .Add(UnicodeAttribute("user_id").HashKey())
            .Add(NumberAttribute("created_at").RangeKey())
            .Add(UnicodeAttribute("email").Nullable())
            .Add(NumberAttribute("score").Default(0))
            .AddLocalIndex("by_score", "user_id", "score", Projection::KeysOnly())
            .AddGlobalIndex("by_email",
                            "email",
                            std::nullopt,
                            Projection::Include({"score"}),
                            Throughput{5, 6})
            .Provisioning(2, 3)
            .Register();
    auto transport = std::make_shared<FakeTransport>();
    Model model(schema, transport);
    transport->on_describe_table_ = [](const DDB::DescribeTableRequest &)
    { return ActiveTable(); };

    model.CreateTable(true);
    REQUIRE(transport->creates_.size() == 1);
    REQUIRE(transport->describes_.size() == 1);
    const auto &ctr = transport->creates_[0];
    REQUIRE(ctr.GetTableName() == "user");

    const auto &defs = ctr.GetAttributeDefinitions();
    REQUIRE(defs.size() == 4);
    REQUIRE(defs[0].GetAttributeName() == "user_id");
    REQUIRE(defs[0].GetAttributeType() == DDB::ScalarAttributeType::S);
    REQUIRE(defs[1].GetAttributeName() == "created_at");
    REQUIRE(defs[1].GetAttributeType() == DDB::ScalarAttributeType::N);

    const auto &key_schema = ctr.GetKeySchema();
    REQUIRE(key_schema.size() == 2);
    REQUIRE(key_schema[0].GetKeyType() == DDB::KeyType::HASH);
    REQUIRE(key_schema[1].GetAttributeName() == "created_at");
    REQUIRE(key_schema[1].GetKeyType() == DDB::KeyType::RANGE);

    REQUIRE(ctr.GetLocalSecondaryIndexes().size() == 1);
    const auto &lsi = ctr.GetLocalSecondaryIndexes()[0];
    REQUIRE(lsi.GetIndexName() == "by_score");
    REQUIRE(lsi.GetProjection().GetProjectionType() ==
            DDB::ProjectionType::KEYS_ONLY);

    REQUIRE(ctr.GetGlobalSecondaryIndexes().size() == 1);
    const auto &gsi = ctr.GetGlobalSecondaryIndexes()[0];
    REQUIRE(gsi.GetKeySchema().size() == 1);
    REQUIRE(gsi.GetProjection().GetProjectionType() ==
            DDB::ProjectionType::INCLUDE);
    REQUIRE(gsi.GetProjection().GetNonKeyAttributes().size() == 1);
    REQUIRE(gsi.GetProvisionedThroughput().GetReadCapacityUnits() == 5);

    REQUIRE(ctr.GetBillingMode() == DDB::BillingMode::PROVISIONED);
    REQUIRE(ctr.GetProvisionedThroughput().GetReadCapacityUnits() == 2);
    REQUIRE(ctr.GetProvisionedThroughput().GetWriteCapacityUnits() == 3);

    model.CreateTable(false, std::nullopt, BillingMode::PayPerRequest);
    const auto &on_demand = transport->creates_[1];
    REQUIRE(on_demand.GetBillingMode() == DDB::BillingMode::PAY_PER_REQUEST);
    REQUIRE_FALSE(on_demand.ProvisionedThroughputHasBeenSet());
    REQUIRE_FALSE(
        on_demand.GetGlobalSecondaryIndexes()[0].ProvisionedThroughputHasBeenSet());
    REQUIRE(transport->describes_.size() == 1);
}

TEST_CASE("model-table-lifecycle")
{
    LOG(INFO) << "running: model-table-lifecycle: ";

    auto transport = std::make_shared<FakeTransport>();
    Model model(UserSchema(), transport);

    transport->on_describe_table_ = [](const DDB::DescribeTableRequest &)
    { return ActiveTable(); };
    REQUIRE(model.Exists());
    REQUIRE(model.DescribeTable().GetTableStatus() == DDB::TableStatus::ACTIVE);

    transport->on_describe_table_ = [](const DDB::DescribeTableRequest &)
    {
        return DDB::DescribeTableOutcome(
            MakeError(DynamoDBErrors::RESOURCE_NOT_FOUND,
                      "ResourceNotFoundException",
                      "Requested resource not found"));
    };
    REQUIRE_FALSE(model.Exists());
    REQUIRE_THROWS_AS(model.DescribeTable(), TransportError);
    model.DeleteTable(true);
    REQUIRE(transport->drops_.size() == 1);
    REQUIRE(transport->drops_[0].GetTableName() == "user");

    transport->on_describe_table_ = [](const DDB::DescribeTableRequest &)
    {
        return DDB::DescribeTableOutcome(
            MakeError(DynamoDBErrors::ACCESS_DENIED,
                      "AccessDeniedException",
                      "denied"));
    };
    REQUIRE_THROWS_AS(model.Exists(), TransportError);

    REQUIRE_THROWS_AS(Model(UserSchema(), nullptr), ModelError);
}
