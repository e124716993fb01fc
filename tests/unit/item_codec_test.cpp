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
#include <glog/logging.h>

#include <catch2/catch_all.hpp>
#include <string>

#include "fake_transport.h"
#include "item.h"
#include "item_codec.h"
#include "model_errors.h"
#include "schema.h"

using namespace EloqDM;
using EloqDM::Test::N;
using EloqDM::Test::S;

namespace
{
std::shared_ptr<const Schema> ThreadSchema()
{
    return SchemaBuilder("thread")
        .Add(UnicodeAttribute("forum_name").HashKey())
        .Add(UnicodeAttribute("subject").RangeKey())
        .Add(NumberAttribute("views").Default(0))
        .Add(UnicodeSetAttribute("tags"))
        .Add(JSONAttribute("data").Nullable())
        .Add(UTCDateTimeAttribute("created").DefaultFactory(
            []() { return Value(NowTimestamp()); }))
        .Add(VersionAttribute("version"))
        .Register();
}
}  // namespace

TEST_CASE("item-defaults-and-access")
{
    LOG(INFO) << "running: item-defaults-and-access: ";

    auto schema = ThreadSchema();
    Item item(schema, Value("forum"), Value("subject"));
    REQUIRE(item.Get("views") == Value(0));
    REQUIRE(item.Get("created").Is<Timestamp>());
    REQUIRE(item.Get("tags").IsNull());
    REQUIRE_FALSE(item.Version().has_value());
    REQUIRE_THROWS_AS(item.Get("missing"), SchemaError);
    REQUIRE_THROWS_AS(item.Set("missing", Value(1)), SchemaError);

    item.Set("views", Value());
    REQUIRE_FALSE(item.Has("views"));

    auto no_range = SchemaBuilder("single")
                        .Add(UnicodeAttribute("id").HashKey())
                        .Register();
    REQUIRE_THROWS_AS(Item(no_range, Value("a"), Value("b")), SchemaError);
}

TEST_CASE("item-encode")
{
    LOG(INFO) << "running: item-encode: ";

    auto schema = ThreadSchema();
    Item item(schema, Value("forum"), Value("subject"));
    item.Set("views", Value(3));
    item.Set("tags", Value(StringSet{}));
    item.Set("data", Value(ValueMap{{"foo", Value("bar")}}));

    AttributeMap doc = Encode(item);
    REQUIRE(doc.at("forum_name").GetS() == "forum");
    REQUIRE(doc.at("subject").GetS() == "subject");
    REQUIRE(doc.at("views").GetN() == "3");
    REQUIRE(doc.at("data").GetS() == "{\"foo\":\"bar\"}");
    REQUIRE(doc.count("created") == 1);
    // Empty sets and unset attributes are not written.
    REQUIRE(doc.count("tags") == 0);
    REQUIRE(doc.count("version") == 0);

    Item keyless(schema);
    REQUIRE_THROWS_AS(Encode(keyless), MarshalError);
}

TEST_CASE("item-encode-key")
{
    LOG(INFO) << "running: item-encode-key: ";

    auto schema = ThreadSchema();
    AttributeMap key = EncodeKey(*schema, Value("f"), Value("s"));
    REQUIRE(key.size() == 2);
    REQUIRE(key.at("forum_name").GetS() == "f");
    REQUIRE(DescribeKey(key, *schema) == "forum_name=\"f\", subject=\"s\"");

    REQUIRE_THROWS_AS(EncodeKey(*schema, Value("f")), MarshalError);
    REQUIRE_THROWS_AS(EncodeKey(*schema, Value(), Value("s")), MarshalError);

    auto numbered = SchemaBuilder("numbered")
                        .Add(NumberAttribute("id").HashKey())
                        .Register();
    AttributeMap num_key = EncodeKey(*numbered, Value(5));
    REQUIRE(num_key.size() == 1);
    REQUIRE(DescribeKey(num_key, *numbered) == "id=5");
    REQUIRE_THROWS_AS(EncodeKey(*numbered, Value(5), Value(6)), MarshalError);
}

TEST_CASE("item-decode")
{
    LOG(INFO) << "running: item-decode: ";

    auto schema = ThreadSchema();
    AttributeMap doc;
    doc["forum_name"] = S("forum");
    doc["subject"] = S("subject");
    doc["version"] = N("4");
    doc["extra"] = S("kept");

    Item item = Decode(doc, schema);
    REQUIRE(item.HashKeyValue() == Value("forum"));
    REQUIRE(item.RangeKeyValue() == Value("subject"));
    REQUIRE(item.Version() == 4);
    // Defaults are for new items only, a stored item lacks what it lacks.
    REQUIRE_FALSE(item.Has("views"));
    REQUIRE_FALSE(item.Has("created"));
    // Attributes the schema does not know survive a read and write cycle.
    REQUIRE(item.RawAttributes().at("extra").GetS() == "kept");
    REQUIRE(Encode(item).at("extra").GetS() == "kept");

    AttributeMap no_range = doc;
    no_range.erase("subject");
    REQUIRE_THROWS_AS(Decode(no_range, schema), DecodeError);

    AttributeMap bad_type = doc;
    bad_type["views"] = S("many");
    REQUIRE_THROWS_AS(Decode(bad_type, schema), UnmarshalError);
}

TEST_CASE("item-decode-raw")
{
    LOG(INFO) << "running: item-decode-raw: ";

    auto schema = ThreadSchema();
    AttributeMap doc;
    doc["forum_name"] = S("forum");
    doc["subject"] = S("subject");
    doc["data"] = S("{\"foo\":\"bar\"}");
    doc["version"] = N("2");

    Item item = DecodeRaw(doc, schema);
    REQUIRE(item.Get("data") == Value(ValueMap{{"foo", Value("bar")}}));
    REQUIRE(item.Version() == 2);

    Item again = Decode(Encode(item), schema);
    REQUIRE(again == item);
}
