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
#include <aws/dynamodb/model/PutItemRequest.h>
#include <glog/logging.h>

#include <catch2/catch_all.hpp>
#include <string>

#include "condition.h"
#include "expression_builder.h"
#include "model_errors.h"
#include "schema.h"
#include "update_action.h"

using namespace EloqDM;

namespace
{
std::shared_ptr<const Schema> PostSchema()
{
    return SchemaBuilder("post")
        .Add(UnicodeAttribute("name").HashKey())
        .Add(UnicodeAttribute("subject").RangeKey())
        .Add(NumberAttribute("views").Default(0))
        .Add(NumberAttribute("rating").Nullable())
        .Add(UnicodeAttribute("body").Nullable())
        .Add(UnicodeAttribute("author").Nullable())
        .Add(UnicodeSetAttribute("tags"))
        .Register();
}
}  // namespace

TEST_CASE("expression-comparison")
{
    LOG(INFO) << "running: expression-comparison: ";

    auto schema = PostSchema();
    const Attribute &views = schema->Get("views");
    const Attribute &name = schema->Get("name");

    ExpressionBuilder builder;
    REQUIRE(builder.CompileCondition(Eq(name, Value("x"))) == "#a0 = :v0");
    // "name" is a reserved word, it only appears through its token.
    REQUIRE(builder.Names().at("#a0") == "name");
    REQUIRE(builder.Values().at(":v0").GetS() == "x");

    REQUIRE(builder.CompileCondition(Ne(views, Value(1))) == "#a1 <> :v1");
    REQUIRE(builder.CompileCondition(Lt(views, Value(2))) == "#a1 < :v2");
    REQUIRE(builder.CompileCondition(Le(views, Value(3))) == "#a1 <= :v3");
    REQUIRE(builder.CompileCondition(Gt(views, Value(1))) == "#a1 > :v1");
    REQUIRE(builder.CompileCondition(Ge(views, Value(2))) == "#a1 >= :v2");
    REQUIRE(builder.Names().size() == 2);
    REQUIRE(builder.Values().size() == 4);
}

TEST_CASE("expression-placeholder-reuse")
{
    LOG(INFO) << "running: expression-placeholder-reuse: ";

    auto schema = PostSchema();
    const Attribute &views = schema->Get("views");
    const Attribute &rating = schema->Get("rating");

    ExpressionBuilder builder;
    std::string expr = builder.CompileCondition(
        And(Eq(views, Value(5)), Or(Eq(rating, Value(5)), Ne(views, Value(5)))));
    REQUIRE(expr == "(#a0 = :v0 AND (#a1 = :v0 OR #a0 <> :v0))");
    REQUIRE(builder.Names().size() == 2);
    REQUIRE(builder.Values().size() == 1);
    REQUIRE(builder.Values().at(":v0").GetN() == "5");

    // Same number, different type: a string "5" is another value.
    ExpressionBuilder other;
    other.CompileCondition(
        And(Eq(views, Value(5)), Eq(schema->Get("body"), Value("5"))));
    REQUIRE(other.Values().size() == 2);
}

TEST_CASE("expression-logical-nesting")
{
    LOG(INFO) << "running: expression-logical-nesting: ";

    auto schema = PostSchema();
    const Attribute &views = schema->Get("views");
    const Attribute &body = schema->Get("body");

    ExpressionBuilder builder;
    REQUIRE(builder.CompileCondition(
                Not(Or(Lt(views, Value(1)), Gt(views, Value(10))))) ==
            "(NOT (#a0 < :v0 OR #a0 > :v1))");
    REQUIRE(builder.CompileCondition(
                And(And(Exists(body), NotExists(views)), Not(Exists(body)))) ==
            "((attribute_exists (#a1) AND attribute_not_exists (#a0)) AND "
            "(NOT attribute_exists (#a1)))");
}

TEST_CASE("expression-functions")
{
    LOG(INFO) << "running: expression-functions: ";

    auto schema = PostSchema();
    const Attribute &views = schema->Get("views");
    const Attribute &subject = schema->Get("subject");
    const Attribute &tags = schema->Get("tags");

    ExpressionBuilder builder;
    REQUIRE(builder.CompileCondition(Between(views, Value(1), Value(10))) ==
            "#a0 BETWEEN :v0 AND :v1");
    REQUIRE(builder.CompileCondition(
                In(subject, {Value("a"), Value("b"), Value("a")})) ==
            "#a1 IN (:v2, :v3, :v2)");
    REQUIRE(builder.CompileCondition(BeginsWith(subject, Value("b"))) ==
            "begins_with (#a1, :v3)");
    REQUIRE(builder.CompileCondition(Contains(tags, Value("x"))) ==
            "contains (#a2, :v4)");
    // The operand of contains() on a set is one element.
    REQUIRE(builder.Values().at(":v4").GetS() == "x");
}

TEST_CASE("expression-condition-errors")
{
    LOG(INFO) << "running: expression-condition-errors: ";

    auto schema = PostSchema();
    const Attribute &views = schema->Get("views");
    const Attribute &tags = schema->Get("tags");

    REQUIRE_THROWS_AS(In(views, {}), BuildError);
    REQUIRE_THROWS_AS(Eq(views, Value()), BuildError);
    REQUIRE_THROWS_AS(Between(views, Value(1), Value()), BuildError);
    REQUIRE_THROWS_AS(Contains(views, Value(1)), BuildError);
    REQUIRE_THROWS_AS(BeginsWith(views, Value(1)), BuildError);

    ExpressionBuilder builder;
    // An empty set is no value at all.
    REQUIRE_THROWS_AS(builder.CompileCondition(Eq(tags, Value(StringSet{}))),
                      BuildError);
    REQUIRE_THROWS_AS(builder.CompileCondition(Eq(views, Value("text"))),
                      MarshalError);
}

TEST_CASE("expression-update")
{
    LOG(INFO) << "running: expression-update: ";

    auto schema = PostSchema();
    const Attribute &views = schema->Get("views");
    const Attribute &rating = schema->Get("rating");
    const Attribute &body = schema->Get("body");
    const Attribute &author = schema->Get("author");
    const Attribute &tags = schema->Get("tags");

    UpdateActions actions{Add(views, Value(1)),
                          Set(body, Value("hi")),
                          Delete(tags, Value(StringSet{"x"})),
                          Remove(author),
                          Set(rating, Value(2))};
    ExpressionBuilder builder;
    REQUIRE(builder.CompileUpdate(actions) ==
            "SET #a0 = :v0, #a1 = :v1 REMOVE #a2 ADD #a3 :v2 DELETE #a4 :v3");
    REQUIRE(builder.Names().at("#a0") == "body");
    REQUIRE(builder.Names().at("#a3") == "views");
    REQUIRE(builder.Values().at(":v3").GetSS().size() == 1);

    // Setting null or an empty set removes the attribute.
    REQUIRE(Set(body, Value()).op_ == UpdateOp::Remove);
    REQUIRE(Set(tags, Value(StringSet{})).op_ == UpdateOp::Remove);

    ExpressionBuilder only_remove;
    REQUIRE(only_remove.CompileUpdate({Set(body, Value())}) == "REMOVE #a0");
    REQUIRE(only_remove.Values().empty());
}

TEST_CASE("expression-update-errors")
{
    LOG(INFO) << "running: expression-update-errors: ";

    auto schema = PostSchema();
    const Attribute &views = schema->Get("views");
    const Attribute &body = schema->Get("body");
    const Attribute &tags = schema->Get("tags");

    ExpressionBuilder builder;
    REQUIRE_THROWS_AS(builder.CompileUpdate({}), BuildError);
    REQUIRE_THROWS_AS(
        builder.CompileUpdate({Set(views, Value(1)), Add(views, Value(2))}),
        BuildError);

    REQUIRE_THROWS_AS(Set(schema->Get("name"), Value("x")), BuildError);
    REQUIRE_THROWS_AS(Remove(schema->Get("subject")), BuildError);
    REQUIRE_THROWS_AS(Add(body, Value("x")), BuildError);
    REQUIRE_THROWS_AS(Add(views, Value()), BuildError);
    REQUIRE_THROWS_AS(Delete(views, Value(1)), BuildError);
    REQUIRE_THROWS_AS(Delete(tags, Value(StringSet{})), BuildError);
}

TEST_CASE("expression-projection")
{
    LOG(INFO) << "running: expression-projection: ";

    auto schema = PostSchema();
    ExpressionBuilder builder;
    builder.CompileCondition(Exists(schema->Get("views")));
    REQUIRE(builder.CompileProjection({"subject", "views"}) == "#a1, #a0");
    REQUIRE_THROWS_AS(builder.CompileProjection({}), BuildError);

    Aws::DynamoDB::Model::PutItemRequest req;
    builder.ApplyTo(req);
    REQUIRE(req.ExpressionAttributeNamesHasBeenSet());
    // No literal was used, the values table stays off the request.
    REQUIRE_FALSE(req.ExpressionAttributeValuesHasBeenSet());
}

TEST_CASE("expression-aliases-used-once")
{
    LOG(INFO) << "running: expression-aliases-used-once: ";

    auto schema = SchemaBuilder("thread")
                      .Add(UnicodeAttribute("forum").HashKey())
                      .Add(NumberAttribute("view").Default(0))
                      .Register();
    ExpressionBuilder builder;
    std::string expr = builder.CompileCondition(
        And(Eq(schema->Get("forum"), Value("foo")),
            Gt(schema->Get("view"), Value(0))));
    REQUIRE(expr == "(#a0 = :v0 AND #a1 > :v1)");
    REQUIRE(builder.Names().size() == 2);
    REQUIRE(builder.Values().size() == 2);
    for (const auto &[token, name] : builder.Names())
    {
        REQUIRE(expr.find(token) == expr.rfind(token));
    }
    for (const auto &[token, value] : builder.Values())
    {
        REQUIRE(expr.find(token) == expr.rfind(token));
    }
}
