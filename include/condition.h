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

#include <memory>
#include <optional>
#include <vector>

#include "attribute.h"
#include "attribute_value.h"

namespace EloqDM
{
enum class ConditionOp : uint8_t
{
    Equals = 0,
    NotEquals,
    LessThan,
    LessOrEqual,
    GreaterThan,
    GreaterOrEqual,
    Between,
    In,
    Exists,
    NotExists,
    BeginsWith,
    Contains,
    And,
    Or,
    Not
};

const char *ConditionOpName(ConditionOp op);

/**
 * @brief Immutable node of a condition tree. Leaves reference one attribute
 * and its literal operands, And/Or/Not nodes reference their children.
 * Copies share the same node.
 *
 * The referenced attribute must outlive the condition, which holds for
 * attributes taken from a registered Schema.
 */
class Condition
{
public:
    ConditionOp Op() const
    {
        return node_->op_;
    }

    bool IsLogical() const
    {
        return node_->op_ == ConditionOp::And ||
               node_->op_ == ConditionOp::Or || node_->op_ == ConditionOp::Not;
    }

    // nullptr for And/Or/Not.
    const Attribute *GetAttribute() const
    {
        return node_->attr_;
    }

    const std::vector<Value> &Operands() const
    {
        return node_->operands_;
    }

    const std::vector<Condition> &Children() const
    {
        return node_->children_;
    }

private:
    struct Node
    {
        ConditionOp op_;
        const Attribute *attr_{nullptr};
        std::vector<Value> operands_;
        std::vector<Condition> children_;
    };

    explicit Condition(std::shared_ptr<const Node> node)
        : node_(std::move(node))
    {
    }

    static Condition Leaf(ConditionOp op,
                          const Attribute &attr,
                          std::vector<Value> operands);
    static Condition Logical(ConditionOp op, std::vector<Condition> children);

    friend Condition Eq(const Attribute &, Value);
    friend Condition Ne(const Attribute &, Value);
    friend Condition Lt(const Attribute &, Value);
    friend Condition Le(const Attribute &, Value);
    friend Condition Gt(const Attribute &, Value);
    friend Condition Ge(const Attribute &, Value);
    friend Condition Between(const Attribute &, Value, Value);
    friend Condition In(const Attribute &, std::vector<Value>);
    friend Condition Exists(const Attribute &);
    friend Condition NotExists(const Attribute &);
    friend Condition BeginsWith(const Attribute &, Value);
    friend Condition Contains(const Attribute &, Value);
    friend Condition And(Condition, Condition);
    friend Condition Or(Condition, Condition);
    friend Condition Not(Condition);

    std::shared_ptr<const Node> node_;
};

Condition Eq(const Attribute &attr, Value value);
Condition Ne(const Attribute &attr, Value value);
Condition Lt(const Attribute &attr, Value value);
Condition Le(const Attribute &attr, Value value);
Condition Gt(const Attribute &attr, Value value);
Condition Ge(const Attribute &attr, Value value);
Condition Between(const Attribute &attr, Value lower, Value upper);
// @throws BuildError for an empty candidate list.
Condition In(const Attribute &attr, std::vector<Value> candidates);
Condition Exists(const Attribute &attr);
Condition NotExists(const Attribute &attr);
// String, Binary and set attributes only, BuildError otherwise.
Condition BeginsWith(const Attribute &attr, Value prefix);
Condition Contains(const Attribute &attr, Value element);
Condition And(Condition lhs, Condition rhs);
Condition Or(Condition lhs, Condition rhs);
Condition Not(Condition operand);

// And() of an optional condition with another one.
inline std::optional<Condition> AndMaybe(std::optional<Condition> lhs,
                                         std::optional<Condition> rhs)
{
    if (!lhs.has_value())
    {
        return rhs;
    }
    if (!rhs.has_value())
    {
        return lhs;
    }
    return And(std::move(*lhs), std::move(*rhs));
}

}  // namespace EloqDM
