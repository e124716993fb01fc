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

#include <string>
#include <unordered_map>
#include <vector>

#include "condition.h"
#include "model_errors.h"
#include "update_action.h"

namespace EloqDM
{
/**
 * @brief Compiles the condition trees and update actions of one request into
 * the store's expression language.
 *
 * Attribute names are always replaced by "#aN" tokens and literal values by
 * ":vN" tokens, so reserved words and special characters in names never
 * reach the expression text. A builder belongs to a single request: tokens
 * are shared between all the expressions compiled with it (key condition,
 * filter, condition, update and projection) and both tables end up in that
 * request.
 */
class ExpressionBuilder
{
public:
    ExpressionBuilder() = default;
    ExpressionBuilder(const ExpressionBuilder &) = delete;
    ExpressionBuilder &operator=(const ExpressionBuilder &) = delete;

    std::string CompileCondition(const Condition &condition);

    /**
     * @brief Render "SET ... REMOVE ... ADD ... DELETE ...", each clause
     * listing its actions in call order.
     * @throws BuildError if the list is empty or names an attribute twice.
     */
    std::string CompileUpdate(const UpdateActions &actions);

    std::string CompileProjection(const std::vector<std::string> &names);

    // Token -> attribute name.
    const Aws::Map<Aws::String, Aws::String> &Names() const
    {
        return names_;
    }

    // Token -> wire value.
    const AttributeMap &Values() const
    {
        return values_;
    }

    /**
     * @brief Attach the substitution tables to a request. Empty tables are
     * left out since the store rejects them.
     */
    template <typename RequestT>
    void ApplyTo(RequestT &request) const
    {
        if (!names_.empty())
        {
            request.SetExpressionAttributeNames(names_);
        }
        if (!values_.empty())
        {
            request.SetExpressionAttributeValues(values_);
        }
    }

    // Same for requests that take names only (GetItem, BatchGet keys).
    template <typename RequestT>
    void ApplyNamesTo(RequestT &request) const
    {
        if (!names_.empty())
        {
            request.SetExpressionAttributeNames(names_);
        }
    }

private:
    std::string NameToken(const std::string &name);
    std::string ValueToken(const Aws::DynamoDB::Model::AttributeValue &value);
    std::string OperandToken(const Attribute &attr, const Value &value);
    void CompileInto(const Condition &condition, std::string &out);

    Aws::Map<Aws::String, Aws::String> names_;
    std::unordered_map<std::string, std::string> name_tokens_;
    AttributeMap values_;
    // Keyed by the compact JSON form of the wire value.
    std::unordered_map<std::string, std::string> value_tokens_;
};

}  // namespace EloqDM
