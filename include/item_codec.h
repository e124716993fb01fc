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
#include <string>

#include "item.h"
#include "model_errors.h"
#include "schema.h"

namespace EloqDM
{
/**
 * @brief Convert an item into the wire document written by PutItem. Absent
 * attributes and empty sets are left out, raw attributes are copied as is.
 * @throws MarshalError for values the declared attribute cannot hold.
 */
AttributeMap Encode(const Item &item);

/**
 * @brief Primary key document of an item or of explicit key values.
 * @throws MarshalError if a key value is null, including a missing range key
 * for a model that declares one.
 */
AttributeMap EncodeKey(const Item &item);
AttributeMap EncodeKey(const Schema &schema,
                       const Value &hash_key,
                       const std::optional<Value> &range_key = std::nullopt);

/**
 * @brief Build an item from a document returned by the store.
 * @throws DecodeError if a key attribute is missing, UnmarshalError if a
 * declared attribute holds a value of the wrong type.
 */
Item Decode(const AttributeMap &document,
            const std::shared_ptr<const Schema> &schema);

/**
 * @brief Same as Decode() for documents that are not the result of a read,
 * e.g. the prior state attached to a failed conditional write.
 */
Item DecodeRaw(const AttributeMap &document,
               const std::shared_ptr<const Schema> &schema);

// Render the key part of a document, e.g. "forum=\"x\", subject=\"y\"".
std::string DescribeKey(const AttributeMap &document, const Schema &schema);

}  // namespace EloqDM
