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

#include <aws/core/Aws.h>
#include <aws/dynamodb/DynamoDBErrors.h>
#include <aws/dynamodb/model/AttributeValue.h>
#include <aws/dynamodb/model/WriteRequest.h>

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace EloqDM
{
using AttributeMap =
    Aws::Map<Aws::String, Aws::DynamoDB::Model::AttributeValue>;

/**
 * @brief Root of every error raised by the model layer.
 */
class ModelError : public std::runtime_error
{
public:
    explicit ModelError(const std::string &msg) : std::runtime_error(msg)
    {
    }
};

// Bad model or index definition, raised at registration time.
class SchemaError : public ModelError
{
public:
    explicit SchemaError(const std::string &msg) : ModelError(msg)
    {
    }
};

// Native value cannot be written with the declared attribute type.
class MarshalError : public ModelError
{
public:
    explicit MarshalError(const std::string &msg) : ModelError(msg)
    {
    }
};

// Wire value does not carry the tag the attribute expects.
class UnmarshalError : public ModelError
{
public:
    explicit UnmarshalError(const std::string &msg) : ModelError(msg)
    {
    }
};

// Wire document cannot become an item, e.g. the hash key is missing.
class DecodeError : public ModelError
{
public:
    explicit DecodeError(const std::string &msg) : ModelError(msg)
    {
    }
};

// Malformed condition or update expression.
class BuildError : public ModelError
{
public:
    explicit BuildError(const std::string &msg) : ModelError(msg)
    {
    }
};

class DoesNotExist : public ModelError
{
public:
    explicit DoesNotExist(const std::string &msg) : ModelError(msg)
    {
    }
};

/**
 * @brief A request rejected by the store. The SDK error is kept unchanged so
 * callers can inspect its type, message and retry hint.
 */
class TransportError : public ModelError
{
public:
    TransportError(const std::string &operation,
                   const Aws::DynamoDB::DynamoDBError &error)
        : ModelError(operation + " failed: " + error.GetExceptionName() +
                     ": " + error.GetMessage()),
          operation_(operation),
          error_(error)
    {
    }

    const std::string &Operation() const
    {
        return operation_;
    }

    const Aws::DynamoDB::DynamoDBError &Error() const
    {
        return error_;
    }

private:
    std::string operation_;
    Aws::DynamoDB::DynamoDBError error_;
};

/**
 * @brief The condition attached to a write did not hold. When the write asked
 * for ALL_OLD on condition failure, the item as it is stored is attached
 * unmodified.
 */
class ConditionalCheckFailed : public TransportError
{
public:
    ConditionalCheckFailed(const std::string &operation,
                           const Aws::DynamoDB::DynamoDBError &error,
                           std::optional<AttributeMap> old_item)
        : TransportError(operation, error), old_item_(std::move(old_item))
    {
    }

    bool HasOldItem() const
    {
        return old_item_.has_value();
    }

    const std::optional<AttributeMap> &RawOldItem() const
    {
        return old_item_;
    }

private:
    std::optional<AttributeMap> old_item_;
};

/**
 * @brief Conditional failure of a write guarded by the version attribute.
 * Never retried by the library.
 */
class VersionConflict : public ConditionalCheckFailed
{
public:
    VersionConflict(const std::string &operation,
                    const Aws::DynamoDB::DynamoDBError &error,
                    std::optional<AttributeMap> old_item,
                    int64_t expected_version)
        : ConditionalCheckFailed(operation, error, std::move(old_item)),
          expected_version_(expected_version)
    {
    }

    int64_t ExpectedVersion() const
    {
        return expected_version_;
    }

private:
    int64_t expected_version_;
};

/**
 * @brief Batch operations still unprocessed after the retry ceiling. Exactly
 * one of the two lists is filled, depending on the batch kind.
 */
class BatchIncomplete : public ModelError
{
public:
    BatchIncomplete(const std::string &msg,
                    std::vector<Aws::DynamoDB::Model::WriteRequest> writes)
        : ModelError(msg), unprocessed_writes_(std::move(writes))
    {
    }

    BatchIncomplete(const std::string &msg, std::vector<AttributeMap> keys)
        : ModelError(msg), unprocessed_keys_(std::move(keys))
    {
    }

    const std::vector<Aws::DynamoDB::Model::WriteRequest> &UnprocessedWrites()
        const
    {
        return unprocessed_writes_;
    }

    const std::vector<AttributeMap> &UnprocessedKeys() const
    {
        return unprocessed_keys_;
    }

private:
    std::vector<Aws::DynamoDB::Model::WriteRequest> unprocessed_writes_;
    std::vector<AttributeMap> unprocessed_keys_;
};

}  // namespace EloqDM
