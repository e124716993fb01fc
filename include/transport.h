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
#include <aws/dynamodb/DynamoDBClient.h>
#include <aws/dynamodb/model/BatchGetItemRequest.h>
#include <aws/dynamodb/model/BatchWriteItemRequest.h>
#include <aws/dynamodb/model/CreateTableRequest.h>
#include <aws/dynamodb/model/DeleteItemRequest.h>
#include <aws/dynamodb/model/DeleteTableRequest.h>
#include <aws/dynamodb/model/DescribeTableRequest.h>
#include <aws/dynamodb/model/GetItemRequest.h>
#include <aws/dynamodb/model/PutItemRequest.h>
#include <aws/dynamodb/model/QueryRequest.h>
#include <aws/dynamodb/model/ScanRequest.h>
#include <aws/dynamodb/model/UpdateItemRequest.h>

#include <memory>

#include "model_config.h"

namespace EloqDM
{
/**
 * @brief The calls the model layer makes to the store. All calls are
 * synchronous and return the SDK outcome unchanged; translating failures
 * into exceptions is left to the caller.
 */
class Transport
{
public:
    virtual ~Transport() = default;

    virtual Aws::DynamoDB::Model::PutItemOutcome PutItem(
        const Aws::DynamoDB::Model::PutItemRequest &req) = 0;
    virtual Aws::DynamoDB::Model::GetItemOutcome GetItem(
        const Aws::DynamoDB::Model::GetItemRequest &req) = 0;
    virtual Aws::DynamoDB::Model::UpdateItemOutcome UpdateItem(
        const Aws::DynamoDB::Model::UpdateItemRequest &req) = 0;
    virtual Aws::DynamoDB::Model::DeleteItemOutcome DeleteItem(
        const Aws::DynamoDB::Model::DeleteItemRequest &req) = 0;
    virtual Aws::DynamoDB::Model::QueryOutcome Query(
        const Aws::DynamoDB::Model::QueryRequest &req) = 0;
    virtual Aws::DynamoDB::Model::ScanOutcome Scan(
        const Aws::DynamoDB::Model::ScanRequest &req) = 0;
    virtual Aws::DynamoDB::Model::BatchGetItemOutcome BatchGetItem(
        const Aws::DynamoDB::Model::BatchGetItemRequest &req) = 0;
    virtual Aws::DynamoDB::Model::BatchWriteItemOutcome BatchWriteItem(
        const Aws::DynamoDB::Model::BatchWriteItemRequest &req) = 0;
    virtual Aws::DynamoDB::Model::CreateTableOutcome CreateTable(
        const Aws::DynamoDB::Model::CreateTableRequest &req) = 0;
    virtual Aws::DynamoDB::Model::DescribeTableOutcome DescribeTable(
        const Aws::DynamoDB::Model::DescribeTableRequest &req) = 0;
    virtual Aws::DynamoDB::Model::DeleteTableOutcome DeleteTable(
        const Aws::DynamoDB::Model::DeleteTableRequest &req) = 0;
};

/**
 * @brief Transport over the AWS SDK DynamoDB client. Aws::InitAPI must have
 * been called, see AwsApiGuard.
 */
class DynamoTransport : public Transport
{
public:
    explicit DynamoTransport(const ClientConfig &config);

    Aws::DynamoDB::Model::PutItemOutcome PutItem(
        const Aws::DynamoDB::Model::PutItemRequest &req) override;
    Aws::DynamoDB::Model::GetItemOutcome GetItem(
        const Aws::DynamoDB::Model::GetItemRequest &req) override;
    Aws::DynamoDB::Model::UpdateItemOutcome UpdateItem(
        const Aws::DynamoDB::Model::UpdateItemRequest &req) override;
    Aws::DynamoDB::Model::DeleteItemOutcome DeleteItem(
        const Aws::DynamoDB::Model::DeleteItemRequest &req) override;
    Aws::DynamoDB::Model::QueryOutcome Query(
        const Aws::DynamoDB::Model::QueryRequest &req) override;
    Aws::DynamoDB::Model::ScanOutcome Scan(
        const Aws::DynamoDB::Model::ScanRequest &req) override;
    Aws::DynamoDB::Model::BatchGetItemOutcome BatchGetItem(
        const Aws::DynamoDB::Model::BatchGetItemRequest &req) override;
    Aws::DynamoDB::Model::BatchWriteItemOutcome BatchWriteItem(
        const Aws::DynamoDB::Model::BatchWriteItemRequest &req) override;
    Aws::DynamoDB::Model::CreateTableOutcome CreateTable(
        const Aws::DynamoDB::Model::CreateTableRequest &req) override;
    Aws::DynamoDB::Model::DescribeTableOutcome DescribeTable(
        const Aws::DynamoDB::Model::DescribeTableRequest &req) override;
    Aws::DynamoDB::Model::DeleteTableOutcome DeleteTable(
        const Aws::DynamoDB::Model::DeleteTableRequest &req) override;

private:
    std::unique_ptr<Aws::DynamoDB::DynamoDBClient> client_;
};

/**
 * @brief Aws::InitAPI() for the lifetime of the guard. Create one in main()
 * before any DynamoTransport.
 */
class AwsApiGuard
{
public:
    AwsApiGuard();
    ~AwsApiGuard();

    AwsApiGuard(const AwsApiGuard &) = delete;
    AwsApiGuard &operator=(const AwsApiGuard &) = delete;

private:
    Aws::SDKOptions sdk_options_;
};

}  // namespace EloqDM
