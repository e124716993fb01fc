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
#include "transport.h"

#include <aws/core/auth/AWSCredentials.h>
#include <aws/core/client/ClientConfiguration.h>
#include <glog/logging.h>

namespace EloqDM
{
using namespace Aws::DynamoDB::Model;

DynamoTransport::DynamoTransport(const ClientConfig &config)
{
    Aws::Client::ClientConfiguration clientConfig;
    clientConfig.region = config.region_;
    if (config.endpoint_.size())
    {
        // Override endpoint if provided, e.g. DynamoDB Local.
        clientConfig.endpointOverride = config.endpoint_;
    }
    clientConfig.connectTimeoutMs = config.connect_timeout_ms_;
    clientConfig.requestTimeoutMs = config.request_timeout_ms_;

    if (config.aws_access_key_id_.empty() || config.aws_secret_key_.empty())
    {
        client_ = std::make_unique<Aws::DynamoDB::DynamoDBClient>(clientConfig);
    }
    else
    {
        Aws::Auth::AWSCredentials credentials(config.aws_access_key_id_,
                                              config.aws_secret_key_);
        client_ = std::make_unique<Aws::DynamoDB::DynamoDBClient>(credentials,
                                                                  clientConfig);
    }
    LOG(INFO) << "DynamoDB client created, region: " << config.region_
              << ", endpoint: "
              << (config.endpoint_.empty() ? "<default>" : config.endpoint_);
}

PutItemOutcome DynamoTransport::PutItem(const PutItemRequest &req)
{
    return client_->PutItem(req);
}

GetItemOutcome DynamoTransport::GetItem(const GetItemRequest &req)
{
    return client_->GetItem(req);
}

UpdateItemOutcome DynamoTransport::UpdateItem(const UpdateItemRequest &req)
{
    return client_->UpdateItem(req);
}

DeleteItemOutcome DynamoTransport::DeleteItem(const DeleteItemRequest &req)
{
    return client_->DeleteItem(req);
}

QueryOutcome DynamoTransport::Query(const QueryRequest &req)
{
    return client_->Query(req);
}

ScanOutcome DynamoTransport::Scan(const ScanRequest &req)
{
    return client_->Scan(req);
}

BatchGetItemOutcome DynamoTransport::BatchGetItem(
    const BatchGetItemRequest &req)
{
    return client_->BatchGetItem(req);
}

BatchWriteItemOutcome DynamoTransport::BatchWriteItem(
    const BatchWriteItemRequest &req)
{
    return client_->BatchWriteItem(req);
}

CreateTableOutcome DynamoTransport::CreateTable(const CreateTableRequest &req)
{
    return client_->CreateTable(req);
}

DescribeTableOutcome DynamoTransport::DescribeTable(
    const DescribeTableRequest &req)
{
    return client_->DescribeTable(req);
}

DeleteTableOutcome DynamoTransport::DeleteTable(const DeleteTableRequest &req)
{
    return client_->DeleteTable(req);
}

AwsApiGuard::AwsApiGuard()
{
    // This must be called before doing anything else with the SDK.
    Aws::InitAPI(sdk_options_);
}

AwsApiGuard::~AwsApiGuard()
{
    Aws::ShutdownAPI(sdk_options_);
}

}  // namespace EloqDM
