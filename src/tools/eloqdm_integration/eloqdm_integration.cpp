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
#include <memory>
#include <string>
#include <vector>

#include "INIReader.h"
#include "attribute.h"
#include "gflags/gflags.h"
#include "glog/logging.h"
#include "glog_error_logging.h"
#include "model.h"
#include "model_config.h"
#include "schema.h"
#include "transport.h"

DEFINE_string(config, "", "ini file with a [dynamodb] section");
DEFINE_string(log_file_name_prefix,
              "eloqdm_integration",
              "Prefix of the log file names");
DEFINE_string(table_prefix, "eloqdm-ci", "Prefix of the tables created");

namespace EloqDM
{
namespace Tools
{
std::shared_ptr<const Schema> ThreadSchema()
{
    return SchemaBuilder(FLAGS_table_prefix)
        .Add(UnicodeAttribute("forum").HashKey())
        .Add(UnicodeAttribute("thread").RangeKey())
        .Add(NumberAttribute("view").Default(0))
        .Add(UTCDateTimeAttribute("epoch").DefaultFactory(
            []() { return Value(NowTimestamp()); }))
        .Add(BinaryAttribute("content").Nullable())
        .Add(NumberSetAttribute("scores"))
        .Add(VersionAttribute("version"))
        .AddLocalIndex("view_index", "forum", "view")
        .AddGlobalIndex("epoch_index",
                        "epoch",
                        std::nullopt,
                        Projection::All(),
                        Throughput{2, 1})
        .Register();
}

void RecreateTable(const Model &model)
{
    if (model.Exists())
    {
        model.DeleteTable(true);
    }
    model.CreateTable(true, Throughput{1, 1});
}

void PrintScanner(ResultScanner &scanner, const char *what)
{
    while (scanner.MoveNext())
    {
        LOG(INFO) << what << ": " << scanner.Current().DebugString();
    }
}

bool RunModelFlow(const std::shared_ptr<Transport> &transport,
                  const ClientConfig &config)
{
    Model model(ThreadSchema(), transport, config);
    const Schema &schema = model.GetSchema();
    RecreateTable(model);

    Item obj = model.NewItem("1", Value("2"));
    model.Save(obj);
    model.Refresh(obj);
    obj = model.NewItem("foo", Value("bar"));
    model.Save(obj);

    Item obj3 = model.NewItem("setitem", Value("setrange"));
    obj3.Set("scores", NumberSet{Number(1), Number(2.1)});
    model.Save(obj3);
    model.Refresh(obj3);

    model.WithBatchWrite(
        [&](BatchWriter &batch)
        {
            for (int x = 0; x < 10; ++x)
            {
                batch.Save(model.NewItem("hash-" + std::to_string(x),
                                         Value(std::to_string(x))));
            }
        });

    std::vector<ItemKey> keys;
    for (int x = 0; x < 10; ++x)
    {
        keys.push_back(ItemKey{"hash-" + std::to_string(x),
                               Value("thread-" + std::to_string(x))});
    }
    BatchGetScanner batch_get = model.BatchGet(keys);
    while (batch_get.MoveNext())
    {
        LOG(INFO) << "Batch get item: " << batch_get.Current().DebugString();
    }

    auto query = model.Query("setitem", BeginsWith(schema.Get("thread"), "set"));
    PrintScanner(*query, "Query item");

    model.WithBatchWrite(
        [&](BatchWriter &batch)
        {
            for (int x = 0; x < 10; ++x)
            {
                batch.Delete(model.NewItem("hash-" + std::to_string(x),
                                           Value(std::to_string(x))));
            }
        });

    auto scan = model.Scan();
    PrintScanner(*scan, "Scanned item");

    Timestamp tstamp = NowTimestamp();
    Item query_obj = model.NewItem("query_forum", Value("query_thread"));
    query_obj.Set("forum", "foo");
    model.Save(query_obj);
    model.Update(query_obj, {Add(schema.Get("view"), 1)});

    QueryOptions epoch_options;
    epoch_options.index_name_ = "epoch_index";
    auto by_epoch = model.Query(tstamp, std::nullopt, std::nullopt, epoch_options);
    PrintScanner(*by_epoch, "Item queried from index");

    QueryOptions view_options;
    view_options.index_name_ = "view_index";
    auto by_view = model.Query(
        "foo", Gt(schema.Get("view"), 0), std::nullopt, view_options);
    PrintScanner(*by_view, "Item queried from index");

    model.Update(query_obj, {Set(schema.Get("scores"), NumberSet())});
    model.Refresh(query_obj);
    if (query_obj.Has("scores"))
    {
        LOG(ERROR) << "scores should be gone after setting an empty set";
        return false;
    }

    model.Update(query_obj,
                 {Add(schema.Get("view"), 1)},
                 Exists(schema.Get("forum")));
    LOG(INFO) << "Updated item: " << query_obj.DebugString();

    model.DeleteTable();
    return true;
}

bool RunConditionFailureFlow(const std::shared_ptr<Transport> &transport,
                             const ClientConfig &config)
{
    Model model(SchemaBuilder(FLAGS_table_prefix)
                    .Add(UnicodeAttribute("user_id").HashKey())
                    .Add(UnicodeAttribute("created_at").RangeKey())
                    .Add(MapAttribute("data").Nullable())
                    .Add(VersionAttribute("version"))
                    .Register(),
                transport,
                config);
    RecreateTable(model);

    Item origin_obj = model.NewItem("1", Value("2"));
    model.Save(origin_obj);
    std::optional<Item> parallel_obj = model.Get("1", Value("2"));
    if (!parallel_obj.has_value())
    {
        LOG(ERROR) << "item 1/2 not found after save";
        return false;
    }
    parallel_obj->Set("data", ValueMap{{"foo", "bar"}});
    model.Save(*parallel_obj);

    // origin_obj is one version behind.
    origin_obj.Set("data", ValueMap{{"foo", "second_bar"}});
    bool ok = false;
    try
    {
        model.Save(origin_obj,
                   std::nullopt,
                   ReturnValuesOnConditionFailure::AllOld);
        LOG(ERROR) << "stale save succeeded";
    }
    catch (const VersionConflict &e)
    {
        if (!e.HasOldItem())
        {
            LOG(ERROR) << "version conflict without the stored item";
        }
        else
        {
            Item old_parallel_obj = model.FromRawData(*e.RawOldItem());
            ok = old_parallel_obj.Get("data") == Value(ValueMap{{"foo", "bar"}}) &&
                 old_parallel_obj.Version() == 2;
            LOG(INFO) << "stored item on conflict: "
                      << old_parallel_obj.DebugString();
        }
    }
    model.DeleteTable();
    return ok;
}

bool RunVersionInheritanceCheck()
{
    std::shared_ptr<const Schema> model_a =
        SchemaBuilder(FLAGS_table_prefix + "-a")
            .Add(UnicodeAttribute("forum").HashKey())
            .Add(UnicodeAttribute("thread").RangeKey())
            .Add(NumberAttribute("scores"))
            .Add(VersionAttribute("version"))
            .Register();
    std::shared_ptr<const Schema> model_b =
        SchemaBuilder(FLAGS_table_prefix + "-b").Register(model_a.get());
    if (model_b->VersionAttribute() == nullptr)
    {
        LOG(ERROR) << "version attribute not inherited";
        return false;
    }
    try
    {
        SchemaBuilder(FLAGS_table_prefix + "-c")
            .Add(VersionAttribute("version_invalid"))
            .Register(model_a.get());
    }
    catch (const SchemaError &e)
    {
        return std::string(e.what()) ==
               "The model has more than one Version attribute: version, "
               "version_invalid";
    }
    return false;
}

}  // namespace Tools
}  // namespace EloqDM

int main(int argc, char *argv[])
{
    google::ParseCommandLineFlags(&argc, &argv, true);
    EloqDM::InitGoogleLogging(argv);
    EloqDM::AwsApiGuard aws_api;

    EloqDM::ClientConfig config;
    if (!FLAGS_config.empty())
    {
        INIReader reader(FLAGS_config);
        if (reader.ParseError() != 0)
        {
            LOG(ERROR) << "Failed to parse config file: " << FLAGS_config;
            return -1;
        }
        config = EloqDM::ClientConfig(reader);
    }
    else
    {
        config = EloqDM::ClientConfig::FromFlags();
    }

    auto transport = std::make_shared<EloqDM::DynamoTransport>(config);
    int failures = 0;
    try
    {
        if (!EloqDM::Tools::RunModelFlow(transport, config))
        {
            failures++;
        }
        if (!EloqDM::Tools::RunConditionFailureFlow(transport, config))
        {
            LOG(ERROR) << "condition failure flow failed";
            failures++;
        }
        if (!EloqDM::Tools::RunVersionInheritanceCheck())
        {
            LOG(ERROR) << "version inheritance check failed";
            failures++;
        }
    }
    catch (const EloqDM::ModelError &e)
    {
        LOG(ERROR) << "integration run aborted: " << e.what();
        return -1;
    }

    LOG(INFO) << "integration run finished with " << failures << " failures";
    return failures == 0 ? 0 : -1;
}
