// Copyright (C) 2025 Ian Torres
//
// This program is free software: you can redistribute it and/or modify
// it under the terms of the GNU Affero General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// (at your option) any later version.
//
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
// GNU Affero General Public License for more details.
//
// You should have received a copy of the GNU Affero General Public License
// along with this program. If not, see <https://www.gnu.org/licenses/>.

#include "fixtures.hpp"

#include <reclaim/bulk_remover_factory.hpp>
#include <reclaim/clients/azure_client.hpp>
#include <reclaim/clients/s3_client.hpp>
#include <reclaim/exceptions.hpp>
#include <reclaim/removers/azure_bulk_remover.hpp>
#include <reclaim/removers/local_bulk_remover.hpp>
#include <reclaim/removers/s3_bulk_remover.hpp>
#include <unordered_set>

namespace
{
  class fake_s3_client final : public s3_client
  {
  public:
    std::vector<std::string> delete_objects(const std::string &bucket, const std::vector<std::string> &keys) override
    {
      ++calls_;
      bucket_ = bucket;
      requested_ = keys;
      if (fail_)
        throw backend_error("s3 unavailable");

      std::vector<std::string> _confirmed;
      for (const auto &_key : keys)
        if (!rejected_.contains(_key))
          _confirmed.push_back(_key);
      return _confirmed;
    }

    int calls_ = 0;
    bool fail_ = false;
    std::string bucket_;
    std::vector<std::string> requested_;
    std::unordered_set<std::string> rejected_;
  };

  class fake_azure_client final : public azure_client
  {
  public:
    std::vector<unsigned> delete_blobs(const std::vector<std::string> &urls) override
    {
      ++calls_;
      requested_ = urls;
      if (throws_)
        throw validation_error("unsupported blob url");
      return statuses_;
    }

    int calls_ = 0;
    bool throws_ = false;
    std::vector<std::string> requested_;
    std::vector<unsigned> statuses_;
  };
} // namespace

TEST(BulkRemover, MaxBulkSizes)
{
  const s3_bulk_remover _s3(std::make_shared<fake_s3_client>(), "s3://bucket/prefix");
  const azure_bulk_remover _azure(std::make_shared<fake_azure_client>());
  const local_bulk_remover _local;

  ASSERT_EQ(_s3.get_max_bulk_size(), 1000);
  ASSERT_EQ(_azure.get_max_bulk_size(), 256);
  ASSERT_EQ(_local.get_max_bulk_size(), 1000);
}

TEST(BulkRemover, S3KeyNamesUseTheNamespacePath)
{
  const s3_bulk_remover _remover(std::make_shared<fake_s3_client>(), "s3://bucket/prefix");
  const std::vector<std::string> _keys{"data/a", "b"};

  ASSERT_EQ(
    _remover.construct_remove_key_names(_keys, "s3://bucket/prefix"),
    (std::vector<std::string>{"prefix/data/a", "prefix/b"}));
  ASSERT_EQ(
    _remover.construct_remove_key_names(_keys, "s3://bucket/nested/prefix/"),
    (std::vector<std::string>{"nested/prefix/data/a", "nested/prefix/b"}));
  ASSERT_EQ(_remover.construct_remove_key_names(_keys, "s3://bucket"), _keys);
}

TEST(BulkRemover, AzureKeyNamesAppendToTheNamespace)
{
  const azure_bulk_remover _remover(std::make_shared<fake_azure_client>());

  ASSERT_EQ(
    _remover.construct_remove_key_names({"a", "dir/b"}, "https://account.blob.core.windows.net/container/prefix"),
    (std::vector<std::string>{
      "https://account.blob.core.windows.net/container/prefix/a",
      "https://account.blob.core.windows.net/container/prefix/dir/b"}));
  ASSERT_EQ(
    _remover.construct_remove_key_names({"a"}, "https://account.blob.core.windows.net/container/"),
    std::vector<std::string>{"https://account.blob.core.windows.net/container/a"});
}

TEST(BulkRemover, EmptyKeysIssueNoBackendCall)
{
  const auto _s3_client = std::make_shared<fake_s3_client>();
  const auto _azure_client = std::make_shared<fake_azure_client>();
  s3_bulk_remover _s3(_s3_client, "s3://bucket/prefix");
  azure_bulk_remover _azure(_azure_client);
  local_bulk_remover _local;

  ASSERT_TRUE(_s3.construct_remove_key_names({}, "s3://bucket/prefix").empty());
  ASSERT_TRUE(_azure.construct_remove_key_names({}, "https://account/container").empty());

  const auto _s3_result = _s3.delete_objects({}, "s3://bucket/prefix");
  const auto _azure_result = _azure.delete_objects({}, "https://account/container");
  const auto _local_result = _local.delete_objects({}, "local://nowhere");

  ASSERT_TRUE(_s3_result.deleted_.empty());
  ASSERT_TRUE(_azure_result.deleted_.empty());
  ASSERT_TRUE(_local_result.deleted_.empty());
  ASSERT_EQ(_s3_client->calls_, 0);
  ASSERT_EQ(_azure_client->calls_, 0);
}

TEST(BulkRemover, S3ReturnsOnlyConfirmedKeys)
{
  const auto _client = std::make_shared<fake_s3_client>();
  _client->rejected_.insert("prefix/b");
  s3_bulk_remover _remover(_client, "s3://bucket/prefix/");

  const auto _result = _remover.delete_objects({"a", "b", "c"}, "s3://bucket/prefix/");

  ASSERT_EQ(_client->calls_, 1);
  ASSERT_EQ(_client->bucket_, "bucket");
  ASSERT_EQ(_client->requested_, (std::vector<std::string>{"prefix/a", "prefix/b", "prefix/c"}));
  ASSERT_EQ(_result.deleted_, (std::vector<std::string>{"a", "c"}));
  ASSERT_TRUE(_result.error_.empty());
}

TEST(BulkRemover, S3BackendFailureIsReportedNotThrown)
{
  const auto _client = std::make_shared<fake_s3_client>();
  _client->fail_ = true;
  s3_bulk_remover _remover(_client, "s3://bucket/prefix");

  delete_result _result;
  ASSERT_NO_THROW(_result = _remover.delete_objects({"a", "b"}, "s3://bucket/prefix"));
  ASSERT_TRUE(_result.deleted_.empty());
  ASSERT_EQ(_result.error_, "s3 unavailable");
}

TEST(BulkRemover, AzureStatusesMapToOutcomes)
{
  const auto _client = std::make_shared<fake_azure_client>();
  _client->statuses_ = {202, 200, 404, 500, 0};
  azure_bulk_remover _remover(_client);

  const auto _result = _remover.delete_objects({"a", "b", "c", "d", "e"}, "https://account/container");

  ASSERT_EQ(_client->requested_.front(), "https://account/container/a");
  ASSERT_EQ(_result.deleted_, (std::vector<std::string>{"a", "b"}));
  ASSERT_EQ(_result.absent_, std::vector<std::string>{"c"});
}

TEST(BulkRemover, AzureShortAnswerLeavesTailUnconfirmed)
{
  const auto _client = std::make_shared<fake_azure_client>();
  _client->statuses_ = {202};
  azure_bulk_remover _remover(_client);

  const auto _result = _remover.delete_objects({"a", "b"}, "https://account/container");

  ASSERT_EQ(_result.deleted_, std::vector<std::string>{"a"});
  ASSERT_TRUE(_result.absent_.empty());
}

TEST(BulkRemover, LocalRemovesFilesAndReportsMissingOnes)
{
  const temporary_directory _directory;
  _directory.write("store/data/a");
  _directory.write("store/b");
  const auto _namespace = "local://" + (_directory.path() / "store").string();
  local_bulk_remover _remover;

  const auto _result = _remover.delete_objects({"data/a", "b", "missing"}, _namespace);

  ASSERT_EQ(_result.deleted_, (std::vector<std::string>{"data/a", "b"}));
  ASSERT_EQ(_result.absent_, std::vector<std::string>{"missing"});
  ASSERT_TRUE(_result.error_.empty());
  ASSERT_FALSE(std::filesystem::exists(_directory.path() / "store" / "data" / "a"));
  ASSERT_TRUE(std::filesystem::exists(_directory.path() / "store" / "data"));
}

TEST(BulkRemover, LocalKeyNamesJoinTheNamespaceDirectory)
{
  const local_bulk_remover _remover;

  ASSERT_EQ(
    _remover.construct_remove_key_names({"a", "/b"}, "local:///var/data"),
    (std::vector<std::string>{"/var/data/a", "/var/data/b"}));
}

TEST(BulkRemover, AzureClientFailureIsReportedNotThrown)
{
  const auto _client = std::make_shared<fake_azure_client>();
  _client->throws_ = true;
  azure_bulk_remover _remover(_client);

  delete_result _result;
  ASSERT_NO_THROW(_result = _remover.delete_objects({"a", "b"}, "https://acct.blob.core.windows.net/container/repo/"));
  ASSERT_TRUE(_result.deleted_.empty());
  ASSERT_TRUE(_result.absent_.empty());
  ASSERT_EQ(_result.error_, "unsupported blob url");
}

TEST(BulkRemover, AzureHttpsNamespaceWithoutEndpointIsAccepted)
{
  const auto _remover = make_bulk_remover(
    storage_types::azure, {.storage_namespace_ = "https://acct.blob.core.windows.net/container/repo/", .sas_token_ = "sv=x"});

  ASSERT_EQ(_remover->type(), storage_types::azure);
  ASSERT_EQ(
    _remover->construct_remove_key_names({"a"}, "https://acct.blob.core.windows.net/container/repo/"),
    std::vector<std::string>{"https://acct.blob.core.windows.net/container/repo/a"});
}

TEST(BulkRemover, AzureUnlocatableBlobIsReportedNotThrown)
{
  azure_bulk_remover _remover(std::make_shared<blob_batch_client>(azure_client_options{}));

  delete_result _result;
  ASSERT_NO_THROW(_result = _remover.delete_objects({"a"}, "https://acct.blob.core.windows.net"));
  ASSERT_TRUE(_result.deleted_.empty());
  ASSERT_FALSE(_result.error_.empty());
}

TEST(BulkRemover, LocalInvalidNamespaceIsReportedNotThrown)
{
  local_bulk_remover _remover;

  delete_result _result;
  ASSERT_NO_THROW(_result = _remover.delete_objects({"a"}, "no-scheme"));
  ASSERT_TRUE(_result.deleted_.empty());
  ASSERT_FALSE(_result.error_.empty());
}

TEST(BulkRemover, FactorySelectsRemoverByStorageType)
{
  const aws_api _aws;
  const run_context _context;

  const auto _local = make_bulk_remover(storage_types::local, {.storage_namespace_ = "local:///tmp/store"});
  const auto _s3 = make_bulk_remover(
    storage_types::s3, {.storage_namespace_ = "s3://bucket/prefix", .endpoint_ = "http://127.0.0.1:9000", .context_ = &_context});
  const auto _azure = make_bulk_remover(storage_types::azure, {.storage_namespace_ = "https://account/container"});

  ASSERT_EQ(_local->type(), storage_types::local);
  ASSERT_EQ(_s3->type(), storage_types::s3);
  ASSERT_EQ(_azure->type(), storage_types::azure);
}

TEST(BulkRemover, FactoryRejectsInvalidOptions)
{
  const run_context _context;

  ASSERT_THROW(
    static_cast<void>(make_bulk_remover(storage_types::s3, {.storage_namespace_ = "local:///tmp", .context_ = &_context})),
    validation_error);
  ASSERT_THROW(static_cast<void>(make_bulk_remover(storage_types::s3, {.storage_namespace_ = "s3://bucket"})), validation_error);
  ASSERT_THROW(
    static_cast<void>(make_bulk_remover(storage_types::s3, {.storage_namespace_ = "s3:///prefix", .context_ = &_context})),
    validation_error);
  ASSERT_THROW(
    static_cast<void>(make_bulk_remover(
      storage_types::s3, {.storage_namespace_ = "s3://bucket", .endpoint_ = "ftp://storage", .context_ = &_context})),
    validation_error);
  ASSERT_THROW(static_cast<void>(make_bulk_remover(storage_types::azure, {.storage_namespace_ = "https://account"})), validation_error);
  ASSERT_THROW(static_cast<void>(make_bulk_remover(storage_types::azure, {.storage_namespace_ = "s3://bucket/c"})), validation_error);
  ASSERT_THROW(static_cast<void>(make_bulk_remover(storage_types::local, {.storage_namespace_ = "/no/scheme"})), validation_error);
}
