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
#include "http_test_server.hpp"

#include <reclaim/app.hpp>
#include <reclaim/exceptions.hpp>
#include <reclaim/mark_repository.hpp>
#include <reclaim/version.hpp>

#include <iterator>
#include <limits>

class AppTestFixture : public testing::Test
{
protected:
  temporary_directory directory_;

  /**
   * main keeps three objects, two deleted branches left data/file behind in a
   * dangling commit.
   */
  static constexpr auto metadata_ =
      "default_retention 1\n"
      "entry t0 not_deleted_file1 data/nd1\n"
      "entry t0 not_deleted_file2 data/nd2\n"
      "entry t0 not_deleted_file3 data/nd3\n"
      "commit c0 0 t0\n"
      "entry t1 not_deleted_file1 data/nd1\n"
      "entry t1 not_deleted_file2 data/nd2\n"
      "entry t1 not_deleted_file3 data/nd3\n"
      "entry t1 file data/file\n"
      "commit c1 10 t1 c0\n"
      "branch main c0\n"
      "dangling c1\n"
      "dangling c1\n";

  void SetUp() override
  {
    for (const auto *_key : {"data/nd1", "data/nd2", "data/nd3", "data/file"})
      directory_.write(std::string("store/") + _key);

    directory_.write("repository.meta", metadata_);
  }

  [[nodiscard]] program_parameters parameters(const std::string &mode, const std::string &mark_id) const
  {
    return program_parameters{
      .mode_ = mode,
      .mark_id_ = mark_id,
      .metadata_ = (directory_.path() / "repository.meta").string(),
      .marks_dir_ = (directory_.path() / "marks").string(),
      .storage_type_ = "local",
      .storage_namespace_ = "local://" + (directory_.path() / "store").string(),
      .now_ = 1'700'000'000,
    };
  }

  [[nodiscard]] bool stored(const std::string &key) const
  {
    return std::filesystem::exists(directory_.path() / "store" / key);
  }

  [[nodiscard]] mark_repository marks() const
  {
    return mark_repository(directory_.path() / "marks");
  }

  static int run(const program_parameters &parameters)
  {
    const auto _app = std::make_shared<app>(parameters);
    return _app->run();
  }
};

TEST_F(AppTestFixture, MarkOnlyLeavesObjectsInPlace)
{
  ASSERT_EQ(run(parameters("mark", "marker10")), EXIT_SUCCESS);

  const auto _manifest = marks().load("marker10");
  ASSERT_EQ(_manifest.addresses_, std::vector<object_address>{"data/file"});
  ASSERT_TRUE(stored("data/file"));
  ASSERT_FALSE(std::filesystem::exists(directory_.path() / "marks" / "marker10.report"));
}

TEST_F(AppTestFixture, SweepOnlyRemovesExactlyTheMarkedObjects)
{
  ASSERT_EQ(run(parameters("mark", "marker11")), EXIT_SUCCESS);
  ASSERT_EQ(run(parameters("sweep", "marker11")), EXIT_SUCCESS);

  ASSERT_FALSE(stored("data/file"));
  ASSERT_TRUE(stored("data/nd1"));
  ASSERT_TRUE(stored("data/nd2"));
  ASSERT_TRUE(stored("data/nd3"));
  ASSERT_TRUE(std::filesystem::exists(directory_.path() / "marks" / "marker11.report"));
}

TEST_F(AppTestFixture, SweepOnlyNeverRecomputesReachability)
{
  marks().save({.mark_id_ = "manual", .created_at_ = from_seconds(1), .addresses_ = {"data/nd1"}});

  ASSERT_EQ(run(parameters("sweep", "manual")), EXIT_SUCCESS);

  ASSERT_FALSE(stored("data/nd1"));
  ASSERT_TRUE(stored("data/file"));
}

TEST_F(AppTestFixture, MarkAndSweepWithGeneratedMarkId)
{
  ASSERT_EQ(run(parameters("both", "")), EXIT_SUCCESS);

  ASSERT_FALSE(stored("data/file"));
  ASSERT_TRUE(stored("data/nd1"));

  std::size_t _manifests = 0;
  for (const auto &_entry : std::filesystem::directory_iterator(directory_.path() / "marks"))
    _manifests += _entry.path().extension() == ".manifest" ? 1 : 0;
  ASSERT_EQ(_manifests, 1u);
}

TEST_F(AppTestFixture, ResweepReportsObjectsAsAbsent)
{
  ASSERT_EQ(run(parameters("both", "twice")), EXIT_SUCCESS);
  ASSERT_EQ(run(parameters("sweep", "twice")), EXIT_SUCCESS);

  std::ifstream _in(directory_.path() / "marks" / "twice.report");
  const std::string _content{std::istreambuf_iterator<char>(_in), std::istreambuf_iterator<char>()};
  ASSERT_NE(_content.find("absent data/file"), std::string::npos);
  ASSERT_NE(_content.find("failed_count 0"), std::string::npos);
}

TEST_F(AppTestFixture, RecentEvaluationTimeMarksNothing)
{
  auto _parameters = parameters("both", "early");
  _parameters.now_ = 20;

  ASSERT_EQ(run(_parameters), EXIT_SUCCESS);

  ASSERT_TRUE(marks().load("early").addresses_.empty());
  ASSERT_TRUE(stored("data/file"));
}

TEST_F(AppTestFixture, SweepRequiresMarkId)
{
  ASSERT_THROW(static_cast<void>(run(parameters("sweep", ""))), validation_error);
}

TEST_F(AppTestFixture, SweepOfUnknownMarkFails)
{
  ASSERT_THROW(static_cast<void>(run(parameters("sweep", "missing"))), mark_not_found);
  ASSERT_TRUE(stored("data/file"));
}

TEST_F(AppTestFixture, InvalidRulesAreRejectedBeforeMarking)
{
  directory_.write("repository.meta", "default_retention 1\nrule main 1\nrule main 2\n");

  ASSERT_THROW(static_cast<void>(run(parameters("both", "rules"))), validation_error);
  ASSERT_FALSE(marks().exists("rules"));
}

TEST_F(AppTestFixture, UnreadableAncestryPublishesNoManifest)
{
  directory_.write("repository.meta", "default_retention 1\ntree t\ncommit c1 10 t c0\nbranch main c1\n");

  ASSERT_THROW(static_cast<void>(run(parameters("both", "broken"))), ancestry_read_error);
  ASSERT_FALSE(marks().exists("broken"));
  ASSERT_TRUE(stored("data/file"));
}

TEST_F(AppTestFixture, InvalidParametersAreRejected)
{
  auto _mode = parameters("purge", "m");
  auto _storage = parameters("both", "m");
  _storage.storage_type_ = "gcs";
  auto _mismatch = parameters("both", "m");
  _mismatch.storage_type_ = "s3";
  auto _mark_id = parameters("mark", "../m");

  ASSERT_THROW(static_cast<void>(run(_mode)), validation_error);
  ASSERT_THROW(static_cast<void>(run(_storage)), validation_error);
  ASSERT_THROW(static_cast<void>(run(_mismatch)), validation_error);
  ASSERT_THROW(static_cast<void>(run(_mark_id)), validation_error);
}

TEST_F(AppTestFixture, MetadataIsFetchedFromTheControlPlane)
{
  http_test_server _server(
    [](const http_request &request, int)
    {
      http_response _response{boost::beast::http::status::ok, 11};
      if (request.target() == "/export")
        _response.body() = metadata_;
      else
        _response.result(boost::beast::http::status::not_found);
      return _response;
    });

  auto _parameters = parameters("mark", "remote");
  _parameters.metadata_ = _server.url("/export");
  ASSERT_EQ(run(_parameters), EXIT_SUCCESS);
  ASSERT_EQ(marks().load("remote").addresses_, std::vector<object_address>{"data/file"});

  auto _missing = parameters("mark", "missing-export");
  _missing.metadata_ = _server.url("/missing");
  ASSERT_THROW(static_cast<void>(run(_missing)), transport_error);
  ASSERT_FALSE(marks().exists("missing-export"));
}

TEST_F(AppTestFixture, OutOfRangeEvaluationTimeIsRejected)
{
  auto _parameters = parameters("mark", "far");
  _parameters.now_ = std::numeric_limits<std::int64_t>::max();

  ASSERT_THROW(static_cast<void>(run(_parameters)), validation_error);
}

TEST(App, Version)
{
  ASSERT_EQ(get_version(), "1.2.0");
}
