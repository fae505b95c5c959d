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

#include <reclaim/exceptions.hpp>
#include <reclaim/metadata_reader.hpp>
#include <sstream>

TEST(MetadataReader, ReadsEveryRecordType)
{
  std::istringstream _in(R"(# exported repository
default_retention 21
rule main 7

tree t0
commit c0 100 t0
entry t1 data/a.csv addr-a
entry t1 data/b.csv addr-b
commit c1 200 t1 c0
branch main c1
dangling c0 150 removed-branch
dangling c1
)");

  const auto _metadata = read_metadata(_in);

  ASSERT_EQ(_metadata.rules_.default_retention_days_, 21);
  ASSERT_EQ(_metadata.rules_.branches_.size(), 1);
  ASSERT_EQ(_metadata.rules_.branches_[0].branch_id_, "main");
  ASSERT_EQ(_metadata.rules_.branches_[0].retention_days_, 7);

  const auto &_store = *_metadata.store_;
  ASSERT_EQ(_store.commit_count(), 2);

  const auto _branches = _store.branches();
  ASSERT_EQ(_branches.size(), 1);
  ASSERT_EQ(_branches[0].name_, "main");
  ASSERT_EQ(_branches[0].tip_, "c1");

  const auto &_commit = _store.get_commit("c1");
  ASSERT_EQ(_commit.parents_, std::vector<std::string>{"c0"});
  ASSERT_EQ(_commit.created_at_, from_seconds(200));
  ASSERT_EQ(_store.get_tree(_commit.tree_id_).at("data/b.csv"), "addr-b");
  ASSERT_TRUE(_store.get_tree("t0").empty());

  const auto _dangling = _store.dangling_roots();
  ASSERT_EQ(_dangling.size(), 2);
  ASSERT_EQ(_dangling[0].commit_id_, "c0");
  ASSERT_EQ(_dangling[0].deleted_at_, from_seconds(150));
  ASSERT_EQ(_dangling[0].branch_name_, "removed-branch");
  ASSERT_FALSE(_dangling[1].deleted_at_.has_value());
}

TEST(MetadataReader, MergeCommitKeepsParentOrder)
{
  std::istringstream _in("tree t\ncommit m 5 t p1 p2 p3\n");

  const auto _metadata = read_metadata(_in);

  ASSERT_EQ(_metadata.store_->get_commit("m").parents_, (std::vector<std::string>{"p1", "p2", "p3"}));
}

TEST(MetadataReader, RejectsMalformedInput)
{
  const std::vector<std::string> _inputs{
    "unknown record\n",
    "default_retention many\n",
    "default_retention 1 2\n",
    "rule main\n",
    "commit c0 yesterday t0\n",
    "commit c0 1\n",
    "tree t0\ncommit c0 1 t0\ncommit c0 2 t0\n",
    "dangling c0 12x\n",
    "entry t0 path\n",
    "tree t0\ncommit c0 9223372036854775807 t0\n",
    "dangling c0 -9223372036854775808\n",
  };

  for (const auto &_input : _inputs)
  {
    SCOPED_TRACE(_input);
    std::istringstream _in(_input);
    ASSERT_THROW(static_cast<void>(read_metadata(_in)), serialize_error);
  }
}

TEST(MetadataReader, ErrorsCarryLineNumber)
{
  std::istringstream _in("default_retention 1\n\nbogus\n");

  try
  {
    static_cast<void>(read_metadata(_in));
    FAIL() << "expected serialize_error";
  }
  catch (const serialize_error &e)
  {
    ASSERT_NE(std::string(e.what()).find("line 3"), std::string::npos);
  }
}

TEST(MetadataReader, RulesAreNotValidatedByTheReader)
{
  std::istringstream _in("rule main 1\nrule main 2\n");

  const auto _metadata = read_metadata(_in);

  ASSERT_EQ(_metadata.rules_.branches_.size(), 2);
}

TEST(MetadataReader, MissingFileIsASerializeError)
{
  const temporary_directory _directory;

  ASSERT_THROW(static_cast<void>(read_metadata_file((_directory.path() / "absent.meta").string())), serialize_error);
}

TEST(MetadataReader, ReadsFromFile)
{
  const temporary_directory _directory;
  _directory.write("repository.meta", "default_retention 3\nentry t a addr\ncommit c 1 t\nbranch main c\n");

  const auto _metadata = read_metadata_file((_directory.path() / "repository.meta").string());

  ASSERT_EQ(_metadata.rules_.default_retention_days_, 3);
  ASSERT_EQ(_metadata.store_->branches().size(), 1);
}
