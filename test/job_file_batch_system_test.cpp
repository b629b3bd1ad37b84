#include <catch2/catch.hpp>

#include "mocks.hpp"

#include <cloudburst/job_file_batch_system.hpp>

#include <boost/filesystem.hpp>
#include <boost/filesystem/fstream.hpp>

#include <sstream>

using namespace cloudburst;
using namespace cloudburst::test;

TEST_CASE("Job snapshots are parsed line by line", "[batch]")
{
  std::stringstream in("# jobid state submitted running node\n"
                       "\n"
                       "J1 PENDING 1600000000\n"
                       "J2 running 1600000000.5 1600000010 node1 # note\n"
                       "  J3\tfinished  -  -  -\n"
                       "J4 other\n");
  auto jobs = JobFileBatchSystem::ParseSnapshot(in, "queue");
  REQUIRE(jobs.size() == 4);

  REQUIRE(jobs[0].getJobID() == "J1");
  REQUIRE(jobs[0].isPending());
  REQUIRE(ToUnixSeconds(jobs[0].getSubmittedAt()) == Approx(1600000000));
  REQUIRE(jobs[0].getRunningAt() == TimePoint());

  REQUIRE(jobs[1].isRunning());
  REQUIRE(jobs[1].getExecNodeName() == "node1");
  REQUIRE(ToUnixSeconds(jobs[1].getSubmittedAt()) == Approx(1600000000.5));
  REQUIRE(ToUnixSeconds(jobs[1].getRunningAt()) == Approx(1600000010));

  REQUIRE(jobs[2].getState() == JobInfo::Finished);
  REQUIRE(jobs[2].getExecNodeName().empty());
  REQUIRE(jobs[3].getState() == JobInfo::Other);
}

TEST_CASE("Malformed job snapshots name the offending line", "[batch]")
{
  auto parse = [](const std::string& text) {
    std::stringstream in(text);
    return JobFileBatchSystem::ParseSnapshot(in, "queue");
  };

  REQUIRE_THROWS_WITH(parse("J1 PENDING 1\nJ2\n"),
                      Catch::StartsWith("queue:2: Expected 2 to 5 fields"));
  REQUIRE_THROWS_WITH(parse("J1 PENDING 1 2 node extra\n"),
                      Catch::StartsWith("queue:1:"));
  REQUIRE_THROWS_WITH(parse("J1 HELD\n"), Catch::Contains("HELD"));
  REQUIRE_THROWS_WITH(parse("J1 PENDING soon\n"),
                      Catch::StartsWith("queue:1:"));
  REQUIRE_THROWS_WITH(parse("J1 PENDING 12abc\n"),
                      Catch::Contains("Invalid time"));
  // Running jobs need a node.
  REQUIRE_THROWS_WITH(parse("J1 RUNNING 1 2\n"),
                      Catch::Contains("no execution node"));
  REQUIRE_THROWS_AS(parse("J1 RUNNING 1 2 -\n"), std::runtime_error);
}

TEST_CASE("Pending jobs without submission time are rejected", "[batch]")
{
  auto parse = [](const std::string& text) {
    std::stringstream in(text);
    return JobFileBatchSystem::ParseSnapshot(in, "queue");
  };

  REQUIRE_THROWS_WITH(parse("J1 RUNNING 1 2 node1\nJ2 PENDING - - -\n"),
                      Catch::StartsWith("queue:2:") &&
                        Catch::Contains("no submission time"));
  REQUIRE_THROWS_WITH(parse("J2 PENDING\n"),
                      Catch::StartsWith("queue:1:") &&
                        Catch::Contains("no submission time"));
  // Only pending jobs need it.
  REQUIRE(parse("J3 OTHER -\nJ4 FINISHED\n").size() == 2);
}

TEST_CASE("Job file is re-read on every call", "[batch]")
{
  auto config = MakeTestConfig();
  auto log = std::make_shared<Log>(config);

  boost::filesystem::path path = boost::filesystem::temp_directory_path() /
                                 boost::filesystem::unique_path(
                                   "cloudburst-jobs-%%%%-%%%%.txt");
  JobFileBatchSystem batch(path.string(), log);
  REQUIRE(batch.getPath() == path.string());

  REQUIRE_THROWS_AS(batch.getSchedInfo(), std::runtime_error);

  {
    boost::filesystem::ofstream out(path);
    out << "J1 PENDING 100\n";
  }
  auto jobs = batch.getSchedInfo();
  REQUIRE(jobs.size() == 1);
  REQUIRE(jobs[0].isPending());

  {
    boost::filesystem::ofstream out(path);
    out << "J1 RUNNING 100 110 node1\nJ2 PENDING 120\n";
  }
  jobs = batch.getSchedInfo();
  REQUIRE(jobs.size() == 2);
  REQUIRE(jobs[0].isRunning());

  boost::filesystem::remove(path);
}
