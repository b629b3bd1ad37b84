#include "../include/cloudburst/job_file_batch_system.hpp"
#include "../include/cloudburst/clock.hpp"

#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/split.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <boost/filesystem.hpp>
#include <boost/filesystem/fstream.hpp>
#include <stdexcept>

namespace cloudburst {
static TimePoint
ParseTime(const std::string& field)
{
  if(field == "-")
    return TimePoint();

  std::size_t pos = 0;
  double seconds = std::stod(field, &pos);
  if(pos != field.size()) {
    throw std::invalid_argument("Invalid time \"" + field + "\"!");
  }
  return FromUnixSeconds(seconds);
}

JobFileBatchSystem::JobFileBatchSystem(std::string path, LogPtr log)
  : m_path(std::move(path))
  , m_logger(log->createLogger("JobFileBatchSystem"))
{}
JobFileBatchSystem::~JobFileBatchSystem() {}

std::vector<JobInfo>
JobFileBatchSystem::getSchedInfo()
{
  boost::filesystem::path p(m_path);
  if(!boost::filesystem::exists(p)) {
    throw std::runtime_error("Jobs file \"" + m_path + "\" does not exist!");
  }
  boost::filesystem::ifstream in(p);
  if(!in) {
    throw std::runtime_error("Could not open jobs file \"" + m_path + "\"!");
  }

  auto jobs = ParseSnapshot(in, m_path);
  CLOUDBURST_LOG(m_logger, Trace)
    << "Read " << jobs.size() << " jobs from " << m_path;
  return jobs;
}

std::vector<JobInfo>
JobFileBatchSystem::ParseSnapshot(std::istream& in, const std::string& source)
{
  std::vector<JobInfo> jobs;
  std::string line;
  std::size_t lineNumber = 0;

  while(std::getline(in, line)) {
    ++lineNumber;

    auto comment = line.find('#');
    if(comment != std::string::npos)
      line.erase(comment);
    boost::algorithm::trim(line);
    if(line.empty())
      continue;

    std::vector<std::string> fields;
    boost::algorithm::split(fields,
                            line,
                            boost::algorithm::is_any_of(" \t"),
                            boost::algorithm::token_compress_on);

    try {
      if(fields.size() < 2 || fields.size() > 5) {
        throw std::invalid_argument("Expected 2 to 5 fields, got " +
                                    std::to_string(fields.size()) + "!");
      }
      fields.resize(5, "-");

      jobs.emplace_back(fields[0],
                        JobInfo::StateFromString(fields[1]),
                        fields[4] == "-" ? "" : fields[4],
                        ParseTime(fields[2]),
                        ParseTime(fields[3]));
    } catch(const std::exception& e) {
      throw std::runtime_error(source + ":" + std::to_string(lineNumber) +
                               ": " + e.what());
    }
  }
  return jobs;
}
}
