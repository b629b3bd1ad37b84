#ifndef CLOUDBURST_LOG_HPP
#define CLOUDBURST_LOG_HPP

#include <boost/log/attributes/constant.hpp>
#include <boost/log/attributes/mutable_constant.hpp>
#include <boost/log/sinks/sync_frontend.hpp>
#include <boost/log/sinks/text_ostream_backend.hpp>
#include <boost/log/sources/record_ostream.hpp>
#include <boost/log/sources/severity_feature.hpp>
#include <boost/log/sources/severity_logger.hpp>
#include <boost/log/utility/formatting_ostream.hpp>
#include <boost/log/utility/manipulators/to_log.hpp>
#include <boost/thread/locks.hpp>
#include <boost/thread/shared_mutex.hpp>
#include <map>
#include <memory>
#include <shared_mutex>
#include <string>
#include <thread>

template<typename T>
using MutableConstant = boost::log::attributes::mutable_constant<
  T,
  boost::shared_mutex,                    // synchronization primitive
  boost::unique_lock<boost::shared_mutex>,// exclusive lock type
  boost::shared_lock<boost::shared_mutex> // shared lock type;
  >;

extern thread_local MutableConstant<std::string> threadNameAttr;

namespace cloudburst {
class Config;
class Log;
using ConfigPtr = std::shared_ptr<Config>;
using LogPtr = std::shared_ptr<Log>;

/** @brief Utility class to manage logging.
 *
 * One instance is created from the parsed \ref Config and handed to every
 * component that logs. Components create their own named logger handles.
 */
class Log
{
  public:
  /** @brief Tag to associate severity internally.
   */
  struct Severity_Tag;
  /** @brief Severity of a log message.
   *
   * Alert is reserved for situations an operator has to resolve by hand, e.g.
   * a VM that could not be stopped and may still be billed.
   */
  enum Severity
  {
    Trace,
    Debug,
    Info,
    Warning,
    Error,
    Alert,
    Fatal,
  };

  template<typename LoggerType>
  struct Handle
  {
    Handle(LoggerType logger, Log& log)
      : logger(logger)
      , log(&log)
      , metaAttr("")
    {}
    Handle(const Handle& o)
      : logger(o.logger)
      , log(o.log)
      , metaAttr(o.metaAttr)
      , metaAdded(o.metaAdded)
    {}
    Handle& operator=(const Handle& o)
    {
      logger = o.logger;
      log = o.log;
      metaAttr = o.metaAttr;
      metaAdded = o.metaAdded;
      return *this;
    }
    void setMeta(const std::string& meta)
    {
      if(!metaAdded) {
        logger.add_attribute("ContextMeta", metaAttr);
        metaAdded = true;
      }
      metaAttr.set(meta);
    }
    void resetMeta()
    {
      logger.remove_attribute("ContextMeta");
      metaAdded = false;
    }
    LoggerType logger;
    Log* log;
    MutableConstant<std::string> metaAttr;
    bool metaAdded = false;
  };

  using Logger = Handle<boost::log::sources::severity_logger<Log::Severity>>;
  using LoggerMT =
    Handle<boost::log::sources::severity_logger_mt<Log::Severity>>;

  /** @brief Constructor
   */
  explicit Log(ConfigPtr config);
  /** @brief Destructor.
   */
  ~Log();

  /** @brief Create a logger for a specific environment, which may receive
   * multiple custom attributes.
   */
  Logger createLogger(const std::string& context, const std::string& meta = "");
  LoggerMT createLoggerMT(const std::string& context,
                          const std::string& meta = "");

  inline bool isLogLevelEnabled(Severity severity) const
  {
    return severity >= m_targetSeverity;
  }
  inline Severity getTargetSeverity() const { return m_targetSeverity; }

  struct ThreadLocalData
  {
    explicit ThreadLocalData(const std::string& threadName)
      : threadName(threadName)
    {}

    std::string threadName;
  };
  /** @brief Get data registered for the calling thread.
   *
   * Threads that never called \ref initLocalThread get a shared fallback
   * entry.
   */
  const ThreadLocalData& getThreadLocalData() const;
  void initLocalThread(const std::string& threadName);

  private:
  ConfigPtr m_config;
  Severity m_targetSeverity = Severity::Warning;

  std::map<std::thread::id, ThreadLocalData> m_threadLocalData;
  mutable std::shared_mutex m_threadLocalDataMutex;
};

using Logger = Log::Logger;
using LoggerMT = Log::LoggerMT;

std::ostream&
operator<<(std::ostream& strm, ::cloudburst::Log::Severity level);

boost::log::formatting_ostream&
operator<<(
  boost::log::formatting_ostream& strm,
  boost::log::to_log_manip<::cloudburst::Log::Severity,
                           ::cloudburst::Log::Severity_Tag> const& manip);
}

#define CLOUDBURST_LOG(LOGGER, SEVERITY)                                        \
  if((LOGGER).log->isLogLevelEnabled(::cloudburst::Log::Severity::SEVERITY)) {  \
    threadNameAttr.set((LOGGER).log->getThreadLocalData().threadName);          \
  }                                                                             \
  if((LOGGER).log->isLogLevelEnabled(::cloudburst::Log::Severity::SEVERITY))    \
  BOOST_LOG_SEV((LOGGER).logger, ::cloudburst::Log::Severity::SEVERITY)

#endif
