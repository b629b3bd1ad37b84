#ifndef CLOUDBURST_CONFIG_HPP
#define CLOUDBURST_CONFIG_HPP

#include <array>
#include <boost/program_options/options_description.hpp>
#include <boost/program_options/variables_map.hpp>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "types.hpp"

namespace cloudburst {

/** @brief Store for all options of one orchestrator process.
 *
 * Values are filled with defaults on construction and overridden by
 * \ref parseParameters.
 */
class Config
{
  public:
  /** Configuration variable differentiator enumeration.
   */
  enum Key
  {
    ThreadCount,
    MaxVMs,
    MaxDelta,
    CycleDelay,
    MaxCycles,
    StatusTimeout,
    TaskDeadline,
    StopRetries,
    StopRetryBackoff,
    ListenAddress,
    ListenPort,
    JobsFile,
    IdleThreshold,
    CandidatePattern,
    AuthTokenLength,
    LogToSTDOUT,

    _KEY_COUNT
  };

  using StringVector = std::vector<std::string>;

  using ConfigVariant = std::variant<uint16_t,
                                     uint32_t,
                                     uint64_t,
                                     int32_t,
                                     int64_t,
                                     float,
                                     std::string,
                                     StringVector>;

  /** @brief Constructor
   */
  Config();
  /** @brief Destructor.
   */
  ~Config();

  /** @brief Parse command line parameters.
   *
   * Calling this without arguments applies all default values.
   *
   * @return True if program execution may continue, false if program should be
   * terminated.
   */
  bool parseParameters(int argc = 0, char* argv[] = nullptr);

  std::string getKeyAsString(Key key);

  /** @brief Get a configuration variable with type and key.
   */
  template<typename T>
  inline T& get(Key key)
  {
    return std::get<T>(m_config[key]);
  }
  /** @brief Get a configuration variable with type and key.
   */
  template<typename T>
  inline const T& get(Key key) const
  {
    return std::get<T>(m_config[key]);
  }
  /** @brief Get a std::string configuration variable.
   */
  inline std::string_view getString(Key key) const
  {
    const std::string& str = get<std::string>(key);
    return std::string_view{ str.c_str(), str.size() };
  }
  /** @brief Get an uint16 configuration variable.
   */
  inline uint16_t getUint16(Key key) const { return get<uint16_t>(key); }
  /** @brief Get an uint32 configuration variable.
   */
  inline uint32_t getUint32(Key key) const { return get<uint32_t>(key); }
  /** @brief Get an uint64 configuration variable.
   */
  inline uint64_t getUint64(Key key) const { return get<uint64_t>(key); }
  /** @brief Get a float configuration variable.
   */
  inline float getFloat(Key key) const { return get<float>(key); }

  /** @brief Get a configuration variable which can be cast in any way.
   */
  inline ConfigVariant& get(Key key) { return m_config[key]; }
  /** @brief Get a configuration variable which can be cast in any way.
   */
  inline const ConfigVariant& get(Key key) const { return m_config[key]; }
  /** @brief Set a configuration variable.
   */
  inline void set(Key key, ConfigVariant&& val) { m_config[key] = val; }

  /** @brief Get a configuration variable which can be cast in any way.
   */
  ConfigVariant& operator[](Key key) { return get(key); }

  /** @brief Check if debug mode is active. */
  inline bool isDebugMode() const { return m_debugMode; }
  /** @brief Check if trace mode is active. */
  inline bool isTraceMode() const { return m_traceMode; }
  /** @brief Check if info mode is active. */
  inline bool isInfoMode() const { return m_infoMode; }
  /** @brief Check if the readiness listener should be started. */
  inline bool isListenerEnabled() const { return !m_disableListener; }

  /** @brief Set debug mode active. */
  inline void setDebugMode(bool v) { m_debugMode = v; }
  /** @brief Set trace mode active. */
  inline void setTraceMode(bool v) { m_traceMode = v; }
  /** @brief Set info mode active. */
  inline void setInfoMode(bool v) { m_infoMode = v; }

  /** @brief True if the last \ref parseParameters only printed the help. */
  inline bool isHelpRequested() const { return m_helpRequested; }

  /** @brief Check if STDOUT should be used for logging instead of CLOG. */
  inline bool useSTDOUTForLogging() const { return m_useSTDOUTForLogging; }

  private:
  bool processCommonParameters(
    const boost::program_options::variables_map& map);

  using ConfigArray =
    std::array<ConfigVariant, static_cast<std::size_t>(_KEY_COUNT)>;
  ConfigArray m_config;

  boost::program_options::options_description m_optionsCLI;
  boost::program_options::options_description m_optionsCommon;

  bool m_debugMode = false;
  bool m_traceMode = false;
  bool m_infoMode = false;
  bool m_useSTDOUTForLogging = false;
  bool m_disableListener = false;
  bool m_helpRequested = false;
};

constexpr const char*
GetConfigNameFromEnum(Config::Key key)
{
  switch(key) {
    case Config::ThreadCount:
      return "threads";
    case Config::MaxVMs:
      return "max-vms";
    case Config::MaxDelta:
      return "max-delta";
    case Config::CycleDelay:
      return "delay";
    case Config::MaxCycles:
      return "max-cycles";
    case Config::StatusTimeout:
      return "status-timeout";
    case Config::TaskDeadline:
      return "task-deadline";
    case Config::StopRetries:
      return "stop-retries";
    case Config::StopRetryBackoff:
      return "stop-retry-backoff";
    case Config::ListenAddress:
      return "listen-address";
    case Config::ListenPort:
      return "listen-port";
    case Config::JobsFile:
      return "jobs-file";
    case Config::IdleThreshold:
      return "idle-threshold";
    case Config::CandidatePattern:
      return "candidate-pattern";
    case Config::AuthTokenLength:
      return "auth-token-length";
    case Config::LogToSTDOUT:
      return "log-to-stdout";
    default:
      return "";
  }
}
}

#endif
