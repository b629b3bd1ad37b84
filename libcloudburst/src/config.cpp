#include "../include/cloudburst/config.hpp"
#include <boost/algorithm/string/join.hpp>
#include <boost/program_options.hpp>
#include <cstddef>
#include <iostream>

namespace po = boost::program_options;

namespace cloudburst {
Config::Config()
  : m_optionsCLI("CLI-only options")
  , m_optionsCommon("Orchestrator options")
{
  /* CLI ONLY OPTIONS
   * --------------------------------------- */
  // clang-format off
  m_optionsCLI.add_options()
    ("help,h", "produce help message")
    ;
  // clang-format on

  set(ThreadCount, uint32_t(8));
  set(MaxVMs, uint32_t(10));
  set(MaxDelta, uint32_t(1));
  set(CycleDelay, float(30));
  set(MaxCycles, uint64_t(0));
  set(StatusTimeout, uint64_t(10000));
  set(TaskDeadline, uint64_t(600));
  set(StopRetries, uint16_t(1));
  set(StopRetryBackoff, uint64_t(60));
  set(ListenAddress, std::string("0.0.0.0"));
  set(ListenPort, uint16_t(8223));
  set(JobsFile, std::string(""));
  set(IdleThreshold, float(300));
  set(CandidatePattern, std::string(".*"));
  set(AuthTokenLength, uint16_t(24));

  /* COMMON OPTIONS
   * --------------------------------------- */
  // clang-format off
  m_optionsCommon.add_options()
    (GetConfigNameFromEnum(Config::ThreadCount),
         po::value<uint32_t>()->default_value(getUint32(ThreadCount))->value_name("int"),
         "number of worker threads executing VM start and stop operations")
    (GetConfigNameFromEnum(Config::MaxVMs),
         po::value<uint32_t>()->default_value(getUint32(MaxVMs))->value_name("int"),
         "maximum number of VMs allocated in the cloud at the same time")
    (GetConfigNameFromEnum(Config::MaxDelta),
         po::value<uint32_t>()->default_value(getUint32(MaxDelta))->value_name("int"),
         "maximum number of VMs to start in one cycle (at most one start per cycle is issued)")
    (GetConfigNameFromEnum(Config::CycleDelay),
         po::value<float>()->default_value(getFloat(CycleDelay))->value_name("seconds"),
         "delay between the starts of two orchestrator cycles")
    (GetConfigNameFromEnum(Config::MaxCycles),
         po::value<uint64_t>()->default_value(getUint64(MaxCycles))->value_name("int"),
         "stop after this many cycles. 0 means run until interrupted.")
    (GetConfigNameFromEnum(Config::StatusTimeout),
         po::value<uint64_t>()->default_value(getUint64(StatusTimeout))->value_name("ms"),
         "time the main loop waits for a VM status refresh from the cloud backend")
    (GetConfigNameFromEnum(Config::TaskDeadline),
         po::value<uint64_t>()->default_value(getUint64(TaskDeadline))->value_name("seconds"),
         "deadline after which a running VM start or stop is reported as overdue")
    (GetConfigNameFromEnum(Config::StopRetries),
         po::value<uint16_t>()->default_value(getUint16(StopRetries))->value_name("int"),
         "number of times a failed VM stop is retried before raising an alert")
    (GetConfigNameFromEnum(Config::StopRetryBackoff),
         po::value<uint64_t>()->default_value(getUint64(StopRetryBackoff))->value_name("seconds"),
         "delay before the first stop retry, doubled for every further retry")
    (GetConfigNameFromEnum(Config::ListenAddress),
         po::value<std::string>()->default_value(get<std::string>(ListenAddress))->value_name("string"),
         "address the readiness listener binds to")
    (GetConfigNameFromEnum(Config::ListenPort),
         po::value<uint16_t>()->default_value(getUint16(ListenPort))->value_name("int"),
         "tcp port of the readiness listener. 0 picks a free port.")
    (GetConfigNameFromEnum(Config::JobsFile),
         po::value<std::string>()->default_value(get<std::string>(JobsFile))->value_name("path"),
         "batch queue snapshot file, re-read every cycle")
    (GetConfigNameFromEnum(Config::IdleThreshold),
         po::value<float>()->default_value(getFloat(IdleThreshold))->value_name("seconds"),
         "idle time after which a ready VM may be stopped")
    (GetConfigNameFromEnum(Config::CandidatePattern),
         po::value<std::string>()->default_value(get<std::string>(CandidatePattern))->value_name("regex"),
         "pending jobs with matching job ids may be run in the cloud")
    (GetConfigNameFromEnum(Config::AuthTokenLength),
         po::value<uint16_t>()->default_value(getUint16(AuthTokenLength))->value_name("int"),
         "length of the readiness tokens handed to new VMs")
    ("debug,d", po::bool_switch(&m_debugMode)->default_value(false)->value_name("bool"), "debug mode (activate DEBG output)")
    ("trace,t", po::bool_switch(&m_traceMode)->default_value(false)->value_name("bool"), "trace mode (activate TRCE output)")
    ("info,i", po::bool_switch(&m_infoMode)->default_value(false)->value_name("bool"), "info mode (more information)")
    ("no-listener", po::bool_switch(&m_disableListener)->default_value(false)->value_name("bool"), "do not start the readiness listener")
    (GetConfigNameFromEnum(Config::LogToSTDOUT), po::bool_switch(&m_useSTDOUTForLogging)->default_value(false)->value_name("bool"), "use stdout for logging")
    ;
  // clang-format on
}

Config::~Config() {}

bool
Config::parseParameters(int argc, char** argv)
{
  static char* argv_default[] = { (char*)"", nullptr };
  if(argc == 0 && argv == nullptr) {
    argc = 1;
    argv = argv_default;
  }

  po::options_description cliGroup;
  cliGroup.add(m_optionsCommon).add(m_optionsCLI);
  po::variables_map vm;
  try {
    po::store(po::command_line_parser(argc, argv).options(cliGroup).run(), vm);
    po::notify(vm);
  } catch(const std::exception& e) {
    std::cout << "Could not parse CLI Parameters! Error: " << e.what()
              << std::endl;
    return false;
  }

  if(vm.count("help")) {
    m_helpRequested = true;
    std::cout << m_optionsCLI << std::endl;
    std::cout << m_optionsCommon << std::endl;
    return false;
  }
  return processCommonParameters(vm);
}

std::string
Config::getKeyAsString(Key key)
{
  ConfigVariant& v = get(key);
  switch(v.index()) {
    case 0:
      return std::to_string(std::get<uint16_t>(v));
    case 1:
      return std::to_string(std::get<uint32_t>(v));
    case 2:
      return std::to_string(std::get<uint64_t>(v));
    case 3:
      return std::to_string(std::get<int32_t>(v));
    case 4:
      return std::to_string(std::get<int64_t>(v));
    case 5:
      return std::to_string(std::get<float>(v));
    case 6:
      return std::get<std::string>(v);
    case 7:
      return boost::algorithm::join(std::get<StringVector>(v), ";");
    default:
      return "Unknown Type!";
  }
}

template<typename T>
inline void
conditionallySetConfigOptionToArray(
  const boost::program_options::variables_map& vm,
  Config::ConfigVariant* arr,
  Config::Key key)
{
  if(vm.count(GetConfigNameFromEnum(key))) {
    arr[key] = vm[GetConfigNameFromEnum(key)].as<T>();
  }
}

bool
Config::processCommonParameters(const boost::program_options::variables_map& vm)
{
  conditionallySetConfigOptionToArray<uint32_t>(
    vm, m_config.data(), Config::ThreadCount);
  conditionallySetConfigOptionToArray<uint32_t>(
    vm, m_config.data(), Config::MaxVMs);
  conditionallySetConfigOptionToArray<uint32_t>(
    vm, m_config.data(), Config::MaxDelta);
  conditionallySetConfigOptionToArray<float>(
    vm, m_config.data(), Config::CycleDelay);
  conditionallySetConfigOptionToArray<uint64_t>(
    vm, m_config.data(), Config::MaxCycles);
  conditionallySetConfigOptionToArray<uint64_t>(
    vm, m_config.data(), Config::StatusTimeout);
  conditionallySetConfigOptionToArray<uint64_t>(
    vm, m_config.data(), Config::TaskDeadline);
  conditionallySetConfigOptionToArray<uint16_t>(
    vm, m_config.data(), Config::StopRetries);
  conditionallySetConfigOptionToArray<uint64_t>(
    vm, m_config.data(), Config::StopRetryBackoff);
  conditionallySetConfigOptionToArray<std::string>(
    vm, m_config.data(), Config::ListenAddress);
  conditionallySetConfigOptionToArray<uint16_t>(
    vm, m_config.data(), Config::ListenPort);
  conditionallySetConfigOptionToArray<std::string>(
    vm, m_config.data(), Config::JobsFile);
  conditionallySetConfigOptionToArray<float>(
    vm, m_config.data(), Config::IdleThreshold);
  conditionallySetConfigOptionToArray<std::string>(
    vm, m_config.data(), Config::CandidatePattern);
  conditionallySetConfigOptionToArray<uint16_t>(
    vm, m_config.data(), Config::AuthTokenLength);

  if(getUint32(ThreadCount) == 0) {
    std::cout << "Option --" << GetConfigNameFromEnum(ThreadCount)
              << " must be at least 1!" << std::endl;
    return false;
  }
  if(getUint16(AuthTokenLength) < 8) {
    std::cout << "Option --" << GetConfigNameFromEnum(AuthTokenLength)
              << " must be at least 8!" << std::endl;
    return false;
  }
  if(getFloat(CycleDelay) < 0) {
    std::cout << "Option --" << GetConfigNameFromEnum(CycleDelay)
              << " must not be negative!" << std::endl;
    return false;
  }

  return true;
}
}
