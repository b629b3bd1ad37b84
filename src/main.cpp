#include <iostream>
#include <thread>

#include <boost/exception/all.hpp>

#include <cloudburst/communicator.hpp>
#include <cloudburst/config.hpp>
#include <cloudburst/dummy_cloud.hpp>
#include <cloudburst/job_file_batch_system.hpp>
#include <cloudburst/log.hpp>
#include <cloudburst/orchestrator.hpp>
#include <cloudburst/threshold_policy.hpp>

using namespace cloudburst;

int
main(int argc, char* argv[])
{
  auto start = std::chrono::steady_clock::now();
  std::shared_ptr<Config> config = std::make_shared<Config>();
  bool continueRunning = config->parseParameters(argc, argv);
  if(!continueRunning) {
    return config->isHelpRequested() ? EXIT_SUCCESS : EXIT_FAILURE;
  }

  std::shared_ptr<Log> log = std::make_shared<Log>(config);
  auto logger = log->createLogger("main");

  std::string jobsFile(config->getString(Config::JobsFile));
  if(jobsFile.empty()) {
    CLOUDBURST_LOG(logger, Fatal)
      << "No jobs file given! Use --" << GetConfigNameFromEnum(Config::JobsFile)
      << " to name the batch queue snapshot to monitor.";
    return EXIT_FAILURE;
  }

  int status = EXIT_SUCCESS;
  try {
    auto batchSystem = std::make_shared<JobFileBatchSystem>(jobsFile, log);
    auto cloud = std::make_shared<DummyCloud>(log);
    auto policy = std::make_shared<ThresholdPolicy>(config, log);

    auto orchestrator = std::make_shared<Orchestrator>(
      config, log, cloud, batchSystem, policy);

    // Transitions are reported from the main loop and the listener thread.
    auto stateLogger = log->createLoggerMT("VmState");
    orchestrator->getVmStateSignal().connect(
      [stateLogger](const VmInfo& vm, VmInfo::State previous) mutable {
        CLOUDBURST_LOG(stateLogger, Info)
          << vm << " is now " << vm.state << " (was " << previous << ")";
      });

    CommunicatorPtr communicator = std::make_shared<Communicator>(
      config,
      log,
      [orchestrator](const AuthToken& auth, const NodeName& nodename) {
        return orchestrator->vmIsReady(auth, nodename);
      },
      [orchestrator]() { orchestrator->exit(); });

    if(config->isListenerEnabled() && !communicator->listen()) {
      return EXIT_FAILURE;
    }

    std::thread communicatorThread([log, communicator]() {
      log->initLocalThread("Listener");
      communicator->run();
    });

    try {
      orchestrator->run(config->getFloat(Config::CycleDelay),
                        config->getUint64(Config::MaxCycles));
    } catch(...) {
      communicator->exit();
      communicatorThread.join();
      throw;
    }

    communicator->exit();
    communicatorThread.join();
  } catch(const boost::exception& e) {
    CLOUDBURST_LOG(logger, Fatal)
      << "Encountered boost exception which was not catched until main()! "
         "Diagnostics info: "
      << boost::diagnostic_information(e);
    status = EXIT_FAILURE;
  } catch(const std::exception& e) {
    CLOUDBURST_LOG(logger, Fatal)
      << "Encountered exception which was not catched until main()! Message: "
      << e.what();
    status = EXIT_FAILURE;
  }

  auto end = std::chrono::steady_clock::now();
  CLOUDBURST_LOG(logger, Trace)
    << "Orchestrating took "
    << std::chrono::duration_cast<std::chrono::seconds>(end - start).count()
    << "s";

  CLOUDBURST_LOG(logger, Trace) << "Ending cloudburstd.";
  return status;
}
