#include "../include/cloudburst/communicator.hpp"
#include "../include/cloudburst/config.hpp"
#include "../include/cloudburst/net/readiness_listener.hpp"

#include <boost/system/error_code.hpp>
#include <csignal>

namespace cloudburst {
Communicator::Communicator(ConfigPtr config,
                           LogPtr log,
                           ReadinessHandler readinessHandler,
                           ExitHandler exitHandler)
  : m_config(config)
  , m_log(log)
  , m_logger(log->createLogger("Communicator"))
  , m_readinessHandler(std::move(readinessHandler))
  , m_exitHandler(std::move(exitHandler))
  , m_ioServiceWork(
      std::make_unique<boost::asio::io_service::work>(m_ioService))
  , m_signalSet(m_ioService, SIGINT, SIGTERM)
{
  m_signalSet.async_wait(std::bind(&Communicator::signalHandler,
                                   this,
                                   std::placeholders::_1,
                                   std::placeholders::_2));
}

Communicator::~Communicator()
{
  CLOUDBURST_LOG(m_logger, Trace) << "Destruct Communicator.";
}

bool
Communicator::listen()
{
  std::string addressStr(m_config->getString(Config::ListenAddress));
  uint16_t port = m_config->getUint16(Config::ListenPort);

  boost::system::error_code err;
  auto address = boost::asio::ip::address::from_string(addressStr, err);
  if(err) {
    CLOUDBURST_LOG(m_logger, Error)
      << "Could not parse given listen address \"" << addressStr
      << "\". Error: " << err.message();
    return false;
  }

  try {
    m_readinessListener = std::make_unique<net::ReadinessListener>(
      m_ioService,
      boost::asio::ip::tcp::endpoint(address, port),
      m_log,
      m_readinessHandler);
    m_listenEndpoint = m_readinessListener->getLocalEndpoint();
    m_readinessListener->startAccepting();
    return true;
  } catch(const std::exception& e) {
    CLOUDBURST_LOG(m_logger, Error)
      << "Could not listen for readiness notifications on " << addressStr
      << ":" << port << "! Error: " << e.what();
    m_readinessListener.reset();
    return false;
  }
}

void
Communicator::run()
{
  CLOUDBURST_LOG(m_logger, Trace) << "Communicator io_service started.";
  bool ioServiceRunningWithoutException = true;
  while(ioServiceRunningWithoutException) {
    try {
      m_ioService.run();
      ioServiceRunningWithoutException = false;
    } catch(const std::exception& e) {
      CLOUDBURST_LOG(m_logger, Error)
        << "Exception encountered from ioService! Message: " << e.what();
    }
  }
  CLOUDBURST_LOG(m_logger, Trace) << "Communicator io_service ended.";
}

void
Communicator::exit()
{
  m_ioService.post([this]() {
    if(m_readinessListener) {
      m_readinessListener->stop();
      m_readinessListener.reset();
    }
    boost::system::error_code ec;
    m_signalSet.cancel(ec);
    m_ioServiceWork.reset();
    m_ioService.stop();
  });
}

std::optional<boost::asio::ip::tcp::endpoint>
Communicator::getListenEndpoint() const
{
  return m_listenEndpoint;
}

void
Communicator::signalHandler(const boost::system::error_code& error,
                            int signalNumber)
{
  if(error)
    return;

  CLOUDBURST_LOG(m_logger, Warning)
    << "Received signal " << signalNumber << ", shutting down.";
  if(m_exitHandler) {
    m_exitHandler();
  }
  exit();
}
}
