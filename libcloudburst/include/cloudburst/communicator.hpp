#ifndef CLOUDBURST_COMMUNICATOR_HPP
#define CLOUDBURST_COMMUNICATOR_HPP

#include "log.hpp"
#include "types.hpp"

#include <functional>
#include <memory>
#include <optional>

#include <boost/asio/io_service.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/signal_set.hpp>

namespace boost {
namespace system {
class error_code;
}
}

namespace cloudburst {
namespace net {
class ReadinessListener;
}

/** @brief Owner of the boost asio io_service of the daemon.
 *
 * Runs the readiness listener and watches for SIGINT and SIGTERM, which
 * invoke the exit handler (normally Orchestrator::exit).
 */
class Communicator
{
  public:
  using ExitHandler = std::function<void()>;

  /** @brief Constructor */
  Communicator(ConfigPtr config,
               LogPtr log,
               ReadinessHandler readinessHandler,
               ExitHandler exitHandler);
  /** @brief Destructor */
  ~Communicator();

  /** @brief Bind the readiness listener to listen-address:listen-port.
   *
   * Must be called before \ref run. Returns false if the address could not
   * be parsed or bound.
   */
  bool listen();

  /** @brief Runs the io_service and blocks until \ref exit is called. */
  void run();

  /** @brief Stops the listener and makes \ref run return. Thread-safe. */
  void exit();

  /** @brief Endpoint the readiness listener is bound to, if listening. */
  std::optional<boost::asio::ip::tcp::endpoint> getListenEndpoint() const;

  private:
  ConfigPtr m_config;
  LogPtr m_log;
  Logger m_logger;
  ReadinessHandler m_readinessHandler;
  ExitHandler m_exitHandler;

  boost::asio::io_service m_ioService;
  std::unique_ptr<boost::asio::io_service::work> m_ioServiceWork;
  boost::asio::signal_set m_signalSet;
  std::unique_ptr<net::ReadinessListener> m_readinessListener;
  std::optional<boost::asio::ip::tcp::endpoint> m_listenEndpoint;

  void signalHandler(const boost::system::error_code& error, int signalNumber);
};

using CommunicatorPtr = std::shared_ptr<Communicator>;
}

#endif
