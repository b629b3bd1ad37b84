#ifndef CLOUDBURST_NET_READINESS_LISTENER
#define CLOUDBURST_NET_READINESS_LISTENER

#include <memory>
#include <string>
#include <string_view>

#include <boost/asio/coroutine.hpp>
#include <boost/asio/io_service.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/streambuf.hpp>
#include <boost/system/error_code.hpp>

#include "../log.hpp"
#include "../types.hpp"

namespace cloudburst {
namespace net {

/** @brief One connection of a booted VM announcing its readiness.
 *
 * Reads a single line `READY <token> <nodename>`, passes it to the handler
 * and answers with `OK`, `DENIED` or `ERROR <reason>` before closing the
 * connection.
 */
class ReadinessSession : boost::asio::coroutine
{
  public:
  /// Longest accepted request line, including the newline.
  static constexpr std::size_t MaxRequestLength = 1024;

  struct State
  {
    explicit State(boost::asio::io_service& ioService,
                   LogPtr log,
                   ReadinessHandler handler);
    ~State();

    boost::asio::ip::tcp::socket socket;
    boost::asio::streambuf recvStreambuf;
    LogPtr log;
    Logger logger;
    ReadinessHandler handler;
    std::string reply;
  };

  ReadinessSession(boost::asio::io_service& ioService,
                   LogPtr log,
                   ReadinessHandler handler);
  ~ReadinessSession();

  boost::asio::ip::tcp::socket& socket() { return m_state->socket; }

  /** @brief Start reading the request of an accepted connection. */
  void start();

  void operator()(const boost::system::error_code& ec = {},
                  std::size_t bytes = 0);

  /** @brief Parse one request line and produce the reply line. */
  static std::string ProcessRequest(std::string_view request,
                                    const ReadinessHandler& handler);

  private:
  std::shared_ptr<State> m_state;

  boost::asio::streambuf& recvStreambuf() { return m_state->recvStreambuf; }
  Logger& logger() { return m_state->logger; }
  std::string& reply() { return m_state->reply; }

  void close();
};

/** @brief Accepts readiness notifications of booted VMs over TCP.
 *
 * Every accepted connection becomes a \ref ReadinessSession which calls the
 * given handler (normally Orchestrator::vmIsReady) on the io_service thread.
 */
class ReadinessListener : boost::asio::coroutine
{
  public:
  struct State
  {
    explicit State(boost::asio::io_service& ioService,
                   boost::asio::ip::tcp::endpoint endpoint,
                   LogPtr log,
                   ReadinessHandler handler);
    ~State();

    boost::asio::io_service& ioService;
    boost::asio::ip::tcp::acceptor acceptor;
    LogPtr log;
    Logger logger;
    ReadinessHandler handler;
    std::unique_ptr<ReadinessSession> newSession;
  };

  /** @brief Bind the endpoint. Throws boost::system::system_error if the
   * endpoint cannot be bound. Port 0 picks a free port. */
  ReadinessListener(boost::asio::io_service& ioService,
                    boost::asio::ip::tcp::endpoint endpoint,
                    LogPtr log,
                    ReadinessHandler handler);
  ~ReadinessListener();

  void startAccepting();
  /** @brief Close the acceptor. Sessions already accepted still finish. */
  void stop();

  boost::asio::ip::tcp::endpoint getLocalEndpoint() const;

  /** @brief Accept handler that is called when new connections arrive. */
  void operator()(const boost::system::error_code& ec);

  private:
  std::shared_ptr<State> m_state;

  boost::asio::ip::tcp::acceptor& acceptor() { return m_state->acceptor; }
  Logger& logger() { return m_state->logger; }
  std::unique_ptr<ReadinessSession>& newSession()
  {
    return m_state->newSession;
  }
};
}
}

#endif
