#include "../../include/cloudburst/net/readiness_listener.hpp"

#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/split.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <boost/asio/buffers_iterator.hpp>
#include <boost/asio/read_until.hpp>
#include <boost/asio/write.hpp>
#include <exception>
#include <vector>

namespace cloudburst {
namespace net {
ReadinessSession::State::State(boost::asio::io_service& ioService,
                               LogPtr log,
                               ReadinessHandler handler)
  : socket(ioService)
  , recvStreambuf(MaxRequestLength)
  , log(log)
  , logger(log->createLogger("ReadinessSession"))
  , handler(std::move(handler))
{}
ReadinessSession::State::~State() {}

ReadinessSession::ReadinessSession(boost::asio::io_service& ioService,
                                   LogPtr log,
                                   ReadinessHandler handler)
  : m_state(std::make_shared<State>(ioService, log, std::move(handler)))
{}
ReadinessSession::~ReadinessSession() {}

void
ReadinessSession::start()
{
  boost::system::error_code ec;
  auto remote = socket().remote_endpoint(ec);
  if(!ec) {
    logger().setMeta(remote.address().to_string());
  }
  (*this)();
}

std::string
ReadinessSession::ProcessRequest(std::string_view request,
                                 const ReadinessHandler& handler)
{
  std::string line = boost::algorithm::trim_copy(std::string(request));
  if(line.empty()) {
    return "ERROR empty request\n";
  }

  std::vector<std::string> parts;
  boost::algorithm::split(parts,
                          line,
                          boost::algorithm::is_any_of(" \t"),
                          boost::algorithm::token_compress_on);

  if(parts[0] != "READY") {
    return "ERROR unknown command " + parts[0] + "\n";
  }
  if(parts.size() != 3) {
    return "ERROR expected READY <token> <nodename>\n";
  }

  try {
    return handler(parts[1], parts[2]) ? "OK\n" : "DENIED\n";
  } catch(const std::exception& e) {
    return std::string("ERROR ") + e.what() + "\n";
  }
}

void
ReadinessSession::close()
{
  boost::system::error_code ec;
  socket().shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
  if(ec) {
    CLOUDBURST_LOG(logger(), Trace)
      << "Shutdown of readiness connection failed: " << ec.message();
  }
  socket().close(ec);
}

#include <boost/asio/yield.hpp>

void
ReadinessSession::operator()(const boost::system::error_code& ec,
                             std::size_t bytes)
{
  reenter(this)
  {
    yield boost::asio::async_read_until(
      socket(), recvStreambuf(), '\n', *this);

    if(ec == boost::asio::error::not_found) {
      reply() = "ERROR request longer than " +
                std::to_string(MaxRequestLength) + " bytes\n";
    } else if(ec && !(ec == boost::asio::error::eof &&
                      recvStreambuf().size() > 0)) {
      CLOUDBURST_LOG(logger(), Debug)
        << "Could not read readiness request! Error: " << ec.message();
      close();
      yield break;
    } else {
      // A request cut off by EOF is still processed.
      std::size_t length = ec ? recvStreambuf().size() : bytes;
      auto begin = boost::asio::buffers_begin(recvStreambuf().data());
      std::string request(begin, begin + length);
      reply() = ProcessRequest(request, m_state->handler);
    }

    CLOUDBURST_LOG(logger(), Debug)
      << "Answering readiness request with "
      << boost::algorithm::trim_copy(reply());

    yield boost::asio::async_write(
      socket(), boost::asio::buffer(reply()), *this);

    if(ec) {
      CLOUDBURST_LOG(logger(), Debug)
        << "Could not send readiness reply! Error: " << ec.message();
    }
    close();
  }
}

#include <boost/asio/unyield.hpp>

ReadinessListener::State::State(boost::asio::io_service& ioService,
                                boost::asio::ip::tcp::endpoint endpoint,
                                LogPtr log,
                                ReadinessHandler handler)
  : ioService(ioService)
  , acceptor(ioService)
  , log(log)
  , logger(log->createLogger("ReadinessListener"))
  , handler(std::move(handler))
{
  acceptor.open(endpoint.protocol());
  acceptor.set_option(boost::asio::ip::tcp::acceptor::reuse_address(true));
  acceptor.bind(endpoint);
  acceptor.listen();
}

ReadinessListener::State::~State()
{
  CLOUDBURST_LOG(logger, Trace) << "ReadinessListener stopped.";
}

ReadinessListener::ReadinessListener(boost::asio::io_service& ioService,
                                     boost::asio::ip::tcp::endpoint endpoint,
                                     LogPtr log,
                                     ReadinessHandler handler)
  : m_state(
      std::make_shared<State>(ioService, endpoint, log, std::move(handler)))
{}
ReadinessListener::~ReadinessListener() {}

void
ReadinessListener::startAccepting()
{
  (*this)(boost::system::error_code());
  CLOUDBURST_LOG(logger(), Info)
    << "ReadinessListener started at " << getLocalEndpoint();
}

void
ReadinessListener::stop()
{
  boost::system::error_code ec;
  acceptor().close(ec);
  if(ec) {
    CLOUDBURST_LOG(logger(), Warning)
      << "Could not close readiness listener! Error: " << ec.message();
  }
}

boost::asio::ip::tcp::endpoint
ReadinessListener::getLocalEndpoint() const
{
  return m_state->acceptor.local_endpoint();
}

#include <boost/asio/yield.hpp>

void
ReadinessListener::operator()(const boost::system::error_code& ec)
{
  reenter(this)
  {
    for(;;) {
      newSession() = std::make_unique<ReadinessSession>(
        m_state->ioService, m_state->log, m_state->handler);

      yield acceptor().async_accept(newSession()->socket(), *this);

      if(ec == boost::asio::error::operation_aborted) {
        CLOUDBURST_LOG(logger(), Trace) << "Stopped accepting connections.";
        yield break;
      }
      if(ec) {
        CLOUDBURST_LOG(logger(), Error)
          << "Error during accepting new connections! Error: "
          << ec.message();
        continue;
      }

      newSession()->start();
      newSession().reset();
    }
  }
}

#include <boost/asio/unyield.hpp>
}
}
