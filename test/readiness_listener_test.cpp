#include <catch2/catch.hpp>

#include "mocks.hpp"

#include <cloudburst/communicator.hpp>
#include <cloudburst/net/readiness_listener.hpp>

#include <boost/asio/connect.hpp>
#include <boost/asio/read_until.hpp>
#include <boost/asio/streambuf.hpp>
#include <boost/asio/write.hpp>

#include <istream>
#include <thread>

using namespace cloudburst;
using namespace cloudburst::net;
using namespace cloudburst::test;
using boost::asio::ip::tcp;

/// Sends one raw request, closes the sending side and returns the reply line
/// without newline.
static std::string
Request(const tcp::endpoint& endpoint, const std::string& request)
{
  boost::asio::io_service ioService;
  tcp::socket socket(ioService);
  socket.connect(endpoint);
  boost::asio::write(socket, boost::asio::buffer(request));
  socket.shutdown(tcp::socket::shutdown_send);

  boost::asio::streambuf buf;
  boost::system::error_code ec;
  boost::asio::read_until(socket, buf, '\n', ec);

  std::istream in(&buf);
  std::string reply;
  std::getline(in, reply);
  return reply;
}

TEST_CASE("Readiness requests are parsed", "[readiness][net]")
{
  std::vector<std::pair<AuthToken, NodeName>> calls;
  ReadinessHandler handler = [&calls](const AuthToken& auth,
                                      const NodeName& nodename) {
    calls.emplace_back(auth, nodename);
    return auth == "good";
  };

  REQUIRE(ReadinessSession::ProcessRequest("READY good node1\n", handler) ==
          "OK\n");
  REQUIRE(ReadinessSession::ProcessRequest("  READY \t bad  node2\r\n",
                                           handler) == "DENIED\n");
  REQUIRE(calls.size() == 2);
  REQUIRE(calls[1].first == "bad");
  REQUIRE(calls[1].second == "node2");

  REQUIRE(ReadinessSession::ProcessRequest("\n", handler) ==
          "ERROR empty request\n");
  REQUIRE(ReadinessSession::ProcessRequest("HELLO there", handler) ==
          "ERROR unknown command HELLO\n");
  REQUIRE(ReadinessSession::ProcessRequest("READY good", handler) ==
          "ERROR expected READY <token> <nodename>\n");
  REQUIRE(ReadinessSession::ProcessRequest("READY a b c", handler) ==
          "ERROR expected READY <token> <nodename>\n");
  REQUIRE(calls.size() == 2);

  ReadinessHandler throwing = [](const AuthToken&, const NodeName&) -> bool {
    throw std::runtime_error("orchestrator gone");
  };
  REQUIRE(ReadinessSession::ProcessRequest("READY t n", throwing) ==
          "ERROR orchestrator gone\n");
}

TEST_CASE("Readiness listener answers over TCP", "[readiness][net]")
{
  auto config = MakeTestConfig();
  auto log = std::make_shared<Log>(config);

  std::mutex callsMutex;
  std::vector<NodeName> accepted;
  ReadinessHandler handler = [&](const AuthToken& auth,
                                 const NodeName& nodename) {
    std::unique_lock<std::mutex> lock(callsMutex);
    if(auth != "secret")
      return false;
    accepted.push_back(nodename);
    return true;
  };

  boost::asio::io_service ioService;
  ReadinessListener listener(
    ioService,
    tcp::endpoint(boost::asio::ip::address::from_string("127.0.0.1"), 0),
    log,
    handler);
  listener.startAccepting();
  tcp::endpoint endpoint = listener.getLocalEndpoint();
  REQUIRE(endpoint.port() != 0);

  std::thread ioThread([&ioService]() { ioService.run(); });

  REQUIRE(Request(endpoint, "READY secret node1\n") == "OK");
  REQUIRE(Request(endpoint, "READY wrong node2\n") == "DENIED");
  REQUIRE(Request(endpoint, "PING\n") == "ERROR unknown command PING");
  // Connection closed by the VM before the newline.
  REQUIRE(Request(endpoint, "READY secret node3") == "OK");
  REQUIRE(Request(endpoint,
                  std::string(ReadinessSession::MaxRequestLength, 'x')) ==
          "ERROR request longer than 1024 bytes");

  {
    std::unique_lock<std::mutex> lock(callsMutex);
    REQUIRE(accepted == std::vector<NodeName>{ "node1", "node3" });
  }

  ioService.post([&listener]() { listener.stop(); });
  ioThread.join();
}

TEST_CASE("Communicator runs the readiness listener", "[readiness][net]")
{
  OrchestratorFixture f;
  f.batch->setJobs({ f.pending("J1") });
  f.orchestrator->cycle();
  REQUIRE(f.wait());
  AuthToken auth = f.cloud->getStarted(0).auth;

  bool exitCalled = false;
  Communicator communicator(
    f.config,
    f.log,
    [&f](const AuthToken& token, const NodeName& nodename) {
      return f.orchestrator->vmIsReady(token, nodename);
    },
    [&exitCalled]() { exitCalled = true; });

  REQUIRE(communicator.listen());
  auto endpoint = communicator.getListenEndpoint();
  REQUIRE(endpoint);

  std::thread communicatorThread([&communicator]() { communicator.run(); });

  REQUIRE(Request(*endpoint, "READY " + auth + " node1\n") == "OK");
  REQUIRE(Request(*endpoint, "READY " + auth + " node1\n") == "DENIED");

  communicator.exit();
  communicatorThread.join();

  REQUIRE_FALSE(exitCalled);
  auto vm = f.orchestrator->getVmByNodeName("node1");
  REQUIRE(vm);
  REQUIRE(vm->state == VmInfo::Ready);
}

TEST_CASE("Communicator rejects invalid listen addresses", "[net]")
{
  auto config = MakeTestConfig();
  config->set(Config::ListenAddress, std::string("not an address"));
  auto log = std::make_shared<Log>(config);

  Communicator communicator(
    config,
    log,
    [](const AuthToken&, const NodeName&) { return false; },
    Communicator::ExitHandler());
  REQUIRE_FALSE(communicator.listen());
  REQUIRE_FALSE(communicator.getListenEndpoint());
}
