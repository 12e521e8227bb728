#include <gtest/gtest.h>
#include "FakeSerialLink.hpp"
#include "PositionStore.hpp"
#include "rotators/MotionPlanner.hpp"
#include "rotators/easycomm.hpp"
#include <algorithm>
#include <cstring>
#include <sys/time.h>

namespace {

const Limits kLimits = {0.0, 360.0, 45.0, 135.0};
const SpeedConfig kSpeeds = {1000.0, 500.0};

class TestClient {
private:
  int fd = -1;

public:
  ~TestClient() { Close(); }

  bool Connect(int port)
  {
    fd = socket(PF_INET, SOCK_STREAM, IPPROTO_TCP);
    if (fd < 0) {
      return false;
    }

    struct timeval tv;
    tv.tv_sec = 2;
    tv.tv_usec = 0;
    setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));

    struct sockaddr_in addr;
    memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    inet_pton(AF_INET, "127.0.0.1", &addr.sin_addr);
    return connect(fd, (struct sockaddr *)&addr, sizeof(addr)) == 0;
  }

  bool Send(const std::string &text)
  {
    return send_fixed(fd, text.c_str(), text.size(), MSG_NOSIGNAL) == (int)text.size();
  }

  // "" on timeout or close
  std::string ReadLine()
  {
    std::string line;
    char c;
    while (recv(fd, &c, 1, 0) == 1) {
      line.push_back(c);
      if (c == '\n') {
        return line;
      }
    }
    return "";
  }

  std::string Transact(const std::string &text)
  {
    if (!Send(text)) {
      return "";
    }
    return ReadLine();
  }

  void Close()
  {
    if (fd >= 0) {
      close(fd);
      fd = -1;
    }
  }
};

class EasyCommServerTest : public ::testing::Test {
protected:
  PositionStore store;
  FakeSerialLink link;
  MotionPlanner planner;
  easycomm server;

  void SetUp() override
  {
    ASSERT_TRUE(store.Initialize(kLimits, kSpeeds, {0.0, 90.0}));
    PlannerConfig config;
    config.tickIntervalMs = 5;
    config.settleMs = 0;
    planner.Initialize(&store, &link, config);
    planner.Start();

    server.Initialize("127.0.0.1", 0);
    server.SetRequestHandler(makeEasyCommHandler(planner, store));
    ASSERT_TRUE(server.Start());
    ASSERT_GT(server.BoundPort(), 0);
  }

  bool WaitForStatus(RotatorController::RotatorStatus wanted)
  {
    for (int i = 0; i < 2000; i++) {
      if (planner.Status() == wanted) {
        return true;
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    return false;
  }

  // polls the server until it reports expected or two seconds pass
  std::string WaitForReply(TestClient &client, const std::string &expected)
  {
    std::string reply;
    for (int i = 0; i < 400; i++) {
      reply = client.Transact("AZ EL\n");
      if (reply == expected) {
        break;
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return reply;
  }
};

RotatorResponse positionHandler(RotatorRequest req)
{
  RotatorResponse resp;
  resp.success = true;
  resp.position = {12.34, 56.78};
  if (req.cmd != GET_POS) {
    resp.position = {0, 0};
  }
  return resp;
}

}

TEST(EasyCommParse, QueryForms) {
  for (const char *line : {"AZ EL", "az el", "AZ", "EL", "  AZ   EL  "}) {
    EasyCommCommand cmd = easycommParse(line);
    EXPECT_EQ(cmd.kind, EASYCOMM_REQUEST) << line;
    EXPECT_EQ(cmd.request.cmd, GET_POS) << line;
  }
}

TEST(EasyCommParse, SetBothAxes) {
  EasyCommCommand cmd = easycommParse("AZ180.5 EL45.0");
  ASSERT_EQ(cmd.kind, EASYCOMM_REQUEST);
  ASSERT_EQ(cmd.request.cmd, CHANGE_POS);
  EXPECT_DOUBLE_EQ(cmd.request.payload.ChangePos.aziRequested, 180.5);
  EXPECT_DOUBLE_EQ(cmd.request.payload.ChangePos.eleRequested, 45.0);
}

TEST(EasyCommParse, SetSingleAxis) {
  EasyCommCommand cmd = easycommParse("AZ400.0");
  ASSERT_EQ(cmd.request.cmd, CHANGE_AZI);
  EXPECT_DOUBLE_EQ(cmd.request.payload.ChangeAzi.aziRequested, 400.0);

  cmd = easycommParse("el-3");
  ASSERT_EQ(cmd.request.cmd, CHANGE_ELE);
  EXPECT_DOUBLE_EQ(cmd.request.payload.ChangeEle.eleRequested, -3.0);
}

TEST(EasyCommParse, EasyCommOneTrailingFieldsAreIgnored) {
  EasyCommCommand cmd = easycommParse("AZ100.0 EL30.0 UP000 XXX DN000 XXX");
  ASSERT_EQ(cmd.kind, EASYCOMM_REQUEST);
  EXPECT_EQ(cmd.request.cmd, CHANGE_POS);
}

TEST(EasyCommParse, StopAndVersion) {
  EXPECT_EQ(easycommParse("SA SE").request.cmd, STOP_MOTION);
  EXPECT_EQ(easycommParse("SA").request.cmd, STOP_MOTION);
  EXPECT_EQ(easycommParse("VE").kind, EASYCOMM_VERSION);
}

TEST(EasyCommParse, InvalidInput) {
  EXPECT_EQ(easycommParse("FOO").kind, EASYCOMM_INVALID);
  EXPECT_EQ(easycommParse("AZabc").kind, EASYCOMM_INVALID);
  EXPECT_EQ(easycommParse("AZ12x EL4").kind, EASYCOMM_INVALID);
  EXPECT_EQ(easycommParse("AZnan").kind, EASYCOMM_INVALID);
  EXPECT_EQ(easycommParse("XXX").kind, EASYCOMM_INVALID);
  EXPECT_EQ(easycommParse("").kind, EASYCOMM_EMPTY);
  EXPECT_EQ(easycommParse("   ").kind, EASYCOMM_EMPTY);
}

TEST(EasyCommHandleLine, Replies) {
  EXPECT_EQ(easycommHandleLine("AZ EL", positionHandler), "AZ12.3 EL56.8\n");
  EXPECT_EQ(easycommHandleLine("AZ10 EL50", positionHandler), "OK\n");
  EXPECT_EQ(easycommHandleLine("VE", positionHandler), "VE" EASYCOMM_VERSION_STRING "\n");
  EXPECT_EQ(easycommHandleLine("", positionHandler), "");
  EXPECT_EQ(easycommHandleLine("HELLO", positionHandler), "ERR Unknown command 'HELLO'\n");
}

TEST(EasyCommHandleLine, HandlerFailureIsReported) {
  auto failing = [](RotatorRequest) {
    RotatorResponse resp;
    resp.message = "Motion planner is not running";
    return resp;
  };
  EXPECT_EQ(easycommHandleLine("AZ10", failing), "ERR Motion planner is not running\n");
}

TEST(EasyCommFormat, OneDecimal) {
  EXPECT_EQ(easycommFormatPosition({0.0, 90.0}), "AZ0.0 EL90.0\n");
  EXPECT_EQ(easycommFormatPosition({359.96, 45.04}), "AZ360.0 EL45.0\n");
}

TEST_F(EasyCommServerTest, QueryReturnsInitialPosition) {
  TestClient client;
  ASSERT_TRUE(client.Connect(server.BoundPort()));
  EXPECT_EQ(client.Transact("AZ EL\n"), "AZ0.0 EL90.0\n");
  EXPECT_EQ(client.Transact("AZ EL\r\n"), "AZ0.0 EL90.0\n");
}

TEST_F(EasyCommServerTest, SetBeyondLimitDrivesToLimit) {
  TestClient client;
  ASSERT_TRUE(client.Connect(server.BoundPort()));

  EXPECT_EQ(client.Transact("AZ400.0\n"), "OK\n");
  EXPECT_EQ(WaitForReply(client, "AZ360.0 EL90.0\n"), "AZ360.0 EL90.0\n");
  EXPECT_DOUBLE_EQ(store.GetPosition().azi, 360.0);
}

TEST_F(EasyCommServerTest, UnknownCommandKeepsConnectionOpen) {
  TestClient client;
  ASSERT_TRUE(client.Connect(server.BoundPort()));

  EXPECT_EQ(client.Transact("FROB 12\n"), "ERR Unknown command 'FROB'\n");
  EXPECT_EQ(client.Transact("AZ EL\n"), "AZ0.0 EL90.0\n");
}

TEST_F(EasyCommServerTest, CommandsSplitAcrossWritesAreReassembled) {
  TestClient client;
  ASSERT_TRUE(client.Connect(server.BoundPort()));

  ASSERT_TRUE(client.Send("AZ "));
  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  ASSERT_TRUE(client.Send("EL\nVE\n"));
  EXPECT_EQ(client.ReadLine(), "AZ0.0 EL90.0\n");
  EXPECT_EQ(client.ReadLine(), "VE" EASYCOMM_VERSION_STRING "\n");
}

TEST_F(EasyCommServerTest, ReaderAndWriterClientsAreServedTogether) {
  TestClient reader, writer;
  ASSERT_TRUE(reader.Connect(server.BoundPort()));
  ASSERT_TRUE(writer.Connect(server.BoundPort()));

  EXPECT_EQ(reader.Transact("AZ EL\n"), "AZ0.0 EL90.0\n");
  EXPECT_EQ(writer.Transact("AZ100.0 EL100.0\n"), "OK\n");
  EXPECT_EQ(WaitForReply(reader, "AZ100.0 EL100.0\n"), "AZ100.0 EL100.0\n");
}

TEST_F(EasyCommServerTest, StopCommandHaltsMotion) {
  TestClient client;
  ASSERT_TRUE(client.Connect(server.BoundPort()));

  EXPECT_EQ(client.Transact("SA SE\n"), "OK\n");
  EXPECT_FALSE(link.Moved());
}

TEST_F(EasyCommServerTest, TerminateClosesClientsButNotMotion) {
  TestClient client;
  ASSERT_TRUE(client.Connect(server.BoundPort()));
  ASSERT_EQ(client.Transact("AZ EL\n"), "AZ0.0 EL90.0\n");

  server.Terminate();
  EXPECT_EQ(client.ReadLine(), "");

  // the planner still takes requests
  EXPECT_TRUE(planner.MoveTo(30.0, 90.0).success);
}

TEST_F(EasyCommServerTest, TerminateLeavesInFlightMoveRunning) {
  TestClient client;
  ASSERT_TRUE(client.Connect(server.BoundPort()));

  ASSERT_EQ(client.Transact("AZ300\n"), "OK\n");
  ASSERT_TRUE(WaitForStatus(RotatorController::ROTATING));

  server.Terminate();
  EXPECT_EQ(client.ReadLine(), "");

  ASSERT_TRUE(WaitForStatus(RotatorController::IDLE));
  // a cancelled move would have stopped short of the target
  EXPECT_DOUBLE_EQ(store.GetPosition().azi, 300.0);
  auto frames = link.Frames();
  EXPECT_EQ(std::count_if(frames.begin(), frames.end(), [](const PelcoFrame &f) { return f.command2 == 0; }), 1);
}

TEST_F(EasyCommServerTest, PlannerNotRunningIsReportedToClient) {
  planner.Terminate();

  TestClient client;
  ASSERT_TRUE(client.Connect(server.BoundPort()));
  EXPECT_EQ(client.Transact("AZ10 EL50\n"), "ERR Motion planner is not running\n");
  EXPECT_EQ(client.Transact("AZ EL\n"), "AZ0.0 EL90.0\n");
  EXPECT_FALSE(link.Moved());
}

TEST(EasyCommHandler, SetTargetsAreClampedBeforeQueuing) {
  PositionStore store;
  FakeSerialLink link;
  MotionPlanner planner;
  ASSERT_TRUE(store.Initialize(kLimits, kSpeeds, {0.0, 90.0}));
  PlannerConfig config;
  config.tickIntervalMs = 5;
  config.settleMs = 0;
  planner.Initialize(&store, &link, config);
  planner.Start();
  auto handler = makeEasyCommHandler(planner, store);

  RotatorResponse resp = handler(easycommParse("AZ400 EL10").request);
  EXPECT_TRUE(resp.success);
  EXPECT_DOUBLE_EQ(resp.position.azi, 360.0);
  EXPECT_DOUBLE_EQ(resp.position.ele, 45.0);

  resp = handler(easycommParse("EL-20").request);
  EXPECT_DOUBLE_EQ(resp.position.ele, 45.0);

  resp = handler(easycommParse("AZ-5").request);
  EXPECT_DOUBLE_EQ(resp.position.azi, 0.0);
  planner.Terminate();
}
