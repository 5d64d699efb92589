// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "WebSocketClient.hxx"
#include "Instance.hxx"
#include "Config.hxx"
#include "stock/ProcessPool.hxx"
#include "io/Logger.hxx"

#include <gtest/gtest.h>

#include <fmt/format.h>

#include <atomic>
#include <chrono>
#include <exception>
#include <functional>
#include <initializer_list>
#include <thread>

#include <signal.h>
#include <unistd.h>

using namespace StdioGateway;
using namespace std::chrono_literals;

static uint16_t
GetCloseCode(const std::string &payload)
{
	if (payload.size() < 2)
		return 0;

	return (uint8_t(payload[0]) << 8) | uint8_t(payload[1]);
}

namespace {

/**
 * Redirects stderr (i.e. the log) to a pipe while it exists.
 */
class StderrCapture {
	UniqueFileDescriptor pipe_r;
	int saved;

public:
	StderrCapture() {
		auto [r, w] = UniqueFileDescriptor::CreatePipe();
		pipe_r = std::move(r);
		pipe_r.SetNonBlocking();

		/* never block the logger if nobody reads */
		w.SetNonBlocking();

		saved = dup(STDERR_FILENO);
		dup2(w.Get(), STDERR_FILENO);
	}

	~StderrCapture() noexcept {
		dup2(saved, STDERR_FILENO);
		close(saved);
	}

	StderrCapture(const StderrCapture &) = delete;
	StderrCapture &operator=(const StderrCapture &) = delete;

	std::string Read() {
		std::string result;
		char buffer[4096];
		ssize_t nbytes;
		while ((nbytes = pipe_r.Read(buffer, sizeof(buffer))) > 0)
			result.append(buffer, nbytes);
		return result;
	}
};

class GatewayTest : public ::testing::Test {
protected:
	GatewayConfig config;

	std::unique_ptr<GatewayInstance> instance;

	unsigned port;

	static void SetUpTestSuite() {
		signal(SIGPIPE, SIG_IGN);
	}

	void AddBackend(const char *name,
			std::initializer_list<const char *> args,
			unsigned min_pool_size=1) {
		BackendConfig backend(name);
		backend.args.assign(args.begin(), args.end());
		backend.min_pool_size = min_pool_size;
		config.backends.emplace_back(std::move(backend));
	}

	void Start() {
		instance = std::make_unique<GatewayInstance>(config);
		instance->InitializePools();
		instance->Listen(0);
		port = instance->listener.GetLocalPort();
	}

	void TearDown() override {
		instance.reset();
	}

	/**
	 * Run the client function in a separate thread while the
	 * event loop runs in this one.
	 */
	void RunClient(std::function<void(WebSocketClient &)> f) {
		std::atomic_bool done{false};
		std::exception_ptr error;

		std::thread thread([&]{
			try {
				WebSocketClient client;
				client.Connect(port);
				f(client);
			} catch (...) {
				error = std::current_exception();
			}

			done = true;
		});

		const auto deadline = std::chrono::steady_clock::now() + 30s;
		while (!done && std::chrono::steady_clock::now() < deadline) {
			instance->event_loop.LoopOnceNonBlock();
			std::this_thread::sleep_for(1ms);
		}

		/* the client times out eventually if the gateway hangs */
		while (!done)
			instance->event_loop.LoopOnceNonBlock();

		thread.join();

		if (error)
			std::rethrow_exception(error);
	}

	template<typename P>
	bool RunUntil(P &&predicate) {
		const auto deadline = std::chrono::steady_clock::now() + 10s;
		while (!predicate()) {
			if (std::chrono::steady_clock::now() > deadline)
				return false;

			instance->event_loop.LoopOnceNonBlock();
			std::this_thread::sleep_for(1ms);
		}

		return true;
	}
};

} // anonymous namespace

TEST_F(GatewayTest, Echo)
{
	AddBackend("echo", {"cat"}, 2);
	Start();

	RunClient([](WebSocketClient &client){
		client.SendUpgradeRequest("/echo");

		const auto head = client.ReceiveResponseHead();
		EXPECT_EQ(head.substr(0, head.find('\r')),
			  "HTTP/1.1 101 Switching Protocols");
		EXPECT_NE(head.find("sec-websocket-accept: s3pPLMBiTxaQ9kYGzzhZRbK+xOo="),
			  head.npos);

		WebSocketClient::Frame frame;

		client.SendFrame(WebSocketOpcode::TEXT,
				 "{\"jsonrpc\":\"2.0\",\"id\":1}");
		ASSERT_TRUE(client.ReceiveFrame(frame));
		EXPECT_EQ(frame.opcode, WebSocketOpcode::TEXT);
		EXPECT_EQ(frame.payload, "{\"jsonrpc\":\"2.0\",\"id\":1}");

		/* order is preserved */
		client.SendFrame(WebSocketOpcode::TEXT, "a");
		client.SendFrame(WebSocketOpcode::BINARY, "b");
		client.SendFrame(WebSocketOpcode::TEXT, "c");

		for (const char *expected : {"a", "b", "c"}) {
			ASSERT_TRUE(client.ReceiveFrame(frame));
			EXPECT_EQ(frame.payload, expected);
		}

		client.SendFrame(WebSocketOpcode::PING, "ping");
		ASSERT_TRUE(client.ReceiveFrame(frame));
		EXPECT_EQ(frame.opcode, WebSocketOpcode::PONG);
		EXPECT_EQ(frame.payload, "ping");

		client.SendFrame(WebSocketOpcode::CLOSE,
				 std::string_view("\x03\xe8", 2));
		ASSERT_TRUE(client.ReceiveFrame(frame));
		EXPECT_EQ(frame.opcode, WebSocketOpcode::CLOSE);
		EXPECT_EQ(GetCloseCode(frame.payload), 1000);

		EXPECT_FALSE(client.ReceiveFrame(frame));
	});

	/* the pool has been refilled */
	auto &pool = *instance->FindPool("echo");
	EXPECT_TRUE(RunUntil([&]{
		return pool.GetIdleCount() == 2 && pool.GetSpawningCount() == 0;
	}));
}

TEST_F(GatewayTest, NotFound)
{
	AddBackend("echo", {"cat"}, 1);
	Start();

	const auto count = instance->child_process_registry.GetCount();

	RunClient([](WebSocketClient &client){
		client.SendUpgradeRequest("/mcp/unknown");

		const auto response = client.ReceiveAll();
		EXPECT_EQ(response.substr(0, response.find('\r')),
			  "HTTP/1.1 404 Not Found");
		EXPECT_NE(response.find("\r\n\r\nNo backend found at unknown"),
			  response.npos);
	});

	/* no worker was spawned */
	EXPECT_EQ(instance->child_process_registry.GetCount(), count);
}

TEST_F(GatewayTest, BadRequests)
{
	AddBackend("echo", {"cat"}, 0);
	Start();

	RunClient([](WebSocketClient &client){
		client.SendRaw("POST /echo HTTP/1.1\r\n\r\n");
		const auto response = client.ReceiveAll();
		EXPECT_EQ(response.substr(0, response.find('\r')),
			  "HTTP/1.1 405 Method Not Allowed");
	});

	RunClient([](WebSocketClient &client){
		client.SendRaw("GET /echo HTTP/1.1\r\nHost: x\r\n\r\n");
		const auto response = client.ReceiveAll();
		EXPECT_EQ(response.substr(0, response.find('\r')),
			  "HTTP/1.1 426 Upgrade Required");
	});

	RunClient([](WebSocketClient &client){
		client.SendRaw("garbage\r\n\r\n");
		const auto response = client.ReceiveAll();
		EXPECT_EQ(response.substr(0, response.find('\r')),
			  "HTTP/1.1 400 Bad Request");
	});

	RunClient([](WebSocketClient &client){
		client.SendRaw("GET /echo HTTP/1.1\r\nX-Large: " +
			       std::string(10000, 'x'));
		const auto response = client.ReceiveAll();
		EXPECT_EQ(response.substr(0, response.find('\r')),
			  "HTTP/1.1 431 Request Header Fields Too Large");
	});
}

TEST_F(GatewayTest, ProtocolError)
{
	AddBackend("echo", {"cat"}, 1);
	Start();

	RunClient([](WebSocketClient &client){
		client.SendUpgradeRequest("/echo");
		client.ReceiveResponseHead();

		/* unmasked frame */
		client.SendRaw(std::string_view("\x81\x02hi", 4));

		WebSocketClient::Frame frame;
		ASSERT_TRUE(client.ReceiveFrame(frame));
		EXPECT_EQ(frame.opcode, WebSocketOpcode::CLOSE);
		EXPECT_EQ(GetCloseCode(frame.payload), 1002);
		EXPECT_FALSE(client.ReceiveFrame(frame));
	});
}

TEST_F(GatewayTest, ProcessExit)
{
	/* prints one line, then exits */
	AddBackend("once", {"/bin/sh", "-c", "read line; echo \"got $line\""}, 1);
	Start();

	RunClient([](WebSocketClient &client){
		client.SendUpgradeRequest("/once");
		client.ReceiveResponseHead();

		client.SendFrame(WebSocketOpcode::TEXT, "x");

		WebSocketClient::Frame frame;
		ASSERT_TRUE(client.ReceiveFrame(frame));
		EXPECT_EQ(frame.opcode, WebSocketOpcode::TEXT);
		EXPECT_EQ(frame.payload, "got x");

		ASSERT_TRUE(client.ReceiveFrame(frame));
		EXPECT_EQ(frame.opcode, WebSocketOpcode::CLOSE);
		EXPECT_EQ(GetCloseCode(frame.payload), 1000);
		EXPECT_FALSE(client.ReceiveFrame(frame));
	});
}

TEST_F(GatewayTest, ExitWithBackgroundChild)
{
	/* the background process inherits stdout and outlives the
	   worker */
	AddBackend("bg", {"/bin/sh", "-c",
			  "read line; echo \"bye $line\"; sleep 30 & exit 3"}, 1);
	Start();

	RunClient([](WebSocketClient &client){
		client.SendUpgradeRequest("/bg");
		client.ReceiveResponseHead();

		const auto start = std::chrono::steady_clock::now();
		client.SendFrame(WebSocketOpcode::TEXT, "x");

		WebSocketClient::Frame frame;
		ASSERT_TRUE(client.ReceiveFrame(frame));
		EXPECT_EQ(frame.opcode, WebSocketOpcode::TEXT);
		EXPECT_EQ(frame.payload, "bye x");

		ASSERT_TRUE(client.ReceiveFrame(frame));
		EXPECT_EQ(frame.opcode, WebSocketOpcode::CLOSE);
		EXPECT_EQ(GetCloseCode(frame.payload), 1011);
		EXPECT_FALSE(client.ReceiveFrame(frame));

		EXPECT_LT(std::chrono::steady_clock::now() - start, 5s);
	});
}

TEST_F(GatewayTest, ConcurrentSessions)
{
	/* prints its pid, then echoes */
	AddBackend("pid", {"/bin/sh", "-c", "echo $$; exec cat"}, 1);
	Start();

	RunClient([this](WebSocketClient &a){
		WebSocketClient b;
		b.Connect(port);

		a.SendUpgradeRequest("/pid");
		b.SendUpgradeRequest("/pid");

		for (auto *client : {&a, &b}) {
			const auto head = client->ReceiveResponseHead();
			EXPECT_EQ(head.substr(0, head.find('\r')),
				  "HTTP/1.1 101 Switching Protocols");
		}

		WebSocketClient::Frame frame_a, frame_b;
		ASSERT_TRUE(a.ReceiveFrame(frame_a));
		ASSERT_TRUE(b.ReceiveFrame(frame_b));
		EXPECT_FALSE(frame_a.payload.empty());
		EXPECT_FALSE(frame_b.payload.empty());
		EXPECT_NE(frame_a.payload, frame_b.payload);

		a.SendFrame(WebSocketOpcode::TEXT, "one");
		b.SendFrame(WebSocketOpcode::TEXT, "two");

		ASSERT_TRUE(a.ReceiveFrame(frame_a));
		ASSERT_TRUE(b.ReceiveFrame(frame_b));
		EXPECT_EQ(frame_a.payload, "one");
		EXPECT_EQ(frame_b.payload, "two");
	});
}

TEST_F(GatewayTest, WorkerOutputIsLogged)
{
	AddBackend("noisy", {"/bin/sh", "-c",
			     "read line; echo \"oops $line\" >&2; echo $$"}, 1);
	Start();

	std::string pid, log;

	{
		StderrCapture capture;
		SetLogLevel(5);

		RunClient([&pid](WebSocketClient &client){
			client.SendUpgradeRequest("/noisy");
			client.ReceiveResponseHead();

			client.SendFrame(WebSocketOpcode::TEXT, "x");

			/* only stdout reaches the client */
			WebSocketClient::Frame frame;
			ASSERT_TRUE(client.ReceiveFrame(frame));
			EXPECT_EQ(frame.opcode, WebSocketOpcode::TEXT);
			pid = frame.payload;

			ASSERT_TRUE(client.ReceiveFrame(frame));
			EXPECT_EQ(frame.opcode, WebSocketOpcode::CLOSE);
			EXPECT_EQ(GetCloseCode(frame.payload), 1000);
			EXPECT_FALSE(client.ReceiveFrame(frame));
		});

		SetLogLevel(1);
		log = capture.Read();
	}

	ASSERT_FALSE(pid.empty());

	const auto i = log.find("oops x");
	ASSERT_NE(i, log.npos) << log;

	const auto start = log.rfind('\n', i) + 1;
	const auto line = log.substr(start, i - start);
	EXPECT_EQ(line.rfind(fmt::format("child[{}]: [session ", pid), 0), 0u)
		<< line;

	/* forwarded stdout lines are traced per session */
	const auto j = log.find(fmt::format(": {}\n", pid));
	ASSERT_NE(j, log.npos) << log;

	const auto trace_start = log.rfind('\n', j) + 1;
	EXPECT_EQ(log.compare(trace_start, 8, "session "), 0)
		<< log.substr(trace_start, j - trace_start);
}

TEST_F(GatewayTest, Crash)
{
	/* crashes on the first message */
	AddBackend("crash", {"/bin/sh", "-c", "read line; kill -SEGV $$"}, 1);
	Start();

	for (unsigned i = 0; i < 2; ++i) {
		RunClient([](WebSocketClient &client){
			client.SendUpgradeRequest("/crash");

			const auto head = client.ReceiveResponseHead();
			EXPECT_EQ(head.substr(0, head.find('\r')),
				  "HTTP/1.1 101 Switching Protocols");

			client.SendFrame(WebSocketOpcode::TEXT, "boom");

			WebSocketClient::Frame frame;
			ASSERT_TRUE(client.ReceiveFrame(frame));
			EXPECT_EQ(frame.opcode, WebSocketOpcode::CLOSE);
			EXPECT_EQ(GetCloseCode(frame.payload), 1011);
			EXPECT_FALSE(client.ReceiveFrame(frame));
		});
	}
}

TEST_F(GatewayTest, SpawnFailure)
{
	AddBackend("broken", {"/nonexistent/stdio-gateway-backend"}, 0);
	AddBackend("echo", {"cat"}, 0);
	Start();

	RunClient([](WebSocketClient &client){
		client.SendUpgradeRequest("/broken");
		const auto response = client.ReceiveAll();
		EXPECT_EQ(response.substr(0, response.find('\r')),
			  "HTTP/1.1 503 Service Unavailable");
	});

	/* other backends are unaffected */
	RunClient([](WebSocketClient &client){
		client.SendUpgradeRequest("/echo");
		client.ReceiveResponseHead();

		client.SendFrame(WebSocketOpcode::TEXT, "still alive");

		WebSocketClient::Frame frame;
		ASSERT_TRUE(client.ReceiveFrame(frame));
		EXPECT_EQ(frame.payload, "still alive");
	});
}

TEST_F(GatewayTest, ClientDisconnect)
{
	AddBackend("echo", {"cat"}, 1);
	Start();

	RunClient([](WebSocketClient &client){
		client.SendUpgradeRequest("/echo");
		client.ReceiveResponseHead();
	});

	/* the worker receives SIGINT and is reaped; only the
	   replacement remains */
	auto &pool = *instance->FindPool("echo");
	EXPECT_TRUE(RunUntil([&]{
		return instance->connections.empty() &&
			pool.GetIdleCount() == 1 &&
			pool.GetSpawningCount() == 0 &&
			instance->child_process_registry.GetCount() == 1;
	}));
}
