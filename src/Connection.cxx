// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Connection.hxx"
#include "Instance.hxx"
#include "AcquireJob.hxx"
#include "SessionId.hxx"
#include "stock/ProcessPool.hxx"
#include "http/Request.hxx"
#include "http/Response.hxx"
#include "http/Upgrade.hxx"
#include "http/MessageResponse.hxx"
#include "websocket/Handshake.hxx"
#include "websocket/Writer.hxx"
#include "websocket/Error.hxx"

#include <fmt/format.h>

#include <errno.h>
#include <string.h>
#include <sys/socket.h>

using namespace StdioGateway;

/**
 * Stop reading the worker's output if this many bytes are waiting to
 * be sent to the client.
 */
static constexpr std::size_t OUTPUT_HIGH_WATERMARK = 1024 * 1024;

/**
 * Resume reading the worker's output when the output buffer has
 * shrunk below this size.
 */
static constexpr std::size_t OUTPUT_LOW_WATERMARK = 64 * 1024;

/**
 * Disconnect clients which send more than this without giving us a
 * chance to process it.
 */
static constexpr std::size_t MAX_INPUT_SIZE = 2 * MAX_MESSAGE_SIZE;

GatewayConnection::GatewayConnection(GatewayInstance &_instance,
				     UniqueFileDescriptor &&_fd,
				     std::string &&address) noexcept
	:instance(_instance),
	 logger(address),
	 fd(std::move(_fd)),
	 event(instance.event_loop, BIND_THIS_METHOD(OnSocketReady), fd.Get())
{
	logger(4, "connected");
	event.ScheduleRead();
}

GatewayConnection::~GatewayConnection() noexcept
{
	if (job != nullptr) {
		if (instance.GetThreadQueue().Cancel(*job))
			delete job;
		else
			/* Acquire() is running; the job will dispose of
			   the worker */
			job->Abandon();
	}

	session.reset();
	event.Cancel();

	logger(4, "disconnected");
}

void
GatewayConnection::Send(std::string_view data) noexcept
{
	output.append(data);
	event.ScheduleWrite();

	if (session && !output_throttled &&
	    output.size() >= OUTPUT_HIGH_WATERMARK) {
		output_throttled = true;
		session->SuspendOutput();
	}
}

void
GatewayConnection::SendMessageResponse(HttpStatus status,
				       std::string_view body) noexcept
{
	logger(3, "responding ", http_status_to_string(status), ": ", body);

	Send(MakeHttpMessageResponse(status, body));

	/* unread input would make close() send RST; keep reading
	   (and discarding) until the response has been flushed */
	state = State::CLOSING;
	input.clear();
}

void
GatewayConnection::SendCloseFrame(std::string_view frame) noexcept
{
	session.reset();

	Send(frame);
	state = State::CLOSING;
	input.clear();
}

void
GatewayConnection::CloseWebSocket(WebSocketCloseCode code,
				  std::string_view reason) noexcept
{
	std::string frame;
	AppendWebSocketClose(frame, code, reason);
	SendCloseFrame(frame);
}

void
GatewayConnection::StartProvisioning(ProcessPool &pool) noexcept
{
	state = State::PROVISIONING;

	if (auto worker = pool.TryAcquireIdle()) {
		OnAcquireDone(std::move(worker), {});
		return;
	}

	/* spawning may block; do it in a worker thread */
	job = new AcquireJob(pool, *this);
	instance.GetThreadQueue().Add(*job);
}

void
GatewayConnection::OnAcquireDone(WorkerPtr &&worker,
				 std::exception_ptr error) noexcept
{
	job = nullptr;

	if (error) {
		logger(1, "failed to provision a process for '", backend, "': ",
		       error);
		SendMessageResponse(HttpStatus::SERVICE_UNAVAILABLE,
				    "No process available");
		return;
	}

	SessionId id;
	try {
		id.Generate();
	} catch (...) {
		logger(1, "failed to generate session id: ",
		       std::current_exception());
		SendMessageResponse(HttpStatus::SERVICE_UNAVAILABLE,
				    "No process available");
		return;
	}

	Send(MakeWebSocketUpgradeResponse(websocket_accept));
	websocket_accept.clear();

	state = State::SESSION;
	session = std::make_unique<Session>(instance.child_process_registry,
					    std::move(worker), id.Format(),
					    static_cast<SessionHandler &>(*this));

	/* frames which arrived while waiting for the worker */
	ParseFrames();
}

void
GatewayConnection::ParseRequest() noexcept
{
	const std::size_t end = FindHttpRequestHeadEnd(input);
	if (end == 0 ? input.size() > MAX_HTTP_REQUEST_HEAD_SIZE
	    : end > MAX_HTTP_REQUEST_HEAD_SIZE) {
		SendMessageResponse(HttpStatus::REQUEST_HEADER_FIELDS_TOO_LARGE,
				    "Request header too large");
		return;
	}

	if (end == 0)
		/* need more data */
		return;

	ProcessPool *pool;

	try {
		const auto request = ParseHttpRequestHead({input.data(), end});
		if (request.method != "GET")
			throw HttpMessageResponse(HttpStatus::METHOD_NOT_ALLOWED,
						  "Method not allowed");

		const auto key = GetRoutingKey(request.uri);
		pool = instance.FindPool(key);
		if (pool == nullptr)
			throw HttpMessageResponse(HttpStatus::NOT_FOUND,
						  fmt::format("No backend found at {}",
							      key));

		websocket_accept = MakeWebSocketAccept(CheckWebSocketUpgrade(request));
		backend = key;
	} catch (const HttpMessageResponse &e) {
		SendMessageResponse(e.GetStatus(), e.what());
		return;
	}

	logger(4, "upgrade request for '", backend, "'");

	input.erase(0, end);
	StartProvisioning(*pool);
}

void
GatewayConnection::ParseFrames() noexcept
try {
	while (state == State::SESSION) {
		WebSocketMessage message;
		bool complete;
		const std::size_t nbytes =
			websocket_parser.Parse(input, message, complete);
		if (nbytes == 0)
			break;

		input.erase(0, nbytes);

		if (!complete)
			continue;

		switch (message.opcode) {
		case WebSocketOpcode::CONTINUATION:
			break;

		case WebSocketOpcode::TEXT:
		case WebSocketOpcode::BINARY:
			session->OnMessage(message.payload);
			break;

		case WebSocketOpcode::PING:
			{
				std::string pong;
				AppendWebSocketFrame(pong, WebSocketOpcode::PONG,
						     message.payload);
				Send(pong);
			}
			break;

		case WebSocketOpcode::PONG:
			break;

		case WebSocketOpcode::CLOSE:
			if (message.payload.size() == 1)
				throw WebSocketProtocolError(WebSocketCloseCode::PROTOCOL_ERROR,
							     "Malformed close frame");

			logger(4, "client has closed the WebSocket");

			{
				/* echo the status code */
				std::string frame;
				AppendWebSocketFrame(frame, WebSocketOpcode::CLOSE,
						     std::string_view{message.payload}.substr(0, 2));
				SendCloseFrame(frame);
			}

			return;
		}
	}
} catch (const WebSocketProtocolError &e) {
	logger(2, "WebSocket protocol error: ", e.what());
	CloseWebSocket(e.GetCode());
}

bool
GatewayConnection::Fill() noexcept
{
	char buffer[65536];
	const ssize_t nbytes = recv(fd.Get(), buffer, sizeof(buffer),
				    MSG_DONTWAIT);
	if (nbytes < 0) {
		if (errno == EAGAIN || errno == EINTR)
			return true;

		logger(4, "failed to receive: ", strerror(errno));
		Destroy();
		return false;
	}

	if (nbytes == 0) {
		logger(5, "client has closed the connection");
		Destroy();
		return false;
	}

	if (state == State::CLOSING)
		/* discard */
		return true;

	input.append(buffer, nbytes);
	if (input.size() > MAX_INPUT_SIZE) {
		logger(2, "too much input from client");
		Destroy();
		return false;
	}

	switch (state) {
	case State::REQUEST:
		ParseRequest();
		break;

	case State::PROVISIONING:
		/* keep the data until the session starts */
		break;

	case State::SESSION:
		ParseFrames();
		break;

	case State::CLOSING:
		break;
	}

	return true;
}

bool
GatewayConnection::Flush() noexcept
{
	if (!output.empty()) {
		const ssize_t nbytes = send(fd.Get(), output.data(), output.size(),
					    MSG_DONTWAIT|MSG_NOSIGNAL);
		if (nbytes < 0) {
			if (errno == EAGAIN || errno == EINTR)
				return true;

			logger(4, "failed to send: ", strerror(errno));
			Destroy();
			return false;
		}

		output.erase(0, nbytes);
	}

	if (output_throttled && output.size() < OUTPUT_LOW_WATERMARK) {
		output_throttled = false;
		if (session)
			session->ResumeOutput();
	}

	if (output.empty()) {
		event.CancelWrite();

		if (state == State::CLOSING) {
			Destroy();
			return false;
		}
	}

	return true;
}

void
GatewayConnection::OnSocketReady(unsigned events) noexcept
{
	if ((events & SocketEvent::WRITE) != 0 && !Flush())
		return;

	if ((events & SocketEvent::READ) != 0)
		Fill();
}

void
GatewayConnection::OnSessionLine(std::string_view line) noexcept
{
	std::string frame;
	AppendWebSocketFrame(frame, WebSocketOpcode::TEXT, line);
	Send(frame);
}

void
GatewayConnection::OnSessionEnd(WebSocketCloseCode code,
				std::string_view reason) noexcept
{
	CloseWebSocket(code, reason);
}
