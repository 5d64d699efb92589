// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Config.hxx"
#include "util/Exception.hxx"

#include <gtest/gtest.h>

#include <boost/filesystem/operations.hpp>

#include <fstream>
#include <system_error>

namespace fs = boost::filesystem;

namespace {

class ConfigParserTest : public ::testing::Test {
protected:
	fs::path directory;

	void SetUp() override {
		directory = fs::temp_directory_path() /
			fs::unique_path("stdio-gateway-%%%%-%%%%");
		fs::create_directory(directory);
	}

	void TearDown() override {
		fs::remove_all(directory);
	}

	fs::path Write(const char *name, const char *contents) {
		auto path = directory / name;
		std::ofstream(path.native()) << contents;
		return path;
	}

	GatewayConfig Load(const char *contents) {
		GatewayConfig config;
		LoadConfigFile(config, Write("gateway.json", contents).c_str());
		return config;
	}

	std::string LoadError(const char *contents) {
		try {
			Load(contents);
		} catch (...) {
			return GetFullMessage(std::current_exception());
		}

		ADD_FAILURE() << "no error";
		return {};
	}
};

} // anonymous namespace

TEST_F(ConfigParserTest, Basic)
{
	const auto config = Load(R"({
  "mcpServers": {
    "echo": {
      "command": "cat",
      "args": [],
      "min_pool_size": 2
    },
    "github": {
      "command": "/bin/sh",
      "args": ["-c", "echo hello"],
      "env": {"TOKEN": "secret", "EMPTY": ""},
      "disabled": false
    }
  },
  "globalShortcut": "Ctrl+Space"
})");

	ASSERT_EQ(config.backends.size(), 2u);

	const auto *echo = config.FindBackend("echo");
	ASSERT_NE(echo, nullptr);
	ASSERT_EQ(echo->args.size(), 1u);
	EXPECT_EQ(echo->args[0], "cat");
	EXPECT_EQ(echo->min_pool_size, 2u);
	EXPECT_TRUE(echo->env.empty());

	const auto *github = config.FindBackend("github");
	ASSERT_NE(github, nullptr);
	ASSERT_EQ(github->args.size(), 3u);
	EXPECT_EQ(github->args[0], "/bin/sh");
	EXPECT_EQ(github->args[1], "-c");
	EXPECT_EQ(github->args[2], "echo hello");
	EXPECT_EQ(github->min_pool_size, 1u);
	ASSERT_EQ(github->env.size(), 2u);

	bool found_token = false, found_empty = false;
	for (const auto &[name, value] : github->env) {
		if (name == "TOKEN") {
			EXPECT_EQ(value, "secret");
			found_token = true;
		} else if (name == "EMPTY") {
			EXPECT_EQ(value, "");
			found_empty = true;
		}
	}

	EXPECT_TRUE(found_token);
	EXPECT_TRUE(found_empty);

	EXPECT_EQ(config.FindBackend("nope"), nullptr);
}

TEST_F(ConfigParserTest, MinimalEntry)
{
	/* "args" is optional; 0 disables pre-warming */
	const auto config = Load(R"({"mcpServers": {"cat": {"command": "cat", "min_pool_size": 0}}})");

	ASSERT_EQ(config.backends.size(), 1u);
	EXPECT_EQ(config.backends.front().name, "cat");
	ASSERT_EQ(config.backends.front().args.size(), 1u);
	EXPECT_EQ(config.backends.front().min_pool_size, 0u);
}

TEST_F(ConfigParserTest, Errors)
{
	auto msg = LoadError("");
	EXPECT_NE(msg.find("gateway.json"), msg.npos) << msg;
	EXPECT_NE(msg.find("parse error"), msg.npos) << msg;

	/* truncated document: the position is reported */
	msg = LoadError("{\"mcpServers\": {\n"
			"  \"echo\": {\"command\": \"cat\"}\n");
	EXPECT_NE(msg.find("gateway.json"), msg.npos) << msg;
	EXPECT_NE(msg.find("line 3"), msg.npos) << msg;

	msg = LoadError("[]");
	EXPECT_NE(msg.find("Configuration must be an object"), msg.npos) << msg;

	msg = LoadError("{}");
	EXPECT_NE(msg.find("mcpServers"), msg.npos) << msg;

	msg = LoadError(R"({"mcpServers": {}})");
	EXPECT_NE(msg.find("No backends configured"), msg.npos) << msg;

	msg = LoadError(R"({"mcpServers": {"echo": {"args": ["x"]}}})");
	EXPECT_NE(msg.find("Invalid server 'echo'"), msg.npos) << msg;
	EXPECT_NE(msg.find("command"), msg.npos) << msg;

	msg = LoadError(R"({"mcpServers": {"echo": {"command": ""}}})");
	EXPECT_NE(msg.find("Empty \"command\""), msg.npos) << msg;

	msg = LoadError(R"({"mcpServers": {"echo": "cat"}})");
	EXPECT_NE(msg.find("Server must be an object"), msg.npos) << msg;

	msg = LoadError(R"({"mcpServers": {"a/b": {"command": "cat"}}})");
	EXPECT_NE(msg.find("Invalid server 'a/b'"), msg.npos) << msg;
	EXPECT_NE(msg.find("slash"), msg.npos) << msg;

	msg = LoadError(R"({"mcpServers": {"": {"command": "cat"}}})");
	EXPECT_NE(msg.find("Empty server name"), msg.npos) << msg;

	msg = LoadError(R"({"mcpServers": {"echo": {"command": "cat", "args": "x"}}})");
	EXPECT_NE(msg.find("Invalid server 'echo'"), msg.npos) << msg;

	msg = LoadError(R"({"mcpServers": {"echo": {"command": "cat", "env": {"A=B": "c"}}}})");
	EXPECT_NE(msg.find("Invalid environment variable name 'A=B'"), msg.npos) << msg;

	msg = LoadError(R"({"mcpServers": {"echo": {"command": "cat", "env": {"A": 1}}}})");
	EXPECT_NE(msg.find("Invalid server 'echo'"), msg.npos) << msg;

	msg = LoadError(R"({"mcpServers": {"echo": {"command": "cat", "min_pool_size": -1}}})");
	EXPECT_NE(msg.find("min_pool_size"), msg.npos) << msg;

	msg = LoadError(R"({"mcpServers": {"echo": {"command": "cat", "min_pool_size": "many"}}})");
	EXPECT_NE(msg.find("min_pool_size"), msg.npos) << msg;
}

TEST_F(ConfigParserTest, MissingFile)
{
	GatewayConfig config;
	EXPECT_THROW(LoadConfigFile(config, (directory / "nope.json").c_str()),
		     std::system_error);
}
