// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "SessionId.hxx"

#include <gtest/gtest.h>

TEST(SessionIdTest, Format)
{
	SessionId id;
	EXPECT_FALSE(id.IsDefined());
	EXPECT_EQ(id.Format(), "00000000-0000-0000-0000-000000000000");

	id.Generate();
	EXPECT_TRUE(id.IsDefined());

	const auto s = id.Format();
	ASSERT_EQ(s.size(), 36u);
	EXPECT_EQ(s[8], '-');
	EXPECT_EQ(s[13], '-');
	EXPECT_EQ(s[18], '-');
	EXPECT_EQ(s[23], '-');

	/* version and variant */
	EXPECT_EQ(s[14], '4');
	EXPECT_NE(std::string_view("89ab").find(s[19]), std::string_view::npos);
}

TEST(SessionIdTest, Unique)
{
	SessionId a, b;
	a.Generate();
	b.Generate();
	EXPECT_FALSE(a == b);
	EXPECT_TRUE(a == a);
}
