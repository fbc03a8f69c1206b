#include "core/utils.hpp"

#include <gtest/gtest.h>

using namespace vtrack;

TEST(Utils, FoldCaseHandlesNonAsciiLetters)
{
	EXPECT_EQ(util::fold_case("AGreenFruit"), "agreenfruit");
	EXPECT_EQ(util::fold_case("Émile"), util::fold_case("émile"));
	EXPECT_EQ(util::fold_case("ΣΟΦΙΑ"), util::fold_case("σοφια"));
	EXPECT_EQ(util::fold_case("Straße"), "strasse");
	EXPECT_EQ(util::fold_case("#123"), "#123");
}

TEST(Utils, IequalsUsesCaseFolding)
{
	EXPECT_TRUE(util::iequals("Émile", "émile"));
	EXPECT_TRUE(util::iequals("AGreenFruit", "agreenfruit"));
	EXPECT_TRUE(util::iequals("STRASSE", "straße"));
	EXPECT_FALSE(util::iequals("Emile", "Émile"));
	EXPECT_FALSE(util::iequals("Foo", "Foo1"));
}

TEST(Utils, AccountKeyJoinsFoldedHandleAndTag)
{
	EXPECT_EQ(util::account_key("Foo", "ABC"), "foo#abc");
	EXPECT_EQ(util::account_key("Émile", "EU"), util::account_key("émile", "eu"));
	EXPECT_NE(util::account_key("ab", "c"), util::account_key("a", "bc"));
}

TEST(Utils, ToLowerLeavesNonAsciiBytesAlone)
{
	EXPECT_EQ(util::to_lower("EU"), "eu");
	EXPECT_EQ(util::to_lower("É"), "É");
}
