#include "vercompat.h"

#include <gtest/gtest.h>

#include <stdio.h>
#include <stdlib.h>

#include <array>
#include <string_view>

class f : public testing::Test {
protected:
  FILE *err_;

  void SetUp() override { err_ = ::tmpfile(); }

  void TearDown() override {
    if (err_)
      ::fclose(err_);
  }

  bool wrote_error() { return err_ && ::ftell(err_) > 0; }
};

TEST(Compatible, SameMinorOk) {
  EXPECT_EQ(vercompat_is_compatible("pvp", "0.1.0", "0.1.5", NULL), 1);
}

TEST(Compatible, DifferentMinorNotOk) {
  EXPECT_EQ(vercompat_is_compatible("pvp", "0.1.0", "0.2.0", NULL), 0);
}

TEST(Compatible, SemverSpecZeroMajorNotOk) {
  EXPECT_EQ(vercompat_is_compatible("semver-spec", "0.1.0", "0.1.5", NULL), 0);
  EXPECT_EQ(vercompat_is_compatible("early-semver", "0.1.0", "0.1.5", NULL),
            1);
}

TEST(Compatible, IntervalConstraint) {
  EXPECT_EQ(vercompat_is_compatible("strict", "[1.0,2.0)", "1.5", NULL), 1);
  EXPECT_EQ(vercompat_is_compatible("strict", "[1.0,2.0)", "2.0", NULL), 0);
}

TEST_F(f, UnknownPolicyIsError) {
  EXPECT_EQ(vercompat_is_compatible("bogus", "1.0", "1.0", err_), -1);
  EXPECT_TRUE(wrote_error());
}

TEST_F(f, NullArgumentsAreErrors) {
  EXPECT_EQ(vercompat_is_compatible(NULL, "1.0", "1.0", err_), -1);
  EXPECT_EQ(vercompat_is_compatible("pvp", NULL, "1.0", err_), -1);
  EXPECT_EQ(vercompat_is_compatible("pvp", "1.0", NULL, err_), -1);
  EXPECT_TRUE(wrote_error());
}

TEST(Compatible, NullErrStreamIsAllowed) {
  EXPECT_EQ(vercompat_is_compatible("bogus", "1.0", "1.0", NULL), -1);
}

TEST(CompatibleDeathTest, AmbiguousSemverExits) {
  EXPECT_EXIT(vercompat_is_compatible("semver", "1.0", "1.0", NULL),
              testing::ExitedWithCode(EXIT_FAILURE), "ambiguous");
}

TEST_F(f, MalformedConstraintIsNotCompatible) {
  EXPECT_EQ(vercompat_is_compatible("pvp", "[1.0", "1.0.5", err_), 0);
  EXPECT_EQ(vercompat_is_compatible("strict", "(,)", "1.0", err_), 0);
}

TEST(Minimum, WritesResult) {
  std::array<char, 32> buf;
  int n = vercompat_minimum_compatible_version("pvp", "1.2.3", buf.data(),
                                               buf.size(), NULL);

  EXPECT_EQ(n, 3);
  EXPECT_EQ(std::string_view{buf.data()}, "1.2");
}

TEST(Minimum, NullBufferComputesSize) {
  int n = vercompat_minimum_compatible_version("early-semver", "10.2.3", NULL,
                                               0, NULL);
  EXPECT_EQ(n, 2);
}

TEST(Minimum, SmallBufferTruncates) {
  std::array<char, 2> buf;
  int n = vercompat_minimum_compatible_version("strict", "1.2.3", buf.data(),
                                               buf.size(), NULL);

  EXPECT_EQ(n, 5);
  EXPECT_EQ(std::string_view{buf.data()}, "1");
}

TEST_F(f, MinimumUnknownPolicyIsError) {
  std::array<char, 32> buf;
  int n = vercompat_minimum_compatible_version("bogus", "1.2.3", buf.data(),
                                               buf.size(), err_);

  EXPECT_EQ(n, -1);
  EXPECT_TRUE(wrote_error());
}

TEST(Name, KnownPolicy) {
  EXPECT_EQ(std::string_view{vercompat_policy_name("semver-spec")},
            "strict semantic versioning");
  EXPECT_EQ(std::string_view{vercompat_policy_name("default")},
            "package versioning policy");
}

TEST(Name, UnknownPolicyIsNull) {
  EXPECT_EQ(vercompat_policy_name("bogus"), nullptr);
}

TEST(NameDeathTest, AmbiguousSemverExits) {
  EXPECT_EXIT(vercompat_policy_name("semver"),
              testing::ExitedWithCode(EXIT_FAILURE), "ambiguous");
}
