#include "boardbuild/version.hpp"

#include <gtest/gtest.h>

namespace boardbuild {

TEST(resolve_version, defaultsWithoutSource) {
    BuildRequest req;
    EXPECT_EQ(resolve_version(req, std::nullopt), "0.0.0");
}

TEST(resolve_version, commitIsAbbreviated) {
    BuildRequest req;
    ResolvedCheckout checkout{std::string(40, 'a'), CheckoutKind::Commit};
    EXPECT_EQ(resolve_version(req, checkout), "gitaaaaaaa");
}

TEST(resolve_version, checkoutRefUsedVerbatim) {
    BuildRequest req;
    EXPECT_EQ(resolve_version(req, ResolvedCheckout{"nightly", CheckoutKind::Branch}), "nightly");
    EXPECT_EQ(resolve_version(req, ResolvedCheckout{"pr12", CheckoutKind::PullRequest}), "pr12");
}

TEST(resolve_version, overrideWins) {
    BuildRequest req;
    req.version_override = "20240101";
    EXPECT_EQ(resolve_version(req, ResolvedCheckout{"main", CheckoutKind::Branch}), "20240101");
}

TEST(resolve_version, overrideIsAbbreviatedToo) {
    BuildRequest req;
    req.version_override = "1f2e3d4c5b6a79881f2e3d4c5b6a79881f2e3d4c";
    EXPECT_EQ(resolve_version(req, ResolvedCheckout{"main", CheckoutKind::Branch}), "git1f2e3d4");
}

TEST(resolve_version, onlyExactFortyHexDigitsAreAbbreviated) {
    BuildRequest req;
    const std::string almost(39, 'b');
    const std::string too_long(41, 'c');
    const std::string not_hex = std::string(39, 'a') + "g";
    EXPECT_EQ(resolve_version(req, ResolvedCheckout{almost, CheckoutKind::Commit}), almost);
    EXPECT_EQ(resolve_version(req, ResolvedCheckout{too_long, CheckoutKind::Commit}), too_long);
    EXPECT_EQ(resolve_version(req, ResolvedCheckout{not_hex, CheckoutKind::Tag}), not_hex);
}

TEST(is_commit_hash, lowerCaseOnly) {
    EXPECT_TRUE(is_commit_hash("0123456789abcdef0123456789abcdef01234567"));
    EXPECT_FALSE(is_commit_hash("0123456789abcdef0123456789ABCDEF01234567"));
    EXPECT_FALSE(is_commit_hash(""));
    EXPECT_FALSE(is_commit_hash("v1.0"));
}

TEST(resolve_version, upperCaseHashIsKept) {
    BuildRequest req;
    const std::string upper = "ABCDEF0123456789ABCDEF0123456789ABCDEF01";
    EXPECT_EQ(resolve_version(req, ResolvedCheckout{upper, CheckoutKind::Commit}), upper);
}

} // namespace boardbuild
