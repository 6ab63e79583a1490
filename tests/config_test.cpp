#include "boardbuild/config.hpp"

#include "test_support.hpp"

#include <gtest/gtest.h>

namespace boardbuild {

TEST(parse_request, minimal) {
    auto req = parse_request({{"TB_REPO", "https://github.com/acme/os.git"}, {"TB_BOARD", "raspberrypi4"}});
    ASSERT_TRUE(req.has_value()) << req.error().message;
    EXPECT_EQ(req->repo_url, "https://github.com/acme/os.git");
    EXPECT_EQ(req->board, "raspberrypi4");
    EXPECT_EQ(req->clean_scope, CleanScope::Full);
    EXPECT_EQ(req->attach_mode, AttachMode::Auto);
    EXPECT_EQ(req->layout.os_dir.string(), "/os");
    EXPECT_EQ(req->layout.dl_dir.string(), "/mnt/dl");
    EXPECT_EQ(req->layout.ccache_dir.string(), "/mnt/ccache");
    EXPECT_EQ(req->layout.output_dir.string(), "/mnt/output");
    EXPECT_EQ(req->build_driver, "build.sh");
    EXPECT_FALSE(req->custom_command.has_value());
}

TEST(parse_request, missingRepo) {
    auto req = parse_request({{"TB_BOARD", "raspberrypi4"}});
    ASSERT_FALSE(req.has_value());
    EXPECT_EQ(req.error().kind, ErrorKind::Configuration);
    EXPECT_EQ(req.error().status, 1);
    EXPECT_NE(req.error().message.find("TB_REPO"), std::string::npos);
}

TEST(parse_request, everyProblemIsReported) {
    auto req = parse_request({{"TB_PR", "abc"}, {"TB_CLEAN_TARGET_ONLY", "maybe"}});
    ASSERT_FALSE(req.has_value());
    const auto &msg = req.error().message;
    EXPECT_NE(msg.find("TB_REPO"), std::string::npos);
    EXPECT_NE(msg.find("TB_BOARD"), std::string::npos);
    EXPECT_NE(msg.find("TB_PR"), std::string::npos);
    EXPECT_NE(msg.find("TB_CLEAN_TARGET_ONLY"), std::string::npos);
}

TEST(parse_request, emptyValuesAreUnset) {
    auto req = parse_request({{"TB_REPO", "u"}, {"TB_BOARD", "b"}, {"TB_BRANCH", ""}, {"TB_VERSION", ""}});
    ASSERT_TRUE(req.has_value());
    EXPECT_FALSE(req->branch.has_value());
    EXPECT_FALSE(req->version_override.has_value());
}

TEST(parse_request, localCheckoutNeedsOnlyBoard) {
    auto req = parse_request({{"TB_LOCAL", "true"}, {"TB_BOARD", "odroidc4"}});
    ASSERT_TRUE(req.has_value()) << req.error().message;
    EXPECT_TRUE(req->local_checkout);

    auto no_board = parse_request({{"TB_LOCAL", "true"}});
    ASSERT_FALSE(no_board.has_value());
    EXPECT_NE(no_board.error().message.find("TB_BOARD"), std::string::npos);
}

TEST(parse_request, allOptions) {
    auto req = parse_request({
        {"TB_REPO", "https://github.com/acme/os.git"},
        {"TB_BOARD", "pi"},
        {"TB_GIT_CREDENTIALS", "bot:pw"},
        {"TB_BRANCH", "dev"},
        {"TB_PR", "17"},
        {"TB_TAG", "v1"},
        {"TB_COMMIT", "abc"},
        {"TB_VERSION", "1.2"},
        {"TB_CUSTOM_CMD", "make menuconfig"},
        {"TB_CLEAN_TARGET_ONLY", "TRUE"},
        {"TB_LOOP_DEV", "/dev/loop3"},
        {"TB_GIT_CLONE_ARGS", "--no-single-branch  --depth 1"},
        {"TB_OS_DIR", "/work/os"},
        {"TB_OUTPUT_DIR", "/srv/out"},
        {"TB_BUILD_DRIVER", "/usr/bin/osbuild"},
        {"TB_ATTACH_MODE", "Symlink"},
        {"TB_PRESERVE_DL_ON_CLEAN_TARGET", "yes"},
    });
    ASSERT_TRUE(req.has_value()) << req.error().message;
    EXPECT_EQ(req->credentials, "bot:pw");
    EXPECT_EQ(req->branch, "dev");
    EXPECT_EQ(req->pull_request, 17u);
    EXPECT_EQ(req->tag, "v1");
    EXPECT_EQ(req->commit, "abc");
    EXPECT_EQ(req->version_override, "1.2");
    EXPECT_EQ(req->custom_command, "make menuconfig");
    EXPECT_EQ(req->clean_scope, CleanScope::TargetOnly);
    EXPECT_EQ(req->loop_dev, "/dev/loop3");
    EXPECT_EQ(req->clone_args, (std::vector<std::string>{"--no-single-branch", "--depth", "1"}));
    EXPECT_EQ(req->layout.os_dir.string(), "/work/os");
    EXPECT_EQ(req->layout.output_dir.string(), "/srv/out");
    EXPECT_EQ(req->build_driver, "/usr/bin/osbuild");
    EXPECT_EQ(req->attach_mode, AttachMode::Symlink);
    EXPECT_TRUE(req->preserve_dl_on_clean_target);
}

TEST(parse_request, rejectsBadValues) {
    EXPECT_FALSE(parse_request({{"TB_REPO", "u"}, {"TB_BOARD", "b"}, {"TB_PR", "0"}}).has_value());
    EXPECT_FALSE(parse_request({{"TB_REPO", "u"}, {"TB_BOARD", "b"}, {"TB_PR", "12x"}}).has_value());
    EXPECT_FALSE(parse_request({{"TB_REPO", "u"}, {"TB_BOARD", "b"}, {"TB_ATTACH_MODE", "overlay"}}).has_value());
    EXPECT_FALSE(parse_request({{"TB_REPO", "u"}, {"TB_BOARD", "../etc"}}).has_value());
}

TEST(capture_environment, splitsAtFirstEquals) {
    const char *envp[] = {"TB_BOARD=pi", "TB_CUSTOM_CMD=make FOO=1", "BROKEN", nullptr};
    auto env = capture_environment(envp);
    EXPECT_EQ(env.at("TB_BOARD"), "pi");
    EXPECT_EQ(env.at("TB_CUSTOM_CMD"), "make FOO=1");
    EXPECT_EQ(env.count("BROKEN"), 0u);
}

TEST(apply_env_file, environmentWins) {
    test::TempDir tmp;
    test::write_file(tmp / "build.env", "TB_REPO=https://example.com/os.git\nTB_BOARD=from-file\n");
    auto env = apply_env_file({{"TB_BOARD", "from-env"}}, tmp / "build.env");
    ASSERT_TRUE(env.has_value()) << env.error().message;
    EXPECT_EQ(env->at("TB_REPO"), "https://example.com/os.git");
    EXPECT_EQ(env->at("TB_BOARD"), "from-env");
}

TEST(apply_env_file, missingFileIsConfigurationError) {
    test::TempDir tmp;
    auto env = apply_env_file({}, tmp / "absent.env");
    ASSERT_FALSE(env.has_value());
    EXPECT_EQ(env.error().kind, ErrorKind::Configuration);
}

} // namespace boardbuild
