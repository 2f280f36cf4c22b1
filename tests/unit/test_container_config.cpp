/**
 * @file test_container_config.cpp
 * @brief Unit tests for container configuration, mounts and the builder.
 */

#include "taskbox/core/container_config.hpp"
#include "taskbox/core/errors.hpp"

#include <gtest/gtest.h>

#include <limits>

using namespace taskbox::core;

class ContainerConfigTest : public ::testing::Test {
protected:
    ContainerBuilder builder_;

    void SetUp() override {
        builder_.WithImage("alpine:3.19").WithLimits(ResourceProfileResolver().Resolve("easy"));
    }
};

TEST_F(ContainerConfigTest, MinimalConfigBuilds) {
    ContainerConfig config = builder_.Build();
    EXPECT_EQ(config.image, "alpine:3.19");
    EXPECT_TRUE(config.command.empty());
    EXPECT_FALSE(config.name.has_value());
    EXPECT_EQ(config.EffectiveNetworkMode(), NetworkMode::NONE);
}

TEST_F(ContainerConfigTest, NetworkOverride) {
    ContainerConfig config = builder_.WithNetwork(NetworkMode::EXTERNAL).Build();
    EXPECT_EQ(config.limits.network_mode, NetworkMode::NONE);
    EXPECT_EQ(config.EffectiveNetworkMode(), NetworkMode::EXTERNAL);
}

TEST_F(ContainerConfigTest, MissingImageRejected) {
    EXPECT_THROW(ContainerBuilder().WithImage("  ")
                     .WithLimits(ResourceProfileResolver().Resolve("easy"))
                     .Build(),
                 ConfigError);
}

TEST_F(ContainerConfigTest, UnresolvedLimitsRejected) {
    EXPECT_THROW(ContainerBuilder().WithImage("alpine").Build(), ConfigError);
}

TEST_F(ContainerConfigTest, TinyMemoryRejected) {
    ResourceLimits limits = ResourceProfileResolver().Resolve("easy");
    limits.memory_bytes = 1024 * 1024;
    EXPECT_THROW(builder_.WithLimits(limits).Build(), ConfigError);
}

TEST_F(ContainerConfigTest, TimeoutBeyondMaximumRejected) {
    ResourceLimits limits = ResourceProfileResolver().Resolve("easy");
    limits.timeout = std::chrono::seconds(std::numeric_limits<std::int64_t>::max());
    EXPECT_THROW(builder_.WithLimits(limits).Build(), ConfigError);

    limits.timeout = kMaxTimeout;
    EXPECT_NO_THROW(ContainerBuilder(builder_).WithLimits(limits).Build());
}

TEST_F(ContainerConfigTest, InvalidEnvironmentKeyRejected) {
    EXPECT_THROW(builder_.WithEnvironment("1ABC", "x").Build(), ConfigError);
}

TEST_F(ContainerConfigTest, EnvironmentKeyWithSpaceRejected) {
    EXPECT_THROW(builder_.WithEnvironment("MY VAR", "x").Build(), ConfigError);
}

TEST_F(ContainerConfigTest, RelativeMountTargetRejected) {
    EXPECT_THROW(builder_.WithMount("/host", "relative").Build(), ConfigError);
}

TEST_F(ContainerConfigTest, DuplicateMountTargetRejected) {
    EXPECT_THROW(builder_.WithMount("/a", "/data").WithReadOnlyMount("/b", "/data").Build(),
                 ConfigError);
}

TEST_F(ContainerConfigTest, InvalidNameRejected) {
    EXPECT_THROW(builder_.WithName("-leading-dash").Build(), ConfigError);
    EXPECT_THROW(ContainerBuilder(builder_).WithName("has space").Build(), ConfigError);
}

TEST_F(ContainerConfigTest, RelativeWorkingDirRejected) {
    EXPECT_THROW(builder_.WithWorkingDir("work").Build(), ConfigError);
}

TEST_F(ContainerConfigTest, FullConfigBuilds) {
    ContainerConfig config = builder_
        .WithCommand({"python3", "-c", "print(1)"})
        .WithEnvironment("PYTHONUNBUFFERED", "1")
        .WithReadOnlyMount("/srv/task", "/task")
        .WithName("grader_17.run-2")
        .WithWorkingDir("/task")
        .WithUser("nobody")
        .WithLabel("job", "17")
        .Build();

    EXPECT_EQ(config.command.size(), 3u);
    EXPECT_EQ(config.environment.at("PYTHONUNBUFFERED"), "1");
    ASSERT_EQ(config.mounts.size(), 1u);
    EXPECT_TRUE(config.mounts[0].read_only);
    EXPECT_EQ(*config.name, "grader_17.run-2");
    EXPECT_EQ(config.labels.at("job"), "17");
}

TEST(VolumeMountTest, ParseAndFormat) {
    VolumeMount rw = VolumeMount::Parse("/host/data:/data");
    EXPECT_EQ(rw.host_path, "/host/data");
    EXPECT_EQ(rw.container_path, "/data");
    EXPECT_FALSE(rw.read_only);
    EXPECT_EQ(rw.ToBindString(), "/host/data:/data");

    VolumeMount ro = VolumeMount::Parse("/host/task:/task:ro");
    EXPECT_TRUE(ro.read_only);
    EXPECT_EQ(ro.ToBindString(), "/host/task:/task:ro");

    EXPECT_FALSE(VolumeMount::Parse("/a:/b:rw").read_only);
}

TEST(VolumeMountTest, MalformedSpecsRejected) {
    EXPECT_THROW(VolumeMount::Parse("/only-host"), ConfigError);
    EXPECT_THROW(VolumeMount::Parse(":/data"), ConfigError);
    EXPECT_THROW(VolumeMount::Parse("/host:"), ConfigError);
    EXPECT_THROW(VolumeMount::Parse("/a:/b:rx"), ConfigError);
    EXPECT_THROW(VolumeMount::Parse("/a:/b:ro:extra"), ConfigError);
}
