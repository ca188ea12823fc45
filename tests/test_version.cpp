#include <agentlink/version.hpp>
#include <gtest/gtest.h>

TEST(VersionTest, VersionString)
{
    std::string version = agentlink::version_string();
    EXPECT_FALSE(version.empty());
    std::string expected = std::to_string(agentlink::VERSION_MAJOR) + "." +
                           std::to_string(agentlink::VERSION_MINOR) + "." +
                           std::to_string(agentlink::VERSION_PATCH);
    EXPECT_EQ(version, expected);
}

TEST(VersionTest, VersionConstants)
{
    EXPECT_GE(agentlink::VERSION_MAJOR, 0);
    EXPECT_GE(agentlink::VERSION_MINOR, 0);
    EXPECT_GE(agentlink::VERSION_PATCH, 0);
}
