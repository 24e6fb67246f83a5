#include "ServerConfig.h"

#include <gtest/gtest.h>

#include <stdexcept>

using relaychat::ServerConfig;

TEST(ServerConfigTest, Defaults) {
    const char* argv[] = {"relaychat_server"};
    const auto config = ServerConfig::from_args(1, argv);
    EXPECT_EQ(config.host, "localhost");
    EXPECT_EQ(config.port, 12345);
    EXPECT_EQ(config.log_dir.string(), "server_logs");
    EXPECT_GE(config.worker_threads(), 1u);
}

TEST(ServerConfigTest, PositionalOverrides) {
    const char* argv[] = {"relaychat_server", "0.0.0.0", "9000", "/tmp/chat"};
    const auto config = ServerConfig::from_args(4, argv);
    EXPECT_EQ(config.host, "0.0.0.0");
    EXPECT_EQ(config.port, 9000);
    EXPECT_EQ(config.log_dir.string(), "/tmp/chat");
}

TEST(ServerConfigTest, BadPortThrows) {
    const char* not_a_number[] = {"relaychat_server", "localhost", "http"};
    EXPECT_THROW(ServerConfig::from_args(3, not_a_number), std::invalid_argument);

    const char* too_big[] = {"relaychat_server", "localhost", "70000"};
    EXPECT_THROW(ServerConfig::from_args(3, too_big), std::invalid_argument);

    const char* trailing[] = {"relaychat_server", "localhost", "80x"};
    EXPECT_THROW(ServerConfig::from_args(3, trailing), std::invalid_argument);
}

TEST(ServerConfigTest, TooManyArgumentsThrows) {
    const char* argv[] = {"relaychat_server", "a", "1", "b", "c"};
    EXPECT_THROW(ServerConfig::from_args(5, argv), std::invalid_argument);
}
