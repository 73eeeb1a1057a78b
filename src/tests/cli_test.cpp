#include <gtest/gtest.h>
#include <filesystem>
#include <sstream>
#include "cli/cli.hpp"
#include "test_utils.hpp"

using vault::cli::CLI;
using vault::store::Store;

class CLITest : public ::testing::Test {
protected:
    void SetUp() override {
        init_logging(boost::log::trivial::fatal);
        test_dir = make_test_dir("cli_test");
        store = std::make_unique<Store>(test_config(test_dir));
    }

    void TearDown() override {
        store.reset();
        std::filesystem::remove_all(test_dir);
    }

    // Runs a whole session and returns everything printed
    std::string run_session(const std::string& script) {
        std::istringstream in(script);
        std::ostringstream out;
        CLI shell(*store, in, out);
        shell.run();
        return out.str();
    }

    std::filesystem::path test_dir;
    std::unique_ptr<Store> store;
};

TEST_F(CLITest, PutGetRemove) {
    auto output = run_session(
        "put project/p1 {\"name\": \"demo\"}\n"
        "get project/p1\n"
        "rm project/p1\n"
        "get project/p1\n"
        "quit\n");

    EXPECT_NE(output.find("Stored project/p1"), std::string::npos);
    EXPECT_NE(output.find("\"name\": \"demo\""), std::string::npos);
    EXPECT_NE(output.find("Removed project/p1"), std::string::npos);
    EXPECT_NE(output.find("Not found: project/p1"), std::string::npos);
    EXPECT_FALSE(store->has({"project", "p1"}));
}

TEST_F(CLITest, ListsKeys) {
    store->write({"session", "a"}, 1);
    store->write({"session", "b"}, 2);
    store->write({"other"}, 3);

    auto output = run_session("ls session\n");
    EXPECT_NE(output.find("session/a"), std::string::npos);
    EXPECT_NE(output.find("session/b"), std::string::npos);
    EXPECT_EQ(output.find("other"), std::string::npos);
    EXPECT_NE(output.find("2 records"), std::string::npos);
}

TEST_F(CLITest, ReportsErrorsWithoutExiting) {
    auto output = run_session(
        "put bad/key not-json\n"
        "get ../escape\n"
        "migrate\n"
        "frobnicate\n"
        "help\n");

    EXPECT_NE(output.find("Invalid JSON"), std::string::npos);
    EXPECT_NE(output.find("Error reading record"), std::string::npos);
    EXPECT_NE(output.find("Migration unavailable"), std::string::npos);
    EXPECT_NE(output.find("Unknown command"), std::string::npos);
    EXPECT_NE(output.find("Available commands:"), std::string::npos);
}

TEST_F(CLITest, QuitStopsProcessing) {
    CLI shell(*store);
    EXPECT_TRUE(shell.execute(""));
    EXPECT_FALSE(shell.execute("quit"));

    auto output = run_session("quit\nput after/quit 1\n");
    EXPECT_FALSE(store->has({"after", "quit"}));
    EXPECT_EQ(output.find("Stored"), std::string::npos);
}

TEST_F(CLITest, KeygenAndLocks) {
    auto output = run_session("keygen\nlocks\n");
    EXPECT_NE(output.find(vault::config::ENCRYPTION_KEY_ENV), std::string::npos);
    EXPECT_NE(output.find("No locks held"), std::string::npos);
}
