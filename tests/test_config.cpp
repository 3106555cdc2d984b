#include <gtest/gtest.h>
#include <core/config.hpp>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

TEST(Config, EmptyTextGivesDefaults) {
    auto r = Config::parse("");
    ASSERT_TRUE(r.is_ok());
    const Settings& s = r.value.settings();
    EXPECT_EQ(s.poll_interval_ms, 5);
    EXPECT_EQ(s.wait_strategy, WaitStrategy::BUSY_POLL);
    EXPECT_EQ(s.send_helper, "sz");
    EXPECT_EQ(s.receive_helper, "rz");
    ASSERT_EQ(s.receive_helper_args.size(), 1u);
    EXPECT_EQ(s.receive_helper_args[0], "-y");
    EXPECT_EQ(s.ssh_options.size(), 3u);
    EXPECT_TRUE(r.value.hosts().empty());
}

TEST(Config, ParsesSettings) {
    auto r = Config::parse(R"(
settings:
  poll_interval_ms: 20
  wait_strategy: readiness
  term: vt100
  receive_helper_args: ["-y", "-b"]
  send_helper_args: -e
  upload_picker: zenity --file-selection
  download_dir: ~/Downloads
)");
    ASSERT_TRUE(r.is_ok()) << r.error.message;
    const Settings& s = r.value.settings();
    EXPECT_EQ(s.poll_interval_ms, 20);
    EXPECT_EQ(s.wait_strategy, WaitStrategy::READINESS);
    EXPECT_EQ(s.term, "vt100");
    EXPECT_EQ(s.receive_helper_args.size(), 2u);
    ASSERT_EQ(s.send_helper_args.size(), 1u);
    EXPECT_EQ(s.send_helper_args[0], "-e");
    EXPECT_EQ(s.upload_picker, "zenity --file-selection");
    EXPECT_EQ(s.download_dir, "~/Downloads");
}

TEST(Config, ParsesHosts) {
    auto r = Config::parse(R"(
hosts:
  web:
    host: web.example.org
    user: deploy
    password: secret
  db:
    host: db.example.org
    port: 2222
    user: admin
    key: ~/.ssh/db_key
    password: fallback
    backend: async
  lab:
    host: lab.example.org
    user: me
)");
    ASSERT_TRUE(r.is_ok()) << r.error.message;
    ASSERT_EQ(r.value.hosts().size(), 3u);

    const HostEntry* web = r.value.find_host("web");
    ASSERT_NE(web, nullptr);
    EXPECT_TRUE(std::holds_alternative<PasswordCredential>(web->target.credential));
    EXPECT_EQ(web->backend, TransportBackend::LIBRARY);

    const HostEntry* db = r.value.find_host("db");
    ASSERT_NE(db, nullptr);
    EXPECT_EQ(db->target.port, 2222);
    EXPECT_EQ(db->backend, TransportBackend::ASYNC);
    auto* key = std::get_if<KeyFileCredential>(&db->target.credential);
    ASSERT_NE(key, nullptr);
    EXPECT_EQ(key->path, "~/.ssh/db_key");
    ASSERT_TRUE(key->fallback_secret.has_value());
    EXPECT_EQ(*key->fallback_secret, "fallback");

    const HostEntry* lab = r.value.find_host("lab");
    ASSERT_NE(lab, nullptr);
    EXPECT_TRUE(std::holds_alternative<AgentCredential>(lab->target.credential));

    EXPECT_EQ(r.value.find_host("missing"), nullptr);
}

TEST(Config, MalformedYamlIsConfigError) {
    auto r = Config::parse("hosts: [unclosed");
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error.kind, ErrorKind::CONFIG);
}

TEST(Config, UnknownAuthIsConfigError) {
    auto r = Config::parse("hosts:\n  x:\n    host: h\n    user: u\n    auth: kerberos\n");
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error.kind, ErrorKind::CONFIG);
}

TEST(Config, UnknownWaitStrategyIsConfigError) {
    EXPECT_TRUE(Config::parse("settings:\n  wait_strategy: sometimes\n").is_err());
}

class ConfigFileTest : public ::testing::Test {
protected:
    fs::path dir_;

    void SetUp() override {
        dir_ = fs::temp_directory_path() / "rzterm_test_config";
        fs::remove_all(dir_);
        fs::create_directories(dir_);
    }

    void TearDown() override {
        fs::remove_all(dir_);
    }
};

TEST_F(ConfigFileTest, MissingFileGivesDefaults) {
    auto r = Config::load(dir_ / "nope.yaml");
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value.settings().term, "xterm-256color");
}

TEST_F(ConfigFileTest, LoadsFromDisk) {
    std::ofstream(dir_ / "config.yaml") << "settings:\n  connect_timeout_secs: 7\n";
    auto r = Config::load(dir_ / "config.yaml");
    ASSERT_TRUE(r.is_ok()) << r.error.message;
    EXPECT_EQ(r.value.settings().connect_timeout_secs, 7);
}
