// Copyright (c) 2024 liudegui. MIT License.
// Tests for sqlcred::CredentialManager.

#include <catch2/catch_test_macros.hpp>
#include <chrono>
#include <cstdio>
#include <cstring>
#include <string>
#include <thread>
#include <vector>

#include <unistd.h>

#include "fake_backend.hpp"
#include "sqlcred/sqlcred.hpp"

using namespace sqlcred;

using test::FakeBackend;
using test::FakeServer;

using FakeManager = CredentialManager<FakeBackend>;

static Settings FakeSettings() {
  return {{"connection_url", "fake://{{username}}:{{password}}"},
          {"username", "root"},
          {"password", "old"}};
}

static FakeServer& ResetServer() {
  FakeServer::Instance().Reset();
  return FakeServer::Instance();
}

static std::chrono::system_clock::time_point InOneHour() {
  return std::chrono::system_clock::now() + std::chrono::hours(1);
}

static Statements MySqlStatements() {
  Statements s;
  s.creation.push_back(
      "CREATE USER '{{name}}'@'%' IDENTIFIED BY '{{password}}';"
      "GRANT SELECT ON *.* TO '{{name}}'@'%';");
  return s;
}

// ---------------------------------------------------------------------------
// CreateUser
// ---------------------------------------------------------------------------

TEST_CASE("CredentialManager: type and policy", "[credential_manager]") {
  FakeManager current;
  REQUIRE(std::strcmp(current.Type(), "fake") == 0);
  REQUIRE(current.Policy().username_len == 32);

  FakeManager legacy(kLegacyUsernamePolicy);
  REQUIRE(legacy.Policy().username_len == 16);
  REQUIRE(legacy.Policy().display_name_len == kNoneLength);

  Sqlite3CredentialManager lite;
  REQUIRE(std::strcmp(lite.Type(), "sqlite3") == 0);
}

TEST_CASE("CredentialManager: initialize rejects bad config", "[credential_manager]") {
  ResetServer();
  FakeManager mgr;
  auto err = mgr.Initialize({{"username", "root"}}, false);
  REQUIRE(err.code == ErrorCode::kConfiguration);

  std::string user, pass;
  err = mgr.CreateUser(Context::Background(), MySqlStatements(), {"app", "ro"},
                       InOneHour(), &user, &pass);
  REQUIRE(err.code == ErrorCode::kNotInitialized);
}

TEST_CASE("CredentialManager: create falls back for unsupported prepare",
          "[credential_manager]") {
  auto& server = ResetServer();
  server.FailPrepare("CREATE USER", test::kFakeUnsupportedPs);

  FakeManager mgr;
  REQUIRE(mgr.Initialize(FakeSettings(), false).ok());

  std::string user, pass;
  auto err = mgr.CreateUser(Context::Background(), MySqlStatements(),
                            {"app", "ro"}, InOneHour(), &user, &pass);
  REQUIRE(err.ok());
  REQUIRE(user.compare(0, 9, "v-app-ro-") == 0);
  REQUIRE(user.size() <= 32);
  REQUIRE(pass.size() == 20);

  const std::string create =
      "CREATE USER '" + user + "'@'%' IDENTIFIED BY '" + pass + "'";
  const std::string grant = "GRANT SELECT ON *.* TO '" + user + "'@'%'";

  std::vector<std::string> expected = {
      "open:fake://root:old", "begin",
      "prepare:" + create,    "direct:" + create,
      "prepare:" + grant,     "exec:" + grant,
      "commit"};
  REQUIRE(server.Events() == expected);
  REQUIRE(server.Committed() == std::vector<std::string>{create, grant});
}

TEST_CASE("CredentialManager: create renders the expiration", "[credential_manager]") {
  auto& server = ResetServer();
  FakeManager mgr;
  REQUIRE(mgr.Initialize(FakeSettings(), true).ok());

  Statements s;
  s.creation.push_back(
      "CREATE USER '{{name}}'@'%' IDENTIFIED BY '{{password}}' "
      "COMMENT '{{expiration}} {{unknown}}'");

  std::string user, pass;
  REQUIRE(mgr.CreateUser(Context::Background(), s, {"", ""},
                         std::chrono::system_clock::from_time_t(0), &user, &pass)
              .ok());
  auto committed = server.Committed();
  REQUIRE(committed.size() == 1);
  REQUIRE(committed[0].find("COMMENT '1970-01-01 00:00:00+0000 {{unknown}}'") !=
          std::string::npos);
}

TEST_CASE("CredentialManager: empty creation batch touches nothing",
          "[credential_manager]") {
  auto& server = ResetServer();
  FakeManager mgr;
  REQUIRE(mgr.Initialize(FakeSettings(), false).ok());

  std::string user = "stale", pass = "stale";
  auto err = mgr.CreateUser(Context::Background(), Statements{}, {"app", "ro"},
                            InOneHour(), &user, &pass);
  REQUIRE(err.code == ErrorCode::kEmptyStatement);
  REQUIRE(user.empty());
  REQUIRE(pass.empty());

  Statements blank;
  blank.creation = {"  ", " ; ;\n"};
  err = mgr.CreateUser(Context::Background(), blank, {"app", "ro"}, InOneHour(),
                       &user, &pass);
  REQUIRE(err.code == ErrorCode::kEmptyStatement);

  REQUIRE(server.Events().empty());
}

TEST_CASE("CredentialManager: failing statement commits nothing",
          "[credential_manager]") {
  auto& server = ResetServer();
  server.FailExec("GRANT", test::kFakeSyntaxError);

  FakeManager mgr;
  REQUIRE(mgr.Initialize(FakeSettings(), false).ok());

  std::string user, pass;
  auto err = mgr.CreateUser(Context::Background(), MySqlStatements(),
                            {"app", "ro"}, InOneHour(), &user, &pass);
  REQUIRE(err.code == ErrorCode::kStatement);
  REQUIRE(err.native_code == test::kFakeSyntaxError);
  REQUIRE(user.empty());
  REQUIRE(pass.empty());
  REQUIRE(server.Committed().empty());
  REQUIRE(server.Events().back() == "rollback");
  REQUIRE(server.CountEvents("commit") == 0);
}

TEST_CASE("CredentialManager: commit failure rolls back", "[credential_manager]") {
  auto& server = ResetServer();
  server.FailCommit(true);

  FakeManager mgr;
  REQUIRE(mgr.Initialize(FakeSettings(), false).ok());

  std::string user, pass;
  auto err = mgr.CreateUser(Context::Background(), MySqlStatements(),
                            {"app", "ro"}, InOneHour(), &user, &pass);
  REQUIRE(err.code == ErrorCode::kTransaction);
  REQUIRE(user.empty());
  REQUIRE(server.Committed().empty());

  auto events = server.Events();
  REQUIRE(events[events.size() - 2] == "commit");
  REQUIRE(events.back() == "rollback");
}

TEST_CASE("CredentialManager: cancelled context runs nothing", "[credential_manager]") {
  auto& server = ResetServer();
  FakeManager mgr;
  REQUIRE(mgr.Initialize(FakeSettings(), true).ok());

  Context ctx;
  ctx.Cancel();
  std::string user, pass;
  auto err = mgr.CreateUser(ctx, MySqlStatements(), {"app", "ro"}, InOneHour(),
                            &user, &pass);
  REQUIRE(err.code == ErrorCode::kCancelled);
  REQUIRE(server.CountEvents("begin") == 0);
  REQUIRE(server.Committed().empty());
}

TEST_CASE("CredentialManager: legacy profile keeps names short",
          "[credential_manager]") {
  ResetServer();
  FakeManager mgr(kLegacyUsernamePolicy);
  REQUIRE(mgr.Initialize(FakeSettings(), false).ok());

  std::string user, pass;
  REQUIRE(mgr.CreateUser(Context::Background(), MySqlStatements(),
                         {"token", "readonly"}, InOneHour(), &user, &pass)
              .ok());
  REQUIRE(user.size() == 16);
  REQUIRE(user.compare(0, 7, "v-read-") == 0);
}

TEST_CASE("CredentialManager: null outputs", "[credential_manager]") {
  FakeManager mgr;
  std::string user;
  auto err = mgr.CreateUser(Context::Background(), MySqlStatements(),
                            {"app", "ro"}, InOneHour(), &user, nullptr);
  REQUIRE(err.code == ErrorCode::kNullParam);
  REQUIRE(mgr.RotateRootCredentials(Context::Background(), {}, nullptr).code ==
          ErrorCode::kNullParam);
}

// ---------------------------------------------------------------------------
// RenewUser
// ---------------------------------------------------------------------------

TEST_CASE("CredentialManager: renew is a no-op", "[credential_manager]") {
  auto& server = ResetServer();
  FakeManager mgr;
  REQUIRE(mgr.Initialize(FakeSettings(), false).ok());

  auto err = mgr.RenewUser(Context::Background(), MySqlStatements(),
                           "v-app-ro-x", InOneHour());
  REQUIRE(err.ok());
  REQUIRE(server.Events().empty());
}

// ---------------------------------------------------------------------------
// RevokeUser
// ---------------------------------------------------------------------------

TEST_CASE("CredentialManager: revoke with default statements", "[credential_manager]") {
  auto& server = ResetServer();
  FakeManager mgr;
  REQUIRE(mgr.Initialize(FakeSettings(), false).ok());

  auto err = mgr.RevokeUser(Context::Background(), Statements{}, "v-app-ro-abc");
  REQUIRE(err.ok());

  std::vector<std::string> expected = {
      "open:fake://root:old", "begin",
      "direct:REVOKE ALL PRIVILEGES, GRANT OPTION FROM 'v-app-ro-abc'@'%'",
      "direct:DROP USER 'v-app-ro-abc'@'%'",
      "commit"};
  REQUIRE(server.Events() == expected);
  REQUIRE(server.Committed().size() == 2);
}

TEST_CASE("CredentialManager: revoke with configured statements",
          "[credential_manager]") {
  auto& server = ResetServer();
  FakeManager mgr;
  REQUIRE(mgr.Initialize(FakeSettings(), false).ok());

  Statements s;
  s.revocation.push_back("DROP USER IF EXISTS '{{name}}'@'%'");
  REQUIRE(mgr.RevokeUser(Context::Background(), s, "v-x").ok());
  REQUIRE(server.Committed() ==
          std::vector<std::string>{"DROP USER IF EXISTS 'v-x'@'%'"});
  REQUIRE(server.CountEvents("prepare:") == 0);
}

TEST_CASE("CredentialManager: revoke failure keeps the account", "[credential_manager]") {
  auto& server = ResetServer();
  server.FailExec("DROP USER", 1396);
  FakeManager mgr;
  REQUIRE(mgr.Initialize(FakeSettings(), false).ok());

  auto err = mgr.RevokeUser(Context::Background(), Statements{}, "v-x");
  REQUIRE(err.code == ErrorCode::kStatement);
  REQUIRE(err.native_code == 1396);
  REQUIRE(server.Committed().empty());
  REQUIRE(server.Events().back() == "rollback");
}

TEST_CASE("CredentialManager: revoke rejects empty username", "[credential_manager]") {
  auto& server = ResetServer();
  FakeManager mgr;
  REQUIRE(mgr.Initialize(FakeSettings(), false).ok());
  REQUIRE(mgr.RevokeUser(Context::Background(), Statements{}, "").code ==
          ErrorCode::kMisuse);
  REQUIRE(server.Events().empty());
}

// ---------------------------------------------------------------------------
// RotateRootCredentials
// ---------------------------------------------------------------------------

TEST_CASE("CredentialManager: rotate root with default statement",
          "[credential_manager]") {
  auto& server = ResetServer();
  FakeManager mgr;
  REQUIRE(mgr.Initialize(FakeSettings(), true).ok());

  ConnectionConfig cfg;
  auto err = mgr.RotateRootCredentials(Context::Background(), {}, &cfg);
  REQUIRE(err.ok());
  REQUIRE(cfg.username == "root");
  REQUIRE(cfg.password != "old");
  REQUIRE(cfg.password.size() == 20);
  REQUIRE(cfg.password.compare(0, 4, "A1a-") == 0);
  REQUIRE(cfg.ToSettings().at("password") == cfg.password);
  REQUIRE(mgr.Config().password == cfg.password);

  std::vector<std::string> expected = {
      "open:fake://root:old", "begin",
      "direct:ALTER USER 'root'@'%' IDENTIFIED BY '" + cfg.password + "'",
      "commit", "close"};
  REQUIRE(server.Events() == expected);

  // The next operation reconnects with the new password.
  REQUIRE(mgr.RevokeUser(Context::Background(), Statements{}, "v-x").ok());
  REQUIRE(server.CountEvents("open:fake://root:" + cfg.password) == 1);
}

TEST_CASE("CredentialManager: rotate needs root credentials", "[credential_manager]") {
  auto& server = ResetServer();
  FakeManager mgr;
  REQUIRE(mgr.Initialize({{"connection_url", "fake://{{username}}:{{password}}"},
                          {"password", "old"}},
                         false)
              .ok());

  ConnectionConfig cfg;
  auto err = mgr.RotateRootCredentials(Context::Background(), {}, &cfg);
  REQUIRE(err.code == ErrorCode::kConfiguration);
  REQUIRE(cfg.password == "old");
  REQUIRE(server.CountEvents("begin") == 0);
}

TEST_CASE("CredentialManager: rotate before initialize", "[credential_manager]") {
  FakeManager mgr;
  ConnectionConfig cfg;
  REQUIRE(mgr.RotateRootCredentials(Context::Background(), {}, &cfg).code ==
          ErrorCode::kNotInitialized);
}

TEST_CASE("CredentialManager: failed rotation keeps the old password",
          "[credential_manager]") {
  auto& server = ResetServer();
  server.FailExec("ALTER USER", 1396);
  FakeManager mgr;
  REQUIRE(mgr.Initialize(FakeSettings(), false).ok());

  ConnectionConfig cfg;
  auto err = mgr.RotateRootCredentials(
      Context::Background(),
      {"ALTER USER '{{username}}'@'localhost' IDENTIFIED BY '{{password}}'"}, &cfg);
  REQUIRE(err.code == ErrorCode::kStatement);
  REQUIRE(cfg.password == "old");
  REQUIRE(mgr.Config().password == "old");
  REQUIRE(server.CountEvents("close") == 0);
  REQUIRE(server.Events().back() == "rollback");
}

TEST_CASE("CredentialManager: rotation batch without SQL changes nothing",
          "[credential_manager]") {
  auto& server = ResetServer();
  FakeManager mgr;
  REQUIRE(mgr.Initialize(FakeSettings(), false).ok());

  ConnectionConfig cfg;
  auto err = mgr.RotateRootCredentials(Context::Background(), {"  ;  \n ; "}, &cfg);
  REQUIRE(err.code == ErrorCode::kEmptyStatement);
  REQUIRE(cfg.password == "old");
  REQUIRE(mgr.Config().password == "old");
  REQUIRE(server.Events().empty());
}

TEST_CASE("CredentialManager: revoke batch without SQL runs nothing",
          "[credential_manager]") {
  auto& server = ResetServer();
  FakeManager mgr;
  REQUIRE(mgr.Initialize(FakeSettings(), false).ok());

  Statements s;
  s.revocation.push_back(" ; ");
  REQUIRE(mgr.RevokeUser(Context::Background(), s, "v-x").code ==
          ErrorCode::kEmptyStatement);
  REQUIRE(server.Events().empty());
}

TEST_CASE("CredentialManager: close failure after rotation keeps the new password",
          "[credential_manager]") {
  auto& server = ResetServer();
  FakeManager mgr;
  REQUIRE(mgr.Initialize(FakeSettings(), true).ok());
  server.FailClose(true);

  ConnectionConfig cfg;
  auto err = mgr.RotateRootCredentials(Context::Background(), {}, &cfg);
  REQUIRE(err.code == ErrorCode::kConnection);
  REQUIRE(err.native_code == 2013);
  REQUIRE(cfg.password != "old");
  REQUIRE(mgr.Config().password == cfg.password);
  REQUIRE(server.Committed().size() == 1);
  REQUIRE(server.Events().back() == "close");

  // The stale handle is replaced with one opened with the new password.
  server.FailClose(false);
  REQUIRE(mgr.RevokeUser(Context::Background(), Statements{}, "v-x").ok());
  REQUIRE(server.CountEvents("open:fake://root:" + cfg.password) == 1);
}

// ---------------------------------------------------------------------------
// Exclusivity
// ---------------------------------------------------------------------------

TEST_CASE("CredentialManager: concurrent operations do not interleave",
          "[credential_manager]") {
  auto& server = ResetServer();
  server.SetExecHook([](const std::string&) {
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  });

  FakeManager mgr;
  REQUIRE(mgr.Initialize(FakeSettings(), false).ok());

  constexpr int kThreads = 4;
  std::vector<Error> results(kThreads);
  std::vector<std::thread> threads;
  for (int i = 0; i < kThreads; ++i) {
    threads.emplace_back([&mgr, &results, i]() {
      std::string user, pass;
      if (i % 2 == 0) {
        results[i] = mgr.CreateUser(Context::Background(), MySqlStatements(),
                                    {"app", "ro"}, InOneHour(), &user, &pass);
      } else {
        results[i] = mgr.RevokeUser(Context::Background(), Statements{},
                                    "v-gone-" + std::to_string(i));
      }
    });
  }
  for (auto& t : threads) { t.join(); }
  server.SetExecHook(nullptr);

  for (const auto& r : results) { REQUIRE(r.ok()); }

  // Each begin..commit window holds exactly one operation's statements.
  auto events = server.Events();
  bool in_tx = false;
  int transactions = 0;
  std::string window_user;
  for (const auto& e : events) {
    if (e == "begin") {
      REQUIRE_FALSE(in_tx);
      in_tx = true;
      window_user.clear();
      ++transactions;
    } else if (e == "commit") {
      REQUIRE(in_tx);
      in_tx = false;
    } else if (e.compare(0, 5, "exec:") == 0 ||
               e.compare(0, 7, "direct:") == 0) {
      REQUIRE(in_tx);
      size_t open = e.find('\'');
      size_t close = e.find('\'', open + 1);
      std::string user = e.substr(open + 1, close - open - 1);
      if (window_user.empty()) { window_user = user; }
      REQUIRE(user == window_user);
    }
  }
  REQUIRE_FALSE(in_tx);
  REQUIRE(transactions == kThreads);
}

// ---------------------------------------------------------------------------
// End to end on SQLite (transactional DDL)
// ---------------------------------------------------------------------------

namespace {

class TempDb {
 public:
  explicit TempDb(const char* tag)
      : path_("/tmp/sqlcred_" + std::string(tag) + "_" +
              std::to_string(static_cast<long>(::getpid())) + ".db") {
    std::remove(path_.c_str());
    Sqlite3Db db;
    REQUIRE(db.Open(path_.c_str()).ok());
    Error err;
    db.ExecDml(
        "CREATE TABLE accounts(name TEXT PRIMARY KEY, password TEXT, "
        "expires TEXT);", &err);
    REQUIRE(err.ok());
    db.ExecDml("CREATE TABLE grants(name TEXT, privilege TEXT);", &err);
    REQUIRE(err.ok());
    db.ExecDml("CREATE TABLE root_creds(username TEXT, password TEXT);", &err);
    REQUIRE(err.ok());
    db.ExecDml("INSERT INTO root_creds VALUES('root', 'old');", &err);
    REQUIRE(err.ok());
  }

  ~TempDb() { std::remove(path_.c_str()); }

  const std::string& Path() const { return path_; }

  Settings ManagerSettings() const {
    return {{"connection_url", path_}, {"username", "root"}, {"password", "old"}};
  }

  /// Run a scalar query on a fresh connection.
  int32_t Count(const std::string& sql) const {
    Sqlite3Db db;
    REQUIRE(db.Open(path_.c_str()).ok());
    Error err;
    int32_t n = db.ExecScalar(sql.c_str(), -1, &err);
    REQUIRE(err.ok());
    return n;
  }

  std::string RootPassword() const {
    Sqlite3Db db;
    REQUIRE(db.Open(path_.c_str()).ok());
    Error err;
    std::string password = db.ExecScalarText(
        "SELECT password FROM root_creds WHERE username='root';", "", &err);
    REQUIRE(err.ok());
    return password;
  }

 private:
  std::string path_;
};

Statements SqliteStatements() {
  Statements s;
  s.creation.push_back(
      "INSERT INTO accounts VALUES('{{name}}', '{{password}}', '{{expiration}}');"
      "INSERT INTO grants VALUES('{{name}}', 'SELECT');");
  s.revocation.push_back(
      "DELETE FROM grants WHERE name='{{name}}';"
      "DELETE FROM accounts WHERE name='{{name}}';");
  return s;
}

}  // namespace

TEST_CASE("CredentialManager: sqlite create, revoke, rotate", "[credential_manager][sqlite3]") {
  TempDb tmp("lifecycle");
  Sqlite3CredentialManager mgr;
  REQUIRE(mgr.Initialize(tmp.ManagerSettings(), true).ok());

  std::string user, pass;
  REQUIRE(mgr.CreateUser(Context::Background(), SqliteStatements(),
                         {"app", "ro"}, std::chrono::system_clock::from_time_t(0),
                         &user, &pass)
              .ok());
  REQUIRE(tmp.Count("SELECT count(*) FROM accounts WHERE name='" + user +
                    "' AND password='" + pass +
                    "' AND expires='1970-01-01 00:00:00+0000';") == 1);
  REQUIRE(tmp.Count("SELECT count(*) FROM grants WHERE name='" + user + "';") == 1);

  REQUIRE(mgr.RevokeUser(Context::Background(), SqliteStatements(), user).ok());
  REQUIRE(tmp.Count("SELECT count(*) FROM accounts;") == 0);
  REQUIRE(tmp.Count("SELECT count(*) FROM grants;") == 0);

  ConnectionConfig cfg;
  REQUIRE(mgr.RotateRootCredentials(
                 Context::Background(),
                 {"UPDATE root_creds SET password='{{password}}' "
                  "WHERE username='{{username}}'"},
                 &cfg)
              .ok());
  REQUIRE(cfg.password != "old");
  REQUIRE(tmp.RootPassword() == cfg.password);
  REQUIRE(mgr.Close().ok());
}

TEST_CASE("CredentialManager: sqlite batch is all or nothing", "[credential_manager][sqlite3]") {
  TempDb tmp("atomic");
  Sqlite3CredentialManager mgr;
  REQUIRE(mgr.Initialize(tmp.ManagerSettings(), false).ok());

  Statements s;
  s.creation = {
      "CREATE TABLE marker(x INTEGER)",
      "INSERT INTO accounts VALUES('{{name}}', '{{password}}', '{{expiration}}')",
      "INSERT INTO grants VALUES('{{name}}', 'SELECT')",
      "INSERT INTO no_such_table VALUES('{{name}}')"};

  std::string user, pass;
  auto err = mgr.CreateUser(Context::Background(), s, {"app", "ro"}, InOneHour(),
                            &user, &pass);
  REQUIRE(err.code == ErrorCode::kStatement);
  REQUIRE(user.empty());
  REQUIRE(tmp.Count("SELECT count(*) FROM accounts;") == 0);
  REQUIRE(tmp.Count("SELECT count(*) FROM grants;") == 0);
  REQUIRE(tmp.Count("SELECT count(*) FROM sqlite_master WHERE type='table';") == 3);
}

TEST_CASE("CredentialManager: sqlite cancel aborts a running creation",
          "[credential_manager][sqlite3]") {
  TempDb tmp("cancel");
  Sqlite3CredentialManager mgr;
  REQUIRE(mgr.Initialize(tmp.ManagerSettings(), false).ok());

  Statements s;
  s.creation = {
      "INSERT INTO accounts VALUES('{{name}}', '{{password}}', '{{expiration}}')",
      "WITH RECURSIVE c(x) AS (SELECT 1 UNION ALL SELECT x + 1 FROM c "
      "WHERE x < 2000000000) SELECT count(*) FROM c"};

  Context ctx;
  std::thread canceller([&ctx] {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    ctx.Cancel();
  });
  std::string user, pass;
  auto err = mgr.CreateUser(ctx, s, {"app", "ro"}, InOneHour(), &user, &pass);
  canceller.join();

  REQUIRE(err.code == ErrorCode::kCancelled);
  REQUIRE(user.empty());
  REQUIRE(tmp.Count("SELECT count(*) FROM accounts;") == 0);
}

TEST_CASE("CredentialManager: sqlite revoke with default statements fails cleanly",
          "[credential_manager][sqlite3]") {
  TempDb tmp("revoke_default");
  Sqlite3CredentialManager mgr;
  REQUIRE(mgr.Initialize(tmp.ManagerSettings(), false).ok());

  std::string user, pass;
  REQUIRE(mgr.CreateUser(Context::Background(), SqliteStatements(),
                         {"app", "ro"}, InOneHour(), &user, &pass)
              .ok());

  // REVOKE is MySQL syntax; SQLite rejects it and nothing changes.
  auto err = mgr.RevokeUser(Context::Background(), Statements{}, user);
  REQUIRE(err.code == ErrorCode::kStatement);
  REQUIRE(tmp.Count("SELECT count(*) FROM accounts;") == 1);
}

TEST_CASE("CredentialManager: sqlite rotation failure keeps stored password",
          "[credential_manager][sqlite3]") {
  TempDb tmp("rotate_fail");
  Sqlite3CredentialManager mgr;
  REQUIRE(mgr.Initialize(tmp.ManagerSettings(), false).ok());

  ConnectionConfig cfg;
  auto err = mgr.RotateRootCredentials(
      Context::Background(),
      {"UPDATE root_creds SET password='{{password}}' WHERE username='{{username}}'",
       "UPDATE missing SET x=1"},
      &cfg);
  REQUIRE(err.code == ErrorCode::kStatement);
  REQUIRE(cfg.password == "old");
  REQUIRE(tmp.RootPassword() == "old");
}
