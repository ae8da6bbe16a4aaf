#include "ConnectionProfile.hpp"
#include "TestHeaders.hpp"

using namespace td;
using Catch::Matchers::ContainsSubstring;

namespace {
LoginForm makeForm() {
  LoginForm form;
  form.tunnelUrl = "https://abc.trycloudflare.com";
  form.username = "admin";
  form.password = "";
  form.width = "1920";
  form.height = "1080";
  return form;
}
}  // namespace

TEST_CASE("Login form builds a profile for the local proxy",
          "[ConnectionProfile]") {
  auto request = buildClientConnectRequest(makeForm(), 13389);
  REQUIRE(request.tunnelUrl == "https://abc.trycloudflare.com");
  REQUIRE(request.profile.hostname == "localhost");
  REQUIRE(request.profile.username == "admin");
  REQUIRE(request.profile.password.empty());
  REQUIRE(request.profile.width == 1920);
  REQUIRE(request.profile.height == 1080);
  REQUIRE(request.profile.proxyPort == 13389);
  REQUIRE(request.profile.serverAddr() == "localhost:13389");
}

TEST_CASE("Tunnel URL is trimmed and given a scheme", "[ConnectionProfile]") {
  auto form = makeForm();
  form.tunnelUrl = "  abc.trycloudflare.com \n";
  form.username = " admin ";
  auto request = buildClientConnectRequest(form, 13389);
  REQUIRE(request.tunnelUrl == "https://abc.trycloudflare.com");
  REQUIRE(request.profile.username == "admin");

  REQUIRE(normalizeTunnelUrl("http://host") == "http://host");
  REQUIRE(normalizeTunnelUrl("") == "");
}

TEST_CASE("Invalid login forms are rejected", "[ConnectionProfile]") {
  auto form = makeForm();
  form.tunnelUrl = " ";
  REQUIRE_THROWS_WITH(buildClientConnectRequest(form, 13389),
                      ContainsSubstring("Tunnel URL"));

  form = makeForm();
  form.username = "";
  REQUIRE_THROWS_WITH(buildClientConnectRequest(form, 13389),
                      ContainsSubstring("Username"));

  form = makeForm();
  form.width = "wide";
  REQUIRE_THROWS_WITH(buildClientConnectRequest(form, 13389),
                      ContainsSubstring("Width must be a number"));

  form = makeForm();
  form.height = "0";
  REQUIRE_THROWS_WITH(buildClientConnectRequest(form, 13389),
                      ContainsSubstring("Height is out of range"));

  form = makeForm();
  form.height = "";
  REQUIRE_THROWS_WITH(buildClientConnectRequest(form, 13389),
                      ContainsSubstring("Height is required"));

  REQUIRE_THROWS_AS(buildClientConnectRequest(makeForm(), 0),
                    ProfileValidationException);
}

TEST_CASE("Server address is deterministic", "[ConnectionProfile]") {
  ConnectionProfile profile;
  profile.username = "admin";
  profile.proxyPort = 3390;
  REQUIRE(profile.serverAddr() == "localhost:3390");
  REQUIRE(profile.serverAddr() == profile.serverAddr());
  REQUIRE(profile.getEndpoint() == SocketEndpoint("localhost", 3390));
}

TEST_CASE("Serialized profiles never contain the password",
          "[ConnectionProfile]") {
  ConnectionProfile profile;
  profile.username = "admin";
  profile.password = "hunter2";
  profile.width = 1280;
  profile.height = 720;

  json j = profile.toJson();
  REQUIRE_FALSE(j.contains("password"));
  REQUIRE(j.dump().find("hunter2") == string::npos);

  ConnectionProfile loaded = ConnectionProfile::fromJson(j);
  REQUIRE(loaded.password.empty());
  REQUIRE(loaded.serverAddr() == profile.serverAddr());
  profile.password.clear();
  REQUIRE(loaded == profile);
}

TEST_CASE("Profiles load defaults and reject bad values",
          "[ConnectionProfile]") {
  json j;
  j["username"] = "bob";
  ConnectionProfile loaded = ConnectionProfile::fromJson(j);
  REQUIRE(loaded.hostname == "localhost");
  REQUIRE(loaded.width == 1920);
  REQUIRE(loaded.height == 1080);
  REQUIRE(loaded.proxyPort == DEFAULT_CLIENT_PROXY_PORT);

  j["proxy_port"] = 70000;
  REQUIRE_THROWS_AS(ConnectionProfile::fromJson(j),
                    ProfileValidationException);

  j["proxy_port"] = "not a port";
  REQUIRE_THROWS_AS(ConnectionProfile::fromJson(j),
                    ProfileValidationException);
}

TEST_CASE("Profiles save and load from disk", "[ConnectionProfile]") {
  string dirPattern = GetTempDirectory() + string("td_profile_XXXXXXXX");
  string dir = string(mkdtemp(&dirPattern[0]));
  string path = dir + "/profile.json";

  ConnectionProfile profile;
  profile.username = "admin";
  profile.password = "secret";
  profile.width = 800;
  profile.height = 600;
  profile.save(path);

  std::ifstream in(path);
  string contents((std::istreambuf_iterator<char>(in)),
                  std::istreambuf_iterator<char>());
  REQUIRE(contents.find("secret") == string::npos);

  ConnectionProfile loaded = ConnectionProfile::load(path);
  REQUIRE(loaded.username == "admin");
  REQUIRE(loaded.width == 800);
  REQUIRE(loaded.password.empty());

  fs::remove_all(dir);
}
