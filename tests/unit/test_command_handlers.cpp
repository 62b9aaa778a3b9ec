#include "TestFixtures.hpp"
#include "emulator-server/Base64.hpp"
#include "emulator-server/server/CommandHandlers.hpp"

#include <fstream>
#include <gtest/gtest.h>

using namespace emuserver;
using namespace emuserver::server;
using emuserver::test::FakeProcessExecutor;
using emuserver::test::make_result;
using nlohmann::json;

namespace {

const char *LOGIN_XML =
    "<?xml version='1.0' encoding='UTF-8' standalone='yes' ?>"
    "<hierarchy rotation=\"0\">"
    "<node index=\"0\" text=\"Sign in\" resource-id=\"com.example:id/login\""
    " class=\"android.widget.Button\" package=\"com.example\" content-desc=\"\""
    " clickable=\"true\" enabled=\"true\" bounds=\"[100,200][300,260]\" />"
    "<node index=\"1\" text=\"Sign in\" resource-id=\"com.example:id/alt\""
    " class=\"android.widget.Button\" package=\"com.example\" content-desc=\"\""
    " clickable=\"true\" enabled=\"true\" bounds=\"[0,1000][200,1100]\" />"
    "<node index=\"2\" text=\"Help\" resource-id=\"\""
    " class=\"android.widget.TextView\" package=\"com.example\" content-desc=\"\""
    " clickable=\"false\" enabled=\"true\" bounds=\"\" />"
    "</hierarchy>";

// Responder writing `bytes` to the local destination of `adb pull`
FakeProcessExecutor::Responder pulled(std::string bytes) {
  return [bytes](const ipc::ProcessRequest &request) {
    std::ofstream ofs(request.args.back(), std::ios::binary | std::ios::trunc);
    ofs << bytes;
    return make_result("1 file pulled");
  };
}

} // namespace

class CommandHandlersTest : public test::DispatchTest {
protected:
  void SetUp() override {
    test::DispatchTest::SetUp();
    executor_.set_devices({{"emulator-5554", "device"}});
  }

  // Joined argument lists of the device shell commands issued so far
  std::vector<std::string> shell_commands() const {
    std::vector<std::string> out;
    for (const auto &line : executor_.command_lines()) {
      const std::string prefix = "-s emulator-5554 shell ";
      if (line.rfind(prefix, 0) == 0) {
        out.push_back(line.substr(prefix.size()));
      }
    }
    return out;
  }

  bool issued(const std::string &command) const {
    for (const auto &c : shell_commands()) {
      if (c == command)
        return true;
    }
    return false;
  }
};

TEST(InputEscapeTest, SpacesAndMetacharacters) {
  EXPECT_EQ(escape_input_text("hello world"), "hello%sworld");
  EXPECT_EQ(escape_input_text("it's"), "it\\'s");
  EXPECT_EQ(escape_input_text("a&b|c;d"), "a\\&b\\|c\\;d");
  EXPECT_EQ(escape_input_text("$(reboot)"), "\\$\\(reboot\\)");
  EXPECT_EQ(escape_input_text("plain"), "plain");
}

TEST(InputTextSplitTest, BreaksBetweenPercentAndS) {
  EXPECT_EQ(split_input_text("plain"), std::vector<std::string>{"plain"});
  EXPECT_EQ(split_input_text("50%sale"),
            (std::vector<std::string>{"50%", "sale"}));
  EXPECT_EQ(split_input_text("%s%s"),
            (std::vector<std::string>{"%", "s%", "s"}));
  EXPECT_EQ(split_input_text("100% sure"),
            std::vector<std::string>{"100% sure"});
}

TEST(KeyCodeTest, KnownKeys) {
  EXPECT_EQ(key_code("back").value_or(-1), 4);
  EXPECT_EQ(key_code("home").value_or(-1), 3);
  EXPECT_EQ(key_code("recent").value_or(-1), 187);
  EXPECT_EQ(key_code("menu").value_or(-1), 82);
  EXPECT_EQ(key_code("power").value_or(-1), 26);
  EXPECT_EQ(key_code("volume_up").value_or(-1), 24);
  EXPECT_EQ(key_code("volume_down").value_or(-1), 25);
  EXPECT_FALSE(key_code("launch_missiles").has_value());
}

TEST(GetpropTest, ParsesBracketedLines) {
  auto props = parse_getprop("[ro.product.model]: [sdk_gphone64_x86_64]\r\n"
                             "[ro.build.version.sdk]: [34]\n"
                             "garbage line\n"
                             "[empty.value]: []\n");
  EXPECT_EQ(props.size(), 3u);
  EXPECT_EQ(props["ro.product.model"], "sdk_gphone64_x86_64");
  EXPECT_EQ(props["ro.build.version.sdk"], "34");
  EXPECT_EQ(props["empty.value"], "");
}

TEST_F(CommandHandlersTest, ListDevices) {
  auto resp = call("list_devices");
  ASSERT_TRUE(resp["ok"].get<bool>()) << resp.dump();
  EXPECT_EQ(resp["result"]["count"], 1);
  EXPECT_EQ(resp["result"]["devices"][0]["serial"], "emulator-5554");
  EXPECT_EQ(resp["result"]["devices"][0]["details"]["model"],
            "sdk_gphone64_x86_64");
  EXPECT_FALSE(resp["result"].contains("selected"));
}

TEST_F(CommandHandlersTest, ListOperationsNeedsNoDevice) {
  executor_.set_devices({});
  auto resp = call("list_operations");
  ASSERT_TRUE(resp["ok"].get<bool>()) << resp.dump();
  EXPECT_EQ(resp["result"]["count"], registry_->size());
  EXPECT_EQ(executor_.call_count(), 0u);
}

TEST_F(CommandHandlersTest, DeviceInfo) {
  executor_.respond_stdout("shell getprop",
                           "[ro.product.model]: [sdk_gphone64_x86_64]\n"
                           "[ro.product.manufacturer]: [Google]\n"
                           "[ro.build.version.release]: [14]\n"
                           "[ro.build.version.sdk]: [34]\n"
                           "[ro.product.cpu.abi]: [x86_64]\n"
                           "[ro.kernel.qemu]: [1]\n");
  executor_.respond_stdout("shell wm size",
                           "Physical size: 1080x2400\nOverride size: 720x1600\n");

  auto resp = call("get_device_info");
  ASSERT_TRUE(resp["ok"].get<bool>()) << resp.dump();
  const auto &r = resp["result"];
  EXPECT_EQ(r["serial"], "emulator-5554");
  EXPECT_EQ(r["model"], "sdk_gphone64_x86_64");
  EXPECT_EQ(r["manufacturer"], "Google");
  EXPECT_EQ(r["android_version"], "14");
  EXPECT_EQ(r["sdk_version"], "34");
  EXPECT_EQ(r["cpu_abi"], "x86_64");
  EXPECT_EQ(r["is_emulator"], true);
  EXPECT_EQ(r["screen_size"]["width"], 720);
  EXPECT_EQ(r["screen_size"]["height"], 1600);
}

TEST_F(CommandHandlersTest, DeviceInfoWithoutScreenSize) {
  auto resp = call("get_device_info");
  ASSERT_TRUE(resp["ok"].get<bool>()) << resp.dump();
  EXPECT_TRUE(resp["result"]["screen_size"].is_null());
  EXPECT_TRUE(resp["result"]["model"].is_null());
  EXPECT_EQ(resp["result"]["is_emulator"], false);
}

TEST_F(CommandHandlersTest, ScreenshotReturnsPngAndCleansUp) {
  executor_.on("pull", pulled("\x89PNG"));

  auto resp = call("capture_screenshot");
  ASSERT_TRUE(resp["ok"].get<bool>()) << resp.dump();
  EXPECT_EQ(resp["result"]["mime_type"], "image/png");
  EXPECT_EQ(resp["result"]["encoding"], "base64");
  EXPECT_EQ(resp["result"]["size"], 4);
  auto bytes = base64_decode(resp["result"]["data"].get<std::string>());
  EXPECT_EQ(std::string(bytes.begin(), bytes.end()), "\x89PNG");

  auto cmds = shell_commands();
  ASSERT_GE(cmds.size(), 2u);
  EXPECT_EQ(cmds.front().rfind("screencap -p /data/local/tmp/emu-screen-", 0),
            0u);
  EXPECT_EQ(cmds.back().rfind("rm -f '/data/local/tmp/emu-screen-", 0), 0u);
  EXPECT_TRUE(temp_dir_.entries().empty());
}

TEST_F(CommandHandlersTest, ScreenshotSavedLocally) {
  executor_.on("pull", pulled("\x89PNG"));
  auto save = temp_dir_.file("shot.png");

  auto resp = call("capture_screenshot", {{"save_path", save}});
  ASSERT_TRUE(resp["ok"].get<bool>()) << resp.dump();
  std::ifstream ifs(save, std::ios::binary);
  std::string content((std::istreambuf_iterator<char>(ifs)),
                      std::istreambuf_iterator<char>());
  EXPECT_EQ(content, "\x89PNG");
}

TEST_F(CommandHandlersTest, RemoteScratchRemovedWhenPullFails) {
  executor_.respond_error("pull", 1, "adb: error: failed to stat remote object");
  auto resp = call("capture_screenshot");
  EXPECT_FALSE(resp["ok"].get<bool>());
  EXPECT_EQ(resp["error"]["kind"], "ProcessError");
  EXPECT_EQ(executor_.count_matching("shell rm -f '/data/local/tmp/emu-screen-"),
            1u);
}

TEST_F(CommandHandlersTest, UiHierarchyIsReturnedAsText) {
  executor_.on("pull", pulled(LOGIN_XML));
  auto resp = call("get_ui_hierarchy");
  ASSERT_TRUE(resp["ok"].get<bool>()) << resp.dump();
  EXPECT_EQ(resp["result"], LOGIN_XML);
  EXPECT_EQ(executor_.count_matching("shell uiautomator dump "), 1u);
}

TEST_F(CommandHandlersTest, UiDumpErrorIsReported) {
  executor_.respond_stdout("uiautomator dump",
                           "ERROR: could not get idle state.\n");
  auto resp = call("get_ui_hierarchy");
  EXPECT_FALSE(resp["ok"].get<bool>());
  EXPECT_EQ(resp["error"]["kind"], "ProcessError");
  EXPECT_EQ(executor_.count_matching(" pull "), 0u);
}

TEST_F(CommandHandlersTest, FindElementIsExact) {
  executor_.on("pull", pulled(LOGIN_XML));
  auto resp = call("find_element", {{"text", "Sign in"}});
  ASSERT_TRUE(resp["ok"].get<bool>()) << resp.dump();
  EXPECT_EQ(resp["result"]["matches"], 2);
  EXPECT_EQ(resp["result"]["elements"][1]["resource_id"], "com.example:id/alt");

  resp = call("find_element", {{"text", "Sign"}});
  ASSERT_TRUE(resp["ok"].get<bool>());
  EXPECT_EQ(resp["result"]["matches"], 0);
}

TEST_F(CommandHandlersTest, FindElementNeedsACriterion) {
  auto resp = call("find_element");
  EXPECT_FALSE(resp["ok"].get<bool>());
  EXPECT_EQ(resp["error"]["reason"], "missingParam");
  EXPECT_EQ(executor_.call_count(), 0u);
}

TEST_F(CommandHandlersTest, TapElementTapsCentre) {
  executor_.on("pull", pulled(LOGIN_XML));
  auto resp = call("tap_element",
                   {{"resource_id", "com.example:id/alt"}});
  ASSERT_TRUE(resp["ok"].get<bool>()) << resp.dump();
  EXPECT_EQ(resp["result"]["tapped"], true);
  EXPECT_EQ(resp["result"]["x"], 100);
  EXPECT_EQ(resp["result"]["y"], 1050);
  EXPECT_TRUE(issued("input tap 100 1050"));
}

TEST_F(CommandHandlersTest, TapElementIndexSelectsMatch) {
  executor_.on("pull", pulled(LOGIN_XML));
  auto resp = call("tap_element", {{"text", "Sign in"}, {"index", 1}});
  ASSERT_TRUE(resp["ok"].get<bool>()) << resp.dump();
  EXPECT_EQ(resp["result"]["matches"], 2);
  EXPECT_TRUE(issued("input tap 100 1050"));

  resp = call("tap_element", {{"text", "Sign in"}, {"index", 5}});
  ASSERT_TRUE(resp["ok"].get<bool>());
  EXPECT_EQ(resp["result"]["tapped"], false);
  EXPECT_TRUE(resp["result"].contains("reason"));
}

TEST_F(CommandHandlersTest, TapElementWithoutMatchDoesNotTap) {
  executor_.on("pull", pulled(LOGIN_XML));
  auto resp = call("tap_element", {{"text", "Nowhere"}});
  ASSERT_TRUE(resp["ok"].get<bool>()) << resp.dump();
  EXPECT_EQ(resp["result"]["matches"], 0);
  EXPECT_EQ(resp["result"]["tapped"], false);
  EXPECT_EQ(executor_.count_matching("input tap"), 0u);
}

TEST_F(CommandHandlersTest, TapElementWithoutBounds) {
  executor_.on("pull", pulled(LOGIN_XML));
  auto resp = call("tap_element", {{"text", "Help"}});
  ASSERT_TRUE(resp["ok"].get<bool>()) << resp.dump();
  EXPECT_EQ(resp["result"]["tapped"], false);
  EXPECT_EQ(resp["result"]["reason"], "element has no bounds");
  EXPECT_EQ(executor_.count_matching("input tap"), 0u);
}

TEST_F(CommandHandlersTest, TapCoordinates) {
  auto resp = call("tap_coordinates", {{"x", 540}, {"y", "1200"}});
  ASSERT_TRUE(resp["ok"].get<bool>()) << resp.dump();
  EXPECT_EQ(resp["result"], "Tapped at (540, 1200)");
  EXPECT_TRUE(issued("input tap 540 1200"));
}

TEST_F(CommandHandlersTest, NegativeCoordinatesAreRejected) {
  auto resp = call("tap_coordinates", {{"x", -5}, {"y", 10}});
  EXPECT_FALSE(resp["ok"].get<bool>());
  EXPECT_EQ(resp["error"]["reason"], "outOfRange");
  EXPECT_EQ(resp["error"]["field"], "x");
  EXPECT_EQ(executor_.call_count(), 0u);
}

TEST_F(CommandHandlersTest, SwipeUsesDefaultDuration) {
  auto resp = call("swipe", {{"start_x", 500},
                             {"start_y", 1500},
                             {"end_x", 500},
                             {"end_y", 300}});
  ASSERT_TRUE(resp["ok"].get<bool>()) << resp.dump();
  EXPECT_TRUE(issued("input swipe 500 1500 500 300 300"));
}

TEST_F(CommandHandlersTest, InputTextIsEscaped) {
  auto resp = call("input_text", {{"text", "hi there; rm"}});
  ASSERT_TRUE(resp["ok"].get<bool>()) << resp.dump();
  EXPECT_EQ(resp["result"], "Entered text: hi there; rm");
  EXPECT_TRUE(issued("input text hi%sthere\\;%srm"));
}

TEST_F(CommandHandlersTest, InputTextWithControlCharactersRunsNothing) {
  for (const std::string text : {"a\nreboot", "hi\ntouch\t/tmp/x", "a\rb"}) {
    auto resp = call("input_text", {{"text", text}});
    EXPECT_FALSE(resp["ok"].get<bool>());
    EXPECT_EQ(resp["error"]["reason"], "invalidValue");
    EXPECT_EQ(resp["error"]["field"], "text");
  }
  EXPECT_TRUE(executor_.calls().empty());
}

TEST_F(CommandHandlersTest, InputTextKeepsLiteralPercentS) {
  auto resp = call("input_text", {{"text", "50%sale"}});
  ASSERT_TRUE(resp["ok"].get<bool>()) << resp.dump();

  std::vector<std::string> typed;
  for (const auto &c : shell_commands()) {
    if (c.rfind("input text ", 0) == 0)
      typed.push_back(c);
  }
  ASSERT_EQ(typed.size(), 2u);
  EXPECT_EQ(typed[0], "input text 50%");
  EXPECT_EQ(typed[1], "input text sale");
}

TEST_F(CommandHandlersTest, EmptyInputTextIsRejected) {
  auto resp = call("input_text", {{"text", ""}});
  EXPECT_FALSE(resp["ok"].get<bool>());
  EXPECT_EQ(resp["error"]["reason"], "invalidValue");
  EXPECT_EQ(executor_.count_matching("input text"), 0u);
}

TEST_F(CommandHandlersTest, PressKey) {
  auto resp = call("press_key", {{"key", "back"}});
  ASSERT_TRUE(resp["ok"].get<bool>()) << resp.dump();
  EXPECT_EQ(resp["result"], "Pressed back key");
  EXPECT_TRUE(issued("input keyevent 4"));

  resp = call("press_key", {{"key", "explode"}});
  EXPECT_FALSE(resp["ok"].get<bool>());
  EXPECT_EQ(resp["error"]["reason"], "invalidValue");
}

TEST_F(CommandHandlersTest, InstallAppChecksLocalFileFirst) {
  auto resp = call("install_app", {{"apk_path", temp_dir_.file("nope.apk")}});
  EXPECT_FALSE(resp["ok"].get<bool>());
  EXPECT_EQ(resp["error"]["reason"], "invalidValue");
  EXPECT_EQ(resp["error"]["field"], "apk_path");
  EXPECT_EQ(executor_.call_count(), 0u);
}

TEST_F(CommandHandlersTest, InstallApp) {
  auto apk = temp_dir_.file("app.apk");
  {
    std::ofstream ofs(apk);
    ofs << "PK";
  }
  executor_.respond_stdout("install -r", "Performing Streamed Install\nSuccess\n");

  auto resp = call("install_app", {{"apk_path", apk}});
  ASSERT_TRUE(resp["ok"].get<bool>()) << resp.dump();
  EXPECT_NE(resp["result"].get<std::string>().find("Success"),
            std::string::npos);

  auto calls = executor_.calls();
  EXPECT_EQ(*calls.back().timeout, std::chrono::seconds(120));

  resp = call("install_app", {{"apk_path", apk}, {"timeout_s", 5}});
  ASSERT_TRUE(resp["ok"].get<bool>());
  EXPECT_EQ(*executor_.calls().back().timeout, std::chrono::seconds(5));
}

TEST_F(CommandHandlersTest, LaunchApp) {
  executor_.respond_stdout("monkey", "Events injected: 1\n");
  auto resp = call("launch_app", {{"package", "com.example.app"}});
  ASSERT_TRUE(resp["ok"].get<bool>()) << resp.dump();
  EXPECT_TRUE(issued(
      "monkey -p com.example.app -c android.intent.category.LAUNCHER 1"));
}

TEST_F(CommandHandlersTest, LaunchUnknownPackageFails) {
  executor_.respond_stdout("monkey",
                           "** No activities found to run, monkey aborted.\n");
  auto resp = call("launch_app", {{"package", "com.missing"}});
  EXPECT_FALSE(resp["ok"].get<bool>());
  EXPECT_EQ(resp["error"]["kind"], "ProcessError");
}

TEST_F(CommandHandlersTest, PackageNamesAreValidated) {
  auto resp = call("stop_app", {{"package", "com.example; reboot"}});
  EXPECT_FALSE(resp["ok"].get<bool>());
  EXPECT_EQ(resp["error"]["reason"], "invalidValue");
  EXPECT_EQ(executor_.call_count(), 0u);
}

TEST_F(CommandHandlersTest, StopAndClearApp) {
  ASSERT_TRUE(call("stop_app", {{"package", "com.example"}})["ok"].get<bool>());
  EXPECT_TRUE(issued("am force-stop com.example"));

  executor_.respond_stdout("pm clear", "Success\n");
  ASSERT_TRUE(call("clear_app_data", {{"package", "com.example"}})["ok"].get<bool>());
  EXPECT_TRUE(issued("pm clear com.example"));

  executor_.respond_stdout("pm clear", "Failed\n");
  EXPECT_FALSE(call("clear_app_data", {{"package", "com.example"}})["ok"].get<bool>());
}

TEST_F(CommandHandlersTest, ListPackagesSorted) {
  executor_.respond_stdout("pm list packages",
                           "package:com.zeta\npackage:com.alpha\r\n\n");
  auto resp = call("list_packages");
  ASSERT_TRUE(resp["ok"].get<bool>()) << resp.dump();
  EXPECT_EQ(resp["result"]["count"], 2);
  EXPECT_EQ(resp["result"]["packages"][0], "com.alpha");
  EXPECT_EQ(resp["result"]["packages"][1], "com.zeta");

  call("list_packages", {{"filter", "google"}});
  EXPECT_TRUE(issued("pm list packages 'google'"));
}

TEST_F(CommandHandlersTest, Proxy) {
  auto resp = call("setup_proxy", {{"host", "10.0.2.2"}, {"port", 8080}});
  ASSERT_TRUE(resp["ok"].get<bool>()) << resp.dump();
  EXPECT_TRUE(issued("settings put global http_proxy '10.0.2.2:8080'"));

  resp = call("setup_proxy", {{"host", "10.0.2.2"}, {"port", 70000}});
  EXPECT_FALSE(resp["ok"].get<bool>());
  EXPECT_EQ(resp["error"]["reason"], "outOfRange");

  ASSERT_TRUE(call("clear_proxy")["ok"].get<bool>());
  EXPECT_TRUE(issued("settings put global http_proxy :0"));
}

TEST_F(CommandHandlersTest, InstallCertificatePushesToDownloads) {
  auto cert = temp_dir_.file("mitm.pem");
  {
    std::ofstream ofs(cert);
    ofs << "-----BEGIN CERTIFICATE-----\n";
  }

  auto resp = call("install_certificate", {{"cert_path", cert}});
  ASSERT_TRUE(resp["ok"].get<bool>()) << resp.dump();
  EXPECT_NE(resp["result"].get<std::string>().find(
                "/sdcard/Download/ca_cert.crt"),
            std::string::npos);
  EXPECT_EQ(executor_.count_matching("push "), 1u);
  EXPECT_EQ(executor_.command_lines().back().substr(
                executor_.command_lines().back().rfind(' ') + 1),
            "/sdcard/Download/ca_cert.crt");
}

TEST_F(CommandHandlersTest, ExecuteShellReportsExitCode) {
  executor_.on("shell cat /nope",
               make_result("", 1, "cat: /nope: No such file or directory"));
  auto resp = call("execute_shell", {{"command", "cat /nope"}});
  ASSERT_TRUE(resp["ok"].get<bool>()) << resp.dump();
  EXPECT_EQ(resp["result"]["command"], "cat /nope");
  EXPECT_EQ(resp["result"]["exit_code"], 1);
  EXPECT_EQ(resp["result"]["stderr"], "cat: /nope: No such file or directory");
}

TEST_F(CommandHandlersTest, ExecuteShellDefaultsToLongerTimeout) {
  executor_.on("shell uptime", make_result("up 3 min\n"));
  ASSERT_TRUE(call("execute_shell", {{"command", "uptime"}})["ok"].get<bool>());
  EXPECT_EQ(*executor_.calls().back().timeout, std::chrono::seconds(60));

  ASSERT_TRUE(call("execute_shell", {{"command", "uptime"}, {"timeout_s", 5}})["ok"]
                  .get<bool>());
  EXPECT_EQ(*executor_.calls().back().timeout, std::chrono::seconds(5));
}

TEST_F(CommandHandlersTest, ExecuteShellRetriesWhenDeviceDropsOff) {
  executor_.on("shell echo hello", make_result("hello\n"));
  executor_.on_times("shell echo hello", 1,
                     make_result("", 1, "error: device offline"));

  auto resp = call("execute_shell", {{"command", "echo hello"}});
  ASSERT_TRUE(resp["ok"].get<bool>()) << resp.dump();
  EXPECT_EQ(resp["result"]["exit_code"], 0);
  EXPECT_EQ(resp["result"]["stdout"], "hello\n");
  EXPECT_EQ(executor_.count_matching("shell echo hello"), 2u);
}

TEST_F(CommandHandlersTest, PullFileInline) {
  executor_.on("pull", pulled("hello"));
  auto resp = call("pull_file", {{"remote_path", "/sdcard/notes.txt"}});
  ASSERT_TRUE(resp["ok"].get<bool>()) << resp.dump();
  EXPECT_EQ(resp["result"]["name"], "notes.txt");
  EXPECT_EQ(resp["result"]["mime_type"], "text/plain");
  EXPECT_EQ(resp["result"]["data"], "aGVsbG8=");
}

TEST_F(CommandHandlersTest, PullFileToLocalPath) {
  executor_.on("pull", pulled("hello"));
  auto dest = temp_dir_.file("notes.txt");
  auto resp = call("pull_file",
                   {{"remote_path", "/sdcard/notes.txt"}, {"local_path", dest}});
  ASSERT_TRUE(resp["ok"].get<bool>()) << resp.dump();
  EXPECT_EQ(resp["result"]["local_path"], dest);
  EXPECT_EQ(resp["result"]["size"], 5);
}

TEST_F(CommandHandlersTest, PushFile) {
  auto src = temp_dir_.file("data.bin");
  {
    std::ofstream ofs(src, std::ios::binary);
    ofs << "abc";
  }
  auto resp = call("push_file",
                   {{"local_path", src}, {"remote_path", "/sdcard/data.bin"}});
  ASSERT_TRUE(resp["ok"].get<bool>()) << resp.dump();
  EXPECT_EQ(resp["result"]["size"], 3);
  EXPECT_EQ(executor_.command_lines().back(),
            "-s emulator-5554 push " + src + " /sdcard/data.bin");
}

TEST_F(CommandHandlersTest, LogsWithTagAndPriority) {
  executor_.respond_stdout("logcat", "I/ActivityManager: started\n");
  auto resp = call("get_logs");
  ASSERT_TRUE(resp["ok"].get<bool>()) << resp.dump();
  EXPECT_EQ(resp["result"], "I/ActivityManager: started\n");
  EXPECT_TRUE(issued("logcat -d -t 200"));

  ASSERT_TRUE(call("get_logs", {{"lines", 50}, {"priority", "E"}})["ok"].get<bool>());
  EXPECT_TRUE(issued("logcat -d -t 50 '*:E'"));

  ASSERT_TRUE(call("get_logs", {{"tag", "OkHttp"}, {"priority", "D"}})["ok"].get<bool>());
  EXPECT_TRUE(issued("logcat -d -t 200 'OkHttp:D' '*:S'"));

  auto bad = call("get_logs", {{"lines", 0}});
  EXPECT_FALSE(bad["ok"].get<bool>());
  EXPECT_EQ(bad["error"]["reason"], "outOfRange");
}
