#include "TestFixtures.hpp"
#include "emulator-server/Errors.hpp"
#include "emulator-server/server/ParamValidator.hpp"

#include <fstream>
#include <gtest/gtest.h>

using namespace emuserver;
using namespace emuserver::server;
using nlohmann::json;

class ParamValidatorTest : public ::testing::Test {
protected:
  void SetUp() override {
    spec_.name = "swipe_like";

    ParamSpec x;
    x.name = "x";
    x.type = ParamType::Integer;
    x.required = true;
    x.min = 0;
    spec_.params.push_back(x);

    ParamSpec duration;
    duration.name = "duration_ms";
    duration.type = ParamType::Integer;
    duration.default_value = 300;
    duration.min = 0;
    duration.max = 60000;
    spec_.params.push_back(duration);

    ParamSpec key;
    key.name = "key";
    key.type = ParamType::Enum;
    key.allowed = {"back", "home"};
    spec_.params.push_back(key);

    ParamSpec verbose;
    verbose.name = "verbose";
    verbose.type = ParamType::Boolean;
    spec_.params.push_back(verbose);

    ParamSpec scale;
    scale.name = "scale";
    scale.type = ParamType::Number;
    scale.max = 10;
    spec_.params.push_back(scale);
  }

  // Reason and field of the ValidationError thrown for args
  std::pair<ValidationReason, std::string> failure(const OperationSpec &spec,
                                                   const json &args) {
    try {
      ParamValidator::validate(spec, args);
    } catch (const ValidationError &e) {
      return {e.reason(), e.field()};
    }
    ADD_FAILURE() << "expected a ValidationError for " << args.dump();
    return {ValidationReason::UnknownOperation, ""};
  }

  OperationSpec spec_;
};

TEST_F(ParamValidatorTest, FillsDefaults) {
  auto result = ParamValidator::validate(spec_, {{"x", 5}});
  EXPECT_EQ(result.args["x"], 5);
  EXPECT_EQ(result.args["duration_ms"], 300);
  EXPECT_FALSE(result.args.contains("key"));
  EXPECT_TRUE(result.ignored.empty());
}

TEST_F(ParamValidatorTest, MissingRequiredParam) {
  auto f = failure(spec_, json::object());
  EXPECT_EQ(f.first, ValidationReason::MissingParam);
  EXPECT_EQ(f.second, "x");
}

TEST_F(ParamValidatorTest, NullCountsAsAbsent) {
  auto f = failure(spec_, {{"x", nullptr}});
  EXPECT_EQ(f.first, ValidationReason::MissingParam);

  auto result = ParamValidator::validate(spec_, {{"x", 1}, {"key", nullptr}});
  EXPECT_FALSE(result.args.contains("key"));
}

TEST_F(ParamValidatorTest, NullArgsTreatedAsEmptyObject) {
  OperationSpec no_params;
  no_params.name = "noop";
  auto result = ParamValidator::validate(no_params, json());
  EXPECT_TRUE(result.args.is_object());
  EXPECT_TRUE(result.args.empty());
}

TEST_F(ParamValidatorTest, NonObjectArgsAreMalformed) {
  auto f = failure(spec_, json::array({1, 2}));
  EXPECT_EQ(f.first, ValidationReason::MalformedRequest);
  EXPECT_EQ(f.second, "args");
}

TEST_F(ParamValidatorTest, IntegerCoercion) {
  EXPECT_EQ(ParamValidator::validate(spec_, {{"x", "42"}}).args["x"], 42);
  EXPECT_EQ(ParamValidator::validate(spec_, {{"x", 7.9}}).args["x"], 7);
  EXPECT_EQ(ParamValidator::validate(spec_, {{"x", " 12 "}}).args["x"], 12);

  auto f = failure(spec_, {{"x", "abc"}});
  EXPECT_EQ(f.first, ValidationReason::WrongType);
  EXPECT_EQ(f.second, "x");

  EXPECT_EQ(failure(spec_, {{"x", true}}).first, ValidationReason::WrongType);
  EXPECT_EQ(failure(spec_, {{"x", json::array()}}).first,
            ValidationReason::WrongType);
}

TEST_F(ParamValidatorTest, WrongTypeMessageNamesTypes) {
  try {
    ParamValidator::validate(spec_, {{"x", "abc"}});
    FAIL() << "expected ValidationError";
  } catch (const ValidationError &e) {
    EXPECT_STREQ(e.what(), "parameter 'x' must be integer, got string");
  }
}

TEST_F(ParamValidatorTest, BoundsAreChecked) {
  auto f = failure(spec_, {{"x", -1}});
  EXPECT_EQ(f.first, ValidationReason::OutOfRange);
  EXPECT_EQ(f.second, "x");

  f = failure(spec_, {{"x", 1}, {"duration_ms", 60001}});
  EXPECT_EQ(f.first, ValidationReason::OutOfRange);
  EXPECT_EQ(f.second, "duration_ms");

  f = failure(spec_, {{"x", 1}, {"scale", 10.5}});
  EXPECT_EQ(f.first, ValidationReason::OutOfRange);

  f = failure(spec_, {{"x", "1e17"}});
  EXPECT_EQ(f.first, ValidationReason::OutOfRange);
}

TEST_F(ParamValidatorTest, NumberAcceptsNumericStrings) {
  auto result = ParamValidator::validate(spec_, {{"x", 0}, {"scale", "2.5"}});
  EXPECT_DOUBLE_EQ(result.args["scale"].get<double>(), 2.5);
  EXPECT_EQ(failure(spec_, {{"x", 0}, {"scale", "two"}}).first,
            ValidationReason::WrongType);
}

TEST_F(ParamValidatorTest, BooleanCoercion) {
  EXPECT_EQ(ParamValidator::validate(spec_, {{"x", 0}, {"verbose", "true"}})
                .args["verbose"],
            true);
  EXPECT_EQ(ParamValidator::validate(spec_, {{"x", 0}, {"verbose", false}})
                .args["verbose"],
            false);
  EXPECT_EQ(failure(spec_, {{"x", 0}, {"verbose", "yes"}}).first,
            ValidationReason::WrongType);
  EXPECT_EQ(failure(spec_, {{"x", 0}, {"verbose", 1}}).first,
            ValidationReason::WrongType);
}

TEST_F(ParamValidatorTest, EnumValues) {
  EXPECT_EQ(
      ParamValidator::validate(spec_, {{"x", 0}, {"key", "home"}}).args["key"],
      "home");

  auto f = failure(spec_, {{"x", 0}, {"key", "launch"}});
  EXPECT_EQ(f.first, ValidationReason::InvalidValue);
  EXPECT_EQ(f.second, "key");

  EXPECT_EQ(failure(spec_, {{"x", 0}, {"key", 4}}).first,
            ValidationReason::WrongType);
}

TEST_F(ParamValidatorTest, UndeclaredKeysAreReportedNotRejected) {
  auto result =
      ParamValidator::validate(spec_, {{"x", 0}, {"colour", "red"}});
  ASSERT_EQ(result.ignored.size(), 1u);
  EXPECT_EQ(result.ignored[0], "colour");
  EXPECT_FALSE(result.args.contains("colour"));
}

TEST_F(ParamValidatorTest, RequireAnyGroup) {
  OperationSpec spec;
  spec.name = "find";
  for (const char *name : {"text", "resource_id"}) {
    ParamSpec p;
    p.name = name;
    spec.params.push_back(p);
  }
  spec.require_any = {"text", "resource_id"};

  auto f = failure(spec, json::object());
  EXPECT_EQ(f.first, ValidationReason::MissingParam);
  EXPECT_EQ(f.second, "text|resource_id");

  EXPECT_NO_THROW(ParamValidator::validate(spec, {{"resource_id", "id/ok"}}));
}

TEST_F(ParamValidatorTest, StringPatternMustMatchWholeValue) {
  OperationSpec spec;
  spec.name = "launch";
  ParamSpec package;
  package.name = "package";
  package.required = true;
  package.pattern = "[A-Za-z][A-Za-z0-9_]*(\\.[A-Za-z0-9_]+)+";
  spec.params.push_back(package);

  EXPECT_NO_THROW(ParamValidator::validate(spec, {{"package", "com.example"}}));

  auto f = failure(spec, {{"package", "com.example; reboot"}});
  EXPECT_EQ(f.first, ValidationReason::InvalidValue);
  EXPECT_EQ(f.second, "package");
}

TEST_F(ParamValidatorTest, SingleLineRejectsControlCharacters) {
  OperationSpec spec;
  spec.name = "type";
  ParamSpec text;
  text.name = "text";
  text.required = true;
  text.single_line = true;
  spec.params.push_back(text);

  EXPECT_NO_THROW(ParamValidator::validate(spec, {{"text", "hello world"}}));
  EXPECT_NO_THROW(
      ParamValidator::validate(spec, {{"text", "caf\xc3\xa9 50% off"}}));

  std::vector<std::string> bad_values{"a\nreboot", "a\rb", "hi\ttouch",
                                      std::string("nul\0x", 5), "del\x7f"};
  for (const auto &bad : bad_values) {
    auto f = failure(spec, {{"text", bad}});
    EXPECT_EQ(f.first, ValidationReason::InvalidValue) << bad;
    EXPECT_EQ(f.second, "text");
  }
}

TEST_F(ParamValidatorTest, ExistingFileIsCheckedLocally) {
  test::TempDir dir;
  auto present = dir.file("app.apk");
  {
    std::ofstream ofs(present);
    ofs << "PK";
  }

  OperationSpec spec;
  spec.name = "install";
  ParamSpec path;
  path.name = "apk_path";
  path.required = true;
  path.existing_file = true;
  spec.params.push_back(path);

  EXPECT_NO_THROW(ParamValidator::validate(spec, {{"apk_path", present}}));

  auto f = failure(spec, {{"apk_path", dir.file("missing.apk")}});
  EXPECT_EQ(f.first, ValidationReason::InvalidValue);
  EXPECT_EQ(f.second, "apk_path");

  // A directory is not a file
  f = failure(spec, {{"apk_path", dir.path()}});
  EXPECT_EQ(f.first, ValidationReason::InvalidValue);
}
