#include <gtest/gtest.h>
#include <cosign/execution/call_executor.hpp>
#include <cosign/testing/common.hpp>

#include <filesystem>
#include <string>

namespace {

bool shell_available() {
  return std::filesystem::exists("/bin/sh");
}

}  // namespace

TEST(call_executor, rejecting_executor_fails) {
  auto executor = cosign::execution::make_rejecting_executor();
  EXPECT_FALSE(executor(cosign::testing::make_address(0x01),
                        cosign::schema::amount_t{1},
                        cosign::schema::bytes_view_t{}));
}

TEST(call_executor, command_exit_status_decides_success) {
  if (!shell_available()) {
    GTEST_SKIP() << "/bin/sh not available";
  }
  auto target = cosign::testing::make_address(0x01);
  auto succeed = cosign::execution::make_command_executor("true");
  auto fail = cosign::execution::make_command_executor("false");
  EXPECT_TRUE(succeed(target, cosign::schema::amount_t{0}, {}));
  EXPECT_FALSE(fail(target, cosign::schema::amount_t{0}, {}));
}

TEST(call_executor, command_receives_target_value_and_payload) {
  if (!shell_available()) {
    GTEST_SKIP() << "/bin/sh not available";
  }
  auto target = cosign::testing::make_address(0xAB);
  auto payload = cosign::schema::bytes_t{0x01, 0x02};
  auto expected_target = "0x" + cosign::schema::to_hex(target);

  auto executor = cosign::execution::make_command_executor(
      "sh -c '[ \"$1\" = \"" + expected_target +
      "\" ] && [ \"$2\" = \"12345\" ] && [ \"$3\" = \"0x0102\" ]' sh");
  EXPECT_TRUE(executor(target, cosign::schema::amount_t{12345}, payload));
  EXPECT_FALSE(executor(target, cosign::schema::amount_t{12346}, payload));
}

TEST(call_executor, arguments_are_not_interpreted_by_the_shell) {
  if (!shell_available()) {
    GTEST_SKIP() << "/bin/sh not available";
  }
  // Hex output never contains shell metacharacters, but the quoting keeps
  // the argument count fixed at three regardless.
  auto executor =
      cosign::execution::make_command_executor("sh -c '[ $# -eq 3 ]' sh");
  EXPECT_TRUE(executor(cosign::testing::make_address(0x00),
                       cosign::schema::amount_t{0}, {}));
}
